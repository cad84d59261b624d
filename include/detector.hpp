#pragma once
#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>

#include "bounded_queue.hpp"
#include "types.hpp"
#include "worker_thread.hpp"

using DetectionCallback = std::function<void(DetectionResult)>;

// Asynchronous landmark detector. detect() never blocks: it either accepts
// the frame or drops it. For an accepted frame the callback fires at most
// once, from a detector-owned thread, and not at all if nothing was found.
class Detector {
public:
  virtual ~Detector() = default;

  virtual DetectionKind kind() const = 0;
  virtual bool start() = 0;
  virtual bool detect(const Frame& frame, int64_t timestamp_ms, DetectionCallback callback) = 0;
  virtual void stop() = 0;
  virtual bool join_for(std::chrono::milliseconds timeout) = 0;
};

// Plain landmark values, for detectors that compute the angles themselves.
struct PoseReading : public LandmarkAccessor {
  std::optional<double> pitch_deg;
  std::optional<double> roll_deg;
  std::optional<double> yaw_deg;
  std::optional<double> height_pct;
  std::optional<Gaze> gaze_reading;

  std::optional<double> pitch() const override { return pitch_deg; }
  std::optional<double> roll() const override { return roll_deg; }
  std::optional<double> yaw() const override { return yaw_deg; }
  std::optional<double> height() const override { return height_pct; }
  std::optional<Gaze> gaze() const override { return gaze_reading; }
};

// Detector with its own bounded input queue and inference thread.
class AsyncDetector : public Detector {
public:
  AsyncDetector(DetectionKind kind, size_t queue_capacity,
                std::shared_ptr<spdlog::logger> log = nullptr);
  ~AsyncDetector() override;

  DetectionKind kind() const override { return kind_; }
  bool start() override;
  bool detect(const Frame& frame, int64_t timestamp_ms, DetectionCallback callback) override;
  void stop() override;
  bool join_for(std::chrono::milliseconds timeout) override;

  uint64_t processed() const { return processed_.load(); }
  uint64_t dropped() const { return dropped_.load(); }

protected:
  // Runs on the inference thread. nullptr means nothing was detected.
  virtual std::shared_ptr<const LandmarkAccessor> infer(const cv::Mat& image) = 0;

  // Subclass destructors call this before their model members go away.
  void shutdown();

  std::shared_ptr<spdlog::logger> log_;

private:
  struct Job {
    Frame frame;
    int64_t timestamp_ms{0};
    DetectionCallback callback;
  };

  void run();

  const DetectionKind kind_;
  BoundedQueue<Job> jobs_;
  WorkerThread worker_;
  std::atomic<uint64_t> processed_{0};
  std::atomic<uint64_t> dropped_{0};
};
