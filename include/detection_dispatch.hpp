#pragma once
#include <spdlog/spdlog.h>

#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>

#include "bounded_queue.hpp"
#include "correlation_buffer.hpp"
#include "detector.hpp"
#include "types.hpp"
#include "worker_thread.hpp"

// One bounded lane per detector kind behind a single wait point. Detector
// callbacks only push here; a full lane drops the result.
class ResultChannel {
public:
  explicit ResultChannel(size_t lane_capacity);

  bool push(DetectionResult result);
  // Oldest-timestamp head across the lanes.
  std::optional<DetectionResult> pop_for(std::chrono::milliseconds timeout);
  void close();
  void reopen();
  size_t size(DetectionKind kind) const;
  uint64_t dropped(DetectionKind kind) const;

private:
  const size_t cap_;
  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::array<std::deque<DetectionResult>, kDetectionKinds> lanes_;
  std::array<uint64_t, kDetectionKinds> dropped_{};
  bool closed_{false};
};

struct DetectionDispatchConfig {
  size_t queue_capacity{8};         // frames waiting for the detectors
  size_t result_lane_capacity{16};  // results waiting for fusion, per kind
};

// Fans each submitted frame out to the face and pose detectors and feeds
// their results into the CorrelationBuffer from a single fuser thread.
class DetectionDispatch {
public:
  DetectionDispatch(DetectionDispatchConfig cfg, std::unique_ptr<Detector> face,
                    std::unique_ptr<Detector> pose, CorrelationBuffer& buffer,
                    std::shared_ptr<spdlog::logger> log = nullptr);
  ~DetectionDispatch();

  DetectionDispatch(const DetectionDispatch&) = delete;
  DetectionDispatch& operator=(const DetectionDispatch&) = delete;

  bool start();
  // Never blocks. Stamps the frame with a strictly increasing timestamp;
  // returns false and drops it when the queue is saturated.
  bool submit(Frame frame);
  void stop();
  // Dispatch thread first, then the detectors, then the fuser.
  bool join_for(std::chrono::milliseconds timeout);
  bool running() const { return dispatcher_.running(); }

  uint64_t submitted() const { return submitted_.load(); }
  uint64_t dropped() const { return dropped_.load(); }
  uint64_t detector_drops(DetectionKind kind) const;
  uint64_t fused() const { return fused_.load(); }
  int64_t last_timestamp() const;

private:
  int64_t next_timestamp();
  void dispatch_loop();
  void fuse_loop();

  DetectionDispatchConfig cfg_;
  std::array<std::unique_ptr<Detector>, kDetectionKinds> detectors_;
  CorrelationBuffer& buffer_;
  std::shared_ptr<spdlog::logger> log_;

  BoundedQueue<Frame> frames_;
  ResultChannel results_;

  mutable std::mutex ts_mu_;
  int64_t last_ts_{0};

  std::atomic<uint64_t> submitted_{0};
  std::atomic<uint64_t> dropped_{0};
  std::array<std::atomic<uint64_t>, kDetectionKinds> detector_drops_{};
  std::atomic<uint64_t> fused_{0};

  WorkerThread dispatcher_;
  WorkerThread fuser_;
};
