#pragma once
#include <spdlog/spdlog.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <opencv2/videoio.hpp>

#include "types.hpp"
#include "worker_thread.hpp"

// Latest-wins frame slot filled by a capture thread. Frames overwritten
// before anyone reads them are lost.
//
// Subclasses provide the device: open() runs in start(), grab() blocks on
// one device read and release() runs when the capture thread exits. A
// subclass destructor must call shutdown() so the thread is gone before the
// device members are destroyed.
class FrameSource {
public:
  explicit FrameSource(std::shared_ptr<spdlog::logger> log = nullptr);
  virtual ~FrameSource();

  FrameSource(const FrameSource&) = delete;
  FrameSource& operator=(const FrameSource&) = delete;

  // Spawns the capture thread. Returns false if the device cannot be opened.
  bool start();
  void stop();
  bool join_for(std::chrono::milliseconds timeout);
  bool running() const { return worker_.running(); }

  // Independent copy of the newest frame, resized/mirrored per `opts`, or
  // nullopt if nothing has been captured yet.
  std::optional<Frame> latest(const FrameOptions& opts = {}) const;

  uint64_t frames_captured() const { return captured_.load(); }
  uint64_t read_failures() const { return failures_.load(); }

protected:
  virtual bool open() = 0;
  virtual bool grab(cv::Mat& out) = 0;
  virtual void release() = 0;

  void shutdown();

  std::shared_ptr<spdlog::logger> log_;

private:
  void capture();

  mutable std::mutex mu_;
  cv::Mat latest_;
  int64_t latest_ts_{0};

  std::atomic<uint64_t> captured_{0};
  std::atomic<uint64_t> failures_{0};
  std::atomic<bool> opened_{false};
  WorkerThread worker_;
};

struct CaptureConfig {
  std::string device{"0"};  // camera index or a video file/stream URI
  int width{1280};
  int height{720};
  int fps{30};
};

class CameraFrameSource : public FrameSource {
public:
  explicit CameraFrameSource(CaptureConfig cfg, std::shared_ptr<spdlog::logger> log = nullptr);
  ~CameraFrameSource() override;

protected:
  bool open() override;
  bool grab(cv::Mat& out) override;
  void release() override;

private:
  CaptureConfig cfg_;
  cv::VideoCapture cap_;
};
