#include "frame_source.hpp"

#include <thread>

#include <opencv2/imgproc.hpp>

#include "logging.hpp"

using namespace std::chrono;

FrameSource::FrameSource(std::shared_ptr<spdlog::logger> log) : log_(or_default(std::move(log))) {}

FrameSource::~FrameSource() {
  worker_.request_stop();
  worker_.join();
}

bool FrameSource::start() {
  if (worker_.running()) return true;
  // A previous capture thread that has not exited yet still owns the device.
  if (!worker_.join_for(milliseconds(0))) {
    log_->warn("Capture thread from the previous run is still exiting");
    return false;
  }
  if (!open()) {
    log_->error("Failed to open capture device");
    return false;
  }
  {
    std::lock_guard<std::mutex> g(mu_);
    latest_.release();
    latest_ts_ = 0;
  }
  opened_ = true;
  if (!worker_.start([this] { capture(); })) {
    release();
    opened_ = false;
    return false;
  }
  log_->info("Capture thread started");
  return true;
}

void FrameSource::stop() { worker_.request_stop(); }

bool FrameSource::join_for(milliseconds timeout) { return worker_.join_for(timeout); }

void FrameSource::shutdown() {
  worker_.request_stop();
  worker_.join();
}

void FrameSource::capture() {
  int consecutive_failures = 0;
  while (!worker_.stop_requested()) {
    cv::Mat image;
    bool ok = false;
    try {
      ok = grab(image) && !image.empty();
    } catch (const std::exception& e) {
      log_->error("Frame grab failed: {}", e.what());
    }
    if (!ok) {
      failures_.fetch_add(1, std::memory_order_relaxed);
      if (++consecutive_failures % 100 == 1) {
        log_->warn("No frame from capture device ({} consecutive failures)",
                   consecutive_failures);
      }
      std::this_thread::sleep_for(milliseconds(10));
      continue;
    }
    consecutive_failures = 0;
    const int64_t ts = monotonic_ms();
    {
      std::lock_guard<std::mutex> g(mu_);
      latest_ = std::move(image);
      latest_ts_ = ts;
    }
    captured_.fetch_add(1, std::memory_order_relaxed);
  }
  if (opened_.exchange(false)) release();
  log_->info("Capture thread stopped after {} frames", captured_.load());
}

std::optional<Frame> FrameSource::latest(const FrameOptions& opts) const {
  Frame out;
  {
    std::lock_guard<std::mutex> g(mu_);
    if (latest_.empty()) return std::nullopt;
    out.image = latest_.clone();
    out.timestamp_ms = latest_ts_;
  }
  if (opts.width > 0 && opts.height > 0 &&
      (out.image.cols != opts.width || out.image.rows != opts.height)) {
    cv::Mat resized;
    cv::resize(out.image, resized, cv::Size(opts.width, opts.height));
    out.image = resized;
  }
  if (opts.mirror) {
    cv::Mat flipped;
    cv::flip(out.image, flipped, 1);
    out.image = flipped;
  }
  return out;
}

CameraFrameSource::CameraFrameSource(CaptureConfig cfg, std::shared_ptr<spdlog::logger> log)
    : FrameSource(std::move(log)), cfg_(std::move(cfg)) {}

CameraFrameSource::~CameraFrameSource() { shutdown(); }

bool CameraFrameSource::open() {
  bool ok = false;
  if (cfg_.device.empty()) return false;
  if (cfg_.device.find_first_not_of("0123456789") == std::string::npos) {
    ok = cap_.open(std::stoi(cfg_.device));
  } else {
    ok = cap_.open(cfg_.device);
  }
  if (!ok) {
    log_->error("Cannot open capture device '{}'", cfg_.device);
    return false;
  }
  cap_.set(cv::CAP_PROP_FRAME_WIDTH, cfg_.width);
  cap_.set(cv::CAP_PROP_FRAME_HEIGHT, cfg_.height);
  cap_.set(cv::CAP_PROP_FPS, cfg_.fps);
  log_->info("Opened capture device '{}' ({}x{} @ ~{} fps)", cfg_.device,
             static_cast<int>(cap_.get(cv::CAP_PROP_FRAME_WIDTH)),
             static_cast<int>(cap_.get(cv::CAP_PROP_FRAME_HEIGHT)), cfg_.fps);
  return true;
}

bool CameraFrameSource::grab(cv::Mat& out) { return cap_.read(out); }

void CameraFrameSource::release() {
  if (cap_.isOpened()) cap_.release();
  log_->info("Released capture device '{}'", cfg_.device);
}
