#include "detector.hpp"

#include "logging.hpp"

using namespace std::chrono;

AsyncDetector::AsyncDetector(DetectionKind kind, size_t queue_capacity,
                             std::shared_ptr<spdlog::logger> log)
    : log_(or_default(std::move(log))), kind_(kind), jobs_(queue_capacity) {}

AsyncDetector::~AsyncDetector() { shutdown(); }

bool AsyncDetector::start() {
  if (worker_.running()) return true;
  if (!worker_.join_for(milliseconds(0))) return false;
  jobs_.reopen();
  return worker_.start([this] { run(); });
}

bool AsyncDetector::detect(const Frame& frame, int64_t timestamp_ms, DetectionCallback callback) {
  if (!jobs_.try_push(Job{frame, timestamp_ms, std::move(callback)})) {
    dropped_.fetch_add(1, std::memory_order_relaxed);
    return false;
  }
  return true;
}

void AsyncDetector::stop() {
  worker_.request_stop();
  jobs_.close();
}

bool AsyncDetector::join_for(milliseconds timeout) {
  const bool joined = worker_.join_for(timeout);
  if (joined) jobs_.clear();
  return joined;
}

void AsyncDetector::shutdown() {
  stop();
  worker_.join();
  jobs_.clear();
}

void AsyncDetector::run() {
  log_->info("{} detector started", to_string(kind_));
  while (!worker_.stop_requested()) {
    auto job = jobs_.pop_for(milliseconds(100));
    if (!job) continue;
    std::shared_ptr<const LandmarkAccessor> landmarks;
    try {
      landmarks = infer(job->frame.image);
    } catch (const std::exception& e) {
      log_->error("{} inference failed at {}: {}", to_string(kind_), job->timestamp_ms, e.what());
      continue;
    }
    processed_.fetch_add(1, std::memory_order_relaxed);
    if (!landmarks) {
      log_->trace("No {} landmarks at {}", to_string(kind_), job->timestamp_ms);
      continue;
    }
    if (job->callback) job->callback(DetectionResult{kind_, job->timestamp_ms, std::move(landmarks)});
  }
  log_->info("{} detector stopped", to_string(kind_));
}
