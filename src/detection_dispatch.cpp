#include "detection_dispatch.hpp"

#include <algorithm>
#include <stdexcept>

#include "logging.hpp"

using namespace std::chrono;

ResultChannel::ResultChannel(size_t lane_capacity) : cap_(lane_capacity) {
  if (cap_ == 0) throw std::invalid_argument("ResultChannel lane capacity must be > 0");
}

bool ResultChannel::push(DetectionResult result) {
  const size_t lane = static_cast<size_t>(result.kind);
  {
    std::lock_guard<std::mutex> g(mu_);
    if (closed_ || lanes_[lane].size() >= cap_) {
      ++dropped_[lane];
      return false;
    }
    lanes_[lane].push_back(std::move(result));
  }
  cv_.notify_one();
  return true;
}

std::optional<DetectionResult> ResultChannel::pop_for(milliseconds timeout) {
  std::unique_lock<std::mutex> lk(mu_);
  cv_.wait_for(lk, timeout, [this] {
    return closed_ || std::any_of(lanes_.begin(), lanes_.end(),
                                  [](const auto& l) { return !l.empty(); });
  });
  std::deque<DetectionResult>* pick = nullptr;
  for (auto& lane : lanes_) {
    if (lane.empty()) continue;
    if (!pick || lane.front().timestamp_ms < pick->front().timestamp_ms) pick = &lane;
  }
  if (!pick) return std::nullopt;
  DetectionResult out = std::move(pick->front());
  pick->pop_front();
  return out;
}

void ResultChannel::close() {
  {
    std::lock_guard<std::mutex> g(mu_);
    closed_ = true;
  }
  cv_.notify_all();
}

void ResultChannel::reopen() {
  std::lock_guard<std::mutex> g(mu_);
  closed_ = false;
}

size_t ResultChannel::size(DetectionKind kind) const {
  std::lock_guard<std::mutex> g(mu_);
  return lanes_[static_cast<size_t>(kind)].size();
}

uint64_t ResultChannel::dropped(DetectionKind kind) const {
  std::lock_guard<std::mutex> g(mu_);
  return dropped_[static_cast<size_t>(kind)];
}

DetectionDispatch::DetectionDispatch(DetectionDispatchConfig cfg, std::unique_ptr<Detector> face,
                                     std::unique_ptr<Detector> pose, CorrelationBuffer& buffer,
                                     std::shared_ptr<spdlog::logger> log)
    : cfg_(cfg),
      buffer_(buffer),
      log_(or_default(std::move(log))),
      frames_(cfg.queue_capacity),
      results_(cfg.result_lane_capacity) {
  if (!face || !pose) throw std::invalid_argument("DetectionDispatch needs both detectors");
  if (face->kind() != DetectionKind::Face || pose->kind() != DetectionKind::Pose) {
    throw std::invalid_argument("DetectionDispatch detectors passed in the wrong slots");
  }
  detectors_[static_cast<size_t>(DetectionKind::Face)] = std::move(face);
  detectors_[static_cast<size_t>(DetectionKind::Pose)] = std::move(pose);
}

DetectionDispatch::~DetectionDispatch() {
  stop();
  dispatcher_.join();
  // Detector threads call back into results_, so they go before any member.
  for (auto& d : detectors_) d.reset();
  fuser_.join();
}

bool DetectionDispatch::start() {
  if (dispatcher_.running()) return true;
  frames_.reopen();
  results_.reopen();
  for (auto& d : detectors_) {
    if (!d->start()) {
      log_->error("Failed to start {} detector", to_string(d->kind()));
      return false;
    }
  }
  if (!fuser_.running()) {
    if (!fuser_.join_for(milliseconds(0)) || !fuser_.start([this] { fuse_loop(); })) {
      log_->error("Fuser thread from the previous run is still exiting");
      return false;
    }
  }
  if (!dispatcher_.join_for(milliseconds(0)) || !dispatcher_.start([this] { dispatch_loop(); })) {
    log_->error("Dispatch thread from the previous run is still exiting");
    return false;
  }
  log_->info("Detection dispatch started (queue={}, lanes={})", cfg_.queue_capacity,
             cfg_.result_lane_capacity);
  return true;
}

int64_t DetectionDispatch::next_timestamp() {
  std::lock_guard<std::mutex> g(ts_mu_);
  int64_t ts = monotonic_ms();
  if (ts <= last_ts_) ts = last_ts_ + 1;
  last_ts_ = ts;
  return ts;
}

int64_t DetectionDispatch::last_timestamp() const {
  std::lock_guard<std::mutex> g(ts_mu_);
  return last_ts_;
}

bool DetectionDispatch::submit(Frame frame) {
  if (frame.empty()) return false;
  frame.timestamp_ms = next_timestamp();
  const int64_t ts = frame.timestamp_ms;
  if (!frames_.try_push(std::move(frame))) {
    dropped_.fetch_add(1, std::memory_order_relaxed);
    log_->debug("Detection queue full, dropping frame {}", ts);
    return false;
  }
  submitted_.fetch_add(1, std::memory_order_relaxed);
  return true;
}

uint64_t DetectionDispatch::detector_drops(DetectionKind kind) const {
  return detector_drops_[static_cast<size_t>(kind)].load();
}

void DetectionDispatch::dispatch_loop() {
  while (!dispatcher_.stop_requested()) {
    auto frame = frames_.pop_for(milliseconds(100));
    if (!frame) continue;
    for (auto& d : detectors_) {
      const bool accepted = d->detect(*frame, frame->timestamp_ms,
                                      [this](DetectionResult r) { results_.push(std::move(r)); });
      if (!accepted) {
        detector_drops_[static_cast<size_t>(d->kind())].fetch_add(1, std::memory_order_relaxed);
        log_->debug("{} detector saturated, frame {} dropped", to_string(d->kind()),
                    frame->timestamp_ms);
      }
    }
  }
}

void DetectionDispatch::fuse_loop() {
  while (!fuser_.stop_requested()) {
    auto result = results_.pop_for(milliseconds(50));
    if (!result) continue;
    buffer_.add(result->kind, *result, result->timestamp_ms);
    fused_.fetch_add(1, std::memory_order_relaxed);
  }
}

void DetectionDispatch::stop() {
  dispatcher_.request_stop();
  frames_.close();
  for (auto& d : detectors_) d->stop();
  fuser_.request_stop();
  results_.close();
}

bool DetectionDispatch::join_for(milliseconds timeout) {
  const auto deadline = steady_clock::now() + timeout;
  auto remaining = [&deadline] {
    return std::max(milliseconds(0),
                    duration_cast<milliseconds>(deadline - steady_clock::now()));
  };
  bool ok = true;
  if (!dispatcher_.join_for(remaining())) {
    log_->error("Detection dispatch thread did not stop within {} ms", timeout.count());
    ok = false;
  }
  for (auto& d : detectors_) {
    if (!d->join_for(remaining())) {
      log_->error("{} detector did not stop within {} ms", to_string(d->kind()), timeout.count());
      ok = false;
    }
  }
  if (!fuser_.join_for(remaining())) {
    log_->error("Fuser thread did not stop within {} ms", timeout.count());
    ok = false;
  }
  if (ok) frames_.clear();
  return ok;
}
