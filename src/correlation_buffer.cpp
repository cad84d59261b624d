#include "correlation_buffer.hpp"

#include <stdexcept>

#include "logging.hpp"

namespace {

template <typename T>
std::optional<T> first_of(const std::optional<T>& preferred, const std::optional<T>& fallback) {
  return preferred ? preferred : fallback;
}

size_t index_of(DetectionKind kind) { return static_cast<size_t>(kind); }

}  // namespace

const char* to_string(FusionPolicy policy) {
  return policy == FusionPolicy::StrictPairing ? "strict_pairing" : "independent_latest";
}

FusionPolicy parse_fusion_policy(const std::string& name) {
  if (name == "independent_latest") return FusionPolicy::IndependentLatest;
  if (name == "strict_pairing") return FusionPolicy::StrictPairing;
  throw std::invalid_argument("Unknown fusion policy: " + name);
}

CorrelationBuffer::CorrelationBuffer(CorrelationConfig cfg, std::shared_ptr<spdlog::logger> log)
    : cfg_(cfg), log_(or_default(std::move(log))) {
  if (cfg_.ring_capacity == 0) throw std::invalid_argument("ring_capacity must be > 0");
  if (cfg_.face_timeout_ms < 0 || cfg_.pose_timeout_ms < 0 || cfg_.max_delay_ms < 0 ||
      cfg_.tolerance_ms < 0) {
    throw std::invalid_argument("CorrelationBuffer windows must not be negative");
  }
}

void CorrelationBuffer::add(DetectionKind kind, const DetectionResult& result,
                            int64_t timestamp_ms) {
  if (!result.landmarks) {
    log_->debug("Ignoring {} result at {} without landmarks", to_string(kind), timestamp_ms);
    return;
  }
  std::lock_guard<std::mutex> g(mu_);
  if (cfg_.policy == FusionPolicy::StrictPairing) {
    add_strict(kind, result, timestamp_ms);
  } else {
    add_independent(kind, result, timestamp_ms);
  }
}

int64_t CorrelationBuffer::timeout_for(DetectionKind kind) const {
  return kind == DetectionKind::Face ? cfg_.face_timeout_ms : cfg_.pose_timeout_ms;
}

void CorrelationBuffer::add_independent(DetectionKind kind, const DetectionResult& result,
                                        int64_t ts) {
  KindSlot& own = latest_by_kind_[index_of(kind)];
  own.landmarks = result.landmarks;
  own.timestamp_ms = ts;
  own.valid_until = ts + timeout_for(kind);
  own.present = true;

  const KindSlot& other = latest_by_kind_[index_of(other_kind(kind))];
  const bool other_valid = other.present && ts <= other.valid_until;
  const LandmarkAccessor* other_landmarks = other_valid ? other.landmarks.get() : nullptr;

  if (kind == DetectionKind::Face) {
    publish(fuse(own.landmarks.get(), other_landmarks, ts));
  } else {
    publish(fuse(other_landmarks, own.landmarks.get(), ts));
  }
}

void CorrelationBuffer::add_strict(DetectionKind kind, const DetectionResult& result, int64_t ts) {
  const auto now = Clock::now();
  evict_stale_pending(now);

  auto it = pending_.lower_bound(ts - cfg_.tolerance_ms);
  while (it != pending_.end() && it->first <= ts + cfg_.tolerance_ms &&
         it->second.parts[index_of(kind)]) {
    ++it;
  }
  if (it == pending_.end() || it->first > ts + cfg_.tolerance_ms) {
    PendingPair fresh;
    fresh.first_seen = now;
    it = pending_.emplace(ts, std::move(fresh)).first;
    if (it->second.parts[index_of(kind)]) {
      // Same timestamp already holds this kind: latest result wins.
      it->second.parts[index_of(kind)] = result.landmarks;
      return;
    }
  }
  it->second.parts[index_of(kind)] = result.landmarks;

  const auto& parts = it->second.parts;
  if (!parts[index_of(DetectionKind::Face)] || !parts[index_of(DetectionKind::Pose)]) return;

  const int64_t pair_ts = it->first;
  FusedPoseSample sample = fuse(parts[index_of(DetectionKind::Face)].get(),
                                parts[index_of(DetectionKind::Pose)].get(), pair_ts);
  // Anything older than a completed pair can no longer become the newest sample.
  pending_.erase(pending_.begin(), std::next(it));
  publish(std::move(sample));
}

void CorrelationBuffer::evict_stale_pending(TimePoint now) {
  const auto max_delay = std::chrono::milliseconds(cfg_.max_delay_ms);
  for (auto it = pending_.begin(); it != pending_.end();) {
    if (now - it->second.first_seen > max_delay) {
      log_->debug("Evicting unmatched entry at {}", it->first);
      it = pending_.erase(it);
      ++evicted_;
    } else {
      ++it;
    }
  }
}

void CorrelationBuffer::publish(FusedPoseSample sample) {
  if (last_ts_ && sample.timestamp_ms <= *last_ts_) sample.timestamp_ms = *last_ts_ + 1;
  last_ts_ = sample.timestamp_ms;
  last_publish_ = Clock::now();
  ring_.push_back(std::move(sample));
  while (ring_.size() > cfg_.ring_capacity) ring_.pop_front();
}

FusedPoseSample CorrelationBuffer::fuse(const LandmarkAccessor* face,
                                        const LandmarkAccessor* pose, int64_t ts) {
  static const LandmarkAccessor kEmpty{};
  const LandmarkAccessor& f = face ? *face : kEmpty;
  const LandmarkAccessor& p = pose ? *pose : kEmpty;

  FusedPoseSample s;
  s.pitch = first_of(f.pitch(), p.pitch());
  s.roll = first_of(f.roll(), p.roll());
  s.yaw = first_of(f.yaw(), p.yaw());
  s.height = first_of(p.height(), f.height());
  s.gaze = first_of(f.gaze(), p.gaze());
  s.timestamp_ms = ts;
  return s;
}

std::optional<FusedPoseSample> CorrelationBuffer::latest() const {
  std::lock_guard<std::mutex> g(mu_);
  if (ring_.empty()) return std::nullopt;
  return ring_.back();
}

bool CorrelationBuffer::is_fresh(std::chrono::milliseconds max_age) const {
  std::lock_guard<std::mutex> g(mu_);
  return last_publish_ && (Clock::now() - *last_publish_) <= max_age;
}

std::vector<FusedPoseSample> CorrelationBuffer::snapshot() const {
  std::lock_guard<std::mutex> g(mu_);
  return {ring_.begin(), ring_.end()};
}

size_t CorrelationBuffer::size() const {
  std::lock_guard<std::mutex> g(mu_);
  return ring_.size();
}

size_t CorrelationBuffer::pending_size() const {
  std::lock_guard<std::mutex> g(mu_);
  return pending_.size();
}

uint64_t CorrelationBuffer::evicted_count() const {
  std::lock_guard<std::mutex> g(mu_);
  return evicted_;
}

void CorrelationBuffer::clear() {
  std::lock_guard<std::mutex> g(mu_);
  latest_by_kind_ = {};
  pending_.clear();
  ring_.clear();
  last_ts_.reset();
  last_publish_.reset();
}
