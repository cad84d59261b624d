#include "motion_smoother.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace {

constexpr double kPi = 3.14159265358979323846;

// Head angles are limited to what the actuator can follow; height and ears
// keep their native ranges.
const std::array<ChannelRange, kChannelCount> kRanges{{
    {-30.0, 30.0, 0.0, true},    // x
    {-30.0, 30.0, 0.0, true},    // y
    {-30.0, 30.0, 0.0, true},    // z
    {0.0, 100.0, 50.0, false},   // h
    {50.0, 130.0, 90.0, false},  // e
}};

}  // namespace

const char* channel_key(Channel c) {
  switch (c) {
    case Channel::X:
      return "x";
    case Channel::Y:
      return "y";
    case Channel::Z:
      return "z";
    case Channel::H:
      return "h";
    case Channel::E:
      return "e";
  }
  return "?";
}

Channel parse_channel(const std::string& key) {
  if (key == "x") return Channel::X;
  if (key == "y") return Channel::Y;
  if (key == "z") return Channel::Z;
  if (key == "h") return Channel::H;
  if (key == "e") return Channel::E;
  throw std::invalid_argument("Invalid channel key: '" + key + "'");
}

const ChannelRange& MotionSmoother::range(Channel c) { return kRanges.at(idx(c)); }

double MotionSmoother::to_actuator(Channel c, double value) {
  const ChannelRange& r = range(c);
  const double clamped = std::clamp(value, r.lo, r.hi);
  return r.to_radians ? clamped * kPi / 180.0 : clamped;
}

MotionSmoother::MotionSmoother(SmootherConfig cfg) : cfg_(cfg) {
  for (double a : cfg_.alpha) {
    if (!(a > 0.0 && a <= 1.0)) throw std::invalid_argument("alpha must be in (0, 1]");
  }
  if (!(cfg_.rate_hz > 0.0)) throw std::invalid_argument("rate_hz must be positive");
  if (cfg_.min_duration_ms <= 0 || cfg_.max_duration_ms < cfg_.min_duration_ms) {
    throw std::invalid_argument("duration bounds must satisfy 0 < min <= max");
  }
  min_interval_ = std::chrono::duration<double>(1.0 / cfg_.rate_hz);
  reset();
}

void MotionSmoother::reset() {
  for (size_t i = 0; i < kChannelCount; ++i) smoothed_[i] = kRanges[i].neutral;
  last_emitted_ = smoothed_;
  last_emit_.reset();
}

std::optional<double> MotionSmoother::smooth(Channel c, double value) {
  if (std::isnan(value)) return std::nullopt;
  const ChannelRange& r = range(c);
  const double input = std::clamp(value, r.lo, r.hi);
  const double a = cfg_.alpha[idx(c)];
  double& s = smoothed_[idx(c)];
  s = a * input + (1.0 - a) * s;
  return s;
}

EmitDecision MotionSmoother::should_emit(const std::vector<Channel>& channels) {
  return should_emit(channels, Clock::now());
}

EmitDecision MotionSmoother::should_emit(const std::vector<Channel>& channels, TimePoint now) {
  if (channels.empty()) return {};
  if (last_emit_ && (now - *last_emit_) < min_interval_) return {};

  double max_change = 0.0;
  for (Channel c : channels) {
    max_change = std::max(max_change, std::abs(smoothed_[idx(c)] - last_emitted_[idx(c)]));
  }
  if (max_change <= cfg_.threshold) return {};

  last_emit_ = now;
  for (Channel c : channels) last_emitted_[idx(c)] = smoothed_[idx(c)];

  // One second of transition per 100 units of change.
  const int proportional = static_cast<int>(std::lround(max_change * 10.0));
  return {true, std::clamp(proportional, cfg_.min_duration_ms, cfg_.max_duration_ms)};
}

double MotionSmoother::actuator_value(Channel c) const { return to_actuator(c, value(c)); }
