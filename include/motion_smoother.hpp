#pragma once
#include <array>
#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "types.hpp"

// Logical actuator channels. Keys match the config file and the payload.
enum class Channel : size_t {
  X = 0,  // pitch, degrees
  Y,      // roll, degrees
  Z,      // yaw, degrees
  H,      // height, percent of frame
  E,      // ears, driven by the gaze ratio
};
constexpr size_t kChannelCount = 5;

const char* channel_key(Channel c);
// Throws std::invalid_argument for anything but x, y, z, h, e.
Channel parse_channel(const std::string& key);

// Fixed per-channel mapping. Inputs are clamped to [lo, hi] before smoothing;
// actuator_value() converts the smoothed value to the actuator's unit.
struct ChannelRange {
  double lo;
  double hi;
  double neutral;
  bool to_radians;
};

struct SmootherConfig {
  std::array<double, kChannelCount> alpha{0.3, 0.2, 0.1, 0.3, 0.2};
  double rate_hz{10.0};
  double threshold{2.0};
  int min_duration_ms{100};
  int max_duration_ms{400};
};

// Per-session EMA state plus the emission gate. Not thread-safe: owned by
// the control loop.
class MotionSmoother {
public:
  explicit MotionSmoother(SmootherConfig cfg = {});

  // Returns the new smoothed value, or nullopt (state untouched) for NaN input.
  std::optional<double> smooth(Channel c, double value);

  EmitDecision should_emit(const std::vector<Channel>& channels);
  EmitDecision should_emit(const std::vector<Channel>& channels, TimePoint now);

  double value(Channel c) const { return smoothed_[idx(c)]; }
  double last_emitted(Channel c) const { return last_emitted_[idx(c)]; }
  double actuator_value(Channel c) const;

  // Back to the neutral pose; the next should_emit() is immediately eligible.
  void reset();

  const SmootherConfig& config() const { return cfg_; }

  static const ChannelRange& range(Channel c);
  static double to_actuator(Channel c, double value);

private:
  static size_t idx(Channel c) { return static_cast<size_t>(c); }

  SmootherConfig cfg_;
  std::chrono::duration<double> min_interval_;
  std::array<double, kChannelCount> smoothed_{};
  std::array<double, kChannelCount> last_emitted_{};
  std::optional<TimePoint> last_emit_;
};
