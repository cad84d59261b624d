#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include <opencv2/core.hpp>

using Clock = std::chrono::steady_clock;
using TimePoint = std::chrono::time_point<Clock>;

// Milliseconds on the steady clock. All frame and detection timestamps use this base.
inline int64_t monotonic_ms() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now().time_since_epoch())
      .count();
}

struct Frame {
  cv::Mat image;
  int64_t timestamp_ms{0};

  bool empty() const { return image.empty(); }
};

// Per-reader view of the latest frame. width/height of 0 keep the capture size.
struct FrameOptions {
  int width{0};
  int height{0};
  bool mirror{false};
};

enum class DetectionKind { Face = 0, Pose = 1 };
constexpr size_t kDetectionKinds = 2;

const char* to_string(DetectionKind kind);
DetectionKind other_kind(DetectionKind kind);

struct Gaze {
  std::string label{"center"};
  double ratio{0.5};
};

// Read-only view over detector-specific landmark data. A detector only
// overrides the fields it can measure.
class LandmarkAccessor {
public:
  virtual ~LandmarkAccessor() = default;
  virtual std::optional<double> pitch() const { return std::nullopt; }
  virtual std::optional<double> roll() const { return std::nullopt; }
  virtual std::optional<double> yaw() const { return std::nullopt; }
  virtual std::optional<double> height() const { return std::nullopt; }
  virtual std::optional<Gaze> gaze() const { return std::nullopt; }
};

struct DetectionResult {
  DetectionKind kind{DetectionKind::Face};
  int64_t timestamp_ms{0};
  std::shared_ptr<const LandmarkAccessor> landmarks;
};

struct FusedPoseSample {
  std::optional<double> pitch;
  std::optional<double> roll;
  std::optional<double> yaw;
  std::optional<double> height;
  std::optional<Gaze> gaze;
  int64_t timestamp_ms{0};

  bool has_angles() const { return pitch && roll && yaw; }
};

struct EmitDecision {
  bool should_emit{false};
  int duration_ms{0};
};

struct ActuatorPayload {
  double x{0.0};
  double y{0.0};
  double z{0.0};
  double h{0.0};
  double ears{0.0};
  // Fixed orientation of the actuator's reference frame.
  double ax{0.0};
  double ay{0.0};
  double az{-1.0};
  int duration_ms{500};
};

// Throws std::invalid_argument when a field is non-finite or the duration is not positive.
void validate(const ActuatorPayload& payload);

struct CalibrationOffset {
  double pitch{0.0};
  double roll{0.0};
  double yaw{0.0};
};
