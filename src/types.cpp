#include "types.hpp"

#include <cmath>
#include <stdexcept>
#include <string>

const char* to_string(DetectionKind kind) {
  switch (kind) {
    case DetectionKind::Face:
      return "face";
    case DetectionKind::Pose:
      return "pose";
  }
  return "unknown";
}

DetectionKind other_kind(DetectionKind kind) {
  return kind == DetectionKind::Face ? DetectionKind::Pose : DetectionKind::Face;
}

void validate(const ActuatorPayload& p) {
  const double fields[] = {p.x, p.y, p.z, p.h, p.ears, p.ax, p.ay, p.az};
  for (double v : fields) {
    if (!std::isfinite(v)) throw std::invalid_argument("ActuatorPayload contains a non-finite value");
  }
  if (p.duration_ms <= 0) {
    throw std::invalid_argument("ActuatorPayload duration_ms must be positive, got " +
                                std::to_string(p.duration_ms));
  }
}
