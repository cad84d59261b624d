#include "util.hpp"

#include <yaml-cpp/yaml.h>

#include <set>
#include <stdexcept>

using std::chrono::milliseconds;

namespace {

template <typename T>
void read(const YAML::Node& n, const char* key, T& out) {
  if (n[key]) out = n[key].as<T>();
}

void read_ms(const YAML::Node& n, const char* key, milliseconds& out) {
  if (n[key]) out = milliseconds(n[key].as<int64_t>());
}

OutputConfig parse_output(const YAML::Node& n) {
  OutputConfig o{};
  read(n, "name", o.name);
  read(n, "host", o.host);
  read(n, "port", o.port);
  read(n, "path", o.path);
  read(n, "enabled", o.enabled);
  read(n, "queue_capacity", o.queue_capacity);
  read(n, "min_interval_ms", o.min_interval_ms);
  read(n, "timeout_ms", o.timeout_ms);
  if (o.name.empty()) throw std::invalid_argument("Output needs a name");
  if (o.port <= 0 || o.port > 65535) {
    throw std::invalid_argument("Output '" + o.name + "' has an invalid port");
  }
  if (o.queue_capacity == 0) {
    throw std::invalid_argument("Output '" + o.name + "' needs a positive queue_capacity");
  }
  return o;
}

}  // namespace

AppConfig load_config(const std::string& path) {
  YAML::Node y = YAML::LoadFile(path);
  AppConfig c{};
  LoopConfig& loop = c.pipeline.loop;

  if (auto n = y["capture"]) {
    read(n, "device", c.capture.device);
    read(n, "width", c.capture.width);
    read(n, "height", c.capture.height);
    read(n, "fps", c.capture.fps);
    read(n, "mirror", loop.detect_frame.mirror);
    read(n, "detect_width", loop.detect_frame.width);
    read(n, "detect_height", loop.detect_frame.height);
  }
  c.face.mirrored = loop.detect_frame.mirror;

  if (auto n = y["detection"]) {
    read(n, "face_model_path", c.face.model_path);
    read(n, "queue_capacity", c.pipeline.detection.queue_capacity);
    read(n, "result_lane_capacity", c.pipeline.detection.result_lane_capacity);
    if (n["detector_queue_capacity"]) {
      c.face.queue_capacity = n["detector_queue_capacity"].as<size_t>();
      c.body.queue_capacity = c.face.queue_capacity;
    }
    read(n, "score_threshold", c.face.score_threshold);
    read(n, "gaze_left", c.face.gaze_left);
    read(n, "gaze_right", c.face.gaze_right);
    read(n, "gaze_alpha", c.face.gaze_alpha);
  }

  if (auto n = y["fusion"]) {
    if (n["policy"]) c.pipeline.fusion.policy = parse_fusion_policy(n["policy"].as<std::string>());
    read(n, "ring_capacity", c.pipeline.fusion.ring_capacity);
    read(n, "face_timeout_ms", c.pipeline.fusion.face_timeout_ms);
    read(n, "pose_timeout_ms", c.pipeline.fusion.pose_timeout_ms);
    read(n, "max_delay_ms", c.pipeline.fusion.max_delay_ms);
    read(n, "tolerance_ms", c.pipeline.fusion.tolerance_ms);
  }

  if (auto n = y["smoothing"]) {
    if (auto a = n["alpha"]) {
      for (const auto& kv : a) {
        const Channel ch = parse_channel(kv.first.as<std::string>());
        c.pipeline.smoothing.alpha[static_cast<size_t>(ch)] = kv.second.as<double>();
      }
    }
    read(n, "rate_hz", c.pipeline.smoothing.rate_hz);
    read(n, "threshold", c.pipeline.smoothing.threshold);
    read(n, "min_duration_ms", c.pipeline.smoothing.min_duration_ms);
    read(n, "max_duration_ms", c.pipeline.smoothing.max_duration_ms);
  }

  if (auto n = y["loop"]) {
    read(n, "target_fps", loop.target_fps);
    read_ms(n, "first_frame_timeout_ms", loop.first_frame_timeout);
    read_ms(n, "calibration_duration_ms", loop.calibration_duration);
    read(n, "calibration_max_samples", loop.calibration_max_samples);
    read_ms(n, "stop_timeout_ms", loop.stop_timeout);
    read(n, "angle_limit_deg", loop.angle_limit_deg);
    if (auto t = n["tracked"]) {
      loop.tracked.clear();
      for (const auto& key : t) loop.tracked.push_back(parse_channel(key.as<std::string>()));
    }
  }

  if (auto n = y["outputs"]) {
    c.outputs.clear();
    std::set<std::string> names;
    for (const auto& o : n) {
      c.outputs.push_back(parse_output(o));
      if (!names.insert(c.outputs.back().name).second) {
        throw std::invalid_argument("Duplicate output name '" + c.outputs.back().name + "'");
      }
    }
    if (c.outputs.size() > Orchestrator::kMaxOutputs) {
      throw std::invalid_argument("At most " + std::to_string(Orchestrator::kMaxOutputs) +
                                  " outputs are supported");
    }
  }

  if (y["telemetry"] && y["telemetry"]["control_port"])
    c.control_port = y["telemetry"]["control_port"].as<int>();

  if (auto n = y["logging"]) {
    read(n, "level", c.logging.level);
    read(n, "pattern", c.logging.pattern);
    read(n, "pose_log_path", c.logging.pose_log_path);
  }

  if (loop.target_fps <= 0) throw std::invalid_argument("loop.target_fps must be positive");
  // Head angles beyond the actuator's x/y/z range would be clamped again by the smoother.
  const double max_angle = MotionSmoother::range(Channel::X).hi;
  if (!(loop.angle_limit_deg > 0.0 && loop.angle_limit_deg <= max_angle)) {
    throw std::invalid_argument(
        fmt::format("loop.angle_limit_deg must be in (0, {}]", max_angle));
  }
  return c;
}
