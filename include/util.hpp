#pragma once
#include <string>
#include <vector>

#include "frame_source.hpp"
#include "landmark_detectors.hpp"
#include "logging.hpp"
#include "orchestrator.hpp"

// One actuator endpoint, fed by its own Dispatcher.
struct OutputConfig {
  std::string name{"one"};
  std::string host{"127.0.0.1"};
  int port{8080};
  std::string path{"/position"};
  bool enabled{true};
  size_t queue_capacity{32};
  int min_interval_ms{100};
  int timeout_ms{1000};
};

struct AppConfig {
  CaptureConfig capture;
  FaceDetectorConfig face;
  BodyDetectorConfig body;
  OrchestratorConfig pipeline;
  std::vector<OutputConfig> outputs{OutputConfig{}};
  LoggingConfig logging;
  int control_port{9090};
};

// Missing keys keep their defaults. Throws YAML::Exception for unreadable or
// malformed files and std::invalid_argument for out-of-range values.
AppConfig load_config(const std::string& path);
