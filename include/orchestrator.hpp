#pragma once
#include <spdlog/spdlog.h>

#include <array>
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "correlation_buffer.hpp"
#include "detection_dispatch.hpp"
#include "detector.hpp"
#include "dispatcher.hpp"
#include "frame_source.hpp"
#include "metrics.hpp"
#include "motion_smoother.hpp"
#include "types.hpp"
#include "worker_thread.hpp"

enum class PipelineState { Idle, Initializing, Calibrating, Running, Stopping, Stopped };

const char* to_string(PipelineState state);

// No frame within the startup timeout, or the device/detectors cannot start.
class InitializationError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Calibration window closed without a single usable sample.
class CalibrationError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

struct LoopConfig {
  int target_fps{30};
  FrameOptions detect_frame{320, 180, true};
  std::chrono::milliseconds first_frame_timeout{5000};
  std::chrono::milliseconds first_frame_poll{10};
  std::chrono::milliseconds idle_sleep{10};
  std::chrono::milliseconds calibration_duration{2000};
  size_t calibration_max_samples{10};
  std::chrono::milliseconds calibration_poll{10};
  std::chrono::milliseconds stop_timeout{1000};
  double angle_limit_deg{30.0};
  std::vector<Channel> tracked{Channel::X, Channel::Y, Channel::Z, Channel::H};
  int idle_duration_ms{500};  // payload duration when the gate did not fire
};

struct OrchestratorConfig {
  LoopConfig loop;
  DetectionDispatchConfig detection;
  CorrelationConfig fusion;
  SmootherConfig smoothing;
};

// What the last processed sample turned into.
struct LoopStatus {
  PipelineState state{PipelineState::Idle};
  bool has_sample{false};
  int64_t sample_timestamp_ms{0};
  double pitch{0.0}, roll{0.0}, yaw{0.0};  // offset-corrected, clamped degrees
  std::optional<double> height;
  std::optional<Gaze> gaze;
  ActuatorPayload payload;
  bool data_sent{false};
  double fps{0.0};
  CalibrationOffset offset;
};

void to_json(nlohmann::json& j, const LoopStatus& s);

// Owns the pipeline: frame source -> detection dispatch -> correlation
// buffer -> smoother -> output slots. Lifecycle calls (start, stop,
// calibrate, output toggles) may come from any thread.
class Orchestrator {
public:
  static constexpr size_t kMaxOutputs = 2;

  Orchestrator(OrchestratorConfig cfg, std::unique_ptr<FrameSource> source,
               std::unique_ptr<Detector> face, std::unique_ptr<Detector> pose,
               MetricsRegistry& metrics, std::shared_ptr<spdlog::logger> log = nullptr);
  ~Orchestrator();

  Orchestrator(const Orchestrator&) = delete;
  Orchestrator& operator=(const Orchestrator&) = delete;

  // Starts capture, waits for the first frame and warms up the detectors.
  // Returns the capture resolution. Throws InitializationError.
  cv::Size initialize();
  // Blocking. Averages the head angles seen during the calibration window
  // and installs them as the new offset. Throws CalibrationError.
  CalibrationOffset calibrate();
  // Initializes if needed, then runs the control loop on its own thread.
  void start();
  // Stops the loop, the frame source, the detectors and every output, each
  // with a bounded wait.
  void stop();

  PipelineState state() const;
  bool running() const { return loop_.running(); }

  // One control step for a fused sample: offset, clamp, smooth, gate and
  // fan out. Returns the payload if the gate fired. Control-loop thread only
  // while the loop is running.
  std::optional<ActuatorPayload> process_sample(const FusedPoseSample& sample);

  // Output slots are attached before start(); toggles are thread-safe.
  void attach_output(size_t slot, std::unique_ptr<Dispatcher> dispatcher, bool enabled = false);
  bool enable_output(const std::string& name);
  bool disable_output(const std::string& name);
  bool output_enabled(const std::string& name) const;
  std::vector<std::string> output_names() const;
  const Dispatcher* output(const std::string& name) const;

  CalibrationOffset offset() const;
  void set_offset(const CalibrationOffset& offset);
  // Set before start().
  void set_pose_log(std::shared_ptr<spdlog::logger> pose_log);

  LoopStatus status() const;
  StatSnapshot stats() const;
  CorrelationBuffer& buffer() { return buffer_; }
  DetectionDispatch& detection() { return *dispatch_; }

private:
  struct OutputSlot {
    std::unique_ptr<Dispatcher> dispatcher;
    std::atomic<bool> enabled{false};
  };

  enum class StepResult { NoFrame, NoSample, StaleSample, Processed };

  struct LoopCursor {
    std::optional<int64_t> last_frame_ts;
    std::optional<int64_t> last_sample_ts;
  };

  cv::Size initialize_locked();
  void run_loop();
  StepResult step(LoopCursor& cursor);
  void fan_out(const ActuatorPayload& payload);
  void stop_outputs();
  OutputSlot* find_output(const std::string& name);
  const OutputSlot* find_output(const std::string& name) const;

  OrchestratorConfig cfg_;
  MetricsRegistry& metrics_;
  std::shared_ptr<spdlog::logger> log_;
  std::shared_ptr<spdlog::logger> pose_log_;

  std::unique_ptr<FrameSource> source_;
  CorrelationBuffer buffer_;
  std::unique_ptr<DetectionDispatch> dispatch_;
  MotionSmoother smoother_;
  std::array<OutputSlot, kMaxOutputs> outputs_;

  std::mutex lifecycle_mu_;
  std::atomic<PipelineState> state_{PipelineState::Idle};
  std::atomic<bool> calibrating_{false};
  std::atomic<bool> stopping_{false};
  bool initialized_{false};

  mutable std::mutex status_mu_;
  LoopStatus status_;
  CalibrationOffset offset_;
  StatSnapshot last_stats_{};

  WorkerThread loop_;
};
