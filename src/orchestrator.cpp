#include "orchestrator.hpp"

#include <algorithm>
#include <thread>

#include "logging.hpp"

using namespace std::chrono;

namespace {

// Gaze ratio 0..1 spans the full ear range.
double ears_from_gaze(double ratio) {
  const ChannelRange& r = MotionSmoother::range(Channel::E);
  return r.lo + std::clamp(ratio, 0.0, 1.0) * (r.hi - r.lo);
}

}  // namespace

const char* to_string(PipelineState state) {
  switch (state) {
    case PipelineState::Idle:
      return "idle";
    case PipelineState::Initializing:
      return "initializing";
    case PipelineState::Calibrating:
      return "calibrating";
    case PipelineState::Running:
      return "running";
    case PipelineState::Stopping:
      return "stopping";
    case PipelineState::Stopped:
      return "stopped";
  }
  return "unknown";
}

void to_json(nlohmann::json& j, const LoopStatus& s) {
  j = nlohmann::json{{"state", to_string(s.state)},
                     {"has_sample", s.has_sample},
                     {"timestamp_ms", s.sample_timestamp_ms},
                     {"axis", {{"pitch", s.pitch}, {"roll", s.roll}, {"yaw", s.yaw}}},
                     {"actuator", s.payload},
                     {"data_sent", s.data_sent},
                     {"fps", s.fps},
                     {"offset",
                      {{"pitch", s.offset.pitch}, {"roll", s.offset.roll}, {"yaw", s.offset.yaw}}}};
  j["height"] = s.height ? nlohmann::json(*s.height) : nlohmann::json(nullptr);
  if (s.gaze) {
    j["gaze"] = {{"label", s.gaze->label}, {"ratio", s.gaze->ratio}};
  } else {
    j["gaze"] = nullptr;
  }
}

Orchestrator::Orchestrator(OrchestratorConfig cfg, std::unique_ptr<FrameSource> source,
                           std::unique_ptr<Detector> face, std::unique_ptr<Detector> pose,
                           MetricsRegistry& metrics, std::shared_ptr<spdlog::logger> log)
    : cfg_(std::move(cfg)),
      metrics_(metrics),
      log_(or_default(std::move(log))),
      source_(std::move(source)),
      buffer_(cfg_.fusion, log_),
      smoother_(cfg_.smoothing) {
  if (!source_) throw std::invalid_argument("Orchestrator needs a frame source");
  if (cfg_.loop.target_fps <= 0) throw std::invalid_argument("target_fps must be positive");
  const double max_angle = MotionSmoother::range(Channel::X).hi;
  if (!(cfg_.loop.angle_limit_deg > 0.0 && cfg_.loop.angle_limit_deg <= max_angle)) {
    throw std::invalid_argument(fmt::format("angle_limit_deg must be in (0, {}]", max_angle));
  }
  dispatch_ = std::make_unique<DetectionDispatch>(cfg_.detection, std::move(face),
                                                  std::move(pose), buffer_, log_);
}

Orchestrator::~Orchestrator() {
  stop();
  // Detector threads call back into the buffer; they must be gone first.
  dispatch_.reset();
}

cv::Size Orchestrator::initialize() {
  std::lock_guard<std::mutex> lk(lifecycle_mu_);
  return initialize_locked();
}

cv::Size Orchestrator::initialize_locked() {
  state_ = PipelineState::Initializing;
  stopping_ = false;
  if (!source_->start()) {
    state_ = PipelineState::Stopped;
    throw InitializationError("Cannot open the capture device");
  }

  std::optional<Frame> first;
  const auto deadline = Clock::now() + cfg_.loop.first_frame_timeout;
  while (Clock::now() < deadline) {
    first = source_->latest();
    if (first && !first->empty()) break;
    std::this_thread::sleep_for(cfg_.loop.first_frame_poll);
  }
  if (!first || first->empty()) {
    source_->stop();
    if (!source_->join_for(cfg_.loop.stop_timeout)) {
      log_->error("Capture thread did not exit within {} ms", cfg_.loop.stop_timeout.count());
    }
    state_ = PipelineState::Stopped;
    throw InitializationError("No frame within " +
                              std::to_string(cfg_.loop.first_frame_timeout.count()) + " ms");
  }

  const cv::Size size = first->image.size();
  log_->info("Capture ready at {}x{}, detecting at {}x{}", size.width, size.height,
             cfg_.loop.detect_frame.width, cfg_.loop.detect_frame.height);

  if (!dispatch_->start()) {
    source_->stop();
    if (!source_->join_for(cfg_.loop.stop_timeout)) {
      log_->error("Capture thread did not exit within {} ms", cfg_.loop.stop_timeout.count());
    }
    state_ = PipelineState::Stopped;
    throw InitializationError("Detectors failed to start");
  }
  initialized_ = true;
  state_ = PipelineState::Idle;
  return size;
}

CalibrationOffset Orchestrator::calibrate() {
  {
    std::lock_guard<std::mutex> lk(lifecycle_mu_);
    if (!initialized_) {
      try {
        initialize_locked();
      } catch (const InitializationError& e) {
        throw CalibrationError(std::string("Calibration needs a running pipeline: ") + e.what());
      }
    }
    if (calibrating_.exchange(true)) throw CalibrationError("Calibration already in progress");
  }

  log_->info("Calibrating for {} ms, keep a neutral pose", cfg_.loop.calibration_duration.count());
  double sum_pitch = 0.0, sum_roll = 0.0, sum_yaw = 0.0;
  size_t n = 0;
  std::optional<int64_t> last_frame_ts;
  // Only samples fused inside the window count.
  std::optional<int64_t> last_sample_ts;
  if (auto before = buffer_.latest()) last_sample_ts = before->timestamp_ms;
  const auto deadline = Clock::now() + cfg_.loop.calibration_duration;

  while (Clock::now() < deadline && n < cfg_.loop.calibration_max_samples && !stopping_) {
    // The control loop already feeds the detectors while it runs.
    if (!loop_.running()) {
      auto frame = source_->latest(cfg_.loop.detect_frame);
      if (frame && frame->timestamp_ms != last_frame_ts) {
        last_frame_ts = frame->timestamp_ms;
        dispatch_->submit(std::move(*frame));
      }
    }
    auto sample = buffer_.latest();
    if (sample && sample->has_angles() &&
        (!last_sample_ts || sample->timestamp_ms > *last_sample_ts)) {
      last_sample_ts = sample->timestamp_ms;
      sum_pitch += *sample->pitch;
      sum_roll += *sample->roll;
      sum_yaw += *sample->yaw;
      ++n;
    }
    std::this_thread::sleep_for(cfg_.loop.calibration_poll);
  }
  calibrating_ = false;

  if (n == 0) {
    log_->error("Calibration failed: no pose detected");
    throw CalibrationError("No pose detected during calibration");
  }
  CalibrationOffset off{sum_pitch / n, sum_roll / n, sum_yaw / n};
  set_offset(off);
  log_->info("Calibration complete from {} samples: pitch={:.2f} roll={:.2f} yaw={:.2f}", n,
             off.pitch, off.roll, off.yaw);
  return off;
}

void Orchestrator::start() {
  std::lock_guard<std::mutex> lk(lifecycle_mu_);
  if (loop_.running()) return;
  if (!loop_.join_for(cfg_.loop.stop_timeout)) {
    throw InitializationError("Control loop from the previous run is still exiting");
  }
  if (!initialized_) initialize_locked();

  for (auto& slot : outputs_) {
    if (slot.dispatcher && slot.enabled && !slot.dispatcher->start()) {
      log_->error("Output '{}' failed to start", slot.dispatcher->name());
    }
  }
  state_ = PipelineState::Running;
  if (!loop_.start([this] { run_loop(); })) {
    state_ = PipelineState::Idle;
    throw InitializationError("Control loop failed to start");
  }
  log_->info("Pipeline started");
}

void Orchestrator::stop() {
  std::lock_guard<std::mutex> lk(lifecycle_mu_);
  if (state_ == PipelineState::Stopped && !loop_.running()) return;
  stopping_ = true;
  state_ = PipelineState::Stopping;
  const auto timeout = cfg_.loop.stop_timeout;

  loop_.request_stop();
  if (!loop_.join_for(timeout)) {
    log_->error("Control loop did not exit within {} ms", timeout.count());
  }
  source_->stop();
  if (!source_->join_for(timeout)) {
    log_->error("Capture thread did not exit within {} ms", timeout.count());
  }
  dispatch_->stop();
  if (!dispatch_->join_for(timeout)) {
    log_->error("Detection threads did not exit within {} ms", timeout.count());
  }
  stop_outputs();
  // The next session starts from fresh detections.
  buffer_.clear();

  initialized_ = false;
  state_ = PipelineState::Stopped;
  stopping_ = false;
  log_->info("Pipeline stopped");
}

void Orchestrator::stop_outputs() {
  for (auto& slot : outputs_) {
    if (!slot.dispatcher) continue;
    slot.dispatcher->stop();
    if (!slot.dispatcher->join_for(cfg_.loop.stop_timeout)) {
      log_->error("Output '{}' did not exit within {} ms", slot.dispatcher->name(),
                  cfg_.loop.stop_timeout.count());
    }
  }
}

PipelineState Orchestrator::state() const {
  if (stopping_) return PipelineState::Stopping;
  if (calibrating_) return PipelineState::Calibrating;
  return state_.load();
}

void Orchestrator::run_loop() {
  const auto period = duration<double, std::milli>(1000.0 / cfg_.loop.target_fps);
  LoopCursor cursor;
  uint64_t processed_in_window = 0;
  auto window_start = Clock::now();

  log_->info("Control loop started at {} fps", cfg_.loop.target_fps);
  while (!loop_.stop_requested()) {
    const auto t0 = Clock::now();
    StepResult result = StepResult::NoFrame;
    try {
      result = step(cursor);
    } catch (const std::invalid_argument& e) {
      log_->critical("Control loop contract violation: {}", e.what());
#ifndef NDEBUG
      throw;
#else
      break;
#endif
    } catch (const std::exception& e) {
      log_->error("Control loop iteration failed: {}", e.what());
    }

    const auto t1 = Clock::now();
    const double ms = duration<double, std::milli>(t1 - t0).count();
    metrics_.add_loop(ms);
    metrics_.inc_iteration();
    if (result == StepResult::Processed) ++processed_in_window;

    const double win_secs = duration<double>(t1 - window_start).count();
    if (win_secs >= 1.0) {
      StatSnapshot snap = metrics_.snapshot();
      snap.fps = processed_in_window / win_secs;
      {
        std::lock_guard<std::mutex> g(status_mu_);
        last_stats_ = snap;
        status_.fps = snap.fps;
      }
      processed_in_window = 0;
      window_start = t1;
    }

    if (result == StepResult::NoSample) {
      std::this_thread::sleep_for(cfg_.loop.idle_sleep);
      continue;
    }
    if (ms > period.count()) {
      metrics_.inc_overrun();
    } else {
      std::this_thread::sleep_for(period - duration<double, std::milli>(ms));
    }
  }
  log_->info("Control loop stopped after {} iterations", metrics_.iterations());
}

Orchestrator::StepResult Orchestrator::step(LoopCursor& cursor) {
  auto frame = source_->latest(cfg_.loop.detect_frame);
  if (!frame || frame->timestamp_ms == cursor.last_frame_ts) return StepResult::NoFrame;
  cursor.last_frame_ts = frame->timestamp_ms;
  if (dispatch_->submit(std::move(*frame))) {
    metrics_.inc_submitted();
  } else {
    metrics_.inc_frame_dropped();
  }

  auto sample = buffer_.latest();
  if (!sample) {
    log_->debug("No pose data received yet");
    return StepResult::NoSample;
  }
  if (sample->timestamp_ms == cursor.last_sample_ts) return StepResult::StaleSample;
  cursor.last_sample_ts = sample->timestamp_ms;
  process_sample(*sample);
  return StepResult::Processed;
}

std::optional<ActuatorPayload> Orchestrator::process_sample(const FusedPoseSample& sample) {
  if (!sample.has_angles()) {
    log_->debug("Sample at {} has no head angles, skipping", sample.timestamp_ms);
    return std::nullopt;
  }
  const CalibrationOffset off = offset();
  const double lim = cfg_.loop.angle_limit_deg;
  const double pitch = std::clamp(*sample.pitch - off.pitch, -lim, lim);
  const double roll = std::clamp(*sample.roll - off.roll, -lim, lim);
  const double yaw = std::clamp(*sample.yaw - off.yaw, -lim, lim);

  smoother_.smooth(Channel::X, pitch);
  smoother_.smooth(Channel::Y, roll);
  smoother_.smooth(Channel::Z, yaw);
  if (sample.height) smoother_.smooth(Channel::H, *sample.height);
  if (sample.gaze) smoother_.smooth(Channel::E, ears_from_gaze(sample.gaze->ratio));
  metrics_.inc_sample();

  const EmitDecision decision = smoother_.should_emit(cfg_.loop.tracked);
  ActuatorPayload payload;
  payload.x = smoother_.actuator_value(Channel::X);
  payload.y = smoother_.actuator_value(Channel::Y);
  payload.z = smoother_.actuator_value(Channel::Z);
  payload.h = smoother_.actuator_value(Channel::H);
  payload.ears = smoother_.actuator_value(Channel::E);
  payload.duration_ms = decision.should_emit ? decision.duration_ms : cfg_.loop.idle_duration_ms;

  if (decision.should_emit) {
    metrics_.inc_emitted();
    fan_out(payload);
  }

  LoopStatus snap;
  {
    std::lock_guard<std::mutex> g(status_mu_);
    status_.has_sample = true;
    status_.sample_timestamp_ms = sample.timestamp_ms;
    status_.pitch = pitch;
    status_.roll = roll;
    status_.yaw = yaw;
    status_.height = sample.height;
    status_.gaze = sample.gaze;
    status_.payload = payload;
    status_.data_sent = decision.should_emit;
    status_.offset = off;
    snap = status_;
  }
  if (pose_log_) {
    snap.state = state();
    pose_log_->info("{}", nlohmann::json(snap).dump());
  }

  if (decision.should_emit) return payload;
  return std::nullopt;
}

void Orchestrator::fan_out(const ActuatorPayload& payload) {
  for (auto& slot : outputs_) {
    if (!slot.dispatcher || !slot.enabled) continue;
    if (!slot.dispatcher->send(payload)) metrics_.inc_payload_dropped();
  }
}

void Orchestrator::attach_output(size_t slot, std::unique_ptr<Dispatcher> dispatcher,
                                 bool enabled) {
  if (slot >= outputs_.size()) throw std::out_of_range("Output slot out of range");
  if (!dispatcher) throw std::invalid_argument("Output slot needs a dispatcher");
  if (loop_.running()) throw std::logic_error("Outputs must be attached before start()");
  for (size_t i = 0; i < outputs_.size(); ++i) {
    if (i != slot && outputs_[i].dispatcher && outputs_[i].dispatcher->name() == dispatcher->name()) {
      throw std::invalid_argument("Duplicate output name '" + dispatcher->name() + "'");
    }
  }
  outputs_[slot].dispatcher = std::move(dispatcher);
  outputs_[slot].enabled = enabled;
  log_->info("Output '{}' attached to slot {} ({})", outputs_[slot].dispatcher->name(), slot,
             enabled ? "enabled" : "disabled");
}

Orchestrator::OutputSlot* Orchestrator::find_output(const std::string& name) {
  for (auto& slot : outputs_) {
    if (slot.dispatcher && slot.dispatcher->name() == name) return &slot;
  }
  return nullptr;
}

const Orchestrator::OutputSlot* Orchestrator::find_output(const std::string& name) const {
  for (const auto& slot : outputs_) {
    if (slot.dispatcher && slot.dispatcher->name() == name) return &slot;
  }
  return nullptr;
}

bool Orchestrator::enable_output(const std::string& name) {
  std::lock_guard<std::mutex> lk(lifecycle_mu_);
  OutputSlot* slot = find_output(name);
  if (!slot) return false;
  if (loop_.running() && !slot->dispatcher->start()) {
    log_->error("Output '{}' failed to start", name);
    return false;
  }
  slot->enabled = true;
  log_->info("Output '{}' enabled", name);
  return true;
}

bool Orchestrator::disable_output(const std::string& name) {
  std::lock_guard<std::mutex> lk(lifecycle_mu_);
  OutputSlot* slot = find_output(name);
  if (!slot) return false;
  slot->enabled = false;
  slot->dispatcher->stop();
  if (!slot->dispatcher->join_for(cfg_.loop.stop_timeout)) {
    log_->error("Output '{}' did not exit within {} ms", name, cfg_.loop.stop_timeout.count());
  }
  log_->info("Output '{}' disabled", name);
  return true;
}

bool Orchestrator::output_enabled(const std::string& name) const {
  const OutputSlot* slot = find_output(name);
  return slot && slot->enabled;
}

std::vector<std::string> Orchestrator::output_names() const {
  std::vector<std::string> names;
  for (const auto& slot : outputs_) {
    if (slot.dispatcher) names.push_back(slot.dispatcher->name());
  }
  return names;
}

const Dispatcher* Orchestrator::output(const std::string& name) const {
  const OutputSlot* slot = find_output(name);
  return slot ? slot->dispatcher.get() : nullptr;
}

CalibrationOffset Orchestrator::offset() const {
  std::lock_guard<std::mutex> g(status_mu_);
  return offset_;
}

void Orchestrator::set_offset(const CalibrationOffset& offset) {
  std::lock_guard<std::mutex> g(status_mu_);
  offset_ = offset;
}

void Orchestrator::set_pose_log(std::shared_ptr<spdlog::logger> pose_log) {
  pose_log_ = std::move(pose_log);
}

LoopStatus Orchestrator::status() const {
  LoopStatus s;
  {
    std::lock_guard<std::mutex> g(status_mu_);
    s = status_;
    s.offset = offset_;
  }
  s.state = state();
  return s;
}

StatSnapshot Orchestrator::stats() const {
  std::lock_guard<std::mutex> g(status_mu_);
  return last_stats_;
}
