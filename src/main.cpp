#include <httplib.h>
#include <spdlog/spdlog.h>

#include <CLI/CLI.hpp>
#include <atomic>
#include <csignal>
#include <iostream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <string>
#include <thread>

#include "dispatcher.hpp"
#include "frame_source.hpp"
#include "landmark_detectors.hpp"
#include "logging.hpp"
#include "metrics.hpp"
#include "orchestrator.hpp"
#include "util.hpp"

namespace {

std::atomic<bool> g_shutdown{false};

void on_signal(int) { g_shutdown = true; }

void reply_json(httplib::Response& res, const nlohmann::json& j, int status = 200) {
  res.status = status;
  res.set_content(j.dump(2), "application/json");
}

nlohmann::json outputs_json(const Orchestrator& orch) {
  nlohmann::json out = nlohmann::json::object();
  for (const auto& name : orch.output_names()) out[name] = orch.output_enabled(name);
  return out;
}

}  // namespace

int main(int argc, char** argv) {
  CLI::App cli_app{"Mimic-RT: real-time head and body mimicry for a desktop companion robot"};

  std::string cfg_path = "configs/config.yaml";
  cli_app.add_option("-c,--config", cfg_path, "Configuration file path")->check(CLI::ExistingFile);

  bool show_version = false;
  cli_app.add_flag("-v,--version", show_version, "Show version information");

  bool calibrate_first = false;
  cli_app.add_flag("--calibrate", calibrate_first, "Calibrate the neutral pose before starting");

  bool no_server = false;
  cli_app.add_flag("--no-server", no_server,
                   "Run the loop in the foreground without the control server");

  try {
    cli_app.parse(argc, argv);
  } catch (const CLI::ParseError& e) {
    return cli_app.exit(e);
  }

  if (show_version) {
    std::cout << "Mimic-RT v1.0.0" << std::endl;
    std::cout << "Face and body landmarks -> smoothed actuator poses over HTTP" << std::endl;
    return 0;
  }

  AppConfig app;
  try {
    app = load_config(cfg_path);
    configure_logging(app.logging);
  } catch (const std::exception& e) {
    spdlog::error("Invalid configuration {}: {}", cfg_path, e.what());
    return 1;
  }
  spdlog::info("Mimic-RT starting (config: {})", cfg_path);

  MetricsRegistry metrics;
  std::unique_ptr<Orchestrator> orch;
  try {
    auto face = std::make_unique<FaceLandmarkDetector>(app.face, make_logger("face"));
    auto body = std::make_unique<BodyHeightDetector>(app.body, make_logger("body"));
    auto source = std::make_unique<CameraFrameSource>(app.capture, make_logger("capture"));
    orch = std::make_unique<Orchestrator>(app.pipeline, std::move(source), std::move(face),
                                          std::move(body), metrics, make_logger("pipeline"));

    auto out_log = make_logger("output");
    for (size_t i = 0; i < app.outputs.size(); ++i) {
      const OutputConfig& o = app.outputs[i];
      auto transport = std::make_unique<HttpTransport>(
          o.host, o.port, o.path, std::chrono::milliseconds(o.timeout_ms), out_log);
      DispatcherConfig dc;
      dc.name = o.name;
      dc.queue_capacity = o.queue_capacity;
      dc.min_interval = std::chrono::milliseconds(o.min_interval_ms);
      orch->attach_output(i, std::make_unique<Dispatcher>(dc, std::move(transport), out_log),
                          o.enabled);
    }
  } catch (const std::exception& e) {
    spdlog::error("Failed to set up the pipeline: {}", e.what());
    return 1;
  }

  if (!app.logging.pose_log_path.empty()) {
    auto pose_log = make_pose_logger(app.logging.pose_log_path);
    if (pose_log) {
      orch->set_pose_log(pose_log);
      spdlog::info("Pose log -> {}", app.logging.pose_log_path);
    } else {
      spdlog::warn("Cannot open pose log {}, continuing without it", app.logging.pose_log_path);
    }
  }

  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);

  try {
    if (calibrate_first) {
      try {
        orch->calibrate();
      } catch (const CalibrationError& e) {
        spdlog::error("{}; continuing with the previous offset", e.what());
      }
    }
    orch->start();
  } catch (const InitializationError& e) {
    spdlog::error("Initialization failed: {}", e.what());
    orch->stop();
    return 1;
  }

  if (no_server) {
    while (!g_shutdown) std::this_thread::sleep_for(std::chrono::milliseconds(100));
    orch->stop();
    spdlog::info("Shutdown complete.");
    return 0;
  }

  httplib::Server svr;

  svr.Get("/healthz", [&](const httplib::Request&, httplib::Response& res) {
    res.set_content("{\"status\":\"ok\"}", "application/json");
  });

  svr.Get("/readyz", [&](const httplib::Request&, httplib::Response& res) {
    const bool ready = orch->state() == PipelineState::Running;
    res.set_content(std::string("{\"ready\":") + (ready ? "true" : "false") + "}",
                    "application/json");
  });

  svr.Post("/pipeline/start", [&](const httplib::Request&, httplib::Response& res) {
    try {
      orch->start();
      reply_json(res, {{"started", true}});
    } catch (const InitializationError& e) {
      reply_json(res, {{"started", false}, {"error", e.what()}}, 503);
    }
  });

  svr.Post("/pipeline/stop", [&](const httplib::Request&, httplib::Response& res) {
    orch->stop();
    reply_json(res, {{"stopped", true}});
  });

  svr.Post("/pipeline/calibrate", [&](const httplib::Request&, httplib::Response& res) {
    try {
      const CalibrationOffset off = orch->calibrate();
      reply_json(res, {{"calibrated", true},
                       {"offset", {{"pitch", off.pitch}, {"roll", off.roll}, {"yaw", off.yaw}}}});
    } catch (const CalibrationError& e) {
      reply_json(res, {{"calibrated", false}, {"error", e.what()}}, 422);
    }
  });

  svr.Post(R"(/outputs/([^/]+)/(enable|disable))",
           [&](const httplib::Request& req, httplib::Response& res) {
             const std::string name = req.matches[1];
             const bool enable = req.matches[2] == "enable";
             const bool ok = enable ? orch->enable_output(name) : orch->disable_output(name);
             if (!ok) {
               reply_json(res, {{"error", "unknown output '" + name + "'"}}, 404);
               return;
             }
             reply_json(res, {{"outputs", outputs_json(*orch)}});
           });

  svr.Get("/pipeline/stats", [&](const httplib::Request&, httplib::Response& res) {
    const StatSnapshot s = orch->stats();
    nlohmann::json j = orch->status();
    j["loop"] = {{"p50_ms", s.loop_p50},
                 {"p95_ms", s.loop_p95},
                 {"p99_ms", s.loop_p99},
                 {"overrun_rate", s.overrun_rate},
                 {"iterations", s.iterations}};
    j["outputs"] = outputs_json(*orch);
    j["fused_samples"] = orch->buffer().size();
    reply_json(res, j);
  });

  svr.Get("/metrics", [&](const httplib::Request&, httplib::Response& res) {
    std::ostringstream os;
    os << metrics.prometheus_text(orch->stats());
    os << "detection_submitted_total " << orch->detection().submitted() << "\n";
    os << "detection_dropped_total " << orch->detection().dropped() << "\n";
    os << "fusion_evicted_total " << orch->buffer().evicted_count() << "\n";
    for (const auto& name : orch->output_names()) {
      const Dispatcher* d = orch->output(name);
      os << "output_sent_total{output=\"" << name << "\"} " << d->sent() << "\n";
      os << "output_failed_total{output=\"" << name << "\"} " << d->failed() << "\n";
      os << "output_dropped_total{output=\"" << name << "\"} " << d->dropped() << "\n";
    }
    res.set_content(os.str(), "text/plain; version=0.0.4");
  });

  std::thread watcher([&] {
    while (!g_shutdown) std::this_thread::sleep_for(std::chrono::milliseconds(100));
    spdlog::info("Shutdown requested");
    svr.stop();
  });

  spdlog::info("Control server listening on 0.0.0.0:{}", app.control_port);
  if (!svr.listen("0.0.0.0", app.control_port)) {
    spdlog::error("Cannot listen on port {}", app.control_port);
  }

  g_shutdown = true;
  watcher.join();
  orch->stop();
  spdlog::info("Shutdown complete.");
  return 0;
}
