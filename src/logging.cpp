#include "logging.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <filesystem>
#include <stdexcept>

std::shared_ptr<spdlog::logger> make_logger(const std::string& name) {
  if (auto existing = spdlog::get(name)) return existing;
  try {
    return spdlog::stdout_color_mt(name);
  } catch (const spdlog::spdlog_ex&) {
    // Another thread registered the same name between get() and create.
    return spdlog::get(name);
  }
}

std::shared_ptr<spdlog::logger> make_pose_logger(const std::string& path) {
  try {
    std::filesystem::path p(path);
    if (p.has_parent_path()) std::filesystem::create_directories(p.parent_path());
    auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path, /*truncate*/ false);
    auto log = std::make_shared<spdlog::logger>("pose", sink);
    log->set_pattern("%v");
    log->set_level(spdlog::level::info);
    log->flush_on(spdlog::level::info);
    return log;
  } catch (const std::exception& e) {
    spdlog::error("Cannot open pose log '{}': {}", path, e.what());
    return nullptr;
  }
}

spdlog::level::level_enum parse_level(const std::string& level) {
  if (level == "trace") return spdlog::level::trace;
  if (level == "debug") return spdlog::level::debug;
  if (level == "info") return spdlog::level::info;
  if (level == "warn" || level == "warning") return spdlog::level::warn;
  if (level == "error") return spdlog::level::err;
  if (level == "critical") return spdlog::level::critical;
  if (level == "off") return spdlog::level::off;
  throw std::invalid_argument("Unknown log level: " + level);
}

void configure_logging(const LoggingConfig& cfg) {
  spdlog::set_pattern(cfg.pattern);
  spdlog::set_level(parse_level(cfg.level));
}
