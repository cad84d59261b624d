#pragma once
#include <spdlog/spdlog.h>

#include <memory>
#include <string>

struct LoggingConfig {
  std::string level{"info"};
  std::string pattern{"[%H:%M:%S.%e] %^[%l]%$ [%n] %v"};
  std::string pose_log_path;  // empty disables the per-iteration pose log
};

// Components accept an optional logger; null means the process default.
inline std::shared_ptr<spdlog::logger> or_default(std::shared_ptr<spdlog::logger> log) {
  return log ? std::move(log) : spdlog::default_logger();
}

// Named colored stdout logger, created on first use.
std::shared_ptr<spdlog::logger> make_logger(const std::string& name);

// Logger writing one raw line per message to `path`. Returns nullptr if the file cannot be opened.
std::shared_ptr<spdlog::logger> make_pose_logger(const std::string& path);

spdlog::level::level_enum parse_level(const std::string& level);

void configure_logging(const LoggingConfig& cfg);
