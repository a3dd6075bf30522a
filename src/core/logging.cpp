#include "core/logging.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <cctype>
#include <memory>
#include <vector>

namespace stepagent::logging {

namespace {

constexpr size_t kMaxLogFileSize = 5 * 1024 * 1024;
constexpr size_t kMaxLogFiles = 3;

}  // namespace

spdlog::level::level_enum parse_level(const std::string &name) {
  std::string lower = name;
  std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) { return std::tolower(c); });

  if (lower == "trace") return spdlog::level::trace;
  if (lower == "debug") return spdlog::level::debug;
  if (lower == "info") return spdlog::level::info;
  if (lower == "warn" || lower == "warning") return spdlog::level::warn;
  if (lower == "error") return spdlog::level::err;
  if (lower == "critical") return spdlog::level::critical;
  if (lower == "off") return spdlog::level::off;
  return spdlog::level::info;
}

void setup(const std::string &level, const std::string &log_file) {
  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

  if (!log_file.empty()) {
    try {
      sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(log_file, kMaxLogFileSize, kMaxLogFiles));
    } catch (const spdlog::spdlog_ex &e) {
      spdlog::warn("[Log] Cannot open log file {}: {}", log_file, e.what());
    }
  }

  auto logger = std::make_shared<spdlog::logger>("stepagent", sinks.begin(), sinks.end());
  logger->set_level(parse_level(level));
  logger->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
  spdlog::set_default_logger(logger);
}

}  // namespace stepagent::logging
