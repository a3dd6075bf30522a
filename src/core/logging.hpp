#pragma once

#include <spdlog/spdlog.h>

#include <string>

namespace stepagent::logging {

// "trace", "debug", "info", "warn"/"warning", "error", "critical", "off".
// Unknown names fall back to info.
spdlog::level::level_enum parse_level(const std::string &name);

// Install the default "stepagent" logger: colored stderr, plus a rotating file
// sink when log_file is non-empty.
void setup(const std::string &level, const std::string &log_file = "");

}  // namespace stepagent::logging
