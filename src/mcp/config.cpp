#include "mcp/config.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <mutex>
#include <stdexcept>

namespace stepagent::mcp {

namespace {

std::mutex timeout_mutex;
McpTimeoutConfig timeout_defaults;

std::string to_lower(std::string str) {
  std::transform(str.begin(), str.end(), str.begin(), [](unsigned char c) { return std::tolower(c); });
  return str;
}

void check_positive(const char *field, double value) {
  if (!(value > 0.0)) {
    throw std::invalid_argument(std::string(field) + " must be positive, got " + std::to_string(value));
  }
}

// Reads an optional positive number; returns an error message on bad input
std::optional<std::string> read_timeout(const json &j, const char *field, std::optional<double> &out) {
  if (!j.contains(field) || j[field].is_null()) {
    return std::nullopt;
  }
  if (!j[field].is_number()) {
    return std::string(field) + " must be a number";
  }
  double value = j[field].get<double>();
  if (!(value > 0.0)) {
    return std::string(field) + " must be positive";
  }
  out = value;
  return std::nullopt;
}

std::optional<std::string> read_string_map(const json &entry, const char *field, std::map<std::string, std::string> &out) {
  if (!entry.contains(field) || entry[field].is_null()) {
    return std::nullopt;
  }
  if (!entry[field].is_object()) {
    return std::string(field) + " must be an object of strings";
  }
  for (const auto &[key, value] : entry[field].items()) {
    if (!value.is_string()) {
      return std::string(field) + "." + key + " must be a string";
    }
    out[key] = value.get<std::string>();
  }
  return std::nullopt;
}

}  // namespace

std::string to_string(TransportKind kind) {
  switch (kind) {
    case TransportKind::Stdio:
      return "stdio";
    case TransportKind::Sse:
      return "sse";
    case TransportKind::Http:
      return "http";
    case TransportKind::StreamableHttp:
      return "streamable_http";
  }
  return "stdio";
}

std::optional<TransportKind> transport_kind_from_string(const std::string &str) {
  auto lower = to_lower(str);
  if (lower == "stdio") return TransportKind::Stdio;
  if (lower == "sse") return TransportKind::Sse;
  if (lower == "http") return TransportKind::Http;
  if (lower == "streamable_http") return TransportKind::StreamableHttp;
  return std::nullopt;
}

// ============================================================
// Timeouts
// ============================================================

McpTimeoutConfig get_timeout_config() {
  std::lock_guard<std::mutex> lock(timeout_mutex);
  return timeout_defaults;
}

void set_timeout_config(std::optional<double> connect_timeout, std::optional<double> execute_timeout,
                        std::optional<double> sse_read_timeout) {
  if (connect_timeout) check_positive("connect_timeout", *connect_timeout);
  if (execute_timeout) check_positive("execute_timeout", *execute_timeout);
  if (sse_read_timeout) check_positive("sse_read_timeout", *sse_read_timeout);

  std::lock_guard<std::mutex> lock(timeout_mutex);
  if (connect_timeout) timeout_defaults.connect_timeout = *connect_timeout;
  if (execute_timeout) timeout_defaults.execute_timeout = *execute_timeout;
  if (sse_read_timeout) timeout_defaults.sse_read_timeout = *sse_read_timeout;
}

void set_timeout_config(const McpTimeoutConfig &config) {
  set_timeout_config(config.connect_timeout, config.execute_timeout, config.sse_read_timeout);
}

std::chrono::milliseconds to_millis(double seconds) {
  return std::chrono::milliseconds(static_cast<int64_t>(seconds * 1000.0));
}

// ============================================================
// McpServerConfig
// ============================================================

TransportKind McpServerConfig::kind() const {
  if (auto *url = std::get_if<UrlTransportSpec>(&transport)) {
    return url->kind;
  }
  return TransportKind::Stdio;
}

double McpServerConfig::connect_timeout() const {
  return timeouts.connect_timeout.value_or(get_timeout_config().connect_timeout);
}

double McpServerConfig::execute_timeout() const {
  return timeouts.execute_timeout.value_or(get_timeout_config().execute_timeout);
}

double McpServerConfig::sse_read_timeout() const {
  return timeouts.sse_read_timeout.value_or(get_timeout_config().sse_read_timeout);
}

TransportKind infer_transport_kind(const json &entry) {
  if (entry.contains("type") && entry["type"].is_string()) {
    if (auto kind = transport_kind_from_string(entry["type"].get<std::string>())) {
      return *kind;
    }
  }

  bool has_command = entry.contains("command") && !entry["command"].is_null();
  bool has_url = entry.contains("url") && !entry["url"].is_null();

  if (has_command && !has_url) return TransportKind::Stdio;
  if (has_url) return TransportKind::StreamableHttp;
  return TransportKind::Stdio;
}

Result<TimeoutOverrides> parse_timeout_overrides(const json &j) {
  if (!j.is_object()) {
    return Result<TimeoutOverrides>::failure("timeouts must be an object");
  }
  TimeoutOverrides overrides;
  for (auto [field, slot] : {std::pair{"connect_timeout", &overrides.connect_timeout},
                             std::pair{"execute_timeout", &overrides.execute_timeout},
                             std::pair{"sse_read_timeout", &overrides.sse_read_timeout}}) {
    if (auto err = read_timeout(j, field, *slot)) {
      return Result<TimeoutOverrides>::failure(*err);
    }
  }
  return Result<TimeoutOverrides>::success(overrides);
}

Result<McpServerConfig> parse_server_config(const std::string &name, const json &entry, const TimeoutOverrides &defaults) {
  using R = Result<McpServerConfig>;

  if (!entry.is_object()) {
    return R::failure("server '" + name + "': entry must be an object");
  }

  McpServerConfig config;
  config.name = name;

  if (entry.contains("disabled")) {
    if (!entry["disabled"].is_boolean()) {
      return R::failure("server '" + name + "': disabled must be a boolean");
    }
    config.disabled = entry["disabled"].get<bool>();
  }

  auto kind = infer_transport_kind(entry);
  if (entry.contains("type") && entry["type"].is_string() &&
      !transport_kind_from_string(entry["type"].get<std::string>())) {
    spdlog::warn("[MCP] Server '{}': unknown transport type '{}', using {}", name, entry["type"].get<std::string>(),
                 to_string(kind));
  }

  if (kind == TransportKind::Stdio) {
    StdioTransportSpec spec;
    if (entry.contains("command") && !entry["command"].is_null()) {
      if (!entry["command"].is_string()) {
        return R::failure("server '" + name + "': command must be a string");
      }
      spec.command = entry["command"].get<std::string>();
    }
    if (spec.command.empty()) {
      return R::failure("server '" + name + "': stdio transport requires a non-empty command");
    }

    if (entry.contains("args") && !entry["args"].is_null()) {
      if (!entry["args"].is_array()) {
        return R::failure("server '" + name + "': args must be an array of strings");
      }
      for (const auto &arg : entry["args"]) {
        if (!arg.is_string()) {
          return R::failure("server '" + name + "': args must be an array of strings");
        }
        spec.args.push_back(arg.get<std::string>());
      }
    }
    if (auto err = read_string_map(entry, "env", spec.env)) {
      return R::failure("server '" + name + "': " + *err);
    }
    config.transport = std::move(spec);
  } else {
    UrlTransportSpec spec;
    spec.kind = kind;
    if (entry.contains("url") && !entry["url"].is_null()) {
      if (!entry["url"].is_string()) {
        return R::failure("server '" + name + "': url must be a string");
      }
      spec.url = entry["url"].get<std::string>();
    }
    if (spec.url.empty()) {
      return R::failure("server '" + name + "': " + to_string(kind) + " transport requires a non-empty url");
    }
    if (auto err = read_string_map(entry, "headers", spec.headers)) {
      return R::failure("server '" + name + "': " + *err);
    }
    config.transport = std::move(spec);
  }

  auto overrides = parse_timeout_overrides(entry);
  if (overrides.failed()) {
    return R::failure("server '" + name + "': " + *overrides.error);
  }
  config.timeouts = *overrides.value;
  if (!config.timeouts.connect_timeout) config.timeouts.connect_timeout = defaults.connect_timeout;
  if (!config.timeouts.execute_timeout) config.timeouts.execute_timeout = defaults.execute_timeout;
  if (!config.timeouts.sse_read_timeout) config.timeouts.sse_read_timeout = defaults.sse_read_timeout;

  return R::success(std::move(config));
}

}  // namespace stepagent::mcp
