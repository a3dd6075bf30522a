#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include "core/types.hpp"

namespace stepagent::mcp {

// Transport kind of one MCP server entry
enum class TransportKind { Stdio, Sse, Http, StreamableHttp };

std::string to_string(TransportKind kind);

// Case-insensitive; nullopt for unknown names
std::optional<TransportKind> transport_kind_from_string(const std::string &str);

inline bool is_url_kind(TransportKind kind) {
  return kind != TransportKind::Stdio;
}

// ============================================================
// Timeouts (seconds)
// ============================================================

struct McpTimeoutConfig {
  double connect_timeout = 10.0;
  double execute_timeout = 60.0;
  double sse_read_timeout = 120.0;
};

// Process-wide defaults, copied by value when an operation starts
McpTimeoutConfig get_timeout_config();

// Partial update; unset fields keep their current value.
// Throws std::invalid_argument for non-positive values.
void set_timeout_config(std::optional<double> connect_timeout, std::optional<double> execute_timeout = std::nullopt,
                        std::optional<double> sse_read_timeout = std::nullopt);
void set_timeout_config(const McpTimeoutConfig &config);

// Snapshots the process-wide defaults and restores them on destruction
class ScopedTimeoutConfig {
 public:
  ScopedTimeoutConfig() : saved_(get_timeout_config()) {}
  explicit ScopedTimeoutConfig(const McpTimeoutConfig &config) : saved_(get_timeout_config()) {
    set_timeout_config(config);
  }
  ~ScopedTimeoutConfig() {
    set_timeout_config(saved_);
  }

  ScopedTimeoutConfig(const ScopedTimeoutConfig &) = delete;
  ScopedTimeoutConfig &operator=(const ScopedTimeoutConfig &) = delete;

 private:
  McpTimeoutConfig saved_;
};

// Per-server overrides
struct TimeoutOverrides {
  std::optional<double> connect_timeout;
  std::optional<double> execute_timeout;
  std::optional<double> sse_read_timeout;
};

std::chrono::milliseconds to_millis(double seconds);

// ============================================================
// Server configuration
// ============================================================

struct StdioTransportSpec {
  std::string command;
  std::vector<std::string> args;
  std::map<std::string, std::string> env;
};

struct UrlTransportSpec {
  TransportKind kind = TransportKind::StreamableHttp;
  std::string url;
  std::map<std::string, std::string> headers;
};

using TransportSpec = std::variant<StdioTransportSpec, UrlTransportSpec>;

struct McpServerConfig {
  std::string name;
  bool disabled = false;
  TransportSpec transport;
  TimeoutOverrides timeouts;

  TransportKind kind() const;

  // Override if set, else the process-wide default at the time of the call
  double connect_timeout() const;
  double execute_timeout() const;
  double sse_read_timeout() const;
};

// Transport kind of a raw entry:
//   explicit "type" (case-insensitive) > command without url -> stdio > url -> streamable_http > stdio
TransportKind infer_transport_kind(const json &entry);

// Validates one "mcpServers" entry. `defaults` fills timeouts the entry does not set.
Result<McpServerConfig> parse_server_config(const std::string &name, const json &entry,
                                            const TimeoutOverrides &defaults = {});

// Parses a {"connect_timeout": .., ...} block
Result<TimeoutOverrides> parse_timeout_overrides(const json &j);

}  // namespace stepagent::mcp
