#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "core/types.hpp"
#include "mcp/config.hpp"
#include "mcp/transport.hpp"
#include "tool/tool.hpp"

namespace stepagent::mcp {

// MCP server capabilities (returned during initialize)
struct ServerCapabilities {
  bool supports_tools = false;
  bool supports_resources = false;
  bool supports_prompts = false;
  bool supports_logging = false;
};

// MCP tool definition (from tools/list)
struct McpToolInfo {
  std::string name;
  std::string description;
  json input_schema;  // JSON Schema, kept verbatim
};

// Connection state
enum class ClientState { Disconnected, Connecting, Connected, Failed };

std::string to_string(ClientState state);

// Converts a tools/call result into a ToolResult: text items joined with
// newlines, other items as "[<type> content]", isError -> failure.
ToolResult format_tool_result(const json &result);

// One connection to one MCP server
class McpConnection {
 public:
  explicit McpConnection(McpServerConfig config);
  ~McpConnection();

  McpConnection(const McpConnection &) = delete;
  McpConnection &operator=(const McpConnection &) = delete;

  // Opens the transport and runs the initialize handshake within
  // connect_timeout. Returns false (state Failed) on any failure; never throws.
  bool connect();

  // Idempotent; any state -> Disconnected
  void disconnect();

  ClientState state() const {
    return state_;
  }

  bool is_connected() const {
    return state() == ClientState::Connected;
  }

  const std::string &name() const {
    return config_.name;
  }

  const McpServerConfig &config() const {
    return config_;
  }

  const ServerCapabilities &capabilities() const {
    return capabilities_;
  }

  // tools/list (all pages), bounded by execute_timeout per request
  Result<std::vector<McpToolInfo>> list_tools();

  // tools/call, bounded by execute_timeout. Errors come back as failed results.
  ToolResult execute(const std::string &tool_name, const json &arguments);

 private:
  // nullopt when the response did not arrive in time
  std::optional<JsonRpcResponse> call(const std::string &method, const json &params,
                                      std::chrono::steady_clock::time_point deadline);

  bool initialize(std::chrono::steady_clock::time_point deadline);
  bool fail_connect(const std::string &reason);

  // Moves to Failed when the transport reports itself closed
  void check_transport();

  std::shared_ptr<Transport> current_transport() const;

  McpServerConfig config_;
  ServerCapabilities capabilities_;
  std::atomic<ClientState> state_{ClientState::Disconnected};
  std::atomic<int64_t> next_request_id_{1};

  mutable std::mutex transport_mutex_;
  std::shared_ptr<Transport> transport_;

  // Serializes connect / list_tools / execute
  std::mutex call_mutex_;
};

// Exposes one remote tool as a local Tool. Holds the connection weakly; the
// ToolRegistry owns it.
class McpToolBridge : public Tool {
 public:
  McpToolBridge(std::weak_ptr<McpConnection> connection, std::string server_name, McpToolInfo info);

  std::string name() const override {
    return info_.name;
  }

  std::string description() const override {
    return info_.description;
  }

  json parameters_schema() const override {
    return info_.input_schema;
  }

  std::future<ToolResult> execute(const json &args) override;

  const std::string &server_name() const {
    return server_name_;
  }

 private:
  std::weak_ptr<McpConnection> connection_;
  std::string server_name_;
  McpToolInfo info_;
};

}  // namespace stepagent::mcp
