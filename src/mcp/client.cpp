#include "mcp/client.hpp"

#include <spdlog/spdlog.h>

#include <sstream>

namespace stepagent::mcp {

namespace {

constexpr const char *kProtocolVersion = "2024-11-05";
constexpr const char *kClientName = "stepagent";
constexpr const char *kClientVersion = "0.1.0";

std::string format_seconds(double seconds) {
  std::ostringstream oss;
  oss << seconds;
  return oss.str();
}

}  // namespace

// ============================================================
// ClientState helpers
// ============================================================

std::string to_string(ClientState state) {
  switch (state) {
    case ClientState::Disconnected:
      return "Disconnected";
    case ClientState::Connecting:
      return "Connecting";
    case ClientState::Connected:
      return "Connected";
    case ClientState::Failed:
      return "Failed";
  }
  return "Unknown";
}

ToolResult format_tool_result(const json &result) {
  std::string output;

  if (result.contains("content") && result["content"].is_array()) {
    for (const auto &item : result["content"]) {
      std::string type = item.is_object() ? item.value("type", "text") : "text";
      std::string piece;
      if (type == "text") {
        piece = item.value("text", "");
      } else {
        piece = "[" + type + " content]";
      }
      if (!output.empty()) output += "\n";
      output += piece;
    }
  }

  if (result.value("isError", false)) {
    return ToolResult::failure(output.empty() ? "Tool reported an error" : output);
  }
  return ToolResult::ok(output);
}

// ============================================================
// McpConnection
// ============================================================

McpConnection::McpConnection(McpServerConfig config) : config_(std::move(config)) {}

McpConnection::~McpConnection() {
  disconnect();
}

std::shared_ptr<Transport> McpConnection::current_transport() const {
  std::lock_guard<std::mutex> lock(transport_mutex_);
  return transport_;
}

bool McpConnection::connect() {
  std::lock_guard<std::mutex> call_lock(call_mutex_);

  if (state_ == ClientState::Connected) {
    return true;
  }

  // Timeout is read once, when the operation starts
  double timeout = config_.connect_timeout();
  auto deadline = std::chrono::steady_clock::now() + to_millis(timeout);

  state_ = ClientState::Connecting;
  spdlog::info("[MCP] Connecting to '{}' ({})", config_.name, to_string(config_.kind()));

  std::shared_ptr<Transport> transport;
  try {
    transport = make_transport(config_);
  } catch (const std::exception &e) {
    return fail_connect(std::string("cannot create transport: ") + e.what());
  }

  transport->set_notification_handler([name = config_.name](const std::string &method, const json &params) {
    if (method == "notifications/tools/list_changed") {
      spdlog::info("[MCP] Server '{}' reports its tool list changed", name);
      return;
    }
    spdlog::debug("[MCP] Notification from '{}': {} {}", name, method, params.dump());
  });

  {
    std::lock_guard<std::mutex> lock(transport_mutex_);
    if (transport_) {
      transport_->disconnect();
    }
    transport_ = transport;
  }

  try {
    auto opened = transport->connect();
    if (opened.wait_until(deadline) != std::future_status::ready) {
      transport->disconnect();
      return fail_connect("transport did not open within " + format_seconds(timeout) + "s");
    }
    if (!opened.get()) {
      transport->disconnect();
      return fail_connect("transport failed to open");
    }

    if (!initialize(deadline)) {
      transport->disconnect();
      return fail_connect("initialize handshake failed");
    }
  } catch (const std::exception &e) {
    transport->disconnect();
    return fail_connect(e.what());
  }

  state_ = ClientState::Connected;
  spdlog::info("[MCP] Server '{}' is ready", config_.name);
  return true;
}

bool McpConnection::fail_connect(const std::string &reason) {
  spdlog::warn("[MCP] Failed to connect to '{}': {}", config_.name, reason);
  state_ = ClientState::Failed;
  return false;
}

void McpConnection::disconnect() {
  auto transport = current_transport();
  if (transport) {
    transport->disconnect();
  }

  auto previous = state_.exchange(ClientState::Disconnected);
  if (previous == ClientState::Connected) {
    spdlog::info("[MCP] Disconnected from '{}'", config_.name);
  }
}

std::optional<JsonRpcResponse> McpConnection::call(const std::string &method, const json &params,
                                                   std::chrono::steady_clock::time_point deadline) {
  auto transport = current_transport();
  if (!transport) {
    return JsonRpcResponse::failure(0, "MCP server '" + config_.name + "' has no transport");
  }

  JsonRpcRequest req;
  req.method = method;
  req.params = params;
  req.id = next_request_id_++;

  auto future = transport->send_request(req);
  if (future.wait_until(deadline) != std::future_status::ready) {
    transport->cancel_request(req.id);
    return std::nullopt;
  }
  return future.get();
}

bool McpConnection::initialize(std::chrono::steady_clock::time_point deadline) {
  json params = {{"protocolVersion", kProtocolVersion},
                 {"capabilities", json::object()},
                 {"clientInfo", {{"name", kClientName}, {"version", kClientVersion}}}};

  auto resp = call("initialize", params, deadline);
  if (!resp) {
    spdlog::error("[MCP] Initialize timed out for '{}'", config_.name);
    return false;
  }
  if (!resp->ok()) {
    spdlog::error("[MCP] Initialize error from '{}': {}", config_.name, resp->error_message());
    return false;
  }

  capabilities_ = ServerCapabilities{};
  if (resp->result.has_value() && resp->result->is_object()) {
    const auto &result = resp->result.value();
    if (result.contains("capabilities") && result["capabilities"].is_object()) {
      const auto &caps = result["capabilities"];
      capabilities_.supports_tools = caps.contains("tools");
      capabilities_.supports_resources = caps.contains("resources");
      capabilities_.supports_prompts = caps.contains("prompts");
      capabilities_.supports_logging = caps.contains("logging");
    }

    if (result.contains("serverInfo") && result["serverInfo"].is_object()) {
      const auto &info = result["serverInfo"];
      spdlog::info("[MCP] Server '{}' info: {} v{}", config_.name, info.value("name", "unknown"),
                   info.value("version", "unknown"));
    }
  }

  JsonRpcNotification notif;
  notif.method = "notifications/initialized";
  current_transport()->send_notification(notif);

  return true;
}

void McpConnection::check_transport() {
  auto transport = current_transport();
  if (transport && transport->state() == TransportState::Failed && state_ == ClientState::Connected) {
    spdlog::warn("[MCP] Transport for '{}' closed", config_.name);
    state_ = ClientState::Failed;
  }
}

Result<std::vector<McpToolInfo>> McpConnection::list_tools() {
  using R = Result<std::vector<McpToolInfo>>;
  std::lock_guard<std::mutex> lock(call_mutex_);

  if (state_ != ClientState::Connected) {
    return R::failure("MCP server '" + config_.name + "' is not connected");
  }

  double timeout = config_.execute_timeout();
  std::vector<McpToolInfo> tools;
  std::optional<std::string> cursor;

  do {
    json params = json::object();
    if (cursor) {
      params["cursor"] = *cursor;
    }

    auto resp = call("tools/list", params, std::chrono::steady_clock::now() + to_millis(timeout));
    check_transport();
    if (!resp) {
      return R::failure("tools/list on '" + config_.name + "' timed out after " + format_seconds(timeout) + "s");
    }
    if (!resp->ok()) {
      return R::failure("tools/list on '" + config_.name + "' failed: " + resp->error_message());
    }

    cursor.reset();
    if (!resp->result.has_value() || !resp->result->is_object()) {
      break;
    }
    const auto &result = resp->result.value();

    if (result.contains("tools") && result["tools"].is_array()) {
      for (const auto &tool_json : result["tools"]) {
        if (!tool_json.is_object() || !tool_json.contains("name") || !tool_json["name"].is_string()) {
          spdlog::warn("[MCP] Server '{}' listed a tool without a name, skipping", config_.name);
          continue;
        }
        McpToolInfo info;
        info.name = tool_json["name"].get<std::string>();
        info.description = tool_json.contains("description") && tool_json["description"].is_string()
                               ? tool_json["description"].get<std::string>()
                               : "";
        if (tool_json.contains("inputSchema") && tool_json["inputSchema"].is_object()) {
          info.input_schema = tool_json["inputSchema"];
        } else {
          info.input_schema = json{{"type", "object"}, {"properties", json::object()}};
        }
        tools.push_back(std::move(info));
      }
    }

    if (result.contains("nextCursor") && result["nextCursor"].is_string() &&
        !result["nextCursor"].get<std::string>().empty()) {
      cursor = result["nextCursor"].get<std::string>();
    }
  } while (cursor);

  spdlog::info("[MCP] Server '{}' provides {} tools", config_.name, tools.size());
  return R::success(std::move(tools));
}

ToolResult McpConnection::execute(const std::string &tool_name, const json &arguments) {
  std::lock_guard<std::mutex> lock(call_mutex_);

  if (state_ != ClientState::Connected) {
    return ToolResult::failure("MCP server '" + config_.name + "' is not connected");
  }

  double timeout = config_.execute_timeout();
  spdlog::debug("[MCP] Calling '{}' on '{}'", tool_name, config_.name);

  json params = {{"name", tool_name}, {"arguments", arguments.is_object() ? arguments : json::object()}};
  auto resp = call("tools/call", params, std::chrono::steady_clock::now() + to_millis(timeout));
  check_transport();

  if (!resp) {
    spdlog::warn("[MCP] Tool '{}' on '{}' timed out after {}s", tool_name, config_.name, timeout);
    return ToolResult::failure("Tool '" + tool_name + "' timed out after " + format_seconds(timeout) + " seconds");
  }
  if (!resp->ok()) {
    return ToolResult::failure(resp->error_message());
  }
  return format_tool_result(resp->result.value_or(json::object()));
}

// ============================================================
// McpToolBridge — wraps MCP tool as local Tool
// ============================================================

McpToolBridge::McpToolBridge(std::weak_ptr<McpConnection> connection, std::string server_name, McpToolInfo info)
    : connection_(std::move(connection)), server_name_(std::move(server_name)), info_(std::move(info)) {}

std::future<ToolResult> McpToolBridge::execute(const json &args) {
  return std::async(std::launch::async, [connection = connection_, server = server_name_, tool = info_.name, args]() {
    auto conn = connection.lock();
    if (!conn) {
      return ToolResult::failure("MCP server '" + server + "' is no longer available");
    }
    return conn->execute(tool, args);
  });
}

}  // namespace stepagent::mcp
