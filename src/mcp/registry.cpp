#include "mcp/registry.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <future>
#include <set>

namespace stepagent::mcp {

ToolRegistry::~ToolRegistry() {
  cleanup();
}

std::vector<ToolPtr> ToolRegistry::load(const std::string &config_path) {
  std::ifstream file(config_path);
  if (!file.is_open()) {
    spdlog::warn("[MCP] Config file not found: {}", config_path);
    cleanup();
    return {};
  }

  auto config = json::parse(file, nullptr, false);
  if (config.is_discarded()) {
    spdlog::warn("[MCP] Config file is not valid JSON: {}", config_path);
    cleanup();
    return {};
  }

  spdlog::info("[MCP] Loading servers from {}", config_path);
  return load_json(config);
}

std::vector<ToolPtr> ToolRegistry::load_json(const json &config) {
  cleanup();

  if (!config.is_object() || !config.contains("mcpServers") || !config["mcpServers"].is_object()) {
    spdlog::warn("[MCP] Config has no \"mcpServers\" object");
    return {};
  }

  TimeoutOverrides defaults;
  if (config.contains("timeouts") && !config["timeouts"].is_null()) {
    auto parsed = parse_timeout_overrides(config["timeouts"]);
    if (parsed.ok()) {
      defaults = *parsed.value;
    } else {
      spdlog::warn("[MCP] Ignoring timeouts block: {}", *parsed.error);
    }
  }

  // Validate every entry before touching any process or network
  std::vector<std::shared_ptr<McpConnection>> candidates;
  for (const auto &[name, entry] : config["mcpServers"].items()) {
    if (entry.is_object() && entry.contains("disabled") && entry["disabled"].is_boolean() && entry["disabled"].get<bool>()) {
      spdlog::info("[MCP] Skipping disabled server '{}'", name);
      continue;
    }

    auto parsed = parse_server_config(name, entry, defaults);
    if (parsed.failed()) {
      spdlog::warn("[MCP] Skipping invalid entry: {}", *parsed.error);
      continue;
    }
    candidates.push_back(std::make_shared<McpConnection>(std::move(*parsed.value)));
  }

  // Connect in parallel, collect in config order
  std::vector<std::future<bool>> futures;
  futures.reserve(candidates.size());
  for (auto &conn : candidates) {
    futures.push_back(std::async(std::launch::async, [conn]() {
      return conn->connect();
    }));
  }

  std::vector<std::shared_ptr<McpConnection>> connected;
  for (size_t i = 0; i < futures.size(); ++i) {
    if (futures[i].get()) {
      connected.push_back(candidates[i]);
    } else {
      candidates[i]->disconnect();
    }
  }

  std::vector<ToolPtr> tools;
  std::set<std::string> seen;
  for (auto &conn : connected) {
    auto listed = conn->list_tools();
    if (listed.failed()) {
      spdlog::warn("[MCP] {}", *listed.error);
      continue;
    }

    for (auto &info : *listed.value) {
      if (!seen.insert(info.name).second) {
        spdlog::warn("[MCP] Tool '{}' from '{}' shadows an earlier tool with the same name, skipping", info.name,
                     conn->name());
        continue;
      }
      spdlog::debug("[MCP] Registered tool '{}' from server '{}'", info.name, conn->name());
      tools.push_back(std::make_shared<McpToolBridge>(conn, conn->name(), std::move(info)));
    }
  }

  spdlog::info("[MCP] {} of {} servers connected, {} tools available", connected.size(), candidates.size(),
               tools.size());

  std::lock_guard<std::mutex> lock(mutex_);
  connections_ = std::move(connected);
  tools_ = tools;
  return tools;
}

void ToolRegistry::cleanup() {
  std::vector<std::shared_ptr<McpConnection>> connections;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    connections = std::move(connections_);
    connections_.clear();
    tools_.clear();
  }

  for (auto &conn : connections) {
    conn->disconnect();
  }
}

std::vector<ToolPtr> ToolRegistry::tools() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return tools_;
}

std::shared_ptr<McpConnection> ToolRegistry::connection(const std::string &name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto &conn : connections_) {
    if (conn->name() == name) {
      return conn;
    }
  }
  return nullptr;
}

std::vector<std::string> ToolRegistry::connection_names() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> names;
  names.reserve(connections_.size());
  for (const auto &conn : connections_) {
    names.push_back(conn->name());
  }
  return names;
}

size_t ToolRegistry::tool_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return tools_.size();
}

}  // namespace stepagent::mcp
