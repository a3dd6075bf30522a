#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "core/types.hpp"
#include "mcp/client.hpp"
#include "tool/tool.hpp"

namespace stepagent::mcp {

// Owns the MCP connections built from one configuration and the tool proxies
// they expose.
//
// Config shape:
//   {"timeouts": {...}?, "mcpServers": {"<name>": {command|url, ...}}}
//
// Entries that are disabled, invalid or unreachable are logged and skipped;
// loading never throws for them.
class ToolRegistry {
 public:
  ToolRegistry() = default;
  ~ToolRegistry();

  ToolRegistry(const ToolRegistry &) = delete;
  ToolRegistry &operator=(const ToolRegistry &) = delete;

  // Replaces any previous load. A missing or unparsable file yields no tools.
  std::vector<ToolPtr> load(const std::string &config_path);
  std::vector<ToolPtr> load_json(const json &config);

  // Disconnects every retained connection once and forgets it. Safe to repeat.
  void cleanup();

  std::vector<ToolPtr> tools() const;
  std::shared_ptr<McpConnection> connection(const std::string &name) const;
  std::vector<std::string> connection_names() const;

  size_t tool_count() const;

 private:
  mutable std::mutex mutex_;
  std::vector<std::shared_ptr<McpConnection>> connections_;
  std::vector<ToolPtr> tools_;
};

}  // namespace stepagent::mcp
