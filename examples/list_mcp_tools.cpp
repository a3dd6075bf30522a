#include <spdlog/spdlog.h>

#include <iostream>

#include "core/logging.hpp"
#include "mcp/registry.hpp"

using namespace stepagent;

int main(int argc, char *argv[]) {
  // 启用 debug 日志
  logging::setup("debug");

  std::string config_path = argc > 1 ? argv[1] : "mcp.json";
  std::cout << "=== MCP servers from " << config_path << " ===\n" << std::endl;

  // 1. 连接所有服务器
  mcp::ToolRegistry registry;
  auto tools = registry.load(config_path);

  auto names = registry.connection_names();
  if (names.empty()) {
    std::cerr << "No MCP server could be connected." << std::endl;
    return 1;
  }

  // 2. 打印服务器和工具
  for (const auto &name : names) {
    auto conn = registry.connection(name);
    std::cout << name << " (" << mcp::to_string(conn->config().kind()) << ", " << mcp::to_string(conn->state()) << ")"
              << std::endl;
  }
  std::cout << std::endl;

  for (const auto &tool : tools) {
    auto bridge = std::dynamic_pointer_cast<mcp::McpToolBridge>(tool);
    std::cout << "- " << tool->name();
    if (bridge) {
      std::cout << " [" << bridge->server_name() << "]";
    }
    std::cout << "\n    " << tool->description() << "\n    " << tool->parameters_schema().dump() << std::endl;
  }

  // 3. 可选：调用一个工具
  if (argc > 3) {
    auto tool = find_tool(tools, argv[2]);
    if (!tool) {
      std::cerr << "Unknown tool: " << argv[2] << std::endl;
      return 1;
    }
    auto args = json::parse(argv[3], nullptr, false);
    if (args.is_discarded()) {
      std::cerr << "Arguments must be a JSON object" << std::endl;
      return 1;
    }
    auto result = tool->execute(args).get();
    std::cout << "\n" << (result.success ? "OK: " : "FAILED: ") << result.to_message_content() << std::endl;
  }

  registry.cleanup();
  return 0;
}
