#include <filesystem>
#include <fstream>

#include "builtins.hpp"

namespace stepagent::tools {

namespace fs = std::filesystem;

// ============================================================================
// WriteTool
// ============================================================================

WriteTool::WriteTool(std::string workspace_dir)
    : SimpleTool("write_file", "Write content to a file. Creates parent directories and overwrites existing files."),
      workspace_dir_(std::move(workspace_dir)) {}

std::vector<ParameterSchema> WriteTool::parameters() const {
  return {{"path", "string", "Absolute path or path relative to the workspace", true, std::nullopt, std::nullopt},
          {"content", "string", "Complete file content", true, std::nullopt, std::nullopt}};
}

std::future<ToolResult> WriteTool::execute(const json &args) {
  return std::async(std::launch::async, [args, workspace = workspace_dir_]() -> ToolResult {
    std::string file_path = args.value("path", "");
    std::string content = args.value("content", "");

    if (file_path.empty()) {
      return ToolResult::failure("path is required");
    }

    auto path = resolve_path(workspace, file_path);

    std::error_code ec;
    auto parent = path.parent_path();
    if (!parent.empty()) {
      fs::create_directories(parent, ec);
      if (ec) {
        return ToolResult::failure("Failed to create directory " + parent.string() + ": " + ec.message());
      }
    }

    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
      return ToolResult::failure("Failed to open file for writing: " + path.string());
    }
    file << content;
    if (!file) {
      return ToolResult::failure("Failed to write file: " + path.string());
    }

    return ToolResult::ok("Successfully wrote " + std::to_string(content.size()) + " bytes to " + path.string());
  });
}

}  // namespace stepagent::tools
