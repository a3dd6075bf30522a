#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>

#include "builtins.hpp"

namespace stepagent::tools {

namespace fs = std::filesystem;

fs::path resolve_path(const std::string &workspace_dir, const std::string &path) {
  fs::path resolved = path;
  if (!resolved.is_absolute() && !workspace_dir.empty()) {
    resolved = fs::path(workspace_dir) / resolved;
  }
  return resolved;
}

// ============================================================================
// ReadTool
// ============================================================================

ReadTool::ReadTool(std::string workspace_dir)
    : SimpleTool("read_file", "Read file contents with line numbers. Use offset and limit to page through large files."),
      workspace_dir_(std::move(workspace_dir)) {}

std::vector<ParameterSchema> ReadTool::parameters() const {
  return {{"path", "string", "Absolute path or path relative to the workspace", true, std::nullopt, std::nullopt},
          {"offset", "integer", "Line number to start reading from (1-based)", false, std::nullopt, std::nullopt},
          {"limit", "integer", "Maximum number of lines to read", false, std::nullopt, std::nullopt}};
}

std::future<ToolResult> ReadTool::execute(const json &args) {
  return std::async(std::launch::async, [args, workspace = workspace_dir_]() -> ToolResult {
    std::string file_path = args.value("path", "");
    if (file_path.empty()) {
      return ToolResult::failure("path is required");
    }

    int offset = args.value("offset", 1);
    int limit = args.value("limit", 0);
    if (offset < 1) offset = 1;

    auto path = resolve_path(workspace, file_path);
    if (!fs::exists(path)) {
      return ToolResult::failure("File not found: " + path.string());
    }
    if (fs::is_directory(path)) {
      return ToolResult::failure("Path is a directory, not a file: " + path.string());
    }

    std::ifstream file(path);
    if (!file.is_open()) {
      return ToolResult::failure("Failed to open file: " + path.string());
    }

    std::ostringstream output;
    std::string line;
    int line_num = 0;
    int lines_read = 0;
    bool has_more = false;

    while (std::getline(file, line)) {
      line_num++;
      if (line_num < offset) continue;
      if (limit > 0 && lines_read >= limit) {
        has_more = true;
        break;
      }
      output << std::setw(6) << line_num << "|" << line << "\n";
      lines_read++;
    }

    std::string content = output.str();
    if (has_more) {
      content += "\n(File has more lines. Use offset=" + std::to_string(offset + limit) + " to continue)";
    }
    return ToolResult::ok(content);
  });
}

}  // namespace stepagent::tools
