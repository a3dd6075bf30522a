#include <filesystem>
#include <fstream>
#include <sstream>

#include "builtins.hpp"

namespace stepagent::tools {

namespace fs = std::filesystem;

// ============================================================================
// EditTool
// ============================================================================

EditTool::EditTool(std::string workspace_dir)
    : SimpleTool("edit_file", "Replace an exact string in a file. old_str must match exactly once unless replace_all is set."),
      workspace_dir_(std::move(workspace_dir)) {}

std::vector<ParameterSchema> EditTool::parameters() const {
  return {{"path", "string", "Absolute path or path relative to the workspace", true, std::nullopt, std::nullopt},
          {"old_str", "string", "Exact text to replace", true, std::nullopt, std::nullopt},
          {"new_str", "string", "Replacement text", true, std::nullopt, std::nullopt},
          {"replace_all", "boolean", "Replace every occurrence", false, json(false), std::nullopt}};
}

std::future<ToolResult> EditTool::execute(const json &args) {
  return std::async(std::launch::async, [args, workspace = workspace_dir_]() -> ToolResult {
    std::string file_path = args.value("path", "");
    std::string old_str = args.value("old_str", "");
    std::string new_str = args.value("new_str", "");
    bool replace_all = args.value("replace_all", false);

    if (file_path.empty()) {
      return ToolResult::failure("path is required");
    }
    if (old_str.empty()) {
      return ToolResult::failure("old_str is required");
    }

    auto path = resolve_path(workspace, file_path);
    if (!fs::exists(path)) {
      return ToolResult::failure("File not found: " + path.string());
    }

    std::string content;
    {
      std::ifstream file(path, std::ios::binary);
      if (!file.is_open()) {
        return ToolResult::failure("Failed to open file: " + path.string());
      }
      std::stringstream buffer;
      buffer << file.rdbuf();
      content = buffer.str();
    }

    size_t count = 0;
    for (size_t pos = content.find(old_str); pos != std::string::npos; pos = content.find(old_str, pos + old_str.size())) {
      count++;
    }

    if (count == 0) {
      return ToolResult::failure("old_str not found in " + path.string());
    }
    if (count > 1 && !replace_all) {
      return ToolResult::failure("old_str found " + std::to_string(count) +
                                 " times. Set replace_all=true or include more context to make it unique.");
    }

    std::string updated;
    updated.reserve(content.size());
    size_t pos = 0;
    size_t replaced = 0;
    while (true) {
      size_t found = content.find(old_str, pos);
      if (found == std::string::npos || (replaced > 0 && !replace_all)) {
        updated.append(content, pos, std::string::npos);
        break;
      }
      updated.append(content, pos, found - pos);
      updated += new_str;
      pos = found + old_str.size();
      replaced++;
    }

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
      return ToolResult::failure("Failed to write file: " + path.string());
    }
    out << updated;

    return ToolResult::ok("Replaced " + std::to_string(replaced) + " occurrence(s) in " + path.string());
  });
}

}  // namespace stepagent::tools
