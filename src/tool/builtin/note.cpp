#include <spdlog/spdlog.h>

#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

#include "builtins.hpp"

namespace stepagent::tools {

namespace fs = std::filesystem;

namespace {

std::string current_timestamp() {
  auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  std::tm tm{};
  localtime_r(&now, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S");
  return oss.str();
}

}  // namespace

// ============================================================================
// NoteStore
// ============================================================================

json NoteStore::load() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return read_notes();
}

json NoteStore::read_notes() const {
  std::ifstream file(file_);
  if (!file.is_open()) {
    return json::array();
  }

  try {
    auto notes = json::parse(file);
    return notes.is_array() ? notes : json::array();
  } catch (const json::parse_error &e) {
    spdlog::warn("[Notes] Ignoring unreadable notes file {}: {}", file_.string(), e.what());
    return json::array();
  }
}

void NoteStore::append(const std::string &category, const std::string &content) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto notes = read_notes();
  notes.push_back({{"timestamp", current_timestamp()}, {"category", category}, {"content", content}});

  auto parent = file_.parent_path();
  if (!parent.empty()) {
    fs::create_directories(parent);
  }

  std::ofstream out(file_, std::ios::trunc);
  if (!out.is_open()) {
    throw std::runtime_error("Failed to open notes file: " + file_.string());
  }
  out << notes.dump(2);
}

// ============================================================================
// RecordNoteTool
// ============================================================================

RecordNoteTool::RecordNoteTool(std::shared_ptr<NoteStore> store)
    : SimpleTool("record_note",
                 "Record an important fact, decision or user preference so it can be recalled later in this or a future "
                 "session."),
      store_(std::move(store)) {}

std::vector<ParameterSchema> RecordNoteTool::parameters() const {
  return {{"content", "string", "The information to remember", true, std::nullopt, std::nullopt},
          {"category", "string", "Category such as user_preference, project_info or decision", false, json("general"),
           std::nullopt}};
}

std::future<ToolResult> RecordNoteTool::execute(const json &args) {
  return std::async(std::launch::async, [args, store = store_]() -> ToolResult {
    std::string content = args.value("content", "");
    std::string category = args.value("category", "general");
    if (content.empty()) {
      return ToolResult::failure("content is required");
    }

    try {
      store->append(category, content);
    } catch (const std::exception &e) {
      return ToolResult::failure(std::string("Failed to record note: ") + e.what());
    }
    return ToolResult::ok("Recorded note: " + content + " (category: " + category + ")");
  });
}

// ============================================================================
// RecallNoteTool
// ============================================================================

RecallNoteTool::RecallNoteTool(std::shared_ptr<NoteStore> store)
    : SimpleTool("recall_note", "Recall previously recorded notes, optionally filtered by category."), store_(std::move(store)) {}

std::vector<ParameterSchema> RecallNoteTool::parameters() const {
  return {{"category", "string", "Only return notes in this category", false, std::nullopt, std::nullopt}};
}

std::future<ToolResult> RecallNoteTool::execute(const json &args) {
  return std::async(std::launch::async, [args, store = store_]() -> ToolResult {
    std::string category = args.value("category", "");
    auto notes = store->load();
    if (notes.empty()) {
      return ToolResult::ok("No notes recorded yet.");
    }

    std::ostringstream out;
    int index = 0;
    for (const auto &note : notes) {
      auto note_category = note.value("category", "general");
      if (!category.empty() && note_category != category) continue;
      out << ++index << ". [" << note_category << "] " << note.value("content", "") << " (recorded at "
          << note.value("timestamp", "") << ")\n";
    }

    if (index == 0) {
      return ToolResult::ok("No notes found in category: " + category);
    }
    return ToolResult::ok("Recorded notes:\n" + out.str());
  });
}

// ============================================================================
// Factory
// ============================================================================

std::vector<ToolPtr> make_builtin_tools(const ToolsConfig &config, const std::string &workspace_dir) {
  std::vector<ToolPtr> tools;

  if (config.enable_file_tools) {
    tools.push_back(std::make_shared<ReadTool>(workspace_dir));
    tools.push_back(std::make_shared<WriteTool>(workspace_dir));
    tools.push_back(std::make_shared<EditTool>(workspace_dir));
  }
  if (config.enable_bash) {
    tools.push_back(std::make_shared<BashTool>(workspace_dir));
  }
  if (config.enable_note) {
    auto store = std::make_shared<NoteStore>(resolve_path(workspace_dir, config.notes_file));
    tools.push_back(std::make_shared<RecordNoteTool>(store));
    tools.push_back(std::make_shared<RecallNoteTool>(store));
  }

  spdlog::debug("[Tools] {} built-in tools enabled", tools.size());
  return tools;
}

}  // namespace stepagent::tools
