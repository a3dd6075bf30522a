#pragma once

#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

#include "core/config.hpp"
#include "tool/tool.hpp"

namespace stepagent::tools {

// Relative paths are taken against the workspace directory
std::filesystem::path resolve_path(const std::string &workspace_dir, const std::string &path);

// ============================================================================
// File tools
// ============================================================================

class ReadTool : public SimpleTool {
 public:
  explicit ReadTool(std::string workspace_dir);
  std::future<ToolResult> execute(const json &args) override;

 protected:
  std::vector<ParameterSchema> parameters() const override;

 private:
  std::string workspace_dir_;
};

class WriteTool : public SimpleTool {
 public:
  explicit WriteTool(std::string workspace_dir);
  std::future<ToolResult> execute(const json &args) override;

 protected:
  std::vector<ParameterSchema> parameters() const override;

 private:
  std::string workspace_dir_;
};

class EditTool : public SimpleTool {
 public:
  explicit EditTool(std::string workspace_dir);
  std::future<ToolResult> execute(const json &args) override;

 protected:
  std::vector<ParameterSchema> parameters() const override;

 private:
  std::string workspace_dir_;
};

// ============================================================================
// Shell
// ============================================================================

class BashTool : public SimpleTool {
 public:
  static constexpr int kDefaultTimeoutSeconds = 120;
  static constexpr int kMaxTimeoutSeconds = 600;

  explicit BashTool(std::string workspace_dir);
  std::future<ToolResult> execute(const json &args) override;

 protected:
  std::vector<ParameterSchema> parameters() const override;

 private:
  std::string workspace_dir_;
};

// ============================================================================
// Session notes (flat JSON array of {timestamp, category, content})
// ============================================================================

class NoteStore {
 public:
  explicit NoteStore(std::filesystem::path file) : file_(std::move(file)) {}

  json load() const;
  void append(const std::string &category, const std::string &content);

  const std::filesystem::path &file() const {
    return file_;
  }

 private:
  json read_notes() const;

  std::filesystem::path file_;
  mutable std::mutex mutex_;
};

class RecordNoteTool : public SimpleTool {
 public:
  explicit RecordNoteTool(std::shared_ptr<NoteStore> store);
  std::future<ToolResult> execute(const json &args) override;

 protected:
  std::vector<ParameterSchema> parameters() const override;

 private:
  std::shared_ptr<NoteStore> store_;
};

class RecallNoteTool : public SimpleTool {
 public:
  explicit RecallNoteTool(std::shared_ptr<NoteStore> store);
  std::future<ToolResult> execute(const json &args) override;

 protected:
  std::vector<ParameterSchema> parameters() const override;

 private:
  std::shared_ptr<NoteStore> store_;
};

// Builds the tools enabled in `config`
std::vector<ToolPtr> make_builtin_tools(const ToolsConfig &config, const std::string &workspace_dir);

}  // namespace stepagent::tools
