#pragma once

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "tool/tool.hpp"

namespace stepagent::skill {

// Parsed SKILL.md representation
struct SkillInfo {
  std::string name;                             // Required: lowercase alphanumeric with hyphens
  std::string description;                      // Required: 1-1024 chars
  std::string body;                             // Markdown content after frontmatter
  std::optional<std::string> license;           // Optional
  std::map<std::string, std::string> metadata;  // Optional: string-to-string map
  std::filesystem::path source_path;            // Absolute path to the SKILL.md file

  // Full content handed to the model by get_skill
  std::string to_prompt() const;
};

// Result of parsing a SKILL.md file
struct ParseResult {
  std::optional<SkillInfo> skill;
  std::optional<std::string> error;

  bool ok() const {
    return skill.has_value();
  }
};

// Validate a skill name:
//   - 1-64 characters
//   - lowercase alphanumeric with single hyphen separators
//   - Must match: ^[a-z0-9]+(-[a-z0-9]+)*$
bool validate_skill_name(const std::string &name);

// Parse SKILL.md text (YAML-style frontmatter between "---" lines, then markdown)
ParseResult parse_skill(const std::string &text, const std::filesystem::path &source_path = {});

// Parse a SKILL.md file
ParseResult parse_skill_file(const std::filesystem::path &path);

// Skills found under one directory
class SkillRegistry {
 public:
  // Scans `skills_dir` recursively for SKILL.md files. Returns the number registered.
  size_t discover(const std::filesystem::path &skills_dir);

  std::optional<SkillInfo> get(const std::string &name) const;

  // Sorted by name
  std::vector<SkillInfo> all() const;
  std::vector<std::string> names() const;

  size_t size() const;
  void clear();

  // "## Available Skills" section listing name and description of each skill;
  // empty when there are none
  std::string metadata_prompt() const;

 private:
  // First-wins dedup by name; false when the name is taken
  bool register_skill(SkillInfo skill);

  mutable std::mutex mutex_;
  std::map<std::string, SkillInfo> skills_;
};

// get_skill: loads the full content of one skill on demand
class GetSkillTool : public SimpleTool {
 public:
  explicit GetSkillTool(std::shared_ptr<SkillRegistry> registry);
  std::future<ToolResult> execute(const json &args) override;

 protected:
  std::vector<ParameterSchema> parameters() const override;

 private:
  std::shared_ptr<SkillRegistry> registry_;
};

}  // namespace stepagent::skill
