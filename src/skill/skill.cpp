#include "skill/skill.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <regex>
#include <sstream>

namespace stepagent::skill {

namespace fs = std::filesystem;

namespace {

std::string trim(const std::string &s) {
  auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) return "";
  auto end = s.find_last_not_of(" \t\r\n");
  return s.substr(start, end - start + 1);
}

std::string unquote(const std::string &s) {
  if (s.size() >= 2 && ((s.front() == '"' && s.back() == '"') || (s.front() == '\'' && s.back() == '\''))) {
    return s.substr(1, s.size() - 2);
  }
  return s;
}

// Splits "---\n<frontmatter>\n---\n<body>"; false when there is no frontmatter
bool split_frontmatter(const std::string &text, std::string &frontmatter, std::string &body) {
  std::istringstream in(text);
  std::string line;

  if (!std::getline(in, line) || trim(line) != "---") {
    return false;
  }

  std::ostringstream fm;
  bool closed = false;
  while (std::getline(in, line)) {
    if (trim(line) == "---") {
      closed = true;
      break;
    }
    fm << line << "\n";
  }
  if (!closed) {
    return false;
  }

  frontmatter = fm.str();
  std::ostringstream rest;
  rest << in.rdbuf();
  body = trim(rest.str());
  return true;
}

}  // namespace

std::string SkillInfo::to_prompt() const {
  std::string prompt = "# Skill: " + name + "\n\n" + description + "\n\n";
  if (!source_path.empty()) {
    prompt += "**Skill Root Directory:** `" + source_path.parent_path().string() + "`\n\n";
    prompt += "Paths mentioned below are relative to this directory.\n\n";
  }
  prompt += "---\n\n" + body;
  return prompt;
}

bool validate_skill_name(const std::string &name) {
  static const std::regex pattern("^[a-z0-9]+(-[a-z0-9]+)*$");
  return !name.empty() && name.size() <= 64 && std::regex_match(name, pattern);
}

ParseResult parse_skill(const std::string &text, const fs::path &source_path) {
  std::string frontmatter;
  std::string body;
  if (!split_frontmatter(text, frontmatter, body)) {
    return {std::nullopt, "missing frontmatter"};
  }

  SkillInfo skill;
  skill.body = body;
  skill.source_path = source_path;

  std::istringstream in(frontmatter);
  std::string line;
  bool in_metadata = false;
  while (std::getline(in, line)) {
    if (trim(line).empty() || trim(line)[0] == '#') continue;

    bool indented = line[0] == ' ' || line[0] == '\t';
    auto colon = line.find(':');
    if (colon == std::string::npos) continue;

    std::string key = trim(line.substr(0, colon));
    std::string value = unquote(trim(line.substr(colon + 1)));

    if (indented && in_metadata) {
      skill.metadata[key] = value;
      continue;
    }
    in_metadata = false;

    if (key == "name") {
      skill.name = value;
    } else if (key == "description") {
      skill.description = value;
    } else if (key == "license") {
      skill.license = value;
    } else if (key == "metadata") {
      in_metadata = true;
    }
  }

  if (skill.name.empty()) {
    return {std::nullopt, "missing required field: name"};
  }
  if (!validate_skill_name(skill.name)) {
    return {std::nullopt, "invalid skill name: " + skill.name};
  }
  if (skill.description.empty() || skill.description.size() > 1024) {
    return {std::nullopt, "description must be 1-1024 characters"};
  }

  return {std::move(skill), std::nullopt};
}

ParseResult parse_skill_file(const fs::path &path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    return {std::nullopt, "cannot open " + path.string()};
  }
  std::ostringstream content;
  content << file.rdbuf();

  std::error_code ec;
  auto absolute = fs::absolute(path, ec);
  return parse_skill(content.str(), ec ? path : absolute);
}

// ============================================================
// SkillRegistry
// ============================================================

size_t SkillRegistry::discover(const fs::path &skills_dir) {
  std::error_code ec;
  if (!fs::is_directory(skills_dir, ec)) {
    spdlog::debug("[Skill] No skills directory at {}", skills_dir.string());
    return 0;
  }

  size_t count = 0;
  for (auto it = fs::recursive_directory_iterator(skills_dir, fs::directory_options::skip_permission_denied, ec);
       !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
    if (!it->is_regular_file() || it->path().filename() != "SKILL.md") continue;

    auto result = parse_skill_file(it->path());
    if (!result.ok()) {
      spdlog::warn("[Skill] Skipping {}: {}", it->path().string(), *result.error);
      continue;
    }
    if (register_skill(std::move(*result.skill))) {
      ++count;
    }
  }

  spdlog::info("[Skill] Discovered {} skills in {}", count, skills_dir.string());
  return count;
}

bool SkillRegistry::register_skill(SkillInfo skill) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (skills_.count(skill.name)) {
    spdlog::warn("[Skill] Duplicate skill '{}' at {}, keeping the first", skill.name, skill.source_path.string());
    return false;
  }
  auto name = skill.name;
  skills_.emplace(std::move(name), std::move(skill));
  return true;
}

std::optional<SkillInfo> SkillRegistry::get(const std::string &name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = skills_.find(name);
  if (it == skills_.end()) return std::nullopt;
  return it->second;
}

std::vector<SkillInfo> SkillRegistry::all() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<SkillInfo> result;
  for (const auto &[name, skill] : skills_) {
    result.push_back(skill);
  }
  return result;
}

std::vector<std::string> SkillRegistry::names() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::string> result;
  for (const auto &[name, skill] : skills_) {
    result.push_back(name);
  }
  return result;
}

size_t SkillRegistry::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return skills_.size();
}

void SkillRegistry::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  skills_.clear();
}

std::string SkillRegistry::metadata_prompt() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (skills_.empty()) return "";

  std::string prompt = "## Available Skills\n\n";
  prompt += "You have access to specialized skills. Each skill provides expert guidance for specific tasks.\n";
  prompt += "Load a skill's full content with the get_skill tool when it applies.\n\n";
  for (const auto &[name, skill] : skills_) {
    prompt += "- `" + name + "`: " + skill.description + "\n";
  }
  return prompt;
}

// ============================================================
// GetSkillTool
// ============================================================

GetSkillTool::GetSkillTool(std::shared_ptr<SkillRegistry> registry)
    : SimpleTool("get_skill",
                 "Get complete content and guidance for a specified skill, used for executing specific types of tasks"),
      registry_(std::move(registry)) {}

std::vector<ParameterSchema> GetSkillTool::parameters() const {
  return {{"skill_name", "string", "Name of the skill to retrieve", true, std::nullopt, std::nullopt}};
}

std::future<ToolResult> GetSkillTool::execute(const json &args) {
  return std::async(std::launch::async, [args, registry = registry_]() -> ToolResult {
    std::string name = args.value("skill_name", "");
    auto skill = registry->get(name);
    if (!skill) {
      std::string available;
      for (const auto &n : registry->names()) {
        if (!available.empty()) available += ", ";
        available += n;
      }
      return ToolResult::failure("Skill '" + name + "' does not exist. Available skills: " + available);
    }
    return ToolResult::ok(skill->to_prompt());
  });
}

}  // namespace stepagent::skill
