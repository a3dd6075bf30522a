#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "core/retry.hpp"
#include "core/types.hpp"

namespace stepagent {

// Model provider settings
struct LlmConfig {
  std::string provider = "anthropic";  // "anthropic" or "openai"
  std::string api_key;
  std::string api_base = "https://api.anthropic.com";
  std::string model = "claude-sonnet-4-20250514";
  int max_tokens = 16384;
  double request_timeout = 120.0;  // seconds
  RetryConfig retry;
};

// Step-loop settings
struct AgentSettings {
  int max_steps = 50;
  std::string workspace_dir = "./workspace";
  std::string system_prompt;
  std::string system_prompt_path;  // Read when system_prompt is empty
};

// Which tools are made available to the agent
struct ToolsConfig {
  bool enable_file_tools = true;
  bool enable_bash = true;
  bool enable_note = true;
  std::string notes_file = ".agent_memory.json";
  bool enable_mcp = true;
  std::string mcp_config_path = "mcp.json";
  bool enable_skills = true;
  std::string skills_dir = "./skills";
};

struct Config {
  LlmConfig llm;
  AgentSettings agent;
  ToolsConfig tools;

  std::string log_level = "info";
  std::string log_file;

  // Load from a JSON file. A missing file yields defaults; malformed JSON throws std::runtime_error.
  static Config load(const std::filesystem::path &path);

  // Load ~/.config/stepagent/config.json (or defaults)
  static Config load_default();

  static Config from_json(const json &j);
  json to_json() const;

  void save(const std::filesystem::path &path) const;

  // System prompt text, reading system_prompt_path if needed
  std::string resolve_system_prompt() const;
};

namespace config_paths {

std::filesystem::path home_dir();
std::filesystem::path config_dir();
std::filesystem::path default_config_file();

}  // namespace config_paths

}  // namespace stepagent
