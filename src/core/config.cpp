#include "core/config.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace stepagent {

namespace fs = std::filesystem;

namespace {

constexpr const char *kApiKeyEnv = "STEPAGENT_API_KEY";
constexpr const char *kDefaultSystemPrompt = "You are a helpful AI assistant that can use tools to complete tasks.";

RetryConfig retry_from_json(const json &j) {
  RetryConfig retry;
  retry.enabled = j.value("enabled", retry.enabled);
  retry.max_retries = j.value("max_retries", retry.max_retries);
  retry.initial_delay = j.value("initial_delay", retry.initial_delay);
  retry.max_delay = j.value("max_delay", retry.max_delay);
  retry.exponential_base = j.value("exponential_base", retry.exponential_base);
  return retry;
}

json retry_to_json(const RetryConfig &retry) {
  return json{{"enabled", retry.enabled},
              {"max_retries", retry.max_retries},
              {"initial_delay", retry.initial_delay},
              {"max_delay", retry.max_delay},
              {"exponential_base", retry.exponential_base}};
}

}  // namespace

Config Config::from_json(const json &j) {
  Config config;

  if (j.contains("llm") && j["llm"].is_object()) {
    const auto &llm = j["llm"];
    config.llm.provider = llm.value("provider", config.llm.provider);
    config.llm.api_key = llm.value("api_key", config.llm.api_key);
    config.llm.api_base = llm.value("api_base", config.llm.api_base);
    config.llm.model = llm.value("model", config.llm.model);
    config.llm.max_tokens = llm.value("max_tokens", config.llm.max_tokens);
    config.llm.request_timeout = llm.value("request_timeout", config.llm.request_timeout);
    if (llm.contains("retry") && llm["retry"].is_object()) {
      config.llm.retry = retry_from_json(llm["retry"]);
    }
  }

  if (j.contains("agent") && j["agent"].is_object()) {
    const auto &agent = j["agent"];
    config.agent.max_steps = agent.value("max_steps", config.agent.max_steps);
    config.agent.workspace_dir = agent.value("workspace_dir", config.agent.workspace_dir);
    config.agent.system_prompt = agent.value("system_prompt", config.agent.system_prompt);
    config.agent.system_prompt_path = agent.value("system_prompt_path", config.agent.system_prompt_path);
  }

  if (j.contains("tools") && j["tools"].is_object()) {
    const auto &tools = j["tools"];
    config.tools.enable_file_tools = tools.value("enable_file_tools", config.tools.enable_file_tools);
    config.tools.enable_bash = tools.value("enable_bash", config.tools.enable_bash);
    config.tools.enable_note = tools.value("enable_note", config.tools.enable_note);
    config.tools.notes_file = tools.value("notes_file", config.tools.notes_file);
    config.tools.enable_mcp = tools.value("enable_mcp", config.tools.enable_mcp);
    config.tools.mcp_config_path = tools.value("mcp_config_path", config.tools.mcp_config_path);
    config.tools.enable_skills = tools.value("enable_skills", config.tools.enable_skills);
    config.tools.skills_dir = tools.value("skills_dir", config.tools.skills_dir);
  }

  config.log_level = j.value("log_level", config.log_level);
  config.log_file = j.value("log_file", config.log_file);

  if (config.llm.api_key.empty()) {
    if (const char *env_key = std::getenv(kApiKeyEnv)) {
      config.llm.api_key = env_key;
    }
  }

  return config;
}

json Config::to_json() const {
  json j;
  j["llm"] = json{{"provider", llm.provider},
                  {"api_key", llm.api_key},
                  {"api_base", llm.api_base},
                  {"model", llm.model},
                  {"max_tokens", llm.max_tokens},
                  {"request_timeout", llm.request_timeout},
                  {"retry", retry_to_json(llm.retry)}};
  j["agent"] = json{{"max_steps", agent.max_steps},
                    {"workspace_dir", agent.workspace_dir},
                    {"system_prompt", agent.system_prompt},
                    {"system_prompt_path", agent.system_prompt_path}};
  j["tools"] = json{{"enable_file_tools", tools.enable_file_tools},
                    {"enable_bash", tools.enable_bash},
                    {"enable_note", tools.enable_note},
                    {"notes_file", tools.notes_file},
                    {"enable_mcp", tools.enable_mcp},
                    {"mcp_config_path", tools.mcp_config_path},
                    {"enable_skills", tools.enable_skills},
                    {"skills_dir", tools.skills_dir}};
  j["log_level"] = log_level;
  j["log_file"] = log_file;
  return j;
}

Config Config::load(const fs::path &path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    spdlog::warn("[Config] {} not found, using defaults", path.string());
    return from_json(json::object());
  }

  json j;
  try {
    j = json::parse(file);
  } catch (const json::parse_error &e) {
    throw std::runtime_error("Failed to parse config " + path.string() + ": " + e.what());
  }

  if (!j.is_object()) {
    throw std::runtime_error("Config " + path.string() + " must contain a JSON object");
  }

  try {
    return from_json(j);
  } catch (const json::type_error &e) {
    throw std::runtime_error("Invalid value in config " + path.string() + ": " + e.what());
  }
}

Config Config::load_default() {
  return load(config_paths::default_config_file());
}

void Config::save(const fs::path &path) const {
  auto parent = path.parent_path();
  if (!parent.empty() && !fs::exists(parent)) {
    fs::create_directories(parent);
  }

  std::ofstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error("Failed to open config for writing: " + path.string());
  }
  file << to_json().dump(2);
}

std::string Config::resolve_system_prompt() const {
  if (!agent.system_prompt.empty()) {
    return agent.system_prompt;
  }

  if (!agent.system_prompt_path.empty()) {
    std::ifstream file(agent.system_prompt_path);
    if (file.is_open()) {
      std::stringstream buffer;
      buffer << file.rdbuf();
      return buffer.str();
    }
    spdlog::warn("[Config] System prompt file {} not found, using default prompt", agent.system_prompt_path);
  }

  return kDefaultSystemPrompt;
}

// ============================================================
// config_paths
// ============================================================

namespace config_paths {

fs::path home_dir() {
  if (const char *home = std::getenv("HOME")) {
    return home;
  }
  return fs::temp_directory_path();
}

fs::path config_dir() {
  return home_dir() / ".config" / "stepagent";
}

fs::path default_config_file() {
  return config_dir() / "config.json";
}

}  // namespace config_paths

}  // namespace stepagent
