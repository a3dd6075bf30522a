#pragma once

#include <optional>
#include <string>
#include <vector>

#include "core/types.hpp"

namespace stepagent {

// Message role
enum class Role { System, User, Assistant, Tool };

std::string to_string(Role role);
Role role_from_string(const std::string &str);

// A tool invocation requested by the model
struct ToolCall {
  std::string id;
  std::string name;
  json arguments = json::object();

  json to_json() const;
  static ToolCall from_json(const json &j);
};

// One turn of a conversation. Tool messages carry the id of the assistant
// tool call they answer.
struct Message {
  Role role = Role::User;
  std::string content;
  std::optional<std::string> thinking;
  std::vector<ToolCall> tool_calls;
  std::optional<std::string> tool_call_id;
  std::optional<std::string> name;  // Tool name for Role::Tool

  // Factory methods
  static Message system(const std::string &content);
  static Message user(const std::string &content);
  static Message assistant(const std::string &content, std::vector<ToolCall> tool_calls = {},
                           std::optional<std::string> thinking = std::nullopt);
  static Message tool(const std::string &tool_call_id, const std::string &tool_name, const std::string &content);

  bool has_tool_calls() const {
    return !tool_calls.empty();
  }

  // Serialization
  json to_json() const;
  static Message from_json(const json &j);
};

// Model output for one generate() call
struct LlmResponse {
  std::string content;
  std::optional<std::string> thinking;
  std::vector<ToolCall> tool_calls;
  FinishReason finish_reason = FinishReason::Stop;
  std::optional<TokenUsage> usage;

  bool has_tool_calls() const {
    return !tool_calls.empty();
  }

  // Converts the response into the assistant message appended to history
  Message to_message() const;
};

}  // namespace stepagent
