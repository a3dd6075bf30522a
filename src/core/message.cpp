#include "core/message.hpp"

namespace stepagent {

std::string to_string(Role role) {
  switch (role) {
    case Role::System:
      return "system";
    case Role::User:
      return "user";
    case Role::Assistant:
      return "assistant";
    case Role::Tool:
      return "tool";
  }
  return "user";
}

Role role_from_string(const std::string &str) {
  if (str == "system") return Role::System;
  if (str == "assistant") return Role::Assistant;
  if (str == "tool") return Role::Tool;
  return Role::User;
}

// ============================================================
// ToolCall
// ============================================================

json ToolCall::to_json() const {
  return json{{"id", id}, {"name", name}, {"arguments", arguments}};
}

ToolCall ToolCall::from_json(const json &j) {
  ToolCall call;
  call.id = j.value("id", "");
  call.name = j.value("name", "");
  if (j.contains("arguments") && j["arguments"].is_object()) {
    call.arguments = j["arguments"];
  }
  return call;
}

// ============================================================
// Message
// ============================================================

Message Message::system(const std::string &content) {
  Message msg;
  msg.role = Role::System;
  msg.content = content;
  return msg;
}

Message Message::user(const std::string &content) {
  Message msg;
  msg.role = Role::User;
  msg.content = content;
  return msg;
}

Message Message::assistant(const std::string &content, std::vector<ToolCall> tool_calls, std::optional<std::string> thinking) {
  Message msg;
  msg.role = Role::Assistant;
  msg.content = content;
  msg.tool_calls = std::move(tool_calls);
  msg.thinking = std::move(thinking);
  return msg;
}

Message Message::tool(const std::string &tool_call_id, const std::string &tool_name, const std::string &content) {
  Message msg;
  msg.role = Role::Tool;
  msg.content = content;
  msg.tool_call_id = tool_call_id;
  msg.name = tool_name;
  return msg;
}

json Message::to_json() const {
  json j;
  j["role"] = to_string(role);
  j["content"] = content;
  if (thinking) {
    j["thinking"] = *thinking;
  }
  if (!tool_calls.empty()) {
    j["tool_calls"] = json::array();
    for (const auto &call : tool_calls) {
      j["tool_calls"].push_back(call.to_json());
    }
  }
  if (tool_call_id) {
    j["tool_call_id"] = *tool_call_id;
  }
  if (name) {
    j["name"] = *name;
  }
  return j;
}

Message Message::from_json(const json &j) {
  Message msg;
  msg.role = role_from_string(j.value("role", "user"));
  msg.content = j.value("content", "");
  if (j.contains("thinking") && j["thinking"].is_string()) {
    msg.thinking = j["thinking"].get<std::string>();
  }
  if (j.contains("tool_calls") && j["tool_calls"].is_array()) {
    for (const auto &call : j["tool_calls"]) {
      msg.tool_calls.push_back(ToolCall::from_json(call));
    }
  }
  if (j.contains("tool_call_id") && j["tool_call_id"].is_string()) {
    msg.tool_call_id = j["tool_call_id"].get<std::string>();
  }
  if (j.contains("name") && j["name"].is_string()) {
    msg.name = j["name"].get<std::string>();
  }
  return msg;
}

// ============================================================
// LlmResponse
// ============================================================

Message LlmResponse::to_message() const {
  return Message::assistant(content, tool_calls, thinking);
}

}  // namespace stepagent
