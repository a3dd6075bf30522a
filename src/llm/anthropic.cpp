#include "llm/anthropic.hpp"

#include <spdlog/spdlog.h>

namespace stepagent::llm {

namespace {

FinishReason map_stop_reason(const std::string &reason) {
  if (reason == "end_turn" || reason == "stop_sequence") return FinishReason::Stop;
  if (reason == "tool_use") return FinishReason::ToolCalls;
  if (reason == "max_tokens") return FinishReason::Length;
  if (reason == "refusal") return FinishReason::Refusal;
  return FinishReason::Stop;
}

json assistant_message(const Message &msg) {
  if (!msg.thinking && msg.tool_calls.empty()) {
    return json{{"role", "assistant"}, {"content", msg.content}};
  }

  json blocks = json::array();
  if (msg.thinking) {
    blocks.push_back({{"type", "thinking"}, {"thinking", *msg.thinking}});
  }
  if (!msg.content.empty()) {
    blocks.push_back({{"type", "text"}, {"text", msg.content}});
  }
  for (const auto &call : msg.tool_calls) {
    blocks.push_back({{"type", "tool_use"}, {"id", call.id}, {"name", call.name}, {"input", call.arguments}});
  }
  return json{{"role", "assistant"}, {"content", blocks}};
}

bool is_tool_result_message(const json &msg) {
  if (msg.value("role", "") != "user" || !msg["content"].is_array() || msg["content"].empty()) {
    return false;
  }
  return msg["content"].back().value("type", "") == "tool_result";
}

}  // namespace

std::string AnthropicClient::endpoint() const {
  return base_url() + "/v1/messages";
}

std::map<std::string, std::string> AnthropicClient::headers() const {
  return {{"x-api-key", config_.api_key}, {"anthropic-version", kApiVersion}};
}

json AnthropicClient::build_request(const std::vector<Message> &messages, const std::vector<ToolPtr> &tools) const {
  std::string system;
  json api_messages = json::array();

  for (const auto &msg : messages) {
    switch (msg.role) {
      case Role::System:
        if (!system.empty()) system += "\n\n";
        system += msg.content;
        break;

      case Role::User:
        api_messages.push_back({{"role", "user"}, {"content", msg.content}});
        break;

      case Role::Assistant:
        api_messages.push_back(assistant_message(msg));
        break;

      case Role::Tool: {
        json block = {{"type", "tool_result"}, {"tool_use_id", msg.tool_call_id.value_or("")}, {"content", msg.content}};
        // Results of one assistant turn travel together in a single user message
        if (!api_messages.empty() && is_tool_result_message(api_messages.back())) {
          api_messages.back()["content"].push_back(block);
        } else {
          api_messages.push_back({{"role", "user"}, {"content", json::array({block})}});
        }
        break;
      }
    }
  }

  json request = {{"model", config_.model}, {"max_tokens", config_.max_tokens}, {"messages", api_messages}};
  if (!system.empty()) {
    request["system"] = system;
  }
  if (!tools.empty()) {
    json tool_defs = json::array();
    for (const auto &tool : tools) {
      tool_defs.push_back(tool->to_schema());
    }
    request["tools"] = tool_defs;
  }
  return request;
}

LlmResponse AnthropicClient::parse_response(const json &body) const {
  if (body.contains("error") && body["error"].is_object()) {
    throw LlmError("API error: " + body["error"].value("message", body["error"].dump()));
  }
  if (!body.contains("content") || !body["content"].is_array()) {
    throw LlmError("Malformed response: missing content array");
  }

  LlmResponse response;
  std::string thinking;

  for (const auto &block : body["content"]) {
    auto type = block.value("type", "");
    if (type == "text") {
      response.content += block.value("text", "");
    } else if (type == "thinking") {
      thinking += block.value("thinking", "");
    } else if (type == "tool_use") {
      ToolCall call;
      call.id = block.value("id", "");
      call.name = block.value("name", "");
      if (block.contains("input") && block["input"].is_object()) {
        call.arguments = block["input"];
      }
      response.tool_calls.push_back(std::move(call));
    } else {
      spdlog::debug("[Anthropic] Ignoring content block of type '{}'", type);
    }
  }

  if (!thinking.empty()) {
    response.thinking = thinking;
  }

  auto stop_reason = body.contains("stop_reason") && body["stop_reason"].is_string() ? body["stop_reason"].get<std::string>() : "";
  response.finish_reason = response.has_tool_calls() ? FinishReason::ToolCalls : map_stop_reason(stop_reason);

  if (body.contains("usage") && body["usage"].is_object()) {
    const auto &u = body["usage"];
    TokenUsage usage;
    usage.input_tokens = u.value("input_tokens", 0);
    usage.output_tokens = u.value("output_tokens", 0);
    usage.cache_read_tokens = u.value("cache_read_input_tokens", 0);
    usage.cache_write_tokens = u.value("cache_creation_input_tokens", 0);
    response.usage = usage;
  }

  return response;
}

}  // namespace stepagent::llm
