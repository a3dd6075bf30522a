#include "llm/openai.hpp"

#include <spdlog/spdlog.h>

namespace stepagent::llm {

namespace {

FinishReason map_finish_reason(const std::string &reason) {
  if (reason == "stop") return FinishReason::Stop;
  if (reason == "tool_calls" || reason == "function_call") return FinishReason::ToolCalls;
  if (reason == "length") return FinishReason::Length;
  if (reason == "content_filter") return FinishReason::Refusal;
  return FinishReason::Stop;
}

json parse_arguments(const json &raw, const std::string &tool_name) {
  if (raw.is_object()) {
    return raw;
  }
  if (!raw.is_string() || raw.get<std::string>().empty()) {
    return json::object();
  }
  auto parsed = json::parse(raw.get<std::string>(), nullptr, false);
  if (parsed.is_discarded() || !parsed.is_object()) {
    spdlog::warn("[OpenAI] Unparsable arguments for tool '{}': {}", tool_name, raw.get<std::string>());
    return json::object();
  }
  return parsed;
}

}  // namespace

std::string OpenAIClient::endpoint() const {
  return base_url() + "/chat/completions";
}

std::map<std::string, std::string> OpenAIClient::headers() const {
  return {{"Authorization", "Bearer " + config_.api_key}};
}

json OpenAIClient::build_request(const std::vector<Message> &messages, const std::vector<ToolPtr> &tools) const {
  json api_messages = json::array();

  for (const auto &msg : messages) {
    switch (msg.role) {
      case Role::System:
        api_messages.push_back({{"role", "system"}, {"content", msg.content}});
        break;

      case Role::User:
        api_messages.push_back({{"role", "user"}, {"content", msg.content}});
        break;

      case Role::Assistant: {
        json m = {{"role", "assistant"}, {"content", msg.content}};
        if (msg.thinking) {
          m["reasoning_content"] = *msg.thinking;
        }
        if (!msg.tool_calls.empty()) {
          json calls = json::array();
          for (const auto &call : msg.tool_calls) {
            calls.push_back({{"id", call.id},
                             {"type", "function"},
                             {"function", {{"name", call.name}, {"arguments", call.arguments.dump()}}}});
          }
          m["tool_calls"] = calls;
        }
        api_messages.push_back(m);
        break;
      }

      case Role::Tool:
        api_messages.push_back({{"role", "tool"}, {"tool_call_id", msg.tool_call_id.value_or("")}, {"content", msg.content}});
        break;
    }
  }

  json request = {{"model", config_.model}, {"max_tokens", config_.max_tokens}, {"messages", api_messages}};
  if (!tools.empty()) {
    json tool_defs = json::array();
    for (const auto &tool : tools) {
      tool_defs.push_back(tool->to_openai_schema());
    }
    request["tools"] = tool_defs;
  }
  return request;
}

LlmResponse OpenAIClient::parse_response(const json &body) const {
  if (body.contains("error") && body["error"].is_object()) {
    throw LlmError("API error: " + body["error"].value("message", body["error"].dump()));
  }
  if (!body.contains("choices") || !body["choices"].is_array() || body["choices"].empty()) {
    throw LlmError("Malformed response: no choices");
  }

  const auto &choice = body["choices"][0];
  if (!choice.contains("message") || !choice["message"].is_object()) {
    throw LlmError("Malformed response: choice has no message");
  }
  const auto &message = choice["message"];

  LlmResponse response;
  if (message.contains("content") && message["content"].is_string()) {
    response.content = message["content"].get<std::string>();
  }

  if (message.contains("reasoning_content") && message["reasoning_content"].is_string()) {
    response.thinking = message["reasoning_content"].get<std::string>();
  } else if (message.contains("reasoning_details") && message["reasoning_details"].is_array()) {
    std::string thinking;
    for (const auto &detail : message["reasoning_details"]) {
      if (detail.is_object() && detail.contains("text") && detail["text"].is_string()) {
        thinking += detail["text"].get<std::string>();
      }
    }
    if (!thinking.empty()) {
      response.thinking = thinking;
    }
  }

  if (message.contains("tool_calls") && message["tool_calls"].is_array()) {
    for (const auto &tc : message["tool_calls"]) {
      if (!tc.contains("function") || !tc["function"].is_object()) continue;
      const auto &fn = tc["function"];
      ToolCall call;
      call.id = tc.value("id", "");
      call.name = fn.value("name", "");
      call.arguments = parse_arguments(fn.contains("arguments") ? fn["arguments"] : json(), call.name);
      response.tool_calls.push_back(std::move(call));
    }
  }

  auto finish = choice.contains("finish_reason") && choice["finish_reason"].is_string()
                    ? choice["finish_reason"].get<std::string>()
                    : "";
  response.finish_reason = response.has_tool_calls() ? FinishReason::ToolCalls : map_finish_reason(finish);

  if (body.contains("usage") && body["usage"].is_object()) {
    const auto &u = body["usage"];
    TokenUsage usage;
    usage.input_tokens = u.value("prompt_tokens", 0);
    usage.output_tokens = u.value("completion_tokens", 0);
    if (u.contains("prompt_tokens_details") && u["prompt_tokens_details"].is_object()) {
      usage.cache_read_tokens = u["prompt_tokens_details"].value("cached_tokens", 0);
    }
    response.usage = usage;
  }

  return response;
}

}  // namespace stepagent::llm
