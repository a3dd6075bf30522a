#pragma once

#include "llm/provider.hpp"

namespace stepagent::llm {

// OpenAI Chat Completions API (and compatible endpoints)
class OpenAIClient : public LlmClient {
 public:
  explicit OpenAIClient(LlmConfig config) : LlmClient(std::move(config)) {}

  std::string name() const override {
    return "openai";
  }

  json build_request(const std::vector<Message> &messages, const std::vector<ToolPtr> &tools) const override;
  LlmResponse parse_response(const json &body) const override;

 protected:
  std::string endpoint() const override;
  std::map<std::string, std::string> headers() const override;
};

}  // namespace stepagent::llm
