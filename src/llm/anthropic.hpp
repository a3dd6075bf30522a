#pragma once

#include "llm/provider.hpp"

namespace stepagent::llm {

// Anthropic Messages API (also served by Anthropic-compatible gateways)
class AnthropicClient : public LlmClient {
 public:
  static constexpr const char *kApiVersion = "2023-06-01";

  explicit AnthropicClient(LlmConfig config) : LlmClient(std::move(config)) {}

  std::string name() const override {
    return "anthropic";
  }

  json build_request(const std::vector<Message> &messages, const std::vector<ToolPtr> &tools) const override;
  LlmResponse parse_response(const json &body) const override;

 protected:
  std::string endpoint() const override;
  std::map<std::string, std::string> headers() const override;
};

}  // namespace stepagent::llm
