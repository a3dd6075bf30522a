#include "llm/provider.hpp"

#include <spdlog/spdlog.h>

#include "llm/anthropic.hpp"
#include "llm/openai.hpp"
#include "net/http_client.hpp"

namespace stepagent::llm {

namespace {

bool is_retryable_error(const std::exception &e) {
  if (auto *llm_error = dynamic_cast<const LlmError *>(&e)) {
    return llm_error->retryable();
  }
  return true;
}

// Pulls a readable message out of a provider error body
std::string error_message(const std::string &body) {
  auto j = json::parse(body, nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    return body.substr(0, 500);
  }
  if (j.contains("error")) {
    const auto &err = j["error"];
    if (err.is_object() && err.contains("message") && err["message"].is_string()) {
      return err["message"].get<std::string>();
    }
    if (err.is_string()) {
      return err.get<std::string>();
    }
  }
  return j.dump().substr(0, 500);
}

}  // namespace

LlmClient::LlmClient(LlmConfig config) : config_(std::move(config)), retry_(config_.retry, is_retryable_error) {}

std::future<LlmResponse> LlmClient::generate(const std::vector<Message> &messages, const std::vector<ToolPtr> &tools) {
  return std::async(std::launch::async, [this, messages, tools]() {
    return retry_.run(
        [&]() {
          auto payload = build_request(messages, tools);
          auto body = send(payload);
          return parse_response(body);
        },
        name() + " request");
  });
}

json LlmClient::send(const json &payload) {
  net::HttpOptions options;
  options.method = "POST";
  options.headers = headers();
  options.headers["Content-Type"] = "application/json";
  options.body = payload.dump();
  options.timeout = std::chrono::milliseconds(static_cast<int64_t>(config_.request_timeout * 1000));

  spdlog::debug("[LLM] POST {} ({} bytes)", endpoint(), options.body.size());

  net::HttpClient client;
  auto response = client.request(endpoint(), options);

  if (!response.error.empty()) {
    throw LlmError("HTTP request failed: " + response.error, 0, true);
  }

  if (!response.ok()) {
    bool retryable = response.status_code == 429 || response.status_code >= 500;
    throw LlmError("API error (HTTP " + std::to_string(response.status_code) + "): " + error_message(response.body),
                   response.status_code, retryable);
  }

  auto body = json::parse(response.body, nullptr, false);
  if (body.is_discarded()) {
    throw LlmError("Invalid JSON in response body", response.status_code, false);
  }
  return body;
}

std::string LlmClient::base_url() const {
  std::string base = config_.api_base;
  while (!base.empty() && base.back() == '/') {
    base.pop_back();
  }
  return base;
}

std::shared_ptr<LlmClient> create_client(const LlmConfig &config) {
  if (config.provider == "anthropic") {
    return std::make_shared<AnthropicClient>(config);
  }
  if (config.provider == "openai") {
    return std::make_shared<OpenAIClient>(config);
  }
  spdlog::error("[LLM] Unknown provider '{}' (expected 'anthropic' or 'openai')", config.provider);
  return nullptr;
}

}  // namespace stepagent::llm
