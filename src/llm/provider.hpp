#pragma once

#include <future>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "core/config.hpp"
#include "core/message.hpp"
#include "core/retry.hpp"
#include "tool/tool.hpp"

namespace stepagent::llm {

// Failure of one model request. Retryable for transport errors, 429 and 5xx.
class LlmError : public std::runtime_error {
 public:
  LlmError(const std::string &message, int status_code = 0, bool retryable = false)
      : std::runtime_error(message), status_code_(status_code), retryable_(retryable) {}

  int status_code() const {
    return status_code_;
  }

  bool retryable() const {
    return retryable_;
  }

 private:
  int status_code_;
  bool retryable_;
};

// Uniform model client. Concrete protocols translate messages and tool schemas
// into their wire shape and parse the reply back into an LlmResponse.
class LlmClient {
 public:
  explicit LlmClient(LlmConfig config);
  virtual ~LlmClient() = default;

  virtual std::string name() const = 0;

  // One model turn, retried per config().retry. Errors (including
  // RetryExhaustedError) surface from future::get().
  virtual std::future<LlmResponse> generate(const std::vector<Message> &messages, const std::vector<ToolPtr> &tools);

  virtual json build_request(const std::vector<Message> &messages, const std::vector<ToolPtr> &tools) const = 0;
  virtual LlmResponse parse_response(const json &body) const = 0;

  const LlmConfig &config() const {
    return config_;
  }

  RetryPolicy &retry_policy() {
    return retry_;
  }

 protected:
  virtual std::string endpoint() const = 0;
  virtual std::map<std::string, std::string> headers() const = 0;

  // POST the payload and return the decoded JSON body
  virtual json send(const json &payload);

  // api_base without a trailing slash
  std::string base_url() const;

  LlmConfig config_;
  RetryPolicy retry_;
};

// "anthropic" or "openai"; nullptr for anything else
std::shared_ptr<LlmClient> create_client(const LlmConfig &config);

}  // namespace stepagent::llm
