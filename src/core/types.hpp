#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace stepagent {

using json = nlohmann::json;

// Result type for operations that can fail
template <typename T>
struct Result {
  std::optional<T> value;
  std::optional<std::string> error;

  bool ok() const {
    return value.has_value();
  }

  bool failed() const {
    return error.has_value();
  }

  static Result success(T val) {
    return Result{std::move(val), std::nullopt};
  }

  static Result failure(std::string err) {
    return Result{std::nullopt, std::move(err)};
  }
};

// Token usage tracking
struct TokenUsage {
  int64_t input_tokens = 0;
  int64_t output_tokens = 0;
  int64_t cache_read_tokens = 0;
  int64_t cache_write_tokens = 0;

  int64_t total() const {
    return input_tokens + output_tokens;
  }

  TokenUsage &operator+=(const TokenUsage &other) {
    input_tokens += other.input_tokens;
    output_tokens += other.output_tokens;
    cache_read_tokens += other.cache_read_tokens;
    cache_write_tokens += other.cache_write_tokens;
    return *this;
  }
};

// Finish reason for LLM responses
enum class FinishReason {
  Stop,       // Natural completion
  ToolCalls,  // Needs tool execution
  Length,     // Token limit reached
  Refusal,    // Model declined to answer
  Error       // Error occurred
};

std::string to_string(FinishReason reason);

FinishReason finish_reason_from_string(const std::string &str);

}  // namespace stepagent
