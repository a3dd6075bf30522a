#pragma once

#include <spdlog/spdlog.h>

#include <chrono>
#include <exception>
#include <functional>
#include <stdexcept>
#include <string>
#include <type_traits>

namespace stepagent {

// Backoff configuration. Delays are in seconds.
struct RetryConfig {
  bool enabled = true;
  int max_retries = 3;
  double initial_delay = 1.0;
  double max_delay = 60.0;
  double exponential_base = 2.0;

  // delay(attempt) = min(initial_delay * exponential_base^attempt, max_delay), attempt starts at 0
  double calculate_delay(int attempt) const;
};

// Raised once every attempt has failed
class RetryExhaustedError : public std::runtime_error {
 public:
  RetryExhaustedError(std::exception_ptr last_exception, const std::string &last_message, int attempts);

  int attempts() const {
    return attempts_;
  }

  std::exception_ptr last_exception() const {
    return last_exception_;
  }

  const std::string &last_message() const {
    return last_message_;
  }

 private:
  std::exception_ptr last_exception_;
  std::string last_message_;
  int attempts_;
};

// Exponential-backoff wrapper around a fallible operation
class RetryPolicy {
 public:
  using RetryablePredicate = std::function<bool(const std::exception &)>;
  using RetryCallback = std::function<void(const std::exception &, int attempt)>;
  using Sleeper = std::function<void(std::chrono::duration<double>)>;

  explicit RetryPolicy(RetryConfig config = {}, RetryablePredicate retryable = nullptr);

  const RetryConfig &config() const {
    return config_;
  }

  // Observer invoked before each wait with the error and the 1-based number of the failed attempt
  void set_on_retry(RetryCallback callback) {
    on_retry_ = std::move(callback);
  }

  // Replaces the wait between attempts (tests use this to avoid sleeping)
  void set_sleeper(Sleeper sleeper) {
    sleeper_ = std::move(sleeper);
  }

  bool is_retryable(const std::exception &e) const {
    return !retryable_ || retryable_(e);
  }

  // Runs `operation` until it succeeds, a non-retryable error escapes, or
  // max_retries + 1 attempts have failed (RetryExhaustedError).
  template <typename F>
  std::invoke_result_t<F &> run(F &&operation, const std::string &what = "operation") {
    if (!config_.enabled) {
      return operation();
    }

    for (int attempt = 0;; ++attempt) {
      try {
        return operation();
      } catch (const RetryExhaustedError &) {
        throw;
      } catch (const std::exception &e) {
        if (!is_retryable(e)) {
          throw;
        }

        if (attempt >= config_.max_retries) {
          spdlog::error("[Retry] {} failed after {} attempts: {}", what, attempt + 1, e.what());
          throw RetryExhaustedError(std::current_exception(), e.what(), attempt + 1);
        }

        double delay = config_.calculate_delay(attempt);
        spdlog::warn("[Retry] {} attempt {} failed: {}, retrying in {:.2f}s", what, attempt + 1, e.what(), delay);

        if (on_retry_) {
          on_retry_(e, attempt + 1);
        }
        wait(delay);
      }
    }
  }

 private:
  void wait(double seconds) const;

  RetryConfig config_;
  RetryablePredicate retryable_;
  RetryCallback on_retry_;
  Sleeper sleeper_;
};

}  // namespace stepagent
