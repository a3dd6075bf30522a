#include "core/retry.hpp"

#include <algorithm>
#include <cmath>
#include <thread>

namespace stepagent {

double RetryConfig::calculate_delay(int attempt) const {
  double delay = initial_delay * std::pow(exponential_base, attempt);
  return std::min(delay, max_delay);
}

RetryExhaustedError::RetryExhaustedError(std::exception_ptr last_exception, const std::string &last_message, int attempts)
    : std::runtime_error("Retry failed after " + std::to_string(attempts) + " attempts. Last error: " + last_message),
      last_exception_(std::move(last_exception)),
      last_message_(last_message),
      attempts_(attempts) {}

RetryPolicy::RetryPolicy(RetryConfig config, RetryablePredicate retryable) : config_(config), retryable_(std::move(retryable)) {}

void RetryPolicy::wait(double seconds) const {
  auto duration = std::chrono::duration<double>(seconds);
  if (sleeper_) {
    sleeper_(duration);
    return;
  }
  std::this_thread::sleep_for(duration);
}

}  // namespace stepagent
