#include "whalecopy/execution/retry_policy.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace whalecopy {

RetryPolicy::RetryPolicy(int max_retries, std::int64_t base_backoff_ms,
                         double backoff_multiplier, std::int64_t max_backoff_ms,
                         Predicate retryable)
    : max_retries_(std::max(0, max_retries)),
      base_backoff_ms_(base_backoff_ms),
      backoff_multiplier_(backoff_multiplier),
      max_backoff_ms_(max_backoff_ms),
      retryable_(std::move(retryable)) {
  if (!retryable_) {
    retryable_ = [](const ExchangeError& e) { return e.transient(); };
  }
}

RetryPolicy RetryPolicy::fromConfig(const ExecutionConfig& config) {
  return RetryPolicy(config.max_retries, config.base_backoff_ms,
                     config.backoff_multiplier, config.max_backoff_ms);
}

std::int64_t RetryPolicy::backoffMs(int retry_number) const {
  if (retry_number <= 0) {
    return 0;
  }
  const double raw = static_cast<double>(base_backoff_ms_) *
                     std::pow(backoff_multiplier_, retry_number - 1);
  return std::min(max_backoff_ms_, static_cast<std::int64_t>(raw));
}

bool RetryPolicy::isRetryable(const ExchangeError& error) const {
  return retryable_(error);
}

}  // namespace whalecopy
