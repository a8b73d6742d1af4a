#pragma once

#include "whalecopy/config/engine_config.hpp"
#include "whalecopy/execution/exchange_error.hpp"
#include "whalecopy/time/i_time_provider.hpp"

#include <cstdint>
#include <functional>
#include <iostream>

namespace whalecopy {

// -----------------------------------------------------------------------------
// RetryPolicy - max attempts, backoff schedule, retryable predicate
// -----------------------------------------------------------------------------
//
// @brief  One explicit policy object shared by submit, cancel, poll and
//         order book fetches.
//
// @details
// backoffMs(n) for the n-th retry (1-based) is
//   min(base * multiplier^(n-1), max_backoff)
// which with the defaults gives 1 s, 2 s, 4 s. The predicate defaults to
// ExchangeError::transient().
//
// Submission drives its own FAILED -> PENDING loop in OrderExecutor so each
// attempt is audited; run() serves the operations that have no order state
// of their own.
// -----------------------------------------------------------------------------
class RetryPolicy {
 public:
  using Predicate = std::function<bool(const ExchangeError&)>;

  RetryPolicy(int max_retries, std::int64_t base_backoff_ms,
              double backoff_multiplier, std::int64_t max_backoff_ms,
              Predicate retryable = {});

  static RetryPolicy fromConfig(const ExecutionConfig& config);

  int maxRetries() const { return max_retries_; }

  std::int64_t backoffMs(int retry_number) const;

  bool isRetryable(const ExchangeError& error) const;

  // -------------------------------------------------------------------------
  // run(clock, operation, fn)
  // -------------------------------------------------------------------------
  // @brief  Calls fn(); on a retryable ExchangeError sleeps the backoff on
  //         `clock` and tries again, up to maxRetries() retries.
  //
  // @details
  // Non-retryable errors and the last retryable error are rethrown
  // unchanged. Each retry logs one line naming `operation`.
  // -------------------------------------------------------------------------
  template <typename Fn>
  auto run(const ITimeProvider& clock, const char* operation, Fn&& fn) const
      -> decltype(fn()) {
    int retry = 0;
    while (true) {
      try {
        return fn();
      } catch (const ExchangeError& e) {
        if (!isRetryable(e) || retry >= max_retries_) {
          throw;
        }
        ++retry;
        const std::int64_t delay = backoffMs(retry);
        std::cerr << "[RetryPolicy] WARNING: " << operation << " failed ("
                  << e.what() << "), retry " << retry << "/" << max_retries_
                  << " in " << delay << " ms\n";
        clock.sleep_ms(delay);
      }
    }
  }

 private:
  int max_retries_;
  std::int64_t base_backoff_ms_;
  double backoff_multiplier_;
  std::int64_t max_backoff_ms_;
  Predicate retryable_;
};

}  // namespace whalecopy
