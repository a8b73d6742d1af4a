#pragma once

#include <stdexcept>
#include <string>

namespace whalecopy {

enum class ExchangeErrorCode {
  // Transient: retried with backoff
  Timeout,
  ConnectionError,
  RateLimited,
  Unavailable,
  // Terminal: the order fails, no retry
  InsufficientBalance,
  InvalidMarket,
  MarketClosed,
  InvalidPrice,
  Rejected,
  OrderNotFound,
};

const char* toString(ExchangeErrorCode code);

// True for the codes a retry can cure.
bool isTransient(ExchangeErrorCode code);

// -----------------------------------------------------------------------------
// ExchangeError - every failure reported by an IExchangeClient
// -----------------------------------------------------------------------------
class ExchangeError : public std::runtime_error {
 public:
  ExchangeError(ExchangeErrorCode code, const std::string& message)
      : std::runtime_error(std::string(toString(code)) + ": " + message),
        code_(code) {}

  ExchangeErrorCode code() const { return code_; }
  bool transient() const { return isTransient(code_); }

 private:
  ExchangeErrorCode code_;
};

}  // namespace whalecopy
