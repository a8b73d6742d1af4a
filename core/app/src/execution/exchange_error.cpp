#include "whalecopy/execution/exchange_error.hpp"

namespace whalecopy {

const char* toString(ExchangeErrorCode code) {
  switch (code) {
    case ExchangeErrorCode::Timeout:
      return "TIMEOUT";
    case ExchangeErrorCode::ConnectionError:
      return "CONNECTION_ERROR";
    case ExchangeErrorCode::RateLimited:
      return "RATE_LIMITED";
    case ExchangeErrorCode::Unavailable:
      return "UNAVAILABLE";
    case ExchangeErrorCode::InsufficientBalance:
      return "INSUFFICIENT_BALANCE";
    case ExchangeErrorCode::InvalidMarket:
      return "INVALID_MARKET";
    case ExchangeErrorCode::MarketClosed:
      return "MARKET_CLOSED";
    case ExchangeErrorCode::InvalidPrice:
      return "INVALID_PRICE";
    case ExchangeErrorCode::Rejected:
      return "REJECTED";
    case ExchangeErrorCode::OrderNotFound:
      return "ORDER_NOT_FOUND";
  }
  return "UNKNOWN";
}

bool isTransient(ExchangeErrorCode code) {
  switch (code) {
    case ExchangeErrorCode::Timeout:
    case ExchangeErrorCode::ConnectionError:
    case ExchangeErrorCode::RateLimited:
    case ExchangeErrorCode::Unavailable:
      return true;
    default:
      return false;
  }
}

}  // namespace whalecopy
