#pragma once

#include "whalecopy/domain/market.hpp"
#include "whalecopy/domain/order.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace whalecopy {

struct SubmitRequest {
  std::string client_order_id;   // The order's idempotency key
  std::string token_id;
  domain::Side side{domain::Side::Buy};
  double size{0.0};
  std::optional<double> price;
  domain::OrderType order_type{domain::OrderType::Limit};
  std::int64_t deadline_ms{0};   // Absolute; the client gives up after it
};

struct SubmitAck {
  std::string exchange_order_id;
  bool duplicate{false};         // The client order id was already known
};

// Cumulative fill state of one exchange order.
struct FillStatus {
  std::string exchange_order_id;
  double filled_size{0.0};
  double avg_price{0.0};
  std::uint64_t fill_sequence{0};
  bool open{true};               // False once complete or cancelled
};

// -----------------------------------------------------------------------------
// FillReport - the single internal fill event
// -----------------------------------------------------------------------------
// Produced by REST polling (from a FillStatus) and by the push feed alike.
// filled_size is cumulative. Deduplicated by (order_id, fill_sequence) in
// OrderExecutor; a report whose cumulative size does not exceed what is
// already booked is ignored. order_id may be empty when only the exchange
// id is known.
// -----------------------------------------------------------------------------
struct FillReport {
  std::string order_id;
  std::string exchange_order_id;
  double filled_size{0.0};
  double avg_price{0.0};
  std::uint64_t fill_sequence{0};
  std::int64_t timestamp_ms{0};
};

// -----------------------------------------------------------------------------
// IExchangeClient - capability interface to the prediction-market exchange
// -----------------------------------------------------------------------------
//
// @brief  submit / cancel / book snapshot / fill poll. Every failure is an
//         ExchangeError whose code tells transient from terminal.
//
// @details
// Implementations must treat client_order_id as an idempotency token:
// submitting a known id again returns the original exchange order id with
// duplicate == true and places nothing new. This is what makes a retry
// after a lost acknowledgement safe.
//
// Thread model: called from execution_loop, the signal loop (order book
// fetches, the stale-order sweep) and tests. Implementations must be
// thread-safe.
//
// Ownership: owned by main() or the test fixture; must outlive the engine.
// -----------------------------------------------------------------------------
class IExchangeClient {
 public:
  virtual ~IExchangeClient() = default;

  virtual SubmitAck submitOrder(const SubmitRequest& request) = 0;
  virtual void cancelOrder(const std::string& exchange_order_id) = 0;
  virtual domain::OrderBook fetchOrderBook(const std::string& token_id) = 0;
  virtual FillStatus pollFill(const std::string& exchange_order_id) = 0;
};

}  // namespace whalecopy
