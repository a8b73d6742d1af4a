#pragma once

#include "whalecopy/domain/order_state.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace whalecopy {
namespace domain {

using OrderId = std::string;

enum class Side {
  Buy,
  Sell,
};

enum class OrderType {
  Limit,
  Market,
  Fok,  // Fill-or-kill
  Gtc,  // Good-till-cancelled
};

// -----------------------------------------------------------------------------
// Order - one attempted exchange order
// -----------------------------------------------------------------------------
//
// @brief  Plain value type describing an order and its execution state.
//
// @details
// Created by OrderExecutor when an approved trade intent arrives and
// mutated only by OrderExecutor. The store keeps one copy per order_id;
// everybody else works on snapshots.
//
// remaining_size is derived from size and filled_size. Use setFilled()
// instead of assigning the two fields separately so the invariant
// remaining_size == size - filled_size always holds.
//
// Lineage fields link a partial-fill child order to its parent and a
// closing order to the position it closes.
// -----------------------------------------------------------------------------
struct Order {
  OrderId order_id;                // System generated ("ord-<n>")
  std::string idempotency_key;     // Caller supplied, unique
  std::string exchange_order_id;   // Assigned once the exchange accepts

  std::string token_id;            // Outcome token traded
  std::string market_id;
  Side side{Side::Buy};
  double size{0.0};                // Requested size (shares)
  std::optional<double> price;     // Limit price, empty for market orders
  OrderType order_type{OrderType::Limit};

  OrderState state{OrderState::Pending};
  double filled_size{0.0};
  double remaining_size{0.0};
  double avg_fill_price{0.0};

  std::int64_t created_at_ms{0};
  std::optional<std::int64_t> submitted_at_ms;
  std::optional<std::int64_t> filled_at_ms;
  std::optional<std::int64_t> confirmed_at_ms;

  int retry_count{0};
  int max_retries{3};
  std::string error_message;

  std::string parent_order_id;     // Set on partial-fill child orders
  int child_depth{0};
  std::string position_id;         // Set on closing orders
  std::string whale_address;       // Source whale of the copied trade

  // Updates filled_size and keeps remaining_size consistent with size.
  void setFilled(double filled) {
    filled_size = filled;
    remaining_size = size - filled;
    if (remaining_size < 0.0) {
      remaining_size = 0.0;
    }
  }

  double fillRatio() const { return size > 0.0 ? filled_size / size : 0.0; }
};

// -----------------------------------------------------------------------------
// OrderTransition - immutable audit record of one state change
// -----------------------------------------------------------------------------
//
// from_state is empty for the creation record. metadata always carries the
// order snapshot after the change under the key "order", which is what
// recovery reads back.
// -----------------------------------------------------------------------------
struct OrderTransition {
  std::uint64_t id{0};                  // Assigned by AuditTrail
  OrderId order_id;
  std::optional<OrderState> from_state;
  OrderState to_state{OrderState::Pending};
  std::int64_t timestamp_ms{0};
  std::string reason;
  nlohmann::json metadata = nlohmann::json::object();
};

}  // namespace domain
}  // namespace whalecopy
