#pragma once

#include "whalecopy/domain/order.hpp"

#include <optional>
#include <string>
#include <vector>

namespace whalecopy {

// -----------------------------------------------------------------------------
// OrderRequest - what a caller asks OrderExecutor to place
// -----------------------------------------------------------------------------
// The idempotency key is the caller's identity for the request. Copy orders
// use "copy:<whale>:<trade_id>", closing orders "close:<position_id>:<n>".
// -----------------------------------------------------------------------------
struct OrderRequest {
  std::string idempotency_key;
  std::string token_id;
  std::string market_id;
  domain::Side side{domain::Side::Buy};
  double size{0.0};
  std::optional<double> price;
  domain::OrderType order_type{domain::OrderType::Limit};

  std::string whale_address;
  std::string position_id;       // Non-empty for closing orders
  std::string parent_order_id;   // Non-empty for partial-fill children
  int child_depth{0};
};

// -----------------------------------------------------------------------------
// ExecutionReport - outcome of one OrderExecutor::execute() call
// -----------------------------------------------------------------------------
// `order` is the root order of the request. `children` holds any
// partial-fill child orders in creation order. total_filled and
// avg_fill_price aggregate the whole lineage so the ledger books one fill.
// -----------------------------------------------------------------------------
struct ExecutionReport {
  domain::Order order;
  std::vector<domain::Order> children;
  bool created{true};     // false when the idempotency key already existed
  double total_filled{0.0};
  double avg_fill_price{0.0};

  bool filled() const { return total_filled > 0.0; }
};

}  // namespace whalecopy
