#pragma once

#include "whalecopy/domain/order.hpp"
#include "whalecopy/domain/order_state.hpp"
#include "whalecopy/time/time_utils.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace whalecopy {

// -----------------------------------------------------------------------------
// OrderUpdateEvent
// -----------------------------------------------------------------------------
//
// @brief  Published by OrderExecutor after every order state transition has
//         been written to the audit trail and the order store.
//
// @details
// `order` is a full copy of the order after the transition. previous_state
// is empty for the creation record (the initial PENDING). `reason` repeats
// the audit record's reason string.
//
// Thread model:
//   Published on whichever thread drove the transition (execution_loop for
//   lifecycles, the feed thread for push fills, signal_loop for the stale
//   order sweep). Plain data, safe to copy across threads.
// -----------------------------------------------------------------------------
struct OrderUpdateEvent {
  domain::Order order;
  std::optional<domain::OrderState> previous_state;
  std::string reason;
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

}  // namespace whalecopy
