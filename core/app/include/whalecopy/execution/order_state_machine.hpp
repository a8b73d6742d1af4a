#pragma once

#include "whalecopy/domain/order_state.hpp"

namespace whalecopy {

// -----------------------------------------------------------------------------
// OrderStateMachine - legal order state transitions
// -----------------------------------------------------------------------------
//
// @brief  The transition graph every order mutation is checked against.
//
// @details
// Legal transitions:
//   PENDING          -> SUBMITTED, FAILED, CANCELLED
//   SUBMITTED        -> PARTIALLY_FILLED, FILLED, CANCELLED, FAILED
//   PARTIALLY_FILLED -> PARTIALLY_FILLED, FILLED, CONFIRMED, CANCELLED
//   FILLED           -> CONFIRMED
//   FAILED           -> PENDING (retry), DEAD_LETTER
//   CONFIRMED, CANCELLED, DEAD_LETTER -> (none, terminal)
//
// Thread model: pure functions, safe from any context.
// -----------------------------------------------------------------------------
class OrderStateMachine {
 public:
  static bool canTransition(domain::OrderState from, domain::OrderState to);

  // Throws InvalidTransitionError naming both states when the move is not
  // in the graph.
  static void validate(domain::OrderState from, domain::OrderState to);

  // CONFIRMED, CANCELLED and DEAD_LETTER.
  static bool isTerminal(domain::OrderState state);

  // Orders with capital at the exchange: SUBMITTED and PARTIALLY_FILLED.
  static bool isWorking(domain::OrderState state);
};

}  // namespace whalecopy
