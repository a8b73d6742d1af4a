#pragma once

namespace whalecopy {
namespace domain {

// -----------------------------------------------------------------------------
// OrderState - lifecycle state of one exchange order
// -----------------------------------------------------------------------------
//
// @brief  States driven by OrderExecutor. PENDING is the initial state;
//         CONFIRMED, CANCELLED and DEAD_LETTER are terminal.
//
// @details
// FAILED is terminal only when the failure was a terminal exchange error.
// After a transient failure the executor either retries (FAILED -> PENDING)
// or gives up (FAILED -> DEAD_LETTER). The legal graph lives in
// OrderStateMachine.
// -----------------------------------------------------------------------------
enum class OrderState {
  Pending,          // Created, submission not yet acknowledged
  Submitted,        // Acknowledged by the exchange, nothing filled yet
  PartiallyFilled,  // Some size filled, remainder still working
  Filled,           // Fully filled, awaiting confirmation
  Confirmed,        // Fill confirmed - terminal
  Cancelled,        // Cancelled locally or on the exchange - terminal
  Failed,           // Submission failed (retryable or terminal error)
  DeadLetter,       // Retries exhausted, needs manual review - terminal
};

}  // namespace domain
}  // namespace whalecopy
