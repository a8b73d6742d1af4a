#pragma once

#include "whalecopy/execution/order_request.hpp"
#include "whalecopy/ledger/ledger_types.hpp"
#include "whalecopy/time/time_utils.hpp"

#include <cstdint>
#include <string>

namespace whalecopy {

// -----------------------------------------------------------------------------
// CopyOrderEvent
// -----------------------------------------------------------------------------
// Responsibility: An approved, sized and risk-reserved copy trade handed from
// signal_loop to execution_loop. `open` carries the position context booked
// on fill; `reservation_id` names the RiskManager reservation to settle.
// -----------------------------------------------------------------------------
struct CopyOrderEvent {
  OrderRequest request;
  PositionOpen open;
  std::string reservation_id;
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

// An exit trigger fired by the ledger, to be executed as a closing order.
struct ExitSignalEvent {
  ExitSignal signal;
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

}  // namespace whalecopy
