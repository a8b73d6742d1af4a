#pragma once

#include "whalecopy/domain/position.hpp"
#include "whalecopy/time/time_utils.hpp"

#include <cstdint>

namespace whalecopy {

// -----------------------------------------------------------------------------
// PositionUpdateEvent
// -----------------------------------------------------------------------------
//
// @brief  Snapshot of a Position after PositionLedger committed a mutation.
//
// @details
// Published once per recorded PositionUpdate, after the audit append. The
// position is copied by value so the event stays valid regardless of later
// ledger changes. sequence_id is the audit record id.
// -----------------------------------------------------------------------------
struct PositionUpdateEvent {
  domain::Position position;
  domain::PositionUpdateType update_type{domain::PositionUpdateType::PriceUpdate};
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

}  // namespace whalecopy
