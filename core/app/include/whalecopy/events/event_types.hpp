#pragma once

#include "whalecopy/domain/market.hpp"
#include "whalecopy/domain/whale.hpp"
#include "whalecopy/time/time_utils.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace whalecopy {

// -----------------------------------------------------------------------------
// WhaleTradeEvent
// -----------------------------------------------------------------------------
// Responsibility: One trade observed from a tracked whale, as delivered by
// the signal feed. Consumed on signal_loop: BUY trades are candidates for
// copying, SELL trades mirror an exit of an already-copied position.
// -----------------------------------------------------------------------------
struct WhaleTradeEvent {
  domain::WhaleTrade trade;
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

// -----------------------------------------------------------------------------
// PriceUpdateEvent
// -----------------------------------------------------------------------------
// Responsibility: Current price of one outcome token, optionally with a book
// snapshot. The price is the token's own price; the ledger converts it to
// the YES-reference price per position.
// -----------------------------------------------------------------------------
struct PriceUpdateEvent {
  std::string token_id;
  double price{0.0};
  std::optional<domain::OrderBook> book;
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

// Refreshed whale statistics from the external scoring service.
struct WhaleProfileEvent {
  domain::WhaleProfile profile;
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

// Market metadata (category, resolution time).
struct MarketInfoEvent {
  domain::MarketInfo market;
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

// -----------------------------------------------------------------------------
// HeartbeatEvent
// -----------------------------------------------------------------------------
// Responsibility: Periodic tick from the maintenance thread. The signal loop
// runs day rollover, quarantine review, the stale-order sweep, time-based
// exits and archival on each one.
// -----------------------------------------------------------------------------
struct HeartbeatEvent {
  std::string component_id;
  std::string status;
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

// -----------------------------------------------------------------------------
// SignalRejectedEvent
// -----------------------------------------------------------------------------
// Responsibility: A whale trade that was not copied, with the stage that
// stopped it (1-3 for the filter, 4 for sizing, 5 for the risk veto) and the
// human-readable reason.
// -----------------------------------------------------------------------------
struct SignalRejectedEvent {
  std::string whale_address;
  std::string market_id;
  std::string token_id;
  int stage{0};
  std::string code;
  std::string reason;
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

}  // namespace whalecopy
