#pragma once

#include "whalecopy/domain/position.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace whalecopy {

// Everything the ledger needs to open (or add to) a copied position, except
// the fill itself, which is supplied when the order completes.
struct PositionOpen {
  std::string whale_address;
  std::string token_id;
  std::string market_id;
  std::string category;
  domain::Outcome side{domain::Outcome::Yes};
  double kelly_fraction{0.0};
  double edge{0.0};
  double win_rate{0.0};
  std::optional<std::int64_t> resolution_time_ms;
};

// -----------------------------------------------------------------------------
// ExitSignal - a fired exit trigger, turned into a closing order by the engine
// -----------------------------------------------------------------------------
// `size` is the position's current size at the time the trigger fired and
// `token_price` the held token's price, used as the closing limit reference.
// -----------------------------------------------------------------------------
struct ExitSignal {
  domain::PositionId position_id;
  std::string whale_address;
  std::string token_id;
  std::string market_id;
  domain::Outcome side{domain::Outcome::Yes};
  std::optional<domain::ExitTrigger> trigger;  // Empty for manual closes
  domain::CloseReason reason{domain::CloseReason::Manual};
  double size{0.0};
  double token_price{0.0};
  std::string detail;
};

// Result of booking a closing fill.
struct CloseResult {
  domain::Position position;    // Snapshot after the fill
  double closed_size{0.0};
  double realized_delta{0.0};   // Realized P&L of this fill alone
  double released_cost{0.0};    // Entry cost of the closed shares
  bool fully_closed{false};
};

}  // namespace whalecopy
