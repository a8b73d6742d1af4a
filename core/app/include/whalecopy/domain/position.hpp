#pragma once

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdint>
#include <optional>
#include <string>

namespace whalecopy {
namespace domain {

using PositionId = std::string;

// Outcome held. Prices are quoted on the YES reference, so a NO position is
// short the reference price.
enum class Outcome {
  Yes,
  No,
};

enum class PositionStatus {
  Open,
  Closing,   // A closing order is in flight; exit triggers are suppressed
  Closed,
  Archived,
};

enum class CloseReason {
  StopLoss,
  TakeProfit,
  Manual,
  WhaleExit,
  PreResolution,
};

// Exit checks evaluated by PositionLedger, in configurable priority order.
enum class ExitTrigger {
  StopLoss,
  TakeProfit,
  TimeBased,
  WhaleExit,
};

enum class PositionUpdateType {
  PriceUpdate,
  SizeIncrease,
  SizeDecrease,
  PartialClose,
  FullClose,
  StopLossHit,
  TakeProfitHit,
  ManualAdjustment,
};

constexpr double kMinPrice = 0.01;
constexpr double kMaxPrice = 0.99;

inline double clampPrice(double price) {
  return std::clamp(price, kMinPrice, kMaxPrice);
}

// +1 for YES (long the reference), -1 for NO.
inline double direction(Outcome side) {
  return side == Outcome::Yes ? 1.0 : -1.0;
}

// Converts the price paid for an outcome token to the YES reference.
inline double referencePrice(Outcome side, double token_price) {
  return side == Outcome::Yes ? token_price : 1.0 - token_price;
}

// -----------------------------------------------------------------------------
// Position - one market exposure copied from a whale
// -----------------------------------------------------------------------------
//
// @brief  Value type owned by PositionLedger. Everyone else sees copies.
//
// @details
// P&L rules:
//   unrealized_pnl = (current_price - entry_price) * current_size * dir
//   total_pnl      = unrealized_pnl + realized_pnl          (derived)
//   pnl_percentage = total_pnl / entry_amount * 100, or 0   (derived)
//
// total_pnl and pnl_percentage are member functions on purpose: they are
// never stored, so they cannot drift from their inputs.
//
// market_value is the current size priced on the outcome token actually
// held, so for NO positions it uses (1 - current_price).
//
// High-water marks track total_pnl: max_profit >= 0, max_drawdown <= 0.
// -----------------------------------------------------------------------------
struct Position {
  PositionId position_id;
  std::string whale_address;
  std::string token_id;
  std::string market_id;
  std::string category;
  Outcome side{Outcome::Yes};

  double entry_size{0.0};
  double entry_price{0.0};     // YES reference, [0.01, 0.99]
  double entry_amount{0.0};    // USD paid

  double current_size{0.0};
  double current_price{0.0};   // YES reference, [0.01, 0.99]
  double market_value{0.0};

  double unrealized_pnl{0.0};
  double realized_pnl{0.0};

  double max_drawdown{0.0};
  double max_profit{0.0};
  std::optional<double> stop_loss_price;
  std::optional<double> take_profit_price;
  std::optional<double> trailing_reference_price;  // Set once trailing arms
  double kelly_fraction{0.0};
  double edge{0.0};
  double win_rate{0.0};

  PositionStatus status{PositionStatus::Open};
  std::int64_t opened_at_ms{0};
  std::int64_t last_updated_at_ms{0};
  std::optional<std::int64_t> closed_at_ms;
  std::optional<CloseReason> close_reason;
  std::optional<std::int64_t> resolution_time_ms;
  bool whale_exit_pending{false};

  double totalPnl() const { return unrealized_pnl + realized_pnl; }

  double pnlPercentage() const {
    return entry_amount > 0.0 ? totalPnl() / entry_amount * 100.0 : 0.0;
  }

  double tokenPrice() const {
    return side == Outcome::Yes ? current_price : 1.0 - current_price;
  }

  bool isLive() const {
    return status == PositionStatus::Open || status == PositionStatus::Closing;
  }

  // Recomputes market_value, unrealized_pnl and the high-water marks from
  // current_size and current_price.
  void revalue() {
    market_value = current_size * tokenPrice();
    unrealized_pnl = (current_price - entry_price) * current_size * direction(side);
    const double total = totalPnl();
    max_profit = std::max(max_profit, total);
    max_drawdown = std::min(max_drawdown, total);
  }
};

// -----------------------------------------------------------------------------
// PositionUpdate - immutable before/after snapshot of a position mutation
// -----------------------------------------------------------------------------
struct PositionUpdate {
  std::uint64_t id{0};  // Assigned by AuditTrail
  PositionId position_id;
  PositionUpdateType update_type{PositionUpdateType::PriceUpdate};
  double old_size{0.0};
  double new_size{0.0};
  double old_price{0.0};
  double new_price{0.0};
  double old_market_value{0.0};
  double new_market_value{0.0};
  double old_unrealized_pnl{0.0};
  double new_unrealized_pnl{0.0};
  std::int64_t timestamp_ms{0};
  std::string reason;
  nlohmann::json metadata = nlohmann::json::object();
};

}  // namespace domain
}  // namespace whalecopy
