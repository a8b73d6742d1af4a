#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>

namespace whalecopy {
namespace domain {

enum class BreakerState {
  Normal,
  Reduced,  // Drawdown breaker: sizes scaled down
  Paused,   // Consecutive-loss cooldown
  Halted,   // Daily loss or manual halt: no new trading
};

// Why the portfolio was halted. Daily-loss halts clear at the next UTC
// day; manual and emergency halts only clear on manual reset.
enum class HaltCause {
  None,
  DailyLoss,
  Manual,
};

// Exposure already committed plus exposure reserved by approved orders that
// have not finished executing.
struct ExposureBook {
  double total{0.0};
  std::map<std::string, double> by_whale;
  std::map<std::string, double> by_market;
  std::map<std::string, double> by_category;
};

// -----------------------------------------------------------------------------
// RiskState - process-wide risk bookkeeping
// -----------------------------------------------------------------------------
//
// @brief  Single authoritative value owned by RiskManager.
//
// @details
// Mutated exclusively by RiskManager under its writer lock. Filters, the
// sizer and the query surface receive copies (snapshots), never a
// reference, so a read can never observe a half-applied update.
// -----------------------------------------------------------------------------
struct RiskState {
  double nav{0.0};
  double start_of_day_nav{0.0};
  double daily_realized_pnl{0.0};
  double daily_unrealized_pnl{0.0};
  double cumulative_realized_pnl{0.0};
  double unrealized_pnl{0.0};
  double portfolio_value{0.0};
  double portfolio_peak_value{0.0};

  ExposureBook exposure;       // Filled positions
  ExposureBook reserved;       // Approved, still executing
  std::map<std::string, double> whale_daily_pnl;

  BreakerState breaker{BreakerState::Normal};
  HaltCause halt_cause{HaltCause::None};
  bool circuit_breaker_tripped{false};
  std::string circuit_breaker_reason;
  double size_multiplier{1.0};

  int consecutive_losses{0};
  std::optional<std::int64_t> paused_until_ms;
  std::int64_t trading_day{0};  // UTC day index

  std::set<std::string> quarantined_whales;

  double dailyPnl() const { return daily_realized_pnl + daily_unrealized_pnl; }

  double drawdown() const {
    if (portfolio_peak_value <= 0.0) {
      return 0.0;
    }
    const double dd = (portfolio_peak_value - portfolio_value) / portfolio_peak_value;
    return dd > 0.0 ? dd : 0.0;
  }

  double openExposure() const { return exposure.total + reserved.total; }
};

}  // namespace domain
}  // namespace whalecopy
