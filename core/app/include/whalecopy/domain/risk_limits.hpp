#pragma once

#include <cstdint>

namespace whalecopy {
namespace domain {

// What happens to a quarantined whale's open positions.
enum class QuarantinePolicy {
  Hold,       // Keep them, only stop new copies
  Liquidate,  // Close them with reason MANUAL
};

// -----------------------------------------------------------------------------
// RiskLimits - hard thresholds enforced by RiskManager
// -----------------------------------------------------------------------------
struct RiskLimits {
  /// Daily loss (realized + unrealized, USD) that halts all new trading.
  double daily_loss_limit_usd{500.0};

  /// Daily loss as a fraction of start-of-day NAV that halts trading.
  double daily_loss_limit_pct{0.05};

  /// Daily loss attributed to one whale that vetoes further copies of it.
  double whale_daily_loss_limit_usd{200.0};

  /// Drawdown from the portfolio peak at which sizes are scaled down.
  double drawdown_reduce_pct{0.10};

  /// Size multiplier applied while the drawdown breaker is active.
  double reduce_factor{0.5};

  /// Consecutive losing trades that trigger a cooldown pause.
  int max_consecutive_losses{5};

  /// Length of the cooldown pause.
  std::int64_t pause_duration_ms{60LL * 60 * 1000};

  /// Per-position, per-market and per-whale ceilings (USD).
  double max_position_usd{1000.0};
  double max_market_exposure_usd{2000.0};
  double max_whale_exposure_usd{3000.0};

  /// Ceiling on total allocated capital as a fraction of NAV.
  double max_portfolio_allocation_pct{0.95};

  /// Quarantine triggers.
  double quarantine_min_score{50.0};
  double quarantine_max_drawdown{0.10};
  double quarantine_score_drop{25.0};
  std::int64_t score_drop_window_ms{7LL * 24 * 60 * 60 * 1000};

  /// Quarantine release requirements.
  double release_min_score{60.0};
  std::int64_t release_clean_period_ms{7LL * 24 * 60 * 60 * 1000};

  QuarantinePolicy quarantine_policy{QuarantinePolicy::Hold};
};

}  // namespace domain
}  // namespace whalecopy
