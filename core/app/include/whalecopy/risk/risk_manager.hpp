#pragma once

#include "whalecopy/domain/risk_limits.hpp"
#include "whalecopy/domain/risk_state.hpp"
#include "whalecopy/domain/whale.hpp"
#include "whalecopy/events/event.hpp"
#include "whalecopy/time/i_time_provider.hpp"

#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace whalecopy {

// A pre-trade question: may `whale_address` add `notional_usd` of exposure
// in `market_id` / `category`?
struct RiskRequest {
  std::string whale_address;
  std::string market_id;
  std::string category;
  double notional_usd{0.0};
};

// A veto is a value, not an error.
struct RiskDecision {
  bool approved{false};
  std::string reason;
  double size_multiplier{1.0};

  static RiskDecision approve(double multiplier) {
    return RiskDecision{true, "", multiplier};
  }
  static RiskDecision veto(std::string reason) {
    return RiskDecision{false, std::move(reason), 0.0};
  }
};

enum class QuarantineChange {
  None,
  Quarantined,
  Released,
};

// -----------------------------------------------------------------------------
// RiskManager - portfolio gatekeeper and sole owner of RiskState
// -----------------------------------------------------------------------------
//
// @brief  Circuit breakers, exposure and concentration limits, and whale
//         quarantine. Holds veto authority over every copy order.
//
// @details
// Circuit breakers:
//   HALTED   daily loss (realized + unrealized change since the UTC day
//            start) beyond min(daily_loss_limit_usd, pct * start-of-day NAV).
//            Cleared at the next UTC day or by resetCircuitBreaker(). A
//            manual halt (haltTrading) clears only on reset.
//   REDUCED  drawdown from peak >= drawdown_reduce_pct: size multiplier
//            becomes reduce_factor; restored once drawdown recovers.
//   PAUSED   max_consecutive_losses losing trades in a row: no new intents
//            until pause_duration_ms has elapsed.
//
// Limits (each a veto): per-position USD, per-market, per-whale, total
// allocation of portfolio value, and the per-whale daily loss limit.
//
// Quarantine: score < quarantine_min_score, drawdown above
// quarantine_max_drawdown, or a drop of quarantine_score_drop points within
// score_drop_window_ms. Release needs score > release_min_score and no loss
// on that whale for release_clean_period_ms (counted from the later of the
// quarantine time and the whale's last losing trade).
//
// Exposure lifecycle: reserve() books a reservation at approval time,
// settleReservation() moves the filled part into open exposure and drops the
// rest, releaseExposure() removes exposure when a position closes.
//
// Thread model:
//   One writer mutex guards all state. evaluate() checks a request against a
//   single consistent copy; reserve() checks and books under the same lock,
//   so two concurrent approvals can never both consume the last headroom.
//   Alerts are emitted through the sink after the lock is released.
// -----------------------------------------------------------------------------
class RiskManager {
 public:
  RiskManager(const ITimeProvider& clock, domain::RiskLimits limits,
              double initial_nav, EventSink alert_sink = {});

  RiskManager(const RiskManager&) = delete;
  RiskManager& operator=(const RiskManager&) = delete;
  RiskManager(RiskManager&&) = delete;
  RiskManager& operator=(RiskManager&&) = delete;

  // Pure check against the current state. Does not reserve anything.
  RiskDecision evaluate(const RiskRequest& request) const;

  // -------------------------------------------------------------------------
  // reserve(reservation_id, request)
  // -------------------------------------------------------------------------
  // @brief  Atomically evaluates `request` and, if approved, books its
  //         notional as reserved exposure under `reservation_id`.
  //
  // @details
  // Reserving an id that is already held returns the earlier approval
  // without booking twice.
  // -------------------------------------------------------------------------
  RiskDecision reserve(const std::string& reservation_id,
                       const RiskRequest& request);

  // Drops a reservation without creating exposure (order never filled).
  void releaseReservation(const std::string& reservation_id);

  // Converts a reservation into `filled_notional` of open exposure.
  void settleReservation(const std::string& reservation_id,
                         double filled_notional);

  // Adds open exposure directly. Used when hydrating recovered positions.
  void addExposure(const std::string& whale_address,
                   const std::string& market_id, const std::string& category,
                   double notional);

  void releaseExposure(const std::string& whale_address,
                       const std::string& market_id,
                       const std::string& category, double notional);

  // Books the realized P&L of a closing fill: daily and cumulative P&L, NAV,
  // whale daily P&L and the consecutive-loss counter. May trip breakers.
  void recordTradeResult(const std::string& whale_address, double realized_pnl);

  // Sets the portfolio's current unrealized P&L. May trip breakers.
  void updateUnrealized(double unrealized_pnl);

  QuarantineChange onWhaleProfile(const domain::WhaleProfile& profile);

  // -------------------------------------------------------------------------
  // maintain()
  // -------------------------------------------------------------------------
  // @brief  Periodic housekeeping: UTC day rollover, pause expiry and the
  //         quarantine release review.
  //
  // @return Whales released from quarantine by this call.
  // -------------------------------------------------------------------------
  std::vector<std::string> maintain();

  void haltTrading(const std::string& reason);

  // Clears every breaker (including a manual halt), the pause and the
  // consecutive-loss counter. Quarantines are unaffected.
  void resetCircuitBreaker();

  domain::RiskState snapshot() const;

  double sizeMultiplier() const;
  bool isQuarantined(const std::string& whale_address) const;
  bool tradingHalted() const;

  const domain::RiskLimits& limits() const { return limits_; }

 private:
  struct Reservation {
    std::string whale_address;
    std::string market_id;
    std::string category;
    double notional{0.0};
  };

  struct WhaleRecord {
    std::deque<std::pair<std::int64_t, double>> score_history;
    double last_score{0.0};
    bool has_score{false};
    std::int64_t quarantined_at_ms{0};
    std::int64_t last_loss_ms{0};
    bool has_loss{false};
  };

  RiskDecision checkLocked(const RiskRequest& request, std::int64_t now) const;

  void rolloverLocked(std::int64_t now, std::vector<Event>& alerts);
  void refreshBreakersLocked(std::int64_t now, std::vector<Event>& alerts);
  void revalueLocked();
  bool releaseEligibleLocked(const std::string& whale, const WhaleRecord& record,
                             std::int64_t now) const;
  void emit(std::vector<Event>& alerts) const;

  RiskAlertEvent makeAlert(RiskAlertKind kind, std::string subject,
                           std::string reason, double current,
                           double limit) const;

  const ITimeProvider& clock_;
  domain::RiskLimits limits_;
  double initial_nav_;
  EventSink alert_sink_;

  mutable std::mutex mutex_;
  domain::RiskState state_;
  double unrealized_at_day_start_{0.0};
  bool reduced_{false};
  std::map<std::string, Reservation> reservations_;
  std::map<std::string, WhaleRecord> whales_;
};

}  // namespace whalecopy
