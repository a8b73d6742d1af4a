// =============================================================================
// risk_manager_test.cpp
// =============================================================================
// Unit tests for whalecopy::RiskManager.
//
// Validates:
//   - Exposure limits veto in order: position, market, whale, allocation
//   - Reservation lifecycle: reserve (idempotent), settle, release
//   - HALTED on daily loss, cleared by the next UTC day
//   - Manual halt holds until resetCircuitBreaker()
//   - PAUSED after consecutive losses, expiring after the cooldown
//   - REDUCED on drawdown with the 0.5 size multiplier, and recovery
//   - Whale quarantine triggers, and release after a clean period
//   - NAV = initial NAV + cumulative realized P&L
//
// A SimulationTimeProvider drives every time-dependent rule.
// =============================================================================

#include "whalecopy/domain/risk_limits.hpp"
#include "whalecopy/domain/risk_state.hpp"
#include "whalecopy/events/event.hpp"
#include "whalecopy/risk/risk_manager.hpp"
#include "whalecopy/time/simulation_time_provider.hpp"
#include "whalecopy/time/time_utils.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

using whalecopy::QuarantineChange;
using whalecopy::RiskAlertEvent;
using whalecopy::RiskAlertKind;
using whalecopy::RiskDecision;
using whalecopy::RiskRequest;
using whalecopy::domain::BreakerState;

namespace {

// 10:00 UTC on some day, so a few hours of activity stay on the same day.
constexpr std::int64_t kStart = 20000 * whalecopy::kMsPerDay + 10 * whalecopy::kMsPerHour;

RiskRequest request(const std::string& whale, const std::string& market,
                    double notional, const std::string& category = "Politics") {
  return RiskRequest{whale, market, category, notional};
}

whalecopy::domain::WhaleProfile profile(const std::string& address,
                                        double score, double drawdown) {
  whalecopy::domain::WhaleProfile p;
  p.address = address;
  p.quality_score = score;
  p.current_drawdown = drawdown;
  p.sharpe_30d = 1.5;
  p.sharpe_90d = 1.0;
  p.win_rate = 0.6;
  return p;
}

}  // namespace

// =============================================================================
// Test fixture: 10k NAV, default limits, alerts captured into a vector.
// =============================================================================
class RiskManagerTest : public ::testing::Test {
 protected:
  whalecopy::SimulationTimeProvider clock{kStart};
  std::vector<RiskAlertEvent> alerts;
  std::unique_ptr<whalecopy::RiskManager> risk;

  void SetUp() override { build(whalecopy::domain::RiskLimits{}); }

  void build(const whalecopy::domain::RiskLimits& limits) {
    alerts.clear();
    risk = std::make_unique<whalecopy::RiskManager>(
        clock, limits, 10000.0, [this](whalecopy::Event e) {
          if (auto* alert = std::get_if<RiskAlertEvent>(&e)) {
            alerts.push_back(*alert);
          }
        });
  }

  bool sawAlert(RiskAlertKind kind, const std::string& subject) const {
    for (const auto& a : alerts) {
      if (a.kind == kind && a.subject == subject) {
        return true;
      }
    }
    return false;
  }
};

// -----------------------------------------------------------------------------
// 1. A fresh manager starts NORMAL with NAV equal to the initial capital.
// -----------------------------------------------------------------------------
TEST_F(RiskManagerTest, InitialState) {
  const auto s = risk->snapshot();
  EXPECT_DOUBLE_EQ(s.nav, 10000.0);
  EXPECT_DOUBLE_EQ(s.portfolio_value, 10000.0);
  EXPECT_EQ(s.breaker, BreakerState::Normal);
  EXPECT_DOUBLE_EQ(s.size_multiplier, 1.0);
  EXPECT_TRUE(risk->evaluate(request("0xA", "M1", 500.0)).approved);
}

// -----------------------------------------------------------------------------
// 2. Per-position, per-market and per-whale ceilings.
// -----------------------------------------------------------------------------
TEST_F(RiskManagerTest, ExposureLimitsVeto) {
  EXPECT_EQ(risk->evaluate(request("0xA", "M1", 1000.01)).reason,
            "Position size limit");
  EXPECT_EQ(risk->evaluate(request("0xA", "M1", 0.0)).reason,
            "Order notional must be positive");

  ASSERT_TRUE(risk->reserve("r1", request("0xA", "M1", 900.0)).approved);
  ASSERT_TRUE(risk->reserve("r2", request("0xB", "M1", 900.0)).approved);
  EXPECT_EQ(risk->reserve("r3", request("0xC", "M1", 300.0)).reason,
            "Market exposure limit");

  ASSERT_TRUE(risk->reserve("r4", request("0xA", "M2", 900.0)).approved);
  ASSERT_TRUE(risk->reserve("r5", request("0xA", "M3", 900.0)).approved);
  EXPECT_EQ(risk->reserve("r6", request("0xA", "M4", 400.0)).reason,
            "Whale exposure limit");
  EXPECT_TRUE(risk->reserve("r7", request("0xA", "M4", 300.0)).approved);
}

// -----------------------------------------------------------------------------
// 3. Total allocation is capped at 95% of portfolio value.
// -----------------------------------------------------------------------------
TEST_F(RiskManagerTest, PortfolioAllocationLimit) {
  whalecopy::domain::RiskLimits limits;
  limits.max_position_usd = 10000.0;
  limits.max_market_exposure_usd = 100000.0;
  limits.max_whale_exposure_usd = 100000.0;
  build(limits);

  ASSERT_TRUE(risk->reserve("r1", request("0xA", "M1", 9000.0)).approved);
  const RiskDecision d = risk->reserve("r2", request("0xB", "M2", 600.0));
  EXPECT_FALSE(d.approved);
  EXPECT_EQ(d.reason, "Portfolio allocation limit");
}

// -----------------------------------------------------------------------------
// 4. Reservations: idempotent by id, settled into exposure, or released.
// Why: A replayed approval must not consume headroom twice.
// -----------------------------------------------------------------------------
TEST_F(RiskManagerTest, ReservationLifecycle) {
  ASSERT_TRUE(risk->reserve("r1", request("0xA", "M1", 900.0)).approved);
  ASSERT_TRUE(risk->reserve("r1", request("0xA", "M1", 900.0)).approved);
  EXPECT_DOUBLE_EQ(risk->snapshot().reserved.total, 900.0);

  risk->settleReservation("r1", 500.0);
  auto s = risk->snapshot();
  EXPECT_DOUBLE_EQ(s.reserved.total, 0.0);
  EXPECT_DOUBLE_EQ(s.exposure.total, 500.0);
  EXPECT_DOUBLE_EQ(s.exposure.by_market["M1"], 500.0);
  EXPECT_DOUBLE_EQ(s.exposure.by_category["Politics"], 500.0);

  ASSERT_TRUE(risk->reserve("r2", request("0xA", "M2", 300.0)).approved);
  risk->releaseReservation("r2");
  EXPECT_DOUBLE_EQ(risk->snapshot().reserved.total, 0.0);

  risk->releaseExposure("0xA", "M1", "Politics", 500.0);
  s = risk->snapshot();
  EXPECT_DOUBLE_EQ(s.exposure.total, 0.0);
  EXPECT_EQ(s.exposure.by_market.count("M1"), 0u);
}

// -----------------------------------------------------------------------------
// 5. A daily loss beyond min(500, 5% NAV) halts trading until the next UTC day.
// -----------------------------------------------------------------------------
TEST_F(RiskManagerTest, DailyLossHaltsUntilRollover) {
  risk->recordTradeResult("0xB", -501.0);

  EXPECT_TRUE(risk->tradingHalted());
  EXPECT_EQ(risk->snapshot().breaker, BreakerState::Halted);
  EXPECT_EQ(risk->evaluate(request("0xA", "M1", 100.0)).reason,
            "Circuit breaker: Daily loss limit");
  EXPECT_TRUE(sawAlert(RiskAlertKind::BreakerTripped, "HALTED"));

  clock.advance_by(whalecopy::kMsPerDay);
  risk->maintain();

  EXPECT_FALSE(risk->tradingHalted());
  EXPECT_TRUE(risk->evaluate(request("0xA", "M1", 100.0)).approved);
  EXPECT_DOUBLE_EQ(risk->snapshot().start_of_day_nav, 9499.0);
}

// -----------------------------------------------------------------------------
// 6. A manual halt survives the day rollover and clears only on reset.
// -----------------------------------------------------------------------------
TEST_F(RiskManagerTest, ManualHaltNeedsReset) {
  risk->haltTrading("Operator request");
  EXPECT_EQ(risk->evaluate(request("0xA", "M1", 100.0)).reason,
            "Circuit breaker: Operator request");

  clock.advance_by(whalecopy::kMsPerDay);
  risk->maintain();
  EXPECT_TRUE(risk->tradingHalted());

  risk->resetCircuitBreaker();
  EXPECT_FALSE(risk->tradingHalted());
  EXPECT_TRUE(risk->evaluate(request("0xA", "M1", 100.0)).approved);
}

// -----------------------------------------------------------------------------
// 7. Five consecutive losses pause new trading for an hour.
// -----------------------------------------------------------------------------
TEST_F(RiskManagerTest, ConsecutiveLossesPause) {
  for (int i = 0; i < 5; ++i) {
    risk->recordTradeResult("0xB", -10.0);
  }

  auto s = risk->snapshot();
  EXPECT_EQ(s.breaker, BreakerState::Paused);
  EXPECT_EQ(s.consecutive_losses, 0);
  EXPECT_EQ(risk->evaluate(request("0xA", "M1", 100.0)).reason,
            "Trading paused after consecutive losses");

  clock.advance_by(60 * 60 * 1000);
  risk->maintain();
  EXPECT_EQ(risk->snapshot().breaker, BreakerState::Normal);
  EXPECT_TRUE(risk->evaluate(request("0xA", "M1", 100.0)).approved);
}

TEST_F(RiskManagerTest, WinResetsLossStreak) {
  for (int i = 0; i < 4; ++i) {
    risk->recordTradeResult("0xB", -10.0);
  }
  risk->recordTradeResult("0xB", 5.0);
  risk->recordTradeResult("0xB", -10.0);

  const auto s = risk->snapshot();
  EXPECT_EQ(s.consecutive_losses, 1);
  EXPECT_NE(s.breaker, BreakerState::Paused);
}

// -----------------------------------------------------------------------------
// 8. One whale's daily losses veto further copies of that whale only.
// -----------------------------------------------------------------------------
TEST_F(RiskManagerTest, WhaleDailyLossLimit) {
  risk->recordTradeResult("0xA", -200.0);
  EXPECT_EQ(risk->evaluate(request("0xA", "M1", 100.0)).reason,
            "Whale daily loss limit");
  EXPECT_TRUE(risk->evaluate(request("0xB", "M1", 100.0)).approved);
}

// -----------------------------------------------------------------------------
// 9. A 10% drawdown from peak halves new sizes; recovery restores them.
// -----------------------------------------------------------------------------
TEST_F(RiskManagerTest, DrawdownReducesSizing) {
  whalecopy::domain::RiskLimits limits;
  limits.daily_loss_limit_usd = 5000.0;
  limits.daily_loss_limit_pct = 1.0;
  build(limits);

  risk->updateUnrealized(-1200.0);
  auto s = risk->snapshot();
  EXPECT_EQ(s.breaker, BreakerState::Reduced);
  EXPECT_DOUBLE_EQ(s.size_multiplier, 0.5);
  EXPECT_NEAR(s.drawdown(), 0.12, 1e-12);

  const RiskDecision d = risk->evaluate(request("0xA", "M1", 100.0));
  EXPECT_TRUE(d.approved);
  EXPECT_DOUBLE_EQ(d.size_multiplier, 0.5);

  risk->updateUnrealized(0.0);
  EXPECT_DOUBLE_EQ(risk->sizeMultiplier(), 1.0);
  EXPECT_EQ(risk->snapshot().breaker, BreakerState::Normal);
  EXPECT_TRUE(sawAlert(RiskAlertKind::BreakerCleared, "REDUCED"));
}

// -----------------------------------------------------------------------------
// 10. NAV moves with realized P&L only; portfolio value adds unrealized.
// -----------------------------------------------------------------------------
TEST_F(RiskManagerTest, NavTracksRealizedPnl) {
  risk->recordTradeResult("0xA", 100.0);
  risk->updateUnrealized(-50.0);

  const auto s = risk->snapshot();
  EXPECT_DOUBLE_EQ(s.nav, 10100.0);
  EXPECT_DOUBLE_EQ(s.portfolio_value, 10050.0);
  EXPECT_DOUBLE_EQ(s.dailyPnl(), 50.0);
}

// -----------------------------------------------------------------------------
// 11. Quarantine on a low score; release needs score > 60 and 7 clean days.
// -----------------------------------------------------------------------------
TEST_F(RiskManagerTest, LowScoreQuarantineAndRelease) {
  EXPECT_EQ(risk->onWhaleProfile(profile("0xA", 40.0, 0.02)),
            QuarantineChange::Quarantined);
  EXPECT_TRUE(risk->isQuarantined("0xA"));
  EXPECT_EQ(risk->evaluate(request("0xA", "M1", 100.0)).reason,
            "Whale quarantined");
  EXPECT_TRUE(sawAlert(RiskAlertKind::WhaleQuarantined, "0xA"));

  EXPECT_EQ(risk->onWhaleProfile(profile("0xA", 70.0, 0.02)),
            QuarantineChange::None);

  clock.advance_by(7 * whalecopy::kMsPerDay);
  EXPECT_EQ(risk->onWhaleProfile(profile("0xA", 70.0, 0.02)),
            QuarantineChange::Released);
  EXPECT_FALSE(risk->isQuarantined("0xA"));
}

// -----------------------------------------------------------------------------
// 12. Drawdown quarantine; a loss during quarantine restarts the clean period.
// -----------------------------------------------------------------------------
TEST_F(RiskManagerTest, LossDuringQuarantineDelaysRelease) {
  ASSERT_EQ(risk->onWhaleProfile(profile("0xA", 80.0, 0.20)),
            QuarantineChange::Quarantined);

  clock.advance_by(3 * whalecopy::kMsPerDay);
  risk->recordTradeResult("0xA", -5.0);

  clock.advance_by(4 * whalecopy::kMsPerDay);
  EXPECT_TRUE(risk->maintain().empty());

  clock.advance_by(3 * whalecopy::kMsPerDay);
  const auto released = risk->maintain();
  ASSERT_EQ(released.size(), 1u);
  EXPECT_EQ(released.front(), "0xA");
  EXPECT_TRUE(sawAlert(RiskAlertKind::WhaleReleased, "0xA"));
}

// -----------------------------------------------------------------------------
// 13. A drop of 25 points within the window quarantines even above 50.
// -----------------------------------------------------------------------------
TEST_F(RiskManagerTest, ScoreDropQuarantines) {
  EXPECT_EQ(risk->onWhaleProfile(profile("0xA", 90.0, 0.02)),
            QuarantineChange::None);
  clock.advance_by(whalecopy::kMsPerDay);
  EXPECT_EQ(risk->onWhaleProfile(profile("0xA", 64.0, 0.02)),
            QuarantineChange::Quarantined);

  // Outside the 7-day window the old high no longer counts.
  EXPECT_EQ(risk->onWhaleProfile(profile("0xB", 90.0, 0.02)),
            QuarantineChange::None);
  clock.advance_by(8 * whalecopy::kMsPerDay);
  EXPECT_EQ(risk->onWhaleProfile(profile("0xB", 64.0, 0.02)),
            QuarantineChange::None);
}
