// =============================================================================
// position_ledger_test.cpp
// =============================================================================
// Unit tests for whalecopy::PositionLedger.
//
// Validates:
//   - Opening YES and NO positions on the YES reference with default stops
//   - Adding to an open position at the size-weighted entry
//   - Revaluation on ticks, including NO-side P&L and market value
//   - Stop-loss, take-profit, trailing-stop, time-based and whale exits
//   - Configurable exit priority
//   - A CLOSING position is never re-triggered; abortClose() reopens it
//   - Partial and full closes book realized P&L and released cost
//   - Archival, queries, and recovery from the audit trail
// =============================================================================

#include "whalecopy/audit/audit_trail.hpp"
#include "whalecopy/config/engine_config.hpp"
#include "whalecopy/errors.hpp"
#include "whalecopy/events/event.hpp"
#include "whalecopy/ledger/position_ledger.hpp"
#include "whalecopy/time/simulation_time_provider.hpp"
#include "whalecopy/time/time_utils.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using whalecopy::CloseResult;
using whalecopy::ExitSignal;
using whalecopy::PositionOpen;
using whalecopy::domain::CloseReason;
using whalecopy::domain::ExitTrigger;
using whalecopy::domain::Outcome;
using whalecopy::domain::Position;
using whalecopy::domain::PositionStatus;
using whalecopy::domain::PositionUpdateType;

namespace {

constexpr std::int64_t kStart = 1'700'000'000'000;

PositionOpen openFor(const std::string& whale, const std::string& token,
                     Outcome side = Outcome::Yes) {
  PositionOpen open;
  open.whale_address = whale;
  open.token_id = token;
  open.market_id = "M-" + token;
  open.category = "Politics";
  open.side = side;
  open.kelly_fraction = 0.05;
  open.edge = 0.056;
  open.win_rate = 0.63;
  open.resolution_time_ms = kStart + 30 * whalecopy::kMsPerDay;
  return open;
}

}  // namespace

// =============================================================================
// Test fixture: in-memory audit trail, default ledger config, events captured.
// =============================================================================
class PositionLedgerTest : public ::testing::Test {
 protected:
  whalecopy::SimulationTimeProvider clock{kStart};
  whalecopy::AuditTrail audit;
  std::vector<whalecopy::PositionUpdateEvent> events;
  std::unique_ptr<whalecopy::PositionLedger> ledger;

  void SetUp() override { build(whalecopy::LedgerConfig{}); }

  void build(const whalecopy::LedgerConfig& config) {
    ledger = std::make_unique<whalecopy::PositionLedger>(
        clock, audit, config, [this](whalecopy::Event e) {
          if (auto* update = std::get_if<whalecopy::PositionUpdateEvent>(&e)) {
            events.push_back(*update);
          }
        });
  }

  Position position(const std::string& id) const {
    auto p = ledger->get(id);
    EXPECT_TRUE(p.has_value()) << id;
    return p.value_or(Position{});
  }
};

// -----------------------------------------------------------------------------
// 1. A YES fill opens a position with stops at -15% / +30%.
// -----------------------------------------------------------------------------
TEST_F(PositionLedgerTest, OpensYesPositionWithDefaultStops) {
  const Position p = ledger->openPosition(openFor("0xA", "T1"), 1000.0, 0.55);

  EXPECT_EQ(p.position_id, "pos-1");
  EXPECT_EQ(p.status, PositionStatus::Open);
  EXPECT_DOUBLE_EQ(p.entry_price, 0.55);
  EXPECT_DOUBLE_EQ(p.current_size, 1000.0);
  EXPECT_DOUBLE_EQ(p.entry_amount, 550.0);
  EXPECT_NEAR(*p.stop_loss_price, 0.4675, 1e-12);
  EXPECT_NEAR(*p.take_profit_price, 0.715, 1e-12);
  EXPECT_DOUBLE_EQ(p.unrealized_pnl, 0.0);

  ASSERT_EQ(events.size(), 1u);
  EXPECT_EQ(events[0].update_type, PositionUpdateType::SizeIncrease);
  EXPECT_EQ(audit.updatesFor("pos-1").size(), 1u);
}

// -----------------------------------------------------------------------------
// 2. A NO fill at 0.40 is booked at 0.60 on the YES reference, short.
// Why: Every stop and P&L rule works on one price axis; the NO side
//      mirrors it through dir = -1.
// -----------------------------------------------------------------------------
TEST_F(PositionLedgerTest, NoPositionMirrorsReferencePrice) {
  const Position p =
      ledger->openPosition(openFor("0xA", "T2", Outcome::No), 1000.0, 0.40);

  EXPECT_NEAR(p.entry_price, 0.60, 1e-12);
  EXPECT_DOUBLE_EQ(p.entry_amount, 400.0);
  EXPECT_NEAR(*p.stop_loss_price, 0.69, 1e-12);
  EXPECT_NEAR(*p.take_profit_price, 0.42, 1e-12);

  // The NO token drops to 0.30: the reference rises to 0.70, a loss.
  EXPECT_EQ(ledger->applyPrice("T2", 0.30), 1u);
  const Position after = position(p.position_id);
  EXPECT_NEAR(after.current_price, 0.70, 1e-12);
  EXPECT_NEAR(after.unrealized_pnl, -100.0, 1e-9);
  EXPECT_NEAR(after.market_value, 300.0, 1e-9);
  EXPECT_LE(after.max_drawdown, -100.0 + 1e-9);

  const auto signals = ledger->evaluateExits();
  ASSERT_EQ(signals.size(), 1u);
  EXPECT_EQ(*signals[0].trigger, ExitTrigger::StopLoss);
  EXPECT_EQ(signals[0].reason, CloseReason::StopLoss);
  EXPECT_EQ(signals[0].side, Outcome::No);
  EXPECT_NEAR(signals[0].token_price, 0.30, 1e-12);
}

// -----------------------------------------------------------------------------
// 3. A second fill for the same whale and token adds at the weighted entry.
// -----------------------------------------------------------------------------
TEST_F(PositionLedgerTest, SecondFillAddsToPosition) {
  ledger->openPosition(openFor("0xA", "T1"), 1000.0, 0.50);
  const Position p = ledger->openPosition(openFor("0xA", "T1"), 1000.0, 0.60);

  EXPECT_EQ(p.position_id, "pos-1");
  EXPECT_DOUBLE_EQ(p.current_size, 2000.0);
  EXPECT_NEAR(p.entry_price, 0.55, 1e-12);
  EXPECT_NEAR(p.entry_amount, 1100.0, 1e-9);
  EXPECT_NEAR(*p.stop_loss_price, 0.4675, 1e-12);
  EXPECT_EQ(ledger->all().size(), 1u);

  // A different whale on the same token gets its own position.
  const Position other = ledger->openPosition(openFor("0xB", "T1"), 10.0, 0.60);
  EXPECT_EQ(other.position_id, "pos-2");
}

// -----------------------------------------------------------------------------
// 4. Take-profit fires at +30%.
// -----------------------------------------------------------------------------
TEST_F(PositionLedgerTest, TakeProfitFires) {
  const Position p = ledger->openPosition(openFor("0xA", "T1"), 1000.0, 0.55);
  ledger->applyPrice("T1", 0.72);

  const auto signals = ledger->evaluateExits();
  ASSERT_EQ(signals.size(), 1u);
  EXPECT_EQ(*signals[0].trigger, ExitTrigger::TakeProfit);
  EXPECT_EQ(signals[0].reason, CloseReason::TakeProfit);
  EXPECT_DOUBLE_EQ(signals[0].size, 1000.0);
  EXPECT_EQ(position(p.position_id).status, PositionStatus::Closing);

  const auto updates = audit.updatesFor(p.position_id);
  EXPECT_EQ(updates.back().update_type, PositionUpdateType::TakeProfitHit);
}

// -----------------------------------------------------------------------------
// 5. Trailing stop arms at +10% and ratchets 5% under the best price.
// -----------------------------------------------------------------------------
TEST_F(PositionLedgerTest, TrailingStopRatchets) {
  const Position p = ledger->openPosition(openFor("0xA", "T1"), 1000.0, 0.50);

  ledger->applyPrice("T1", 0.54);  // +8%: not armed
  EXPECT_FALSE(position(p.position_id).trailing_reference_price.has_value());
  EXPECT_NEAR(*position(p.position_id).stop_loss_price, 0.425, 1e-12);

  ledger->applyPrice("T1", 0.56);  // +12%: armed
  EXPECT_NEAR(*position(p.position_id).stop_loss_price, 0.532, 1e-12);

  ledger->applyPrice("T1", 0.60);
  EXPECT_NEAR(*position(p.position_id).stop_loss_price, 0.57, 1e-12);
  EXPECT_TRUE(ledger->evaluateExits().empty());

  ledger->applyPrice("T1", 0.58);  // Pullback never lowers the stop
  EXPECT_NEAR(*position(p.position_id).stop_loss_price, 0.57, 1e-12);
  EXPECT_TRUE(ledger->evaluateExits().empty());

  ledger->applyPrice("T1", 0.56);
  const auto signals = ledger->evaluateExits();
  ASSERT_EQ(signals.size(), 1u);
  EXPECT_EQ(*signals[0].trigger, ExitTrigger::StopLoss);
  EXPECT_EQ(audit.updatesFor(p.position_id).back().update_type,
            PositionUpdateType::StopLossHit);
}

// -----------------------------------------------------------------------------
// 6. A CLOSING position is not re-triggered by later ticks.
// -----------------------------------------------------------------------------
TEST_F(PositionLedgerTest, ClosingPositionIsNotRetriggered) {
  ledger->openPosition(openFor("0xA", "T1"), 1000.0, 0.55);
  ledger->applyPrice("T1", 0.40);
  ASSERT_EQ(ledger->evaluateExits().size(), 1u);

  ledger->applyPrice("T1", 0.35);
  EXPECT_TRUE(ledger->evaluateExits().empty());
  EXPECT_EQ(ledger->requiringAction().size(), 1u);
}

// -----------------------------------------------------------------------------
// 7. Within two hours of resolution the position exits PRE_RESOLUTION.
// -----------------------------------------------------------------------------
TEST_F(PositionLedgerTest, TimeBasedExitBeforeResolution) {
  PositionOpen open = openFor("0xA", "T1");
  open.resolution_time_ms = kStart + 3 * whalecopy::kMsPerHour;
  ledger->openPosition(open, 100.0, 0.55);

  EXPECT_TRUE(ledger->evaluateExits().empty());
  clock.advance_by(whalecopy::kMsPerHour);

  const auto signals = ledger->evaluateExits();
  ASSERT_EQ(signals.size(), 1u);
  EXPECT_EQ(*signals[0].trigger, ExitTrigger::TimeBased);
  EXPECT_EQ(signals[0].reason, CloseReason::PreResolution);
}

// -----------------------------------------------------------------------------
// 8. A whale SELL flags its copies; the next evaluation closes them.
// -----------------------------------------------------------------------------
TEST_F(PositionLedgerTest, WhaleExitMirrorsSell) {
  ledger->openPosition(openFor("0xA", "T1"), 100.0, 0.55);
  ledger->openPosition(openFor("0xB", "T1"), 100.0, 0.55);

  const auto marked = ledger->markWhaleExit("0xA", "T1");
  ASSERT_EQ(marked.size(), 1u);
  EXPECT_TRUE(ledger->markWhaleExit("0xC", "T1").empty());

  const auto signals = ledger->evaluateExits();
  ASSERT_EQ(signals.size(), 1u);
  EXPECT_EQ(signals[0].whale_address, "0xA");
  EXPECT_EQ(signals[0].reason, CloseReason::WhaleExit);
}

// -----------------------------------------------------------------------------
// 9. Exit priority is configurable: WHALE_EXIT ahead of STOP_LOSS.
// -----------------------------------------------------------------------------
TEST_F(PositionLedgerTest, ExitPriorityIsConfigurable) {
  whalecopy::LedgerConfig config;
  config.exit_priority = {ExitTrigger::WhaleExit, ExitTrigger::StopLoss};
  build(config);

  ledger->openPosition(openFor("0xA", "T1"), 100.0, 0.55);
  ledger->applyPrice("T1", 0.40);  // Stop-loss also met
  ledger->markWhaleExit("0xA", "T1");

  const auto signals = ledger->evaluateExits();
  ASSERT_EQ(signals.size(), 1u);
  EXPECT_EQ(*signals[0].trigger, ExitTrigger::WhaleExit);
}

// -----------------------------------------------------------------------------
// 10. Partial then full close: realized P&L per fill and in total.
// -----------------------------------------------------------------------------
TEST_F(PositionLedgerTest, PartialThenFullClose) {
  const Position p = ledger->openPosition(openFor("0xA", "T1"), 1000.0, 0.50);
  ASSERT_TRUE(ledger->beginClose(p.position_id, CloseReason::Manual, "test"));

  const CloseResult partial =
      ledger->applyCloseFill(p.position_id, 400.0, 0.60, CloseReason::Manual);
  EXPECT_FALSE(partial.fully_closed);
  EXPECT_DOUBLE_EQ(partial.closed_size, 400.0);
  EXPECT_NEAR(partial.realized_delta, 40.0, 1e-9);
  EXPECT_NEAR(partial.released_cost, 200.0, 1e-9);
  EXPECT_EQ(partial.position.status, PositionStatus::Open);
  EXPECT_DOUBLE_EQ(partial.position.current_size, 600.0);

  ASSERT_TRUE(ledger->beginClose(p.position_id, CloseReason::Manual, "test"));
  const CloseResult full =
      ledger->applyCloseFill(p.position_id, 600.0, 0.55, CloseReason::Manual);
  EXPECT_TRUE(full.fully_closed);
  EXPECT_NEAR(full.realized_delta, 30.0, 1e-9);
  EXPECT_NEAR(full.position.realized_pnl, 70.0, 1e-9);
  EXPECT_EQ(full.position.status, PositionStatus::Closed);
  EXPECT_EQ(*full.position.close_reason, CloseReason::Manual);
  EXPECT_DOUBLE_EQ(full.position.unrealized_pnl, 0.0);
  EXPECT_NEAR(full.position.pnlPercentage(), 14.0, 1e-9);
  EXPECT_EQ(audit.updatesFor(p.position_id).back().update_type,
            PositionUpdateType::FullClose);

  EXPECT_THROW(ledger->applyCloseFill(p.position_id, 1.0, 0.5, CloseReason::Manual),
               whalecopy::DataIntegrityError);
}

// -----------------------------------------------------------------------------
// 11. Invalid fills and unknown ids are rejected.
// -----------------------------------------------------------------------------
TEST_F(PositionLedgerTest, InvalidInputThrows) {
  EXPECT_THROW(ledger->openPosition(openFor("0xA", "T1"), 0.0, 0.5),
               std::invalid_argument);
  EXPECT_THROW(ledger->openPosition(openFor("0xA", "T1"), 10.0, 1.0),
               std::invalid_argument);

  const Position p = ledger->openPosition(openFor("0xA", "T1"), 10.0, 0.5);
  EXPECT_THROW(ledger->applyCloseFill(p.position_id, -1.0, 0.5, CloseReason::Manual),
               std::invalid_argument);
  EXPECT_THROW(ledger->applyCloseFill(p.position_id, 1.0, 1.5, CloseReason::Manual),
               std::invalid_argument);
  EXPECT_THROW(ledger->applyCloseFill("pos-99", 1.0, 0.5, CloseReason::Manual),
               whalecopy::UnknownEntityError);
  EXPECT_EQ(ledger->applyPrice("T1", 1.5), 0u);
}

// -----------------------------------------------------------------------------
// 12. beginClose / abortClose round trip.
// -----------------------------------------------------------------------------
TEST_F(PositionLedgerTest, AbortCloseReopens) {
  const Position p = ledger->openPosition(openFor("0xA", "T1"), 10.0, 0.5);

  const auto signal = ledger->beginClose(p.position_id, CloseReason::Manual,
                                         "Whale quarantined");
  ASSERT_TRUE(signal.has_value());
  EXPECT_FALSE(signal->trigger.has_value());
  EXPECT_EQ(signal->reason, CloseReason::Manual);
  EXPECT_FALSE(ledger->beginClose(p.position_id, CloseReason::Manual, "again"));

  ledger->abortClose(p.position_id, "no fill");
  EXPECT_EQ(position(p.position_id).status, PositionStatus::Open);
}

// -----------------------------------------------------------------------------
// 13. Closed positions archive after 30 days; counts cover every status.
// -----------------------------------------------------------------------------
TEST_F(PositionLedgerTest, ArchiveAndCounts) {
  const Position a = ledger->openPosition(openFor("0xA", "T1"), 10.0, 0.5);
  ledger->openPosition(openFor("0xA", "T2"), 20.0, 0.5);
  ledger->beginClose(a.position_id, CloseReason::Manual, "test");
  ledger->applyCloseFill(a.position_id, 10.0, 0.5, CloseReason::Manual);

  EXPECT_EQ(ledger->archiveClosed(), 0u);
  clock.advance_by(30 * whalecopy::kMsPerDay);
  EXPECT_EQ(ledger->archiveClosed(), 1u);

  const auto counts = ledger->countsByStatus();
  EXPECT_EQ(counts.at(PositionStatus::Open), 1u);
  EXPECT_EQ(counts.at(PositionStatus::Closing), 0u);
  EXPECT_EQ(counts.at(PositionStatus::Closed), 0u);
  EXPECT_EQ(counts.at(PositionStatus::Archived), 1u);

  EXPECT_EQ(ledger->live().size(), 1u);
  EXPECT_EQ(ledger->forWhale("0xA").size(), 2u);
  EXPECT_NEAR(ledger->totalExposure(), 10.0, 1e-9);
}

// -----------------------------------------------------------------------------
// 14. Recovery rebuilds from audit snapshots and reopens CLOSING positions.
// Why: The closing order of a CLOSING position died with the process; left
//      CLOSING it would never be exited again.
// -----------------------------------------------------------------------------
TEST_F(PositionLedgerTest, RecoverFromAuditTrail) {
  ledger->openPosition(openFor("0xA", "T1"), 10.0, 0.5);
  const Position b = ledger->openPosition(openFor("0xA", "T2"), 20.0, 0.5);
  ledger->applyPrice("T2", 0.6);
  ledger->beginClose(b.position_id, CloseReason::Manual, "test");

  whalecopy::PositionLedger restarted(clock, audit, whalecopy::LedgerConfig{});
  EXPECT_EQ(restarted.recover(audit.recoverPositions()), 2u);

  const auto recovered = restarted.get(b.position_id);
  ASSERT_TRUE(recovered.has_value());
  EXPECT_EQ(recovered->status, PositionStatus::Open);
  EXPECT_NEAR(recovered->current_price, 0.6, 1e-12);
  EXPECT_NEAR(recovered->unrealized_pnl, 2.0, 1e-9);

  const Position fresh = restarted.openPosition(openFor("0xB", "T3"), 5.0, 0.5);
  EXPECT_EQ(fresh.position_id, "pos-3");
}
