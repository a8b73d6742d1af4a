// =============================================================================
// audit_trail_test.cpp
// =============================================================================
// Unit tests for whalecopy::AuditTrail and whalecopy::OrderStore.
//
// Validates:
//   - Ids are assigned in append order, per record kind
//   - Per-entity lookups and lastTransition()
//   - recoverOrders() / recoverPositions() return the latest snapshot
//   - The JSON-lines journal replays across instances, skipping torn lines,
//     and ids continue after the replay
//   - OrderStore enforces the idempotency-key and primary-key constraints
// =============================================================================

#include "whalecopy/audit/audit_trail.hpp"
#include "whalecopy/domain/order.hpp"
#include "whalecopy/domain/position.hpp"
#include "whalecopy/errors.hpp"
#include "whalecopy/persistence/json_codec.hpp"
#include "whalecopy/persistence/order_store.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <optional>
#include <string>

using whalecopy::AuditTrail;
using whalecopy::domain::Order;
using whalecopy::domain::OrderState;
using whalecopy::domain::OrderTransition;
using whalecopy::domain::Position;
using whalecopy::domain::PositionUpdate;

namespace {

Order makeOrder(const std::string& id, const std::string& key,
                OrderState state, double filled = 0.0) {
  Order o;
  o.order_id = id;
  o.idempotency_key = key;
  o.token_id = "T1";
  o.market_id = "M1";
  o.size = 100.0;
  o.price = 0.55;
  o.state = state;
  o.setFilled(filled);
  o.created_at_ms = 1000;
  return o;
}

OrderTransition transitionOf(const Order& order,
                             std::optional<OrderState> from) {
  OrderTransition t;
  t.order_id = order.order_id;
  t.from_state = from;
  t.to_state = order.state;
  t.timestamp_ms = 2000;
  t.reason = "test";
  t.metadata = nlohmann::json{{"order", order}};
  return t;
}

PositionUpdate updateOf(const Position& position) {
  PositionUpdate u;
  u.position_id = position.position_id;
  u.new_size = position.current_size;
  u.new_price = position.current_price;
  u.timestamp_ms = 3000;
  u.metadata = nlohmann::json{{"position", position}};
  return u;
}

}  // namespace

// -----------------------------------------------------------------------------
// 1. Transition ids increase in append order; lookups are per order.
// -----------------------------------------------------------------------------
TEST(AuditTrailTest, AssignsIdsAndIndexesByOrder) {
  AuditTrail audit;
  const Order a = makeOrder("ord-1", "k1", OrderState::Pending);
  const Order b = makeOrder("ord-2", "k2", OrderState::Pending);

  EXPECT_EQ(audit.appendTransition(transitionOf(a, std::nullopt)).id, 1u);
  EXPECT_EQ(audit.appendTransition(transitionOf(b, std::nullopt)).id, 2u);
  Order a_submitted = a;
  a_submitted.state = OrderState::Submitted;
  EXPECT_EQ(audit.appendTransition(transitionOf(a_submitted, OrderState::Pending)).id,
            3u);

  const auto for_a = audit.transitionsFor("ord-1");
  ASSERT_EQ(for_a.size(), 2u);
  EXPECT_FALSE(for_a[0].from_state.has_value());
  EXPECT_EQ(*for_a[1].from_state, OrderState::Pending);
  EXPECT_EQ(for_a[1].to_state, OrderState::Submitted);

  const auto last = audit.lastTransition("ord-1");
  ASSERT_TRUE(last.has_value());
  EXPECT_EQ(last->id, 3u);
  EXPECT_FALSE(audit.lastTransition("ord-9").has_value());
  EXPECT_TRUE(audit.transitionsFor("ord-9").empty());
  EXPECT_EQ(audit.transitionCount(), 3u);
  EXPECT_FALSE(audit.journaled());
}

// -----------------------------------------------------------------------------
// 2. Recovery returns the latest snapshot of each order and position.
// -----------------------------------------------------------------------------
TEST(AuditTrailTest, RecoversLatestSnapshots) {
  AuditTrail audit;
  const Order pending = makeOrder("ord-1", "k1", OrderState::Pending);
  const Order filled = makeOrder("ord-1", "k1", OrderState::Filled, 100.0);
  audit.appendTransition(transitionOf(pending, std::nullopt));
  audit.appendTransition(transitionOf(filled, OrderState::Submitted));

  Position p;
  p.position_id = "pos-1";
  p.token_id = "T1";
  p.entry_price = 0.5;
  p.current_price = 0.5;
  p.current_size = 10.0;
  audit.appendUpdate(updateOf(p));
  p.current_price = 0.6;
  p.revalue();
  audit.appendUpdate(updateOf(p));

  const auto orders = audit.recoverOrders();
  ASSERT_EQ(orders.size(), 1u);
  EXPECT_EQ(orders[0].state, OrderState::Filled);
  EXPECT_DOUBLE_EQ(orders[0].filled_size, 100.0);
  EXPECT_DOUBLE_EQ(orders[0].remaining_size, 0.0);

  const auto positions = audit.recoverPositions();
  ASSERT_EQ(positions.size(), 1u);
  EXPECT_DOUBLE_EQ(positions[0].current_price, 0.6);
  EXPECT_NEAR(positions[0].unrealized_pnl, 1.0, 1e-9);
}

// =============================================================================
// Journal fixture: a fresh file under the temp directory per test.
// =============================================================================
class AuditJournalTest : public ::testing::Test {
 protected:
  std::filesystem::path path;

  void SetUp() override {
    const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
    path = std::filesystem::temp_directory_path() /
           (std::string("whalecopy_audit_") + info->name() + ".jsonl");
    std::filesystem::remove(path);
  }

  void TearDown() override { std::filesystem::remove(path); }
};

// -----------------------------------------------------------------------------
// 3. A second instance on the same journal sees every record, and new ids
//    continue where the first instance stopped.
// Why: Order and position recovery after a restart reads only the journal.
// -----------------------------------------------------------------------------
TEST_F(AuditJournalTest, ReplaysAcrossInstances) {
  {
    AuditTrail audit(path.string());
    EXPECT_TRUE(audit.journaled());
    audit.appendTransition(
        transitionOf(makeOrder("ord-1", "k1", OrderState::Pending), std::nullopt));
    audit.appendTransition(transitionOf(
        makeOrder("ord-1", "k1", OrderState::Submitted), OrderState::Pending));

    Position p;
    p.position_id = "pos-1";
    p.current_size = 5.0;
    audit.appendUpdate(updateOf(p));
  }

  AuditTrail replayed(path.string());
  EXPECT_EQ(replayed.transitionCount(), 2u);
  EXPECT_EQ(replayed.updateCount(), 1u);

  const auto orders = replayed.recoverOrders();
  ASSERT_EQ(orders.size(), 1u);
  EXPECT_EQ(orders[0].state, OrderState::Submitted);

  const auto next = replayed.appendTransition(transitionOf(
      makeOrder("ord-1", "k1", OrderState::Filled, 100.0), OrderState::Submitted));
  EXPECT_EQ(next.id, 3u);
  EXPECT_EQ(replayed.appendUpdate(updateOf(Position{})).id, 2u);
}

// -----------------------------------------------------------------------------
// 4. A torn or unknown line is skipped; the rest still replays.
// -----------------------------------------------------------------------------
TEST_F(AuditJournalTest, SkipsMalformedLines) {
  {
    AuditTrail audit(path.string());
    audit.appendTransition(
        transitionOf(makeOrder("ord-1", "k1", OrderState::Pending), std::nullopt));
  }
  {
    std::ofstream out(path, std::ios::app);
    out << "{\"kind\": \"something_else\", \"record\": {}}\n";
    out << "{\"kind\": \"order_transition\", \"rec";
  }

  AuditTrail replayed(path.string());
  EXPECT_EQ(replayed.transitionCount(), 1u);
  EXPECT_EQ(replayed.recoverOrders().size(), 1u);
}

// -----------------------------------------------------------------------------
// 5. OrderStore: UNIQUE idempotency key, primary key, unknown-id updates.
// -----------------------------------------------------------------------------
TEST(OrderStoreTest, EnforcesConstraints) {
  whalecopy::OrderStore store;
  store.insert(makeOrder("ord-1", "copy:0xA:t1", OrderState::Pending));

  EXPECT_THROW(store.insert(makeOrder("ord-2", "copy:0xA:t1", OrderState::Pending)),
               whalecopy::DuplicateIdempotencyKeyError);
  EXPECT_THROW(store.insert(makeOrder("ord-1", "other", OrderState::Pending)),
               whalecopy::DataIntegrityError);
  EXPECT_THROW(store.update(makeOrder("ord-9", "k9", OrderState::Pending)),
               whalecopy::UnknownEntityError);
  EXPECT_EQ(store.size(), 1u);

  const auto found = store.findByKey("copy:0xA:t1");
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(found->order_id, "ord-1");
}

TEST(OrderStoreTest, QueriesByStateParentAndExchangeId) {
  whalecopy::OrderStore store;
  Order parent = makeOrder("ord-1", "k1", OrderState::Submitted);
  parent.exchange_order_id = "ex-1";
  store.insert(parent);

  Order child = makeOrder("ord-2", "k1#1", OrderState::Pending);
  child.parent_order_id = "ord-1";
  child.child_depth = 1;
  store.insert(child);

  EXPECT_EQ(store.byState(OrderState::Pending).size(), 1u);
  ASSERT_EQ(store.childrenOf("ord-1").size(), 1u);
  EXPECT_EQ(store.childrenOf("ord-1")[0].order_id, "ord-2");
  ASSERT_TRUE(store.findByExchangeId("ex-1").has_value());

  parent.state = OrderState::PartiallyFilled;
  parent.setFilled(40.0);
  store.update(parent);
  EXPECT_DOUBLE_EQ(store.get("ord-1")->remaining_size, 60.0);
}

TEST(OrderStoreTest, ReplaceAllRejectsDuplicateKeys) {
  whalecopy::OrderStore store;
  store.insert(makeOrder("ord-1", "k1", OrderState::Pending));

  EXPECT_THROW(store.replaceAll({makeOrder("ord-5", "dup", OrderState::Pending),
                                 makeOrder("ord-6", "dup", OrderState::Pending)}),
               whalecopy::DuplicateIdempotencyKeyError);
  EXPECT_TRUE(store.get("ord-1").has_value());

  store.replaceAll({makeOrder("ord-5", "k5", OrderState::Filled, 100.0)});
  EXPECT_EQ(store.size(), 1u);
  EXPECT_FALSE(store.get("ord-1").has_value());
}
