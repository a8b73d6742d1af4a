// =============================================================================
// order_executor_test.cpp
// =============================================================================
// Unit tests for whalecopy::OrderExecutor, RetryPolicy and the simulated
// exchange it is driven against.
//
// Validates:
//   - Happy path PENDING -> SUBMITTED -> FILLED -> CONFIRMED, fully audited
//   - A known idempotency key never reaches the exchange twice, even when
//     the same key arrives on several threads at once
//   - Transient submit errors retry with 1 s / 2 s backoff, exhaustion ends
//     in DEAD_LETTER, terminal errors end in FAILED without a retry
//   - A lost acknowledgement is retried safely (exchange-side dedupe)
//   - Deadline handling: accept >= 80%, cancel + child below, depth cap
//   - Push fill reports are deduplicated by (order, sequence), and only
//     while the order is working
//   - A fill landing during the cancel is booked before the order settles
//   - Update events are published outside the order lock
//   - Lock and fill-sequence bookkeeping is released once orders settle
//   - Stale sweep, recovery and consistency checks after a crash
//
// All time is simulated: every backoff and poll interval advances the
// SimulationTimeProvider instead of sleeping.
// =============================================================================

#include "whalecopy/audit/audit_trail.hpp"
#include "whalecopy/config/engine_config.hpp"
#include "whalecopy/domain/order.hpp"
#include "whalecopy/events/event.hpp"
#include "whalecopy/execution/exchange_error.hpp"
#include "whalecopy/execution/i_exchange_client.hpp"
#include "whalecopy/execution/order_executor.hpp"
#include "whalecopy/execution/retry_policy.hpp"
#include "whalecopy/execution/simulated_exchange_client.hpp"
#include "whalecopy/persistence/json_codec.hpp"
#include "whalecopy/persistence/order_store.hpp"
#include "whalecopy/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using whalecopy::ExchangeError;
using whalecopy::ExchangeErrorCode;
using whalecopy::ExecutionReport;
using whalecopy::OrderRequest;
using whalecopy::domain::Order;
using whalecopy::domain::OrderState;

namespace {

constexpr std::int64_t kStart = 1'700'000'000'000;

OrderRequest buyRequest(const std::string& key, double size = 100.0) {
  OrderRequest r;
  r.idempotency_key = key;
  r.token_id = "T1";
  r.market_id = "M1";
  r.side = whalecopy::domain::Side::Buy;
  r.size = size;
  r.price = 0.55;
  r.whale_address = "0xA";
  return r;
}

std::vector<OrderState> statesOf(
    const std::vector<whalecopy::domain::OrderTransition>& transitions) {
  std::vector<OrderState> states;
  for (const auto& t : transitions) {
    states.push_back(t.to_state);
  }
  return states;
}

// -----------------------------------------------------------------------------
// Exchange decorator that runs a hook before the first fill poll, the way a
// push fill can arrive on the feed thread while execution_loop is polling,
// and another before each cancel, for fills racing the cancel.
// -----------------------------------------------------------------------------
class HookedExchange final : public whalecopy::IExchangeClient {
 public:
  explicit HookedExchange(whalecopy::SimulatedExchangeClient& inner) : inner_(inner) {}

  whalecopy::SubmitAck submitOrder(const whalecopy::SubmitRequest& request) override {
    return inner_.submitOrder(request);
  }
  void cancelOrder(const std::string& exchange_order_id) override {
    if (before_cancel) {
      before_cancel(exchange_order_id);
    }
    inner_.cancelOrder(exchange_order_id);
  }
  whalecopy::domain::OrderBook fetchOrderBook(const std::string& token_id) override {
    return inner_.fetchOrderBook(token_id);
  }
  whalecopy::FillStatus pollFill(const std::string& exchange_order_id) override {
    if (before_first_poll) {
      auto hook = std::move(before_first_poll);
      before_first_poll = nullptr;
      hook();
    }
    return inner_.pollFill(exchange_order_id);
  }

  std::function<void()> before_first_poll;
  std::function<void(const std::string&)> before_cancel;

 private:
  whalecopy::SimulatedExchangeClient& inner_;
};

}  // namespace

// =============================================================================
// Test fixture: simulated clock and exchange, in-memory audit and store.
// =============================================================================
class OrderExecutorTest : public ::testing::Test {
 protected:
  whalecopy::SimulationTimeProvider clock{kStart};
  whalecopy::SimulatedExchangeClient exchange{clock};
  whalecopy::OrderStore store;
  whalecopy::AuditTrail audit;
  std::vector<whalecopy::OrderUpdateEvent> updates;
  std::unique_ptr<whalecopy::OrderExecutor> executor;

  void SetUp() override { build(exchange); }

  void build(whalecopy::IExchangeClient& client) {
    executor = std::make_unique<whalecopy::OrderExecutor>(
        clock, client, store, audit, whalecopy::ExecutionConfig{},
        [this](whalecopy::Event e) {
          if (auto* u = std::get_if<whalecopy::OrderUpdateEvent>(&e)) {
            updates.push_back(*u);
          }
        });
  }

  void seed(const Order& order) {
    whalecopy::domain::OrderTransition t;
    t.order_id = order.order_id;
    t.to_state = order.state;
    t.timestamp_ms = order.created_at_ms;
    t.reason = "seeded";
    t.metadata = nlohmann::json{{"order", order}};
    audit.appendTransition(t);
  }
};

// -----------------------------------------------------------------------------
// 1. A fully filled order is confirmed; every step is audited and published.
// -----------------------------------------------------------------------------
TEST_F(OrderExecutorTest, FullFillIsConfirmed) {
  const ExecutionReport report = executor->execute(buyRequest("copy:0xA:t1"));

  EXPECT_TRUE(report.created);
  EXPECT_EQ(report.order.order_id, "ord-1");
  EXPECT_EQ(report.order.state, OrderState::Confirmed);
  EXPECT_DOUBLE_EQ(report.total_filled, 100.0);
  EXPECT_DOUBLE_EQ(report.avg_fill_price, 0.55);
  EXPECT_TRUE(report.children.empty());
  EXPECT_TRUE(report.order.confirmed_at_ms.has_value());

  const std::vector<OrderState> expected = {OrderState::Pending, OrderState::Submitted,
                                            OrderState::Filled, OrderState::Confirmed};
  EXPECT_EQ(statesOf(executor->transitionsFor("ord-1")), expected);
  ASSERT_EQ(updates.size(), 4u);
  EXPECT_FALSE(updates.front().previous_state.has_value());
  EXPECT_EQ(*updates.back().previous_state, OrderState::Filled);
  EXPECT_TRUE(executor->verifyConsistency().empty());
}

// -----------------------------------------------------------------------------
// 2. Re-executing a known key returns the existing order without submitting.
// Why: A replayed whale trade must never double the position.
// -----------------------------------------------------------------------------
TEST_F(OrderExecutorTest, KnownKeyIsNotResubmitted) {
  executor->execute(buyRequest("copy:0xA:t1"));
  const ExecutionReport again = executor->execute(buyRequest("copy:0xA:t1"));

  EXPECT_FALSE(again.created);
  EXPECT_EQ(again.order.order_id, "ord-1");
  EXPECT_DOUBLE_EQ(again.total_filled, 100.0);
  EXPECT_EQ(exchange.submitAttempts(), 1);
  EXPECT_EQ(store.size(), 1u);
}

// Why: Two feed deliveries of one whale trade can reach the executor from
//      different threads. The key lock must let exactly one of them create.
TEST_F(OrderExecutorTest, ConcurrentSameKeyCreatesOneOrder) {
  whalecopy::OrderExecutor racing(clock, exchange, store, audit,
                                  whalecopy::ExecutionConfig{},
                                  [](whalecopy::Event) {});

  std::atomic<int> created{0};
  std::vector<std::thread> callers;
  for (int i = 0; i < 4; ++i) {
    callers.emplace_back([&] {
      if (racing.execute(buyRequest("copy:0xA:race")).created) {
        created.fetch_add(1);
      }
    });
  }
  for (auto& t : callers) t.join();

  EXPECT_EQ(created.load(), 1);
  EXPECT_EQ(store.size(), 1u);
  EXPECT_EQ(exchange.submitAttempts(), 1);
}

TEST_F(OrderExecutorTest, InvalidRequestThrows) {
  EXPECT_THROW(executor->execute(buyRequest("")), std::invalid_argument);
  EXPECT_THROW(executor->execute(buyRequest("k", 0.0)), std::invalid_argument);
  EXPECT_EQ(store.size(), 0u);
}

// -----------------------------------------------------------------------------
// 3. Two transient failures: FAILED -> PENDING twice with 1 s and 2 s waits.
// -----------------------------------------------------------------------------
TEST_F(OrderExecutorTest, TransientSubmitErrorsRetryWithBackoff) {
  exchange.failNextSubmits(ExchangeErrorCode::Timeout, 2);

  const ExecutionReport report = executor->execute(buyRequest("copy:0xA:t1"));

  EXPECT_EQ(report.order.state, OrderState::Confirmed);
  EXPECT_EQ(report.order.retry_count, 2);
  EXPECT_EQ(clock.now_ms(), kStart + 1000 + 2000);

  const std::vector<OrderState> expected = {
      OrderState::Pending, OrderState::Failed,    OrderState::Pending,
      OrderState::Failed,  OrderState::Pending,   OrderState::Submitted,
      OrderState::Filled,  OrderState::Confirmed};
  EXPECT_EQ(statesOf(executor->transitionsFor(report.order.order_id)), expected);
}

// -----------------------------------------------------------------------------
// 4. Retries exhausted: the fourth failure moves the order to DEAD_LETTER.
// -----------------------------------------------------------------------------
TEST_F(OrderExecutorTest, ExhaustedRetriesDeadLetter) {
  exchange.failNextSubmits(ExchangeErrorCode::RateLimited, 4);

  const ExecutionReport report = executor->execute(buyRequest("copy:0xA:t1"));

  EXPECT_EQ(report.order.state, OrderState::DeadLetter);
  EXPECT_FALSE(report.filled());
  EXPECT_EQ(exchange.submitAttempts(), 4);
  EXPECT_EQ(clock.now_ms(), kStart + 1000 + 2000 + 4000);
  ASSERT_EQ(executor->deadLetters().size(), 1u);
  EXPECT_FALSE(report.order.error_message.empty());
}

// -----------------------------------------------------------------------------
// 5. A terminal error fails the order at once; no retry is attempted.
// -----------------------------------------------------------------------------
TEST_F(OrderExecutorTest, TerminalErrorFailsWithoutRetry) {
  exchange.failNextSubmits(ExchangeErrorCode::InsufficientBalance);
  const ExecutionReport report = executor->execute(buyRequest("copy:0xA:t1"));
  EXPECT_EQ(report.order.state, OrderState::Failed);
  EXPECT_EQ(exchange.submitAttempts(), 1);
  EXPECT_EQ(clock.now_ms(), kStart);

  OrderRequest bad_price = buyRequest("copy:0xA:t2");
  bad_price.price = 1.0;
  EXPECT_EQ(executor->execute(bad_price).order.state, OrderState::Failed);
  EXPECT_TRUE(executor->deadLetters().empty());
}

// -----------------------------------------------------------------------------
// 6. The exchange placed the order but the ack was lost: the retry carries
//    the same client id and is answered as a duplicate.
// -----------------------------------------------------------------------------
TEST_F(OrderExecutorTest, LostAckRetryDoesNotDoublePlace) {
  exchange.loseNextAcks(1);

  const ExecutionReport report = executor->execute(buyRequest("copy:0xA:t1"));

  EXPECT_EQ(report.order.state, OrderState::Confirmed);
  EXPECT_EQ(exchange.submissionCount(), 1);
  EXPECT_EQ(exchange.submitAttempts(), 2);
  EXPECT_EQ(report.order.exchange_order_id, *exchange.exchangeIdFor("copy:0xA:t1"));
}

// -----------------------------------------------------------------------------
// 7. 90% filled at the deadline: remainder cancelled, order CONFIRMED.
// -----------------------------------------------------------------------------
TEST_F(OrderExecutorTest, PartialFillAboveThresholdIsAccepted) {
  exchange.scriptFillRatios({0.9});

  const ExecutionReport report = executor->execute(buyRequest("copy:0xA:t1"));

  EXPECT_EQ(report.order.state, OrderState::Confirmed);
  EXPECT_DOUBLE_EQ(report.total_filled, 90.0);
  EXPECT_TRUE(report.children.empty());
  EXPECT_EQ(exchange.cancelCount(), 1);
  EXPECT_EQ(clock.now_ms(), kStart + 30000);
}

// -----------------------------------------------------------------------------
// 8. 50% filled: CANCELLED and a child order for the remaining half.
// -----------------------------------------------------------------------------
TEST_F(OrderExecutorTest, PartialFillBelowThresholdSpawnsChild) {
  exchange.scriptFillRatios({0.5, 1.0});

  const ExecutionReport report = executor->execute(buyRequest("copy:0xA:t1"));

  EXPECT_EQ(report.order.state, OrderState::Cancelled);
  ASSERT_EQ(report.children.size(), 1u);
  const Order& child = report.children[0];
  EXPECT_EQ(child.idempotency_key, "copy:0xA:t1#child-1");
  EXPECT_EQ(child.parent_order_id, report.order.order_id);
  EXPECT_EQ(child.child_depth, 1);
  EXPECT_DOUBLE_EQ(child.size, 50.0);
  EXPECT_EQ(child.state, OrderState::Confirmed);
  EXPECT_DOUBLE_EQ(report.total_filled, 100.0);
  EXPECT_DOUBLE_EQ(report.avg_fill_price, 0.55);
}

TEST_F(OrderExecutorTest, ChildLineageStopsAtMaxDepth) {
  exchange.scriptFillRatios({0.5, 0.5, 0.5});

  const ExecutionReport report = executor->execute(buyRequest("copy:0xA:t1"));

  ASSERT_EQ(report.children.size(), 2u);
  EXPECT_EQ(report.children[1].child_depth, 2);
  EXPECT_EQ(report.children[1].state, OrderState::Cancelled);
  EXPECT_DOUBLE_EQ(report.total_filled, 50.0 + 25.0 + 12.5);
  EXPECT_EQ(store.size(), 3u);
}

// -----------------------------------------------------------------------------
// 9. Nothing filled before the deadline: CANCELLED, no child.
// -----------------------------------------------------------------------------
TEST_F(OrderExecutorTest, UnfilledOrderIsCancelled) {
  exchange.setDefaultFillRatio(0.0);

  const ExecutionReport report = executor->execute(buyRequest("copy:0xA:t1"));

  EXPECT_EQ(report.order.state, OrderState::Cancelled);
  EXPECT_FALSE(report.filled());
  EXPECT_TRUE(report.children.empty());
  EXPECT_EQ(executor->transitionsFor(report.order.order_id).back().reason,
            "Not filled before deadline");
}

// -----------------------------------------------------------------------------
// 10. Push fills: applied once, duplicates and stale cumulative sizes are
//     ignored, and the poll that reports the same sequence adds nothing.
// -----------------------------------------------------------------------------
TEST_F(OrderExecutorTest, PushFillsAreDeduplicated) {
  HookedExchange hooked(exchange);
  build(hooked);
  exchange.scriptFillRatios({0.4, 1.0});

  bool first = false;
  bool duplicate = true;
  bool stale = true;
  hooked.before_first_poll = [&] {
    const std::string exchange_id = *exchange.exchangeIdFor("copy:0xA:t1");
    const whalecopy::FillReport push = exchange.advanceFill(exchange_id, 60.0, 0.55);
    first = executor->onFillReport(push);
    duplicate = executor->onFillReport(push);

    whalecopy::FillReport older = push;
    older.fill_sequence = 7;
    older.filled_size = 50.0;
    stale = executor->onFillReport(older);
  };

  const ExecutionReport report = executor->execute(buyRequest("copy:0xA:t1"));

  EXPECT_TRUE(first);
  EXPECT_FALSE(duplicate);
  EXPECT_FALSE(stale);
  EXPECT_DOUBLE_EQ(report.order.filled_size, 60.0);
  EXPECT_EQ(report.order.state, OrderState::Cancelled);
  ASSERT_EQ(report.children.size(), 1u);
  EXPECT_DOUBLE_EQ(report.children[0].size, 40.0);
  EXPECT_DOUBLE_EQ(report.total_filled, 100.0);
}

TEST_F(OrderExecutorTest, FillForUnknownOrderIsIgnored) {
  whalecopy::FillReport report;
  report.exchange_order_id = "ex-404";
  report.filled_size = 10.0;
  report.fill_sequence = 1;
  EXPECT_FALSE(executor->onFillReport(report));
  EXPECT_FALSE(executor->cancel("ord-404", "test"));
}

// -----------------------------------------------------------------------------
// 10a. The rest of the order fills while the cancel is in flight.
// Why: Settling on the last poll would book 50, cancel the parent and send a
//      child for 50 more, leaving 150 bought on the exchange for a request
//      of 100.
// -----------------------------------------------------------------------------
TEST_F(OrderExecutorTest, FillRacingTheCancelIsBookedBeforeSettling) {
  HookedExchange hooked(exchange);
  build(hooked);
  exchange.scriptFillRatios({0.5, 1.0});
  hooked.before_cancel = [this](const std::string& exchange_id) {
    exchange.advanceFill(exchange_id, 100.0, 0.55);
  };

  const ExecutionReport report = executor->execute(buyRequest("copy:0xA:t1"));

  EXPECT_EQ(report.order.state, OrderState::Confirmed);
  EXPECT_DOUBLE_EQ(report.order.filled_size, 100.0);
  EXPECT_TRUE(report.children.empty());
  EXPECT_DOUBLE_EQ(report.total_filled, 100.0);
  EXPECT_EQ(exchange.submissionCount(), 1);

  const auto on_exchange = exchange.orderStatus(report.order.exchange_order_id);
  ASSERT_TRUE(on_exchange.has_value());
  EXPECT_DOUBLE_EQ(on_exchange->filled_size, report.total_filled);
}

TEST_F(OrderExecutorTest, SweepBooksFillRacingTheCancel) {
  HookedExchange hooked(exchange);
  build(hooked);
  exchange.scriptFillRatios({0.3});
  whalecopy::SubmitRequest placed;
  placed.client_order_id = "copy:0xA:t1";
  placed.token_id = "T1";
  placed.size = 100.0;
  placed.price = 0.55;
  const std::string exchange_id = exchange.submitOrder(placed).exchange_order_id;

  Order working;
  working.order_id = "ord-1";
  working.idempotency_key = "copy:0xA:t1";
  working.exchange_order_id = exchange_id;
  working.token_id = "T1";
  working.size = 100.0;
  working.state = OrderState::PartiallyFilled;
  working.setFilled(30.0);
  working.avg_fill_price = 0.55;
  working.created_at_ms = kStart;
  working.submitted_at_ms = kStart;
  seed(working);
  ASSERT_EQ(executor->recover(), 1u);

  hooked.before_cancel = [this](const std::string& id) {
    exchange.advanceFill(id, 85.0, 0.55);
  };
  clock.advance_by(31000);
  ASSERT_EQ(executor->sweepStale().size(), 1u);

  const Order swept = *executor->get("ord-1");
  EXPECT_EQ(swept.state, OrderState::Confirmed);
  EXPECT_DOUBLE_EQ(swept.filled_size, 85.0);
}

// -----------------------------------------------------------------------------
// 10b. A fill report that arrives while the order is between attempts.
// Why: It must not consume its sequence number, or the poll that later
//      delivers the same sequence for the live order is dropped and the
//      order never fills.
// -----------------------------------------------------------------------------
TEST_F(OrderExecutorTest, EarlyFillReportDoesNotShadowLaterPoll) {
  exchange.failNextSubmits(ExchangeErrorCode::Timeout, 1);

  std::unique_ptr<whalecopy::OrderExecutor> early_executor;
  bool early_applied = true;
  early_executor = std::make_unique<whalecopy::OrderExecutor>(
      clock, exchange, store, audit, whalecopy::ExecutionConfig{},
      [&](whalecopy::Event e) {
        auto* u = std::get_if<whalecopy::OrderUpdateEvent>(&e);
        if (u && u->order.state == OrderState::Failed) {
          whalecopy::FillReport early;
          early.order_id = u->order.order_id;
          early.filled_size = 100.0;
          early.avg_price = 0.55;
          early.fill_sequence = 1;
          early_applied = early_executor->onFillReport(early);
        }
      });

  const ExecutionReport report = early_executor->execute(buyRequest("copy:0xA:t1"));

  EXPECT_FALSE(early_applied);
  EXPECT_EQ(report.order.state, OrderState::Confirmed);
  EXPECT_DOUBLE_EQ(report.order.filled_size, 100.0);
  EXPECT_EQ(report.order.retry_count, 1);
}

// -----------------------------------------------------------------------------
// 10c. Update events are published outside the order lock.
// Why: Engine subscribers react to an update by feeding the executor again;
//      publishing under the lock would deadlock on the same order.
// -----------------------------------------------------------------------------
TEST_F(OrderExecutorTest, SinkMayCallBackIntoExecutor) {
  exchange.setDefaultFillRatio(0.0);

  std::unique_ptr<whalecopy::OrderExecutor> reentrant;
  bool pushed = false;
  reentrant = std::make_unique<whalecopy::OrderExecutor>(
      clock, exchange, store, audit, whalecopy::ExecutionConfig{},
      [&](whalecopy::Event e) {
        auto* u = std::get_if<whalecopy::OrderUpdateEvent>(&e);
        if (u && u->order.state == OrderState::Submitted) {
          pushed = reentrant->onFillReport(
              exchange.advanceFill(u->order.exchange_order_id, 100.0, 0.55));
        }
      });

  const ExecutionReport report = reentrant->execute(buyRequest("copy:0xA:t1"));

  EXPECT_TRUE(pushed);
  EXPECT_EQ(report.order.state, OrderState::Confirmed);
  EXPECT_EQ(clock.now_ms(), kStart);
}

// -----------------------------------------------------------------------------
// 10d. Per-order bookkeeping is released once orders settle.
// -----------------------------------------------------------------------------
TEST_F(OrderExecutorTest, BookkeepingIsReleasedAfterSettlement) {
  HookedExchange hooked(exchange);
  build(hooked);
  exchange.scriptFillRatios({0.4});

  // Mid-lifecycle: the in-flight mark plus the pushed fill sequence.
  std::size_t while_working = 0;
  hooked.before_first_poll = [&] {
    const std::string exchange_id = *exchange.exchangeIdFor("copy:0xA:t1");
    EXPECT_TRUE(executor->onFillReport(exchange.advanceFill(exchange_id, 60.0, 0.55)));
    while_working = executor->trackedEntryCount();
  };

  const ExecutionReport first = executor->execute(buyRequest("copy:0xA:t1"));
  executor->execute(buyRequest("copy:0xA:t2"));

  EXPECT_EQ(first.order.state, OrderState::Cancelled);
  ASSERT_EQ(first.children.size(), 1u);
  EXPECT_EQ(first.children[0].state, OrderState::Confirmed);
  EXPECT_EQ(while_working, 2u);
  EXPECT_EQ(executor->trackedEntryCount(), 0u);
}

// -----------------------------------------------------------------------------
// 11. After a crash: recover from the audit trail, then the stale sweep
//     resolves every order the dead process left behind.
// -----------------------------------------------------------------------------
TEST_F(OrderExecutorTest, RecoverAndSweepAbandonedOrders) {
  // The exchange holds a 90% filled order the process never finished.
  exchange.scriptFillRatios({0.9});
  whalecopy::SubmitRequest placed;
  placed.client_order_id = "copy:0xA:t2";
  placed.token_id = "T1";
  placed.size = 100.0;
  placed.price = 0.55;
  const std::string exchange_id = exchange.submitOrder(placed).exchange_order_id;

  Order pending;
  pending.order_id = "ord-1";
  pending.idempotency_key = "copy:0xA:t1";
  pending.token_id = "T1";
  pending.size = 100.0;
  pending.setFilled(0.0);
  pending.created_at_ms = kStart;
  seed(pending);

  Order working = pending;
  working.order_id = "ord-2";
  working.idempotency_key = "copy:0xA:t2";
  working.exchange_order_id = exchange_id;
  working.state = OrderState::PartiallyFilled;
  working.setFilled(90.0);
  working.avg_fill_price = 0.55;
  working.submitted_at_ms = kStart;
  seed(working);

  Order filled = pending;
  filled.order_id = "ord-7";
  filled.idempotency_key = "copy:0xA:t3";
  filled.state = OrderState::Filled;
  filled.setFilled(100.0);
  seed(filled);

  EXPECT_EQ(executor->recover(), 3u);
  EXPECT_TRUE(executor->verifyConsistency().empty());

  clock.advance_by(31000);
  const auto touched = executor->sweepStale();
  EXPECT_EQ(touched.size(), 3u);
  EXPECT_EQ(executor->get("ord-1")->state, OrderState::Cancelled);
  EXPECT_EQ(executor->get("ord-2")->state, OrderState::Confirmed);
  EXPECT_EQ(executor->get("ord-7")->state, OrderState::Confirmed);
  EXPECT_TRUE(executor->sweepStale().empty());

  // New ids continue past the recovered ones.
  EXPECT_EQ(executor->execute(buyRequest("copy:0xA:t4")).order.order_id, "ord-8");
}

TEST_F(OrderExecutorTest, VerifyConsistencyFlagsDrift) {
  executor->execute(buyRequest("copy:0xA:t1"));

  Order drifted = *store.get("ord-1");
  drifted.setFilled(10.0);
  store.update(drifted);

  const auto mismatched = executor->verifyConsistency();
  ASSERT_EQ(mismatched.size(), 1u);
  EXPECT_EQ(mismatched[0], "ord-1");
}

// -----------------------------------------------------------------------------
// 12. Book fetches go through the shared retry policy.
// -----------------------------------------------------------------------------
TEST_F(OrderExecutorTest, BookFetchRetriesTransientErrors) {
  whalecopy::domain::OrderBook book;
  book.token_id = "T1";
  book.bids = {{0.54, 100.0}};
  book.asks = {{0.56, 100.0}};
  exchange.setOrderBook(book);
  exchange.failNextBookFetches(ExchangeErrorCode::ConnectionError, 1);

  const auto fetched = executor->fetchOrderBook("T1");
  EXPECT_EQ(fetched.asks.size(), 1u);
  EXPECT_EQ(clock.now_ms(), kStart + 1000);

  EXPECT_THROW(executor->fetchOrderBook("T9"), ExchangeError);
}

// -----------------------------------------------------------------------------
// 13. Backoff schedule and the retryable predicate.
// -----------------------------------------------------------------------------
TEST(RetryPolicyTest, BackoffScheduleAndPredicate) {
  const auto policy = whalecopy::RetryPolicy::fromConfig(whalecopy::ExecutionConfig{});

  EXPECT_EQ(policy.maxRetries(), 3);
  EXPECT_EQ(policy.backoffMs(0), 0);
  EXPECT_EQ(policy.backoffMs(1), 1000);
  EXPECT_EQ(policy.backoffMs(2), 2000);
  EXPECT_EQ(policy.backoffMs(3), 4000);
  EXPECT_EQ(policy.backoffMs(4), 4000);

  EXPECT_TRUE(policy.isRetryable(ExchangeError(ExchangeErrorCode::Timeout, "t")));
  EXPECT_TRUE(policy.isRetryable(ExchangeError(ExchangeErrorCode::Unavailable, "u")));
  EXPECT_FALSE(policy.isRetryable(ExchangeError(ExchangeErrorCode::MarketClosed, "c")));
  EXPECT_FALSE(policy.isRetryable(ExchangeError(ExchangeErrorCode::Rejected, "r")));
}

TEST(RetryPolicyTest, RunRethrowsAfterLastRetry) {
  whalecopy::SimulationTimeProvider clock{0};
  const whalecopy::RetryPolicy policy(2, 100, 2.0, 1000);

  int calls = 0;
  EXPECT_THROW(policy.run(clock, "test",
                          [&]() -> int {
                            ++calls;
                            throw ExchangeError(ExchangeErrorCode::Timeout, "down");
                          }),
               ExchangeError);
  EXPECT_EQ(calls, 3);
  EXPECT_EQ(clock.now_ms(), 100 + 200);

  calls = 0;
  EXPECT_THROW(policy.run(clock, "test",
                          [&]() -> int {
                            ++calls;
                            throw ExchangeError(ExchangeErrorCode::InvalidMarket, "x");
                          }),
               ExchangeError);
  EXPECT_EQ(calls, 1);
}
