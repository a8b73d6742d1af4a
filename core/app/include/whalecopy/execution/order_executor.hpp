#pragma once

#include "whalecopy/audit/audit_trail.hpp"
#include "whalecopy/concurrent/id_generator.hpp"
#include "whalecopy/concurrent/keyed_mutex.hpp"
#include "whalecopy/config/engine_config.hpp"
#include "whalecopy/domain/order.hpp"
#include "whalecopy/events/event.hpp"
#include "whalecopy/execution/i_exchange_client.hpp"
#include "whalecopy/execution/order_request.hpp"
#include "whalecopy/execution/retry_policy.hpp"
#include "whalecopy/persistence/order_store.hpp"
#include "whalecopy/time/i_time_provider.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace whalecopy {

// -----------------------------------------------------------------------------
// OrderExecutor - idempotent order lifecycle driver
// -----------------------------------------------------------------------------
//
// @brief  Creates, submits, retries, polls and confirms orders, and is the
//         only component that mutates them.
//
// @details
// Lifecycle of one execute() call:
//   1. Create: under the per-key lock, return the existing order if the
//      idempotency key is known, otherwise insert a PENDING order.
//   2. Submit: PENDING -> SUBMITTED. A transient error goes PENDING ->
//      FAILED, waits the RetryPolicy backoff and retries FAILED -> PENDING
//      with retry_count + 1; exhaustion ends in DEAD_LETTER. A terminal
//      error ends in FAILED.
//   3. Poll: every poll_interval until submitted_at + submitted_timeout.
//      A complete fill goes FILLED -> CONFIRMED.
//   4. Deadline: cancel the remainder on the exchange, then
//        fill >= partial_fill_accept_ratio  -> CONFIRMED
//        0 < fill < ratio                   -> CANCELLED + child order
//        nothing filled                     -> CANCELLED
//
// Every transition is validated by OrderStateMachine, appended to the
// AuditTrail, written to the OrderStore and published as an
// OrderUpdateEvent, in that order. Events are published after the per-order
// lock is released, so sink callbacks may call back into the executor.
//
// Thread model:
//   execute() blocks the caller for the whole lifecycle (execution_loop in
//   the engine). Each mutation takes the per-order lock only for its own
//   duration, so push fills (onFillReport) from the feed thread interleave
//   with polling. sweepStale() skips orders an execute() call is driving.
//
// Ownership: holds references to the clock, exchange, store and audit
// trail; all must outlive the executor.
// -----------------------------------------------------------------------------
class OrderExecutor {
 public:
  OrderExecutor(const ITimeProvider& clock, IExchangeClient& exchange,
                OrderStore& store, AuditTrail& audit, ExecutionConfig config,
                EventSink sink = {});

  OrderExecutor(const OrderExecutor&) = delete;
  OrderExecutor& operator=(const OrderExecutor&) = delete;
  OrderExecutor(OrderExecutor&&) = delete;
  OrderExecutor& operator=(OrderExecutor&&) = delete;

  // Runs the request to a terminal (or final FAILED) state. A known key
  // returns the existing lineage with created == false and submits nothing.
  // Throws std::invalid_argument for an empty key or a non-positive size.
  ExecutionReport execute(const OrderRequest& request);

  // -------------------------------------------------------------------------
  // onFillReport(report)
  // -------------------------------------------------------------------------
  // @brief  Applies a cumulative fill from the push feed or from polling.
  //
  // @return true if the order's filled size advanced.
  //
  // @details
  // Duplicates by (order_id, fill_sequence) and reports whose cumulative
  // size does not exceed the booked fill are ignored. Only SUBMITTED and
  // PARTIALLY_FILLED orders accept fills, and only they record sequences;
  // the record is dropped when the order leaves the working states.
  // -------------------------------------------------------------------------
  bool onFillReport(const FillReport& report);

  // Cancels a non-terminal order, on the exchange first when it is working.
  // Returns false if the order is unknown, terminal, or the exchange cancel
  // failed.
  bool cancel(const domain::OrderId& order_id, const std::string& reason);

  // Resolves orders left behind by a crash or an abandoned lifecycle:
  // PENDING older than pending_timeout is cancelled, working orders older
  // than submitted_timeout are cancelled on the exchange and confirmed or
  // cancelled by their fill ratio, FILLED orders are confirmed.
  std::vector<domain::OrderId> sweepStale();

  // Rebuilds the store from the audit trail. Returns the order count.
  std::size_t recover();

  // Orders whose stored state or fill differs from their last audit record.
  std::vector<domain::OrderId> verifyConsistency() const;

  std::vector<domain::Order> deadLetters() const;
  std::vector<domain::OrderTransition> transitionsFor(
      const domain::OrderId& order_id) const;
  std::optional<domain::Order> get(const domain::OrderId& order_id) const;

  // Order book snapshot through the shared retry policy.
  domain::OrderBook fetchOrderBook(const std::string& token_id);

  const RetryPolicy& retryPolicy() const { return retry_; }

  // Lock entries, in-flight marks and seen fill sequences currently held.
  // Zero when no call is running and every order has settled.
  std::size_t trackedEntryCount() const;

 private:
  using Mutator = std::function<void(domain::Order&)>;

  domain::Order runRequest(const OrderRequest& request, bool& created);
  domain::Order createOrder(const OrderRequest& request, std::vector<Event>& events);

  bool submit(const domain::OrderId& order_id);
  void awaitFill(const domain::OrderId& order_id);

  // Cancels the remainder and settles the order by its fill ratio. Returns
  // the child request when the lineage should continue.
  std::optional<OrderRequest> resolveDeadline(const domain::OrderId& order_id,
                                              bool allow_child);

  bool applyFill(const domain::OrderId& order_id, double cumulative,
                 double avg_price, std::uint64_t fill_sequence);

  // Polls the exchange once (with retries) and applies the result. Returns
  // false, after logging, when the exchange could not report the fill.
  bool refreshFill(const domain::Order& order);

  // Transitions only if the current state is one of `from`.
  bool transitionFrom(const domain::OrderId& order_id,
                      std::initializer_list<domain::OrderState> from,
                      domain::OrderState to, const std::string& reason,
                      const Mutator& mutate = {});

  // Caller holds the order's lock. The update event is appended to
  // `events` for emit() once the lock is released.
  domain::Order transitionLocked(domain::Order order, domain::OrderState to,
                                 const std::string& reason,
                                 const Mutator& mutate,
                                 std::vector<Event>& events);

  void recordCreation(const domain::Order& order, std::vector<Event>& events);
  OrderUpdateEvent updateEvent(const domain::Order& order,
                               std::optional<domain::OrderState> previous,
                               const std::string& reason,
                               std::uint64_t sequence_id) const;
  void emit(std::vector<Event>& events) const;

  domain::Order mustGet(const domain::OrderId& order_id) const;
  ExecutionReport reportFor(const domain::Order& root, bool created) const;

  bool isInFlight(const domain::OrderId& order_id) const;

  // Marks an order as driven by an execute() call for its lifetime.
  class InFlightGuard {
   public:
    InFlightGuard(OrderExecutor& owner, domain::OrderId order_id);
    ~InFlightGuard();
    InFlightGuard(const InFlightGuard&) = delete;
    InFlightGuard& operator=(const InFlightGuard&) = delete;

   private:
    OrderExecutor& owner_;
    domain::OrderId order_id_;
  };

  const ITimeProvider& clock_;
  IExchangeClient& exchange_;
  OrderStore& store_;
  AuditTrail& audit_;
  ExecutionConfig config_;
  RetryPolicy retry_;
  EventSink sink_;

  IdGenerator ids_{"ord"};
  KeyedMutex key_locks_;
  KeyedMutex order_locks_;

  mutable std::mutex tracking_mutex_;
  std::set<domain::OrderId> in_flight_;
  std::map<domain::OrderId, std::set<std::uint64_t>> seen_fills_;
};

}  // namespace whalecopy
