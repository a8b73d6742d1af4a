#include "whalecopy/execution/order_executor.hpp"
#include "whalecopy/domain/enum_strings.hpp"
#include "whalecopy/errors.hpp"
#include "whalecopy/execution/order_state_machine.hpp"
#include "whalecopy/persistence/json_codec.hpp"
#include "whalecopy/time/time_utils.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <stdexcept>

namespace whalecopy {

using domain::Order;
using domain::OrderId;
using domain::OrderState;

namespace {

// Fill sizes within this distance of the order size count as complete.
constexpr double kFillEpsilon = 1e-9;

std::string percent(double ratio) {
  return std::to_string(static_cast<int>(ratio * 100.0 + 0.5)) + "%";
}

}  // namespace

OrderExecutor::InFlightGuard::InFlightGuard(OrderExecutor& owner, OrderId order_id)
    : owner_(owner), order_id_(std::move(order_id)) {
  std::lock_guard lock(owner_.tracking_mutex_);
  owner_.in_flight_.insert(order_id_);
}

OrderExecutor::InFlightGuard::~InFlightGuard() {
  std::lock_guard lock(owner_.tracking_mutex_);
  owner_.in_flight_.erase(order_id_);
}

OrderExecutor::OrderExecutor(const ITimeProvider& clock, IExchangeClient& exchange,
                             OrderStore& store, AuditTrail& audit,
                             ExecutionConfig config, EventSink sink)
    : clock_(clock),
      exchange_(exchange),
      store_(store),
      audit_(audit),
      config_(config),
      retry_(RetryPolicy::fromConfig(config)),
      sink_(std::move(sink)) {}

// -----------------------------------------------------------------------------
// execute()
// -----------------------------------------------------------------------------
ExecutionReport OrderExecutor::execute(const OrderRequest& request) {
  if (request.idempotency_key.empty()) {
    throw std::invalid_argument("order request needs an idempotency key");
  }
  if (!(request.size > 0.0)) {
    throw std::invalid_argument("order size must be positive: " +
                                request.idempotency_key);
  }

  bool created = false;
  const Order root = runRequest(request, created);
  return reportFor(root, created);
}

// -----------------------------------------------------------------------------
// runRequest() - create (or find) the order and drive its lineage
// -----------------------------------------------------------------------------
// The in-flight mark is taken while the key lock is still held, so the
// stale sweep can never see a freshly created order as abandoned.
// -----------------------------------------------------------------------------
Order OrderExecutor::runRequest(const OrderRequest& request, bool& created) {
  std::optional<InFlightGuard> in_flight;
  Order order;
  std::vector<Event> events;
  {
    auto key_guard = key_locks_.lock(request.idempotency_key);
    if (auto existing = store_.findByKey(request.idempotency_key)) {
      std::cout << "[OrderExecutor] Idempotency key " << request.idempotency_key
                << " already maps to " << existing->order_id
                << ", not submitting again\n";
      created = false;
      return *existing;
    }
    order = createOrder(request, events);
    created = true;
    in_flight.emplace(*this, order.order_id);
  }
  emit(events);

  if (submit(order.order_id)) {
    awaitFill(order.order_id);
    if (auto child = resolveDeadline(order.order_id, true)) {
      bool child_created = false;
      runRequest(*child, child_created);
    }
  }
  return mustGet(order.order_id);
}

Order OrderExecutor::createOrder(const OrderRequest& request,
                                 std::vector<Event>& events) {
  Order order;
  order.order_id = ids_.next();
  order.idempotency_key = request.idempotency_key;
  order.token_id = request.token_id;
  order.market_id = request.market_id;
  order.side = request.side;
  order.size = request.size;
  order.price = request.price;
  order.order_type = request.order_type;
  order.state = OrderState::Pending;
  order.setFilled(0.0);
  order.created_at_ms = clock_.now_ms();
  order.max_retries = retry_.maxRetries();
  order.parent_order_id = request.parent_order_id;
  order.child_depth = request.child_depth;
  order.position_id = request.position_id;
  order.whale_address = request.whale_address;

  // The unique key constraint is checked before anything reaches the log,
  // so a collision leaves no creation record behind.
  store_.insert(order);
  recordCreation(order, events);
  return order;
}

// -----------------------------------------------------------------------------
// submit() - PENDING -> SUBMITTED with audited retries
// -----------------------------------------------------------------------------
bool OrderExecutor::submit(const OrderId& order_id) {
  while (true) {
    const Order order = mustGet(order_id);
    if (order.state != OrderState::Pending) {
      return OrderStateMachine::isWorking(order.state);
    }

    SubmitRequest request;
    request.client_order_id = order.idempotency_key;
    request.token_id = order.token_id;
    request.side = order.side;
    request.size = order.size;
    request.price = order.price;
    request.order_type = order.order_type;
    request.deadline_ms = clock_.now_ms() + config_.pending_timeout_ms;

    try {
      const SubmitAck ack = exchange_.submitOrder(request);
      const std::int64_t now = clock_.now_ms();
      const std::string reason =
          ack.duplicate ? "Submitted (exchange already held this client id)"
                        : "Submitted";
      return transitionFrom(order_id, {OrderState::Pending}, OrderState::Submitted,
                            reason, [&](Order& o) {
                              o.exchange_order_id = ack.exchange_order_id;
                              o.submitted_at_ms = now;
                              o.error_message.clear();
                            });
    } catch (const ExchangeError& e) {
      if (!transitionFrom(order_id, {OrderState::Pending}, OrderState::Failed,
                          e.what(), [&](Order& o) { o.error_message = e.what(); })) {
        return false;
      }

      if (!retry_.isRetryable(e)) {
        std::cerr << "[OrderExecutor] Order " << order_id
                  << " failed with terminal error: " << e.what() << "\n";
        return false;
      }
      if (order.retry_count >= order.max_retries) {
        transitionFrom(order_id, {OrderState::Failed}, OrderState::DeadLetter,
                       "Retries exhausted after " +
                           std::to_string(order.retry_count) + " retries");
        std::cerr << "[OrderExecutor] CRITICAL: order " << order_id
                  << " moved to DEAD_LETTER: " << e.what() << "\n";
        return false;
      }

      const int retry = order.retry_count + 1;
      const std::int64_t delay = retry_.backoffMs(retry);
      std::cerr << "[OrderExecutor] WARNING: submit of " << order_id
                << " failed (" << e.what() << "), retry " << retry << "/"
                << order.max_retries << " in " << delay << " ms\n";
      clock_.sleep_ms(delay);

      if (!transitionFrom(order_id, {OrderState::Failed}, OrderState::Pending,
                          "Retry " + std::to_string(retry) + "/" +
                              std::to_string(order.max_retries),
                          [&](Order& o) { o.retry_count = retry; })) {
        return false;
      }
    }
  }
}

// -----------------------------------------------------------------------------
// awaitFill() - poll until complete or until the submitted deadline
// -----------------------------------------------------------------------------
void OrderExecutor::awaitFill(const OrderId& order_id) {
  const Order submitted = mustGet(order_id);
  const std::int64_t deadline =
      submitted.submitted_at_ms.value_or(clock_.now_ms()) +
      config_.submitted_timeout_ms;

  while (true) {
    const Order order = mustGet(order_id);
    if (!OrderStateMachine::isWorking(order.state)) {
      break;
    }

    // A failed poll is logged by refreshFill; the next interval polls again.
    refreshFill(order);

    if (mustGet(order_id).state == OrderState::Filled) {
      break;
    }
    const std::int64_t now = clock_.now_ms();
    if (now >= deadline) {
      break;
    }
    clock_.sleep_ms(std::min(config_.poll_interval_ms, deadline - now));
  }

  transitionFrom(order_id, {OrderState::Filled}, OrderState::Confirmed,
                 "Fill confirmed");
}

// -----------------------------------------------------------------------------
// resolveDeadline()
// -----------------------------------------------------------------------------
// After the exchange cancel the fill is polled once more, so anything that
// filled since the last poll is booked before the ratio is taken. A cancel
// or final poll that fails even after retries leaves the order working; the
// stale sweep picks it up on a later maintenance tick.
// -----------------------------------------------------------------------------
std::optional<OrderRequest> OrderExecutor::resolveDeadline(const OrderId& order_id,
                                                           bool allow_child) {
  const Order order = mustGet(order_id);
  if (order.state == OrderState::Filled) {
    transitionFrom(order_id, {OrderState::Filled}, OrderState::Confirmed,
                   "Fill confirmed");
    return std::nullopt;
  }
  if (!OrderStateMachine::isWorking(order.state)) {
    return std::nullopt;
  }

  try {
    retry_.run(clock_, "cancel", [&] { exchange_.cancelOrder(order.exchange_order_id); });
  } catch (const ExchangeError& e) {
    std::cerr << "[OrderExecutor] CRITICAL: cancel of " << order_id << " ("
              << order.exchange_order_id << ") failed: " << e.what()
              << ". Order left working.\n";
    return std::nullopt;
  }
  if (!refreshFill(order)) {
    std::cerr << "[OrderExecutor] CRITICAL: final fill of " << order_id
              << " unknown after cancel. Order left working.\n";
    return std::nullopt;
  }

  Order settled;
  std::vector<Event> events;
  {
    auto guard = order_locks_.lock(order_id);
    const Order current = mustGet(order_id);
    const double ratio = current.fillRatio();
    if (current.state == OrderState::Filled) {
      transitionLocked(current, OrderState::Confirmed, "Fill confirmed", {}, events);
    } else if (!OrderStateMachine::isWorking(current.state)) {
      return std::nullopt;
    } else if (current.filled_size > 0.0 &&
               ratio >= config_.partial_fill_accept_ratio) {
      transitionLocked(current, OrderState::Confirmed,
                       "Partial fill accepted at " + percent(ratio), {}, events);
    } else {
      settled = transitionLocked(
          current, OrderState::Cancelled,
          current.filled_size > 0.0
              ? "Partial fill " + percent(ratio) + " below threshold, remainder cancelled"
              : "Not filled before deadline",
          {}, events);
    }
  }
  emit(events);

  if (settled.state != OrderState::Cancelled) {
    return std::nullopt;
  }
  if (!allow_child || settled.filled_size <= 0.0 || settled.remaining_size <= 0.0) {
    return std::nullopt;
  }
  if (settled.child_depth >= config_.max_child_depth) {
    std::cerr << "[OrderExecutor] WARNING: " << order_id
              << " reached max child depth, remainder "
              << settled.remaining_size << " abandoned\n";
    return std::nullopt;
  }

  OrderRequest child;
  child.child_depth = settled.child_depth + 1;
  child.idempotency_key =
      settled.idempotency_key + "#child-" + std::to_string(child.child_depth);
  child.token_id = settled.token_id;
  child.market_id = settled.market_id;
  child.side = settled.side;
  child.size = settled.remaining_size;
  child.price = settled.price;
  child.order_type = settled.order_type;
  child.whale_address = settled.whale_address;
  child.position_id = settled.position_id;
  child.parent_order_id = settled.order_id;
  std::cout << "[OrderExecutor] Child order " << child.idempotency_key
            << " for remaining " << child.size << "\n";
  return child;
}

// -----------------------------------------------------------------------------
// onFillReport()
// -----------------------------------------------------------------------------
bool OrderExecutor::onFillReport(const FillReport& report) {
  std::optional<Order> order = report.order_id.empty()
                                   ? store_.findByExchangeId(report.exchange_order_id)
                                   : store_.get(report.order_id);
  if (!order) {
    std::cerr << "[OrderExecutor] WARNING: fill report for unknown order "
              << (report.order_id.empty() ? report.exchange_order_id : report.order_id)
              << ". Ignoring.\n";
    return false;
  }

  return applyFill(order->order_id, report.filled_size, report.avg_price,
                   report.fill_sequence);
}

// -----------------------------------------------------------------------------
// applyFill()
// -----------------------------------------------------------------------------
// A sequence is recorded as seen only while the order is working. A report
// that arrives before submission (or after a failed attempt) is dropped
// without shadowing the same sequence when polling delivers it later.
// -----------------------------------------------------------------------------
bool OrderExecutor::applyFill(const OrderId& order_id, double cumulative,
                              double avg_price, std::uint64_t fill_sequence) {
  std::vector<Event> events;
  {
    auto guard = order_locks_.lock(order_id);
    const Order order = mustGet(order_id);
    if (!OrderStateMachine::isWorking(order.state)) {
      return false;
    }
    {
      std::lock_guard lock(tracking_mutex_);
      if (!seen_fills_[order_id].insert(fill_sequence).second) {
        return false;
      }
    }
    if (cumulative <= order.filled_size + kFillEpsilon) {
      return false;
    }

    const double filled = std::min(cumulative, order.size);
    const OrderState to = filled >= order.size - kFillEpsilon
                              ? OrderState::Filled
                              : OrderState::PartiallyFilled;
    transitionLocked(order, to, "Fill report seq " + std::to_string(fill_sequence),
                     [&](Order& o) {
                       o.setFilled(filled);
                       o.avg_fill_price = avg_price;
                     },
                     events);
  }
  emit(events);
  return true;
}

bool OrderExecutor::refreshFill(const Order& order) {
  try {
    const FillStatus status = retry_.run(clock_, "poll fill", [&] {
      return exchange_.pollFill(order.exchange_order_id);
    });
    applyFill(order.order_id, status.filled_size, status.avg_price,
              status.fill_sequence);
    return true;
  } catch (const ExchangeError& e) {
    std::cerr << "[OrderExecutor] WARNING: polling " << order.order_id
              << " failed: " << e.what() << "\n";
    return false;
  }
}

// -----------------------------------------------------------------------------
// cancel()
// -----------------------------------------------------------------------------
bool OrderExecutor::cancel(const OrderId& order_id, const std::string& reason) {
  const std::optional<Order> order = store_.get(order_id);
  if (!order) {
    return false;
  }
  if (OrderStateMachine::isWorking(order->state)) {
    try {
      retry_.run(clock_, "cancel", [&] { exchange_.cancelOrder(order->exchange_order_id); });
    } catch (const ExchangeError& e) {
      std::cerr << "[OrderExecutor] WARNING: cancel of " << order_id
                << " failed: " << e.what() << "\n";
      return false;
    }
    if (!refreshFill(*order)) {
      return false;
    }
    if (transitionFrom(order_id, {OrderState::Filled}, OrderState::Confirmed,
                       "Filled before cancel")) {
      return false;
    }
  }
  return transitionFrom(order_id,
                        {OrderState::Pending, OrderState::Submitted,
                         OrderState::PartiallyFilled},
                        OrderState::Cancelled, reason);
}

// -----------------------------------------------------------------------------
// sweepStale()
// -----------------------------------------------------------------------------
std::vector<OrderId> OrderExecutor::sweepStale() {
  std::vector<OrderId> touched;
  const std::int64_t now = clock_.now_ms();

  for (const Order& order : store_.all()) {
    if (OrderStateMachine::isTerminal(order.state) || isInFlight(order.order_id)) {
      continue;
    }
    switch (order.state) {
      case OrderState::Pending:
        if (now - order.created_at_ms > config_.pending_timeout_ms &&
            cancel(order.order_id, "Stale PENDING order")) {
          touched.push_back(order.order_id);
        }
        break;
      case OrderState::Submitted:
      case OrderState::PartiallyFilled:
        if (now - order.submitted_at_ms.value_or(order.created_at_ms) >
            config_.submitted_timeout_ms) {
          resolveDeadline(order.order_id, false);
          if (OrderStateMachine::isTerminal(mustGet(order.order_id).state)) {
            touched.push_back(order.order_id);
          }
        }
        break;
      case OrderState::Filled:
        if (transitionFrom(order.order_id, {OrderState::Filled},
                           OrderState::Confirmed, "Fill confirmed by sweep")) {
          touched.push_back(order.order_id);
        }
        break;
      default:
        break;
    }
  }

  if (!touched.empty()) {
    std::cout << "[OrderExecutor] Stale sweep resolved " << touched.size()
              << " order(s)\n";
  }
  return touched;
}

// -----------------------------------------------------------------------------
// recover() / verifyConsistency()
// -----------------------------------------------------------------------------
std::size_t OrderExecutor::recover() {
  const std::vector<Order> orders = audit_.recoverOrders();
  store_.replaceAll(orders);
  for (const Order& order : orders) {
    ids_.observe(order.order_id);
  }
  std::cout << "[OrderExecutor] Recovered " << orders.size()
            << " order(s) from the audit trail\n";
  return orders.size();
}

std::vector<OrderId> OrderExecutor::verifyConsistency() const {
  std::vector<OrderId> mismatched;
  std::set<OrderId> logged;
  for (const Order& expected : audit_.recoverOrders()) {
    logged.insert(expected.order_id);
    const std::optional<Order> stored = store_.get(expected.order_id);
    if (!stored || stored->state != expected.state ||
        std::abs(stored->filled_size - expected.filled_size) > kFillEpsilon) {
      mismatched.push_back(expected.order_id);
    }
  }
  for (const Order& stored : store_.all()) {
    if (logged.count(stored.order_id) == 0) {
      mismatched.push_back(stored.order_id);
    }
  }
  return mismatched;
}

std::vector<Order> OrderExecutor::deadLetters() const {
  return store_.byState(OrderState::DeadLetter);
}

std::vector<domain::OrderTransition> OrderExecutor::transitionsFor(
    const OrderId& order_id) const {
  return audit_.transitionsFor(order_id);
}

std::optional<Order> OrderExecutor::get(const OrderId& order_id) const {
  return store_.get(order_id);
}

domain::OrderBook OrderExecutor::fetchOrderBook(const std::string& token_id) {
  return retry_.run(clock_, "order book fetch",
                    [&] { return exchange_.fetchOrderBook(token_id); });
}

// -----------------------------------------------------------------------------
// Transition plumbing: validate -> audit -> store -> publish
// -----------------------------------------------------------------------------
bool OrderExecutor::transitionFrom(const OrderId& order_id,
                                   std::initializer_list<OrderState> from,
                                   OrderState to, const std::string& reason,
                                   const Mutator& mutate) {
  std::vector<Event> events;
  {
    auto guard = order_locks_.lock(order_id);
    const Order order = mustGet(order_id);
    if (std::find(from.begin(), from.end(), order.state) == from.end()) {
      return false;
    }
    transitionLocked(order, to, reason, mutate, events);
  }
  emit(events);
  return true;
}

Order OrderExecutor::transitionLocked(Order order, OrderState to,
                                      const std::string& reason,
                                      const Mutator& mutate,
                                      std::vector<Event>& events) {
  const OrderState from = order.state;
  OrderStateMachine::validate(from, to);

  const std::int64_t now = clock_.now_ms();
  if (mutate) {
    mutate(order);
  }
  order.state = to;
  if (to == OrderState::Filled) {
    order.filled_at_ms = now;
  } else if (to == OrderState::Confirmed) {
    order.confirmed_at_ms = now;
    if (!order.filled_at_ms) {
      order.filled_at_ms = now;
    }
  }

  domain::OrderTransition record;
  record.order_id = order.order_id;
  record.from_state = from;
  record.to_state = to;
  record.timestamp_ms = now;
  record.reason = reason;
  record.metadata = nlohmann::json{{"order", order}};
  record = audit_.appendTransition(std::move(record));

  store_.update(order);
  if (!OrderStateMachine::isWorking(to)) {
    std::lock_guard lock(tracking_mutex_);
    seen_fills_.erase(order.order_id);
  }

  std::cout << "[OrderExecutor] " << order.order_id << " "
            << domain::toString(from) << " -> " << domain::toString(to)
            << " (" << reason << ")\n";
  events.emplace_back(updateEvent(order, from, reason, record.id));
  return order;
}

void OrderExecutor::recordCreation(const Order& order, std::vector<Event>& events) {
  domain::OrderTransition record;
  record.order_id = order.order_id;
  record.to_state = OrderState::Pending;
  record.timestamp_ms = order.created_at_ms;
  record.reason = "Order created";
  record.metadata = nlohmann::json{{"order", order}};
  record = audit_.appendTransition(std::move(record));

  std::cout << "[OrderExecutor] Created " << order.order_id << " ("
            << order.idempotency_key << ") " << domain::toString(order.side)
            << " " << order.size << " " << order.token_id << "\n";
  events.emplace_back(updateEvent(order, std::nullopt, record.reason, record.id));
}

OrderUpdateEvent OrderExecutor::updateEvent(const Order& order,
                                            std::optional<OrderState> previous,
                                            const std::string& reason,
                                            std::uint64_t sequence_id) const {
  OrderUpdateEvent event;
  event.order = order;
  event.previous_state = previous;
  event.reason = reason;
  event.timestamp = ms_to_timestamp(clock_.now_ms());
  event.sequence_id = sequence_id;
  return event;
}

// Publishes collected events once no order or key lock is held.
void OrderExecutor::emit(std::vector<Event>& events) const {
  if (!sink_) {
    return;
  }
  for (Event& event : events) {
    sink_(std::move(event));
  }
}

Order OrderExecutor::mustGet(const OrderId& order_id) const {
  std::optional<Order> order = store_.get(order_id);
  if (!order) {
    throw UnknownEntityError("unknown order id: " + order_id);
  }
  return *order;
}

// -----------------------------------------------------------------------------
// reportFor() - aggregate a root order and its child lineage
// -----------------------------------------------------------------------------
ExecutionReport OrderExecutor::reportFor(const Order& root, bool created) const {
  ExecutionReport report;
  report.order = root;
  report.created = created;

  double filled = root.filled_size;
  double cost = root.filled_size * root.avg_fill_price;

  OrderId parent = root.order_id;
  while (true) {
    const std::vector<Order> children = store_.childrenOf(parent);
    if (children.empty()) {
      break;
    }
    const Order& child = children.front();
    report.children.push_back(child);
    filled += child.filled_size;
    cost += child.filled_size * child.avg_fill_price;
    parent = child.order_id;
  }

  report.total_filled = filled;
  report.avg_fill_price = filled > 0.0 ? cost / filled : 0.0;
  return report;
}

bool OrderExecutor::isInFlight(const OrderId& order_id) const {
  std::lock_guard lock(tracking_mutex_);
  return in_flight_.count(order_id) > 0;
}

std::size_t OrderExecutor::trackedEntryCount() const {
  std::size_t count = key_locks_.size() + order_locks_.size();
  std::lock_guard lock(tracking_mutex_);
  count += in_flight_.size();
  for (const auto& [order_id, sequences] : seen_fills_) {
    count += sequences.size();
  }
  return count;
}

}  // namespace whalecopy
