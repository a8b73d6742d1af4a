#include "whalecopy/engine/copy_trading_engine.hpp"

#include "whalecopy/domain/enum_strings.hpp"
#include "whalecopy/execution/exchange_error.hpp"
#include "whalecopy/persistence/json_codec.hpp"
#include "whalecopy/time/time_utils.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>
#include <exception>
#include <initializer_list>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <variant>

namespace whalecopy {

using domain::CloseReason;
using domain::Position;
using domain::PositionStatus;

namespace {

constexpr const char* kCopyKeyPrefix = "copy:";
constexpr const char* kCloseKeyPrefix = "close:";

std::unique_ptr<AuditTrail> makeAuditTrail(const std::string& journal_path) {
  if (journal_path.empty()) {
    return std::make_unique<AuditTrail>();
  }
  return std::make_unique<AuditTrail>(journal_path);
}

bool startsWith(const std::string& s, const std::string& prefix) {
  return s.compare(0, prefix.size(), prefix) == 0;
}

// Cost basis of a live position in USD at its entry token price.
double entryExposure(const Position& position) {
  return position.current_size *
         domain::referencePrice(position.side, position.entry_price);
}

nlohmann::json exposureJson(const domain::ExposureBook& book) {
  nlohmann::json j;
  j["total"] = book.total;
  j["by_whale"] = book.by_whale;
  j["by_market"] = book.by_market;
  j["by_category"] = book.by_category;
  return j;
}

nlohmann::json positionsJson(const std::vector<Position>& positions) {
  nlohmann::json arr = nlohmann::json::array();
  for (const auto& position : positions) {
    arr.emplace_back(position);
  }
  return arr;
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
CopyTradingEngine::CopyTradingEngine(const ITimeProvider& clock,
                                     IExchangeClient& exchange,
                                     EngineConfig config,
                                     SimulationTimeProvider* replay_clock)
    : clock_(clock),
      config_(std::move(config)),
      replay_clock_(replay_clock),
      audit_(makeAuditTrail(config_.audit_journal_path)),
      risk_(clock_, config_.risk, config_.initial_nav, telemetrySink()),
      executor_(clock_, exchange, store_, *audit_, config_.execution,
                telemetrySink()),
      ledger_(clock_, *audit_, config_.ledger, telemetrySink()),
      filter_(config_.filter),
      sizer_(config_.sizer),
      volatility_(config_.sizer.ewma_lambda) {
  wireLoops();
}

// -----------------------------------------------------------------------------
// Destructor: RAII stop
// -----------------------------------------------------------------------------
CopyTradingEngine::~CopyTradingEngine() { stop(); }

// -----------------------------------------------------------------------------
// wireLoops()
// -----------------------------------------------------------------------------
// Subscriptions live as long as the loops, so they are made once here rather
// than in start(). A restarted engine reuses them.
// -----------------------------------------------------------------------------
void CopyTradingEngine::wireLoops() {
  EventBus& signals = signal_loop_.eventBus();
  signals.subscribe<WhaleTradeEvent>(
      [this](const WhaleTradeEvent& e) { handleWhaleTrade(e); });
  signals.subscribe<PriceUpdateEvent>(
      [this](const PriceUpdateEvent& e) { handlePriceUpdate(e); });
  signals.subscribe<WhaleProfileEvent>(
      [this](const WhaleProfileEvent& e) { handleWhaleProfile(e); });
  signals.subscribe<MarketInfoEvent>(
      [this](const MarketInfoEvent& e) { onMarketInfo(e.market); });
  signals.subscribe<HeartbeatEvent>(
      [this](const HeartbeatEvent& e) { handleHeartbeat(e); });

  EventBus& execution = execution_loop_.eventBus();
  execution.subscribe<CopyOrderEvent>(
      [this](const CopyOrderEvent& e) { handleCopyOrder(e); });
  execution.subscribe<ExitSignalEvent>(
      [this](const ExitSignalEvent& e) { handleExitSignal(e); });
}

EventSink CopyTradingEngine::telemetrySink() {
  return [this](Event event) { telemetry_.publish(event); };
}

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void CopyTradingEngine::start() {
  if (running_.load()) {
    return;
  }

  // ---  1) Rebuild state from the audit trail (before any thread runs) ------
  recover();

  // ---  2) Core event loops --------------------------------------------------
  signal_loop_.start();
  execution_loop_.start();
  running_.store(true);

  // ---  3) Maintenance ticks -------------------------------------------------
  maintenance_thread_ = std::thread([this] { runMaintenanceThread(); });

  // ---  4) IpcServer (commands + telemetry) ----------------------------------
  const NetworkConfig& net = config_.network;
  if (!net.ipc_cmd_endpoint.empty() && !net.ipc_pub_endpoint.empty()) {
    ipc_server_ = std::make_unique<IpcServer>(
        [this](const std::string& cmd) { return executeCommand(cmd); },
        net.ipc_cmd_endpoint, net.ipc_pub_endpoint);
    ipc_server_->start();
    ipc_subscription_ = telemetry_.subscribe(
        [this](const Event& e) { ipc_server_->pushTelemetry(e); });
  }

  // ---  5) Feed LAST (signals begin flowing) --------------------------------
  if (!net.feed_endpoint.empty()) {
    feed_thread_ = std::make_unique<FeedThread>(
        [this](Event event) { pushEvent(std::move(event)); },
        [this](const FillReport& report) { onFillReport(report); },
        net.feed_endpoint, replay_clock_);
    feed_thread_->start();
  }

  std::cout << "[CopyTradingEngine] started. Threads: signal_loop, "
               "execution_loop, maintenance"
            << (ipc_server_ ? ", ipc" : "") << (feed_thread_ ? ", feed" : "")
            << ".\n";
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void CopyTradingEngine::stop() {
  if (!running_.load()) {
    return;
  }

  // ---  1) Stop signal inflow FIRST -----------------------------------------
  feed_thread_.reset();

  // ---  2) Maintenance ticks --------------------------------------------------
  {
    std::lock_guard lock(maintenance_mutex_);
    running_.store(false);
  }
  maintenance_cv_.notify_all();
  if (maintenance_thread_.joinable()) {
    maintenance_thread_.join();
  }

  // ---  3) IpcServer (joins before the components it queries go away) -------
  if (ipc_subscription_) {
    telemetry_.unsubscribe(*ipc_subscription_);
    ipc_subscription_.reset();
  }
  ipc_server_.reset();

  // ---  4) Loops: signals first so no new orders are queued -----------------
  signal_loop_.stop();
  execution_loop_.stop();

  std::cout << "[CopyTradingEngine] stopped. All threads joined.\n";
}

// -----------------------------------------------------------------------------
// recover()
// -----------------------------------------------------------------------------
// Re-derives orders and positions from their latest logged snapshots. Live
// positions get their exposure re-booked with RiskManager; used copy and close
// keys are remembered so a replayed signal or a new close can never collide
// with an order placed before the restart.
//
// Only a journaled audit trail can hold state from an earlier process, and it
// is read once: an in-memory trail only mirrors what this engine already holds.
// -----------------------------------------------------------------------------
void CopyTradingEngine::recover() {
  if (recovered_ || !audit_->journaled()) {
    return;
  }
  recovered_ = true;

  const std::size_t orders = executor_.recover();
  const std::size_t positions = ledger_.recover(audit_->recoverPositions());

  for (const auto& position : ledger_.live()) {
    risk_.addExposure(position.whale_address, position.market_id,
                      position.category, entryExposure(position));
  }
  risk_.updateUnrealized(ledger_.totalUnrealized());

  std::lock_guard lock(keys_mutex_);
  for (const auto& order : store_.all()) {
    const std::string& key = order.idempotency_key;
    if (key.find('#') != std::string::npos) {
      continue;  // Partial-fill child
    }
    if (startsWith(key, kCopyKeyPrefix)) {
      copy_keys_.insert(key);
    } else if (startsWith(key, kCloseKeyPrefix)) {
      const std::size_t sep = key.rfind(':');
      const std::string prefix(kCloseKeyPrefix);
      if (sep == std::string::npos || sep < prefix.size()) {
        continue;
      }
      const std::string position_id = key.substr(prefix.size(), sep - prefix.size());
      try {
        const int attempt = std::stoi(key.substr(sep + 1));
        int& highest = close_attempts_[position_id];
        highest = std::max(highest, attempt);
      } catch (const std::logic_error& e) {
        std::cerr << "[CopyTradingEngine] WARNING: unreadable close key " << key
                  << ": " << e.what() << "\n";
      }
    }
  }

  std::cout << "[CopyTradingEngine] Recovery complete: " << orders
            << " order(s), " << positions << " position(s), "
            << copy_keys_.size() << " copied signal(s).\n";
}

// -----------------------------------------------------------------------------
// runMaintenanceThread()
// -----------------------------------------------------------------------------
void CopyTradingEngine::runMaintenanceThread() {
  const auto interval = std::chrono::milliseconds(config_.maintenance_interval_ms);
  std::unique_lock lock(maintenance_mutex_);
  while (running_.load()) {
    maintenance_cv_.wait_for(lock, interval, [this] { return !running_.load(); });
    if (!running_.load()) {
      break;
    }
    lock.unlock();
    pushEvent(HeartbeatEvent{"maintenance", "tick", {}, 0});
    lock.lock();
  }
}

// -----------------------------------------------------------------------------
// pushEvent(event)
// -----------------------------------------------------------------------------
void CopyTradingEngine::pushEvent(Event event) {
  const std::int64_t now = clock_.now_ms();
  std::visit(
      [this, now](auto& e) {
        e.sequence_id = next_sequence_.fetch_add(1);
        if (e.timestamp == Timestamp{}) {
          e.timestamp = ms_to_timestamp(now);
        }
      },
      event);
  signal_loop_.push(std::move(event));
}

void CopyTradingEngine::onFillReport(const FillReport& report) {
  if (!executor_.onFillReport(report)) {
    std::cout << "[CopyTradingEngine] Fill report for "
              << (report.order_id.empty() ? report.exchange_order_id
                                          : report.order_id)
              << " seq=" << report.fill_sequence << " not applied\n";
  }
}

// -----------------------------------------------------------------------------
// Loop handlers
// -----------------------------------------------------------------------------
// Each handler is the last line of defence for its loop: a data integrity
// error or a bad message fails that one event, is logged, and the loop keeps
// draining.
// -----------------------------------------------------------------------------
void CopyTradingEngine::handleWhaleTrade(const WhaleTradeEvent& event) {
  try {
    if (event.trade.side == domain::Side::Sell) {
      queueExits(onWhaleExit(event.trade));
      return;
    }
    CopyDecision decision = evaluateTrade(event.trade);
    if (decision.approved && decision.order) {
      execution_loop_.push(std::move(*decision.order));
    }
  } catch (const std::exception& e) {
    std::cerr << "[CopyTradingEngine] WARNING: whale trade "
              << event.trade.trade_id << " from " << event.trade.whale_address
              << " failed: " << e.what() << "\n";
  }
}

void CopyTradingEngine::handlePriceUpdate(const PriceUpdateEvent& event) {
  try {
    queueExits(onPriceUpdate(event));
  } catch (const std::exception& e) {
    std::cerr << "[CopyTradingEngine] WARNING: price update for "
              << event.token_id << " failed: " << e.what() << "\n";
  }
}

void CopyTradingEngine::handleWhaleProfile(const WhaleProfileEvent& event) {
  try {
    queueExits(onWhaleProfile(event.profile));
  } catch (const std::exception& e) {
    std::cerr << "[CopyTradingEngine] WARNING: profile update for "
              << event.profile.address << " failed: " << e.what() << "\n";
  }
}

void CopyTradingEngine::handleHeartbeat(const HeartbeatEvent& event) {
  try {
    queueExits(runMaintenance());
  } catch (const std::exception& e) {
    std::cerr << "[CopyTradingEngine] WARNING: maintenance (" << event.component_id
              << ") failed: " << e.what() << "\n";
  }
}

void CopyTradingEngine::handleCopyOrder(const CopyOrderEvent& event) {
  try {
    executeCopy(event);
  } catch (const std::exception& e) {
    std::cerr << "[CopyTradingEngine] CRITICAL: copy order "
              << event.request.idempotency_key << " failed: " << e.what() << "\n";
  }
}

void CopyTradingEngine::handleExitSignal(const ExitSignalEvent& event) {
  try {
    executeExit(event.signal);
  } catch (const std::exception& e) {
    std::cerr << "[CopyTradingEngine] CRITICAL: exit for "
              << event.signal.position_id << " failed: " << e.what() << "\n";
  }
}

void CopyTradingEngine::queueExits(const std::vector<ExitSignal>& signals) {
  const Timestamp now = ms_to_timestamp(clock_.now_ms());
  for (const auto& signal : signals) {
    execution_loop_.push(ExitSignalEvent{signal, now, next_sequence_.fetch_add(1)});
  }
}

// -----------------------------------------------------------------------------
// Market state
// -----------------------------------------------------------------------------
std::vector<ExitSignal> CopyTradingEngine::onWhaleProfile(
    const domain::WhaleProfile& profile) {
  {
    std::unique_lock lock(market_mutex_);
    whales_[profile.address] = profile;
  }

  const QuarantineChange change = risk_.onWhaleProfile(profile);
  std::vector<ExitSignal> exits;
  if (change != QuarantineChange::Quarantined ||
      config_.risk.quarantine_policy != domain::QuarantinePolicy::Liquidate) {
    return exits;
  }

  for (const auto& position : ledger_.forWhale(profile.address)) {
    if (position.status != PositionStatus::Open) {
      continue;
    }
    if (auto signal = ledger_.beginClose(position.position_id, CloseReason::Manual,
                                         "Whale quarantined")) {
      exits.push_back(std::move(*signal));
    }
  }
  std::cout << "[CopyTradingEngine] Liquidating " << exits.size()
            << " position(s) of quarantined whale " << profile.address << "\n";
  return exits;
}

void CopyTradingEngine::onMarketInfo(const domain::MarketInfo& market) {
  std::unique_lock lock(market_mutex_);
  markets_[market.market_id] = market;
}

void CopyTradingEngine::onOrderBook(const domain::OrderBook& book) {
  std::unique_lock lock(market_mutex_);
  books_[book.token_id] = book;
}

// -----------------------------------------------------------------------------
// evaluateTrade(trade)
// -----------------------------------------------------------------------------
// Gate order: duplicate guard, filter stages 1-3, sizing (stage 4), risk
// reservation (stage 5). The copy key is claimed up front so two deliveries
// of one trade can never both pass; every rejection gives it back.
// -----------------------------------------------------------------------------
CopyDecision CopyTradingEngine::evaluateTrade(const domain::WhaleTrade& trade) {
  if (trade.side != domain::Side::Buy) {
    return reject(trade, 0, "NotABuy", "Whale sells are handled as exits");
  }

  const std::string key = copyKey(trade);
  {
    std::lock_guard lock(keys_mutex_);
    if (!copy_keys_.insert(key).second) {
      return reject(trade, 0, "DuplicateSignal", "Trade already copied");
    }
  }
  auto release_key = [this, &key] {
    std::lock_guard lock(keys_mutex_);
    copy_keys_.erase(key);
  };

  // --- Stages 1-3 ---------------------------------------------------------
  const SignalContext context = buildContext(trade);
  FilterResult filtered = filter_.evaluate(trade, context);
  if (!filtered.approved || !filtered.intent) {
    release_key();
    return reject(trade, static_cast<int>(filtered.stage), toString(filtered.code),
                  filtered.reason);
  }
  const TradeIntent& intent = *filtered.intent;

  // --- Stage 4: sizing ----------------------------------------------------
  const domain::RiskState risk = risk_.snapshot();
  SizingInput input;
  input.whale_win_rate = intent.whale.win_rate.value_or(0.0);
  input.market_price = intent.market_price;
  input.whale_quality_score = intent.whale.quality_score.value_or(0.0);
  input.market_vol = volatility_.ewmaVariance(trade.token_id);
  input.portfolio_correlation = intent.weighted_correlation;
  input.portfolio_drawdown = risk.drawdown();
  input.size_multiplier = risk.size_multiplier;
  input.nav = risk.nav;
  const SizingResult sizing = sizer_.size(input);
  if (!sizing.tradeable()) {
    release_key();
    CopyDecision decision = reject(trade, 4, "ZeroSize", "Position size is zero");
    decision.intent = intent;
    decision.sizing = sizing;
    return decision;
  }

  // --- Stage 5: risk reservation -----------------------------------------
  RiskRequest request;
  request.whale_address = trade.whale_address;
  request.market_id = trade.market_id;
  request.category = intent.market.category;
  request.notional_usd = sizing.notional;
  const RiskDecision verdict = risk_.reserve(key, request);
  if (!verdict.approved) {
    release_key();
    CopyDecision decision = reject(trade, 5, "RiskVeto", verdict.reason);
    decision.intent = intent;
    decision.sizing = sizing;
    return decision;
  }

  CopyOrderEvent order;
  order.request.idempotency_key = key;
  order.request.token_id = trade.token_id;
  order.request.market_id = trade.market_id;
  order.request.side = domain::Side::Buy;
  order.request.size = sizing.size;
  order.request.price = intent.limit_price;
  order.request.order_type = config_.execution.default_order_type;
  order.request.whale_address = trade.whale_address;

  order.open.whale_address = trade.whale_address;
  order.open.token_id = trade.token_id;
  order.open.market_id = trade.market_id;
  order.open.category = intent.market.category;
  order.open.side = trade.outcome;
  order.open.kelly_fraction = sizing.f_final;
  order.open.edge = intent.edge;
  order.open.win_rate = input.whale_win_rate;
  order.open.resolution_time_ms = intent.market.resolution_time_ms;

  order.reservation_id = key;
  order.timestamp = ms_to_timestamp(clock_.now_ms());
  order.sequence_id = next_sequence_.fetch_add(1);

  std::cout << "[CopyTradingEngine] APPROVED " << key << " token=" << trade.token_id
            << " f=" << sizing.f_final << " notional=" << sizing.notional
            << " size=" << sizing.size << " limit=" << intent.limit_price << "\n";

  CopyDecision decision;
  decision.approved = true;
  decision.stage = 5;
  decision.code = toString(FilterCode::Approved);
  decision.intent = intent;
  decision.sizing = sizing;
  decision.order = std::move(order);
  return decision;
}

CopyDecision CopyTradingEngine::reject(const domain::WhaleTrade& trade, int stage,
                                       std::string code, std::string reason) {
  std::cout << "[CopyTradingEngine] REJECTED whale=" << trade.whale_address
            << " market=" << trade.market_id << " stage=" << stage
            << " code=" << code << " reason=" << reason << "\n";

  SignalRejectedEvent event;
  event.whale_address = trade.whale_address;
  event.market_id = trade.market_id;
  event.token_id = trade.token_id;
  event.stage = stage;
  event.code = code;
  event.reason = reason;
  event.timestamp = ms_to_timestamp(clock_.now_ms());
  event.sequence_id = next_sequence_.fetch_add(1);
  telemetry_.publish(event);

  CopyDecision decision;
  decision.approved = false;
  decision.stage = stage;
  decision.code = std::move(code);
  decision.reason = std::move(reason);
  return decision;
}

std::string CopyTradingEngine::copyKey(const domain::WhaleTrade& trade) {
  std::string key = kCopyKeyPrefix + trade.whale_address + ":";
  if (!trade.trade_id.empty()) {
    return key + trade.trade_id;
  }
  return key + trade.market_id + ":" + trade.token_id + ":" +
         std::to_string(trade.timestamp_ms);
}

std::string CopyTradingEngine::closeKey(const domain::PositionId& position_id) {
  std::lock_guard lock(keys_mutex_);
  const int attempt = ++close_attempts_[position_id];
  return kCloseKeyPrefix + position_id + ":" + std::to_string(attempt);
}

// -----------------------------------------------------------------------------
// buildContext(trade)
// -----------------------------------------------------------------------------
// A token without a cached book gets one fetched from the exchange. A fetch
// failure leaves the book empty and the trade gate rejects on depth.
// -----------------------------------------------------------------------------
SignalContext CopyTradingEngine::buildContext(const domain::WhaleTrade& trade) {
  SignalContext context;
  context.now_ms = clock_.now_ms();
  {
    std::shared_lock lock(market_mutex_);
    if (auto it = whales_.find(trade.whale_address); it != whales_.end()) {
      context.whale = it->second;
    }
    if (auto it = markets_.find(trade.market_id); it != markets_.end()) {
      context.market = it->second;
    }
    if (auto it = books_.find(trade.token_id); it != books_.end()) {
      context.book = it->second;
    }
  }

  if (!context.book) {
    try {
      domain::OrderBook book = executor_.fetchOrderBook(trade.token_id);
      if (book.token_id.empty()) {
        book.token_id = trade.token_id;
      }
      onOrderBook(book);
      context.book = std::move(book);
    } catch (const ExchangeError& e) {
      std::cerr << "[CopyTradingEngine] WARNING: no order book for "
                << trade.token_id << ": " << e.what() << "\n";
    }
  }

  const domain::RiskState risk = risk_.snapshot();
  context.portfolio.nav = risk.nav;
  context.portfolio.total_exposure = risk.openExposure();
  for (const auto* book : {&risk.exposure, &risk.reserved}) {
    for (const auto& [category, usd] : book->by_category) {
      context.portfolio.category_exposure[category] += usd;
    }
  }
  for (const auto& position : ledger_.live()) {
    ExposureLeg leg;
    leg.market_id = position.market_id;
    leg.category = position.category;
    leg.resolution_time_ms = position.resolution_time_ms;
    leg.exposure_usd = entryExposure(position);
    context.portfolio.open_legs.push_back(std::move(leg));
  }
  return context;
}

// -----------------------------------------------------------------------------
// executeCopy(order)
// -----------------------------------------------------------------------------
// Whatever happens to the order, the reservation is either settled into
// exposure (filled part) or released. A position is opened only for a fill.
// -----------------------------------------------------------------------------
ExecutionReport CopyTradingEngine::executeCopy(const CopyOrderEvent& order) {
  ExecutionReport report;
  try {
    report = executor_.execute(order.request);
  } catch (const std::exception&) {
    risk_.releaseReservation(order.reservation_id);
    throw;
  }

  if (!report.created) {
    std::cout << "[CopyTradingEngine] " << order.request.idempotency_key
              << " was already executed as " << report.order.order_id << "\n";
    return report;
  }

  if (!report.filled()) {
    risk_.releaseReservation(order.reservation_id);
    std::cout << "[CopyTradingEngine] " << order.request.idempotency_key
              << " ended " << domain::toString(report.order.state)
              << " with no fill, reservation released\n";
    return report;
  }

  risk_.settleReservation(order.reservation_id,
                          report.total_filled * report.avg_fill_price);
  const Position position =
      ledger_.openPosition(order.open, report.total_filled, report.avg_fill_price);
  risk_.updateUnrealized(ledger_.totalUnrealized());

  std::cout << "[CopyTradingEngine] FILLED " << order.request.idempotency_key
            << " " << report.total_filled << " @ " << report.avg_fill_price
            << " -> " << position.position_id << "\n";
  return report;
}

// -----------------------------------------------------------------------------
// onWhaleExit(trade)
// -----------------------------------------------------------------------------
std::vector<ExitSignal> CopyTradingEngine::onWhaleExit(const domain::WhaleTrade& trade) {
  const auto flagged = ledger_.markWhaleExit(trade.whale_address, trade.token_id);
  if (flagged.empty()) {
    std::cout << "[CopyTradingEngine] Whale " << trade.whale_address
              << " sold " << trade.token_id << ", no copied position, ignored\n";
    return {};
  }
  return ledger_.evaluateExits();
}

// -----------------------------------------------------------------------------
// onPriceUpdate(update)
// -----------------------------------------------------------------------------
// A tick without a usable price falls back to the mid of its book.
// -----------------------------------------------------------------------------
std::vector<ExitSignal> CopyTradingEngine::onPriceUpdate(const PriceUpdateEvent& update) {
  double price = update.price;
  if (update.book) {
    domain::OrderBook book = *update.book;
    if (book.token_id.empty()) {
      book.token_id = update.token_id;
    }
    if (!(price > 0.0)) {
      price = book.mid().value_or(0.0);
    }
    onOrderBook(book);
  }
  if (!(price > 0.0 && price < 1.0)) {
    std::cerr << "[CopyTradingEngine] WARNING: price update for "
              << update.token_id << " has no usable price\n";
    return {};
  }

  volatility_.observe(update.token_id, price);
  ledger_.applyPrice(update.token_id, price);
  risk_.updateUnrealized(ledger_.totalUnrealized());
  return ledger_.evaluateExits();
}

// -----------------------------------------------------------------------------
// executeExit(signal)
// -----------------------------------------------------------------------------
// Every close attempt gets a fresh idempotency key. The limit sits the
// configured slippage below the trigger price so a falling book still fills.
// -----------------------------------------------------------------------------
std::optional<CloseResult> CopyTradingEngine::executeExit(const ExitSignal& signal) {
  OrderRequest request;
  request.idempotency_key = closeKey(signal.position_id);
  request.token_id = signal.token_id;
  request.market_id = signal.market_id;
  request.side = domain::Side::Sell;
  request.size = signal.size;
  request.price =
      domain::clampPrice(signal.token_price * (1.0 - config_.filter.max_slippage));
  request.order_type = config_.execution.default_order_type;
  request.whale_address = signal.whale_address;
  request.position_id = signal.position_id;

  std::cout << "[CopyTradingEngine] EXIT " << signal.position_id << " reason="
            << domain::toString(signal.reason) << " size=" << signal.size
            << " limit=" << *request.price
            << (signal.detail.empty() ? "" : " (" + signal.detail + ")") << "\n";

  ExecutionReport report;
  try {
    report = executor_.execute(request);
  } catch (const std::exception& e) {
    ledger_.abortClose(signal.position_id, e.what());
    throw;
  }

  if (!report.filled()) {
    ledger_.abortClose(signal.position_id,
                       std::string("Closing order ended ") +
                           domain::toString(report.order.state) + " unfilled");
    return std::nullopt;
  }

  CloseResult result = ledger_.applyCloseFill(
      signal.position_id, report.total_filled, report.avg_fill_price, signal.reason);
  risk_.recordTradeResult(signal.whale_address, result.realized_delta);
  risk_.releaseExposure(signal.whale_address, signal.market_id,
                        result.position.category, result.released_cost);
  risk_.updateUnrealized(ledger_.totalUnrealized());

  if (!result.fully_closed) {
    std::cout << "[CopyTradingEngine] " << signal.position_id << " closed "
              << result.closed_size << ", " << result.position.current_size
              << " left open\n";
  }
  return result;
}

// -----------------------------------------------------------------------------
// runMaintenance()
// -----------------------------------------------------------------------------
std::vector<ExitSignal> CopyTradingEngine::runMaintenance() {
  for (const auto& whale : risk_.maintain()) {
    std::cout << "[CopyTradingEngine] Whale " << whale
              << " released from quarantine\n";
  }

  const auto swept = executor_.sweepStale();
  if (!swept.empty()) {
    std::cout << "[CopyTradingEngine] Stale sweep cancelled " << swept.size()
              << " order(s)\n";
  }

  std::vector<ExitSignal> exits = ledger_.evaluateExits();
  ledger_.archiveClosed();
  return exits;
}

// -----------------------------------------------------------------------------
// Query surface
// -----------------------------------------------------------------------------
double CopyTradingEngine::totalExposure() const { return ledger_.totalExposure(); }

std::map<PositionStatus, std::size_t> CopyTradingEngine::positionCounts() const {
  return ledger_.countsByStatus();
}

PerformanceSummary CopyTradingEngine::performance() const {
  const domain::RiskState risk = risk_.snapshot();
  PerformanceSummary summary;
  summary.nav = risk.nav;
  summary.portfolio_value = risk.portfolio_value;
  summary.daily_pnl = risk.dailyPnl();
  summary.drawdown = risk.drawdown();
  summary.realized_pnl = ledger_.totalRealized();
  summary.unrealized_pnl = ledger_.totalUnrealized();

  for (const auto& position : ledger_.all()) {
    if (position.isLive()) {
      ++summary.open_positions;
      continue;
    }
    ++summary.closed_positions;
    if (position.realized_pnl > 0.0) {
      ++summary.winning_positions;
    } else if (position.realized_pnl < 0.0) {
      ++summary.losing_positions;
    }
  }
  return summary;
}

std::vector<Position> CopyTradingEngine::positionsRequiringAction() const {
  return ledger_.requiringAction();
}

std::vector<Position> CopyTradingEngine::positionsForWhale(
    const std::string& whale_address) const {
  return ledger_.forWhale(whale_address);
}

RiskDecision CopyTradingEngine::checkLimits(const RiskRequest& request) const {
  return risk_.evaluate(request);
}

std::vector<domain::Order> CopyTradingEngine::deadLetters() const {
  return executor_.deadLetters();
}

std::vector<domain::OrderTransition> CopyTradingEngine::orderHistory(
    const domain::OrderId& order_id) const {
  return executor_.transitionsFor(order_id);
}

domain::RiskState CopyTradingEngine::riskSnapshot() const { return risk_.snapshot(); }

// -----------------------------------------------------------------------------
// executeCommand(): handle IPC command requests
// -----------------------------------------------------------------------------
std::string CopyTradingEngine::executeCommand(const std::string& cmd) {
  std::istringstream in(cmd);
  std::string verb;
  std::string arg;
  in >> verb >> arg;

  nlohmann::json response;

  if (verb == "PING") {
    response["status"] = "ok";
    response["response"] = "PONG";
  } else if (verb == "STATUS") {
    const domain::RiskState risk = risk_.snapshot();
    const PerformanceSummary perf = performance();
    response["status"] = "ok";
    response["halted"] = risk_.tradingHalted();
    response["breaker"] = domain::toString(risk.breaker);
    response["breaker_reason"] = risk.circuit_breaker_reason;
    response["size_multiplier"] = risk.size_multiplier;
    response["nav"] = perf.nav;
    response["portfolio_value"] = perf.portfolio_value;
    response["daily_pnl"] = perf.daily_pnl;
    response["drawdown"] = perf.drawdown;
    response["realized_pnl"] = perf.realized_pnl;
    response["unrealized_pnl"] = perf.unrealized_pnl;
    response["win_rate"] = perf.winRate();
    response["quarantined_whales"] = risk.quarantined_whales;

    nlohmann::json counts = nlohmann::json::object();
    for (const auto& [status, n] : positionCounts()) {
      counts[domain::toString(status)] = n;
    }
    response["positions"] = std::move(counts);
    response["dead_letters"] = deadLetters().size();
  } else if (verb == "EXPOSURE") {
    const domain::RiskState risk = risk_.snapshot();
    response["status"] = "ok";
    response["total_exposure"] = totalExposure();
    response["filled"] = exposureJson(risk.exposure);
    response["reserved"] = exposureJson(risk.reserved);
  } else if (verb == "POSITIONS") {
    response["status"] = "ok";
    response["positions"] =
        positionsJson(arg.empty() ? ledger_.all() : positionsForWhale(arg));
  } else if (verb == "ACTION") {
    response["status"] = "ok";
    response["positions"] = positionsJson(positionsRequiringAction());
  } else if (verb == "DEAD_LETTER") {
    nlohmann::json orders = nlohmann::json::array();
    for (const auto& order : deadLetters()) {
      orders.emplace_back(order);
    }
    response["status"] = "ok";
    response["orders"] = std::move(orders);
  } else if (verb == "TRANSITIONS") {
    if (arg.empty()) {
      response["status"] = "error";
      response["response"] = "TRANSITIONS needs an order id";
    } else {
      nlohmann::json history = nlohmann::json::array();
      for (const auto& transition : orderHistory(arg)) {
        history.emplace_back(transition);
      }
      response["status"] = "ok";
      response["order_id"] = arg;
      response["transitions"] = std::move(history);
    }
  } else if (verb == "HALT") {
    risk_.haltTrading("Manual halt via IPC");
    response["status"] = "ok";
    response["response"] = "Trading halted";
  } else if (verb == "RESET") {
    risk_.resetCircuitBreaker();
    response["status"] = "ok";
    response["response"] = "Circuit breakers reset";
  } else {
    response["status"] = "error";
    response["response"] = "Unknown command: " + cmd;
  }

  return response.dump();
}

}  // namespace whalecopy
