#pragma once

#include "whalecopy/audit/audit_trail.hpp"
#include "whalecopy/concurrent/event_loop_thread.hpp"
#include "whalecopy/config/engine_config.hpp"
#include "whalecopy/domain/market.hpp"
#include "whalecopy/domain/position.hpp"
#include "whalecopy/domain/risk_state.hpp"
#include "whalecopy/domain/whale.hpp"
#include "whalecopy/eventbus/event_bus.hpp"
#include "whalecopy/events/event.hpp"
#include "whalecopy/execution/i_exchange_client.hpp"
#include "whalecopy/execution/order_executor.hpp"
#include "whalecopy/ledger/position_ledger.hpp"
#include "whalecopy/network/feed_thread.hpp"
#include "whalecopy/network/ipc_server.hpp"
#include "whalecopy/persistence/order_store.hpp"
#include "whalecopy/risk/risk_manager.hpp"
#include "whalecopy/signal/signal_filter_pipeline.hpp"
#include "whalecopy/sizing/position_sizer.hpp"
#include "whalecopy/sizing/volatility_tracker.hpp"
#include "whalecopy/time/i_time_provider.hpp"
#include "whalecopy/time/simulation_time_provider.hpp"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <thread>
#include <vector>

namespace whalecopy {

// -----------------------------------------------------------------------------
// CopyDecision - outcome of running one whale trade through the gates
// -----------------------------------------------------------------------------
// stage: 1-3 filter stages, 4 sizing, 5 risk veto, 0 for trades that never
// entered the gates (duplicates, sells). `order` is set only when approved;
// its reservation is already booked with RiskManager.
// -----------------------------------------------------------------------------
struct CopyDecision {
  bool approved{false};
  int stage{0};
  std::string code;
  std::string reason;
  std::optional<TradeIntent> intent;
  SizingResult sizing;
  std::optional<CopyOrderEvent> order;
};

// Portfolio performance summary served by the query surface.
struct PerformanceSummary {
  double nav{0.0};
  double portfolio_value{0.0};
  double realized_pnl{0.0};
  double unrealized_pnl{0.0};
  double daily_pnl{0.0};
  double drawdown{0.0};
  std::size_t open_positions{0};
  std::size_t closed_positions{0};
  std::size_t winning_positions{0};
  std::size_t losing_positions{0};

  double winRate() const {
    const std::size_t decided = winning_positions + losing_positions;
    return decided > 0 ? static_cast<double>(winning_positions) / decided : 0.0;
  }
};

// -----------------------------------------------------------------------------
// CopyTradingEngine
// -----------------------------------------------------------------------------
//
// @brief  Owns every component and thread of the copy-trading core and wires
//         the whale-signal-to-execution pipeline.
//
// @details
// Pipeline:
//   WhaleTradeEvent --signal_loop--> SignalFilterPipeline -> PositionSizer
//     -> RiskManager::reserve -> CopyOrderEvent --execution_loop-->
//     OrderExecutor -> PositionLedger::openPosition
//   PriceUpdateEvent --signal_loop--> PositionLedger (revalue, exits)
//     -> ExitSignalEvent --execution_loop--> closing order -> ledger close
//     -> RiskManager::recordTradeResult
//
// Thread layout:
//
//   signal_loop      whale trades, prices, profiles, markets, heartbeats
//   execution_loop   copy orders and exit signals (blocking lifecycles)
//   maintenance      pushes a HeartbeatEvent every maintenance_interval_ms
//   feed thread      FeedGateway ZMQ recv loop (if feed_endpoint is set)
//   IPC thread       IpcServer REP/PUB (if both IPC endpoints are set)
//   caller           start(), stop(), queries
//
// The synchronous entry points (evaluateTrade, executeCopy, onPriceUpdate,
// executeExit, runMaintenance, ...) are what the loop handlers call. They
// are public so a test or a replay driver can run the pipeline step by
// step on its own thread without start().
//
// Telemetry: every component emits through one EventBus (telemetryBus()),
// published synchronously on the producing thread. IpcServer, when
// running, subscribes to it.
//
// Ownership:
//   CopyTradingEngine
//    ├── clock_, exchange         (non-owning, must outlive the engine)
//    ├── audit_                   (unique_ptr<AuditTrail>)
//    ├── store_, telemetry_       (value members)
//    ├── risk_, executor_, ledger_, filter_, sizer_, volatility_
//    ├── signal_loop_, execution_loop_ (EventLoopThread)
//    ├── maintenance_thread_      (std::thread)
//    ├── feed_thread_             (unique_ptr<FeedThread>)
//    └── ipc_server_              (unique_ptr<IpcServer>)
//
// stop() joins every thread before any component is destroyed.
// -----------------------------------------------------------------------------
class CopyTradingEngine {
 public:
  // `replay_clock`, when given, is advanced by the feed to each message's
  // timestamp (recorded-session replay). It is usually the same object as
  // `clock`.
  CopyTradingEngine(const ITimeProvider& clock, IExchangeClient& exchange,
                    EngineConfig config,
                    SimulationTimeProvider* replay_clock = nullptr);

  ~CopyTradingEngine();

  CopyTradingEngine(const CopyTradingEngine&) = delete;
  CopyTradingEngine& operator=(const CopyTradingEngine&) = delete;
  CopyTradingEngine(CopyTradingEngine&&) = delete;
  CopyTradingEngine& operator=(CopyTradingEngine&&) = delete;

  // -------------------------------------------------------------------------
  // start()
  // -------------------------------------------------------------------------
  // @brief  Recovers state from the audit trail, then starts the loops, the
  //         maintenance thread, the IPC server and finally the feed.
  //
  // @details
  // Recovery rebuilds the order store and the ledger, re-books the exposure
  // of live positions with RiskManager and remembers every copy key already
  // used. The feed starts last so every subscriber is live before the first
  // message arrives. Idempotent.
  // -------------------------------------------------------------------------
  void start();

  // Stops inflow first, then joins every thread. Idempotent.
  void stop();

  bool running() const { return running_.load(); }

  // Queues an event on signal_loop (stamped with a sequence id).
  void pushEvent(Event event);

  // Push fills from the feed go straight to the executor.
  void onFillReport(const FillReport& report);

  // --- Synchronous pipeline steps -------------------------------------------

  // Caches the profile and feeds the quarantine review. Under the LIQUIDATE
  // policy a newly quarantined whale's open positions are put into CLOSING
  // and returned as exit signals.
  std::vector<ExitSignal> onWhaleProfile(const domain::WhaleProfile& profile);
  void onMarketInfo(const domain::MarketInfo& market);
  void onOrderBook(const domain::OrderBook& book);

  // Gates a BUY trade: filter, sizing, risk reservation.
  CopyDecision evaluateTrade(const domain::WhaleTrade& trade);

  // Places the copy order and books the fill in the ledger and with risk.
  ExecutionReport executeCopy(const CopyOrderEvent& order);

  // A whale SELL: flags the whale's copied positions on the token and
  // returns the exit signals that result.
  std::vector<ExitSignal> onWhaleExit(const domain::WhaleTrade& trade);

  // Revalues positions on the token and returns the exits it triggered.
  std::vector<ExitSignal> onPriceUpdate(const PriceUpdateEvent& update);

  // Places the closing order for an exit signal and books the result.
  // Returns nothing when the closing order filled nothing.
  std::optional<CloseResult> executeExit(const ExitSignal& signal);

  // Risk day rollover and quarantine review, stale order sweep, exit
  // evaluation, archival. Returns the exits to execute.
  std::vector<ExitSignal> runMaintenance();

  // --- Query surface --------------------------------------------------------

  double totalExposure() const;
  std::map<domain::PositionStatus, std::size_t> positionCounts() const;
  PerformanceSummary performance() const;
  std::vector<domain::Position> positionsRequiringAction() const;
  std::vector<domain::Position> positionsForWhale(const std::string& whale_address) const;
  RiskDecision checkLimits(const RiskRequest& request) const;
  std::vector<domain::Order> deadLetters() const;
  std::vector<domain::OrderTransition> orderHistory(const domain::OrderId& order_id) const;
  domain::RiskState riskSnapshot() const;

  // -------------------------------------------------------------------------
  // executeCommand(cmd)
  // -------------------------------------------------------------------------
  // @brief  IPC command handler. Returns a JSON document with "status"
  //         ("ok" or "error").
  //
  // Commands: PING, STATUS, EXPOSURE, POSITIONS [whale], ACTION,
  // DEAD_LETTER, TRANSITIONS <order_id>, HALT, RESET.
  // -------------------------------------------------------------------------
  std::string executeCommand(const std::string& cmd);

  // --- Component access -----------------------------------------------------

  EventBus& telemetryBus() { return telemetry_; }
  EventBus& signalBus() { return signal_loop_.eventBus(); }
  OrderExecutor& executor() { return executor_; }
  PositionLedger& ledger() { return ledger_; }
  RiskManager& risk() { return risk_; }
  AuditTrail& audit() { return *audit_; }
  const EngineConfig& config() const { return config_; }

 private:
  void wireLoops();
  void recover();
  void runMaintenanceThread();

  void handleWhaleTrade(const WhaleTradeEvent& event);
  void handlePriceUpdate(const PriceUpdateEvent& event);
  void handleWhaleProfile(const WhaleProfileEvent& event);
  void handleHeartbeat(const HeartbeatEvent& event);
  void handleCopyOrder(const CopyOrderEvent& event);
  void handleExitSignal(const ExitSignalEvent& event);

  void queueExits(const std::vector<ExitSignal>& signals);

  SignalContext buildContext(const domain::WhaleTrade& trade);
  CopyDecision reject(const domain::WhaleTrade& trade, int stage, std::string code,
                      std::string reason);
  static std::string copyKey(const domain::WhaleTrade& trade);
  std::string closeKey(const domain::PositionId& position_id);

  EventSink telemetrySink();

  const ITimeProvider& clock_;
  EngineConfig config_;
  SimulationTimeProvider* replay_clock_;

  EventBus telemetry_;
  std::unique_ptr<AuditTrail> audit_;
  OrderStore store_;
  RiskManager risk_;
  OrderExecutor executor_;
  PositionLedger ledger_;
  SignalFilterPipeline filter_;
  PositionSizer sizer_;
  VolatilityTracker volatility_;

  mutable std::shared_mutex market_mutex_;
  std::map<std::string, domain::WhaleProfile> whales_;
  std::map<std::string, domain::MarketInfo> markets_;
  std::map<std::string, domain::OrderBook> books_;

  std::mutex keys_mutex_;
  std::set<std::string> copy_keys_;
  std::map<domain::PositionId, int> close_attempts_;

  EventLoopThread signal_loop_{"signal_loop"};
  EventLoopThread execution_loop_{"execution_loop"};

  std::mutex maintenance_mutex_;
  std::condition_variable maintenance_cv_;
  std::thread maintenance_thread_;

  std::unique_ptr<FeedThread> feed_thread_;
  std::unique_ptr<IpcServer> ipc_server_;
  std::optional<EventBus::SubscriptionId> ipc_subscription_;

  bool recovered_{false};
  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> next_sequence_{1};
};

}  // namespace whalecopy
