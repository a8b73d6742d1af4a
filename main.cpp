// -----------------------------------------------------------------------------
// whalecopy - single executable entry point.
//
// Usage: whalecopy [config.json] [--replay]
//
//   1) Load EngineConfig (defaults when no path is given).
//   2) Pick the clock: LiveTimeProvider, or with --replay a
//      SimulationTimeProvider that the feed advances to each message's
//      timestamp (recorded-session replay).
//   3) Create a SimulatedExchangeClient (paper trading) and the
//      CopyTradingEngine, then start it. The engine spawns its own feed,
//      IPC, maintenance and loop threads.
//   4) Park the main thread until SIGINT, then stop the engine.
//
// Thread layout:
//   main thread        -> waits for SIGINT
//   signal_loop        -> filter, sizer, risk gate, exit evaluation
//   execution_loop     -> order lifecycles (copy and close)
//   feed / ipc threads -> ZeroMQ SUB and REP/PUB
// -----------------------------------------------------------------------------

#include "whalecopy/config/engine_config.hpp"
#include "whalecopy/engine/copy_trading_engine.hpp"
#include "whalecopy/errors.hpp"
#include "whalecopy/events/event.hpp"
#include "whalecopy/execution/simulated_exchange_client.hpp"
#include "whalecopy/time/live_time_provider.hpp"
#include "whalecopy/time/simulation_time_provider.hpp"

#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <utility>

// -----------------------------------------------------------------------------
// Shutdown flag for the SIGINT handler. Only an async-signal-safe store
// happens inside the handler; main() polls the flag.
// -----------------------------------------------------------------------------
static volatile std::sig_atomic_t g_shutdown_requested = 0;

static void sigint_handler(int /*signum*/) { g_shutdown_requested = 1; }

int main(int argc, char** argv) {
  std::string config_path;
  bool replay = false;
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--replay") {
      replay = true;
    } else if (config_path.empty()) {
      config_path = arg;
    } else {
      std::cerr << "Usage: " << argv[0] << " [config.json] [--replay]\n";
      return 2;
    }
  }

  // -------------------------------------------------------------------------
  // 1) Configuration
  // -------------------------------------------------------------------------
  whalecopy::EngineConfig config;
  if (!config_path.empty()) {
    try {
      config = whalecopy::loadEngineConfig(config_path);
    } catch (const whalecopy::ConfigError& e) {
      std::cerr << "[main] CRITICAL: " << e.what() << "\n";
      return 1;
    }
  }

  // -------------------------------------------------------------------------
  // 2) Clock
  // -------------------------------------------------------------------------
  whalecopy::LiveTimeProvider live_clock;
  whalecopy::SimulationTimeProvider replay_clock;
  const whalecopy::ITimeProvider& clock =
      replay ? static_cast<const whalecopy::ITimeProvider&>(replay_clock)
             : static_cast<const whalecopy::ITimeProvider&>(live_clock);

  // -------------------------------------------------------------------------
  // 3) Paper exchange + engine
  // -------------------------------------------------------------------------
  whalecopy::SimulatedExchangeClient exchange(clock);

  std::unique_ptr<whalecopy::CopyTradingEngine> engine;
  try {
    engine = std::make_unique<whalecopy::CopyTradingEngine>(
        clock, exchange, config, replay ? &replay_clock : nullptr);
  } catch (const std::exception& e) {
    std::cerr << "[main] CRITICAL: engine construction failed: " << e.what()
              << "\n";
    return 1;
  }

  // Price ticks carrying a book also feed the paper exchange, so copy and
  // close orders fill against what the feed last showed. Runs on signal_loop.
  engine->signalBus().subscribe<whalecopy::PriceUpdateEvent>(
      [&exchange](const whalecopy::PriceUpdateEvent& e) {
        if (e.book) {
          whalecopy::domain::OrderBook book = *e.book;
          book.token_id = e.token_id;
          exchange.setOrderBook(std::move(book));
        }
      });

  engine->telemetryBus().subscribe<whalecopy::OrderUpdateEvent>(
      [](const whalecopy::OrderUpdateEvent& e) {
        std::cout << "[OrderUpdate] " << e.order.order_id << " key="
                  << e.order.idempotency_key << " filled=" << e.order.filled_size
                  << "/" << e.order.size << " reason=" << e.reason << "\n";
      });

  engine->start();

  // -------------------------------------------------------------------------
  // 4) Wait for Ctrl-C
  // -------------------------------------------------------------------------
  std::signal(SIGINT, sigint_handler);
  std::signal(SIGTERM, sigint_handler);

  std::cout << "[main] Feed on " << config.network.feed_endpoint
            << ", commands on " << config.network.ipc_cmd_endpoint
            << ", telemetry on " << config.network.ipc_pub_endpoint << "\n"
            << "[main] Press Ctrl-C to shut down.\n";

  while (g_shutdown_requested == 0) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }

  std::cout << "\n[main] Shutdown requested. Stopping engine...\n";
  engine->stop();
  return 0;
}
