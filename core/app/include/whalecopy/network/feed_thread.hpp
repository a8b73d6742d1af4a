#pragma once

#include "whalecopy/events/event.hpp"
#include "whalecopy/gateway/feed_gateway.hpp"
#include "whalecopy/time/simulation_time_provider.hpp"

#include <memory>
#include <string>
#include <thread>

namespace whalecopy {

// -----------------------------------------------------------------------------
// FeedThread - dedicated I/O thread for the whale/price/fill feed
// -----------------------------------------------------------------------------
//
// @brief  Owns a FeedGateway and the std::thread running its recv loop.
//
// @details
// The gateway is created in start(), not in the constructor, so the engine
// can construct this object early and only connect once recovery has
// finished and the loops are running.
//
// Thread model: start() and stop() are called from the owning thread
// (CopyTradingEngine::start/stop). The internal thread runs
// FeedGateway::run() exclusively.
//
// Ownership: owned by CopyTradingEngine via std::unique_ptr.
// -----------------------------------------------------------------------------
class FeedThread {
 public:
  FeedThread(EventSink event_sink, FeedGateway::FillSink fill_sink,
             std::string endpoint, SimulationTimeProvider* replay_clock = nullptr);

  ~FeedThread();

  FeedThread(const FeedThread&) = delete;
  FeedThread& operator=(const FeedThread&) = delete;
  FeedThread(FeedThread&&) = delete;
  FeedThread& operator=(FeedThread&&) = delete;

  // Opens the SUB socket and spawns the recv thread. Idempotent.
  void start();

  // Stops the gateway and joins. Idempotent.
  void stop();

 private:
  EventSink event_sink_;
  FeedGateway::FillSink fill_sink_;
  std::string endpoint_;
  SimulationTimeProvider* replay_clock_;

  std::unique_ptr<FeedGateway> gateway_;
  std::thread thread_;
};

}  // namespace whalecopy
