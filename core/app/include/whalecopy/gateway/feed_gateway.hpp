#pragma once

#include "whalecopy/events/event.hpp"
#include "whalecopy/execution/i_exchange_client.hpp"
#include "whalecopy/time/simulation_time_provider.hpp"

#include <zmq.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <string>

namespace whalecopy {

// -----------------------------------------------------------------------------
// FeedGateway - ZeroMQ bridge for whale trades, prices, fills and profiles
// -----------------------------------------------------------------------------
//
// @brief  Listens on a ZeroMQ SUB socket for JSON feed messages, decodes
//         them with decodeFeedMessage() and routes them into the engine.
//
// @details
// Routing:
//   - whale_trade, price, whale_profile, market -> event_sink_ (the
//     signal loop's queue).
//   - fill -> fill_sink_ (OrderExecutor::onFillReport), bypassing the
//     loops so a push fill never waits behind a lifecycle.
//
// Replay mode: when constructed with a SimulationTimeProvider, the clock
// is advanced to each message's timestamp_ms BEFORE the message is routed,
// so every component reading now_ms() while handling it sees the message
// time. A recorded session can then be replayed through the same socket.
//
// A message that fails to decode is logged with its payload and skipped.
//
// Thread model:
//   run() blocks the calling thread (the feed thread, see FeedThread).
//   stop() may be called from any thread; the recv loop re-checks the flag
//   after every kRecvTimeoutMs receive timeout.
//
// Ownership:
//   Owns the zmq::context_t and zmq::socket_t (RAII).
//   Holds copies of both sinks and an optional non-owning clock pointer.
// -----------------------------------------------------------------------------
class FeedGateway {
 public:
  using FillSink = std::function<void(const FillReport&)>;

  FeedGateway(EventSink event_sink, FillSink fill_sink, const std::string& endpoint,
              SimulationTimeProvider* replay_clock = nullptr);

  ~FeedGateway() = default;

  FeedGateway(const FeedGateway&) = delete;
  FeedGateway& operator=(const FeedGateway&) = delete;
  FeedGateway(FeedGateway&&) = delete;
  FeedGateway& operator=(FeedGateway&&) = delete;

  void run();
  void stop();

  // -------------------------------------------------------------------------
  // dispatch(payload)
  // -------------------------------------------------------------------------
  // @brief  Decodes and routes one raw message.
  //
  // @return false if the payload was malformed and skipped.
  //
  // Called by run() for every received message; exposed so the routing
  // can be driven without a socket.
  // -------------------------------------------------------------------------
  bool dispatch(const std::string& payload);

  std::uint64_t receivedCount() const { return received_.load(); }
  std::uint64_t rejectedCount() const { return rejected_.load(); }

 private:
  static constexpr int kRecvTimeoutMs = 100;

  EventSink event_sink_;
  FillSink fill_sink_;
  SimulationTimeProvider* replay_clock_;

  zmq::context_t context_{1};
  zmq::socket_t socket_{context_, zmq::socket_type::sub};

  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> received_{0};
  std::atomic<std::uint64_t> rejected_{0};
};

}  // namespace whalecopy
