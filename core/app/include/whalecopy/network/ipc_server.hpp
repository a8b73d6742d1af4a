#pragma once

#include "whalecopy/concurrent/thread_safe_queue.hpp"
#include "whalecopy/events/event.hpp"

#include <zmq.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace whalecopy {

// -----------------------------------------------------------------------------
// IpcServer - ZeroMQ monitoring surface: commands in, telemetry out
// -----------------------------------------------------------------------------
//
// @brief  One worker thread serving a REP command socket and a PUB
//         telemetry socket.
//
// @details
//   REP socket (default tcp://127.0.0.1:5556):
//     Each request is a command line ("STATUS", "POSITIONS 0xabc", ...)
//     handed to command_handler_ (CopyTradingEngine::executeCommand). The
//     handler's JSON reply is sent back.
//
//   PUB socket (default tcp://127.0.0.1:5557):
//     OrderUpdateEvent, PositionUpdateEvent, RiskAlertEvent and
//     SignalRejectedEvent are queued with pushTelemetry() from whichever
//     thread produced them and published as one JSON document each. Other
//     event types are dropped.
//
// The REP socket has a receive timeout, so the worker alternates between
// draining telemetry and waiting for a command.
//
// Thread model:
//   start()/stop() from the owning thread. pushTelemetry() from any thread.
//   command_handler_ runs on the IPC worker thread.
//
// Ownership: owned by CopyTradingEngine via std::unique_ptr. Owns the ZMQ
// context, both sockets, the telemetry queue and the worker thread.
// -----------------------------------------------------------------------------
class IpcServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  explicit IpcServer(CommandHandler command_handler,
                     std::string cmd_endpoint = "tcp://127.0.0.1:5556",
                     std::string pub_endpoint = "tcp://127.0.0.1:5557");

  ~IpcServer();

  IpcServer(const IpcServer&) = delete;
  IpcServer& operator=(const IpcServer&) = delete;
  IpcServer(IpcServer&&) = delete;
  IpcServer& operator=(IpcServer&&) = delete;

  // Binds both sockets and spawns the worker. Idempotent.
  void start();

  // Joins the worker after a final telemetry drain, then closes the
  // sockets. Idempotent.
  void stop();

  void pushTelemetry(Event event);

  // -------------------------------------------------------------------------
  // formatTelemetry(event)
  // -------------------------------------------------------------------------
  // @return The JSON document published for `event`, or std::nullopt for
  //         event types that are not telemetry.
  //
  // Every document has a "type" field: "order_update", "position_update",
  // "risk_alert" or "signal_rejected".
  // -------------------------------------------------------------------------
  static std::optional<std::string> formatTelemetry(const Event& event);

 private:
  static constexpr int kPollTimeoutMs = 50;

  void run();
  void processTelemetry();
  void processCommands();

  CommandHandler command_handler_;
  std::string cmd_endpoint_;
  std::string pub_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> cmd_socket_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  ThreadSafeQueue<Event> telemetry_queue_;
  std::thread thread_;
  std::atomic<bool> running_{false};
};

}  // namespace whalecopy
