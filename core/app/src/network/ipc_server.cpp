#include "whalecopy/network/ipc_server.hpp"
#include "whalecopy/domain/enum_strings.hpp"
#include "whalecopy/persistence/json_codec.hpp"
#include "whalecopy/time/time_utils.hpp"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <exception>
#include <iostream>
#include <utility>

namespace whalecopy {

IpcServer::IpcServer(CommandHandler command_handler, std::string cmd_endpoint,
                     std::string pub_endpoint)
    : command_handler_(std::move(command_handler)),
      cmd_endpoint_(std::move(cmd_endpoint)),
      pub_endpoint_(std::move(pub_endpoint)) {}

IpcServer::~IpcServer() { stop(); }

// -----------------------------------------------------------------------------
// start(): create sockets and spawn worker thread
// -----------------------------------------------------------------------------
void IpcServer::start() {
  if (running_.load()) {
    return;
  }

  context_ = std::make_unique<zmq::context_t>(1);
  cmd_socket_ = std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::rep);
  pub_socket_ = std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::pub);

  cmd_socket_->set(zmq::sockopt::rcvtimeo, kPollTimeoutMs);
  cmd_socket_->bind(cmd_endpoint_);
  pub_socket_->bind(pub_endpoint_);

  running_.store(true);
  thread_ = std::thread([this] { run(); });

  std::cout << "[IpcServer] started. CMD=" << cmd_endpoint_
            << " PUB=" << pub_endpoint_ << "\n";
}

// -----------------------------------------------------------------------------
// stop(): signal and join
// -----------------------------------------------------------------------------
void IpcServer::stop() {
  if (!running_.load()) {
    if (thread_.joinable()) {
      thread_.join();
    }
    return;
  }

  running_.store(false);
  if (thread_.joinable()) {
    thread_.join();
  }

  cmd_socket_.reset();
  pub_socket_.reset();
  context_.reset();

  std::cout << "[IpcServer] stopped.\n";
}

void IpcServer::pushTelemetry(Event event) {
  telemetry_queue_.push(std::move(event));
}

void IpcServer::run() {
  while (running_.load()) {
    processTelemetry();
    processCommands();
  }
  processTelemetry();
}

void IpcServer::processTelemetry() {
  while (auto event = telemetry_queue_.try_pop()) {
    auto json_str = formatTelemetry(*event);
    if (json_str.has_value()) {
      zmq::message_t msg(json_str->data(), json_str->size());
      pub_socket_->send(msg, zmq::send_flags::dontwait);
    }
  }
}

// -----------------------------------------------------------------------------
// processCommands(): poll REP socket and dispatch
// -----------------------------------------------------------------------------
// A REP socket must answer every request before it can receive the next
// one, so a handler exception is turned into an error reply.
// -----------------------------------------------------------------------------
void IpcServer::processCommands() {
  zmq::message_t request;
  zmq::recv_result_t result;

  try {
    result = cmd_socket_->recv(request, zmq::recv_flags::none);
  } catch (const zmq::error_t& e) {
    if (e.num() == EINTR) {
      return;
    }
    throw;
  }

  if (!result.has_value()) {
    return;
  }

  const std::string cmd(static_cast<const char*>(request.data()), request.size());
  std::string response;
  try {
    response = command_handler_(cmd);
  } catch (const std::exception& e) {
    std::cerr << "[IpcServer] WARNING: command '" << cmd << "' failed: "
              << e.what() << "\n";
    response = nlohmann::json{{"status", "error"}, {"message", e.what()}}.dump();
  }

  zmq::message_t reply(response.data(), response.size());
  cmd_socket_->send(reply, zmq::send_flags::none);
}

// -----------------------------------------------------------------------------
// formatTelemetry(): Event variant -> JSON document
// -----------------------------------------------------------------------------
std::optional<std::string> IpcServer::formatTelemetry(const Event& event) {
  nlohmann::json j;
  if (const auto* e = std::get_if<OrderUpdateEvent>(&event)) {
    j["type"] = "order_update";
    j["order"] = e->order;
    j["previous_state"] =
        e->previous_state ? nlohmann::json(domain::toString(*e->previous_state))
                          : nlohmann::json(nullptr);
    j["reason"] = e->reason;
    j["sequence_id"] = e->sequence_id;
    j["timestamp_ms"] = timestamp_to_ms(e->timestamp);
  } else if (const auto* e = std::get_if<PositionUpdateEvent>(&event)) {
    j["type"] = "position_update";
    j["update_type"] = domain::toString(e->update_type);
    j["position"] = e->position;
    j["sequence_id"] = e->sequence_id;
    j["timestamp_ms"] = timestamp_to_ms(e->timestamp);
  } else if (const auto* e = std::get_if<RiskAlertEvent>(&event)) {
    j["type"] = "risk_alert";
    j["kind"] = toString(e->kind);
    j["subject"] = e->subject;
    j["reason"] = e->reason;
    j["current_value"] = e->current_value;
    j["limit_value"] = e->limit_value;
    j["timestamp_ms"] = timestamp_to_ms(e->timestamp);
  } else if (const auto* e = std::get_if<SignalRejectedEvent>(&event)) {
    j["type"] = "signal_rejected";
    j["whale_address"] = e->whale_address;
    j["market_id"] = e->market_id;
    j["token_id"] = e->token_id;
    j["stage"] = e->stage;
    j["code"] = e->code;
    j["reason"] = e->reason;
    j["timestamp_ms"] = timestamp_to_ms(e->timestamp);
  } else {
    return std::nullopt;
  }
  return j.dump();
}

}  // namespace whalecopy
