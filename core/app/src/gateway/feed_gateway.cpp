#include "whalecopy/gateway/feed_gateway.hpp"
#include "whalecopy/gateway/feed_codec.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <stdexcept>
#include <utility>

namespace whalecopy {

FeedGateway::FeedGateway(EventSink event_sink, FillSink fill_sink,
                         const std::string& endpoint,
                         SimulationTimeProvider* replay_clock)
    : event_sink_(std::move(event_sink)),
      fill_sink_(std::move(fill_sink)),
      replay_clock_(replay_clock) {
  // Every message type shares the socket, so no topic filter.
  socket_.set(zmq::sockopt::subscribe, "");

  // Bounded recv so run() observes stop() without a message arriving.
  socket_.set(zmq::sockopt::rcvtimeo, kRecvTimeoutMs);
  socket_.connect(endpoint);
}

// -----------------------------------------------------------------------------
// run(): blocking recv loop
// -----------------------------------------------------------------------------
void FeedGateway::run() {
  running_.store(true);

  while (running_.load()) {
    zmq::message_t msg;
    auto result = socket_.recv(msg, zmq::recv_flags::none);
    if (!result.has_value()) {
      continue;
    }
    dispatch(msg.to_string());
  }
}

void FeedGateway::stop() { running_.store(false); }

// -----------------------------------------------------------------------------
// dispatch(): decode, advance the replay clock, route
// -----------------------------------------------------------------------------
bool FeedGateway::dispatch(const std::string& payload) {
  ++received_;
  try {
    const auto json = nlohmann::json::parse(payload);
    FeedMessage message = decodeFeedMessage(json);

    if (replay_clock_ != nullptr) {
      const std::int64_t ts = json.value("timestamp_ms", std::int64_t{0});
      if (ts > replay_clock_->now_ms()) {
        replay_clock_->advance_time(ts);
      }
    }

    if (auto* fill = std::get_if<FillReport>(&message)) {
      if (fill_sink_) {
        fill_sink_(*fill);
      }
    } else if (event_sink_) {
      event_sink_(std::move(std::get<Event>(message)));
    }
    return true;
  } catch (const nlohmann::json::exception& e) {
    std::cerr << "[FeedGateway] WARNING: malformed message (" << e.what()
              << "), payload: " << payload << "\n";
  } catch (const std::invalid_argument& e) {
    std::cerr << "[FeedGateway] WARNING: rejected message (" << e.what()
              << "), payload: " << payload << "\n";
  }
  ++rejected_;
  return false;
}

}  // namespace whalecopy
