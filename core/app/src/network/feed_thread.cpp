#include "whalecopy/network/feed_thread.hpp"

#include <iostream>
#include <utility>

namespace whalecopy {

FeedThread::FeedThread(EventSink event_sink, FeedGateway::FillSink fill_sink,
                       std::string endpoint, SimulationTimeProvider* replay_clock)
    : event_sink_(std::move(event_sink)),
      fill_sink_(std::move(fill_sink)),
      endpoint_(std::move(endpoint)),
      replay_clock_(replay_clock) {}

FeedThread::~FeedThread() { stop(); }

void FeedThread::start() {
  if (thread_.joinable()) {
    return;
  }

  gateway_ = std::make_unique<FeedGateway>(event_sink_, fill_sink_, endpoint_,
                                           replay_clock_);

  thread_ = std::thread([this] {
    std::cout << "[FeedThread] listening on " << endpoint_ << "\n";
    gateway_->run();
    std::cout << "[FeedThread] recv loop exited.\n";
  });
}

void FeedThread::stop() {
  if (gateway_) {
    gateway_->stop();
  }
  if (thread_.joinable()) {
    thread_.join();
  }
  gateway_.reset();
}

}  // namespace whalecopy
