#include "whalecopy/concurrent/event_loop_thread.hpp"

#include <chrono>
#include <exception>
#include <iostream>
#include <utility>

namespace whalecopy {

namespace {

// Upper bound on how long an idle worker waits before re-checking running_.
constexpr auto kIdleWaitTimeout = std::chrono::milliseconds(10);

}  // namespace

EventLoopThread::EventLoopThread(std::string name) : name_(std::move(name)) {}

EventLoopThread::~EventLoopThread() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void EventLoopThread::start() {
  if (thread_.joinable()) {
    return;
  }
  running_.store(true);
  thread_ = std::thread([this] { run(); });
  std::cout << "[EventLoopThread] " << name_ << " started\n";
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void EventLoopThread::stop() {
  if (!thread_.joinable()) {
    return;
  }
  running_.store(false);
  thread_.join();
  std::cout << "[EventLoopThread] " << name_ << " stopped\n";
}

// -----------------------------------------------------------------------------
// run() - worker loop
// -----------------------------------------------------------------------------
// pop_for() bounds the wait so a stop() issued while the queue is empty is
// observed within kIdleWaitTimeout.
// -----------------------------------------------------------------------------
void EventLoopThread::run() {
  while (running_.load()) {
    std::optional<Event> event = queue_.pop_for(kIdleWaitTimeout);
    if (!event) {
      continue;
    }
    try {
      bus_.publish(*event);
    } catch (const std::exception& e) {
      std::cerr << "[EventLoopThread] " << name_
                << " WARNING: event dispatch failed: " << e.what() << "\n";
    }
  }
}

}  // namespace whalecopy
