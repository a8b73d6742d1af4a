#pragma once

#include "whalecopy/concurrent/thread_safe_queue.hpp"
#include "whalecopy/eventbus/event_bus.hpp"
#include "whalecopy/events/event.hpp"

#include <atomic>
#include <cstddef>
#include <string>
#include <thread>

namespace whalecopy {

// -----------------------------------------------------------------------------
// EventLoopThread - single worker draining a queue into an EventBus
// -----------------------------------------------------------------------------
//
// @brief  Owns one std::thread that pops Events from a ThreadSafeQueue and
//         publishes them on its own EventBus.
//
// @details
// The engine runs two of these: "signal_loop" (whale trades, price ticks,
// profiles, maintenance heartbeats) and "execution_loop" (order requests and
// exit signals). Every subscriber of a loop's bus therefore runs on that
// loop's thread, which serializes all handling for that stage.
//
// A handler that throws must not kill the loop: the EventBus isolates
// subscriber exceptions, and run() additionally catches anything that
// escapes publish() so the worker keeps draining.
//
// Thread model: start()/stop()/push() may be called from any thread. All
// subscriber callbacks run on the worker thread.
//
// Ownership: owned by CopyTradingEngine. Components subscribed to eventBus()
// must be destroyed (and unsubscribe) before this object.
// -----------------------------------------------------------------------------
class EventLoopThread {
 public:
  explicit EventLoopThread(std::string name);

  // Joins the worker if still running.
  ~EventLoopThread();

  EventLoopThread(const EventLoopThread&) = delete;
  EventLoopThread& operator=(const EventLoopThread&) = delete;
  EventLoopThread(EventLoopThread&&) = delete;
  EventLoopThread& operator=(EventLoopThread&&) = delete;

  // Starts the worker. Idempotent.
  void start();

  // -------------------------------------------------------------------------
  // stop()
  // -------------------------------------------------------------------------
  // @brief  Signals the worker to exit and joins it.
  //
  // @details
  // Events still queued when stop() is called are left in the queue; a
  // later start() resumes draining them. Idempotent.
  // -------------------------------------------------------------------------
  void stop();

  // Thread-safe. The event is published later on the worker thread.
  void push(Event event) { queue_.push(std::move(event)); }

  EventBus& eventBus() { return bus_; }
  const EventBus& eventBus() const { return bus_; }

  const std::string& name() const { return name_; }

  bool running() const { return running_.load(); }

  // Number of events waiting to be dispatched.
  std::size_t pending() const { return queue_.size(); }

 private:
  void run();

  std::string name_;
  ThreadSafeQueue<Event> queue_;
  EventBus bus_;

  std::atomic<bool> running_{false};
  std::thread thread_;
};

}  // namespace whalecopy
