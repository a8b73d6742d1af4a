#pragma once

#include <cstdint>

namespace whalecopy {

// -----------------------------------------------------------------------------
// ITimeProvider - injectable clock
// -----------------------------------------------------------------------------
//
// @brief  Abstracts "what time is it" and "wait this long" so the execution
//         state machine, the risk day boundary and the exit triggers run
//         identically against wall-clock time and simulated time.
//
// @details
// Every component that stamps a record or waits on the exchange holds a
// const ITimeProvider&. Nothing in the engine calls system_clock directly.
//
//   - LiveTimeProvider:       system_clock, sleep_ms blocks the thread.
//   - SimulationTimeProvider: externally advanced clock; sleep_ms advances
//                             the clock instead of blocking, which makes
//                             retry backoff and fill polling instantaneous
//                             and deterministic in tests.
//
// Ownership: owned by main() or the test fixture; must outlive the engine.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // -------------------------------------------------------------------------
  // now_ms()
  // -------------------------------------------------------------------------
  // @brief  Current time in milliseconds since the Unix epoch (UTC).
  //
  // Thread-safety: Safe to call concurrently from any thread.
  // -------------------------------------------------------------------------
  virtual std::int64_t now_ms() const = 0;

  // -------------------------------------------------------------------------
  // sleep_ms(duration_ms)
  // -------------------------------------------------------------------------
  // @brief  Suspends the caller for `duration_ms` of this clock's time.
  //
  // @details
  // The only suspension points of the pipeline (retry backoff, fill poll
  // interval) go through this call. Non-positive durations return
  // immediately.
  //
  // Thread-safety: Safe to call concurrently from any thread.
  // -------------------------------------------------------------------------
  virtual void sleep_ms(std::int64_t duration_ms) const = 0;
};

}  // namespace whalecopy
