#pragma once

#include "whalecopy/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace whalecopy {

// -----------------------------------------------------------------------------
// SimulationTimeProvider - deterministic clock for replay and tests
// -----------------------------------------------------------------------------
//
// @brief  Clock whose value only changes when someone advances it.
//
// @details
// advance_time() sets the clock (the feed gateway calls it with each
// message's timestamp during replay); advance_by() moves it forward.
// sleep_ms() is implemented as advance_by(), so a 4 s retry backoff takes
// no wall-clock time but is still visible in every timestamp recorded
// afterwards.
//
// Thread model: all members are lock-free atomics, safe from any thread.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  explicit SimulationTimeProvider(std::int64_t start_ms = 0)
      : current_time_ms_(start_ms) {}

  std::int64_t now_ms() const override;
  void sleep_ms(std::int64_t duration_ms) const override;

  // Sets the clock to an absolute time. No monotonicity check: replay data
  // is expected in order, and tests may rewind freely.
  void advance_time(std::int64_t new_time_ms);

  void advance_by(std::int64_t delta_ms);

 private:
  // mutable: sleep_ms() is const on the interface but moves simulated time.
  mutable std::atomic<std::int64_t> current_time_ms_;
};

}  // namespace whalecopy
