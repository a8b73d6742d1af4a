#include "whalecopy/time/simulation_time_provider.hpp"

namespace whalecopy {

std::int64_t SimulationTimeProvider::now_ms() const {
  return current_time_ms_.load();
}

// -----------------------------------------------------------------------------
// sleep_ms(): advance simulated time instead of blocking
// -----------------------------------------------------------------------------
void SimulationTimeProvider::sleep_ms(std::int64_t duration_ms) const {
  if (duration_ms <= 0) {
    return;
  }
  current_time_ms_.fetch_add(duration_ms);
}

void SimulationTimeProvider::advance_time(std::int64_t new_time_ms) {
  current_time_ms_.store(new_time_ms);
}

void SimulationTimeProvider::advance_by(std::int64_t delta_ms) {
  current_time_ms_.fetch_add(delta_ms);
}

}  // namespace whalecopy
