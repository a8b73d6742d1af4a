#include "whalecopy/time/live_time_provider.hpp"

#include <chrono>
#include <thread>

namespace whalecopy {

// -----------------------------------------------------------------------------
// now_ms(): system_clock converted to epoch milliseconds
// -----------------------------------------------------------------------------
std::int64_t LiveTimeProvider::now_ms() const {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

// -----------------------------------------------------------------------------
// sleep_ms(): block the calling thread
// -----------------------------------------------------------------------------
void LiveTimeProvider::sleep_ms(std::int64_t duration_ms) const {
  if (duration_ms <= 0) {
    return;
  }
  std::this_thread::sleep_for(std::chrono::milliseconds(duration_ms));
}

}  // namespace whalecopy
