#pragma once

#include "whalecopy/time/i_time_provider.hpp"

namespace whalecopy {

// Wall-clock implementation used by the production executable.
class LiveTimeProvider final : public ITimeProvider {
 public:
  LiveTimeProvider() = default;

  std::int64_t now_ms() const override;
  void sleep_ms(std::int64_t duration_ms) const override;
};

}  // namespace whalecopy
