#pragma once

#include "whalecopy/time/time_utils.hpp"

#include <cstdint>
#include <string>

namespace whalecopy {

enum class RiskAlertKind {
  BreakerTripped,
  BreakerCleared,
  WhaleQuarantined,
  WhaleReleased,
};

// -----------------------------------------------------------------------------
// RiskAlertEvent - circuit breaker and quarantine notifications
// -----------------------------------------------------------------------------
//
// @brief  Published by RiskManager whenever a breaker changes state or a
//         whale enters or leaves quarantine.
//
// @details
//   - kind:          what happened.
//   - subject:       breaker name ("HALTED", "REDUCED", "PAUSED") or the
//                    whale address.
//   - reason:        human-readable description, e.g. "Daily loss limit".
//   - current_value: the value that crossed the threshold.
//   - limit_value:   the threshold.
//
// Thread model: plain data with value semantics.
// -----------------------------------------------------------------------------
struct RiskAlertEvent {
  RiskAlertKind kind{RiskAlertKind::BreakerTripped};
  std::string subject;
  std::string reason;
  double current_value{0.0};
  double limit_value{0.0};
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

inline const char* toString(RiskAlertKind kind) {
  switch (kind) {
    case RiskAlertKind::BreakerTripped:
      return "BREAKER_TRIPPED";
    case RiskAlertKind::BreakerCleared:
      return "BREAKER_CLEARED";
    case RiskAlertKind::WhaleQuarantined:
      return "WHALE_QUARANTINED";
    case RiskAlertKind::WhaleReleased:
      return "WHALE_RELEASED";
  }
  return "UNKNOWN";
}

}  // namespace whalecopy
