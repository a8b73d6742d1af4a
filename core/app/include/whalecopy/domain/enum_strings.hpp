#pragma once

#include "whalecopy/domain/order.hpp"
#include "whalecopy/domain/order_state.hpp"
#include "whalecopy/domain/position.hpp"
#include "whalecopy/domain/risk_limits.hpp"
#include "whalecopy/domain/risk_state.hpp"

#include <optional>
#include <string>

namespace whalecopy {
namespace domain {

// -----------------------------------------------------------------------------
// Wire names for domain enums
// -----------------------------------------------------------------------------
// The upper-case names are the values stored in the persisted schema, the
// audit journal and the IPC telemetry. parse*() returns nullopt for an
// unknown name; callers decide whether that is an error.
// -----------------------------------------------------------------------------

const char* toString(OrderState s);
const char* toString(Side s);
const char* toString(OrderType t);
const char* toString(Outcome o);
const char* toString(PositionStatus s);
const char* toString(CloseReason r);
const char* toString(PositionUpdateType t);
const char* toString(ExitTrigger t);
const char* toString(BreakerState s);
const char* toString(QuarantinePolicy p);

std::optional<OrderState> parseOrderState(const std::string& s);
std::optional<Side> parseSide(const std::string& s);
std::optional<OrderType> parseOrderType(const std::string& s);
std::optional<Outcome> parseOutcome(const std::string& s);
std::optional<PositionStatus> parsePositionStatus(const std::string& s);
std::optional<CloseReason> parseCloseReason(const std::string& s);
std::optional<PositionUpdateType> parsePositionUpdateType(const std::string& s);
std::optional<ExitTrigger> parseExitTrigger(const std::string& s);
std::optional<QuarantinePolicy> parseQuarantinePolicy(const std::string& s);

}  // namespace domain
}  // namespace whalecopy
