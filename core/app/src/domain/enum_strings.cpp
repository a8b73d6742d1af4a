#include "whalecopy/domain/enum_strings.hpp"

#include <array>
#include <utility>

namespace whalecopy {
namespace domain {

namespace {

// Linear lookup over the enum's wire names. The tables are tiny, so a
// scan is simpler than maintaining a second map per enum.
template <typename E, std::size_t N>
std::optional<E> lookup(const std::array<E, N>& values, const std::string& s) {
  for (E value : values) {
    if (s == toString(value)) {
      return value;
    }
  }
  return std::nullopt;
}

}  // namespace

// -----------------------------------------------------------------------------
// toString overloads
// -----------------------------------------------------------------------------
const char* toString(OrderState s) {
  using S = OrderState;
  switch (s) {
    case S::Pending:         return "PENDING";
    case S::Submitted:       return "SUBMITTED";
    case S::PartiallyFilled: return "PARTIALLY_FILLED";
    case S::Filled:          return "FILLED";
    case S::Confirmed:       return "CONFIRMED";
    case S::Cancelled:       return "CANCELLED";
    case S::Failed:          return "FAILED";
    case S::DeadLetter:      return "DEAD_LETTER";
  }
  return "UNKNOWN";
}

const char* toString(Side s) {
  switch (s) {
    case Side::Buy:  return "BUY";
    case Side::Sell: return "SELL";
  }
  return "UNKNOWN";
}

const char* toString(OrderType t) {
  switch (t) {
    case OrderType::Limit:  return "LIMIT";
    case OrderType::Market: return "MARKET";
    case OrderType::Fok:    return "FOK";
    case OrderType::Gtc:    return "GTC";
  }
  return "UNKNOWN";
}

const char* toString(Outcome o) {
  switch (o) {
    case Outcome::Yes: return "YES";
    case Outcome::No:  return "NO";
  }
  return "UNKNOWN";
}

const char* toString(PositionStatus s) {
  switch (s) {
    case PositionStatus::Open:     return "OPEN";
    case PositionStatus::Closing:  return "CLOSING";
    case PositionStatus::Closed:   return "CLOSED";
    case PositionStatus::Archived: return "ARCHIVED";
  }
  return "UNKNOWN";
}

const char* toString(CloseReason r) {
  switch (r) {
    case CloseReason::StopLoss:      return "STOP_LOSS";
    case CloseReason::TakeProfit:    return "TAKE_PROFIT";
    case CloseReason::Manual:        return "MANUAL";
    case CloseReason::WhaleExit:     return "WHALE_EXIT";
    case CloseReason::PreResolution: return "PRE_RESOLUTION";
  }
  return "UNKNOWN";
}

const char* toString(PositionUpdateType t) {
  using T = PositionUpdateType;
  switch (t) {
    case T::PriceUpdate:      return "PRICE_UPDATE";
    case T::SizeIncrease:     return "SIZE_INCREASE";
    case T::SizeDecrease:     return "SIZE_DECREASE";
    case T::PartialClose:     return "PARTIAL_CLOSE";
    case T::FullClose:        return "FULL_CLOSE";
    case T::StopLossHit:      return "STOP_LOSS_HIT";
    case T::TakeProfitHit:    return "TAKE_PROFIT_HIT";
    case T::ManualAdjustment: return "MANUAL_ADJUSTMENT";
  }
  return "UNKNOWN";
}

const char* toString(ExitTrigger t) {
  switch (t) {
    case ExitTrigger::StopLoss:   return "STOP_LOSS";
    case ExitTrigger::TakeProfit: return "TAKE_PROFIT";
    case ExitTrigger::TimeBased:  return "TIME_BASED";
    case ExitTrigger::WhaleExit:  return "WHALE_EXIT";
  }
  return "UNKNOWN";
}

const char* toString(BreakerState s) {
  switch (s) {
    case BreakerState::Normal:  return "NORMAL";
    case BreakerState::Reduced: return "REDUCED";
    case BreakerState::Paused:  return "PAUSED";
    case BreakerState::Halted:  return "HALTED";
  }
  return "UNKNOWN";
}

const char* toString(QuarantinePolicy p) {
  switch (p) {
    case QuarantinePolicy::Hold:      return "HOLD";
    case QuarantinePolicy::Liquidate: return "LIQUIDATE";
  }
  return "UNKNOWN";
}

// -----------------------------------------------------------------------------
// parse* functions
// -----------------------------------------------------------------------------
std::optional<OrderState> parseOrderState(const std::string& s) {
  using S = OrderState;
  static const std::array<S, 8> kValues{
      S::Pending,   S::Submitted, S::PartiallyFilled, S::Filled,
      S::Confirmed, S::Cancelled, S::Failed,          S::DeadLetter};
  return lookup(kValues, s);
}

std::optional<Side> parseSide(const std::string& s) {
  static const std::array<Side, 2> kValues{Side::Buy, Side::Sell};
  return lookup(kValues, s);
}

std::optional<OrderType> parseOrderType(const std::string& s) {
  static const std::array<OrderType, 4> kValues{
      OrderType::Limit, OrderType::Market, OrderType::Fok, OrderType::Gtc};
  return lookup(kValues, s);
}

std::optional<Outcome> parseOutcome(const std::string& s) {
  static const std::array<Outcome, 2> kValues{Outcome::Yes, Outcome::No};
  return lookup(kValues, s);
}

std::optional<PositionStatus> parsePositionStatus(const std::string& s) {
  static const std::array<PositionStatus, 4> kValues{
      PositionStatus::Open, PositionStatus::Closing, PositionStatus::Closed,
      PositionStatus::Archived};
  return lookup(kValues, s);
}

std::optional<CloseReason> parseCloseReason(const std::string& s) {
  static const std::array<CloseReason, 5> kValues{
      CloseReason::StopLoss, CloseReason::TakeProfit, CloseReason::Manual,
      CloseReason::WhaleExit, CloseReason::PreResolution};
  return lookup(kValues, s);
}

std::optional<PositionUpdateType> parsePositionUpdateType(const std::string& s) {
  using T = PositionUpdateType;
  static const std::array<T, 8> kValues{
      T::PriceUpdate,  T::SizeIncrease, T::SizeDecrease,  T::PartialClose,
      T::FullClose,    T::StopLossHit,  T::TakeProfitHit, T::ManualAdjustment};
  return lookup(kValues, s);
}

std::optional<ExitTrigger> parseExitTrigger(const std::string& s) {
  static const std::array<ExitTrigger, 4> kValues{
      ExitTrigger::StopLoss, ExitTrigger::TakeProfit, ExitTrigger::TimeBased,
      ExitTrigger::WhaleExit};
  return lookup(kValues, s);
}

std::optional<QuarantinePolicy> parseQuarantinePolicy(const std::string& s) {
  static const std::array<QuarantinePolicy, 2> kValues{
      QuarantinePolicy::Hold, QuarantinePolicy::Liquidate};
  return lookup(kValues, s);
}

}  // namespace domain
}  // namespace whalecopy
