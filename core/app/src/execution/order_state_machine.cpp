#include "whalecopy/execution/order_state_machine.hpp"
#include "whalecopy/domain/enum_strings.hpp"
#include "whalecopy/errors.hpp"

#include <string>

namespace whalecopy {

bool OrderStateMachine::canTransition(domain::OrderState from,
                                      domain::OrderState to) {
  using S = domain::OrderState;

  switch (from) {
    case S::Pending:
      return to == S::Submitted ||
             to == S::Failed ||
             to == S::Cancelled;

    case S::Submitted:
      return to == S::PartiallyFilled ||
             to == S::Filled ||
             to == S::Cancelled ||
             to == S::Failed;

    case S::PartiallyFilled:
      return to == S::PartiallyFilled ||
             to == S::Filled ||
             to == S::Confirmed ||
             to == S::Cancelled;

    case S::Filled:
      return to == S::Confirmed;

    case S::Failed:
      return to == S::Pending ||
             to == S::DeadLetter;

    case S::Confirmed:
    case S::Cancelled:
    case S::DeadLetter:
      return false;
  }

  return false;
}

void OrderStateMachine::validate(domain::OrderState from, domain::OrderState to) {
  if (!canTransition(from, to)) {
    throw InvalidTransitionError(std::string("illegal order transition ") +
                                 domain::toString(from) + " -> " +
                                 domain::toString(to));
  }
}

bool OrderStateMachine::isTerminal(domain::OrderState state) {
  using S = domain::OrderState;
  return state == S::Confirmed ||
         state == S::Cancelled ||
         state == S::DeadLetter;
}

bool OrderStateMachine::isWorking(domain::OrderState state) {
  return state == domain::OrderState::Submitted ||
         state == domain::OrderState::PartiallyFilled;
}

}  // namespace whalecopy
