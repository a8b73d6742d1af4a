#include "whalecopy/sizing/volatility_tracker.hpp"

#include <cmath>

namespace whalecopy {

VolatilityTracker::VolatilityTracker(double lambda) : lambda_(lambda) {}

void VolatilityTracker::observe(const std::string& token_id, double price) {
  if (!(price > 0.0) || !std::isfinite(price)) {
    return;
  }
  std::lock_guard lock(mutex_);
  auto [it, inserted] = states_.try_emplace(token_id);
  State& state = it->second;
  if (inserted) {
    state.last_price = price;
    return;
  }

  const double r = price / state.last_price - 1.0;
  if (state.has_return) {
    state.variance = lambda_ * state.variance + (1.0 - lambda_) * r * r;
  } else {
    state.variance = r * r;
    state.has_return = true;
  }
  state.last_price = price;
}

double VolatilityTracker::ewmaVariance(const std::string& token_id) const {
  std::lock_guard lock(mutex_);
  auto it = states_.find(token_id);
  if (it == states_.end() || !it->second.has_return) {
    return 0.0;
  }
  return it->second.variance;
}

}  // namespace whalecopy
