#pragma once

#include <mutex>
#include <string>
#include <unordered_map>

namespace whalecopy {

// -----------------------------------------------------------------------------
// VolatilityTracker - per-token EWMA of squared price returns
// -----------------------------------------------------------------------------
//
// @brief  Maintains var_t = lambda * var_{t-1} + (1 - lambda) * r_t^2 for every
//         token seen on the price feed, r_t being the simple return between
//         consecutive observations.
//
// @details
// The first return initializes the variance to r^2. ewmaVariance() returns
// var itself, the market_vol input of the sizer's k_vol term, and 0 for
// tokens with fewer than two observations. Repeated identical prices are
// still observations (they decay the variance).
//
// Thread model: internally locked; observe() runs on signal_loop, reads may
// come from any thread.
// -----------------------------------------------------------------------------
class VolatilityTracker {
 public:
  explicit VolatilityTracker(double lambda = 0.94);

  void observe(const std::string& token_id, double price);

  double ewmaVariance(const std::string& token_id) const;

 private:
  struct State {
    double last_price{0.0};
    double variance{0.0};
    bool has_return{false};
  };

  double lambda_;
  mutable std::mutex mutex_;
  std::unordered_map<std::string, State> states_;
};

}  // namespace whalecopy
