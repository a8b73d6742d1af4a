#include "whalecopy/signal/slippage_estimator.hpp"

#include <algorithm>
#include <cmath>

namespace whalecopy {

SlippageEstimate estimateSlippage(const domain::OrderBook& book,
                                  domain::Side side, double size) {
  SlippageEstimate estimate;
  const auto mid = book.mid();
  if (!mid || *mid <= 0.0 || !(size > 0.0)) {
    return estimate;
  }
  estimate.mid = *mid;

  const auto& levels = side == domain::Side::Buy ? book.asks : book.bids;
  double remaining = size;
  double cost = 0.0;
  for (const auto& level : levels) {
    if (remaining <= 0.0) {
      break;
    }
    if (level.size <= 0.0) {
      continue;
    }
    const double take = std::min(remaining, level.size);
    cost += take * level.price;
    remaining -= take;
    estimate.worst_price = level.price;
  }

  const double walked = size - remaining;
  if (walked > 0.0) {
    estimate.vwap = cost / walked;
    estimate.slippage = std::abs(estimate.vwap - estimate.mid) / estimate.mid;
  }
  estimate.sufficient_depth = remaining <= 1e-9;
  return estimate;
}

}  // namespace whalecopy
