#pragma once

#include "whalecopy/domain/market.hpp"
#include "whalecopy/domain/order.hpp"

namespace whalecopy {

// Result of walking one side of a book for a given size.
struct SlippageEstimate {
  bool sufficient_depth{false};
  double mid{0.0};
  double vwap{0.0};
  double worst_price{0.0};   // Price of the last level touched
  double slippage{0.0};      // |vwap - mid| / mid
};

// -----------------------------------------------------------------------------
// estimateSlippage(book, side, size)
// -----------------------------------------------------------------------------
// @brief  Walks asks (BUY) or bids (SELL) until `size` is covered and
//         compares the volume-weighted price with the book mid.
//
// @details
// sufficient_depth is false when the book has no mid, the side runs out
// before `size` is covered, or size is not positive. In that case the other
// fields describe whatever was walked and must not be used for gating.
// -----------------------------------------------------------------------------
SlippageEstimate estimateSlippage(const domain::OrderBook& book,
                                  domain::Side side, double size);

}  // namespace whalecopy
