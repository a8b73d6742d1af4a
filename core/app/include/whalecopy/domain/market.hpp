#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace whalecopy {
namespace domain {

struct PriceLevel {
  double price{0.0};
  double size{0.0};
};

// -----------------------------------------------------------------------------
// OrderBook - snapshot of one outcome token's book
// -----------------------------------------------------------------------------
// bids are sorted best (highest) first, asks best (lowest) first.
// -----------------------------------------------------------------------------
struct OrderBook {
  std::string token_id;
  std::vector<PriceLevel> bids;
  std::vector<PriceLevel> asks;
  std::int64_t timestamp_ms{0};

  std::optional<double> mid() const {
    if (bids.empty() || asks.empty()) {
      return std::nullopt;
    }
    return (bids.front().price + asks.front().price) / 2.0;
  }
};

// -----------------------------------------------------------------------------
// MarketInfo - static metadata of a prediction market
// -----------------------------------------------------------------------------
struct MarketInfo {
  std::string market_id;
  std::string category;                           // e.g. "Politics"
  std::optional<std::int64_t> resolution_time_ms; // Empty when unknown
  bool active{true};
};

}  // namespace domain
}  // namespace whalecopy
