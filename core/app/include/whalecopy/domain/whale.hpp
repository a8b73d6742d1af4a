#pragma once

#include "whalecopy/domain/order.hpp"
#include "whalecopy/domain/position.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace whalecopy {
namespace domain {

// -----------------------------------------------------------------------------
// WhaleProfile - latest scoring data for one tracked whale
// -----------------------------------------------------------------------------
//
// Every metric is optional because the scoring service may not have
// produced it yet. The whale gate fails closed on any missing value.
// -----------------------------------------------------------------------------
struct WhaleProfile {
  std::string address;
  std::optional<double> quality_score;     // 0..100
  std::optional<double> sharpe_30d;
  std::optional<double> sharpe_90d;
  std::optional<double> current_drawdown;  // Fraction, 0.05 == 5%
  std::optional<double> win_rate;          // Fraction of winning trades
  std::int64_t updated_at_ms{0};
};

// -----------------------------------------------------------------------------
// WhaleTrade - one trade observed on the whale signal feed
// -----------------------------------------------------------------------------
struct WhaleTrade {
  std::string whale_address;
  std::string market_id;
  std::string token_id;
  Side side{Side::Buy};
  Outcome outcome{Outcome::Yes};
  double size{0.0};    // Shares
  double price{0.0};   // Price paid for the outcome token
  std::int64_t timestamp_ms{0};
  std::string trade_id;  // Feed-assigned id, used for idempotency keys

  double notional() const { return size * price; }
};

}  // namespace domain
}  // namespace whalecopy
