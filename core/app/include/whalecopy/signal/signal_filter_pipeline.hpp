#pragma once

#include "whalecopy/config/engine_config.hpp"
#include "whalecopy/domain/market.hpp"
#include "whalecopy/domain/whale.hpp"
#include "whalecopy/signal/correlation_model.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace whalecopy {

enum class FilterStage {
  WhaleQuality = 1,
  TradeQuality = 2,
  PortfolioFit = 3,
};

enum class FilterCode {
  Approved,
  // Stage 1
  MissingWhaleData,
  LowQualityScore,
  NegativeMomentum,
  WhaleInDrawdown,
  // Stage 2
  MissingMarketData,
  MarketInactive,
  TradeTooSmall,
  InsufficientDepth,
  SlippageTooHigh,
  ResolutionTooFar,
  EdgeTooSmall,
  // Stage 3
  CorrelatedWithOpenPositions,
  TotalExposureLimit,
  CategoryExposureLimit,
};

const char* toString(FilterCode code);

// Read-only view of the portfolio taken just before stage 3 runs.
struct PortfolioContext {
  double nav{0.0};
  double total_exposure{0.0};                     // Filled + reserved, USD
  std::map<std::string, double> category_exposure;
  std::vector<ExposureLeg> open_legs;
};

// Everything besides the trade itself that the gates look at. Missing
// optionals are treated as missing data and reject.
struct SignalContext {
  std::optional<domain::WhaleProfile> whale;
  std::optional<domain::MarketInfo> market;
  std::optional<domain::OrderBook> book;
  PortfolioContext portfolio;
  std::int64_t now_ms{0};
};

// An approved trade together with the figures the gates computed, so the
// sizer does not recompute them.
struct TradeIntent {
  domain::WhaleTrade trade;
  domain::WhaleProfile whale;
  domain::MarketInfo market;
  double market_price{0.0};        // Price of the outcome token bought
  double model_probability{0.0};
  double edge{0.0};
  double slippage{0.0};
  double limit_price{0.0};         // Worst book level for the whale's size
  double days_to_resolution{0.0};
  double max_correlation{0.0};
  double weighted_correlation{0.0};
};

struct FilterResult {
  bool approved{false};
  FilterStage stage{FilterStage::WhaleQuality};
  FilterCode code{FilterCode::Approved};
  std::string reason;
  std::optional<TradeIntent> intent;

  static FilterResult reject(FilterStage stage, FilterCode code,
                             std::string reason);
};

// -----------------------------------------------------------------------------
// SignalFilterPipeline - three sequential gates on a whale trade
// -----------------------------------------------------------------------------
//
// @brief  Whale quality, then trade quality, then portfolio fit. The first
//         failing check of a stage short-circuits the whole evaluation with
//         a typed code and a human-readable reason.
//
// @details
// Stage 1 (whale): quality score, Sharpe momentum (30d > 90d), drawdown.
//   Fails closed: any missing datum rejects with MissingWhaleData.
// Stage 2 (trade): notional, book-walk slippage for the whale's size, an
//   active market, days
//   to resolution, edge = p_model - p_market where
//   p_model = w * win_rate + (1 - w) * p_market.
// Stage 3 (portfolio): exposure-weighted mean of pairwise correlations
//   with the open legs, projected total exposure
//   and projected category exposure, each against NAV. The projected trade
//   value is projected_trade_fraction * NAV, the largest order the sizer
//   can produce.
//
// Thread model: stateless after construction; evaluate() is const and safe
// to call concurrently. A rejection has no side effects by construction.
// -----------------------------------------------------------------------------
class SignalFilterPipeline {
 public:
  explicit SignalFilterPipeline(FilterConfig config);

  FilterResult evaluate(const domain::WhaleTrade& trade,
                        const SignalContext& context) const;

  // Individual stages, exposed for tests. Each returns an approved result
  // with no intent when it passes.
  FilterResult checkWhale(const std::optional<domain::WhaleProfile>& whale) const;
  FilterResult checkTrade(const domain::WhaleTrade& trade,
                          const SignalContext& context,
                          TradeIntent& intent) const;
  FilterResult checkPortfolio(const SignalContext& context,
                              TradeIntent& intent) const;

  const FilterConfig& config() const { return config_; }

 private:
  FilterConfig config_;
};

}  // namespace whalecopy
