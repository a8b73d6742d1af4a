#include "whalecopy/signal/signal_filter_pipeline.hpp"
#include "whalecopy/signal/slippage_estimator.hpp"
#include "whalecopy/time/time_utils.hpp"

#include <utility>

namespace whalecopy {

const char* toString(FilterCode code) {
  switch (code) {
    case FilterCode::Approved:
      return "APPROVED";
    case FilterCode::MissingWhaleData:
      return "MISSING_WHALE_DATA";
    case FilterCode::LowQualityScore:
      return "LOW_QUALITY_SCORE";
    case FilterCode::NegativeMomentum:
      return "NEGATIVE_MOMENTUM";
    case FilterCode::WhaleInDrawdown:
      return "WHALE_IN_DRAWDOWN";
    case FilterCode::MissingMarketData:
      return "MISSING_MARKET_DATA";
    case FilterCode::MarketInactive:
      return "MARKET_INACTIVE";
    case FilterCode::TradeTooSmall:
      return "TRADE_TOO_SMALL";
    case FilterCode::InsufficientDepth:
      return "INSUFFICIENT_DEPTH";
    case FilterCode::SlippageTooHigh:
      return "SLIPPAGE_TOO_HIGH";
    case FilterCode::ResolutionTooFar:
      return "RESOLUTION_TOO_FAR";
    case FilterCode::EdgeTooSmall:
      return "EDGE_TOO_SMALL";
    case FilterCode::CorrelatedWithOpenPositions:
      return "CORRELATED";
    case FilterCode::TotalExposureLimit:
      return "TOTAL_EXPOSURE_LIMIT";
    case FilterCode::CategoryExposureLimit:
      return "CATEGORY_EXPOSURE_LIMIT";
  }
  return "UNKNOWN";
}

FilterResult FilterResult::reject(FilterStage stage, FilterCode code,
                                  std::string reason) {
  FilterResult result;
  result.approved = false;
  result.stage = stage;
  result.code = code;
  result.reason = std::move(reason);
  return result;
}

namespace {

FilterResult pass(FilterStage stage) {
  FilterResult result;
  result.approved = true;
  result.stage = stage;
  result.code = FilterCode::Approved;
  return result;
}

}  // namespace

SignalFilterPipeline::SignalFilterPipeline(FilterConfig config)
    : config_(std::move(config)) {}

// -----------------------------------------------------------------------------
// evaluate(): run the three stages in order, stop at the first rejection
// -----------------------------------------------------------------------------
FilterResult SignalFilterPipeline::evaluate(const domain::WhaleTrade& trade,
                                            const SignalContext& context) const {
  FilterResult whale = checkWhale(context.whale);
  if (!whale.approved) {
    return whale;
  }

  TradeIntent intent;
  intent.trade = trade;
  intent.whale = *context.whale;

  FilterResult trade_result = checkTrade(trade, context, intent);
  if (!trade_result.approved) {
    return trade_result;
  }

  FilterResult portfolio = checkPortfolio(context, intent);
  if (!portfolio.approved) {
    return portfolio;
  }

  portfolio.intent = std::move(intent);
  return portfolio;
}

// -----------------------------------------------------------------------------
// Stage 1 - whale gate
// -----------------------------------------------------------------------------
FilterResult SignalFilterPipeline::checkWhale(
    const std::optional<domain::WhaleProfile>& whale) const {
  constexpr FilterStage kStage = FilterStage::WhaleQuality;

  if (!whale) {
    return FilterResult::reject(kStage, FilterCode::MissingWhaleData,
                                "Whale profile unavailable");
  }
  if (!whale->quality_score || !whale->sharpe_30d || !whale->sharpe_90d ||
      !whale->current_drawdown || !whale->win_rate) {
    return FilterResult::reject(kStage, FilterCode::MissingWhaleData,
                                "Whale data incomplete");
  }
  if (*whale->quality_score < config_.min_quality_score) {
    return FilterResult::reject(kStage, FilterCode::LowQualityScore,
                                "WQS too low");
  }
  if (!(*whale->sharpe_30d > *whale->sharpe_90d)) {
    return FilterResult::reject(kStage, FilterCode::NegativeMomentum,
                                "Negative momentum");
  }
  if (*whale->current_drawdown >= config_.max_whale_drawdown) {
    return FilterResult::reject(kStage, FilterCode::WhaleInDrawdown,
                                "Whale in trouble");
  }
  return pass(kStage);
}

// -----------------------------------------------------------------------------
// Stage 2 - trade gate
// -----------------------------------------------------------------------------
FilterResult SignalFilterPipeline::checkTrade(const domain::WhaleTrade& trade,
                                              const SignalContext& context,
                                              TradeIntent& intent) const {
  constexpr FilterStage kStage = FilterStage::TradeQuality;

  if (trade.notional() < config_.min_trade_notional) {
    return FilterResult::reject(kStage, FilterCode::TradeTooSmall,
                                "Trade too small");
  }

  if (!context.book) {
    return FilterResult::reject(kStage, FilterCode::InsufficientDepth,
                                "Insufficient order book depth");
  }
  const SlippageEstimate slip =
      estimateSlippage(*context.book, trade.side, trade.size);
  if (!slip.sufficient_depth) {
    return FilterResult::reject(kStage, FilterCode::InsufficientDepth,
                                "Insufficient order book depth");
  }
  if (slip.slippage > config_.max_slippage) {
    return FilterResult::reject(kStage, FilterCode::SlippageTooHigh,
                                "Slippage too high");
  }

  if (!context.market) {
    return FilterResult::reject(kStage, FilterCode::MissingMarketData,
                                "Market data unavailable");
  }
  if (!context.market->active) {
    return FilterResult::reject(kStage, FilterCode::MarketInactive,
                                "Market inactive");
  }
  if (!context.market->resolution_time_ms) {
    return FilterResult::reject(kStage, FilterCode::ResolutionTooFar,
                                "Resolution date unknown");
  }
  const double days =
      ms_to_days(*context.market->resolution_time_ms - context.now_ms);
  if (days > config_.max_days_to_resolution) {
    return FilterResult::reject(kStage, FilterCode::ResolutionTooFar,
                                "Resolution too far");
  }

  const double p_market = trade.price;
  const double w = config_.whale_win_rate_weight;
  const double p_model = w * *intent.whale.win_rate + (1.0 - w) * p_market;
  const double edge = p_model - p_market;
  if (edge < config_.min_edge) {
    return FilterResult::reject(kStage, FilterCode::EdgeTooSmall,
                                "Edge too small");
  }

  intent.market = *context.market;
  intent.market_price = p_market;
  intent.model_probability = p_model;
  intent.edge = edge;
  intent.slippage = slip.slippage;
  intent.limit_price = slip.worst_price;
  intent.days_to_resolution = days;
  return pass(kStage);
}

// -----------------------------------------------------------------------------
// Stage 3 - portfolio gate
// -----------------------------------------------------------------------------
FilterResult SignalFilterPipeline::checkPortfolio(const SignalContext& context,
                                                  TradeIntent& intent) const {
  constexpr FilterStage kStage = FilterStage::PortfolioFit;
  const PortfolioContext& portfolio = context.portfolio;

  ExposureLeg candidate;
  candidate.market_id = intent.trade.market_id;
  candidate.category = intent.market.category;
  candidate.resolution_time_ms = intent.market.resolution_time_ms;

  const CorrelationSummary corr = correlate(candidate, portfolio.open_legs);
  if (corr.weighted_mean >= config_.max_correlation) {
    return FilterResult::reject(kStage,
                                FilterCode::CorrelatedWithOpenPositions,
                                "Correlated with open positions");
  }

  if (portfolio.nav <= 0.0) {
    return FilterResult::reject(kStage, FilterCode::TotalExposureLimit,
                                "Total exposure limit");
  }
  const double projected = config_.projected_trade_fraction * portfolio.nav;

  if (portfolio.total_exposure + projected >=
      config_.max_total_exposure_pct * portfolio.nav) {
    return FilterResult::reject(kStage, FilterCode::TotalExposureLimit,
                                "Total exposure limit");
  }

  double category_exposure = 0.0;
  auto it = portfolio.category_exposure.find(candidate.category);
  if (it != portfolio.category_exposure.end()) {
    category_exposure = it->second;
  }
  if (category_exposure + projected >=
      config_.max_category_exposure_pct * portfolio.nav) {
    return FilterResult::reject(kStage, FilterCode::CategoryExposureLimit,
                                "Category exposure limit");
  }

  intent.max_correlation = corr.max;
  intent.weighted_correlation = corr.weighted_mean;
  return pass(kStage);
}

}  // namespace whalecopy
