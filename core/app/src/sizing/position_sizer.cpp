#include "whalecopy/sizing/position_sizer.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace whalecopy {

namespace {

bool allFinite(const SizingInput& in) {
  return std::isfinite(in.whale_win_rate) && std::isfinite(in.market_price) &&
         std::isfinite(in.whale_quality_score) && std::isfinite(in.market_vol) &&
         std::isfinite(in.portfolio_correlation) &&
         std::isfinite(in.portfolio_drawdown) &&
         std::isfinite(in.size_multiplier) && std::isfinite(in.nav);
}

}  // namespace

PositionSizer::PositionSizer(SizerConfig config) : config_(std::move(config)) {}

SizingResult PositionSizer::size(const SizingInput& in) const {
  SizingResult r;
  if (!allFinite(in) || in.market_price <= 0.0 || in.market_price >= 1.0 ||
      in.nav <= 0.0) {
    return r;
  }

  const double win_rate = std::clamp(in.whale_win_rate, 0.0, 1.0);
  const double w = config_.whale_win_rate_weight;
  r.p = w * win_rate + (1.0 - w) * in.market_price;
  r.b = (1.0 - in.market_price) / in.market_price;
  const double q = 1.0 - r.p;
  r.f_kelly = (r.p * r.b - q) / r.b;
  if (r.f_kelly <= 0.0) {
    r.f_kelly = 0.0;
    return r;
  }

  const double quality = std::clamp(in.whale_quality_score, 0.0, 100.0);
  r.k_conf = config_.confidence_base + config_.confidence_scale * quality / 100.0;
  r.k_vol = std::clamp(
      1.0 / (1.0 + config_.vol_sensitivity * std::max(0.0, in.market_vol)),
      config_.vol_floor, config_.vol_cap);
  r.k_corr = std::clamp(1.0 - in.portfolio_correlation * in.portfolio_correlation,
                        config_.corr_floor, 1.0);
  r.k_dd = std::clamp(1.0 - std::max(0.0, in.portfolio_drawdown) * config_.drawdown_scale,
                      config_.drawdown_floor, 1.0);

  const double raw = config_.kelly_multiplier * r.f_kelly * r.k_conf * r.k_vol *
                     r.k_corr * r.k_dd;
  const double multiplier = std::clamp(in.size_multiplier, 0.0, 1.0);
  r.f_final = std::clamp(raw, 0.0, config_.max_fraction) * multiplier;

  r.notional = r.f_final * in.nav;
  r.size = r.notional / in.market_price;
  return r;
}

}  // namespace whalecopy
