#pragma once

#include "whalecopy/config/engine_config.hpp"

namespace whalecopy {

struct SizingInput {
  double whale_win_rate{0.0};
  double market_price{0.0};        // Price of the outcome token bought
  double whale_quality_score{0.0}; // 0..100
  double market_vol{0.0};
  double portfolio_correlation{0.0};
  double portfolio_drawdown{0.0};
  double size_multiplier{1.0};     // From RiskManager, 0.5 when REDUCED
  double nav{0.0};
};

// Every factor of the computation, kept for logging and the audit metadata.
struct SizingResult {
  double p{0.0};
  double b{0.0};
  double f_kelly{0.0};
  double k_conf{0.0};
  double k_vol{0.0};
  double k_corr{0.0};
  double k_dd{0.0};
  double f_final{0.0};
  double notional{0.0};
  double size{0.0};

  bool tradeable() const { return f_final > 0.0 && size > 0.0; }
};

// -----------------------------------------------------------------------------
// PositionSizer - adaptive fractional Kelly
// -----------------------------------------------------------------------------
//
//   p       = w*win_rate + (1-w)*price
//   b       = (1 - price) / price
//   f_kelly = (p*b - q) / b, q = 1 - p          (0 if f_kelly <= 0)
//   k_conf  = 0.4 + 0.6 * quality / 100
//   k_vol   = clamp(1 / (1 + 5*vol), 0.5, 1.2)
//   k_corr  = clamp(1 - corr^2, 0.3, 1.0)
//   k_dd    = clamp(1 - drawdown*3, 0.2, 1.0)
//   f_final = clamp(0.5 * f_kelly * k_conf * k_vol * k_corr * k_dd, 0, 0.08)
//             * size_multiplier
//
// Non-finite inputs, prices outside (0, 1) and non-positive NAV size to 0.
// Stateless and const: safe from any thread.
// -----------------------------------------------------------------------------
class PositionSizer {
 public:
  explicit PositionSizer(SizerConfig config);

  SizingResult size(const SizingInput& input) const;

  const SizerConfig& config() const { return config_; }

 private:
  SizerConfig config_;
};

}  // namespace whalecopy
