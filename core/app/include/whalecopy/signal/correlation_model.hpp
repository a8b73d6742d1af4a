#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace whalecopy {

// One open (or candidate) exposure as seen by the correlation model.
struct ExposureLeg {
  std::string market_id;
  std::string category;
  std::optional<std::int64_t> resolution_time_ms;
  double exposure_usd{0.0};
};

struct CorrelationSummary {
  double max{0.0};            // Gated by the portfolio filter
  double weighted_mean{0.0};  // Exposure-weighted, fed to the sizer
};

// -----------------------------------------------------------------------------
// Heuristic pairwise correlation between prediction-market exposures.
// -----------------------------------------------------------------------------
// Same market: 1.0. Otherwise the mean of
//   category term: 0.6 same category, 0.1 otherwise
//   time term:     max(0, 0.5 - |delta resolution days| / 60), 0 if unknown
// -----------------------------------------------------------------------------
double pairwiseCorrelation(const ExposureLeg& a, const ExposureLeg& b);

// Correlation of `candidate` against every leg of `open`. Both fields are 0
// for an empty portfolio. Legs with non-positive exposure carry no weight.
CorrelationSummary correlate(const ExposureLeg& candidate,
                             const std::vector<ExposureLeg>& open);

}  // namespace whalecopy
