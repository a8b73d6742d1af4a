#include "whalecopy/signal/correlation_model.hpp"
#include "whalecopy/time/time_utils.hpp"

#include <algorithm>
#include <cmath>

namespace whalecopy {

namespace {

constexpr double kSameCategory = 0.6;
constexpr double kOtherCategory = 0.1;
constexpr double kTimeTermMax = 0.5;
constexpr double kTimeTermDecayDays = 60.0;

}  // namespace

double pairwiseCorrelation(const ExposureLeg& a, const ExposureLeg& b) {
  if (!a.market_id.empty() && a.market_id == b.market_id) {
    return 1.0;
  }

  const double category_term =
      (!a.category.empty() && a.category == b.category) ? kSameCategory
                                                         : kOtherCategory;

  double time_term = 0.0;
  if (a.resolution_time_ms && b.resolution_time_ms) {
    const double delta_days =
        std::abs(ms_to_days(*a.resolution_time_ms - *b.resolution_time_ms));
    time_term = std::max(0.0, kTimeTermMax - delta_days / kTimeTermDecayDays);
  }

  return (category_term + time_term) / 2.0;
}

CorrelationSummary correlate(const ExposureLeg& candidate,
                             const std::vector<ExposureLeg>& open) {
  CorrelationSummary summary;
  double weighted_sum = 0.0;
  double weight = 0.0;
  for (const auto& leg : open) {
    const double rho = pairwiseCorrelation(candidate, leg);
    summary.max = std::max(summary.max, rho);
    if (leg.exposure_usd > 0.0) {
      weighted_sum += rho * leg.exposure_usd;
      weight += leg.exposure_usd;
    }
  }
  if (weight > 0.0) {
    summary.weighted_mean = weighted_sum / weight;
  }
  return summary;
}

}  // namespace whalecopy
