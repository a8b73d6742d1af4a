// =============================================================================
// position_sizer_test.cpp
// =============================================================================
// Unit tests for whalecopy::PositionSizer and whalecopy::VolatilityTracker.
//
// Validates:
//   - The adjusted-Kelly formula on a worked example
//   - The 8% cap and the REDUCED multiplier applied after it
//   - Each adjustment factor's clamp
//   - Degenerate input (no edge, bad price, NaN) sizes to zero
//   - market_vol as the EWMA of squared price returns, and its k_vol
// =============================================================================

#include "whalecopy/config/engine_config.hpp"
#include "whalecopy/sizing/position_sizer.hpp"
#include "whalecopy/sizing/volatility_tracker.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>

using whalecopy::PositionSizer;
using whalecopy::SizingInput;
using whalecopy::SizingResult;

class PositionSizerTest : public ::testing::Test {
 protected:
  PositionSizer sizer{whalecopy::SizerConfig{}};

  static SizingInput baseline() {
    SizingInput in;
    in.whale_win_rate = 0.63;
    in.market_price = 0.55;
    in.whale_quality_score = 90.0;
    in.market_vol = 0.0;
    in.portfolio_correlation = 0.0;
    in.portfolio_drawdown = 0.0;
    in.size_multiplier = 1.0;
    in.nav = 10000.0;
    return in;
  }
};

// -----------------------------------------------------------------------------
// 1. Worked example: p = 0.7*0.63 + 0.3*0.55 = 0.606, b = 0.45/0.55.
// -----------------------------------------------------------------------------
TEST_F(PositionSizerTest, WorkedExample) {
  const SizingResult r = sizer.size(baseline());

  const double p = 0.606;
  const double b = 0.45 / 0.55;
  const double f_kelly = (p * b - (1.0 - p)) / b;
  EXPECT_NEAR(r.p, p, 1e-12);
  EXPECT_NEAR(r.b, b, 1e-12);
  EXPECT_NEAR(r.f_kelly, f_kelly, 1e-12);
  EXPECT_NEAR(r.k_conf, 0.94, 1e-12);
  EXPECT_DOUBLE_EQ(r.k_vol, 1.0);
  EXPECT_DOUBLE_EQ(r.k_corr, 1.0);
  EXPECT_DOUBLE_EQ(r.k_dd, 1.0);

  const double f_final = 0.5 * f_kelly * 0.94;
  EXPECT_NEAR(r.f_final, f_final, 1e-12);
  EXPECT_NEAR(r.notional, f_final * 10000.0, 1e-9);
  EXPECT_NEAR(r.size, r.notional / 0.55, 1e-9);
  EXPECT_TRUE(r.tradeable());
}

// -----------------------------------------------------------------------------
// 2. The raw fraction is capped at 8%, and the REDUCED multiplier applies on
//    top of the cap.
// -----------------------------------------------------------------------------
TEST_F(PositionSizerTest, CapThenMultiplier) {
  SizingInput in = baseline();
  in.whale_win_rate = 0.95;
  in.market_price = 0.30;
  in.whale_quality_score = 100.0;

  const SizingResult capped = sizer.size(in);
  EXPECT_DOUBLE_EQ(capped.f_final, 0.08);

  in.size_multiplier = 0.5;
  const SizingResult reduced = sizer.size(in);
  EXPECT_DOUBLE_EQ(reduced.f_final, 0.04);
  EXPECT_DOUBLE_EQ(reduced.notional, 400.0);
}

// -----------------------------------------------------------------------------
// 3. Adjustment factors respect their floors and caps.
// -----------------------------------------------------------------------------
TEST_F(PositionSizerTest, AdjustmentFactorsClamp) {
  SizingInput in = baseline();
  in.market_vol = 10.0;             // 1/(1+50) -> floor 0.5
  in.portfolio_correlation = 0.99;  // 1 - 0.98 -> floor 0.3
  in.portfolio_drawdown = 0.5;      // 1 - 1.5 -> floor 0.2
  in.whale_quality_score = 0.0;     // k_conf 0.4

  const SizingResult r = sizer.size(in);
  EXPECT_DOUBLE_EQ(r.k_vol, 0.5);
  EXPECT_DOUBLE_EQ(r.k_corr, 0.3);
  EXPECT_DOUBLE_EQ(r.k_dd, 0.2);
  EXPECT_DOUBLE_EQ(r.k_conf, 0.4);
  EXPECT_GT(r.f_final, 0.0);
  EXPECT_LT(r.f_final, 0.01);
}

// -----------------------------------------------------------------------------
// 4. No edge over the market price sizes to zero.
// -----------------------------------------------------------------------------
TEST_F(PositionSizerTest, NoEdgeSizesToZero) {
  SizingInput in = baseline();
  in.whale_win_rate = 0.40;  // p < price

  const SizingResult r = sizer.size(in);
  EXPECT_DOUBLE_EQ(r.f_kelly, 0.0);
  EXPECT_DOUBLE_EQ(r.f_final, 0.0);
  EXPECT_FALSE(r.tradeable());
}

// -----------------------------------------------------------------------------
// 5. Non-finite or out-of-range input never produces a size.
// -----------------------------------------------------------------------------
TEST_F(PositionSizerTest, DegenerateInputSizesToZero) {
  SizingInput bad_price = baseline();
  bad_price.market_price = 1.0;
  EXPECT_FALSE(sizer.size(bad_price).tradeable());

  SizingInput nan_vol = baseline();
  nan_vol.market_vol = std::numeric_limits<double>::quiet_NaN();
  EXPECT_FALSE(sizer.size(nan_vol).tradeable());

  SizingInput no_nav = baseline();
  no_nav.nav = 0.0;
  EXPECT_FALSE(sizer.size(no_nav).tradeable());
}

// -----------------------------------------------------------------------------
// 6. market_vol is the EWMA of squared returns itself, not its root.
// Why: k_vol = 1 / (1 + 5 * market_vol); for a 10% return that is ~0.95,
//      where the root would give ~0.67 and undersize every trade.
// -----------------------------------------------------------------------------
TEST(VolatilityTrackerTest, EwmaOfSquaredReturns) {
  whalecopy::VolatilityTracker tracker(0.94);
  EXPECT_DOUBLE_EQ(tracker.ewmaVariance("T1"), 0.0);

  tracker.observe("T1", 0.50);
  EXPECT_DOUBLE_EQ(tracker.ewmaVariance("T1"), 0.0);  // No return yet

  tracker.observe("T1", 0.55);  // r = 0.1
  EXPECT_NEAR(tracker.ewmaVariance("T1"), 0.01, 1e-12);

  tracker.observe("T1", 0.55);  // r = 0
  EXPECT_NEAR(tracker.ewmaVariance("T1"), 0.94 * 0.01, 1e-12);

  tracker.observe("T1", -1.0);  // Ignored
  EXPECT_NEAR(tracker.ewmaVariance("T1"), 0.94 * 0.01, 1e-12);
  EXPECT_DOUBLE_EQ(tracker.ewmaVariance("T2"), 0.0);
}

TEST_F(PositionSizerTest, TrackedVarianceDrivesVolAdjustment) {
  whalecopy::VolatilityTracker tracker(0.94);
  tracker.observe("T1", 0.50);
  tracker.observe("T1", 0.55);

  SizingInput in = baseline();
  in.market_vol = tracker.ewmaVariance("T1");
  const SizingResult r = sizer.size(in);
  EXPECT_NEAR(r.k_vol, 1.0 / (1.0 + 5.0 * 0.01), 1e-12);
}
