// =============================================================================
// slippage_model_test.cpp
// =============================================================================
// Unit tests for paper::SlippageModel.
//
// Validates:
//   - rate = clamp(base + impact * stake / max(liquidity, floor), min, max)
//   - Buys fill above the reference, sells below
//   - Fill prices stay inside [0.01, 0.99]
//   - Settlement at 1 for the winning side, 0 for the losing side
// =============================================================================

#include "paper/pricing/slippage_model.hpp"

#include <gtest/gtest.h>

class SlippageModelTest : public ::testing::Test {
 protected:
  paper::SlippageParams params;  // base 0.005, impact 0.05, floor 100
};

// -----------------------------------------------------------------------------
// 1. Impact grows with stake relative to liquidity.
// -----------------------------------------------------------------------------
TEST_F(SlippageModelTest, RateScalesWithStakeOverLiquidity) {
  // 0.005 + 0.05 * 100 / 1000
  EXPECT_NEAR(paper::SlippageModel::rate(100.0, 1000.0, params), 0.010, 1e-12);
  // 0.005 + 0.05 * 200 / 1000
  EXPECT_NEAR(paper::SlippageModel::rate(200.0, 1000.0, params), 0.015, 1e-12);
}

// -----------------------------------------------------------------------------
// 2. Thin or unknown books are treated as liquidity_floor deep.
// -----------------------------------------------------------------------------
TEST_F(SlippageModelTest, LiquidityFloorApplies) {
  const double thin = paper::SlippageModel::rate(50.0, 10.0, params);
  const double unknown = paper::SlippageModel::rate(50.0, 0.0, params);
  EXPECT_NEAR(thin, 0.005 + 0.05 * 50.0 / 100.0, 1e-12);
  EXPECT_DOUBLE_EQ(thin, unknown);
}

// -----------------------------------------------------------------------------
// 3. The rate is clamped at both ends.
// -----------------------------------------------------------------------------
TEST_F(SlippageModelTest, RateIsClamped) {
  EXPECT_DOUBLE_EQ(paper::SlippageModel::rate(10000.0, 100.0, params),
                   params.max_rate);

  params.base_rate = 0.0;
  EXPECT_DOUBLE_EQ(paper::SlippageModel::rate(1.0, 1e9, params),
                   params.min_rate);
}

// -----------------------------------------------------------------------------
// 4. Buys pay up, sells give up.
// -----------------------------------------------------------------------------
TEST_F(SlippageModelTest, BuyAboveSellBelowReference) {
  const auto buy = paper::SlippageModel::quote(
      0.50, 100.0, 1000.0, paper::FillDirection::Buy, params);
  const auto sell = paper::SlippageModel::quote(
      0.50, 100.0, 1000.0, paper::FillDirection::Sell, params);

  EXPECT_NEAR(buy.price, 0.505, 1e-12);
  EXPECT_NEAR(sell.price, 0.495, 1e-12);
  EXPECT_DOUBLE_EQ(buy.reference, 0.50);
  EXPECT_DOUBLE_EQ(buy.rate, sell.rate);
}

// -----------------------------------------------------------------------------
// 5. Fills never leave the tradable price band.
// -----------------------------------------------------------------------------
TEST_F(SlippageModelTest, FillPriceClampedToBand) {
  const auto buy = paper::SlippageModel::quote(
      0.98, 10000.0, 100.0, paper::FillDirection::Buy, params);
  EXPECT_DOUBLE_EQ(buy.price, paper::SlippageModel::kMaxPrice);

  const auto sell = paper::SlippageModel::quote(
      0.011, 10000.0, 100.0, paper::FillDirection::Sell, params);
  EXPECT_DOUBLE_EQ(sell.price, paper::SlippageModel::kMinPrice);
}

// -----------------------------------------------------------------------------
// 6. Resolution settles without slippage.
// -----------------------------------------------------------------------------
TEST_F(SlippageModelTest, SettlementPrice) {
  using paper::domain::Side;
  EXPECT_DOUBLE_EQ(paper::SlippageModel::settlementPrice(Side::Yes, Side::Yes),
                   1.0);
  EXPECT_DOUBLE_EQ(paper::SlippageModel::settlementPrice(Side::No, Side::No),
                   1.0);
  EXPECT_DOUBLE_EQ(paper::SlippageModel::settlementPrice(Side::Yes, Side::No),
                   0.0);
  EXPECT_DOUBLE_EQ(paper::SlippageModel::settlementPrice(Side::No, Side::Yes),
                   0.0);
}
