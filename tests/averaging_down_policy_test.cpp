// =============================================================================
// averaging_down_policy_test.cpp
// =============================================================================
// Unit tests for paper::AveragingDownPolicy.
//
// Validates each gate of a repeat signal, in order:
//   status/side, addition count, price drop, edge improvement, min edge,
//   per-market headroom, Kelly sizing (capped at the headroom).
//
// Base case: Open YES position, 100 @ 0.40, original edge 0.10.
// Accepted signal: p = 0.50, price 0.30, edge 0.20.
//   Kelly: b = 2.333, f* = 0.2857, 0.25 * f* * 4900 = 350 -> capped 245
//   Headroom: 0.10 * 5000 - 100 = 400
// =============================================================================

#include "paper/risk/averaging_down_policy.hpp"

#include <gtest/gtest.h>

class AveragingDownPolicyTest : public ::testing::Test {
 protected:
  void SetUp() override {
    position.position_id = 1;
    position.market_id = "M1";
    position.side = paper::domain::Side::Yes;
    position.status = paper::domain::PositionStatus::Open;
    position.entry_price = 0.40;
    position.stake = 100.0;
    position.original_edge = 0.10;

    signal.market_id = "M1";
    signal.side = paper::domain::Side::Yes;
    signal.probability = 0.50;
    signal.market_price = 0.30;
    signal.edge = 0.20;

    capital = paper::domain::CapitalSnapshot{5000.0, 4900.0, 100.0};

    params.max_additions = 1;
    params.max_market_exposure = 0.10;
    params.price_drop = 0.10;
    params.min_edge_improvement = 0.05;
    params.min_edge = 0.10;

    sizing.kelly_fraction = 0.25;
    sizing.max_trade_exposure = 0.05;
    sizing.min_edge = 0.10;
  }

  paper::Result<double> review() const {
    return paper::AveragingDownPolicy::review(position, signal, capital,
                                              params, sizing);
  }

  paper::domain::Position position;
  paper::domain::Signal signal;
  paper::domain::CapitalSnapshot capital;
  paper::AveragingParams params;
  paper::SizingParams sizing;
};

// -----------------------------------------------------------------------------
// 1. A qualifying signal is sized by Kelly against available capital.
// -----------------------------------------------------------------------------
TEST_F(AveragingDownPolicyTest, QualifyingSignalIsSized) {
  auto r = review();
  ASSERT_TRUE(r.ok()) << r.error().message;
  EXPECT_NEAR(r.value(), 245.0, 1e-9);
}

// -----------------------------------------------------------------------------
// 2. The per-market cap limits the addition to the remaining headroom.
// -----------------------------------------------------------------------------
TEST_F(AveragingDownPolicyTest, HeadroomCapsStake) {
  capital = paper::domain::CapitalSnapshot{1500.0, 1400.0, 100.0};
  auto r = review();
  ASSERT_TRUE(r.ok());
  EXPECT_NEAR(r.value(), 50.0, 1e-9);
}

// -----------------------------------------------------------------------------
// 3. Opposite side or non-Open position: a duplicate, not an addition.
// -----------------------------------------------------------------------------
TEST_F(AveragingDownPolicyTest, OppositeSideOrNotOpen) {
  signal.side = paper::domain::Side::No;
  EXPECT_EQ(review().kind(), paper::ErrorKind::DuplicateActivePosition);

  signal.side = paper::domain::Side::Yes;
  position.status = paper::domain::PositionStatus::ClosingManual;
  EXPECT_EQ(review().kind(), paper::ErrorKind::DuplicateActivePosition);
}

// -----------------------------------------------------------------------------
// 4. Used-up additions are an exposure limit.
// -----------------------------------------------------------------------------
TEST_F(AveragingDownPolicyTest, MaxAdditionsReached) {
  position.additions = 1;
  EXPECT_EQ(review().kind(), paper::ErrorKind::ExposureLimit);
}

// -----------------------------------------------------------------------------
// 5. Price has not dropped far enough (trigger 0.36).
// -----------------------------------------------------------------------------
TEST_F(AveragingDownPolicyTest, PriceNotLowEnough) {
  signal.market_price = 0.37;
  EXPECT_EQ(review().kind(), paper::ErrorKind::DuplicateActivePosition);

  signal.market_price = 0.35;
  EXPECT_TRUE(review().ok());
}

// -----------------------------------------------------------------------------
// 6. Edge must improve by min_edge_improvement and clear min_edge.
// -----------------------------------------------------------------------------
TEST_F(AveragingDownPolicyTest, EdgeGates) {
  signal.edge = 0.14;  // improvement 0.04
  EXPECT_EQ(review().kind(), paper::ErrorKind::DuplicateActivePosition);

  position.original_edge = 0.02;
  signal.edge = 0.09;  // improved, but under min_edge
  EXPECT_EQ(review().kind(), paper::ErrorKind::DuplicateActivePosition);
}

// -----------------------------------------------------------------------------
// 7. No headroom left in the market.
// -----------------------------------------------------------------------------
TEST_F(AveragingDownPolicyTest, NoHeadroom) {
  position.stake = 600.0;
  EXPECT_EQ(review().kind(), paper::ErrorKind::ExposureLimit);
}
