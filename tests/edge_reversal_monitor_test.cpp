// =============================================================================
// edge_reversal_monitor_test.cpp
// =============================================================================
// Unit tests for paper::EdgeReversalMonitor.
//
// Validates:
//   - A sign flip of the edge is evidence; a positive edge resets the streak
//   - A HIGH-confidence edge below min_edge is evidence
//   - Reversal fires only after reversal_ticks consecutive ticks
//   - observe() negates signals for the opposite side
// =============================================================================

#include "paper/risk/edge_reversal_monitor.hpp"

#include <gtest/gtest.h>

using paper::domain::ConfidenceTier;

class EdgeReversalMonitorTest : public ::testing::Test {
 protected:
  void SetUp() override {
    position.market_id = "M1";
    position.side = paper::domain::Side::Yes;
    position.status = paper::domain::PositionStatus::Open;
    position.original_edge = 0.15;
    position.last_edge = 0.15;
    params.reversal_ticks = 2;
    params.min_edge = 0.10;
  }

  static paper::EdgeObservation edge(double e,
                                     ConfidenceTier c = ConfidenceTier::Medium) {
    return paper::EdgeObservation{e, c};
  }

  paper::domain::Position position;
  paper::ReversalParams params;
};

// -----------------------------------------------------------------------------
// 1. No fresh observation: no evidence, streak reset, last edge kept.
// -----------------------------------------------------------------------------
TEST_F(EdgeReversalMonitorTest, NoObservation) {
  position.reversal_streak = 1;
  const auto v = paper::EdgeReversalMonitor::assess(position, std::nullopt,
                                                    params);
  EXPECT_FALSE(v.evidence);
  EXPECT_EQ(v.streak, 0);
  EXPECT_FALSE(v.reversal);
  EXPECT_DOUBLE_EQ(v.last_edge, 0.15);
}

// -----------------------------------------------------------------------------
// 2. Two consecutive flipped ticks close the position.
// -----------------------------------------------------------------------------
TEST_F(EdgeReversalMonitorTest, FlipNeedsConsecutiveTicks) {
  auto first = paper::EdgeReversalMonitor::assess(position, edge(-0.05),
                                                  params);
  EXPECT_TRUE(first.evidence);
  EXPECT_EQ(first.streak, 1);
  EXPECT_FALSE(first.reversal);
  EXPECT_DOUBLE_EQ(first.last_edge, -0.05);

  position.reversal_streak = first.streak;
  auto second = paper::EdgeReversalMonitor::assess(position, edge(0.0),
                                                   params);
  EXPECT_TRUE(second.evidence);
  EXPECT_EQ(second.streak, 2);
  EXPECT_TRUE(second.reversal);
}

// -----------------------------------------------------------------------------
// 3. A healthy tick in between resets the streak.
// -----------------------------------------------------------------------------
TEST_F(EdgeReversalMonitorTest, HealthyTickResetsStreak) {
  position.reversal_streak = 1;
  auto v = paper::EdgeReversalMonitor::assess(position, edge(0.12), params);
  EXPECT_FALSE(v.evidence);
  EXPECT_EQ(v.streak, 0);
  EXPECT_FALSE(v.reversal);
}

// -----------------------------------------------------------------------------
// 4. Weak edge counts only at HIGH confidence.
// -----------------------------------------------------------------------------
TEST_F(EdgeReversalMonitorTest, WeakHighConfidenceIsEvidence) {
  auto medium = paper::EdgeReversalMonitor::assess(
      position, edge(0.05, ConfidenceTier::Medium), params);
  EXPECT_FALSE(medium.evidence);

  auto high = paper::EdgeReversalMonitor::assess(
      position, edge(0.05, ConfidenceTier::High), params);
  EXPECT_TRUE(high.evidence);
  EXPECT_EQ(high.streak, 1);
}

// -----------------------------------------------------------------------------
// 5. reversal_ticks = 1 closes on the first piece of evidence.
// -----------------------------------------------------------------------------
TEST_F(EdgeReversalMonitorTest, SingleTickConfig) {
  params.reversal_ticks = 1;
  auto v = paper::EdgeReversalMonitor::assess(position, edge(-0.2), params);
  EXPECT_TRUE(v.reversal);
}

// -----------------------------------------------------------------------------
// 6. observe(): signals for the other side count against the held side.
// -----------------------------------------------------------------------------
TEST_F(EdgeReversalMonitorTest, ObserveSignsBySide) {
  paper::domain::Signal s;
  s.side = paper::domain::Side::No;
  s.edge = 0.18;
  s.confidence = ConfidenceTier::High;

  const auto against = paper::EdgeReversalMonitor::observe(
      paper::domain::Side::Yes, s);
  EXPECT_DOUBLE_EQ(against.signed_edge, -0.18);
  EXPECT_EQ(against.confidence, ConfidenceTier::High);

  const auto with = paper::EdgeReversalMonitor::observe(
      paper::domain::Side::No, s);
  EXPECT_DOUBLE_EQ(with.signed_edge, 0.18);
}
