// =============================================================================
// reporting_export_test.cpp
// =============================================================================
// Unit tests for paper::ReportingExport.
//
// Validates:
//   - Win/loss counting, gross profit and loss, win rate, profit factor
//   - Break-even positions count as closed but neither win nor loss
//   - Empty history summarizes to zeros
//   - closedPositions() reads the store's history
// =============================================================================

#include "paper/positions/position_store.hpp"
#include "paper/reporting/reporting_export.hpp"

#include <gtest/gtest.h>

#include <vector>

class ReportingExportTest : public ::testing::Test {
 protected:
  static paper::domain::Position closed(double pnl) {
    paper::domain::Position p;
    p.status = paper::domain::PositionStatus::Closed;
    p.realized_pnl = pnl;
    return p;
  }
};

// -----------------------------------------------------------------------------
// 1. Mixed history.
// -----------------------------------------------------------------------------
TEST_F(ReportingExportTest, SummarizesMixedHistory) {
  const std::vector<paper::domain::Position> history = {
      closed(30.0), closed(-10.0), closed(20.0), closed(-15.0), closed(0.0)};

  const auto s = paper::ReportingExport::summarize(history);
  EXPECT_EQ(s.closed, 5u);
  EXPECT_EQ(s.wins, 2u);
  EXPECT_EQ(s.losses, 2u);
  EXPECT_DOUBLE_EQ(s.win_rate, 0.4);
  EXPECT_DOUBLE_EQ(s.gross_profit, 50.0);
  EXPECT_DOUBLE_EQ(s.gross_loss, 25.0);
  EXPECT_DOUBLE_EQ(s.profit_factor, 2.0);
  EXPECT_DOUBLE_EQ(s.total_realized_pnl, 25.0);
}

// -----------------------------------------------------------------------------
// 2. No losses: profit factor falls back to gross profit.
// -----------------------------------------------------------------------------
TEST_F(ReportingExportTest, NoLosses) {
  const auto s = paper::ReportingExport::summarize({closed(12.5)});
  EXPECT_DOUBLE_EQ(s.win_rate, 1.0);
  EXPECT_DOUBLE_EQ(s.profit_factor, 12.5);
}

// -----------------------------------------------------------------------------
// 3. Nothing closed.
// -----------------------------------------------------------------------------
TEST_F(ReportingExportTest, EmptyHistory) {
  const auto s = paper::ReportingExport::summarize({});
  EXPECT_EQ(s.closed, 0u);
  EXPECT_DOUBLE_EQ(s.win_rate, 0.0);
  EXPECT_DOUBLE_EQ(s.profit_factor, 0.0);
  EXPECT_DOUBLE_EQ(s.total_realized_pnl, 0.0);
}

// -----------------------------------------------------------------------------
// 4. closedPositions() returns the store's closed list in order.
// -----------------------------------------------------------------------------
TEST_F(ReportingExportTest, ReadsStoreHistory) {
  paper::PositionStore store;
  for (const char* market : {"A", "B"}) {
    ASSERT_TRUE(
        store.beginOpening(market, paper::domain::Side::Yes, 0.2, 0).ok());
    ASSERT_TRUE(store
                    .confirmOpen(market,
                                 paper::domain::ReservationToken{1, 10.0}, 0.5,
                                 0)
                    .ok());
    ASSERT_TRUE(
        store.beginClosing(market, paper::domain::CloseReason::Manual).ok());
    ASSERT_TRUE(store.finalizeClose(market, 0.6, 0).ok());
  }

  const auto history = paper::ReportingExport::closedPositions(store);
  ASSERT_EQ(history.size(), 2u);
  EXPECT_EQ(history[0].market_id, "A");
  EXPECT_EQ(history[1].market_id, "B");
  EXPECT_NEAR(history[0].realized_pnl, 2.0, 1e-9);
}
