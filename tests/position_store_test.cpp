// =============================================================================
// position_store_test.cpp
// =============================================================================
// Unit tests for paper::PositionStore.
//
// Validates:
//   - Lifecycle Opening -> Open -> Closing* -> Closed, and nothing else
//   - At most one non-terminal position per market
//   - Volume-weighted entry price on averaging down
//   - realized_pnl = contracts * exit_price - stake
//   - Closed positions are immutable history; the market can reopen
//   - hydrate() keeps position ids monotonic
// =============================================================================

#include "paper/positions/position_store.hpp"

#include <gtest/gtest.h>

using paper::domain::CloseReason;
using paper::domain::PositionStatus;
using paper::domain::ReservationToken;
using paper::domain::Side;

class PositionStoreTest : public ::testing::Test {
 protected:
  paper::PositionStore store;

  // Opening + confirmOpen in one step.
  paper::domain::Position open(const std::string& market, double stake,
                               double fill, paper::domain::TokenId token = 1) {
    auto opening = store.beginOpening(market, Side::Yes, 0.15, 1000);
    EXPECT_TRUE(opening.ok());
    auto pos = store.confirmOpen(market, ReservationToken{token, stake}, fill,
                                 0);
    EXPECT_TRUE(pos.ok());
    return pos.value();
  }
};

// -----------------------------------------------------------------------------
// 1. beginOpening creates a transient Opening position; confirmOpen books it.
// -----------------------------------------------------------------------------
TEST_F(PositionStoreTest, OpenLifecycle) {
  auto opening = store.beginOpening("M1", Side::No, 0.12, 500);
  ASSERT_TRUE(opening.ok());
  EXPECT_EQ(opening.value().status, PositionStatus::Opening);
  EXPECT_EQ(opening.value().side, Side::No);
  EXPECT_DOUBLE_EQ(opening.value().original_edge, 0.12);
  EXPECT_EQ(opening.value().opened_at_ms, 500);

  auto pos = store.confirmOpen("M1", ReservationToken{3, 50.0}, 0.25, 9000);
  ASSERT_TRUE(pos.ok());
  EXPECT_EQ(pos.value().status, PositionStatus::Open);
  EXPECT_DOUBLE_EQ(pos.value().stake, 50.0);
  EXPECT_DOUBLE_EQ(pos.value().entry_price, 0.25);
  EXPECT_DOUBLE_EQ(pos.value().contracts, 200.0);
  EXPECT_EQ(pos.value().resolution_at_ms, 9000);
  ASSERT_EQ(pos.value().reservations.size(), 1u);
  EXPECT_EQ(pos.value().reservations[0].id, 3u);
}

// -----------------------------------------------------------------------------
// 2. A market holds at most one non-terminal position, Opening included.
// -----------------------------------------------------------------------------
TEST_F(PositionStoreTest, OneActivePositionPerMarket) {
  ASSERT_TRUE(store.beginOpening("M1", Side::Yes, 0.15, 0).ok());

  auto dup = store.beginOpening("M1", Side::No, 0.20, 0);
  ASSERT_FALSE(dup.ok());
  EXPECT_EQ(dup.kind(), paper::ErrorKind::DuplicateActivePosition);

  EXPECT_TRUE(store.beginOpening("M2", Side::Yes, 0.15, 0).ok());
  EXPECT_EQ(store.activeCount(), 2u);
}

// -----------------------------------------------------------------------------
// 3. abandonOpening only discards Opening positions.
// -----------------------------------------------------------------------------
TEST_F(PositionStoreTest, AbandonOpening) {
  ASSERT_TRUE(store.beginOpening("M1", Side::Yes, 0.15, 0).ok());
  EXPECT_TRUE(store.abandonOpening("M1"));
  EXPECT_FALSE(store.find("M1").has_value());

  open("M2", 100.0, 0.5);
  EXPECT_FALSE(store.abandonOpening("M2"));
  EXPECT_TRUE(store.find("M2").has_value());
}

// -----------------------------------------------------------------------------
// 4. Averaging down: 100 @ 0.40 + 50 @ 0.50 -> entry 0.4333.
// -----------------------------------------------------------------------------
TEST_F(PositionStoreTest, AdditionWeightsEntryPrice) {
  open("M1", 100.0, 0.40);

  paper::AdditionLimits limits{1, 500.0};
  auto pos = store.applyAddition("M1", ReservationToken{2, 50.0}, 0.50, limits);
  ASSERT_TRUE(pos.ok());

  EXPECT_NEAR(pos.value().entry_price, (100.0 * 0.40 + 50.0 * 0.50) / 150.0,
              1e-12);
  EXPECT_NEAR(pos.value().entry_price, 0.43333, 1e-5);
  EXPECT_DOUBLE_EQ(pos.value().stake, 150.0);
  EXPECT_NEAR(pos.value().contracts, 250.0 + 100.0, 1e-9);
  EXPECT_EQ(pos.value().additions, 1);
  EXPECT_EQ(pos.value().reservations.size(), 2u);
}

// -----------------------------------------------------------------------------
// 5. Additions are bounded by count and cumulative stake.
// -----------------------------------------------------------------------------
TEST_F(PositionStoreTest, AdditionLimits) {
  open("M1", 100.0, 0.40);

  auto too_big = store.applyAddition("M1", ReservationToken{2, 60.0}, 0.30,
                                     paper::AdditionLimits{1, 150.0});
  ASSERT_FALSE(too_big.ok());
  EXPECT_EQ(too_big.kind(), paper::ErrorKind::ExposureLimit);

  ASSERT_TRUE(store
                  .applyAddition("M1", ReservationToken{2, 50.0}, 0.30,
                                 paper::AdditionLimits{1, 150.0})
                  .ok());

  auto too_many = store.applyAddition("M1", ReservationToken{3, 1.0}, 0.30,
                                      paper::AdditionLimits{1, 1000.0});
  ASSERT_FALSE(too_many.ok());
  EXPECT_EQ(too_many.kind(), paper::ErrorKind::ExposureLimit);
}

// -----------------------------------------------------------------------------
// 6. Close: Open -> ClosingStopLoss -> Closed with booked PnL.
// -----------------------------------------------------------------------------
TEST_F(PositionStoreTest, CloseBooksRealizedPnl) {
  open("M1", 100.0, 0.50);  // 200 contracts

  auto closing = store.beginClosing("M1", CloseReason::StopLoss);
  ASSERT_TRUE(closing.ok());
  EXPECT_EQ(closing.value().status, PositionStatus::ClosingStopLoss);
  EXPECT_EQ(closing.value().close_reason, CloseReason::StopLoss);

  auto closed = store.finalizeClose("M1", 0.40, 7000);
  ASSERT_TRUE(closed.ok());
  EXPECT_EQ(closed.value().status, PositionStatus::Closed);
  EXPECT_NEAR(closed.value().realized_pnl, 200.0 * 0.40 - 100.0, 1e-9);
  EXPECT_DOUBLE_EQ(closed.value().exit_price, 0.40);
  EXPECT_EQ(closed.value().closed_at_ms, 7000);

  EXPECT_FALSE(store.find("M1").has_value());
  ASSERT_EQ(store.closedPositions().size(), 1u);
  EXPECT_EQ(store.closedPositions()[0].position_id, closed.value().position_id);
}

// -----------------------------------------------------------------------------
// 7. Resolution maps onto ClosingExpired and settles at 1.
// -----------------------------------------------------------------------------
TEST_F(PositionStoreTest, ResolutionUsesExpiredState) {
  open("M1", 100.0, 0.25);

  auto closing = store.beginClosing("M1", CloseReason::Resolved);
  ASSERT_TRUE(closing.ok());
  EXPECT_EQ(closing.value().status, PositionStatus::ClosingExpired);

  auto closed = store.finalizeClose("M1", 1.0, 0);
  ASSERT_TRUE(closed.ok());
  EXPECT_NEAR(closed.value().realized_pnl, 300.0, 1e-9);
  EXPECT_EQ(closed.value().close_reason, CloseReason::Resolved);
}

// -----------------------------------------------------------------------------
// 8. Illegal edges are refused.
// -----------------------------------------------------------------------------
TEST_F(PositionStoreTest, IllegalTransitionsRejected) {
  ASSERT_TRUE(store.beginOpening("M1", Side::Yes, 0.15, 0).ok());

  // Opening cannot close or take additions.
  EXPECT_EQ(store.beginClosing("M1", CloseReason::Manual).kind(),
            paper::ErrorKind::InvalidTransition);
  EXPECT_EQ(store
                .applyAddition("M1", ReservationToken{9, 10.0}, 0.5,
                               paper::AdditionLimits{3, 1000.0})
                .kind(),
            paper::ErrorKind::InvalidTransition);
  EXPECT_EQ(store.finalizeClose("M1", 0.5, 0).kind(),
            paper::ErrorKind::InvalidTransition);

  ASSERT_TRUE(store.confirmOpen("M1", ReservationToken{1, 10.0}, 0.5, 0).ok());
  EXPECT_EQ(store.confirmOpen("M1", ReservationToken{2, 10.0}, 0.5, 0).kind(),
            paper::ErrorKind::InvalidTransition);

  ASSERT_TRUE(store.beginClosing("M1", CloseReason::Manual).ok());
  EXPECT_EQ(store.beginClosing("M1", CloseReason::StopLoss).kind(),
            paper::ErrorKind::InvalidTransition);
  EXPECT_EQ(store.recordEvaluation("M1", 0.0, 1).kind(),
            paper::ErrorKind::InvalidTransition);

  EXPECT_EQ(store.beginClosing("NOPE", CloseReason::Manual).kind(),
            paper::ErrorKind::UnknownMarket);
  EXPECT_EQ(store.beginClosing("M1", CloseReason::None).kind(),
            paper::ErrorKind::InvalidTransition);
}

// -----------------------------------------------------------------------------
// 9. Transition table spot checks.
// -----------------------------------------------------------------------------
TEST_F(PositionStoreTest, TransitionTable) {
  using S = PositionStatus;
  EXPECT_TRUE(paper::PositionStore::canTransition(S::Opening, S::Open));
  EXPECT_TRUE(paper::PositionStore::canTransition(S::Open, S::Open));
  EXPECT_TRUE(paper::PositionStore::canTransition(S::Open, S::ClosingExpired));
  EXPECT_TRUE(paper::PositionStore::canTransition(S::ClosingManual, S::Closed));
  EXPECT_FALSE(paper::PositionStore::canTransition(S::Opening, S::Closed));
  EXPECT_FALSE(paper::PositionStore::canTransition(S::Open, S::Closed));
  EXPECT_FALSE(paper::PositionStore::canTransition(S::ClosingStopLoss, S::Open));
  EXPECT_FALSE(paper::PositionStore::canTransition(S::Closed, S::Open));
}

// -----------------------------------------------------------------------------
// 10. A closed market can be opened again with a fresh position id.
// -----------------------------------------------------------------------------
TEST_F(PositionStoreTest, MarketReopensAfterClose) {
  const auto first = open("M1", 100.0, 0.5);
  ASSERT_TRUE(store.beginClosing("M1", CloseReason::Manual).ok());
  ASSERT_TRUE(store.finalizeClose("M1", 0.5, 0).ok());

  const auto second = open("M1", 80.0, 0.4, 2);
  EXPECT_GT(second.position_id, first.position_id);
  EXPECT_EQ(store.activeCount(), 1u);
  EXPECT_EQ(store.closedPositions().size(), 1u);
}

// -----------------------------------------------------------------------------
// 11. recordEvaluation stores the streak on Open positions.
// -----------------------------------------------------------------------------
TEST_F(PositionStoreTest, RecordEvaluation) {
  open("M1", 100.0, 0.5);
  auto pos = store.recordEvaluation("M1", -0.05, 1);
  ASSERT_TRUE(pos.ok());
  EXPECT_DOUBLE_EQ(pos.value().last_edge, -0.05);
  EXPECT_EQ(pos.value().reversal_streak, 1);
  EXPECT_EQ(store.recordEvaluation("M9", 0.0, 0).kind(),
            paper::ErrorKind::UnknownMarket);
}

// -----------------------------------------------------------------------------
// 12. hydrate() replaces contents; later ids exceed hydrated ones.
// -----------------------------------------------------------------------------
TEST_F(PositionStoreTest, HydrateAdvancesIds) {
  paper::domain::Position active;
  active.position_id = 41;
  active.market_id = "A";
  active.status = PositionStatus::Open;
  active.stake = 10.0;

  paper::domain::Position closed;
  closed.position_id = 40;
  closed.market_id = "B";
  closed.status = PositionStatus::Closed;

  store.hydrate({active}, {closed});
  EXPECT_EQ(store.activeCount(), 1u);
  EXPECT_EQ(store.closedPositions().size(), 1u);
  ASSERT_TRUE(store.find("A").has_value());

  auto fresh = store.beginOpening("C", Side::Yes, 0.2, 0);
  ASSERT_TRUE(fresh.ok());
  EXPECT_GT(fresh.value().position_id, 41u);
}

// -----------------------------------------------------------------------------
// 13. unrealizedPct measures the mark against the entry price.
// -----------------------------------------------------------------------------
TEST_F(PositionStoreTest, UnrealizedPct) {
  paper::domain::Position pos;
  pos.entry_price = 0.50;
  EXPECT_NEAR(paper::PositionStore::unrealizedPct(pos, 0.40), -0.20, 1e-12);
  EXPECT_NEAR(paper::PositionStore::unrealizedPct(pos, 0.60), 0.20, 1e-12);
}
