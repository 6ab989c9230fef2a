// =============================================================================
// risk_supervisor_test.cpp
// =============================================================================
// Unit tests for paper::RiskSupervisor.
//
// Validates:
//   - Exit precedence: expiry, stop-loss, take-profit, edge reversal
//   - Hold carries the reversal verdict for the caller to record
//   - Kill switch and drawdown both block entries; reasons are reported
//   - Repeat signals: policy rejection first, then the halt check
// =============================================================================

#include "paper/risk/risk_supervisor.hpp"

#include <gtest/gtest.h>

#include <variant>

using paper::domain::CloseReason;

class RiskSupervisorTest : public ::testing::Test {
 protected:
  void SetUp() override {
    position.position_id = 1;
    position.market_id = "M1";
    position.side = paper::domain::Side::Yes;
    position.status = paper::domain::PositionStatus::Open;
    position.entry_price = 0.50;
    position.stake = 100.0;
    position.contracts = 200.0;
    position.original_edge = 0.15;
    position.last_edge = 0.15;

    config.stop_loss_pct = 0.20;
    config.take_profit_pct = 0.30;
    config.reversal_ticks = 2;
    config.min_edge = 0.10;
    config.drawdown_halt_threshold = 0.10;
    config.drawdown_resume_threshold = 0.05;
  }

  static const paper::ClosePosition* asClose(const paper::Evaluation& e) {
    return std::get_if<paper::ClosePosition>(&e.command);
  }

  paper::RiskSupervisor risk;
  paper::domain::Position position;
  paper::EngineConfig config;
};

// -----------------------------------------------------------------------------
// 1. Mark within the band: hold.
// -----------------------------------------------------------------------------
TEST_F(RiskSupervisorTest, HoldInsideBand) {
  paper::MarketView view;
  view.mark = 0.55;
  const auto e = risk.evaluate(position, view, 0, config);
  EXPECT_TRUE(std::holds_alternative<paper::Hold>(e.command));
}

// -----------------------------------------------------------------------------
// 2. Stop-loss at -20%, take-profit at +30%.
// -----------------------------------------------------------------------------
TEST_F(RiskSupervisorTest, StopLossAndTakeProfit) {
  paper::MarketView view;
  view.mark = 0.39;
  auto e = risk.evaluate(position, view, 0, config);
  ASSERT_NE(asClose(e), nullptr);
  EXPECT_EQ(asClose(e)->reason, CloseReason::StopLoss);

  view.mark = 0.70;
  e = risk.evaluate(position, view, 0, config);
  ASSERT_NE(asClose(e), nullptr);
  EXPECT_EQ(asClose(e)->reason, CloseReason::TakeProfit);
}

// -----------------------------------------------------------------------------
// 3. Expiry wins over every other exit.
// -----------------------------------------------------------------------------
TEST_F(RiskSupervisorTest, ExpiryTakesPrecedence) {
  position.resolution_at_ms = 5000;
  paper::MarketView view;
  view.mark = 0.10;

  auto before = risk.evaluate(position, view, 4999, config);
  ASSERT_NE(asClose(before), nullptr);
  EXPECT_EQ(asClose(before)->reason, CloseReason::StopLoss);

  auto at = risk.evaluate(position, view, 5000, config);
  ASSERT_NE(asClose(at), nullptr);
  EXPECT_EQ(asClose(at)->reason, CloseReason::Expired);
}

// -----------------------------------------------------------------------------
// 4. Edge reversal closes as Manual after the configured ticks.
// -----------------------------------------------------------------------------
TEST_F(RiskSupervisorTest, EdgeReversalCloses) {
  paper::MarketView view;
  view.mark = 0.50;
  view.latest_edge = paper::EdgeObservation{-0.05,
                                            paper::domain::ConfidenceTier::Medium};

  auto first = risk.evaluate(position, view, 0, config);
  EXPECT_TRUE(std::holds_alternative<paper::Hold>(first.command));
  EXPECT_EQ(first.reversal.streak, 1);

  position.reversal_streak = first.reversal.streak;
  auto second = risk.evaluate(position, view, 0, config);
  ASSERT_NE(asClose(second), nullptr);
  EXPECT_EQ(asClose(second)->reason, CloseReason::Manual);
}

// -----------------------------------------------------------------------------
// 5. Non-Open positions are never acted on.
// -----------------------------------------------------------------------------
TEST_F(RiskSupervisorTest, IgnoresNonOpen) {
  position.status = paper::domain::PositionStatus::ClosingStopLoss;
  paper::MarketView view;
  view.mark = 0.01;
  const auto e = risk.evaluate(position, view, 0, config);
  EXPECT_TRUE(std::holds_alternative<paper::Hold>(e.command));
}

// -----------------------------------------------------------------------------
// 6. Kill switch: blocks entries, carries its reason, clears on resume.
// -----------------------------------------------------------------------------
TEST_F(RiskSupervisorTest, KillSwitch) {
  EXPECT_FALSE(risk.entriesBlocked());
  risk.haltTrading("operator HALT");
  EXPECT_TRUE(risk.entriesBlocked());
  EXPECT_EQ(risk.haltReason(), "operator HALT");

  risk.resumeTrading();
  EXPECT_FALSE(risk.entriesBlocked());
  EXPECT_TRUE(risk.haltReason().empty());
}

// -----------------------------------------------------------------------------
// 7. Drawdown breaker blocks entries independently of the kill switch.
// -----------------------------------------------------------------------------
TEST_F(RiskSupervisorTest, DrawdownBlocksEntries) {
  risk.drawdown().reset(1000.0);
  EXPECT_EQ(risk.observeCapital(850.0, 0, config),
            paper::DrawdownTransition::Halted);
  EXPECT_TRUE(risk.drawdownHalted());
  EXPECT_TRUE(risk.entriesBlocked());
  EXPECT_FALSE(risk.killSwitchActive());
  EXPECT_NE(risk.haltReason().find("drawdown"), std::string::npos);

  // Resuming the kill switch does not lift a drawdown halt.
  risk.resumeTrading();
  EXPECT_TRUE(risk.entriesBlocked());

  EXPECT_EQ(risk.observeCapital(990.0, 0, config),
            paper::DrawdownTransition::Resumed);
  EXPECT_FALSE(risk.entriesBlocked());
}

// -----------------------------------------------------------------------------
// 8. Repeat signals: ineligible ones keep their own error even when halted;
//    eligible ones are refused while halted.
// -----------------------------------------------------------------------------
TEST_F(RiskSupervisorTest, RepeatSignalReview) {
  config.kelly_fraction = 0.25;
  config.max_trade_exposure = 0.05;
  config.max_additions = 1;
  config.max_market_exposure = 0.10;
  config.averaging_price_drop = 0.10;
  config.averaging_min_edge_improvement = 0.05;

  paper::domain::Signal repeat;
  repeat.market_id = "M1";
  repeat.side = paper::domain::Side::Yes;
  repeat.probability = 0.60;
  repeat.market_price = 0.40;
  repeat.edge = 0.25;
  const paper::domain::CapitalSnapshot capital{5000.0, 4900.0, 100.0};

  auto ok = risk.reviewRepeatSignal(position, repeat, capital, config);
  ASSERT_TRUE(ok.ok()) << ok.error().message;
  EXPECT_GT(ok.value().stake, 0.0);
  EXPECT_LE(ok.value().stake, 400.0);

  risk.haltTrading("test");
  EXPECT_EQ(risk.reviewRepeatSignal(position, repeat, capital, config).kind(),
            paper::ErrorKind::TradingHalted);

  repeat.side = paper::domain::Side::No;
  EXPECT_EQ(risk.reviewRepeatSignal(position, repeat, capital, config).kind(),
            paper::ErrorKind::DuplicateActivePosition);
}
