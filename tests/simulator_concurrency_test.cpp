// =============================================================================
// simulator_concurrency_test.cpp
// =============================================================================
// Multi-threaded tests for paper::Simulator.
//
// Validates:
//   - Racing signals for one market create exactly one position
//   - Signals for many markets from many threads never over-allocate and
//     keep available + allocated == total
//   - Sweeps, closes and new signals interleaved across threads leave the
//     ledger and the journal in agreement (reconcile() passes)
//
// Design note: these tests assert invariants after the threads join, not
// a particular interleaving.
// =============================================================================

#include "paper/engine/simulator.hpp"
#include "paper/journal/in_memory_journal.hpp"
#include "paper/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <set>
#include <string>
#include <thread>
#include <vector>

class SimulatorConcurrencyTest : public ::testing::Test {
 protected:
  static paper::EngineConfig baseConfig() {
    paper::EngineConfig c;
    c.initial_capital = 1000.0;
    c.kelly_fraction = 0.25;
    c.max_trade_exposure = 0.05;
    c.min_edge = 0.10;
    c.stop_loss_pct = 0.20;
    c.take_profit_pct = 0.30;
    c.max_additions = 0;
    c.slippage_base_rate = 0.0;
    c.slippage_impact = 0.0;
    c.slippage_min_rate = 0.0;
    c.drawdown_halt_threshold = 0.90;
    c.journal_retry_backoff_ms = 0;
    c.journal_path = "";
    c.snapshot_path = "";
    return c;
  }

  SimulatorConcurrencyTest()
      : config(baseConfig()),
        clock(1000),
        sim(ledger, store, risk, journal, config, clock, bus) {}

  void SetUp() override { ASSERT_TRUE(sim.initialize().ok()); }

  static paper::domain::Signal signal(const std::string& market) {
    paper::domain::Signal s;
    s.market_id = market;
    s.side = paper::domain::Side::Yes;
    s.probability = 0.7;
    s.market_price = 0.5;
    s.edge = 0.2;
    return s;
  }

  void expectBalanced() {
    const auto cap = sim.capital();
    EXPECT_NEAR(cap.available + cap.allocated, cap.total, 1e-6);
    EXPECT_GE(cap.available, -1e-9);

    double staked = 0.0;
    std::set<std::string> markets;
    for (const auto& pos : sim.activePositions()) {
      staked += pos.stake;
      EXPECT_TRUE(markets.insert(pos.market_id).second)
          << "two active positions in " << pos.market_id;
    }
    EXPECT_NEAR(cap.allocated, staked, 1e-6);
    EXPECT_EQ(ledger.outstanding().size(), sim.activePositions().size());
  }

  paper::CapitalLedger ledger;
  paper::PositionStore store;
  paper::RiskSupervisor risk;
  paper::InMemoryJournal journal;
  paper::ConfigStore config;
  paper::SimulationTimeProvider clock;
  paper::EventBus bus;
  paper::Simulator sim;
};

// -----------------------------------------------------------------------------
// 1. Sixteen threads send the same market's signal at once.
// -----------------------------------------------------------------------------
TEST_F(SimulatorConcurrencyTest, OnePositionPerMarket) {
  constexpr int kThreads = 16;
  std::atomic<int> opened{0};
  std::atomic<int> duplicates{0};

  std::vector<std::thread> threads;
  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back([this, &opened, &duplicates] {
      auto r = sim.submitSignal(signal("SAME"));
      if (r) {
        opened.fetch_add(1);
      } else if (r.kind() == paper::ErrorKind::DuplicateActivePosition ||
                 r.kind() == paper::ErrorKind::ExposureLimit) {
        duplicates.fetch_add(1);
      }
    });
  }
  for (auto& t : threads) {
    t.join();
  }

  EXPECT_EQ(opened.load(), 1);
  EXPECT_EQ(duplicates.load(), kThreads - 1);
  EXPECT_EQ(sim.activePositions().size(), 1u);
  expectBalanced();
}

// -----------------------------------------------------------------------------
// 2. Eight threads x 25 distinct markets.
// -----------------------------------------------------------------------------
TEST_F(SimulatorConcurrencyTest, ManyMarketsNeverOverAllocate) {
  constexpr int kThreads = 8;
  constexpr int kPerThread = 25;

  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([this, t] {
      for (int i = 0; i < kPerThread; ++i) {
        auto r = sim.submitSignal(
            signal("M" + std::to_string(t) + "-" + std::to_string(i)));
        (void)r;
      }
    });
  }
  for (auto& t : threads) {
    t.join();
  }

  EXPECT_EQ(sim.activePositions().size(),
            static_cast<std::size_t>(kThreads * kPerThread));
  EXPECT_LE(sim.capital().allocated, 1000.0 + 1e-6);
  expectBalanced();
  EXPECT_TRUE(sim.reconcile());
}

// -----------------------------------------------------------------------------
// 3. Signals, market updates, sweeps and manual closes interleaved.
// -----------------------------------------------------------------------------
TEST_F(SimulatorConcurrencyTest, MixedWorkloadStaysReconciled) {
  constexpr int kMarkets = 20;
  constexpr int kRounds = 30;
  std::atomic<bool> done{false};

  std::thread sweeper([this, &done] {
    while (!done.load()) {
      sim.evaluateAll();
    }
  });

  std::vector<std::thread> workers;
  for (int w = 0; w < 4; ++w) {
    workers.emplace_back([this, w] {
      for (int round = 0; round < kRounds; ++round) {
        const std::string market = "MIX" + std::to_string((w + round) %
                                                          kMarkets);
        switch ((w + round) % 3) {
          case 0: {
            auto r = sim.submitSignal(signal(market));
            (void)r;
            break;
          }
          case 1: {
            paper::domain::MarketUpdate u;
            u.market_id = market;
            u.yes_price = round % 2 == 0 ? 0.35 : 0.70;
            sim.updateMarket(u);
            break;
          }
          default: {
            auto r = sim.closePosition(market);
            (void)r;
            break;
          }
        }
      }
    });
  }
  for (auto& t : workers) {
    t.join();
  }
  done.store(true);
  sweeper.join();

  EXPECT_FALSE(sim.isHalted()) << sim.haltReason();
  expectBalanced();
  EXPECT_TRUE(sim.reconcile());
}
