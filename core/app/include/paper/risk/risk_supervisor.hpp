#pragma once

#include "paper/config/engine_config.hpp"
#include "paper/domain/capital.hpp"
#include "paper/domain/position.hpp"
#include "paper/domain/result.hpp"
#include "paper/domain/signal.hpp"
#include "paper/risk/averaging_down_policy.hpp"
#include "paper/risk/drawdown_protector.hpp"
#include "paper/risk/edge_reversal_monitor.hpp"

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <variant>

namespace paper {

// --- Lifecycle commands the supervisor hands back to the Simulator ----------

struct Hold {};

struct ClosePosition {
  domain::CloseReason reason{domain::CloseReason::Manual};
  std::string detail;
};

struct TopUp {
  double stake{0.0};
};

using RiskCommand = std::variant<Hold, ClosePosition, TopUp>;

// What the Simulator currently knows about a market.
struct MarketView {
  std::optional<double> mark;                    // held side's price
  std::optional<EdgeObservation> latest_edge;    // relative to held side
};

struct Evaluation {
  RiskCommand command{Hold{}};
  ReversalVerdict reversal{};
};

// -----------------------------------------------------------------------------
// RiskSupervisor
// -----------------------------------------------------------------------------
//
// @brief  Turns positions, marks and model updates into lifecycle
//         commands (Hold, ClosePosition, TopUp) and owns the two trading
//         halts: the drawdown breaker and the kill switch.
//
// @details
// The supervisor never mutates capital or positions itself; the Simulator
// executes the command it returns.
//
// evaluate() checks, in order:
//   1. expiry       now >= resolution_at          -> Close(Expired)
//   2. stop-loss    unrealized_pct <= -stop_loss  -> Close(StopLoss)
//   3. take-profit  unrealized_pct >= take_profit -> Close(TakeProfit)
//   4. reversal     EdgeReversalMonitor streak    -> Close(Manual)
// Without a mark only checks 1 and 4 run.
//
// Kill switch:
//   Set by the Simulator on LedgerInvariantViolation, on journal
//   exhaustion and on a failed reconciliation, or by the operator through
//   the IPC HALT command. Unlike the drawdown breaker it never clears
//   itself; only resumeTrading() (operator RESUME) clears it.
//
// entriesBlocked() is what gates Openings and top-ups. Closes are never
// gated.
//
// Thread model:
//   evaluate() and reviewRepeatSignal() are const and lock-free apart from
//   reading the halt flags. The kill switch is an atomic flag; the reason
//   string is guarded by reason_mutex_. DrawdownProtector serialises itself.
//
// Ownership:
//   Owned by PaperEngine (or a test), referenced by Simulator.
// -----------------------------------------------------------------------------
class RiskSupervisor {
 public:
  RiskSupervisor() = default;

  RiskSupervisor(const RiskSupervisor&) = delete;
  RiskSupervisor& operator=(const RiskSupervisor&) = delete;
  RiskSupervisor(RiskSupervisor&&) = delete;
  RiskSupervisor& operator=(RiskSupervisor&&) = delete;

  // -------------------------------------------------------------------------
  // evaluate(position, view, now_ms, config)
  // -------------------------------------------------------------------------
  // @brief  Periodic re-evaluation of one Open position.
  //
  // @return The command to execute plus the reversal verdict, which the
  //         Simulator records on the position when the command is Hold.
  // -------------------------------------------------------------------------
  Evaluation evaluate(const domain::Position& position, const MarketView& view,
                      std::int64_t now_ms, const EngineConfig& config) const;

  // -------------------------------------------------------------------------
  // reviewRepeatSignal(position, signal, capital, config)
  // -------------------------------------------------------------------------
  // @brief  Decides what a signal for a market that already holds a
  //         position becomes.
  //
  // @return TopUp with the addition stake, TradingHalted while entries are
  //         blocked, or the AveragingDownPolicy rejection.
  // -------------------------------------------------------------------------
  Result<TopUp> reviewRepeatSignal(const domain::Position& position,
                                   const domain::Signal& signal,
                                   const domain::CapitalSnapshot& capital,
                                   const EngineConfig& config) const;

  // Feeds the drawdown breaker with the latest total.
  DrawdownTransition observeCapital(double total, std::int64_t now_ms,
                                    const EngineConfig& config);

  void haltTrading(const std::string& reason);
  void resumeTrading();

  bool killSwitchActive() const {
    return kill_switch_.load(std::memory_order_acquire);
  }
  bool drawdownHalted() const { return drawdown_.halted(); }
  bool entriesBlocked() const { return killSwitchActive() || drawdownHalted(); }

  // Why entries are blocked, or an empty string.
  std::string haltReason() const;

  const DrawdownProtector& drawdown() const { return drawdown_; }
  DrawdownProtector& drawdown() { return drawdown_; }

 private:
  DrawdownProtector drawdown_;

  std::atomic<bool> kill_switch_{false};
  mutable std::mutex reason_mutex_;
  std::string kill_reason_;
};

}  // namespace paper
