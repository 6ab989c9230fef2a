#include "paper/risk/risk_supervisor.hpp"
#include "paper/positions/position_store.hpp"

#include <iostream>
#include <sstream>

namespace paper {

// -----------------------------------------------------------------------------
// evaluate: expiry, stop-loss, take-profit, reversal
// -----------------------------------------------------------------------------
Evaluation RiskSupervisor::evaluate(const domain::Position& position,
                                    const MarketView& view,
                                    std::int64_t now_ms,
                                    const EngineConfig& config) const {
  Evaluation out;

  if (position.status != domain::PositionStatus::Open) {
    return out;
  }

  if (position.resolution_at_ms > 0 && now_ms >= position.resolution_at_ms) {
    out.command = ClosePosition{domain::CloseReason::Expired,
                                "resolution time reached"};
    return out;
  }

  if (view.mark) {
    const double pct = PositionStore::unrealizedPct(position, *view.mark);
    if (pct <= -config.stop_loss_pct) {
      std::ostringstream detail;
      detail << "unrealized " << pct << " <= -" << config.stop_loss_pct;
      out.command = ClosePosition{domain::CloseReason::StopLoss, detail.str()};
      return out;
    }
    if (pct >= config.take_profit_pct) {
      std::ostringstream detail;
      detail << "unrealized " << pct << " >= " << config.take_profit_pct;
      out.command =
          ClosePosition{domain::CloseReason::TakeProfit, detail.str()};
      return out;
    }
  }

  out.reversal = EdgeReversalMonitor::assess(position, view.latest_edge,
                                             ReversalParams::from(config));
  if (out.reversal.reversal) {
    std::ostringstream detail;
    detail << "edge reversal for " << out.reversal.streak
           << " ticks (latest " << out.reversal.last_edge << ")";
    out.command = ClosePosition{domain::CloseReason::Manual, detail.str()};
  }
  return out;
}

// -----------------------------------------------------------------------------
// reviewRepeatSignal: halt gate, then averaging-down policy
// -----------------------------------------------------------------------------
Result<TopUp> RiskSupervisor::reviewRepeatSignal(
    const domain::Position& position, const domain::Signal& signal,
    const domain::CapitalSnapshot& capital, const EngineConfig& config) const {
  auto stake = AveragingDownPolicy::review(position, signal, capital,
                                           AveragingParams::from(config),
                                           SizingParams::from(config));
  if (!stake) {
    return stake.error();
  }
  if (entriesBlocked()) {
    return makeError(ErrorKind::TradingHalted,
                     "averaging down blocked: " + haltReason());
  }
  return TopUp{stake.value()};
}

DrawdownTransition RiskSupervisor::observeCapital(double total,
                                                  std::int64_t now_ms,
                                                  const EngineConfig& config) {
  return drawdown_.observe(total, now_ms, DrawdownParams::from(config));
}

// -----------------------------------------------------------------------------
// Kill switch
// -----------------------------------------------------------------------------
void RiskSupervisor::haltTrading(const std::string& reason) {
  {
    std::lock_guard lock(reason_mutex_);
    kill_reason_ = reason;
  }
  kill_switch_.store(true, std::memory_order_release);
  std::cerr << "[RiskSupervisor] CRITICAL: trading halted: " << reason
            << "\n";
}

void RiskSupervisor::resumeTrading() {
  kill_switch_.store(false, std::memory_order_release);
  {
    std::lock_guard lock(reason_mutex_);
    kill_reason_.clear();
  }
  std::cout << "[RiskSupervisor] Kill switch cleared by operator\n";
}

std::string RiskSupervisor::haltReason() const {
  if (killSwitchActive()) {
    std::lock_guard lock(reason_mutex_);
    return kill_reason_;
  }
  if (drawdownHalted()) {
    std::ostringstream msg;
    msg << "drawdown " << drawdown_.drawdown() << " from peak "
        << drawdown_.peak();
    return msg.str();
  }
  return {};
}

}  // namespace paper
