#pragma once

#include "paper/capital/capital_ledger.hpp"
#include "paper/concurrent/market_lock_table.hpp"
#include "paper/config/config_store.hpp"
#include "paper/domain/capital.hpp"
#include "paper/domain/position.hpp"
#include "paper/domain/result.hpp"
#include "paper/domain/signal.hpp"
#include "paper/eventbus/event_bus.hpp"
#include "paper/events/risk_alert_event.hpp"
#include "paper/journal/capital_snapshot_file.hpp"
#include "paper/journal/i_journal.hpp"
#include "paper/journal/journal_replayer.hpp"
#include "paper/positions/position_store.hpp"
#include "paper/risk/risk_supervisor.hpp"
#include "paper/time/i_time_provider.hpp"

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace paper {

enum class SignalAction {
  Opened,
  AveragedDown,
};

inline const char* signalActionToString(SignalAction action) {
  switch (action) {
    case SignalAction::Opened:       return "OPENED";
    case SignalAction::AveragedDown: return "AVERAGED_DOWN";
  }
  return "UNKNOWN";
}

// What an accepted signal did.
struct SignalOutcome {
  SignalAction action{SignalAction::Opened};
  domain::Position position;  // after the step
  double stake{0.0};          // capital reserved by this step
  double fill_price{0.0};
};

struct SweepSummary {
  std::size_t evaluated{0};
  std::size_t held{0};
  std::size_t closed{0};
  std::size_t failed{0};
};

// -----------------------------------------------------------------------------
// Simulator - the paper-trading engine proper
// -----------------------------------------------------------------------------
//
// @brief  Runs every signal through Dedup -> Size -> Reserve -> Open, every
//         open position through Evaluate -> Close -> Release, and is the only
//         caller of CapitalLedger::reserve()/release().
//
// @details
// Signal intake (submitSignal):
//   1. Validate ranges (InvalidSignal) and record the market mark.
//   2. Under the market lock:
//      - market already has a position: ask RiskSupervisor whether the
//        signal is an averaging-down TopUp; otherwise reject
//        (DuplicateActivePosition / ExposureLimit / TradingHalted).
//      - no position: TradingHalted if entries are blocked, else size with
//        KellySizer, beginOpening, reserve, journal, confirmOpen.
//
// Write-ahead:
//   Each step is journaled as one batch before it becomes visible in the
//   store: [RESERVE, OPENED], [RESERVE, AVERAGED_DOWN],
//   [CLOSING_STARTED, RELEASE..., CLOSED]. Reservations happen before the
//   batch (the token id is part of it); if the batch cannot be written
//   after journal_max_retries retries the reservation is released with zero
//   PnL, the step is abandoned and the kill switch is set. A close whose
//   batch fails leaves the position in its Closing* state; the next sweep
//   retries it.
//
// Evaluation (evaluateAll / evaluateMarket):
//   RiskSupervisor decides Hold or ClosePosition from the latest mark and
//   the latest model edge; a changed reversal streak is journaled as an
//   EVALUATED transition. Exits fill through SlippageModel (Sell);
//   resolution settles at 1.0 / 0.0 without slippage.
//
// Halts:
//   Entries (Openings and TopUps) are refused while the drawdown breaker is
//   tripped or the kill switch is set. Closes always run. The kill switch
//   is set on LedgerInvariantViolation (caught here, at the orchestration
//   step), on journal exhaustion, on a failed reconciliation and by the
//   operator; only resume() clears it.
//
// Thread model:
//   All public methods are safe to call concurrently. Locks, always taken
//   in this order:
//     1. per-market lock (MarketLockTable) around every read-decide-write
//        sequence on one market;
//     2. commit_gate_ shared from a ledger mutation until its journal batch
//        is durable; reconcile() and checkpoints take it exclusively, so
//        they see the ledger and the journal at the same point;
//     3. the ledger's own lock.
//   checkpoint() takes checkpoint_mutex_ and then the gate exclusively,
//   after the caller has dropped its shared hold. markets_mutex_ guards
//   the mark table only and is never held while taking another lock.
//
// Ownership:
//   Holds references to everything it uses; owns only the lock table and
//   the mark table. PaperEngine (or a test) owns the collaborators and must
//   keep them alive for the Simulator's lifetime.
// -----------------------------------------------------------------------------
class Simulator {
 public:
  Simulator(CapitalLedger& ledger, PositionStore& store, RiskSupervisor& risk,
            IJournal& journal, ConfigStore& config,
            const ITimeProvider& clock, EventBus& bus,
            CapitalSnapshotFile* snapshot_file = nullptr);

  Simulator(const Simulator&) = delete;
  Simulator& operator=(const Simulator&) = delete;
  Simulator(Simulator&&) = delete;
  Simulator& operator=(Simulator&&) = delete;

  // -------------------------------------------------------------------------
  // initialize()
  // -------------------------------------------------------------------------
  // @brief  Startup: an empty journal gets the configured initial capital as
  //         a DEPOSIT; a non-empty one is replayed and recovered.
  //
  // @details
  // Must run before any worker thread calls into the Simulator. The
  // snapshot file, if any, is compared with the replay and the result
  // logged; the journal wins on disagreement.
  // -------------------------------------------------------------------------
  Result<domain::CapitalSnapshot> initialize();

  // -------------------------------------------------------------------------
  // submitSignal(signal)
  // -------------------------------------------------------------------------
  // @brief  Full intake pipeline for one model signal.
  //
  // @return Opened or AveragedDown with the resulting position, or the
  //         rejection: InvalidSignal, NoEdge, InsufficientCapital,
  //         DuplicateActivePosition, ExposureLimit, TradingHalted,
  //         JournalWriteFailure, LedgerInvariantViolation.
  //
  // Rejections never change capital or positions; each one is logged and
  // published as a SignalRejectedEvent.
  // -------------------------------------------------------------------------
  Result<SignalOutcome> submitSignal(const domain::Signal& signal);

  // Records the latest YES price and liquidity for a market. False (and
  // nothing recorded) for a price outside [0, 1].
  bool updateMarket(const domain::MarketUpdate& update);

  // -------------------------------------------------------------------------
  // resolveMarket(resolution)
  // -------------------------------------------------------------------------
  // @brief  Settles the market's position at 1.0 (held side won) or 0.0.
  //         Later signals for the market are rejected as InvalidSignal.
  //
  // @return The closed position, or UnknownMarket if nothing was held.
  // -------------------------------------------------------------------------
  Result<domain::Position> resolveMarket(
      const domain::MarketResolution& resolution);

  // One sweep over every active position.
  SweepSummary evaluateAll();

  // Re-evaluates one market. Returns the position after the step (Closed if
  // it was closed).
  Result<domain::Position> evaluateMarket(const std::string& market_id);

  // Operator / API close. InvalidTransition unless the position is Open.
  Result<domain::Position> closePosition(
      const std::string& market_id,
      domain::CloseReason reason = domain::CloseReason::Manual);

  // External capital deposit, journaled before it is applied.
  Result<domain::CapitalSnapshot> deposit(double amount);

  // -------------------------------------------------------------------------
  // reconcile()
  // -------------------------------------------------------------------------
  // @brief  Replays the journal and compares the replayed capital with the
  //         live ledger (within CapitalLedger::kTolerance).
  //
  // @return true if they agree. A mismatch sets the kill switch and
  //         publishes a RECONCILE_MISMATCH alert.
  // -------------------------------------------------------------------------
  bool reconcile();

  // Loads replayed state into the ledger, store and drawdown breaker.
  // Recovery only.
  void recover(const ReplayState& state, const EngineConfig& config);

  // Operator kill switch.
  void halt(const std::string& reason);
  void resume();

  // --- Read side ------------------------------------------------------------
  domain::CapitalSnapshot capital() const;
  std::vector<domain::Position> activePositions() const;
  std::vector<domain::Position> closedPositions() const;
  std::optional<domain::Position> position(const std::string& market_id) const;
  bool isHalted() const;
  std::string haltReason() const;

 private:
  struct MarketState {
    std::optional<double> yes_price;
    double liquidity{0.0};
    std::optional<domain::Signal> latest_signal;
    std::optional<domain::Side> outcome;  // set once the market resolved
  };

  Result<SignalOutcome> intakeLocked(const domain::Signal& signal,
                                     const EngineConfig& config);
  Result<SignalOutcome> openLocked(const domain::Signal& signal, double stake,
                                   const EngineConfig& config);
  Result<SignalOutcome> topUpLocked(const domain::Position& position,
                                    const domain::Signal& signal,
                                    double add_stake,
                                    const EngineConfig& config);
  Result<domain::Position> evaluateLocked(const std::string& market_id,
                                          const EngineConfig& config);

  // Drives an Open (or already Closing*) position to Closed. When
  // `settlement` is set the exit is that price with no slippage.
  Result<domain::Position> closeLocked(const std::string& market_id,
                                       domain::CloseReason reason,
                                       std::optional<double> settlement,
                                       const EngineConfig& config);

  Result<std::uint64_t> appendWithRetry(std::vector<JournalRecord> batch,
                                        const EngineConfig& config);

  JournalRecord record(RecordBody body) const;

  std::optional<MarketState> marketState(const std::string& market_id) const;
  void recordSignalMark(const domain::Signal& signal);
  double liquidityFor(const domain::Signal& signal) const;

  std::optional<Error> validate(const domain::Signal& signal) const;

  Error reject(const domain::Signal& signal, Error error);
  void publishAlert(AlertKind kind, const std::string& market_id,
                    const std::string& reason, double current = 0.0,
                    double limit = 0.0);
  // Sets the kill switch and publishes the alert.
  void escalate(AlertKind kind, const std::string& market_id,
                const std::string& reason, double current = 0.0,
                double limit = 0.0);
  Error onLedgerViolation(const std::string& market_id,
                          const LedgerInvariantViolation& e);

  void observeCapital(const EngineConfig& config);
  void checkpoint();

  void publishPosition(const domain::Position& position,
                       const char* change);
  void publishCapital(const char* cause, const std::string& market_id);

  CapitalLedger& ledger_;
  PositionStore& store_;
  RiskSupervisor& risk_;
  IJournal& journal_;
  ConfigStore& config_;
  const ITimeProvider& clock_;
  EventBus& bus_;
  CapitalSnapshotFile* snapshot_file_;

  MarketLockTable market_locks_;
  std::shared_mutex commit_gate_;
  std::mutex checkpoint_mutex_;

  mutable std::mutex markets_mutex_;
  std::unordered_map<std::string, MarketState> markets_;
};

}  // namespace paper
