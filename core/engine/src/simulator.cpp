#include "paper/engine/simulator.hpp"

#include "paper/events/capital_update_event.hpp"
#include "paper/events/position_update_event.hpp"
#include "paper/events/signal_rejected_event.hpp"
#include "paper/pricing/kelly_sizer.hpp"
#include "paper/pricing/slippage_model.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <iostream>
#include <sstream>
#include <thread>
#include <utility>

namespace paper {

namespace {

bool finiteIn(double value, double lo, double hi) {
  return std::isfinite(value) && value >= lo && value <= hi;
}

// Splits `pnl` across the position's reservations in proportion to their
// amounts. The last token takes the remainder so the shares sum exactly.
std::vector<double> splitPnl(const domain::Position& pos, double pnl) {
  std::vector<double> shares;
  shares.reserve(pos.reservations.size());
  double assigned = 0.0;
  for (std::size_t i = 0; i < pos.reservations.size(); ++i) {
    if (i + 1 == pos.reservations.size()) {
      shares.push_back(pnl - assigned);
    } else {
      const double share =
          pos.stake > 0.0 ? pnl * pos.reservations[i].amount / pos.stake : 0.0;
      shares.push_back(share);
      assigned += share;
    }
  }
  return shares;
}

}  // namespace

Simulator::Simulator(CapitalLedger& ledger, PositionStore& store,
                     RiskSupervisor& risk, IJournal& journal,
                     ConfigStore& config, const ITimeProvider& clock,
                     EventBus& bus, CapitalSnapshotFile* snapshot_file)
    : ledger_(ledger),
      store_(store),
      risk_(risk),
      journal_(journal),
      config_(config),
      clock_(clock),
      bus_(bus),
      snapshot_file_(snapshot_file) {}

// -----------------------------------------------------------------------------
// initialize
// -----------------------------------------------------------------------------
Result<domain::CapitalSnapshot> Simulator::initialize() {
  const auto config = config_.snapshot();
  const ReplayState state = JournalReplayer::replay(journal_);

  if (state.stats.parse_errors > 0) {
    std::cerr << "[Simulator] Journal has " << state.stats.parse_errors
              << " unreadable line(s) out of " << state.stats.lines_total
              << "\n";
  }

  if (state.stats.records == 0) {
    if (config->initial_capital > 0.0) {
      auto funded = deposit(config->initial_capital);
      if (!funded) {
        return funded.error();
      }
    }
    risk_.drawdown().reset(ledger_.snapshot().total);
    std::cout << "[Simulator] Fresh start with capital "
              << ledger_.snapshot().total << "\n";
    return ledger_.snapshot();
  }

  if (state.stats.anomalies > 0) {
    std::cerr << "[Simulator] Journal replay skipped "
              << state.stats.anomalies << " anomalous record(s)\n";
  }

  try {
    recover(state, *config);
  } catch (const LedgerInvariantViolation& e) {
    return onLedgerViolation("", e);
  }

  if (snapshot_file_) {
    if (auto cp = snapshot_file_->load()) {
      const bool match =
          std::abs(cp->capital.total - state.capital.total) <=
              CapitalLedger::kTolerance &&
          std::abs(cp->capital.available - state.capital.available) <=
              CapitalLedger::kTolerance &&
          cp->last_sequence == state.last_sequence;
      if (match) {
        std::cout << "[Simulator] Capital snapshot matches journal at seq "
                  << cp->last_sequence << "\n";
      } else {
        std::cerr << "[Simulator] Capital snapshot (total="
                  << cp->capital.total << ", seq=" << cp->last_sequence
                  << ") differs from journal (total=" << state.capital.total
                  << ", seq=" << state.last_sequence
                  << "). Using the journal.\n";
      }
    }
  }

  checkpoint();
  return ledger_.snapshot();
}

// -----------------------------------------------------------------------------
// recover
// -----------------------------------------------------------------------------
void Simulator::recover(const ReplayState& state, const EngineConfig& config) {
  ledger_.restore(state.capital, state.outstanding, state.max_token_id);
  store_.hydrate(state.active, state.closed);

  // Walk the breaker through every recorded total so the peak, a trip and
  // its time come back as they were before the restart.
  const auto params = DrawdownParams::from(config);
  risk_.drawdown().reset(0.0);
  for (const auto& mark : state.capital_trail) {
    risk_.drawdown().observe(mark.total, mark.timestamp_ms, params);
  }
  observeCapital(config);

  std::cout << "[Simulator] Recovered " << state.stats.records
            << " journal records: total=" << state.capital.total
            << " available=" << state.capital.available
            << " allocated=" << state.capital.allocated << ", "
            << state.active.size() << " active / " << state.closed.size()
            << " closed positions, drawdown peak=" << risk_.drawdown().peak()
            << (risk_.drawdown().halted() ? " (HALTED)" : "") << "\n";
}

// -----------------------------------------------------------------------------
// submitSignal
// -----------------------------------------------------------------------------
Result<SignalOutcome> Simulator::submitSignal(const domain::Signal& signal) {
  const auto config = config_.snapshot();
  auto market_lock = market_locks_.acquire(signal.market_id);

  if (auto err = validate(signal)) {
    return reject(signal, *err);
  }
  recordSignalMark(signal);

  try {
    auto outcome = intakeLocked(signal, *config);
    if (!outcome) {
      return reject(signal, outcome.error());
    }
    return outcome;
  } catch (const LedgerInvariantViolation& e) {
    store_.abandonOpening(signal.market_id);
    return reject(signal, onLedgerViolation(signal.market_id, e));
  }
}

Result<SignalOutcome> Simulator::intakeLocked(const domain::Signal& signal,
                                              const EngineConfig& config) {
  // Dedup
  if (auto existing = store_.find(signal.market_id)) {
    if (existing->status != domain::PositionStatus::Open) {
      std::ostringstream msg;
      msg << "market " << signal.market_id << " has position "
          << existing->position_id << " in state "
          << domain::positionStatusToString(existing->status);
      return makeError(ErrorKind::DuplicateActivePosition, msg.str());
    }
    auto top_up = risk_.reviewRepeatSignal(*existing, signal,
                                           ledger_.snapshot(), config);
    if (!top_up) {
      return top_up.error();
    }
    return topUpLocked(*existing, signal, top_up.value().stake, config);
  }

  if (risk_.entriesBlocked()) {
    return makeError(ErrorKind::TradingHalted,
                     "new positions blocked: " + risk_.haltReason());
  }

  // Size
  auto sizing = KellySizer::size(signal, ledger_.snapshot().available,
                                 SizingParams::from(config));
  if (!sizing) {
    return sizing.error();
  }

  return openLocked(signal, sizing.value().stake, config);
}

// -----------------------------------------------------------------------------
// openLocked: Reserve -> journal -> Open
// -----------------------------------------------------------------------------
Result<SignalOutcome> Simulator::openLocked(const domain::Signal& signal,
                                            double stake,
                                            const EngineConfig& config) {
  const std::string& market = signal.market_id;
  const std::int64_t now = clock_.now_ms();

  auto opening = store_.beginOpening(market, signal.side, signal.edge, now);
  if (!opening) {
    return opening.error();
  }

  std::shared_lock gate(commit_gate_);

  auto token = ledger_.reserve(stake);
  if (!token) {
    store_.abandonOpening(market);
    return token.error();
  }

  const Fill fill =
      SlippageModel::quote(signal.market_price, stake, liquidityFor(signal),
                           FillDirection::Buy, SlippageParams::from(config));
  const std::int64_t start =
      signal.timestamp_ms > 0 ? signal.timestamp_ms : now;
  const std::int64_t resolution_at =
      signal.horizon_ms > 0 ? start + signal.horizon_ms : 0;

  const domain::Position preview = PositionStore::withOpen(
      opening.value(), token.value(), fill.price, resolution_at);

  std::vector<JournalRecord> batch;
  batch.push_back(record(ReservationRecord{token.value().id,
                                           preview.position_id, market,
                                           token.value().amount,
                                           domain::ReservationReason::Open}));
  batch.push_back(record(TransitionRecord{TransitionKind::Opened, preview}));

  auto appended = appendWithRetry(std::move(batch), config);
  if (!appended) {
    ledger_.release(token.value(), 0.0);
    store_.abandonOpening(market);
    gate.unlock();
    publishCapital("ROLLBACK", market);
    escalate(AlertKind::JournalFailure, market, appended.error().message);
    return appended.error();
  }

  auto opened = store_.confirmOpen(market, token.value(), fill.price,
                                   resolution_at);
  gate.unlock();
  if (!opened) {
    escalate(AlertKind::LedgerInvariant, market,
             "journaled open could not be applied: " + opened.error().message);
    return opened.error();
  }

  checkpoint();
  publishPosition(opened.value(), "OPENED");
  publishCapital("RESERVE", market);

  std::cout << "[Simulator] Opened position " << preview.position_id << " "
            << domain::sideToString(signal.side) << " " << market
            << " stake=" << stake << " fill=" << fill.price << "\n";

  return SignalOutcome{SignalAction::Opened, opened.value(), stake,
                       fill.price};
}

// -----------------------------------------------------------------------------
// topUpLocked: averaging down
// -----------------------------------------------------------------------------
Result<SignalOutcome> Simulator::topUpLocked(const domain::Position& position,
                                             const domain::Signal& signal,
                                             double add_stake,
                                             const EngineConfig& config) {
  const std::string& market = position.market_id;

  std::shared_lock gate(commit_gate_);

  const AdditionLimits limits{
      config.max_additions,
      config.max_market_exposure * ledger_.snapshot().total};
  if (auto err = PositionStore::checkAddition(position, add_stake, limits)) {
    return *err;
  }

  auto token = ledger_.reserve(add_stake);
  if (!token) {
    return token.error();
  }

  const Fill fill =
      SlippageModel::quote(signal.market_price, add_stake,
                           liquidityFor(signal), FillDirection::Buy,
                           SlippageParams::from(config));
  const domain::Position preview =
      PositionStore::withAddition(position, token.value(), fill.price);

  std::vector<JournalRecord> batch;
  batch.push_back(record(ReservationRecord{
      token.value().id, position.position_id, market, token.value().amount,
      domain::ReservationReason::AverageDown}));
  batch.push_back(
      record(TransitionRecord{TransitionKind::AveragedDown, preview}));

  auto appended = appendWithRetry(std::move(batch), config);
  if (!appended) {
    ledger_.release(token.value(), 0.0);
    gate.unlock();
    publishCapital("ROLLBACK", market);
    escalate(AlertKind::JournalFailure, market, appended.error().message);
    return appended.error();
  }

  auto added = store_.applyAddition(market, token.value(), fill.price, limits);
  gate.unlock();
  if (!added) {
    escalate(AlertKind::LedgerInvariant, market,
             "journaled addition could not be applied: " +
                 added.error().message);
    return added.error();
  }

  checkpoint();
  publishPosition(added.value(), "AVERAGED_DOWN");
  publishCapital("RESERVE", market);

  std::cout << "[Simulator] Averaged down position " << position.position_id
            << " in " << market << " +" << add_stake << " @ " << fill.price
            << " -> entry " << added.value().entry_price << "\n";

  return SignalOutcome{SignalAction::AveragedDown, added.value(), add_stake,
                       fill.price};
}

// -----------------------------------------------------------------------------
// closeLocked: Closing* -> journal -> Release -> Closed
// -----------------------------------------------------------------------------
Result<domain::Position> Simulator::closeLocked(
    const std::string& market_id, domain::CloseReason reason,
    std::optional<double> settlement, const EngineConfig& config) {
  auto current = store_.find(market_id);
  if (!current) {
    return makeError(ErrorKind::UnknownMarket,
                     "no active position for market " + market_id);
  }

  domain::Position closing;
  if (current->status == domain::PositionStatus::Open) {
    auto started = store_.beginClosing(market_id, reason);
    if (!started) {
      return started.error();
    }
    closing = std::move(started).value();
  } else if (domain::isClosing(current->status)) {
    // An earlier close could not be journaled; finish it under its own
    // reason.
    closing = *current;
  } else {
    std::ostringstream msg;
    msg << "position " << current->position_id << " in state "
        << domain::positionStatusToString(current->status)
        << " cannot be closed";
    return makeError(ErrorKind::InvalidTransition, msg.str());
  }

  double exit_price = 0.0;
  if (settlement) {
    exit_price = *settlement;
  } else {
    const auto state = marketState(market_id);
    const double reference =
        state && state->yes_price
            ? domain::sidePrice(closing.side, *state->yes_price)
            : closing.entry_price;
    const double liquidity = state ? state->liquidity : 0.0;
    exit_price = SlippageModel::quote(reference, closing.stake, liquidity,
                                      FillDirection::Sell,
                                      SlippageParams::from(config))
                     .price;
  }

  const std::int64_t now = clock_.now_ms();
  const domain::Position preview =
      PositionStore::withClose(closing, exit_price, now);
  const std::vector<double> shares = splitPnl(closing, preview.realized_pnl);

  std::vector<JournalRecord> batch;
  batch.push_back(
      record(TransitionRecord{TransitionKind::ClosingStarted, closing}));
  for (std::size_t i = 0; i < closing.reservations.size(); ++i) {
    const auto& token = closing.reservations[i];
    batch.push_back(record(ReleaseRecord{token.id, closing.position_id,
                                         market_id, token.amount, shares[i],
                                         closing.close_reason}));
  }
  batch.push_back(record(TransitionRecord{TransitionKind::Closed, preview}));

  std::shared_lock gate(commit_gate_);

  auto appended = appendWithRetry(std::move(batch), config);
  if (!appended) {
    gate.unlock();
    escalate(AlertKind::JournalFailure, market_id,
             "close of position " + std::to_string(closing.position_id) +
                 " not journaled: " + appended.error().message);
    return appended.error();
  }

  for (std::size_t i = 0; i < closing.reservations.size(); ++i) {
    ledger_.release(closing.reservations[i], shares[i]);
  }

  auto closed = store_.finalizeClose(market_id, exit_price, now);
  gate.unlock();
  if (!closed) {
    escalate(AlertKind::LedgerInvariant, market_id,
             "journaled close could not be applied: " +
                 closed.error().message);
    return closed.error();
  }

  checkpoint();
  observeCapital(config);
  publishPosition(closed.value(), "CLOSED");
  publishCapital("RELEASE", market_id);

  std::cout << "[Simulator] Closed position " << closed.value().position_id
            << " in " << market_id << " ("
            << domain::closeReasonToString(closed.value().close_reason)
            << ") exit=" << exit_price
            << " pnl=" << closed.value().realized_pnl << "\n";

  return closed;
}

// -----------------------------------------------------------------------------
// updateMarket / resolveMarket
// -----------------------------------------------------------------------------
bool Simulator::updateMarket(const domain::MarketUpdate& update) {
  if (update.market_id.empty() || !finiteIn(update.yes_price, 0.0, 1.0) ||
      !std::isfinite(update.liquidity) || update.liquidity < 0.0) {
    std::cerr << "[Simulator] Ignoring market update for '"
              << update.market_id << "': yes_price=" << update.yes_price
              << " liquidity=" << update.liquidity << "\n";
    return false;
  }

  std::lock_guard lock(markets_mutex_);
  auto& state = markets_[update.market_id];
  if (state.outcome) {
    return false;
  }
  state.yes_price = update.yes_price;
  if (update.liquidity > 0.0) {
    state.liquidity = update.liquidity;
  }
  return true;
}

Result<domain::Position> Simulator::resolveMarket(
    const domain::MarketResolution& resolution) {
  if (resolution.market_id.empty()) {
    return makeError(ErrorKind::InvalidSignal,
                     "resolution without market_id");
  }

  const auto config = config_.snapshot();
  auto market_lock = market_locks_.acquire(resolution.market_id);

  {
    std::lock_guard lock(markets_mutex_);
    auto& state = markets_[resolution.market_id];
    state.outcome = resolution.outcome;
    state.yes_price = resolution.outcome == domain::Side::Yes ? 1.0 : 0.0;
  }

  std::cout << "[Simulator] Market " << resolution.market_id
            << " resolved " << domain::sideToString(resolution.outcome)
            << "\n";

  try {
    auto current = store_.find(resolution.market_id);
    if (!current) {
      return makeError(ErrorKind::UnknownMarket,
                       "no position to settle in " + resolution.market_id);
    }
    const double settlement =
        SlippageModel::settlementPrice(current->side, resolution.outcome);
    return closeLocked(resolution.market_id, domain::CloseReason::Resolved,
                       settlement, *config);
  } catch (const LedgerInvariantViolation& e) {
    return onLedgerViolation(resolution.market_id, e);
  }
}

// -----------------------------------------------------------------------------
// Evaluation sweep
// -----------------------------------------------------------------------------
SweepSummary Simulator::evaluateAll() {
  SweepSummary summary;

  for (const auto& pos : store_.activePositions()) {
    auto result = evaluateMarket(pos.market_id);
    if (!result) {
      if (result.kind() == ErrorKind::UnknownMarket) {
        continue;  // closed concurrently
      }
      ++summary.evaluated;
      ++summary.failed;
      continue;
    }
    ++summary.evaluated;
    if (result.value().status == domain::PositionStatus::Closed) {
      ++summary.closed;
    } else {
      ++summary.held;
    }
  }

  // Feeds the breaker even when nothing closed, so cooldown recovery fires.
  observeCapital(*config_.snapshot());
  return summary;
}

Result<domain::Position> Simulator::evaluateMarket(
    const std::string& market_id) {
  const auto config = config_.snapshot();
  auto market_lock = market_locks_.acquire(market_id);

  try {
    return evaluateLocked(market_id, *config);
  } catch (const LedgerInvariantViolation& e) {
    return onLedgerViolation(market_id, e);
  }
}

Result<domain::Position> Simulator::evaluateLocked(
    const std::string& market_id, const EngineConfig& config) {
  auto current = store_.find(market_id);
  if (!current) {
    return makeError(ErrorKind::UnknownMarket,
                     "no active position for market " + market_id);
  }
  const auto state = marketState(market_id);

  if (domain::isClosing(current->status)) {
    std::optional<double> settlement;
    if (state && state->outcome) {
      settlement = SlippageModel::settlementPrice(current->side,
                                                  *state->outcome);
    }
    return closeLocked(market_id, current->close_reason, settlement, config);
  }
  if (current->status != domain::PositionStatus::Open) {
    return *current;
  }

  MarketView view;
  if (state && state->yes_price) {
    view.mark = domain::sidePrice(current->side, *state->yes_price);
  }
  if (state && state->latest_signal) {
    view.latest_edge =
        EdgeReversalMonitor::observe(current->side, *state->latest_signal);
  }

  const Evaluation eval =
      risk_.evaluate(*current, view, clock_.now_ms(), config);

  if (const auto* close = std::get_if<ClosePosition>(&eval.command)) {
    std::cout << "[Simulator] Closing position " << current->position_id
              << " in " << market_id << ": "
              << domain::closeReasonToString(close->reason) << " ("
              << close->detail << ")\n";
    return closeLocked(market_id, close->reason, std::nullopt, config);
  }

  if (eval.reversal.streak == current->reversal_streak &&
      eval.reversal.last_edge == current->last_edge) {
    return *current;
  }

  domain::Position preview = *current;
  preview.last_edge = eval.reversal.last_edge;
  preview.reversal_streak = eval.reversal.streak;

  {
    std::shared_lock gate(commit_gate_);
    auto appended = appendWithRetry(
        {record(TransitionRecord{TransitionKind::Evaluated, preview})},
        config);
    if (!appended) {
      gate.unlock();
      escalate(AlertKind::JournalFailure, market_id,
               appended.error().message);
      return appended.error();
    }
  }

  auto updated = store_.recordEvaluation(market_id, preview.last_edge,
                                         preview.reversal_streak);
  if (!updated) {
    return updated.error();
  }
  if (eval.reversal.evidence) {
    std::cerr << "[Simulator] Edge reversal evidence on position "
              << current->position_id << " in " << market_id << ": edge "
              << eval.reversal.last_edge << ", streak "
              << eval.reversal.streak << "\n";
  }
  publishPosition(updated.value(), "EVALUATED");
  return updated;
}

// -----------------------------------------------------------------------------
// closePosition
// -----------------------------------------------------------------------------
Result<domain::Position> Simulator::closePosition(
    const std::string& market_id, domain::CloseReason reason) {
  const auto config = config_.snapshot();
  auto market_lock = market_locks_.acquire(market_id);

  try {
    auto current = store_.find(market_id);
    if (!current) {
      return makeError(ErrorKind::UnknownMarket,
                       "no active position for market " + market_id);
    }
    if (current->status != domain::PositionStatus::Open) {
      std::ostringstream msg;
      msg << "position " << current->position_id << " is "
          << domain::positionStatusToString(current->status);
      return makeError(ErrorKind::InvalidTransition, msg.str());
    }
    return closeLocked(market_id, reason, std::nullopt, *config);
  } catch (const LedgerInvariantViolation& e) {
    return onLedgerViolation(market_id, e);
  }
}

// -----------------------------------------------------------------------------
// deposit
// -----------------------------------------------------------------------------
Result<domain::CapitalSnapshot> Simulator::deposit(double amount) {
  if (!std::isfinite(amount) || amount <= 0.0) {
    return makeError(ErrorKind::InvalidAmount,
                     "deposit must be a positive amount");
  }

  const auto config = config_.snapshot();
  std::shared_lock gate(commit_gate_);

  auto appended = appendWithRetry({record(DepositRecord{amount})}, *config);
  if (!appended) {
    gate.unlock();
    escalate(AlertKind::JournalFailure, "", appended.error().message);
    return appended.error();
  }

  auto deposited = ledger_.deposit(amount);
  gate.unlock();
  if (!deposited) {
    return deposited.error();
  }

  checkpoint();
  observeCapital(*config);
  publishCapital("DEPOSIT", "");
  return deposited;
}

// -----------------------------------------------------------------------------
// reconcile
// -----------------------------------------------------------------------------
bool Simulator::reconcile() {
  ReplayState replayed;
  domain::CapitalSnapshot live;
  std::size_t live_outstanding = 0;
  {
    std::unique_lock gate(commit_gate_);
    replayed = JournalReplayer::replay(journal_);
    live = ledger_.snapshot();
    live_outstanding = ledger_.outstanding().size();
  }

  const auto& expected = replayed.capital;
  const bool match =
      std::abs(expected.total - live.total) <= CapitalLedger::kTolerance &&
      std::abs(expected.available - live.available) <=
          CapitalLedger::kTolerance &&
      std::abs(expected.allocated - live.allocated) <=
          CapitalLedger::kTolerance &&
      replayed.outstanding.size() == live_outstanding;

  if (!match) {
    std::ostringstream msg;
    msg << "journal total=" << expected.total
        << " available=" << expected.available
        << " allocated=" << expected.allocated << " tokens="
        << replayed.outstanding.size() << " vs ledger total=" << live.total
        << " available=" << live.available
        << " allocated=" << live.allocated << " tokens=" << live_outstanding;
    escalate(AlertKind::ReconcileMismatch, "", msg.str(), expected.total,
             live.total);
    return false;
  }

  std::cout << "[Simulator] Reconciled " << replayed.stats.records
            << " journal records at seq " << replayed.last_sequence
            << ": total=" << live.total << "\n";
  return true;
}

// -----------------------------------------------------------------------------
// Operator halt
// -----------------------------------------------------------------------------
void Simulator::halt(const std::string& reason) {
  escalate(AlertKind::KillSwitch, "", reason);
}

void Simulator::resume() {
  risk_.resumeTrading();
  publishAlert(AlertKind::KillSwitch, "", "cleared by operator");
}

// -----------------------------------------------------------------------------
// Read side
// -----------------------------------------------------------------------------
domain::CapitalSnapshot Simulator::capital() const {
  return ledger_.snapshot();
}

std::vector<domain::Position> Simulator::activePositions() const {
  return store_.activePositions();
}

std::vector<domain::Position> Simulator::closedPositions() const {
  return store_.closedPositions();
}

std::optional<domain::Position> Simulator::position(
    const std::string& market_id) const {
  return store_.find(market_id);
}

bool Simulator::isHalted() const { return risk_.entriesBlocked(); }

std::string Simulator::haltReason() const { return risk_.haltReason(); }

// -----------------------------------------------------------------------------
// Helpers
// -----------------------------------------------------------------------------
Result<std::uint64_t> Simulator::appendWithRetry(
    std::vector<JournalRecord> batch, const EngineConfig& config) {
  const int attempts = 1 + std::max(0, config.journal_max_retries);
  auto backoff = std::chrono::milliseconds(
      std::max<std::int64_t>(0, config.journal_retry_backoff_ms));

  Error last = makeError(ErrorKind::JournalWriteFailure, "journal unavailable");
  for (int attempt = 1; attempt <= attempts; ++attempt) {
    auto result = journal_.append(batch);
    if (result) {
      return result;
    }
    last = result.error();
    std::cerr << "[Simulator] Journal append " << attempt << "/" << attempts
              << " failed: " << last.message << "\n";
    if (attempt < attempts && backoff.count() > 0) {
      std::this_thread::sleep_for(backoff);
      backoff *= 2;
    }
  }
  return makeError(ErrorKind::JournalWriteFailure,
                   "journal append failed after " + std::to_string(attempts) +
                       " attempts: " + last.message);
}

JournalRecord Simulator::record(RecordBody body) const {
  JournalRecord rec;
  rec.timestamp_ms = clock_.now_ms();
  rec.body = std::move(body);
  return rec;
}

std::optional<Simulator::MarketState> Simulator::marketState(
    const std::string& market_id) const {
  std::lock_guard lock(markets_mutex_);
  auto it = markets_.find(market_id);
  if (it == markets_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void Simulator::recordSignalMark(const domain::Signal& signal) {
  std::lock_guard lock(markets_mutex_);
  auto& state = markets_[signal.market_id];
  state.yes_price = domain::yesPrice(signal.side, signal.market_price);
  if (signal.liquidity > 0.0) {
    state.liquidity = signal.liquidity;
  }
  state.latest_signal = signal;
}

double Simulator::liquidityFor(const domain::Signal& signal) const {
  if (signal.liquidity > 0.0) {
    return signal.liquidity;
  }
  const auto state = marketState(signal.market_id);
  return state ? state->liquidity : 0.0;
}

std::optional<Error> Simulator::validate(const domain::Signal& signal) const {
  std::ostringstream msg;
  if (signal.market_id.empty()) {
    msg << "missing market_id";
  } else if (!finiteIn(signal.probability, 0.0, 1.0)) {
    msg << "probability " << signal.probability << " outside [0, 1]";
  } else if (!std::isfinite(signal.market_price) ||
             signal.market_price <= 0.0 || signal.market_price >= 1.0) {
    msg << "market_price " << signal.market_price << " outside (0, 1)";
  } else if (!std::isfinite(signal.edge)) {
    msg << "edge is not a number";
  } else if (!std::isfinite(signal.liquidity) || signal.liquidity < 0.0) {
    msg << "liquidity " << signal.liquidity << " is negative";
  } else if (signal.horizon_ms < 0) {
    msg << "horizon_ms " << signal.horizon_ms << " is negative";
  } else {
    const auto state = marketState(signal.market_id);
    if (state && state->outcome) {
      msg << "market " << signal.market_id << " already resolved "
          << domain::sideToString(*state->outcome);
    } else {
      return std::nullopt;
    }
  }
  return makeError(ErrorKind::InvalidSignal, msg.str());
}

Error Simulator::reject(const domain::Signal& signal, Error error) {
  std::cerr << "[Simulator] Rejected " << domain::sideToString(signal.side)
            << " signal for '" << signal.market_id
            << "': " << errorKindToString(error.kind) << " - "
            << error.message << "\n";
  bus_.publish(SignalRejectedEvent{signal.market_id, signal.side, error.kind,
                                   error.message, clock_.now_ms()});
  return error;
}

void Simulator::publishAlert(AlertKind kind, const std::string& market_id,
                             const std::string& reason, double current,
                             double limit) {
  bus_.publish(RiskAlertEvent{kind, market_id, reason, current, limit,
                              clock_.now_ms()});
}

void Simulator::escalate(AlertKind kind, const std::string& market_id,
                         const std::string& reason, double current,
                         double limit) {
  risk_.haltTrading(std::string(alertKindToString(kind)) + ": " + reason);
  publishAlert(kind, market_id, reason, current, limit);
}

Error Simulator::onLedgerViolation(const std::string& market_id,
                                   const LedgerInvariantViolation& e) {
  std::cerr << "[Simulator] CRITICAL: ledger invariant violated"
            << (market_id.empty() ? "" : " in " + market_id) << ": "
            << e.what() << "\n";
  escalate(AlertKind::LedgerInvariant, market_id, e.what());
  return makeError(ErrorKind::LedgerInvariantViolation, e.what());
}

void Simulator::observeCapital(const EngineConfig& config) {
  const double total = ledger_.snapshot().total;
  switch (risk_.observeCapital(total, clock_.now_ms(), config)) {
    case DrawdownTransition::Halted:
      publishAlert(AlertKind::DrawdownHalt, "", risk_.haltReason(),
                   risk_.drawdown().drawdown(),
                   config.drawdown_halt_threshold);
      break;
    case DrawdownTransition::Resumed:
      publishAlert(AlertKind::DrawdownResume, "", "drawdown recovered",
                   risk_.drawdown().drawdown(),
                   config.drawdown_resume_threshold);
      break;
    case DrawdownTransition::None:
      break;
  }
}

void Simulator::checkpoint() {
  if (snapshot_file_ == nullptr) {
    return;
  }

  std::lock_guard lock(checkpoint_mutex_);
  CapitalCheckpoint cp;
  {
    std::unique_lock gate(commit_gate_);
    cp.capital = ledger_.snapshot();
    cp.last_sequence = journal_.lastSequence();
  }
  if (!snapshot_file_->write(cp)) {
    std::cerr << "[Simulator] Capital snapshot not written at seq "
              << cp.last_sequence << "\n";
  }
}

void Simulator::publishPosition(const domain::Position& position,
                                const char* change) {
  bus_.publish(PositionUpdateEvent{position, change, clock_.now_ms()});
}

void Simulator::publishCapital(const char* cause,
                               const std::string& market_id) {
  bus_.publish(CapitalUpdateEvent{ledger_.snapshot(), cause, market_id,
                                  clock_.now_ms()});
}

}  // namespace paper
