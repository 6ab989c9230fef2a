#include "paper/positions/position_store.hpp"

#include <algorithm>
#include <cmath>
#include <mutex>
#include <sstream>

namespace paper {

namespace {

Error invalidTransition(const domain::Position& pos,
                        domain::PositionStatus next) {
  std::ostringstream msg;
  msg << "position " << pos.position_id << " in market " << pos.market_id
      << " cannot move from " << domain::positionStatusToString(pos.status)
      << " to " << domain::positionStatusToString(next);
  return makeError(ErrorKind::InvalidTransition, msg.str());
}

Error unknownMarket(const std::string& market_id) {
  return makeError(ErrorKind::UnknownMarket,
                   "no active position for market " + market_id);
}

bool validFillPrice(double price) {
  return std::isfinite(price) && price > 0.0 && price < 1.0;
}

}  // namespace

// -----------------------------------------------------------------------------
// canTransition: lifecycle graph
// -----------------------------------------------------------------------------
bool PositionStore::canTransition(domain::PositionStatus from,
                                  domain::PositionStatus to) {
  using S = domain::PositionStatus;

  switch (from) {
    case S::Opening:
      return to == S::Open;

    case S::Open:
      return to == S::Open ||
             to == S::ClosingStopLoss ||
             to == S::ClosingTakeProfit ||
             to == S::ClosingExpired ||
             to == S::ClosingManual;

    case S::ClosingStopLoss:
    case S::ClosingTakeProfit:
    case S::ClosingExpired:
    case S::ClosingManual:
      return to == S::Closed;

    case S::Closed:
      return false;
  }

  return false;
}

double PositionStore::realizedPnl(const domain::Position& pos,
                                  double exit_price) {
  return pos.contracts * exit_price - pos.stake;
}

double PositionStore::unrealizedPct(const domain::Position& pos, double mark) {
  if (pos.entry_price <= 0.0) {
    return 0.0;
  }
  return (mark - pos.entry_price) / pos.entry_price;
}

// -----------------------------------------------------------------------------
// Previews
// -----------------------------------------------------------------------------
domain::Position PositionStore::withOpen(domain::Position opening,
                                         const domain::ReservationToken& token,
                                         double fill_price,
                                         std::int64_t resolution_at_ms) {
  opening.status = domain::PositionStatus::Open;
  opening.entry_price = fill_price;
  opening.stake = token.amount;
  opening.contracts = token.amount / fill_price;
  opening.resolution_at_ms = resolution_at_ms;
  opening.reservations.push_back(token);
  return opening;
}

domain::Position PositionStore::withAddition(
    domain::Position open, const domain::ReservationToken& token,
    double fill_price) {
  const double new_stake = open.stake + token.amount;
  open.entry_price =
      (open.stake * open.entry_price + token.amount * fill_price) / new_stake;
  open.contracts += token.amount / fill_price;
  open.stake = new_stake;
  open.additions += 1;
  open.reservations.push_back(token);
  return open;
}

domain::Position PositionStore::withClose(domain::Position closing,
                                          double exit_price,
                                          std::int64_t now_ms) {
  closing.status = domain::PositionStatus::Closed;
  closing.exit_price = exit_price;
  closing.realized_pnl = realizedPnl(closing, exit_price);
  closing.closed_at_ms = now_ms;
  return closing;
}

std::optional<Error> PositionStore::checkAddition(
    const domain::Position& pos, double amount, const AdditionLimits& limits) {
  if (pos.additions >= limits.max_additions) {
    std::ostringstream msg;
    msg << "position " << pos.position_id << " already has " << pos.additions
        << " additions (max " << limits.max_additions << ")";
    return makeError(ErrorKind::ExposureLimit, msg.str());
  }

  const double new_stake = pos.stake + amount;
  if (new_stake > limits.max_market_stake + 1e-9) {
    std::ostringstream msg;
    msg << "stake " << new_stake << " would exceed per-market cap "
        << limits.max_market_stake;
    return makeError(ErrorKind::ExposureLimit, msg.str());
  }
  return std::nullopt;
}

// -----------------------------------------------------------------------------
// lookupForTransitionLocked
// -----------------------------------------------------------------------------
std::optional<Error> PositionStore::lookupForTransitionLocked(
    const std::string& market_id, domain::PositionStatus next,
    domain::Position** out) {
  auto it = active_.find(market_id);
  if (it == active_.end()) {
    return unknownMarket(market_id);
  }
  if (!canTransition(it->second.status, next)) {
    return invalidTransition(it->second, next);
  }
  *out = &it->second;
  return std::nullopt;
}

// -----------------------------------------------------------------------------
// beginOpening
// -----------------------------------------------------------------------------
Result<domain::Position> PositionStore::beginOpening(
    const std::string& market_id, domain::Side side, double edge,
    std::int64_t now_ms) {
  std::unique_lock lock(positions_mutex_);

  auto it = active_.find(market_id);
  if (it != active_.end()) {
    std::ostringstream msg;
    msg << "market " << market_id << " already has position "
        << it->second.position_id << " in state "
        << domain::positionStatusToString(it->second.status);
    return makeError(ErrorKind::DuplicateActivePosition, msg.str());
  }

  domain::Position pos;
  pos.position_id = position_ids_.next();
  pos.market_id = market_id;
  pos.side = side;
  pos.status = domain::PositionStatus::Opening;
  pos.opened_at_ms = now_ms;
  pos.original_edge = edge;
  pos.last_edge = edge;

  active_.emplace(market_id, pos);
  return pos;
}

// -----------------------------------------------------------------------------
// confirmOpen
// -----------------------------------------------------------------------------
Result<domain::Position> PositionStore::confirmOpen(
    const std::string& market_id, const domain::ReservationToken& token,
    double fill_price, std::int64_t resolution_at_ms) {
  if (!validFillPrice(fill_price) || token.amount <= 0.0) {
    return makeError(ErrorKind::InvalidAmount,
                     "open requires a positive stake and a fill in (0, 1)");
  }

  std::unique_lock lock(positions_mutex_);

  domain::Position* pos = nullptr;
  if (auto err = lookupForTransitionLocked(market_id,
                                           domain::PositionStatus::Open, &pos)) {
    return *err;
  }
  if (pos->status != domain::PositionStatus::Opening) {
    return invalidTransition(*pos, domain::PositionStatus::Open);
  }

  *pos = withOpen(std::move(*pos), token, fill_price, resolution_at_ms);
  return *pos;
}

// -----------------------------------------------------------------------------
// abandonOpening
// -----------------------------------------------------------------------------
bool PositionStore::abandonOpening(const std::string& market_id) {
  std::unique_lock lock(positions_mutex_);

  auto it = active_.find(market_id);
  if (it == active_.end() ||
      it->second.status != domain::PositionStatus::Opening) {
    return false;
  }
  active_.erase(it);
  return true;
}

// -----------------------------------------------------------------------------
// applyAddition: stake-weighted entry, accumulate contracts
// -----------------------------------------------------------------------------
Result<domain::Position> PositionStore::applyAddition(
    const std::string& market_id, const domain::ReservationToken& token,
    double fill_price, const AdditionLimits& limits) {
  if (!validFillPrice(fill_price) || token.amount <= 0.0) {
    return makeError(ErrorKind::InvalidAmount,
                     "addition requires a positive stake and a fill in (0, 1)");
  }

  std::unique_lock lock(positions_mutex_);

  domain::Position* pos = nullptr;
  if (auto err = lookupForTransitionLocked(market_id,
                                           domain::PositionStatus::Open, &pos)) {
    return *err;
  }
  if (pos->status != domain::PositionStatus::Open) {
    return invalidTransition(*pos, domain::PositionStatus::Open);
  }

  if (auto err = checkAddition(*pos, token.amount, limits)) {
    return *err;
  }

  *pos = withAddition(std::move(*pos), token, fill_price);
  return *pos;
}

// -----------------------------------------------------------------------------
// beginClosing: Open -> Closing*
// -----------------------------------------------------------------------------
Result<domain::Position> PositionStore::beginClosing(
    const std::string& market_id, domain::CloseReason reason) {
  const domain::PositionStatus next = domain::closingStatusFor(reason);
  if (!domain::isClosing(next)) {
    return makeError(ErrorKind::InvalidTransition,
                     "close requires a close reason");
  }

  std::unique_lock lock(positions_mutex_);

  domain::Position* pos = nullptr;
  if (auto err = lookupForTransitionLocked(market_id, next, &pos)) {
    return *err;
  }

  pos->status = next;
  pos->close_reason = reason;
  return *pos;
}

// -----------------------------------------------------------------------------
// finalizeClose: Closing* -> Closed, move to history
// -----------------------------------------------------------------------------
Result<domain::Position> PositionStore::finalizeClose(
    const std::string& market_id, double exit_price, std::int64_t now_ms) {
  std::unique_lock lock(positions_mutex_);

  domain::Position* pos = nullptr;
  if (auto err = lookupForTransitionLocked(
          market_id, domain::PositionStatus::Closed, &pos)) {
    return *err;
  }

  domain::Position closed = withClose(std::move(*pos), exit_price, now_ms);
  active_.erase(market_id);

  closed_.push_back(closed);
  return closed;
}

// -----------------------------------------------------------------------------
// recordEvaluation
// -----------------------------------------------------------------------------
Result<domain::Position> PositionStore::recordEvaluation(
    const std::string& market_id, double last_edge, int streak) {
  std::unique_lock lock(positions_mutex_);

  auto it = active_.find(market_id);
  if (it == active_.end()) {
    return unknownMarket(market_id);
  }
  if (it->second.status != domain::PositionStatus::Open) {
    return invalidTransition(it->second, domain::PositionStatus::Open);
  }

  it->second.last_edge = last_edge;
  it->second.reversal_streak = streak;
  return it->second;
}

// -----------------------------------------------------------------------------
// Read side
// -----------------------------------------------------------------------------
std::optional<domain::Position> PositionStore::find(
    const std::string& market_id) const {
  std::shared_lock lock(positions_mutex_);
  auto it = active_.find(market_id);
  if (it == active_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<domain::Position> PositionStore::activePositions() const {
  std::vector<domain::Position> result;
  {
    std::shared_lock lock(positions_mutex_);
    result.reserve(active_.size());
    for (const auto& [market, pos] : active_) {
      result.push_back(pos);
    }
  }
  std::sort(result.begin(), result.end(),
            [](const domain::Position& a, const domain::Position& b) {
              return a.position_id < b.position_id;
            });
  return result;
}

std::vector<domain::Position> PositionStore::closedPositions() const {
  std::shared_lock lock(positions_mutex_);
  return closed_;
}

std::size_t PositionStore::activeCount() const {
  std::shared_lock lock(positions_mutex_);
  return active_.size();
}

// -----------------------------------------------------------------------------
// hydrate: recovery from journal replay
// -----------------------------------------------------------------------------
void PositionStore::hydrate(std::vector<domain::Position> active,
                            std::vector<domain::Position> closed) {
  std::unique_lock lock(positions_mutex_);

  active_.clear();
  std::uint64_t max_id = 0;
  for (auto& pos : active) {
    max_id = std::max(max_id, pos.position_id);
    std::string key = pos.market_id;
    active_[key] = std::move(pos);
  }
  for (const auto& pos : closed) {
    max_id = std::max(max_id, pos.position_id);
  }
  closed_ = std::move(closed);

  position_ids_.advancePast(max_id);
}

}  // namespace paper
