#include "paper/capital/capital_ledger.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace paper {

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
CapitalLedger::CapitalLedger(double initial_capital)
    : total_(initial_capital), available_(initial_capital) {
  std::lock_guard lock(mutex_);
  checkInvariantsLocked("construct");
}

// -----------------------------------------------------------------------------
// reserve(): check and move in one critical section
// -----------------------------------------------------------------------------
Result<domain::ReservationToken> CapitalLedger::reserve(double amount) {
  if (!std::isfinite(amount) || amount <= 0.0) {
    std::ostringstream msg;
    msg << "reservation amount must be positive, got " << amount;
    return makeError(ErrorKind::InvalidAmount, msg.str());
  }

  std::lock_guard lock(mutex_);

  if (amount > available_) {
    std::ostringstream msg;
    msg << "requested " << amount << " but only " << available_
        << " available";
    return makeError(ErrorKind::InsufficientCapital, msg.str());
  }

  available_ -= amount;
  allocated_ += amount;

  domain::ReservationToken token{token_ids_.next(), amount};
  outstanding_.emplace(token.id, amount);

  checkInvariantsLocked("reserve");
  return token;
}

// -----------------------------------------------------------------------------
// release(): redeem a token exactly once
// -----------------------------------------------------------------------------
domain::ReleaseReceipt CapitalLedger::release(
    const domain::ReservationToken& token, double realized_pnl) {
  std::lock_guard lock(mutex_);

  auto it = outstanding_.find(token.id);
  if (it == outstanding_.end()) {
    std::ostringstream msg;
    msg << "release of unknown or already released token " << token.id;
    throw LedgerInvariantViolation(msg.str());
  }

  const double amount = it->second;
  if (!std::isfinite(realized_pnl) ||
      realized_pnl < -amount - kTolerance) {
    std::ostringstream msg;
    msg << "token " << token.id << " of " << amount
        << " cannot realize pnl " << realized_pnl;
    throw LedgerInvariantViolation(msg.str());
  }

  outstanding_.erase(it);

  allocated_ -= amount;
  available_ += amount + realized_pnl;
  total_ += realized_pnl;

  checkInvariantsLocked("release");

  domain::ReleaseReceipt receipt;
  receipt.token_id = token.id;
  receipt.amount = amount;
  receipt.realized_pnl = realized_pnl;
  receipt.after = domain::CapitalSnapshot{total_, available_, allocated_};
  return receipt;
}

// -----------------------------------------------------------------------------
// deposit()
// -----------------------------------------------------------------------------
Result<domain::CapitalSnapshot> CapitalLedger::deposit(double amount) {
  if (!std::isfinite(amount) || amount <= 0.0) {
    std::ostringstream msg;
    msg << "deposit must be positive, got " << amount;
    return makeError(ErrorKind::InvalidAmount, msg.str());
  }

  std::lock_guard lock(mutex_);
  total_ += amount;
  available_ += amount;
  checkInvariantsLocked("deposit");
  return domain::CapitalSnapshot{total_, available_, allocated_};
}

domain::CapitalSnapshot CapitalLedger::snapshot() const {
  std::lock_guard lock(mutex_);
  return domain::CapitalSnapshot{total_, available_, allocated_};
}

std::vector<domain::ReservationToken> CapitalLedger::outstanding() const {
  std::vector<domain::ReservationToken> tokens;
  {
    std::lock_guard lock(mutex_);
    tokens.reserve(outstanding_.size());
    for (const auto& [id, amount] : outstanding_) {
      tokens.push_back(domain::ReservationToken{id, amount});
    }
  }
  std::sort(tokens.begin(), tokens.end(),
            [](const auto& a, const auto& b) { return a.id < b.id; });
  return tokens;
}

// -----------------------------------------------------------------------------
// restore(): recovery path, before workers start
// -----------------------------------------------------------------------------
void CapitalLedger::restore(
    const domain::CapitalSnapshot& snapshot,
    const std::vector<domain::ReservationToken>& outstanding,
    domain::TokenId max_token_id) {
  std::lock_guard lock(mutex_);

  total_ = snapshot.total;
  available_ = snapshot.available;
  allocated_ = snapshot.allocated;

  outstanding_.clear();
  for (const auto& token : outstanding) {
    if (!outstanding_.emplace(token.id, token.amount).second) {
      std::ostringstream msg;
      msg << "restore: duplicate token " << token.id;
      throw LedgerInvariantViolation(msg.str());
    }
    token_ids_.advancePast(token.id);
  }
  token_ids_.advancePast(max_token_id);

  checkInvariantsLocked("restore");
}

// -----------------------------------------------------------------------------
// checkInvariantsLocked()
// -----------------------------------------------------------------------------
void CapitalLedger::checkInvariantsLocked(const char* context) const {
  double outstanding_sum = 0.0;
  for (const auto& [id, amount] : outstanding_) {
    outstanding_sum += amount;
  }

  const bool balanced =
      std::abs(available_ + allocated_ - total_) <= kTolerance;
  const bool non_negative =
      available_ >= -kTolerance && allocated_ >= -kTolerance;
  const bool matches_tokens =
      std::abs(allocated_ - outstanding_sum) <= kTolerance;

  if (balanced && non_negative && matches_tokens) {
    return;
  }

  std::ostringstream msg;
  msg << context << ": ledger out of balance (total=" << total_
      << " available=" << available_ << " allocated=" << allocated_
      << " outstanding=" << outstanding_sum << ")";
  throw LedgerInvariantViolation(msg.str());
}

}  // namespace paper
