#pragma once

#include "paper/concurrent/sequence_generator.hpp"
#include "paper/domain/capital.hpp"
#include "paper/domain/result.hpp"

#include <mutex>
#include <unordered_map>
#include <vector>

namespace paper {

// -----------------------------------------------------------------------------
// CapitalLedger - single source of truth for paper capital
// -----------------------------------------------------------------------------
//
// @brief  Tracks total, available and allocated capital and the set of
//         outstanding reservations. Every change of allocated capital goes
//         through a ReservationToken.
//
// @details
// Invariants, checked after every mutation:
//
//   available + allocated == total          (within kTolerance)
//   available >= 0, allocated >= 0
//   allocated == sum(outstanding token amounts)
//
// A violation throws LedgerInvariantViolation. So does redeeming a token
// the ledger did not issue or has already redeemed; a silent no-op there
// would make double releases invisible.
//
// total changes only through release() (by the realized PnL) and
// deposit(). reserve() and release() move capital between available and
// allocated in one critical section; no caller can observe a state in
// which an amount has left available but not yet reached allocated.
//
// Thread model:
//   Every public method locks mutex_ for its whole body. Critical sections
//   do arithmetic only: no I/O, no journal, no callbacks. Callers hold
//   their per-market lock before calling in (lock order: market -> ledger).
//
// Ownership:
//   Owned by PaperEngine (or a test) and passed by reference to Simulator,
//   the only component that calls reserve()/release().
// -----------------------------------------------------------------------------
class CapitalLedger {
 public:
  // Absolute slack allowed in the balance identity.
  static constexpr double kTolerance = 1e-6;

  explicit CapitalLedger(double initial_capital = 0.0);

  CapitalLedger(const CapitalLedger&) = delete;
  CapitalLedger& operator=(const CapitalLedger&) = delete;
  CapitalLedger(CapitalLedger&&) = delete;
  CapitalLedger& operator=(CapitalLedger&&) = delete;

  // -------------------------------------------------------------------------
  // reserve(amount)
  // -------------------------------------------------------------------------
  //
  // @brief  Moves `amount` from available to allocated and returns a token
  //         redeemable exactly once.
  //
  // @return ReservationToken on success.
  //         InvalidAmount        if amount is not a positive finite number.
  //         InsufficientCapital  if amount > available.
  //         No state changes on either error.
  //
  // Thread-safety: Safe from any thread.
  // -------------------------------------------------------------------------
  Result<domain::ReservationToken> reserve(double amount);

  // -------------------------------------------------------------------------
  // release(token, realized_pnl)
  // -------------------------------------------------------------------------
  //
  // @brief  Redeems a token: its amount leaves allocated, amount + pnl
  //         returns to available, total moves by pnl.
  //
  // @param  token         A token issued by reserve() and not yet released.
  //                       Only token.id is trusted; the amount is taken from
  //                       the ledger's own record.
  // @param  realized_pnl  May be negative, but never below -amount (a paper
  //                       position cannot lose more than its stake).
  //
  // @throws LedgerInvariantViolation on an unknown or already-released
  //         token, or if the release would break an invariant.
  //
  // Thread-safety: Safe from any thread.
  // -------------------------------------------------------------------------
  domain::ReleaseReceipt release(const domain::ReservationToken& token,
                                 double realized_pnl);

  // Adds external capital. InvalidAmount for non-positive amounts.
  Result<domain::CapitalSnapshot> deposit(double amount);

  domain::CapitalSnapshot snapshot() const;

  // Tokens not yet released, ordered by id.
  std::vector<domain::ReservationToken> outstanding() const;

  // -------------------------------------------------------------------------
  // restore(snapshot, outstanding, max_token_id)
  // -------------------------------------------------------------------------
  //
  // @brief  Replaces the ledger state with a journal-replayed state.
  //
  // @details
  // Recovery only: called before any worker thread starts. Token ids issued
  // afterwards are strictly greater than every restored id and than
  // `max_token_id`, the highest id the journal ever reserved (released
  // tokens included).
  //
  // @throws LedgerInvariantViolation if the restored state is inconsistent.
  // -------------------------------------------------------------------------
  void restore(const domain::CapitalSnapshot& snapshot,
               const std::vector<domain::ReservationToken>& outstanding,
               domain::TokenId max_token_id = 0);

 private:
  // Throws LedgerInvariantViolation describing `context` on any drift.
  void checkInvariantsLocked(const char* context) const;

  mutable std::mutex mutex_;

  double total_{0.0};
  double available_{0.0};
  double allocated_{0.0};

  std::unordered_map<domain::TokenId, double> outstanding_;
  SequenceGenerator token_ids_;
};

}  // namespace paper
