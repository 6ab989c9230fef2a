#pragma once

#include <cstdint>

namespace paper {
namespace domain {

// -----------------------------------------------------------------------------
// CapitalSnapshot - point-in-time view of the ledger
// -----------------------------------------------------------------------------
// available + allocated == total at every observable point.
// -----------------------------------------------------------------------------
struct CapitalSnapshot {
  double total{0.0};
  double available{0.0};
  double allocated{0.0};
};

// Identifier of a single outstanding reservation. 0 is never issued.
using TokenId = std::uint64_t;

// -----------------------------------------------------------------------------
// ReservationToken - proof that `amount` was moved from available to
// allocated. Redeemable exactly once through CapitalLedger::release().
// -----------------------------------------------------------------------------
struct ReservationToken {
  TokenId id{0};
  double amount{0.0};
};

// Why capital was reserved.
enum class ReservationReason {
  Open,
  AverageDown,
};

// -----------------------------------------------------------------------------
// ReleaseReceipt - result of redeeming a token
// -----------------------------------------------------------------------------
struct ReleaseReceipt {
  TokenId token_id{0};
  double amount{0.0};        // originally reserved amount
  double realized_pnl{0.0};  // PnL share booked against this token
  CapitalSnapshot after{};   // ledger state right after the release
};

inline const char* reservationReasonToString(ReservationReason reason) {
  switch (reason) {
    case ReservationReason::Open:        return "OPEN";
    case ReservationReason::AverageDown: return "AVERAGE_DOWN";
  }
  return "UNKNOWN";
}

}  // namespace domain
}  // namespace paper
