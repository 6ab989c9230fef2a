#pragma once

#include <cstdint>
#include <string>

namespace paper {

enum class AlertKind {
  DrawdownHalt,
  DrawdownResume,
  KillSwitch,
  LedgerInvariant,
  JournalFailure,
  ReconcileMismatch,
  GovernanceBound,
};

inline const char* alertKindToString(AlertKind kind) {
  switch (kind) {
    case AlertKind::DrawdownHalt:      return "DRAWDOWN_HALT";
    case AlertKind::DrawdownResume:    return "DRAWDOWN_RESUME";
    case AlertKind::KillSwitch:        return "KILL_SWITCH";
    case AlertKind::LedgerInvariant:   return "LEDGER_INVARIANT";
    case AlertKind::JournalFailure:    return "JOURNAL_FAILURE";
    case AlertKind::ReconcileMismatch: return "RECONCILE_MISMATCH";
    case AlertKind::GovernanceBound:   return "GOVERNANCE_BOUND";
  }
  return "UNKNOWN";
}

// -----------------------------------------------------------------------------
// RiskAlertEvent - a halt, a resume or a fatal condition
// -----------------------------------------------------------------------------
//
// @brief  Published when trading is halted or resumed, and whenever a fatal
//         condition (ledger invariant, journal exhaustion, reconciliation
//         mismatch) or a governance clamp occurs.
//
// @details
// current_value / limit_value carry the numbers behind the alert where
// there are any (drawdown vs threshold, replayed vs live total, requested
// vs applied parameter); otherwise both are 0.
//
// Thread model:
//   Plain data. Forwarded to the IPC PUB socket by IpcServer.
// -----------------------------------------------------------------------------
struct RiskAlertEvent {
  AlertKind kind{AlertKind::KillSwitch};
  std::string market_id;
  std::string reason;
  double current_value{0.0};
  double limit_value{0.0};
  std::int64_t timestamp_ms{0};
};

}  // namespace paper
