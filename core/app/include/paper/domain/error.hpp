#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace paper {

// -----------------------------------------------------------------------------
// ErrorKind - closed taxonomy of everything the engine can refuse or report
// -----------------------------------------------------------------------------
//
// @details
// Recoverable, local to one signal (logged, processing continues):
//   InvalidSignal, InsufficientCapital, NoEdge, DuplicateActivePosition,
//   TradingHalted, ExposureLimit, UnknownMarket, InvalidAmount
//
// Clamped, never returned to callers (reported for observability only):
//   GovernanceBoundViolation
//
// Fatal, halt new intake process-wide:
//   LedgerInvariantViolation, JournalWriteFailure
//
// InvalidConfig is returned by ConfigStore::reload() only.
//
// InvalidTransition means a PositionStore operation was attempted from a
// state that does not allow it (e.g. closing a position twice).
// -----------------------------------------------------------------------------
enum class ErrorKind {
  InvalidSignal,
  InsufficientCapital,
  NoEdge,
  GovernanceBoundViolation,
  DuplicateActivePosition,
  TradingHalted,
  LedgerInvariantViolation,
  JournalWriteFailure,
  InvalidAmount,
  InvalidTransition,
  UnknownMarket,
  ExposureLimit,
  InvalidConfig,
};

// -----------------------------------------------------------------------------
// Error - value carried by a failed Result<T>
// -----------------------------------------------------------------------------
struct Error {
  ErrorKind kind{ErrorKind::InvalidSignal};
  std::string message;
};

inline Error makeError(ErrorKind kind, std::string message) {
  return Error{kind, std::move(message)};
}

const char* errorKindToString(ErrorKind kind);

// True for the kinds that trip the process-wide kill switch.
inline bool isFatal(ErrorKind kind) {
  return kind == ErrorKind::LedgerInvariantViolation ||
         kind == ErrorKind::JournalWriteFailure;
}

// -----------------------------------------------------------------------------
// LedgerInvariantViolation - accounting corruption or token misuse
// -----------------------------------------------------------------------------
//
// @brief  Thrown by CapitalLedger on a programmer error: redeeming an
//         unknown or already-released token, or any state in which
//         available + allocated != total.
//
// @details
// This is the only exception thrown out of a core component on a normal
// code path. Rejections (insufficient capital, invalid signal) are Result
// values. The Simulator catches this type at its orchestration step, trips
// the kill switch and publishes a RiskAlertEvent.
// -----------------------------------------------------------------------------
class LedgerInvariantViolation : public std::logic_error {
 public:
  explicit LedgerInvariantViolation(const std::string& what)
      : std::logic_error(what) {}
};

}  // namespace paper
