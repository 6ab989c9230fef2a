#include "paper/domain/error.hpp"

namespace paper {

const char* errorKindToString(ErrorKind kind) {
  using K = ErrorKind;
  switch (kind) {
    case K::InvalidSignal:            return "InvalidSignal";
    case K::InsufficientCapital:      return "InsufficientCapital";
    case K::NoEdge:                   return "NoEdge";
    case K::GovernanceBoundViolation: return "GovernanceBoundViolation";
    case K::DuplicateActivePosition:  return "DuplicateActivePosition";
    case K::TradingHalted:            return "TradingHalted";
    case K::LedgerInvariantViolation: return "LedgerInvariantViolation";
    case K::JournalWriteFailure:      return "JournalWriteFailure";
    case K::InvalidAmount:            return "InvalidAmount";
    case K::InvalidTransition:        return "InvalidTransition";
    case K::UnknownMarket:            return "UnknownMarket";
    case K::ExposureLimit:            return "ExposureLimit";
    case K::InvalidConfig:            return "InvalidConfig";
  }
  return "Unknown";
}

}  // namespace paper
