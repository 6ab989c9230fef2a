#include "paper/domain/position.hpp"
#include "paper/domain/signal.hpp"

namespace paper {
namespace domain {

// -----------------------------------------------------------------------------
// Side / ConfidenceTier parsing (wire format used by the gateway and journal)
// -----------------------------------------------------------------------------
bool parseSide(const std::string& text, Side& out) {
  if (text == "YES" || text == "yes") {
    out = Side::Yes;
    return true;
  }
  if (text == "NO" || text == "no") {
    out = Side::No;
    return true;
  }
  return false;
}

bool parseConfidence(const std::string& text, ConfidenceTier& out) {
  if (text == "LOW") {
    out = ConfidenceTier::Low;
  } else if (text == "MEDIUM") {
    out = ConfidenceTier::Medium;
  } else if (text == "HIGH") {
    out = ConfidenceTier::High;
  } else {
    return false;
  }
  return true;
}

// -----------------------------------------------------------------------------
// PositionStatus
// -----------------------------------------------------------------------------
const char* positionStatusToString(PositionStatus s) {
  using S = PositionStatus;
  switch (s) {
    case S::Opening:           return "OPENING";
    case S::Open:              return "OPEN";
    case S::ClosingStopLoss:   return "CLOSING_STOP_LOSS";
    case S::ClosingTakeProfit: return "CLOSING_TAKE_PROFIT";
    case S::ClosingExpired:    return "CLOSING_EXPIRED";
    case S::ClosingManual:     return "CLOSING_MANUAL";
    case S::Closed:            return "CLOSED";
  }
  return "UNKNOWN";
}

bool parsePositionStatus(const std::string& text, PositionStatus& out) {
  using S = PositionStatus;
  for (S s : {S::Opening, S::Open, S::ClosingStopLoss, S::ClosingTakeProfit,
              S::ClosingExpired, S::ClosingManual, S::Closed}) {
    if (text == positionStatusToString(s)) {
      out = s;
      return true;
    }
  }
  return false;
}

// -----------------------------------------------------------------------------
// CloseReason
// -----------------------------------------------------------------------------
const char* closeReasonToString(CloseReason r) {
  using R = CloseReason;
  switch (r) {
    case R::None:       return "NONE";
    case R::StopLoss:   return "STOP_LOSS";
    case R::TakeProfit: return "TAKE_PROFIT";
    case R::Expired:    return "EXPIRED";
    case R::Manual:     return "MANUAL";
    case R::Resolved:   return "RESOLVED";
  }
  return "UNKNOWN";
}

bool parseCloseReason(const std::string& text, CloseReason& out) {
  using R = CloseReason;
  for (R r : {R::None, R::StopLoss, R::TakeProfit, R::Expired, R::Manual,
              R::Resolved}) {
    if (text == closeReasonToString(r)) {
      out = r;
      return true;
    }
  }
  return false;
}

}  // namespace domain
}  // namespace paper
