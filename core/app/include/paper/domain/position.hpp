#pragma once

#include "paper/domain/capital.hpp"
#include "paper/domain/signal.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace paper {
namespace domain {

// -----------------------------------------------------------------------------
// PositionStatus - position lifecycle state machine
// -----------------------------------------------------------------------------
//
// @brief  Every state a paper position can occupy between intake and
//         settlement.
//
// @details
// Legal transitions (enforced by PositionStore):
//
//   Opening ──> Open ──> ClosingStopLoss   ──┐
//      │         │ ▲     ClosingTakeProfit ──┤
//      │         └─┘     ClosingExpired    ──┼──> Closed
//      ▼     (average    ClosingManual     ──┘
//   discarded   down)
//
// Opening exists only while a reservation is in flight; a failed
// reservation discards it without a trace. Closed is terminal and
// immutable.
//
// Thread model:
//   Plain enum, safe to copy and compare from any thread.
// -----------------------------------------------------------------------------
enum class PositionStatus {
  Opening,
  Open,
  ClosingStopLoss,
  ClosingTakeProfit,
  ClosingExpired,
  ClosingManual,
  Closed,
};

// -----------------------------------------------------------------------------
// CloseReason - why a position left the Open state
// -----------------------------------------------------------------------------
// Resolved is settlement at 1.0 / 0.0 when the market's outcome is known;
// it runs through the ClosingExpired state.
// -----------------------------------------------------------------------------
enum class CloseReason {
  None,
  StopLoss,
  TakeProfit,
  Expired,
  Manual,
  Resolved,
};

// -----------------------------------------------------------------------------
// Position - one paper position in one market
// -----------------------------------------------------------------------------
//
// @brief  Capital committed to one side of one market, from reservation to
//         settlement.
//
// @details
// stake is the cost basis: the sum of all reserved amounts backing the
// position (one token for the open, one per averaging-down addition).
// contracts accumulates stake / fill_price per fill, so the value of the
// position at exit price x is contracts * x and
//
//   realized_pnl = contracts * exit_price - stake
//
// entry_price is the stake-weighted average of the fill prices:
//
//   new_entry = (old_stake * old_entry + add_stake * fill) / (old_stake + add_stake)
//
// original_edge is the edge at open time; last_edge and reversal_streak
// track the most recent re-evaluation.
//
// Thread model:
//   Value type. The authoritative copy lives in PositionStore; everything
//   else (events, journal, reports) holds copies.
// -----------------------------------------------------------------------------
struct Position {
  std::uint64_t position_id{0};
  std::string market_id;
  Side side{Side::Yes};
  PositionStatus status{PositionStatus::Opening};

  double entry_price{0.0};
  double stake{0.0};
  double contracts{0.0};

  std::int64_t opened_at_ms{0};
  std::int64_t closed_at_ms{0};
  std::int64_t resolution_at_ms{0};

  double exit_price{0.0};
  double realized_pnl{0.0};
  CloseReason close_reason{CloseReason::None};

  int additions{0};
  double original_edge{0.0};
  double last_edge{0.0};
  int reversal_streak{0};

  std::vector<ReservationToken> reservations;
};

inline bool isClosing(PositionStatus s) {
  return s == PositionStatus::ClosingStopLoss ||
         s == PositionStatus::ClosingTakeProfit ||
         s == PositionStatus::ClosingExpired ||
         s == PositionStatus::ClosingManual;
}

inline bool isTerminal(PositionStatus s) { return s == PositionStatus::Closed; }

// Closing state a given reason runs through. CloseReason::None has none and
// maps to Open.
inline PositionStatus closingStatusFor(CloseReason reason) {
  switch (reason) {
    case CloseReason::StopLoss:   return PositionStatus::ClosingStopLoss;
    case CloseReason::TakeProfit: return PositionStatus::ClosingTakeProfit;
    case CloseReason::Expired:
    case CloseReason::Resolved:   return PositionStatus::ClosingExpired;
    case CloseReason::Manual:     return PositionStatus::ClosingManual;
    case CloseReason::None:       break;
  }
  return PositionStatus::Open;
}

const char* positionStatusToString(PositionStatus s);
const char* closeReasonToString(CloseReason r);
bool parsePositionStatus(const std::string& text, PositionStatus& out);
bool parseCloseReason(const std::string& text, CloseReason& out);

}  // namespace domain
}  // namespace paper
