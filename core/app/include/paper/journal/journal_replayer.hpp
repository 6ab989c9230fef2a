#pragma once

#include "paper/domain/capital.hpp"
#include "paper/domain/position.hpp"
#include "paper/journal/i_journal.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace paper {

struct ReplayStats {
  std::size_t lines_total{0};
  std::size_t parse_errors{0};
  std::size_t records{0};
  std::size_t deposits{0};
  std::size_t reservations{0};
  std::size_t releases{0};
  std::size_t transitions{0};
  std::size_t anomalies{0};  // unknown or reused tokens, out-of-order seq
};

// Total capital after a DEPOSIT or RELEASE, at the record's timestamp.
struct CapitalMark {
  std::int64_t timestamp_ms{0};
  double total{0.0};
};

// -----------------------------------------------------------------------------
// ReplayState - what the journal says the engine looked like
// -----------------------------------------------------------------------------
struct ReplayState {
  domain::CapitalSnapshot capital{};
  std::vector<domain::ReservationToken> outstanding;  // ordered by token id
  std::vector<domain::Position> active;               // ordered by position id
  std::vector<domain::Position> closed;               // in closing order
  std::uint64_t last_sequence{0};
  domain::TokenId max_token_id{0};      // highest id ever reserved
  double peak_total{0.0};               // highest total along the trail
  std::vector<CapitalMark> capital_trail;  // feeds the drawdown breaker
  ReplayStats stats{};
};

// -----------------------------------------------------------------------------
// JournalReplayer - deterministic fold of journal records into state
// -----------------------------------------------------------------------------
//
// @brief  Rebuilds ledger and PositionStore contents from the journal, for
//         crash recovery and for periodic reconciliation.
//
// @details
// Capital is folded from deltas, applying the same arithmetic as
// CapitalLedger:
//   DEPOSIT   total += a, available += a
//   RESERVE   available -= a, allocated += a, token becomes outstanding
//   RELEASE   allocated -= a, available += a + pnl, total += pnl
// Positions are taken from the snapshots in TRANSITION records: the last
// snapshot for a market wins while it is active, and CLOSED moves it into
// the history.
//
// Every DEPOSIT and RELEASE appends the new total to capital_trail so the
// caller can rebuild the drawdown peak and halt state exactly as they were.
//
// A RESERVE for a token id already seen, a RELEASE for a token that is not
// outstanding, or a record whose sequence does not increase, is counted as
// an anomaly and skipped; the caller decides whether that is fatal.
//
// Pure function of its input.
// -----------------------------------------------------------------------------
class JournalReplayer {
 public:
  static ReplayState replay(const std::vector<JournalRecord>& records);
  static ReplayState replay(const IJournal& journal);
};

}  // namespace paper
