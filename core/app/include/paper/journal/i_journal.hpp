#pragma once

#include "paper/domain/result.hpp"
#include "paper/journal/journal_record.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace paper {

// Everything a journal scan produced. Malformed lines are counted in
// parse_errors and skipped.
struct JournalReadResult {
  std::vector<JournalRecord> records;
  std::size_t lines_total{0};
  std::size_t parse_errors{0};
};

// -----------------------------------------------------------------------------
// IJournal - append-only durable record of capital and position lifecycle
// -----------------------------------------------------------------------------
//
// @brief  Polymorphic base for the file-backed journal used in production
//         and the in-memory journal used by tests.
//
// @details
// append() takes one committed step as a batch (for example
// [Reservation, Opened]) and writes it as a unit: either every record is
// durable when it returns, or the call fails and the caller treats the step
// as not journaled. The journal assigns strictly increasing sequence
// numbers; the caller supplies timestamp_ms.
//
// Failures are returned as JournalWriteFailure. Retrying is the caller's
// job (Simulator applies journal_max_retries with backoff).
//
// Ownership:
//   The process root (main() or a test) owns the concrete journal and
//   passes it by reference to Simulator.
//
// Thread model:
//   Implementations must be safe for concurrent append() from several
//   worker threads and the sweep thread.
// -----------------------------------------------------------------------------
class IJournal {
 public:
  virtual ~IJournal() = default;

  // Assigns sequence numbers to `batch` and persists it. Returns the
  // sequence of the last record written.
  virtual Result<std::uint64_t> append(std::vector<JournalRecord> batch) = 0;

  // Every record persisted so far, in sequence order.
  virtual JournalReadResult readAll() const = 0;

  // Sequence of the most recent durable record, 0 if none.
  virtual std::uint64_t lastSequence() const = 0;
};

}  // namespace paper
