#pragma once

#include "paper/journal/i_journal.hpp"

#include <mutex>

namespace paper {

// -----------------------------------------------------------------------------
// InMemoryJournal - deterministic journal for tests and dry runs
// -----------------------------------------------------------------------------
//
// @brief  Keeps records in a vector instead of a file. Same sequencing and
//         batch semantics as FileJournal.
//
// @details
// failNextAppends(n) makes the next n append() calls fail with
// JournalWriteFailure without storing anything, which is how tests drive
// the retry and rollback paths of the Simulator.
//
// Thread model:
//   All members guarded by mutex_.
// -----------------------------------------------------------------------------
class InMemoryJournal final : public IJournal {
 public:
  InMemoryJournal() = default;

  InMemoryJournal(const InMemoryJournal&) = delete;
  InMemoryJournal& operator=(const InMemoryJournal&) = delete;

  Result<std::uint64_t> append(std::vector<JournalRecord> batch) override;
  JournalReadResult readAll() const override;
  std::uint64_t lastSequence() const override;

  void failNextAppends(int count);

  // Number of append() calls that failed on purpose so far.
  int failedAppends() const;

 private:
  mutable std::mutex mutex_;
  std::vector<JournalRecord> records_;
  std::uint64_t last_sequence_{0};
  int fail_remaining_{0};
  int failed_{0};
};

}  // namespace paper
