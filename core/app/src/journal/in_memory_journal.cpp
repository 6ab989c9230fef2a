#include "paper/journal/in_memory_journal.hpp"

namespace paper {

Result<std::uint64_t> InMemoryJournal::append(
    std::vector<JournalRecord> batch) {
  std::lock_guard lock(mutex_);

  if (fail_remaining_ > 0) {
    --fail_remaining_;
    ++failed_;
    return makeError(ErrorKind::JournalWriteFailure,
                     "injected journal write failure");
  }

  for (auto& record : batch) {
    record.sequence = ++last_sequence_;
    records_.push_back(std::move(record));
  }
  return last_sequence_;
}

JournalReadResult InMemoryJournal::readAll() const {
  std::lock_guard lock(mutex_);
  JournalReadResult out;
  out.records = records_;
  out.lines_total = records_.size();
  return out;
}

std::uint64_t InMemoryJournal::lastSequence() const {
  std::lock_guard lock(mutex_);
  return last_sequence_;
}

void InMemoryJournal::failNextAppends(int count) {
  std::lock_guard lock(mutex_);
  fail_remaining_ = count;
}

int InMemoryJournal::failedAppends() const {
  std::lock_guard lock(mutex_);
  return failed_;
}

}  // namespace paper
