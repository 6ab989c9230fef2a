#pragma once

#include "paper/journal/i_journal.hpp"

#include <cstdio>
#include <mutex>
#include <string>

namespace paper {

// -----------------------------------------------------------------------------
// FileJournal - JSON Lines journal with fsync per append
// -----------------------------------------------------------------------------
//
// @brief  Durable IJournal: one JSON object per line, appended with
//         fwrite + fflush + fsync.
//
// @details
// Construction creates the parent directory if needed, scans any existing
// file for the highest sequence number so numbering continues after a
// restart, and opens the file for appending. Failure to open throws
// std::runtime_error (the engine cannot run without a journal).
//
// A batch is serialised to one buffer and written with a single fwrite.
// If the write, flush or fsync fails the file is truncated back to its
// previous length, so a failed batch never leaves a partial step behind,
// and JournalWriteFailure is returned.
//
// readAll() reopens the file read-only and parses it line by line.
// Malformed lines (a torn tail after a crash, manual edits) are counted in
// parse_errors, logged and skipped.
//
// Thread model:
//   append() and readAll() serialise on mutex_, so a reader never sees a
//   half-written batch.
//
// Ownership:
//   Owns the FILE*; closed in the destructor.
// -----------------------------------------------------------------------------
class FileJournal final : public IJournal {
 public:
  explicit FileJournal(std::string path);
  ~FileJournal() override;

  FileJournal(const FileJournal&) = delete;
  FileJournal& operator=(const FileJournal&) = delete;
  FileJournal(FileJournal&&) = delete;
  FileJournal& operator=(FileJournal&&) = delete;

  Result<std::uint64_t> append(std::vector<JournalRecord> batch) override;
  JournalReadResult readAll() const override;
  std::uint64_t lastSequence() const override;

  const std::string& path() const { return path_; }

 private:
  JournalReadResult readAllLocked() const;

  const std::string path_;
  mutable std::mutex mutex_;
  std::FILE* file_{nullptr};
  std::uint64_t last_sequence_{0};
};

}  // namespace paper
