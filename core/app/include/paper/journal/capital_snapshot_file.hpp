#pragma once

#include "paper/domain/capital.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace paper {

struct CapitalCheckpoint {
  domain::CapitalSnapshot capital{};
  std::uint64_t last_sequence{0};
};

// -----------------------------------------------------------------------------
// CapitalSnapshotFile - latest ledger state as a small JSON document
// -----------------------------------------------------------------------------
//
// @brief  Writes {total, available, allocated, last_sequence} after each
//         committed ledger mutation, for external readers and as a startup
//         cross-check against the journal.
//
// @details
// write() serialises to "<path>.tmp" and renames it over <path>, so a
// reader sees either the previous or the new document, never a torn one.
// The journal stays the source of truth: recovery always replays it and
// only compares the result with load().
//
// Thread model:
//   Not synchronised. The Simulator serialises write() calls.
// -----------------------------------------------------------------------------
class CapitalSnapshotFile {
 public:
  explicit CapitalSnapshotFile(std::string path);

  // False (and a log line) if the file could not be written.
  bool write(const CapitalCheckpoint& checkpoint) const;

  // std::nullopt if the file is missing or unreadable.
  std::optional<CapitalCheckpoint> load() const;

  const std::string& path() const { return path_; }

 private:
  std::string path_;
};

}  // namespace paper
