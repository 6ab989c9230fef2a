#include "paper/journal/file_journal.hpp"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

#include <sys/types.h>
#include <unistd.h>

namespace paper {

// -----------------------------------------------------------------------------
// Constructor: recover numbering, then open for append
// -----------------------------------------------------------------------------
FileJournal::FileJournal(std::string path) : path_(std::move(path)) {
  const std::filesystem::path fs_path(path_);
  if (fs_path.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(fs_path.parent_path(), ec);
    if (ec) {
      throw std::runtime_error("[FileJournal] cannot create directory " +
                               fs_path.parent_path().string() + ": " +
                               ec.message());
    }
  }

  const JournalReadResult existing = readAllLocked();
  for (const auto& record : existing.records) {
    if (record.sequence > last_sequence_) {
      last_sequence_ = record.sequence;
    }
  }

  file_ = std::fopen(path_.c_str(), "ab");
  if (file_ == nullptr) {
    throw std::runtime_error("[FileJournal] cannot open " + path_ + ": " +
                             std::strerror(errno));
  }

  std::cout << "[FileJournal] Opened " << path_ << " ("
            << existing.records.size() << " records, last seq "
            << last_sequence_ << ", " << existing.parse_errors
            << " unreadable lines)\n";
}

FileJournal::~FileJournal() {
  if (file_ != nullptr) {
    std::fclose(file_);
  }
}

// -----------------------------------------------------------------------------
// append: one fwrite + fflush + fsync per batch
// -----------------------------------------------------------------------------
Result<std::uint64_t> FileJournal::append(std::vector<JournalRecord> batch) {
  std::lock_guard lock(mutex_);

  std::uint64_t seq = last_sequence_;
  std::string buffer;
  for (auto& record : batch) {
    record.sequence = ++seq;
    buffer += nlohmann::json(record).dump();
    buffer += '\n';
  }

  const int fd = fileno(file_);
  const off_t before = ::lseek(fd, 0, SEEK_END);

  const std::size_t written =
      std::fwrite(buffer.data(), 1, buffer.size(), file_);
  bool ok = written == buffer.size();
  ok = ok && std::fflush(file_) == 0;
  ok = ok && ::fsync(fd) == 0;

  if (!ok) {
    const int err = errno;
    std::clearerr(file_);
    if (before >= 0 && ::ftruncate(fd, before) != 0) {
      std::cerr << "[FileJournal] CRITICAL: could not truncate " << path_
                << " after failed append: " << std::strerror(errno) << "\n";
    }
    return makeError(ErrorKind::JournalWriteFailure,
                     "append to " + path_ + " failed: " + std::strerror(err));
  }

  last_sequence_ = seq;
  return last_sequence_;
}

// -----------------------------------------------------------------------------
// readAll: tolerant line-by-line parse
// -----------------------------------------------------------------------------
JournalReadResult FileJournal::readAll() const {
  std::lock_guard lock(mutex_);
  return readAllLocked();
}

JournalReadResult FileJournal::readAllLocked() const {
  JournalReadResult out;

  std::ifstream in(path_);
  if (!in.is_open()) {
    return out;
  }

  std::string line;
  while (std::getline(in, line)) {
    if (line.empty()) {
      continue;
    }
    ++out.lines_total;
    try {
      out.records.push_back(nlohmann::json::parse(line).get<JournalRecord>());
    } catch (const nlohmann::json::exception& e) {
      ++out.parse_errors;
      std::cerr << "[FileJournal] Skipping malformed line "
                << out.lines_total << ": " << e.what() << "\n";
    } catch (const std::invalid_argument& e) {
      ++out.parse_errors;
      std::cerr << "[FileJournal] Skipping invalid record at line "
                << out.lines_total << ": " << e.what() << "\n";
    }
  }
  return out;
}

std::uint64_t FileJournal::lastSequence() const {
  std::lock_guard lock(mutex_);
  return last_sequence_;
}

}  // namespace paper
