#include "paper/journal/capital_snapshot_file.hpp"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>

#include <unistd.h>

namespace paper {

CapitalSnapshotFile::CapitalSnapshotFile(std::string path)
    : path_(std::move(path)) {
  const std::filesystem::path fs_path(path_);
  if (fs_path.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(fs_path.parent_path(), ec);
    if (ec) {
      std::cerr << "[CapitalSnapshotFile] Cannot create directory "
                << fs_path.parent_path() << ": " << ec.message() << "\n";
    }
  }
}

// -----------------------------------------------------------------------------
// write: temp file, then rename over the target
// -----------------------------------------------------------------------------
bool CapitalSnapshotFile::write(const CapitalCheckpoint& checkpoint) const {
  const nlohmann::json doc{
      {"total", checkpoint.capital.total},
      {"available", checkpoint.capital.available},
      {"allocated", checkpoint.capital.allocated},
      {"last_sequence", checkpoint.last_sequence},
  };

  const std::string tmp = path_ + ".tmp";
  const std::string body = doc.dump() + "\n";

  std::FILE* out = std::fopen(tmp.c_str(), "w");
  if (out == nullptr) {
    std::cerr << "[CapitalSnapshotFile] Cannot open " << tmp << ": "
              << std::strerror(errno) << "\n";
    return false;
  }

  // Content must be durable before the rename makes it visible.
  bool ok = std::fwrite(body.data(), 1, body.size(), out) == body.size();
  ok = ok && std::fflush(out) == 0;
  ok = ok && ::fsync(fileno(out)) == 0;
  const int err = errno;
  ok = std::fclose(out) == 0 && ok;
  if (!ok) {
    std::cerr << "[CapitalSnapshotFile] Write to " << tmp
              << " failed: " << std::strerror(err) << "\n";
    std::error_code ignored;
    std::filesystem::remove(tmp, ignored);
    return false;
  }

  std::error_code ec;
  std::filesystem::rename(tmp, path_, ec);
  if (ec) {
    std::cerr << "[CapitalSnapshotFile] Rename " << tmp << " -> " << path_
              << " failed: " << ec.message() << "\n";
    return false;
  }
  return true;
}

std::optional<CapitalCheckpoint> CapitalSnapshotFile::load() const {
  std::ifstream in(path_);
  if (!in.is_open()) {
    return std::nullopt;
  }

  try {
    const nlohmann::json doc = nlohmann::json::parse(in);
    CapitalCheckpoint cp;
    cp.capital.total = doc.at("total").get<double>();
    cp.capital.available = doc.at("available").get<double>();
    cp.capital.allocated = doc.at("allocated").get<double>();
    cp.last_sequence = doc.at("last_sequence").get<std::uint64_t>();
    return cp;
  } catch (const nlohmann::json::exception& e) {
    std::cerr << "[CapitalSnapshotFile] Unreadable " << path_ << ": "
              << e.what() << "\n";
    return std::nullopt;
  }
}

}  // namespace paper
