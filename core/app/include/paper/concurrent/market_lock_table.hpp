#pragma once

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace paper {

// -----------------------------------------------------------------------------
// MarketLockTable - one exclusive section per market id
// -----------------------------------------------------------------------------
//
// @brief  Serializes every operation that touches a single market (signal
//         intake, averaging down, evaluation, close) while letting distinct
//         markets proceed in parallel.
//
// @details
// Lock order across the engine is fixed:
//
//   market lock  ->  commit gate (shared)  ->  ledger lock
//
// A thread never holds two market locks at once, and never acquires a
// market lock while holding the ledger lock.
//
// Entries are created on first use and never erased, so the mutex a
// caller receives stays valid for the lifetime of the table. The number
// of entries is bounded by the number of distinct markets seen.
//
// Thread model:
//   acquire() is safe from any thread; table_mutex_ is held only for the
//   lookup, never while waiting on the market mutex.
// -----------------------------------------------------------------------------
class MarketLockTable {
 public:
  MarketLockTable() = default;

  MarketLockTable(const MarketLockTable&) = delete;
  MarketLockTable& operator=(const MarketLockTable&) = delete;

  std::unique_lock<std::mutex> acquire(const std::string& market_id) {
    std::mutex* market_mutex = nullptr;
    {
      std::lock_guard lock(table_mutex_);
      auto& slot = locks_[market_id];
      if (!slot) {
        slot = std::make_unique<std::mutex>();
      }
      market_mutex = slot.get();
    }
    return std::unique_lock<std::mutex>(*market_mutex);
  }

  std::size_t size() const {
    std::lock_guard lock(table_mutex_);
    return locks_.size();
  }

 private:
  mutable std::mutex table_mutex_;
  std::unordered_map<std::string, std::unique_ptr<std::mutex>> locks_;
};

}  // namespace paper
