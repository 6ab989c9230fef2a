#pragma once

#include <atomic>
#include <cstdint>

namespace paper {

// -----------------------------------------------------------------------------
// SequenceGenerator - thread-safe, monotonically increasing id source
// -----------------------------------------------------------------------------
//
// @brief  Hands out unique ids starting at 1 (0 is the "unset" sentinel).
//
// @details
// Used for reservation token ids (CapitalLedger) and position ids
// (PositionStore). After crash recovery the owner calls advancePast() with
// the highest id found in the journal so new ids never collide with
// replayed ones.
//
// Thread model:
//   next() and advancePast() are safe to call concurrently. Relaxed
//   ordering is enough: uniqueness is the only guarantee required.
//
// Ownership:
//   Value member of the component that issues the ids. Not a singleton.
// -----------------------------------------------------------------------------
class SequenceGenerator {
 public:
  SequenceGenerator() = default;

  SequenceGenerator(const SequenceGenerator&) = delete;
  SequenceGenerator& operator=(const SequenceGenerator&) = delete;
  SequenceGenerator(SequenceGenerator&&) = delete;
  SequenceGenerator& operator=(SequenceGenerator&&) = delete;

  std::uint64_t next() {
    return next_.fetch_add(1, std::memory_order_relaxed);
  }

  // Guarantees that every later next() returns a value > `used`.
  void advancePast(std::uint64_t used) {
    std::uint64_t current = next_.load(std::memory_order_relaxed);
    while (current <= used &&
           !next_.compare_exchange_weak(current, used + 1,
                                        std::memory_order_relaxed)) {
    }
  }

  // Next id that will be handed out (diagnostics only).
  std::uint64_t peek() const { return next_.load(std::memory_order_relaxed); }

 private:
  std::atomic<std::uint64_t> next_{1};
};

}  // namespace paper
