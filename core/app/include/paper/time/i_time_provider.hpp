#pragma once

#include <cstdint>

namespace paper {

// -----------------------------------------------------------------------------
// ITimeProvider - injectable clock
// -----------------------------------------------------------------------------
//
// @brief  Abstracts "now" so that expiry, cooldown and journal timestamps
//         are deterministic under test.
//
// @details
//   - LiveTimeProvider:       wall clock (std::chrono::system_clock).
//   - SimulationTimeProvider: value set explicitly by a test or replay
//                             harness.
//
// Components hold `const ITimeProvider&` and never read the system clock
// directly.
//
// Thread-safety contract:
//   Implementations must allow concurrent now_ms() from any thread.
//
// Ownership:
//   Borrowed. The provider outlives every component that references it.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // Milliseconds since the Unix epoch.
  virtual std::int64_t now_ms() const = 0;
};

}  // namespace paper
