#pragma once

#include "paper/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace paper {

// -----------------------------------------------------------------------------
// SimulationTimeProvider - externally driven clock
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider whose current time is set by the caller. Tests use
//         it to step past a position's resolution time or a drawdown
//         cooldown without sleeping.
//
// @details
// Stored in a std::atomic<int64_t>: one writer (the test or harness), any
// number of readers (workers, sweep thread), no mutex on the read path.
//
// Monotonicity is the caller's responsibility; advance_time() accepts any
// value.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  SimulationTimeProvider() = default;
  explicit SimulationTimeProvider(std::int64_t start_ms)
      : current_time_ms_(start_ms) {}

  std::int64_t now_ms() const override;

  // Sets the clock to an absolute time.
  void advance_time(std::int64_t new_time_ms);

  // Moves the clock forward by `delta_ms`.
  void advance_by(std::int64_t delta_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_{0};
};

}  // namespace paper
