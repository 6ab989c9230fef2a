#pragma once

#include "paper/config/engine_config.hpp"

#include <atomic>
#include <cstdint>
#include <mutex>

namespace paper {

struct DrawdownParams {
  double halt_threshold{0.10};
  double resume_threshold{0.05};
  DrawdownRecovery recovery{DrawdownRecovery::Hysteresis};
  std::int64_t cooldown_ms{3600000};

  static DrawdownParams from(const EngineConfig& config);
};

// What a single observe() call changed.
enum class DrawdownTransition {
  None,
  Halted,
  Resumed,
};

// -----------------------------------------------------------------------------
// DrawdownProtector - circuit breaker on decline from the capital peak
// -----------------------------------------------------------------------------
//
// @brief  Tracks the rolling peak of total capital and halts new exposure
//         when the relative decline exceeds the halt threshold.
//
// @details
//   drawdown = (peak - total) / peak
//
// While halted, Openings and averaging-down are refused; closes always run.
// Recovery depends on DrawdownParams::recovery:
//   Hysteresis - resume once drawdown < resume_threshold (a new peak counts).
//   Cooldown   - resume once cooldown_ms has elapsed since the halt; the
//                peak is re-anchored to the total at that moment so the
//                breaker does not re-trip on the same loss.
//
// Thread model:
//   observe() is called by the Simulator after each committed capital
//   change (from worker threads and the sweep thread) and is serialised by
//   mutex_. halted() is a lock-free atomic read for the intake hot path.
// -----------------------------------------------------------------------------
class DrawdownProtector {
 public:
  DrawdownProtector() = default;

  DrawdownProtector(const DrawdownProtector&) = delete;
  DrawdownProtector& operator=(const DrawdownProtector&) = delete;

  DrawdownTransition observe(double total, std::int64_t now_ms,
                             const DrawdownParams& params);

  bool halted() const { return halted_.load(std::memory_order_acquire); }

  double peak() const;
  double drawdown() const;

  // Forgets all history and starts again from `baseline` (recovery).
  void reset(double baseline);

 private:
  mutable std::mutex mutex_;
  double peak_{0.0};
  double drawdown_{0.0};
  std::int64_t halted_at_ms_{0};
  std::atomic<bool> halted_{false};
};

}  // namespace paper
