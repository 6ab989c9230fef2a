#include "paper/risk/drawdown_protector.hpp"

#include <iostream>

namespace paper {

DrawdownParams DrawdownParams::from(const EngineConfig& config) {
  DrawdownParams p;
  p.halt_threshold = config.drawdown_halt_threshold;
  p.resume_threshold = config.drawdown_resume_threshold;
  p.recovery = config.drawdown_recovery;
  p.cooldown_ms = config.drawdown_cooldown_ms;
  return p;
}

// -----------------------------------------------------------------------------
// observe: update peak, then trip or recover
// -----------------------------------------------------------------------------
DrawdownTransition DrawdownProtector::observe(double total,
                                              std::int64_t now_ms,
                                              const DrawdownParams& params) {
  std::lock_guard lock(mutex_);

  if (total > peak_) {
    peak_ = total;
  }
  drawdown_ = peak_ > 0.0 ? (peak_ - total) / peak_ : 0.0;

  if (!halted_.load(std::memory_order_relaxed)) {
    if (drawdown_ > params.halt_threshold) {
      halted_at_ms_ = now_ms;
      halted_.store(true, std::memory_order_release);
      std::cerr << "[DrawdownProtector] CRITICAL: drawdown " << drawdown_
                << " exceeds " << params.halt_threshold << " (peak=" << peak_
                << " total=" << total << "). New exposure halted.\n";
      return DrawdownTransition::Halted;
    }
    return DrawdownTransition::None;
  }

  bool recovered = false;
  switch (params.recovery) {
    case DrawdownRecovery::Hysteresis:
      recovered = drawdown_ < params.resume_threshold;
      break;
    case DrawdownRecovery::Cooldown:
      recovered = now_ms - halted_at_ms_ >= params.cooldown_ms;
      if (recovered) {
        peak_ = total;
        drawdown_ = 0.0;
      }
      break;
  }

  if (!recovered) {
    return DrawdownTransition::None;
  }

  halted_.store(false, std::memory_order_release);
  std::cout << "[DrawdownProtector] Resumed (mode="
            << drawdownRecoveryToString(params.recovery)
            << " drawdown=" << drawdown_ << " peak=" << peak_ << ")\n";
  return DrawdownTransition::Resumed;
}

double DrawdownProtector::peak() const {
  std::lock_guard lock(mutex_);
  return peak_;
}

double DrawdownProtector::drawdown() const {
  std::lock_guard lock(mutex_);
  return drawdown_;
}

void DrawdownProtector::reset(double baseline) {
  std::lock_guard lock(mutex_);
  peak_ = baseline;
  drawdown_ = 0.0;
  halted_at_ms_ = 0;
  halted_.store(false, std::memory_order_release);
}

}  // namespace paper
