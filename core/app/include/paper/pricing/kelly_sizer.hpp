#pragma once

#include "paper/config/engine_config.hpp"
#include "paper/domain/result.hpp"
#include "paper/domain/signal.hpp"

namespace paper {

// Parameters the sizer reads; taken from one EngineConfig snapshot.
struct SizingParams {
  double kelly_fraction{0.25};
  double max_trade_exposure{0.05};
  double min_edge{0.10};
  double min_odds{0.05};
  double min_stake{0.0};

  static SizingParams from(const EngineConfig& config);
};

// -----------------------------------------------------------------------------
// SizingDecision - how a stake was derived
// -----------------------------------------------------------------------------
struct SizingDecision {
  double payout_odds{0.0};     // b = (1 - price) / price
  double full_kelly{0.0};      // f* = (b*p - q) / b
  double fraction{0.0};        // k * f*, before the exposure cap
  double stake{0.0};           // clamp(k * f* * C, 0, m * C)
  bool capped{false};          // true if the exposure cap bound the stake
};

// -----------------------------------------------------------------------------
// KellySizer - fractional Kelly stake for a binary contract
// -----------------------------------------------------------------------------
//
// @brief  Pure function of (signal, available capital, params). No state,
//         no locking, no I/O.
//
// @details
// Buying the `side` contract at price P pays 1 per contract, so each unit
// staked returns b = (1 - P) / P on a win. With p = signal.probability and
// q = 1 - p:
//
//   f*    = (b*p - q) / b        (equivalently (p - P) / (1 - P))
//   stake = clamp(k * f* * C, 0, m * C)
//
// Returns NoEdge, touching nothing, when
//   - f* <= 0,
//   - signal.edge <= min_edge,
//   - market_price < min_odds (long shots are not traded), or
//   - the resulting stake is below min_stake.
//
// Returns InvalidSignal for probability outside [0, 1] or a price outside
// (0, 1), and InsufficientCapital when nothing is available.
//
// Monotonicity: for fixed price and capital the stake is non-decreasing in
// probability, and does not depend on signal.edge beyond the threshold.
// -----------------------------------------------------------------------------
class KellySizer {
 public:
  static Result<SizingDecision> size(const domain::Signal& signal,
                                     double available_capital,
                                     const SizingParams& params);
};

}  // namespace paper
