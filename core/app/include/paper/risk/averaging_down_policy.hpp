#pragma once

#include "paper/config/engine_config.hpp"
#include "paper/domain/capital.hpp"
#include "paper/domain/position.hpp"
#include "paper/domain/result.hpp"
#include "paper/domain/signal.hpp"
#include "paper/pricing/kelly_sizer.hpp"

namespace paper {

struct AveragingParams {
  int max_additions{1};
  double max_market_exposure{0.10};
  double price_drop{0.10};
  double min_edge_improvement{0.05};
  double min_edge{0.10};

  static AveragingParams from(const EngineConfig& config);
};

// -----------------------------------------------------------------------------
// AveragingDownPolicy - may a repeat signal top up an open position?
// -----------------------------------------------------------------------------
//
// @brief  Decides whether a repeat signal for a market that already holds
//         an Open position becomes an addition, and how large.
//
// @details
// All of the following must hold:
//   1. the position is Open and the signal backs the same side,
//   2. additions < max_additions,
//   3. the price moved against the position:
//        signal.market_price <= entry_price * (1 - price_drop),
//   4. the edge improved: signal.edge - original_edge >= min_edge_improvement,
//   5. signal.edge > min_edge.
//
// The addition is the Kelly stake for the repeat signal, cut down so the
// cumulative stake stays within max_market_exposure * total:
//
//   add = min(kelly_stake, max_market_exposure * total - stake)
//
// Returns the addition stake, DuplicateActivePosition when the repeat
// signal does not qualify (it is then an ordinary duplicate), or
// ExposureLimit when the position is already at its cap. Sizing errors
// (e.g. InsufficientCapital) pass through unchanged.
//
// Pure: no state, no locking.
// -----------------------------------------------------------------------------
class AveragingDownPolicy {
 public:
  static Result<double> review(const domain::Position& position,
                               const domain::Signal& signal,
                               const domain::CapitalSnapshot& capital,
                               const AveragingParams& params,
                               const SizingParams& sizing);
};

}  // namespace paper
