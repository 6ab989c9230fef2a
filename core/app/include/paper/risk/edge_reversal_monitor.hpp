#pragma once

#include "paper/config/engine_config.hpp"
#include "paper/domain/position.hpp"
#include "paper/domain/signal.hpp"

#include <optional>

namespace paper {

struct ReversalParams {
  int reversal_ticks{2};
  double min_edge{0.10};

  static ReversalParams from(const EngineConfig& config);
};

// Most recent model view of a market, expressed relative to a held side.
struct EdgeObservation {
  double signed_edge{0.0};
  domain::ConfidenceTier confidence{domain::ConfidenceTier::Medium};
};

struct ReversalVerdict {
  bool evidence{false};   // this tick counts towards a reversal
  int streak{0};          // consecutive ticks with evidence
  bool reversal{false};   // streak reached reversal_ticks: close
  double last_edge{0.0};  // edge to store on the position
};

// -----------------------------------------------------------------------------
// EdgeReversalMonitor - has the model turned against an open position?
// -----------------------------------------------------------------------------
//
// Evidence on a tick is either
//   - a sign flip: latest signed edge <= 0 while the position was opened on
//     a positive edge, or
//   - a High-confidence latest edge that is still positive but below
//     min_edge.
// The streak resets on any tick without evidence. A streak of
// reversal_ticks recommends ClosingManual.
//
// Stateless; the streak lives on the Position.
// -----------------------------------------------------------------------------
class EdgeReversalMonitor {
 public:
  static ReversalVerdict assess(const domain::Position& position,
                                const std::optional<EdgeObservation>& latest,
                                const ReversalParams& params);

  // Edge of `signal` seen from the side `held`: the signal's edge when it
  // backs the same side, its negation otherwise.
  static EdgeObservation observe(domain::Side held,
                                 const domain::Signal& signal);
};

}  // namespace paper
