#include "paper/risk/edge_reversal_monitor.hpp"

namespace paper {

ReversalParams ReversalParams::from(const EngineConfig& config) {
  ReversalParams p;
  p.reversal_ticks = config.reversal_ticks;
  p.min_edge = config.min_edge;
  return p;
}

ReversalVerdict EdgeReversalMonitor::assess(
    const domain::Position& position,
    const std::optional<EdgeObservation>& latest,
    const ReversalParams& params) {
  ReversalVerdict verdict;
  verdict.last_edge = position.last_edge;

  if (!latest) {
    verdict.streak = 0;
    return verdict;
  }

  verdict.last_edge = latest->signed_edge;

  const bool opened_positive = position.original_edge > 0.0;
  const bool flipped = opened_positive ? latest->signed_edge <= 0.0
                                       : latest->signed_edge > 0.0;
  const bool weak_high_conviction =
      latest->confidence == domain::ConfidenceTier::High &&
      latest->signed_edge > 0.0 && latest->signed_edge < params.min_edge;

  verdict.evidence = flipped || weak_high_conviction;
  verdict.streak = verdict.evidence ? position.reversal_streak + 1 : 0;
  verdict.reversal =
      verdict.evidence && verdict.streak >= params.reversal_ticks;
  return verdict;
}

EdgeObservation EdgeReversalMonitor::observe(domain::Side held,
                                             const domain::Signal& signal) {
  EdgeObservation obs;
  obs.signed_edge = signal.side == held ? signal.edge : -signal.edge;
  obs.confidence = signal.confidence;
  return obs;
}

}  // namespace paper
