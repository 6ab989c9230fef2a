#include "paper/risk/averaging_down_policy.hpp"

#include <algorithm>
#include <sstream>

namespace paper {

AveragingParams AveragingParams::from(const EngineConfig& config) {
  AveragingParams p;
  p.max_additions = config.max_additions;
  p.max_market_exposure = config.max_market_exposure;
  p.price_drop = config.averaging_price_drop;
  p.min_edge_improvement = config.averaging_min_edge_improvement;
  p.min_edge = config.min_edge;
  return p;
}

namespace {

Error notEligible(const domain::Position& pos, const std::string& why) {
  std::ostringstream msg;
  msg << "market " << pos.market_id << " already has position "
      << pos.position_id << "; not averaging down: " << why;
  return makeError(ErrorKind::DuplicateActivePosition, msg.str());
}

}  // namespace

Result<double> AveragingDownPolicy::review(
    const domain::Position& position, const domain::Signal& signal,
    const domain::CapitalSnapshot& capital, const AveragingParams& params,
    const SizingParams& sizing) {
  if (position.status != domain::PositionStatus::Open) {
    return notEligible(position, std::string("status ") +
                                     domain::positionStatusToString(
                                         position.status));
  }
  if (signal.side != position.side) {
    return notEligible(position, "opposite side");
  }
  if (position.additions >= params.max_additions) {
    std::ostringstream msg;
    msg << "position " << position.position_id << " reached "
        << params.max_additions << " additions";
    return makeError(ErrorKind::ExposureLimit, msg.str());
  }

  const double trigger = position.entry_price * (1.0 - params.price_drop);
  if (signal.market_price > trigger) {
    std::ostringstream why;
    why << "price " << signal.market_price << " above trigger " << trigger;
    return notEligible(position, why.str());
  }

  const double improvement = signal.edge - position.original_edge;
  if (improvement < params.min_edge_improvement) {
    std::ostringstream why;
    why << "edge improvement " << improvement << " below "
        << params.min_edge_improvement;
    return notEligible(position, why.str());
  }
  if (signal.edge <= params.min_edge) {
    std::ostringstream why;
    why << "edge " << signal.edge << " <= min_edge " << params.min_edge;
    return notEligible(position, why.str());
  }

  const double headroom =
      params.max_market_exposure * capital.total - position.stake;
  if (headroom <= 0.0) {
    std::ostringstream msg;
    msg << "position " << position.position_id << " stake " << position.stake
        << " already at per-market cap "
        << params.max_market_exposure * capital.total;
    return makeError(ErrorKind::ExposureLimit, msg.str());
  }

  auto sized = KellySizer::size(signal, capital.available, sizing);
  if (!sized) {
    return sized.error();
  }

  return std::min(sized.value().stake, headroom);
}

}  // namespace paper
