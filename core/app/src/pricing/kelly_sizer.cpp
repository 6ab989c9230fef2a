#include "paper/pricing/kelly_sizer.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace paper {

SizingParams SizingParams::from(const EngineConfig& config) {
  SizingParams p;
  p.kelly_fraction = config.kelly_fraction;
  p.max_trade_exposure = config.max_trade_exposure;
  p.min_edge = config.min_edge;
  p.min_odds = config.min_odds;
  p.min_stake = config.min_stake;
  return p;
}

Result<SizingDecision> KellySizer::size(const domain::Signal& signal,
                                        double available_capital,
                                        const SizingParams& params) {
  const double p = signal.probability;
  const double price = signal.market_price;

  if (!std::isfinite(p) || p < 0.0 || p > 1.0) {
    return makeError(ErrorKind::InvalidSignal,
                     "probability outside [0, 1]");
  }
  if (!std::isfinite(price) || price <= 0.0 || price >= 1.0) {
    return makeError(ErrorKind::InvalidSignal,
                     "market price outside (0, 1)");
  }

  if (signal.edge <= params.min_edge) {
    std::ostringstream msg;
    msg << "edge " << signal.edge << " <= min_edge " << params.min_edge;
    return makeError(ErrorKind::NoEdge, msg.str());
  }
  if (price < params.min_odds) {
    std::ostringstream msg;
    msg << "price " << price << " below min_odds " << params.min_odds;
    return makeError(ErrorKind::NoEdge, msg.str());
  }

  SizingDecision d;
  d.payout_odds = (1.0 - price) / price;
  const double q = 1.0 - p;
  d.full_kelly = (d.payout_odds * p - q) / d.payout_odds;

  if (d.full_kelly <= 0.0) {
    std::ostringstream msg;
    msg << "full Kelly fraction " << d.full_kelly << " <= 0";
    return makeError(ErrorKind::NoEdge, msg.str());
  }

  if (!(available_capital > 0.0)) {
    return makeError(ErrorKind::InsufficientCapital, "no available capital");
  }

  const double capital = available_capital;
  const double cap = params.max_trade_exposure * capital;

  d.fraction = params.kelly_fraction * d.full_kelly;
  const double raw = d.fraction * capital;
  d.stake = std::clamp(raw, 0.0, cap);
  d.capped = raw > cap;

  if (d.stake <= 0.0 || d.stake < params.min_stake) {
    std::ostringstream msg;
    msg << "stake " << d.stake << " below minimum " << params.min_stake;
    return makeError(ErrorKind::NoEdge, msg.str());
  }

  return d;
}

}  // namespace paper
