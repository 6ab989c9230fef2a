#include "paper/pricing/slippage_model.hpp"

#include <algorithm>

namespace paper {

SlippageParams SlippageParams::from(const EngineConfig& config) {
  SlippageParams p;
  p.base_rate = config.slippage_base_rate;
  p.impact = config.slippage_impact;
  p.liquidity_floor = config.slippage_liquidity_floor;
  p.min_rate = config.slippage_min_rate;
  p.max_rate = config.slippage_max_rate;
  return p;
}

double SlippageModel::rate(double stake, double liquidity,
                           const SlippageParams& params) {
  const double depth = std::max({liquidity, params.liquidity_floor, 1e-9});
  const double raw =
      params.base_rate + params.impact * std::max(stake, 0.0) / depth;
  return std::clamp(raw, params.min_rate, params.max_rate);
}

Fill SlippageModel::quote(double reference_price, double stake,
                          double liquidity, FillDirection direction,
                          const SlippageParams& params) {
  Fill fill;
  fill.reference = reference_price;
  fill.rate = rate(stake, liquidity, params);

  const double adjusted = direction == FillDirection::Buy
                              ? reference_price * (1.0 + fill.rate)
                              : reference_price * (1.0 - fill.rate);
  fill.price = std::clamp(adjusted, kMinPrice, kMaxPrice);
  return fill;
}

}  // namespace paper
