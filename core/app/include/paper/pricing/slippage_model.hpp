#pragma once

#include "paper/config/engine_config.hpp"
#include "paper/domain/signal.hpp"

namespace paper {

enum class FillDirection {
  Buy,   // entering or adding: pay more than the reference price
  Sell,  // exiting: receive less than the reference price
};

struct SlippageParams {
  double base_rate{0.005};
  double impact{0.05};
  double liquidity_floor{100.0};
  double min_rate{0.002};
  double max_rate{0.10};

  static SlippageParams from(const EngineConfig& config);
};

struct Fill {
  double price{0.0};      // simulated execution price
  double rate{0.0};       // applied slippage, fraction of reference price
  double reference{0.0};  // price before slippage
};

// -----------------------------------------------------------------------------
// SlippageModel - conservative simulated fill price
// -----------------------------------------------------------------------------
//
// @brief  Pure function: reference price, stake and a liquidity proxy in,
//         fill price out. Used for opens, averaging down and closes alike,
//         so entry and exit PnL are computed under the same assumptions.
//
// @details
//   rate  = clamp(base_rate + impact * stake / max(liquidity, floor),
//                 min_rate, max_rate)
//   Buy:  price = reference * (1 + rate)
//   Sell: price = reference * (1 - rate)
//
// Fill prices are clamped to [kMinPrice, kMaxPrice], the tradable range
// of a binary contract. The liquidity floor keeps the impact term finite
// when liquidity is unknown (0) or tiny. The rate is non-decreasing in
// stake and non-increasing in liquidity.
//
// settlementPrice() is the resolution exit: 1.0 for the winning side, 0.0
// for the losing side, no slippage.
// -----------------------------------------------------------------------------
class SlippageModel {
 public:
  static constexpr double kMinPrice = 0.01;
  static constexpr double kMaxPrice = 0.99;

  static double rate(double stake, double liquidity,
                     const SlippageParams& params);

  static Fill quote(double reference_price, double stake, double liquidity,
                    FillDirection direction, const SlippageParams& params);

  static double settlementPrice(domain::Side held, domain::Side outcome) {
    return held == outcome ? 1.0 : 0.0;
  }
};

}  // namespace paper
