#pragma once

#include <cstdint>
#include <string>

namespace paper {
namespace domain {

// -----------------------------------------------------------------------------
// Side - which contract of a binary market a signal or position refers to
// -----------------------------------------------------------------------------
enum class Side {
  Yes,
  No,
};

// -----------------------------------------------------------------------------
// ConfidenceTier - coarse quality grade attached to a forecast
// -----------------------------------------------------------------------------
enum class ConfidenceTier {
  Low,
  Medium,
  High,
};

// -----------------------------------------------------------------------------
// Signal - externally produced trade intent for one market
// -----------------------------------------------------------------------------
//
// @brief  Immutable record handed to the engine by the forecasting layer.
//
// @details
// All prices and probabilities are expressed from the perspective of the
// chosen side:
//
//   probability   model probability that `side` wins, in [0, 1]
//   market_price  current price of the `side` contract, in (0, 1). This is
//                 the market-implied probability; the payout per unit
//                 staked is b = (1 - market_price) / market_price.
//   edge          externally computed advantage (normally probability -
//                 market_price). Gates the minimum-edge check.
//
// horizon_ms is the time left until the market resolves, measured from
// timestamp_ms. liquidity is a depth proxy in currency units; 0 means
// "unknown" and the slippage model falls back to its configured floor.
//
// Thread model:
//   Plain value type. Copied into worker tasks; never shared mutably.
// -----------------------------------------------------------------------------
struct Signal {
  std::string market_id;
  Side side{Side::Yes};
  double probability{0.0};
  double market_price{0.0};
  double edge{0.0};
  ConfidenceTier confidence{ConfidenceTier::Medium};
  std::int64_t timestamp_ms{0};
  std::int64_t horizon_ms{0};
  double liquidity{0.0};
};

// -----------------------------------------------------------------------------
// MarketUpdate - latest observable price of a market
// -----------------------------------------------------------------------------
// yes_price is always the YES contract price; the NO contract trades at
// 1 - yes_price.
// -----------------------------------------------------------------------------
struct MarketUpdate {
  std::string market_id;
  double yes_price{0.0};
  double liquidity{0.0};
  std::int64_t timestamp_ms{0};
};

// -----------------------------------------------------------------------------
// MarketResolution - final outcome of a market
// -----------------------------------------------------------------------------
struct MarketResolution {
  std::string market_id;
  Side outcome{Side::Yes};
  std::int64_t timestamp_ms{0};
};

// Price of the `side` contract given the YES price.
inline double sidePrice(Side side, double yes_price) {
  return side == Side::Yes ? yes_price : 1.0 - yes_price;
}

// Inverse of sidePrice(): YES price given the price of the `side` contract.
inline double yesPrice(Side side, double side_price) {
  return side == Side::Yes ? side_price : 1.0 - side_price;
}

inline const char* sideToString(Side side) {
  switch (side) {
    case Side::Yes: return "YES";
    case Side::No:  return "NO";
  }
  return "UNKNOWN";
}

inline const char* confidenceToString(ConfidenceTier tier) {
  switch (tier) {
    case ConfidenceTier::Low:    return "LOW";
    case ConfidenceTier::Medium: return "MEDIUM";
    case ConfidenceTier::High:   return "HIGH";
  }
  return "UNKNOWN";
}

// Parsers return false on unrecognised input and leave `out` untouched.
bool parseSide(const std::string& text, Side& out);
bool parseConfidence(const std::string& text, ConfidenceTier& out);

}  // namespace domain
}  // namespace paper
