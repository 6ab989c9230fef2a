#pragma once

#include "paper/domain/result.hpp"
#include "paper/domain/signal.hpp"

#include <string>
#include <variant>

namespace paper {

// Anything the intake socket may carry.
using InboundMessage =
    std::variant<domain::Signal, domain::MarketUpdate,
                 domain::MarketResolution>;

// -----------------------------------------------------------------------------
// MessageCodec - JSON wire format of the intake socket
// -----------------------------------------------------------------------------
//
// @brief  Decodes one intake payload into a Signal, a MarketUpdate or a
//         MarketResolution, selected by the "type" field.
//
// @details
//   {"type":"signal","market_id":"m1","side":"YES","probability":0.55,
//    "market_price":0.30,"edge":0.12,"confidence":"HIGH",
//    "timestamp_ms":1700000000000,"horizon_ms":86400000,"liquidity":5000}
//   {"type":"market","market_id":"m1","yes_price":0.31,"liquidity":5000,
//    "timestamp_ms":1700000000000}
//   {"type":"resolution","market_id":"m1","outcome":"NO",
//    "timestamp_ms":1700000000000}
//
// "confidence", "horizon_ms", "liquidity" and "timestamp_ms" are optional.
// Malformed JSON, missing or mistyped required fields and unknown enum
// text all yield InvalidSignal. Range checks on prices and probabilities
// are left to the Simulator so in-process and socket intake share them.
//
// Stateless.
// -----------------------------------------------------------------------------
class MessageCodec {
 public:
  static Result<InboundMessage> decode(const std::string& payload);

  // Market id of any inbound message.
  static const std::string& marketOf(const InboundMessage& message);
};

}  // namespace paper
