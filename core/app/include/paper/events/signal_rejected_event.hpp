#pragma once

#include "paper/domain/error.hpp"
#include "paper/domain/signal.hpp"

#include <cstdint>
#include <string>

namespace paper {

// A signal the engine refused, with the reason. Rejections never mutate
// state, so this is informational only.
struct SignalRejectedEvent {
  std::string market_id;
  domain::Side side{domain::Side::Yes};
  ErrorKind kind{ErrorKind::InvalidSignal};
  std::string message;
  std::int64_t timestamp_ms{0};
};

}  // namespace paper
