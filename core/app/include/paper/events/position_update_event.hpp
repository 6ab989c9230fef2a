#pragma once

#include "paper/domain/position.hpp"

#include <cstdint>
#include <string>

namespace paper {

// -----------------------------------------------------------------------------
// PositionUpdateEvent
// -----------------------------------------------------------------------------
//
// @brief  Snapshot of a Position right after a committed lifecycle step
//         (opened, averaged down, closing started, closed, evaluated).
//
// @details
// Published by the Simulator after the step is journaled. The position is
// a full copy, so the event stays valid whatever happens to the store
// afterwards. `change` names the step in the journal's vocabulary
// ("OPENED", "CLOSED", ...).
//
// Thread model:
//   Published on whichever thread committed the step (a worker or the
//   sweep thread). Plain data, safe to copy across threads.
// -----------------------------------------------------------------------------
struct PositionUpdateEvent {
  domain::Position position;
  std::string change;
  std::int64_t timestamp_ms{0};
};

}  // namespace paper
