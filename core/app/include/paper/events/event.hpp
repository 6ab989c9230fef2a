#pragma once

#include "paper/events/capital_update_event.hpp"
#include "paper/events/position_update_event.hpp"
#include "paper/events/risk_alert_event.hpp"
#include "paper/events/signal_rejected_event.hpp"

#include <variant>

namespace paper {

// -----------------------------------------------------------------------------
// Event (type alias)
// -----------------------------------------------------------------------------
// The single envelope carried by EventBus. Telemetry only: nothing in the
// engine's decision path listens to the bus, so a slow subscriber can delay
// a publisher but never change an outcome.
//
// Adding a type means adding it here and to IpcServer::formatTelemetry().
// -----------------------------------------------------------------------------
using Event = std::variant<
    PositionUpdateEvent,
    CapitalUpdateEvent,
    RiskAlertEvent,
    SignalRejectedEvent>;

}  // namespace paper
