#pragma once

#include "vclock/events/clock_events.hpp"

#include <variant>

namespace vclock {

// -----------------------------------------------------------------------------
// Event (type alias)
// -----------------------------------------------------------------------------
// The one envelope carried by EventBus and by the telemetry queue of
// ClockServer. Subscribers dispatch with std::get_if or std::visit; adding
// an alternative means updating ClockServer::formatTelemetry().
// -----------------------------------------------------------------------------
using Event = std::variant<TickAdvancedEvent, TimestampIssuedEvent,
                           ClockResetEvent>;

}  // namespace vclock
