#pragma once

#include "tradeguard/events/core_events.hpp"
#include "tradeguard/events/venue_events.hpp"

#include <variant>

namespace tradeguard {

// -----------------------------------------------------------------------------
// Event (type alias)
// -----------------------------------------------------------------------------
// Responsibility: The single envelope carried by the core's event queue and
// EventBus. Venue stream events come in through the bounded queue; core
// events (order updates, kill switch) are published on the same bus so
// telemetry sees one ordered stream.
//
// std::variant keeps events as values: no heap allocation per event, and
// std::get_if/std::visit dispatch is checked by the compiler.
// -----------------------------------------------------------------------------
using Event = std::variant<
    AcknowledgedEvent,
    FillEvent,
    CancelledEvent,
    RejectedEvent,
    ExpiredEvent,
    ConnectionUpEvent,
    ConnectionDownEvent,
    VenueErrorEvent,
    HeartbeatEvent,
    OrderUpdateEvent,
    KillSwitchEvent>;

}  // namespace tradeguard
