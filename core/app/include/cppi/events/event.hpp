#pragma once

#include "cppi/events/event_types.hpp"

#include <variant>

namespace cppi {

// -----------------------------------------------------------------------------
// Event (type alias)
// -----------------------------------------------------------------------------
// Responsibility: The single envelope for everything that moves between the
// feed, the worker loops, the execution loop, the monitor and the IPC server.
//
// std::variant keeps events as values (copied across thread boundaries, no
// shared mutable state) and makes dispatch exhaustive: adding an alternative
// here forces every std::visit site to handle it.
// -----------------------------------------------------------------------------
using Event = std::variant<
    ValuationTickEvent,
    RebalanceRequestEvent,
    RebalanceInstructionEvent,
    RebalanceResultEvent,
    RebalanceCancelRequestEvent,
    RebalanceCompletedEvent,
    RebalanceCancelledEvent,
    PositionUpdateEvent,
    PositionClosedEvent,
    InvariantViolationEvent,
    DataQualityEvent,
    HealthAlertEvent>;

}  // namespace cppi
