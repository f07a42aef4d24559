#pragma once

#include "dca/events/event_types.hpp"

#include <variant>

namespace dca {

// -----------------------------------------------------------------------------
// Event — closed set of everything the EventBus can carry
// -----------------------------------------------------------------------------
// Adding an event type means adding it here and teaching the IpcServer's
// telemetry formatter about it.
// -----------------------------------------------------------------------------
using Event = std::variant<
    OrderCreatedEvent,
    SwapExecutedEvent,
    OrderCompletedEvent,
    OrderCancelledEvent,
    RefundDeferredEvent,
    ExecutionRejectedEvent>;

}  // namespace dca
