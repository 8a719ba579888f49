#pragma once

#include "sigtrader/events/ingestion_events.hpp"
#include "sigtrader/events/lifecycle_events.hpp"

#include <variant>

namespace sigtrader {

// -----------------------------------------------------------------------------
// Event
// -----------------------------------------------------------------------------
// Closed set of everything that travels through an EventLoopThread or the
// telemetry bus. Subscribers select alternatives with EventBus::subscribe<T>.
// -----------------------------------------------------------------------------
using Event = std::variant<
    MessageEvent,
    NewSignalEvent,
    CommandEvent,
    MonitorActionEvent,
    SignalUpdateEvent,
    RejectionEvent>;

}  // namespace sigtrader
