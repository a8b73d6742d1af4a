#pragma once

#include "whalecopy/events/event_types.hpp"
#include "whalecopy/events/execution_events.hpp"
#include "whalecopy/events/order_update_event.hpp"
#include "whalecopy/events/position_update_event.hpp"
#include "whalecopy/events/risk_alert_event.hpp"

#include <functional>
#include <variant>

namespace whalecopy {

// -----------------------------------------------------------------------------
// Event (type alias)
// -----------------------------------------------------------------------------
// The single envelope type carried by every EventBus and EventLoopThread
// queue. Dispatch with std::visit or std::get_if.
// -----------------------------------------------------------------------------
using Event = std::variant<
    WhaleTradeEvent,
    PriceUpdateEvent,
    WhaleProfileEvent,
    MarketInfoEvent,
    HeartbeatEvent,
    SignalRejectedEvent,
    CopyOrderEvent,
    ExitSignalEvent,
    OrderUpdateEvent,
    PositionUpdateEvent,
    RiskAlertEvent>;

// Callback through which components emit events without owning a bus.
using EventSink = std::function<void(Event)>;

}  // namespace whalecopy
