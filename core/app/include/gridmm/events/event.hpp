#pragma once

#include "gridmm/events/command_events.hpp"
#include "gridmm/events/divergence_event.hpp"
#include "gridmm/events/event_types.hpp"
#include "gridmm/events/order_update_event.hpp"
#include "gridmm/events/position_update_event.hpp"
#include "gridmm/events/profit_realized_event.hpp"
#include "gridmm/events/risk_reject_event.hpp"
#include "gridmm/events/venue_events.hpp"

#include <variant>

namespace gridmm {

// -----------------------------------------------------------------------------
// Event (type alias)
// -----------------------------------------------------------------------------
// Responsibility: The single envelope for everything that crosses a thread
// boundary or travels on an EventBus.
//
// Inbound to the reconcile loop:
//   MarketDataEvent, VenueOrderEvent, Place/Cancel/StatusQueryResultEvent,
//   AccountSnapshotEvent, ClockTickEvent, SnapshotRequestEvent (forwarded to
//   the gateway), AccountCommandEvent.
// Outbound commands (reconcile loop → routing thread):
//   PlaceOrderCommand, CancelOrderCommand, QueryOrderCommand,
//   SnapshotRequestEvent.
// Telemetry (→ recorder, IPC):
//   OrderUpdateEvent, PositionUpdateEvent, ProfitRealizedEvent,
//   RiskRejectEvent, DivergenceEvent, HeartbeatEvent.
//
// std::variant keeps the set closed: adding a type forces every std::visit
// site to handle it.
// -----------------------------------------------------------------------------
using Event = std::variant<
    MarketDataEvent,
    ClockTickEvent,
    SnapshotRequestEvent,
    AccountCommandEvent,
    HeartbeatEvent,
    PlaceOrderCommand,
    CancelOrderCommand,
    QueryOrderCommand,
    VenueOrderEvent,
    PlaceResultEvent,
    CancelResultEvent,
    StatusQueryResultEvent,
    AccountSnapshotEvent,
    OrderUpdateEvent,
    PositionUpdateEvent,
    ProfitRealizedEvent,
    RiskRejectEvent,
    DivergenceEvent>;

}  // namespace gridmm
