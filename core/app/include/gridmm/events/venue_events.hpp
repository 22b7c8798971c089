#pragma once

#include "gridmm/domain/errors.hpp"
#include "gridmm/domain/order.hpp"
#include "gridmm/events/event_types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace gridmm {

// -----------------------------------------------------------------------------
// VenueOrderReport
// -----------------------------------------------------------------------------
//
// @brief  The venue's view of one order, as carried by stream events, status
//         query results and account snapshots.
//
// @details
// filled_quantity is cumulative. fill_price is the price of the most recent
// fill (0 when the event carries no fill); average_fill_price is the venue's
// running average where it reports one. sequence is venue-assigned and may
// be 0 when the venue has no sequence numbers.
// -----------------------------------------------------------------------------
struct VenueOrderReport {
  std::string venue_order_id;
  std::optional<domain::IntentId> client_intent_id;
  domain::Side side{domain::Side::Bid};
  domain::OrderType type{domain::OrderType::Limit};
  double price{0.0};
  double quantity{0.0};
  domain::OrderStatus status{domain::OrderStatus::Open};
  double filled_quantity{0.0};
  double fill_price{0.0};
  std::int64_t timestamp_ms{0};
  std::uint64_t sequence{0};
};

// -----------------------------------------------------------------------------
// VenueOrderEvent
// -----------------------------------------------------------------------------
// Responsibility: One order-lifecycle update pushed by the adapter's stream.
// Enters the reconcile loop through the adapter's event sink.
// -----------------------------------------------------------------------------
struct VenueOrderEvent {
  VenueOrderReport report;
  Timestamp timestamp{};
};

// -----------------------------------------------------------------------------
// PlaceResultEvent / CancelResultEvent / StatusQueryResultEvent
// -----------------------------------------------------------------------------
// Published by the ExecutionGateway on the reconcile loop once an adapter
// call has finished (after retries). error == None means success.
// -----------------------------------------------------------------------------
struct PlaceResultEvent {
  domain::IntentId intent_id{};
  domain::VenueError error{domain::VenueError::None};
  std::optional<std::string> venue_order_id;
  std::string message;
  std::int64_t completed_at_ms{0};
};

struct CancelResultEvent {
  domain::IntentId intent_id{};
  domain::VenueError error{domain::VenueError::None};
  std::string message;
};

struct StatusQueryResultEvent {
  domain::IntentId intent_id{};
  domain::VenueError error{domain::VenueError::None};
  std::optional<VenueOrderReport> report;
  std::string message;
};

// -----------------------------------------------------------------------------
// AccountSnapshotEvent
// -----------------------------------------------------------------------------
// Ground-truth account state fetched by the gateway. On error the other
// fields are empty and the engine skips the cycle.
// -----------------------------------------------------------------------------
struct AccountSnapshotEvent {
  domain::VenueError error{domain::VenueError::None};
  std::string symbol;
  double net_position{0.0};
  std::vector<VenueOrderReport> open_orders;
  std::int64_t requested_at_ms{0};
  std::string message;
};

}  // namespace gridmm
