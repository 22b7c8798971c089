#pragma once

#include "gridmm/domain/order.hpp"
#include "gridmm/domain/order_status.hpp"
#include "gridmm/events/event_types.hpp"

namespace gridmm {

// -----------------------------------------------------------------------------
// OrderUpdateEvent
// -----------------------------------------------------------------------------
//
// @brief  Published by the ReconciliationEngine whenever the ledger changes
//         an order's status or filled quantity.
//
// @details
// The order field is a full copy taken after the change was applied;
// previous_status is the state before it. Subscribers (IPC telemetry, tests)
// observe the lifecycle without touching the ledger.
//
// Thread model:
//   Created on the account's reconcile thread. Plain data; safe to copy
//   across threads inside Event.
// -----------------------------------------------------------------------------
struct OrderUpdateEvent {
  std::string userid;
  domain::Order order;
  domain::OrderStatus previous_status{domain::OrderStatus::Intended};
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

}  // namespace gridmm
