#pragma once

#include "gridmm/domain/order.hpp"

#include <optional>
#include <string>

namespace gridmm {

// -----------------------------------------------------------------------------
// PlaceOrderCommand
// -----------------------------------------------------------------------------
// Responsibility: Ask the ExecutionGateway to submit one recorded intent.
// Published by the ReconciliationEngine on the reconcile bus and forwarded
// to the account's OrderRoutingThread. The order is a snapshot taken right
// after the ledger recorded it.
// -----------------------------------------------------------------------------
struct PlaceOrderCommand {
  std::string symbol;
  domain::Order order;
};

struct CancelOrderCommand {
  std::string symbol;
  domain::IntentId intent_id{};
  std::string venue_order_id;
};

// venue_order_id is empty when the order was never acknowledged; the venue
// is then asked by client intent id.
struct QueryOrderCommand {
  std::string symbol;
  domain::IntentId intent_id{};
  std::optional<std::string> venue_order_id;
};

}  // namespace gridmm
