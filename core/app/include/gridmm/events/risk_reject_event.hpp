#pragma once

#include "gridmm/domain/errors.hpp"
#include "gridmm/domain/order.hpp"
#include "gridmm/events/event_types.hpp"

#include <string>

namespace gridmm {

// -----------------------------------------------------------------------------
// RiskRejectEvent
// -----------------------------------------------------------------------------
// An order intent dropped by the RiskGuard before it reached the ledger.
// Non-fatal: the next planning cycle may try again.
// -----------------------------------------------------------------------------
struct RiskRejectEvent {
  std::string userid;
  domain::RiskRejectReason reason{domain::RiskRejectReason::None};
  domain::Side side{domain::Side::Bid};
  domain::OrderPurpose purpose{domain::OrderPurpose::Grid};
  double requested_quantity{0.0};
  double price{0.0};
  double position{0.0};
  Timestamp timestamp{};
};

}  // namespace gridmm
