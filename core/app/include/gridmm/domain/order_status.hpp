#pragma once

namespace gridmm {
namespace domain {

// -----------------------------------------------------------------------------
// OrderStatus — order lifecycle state machine
// -----------------------------------------------------------------------------
//
// @brief  Enumerates every state an order can occupy while the OrderLedger
//         tracks it.
//
// @details
// Legal transitions (enforced by OrderLedger::transitionStatus):
//
//   Intended ──> Submitted ──> Open ──> PartiallyFilled ──> Filled
//      │            │            │            │
//      │            │            │            └──> Cancelled
//      │            │            └──> Filled, Cancelled, Rejected
//      │            └──> PartiallyFilled, Filled, Cancelled, Rejected, Failed
//      └──> Rejected, Failed
//
// Submitted may jump straight to a fill state because the venue's fill event
// can overtake the placement acknowledgment on the wire.
//
// Terminal states: Filled, Cancelled, Rejected, Failed. Failed is only
// entered after a status query confirms the venue never saw the order.
// -----------------------------------------------------------------------------
enum class OrderStatus {
  Intended,         // Recorded locally, not yet handed to the routing thread
  Submitted,        // Sent to the venue, awaiting acknowledgment
  Open,             // Acknowledged and resting
  PartiallyFilled,  // Some quantity filled, remainder still resting
  Filled,           // Fully filled (terminal)
  Cancelled,        // Cancelled at the venue (terminal)
  Rejected,         // Rejected by venue validation (terminal)
  Failed,           // Unknown to the venue after retries/queries (terminal)
};

inline bool isTerminal(OrderStatus status) {
  return status == OrderStatus::Filled ||
         status == OrderStatus::Cancelled ||
         status == OrderStatus::Rejected ||
         status == OrderStatus::Failed;
}

// Working orders occupy a grid level and count as "open" for reconciliation.
inline bool isWorking(OrderStatus status) {
  return status == OrderStatus::Submitted ||
         status == OrderStatus::Open ||
         status == OrderStatus::PartiallyFilled;
}

inline const char* toString(OrderStatus s) {
  switch (s) {
    case OrderStatus::Intended:        return "Intended";
    case OrderStatus::Submitted:       return "Submitted";
    case OrderStatus::Open:            return "Open";
    case OrderStatus::PartiallyFilled: return "PartiallyFilled";
    case OrderStatus::Filled:          return "Filled";
    case OrderStatus::Cancelled:       return "Cancelled";
    case OrderStatus::Rejected:        return "Rejected";
    case OrderStatus::Failed:          return "Failed";
  }
  return "Unknown";
}

}  // namespace domain
}  // namespace gridmm
