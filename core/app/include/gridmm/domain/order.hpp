#pragma once

#include "gridmm/domain/order_status.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace gridmm {
namespace domain {

// -----------------------------------------------------------------------------
// IntentId
// -----------------------------------------------------------------------------
// Local identifier assigned by the agent when an order intent is recorded.
// Unique for the lifetime of one agent run (IntentIdGenerator starts at 1;
// 0 means "unset"). Sent to the venue as the client order id so fills that
// overtake the acknowledgment can still be matched.
// -----------------------------------------------------------------------------
using IntentId = std::uint64_t;

// -----------------------------------------------------------------------------
// Side
// -----------------------------------------------------------------------------
// Bid buys, Ask sells. Used for both grid levels and orders.
// -----------------------------------------------------------------------------
enum class Side {
  Bid,
  Ask,
};

inline Side opposite(Side s) { return s == Side::Bid ? Side::Ask : Side::Bid; }

// +1 for a bid (position grows), -1 for an ask.
inline double sign(Side s) { return s == Side::Bid ? 1.0 : -1.0; }

inline const char* toString(Side s) {
  switch (s) {
    case Side::Bid: return "Bid";
    case Side::Ask: return "Ask";
  }
  return "Unknown";
}

enum class OrderType {
  Limit,
  Market,
};

inline const char* toString(OrderType t) {
  return t == OrderType::Limit ? "Limit" : "Market";
}

// -----------------------------------------------------------------------------
// OrderPurpose
// -----------------------------------------------------------------------------
// Why the order exists. Grid and ReArm orders belong to a grid level.
// FixPosition works the whole position back to flat; AutoClose closes one
// fill at market. Neither triggers follow-ups of its own. Adopted orders
// were discovered in a venue snapshot without a local intent.
// -----------------------------------------------------------------------------
enum class OrderPurpose {
  Grid,
  ReArm,
  FixPosition,
  AutoClose,
  Adopted,
};

inline const char* toString(OrderPurpose p) {
  switch (p) {
    case OrderPurpose::Grid:        return "Grid";
    case OrderPurpose::ReArm:       return "ReArm";
    case OrderPurpose::FixPosition: return "FixPosition";
    case OrderPurpose::AutoClose:   return "AutoClose";
    case OrderPurpose::Adopted:     return "Adopted";
  }
  return "Unknown";
}

// -----------------------------------------------------------------------------
// Order
// -----------------------------------------------------------------------------
//
// @brief  Full state of one order placed by this agent: the original intent
//         plus everything the venue has reported about it.
//
// @details
// The authoritative copy lives inside the OrderLedger and is mutated only on
// the account's reconcile thread. Copies carried by OrderUpdateEvent are
// snapshots; recipients must not mutate them.
//
// filled_quantity is cumulative and never decreases while the order is
// alive. last_sequence is the highest venue sequence number applied, used
// to discard stale events delivered out of order.
//
// fills_in_position is set once a position snapshot has been taken after
// the order left the venue book: later fill reports for it only advance
// filled_quantity, the position already holds them.
//
// generation ties grid orders to the plan that created them; a re-centre
// bumps the generation and every older grid order becomes obsolete.
// -----------------------------------------------------------------------------
struct Order {
  IntentId intent_id{};
  std::optional<std::string> venue_order_id;
  Side side{Side::Bid};
  OrderType type{OrderType::Limit};
  OrderPurpose purpose{OrderPurpose::Grid};
  double price{0.0};
  double quantity{0.0};
  double filled_quantity{0.0};
  double average_fill_price{0.0};
  OrderStatus status{OrderStatus::Intended};
  std::optional<int> level_index;
  std::uint64_t generation{0};

  bool cancel_requested{false};  // Cancel sent, venue has not confirmed yet
  bool query_pending{false};     // Status query in flight
  bool fills_in_position{false}; // Position snapshot already counts its fills

  std::int64_t submitted_at_ms{0};
  std::int64_t acknowledged_at_ms{0};
  std::uint64_t last_sequence{0};

  double remaining() const { return quantity - filled_quantity; }
};

}  // namespace domain
}  // namespace gridmm
