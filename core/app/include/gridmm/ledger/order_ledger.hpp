#pragma once

#include "gridmm/concurrent/intent_id_generator.hpp"
#include "gridmm/domain/order.hpp"
#include "gridmm/domain/position.hpp"
#include "gridmm/events/venue_events.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace gridmm {

// -----------------------------------------------------------------------------
// LedgerUpdate — what one ledger operation changed
// -----------------------------------------------------------------------------
//
// @brief  Returned by every mutating OrderLedger call so the
//         ReconciliationEngine can decide on follow-ups and telemetry
//         without re-reading the ledger.
//
// @details
// result:
//   Applied    something changed (status, fill, venue id binding).
//   Duplicate  the event repeated what the ledger already knew. No-op.
//   Stale      the event would move the order backward. Discarded.
//   Anomaly    cumulative filled size went down. Logged and ignored.
//   Unknown    no order matched.
//
// fill_delta > 0 means the position moved; closed_quantity and
// realized_profit are the part of that fill that reduced existing exposure.
// order is a copy taken after the change.
// -----------------------------------------------------------------------------
struct LedgerUpdate {
  enum class Result { Applied, Duplicate, Stale, Anomaly, Unknown };

  Result result{Result::Unknown};
  std::optional<domain::Order> order;
  domain::OrderStatus previous_status{domain::OrderStatus::Intended};
  double fill_delta{0.0};
  double fill_price{0.0};
  double closed_quantity{0.0};
  double realized_profit{0.0};
  domain::Position position;

  bool applied() const { return result == Result::Applied; }
  bool statusChanged() const {
    return order && order->status != previous_status;
  }
  bool positionChanged() const { return fill_delta > 0.0; }
};

inline const char* toString(LedgerUpdate::Result r) {
  switch (r) {
    case LedgerUpdate::Result::Applied:   return "Applied";
    case LedgerUpdate::Result::Duplicate: return "Duplicate";
    case LedgerUpdate::Result::Stale:     return "Stale";
    case LedgerUpdate::Result::Anomaly:   return "Anomaly";
    case LedgerUpdate::Result::Unknown:   return "Unknown";
  }
  return "Unknown";
}

// Closed quantity and realized profit produced by one fill.
struct FillEffect {
  double closed_quantity{0.0};
  double realized_profit{0.0};
};

// Read-only summary for the IPC STATUS command.
struct LedgerSnapshot {
  domain::Position position;
  std::size_t working_orders{0};
  std::size_t finished_orders{0};
};

// -----------------------------------------------------------------------------
// OrderLedger — authoritative record of one account's orders and position
// -----------------------------------------------------------------------------
//
// @brief  Owns every order this account has placed, applies venue events to
//         them under the lifecycle state machine, and derives the net
//         position from fills.
//
// @details
// State machine (anything else is refused):
//   Intended        → Submitted, Rejected, Failed
//   Submitted       → Open, PartiallyFilled, Filled, Cancelled, Rejected,
//                     Failed
//   Open            → PartiallyFilled, Filled, Cancelled, Rejected
//   PartiallyFilled → PartiallyFilled, Filled, Cancelled
//
// Venue events are matched by venue order id, falling back to the client
// intent id; a fill that overtakes the place acknowledgment binds the venue
// id on the spot. Idempotence rules for applyVenueReport():
//   - same cumulative filled size and same state: Duplicate, no-op
//   - lower cumulative filled size: Anomaly, logged and ignored
//   - a state that would move backward, or a venue sequence below the last
//     applied one without a higher cumulative: Stale, discarded
//   - a higher cumulative on an order marked by markFillsInPosition():
//     filled size advances, the position does not
//   - a terminal event with a higher cumulative applies the fill first, so
//     a fill racing a cancel is never lost
//
// Terminal orders move to a bounded history (oldest evicted first) so late
// duplicates of finished orders are still recognised.
//
// Thread model:
//   Mutated only on the account's reconcile thread. snapshot() may be called
//   from any thread; a shared_mutex guards the fields it reads.
//
// Ownership:
//   Owned by AccountContext. Holds a reference to the process-wide
//   IntentIdGenerator.
// -----------------------------------------------------------------------------
class OrderLedger {
 public:
  static constexpr std::size_t kDefaultHistoryCapacity = 5000;

  OrderLedger(IntentIdGenerator& ids, std::string symbol,
              std::size_t history_capacity = kDefaultHistoryCapacity);

  OrderLedger(const OrderLedger&) = delete;
  OrderLedger& operator=(const OrderLedger&) = delete;
  OrderLedger(OrderLedger&&) = delete;
  OrderLedger& operator=(OrderLedger&&) = delete;

  // Legal lifecycle transition check.
  static bool canTransition(domain::OrderStatus from, domain::OrderStatus to);

  // Weighted-average position math. Extending averages the entry price,
  // reducing realizes PnL against it, flipping resets it to the fill price.
  static FillEffect applyFill(domain::Position& position, double signed_qty,
                              double fill_price);

  // -------------------------------------------------------------------------
  // Local lifecycle
  // -------------------------------------------------------------------------
  const domain::Order& recordIntent(domain::Side side, domain::OrderType type,
                                    domain::OrderPurpose purpose, double price,
                                    double quantity,
                                    std::optional<int> level_index,
                                    std::uint64_t generation);

  LedgerUpdate markSubmitted(domain::IntentId id, std::int64_t now_ms);

  // Place acknowledged: Submitted → Open and bind the venue id. If a fill
  // already advanced the order, only the binding happens.
  LedgerUpdate acknowledge(domain::IntentId id,
                           const std::string& venue_order_id,
                           std::int64_t now_ms);

  // Local terminal decisions (Rejected, Failed, Cancelled).
  LedgerUpdate finalize(domain::IntentId id, domain::OrderStatus status);

  bool setCancelRequested(domain::IntentId id, bool requested);
  bool setQueryPending(domain::IntentId id, bool pending);

  // -------------------------------------------------------------------------
  // Venue events
  // -------------------------------------------------------------------------
  LedgerUpdate applyVenueReport(const VenueOrderReport& report,
                                std::int64_t now_ms);

  // -------------------------------------------------------------------------
  // Snapshot reconciliation
  // -------------------------------------------------------------------------
  // Forces the net position to the venue's. Realized PnL is kept; the entry
  // price becomes reference_price when the position flips or opens.
  domain::Position correctPosition(double venue_net_quantity,
                                   double reference_price);

  // Sets the entry price of a position whose entry is unknown (adopted at
  // startup). Returns true if it changed anything.
  bool seedEntryPrice(double reference_price);

  // Records a venue order the ledger never knew about.
  const domain::Order& adoptVenueOrder(const VenueOrderReport& report,
                                       std::int64_t now_ms);

  // Raises filled_quantity to the venue's without touching the position
  // (the position was already corrected from the same snapshot).
  LedgerUpdate syncFilledFromSnapshot(domain::IntentId id,
                                      double venue_filled_quantity,
                                      std::int64_t now_ms);

  // The order is missing from a venue snapshot whose position already
  // includes every fill it had. Returns false if the order is not active.
  bool markFillsInPosition(domain::IntentId id);

  // -------------------------------------------------------------------------
  // Queries
  // -------------------------------------------------------------------------
  // Active (non-terminal) order by intent id, or nullptr.
  const domain::Order* findActive(domain::IntentId id) const;

  // Active or finished order by intent id, or nullptr.
  const domain::Order* find(domain::IntentId id) const;

  const domain::Order* findByVenueId(const std::string& venue_order_id) const;

  // Copies of every non-terminal order, oldest intent first.
  std::vector<domain::Order> activeOrders() const;

  // Submitted orders whose acknowledgment is overdue and that have no
  // status query in flight.
  std::vector<domain::IntentId> overdueAcks(std::int64_t now_ms,
                                            std::int64_t ack_deadline_ms) const;

  const domain::Position& position() const { return position_; }
  const std::string& symbol() const { return symbol_; }

  std::size_t activeCount() const { return active_.size(); }
  std::size_t historySize() const { return history_.size(); }

  LedgerSnapshot snapshot() const;

 private:
  domain::Order* mutableActive(domain::IntentId id);
  domain::Order* matchReport(const VenueOrderReport& report);
  void bindVenueId(domain::Order& order, const std::string& venue_order_id);
  void retire(domain::IntentId id);
  LedgerUpdate makeUpdate(LedgerUpdate::Result result,
                          const domain::Order* order,
                          domain::OrderStatus previous) const;

  IntentIdGenerator& ids_;
  std::string symbol_;
  std::size_t history_capacity_;

  mutable std::shared_mutex snapshot_mutex_;  // Guards position_ and counts

  std::unordered_map<domain::IntentId, domain::Order> active_;
  std::unordered_map<domain::IntentId, domain::Order> history_;
  std::deque<domain::IntentId> history_order_;
  std::unordered_map<std::string, domain::IntentId> venue_index_;

  domain::Position position_;
};

}  // namespace gridmm
