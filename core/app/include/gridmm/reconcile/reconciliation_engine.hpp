#pragma once

#include "gridmm/eventbus/event_bus.hpp"
#include "gridmm/grid/grid_planner.hpp"
#include "gridmm/ledger/order_ledger.hpp"
#include "gridmm/risk/risk_guard.hpp"
#include "gridmm/time/i_time_provider.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace gridmm {

// -----------------------------------------------------------------------------
// ReconciliationEngine — the single writer of one account's ledger
// -----------------------------------------------------------------------------
//
// @brief  Consumes the account's event stream, drives the OrderLedger, keeps
//         the working orders in line with the planned grid, and issues the
//         follow-up orders that fills call for.
//
// @details
// Subscribes on the account's reconcile bus to:
//   MarketDataEvent        update the reference; first price or a move past
//                          the re-centre threshold starts a new generation
//   VenueOrderEvent        apply through the ledger's idempotence rules
//   PlaceResultEvent       ack → Open; Rejected → Rejected; transport
//                          trouble or timeout → status query
//   CancelResultEvent      AlreadyFilled/NotFound → status query; transport
//                          failure → clear cancel_requested and retry later
//   StatusQueryResultEvent apply the report; NotFound → Failed if never
//                          acknowledged, else Cancelled plus a divergence
//   AccountSnapshotEvent   correct position, query missing orders, adopt
//                          unknown ones, sync filled sizes
//   ClockTickEvent         ack deadlines, interval profit emission
//   AccountCommandEvent    pause / resume
//
// and publishes on the same bus:
//   PlaceOrderCommand, CancelOrderCommand, QueryOrderCommand (forwarded to
//   the routing thread by AccountContext), OrderUpdateEvent,
//   PositionUpdateEvent, ProfitRealizedEvent, RiskRejectEvent,
//   DivergenceEvent, HeartbeatEvent.
//
// Grid diff (run after every event that can change the picture):
//   - paused: cancel every working order, place nothing
//   - grid orders of an older generation are cancelled
//   - several working orders on one level: keep the oldest, cancel the rest
//   - every planned level with no working order gets a placement
//   - fix-order mode: at most one working FixPosition order, sized to the
//     whole position and on the side that flattens it. Priced from entry
//     or reference, whichever favours the agent, plus fix_order_offset.
//     Cancelled when flat, cancelled and replaced when the position it was
//     sized for changes.
//
// Fill follow-ups, from the ledger's LedgerUpdate:
//   - Grid/ReArm order reaches Filled → one opposite-side ReArm at the same
//     level and price (not in auto-close mode, not for stale generations)
//   - auto-close mode → AutoClose market order for the fill delta
//   - FixPosition/AutoClose fills never trigger follow-ups
// Every placement, follow-ups included, is risk-checked against the
// projected exposure on its side: the position plus the remaining size of
// every working same-side order, including the ones placed just before it
// and the ones with a cancel in flight.
//
// Thread model:
//   All handlers run on the account's reconcile EventLoopThread. No locks.
//
// Ownership:
//   Owned by AccountContext, which also owns the bus, ledger, planner and
//   guard referenced here; they outlive the engine.
// -----------------------------------------------------------------------------
class ReconciliationEngine {
 public:
  ReconciliationEngine(EventBus& bus, const ITimeProvider& clock,
                       std::string userid, OrderLedger& ledger,
                       const GridPlanner& planner, const RiskGuard& guard);

  ~ReconciliationEngine();

  ReconciliationEngine(const ReconciliationEngine&) = delete;
  ReconciliationEngine& operator=(const ReconciliationEngine&) = delete;
  ReconciliationEngine(ReconciliationEngine&&) = delete;
  ReconciliationEngine& operator=(ReconciliationEngine&&) = delete;

  void onMarketData(const MarketDataEvent& event);
  void onVenueOrder(const VenueOrderEvent& event);
  void onPlaceResult(const PlaceResultEvent& event);
  void onCancelResult(const CancelResultEvent& event);
  void onStatusQueryResult(const StatusQueryResultEvent& event);
  void onSnapshot(const AccountSnapshotEvent& event);
  void onClockTick(const ClockTickEvent& event);
  void onAccountCommand(const AccountCommandEvent& event);

  std::uint64_t generation() const { return generation_; }
  double referencePrice() const { return reference_price_; }
  double anchorPrice() const { return anchor_price_; }
  bool isPaused() const { return paused_; }
  const std::vector<domain::GridLevel>& plannedLevels() const {
    return planned_levels_;
  }

 private:
  bool replan(double reference_price);
  void reconcileGrid();
  void reconcileOnce();

  std::optional<domain::Order> placeIntent(
      domain::Side side, domain::OrderType type, domain::OrderPurpose purpose,
      double quantity, double price, std::optional<int> level_index,
      std::uint64_t generation, double risk_position);
  void requestCancel(const domain::Order& order);
  void requestQuery(domain::IntentId id,
                    const std::optional<std::string>& venue_order_id);

  void handleUpdate(const LedgerUpdate& update);
  void emitPolicyFollowUp(const LedgerUpdate& update);
  void maybeReArm(const domain::Order& order);
  void syncFixOrder(const std::vector<domain::Order>& active,
                    double& bid_exposure, double& ask_exposure);
  double projectedExposure(domain::Side side) const;
  void recordRealized(const LedgerUpdate& update);

  void publishOrderUpdate(const LedgerUpdate& update);
  void publishPositionUpdate(const domain::Position& position);
  void publishDivergence(DivergenceEvent::Kind kind, domain::IntentId id,
                         const std::string& venue_order_id, double local_value,
                         double venue_value);
  void publishHealth(const std::string& status, const std::string& detail);

  Timestamp now() const;

  EventBus& bus_;
  const ITimeProvider& clock_;
  std::string userid_;
  OrderLedger& ledger_;
  const GridPlanner& planner_;
  const RiskGuard& guard_;
  const GridConfig& config_;
  const domain::InstrumentSpec& instrument_;

  double reference_price_{0.0};
  double anchor_price_{0.0};
  std::uint64_t generation_{0};
  std::vector<domain::GridLevel> planned_levels_;

  // Working fix order and the position size it was placed for; the venue
  // may hold less if risk clipped it.
  domain::IntentId fix_intent_{0};
  double fix_target_quantity_{0.0};
  bool paused_{false};
  bool in_reconcile_{false};
  bool reconcile_again_{false};

  double period_profit_{0.0};
  double period_closed_quantity_{0.0};
  std::int64_t period_started_ms_{0};

  std::uint64_t sequence_{0};

  std::vector<EventBus::SubscriptionId> subscriptions_;
};

}  // namespace gridmm
