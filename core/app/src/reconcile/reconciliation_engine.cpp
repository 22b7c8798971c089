#include "gridmm/reconcile/reconciliation_engine.hpp"
#include "gridmm/domain/errors.hpp"
#include "gridmm/time/time_utils.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <map>
#include <unordered_set>
#include <utility>

namespace gridmm {

namespace {

constexpr double kQuantityEpsilon = 1e-9;

bool isGridPurpose(domain::OrderPurpose purpose) {
  return purpose == domain::OrderPurpose::Grid ||
         purpose == domain::OrderPurpose::ReArm;
}

}  // namespace

ReconciliationEngine::ReconciliationEngine(EventBus& bus,
                                           const ITimeProvider& clock,
                                           std::string userid,
                                           OrderLedger& ledger,
                                           const GridPlanner& planner,
                                           const RiskGuard& guard)
    : bus_(bus),
      clock_(clock),
      userid_(std::move(userid)),
      ledger_(ledger),
      planner_(planner),
      guard_(guard),
      config_(planner.config()),
      instrument_(planner.instrument()) {
  subscriptions_.push_back(bus_.subscribe<MarketDataEvent>(
      [this](const MarketDataEvent& e) { onMarketData(e); }));
  subscriptions_.push_back(bus_.subscribe<VenueOrderEvent>(
      [this](const VenueOrderEvent& e) { onVenueOrder(e); }));
  subscriptions_.push_back(bus_.subscribe<PlaceResultEvent>(
      [this](const PlaceResultEvent& e) { onPlaceResult(e); }));
  subscriptions_.push_back(bus_.subscribe<CancelResultEvent>(
      [this](const CancelResultEvent& e) { onCancelResult(e); }));
  subscriptions_.push_back(bus_.subscribe<StatusQueryResultEvent>(
      [this](const StatusQueryResultEvent& e) { onStatusQueryResult(e); }));
  subscriptions_.push_back(bus_.subscribe<AccountSnapshotEvent>(
      [this](const AccountSnapshotEvent& e) { onSnapshot(e); }));
  subscriptions_.push_back(bus_.subscribe<ClockTickEvent>(
      [this](const ClockTickEvent& e) { onClockTick(e); }));
  subscriptions_.push_back(bus_.subscribe<AccountCommandEvent>(
      [this](const AccountCommandEvent& e) { onAccountCommand(e); }));
}

ReconciliationEngine::~ReconciliationEngine() {
  for (auto id : subscriptions_) {
    bus_.unsubscribe(id);
  }
}

// -----------------------------------------------------------------------------
// onMarketData(): track the reference; re-plan on first price or re-centre
// -----------------------------------------------------------------------------
void ReconciliationEngine::onMarketData(const MarketDataEvent& event) {
  if (!event.symbol.empty() && event.symbol != instrument_.symbol) {
    return;
  }
  if (!(event.price > 0.0)) {
    std::cerr << "[ReconciliationEngine] WARNING: " << userid_
              << " ignoring non-positive price " << event.price << ".\n";
    return;
  }

  reference_price_ = event.price;
  if (ledger_.seedEntryPrice(event.price)) {
    publishPositionUpdate(ledger_.position());
  }

  if (generation_ == 0 || planner_.needsRecenter(anchor_price_, event.price)) {
    if (!replan(event.price)) {
      return;
    }
  }
  reconcileGrid();
}

void ReconciliationEngine::onVenueOrder(const VenueOrderEvent& event) {
  LedgerUpdate update =
      ledger_.applyVenueReport(event.report, clock_.now_ms());

  switch (update.result) {
    case LedgerUpdate::Result::Applied:
      handleUpdate(update);
      reconcileGrid();
      break;
    case LedgerUpdate::Result::Unknown:
      std::cerr << "[ReconciliationEngine] WARNING: " << userid_
                << " event for unknown venue order "
                << event.report.venue_order_id
                << ". Left for the next snapshot.\n";
      break;
    case LedgerUpdate::Result::Duplicate:
    case LedgerUpdate::Result::Stale:
    case LedgerUpdate::Result::Anomaly:
      break;
  }
}

// -----------------------------------------------------------------------------
// onPlaceResult(): the call may have succeeded even when it reports failure,
// so anything other than a clean ack or reject is settled by a status query.
// -----------------------------------------------------------------------------
void ReconciliationEngine::onPlaceResult(const PlaceResultEvent& event) {
  using domain::VenueError;

  switch (event.error) {
    case VenueError::None: {
      if (!event.venue_order_id || event.venue_order_id->empty()) {
        std::cerr << "[ReconciliationEngine] WARNING: " << userid_
                  << " ack without venue id for intent_id=" << event.intent_id
                  << ". Querying.\n";
        requestQuery(event.intent_id, std::nullopt);
        return;
      }
      LedgerUpdate update = ledger_.acknowledge(
          event.intent_id, *event.venue_order_id, clock_.now_ms());
      if (update.applied()) {
        publishOrderUpdate(update);
        reconcileGrid();
      }
      return;
    }

    case VenueError::Rejected: {
      std::cerr << "[ReconciliationEngine] " << userid_ << " intent_id="
                << event.intent_id << " rejected by venue: " << event.message
                << "\n";
      LedgerUpdate update =
          ledger_.finalize(event.intent_id, domain::OrderStatus::Rejected);
      if (update.applied()) {
        publishOrderUpdate(update);
      }
      return;
    }

    case VenueError::TransportFailure:
    case VenueError::RateLimited:
    case VenueError::Timeout:
    case VenueError::AlreadyFilled:
    case VenueError::NotFound:
      std::cerr << "[ReconciliationEngine] WARNING: " << userid_
                << " place of intent_id=" << event.intent_id << " ended with "
                << domain::toString(event.error) << ". Querying status.\n";
      requestQuery(event.intent_id, event.venue_order_id);
      return;
  }
}

void ReconciliationEngine::onCancelResult(const CancelResultEvent& event) {
  using domain::VenueError;

  switch (event.error) {
    case VenueError::None:
      // Wait for the venue's Cancelled (or a racing fill) on the stream.
      return;

    case VenueError::AlreadyFilled:
    case VenueError::NotFound:
      requestQuery(event.intent_id, std::nullopt);
      return;

    case VenueError::Rejected:
    case VenueError::TransportFailure:
    case VenueError::RateLimited:
    case VenueError::Timeout:
      std::cerr << "[ReconciliationEngine] WARNING: " << userid_
                << " cancel of intent_id=" << event.intent_id << " ended with "
                << domain::toString(event.error) << ". Will retry.\n";
      ledger_.setCancelRequested(event.intent_id, false);
      return;
  }
}

void ReconciliationEngine::onStatusQueryResult(
    const StatusQueryResultEvent& event) {
  ledger_.setQueryPending(event.intent_id, false);

  if (event.error == domain::VenueError::None && event.report) {
    VenueOrderReport report = *event.report;
    if (!report.client_intent_id) {
      report.client_intent_id = event.intent_id;
    }
    LedgerUpdate update = ledger_.applyVenueReport(report, clock_.now_ms());
    if (update.applied()) {
      handleUpdate(update);
      reconcileGrid();
    }
    return;
  }

  if (event.error == domain::VenueError::NotFound) {
    const domain::Order* order = ledger_.findActive(event.intent_id);
    if (order == nullptr) {
      return;
    }
    const bool never_acknowledged =
        !order->venue_order_id && order->acknowledged_at_ms == 0;
    const std::string venue_id = order->venue_order_id.value_or("");

    LedgerUpdate update = ledger_.finalize(
        event.intent_id, never_acknowledged ? domain::OrderStatus::Failed
                                            : domain::OrderStatus::Cancelled);
    if (!update.applied()) {
      return;
    }
    publishOrderUpdate(update);
    if (!never_acknowledged) {
      publishDivergence(DivergenceEvent::Kind::VanishedAfterAck,
                        event.intent_id, venue_id, 0.0, 0.0);
    }
    reconcileGrid();
    return;
  }

  std::cerr << "[ReconciliationEngine] WARNING: " << userid_
            << " status query for intent_id=" << event.intent_id
            << " failed: " << domain::toString(event.error) << " "
            << event.message << ". Will retry.\n";
}

// -----------------------------------------------------------------------------
// onSnapshot(): venue truth wins
// -----------------------------------------------------------------------------
void ReconciliationEngine::onSnapshot(const AccountSnapshotEvent& event) {
  if (event.error != domain::VenueError::None) {
    std::cerr << "[ReconciliationEngine] WARNING: " << userid_
              << " snapshot failed: " << domain::toString(event.error) << " "
              << event.message << ". Skipping cycle.\n";
    publishHealth("degraded", "snapshot failed");
    return;
  }
  if (!event.symbol.empty() && event.symbol != instrument_.symbol) {
    return;
  }

  const std::int64_t now_ms = clock_.now_ms();

  const double local = ledger_.position().net_quantity;
  if (std::abs(local - event.net_position) >
      config_.position_tolerance + kQuantityEpsilon) {
    domain::Position corrected =
        ledger_.correctPosition(event.net_position, reference_price_);
    publishDivergence(DivergenceEvent::Kind::PositionMismatch, 0, "", local,
                      event.net_position);
    publishPositionUpdate(corrected);
  }

  std::unordered_set<std::string> venue_ids;
  for (const auto& report : event.open_orders) {
    venue_ids.insert(report.venue_order_id);
  }

  // Orders acknowledged after the snapshot was requested may legitimately
  // be missing from it. One that was on the book before and is gone now
  // finished at the venue, and the snapshot position holds its fills.
  for (const auto& order : ledger_.activeOrders()) {
    if (!order.venue_order_id || !domain::isWorking(order.status) ||
        order.acknowledged_at_ms == 0 ||
        order.acknowledged_at_ms > event.requested_at_ms ||
        venue_ids.count(*order.venue_order_id) != 0) {
      continue;
    }
    ledger_.markFillsInPosition(order.intent_id);
    if (order.query_pending) {
      continue;
    }
    publishDivergence(DivergenceEvent::Kind::MissingAtVenue, order.intent_id,
                      *order.venue_order_id, order.remaining(), 0.0);
    requestQuery(order.intent_id, order.venue_order_id);
  }

  for (const auto& report : event.open_orders) {
    const domain::Order* known = nullptr;
    if (!report.venue_order_id.empty()) {
      known = ledger_.findByVenueId(report.venue_order_id);
    }
    if (known == nullptr && report.client_intent_id) {
      known = ledger_.find(*report.client_intent_id);
    }
    const domain::Order* active =
        known ? ledger_.findActive(known->intent_id) : nullptr;

    if (active == nullptr) {
      const domain::Order& adopted = ledger_.adoptVenueOrder(report, now_ms);
      std::cerr << "[ReconciliationEngine] WARNING: " << userid_
                << " adopted unknown venue order " << report.venue_order_id
                << " as intent_id=" << adopted.intent_id << ".\n";
      LedgerUpdate update;
      update.result = LedgerUpdate::Result::Applied;
      update.order = adopted;
      update.previous_status = domain::OrderStatus::Intended;
      update.position = ledger_.position();
      publishDivergence(DivergenceEvent::Kind::UnknownAtVenue,
                        adopted.intent_id, report.venue_order_id, 0.0,
                        report.quantity);
      publishOrderUpdate(update);
      continue;
    }

    const domain::IntentId id = active->intent_id;
    const double local_filled = active->filled_quantity;

    if (!active->venue_order_id && !report.venue_order_id.empty()) {
      LedgerUpdate update =
          ledger_.acknowledge(id, report.venue_order_id, now_ms);
      if (update.applied()) {
        publishOrderUpdate(update);
      }
    }

    if (report.filled_quantity > local_filled + kQuantityEpsilon) {
      LedgerUpdate update =
          ledger_.syncFilledFromSnapshot(id, report.filled_quantity, now_ms);
      if (update.applied()) {
        publishDivergence(DivergenceEvent::Kind::FilledMismatch, id,
                          report.venue_order_id, local_filled,
                          report.filled_quantity);
        publishOrderUpdate(update);
        if (update.order->status == domain::OrderStatus::Filled) {
          maybeReArm(*update.order);
        }
      }
    }
  }

  reconcileGrid();
}

// -----------------------------------------------------------------------------
// onClockTick(): ack deadlines, interval profit, retry the diff
// -----------------------------------------------------------------------------
void ReconciliationEngine::onClockTick(const ClockTickEvent& event) {
  for (domain::IntentId id :
       ledger_.overdueAcks(event.now_ms, config_.ack_deadline_ms)) {
    std::cerr << "[ReconciliationEngine] WARNING: " << userid_
              << " no ack for intent_id=" << id << " within "
              << config_.ack_deadline_ms << " ms. Querying status.\n";
    requestQuery(id, std::nullopt);
  }

  if (config_.profit_log_interval_ms > 0) {
    if (period_started_ms_ == 0) {
      period_started_ms_ = event.now_ms;
    } else if (event.now_ms - period_started_ms_ >=
               config_.profit_log_interval_ms) {
      if (period_closed_quantity_ > 0.0) {
        ProfitRealizedEvent profit;
        profit.userid = userid_;
        profit.entry.price = reference_price_;
        profit.entry.position = ledger_.position().net_quantity;
        profit.entry.period_profit = period_profit_;
        profit.entry.created_at_ms = event.now_ms;
        profit.closed_quantity = period_closed_quantity_;
        profit.timestamp = ms_to_timestamp(event.now_ms);
        bus_.publish(profit);
      }
      period_profit_ = 0.0;
      period_closed_quantity_ = 0.0;
      period_started_ms_ = event.now_ms;
    }
  }

  reconcileGrid();
}

void ReconciliationEngine::onAccountCommand(const AccountCommandEvent& event) {
  if (event.command == AccountCommandEvent::Command::Pause) {
    if (paused_) {
      return;
    }
    paused_ = true;
    std::cout << "[ReconciliationEngine] " << userid_
              << " paused. Cancelling working orders.\n";
    reconcileGrid();
    return;
  }

  if (!paused_) {
    return;
  }
  paused_ = false;
  std::cout << "[ReconciliationEngine] " << userid_ << " resumed.\n";
  if (reference_price_ > 0.0 && !replan(reference_price_)) {
    return;
  }
  reconcileGrid();
}

// -----------------------------------------------------------------------------
// replan(): new generation around reference_price
// -----------------------------------------------------------------------------
// A reference at which the plan is invalid (spacing below one tick) is not
// fatal at runtime: the old plan stays and the account reports degraded.
// -----------------------------------------------------------------------------
bool ReconciliationEngine::replan(double reference_price) {
  std::vector<domain::GridLevel> levels;
  try {
    levels = planner_.plan(reference_price);
  } catch (const ConfigurationError& e) {
    std::cerr << "[ReconciliationEngine] WARNING: " << userid_
              << " cannot plan at " << reference_price << ": " << e.what()
              << "\n";
    publishHealth("degraded", e.what());
    return false;
  }

  planned_levels_ = std::move(levels);
  anchor_price_ = reference_price;
  ++generation_;

  std::cout << "[ReconciliationEngine] " << userid_ << " generation "
            << generation_ << " planned " << planned_levels_.size()
            << " level(s) around " << reference_price << ".\n";
  return true;
}

// -----------------------------------------------------------------------------
// reconcileGrid(): diff the plan against working orders
// -----------------------------------------------------------------------------
void ReconciliationEngine::reconcileGrid() {
  if (generation_ == 0) {
    return;
  }
  // A handler reached from inside the diff (synchronous bus) defers to the
  // outer pass instead of diffing against a half-updated picture.
  if (in_reconcile_) {
    reconcile_again_ = true;
    return;
  }
  in_reconcile_ = true;
  do {
    reconcile_again_ = false;
    reconcileOnce();
  } while (reconcile_again_);
  in_reconcile_ = false;
}

void ReconciliationEngine::reconcileOnce() {
  const std::vector<domain::Order> active = ledger_.activeOrders();

  if (paused_) {
    for (const auto& order : active) {
      requestCancel(order);
    }
    return;
  }

  double bid_exposure = ledger_.position().net_quantity;
  double ask_exposure = ledger_.position().net_quantity;
  std::map<int, std::vector<const domain::Order*>> by_level;

  // An order with a cancel in flight can still fill, so it stays in the
  // exposure until the venue confirms the cancel.
  for (const auto& order : active) {
    if (order.side == domain::Side::Bid) {
      bid_exposure += order.remaining();
    } else {
      ask_exposure -= order.remaining();
    }
    if (order.cancel_requested) {
      continue;
    }

    if (!order.level_index || !isGridPurpose(order.purpose)) {
      continue;
    }
    if (order.generation != generation_) {
      requestCancel(order);
      continue;
    }
    by_level[*order.level_index].push_back(&order);
  }

  // activeOrders() is sorted by intent id, so front() is the oldest.
  for (auto& [level, orders] : by_level) {
    for (std::size_t i = 1; i < orders.size(); ++i) {
      std::cerr << "[ReconciliationEngine] WARNING: " << userid_
                << " duplicate order intent_id=" << orders[i]->intent_id
                << " on level " << level << ". Cancelling.\n";
      requestCancel(*orders[i]);
    }
  }

  for (const auto& level : planned_levels_) {
    if (by_level.count(level.level_index) != 0) {
      continue;
    }
    double& exposure =
        level.side == domain::Side::Bid ? bid_exposure : ask_exposure;
    std::optional<domain::Order> placed =
        placeIntent(level.side, domain::OrderType::Limit,
                    domain::OrderPurpose::Grid, level.quantity, level.price,
                    level.level_index, generation_, exposure);
    if (placed) {
      exposure += domain::sign(level.side) * placed->quantity;
    }
  }

  if (config_.fix_order_enabled) {
    syncFixOrder(active, bid_exposure, ask_exposure);
  }
}

// -----------------------------------------------------------------------------
// syncFixOrder(): one working order that brings the position back to flat
// -----------------------------------------------------------------------------
// A fix order is kept while it still covers the position it was sized for
// (its own partial fills shrink both sides equally). Any other change
// cancels it; the replacement goes out once the venue confirms the cancel,
// so two fix orders never work at once.
// -----------------------------------------------------------------------------
void ReconciliationEngine::syncFixOrder(
    const std::vector<domain::Order>& active, double& bid_exposure,
    double& ask_exposure) {
  const domain::Position& position = ledger_.position();
  const double wanted =
      instrument_.quantityDown(std::abs(position.net_quantity));
  const domain::Side side =
      position.net_quantity > 0.0 ? domain::Side::Ask : domain::Side::Bid;

  bool working = false;
  for (const auto& order : active) {
    if (order.purpose != domain::OrderPurpose::FixPosition) {
      continue;
    }
    if (order.cancel_requested) {
      working = true;
      continue;
    }
    const double covers = order.intent_id == fix_intent_
                              ? fix_target_quantity_ - order.filled_quantity
                              : order.remaining();
    if (!working && wanted > kQuantityEpsilon && order.side == side &&
        std::abs(covers - wanted) < kQuantityEpsilon) {
      working = true;
      continue;
    }
    std::cout << "[ReconciliationEngine] " << userid_
              << " fix order intent_id=" << order.intent_id << " covers "
              << covers << ", position needs " << wanted
              << ". Cancelling.\n";
    requestCancel(order);
    working = true;
  }
  if (working || wanted <= kQuantityEpsilon) {
    return;
  }

  double entry = position.average_price > 0.0 ? position.average_price
                                                : reference_price_;
  double mark = reference_price_ > 0.0 ? reference_price_ : entry;
  if (!(entry > 0.0)) {
    return;
  }

  // Never close below entry when long or above it when short.
  double price =
      side == domain::Side::Ask
          ? instrument_.priceUp(std::max(entry, mark) *
                                (1.0 + config_.fix_order_offset))
          : instrument_.priceDown(std::min(entry, mark) *
                                  (1.0 - config_.fix_order_offset));

  double& exposure = side == domain::Side::Bid ? bid_exposure : ask_exposure;
  std::optional<domain::Order> placed =
      placeIntent(side, domain::OrderType::Limit,
                  domain::OrderPurpose::FixPosition, wanted, price,
                  std::nullopt, generation_, exposure);
  if (placed) {
    fix_intent_ = placed->intent_id;
    fix_target_quantity_ = wanted;
    exposure += domain::sign(side) * placed->quantity;
  }
}

// -----------------------------------------------------------------------------
// projectedExposure(): position once every working order on one side fills
// -----------------------------------------------------------------------------
double ReconciliationEngine::projectedExposure(domain::Side side) const {
  double exposure = ledger_.position().net_quantity;
  for (const auto& order : ledger_.activeOrders()) {
    if (order.side == side) {
      exposure += domain::sign(side) * order.remaining();
    }
  }
  return exposure;
}

// -----------------------------------------------------------------------------
// placeIntent(): risk check → record → Submitted → PlaceOrderCommand
// -----------------------------------------------------------------------------
std::optional<domain::Order> ReconciliationEngine::placeIntent(
    domain::Side side, domain::OrderType type, domain::OrderPurpose purpose,
    double quantity, double price, std::optional<int> level_index,
    std::uint64_t generation, double risk_position) {
  RiskDecision decision = guard_.evaluate(risk_position, side, quantity, price);

  if (!decision.accepted()) {
    std::cerr << "[ReconciliationEngine] " << userid_ << " "
              << domain::toString(purpose) << " "
              << domain::toString(side) << " " << quantity << " @ " << price
              << " dropped: " << domain::toString(decision.reason) << "\n";
    RiskRejectEvent reject;
    reject.userid = userid_;
    reject.reason = decision.reason;
    reject.side = side;
    reject.purpose = purpose;
    reject.requested_quantity = quantity;
    reject.price = price;
    reject.position = ledger_.position().net_quantity;
    reject.timestamp = now();
    bus_.publish(reject);
    return std::nullopt;
  }

  const domain::Order& recorded =
      ledger_.recordIntent(side, type, purpose, decision.price,
                           decision.quantity, level_index, generation);
  const domain::IntentId id = recorded.intent_id;

  LedgerUpdate update = ledger_.markSubmitted(id, clock_.now_ms());
  if (!update.applied() || !update.order) {
    return std::nullopt;
  }
  publishOrderUpdate(update);

  PlaceOrderCommand command;
  command.symbol = instrument_.symbol;
  command.order = *update.order;
  bus_.publish(command);
  return update.order;
}

void ReconciliationEngine::requestCancel(const domain::Order& order) {
  if (order.cancel_requested || !order.venue_order_id ||
      !domain::isWorking(order.status)) {
    return;
  }
  ledger_.setCancelRequested(order.intent_id, true);

  CancelOrderCommand command;
  command.symbol = instrument_.symbol;
  command.intent_id = order.intent_id;
  command.venue_order_id = *order.venue_order_id;
  bus_.publish(command);
}

void ReconciliationEngine::requestQuery(
    domain::IntentId id, const std::optional<std::string>& venue_order_id) {
  const domain::Order* order = ledger_.findActive(id);
  if (order == nullptr || order->query_pending) {
    return;
  }
  ledger_.setQueryPending(id, true);

  QueryOrderCommand command;
  command.symbol = instrument_.symbol;
  command.intent_id = id;
  command.venue_order_id =
      venue_order_id ? venue_order_id : order->venue_order_id;
  bus_.publish(command);
}

// -----------------------------------------------------------------------------
// handleUpdate(): telemetry and follow-ups for an applied ledger change
// -----------------------------------------------------------------------------
void ReconciliationEngine::handleUpdate(const LedgerUpdate& update) {
  if (!update.applied() || !update.order) {
    return;
  }
  publishOrderUpdate(update);

  if (update.positionChanged()) {
    publishPositionUpdate(update.position);
    if (update.closed_quantity > 0.0) {
      recordRealized(update);
    }
    emitPolicyFollowUp(update);
  }

  if (update.order->status == domain::OrderStatus::Filled &&
      update.previous_status != domain::OrderStatus::Filled) {
    maybeReArm(*update.order);
  }
}

void ReconciliationEngine::emitPolicyFollowUp(const LedgerUpdate& update) {
  const domain::Order& order = *update.order;
  if (order.purpose == domain::OrderPurpose::FixPosition ||
      order.purpose == domain::OrderPurpose::AutoClose || paused_) {
    return;
  }

  if (config_.auto_close_enabled) {
    const domain::Side counter = domain::opposite(order.side);
    placeIntent(counter, domain::OrderType::Market,
                domain::OrderPurpose::AutoClose, update.fill_delta,
                update.fill_price, std::nullopt, generation_,
                projectedExposure(counter));
  }
}

void ReconciliationEngine::maybeReArm(const domain::Order& order) {
  if (config_.auto_close_enabled || paused_ || !order.level_index ||
      !isGridPurpose(order.purpose)) {
    return;
  }
  if (order.generation != generation_) {
    // The level belongs to an abandoned plan; the diff places the new one.
    return;
  }
  const domain::Side side = domain::opposite(order.side);
  placeIntent(side, domain::OrderType::Limit, domain::OrderPurpose::ReArm,
              order.filled_quantity, order.price, order.level_index,
              order.generation, projectedExposure(side));
}

void ReconciliationEngine::recordRealized(const LedgerUpdate& update) {
  if (config_.profit_log_interval_ms > 0) {
    period_profit_ += update.realized_profit;
    period_closed_quantity_ += update.closed_quantity;
    return;
  }

  const std::int64_t now_ms = clock_.now_ms();
  ProfitRealizedEvent profit;
  profit.userid = userid_;
  profit.entry.price =
      reference_price_ > 0.0 ? reference_price_ : update.fill_price;
  profit.entry.position = update.position.net_quantity;
  profit.entry.period_profit = update.realized_profit;
  profit.entry.created_at_ms = now_ms;
  profit.closed_quantity = update.closed_quantity;
  profit.timestamp = ms_to_timestamp(now_ms);
  bus_.publish(profit);
}

// -----------------------------------------------------------------------------
// Telemetry
// -----------------------------------------------------------------------------
void ReconciliationEngine::publishOrderUpdate(const LedgerUpdate& update) {
  if (!update.order) {
    return;
  }
  OrderUpdateEvent event;
  event.userid = userid_;
  event.order = *update.order;
  event.previous_status = update.previous_status;
  event.timestamp = now();
  event.sequence_id = ++sequence_;
  bus_.publish(event);
}

void ReconciliationEngine::publishPositionUpdate(
    const domain::Position& position) {
  PositionUpdateEvent event;
  event.userid = userid_;
  event.position = position;
  event.timestamp = now();
  event.sequence_id = ++sequence_;
  bus_.publish(event);
}

void ReconciliationEngine::publishDivergence(DivergenceEvent::Kind kind,
                                             domain::IntentId id,
                                             const std::string& venue_order_id,
                                             double local_value,
                                             double venue_value) {
  std::cerr << "[ReconciliationEngine] DIVERGENCE " << userid_ << " "
            << toString(kind) << " intent_id=" << id << " venue_id="
            << venue_order_id << " local=" << local_value
            << " venue=" << venue_value << "\n";

  DivergenceEvent event;
  event.userid = userid_;
  event.kind = kind;
  event.intent_id = id;
  event.venue_order_id = venue_order_id;
  event.local_value = local_value;
  event.venue_value = venue_value;
  event.timestamp = now();
  bus_.publish(event);
}

void ReconciliationEngine::publishHealth(const std::string& status,
                                         const std::string& detail) {
  HeartbeatEvent event;
  event.component_id = "reconcile:" + userid_;
  event.status = status;
  event.detail = detail;
  event.timestamp = now();
  event.sequence_id = ++sequence_;
  bus_.publish(event);
}

Timestamp ReconciliationEngine::now() const {
  return ms_to_timestamp(clock_.now_ms());
}

}  // namespace gridmm
