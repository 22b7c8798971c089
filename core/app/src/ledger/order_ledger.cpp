#include "gridmm/ledger/order_ledger.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <mutex>
#include <utility>

namespace gridmm {

namespace {

// Quantities closer than this are equal. Well below any realistic lot size.
constexpr double kQuantityEpsilon = 1e-9;

// Progress rank used to detect events that would move an order backward.
// All terminal states share the highest rank.
int progressRank(domain::OrderStatus status) {
  using S = domain::OrderStatus;
  switch (status) {
    case S::Intended:        return 0;
    case S::Submitted:       return 1;
    case S::Open:            return 2;
    case S::PartiallyFilled: return 3;
    case S::Filled:
    case S::Cancelled:
    case S::Rejected:
    case S::Failed:          return 4;
  }
  return 0;
}

}  // namespace

OrderLedger::OrderLedger(IntentIdGenerator& ids, std::string symbol,
                         std::size_t history_capacity)
    : ids_(ids),
      symbol_(std::move(symbol)),
      history_capacity_(history_capacity) {
  position_.symbol = symbol_;
}

// -----------------------------------------------------------------------------
// canTransition(): the lifecycle table
// -----------------------------------------------------------------------------
bool OrderLedger::canTransition(domain::OrderStatus from,
                                domain::OrderStatus to) {
  using S = domain::OrderStatus;

  switch (from) {
    case S::Intended:
      return to == S::Submitted || to == S::Rejected || to == S::Failed;

    case S::Submitted:
      return to == S::Open ||
             to == S::PartiallyFilled ||
             to == S::Filled ||
             to == S::Cancelled ||
             to == S::Rejected ||
             to == S::Failed;

    case S::Open:
      return to == S::PartiallyFilled ||
             to == S::Filled ||
             to == S::Cancelled ||
             to == S::Rejected;

    case S::PartiallyFilled:
      return to == S::PartiallyFilled ||
             to == S::Filled ||
             to == S::Cancelled;

    case S::Filled:
    case S::Cancelled:
    case S::Rejected:
    case S::Failed:
      return false;
  }

  return false;
}

// -----------------------------------------------------------------------------
// applyFill(): weighted-average position update
// -----------------------------------------------------------------------------
// Three cases on a non-flat position:
//   same direction        extend: average entry price is re-weighted
//   opposite, |fill| <= |pos|  reduce: realize PnL on the closed part
//   opposite, |fill| >  |pos|  flip: realize on the whole old position, open
//                              the remainder at the fill price
// -----------------------------------------------------------------------------
FillEffect OrderLedger::applyFill(domain::Position& pos, double signed_fill_qty,
                                  double fill_price) {
  FillEffect effect;
  double current_qty = pos.net_quantity;

  if (std::abs(current_qty) < kQuantityEpsilon) {
    pos.net_quantity = signed_fill_qty;
    pos.average_price = fill_price;
    return effect;
  }

  bool same_direction = (current_qty > 0.0 && signed_fill_qty > 0.0) ||
                        (current_qty < 0.0 && signed_fill_qty < 0.0);

  if (same_direction) {
    double new_total = current_qty + signed_fill_qty;
    pos.average_price =
        (current_qty * pos.average_price + signed_fill_qty * fill_price) /
        new_total;
    pos.net_quantity = new_total;
    return effect;
  }

  double abs_current = std::abs(current_qty);
  double abs_fill = std::abs(signed_fill_qty);
  double direction_sign = current_qty > 0.0 ? 1.0 : -1.0;

  if (abs_fill <= abs_current + kQuantityEpsilon) {
    effect.closed_quantity = std::min(abs_fill, abs_current);
    effect.realized_profit = effect.closed_quantity *
                             (fill_price - pos.average_price) * direction_sign;
    pos.realized_pnl += effect.realized_profit;
    pos.net_quantity = current_qty + signed_fill_qty;
    if (std::abs(pos.net_quantity) < kQuantityEpsilon) {
      pos.net_quantity = 0.0;
      pos.average_price = 0.0;
    }
    return effect;
  }

  effect.closed_quantity = abs_current;
  effect.realized_profit =
      abs_current * (fill_price - pos.average_price) * direction_sign;
  pos.realized_pnl += effect.realized_profit;

  double open_qty = abs_fill - abs_current;
  pos.net_quantity = (signed_fill_qty > 0.0 ? 1.0 : -1.0) * open_qty;
  pos.average_price = fill_price;
  return effect;
}

// -----------------------------------------------------------------------------
// Local lifecycle
// -----------------------------------------------------------------------------
const domain::Order& OrderLedger::recordIntent(
    domain::Side side, domain::OrderType type, domain::OrderPurpose purpose,
    double price, double quantity, std::optional<int> level_index,
    std::uint64_t generation) {
  std::unique_lock lock(snapshot_mutex_);

  domain::Order order;
  order.intent_id = ids_.next_id();
  order.side = side;
  order.type = type;
  order.purpose = purpose;
  order.price = price;
  order.quantity = quantity;
  order.level_index = level_index;
  order.generation = generation;
  order.status = domain::OrderStatus::Intended;

  auto [it, inserted] = active_.emplace(order.intent_id, std::move(order));
  return it->second;
}

LedgerUpdate OrderLedger::markSubmitted(domain::IntentId id,
                                        std::int64_t now_ms) {
  std::unique_lock lock(snapshot_mutex_);

  domain::Order* order = mutableActive(id);
  if (order == nullptr) {
    return makeUpdate(LedgerUpdate::Result::Unknown, nullptr,
                      domain::OrderStatus::Intended);
  }

  domain::OrderStatus previous = order->status;
  if (!canTransition(previous, domain::OrderStatus::Submitted)) {
    return makeUpdate(LedgerUpdate::Result::Stale, order, previous);
  }
  order->status = domain::OrderStatus::Submitted;
  order->submitted_at_ms = now_ms;
  return makeUpdate(LedgerUpdate::Result::Applied, order, previous);
}

LedgerUpdate OrderLedger::acknowledge(domain::IntentId id,
                                      const std::string& venue_order_id,
                                      std::int64_t now_ms) {
  std::unique_lock lock(snapshot_mutex_);

  domain::Order* order = mutableActive(id);
  if (order == nullptr) {
    // Finished before the ack arrived (fill-before-ack, or a fast cancel).
    // Bind the id so late stream events still match.
    auto it = history_.find(id);
    if (it == history_.end()) {
      return makeUpdate(LedgerUpdate::Result::Unknown, nullptr,
                        domain::OrderStatus::Intended);
    }
    domain::Order& done = it->second;
    if (done.venue_order_id || venue_order_id.empty()) {
      return makeUpdate(LedgerUpdate::Result::Duplicate, &done, done.status);
    }
    bindVenueId(done, venue_order_id);
    return makeUpdate(LedgerUpdate::Result::Applied, &done, done.status);
  }

  domain::OrderStatus previous = order->status;
  if (!venue_order_id.empty()) {
    bindVenueId(*order, venue_order_id);
  }
  if (order->acknowledged_at_ms == 0) {
    order->acknowledged_at_ms = now_ms;
  }
  if (previous == domain::OrderStatus::Submitted) {
    order->status = domain::OrderStatus::Open;
  }
  return makeUpdate(LedgerUpdate::Result::Applied, order, previous);
}

LedgerUpdate OrderLedger::finalize(domain::IntentId id,
                                   domain::OrderStatus status) {
  std::unique_lock lock(snapshot_mutex_);

  domain::Order* order = mutableActive(id);
  if (order == nullptr) {
    const domain::Order* done = find(id);
    return makeUpdate(done ? LedgerUpdate::Result::Duplicate
                           : LedgerUpdate::Result::Unknown,
                      done, done ? done->status : domain::OrderStatus::Intended);
  }

  domain::OrderStatus previous = order->status;
  if (!canTransition(previous, status)) {
    std::cerr << "[OrderLedger] WARNING: illegal transition for intent_id="
              << id << " from " << domain::toString(previous) << " to "
              << domain::toString(status) << ". Skipping.\n";
    return makeUpdate(LedgerUpdate::Result::Stale, order, previous);
  }

  order->status = status;
  order->cancel_requested = false;
  order->query_pending = false;

  LedgerUpdate update =
      makeUpdate(LedgerUpdate::Result::Applied, order, previous);
  if (domain::isTerminal(status)) {
    retire(id);
  }
  return update;
}

bool OrderLedger::setCancelRequested(domain::IntentId id, bool requested) {
  std::unique_lock lock(snapshot_mutex_);
  domain::Order* order = mutableActive(id);
  if (order == nullptr) {
    return false;
  }
  order->cancel_requested = requested;
  return true;
}

bool OrderLedger::setQueryPending(domain::IntentId id, bool pending) {
  std::unique_lock lock(snapshot_mutex_);
  domain::Order* order = mutableActive(id);
  if (order == nullptr) {
    return false;
  }
  order->query_pending = pending;
  return true;
}

// -----------------------------------------------------------------------------
// applyVenueReport(): the idempotent, order-tolerant event path
// -----------------------------------------------------------------------------
LedgerUpdate OrderLedger::applyVenueReport(const VenueOrderReport& report,
                                           std::int64_t now_ms) {
  std::unique_lock lock(snapshot_mutex_);

  domain::Order* order = matchReport(report);

  if (order == nullptr) {
    // Late event for a finished order. Only a higher cumulative matters:
    // the fill happened at the venue, so the position must see it even
    // though the order was already finalized locally.
    domain::Order* done = nullptr;
    auto vit = venue_index_.find(report.venue_order_id);
    if (vit != venue_index_.end()) {
      auto hit = history_.find(vit->second);
      done = hit != history_.end() ? &hit->second : nullptr;
    }
    if (done == nullptr && report.client_intent_id) {
      auto hit = history_.find(*report.client_intent_id);
      done = hit != history_.end() ? &hit->second : nullptr;
    }
    if (done == nullptr) {
      return makeUpdate(LedgerUpdate::Result::Unknown, nullptr,
                        domain::OrderStatus::Intended);
    }

    double delta = report.filled_quantity - done->filled_quantity;
    if (delta <= kQuantityEpsilon) {
      return makeUpdate(LedgerUpdate::Result::Duplicate, done, done->status);
    }

    double fill_price = report.fill_price > 0.0 ? report.fill_price
                                                : done->price;
    done->average_fill_price =
        (done->average_fill_price * done->filled_quantity +
         fill_price * delta) / report.filled_quantity;
    done->filled_quantity = report.filled_quantity;

    if (done->fills_in_position) {
      std::cout << "[OrderLedger] Late fill of " << delta
                << " on finished intent_id=" << done->intent_id
                << " already counted by a snapshot.\n";
      return makeUpdate(LedgerUpdate::Result::Applied, done, done->status);
    }

    std::cerr << "[OrderLedger] WARNING: late fill of " << delta
              << " on finished intent_id=" << done->intent_id << " ("
              << domain::toString(done->status)
              << "). Applying to position.\n";

    FillEffect effect =
        applyFill(position_, domain::sign(done->side) * delta, fill_price);

    LedgerUpdate update =
        makeUpdate(LedgerUpdate::Result::Applied, done, done->status);
    update.fill_delta = delta;
    update.fill_price = fill_price;
    update.closed_quantity = effect.closed_quantity;
    update.realized_profit = effect.realized_profit;
    update.position = position_;
    return update;
  }

  const domain::OrderStatus previous = order->status;

  if (report.filled_quantity + kQuantityEpsilon < order->filled_quantity) {
    std::cerr << "[OrderLedger] WARNING: cumulative filled quantity went "
                 "down for intent_id=" << order->intent_id << " (local="
              << order->filled_quantity << ", event="
              << report.filled_quantity << "). Ignoring event.\n";
    return makeUpdate(LedgerUpdate::Result::Anomaly, order, previous);
  }

  double delta = report.filled_quantity - order->filled_quantity;
  if (delta <= kQuantityEpsilon) {
    delta = 0.0;
  }

  if (delta == 0.0) {
    if (report.sequence != 0 && report.sequence < order->last_sequence) {
      return makeUpdate(LedgerUpdate::Result::Stale, order, previous);
    }
    if (report.status != previous &&
        progressRank(report.status) < progressRank(previous)) {
      return makeUpdate(LedgerUpdate::Result::Stale, order, previous);
    }
  }

  // Target state. Cumulative filled size outranks the reported state: a
  // cancel that raced a fill still ends Filled when nothing remains.
  const double new_filled = order->filled_quantity + delta;
  domain::OrderStatus next = previous;
  using S = domain::OrderStatus;
  if (new_filled >= order->quantity - kQuantityEpsilon) {
    next = S::Filled;
  } else {
    switch (report.status) {
      case S::Filled:
        next = S::Filled;
        break;
      case S::Cancelled:
      case S::Rejected:
      case S::Failed:
        next = new_filled > kQuantityEpsilon ? S::Cancelled : report.status;
        break;
      case S::Open:
      case S::PartiallyFilled:
        next = new_filled > kQuantityEpsilon ? S::PartiallyFilled : S::Open;
        break;
      case S::Intended:
      case S::Submitted:
        next = new_filled > kQuantityEpsilon ? S::PartiallyFilled : previous;
        break;
    }
  }

  if (next != previous && !canTransition(previous, next)) {
    if (delta == 0.0) {
      std::cerr << "[OrderLedger] WARNING: discarding event for intent_id="
                << order->intent_id << ": " << domain::toString(previous)
                << " -> " << domain::toString(next) << " is not allowed.\n";
      return makeUpdate(LedgerUpdate::Result::Stale, order, previous);
    }
    next = previous;
  }

  bool bound = false;
  if (!order->venue_order_id && !report.venue_order_id.empty()) {
    bindVenueId(*order, report.venue_order_id);
    bound = true;
  }
  order->last_sequence = std::max(order->last_sequence, report.sequence);

  if (delta == 0.0 && next == previous) {
    return makeUpdate(bound ? LedgerUpdate::Result::Applied
                            : LedgerUpdate::Result::Duplicate,
                      order, previous);
  }

  LedgerUpdate update;
  if (delta > 0.0) {
    double fill_price = report.fill_price > 0.0 ? report.fill_price
                                                : order->price;
    order->average_fill_price =
        (order->average_fill_price * order->filled_quantity +
         fill_price * delta) / new_filled;
    order->filled_quantity = new_filled;

    if (order->fills_in_position) {
      std::cout << "[OrderLedger] Fill of " << delta << " on intent_id="
                << order->intent_id
                << " already counted by a snapshot; position unchanged.\n";
    } else {
      FillEffect effect =
          applyFill(position_, domain::sign(order->side) * delta, fill_price);
      update.fill_delta = delta;
      update.fill_price = fill_price;
      update.closed_quantity = effect.closed_quantity;
      update.realized_profit = effect.realized_profit;
    }
  }

  order->status = next;
  if (order->acknowledged_at_ms == 0 && order->venue_order_id) {
    order->acknowledged_at_ms = now_ms;
  }

  update.result = LedgerUpdate::Result::Applied;
  update.order = *order;
  update.previous_status = previous;
  update.position = position_;

  if (domain::isTerminal(next)) {
    order->cancel_requested = false;
    order->query_pending = false;
    update.order = *order;
    retire(order->intent_id);
  }
  return update;
}

// -----------------------------------------------------------------------------
// Snapshot reconciliation
// -----------------------------------------------------------------------------
domain::Position OrderLedger::correctPosition(double venue_net_quantity,
                                              double reference_price) {
  std::unique_lock lock(snapshot_mutex_);

  const double local = position_.net_quantity;
  position_.net_quantity = venue_net_quantity;

  if (std::abs(venue_net_quantity) < kQuantityEpsilon) {
    position_.net_quantity = 0.0;
    position_.average_price = 0.0;
  } else if (std::abs(local) < kQuantityEpsilon ||
             (local > 0.0) != (venue_net_quantity > 0.0)) {
    // Opened or flipped without fills we saw: no better entry estimate.
    if (reference_price > 0.0) {
      position_.average_price = reference_price;
    }
  }
  return position_;
}

bool OrderLedger::seedEntryPrice(double reference_price) {
  if (reference_price <= 0.0 || position_.average_price > 0.0 ||
      std::abs(position_.net_quantity) < kQuantityEpsilon) {
    return false;
  }
  std::unique_lock lock(snapshot_mutex_);
  position_.average_price = reference_price;
  return true;
}

const domain::Order& OrderLedger::adoptVenueOrder(
    const VenueOrderReport& report, std::int64_t now_ms) {
  std::unique_lock lock(snapshot_mutex_);

  domain::Order order;
  order.intent_id = ids_.next_id();
  order.side = report.side;
  order.type = report.type;
  order.purpose = domain::OrderPurpose::Adopted;
  order.price = report.price;
  order.quantity = report.quantity;
  order.filled_quantity = report.filled_quantity;
  order.average_fill_price =
      report.filled_quantity > 0.0
          ? (report.fill_price > 0.0 ? report.fill_price : report.price)
          : 0.0;
  order.status = report.filled_quantity > kQuantityEpsilon
                     ? domain::OrderStatus::PartiallyFilled
                     : domain::OrderStatus::Open;
  order.submitted_at_ms = now_ms;
  order.acknowledged_at_ms = now_ms;
  order.last_sequence = report.sequence;

  domain::IntentId id = order.intent_id;
  auto [it, inserted] = active_.emplace(id, std::move(order));
  bindVenueId(it->second, report.venue_order_id);
  return it->second;
}

bool OrderLedger::markFillsInPosition(domain::IntentId id) {
  std::unique_lock lock(snapshot_mutex_);
  domain::Order* order = mutableActive(id);
  if (order == nullptr) {
    return false;
  }
  order->fills_in_position = true;
  return true;
}

LedgerUpdate OrderLedger::syncFilledFromSnapshot(domain::IntentId id,
                                                 double venue_filled_quantity,
                                                 std::int64_t now_ms) {
  std::unique_lock lock(snapshot_mutex_);

  domain::Order* order = mutableActive(id);
  if (order == nullptr) {
    return makeUpdate(LedgerUpdate::Result::Unknown, nullptr,
                      domain::OrderStatus::Intended);
  }

  const domain::OrderStatus previous = order->status;
  if (venue_filled_quantity <= order->filled_quantity + kQuantityEpsilon) {
    return makeUpdate(LedgerUpdate::Result::Duplicate, order, previous);
  }

  double delta = venue_filled_quantity - order->filled_quantity;
  order->average_fill_price =
      (order->average_fill_price * order->filled_quantity +
       order->price * delta) / venue_filled_quantity;
  order->filled_quantity = venue_filled_quantity;

  domain::OrderStatus next =
      venue_filled_quantity >= order->quantity - kQuantityEpsilon
          ? domain::OrderStatus::Filled
          : domain::OrderStatus::PartiallyFilled;
  if (next != previous && canTransition(previous, next)) {
    order->status = next;
  }
  if (order->acknowledged_at_ms == 0) {
    order->acknowledged_at_ms = now_ms;
  }

  LedgerUpdate update =
      makeUpdate(LedgerUpdate::Result::Applied, order, previous);
  if (domain::isTerminal(order->status)) {
    retire(id);
  }
  return update;
}

// -----------------------------------------------------------------------------
// Queries
// -----------------------------------------------------------------------------
const domain::Order* OrderLedger::findActive(domain::IntentId id) const {
  auto it = active_.find(id);
  return it != active_.end() ? &it->second : nullptr;
}

const domain::Order* OrderLedger::find(domain::IntentId id) const {
  if (const domain::Order* order = findActive(id)) {
    return order;
  }
  auto it = history_.find(id);
  return it != history_.end() ? &it->second : nullptr;
}

const domain::Order* OrderLedger::findByVenueId(
    const std::string& venue_order_id) const {
  auto it = venue_index_.find(venue_order_id);
  if (it == venue_index_.end()) {
    return nullptr;
  }
  return find(it->second);
}

std::vector<domain::Order> OrderLedger::activeOrders() const {
  std::vector<domain::Order> result;
  result.reserve(active_.size());
  for (const auto& [id, order] : active_) {
    result.push_back(order);
  }
  std::sort(result.begin(), result.end(),
            [](const domain::Order& a, const domain::Order& b) {
              return a.intent_id < b.intent_id;
            });
  return result;
}

std::vector<domain::IntentId> OrderLedger::overdueAcks(
    std::int64_t now_ms, std::int64_t ack_deadline_ms) const {
  std::vector<domain::IntentId> result;
  for (const auto& [id, order] : active_) {
    if (order.status == domain::OrderStatus::Submitted &&
        !order.query_pending &&
        now_ms - order.submitted_at_ms >= ack_deadline_ms) {
      result.push_back(id);
    }
  }
  std::sort(result.begin(), result.end());
  return result;
}

LedgerSnapshot OrderLedger::snapshot() const {
  std::shared_lock lock(snapshot_mutex_);
  LedgerSnapshot snap;
  snap.position = position_;
  snap.working_orders = active_.size();
  snap.finished_orders = history_.size();
  return snap;
}

// -----------------------------------------------------------------------------
// Private helpers (callers hold snapshot_mutex_)
// -----------------------------------------------------------------------------
domain::Order* OrderLedger::mutableActive(domain::IntentId id) {
  auto it = active_.find(id);
  return it != active_.end() ? &it->second : nullptr;
}

domain::Order* OrderLedger::matchReport(const VenueOrderReport& report) {
  if (!report.venue_order_id.empty()) {
    auto it = venue_index_.find(report.venue_order_id);
    if (it != venue_index_.end()) {
      return mutableActive(it->second);
    }
  }
  if (report.client_intent_id) {
    return mutableActive(*report.client_intent_id);
  }
  return nullptr;
}

void OrderLedger::bindVenueId(domain::Order& order,
                              const std::string& venue_order_id) {
  if (order.venue_order_id) {
    if (*order.venue_order_id != venue_order_id) {
      std::cerr << "[OrderLedger] WARNING: intent_id=" << order.intent_id
                << " already bound to venue id " << *order.venue_order_id
                << ", ignoring " << venue_order_id << ".\n";
    }
    return;
  }
  order.venue_order_id = venue_order_id;
  venue_index_[venue_order_id] = order.intent_id;
}

// Moves a terminal order to the bounded history, evicting the oldest.
void OrderLedger::retire(domain::IntentId id) {
  auto it = active_.find(id);
  if (it == active_.end()) {
    return;
  }
  history_[id] = std::move(it->second);
  active_.erase(it);
  history_order_.push_back(id);

  while (history_order_.size() > history_capacity_) {
    domain::IntentId oldest = history_order_.front();
    history_order_.pop_front();
    auto hit = history_.find(oldest);
    if (hit != history_.end()) {
      if (hit->second.venue_order_id) {
        venue_index_.erase(*hit->second.venue_order_id);
      }
      history_.erase(hit);
    }
  }
}

LedgerUpdate OrderLedger::makeUpdate(LedgerUpdate::Result result,
                                     const domain::Order* order,
                                     domain::OrderStatus previous) const {
  LedgerUpdate update;
  update.result = result;
  if (order != nullptr) {
    update.order = *order;
  }
  update.previous_status = previous;
  update.position = position_;
  return update;
}

}  // namespace gridmm
