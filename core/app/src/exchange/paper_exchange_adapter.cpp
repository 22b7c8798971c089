#include "gridmm/exchange/paper_exchange_adapter.hpp"
#include "gridmm/time/time_utils.hpp"

#include <iostream>
#include <utility>

namespace gridmm {

namespace {

bool isResting(const VenueOrderReport& r) {
  return r.status == domain::OrderStatus::Open ||
         r.status == domain::OrderStatus::PartiallyFilled;
}

bool tradesThrough(const VenueOrderReport& r, double last_price) {
  if (last_price <= 0.0) {
    return false;
  }
  return r.side == domain::Side::Bid ? last_price <= r.price
                                     : last_price >= r.price;
}

}  // namespace

PaperExchangeAdapter::PaperExchangeAdapter(const ITimeProvider& time_provider,
                                           std::string symbol,
                                           double initial_position)
    : time_provider_(time_provider),
      symbol_(std::move(symbol)),
      net_position_(initial_position) {}

void PaperExchangeAdapter::start(EventSink sink) {
  std::lock_guard lock(mutex_);
  sink_ = std::move(sink);
  std::cout << "[PaperExchange] started for " << symbol_ << ".\n";
}

void PaperExchangeAdapter::stop() {
  std::lock_guard lock(mutex_);
  if (sink_) {
    sink_ = nullptr;
    std::cout << "[PaperExchange] stopped.\n";
  }
}

// -----------------------------------------------------------------------------
// placeOrder(): acknowledge, then fill if the order already crosses
// -----------------------------------------------------------------------------
PlaceResult PaperExchangeAdapter::placeOrder(const PlaceRequest& request,
                                             std::int64_t /*deadline_ms*/) {
  PlaceResult result;
  std::vector<Event> out;
  {
    std::lock_guard lock(mutex_);

    if (!knownSymbol(request.symbol)) {
      result.error = domain::VenueError::Rejected;
      result.message = "unknown symbol " + request.symbol;
      return result;
    }
    if (request.quantity <= 0.0 ||
        (request.type == domain::OrderType::Limit && request.price <= 0.0)) {
      result.error = domain::VenueError::Rejected;
      result.message = "invalid price or quantity";
      return result;
    }
    if (request.type == domain::OrderType::Market && last_price_ <= 0.0) {
      result.error = domain::VenueError::Rejected;
      result.message = "no reference price for market order";
      return result;
    }

    VenueOrderReport report;
    report.venue_order_id = "P-" + std::to_string(next_order_number_++);
    report.client_intent_id = request.intent_id;
    report.side = request.side;
    report.type = request.type;
    report.price = request.type == domain::OrderType::Market ? last_price_
                                                             : request.price;
    report.quantity = request.quantity;
    report.status = domain::OrderStatus::Open;

    auto it = orders_.emplace(report.venue_order_id, report).first;
    emitLocked(it->second, out);

    if (request.type == domain::OrderType::Market ||
        tradesThrough(it->second, last_price_)) {
      fillLocked(it->second, last_price_, out);
    }

    result.venue_order_id = it->first;
  }
  deliver(out);
  return result;
}

CancelResult PaperExchangeAdapter::cancelOrder(
    const std::string& /*symbol*/, const std::string& venue_order_id,
    std::int64_t /*deadline_ms*/) {
  CancelResult result;
  std::vector<Event> out;
  {
    std::lock_guard lock(mutex_);
    auto it = orders_.find(venue_order_id);
    if (it == orders_.end()) {
      result.error = domain::VenueError::NotFound;
      result.message = "unknown order " + venue_order_id;
      return result;
    }
    VenueOrderReport& report = it->second;
    if (report.status == domain::OrderStatus::Filled) {
      result.error = domain::VenueError::AlreadyFilled;
      result.message = "order already filled";
      return result;
    }
    if (!isResting(report)) {
      result.error = domain::VenueError::NotFound;
      result.message = "order no longer open";
      return result;
    }
    report.status = domain::OrderStatus::Cancelled;
    emitLocked(report, out);
  }
  deliver(out);
  return result;
}

QueryResult PaperExchangeAdapter::queryOrder(
    const std::string& /*symbol*/, domain::IntentId intent_id,
    const std::optional<std::string>& venue_order_id,
    std::int64_t /*deadline_ms*/) {
  QueryResult result;
  std::lock_guard lock(mutex_);

  if (venue_order_id) {
    auto it = orders_.find(*venue_order_id);
    if (it != orders_.end()) {
      result.report = it->second;
      return result;
    }
  }
  for (const auto& [id, report] : orders_) {
    if (report.client_intent_id && *report.client_intent_id == intent_id) {
      result.report = report;
      return result;
    }
  }
  result.error = domain::VenueError::NotFound;
  result.message = "no order for intent " + std::to_string(intent_id);
  return result;
}

SnapshotResult PaperExchangeAdapter::getAccountSnapshot(
    const std::string& symbol, std::int64_t /*deadline_ms*/) {
  SnapshotResult result;
  std::lock_guard lock(mutex_);
  if (!knownSymbol(symbol)) {
    result.error = domain::VenueError::NotFound;
    result.message = "unknown symbol " + symbol;
    return result;
  }
  result.net_position = net_position_;
  for (const auto& [id, report] : orders_) {
    if (isResting(report)) {
      result.open_orders.push_back(report);
    }
  }
  return result;
}

// -----------------------------------------------------------------------------
// onMarketData(): forward the tick, then fill what it traded through
// -----------------------------------------------------------------------------
void PaperExchangeAdapter::onMarketData(const MarketDataEvent& event) {
  if (event.symbol != symbol_ || event.price <= 0.0) {
    return;
  }

  std::vector<Event> out;
  {
    std::lock_guard lock(mutex_);
    last_price_ = event.price;
    out.emplace_back(event);
    for (auto& [id, report] : orders_) {
      if (isResting(report) && tradesThrough(report, last_price_)) {
        fillLocked(report, report.price, out);
      }
    }
  }
  deliver(out);
}

double PaperExchangeAdapter::lastPrice() const {
  std::lock_guard lock(mutex_);
  return last_price_;
}

double PaperExchangeAdapter::netPosition() const {
  std::lock_guard lock(mutex_);
  return net_position_;
}

std::size_t PaperExchangeAdapter::restingCount() const {
  std::lock_guard lock(mutex_);
  std::size_t n = 0;
  for (const auto& [id, report] : orders_) {
    if (isResting(report)) {
      ++n;
    }
  }
  return n;
}

void PaperExchangeAdapter::fillLocked(VenueOrderReport& report, double price,
                                      std::vector<Event>& out) {
  const double delta = report.quantity - report.filled_quantity;
  if (delta <= 0.0) {
    return;
  }
  report.filled_quantity = report.quantity;
  report.fill_price = price;
  report.status = domain::OrderStatus::Filled;
  net_position_ += domain::sign(report.side) * delta;
  emitLocked(report, out);
}

void PaperExchangeAdapter::emitLocked(VenueOrderReport& report,
                                      std::vector<Event>& out) {
  report.timestamp_ms = time_provider_.now_ms();
  report.sequence = next_sequence_++;

  VenueOrderEvent event;
  event.report = report;
  event.timestamp = ms_to_timestamp(report.timestamp_ms);
  out.emplace_back(std::move(event));
}

void PaperExchangeAdapter::deliver(std::vector<Event>& events) {
  EventSink sink;
  {
    std::lock_guard lock(mutex_);
    sink = sink_;
  }
  if (!sink) {
    return;
  }
  for (auto& event : events) {
    sink(std::move(event));
  }
}

}  // namespace gridmm
