#include "gridmm/execution/execution_gateway.hpp"

#include <thread>
#include <utility>

namespace gridmm {

// -----------------------------------------------------------------------------
// Constructor: subscribe to commands on the routing bus
// -----------------------------------------------------------------------------
ExecutionGateway::ExecutionGateway(EventBus& bus, IExchangeAdapter& adapter,
                                   const ITimeProvider& time_provider,
                                   std::string symbol, RetryPolicy retry,
                                   std::int64_t call_deadline_ms,
                                   Sleeper sleeper)
    : bus_(bus),
      adapter_(adapter),
      time_provider_(time_provider),
      symbol_(std::move(symbol)),
      retry_(retry),
      call_deadline_ms_(call_deadline_ms),
      sleeper_(std::move(sleeper)) {
  if (!sleeper_) {
    sleeper_ = [](std::chrono::milliseconds d) {
      std::this_thread::sleep_for(d);
    };
  }

  place_sub_id_ = bus_.subscribe<PlaceOrderCommand>(
      [this](const PlaceOrderCommand& c) { onPlace(c); });
  cancel_sub_id_ = bus_.subscribe<CancelOrderCommand>(
      [this](const CancelOrderCommand& c) { onCancel(c); });
  query_sub_id_ = bus_.subscribe<QueryOrderCommand>(
      [this](const QueryOrderCommand& c) { onQuery(c); });
  snapshot_sub_id_ = bus_.subscribe<SnapshotRequestEvent>(
      [this](const SnapshotRequestEvent& r) { onSnapshotRequest(r); });
}

// -----------------------------------------------------------------------------
// Destructor: unsubscribe
// -----------------------------------------------------------------------------
ExecutionGateway::~ExecutionGateway() {
  bus_.unsubscribe(place_sub_id_);
  bus_.unsubscribe(cancel_sub_id_);
  bus_.unsubscribe(query_sub_id_);
  bus_.unsubscribe(snapshot_sub_id_);
}

SnapshotResult ExecutionGateway::fetchSnapshot() {
  return withRetry("snapshot", [this] {
    return adapter_.getAccountSnapshot(symbol_, call_deadline_ms_);
  });
}

// -----------------------------------------------------------------------------
// onPlace(): placeOrder with retry → PlaceResultEvent
// -----------------------------------------------------------------------------
void ExecutionGateway::onPlace(const PlaceOrderCommand& cmd) {
  PlaceRequest request;
  request.intent_id = cmd.order.intent_id;
  request.symbol = cmd.symbol;
  request.side = cmd.order.side;
  request.type = cmd.order.type;
  request.price = cmd.order.price;
  request.quantity = cmd.order.quantity;

  PlaceResult result = withRetry("place", [&] {
    return adapter_.placeOrder(request, call_deadline_ms_);
  });

  PlaceResultEvent event;
  event.intent_id = request.intent_id;
  event.error = result.error;
  if (result.error == domain::VenueError::None) {
    event.venue_order_id = std::move(result.venue_order_id);
  } else {
    std::cerr << "[ExecutionGateway] place of intent " << request.intent_id
              << " ended with " << domain::toString(result.error) << ": "
              << result.message << "\n";
  }
  event.message = std::move(result.message);
  event.completed_at_ms = time_provider_.now_ms();

  bus_.publish(event);
}

// -----------------------------------------------------------------------------
// onCancel(): cancelOrder with retry → CancelResultEvent
// -----------------------------------------------------------------------------
void ExecutionGateway::onCancel(const CancelOrderCommand& cmd) {
  CancelResult result = withRetry("cancel", [&] {
    return adapter_.cancelOrder(cmd.symbol, cmd.venue_order_id,
                                call_deadline_ms_);
  });

  CancelResultEvent event;
  event.intent_id = cmd.intent_id;
  event.error = result.error;
  event.message = std::move(result.message);

  bus_.publish(event);
}

// -----------------------------------------------------------------------------
// onQuery(): queryOrder with retry → StatusQueryResultEvent
// -----------------------------------------------------------------------------
void ExecutionGateway::onQuery(const QueryOrderCommand& cmd) {
  QueryResult result = withRetry("query", [&] {
    return adapter_.queryOrder(cmd.symbol, cmd.intent_id, cmd.venue_order_id,
                               call_deadline_ms_);
  });

  StatusQueryResultEvent event;
  event.intent_id = cmd.intent_id;
  event.error = result.error;
  event.report = std::move(result.report);
  event.message = std::move(result.message);

  bus_.publish(event);
}

// -----------------------------------------------------------------------------
// onSnapshotRequest(): getAccountSnapshot with retry → AccountSnapshotEvent
// -----------------------------------------------------------------------------
void ExecutionGateway::onSnapshotRequest(const SnapshotRequestEvent& req) {
  SnapshotResult result = fetchSnapshot();

  AccountSnapshotEvent event;
  event.error = result.error;
  event.symbol = symbol_;
  event.net_position = result.net_position;
  event.open_orders = std::move(result.open_orders);
  event.requested_at_ms = req.requested_at_ms;
  event.message = std::move(result.message);

  if (event.error != domain::VenueError::None) {
    std::cerr << "[ExecutionGateway] WARNING: snapshot failed with "
              << domain::toString(event.error) << ": " << event.message
              << "\n";
  }

  bus_.publish(event);
}

}  // namespace gridmm
