#pragma once

#include "gridmm/domain/errors.hpp"
#include "gridmm/domain/order.hpp"
#include "gridmm/events/event.hpp"

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace gridmm {

struct PlaceRequest {
  domain::IntentId intent_id{};
  std::string symbol;
  domain::Side side{domain::Side::Bid};
  domain::OrderType type{domain::OrderType::Limit};
  double price{0.0};
  double quantity{0.0};
};

struct PlaceResult {
  domain::VenueError error{domain::VenueError::None};
  std::string venue_order_id;
  std::string message;
};

struct CancelResult {
  domain::VenueError error{domain::VenueError::None};
  std::string message;
};

struct QueryResult {
  domain::VenueError error{domain::VenueError::None};
  std::optional<VenueOrderReport> report;
  std::string message;
};

struct SnapshotResult {
  domain::VenueError error{domain::VenueError::None};
  double net_position{0.0};
  std::vector<VenueOrderReport> open_orders;
  std::string message;
};

// -----------------------------------------------------------------------------
// IExchangeAdapter — the venue, as seen by the agent
// -----------------------------------------------------------------------------
//
// @brief  Four blocking calls plus one asynchronous event stream.
//
// @details
// placeOrder / cancelOrder / queryOrder / getAccountSnapshot block for at
// most deadline_ms and never throw: every failure, including a missed
// deadline (VenueError::Timeout), is returned in the result. A timeout does
// not mean the call failed at the venue.
//
// start(sink) begins delivering VenueOrderEvent and MarketDataEvent to the
// sink from an adapter-owned thread, in the order the venue sent them.
// Reconnection is the adapter's business; gaps are covered by the agent's
// periodic snapshots.
//
// Credentials never cross this interface.
//
// Thread model:
//   The four calls are made only from the account's routing thread. The
//   sink is invoked from the adapter's own thread and must be thread-safe
//   (AccountContext passes a function that pushes into a ThreadSafeQueue).
// -----------------------------------------------------------------------------
class IExchangeAdapter {
 public:
  using EventSink = std::function<void(Event)>;

  virtual ~IExchangeAdapter() = default;

  virtual void start(EventSink sink) = 0;

  virtual void stop() = 0;

  virtual PlaceResult placeOrder(const PlaceRequest& request,
                                 std::int64_t deadline_ms) = 0;

  virtual CancelResult cancelOrder(const std::string& symbol,
                                   const std::string& venue_order_id,
                                   std::int64_t deadline_ms) = 0;

  virtual QueryResult queryOrder(
      const std::string& symbol, domain::IntentId intent_id,
      const std::optional<std::string>& venue_order_id,
      std::int64_t deadline_ms) = 0;

  virtual SnapshotResult getAccountSnapshot(const std::string& symbol,
                                            std::int64_t deadline_ms) = 0;
};

}  // namespace gridmm
