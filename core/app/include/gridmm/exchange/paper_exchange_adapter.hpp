#pragma once

#include "gridmm/exchange/i_exchange_adapter.hpp"
#include "gridmm/time/i_time_provider.hpp"

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace gridmm {

// -----------------------------------------------------------------------------
// PaperExchangeAdapter — in-process simulated venue for dry runs and tests
// -----------------------------------------------------------------------------
//
// @brief  Acknowledges limit orders, fills them when the reference price
//         trades through, fills market orders immediately, confirms cancels
//         and reports snapshots.
//
// @details
// There is no book and no matching between orders. A resting bid fills in
// full at its own price once the last price is at or below it; a resting
// ask once the last price is at or above it. A limit order that already
// crosses the last price when placed fills at the last price. Market orders
// fill at the last price and are rejected while no price has been seen.
//
// Venue order ids are "P-1", "P-2", ... Every state change is pushed to the
// sink as a VenueOrderEvent with an increasing sequence number, after the
// internal lock is released.
//
// Price updates enter through onMarketData(), which the MarketDataGateway
// calls from its own thread. The update is forwarded to the sink as a
// MarketDataEvent before any fills it causes, matching a real venue where
// the trade print and the fill notice race.
//
// Thread model:
//   All public methods are safe to call from any thread. The sink is
//   invoked on the calling thread (routing thread for placeOrder/cancelOrder,
//   market-data thread for onMarketData).
//
// Ownership:
//   Owned by AccountContext (or a test). Holds a reference to the time
//   provider, which must outlive it.
// -----------------------------------------------------------------------------
class PaperExchangeAdapter final : public IExchangeAdapter {
 public:
  PaperExchangeAdapter(const ITimeProvider& time_provider, std::string symbol,
                       double initial_position = 0.0);

  PaperExchangeAdapter(const PaperExchangeAdapter&) = delete;
  PaperExchangeAdapter& operator=(const PaperExchangeAdapter&) = delete;
  PaperExchangeAdapter(PaperExchangeAdapter&&) = delete;
  PaperExchangeAdapter& operator=(PaperExchangeAdapter&&) = delete;

  void start(EventSink sink) override;
  void stop() override;

  PlaceResult placeOrder(const PlaceRequest& request,
                         std::int64_t deadline_ms) override;

  CancelResult cancelOrder(const std::string& symbol,
                           const std::string& venue_order_id,
                           std::int64_t deadline_ms) override;

  QueryResult queryOrder(const std::string& symbol, domain::IntentId intent_id,
                         const std::optional<std::string>& venue_order_id,
                         std::int64_t deadline_ms) override;

  SnapshotResult getAccountSnapshot(const std::string& symbol,
                                    std::int64_t deadline_ms) override;

  // -------------------------------------------------------------------------
  // onMarketData(event)
  // -------------------------------------------------------------------------
  // @brief  Records the new last price, forwards the tick to the sink and
  //         fills every resting order the price traded through.
  //         Ticks for other symbols are ignored.
  // -------------------------------------------------------------------------
  void onMarketData(const MarketDataEvent& event);

  double lastPrice() const;
  double netPosition() const;
  std::size_t restingCount() const;

 private:
  // Fills the remainder of `report` at `price` and appends the event.
  void fillLocked(VenueOrderReport& report, double price,
                  std::vector<Event>& out);

  void emitLocked(VenueOrderReport& report, std::vector<Event>& out);

  // Invokes the sink for each event. Must be called without mutex_ held.
  void deliver(std::vector<Event>& events);

  bool knownSymbol(const std::string& symbol) const {
    return symbol == symbol_;
  }

  const ITimeProvider& time_provider_;
  const std::string symbol_;

  mutable std::mutex mutex_;
  EventSink sink_;
  double last_price_{0.0};
  double net_position_{0.0};
  std::uint64_t next_order_number_{1};
  std::uint64_t next_sequence_{1};

  // Every order ever placed, keyed by venue id.
  std::map<std::string, VenueOrderReport> orders_;
};

}  // namespace gridmm
