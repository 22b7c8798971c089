// =============================================================================
// paper_exchange_adapter_test.cpp
// =============================================================================
// Unit tests for gridmm::PaperExchangeAdapter, the in-process venue used for
// paper trading and tests.
//
// Validates:
//   - A resting limit is acknowledged and reported Open on the sink
//   - Resting orders fill at their own price when the market trades through
//   - Market orders and crossing limits fill immediately at the last price
//   - Cancel outcomes: Cancelled, AlreadyFilled, NotFound
//   - Query by venue id and by client intent id
//   - Snapshot lists resting orders and the net position
// =============================================================================

#include "gridmm/exchange/paper_exchange_adapter.hpp"
#include "gridmm/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>

#include <variant>
#include <vector>

using gridmm::domain::OrderStatus;
using gridmm::domain::OrderType;
using gridmm::domain::Side;
using gridmm::domain::VenueError;

class PaperExchangeAdapterTest : public ::testing::Test {
 protected:
  gridmm::SimulationTimeProvider clock{5000};
  gridmm::PaperExchangeAdapter paper{clock, "BTC-USD"};
  std::vector<gridmm::Event> events;

  void SetUp() override {
    paper.start([this](gridmm::Event e) { events.push_back(std::move(e)); });
  }

  void TearDown() override { paper.stop(); }

  void tick(double price) {
    gridmm::MarketDataEvent md;
    md.symbol = "BTC-USD";
    md.price = price;
    paper.onMarketData(md);
  }

  gridmm::PlaceResult place(Side side, double price, double qty,
                            OrderType type = OrderType::Limit,
                            gridmm::domain::IntentId id = 1) {
    gridmm::PlaceRequest request;
    request.intent_id = id;
    request.symbol = "BTC-USD";
    request.side = side;
    request.type = type;
    request.price = price;
    request.quantity = qty;
    return paper.placeOrder(request, 1000);
  }

  std::vector<gridmm::VenueOrderReport> reports() const {
    std::vector<gridmm::VenueOrderReport> out;
    for (const auto& e : events) {
      if (const auto* v = std::get_if<gridmm::VenueOrderEvent>(&e)) {
        out.push_back(v->report);
      }
    }
    return out;
  }
};

// -----------------------------------------------------------------------------
// 1. A limit below the market rests and is reported Open.
// -----------------------------------------------------------------------------
TEST_F(PaperExchangeAdapterTest, LimitRestsAndReportsOpen) {
  tick(100.0);
  gridmm::PlaceResult result = place(Side::Bid, 99.0, 1.0);

  EXPECT_EQ(result.error, VenueError::None);
  EXPECT_FALSE(result.venue_order_id.empty());
  EXPECT_EQ(paper.restingCount(), 1u);

  auto r = reports();
  ASSERT_EQ(r.size(), 1u);
  EXPECT_EQ(r[0].status, OrderStatus::Open);
  EXPECT_EQ(r[0].venue_order_id, result.venue_order_id);
  EXPECT_EQ(r[0].client_intent_id.value_or(0), 1u);
  EXPECT_EQ(r[0].timestamp_ms, 5000);
}

// -----------------------------------------------------------------------------
// 2. The bid fills at its own price when the market trades down through it,
//    and the tick itself is forwarded first.
// -----------------------------------------------------------------------------
TEST_F(PaperExchangeAdapterTest, RestingBidFillsWhenPriceTradesThrough) {
  tick(100.0);
  place(Side::Bid, 99.0, 1.0);
  events.clear();

  tick(98.5);

  ASSERT_EQ(events.size(), 2u);
  EXPECT_TRUE(std::holds_alternative<gridmm::MarketDataEvent>(events[0]));
  auto r = reports();
  ASSERT_EQ(r.size(), 1u);
  EXPECT_EQ(r[0].status, OrderStatus::Filled);
  EXPECT_DOUBLE_EQ(r[0].filled_quantity, 1.0);
  EXPECT_DOUBLE_EQ(r[0].fill_price, 99.0);
  EXPECT_DOUBLE_EQ(paper.netPosition(), 1.0);
  EXPECT_EQ(paper.restingCount(), 0u);
}

// -----------------------------------------------------------------------------
// 3. An ask above the market does not fill on a lower tick.
// -----------------------------------------------------------------------------
TEST_F(PaperExchangeAdapterTest, AskDoesNotFillBelowItsPrice) {
  tick(100.0);
  place(Side::Ask, 101.0, 1.0);
  events.clear();

  tick(100.9);
  EXPECT_TRUE(reports().empty());

  tick(101.0);
  auto r = reports();
  ASSERT_EQ(r.size(), 1u);
  EXPECT_EQ(r[0].status, OrderStatus::Filled);
  EXPECT_DOUBLE_EQ(paper.netPosition(), -1.0);
}

// -----------------------------------------------------------------------------
// 4. A market order fills immediately at the last price.
// -----------------------------------------------------------------------------
TEST_F(PaperExchangeAdapterTest, MarketOrderFillsAtLastPrice) {
  tick(100.0);
  place(Side::Ask, 0.0, 0.5, OrderType::Market);

  auto r = reports();
  ASSERT_EQ(r.size(), 2u);
  EXPECT_EQ(r[0].status, OrderStatus::Open);
  EXPECT_EQ(r[1].status, OrderStatus::Filled);
  EXPECT_DOUBLE_EQ(r[1].fill_price, 100.0);
  EXPECT_GT(r[1].sequence, r[0].sequence);
  EXPECT_DOUBLE_EQ(paper.netPosition(), -0.5);
}

// -----------------------------------------------------------------------------
// 5. Invalid orders are rejected without events.
// -----------------------------------------------------------------------------
TEST_F(PaperExchangeAdapterTest, InvalidOrdersAreRejected) {
  EXPECT_EQ(place(Side::Bid, 0.0, 1.0, OrderType::Market).error,
            VenueError::Rejected);  // no price yet
  tick(100.0);
  EXPECT_EQ(place(Side::Bid, 99.0, 0.0).error, VenueError::Rejected);
  EXPECT_EQ(place(Side::Bid, -1.0, 1.0).error, VenueError::Rejected);

  gridmm::PlaceRequest other;
  other.symbol = "ETH-USD";
  other.price = 10.0;
  other.quantity = 1.0;
  EXPECT_EQ(paper.placeOrder(other, 1000).error, VenueError::Rejected);

  EXPECT_TRUE(reports().empty());
}

// -----------------------------------------------------------------------------
// 6. Cancel outcomes: resting → Cancelled, filled → AlreadyFilled,
//    unknown → NotFound.
// -----------------------------------------------------------------------------
TEST_F(PaperExchangeAdapterTest, CancelOutcomes) {
  tick(100.0);
  place(Side::Bid, 99.0, 1.0, OrderType::Limit, 1);
  std::string filled = place(Side::Bid, 98.0, 1.0, OrderType::Limit, 2)
                           .venue_order_id;
  tick(97.0);  // fills both bids
  std::string fresh = place(Side::Bid, 96.0, 1.0, OrderType::Limit, 3)
                          .venue_order_id;

  EXPECT_EQ(paper.cancelOrder("BTC-USD", fresh, 1000).error, VenueError::None);
  EXPECT_EQ(paper.cancelOrder("BTC-USD", filled, 1000).error,
            VenueError::AlreadyFilled);
  EXPECT_EQ(paper.cancelOrder("BTC-USD", "P-999", 1000).error,
            VenueError::NotFound);
  EXPECT_EQ(paper.cancelOrder("BTC-USD", fresh, 1000).error,
            VenueError::NotFound);

  auto r = reports();
  EXPECT_EQ(r.back().status, OrderStatus::Cancelled);
  EXPECT_EQ(r.back().venue_order_id, fresh);
}

// -----------------------------------------------------------------------------
// 7. Query finds orders by venue id, falls back to the intent id, and
//    reports NotFound for orders it never saw.
// -----------------------------------------------------------------------------
TEST_F(PaperExchangeAdapterTest, QueryByVenueIdOrIntentId) {
  tick(100.0);
  std::string venue_id =
      place(Side::Ask, 102.0, 1.0, OrderType::Limit, 77).venue_order_id;

  auto by_venue = paper.queryOrder("BTC-USD", 0, venue_id, 1000);
  ASSERT_EQ(by_venue.error, VenueError::None);
  EXPECT_EQ(by_venue.report->client_intent_id.value_or(0), 77u);

  auto by_intent = paper.queryOrder("BTC-USD", 77, std::nullopt, 1000);
  ASSERT_EQ(by_intent.error, VenueError::None);
  EXPECT_EQ(by_intent.report->venue_order_id, venue_id);

  EXPECT_EQ(paper.queryOrder("BTC-USD", 78, std::nullopt, 1000).error,
            VenueError::NotFound);
}

// -----------------------------------------------------------------------------
// 8. The snapshot lists resting orders and the net position.
// -----------------------------------------------------------------------------
TEST(PaperExchangeSnapshotTest, SnapshotListsRestingOrders) {
  gridmm::SimulationTimeProvider clock{1};
  gridmm::PaperExchangeAdapter paper(clock, "BTC-USD", 2.5);

  gridmm::MarketDataEvent md;
  md.symbol = "BTC-USD";
  md.price = 100.0;
  paper.onMarketData(md);

  gridmm::PlaceRequest request;
  request.symbol = "BTC-USD";
  request.side = Side::Bid;
  request.price = 95.0;
  request.quantity = 1.0;
  paper.placeOrder(request, 1000);

  gridmm::SnapshotResult snap = paper.getAccountSnapshot("BTC-USD", 1000);
  EXPECT_EQ(snap.error, VenueError::None);
  EXPECT_DOUBLE_EQ(snap.net_position, 2.5);
  ASSERT_EQ(snap.open_orders.size(), 1u);
  EXPECT_DOUBLE_EQ(snap.open_orders[0].price, 95.0);

  EXPECT_EQ(paper.getAccountSnapshot("ETH-USD", 1000).error,
            VenueError::NotFound);
}
