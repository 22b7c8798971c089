// =============================================================================
// event_bus_test.cpp
// =============================================================================
// Unit tests for gridmm::EventBus and gridmm::EventLoopThread.
//
// Validates:
//   - Generic (all-event) subscription receives every event type
//   - Typed subscription receives only the matching event type
//   - Unsubscribe correctly stops delivery
//   - Re-entrant publish (subscriber publishes inside callback), the path
//     the ReconciliationEngine relies on when it publishes commands from
//     inside a venue-event handler
//   - EventLoopThread delivers pushed events in order and survives a
//     throwing handler
// =============================================================================

#include "gridmm/concurrent/event_loop_thread.hpp"
#include "gridmm/eventbus/event_bus.hpp"
#include "gridmm/events/event.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <stdexcept>
#include <string>
#include <vector>

// =============================================================================
// Test fixture: provides a fresh EventBus for each test.
// =============================================================================
class EventBusTest : public ::testing::Test {
 protected:
  gridmm::EventBus bus;

  static gridmm::MarketDataEvent makeMD(const std::string& symbol,
                                        double price) {
    gridmm::MarketDataEvent e;
    e.symbol = symbol;
    e.price = price;
    e.quantity = 1.0;
    return e;
  }
};

// -----------------------------------------------------------------------------
// 1. A generic subscriber must be invoked for every event type.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, GenericSubscriberReceivesAllEvents) {
  int call_count = 0;
  bus.subscribe([&call_count](const gridmm::Event&) { ++call_count; });

  bus.publish(makeMD("BTC-USD", 100.0));
  bus.publish(gridmm::ClockTickEvent{1000});
  bus.publish(gridmm::HeartbeatEvent{"agent", "ok", "", {}, 0});

  EXPECT_EQ(call_count, 3);
}

// -----------------------------------------------------------------------------
// 2. A typed subscriber must fire only for its registered event type.
// Why: The ReconciliationEngine subscribes to eight event types on one bus;
//      a misrouted event would be applied to the ledger as the wrong kind.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, TypedSubscriberFiltersCorrectly) {
  int md_count = 0;
  bus.subscribe<gridmm::MarketDataEvent>(
      [&md_count](const gridmm::MarketDataEvent&) { ++md_count; });

  bus.publish(makeMD("BTC-USD", 100.0));
  bus.publish(gridmm::ClockTickEvent{1000});

  EXPECT_EQ(md_count, 1);
}

// -----------------------------------------------------------------------------
// 3. After unsubscribe(id), the callback must not fire for future publishes.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, UnsubscribeStopsDelivery) {
  int call_count = 0;
  auto id = bus.subscribe<gridmm::MarketDataEvent>(
      [&call_count](const gridmm::MarketDataEvent&) { ++call_count; });

  bus.publish(makeMD("BTC-USD", 100.0));
  EXPECT_EQ(call_count, 1);

  EXPECT_EQ(bus.subscriberCount(), 1u);
  bus.unsubscribe(id);
  EXPECT_EQ(bus.subscriberCount(), 0u);

  bus.publish(makeMD("BTC-USD", 101.0));
  EXPECT_EQ(call_count, 1);
}

// -----------------------------------------------------------------------------
// 4. Unsubscribing a non-existent id must not crash or throw.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, UnsubscribeNonExistentIdIsNoOp) {
  bus.subscribe([](const gridmm::Event&) {});
  EXPECT_NO_FATAL_FAILURE(bus.unsubscribe(9999));
  EXPECT_EQ(bus.subscriberCount(), 1u);
}

// -----------------------------------------------------------------------------
// 5. A subscriber that calls publish() inside its callback must not deadlock.
//
// Scenario: subscriber A receives a VenueOrderEvent and publishes a
//           QueryOrderCommand. Subscriber B receives the command.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, SubscriberCanPublishInsideCallback) {
  std::vector<gridmm::domain::IntentId> queried;

  bus.subscribe<gridmm::QueryOrderCommand>(
      [&queried](const gridmm::QueryOrderCommand& c) {
        queried.push_back(c.intent_id);
      });

  bus.subscribe<gridmm::VenueOrderEvent>(
      [this](const gridmm::VenueOrderEvent& e) {
        gridmm::QueryOrderCommand cmd;
        cmd.symbol = "BTC-USD";
        cmd.intent_id = e.report.client_intent_id.value_or(0);
        cmd.venue_order_id = e.report.venue_order_id;
        bus.publish(cmd);
      });

  gridmm::VenueOrderEvent event;
  event.report.venue_order_id = "V-1";
  event.report.client_intent_id = 7;
  bus.publish(event);

  ASSERT_EQ(queried.size(), 1u);
  EXPECT_EQ(queried[0], 7u);
}

// -----------------------------------------------------------------------------
// 6. Field values must survive the variant dispatch path.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, TypedSubscriberReceivesCorrectData) {
  std::string received_symbol;
  double received_price = 0.0;

  bus.subscribe<gridmm::MarketDataEvent>(
      [&received_symbol, &received_price](const gridmm::MarketDataEvent& e) {
        received_symbol = e.symbol;
        received_price = e.price;
      });

  bus.publish(makeMD("ETH-USD", 2371.25));

  EXPECT_EQ(received_symbol, "ETH-USD");
  EXPECT_DOUBLE_EQ(received_price, 2371.25);
}

// =============================================================================
// EventLoopThread
// =============================================================================

// -----------------------------------------------------------------------------
// 7. Events pushed from another thread are dispatched on the loop, in order.
// -----------------------------------------------------------------------------
TEST(EventLoopThreadTest, DispatchesPushedEventsInOrder) {
  gridmm::EventLoopThread loop("test_loop");
  std::vector<std::int64_t> seen;
  std::promise<void> done;

  loop.eventBus().subscribe<gridmm::ClockTickEvent>(
      [&](const gridmm::ClockTickEvent& e) {
        seen.push_back(e.now_ms);
        if (seen.size() == 3) {
          done.set_value();
        }
      });

  loop.start();
  loop.push(gridmm::ClockTickEvent{1});
  loop.push(gridmm::ClockTickEvent{2});
  loop.push(gridmm::ClockTickEvent{3});

  ASSERT_EQ(done.get_future().wait_for(std::chrono::seconds(2)),
            std::future_status::ready);
  loop.stop();

  EXPECT_EQ(seen, (std::vector<std::int64_t>{1, 2, 3}));
}

// -----------------------------------------------------------------------------
// 8. A handler that throws must not kill the loop; the next event is
//    processed normally.
// -----------------------------------------------------------------------------
TEST(EventLoopThreadTest, ThrowingHandlerDoesNotStopLoop) {
  gridmm::EventLoopThread loop("test_loop");
  std::promise<std::int64_t> second;

  loop.eventBus().subscribe<gridmm::ClockTickEvent>(
      [&](const gridmm::ClockTickEvent& e) {
        if (e.now_ms == 1) {
          throw std::runtime_error("boom");
        }
        second.set_value(e.now_ms);
      });

  loop.start();
  loop.push(gridmm::ClockTickEvent{1});
  loop.push(gridmm::ClockTickEvent{2});

  auto future = second.get_future();
  ASSERT_EQ(future.wait_for(std::chrono::seconds(2)),
            std::future_status::ready);
  EXPECT_EQ(future.get(), 2);
  EXPECT_TRUE(loop.isRunning());
  loop.stop();
  EXPECT_FALSE(loop.isRunning());
}
