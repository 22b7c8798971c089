// =============================================================================
// venue_codec_test.cpp
// =============================================================================
// Unit tests for gridmm::VenueCodec, the JSON wire format spoken with the
// exchange gateway.
//
// Validates:
//   - Place requests carry the intent id as client_order_id
//   - Reply envelopes map to VenueError, malformed replies to
//     TransportFailure (decoders never throw)
//   - Status spellings from different venues normalize to one OrderStatus
//   - Stream messages decode to VenueOrderEvent / MarketDataEvent and
//     tickers for other symbols are dropped
// =============================================================================

#include "gridmm/exchange/venue_codec.hpp"

#include <gtest/gtest.h>

#include <stdexcept>
#include <variant>

using gridmm::VenueCodec;
using gridmm::domain::OrderStatus;
using gridmm::domain::VenueError;
using nlohmann::json;

// -----------------------------------------------------------------------------
// 1. A place request carries every field the gateway needs.
// -----------------------------------------------------------------------------
TEST(VenueCodecTest, EncodePlace) {
  gridmm::PlaceRequest request;
  request.intent_id = 42;
  request.symbol = "BTC-USD";
  request.side = gridmm::domain::Side::Ask;
  request.type = gridmm::domain::OrderType::Market;
  request.price = 101.5;
  request.quantity = 0.25;

  json j = VenueCodec::encodePlace(request);

  EXPECT_EQ(j.at("op"), "place");
  EXPECT_EQ(j.at("symbol"), "BTC-USD");
  EXPECT_EQ(j.at("client_order_id").get<std::uint64_t>(), 42u);
  EXPECT_EQ(j.at("side"), "sell");
  EXPECT_EQ(j.at("order_type"), "market");
  EXPECT_DOUBLE_EQ(j.at("price").get<double>(), 101.5);
  EXPECT_DOUBLE_EQ(j.at("quantity").get<double>(), 0.25);
}

// -----------------------------------------------------------------------------
// 2. A query without a venue id omits the key.
// -----------------------------------------------------------------------------
TEST(VenueCodecTest, EncodeQueryWithoutVenueId) {
  json with = VenueCodec::encodeQuery("BTC-USD", 7, std::string("V-1"));
  json without = VenueCodec::encodeQuery("BTC-USD", 7, std::nullopt);

  EXPECT_EQ(with.at("venue_order_id"), "V-1");
  EXPECT_FALSE(without.contains("venue_order_id"));
  EXPECT_EQ(without.at("client_order_id").get<std::uint64_t>(), 7u);
}

// -----------------------------------------------------------------------------
// 3. Place replies: ok, venue error, and malformed.
// -----------------------------------------------------------------------------
TEST(VenueCodecTest, DecodePlaceReply) {
  auto ok = VenueCodec::decodePlaceReply(
      json{{"ok", true}, {"venue_order_id", "V-9"}});
  EXPECT_EQ(ok.error, VenueError::None);
  EXPECT_EQ(ok.venue_order_id, "V-9");

  auto rejected = VenueCodec::decodePlaceReply(
      json{{"ok", false}, {"error", "Rejected"}, {"message", "bad price"}});
  EXPECT_EQ(rejected.error, VenueError::Rejected);
  EXPECT_EQ(rejected.message, "bad price");

  auto limited = VenueCodec::decodePlaceReply(
      json{{"ok", false}, {"error", "RateLimited"}});
  EXPECT_EQ(limited.error, VenueError::RateLimited);

  auto no_code = VenueCodec::decodePlaceReply(json{{"ok", false}});
  EXPECT_EQ(no_code.error, VenueError::TransportFailure);

  auto missing_id = VenueCodec::decodePlaceReply(json{{"ok", true}});
  EXPECT_EQ(missing_id.error, VenueError::TransportFailure);

  auto garbage = VenueCodec::decodePlaceReply(json::array({1, 2}));
  EXPECT_EQ(garbage.error, VenueError::TransportFailure);
}

// -----------------------------------------------------------------------------
// 4. A snapshot reply with one bad order is a TransportFailure with no
//    partial order list.
// Why: Acting on half a snapshot would report the missing orders as gone.
// -----------------------------------------------------------------------------
TEST(VenueCodecTest, DecodeSnapshotReplyIsAllOrNothing) {
  json good_order{{"venue_order_id", "V-1"}, {"side", "buy"},
                  {"status", "open"},        {"price", 99.0},
                  {"quantity", 1.0}};
  json bad_order{{"venue_order_id", "V-2"}, {"side", "buy"},
                 {"status", "melted"}};

  auto ok = VenueCodec::decodeSnapshotReply(
      json{{"ok", true}, {"position", -1.5},
           {"open_orders", json::array({good_order})}});
  EXPECT_EQ(ok.error, VenueError::None);
  EXPECT_DOUBLE_EQ(ok.net_position, -1.5);
  ASSERT_EQ(ok.open_orders.size(), 1u);
  EXPECT_EQ(ok.open_orders[0].venue_order_id, "V-1");

  auto bad = VenueCodec::decodeSnapshotReply(
      json{{"ok", true}, {"position", 0.0},
           {"open_orders", json::array({good_order, bad_order})}});
  EXPECT_EQ(bad.error, VenueError::TransportFailure);
  EXPECT_TRUE(bad.open_orders.empty());
}

// -----------------------------------------------------------------------------
// 5. Venue status spellings normalize.
// -----------------------------------------------------------------------------
TEST(VenueCodecTest, StatusSpellingsNormalize) {
  EXPECT_EQ(VenueCodec::statusFromString("NEW"), OrderStatus::Open);
  EXPECT_EQ(VenueCodec::statusFromString("open"), OrderStatus::Open);
  EXPECT_EQ(VenueCodec::statusFromString("PARTIALLY_FILLED"),
            OrderStatus::PartiallyFilled);
  EXPECT_EQ(VenueCodec::statusFromString("partially-filled"),
            OrderStatus::PartiallyFilled);
  EXPECT_EQ(VenueCodec::statusFromString("Filled"), OrderStatus::Filled);
  EXPECT_EQ(VenueCodec::statusFromString("canceled"), OrderStatus::Cancelled);
  EXPECT_EQ(VenueCodec::statusFromString("EXPIRED"), OrderStatus::Cancelled);
  EXPECT_EQ(VenueCodec::statusFromString("rejected"), OrderStatus::Rejected);
  EXPECT_EQ(VenueCodec::statusFromString("pending"), OrderStatus::Submitted);
  EXPECT_THROW(VenueCodec::statusFromString("melted"), std::invalid_argument);

  EXPECT_EQ(VenueCodec::sideFromString("BUY"), gridmm::domain::Side::Bid);
  EXPECT_EQ(VenueCodec::sideFromString("ask"), gridmm::domain::Side::Ask);
  EXPECT_THROW(VenueCodec::sideFromString("hold"), std::invalid_argument);
}

// -----------------------------------------------------------------------------
// 6. An order stream message becomes a VenueOrderEvent.
// -----------------------------------------------------------------------------
TEST(VenueCodecTest, StreamOrderMessage) {
  json msg{{"type", "order"},          {"venue_order_id", "V-3"},
           {"client_order_id", 11},    {"side", "sell"},
           {"status", "partially_filled"}, {"price", 101.0},
           {"quantity", 2.0},          {"filled_quantity", 0.5},
           {"fill_price", 101.0},      {"timestamp_ms", 1700000000000},
           {"sequence", 4}};

  auto event = VenueCodec::decodeStreamMessage(msg, "BTC-USD");
  ASSERT_TRUE(event.has_value());
  ASSERT_TRUE(std::holds_alternative<gridmm::VenueOrderEvent>(*event));

  const auto& report = std::get<gridmm::VenueOrderEvent>(*event).report;
  EXPECT_EQ(report.venue_order_id, "V-3");
  ASSERT_TRUE(report.client_intent_id.has_value());
  EXPECT_EQ(*report.client_intent_id, 11u);
  EXPECT_EQ(report.side, gridmm::domain::Side::Ask);
  EXPECT_EQ(report.status, OrderStatus::PartiallyFilled);
  EXPECT_DOUBLE_EQ(report.filled_quantity, 0.5);
  EXPECT_EQ(report.sequence, 4u);
}

// -----------------------------------------------------------------------------
// 7. Tickers for the account's symbol become MarketDataEvent, others are
//    dropped; malformed messages are dropped without throwing.
// -----------------------------------------------------------------------------
TEST(VenueCodecTest, StreamTickerFiltering) {
  json mine{{"type", "ticker"}, {"symbol", "BTC-USD"}, {"price", 100.25}};
  json other{{"type", "ticker"}, {"symbol", "ETH-USD"}, {"price", 2000.0}};

  auto event = VenueCodec::decodeStreamMessage(mine, "BTC-USD");
  ASSERT_TRUE(event.has_value());
  ASSERT_TRUE(std::holds_alternative<gridmm::MarketDataEvent>(*event));
  EXPECT_DOUBLE_EQ(std::get<gridmm::MarketDataEvent>(*event).price, 100.25);

  EXPECT_FALSE(VenueCodec::decodeStreamMessage(other, "BTC-USD").has_value());
  EXPECT_FALSE(VenueCodec::decodeStreamMessage(json{{"type", "order"}},
                                               "BTC-USD")
                   .has_value());
  EXPECT_FALSE(
      VenueCodec::decodeStreamMessage(json{{"type", "trade"}}, "BTC-USD")
          .has_value());
}

// -----------------------------------------------------------------------------
// 8. A report without client_order_id decodes with no intent id.
// Why: Orders placed outside the agent have no intent id; the ledger then
//      matches by venue id only or adopts them.
// -----------------------------------------------------------------------------
TEST(VenueCodecTest, ReportWithoutClientId) {
  json j{{"venue_order_id", "EXT-1"}, {"side", "buy"}, {"status", "new"},
         {"client_order_id", nullptr}};

  gridmm::VenueOrderReport report = VenueCodec::decodeReport(j);
  EXPECT_FALSE(report.client_intent_id.has_value());
  EXPECT_EQ(report.status, OrderStatus::Open);
  EXPECT_EQ(VenueCodec::encodeReport(report).count("client_order_id"), 0u);
}
