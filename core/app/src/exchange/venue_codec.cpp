#include "gridmm/exchange/venue_codec.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <stdexcept>

namespace gridmm {

namespace {

std::string normalize(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) {
    if (c == '_' || c == '-' || c == ' ') {
      continue;
    }
    out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  return out;
}

// Reads the common {"ok","error","message"} envelope. Returns None when ok.
domain::VenueError envelopeError(const nlohmann::json& reply,
                                 std::string& message) {
  message = reply.value("message", std::string());
  if (reply.at("ok").get<bool>()) {
    return domain::VenueError::None;
  }
  domain::VenueError error =
      domain::venueErrorFromString(reply.value("error", std::string()));
  // An "ok":false reply with no usable code is still a failure.
  return error == domain::VenueError::None
             ? domain::VenueError::TransportFailure
             : error;
}

}  // namespace

// -----------------------------------------------------------------------------
// Requests
// -----------------------------------------------------------------------------
nlohmann::json VenueCodec::encodePlace(const PlaceRequest& request) {
  nlohmann::json j;
  j["op"] = "place";
  j["symbol"] = request.symbol;
  j["client_order_id"] = request.intent_id;
  j["side"] = sideToWire(request.side);
  j["order_type"] =
      request.type == domain::OrderType::Limit ? "limit" : "market";
  j["price"] = request.price;
  j["quantity"] = request.quantity;
  return j;
}

nlohmann::json VenueCodec::encodeCancel(const std::string& symbol,
                                        const std::string& venue_order_id) {
  return nlohmann::json{{"op", "cancel"},
                        {"symbol", symbol},
                        {"venue_order_id", venue_order_id}};
}

nlohmann::json VenueCodec::encodeQuery(
    const std::string& symbol, domain::IntentId intent_id,
    const std::optional<std::string>& venue_order_id) {
  nlohmann::json j{{"op", "query"},
                   {"symbol", symbol},
                   {"client_order_id", intent_id}};
  if (venue_order_id) {
    j["venue_order_id"] = *venue_order_id;
  }
  return j;
}

nlohmann::json VenueCodec::encodeSnapshot(const std::string& symbol) {
  return nlohmann::json{{"op", "snapshot"}, {"symbol", symbol}};
}

// -----------------------------------------------------------------------------
// Replies
// -----------------------------------------------------------------------------
PlaceResult VenueCodec::decodePlaceReply(const nlohmann::json& reply) {
  PlaceResult result;
  try {
    result.error = envelopeError(reply, result.message);
    if (result.error == domain::VenueError::None) {
      result.venue_order_id = reply.at("venue_order_id").get<std::string>();
    }
  } catch (const nlohmann::json::exception& e) {
    result.error = domain::VenueError::TransportFailure;
    result.message = std::string("malformed place reply: ") + e.what();
  }
  return result;
}

CancelResult VenueCodec::decodeCancelReply(const nlohmann::json& reply) {
  CancelResult result;
  try {
    result.error = envelopeError(reply, result.message);
  } catch (const nlohmann::json::exception& e) {
    result.error = domain::VenueError::TransportFailure;
    result.message = std::string("malformed cancel reply: ") + e.what();
  }
  return result;
}

QueryResult VenueCodec::decodeQueryReply(const nlohmann::json& reply) {
  QueryResult result;
  try {
    result.error = envelopeError(reply, result.message);
    if (result.error == domain::VenueError::None) {
      result.report = decodeReport(reply.at("order"));
    }
  } catch (const nlohmann::json::exception& e) {
    result.error = domain::VenueError::TransportFailure;
    result.message = std::string("malformed query reply: ") + e.what();
  } catch (const std::invalid_argument& e) {
    result.error = domain::VenueError::TransportFailure;
    result.message = std::string("malformed query reply: ") + e.what();
  }
  return result;
}

SnapshotResult VenueCodec::decodeSnapshotReply(const nlohmann::json& reply) {
  SnapshotResult result;
  try {
    result.error = envelopeError(reply, result.message);
    if (result.error == domain::VenueError::None) {
      result.net_position = reply.at("position").get<double>();
      for (const auto& order : reply.value("open_orders",
                                           nlohmann::json::array())) {
        result.open_orders.push_back(decodeReport(order));
      }
    }
  } catch (const nlohmann::json::exception& e) {
    result.error = domain::VenueError::TransportFailure;
    result.message = std::string("malformed snapshot reply: ") + e.what();
    result.open_orders.clear();
  } catch (const std::invalid_argument& e) {
    result.error = domain::VenueError::TransportFailure;
    result.message = std::string("malformed snapshot reply: ") + e.what();
    result.open_orders.clear();
  }
  return result;
}

// -----------------------------------------------------------------------------
// Stream
// -----------------------------------------------------------------------------
std::optional<Event> VenueCodec::decodeStreamMessage(
    const nlohmann::json& msg, const std::string& symbol) {
  try {
    const std::string type = msg.at("type").get<std::string>();

    if (type == "ticker") {
      MarketDataEvent md;
      md.symbol = msg.at("symbol").get<std::string>();
      if (md.symbol != symbol) {
        return std::nullopt;
      }
      md.price = msg.at("price").get<double>();
      md.quantity = msg.value("volume", 0.0);
      md.timestamp = Timestamp{std::chrono::milliseconds{
          msg.value("timestamp_ms", std::int64_t{0})}};
      md.sequence_id = msg.value("sequence", std::uint64_t{0});
      return Event{std::move(md)};
    }

    if (type == "order") {
      VenueOrderEvent event;
      event.report = decodeReport(msg);
      event.timestamp =
          Timestamp{std::chrono::milliseconds{event.report.timestamp_ms}};
      return Event{std::move(event)};
    }

    std::cerr << "[VenueCodec] WARNING: unknown stream message type '"
              << type << "'.\n";
  } catch (const nlohmann::json::exception& e) {
    std::cerr << "[VenueCodec] malformed stream message: " << e.what()
              << ", payload: " << msg.dump() << "\n";
  } catch (const std::invalid_argument& e) {
    std::cerr << "[VenueCodec] malformed stream message: " << e.what()
              << ", payload: " << msg.dump() << "\n";
  }
  return std::nullopt;
}

// -----------------------------------------------------------------------------
// Order reports
// -----------------------------------------------------------------------------
nlohmann::json VenueCodec::encodeReport(const VenueOrderReport& report) {
  nlohmann::json j;
  j["venue_order_id"] = report.venue_order_id;
  if (report.client_intent_id) {
    j["client_order_id"] = *report.client_intent_id;
  }
  j["side"] = sideToWire(report.side);
  j["order_type"] =
      report.type == domain::OrderType::Limit ? "limit" : "market";
  j["price"] = report.price;
  j["quantity"] = report.quantity;
  j["status"] = statusToWire(report.status);
  j["filled_quantity"] = report.filled_quantity;
  j["fill_price"] = report.fill_price;
  j["timestamp_ms"] = report.timestamp_ms;
  j["sequence"] = report.sequence;
  return j;
}

VenueOrderReport VenueCodec::decodeReport(const nlohmann::json& j) {
  VenueOrderReport report;
  report.venue_order_id = j.at("venue_order_id").get<std::string>();
  if (j.contains("client_order_id") && !j.at("client_order_id").is_null()) {
    report.client_intent_id = j.at("client_order_id").get<domain::IntentId>();
  }
  report.side = sideFromString(j.at("side").get<std::string>());
  report.type = normalize(j.value("order_type", std::string("limit"))) ==
                        "market"
                    ? domain::OrderType::Market
                    : domain::OrderType::Limit;
  report.price = j.value("price", 0.0);
  report.quantity = j.value("quantity", 0.0);
  report.status = statusFromString(j.at("status").get<std::string>());
  report.filled_quantity = j.value("filled_quantity", 0.0);
  report.fill_price = j.value("fill_price", 0.0);
  report.timestamp_ms = j.value("timestamp_ms", std::int64_t{0});
  report.sequence = j.value("sequence", std::uint64_t{0});
  return report;
}

domain::OrderStatus VenueCodec::statusFromString(const std::string& s) {
  const std::string n = normalize(s);
  if (n == "open" || n == "new" || n == "accepted") {
    return domain::OrderStatus::Open;
  }
  if (n == "partiallyfilled" || n == "partial") {
    return domain::OrderStatus::PartiallyFilled;
  }
  if (n == "filled") {
    return domain::OrderStatus::Filled;
  }
  if (n == "cancelled" || n == "canceled" || n == "expired") {
    return domain::OrderStatus::Cancelled;
  }
  if (n == "rejected") {
    return domain::OrderStatus::Rejected;
  }
  if (n == "pending" || n == "submitted") {
    return domain::OrderStatus::Submitted;
  }
  throw std::invalid_argument("unknown order status '" + s + "'");
}

const char* VenueCodec::statusToWire(domain::OrderStatus status) {
  using S = domain::OrderStatus;
  switch (status) {
    case S::Intended:
    case S::Submitted:       return "pending";
    case S::Open:            return "open";
    case S::PartiallyFilled: return "partially_filled";
    case S::Filled:          return "filled";
    case S::Cancelled:       return "cancelled";
    case S::Rejected:        return "rejected";
    case S::Failed:          return "rejected";
  }
  return "unknown";
}

domain::Side VenueCodec::sideFromString(const std::string& s) {
  const std::string n = normalize(s);
  if (n == "buy" || n == "bid") {
    return domain::Side::Bid;
  }
  if (n == "sell" || n == "ask") {
    return domain::Side::Ask;
  }
  throw std::invalid_argument("unknown side '" + s + "'");
}

const char* VenueCodec::sideToWire(domain::Side side) {
  return side == domain::Side::Bid ? "buy" : "sell";
}

}  // namespace gridmm
