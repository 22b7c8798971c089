#pragma once

#include "gridmm/exchange/i_exchange_adapter.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace gridmm {

// -----------------------------------------------------------------------------
// VenueCodec — JSON wire format of the venue gateway bridge
// -----------------------------------------------------------------------------
//
// @brief  Encodes adapter calls as JSON requests and decodes replies and
//         stream messages back into the adapter's result types.
//
// @details
// Requests (REQ socket):
//   {"op":"place","symbol","client_order_id","side":"buy"|"sell",
//    "order_type":"limit"|"market","price","quantity"}
//   {"op":"cancel","symbol","venue_order_id"}
//   {"op":"query","symbol","client_order_id"[,"venue_order_id"]}
//   {"op":"snapshot","symbol"}
// Replies:
//   {"ok":true, ...op-specific fields} or
//   {"ok":false,"error":"Rejected"|"NotFound"|...,"message":"..."}
// Stream (SUB socket):
//   {"type":"order", <order report fields>}
//   {"type":"ticker","symbol","price","timestamp_ms"}
// Order report fields:
//   venue_order_id, client_order_id?, side, order_type, price, quantity,
//   status, filled_quantity, fill_price, timestamp_ms, sequence
//
// Decoding never throws. A malformed reply becomes TransportFailure with the
// parse error in message; a malformed stream message yields std::nullopt.
// -----------------------------------------------------------------------------
class VenueCodec {
 public:
  static nlohmann::json encodePlace(const PlaceRequest& request);
  static nlohmann::json encodeCancel(const std::string& symbol,
                                     const std::string& venue_order_id);
  static nlohmann::json encodeQuery(
      const std::string& symbol, domain::IntentId intent_id,
      const std::optional<std::string>& venue_order_id);
  static nlohmann::json encodeSnapshot(const std::string& symbol);

  static PlaceResult decodePlaceReply(const nlohmann::json& reply);
  static CancelResult decodeCancelReply(const nlohmann::json& reply);
  static QueryResult decodeQueryReply(const nlohmann::json& reply);
  static SnapshotResult decodeSnapshotReply(const nlohmann::json& reply);

  // Stream message → VenueOrderEvent or MarketDataEvent. Tickers for other
  // symbols are dropped.
  static std::optional<Event> decodeStreamMessage(const nlohmann::json& msg,
                                                  const std::string& symbol);

  static nlohmann::json encodeReport(const VenueOrderReport& report);

  // Throws nlohmann::json::exception or std::invalid_argument.
  static VenueOrderReport decodeReport(const nlohmann::json& j);

  // Accepts the common spellings ("open"/"new", "partially_filled",
  // "canceled"/"cancelled", "expired"). Throws std::invalid_argument.
  static domain::OrderStatus statusFromString(const std::string& s);
  static const char* statusToWire(domain::OrderStatus status);

  static domain::Side sideFromString(const std::string& s);
  static const char* sideToWire(domain::Side side);
};

}  // namespace gridmm
