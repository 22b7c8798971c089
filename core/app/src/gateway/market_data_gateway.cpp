#include "gridmm/gateway/market_data_gateway.hpp"
#include "gridmm/time/time_utils.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <string>

namespace gridmm {

// -----------------------------------------------------------------------------
// Constructor: create ZMQ SUB socket with receive timeout
// -----------------------------------------------------------------------------
MarketDataGateway::MarketDataGateway(EventSink event_sink,
                                     const std::string& endpoint)
    : event_sink_(std::move(event_sink)) {
  socket_.set(zmq::sockopt::subscribe, "");
  socket_.set(zmq::sockopt::rcvtimeo, kRecvTimeoutMs);
  socket_.set(zmq::sockopt::linger, 0);
  socket_.connect(endpoint);
}

// -----------------------------------------------------------------------------
// run(): blocking recv loop
// -----------------------------------------------------------------------------
void MarketDataGateway::run() {
  while (running_.load()) {
    zmq::message_t msg;
    auto result = socket_.recv(msg, zmq::recv_flags::none);

    if (!result.has_value()) {
      // Timeout: re-check the stop flag.
      continue;
    }

    if (auto md = parseTick(msg.to_string())) {
      md->sequence_id = ++sequence_;
      event_sink_(std::move(*md));
    }
  }
}

void MarketDataGateway::stop() { running_.store(false); }

std::optional<MarketDataEvent> MarketDataGateway::parseTick(
    const std::string& payload) {
  try {
    auto json = nlohmann::json::parse(payload);

    MarketDataEvent md;
    md.symbol = json.at("symbol").get<std::string>();
    md.price = json.at("price").get<double>();
    md.quantity = json.value("volume", 0.0);
    md.timestamp =
        ms_to_timestamp(json.at("timestamp_ms").get<std::int64_t>());

    if (md.price <= 0.0) {
      std::cerr << "[MarketDataGateway] WARNING: non-positive price, payload: "
                << payload << "\n";
      return std::nullopt;
    }
    return md;

  } catch (const nlohmann::json::exception& e) {
    std::cerr << "[MarketDataGateway] JSON parse error: " << e.what()
              << ", payload: " << payload << "\n";
    return std::nullopt;
  }
}

}  // namespace gridmm
