#pragma once

#include "gridmm/events/event.hpp"

#include <zmq.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace gridmm {

// -----------------------------------------------------------------------------
// MarketDataGateway — ZeroMQ bridge for reference-price ticks
// -----------------------------------------------------------------------------
//
// @brief  Listens on a ZeroMQ SUB socket for JSON-encoded ticks and hands
//         each one to the event sink as a MarketDataEvent.
//
// @details
// Drives the paper venue in dry runs: a feeder script replays or relays
// prices over ZeroMQ PUB, GridAgent binds the sink to the paper adapters'
// onMarketData(), and the adapters forward the tick into their account's
// reconcile loop together with any fills it causes. Accounts on the ZMQ
// venue bridge receive tickers through their adapter stream instead.
//
// Expected JSON format:
//   {
//     "timestamp_ms": 1700000000000,   // int64 epoch milliseconds
//     "symbol":       "BTC-USD",       // instrument identifier
//     "price":        100.25,          // last/mid price
//     "volume":       1.5              // optional
//   }
//
// Thread model:
//   run() blocks the calling thread (MarketDataThread's worker). stop() may
//   be called from any thread; ZMQ_RCVTIMEO bounds how long it takes the
//   loop to notice.
//
// Ownership:
//   Owns the zmq::context_t and zmq::socket_t (RAII).
//   Holds a copy of the event_sink callback.
// -----------------------------------------------------------------------------
class MarketDataGateway {
 public:
  using EventSink = std::function<void(Event)>;

  explicit MarketDataGateway(
      EventSink event_sink,
      const std::string& endpoint = "tcp://127.0.0.1:5555");

  ~MarketDataGateway() = default;

  MarketDataGateway(const MarketDataGateway&) = delete;
  MarketDataGateway& operator=(const MarketDataGateway&) = delete;
  MarketDataGateway(MarketDataGateway&&) = delete;
  MarketDataGateway& operator=(MarketDataGateway&&) = delete;

  // Blocking recv loop. Call from exactly one thread.
  void run();

  // Requests the recv loop to exit within kRecvTimeoutMs.
  void stop();

  // -------------------------------------------------------------------------
  // parseTick(payload)
  // -------------------------------------------------------------------------
  // @return The decoded tick, or std::nullopt (logged) when the payload is
  //         not valid JSON, lacks a field, or has a non-positive price.
  // -------------------------------------------------------------------------
  static std::optional<MarketDataEvent> parseTick(const std::string& payload);

 private:
  static constexpr int kRecvTimeoutMs = 100;

  EventSink event_sink_;

  zmq::context_t context_{1};
  zmq::socket_t socket_{context_, zmq::socket_type::sub};

  std::atomic<bool> running_{true};
  std::uint64_t sequence_{0};
};

}  // namespace gridmm
