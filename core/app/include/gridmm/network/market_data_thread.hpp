#pragma once

#include "gridmm/events/event.hpp"
#include "gridmm/gateway/market_data_gateway.hpp"

#include <functional>
#include <memory>
#include <string>
#include <thread>

namespace gridmm {

// -----------------------------------------------------------------------------
// MarketDataThread — dedicated I/O thread for reference-price ingestion
// -----------------------------------------------------------------------------
//
// @brief  Encapsulates a std::thread that runs the MarketDataGateway's ZMQ
//         recv loop.
//
// @details
// MarketDataGateway has its own blocking recv loop and does not consume a
// ThreadSafeQueue, so it needs a raw std::thread rather than an
// EventLoopThread. The gateway is created in start() so the socket only
// connects once the accounts it feeds are running.
//
// Thread model:
//   Constructed, started and stopped on the main thread (via GridAgent).
//   The worker runs MarketDataGateway::run() exclusively.
//
// Ownership:
//   Owned by GridAgent via std::unique_ptr. Owns the gateway.
// -----------------------------------------------------------------------------
class MarketDataThread {
 public:
  using EventSink = std::function<void(Event)>;

  explicit MarketDataThread(EventSink event_sink,
                            std::string endpoint = "tcp://127.0.0.1:5555");

  ~MarketDataThread();

  MarketDataThread(const MarketDataThread&) = delete;
  MarketDataThread& operator=(const MarketDataThread&) = delete;
  MarketDataThread(MarketDataThread&&) = delete;
  MarketDataThread& operator=(MarketDataThread&&) = delete;

  // Creates the gateway and spawns the recv thread. Idempotent.
  void start();

  // Signals the gateway, joins the thread. Idempotent.
  void stop();

 private:
  EventSink event_sink_;
  std::string endpoint_;

  std::unique_ptr<MarketDataGateway> gateway_;
  std::thread thread_;
};

}  // namespace gridmm
