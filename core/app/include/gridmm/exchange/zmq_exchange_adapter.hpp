#pragma once

#include "gridmm/exchange/i_exchange_adapter.hpp"

#include <nlohmann/json.hpp>
#include <zmq.hpp>

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace gridmm {

// -----------------------------------------------------------------------------
// ZmqExchangeAdapter — bridge to the external venue gateway process
// -----------------------------------------------------------------------------
//
// @brief  Implements IExchangeAdapter over two ZeroMQ sockets, speaking the
//         JSON protocol defined by VenueCodec.
//
// @details
// The venue gateway process owns exchange credentials, REST/WebSocket
// transport and signing. gridmm only sees:
//
//   1. REQ socket (command_endpoint): one JSON request, one JSON reply.
//      ZMQ_RCVTIMEO is set to the call deadline before every request. A
//      missed deadline leaves a REQ socket unusable (it still expects the
//      reply), so the socket is closed with linger 0 and reopened
//      ("lazy pirate"). The call reports VenueError::Timeout; whatever the
//      venue did is discovered later through a status query.
//
//   2. SUB socket (event_endpoint): order reports and tickers, decoded on
//      a dedicated stream thread and handed to the sink in arrival order.
//      ZMQ reconnects the SUB socket by itself; gaps are covered by the
//      agent's periodic snapshots.
//
// Thread model:
//   The four blocking calls come from the routing thread only; req_mutex_
//   still serializes them so a stray caller cannot interleave a REQ cycle.
//   The SUB socket is created, used and closed on the stream thread.
//
// Ownership:
//   Owns the ZMQ context, the REQ socket and the stream thread.
// -----------------------------------------------------------------------------
class ZmqExchangeAdapter final : public IExchangeAdapter {
 public:
  ZmqExchangeAdapter(std::string symbol, std::string command_endpoint,
                     std::string event_endpoint);

  ~ZmqExchangeAdapter() override;

  ZmqExchangeAdapter(const ZmqExchangeAdapter&) = delete;
  ZmqExchangeAdapter& operator=(const ZmqExchangeAdapter&) = delete;
  ZmqExchangeAdapter(ZmqExchangeAdapter&&) = delete;
  ZmqExchangeAdapter& operator=(ZmqExchangeAdapter&&) = delete;

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

 private:
  // Receive timeout of the SUB socket; bounds how long stop() waits.
  static constexpr int kRecvTimeoutMs = 100;

  // -------------------------------------------------------------------------
  // call(request, deadline_ms, reply, message)
  // -------------------------------------------------------------------------
  // @brief  One REQ/REP round trip.
  //
  // @return None with `reply` filled on success; Timeout when no reply
  //         arrived within deadline_ms (socket is reset); TransportFailure
  //         on a socket error or an unparseable reply, with `message` set.
  // -------------------------------------------------------------------------
  domain::VenueError call(const nlohmann::json& request,
                          std::int64_t deadline_ms, nlohmann::json& reply,
                          std::string& message);

  // Closes (linger 0) and reopens the REQ socket. Caller holds req_mutex_.
  void resetRequestSocket();

  // Stream thread entry point.
  void runStream();

  const std::string symbol_;
  const std::string command_endpoint_;
  const std::string event_endpoint_;

  zmq::context_t context_{1};

  std::mutex req_mutex_;
  std::unique_ptr<zmq::socket_t> req_socket_;

  EventSink sink_;
  std::thread stream_thread_;
  std::atomic<bool> running_{false};
};

}  // namespace gridmm
