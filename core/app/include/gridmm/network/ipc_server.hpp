#pragma once

#include "gridmm/concurrent/thread_safe_queue.hpp"
#include "gridmm/events/event.hpp"

#include <zmq.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace gridmm {

// -----------------------------------------------------------------------------
// IpcServer — dual-socket ZeroMQ gateway for telemetry and operator commands
// -----------------------------------------------------------------------------
//
// @brief  Runs a dedicated thread that broadcasts telemetry to external
//         subscribers (PUB socket) and answers command requests from
//         external clients (REP socket).
//
// @details
// Two ZeroMQ sockets operate on the same thread:
//
//   1. PUB socket (telemetry_endpoint):
//      Broadcasts one JSON object per telemetry event, with a "type" of
//      order_update, position_update, profit, risk_reject, divergence or
//      health. Every object carries the account's "userid". Events arrive
//      through a ThreadSafeQueue from the account reconcile loops and the
//      ProfitRecorder, so JSON serialization and ZMQ I/O never block them.
//
//   2. REP socket (command_endpoint):
//      Accepts command strings (PING, STATUS, PAUSE <userid>,
//      RESUME <userid>) and replies with the JSON string returned by the
//      command handler (GridAgent::executeCommand()). ZMQ_RCVTIMEO keeps
//      the thread alternating between command polling and telemetry
//      draining.
//
// Thread model:
//   Constructed and destroyed on the main thread (via GridAgent).
//   start() spawns the worker; stop() clears an atomic flag and joins.
//   pushTelemetry() is safe from any thread. The command handler runs on
//   the IPC thread.
//
// Ownership:
//   Owned by GridAgent via std::unique_ptr.
//   Owns the ZMQ context, both sockets, the telemetry queue and the worker.
// -----------------------------------------------------------------------------
class IpcServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @brief  Stores parameters for deferred socket creation. No sockets are
  //         opened and no threads are spawned until start().
  // -------------------------------------------------------------------------
  explicit IpcServer(CommandHandler command_handler,
                     std::string cmd_endpoint = "tcp://127.0.0.1:5556",
                     std::string pub_endpoint = "tcp://127.0.0.1:5557");

  ~IpcServer();

  IpcServer(const IpcServer&) = delete;
  IpcServer& operator=(const IpcServer&) = delete;
  IpcServer(IpcServer&&) = delete;
  IpcServer& operator=(IpcServer&&) = delete;

  // Binds both sockets and spawns the worker. Idempotent.
  void start();

  // Signals the worker, joins it and closes the sockets. Idempotent.
  void stop();

  void pushTelemetry(Event event);

  // -------------------------------------------------------------------------
  // formatTelemetry(event)
  // -------------------------------------------------------------------------
  // @return JSON string for telemetry event types, std::nullopt for any
  //         other alternative of the Event variant.
  // -------------------------------------------------------------------------
  static std::optional<std::string> formatTelemetry(const Event& event);

 private:
  static constexpr int kPollTimeoutMs = 50;

  void run();
  void processTelemetry();
  void processCommands();

  static std::string formatOrderUpdate(const OrderUpdateEvent& e);
  static std::string formatPositionUpdate(const PositionUpdateEvent& e);
  static std::string formatProfit(const ProfitRealizedEvent& e);
  static std::string formatRiskReject(const RiskRejectEvent& e);
  static std::string formatDivergence(const DivergenceEvent& e);
  static std::string formatHealth(const HeartbeatEvent& e);

  CommandHandler command_handler_;
  std::string cmd_endpoint_;
  std::string pub_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> cmd_socket_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  ThreadSafeQueue<Event> telemetry_queue_;
  std::thread thread_;
  std::atomic<bool> running_{false};
};

}  // namespace gridmm
