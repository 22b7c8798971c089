#pragma once

#include "gridmm/concurrent/event_loop_thread.hpp"
#include "gridmm/config/grid_config.hpp"
#include "gridmm/exchange/i_exchange_adapter.hpp"
#include "gridmm/execution/execution_gateway.hpp"
#include "gridmm/time/i_time_provider.hpp"

#include <memory>
#include <string>

namespace gridmm {

// -----------------------------------------------------------------------------
// OrderRoutingThread — dedicated I/O thread for venue calls
// -----------------------------------------------------------------------------
//
// @brief  Encapsulates an EventLoopThread and the ExecutionGateway, keeping
//         blocking adapter calls off the account's reconcile loop.
//
// @details
// Cross-thread event bridges (wired by AccountContext):
//
//   reconcile loop                      routing loop
//   ──────────────                      ────────────
//   ReconciliationEngine publishes
//   Place/Cancel/QueryOrderCommand
//         │
//         ├── bridge subscriber ──push()──▶ routing queue
//         │                                     │
//         │                            ExecutionGateway::on*()
//         │                            (adapter call, retries)
//         │                                     │
//         │                            Publish *ResultEvent
//         │                            on routing bus
//         │                                     │
//         ◀──push()── bridge subscriber ────────┘
//         │
//   ReconciliationEngine::on*Result()
//
// The timer thread pushes SnapshotRequestEvent straight into this queue.
//
// Unlike the loop, the gateway exists from construction so that
// AccountContext can take the startup snapshot before any thread runs.
//
// Thread model:
//   Constructed and destroyed on the main thread (via AccountContext).
//   start() and stop() are called from the owning thread only.
//
// Ownership:
//   Owned by AccountContext via std::unique_ptr.
//   Owns the EventLoopThread (value member) and the ExecutionGateway.
//   Holds references to the adapter and the time provider.
// -----------------------------------------------------------------------------
class OrderRoutingThread {
 public:
  OrderRoutingThread(IExchangeAdapter& adapter,
                     const ITimeProvider& time_provider, std::string symbol,
                     RetryPolicy retry, std::int64_t call_deadline_ms,
                     ExecutionGateway::Sleeper sleeper = nullptr);

  // -------------------------------------------------------------------------
  // Destructor
  // -------------------------------------------------------------------------
  // @brief  RAII: stops the loop, then destroys the gateway.
  // -------------------------------------------------------------------------
  ~OrderRoutingThread();

  OrderRoutingThread(const OrderRoutingThread&) = delete;
  OrderRoutingThread& operator=(const OrderRoutingThread&) = delete;
  OrderRoutingThread(OrderRoutingThread&&) = delete;
  OrderRoutingThread& operator=(OrderRoutingThread&&) = delete;

  // Idempotent.
  void start();

  // -------------------------------------------------------------------------
  // stop()
  // -------------------------------------------------------------------------
  // @brief  Stops the loop thread. Commands still queued are dropped; the
  //         next snapshot after a restart resolves whatever they would have
  //         done.
  //
  // Idempotent. Blocks until the worker exits (at most one adapter call).
  // -------------------------------------------------------------------------
  void stop();

  void push(Event event);

  EventBus& eventBus();

  ExecutionGateway& gateway() { return *gateway_; }

 private:
  EventLoopThread loop_;
  std::unique_ptr<ExecutionGateway> gateway_;
  bool running_{false};
};

}  // namespace gridmm
