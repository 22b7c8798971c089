#pragma once

#include "gridmm/concurrent/event_loop_thread.hpp"
#include "gridmm/concurrent/intent_id_generator.hpp"
#include "gridmm/concurrent/periodic_timer.hpp"
#include "gridmm/config/grid_config.hpp"
#include "gridmm/exchange/i_exchange_adapter.hpp"
#include "gridmm/grid/grid_planner.hpp"
#include "gridmm/ledger/order_ledger.hpp"
#include "gridmm/network/order_routing_thread.hpp"
#include "gridmm/persistence/profit_recorder.hpp"
#include "gridmm/reconcile/reconciliation_engine.hpp"
#include "gridmm/risk/risk_guard.hpp"
#include "gridmm/time/i_time_provider.hpp"

#include <atomic>
#include <functional>
#include <memory>
#include <string>

namespace gridmm {

// Thread-safe view of one account for the IPC STATUS command.
struct AccountStatusView {
  std::string userid;
  std::string symbol;
  bool running{false};
  bool paused{false};
  LedgerSnapshot ledger;
};

// -----------------------------------------------------------------------------
// AccountContext — everything one monitored account runs on
// -----------------------------------------------------------------------------
//
// @brief  Owns the account's threads and components and wires the event
//         bridges between them. Accounts share nothing mutable except the
//         ProfitRecorder and the IntentIdGenerator.
//
// @details
// Threads per account:
//   reconcile loop   EventLoopThread: OrderLedger, GridPlanner, RiskGuard
//                    and ReconciliationEngine, single writer
//   routing loop     OrderRoutingThread: ExecutionGateway, the only place an
//                    adapter call blocks
//   adapter stream   owned by the adapter, pushes into the reconcile queue
//   timers           clock ticks (reconcile queue) and snapshot requests
//                    (routing queue)
//
// Bridges (subscribed before any thread starts):
//   reconcile bus  Place/Cancel/QueryOrderCommand     → routing queue
//   routing bus    Place/Cancel/StatusQueryResult,
//                  AccountSnapshotEvent               → reconcile queue
//   reconcile bus  OrderUpdate, PositionUpdate, ProfitRealized, RiskReject,
//                  Divergence, Heartbeat              → telemetry sink
//   reconcile bus  ProfitRealized                     → ProfitRecorder
//
// Startup (synchronization gate):
//   start() takes an account snapshot through the gateway on the calling
//   thread before anything runs. Exhausting the retry budget throws
//   StartupError. The venue's net position and open orders are hydrated
//   into the ledger directly, without divergence reports, and the
//   MonitorAccount row is upserted as Active.
//
// Thread model:
//   Constructed, started and stopped on the main thread (via GridAgent).
//   pause()/resume()/status() are safe from the IPC thread.
//
// Ownership:
//   Owned by GridAgent via std::unique_ptr. Owns the adapter, both loops,
//   the timers and all per-account components. Holds references to the
//   IntentIdGenerator, the time provider and (nullable) the recorder.
// -----------------------------------------------------------------------------
class AccountContext {
 public:
  using TelemetrySink = std::function<void(Event)>;

  AccountContext(AccountConfig config, IntentIdGenerator& ids,
                 const ITimeProvider& clock,
                 std::unique_ptr<IExchangeAdapter> adapter,
                 ProfitRecorder* recorder = nullptr,
                 TelemetrySink telemetry = nullptr,
                 ExecutionGateway::Sleeper sleeper = nullptr);

  ~AccountContext();

  AccountContext(const AccountContext&) = delete;
  AccountContext& operator=(const AccountContext&) = delete;
  AccountContext(AccountContext&&) = delete;
  AccountContext& operator=(AccountContext&&) = delete;

  // Throws StartupError. Idempotent once started.
  void start();

  // Stops timers, the adapter stream and both loops, then upserts the
  // account as Stopped. Idempotent.
  void stop();

  // Enqueues an event on the reconcile loop.
  void pushEvent(Event event);

  void pause();
  void resume();

  AccountStatusView status() const;

  const std::string& userid() const { return config_.userid; }
  const std::string& symbol() const { return config_.instrument.symbol; }
  const AccountConfig& config() const { return config_; }

  bool isRunning() const { return running_.load(); }
  bool isPaused() const { return paused_.load(); }

  // Reconcile loop's bus, for tests and extra telemetry subscribers.
  EventBus& reconcileBus() { return reconcile_loop_.eventBus(); }

 private:
  // Clock-tick period: a quarter of the ack deadline, within [50 ms, 1 s].
  std::chrono::milliseconds tickPeriod() const;

  void hydrate(const SnapshotResult& snapshot);
  void wireBridges();
  void recordStatus(domain::AccountStatus status);

  const AccountConfig config_;
  const ITimeProvider& clock_;
  ProfitRecorder* recorder_;
  TelemetrySink telemetry_;

  EventLoopThread reconcile_loop_;
  OrderLedger ledger_;
  GridPlanner planner_;
  RiskGuard guard_;
  std::unique_ptr<ReconciliationEngine> engine_;

  std::unique_ptr<IExchangeAdapter> adapter_;
  std::unique_ptr<OrderRoutingThread> routing_;

  std::unique_ptr<PeriodicTimer> tick_timer_;
  std::unique_ptr<PeriodicTimer> snapshot_timer_;

  std::int64_t created_at_ms_{0};
  std::atomic<bool> running_{false};
  std::atomic<bool> paused_{false};
};

}  // namespace gridmm
