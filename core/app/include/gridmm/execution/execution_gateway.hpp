#pragma once

#include "gridmm/config/grid_config.hpp"
#include "gridmm/eventbus/event_bus.hpp"
#include "gridmm/events/command_events.hpp"
#include "gridmm/events/event_types.hpp"
#include "gridmm/exchange/i_exchange_adapter.hpp"
#include "gridmm/time/i_time_provider.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <iostream>
#include <string>

namespace gridmm {

// -----------------------------------------------------------------------------
// ExecutionGateway — the only component that calls the exchange adapter
// -----------------------------------------------------------------------------
//
// @brief  Turns order commands from the reconcile loop into adapter calls and
//         publishes their outcomes as result events.
//
// @details
// Subscribes on the routing loop's bus to:
//   PlaceOrderCommand   → adapter.placeOrder   → PlaceResultEvent
//   CancelOrderCommand  → adapter.cancelOrder  → CancelResultEvent
//   QueryOrderCommand   → adapter.queryOrder   → StatusQueryResultEvent
//   SnapshotRequestEvent→ adapter.getAccountSnapshot → AccountSnapshotEvent
//
// Every call carries call_deadline_ms. TransportFailure and RateLimited are
// retried up to RetryPolicy::max_attempts with exponential backoff. Timeout
// is never retried here: a timed-out place may have reached the venue, and
// only a status query can tell.
//
// Results are published on the same bus; AccountContext bridges them back
// to the reconcile loop.
//
// Thread model:
//   All handlers run on the OrderRoutingThread worker, so blocking in the
//   adapter (and in backoff sleeps) never stalls reconciliation.
//   fetchSnapshot() is called from the main thread during startup, before
//   the routing loop runs.
//
// Ownership:
//   Owned by OrderRoutingThread. Holds references to the routing bus, the
//   adapter and the time provider, all of which outlive it.
// -----------------------------------------------------------------------------
class ExecutionGateway {
 public:
  // Injectable so tests can run retry paths without real sleeps.
  using Sleeper = std::function<void(std::chrono::milliseconds)>;

  ExecutionGateway(EventBus& bus, IExchangeAdapter& adapter,
                   const ITimeProvider& time_provider, std::string symbol,
                   RetryPolicy retry, std::int64_t call_deadline_ms,
                   Sleeper sleeper = nullptr);

  ~ExecutionGateway();

  ExecutionGateway(const ExecutionGateway&) = delete;
  ExecutionGateway& operator=(const ExecutionGateway&) = delete;
  ExecutionGateway(ExecutionGateway&&) = delete;
  ExecutionGateway& operator=(ExecutionGateway&&) = delete;

  // -------------------------------------------------------------------------
  // fetchSnapshot()
  // -------------------------------------------------------------------------
  // @brief  Synchronous snapshot with the same retry policy. Used by
  //         AccountContext::start() to seed the ledger.
  // -------------------------------------------------------------------------
  SnapshotResult fetchSnapshot();

  // Adapter calls made so far, retries included.
  std::uint64_t callCount() const { return call_count_; }

 private:
  void onPlace(const PlaceOrderCommand& cmd);
  void onCancel(const CancelOrderCommand& cmd);
  void onQuery(const QueryOrderCommand& cmd);
  void onSnapshotRequest(const SnapshotRequestEvent& req);

  // Runs `call` until it returns a non-retryable error or the attempt
  // budget is spent.
  template <typename Call>
  auto withRetry(const char* op, Call&& call) -> decltype(call()) {
    auto result = call();
    ++call_count_;
    for (int attempt = 1;
         attempt < retry_.max_attempts && domain::isRetryable(result.error);
         ++attempt) {
      const auto backoff =
          std::chrono::milliseconds(retry_.backoffFor(attempt));
      std::cerr << "[ExecutionGateway] WARNING: " << op << " failed with "
                << domain::toString(result.error) << " (attempt " << attempt
                << "/" << retry_.max_attempts << "), retrying in "
                << backoff.count() << " ms.\n";
      sleeper_(backoff);
      result = call();
      ++call_count_;
    }
    return result;
  }

  EventBus& bus_;
  IExchangeAdapter& adapter_;
  const ITimeProvider& time_provider_;
  const std::string symbol_;
  const RetryPolicy retry_;
  const std::int64_t call_deadline_ms_;
  Sleeper sleeper_;

  std::uint64_t call_count_{0};

  EventBus::SubscriptionId place_sub_id_{0};
  EventBus::SubscriptionId cancel_sub_id_{0};
  EventBus::SubscriptionId query_sub_id_{0};
  EventBus::SubscriptionId snapshot_sub_id_{0};
};

}  // namespace gridmm
