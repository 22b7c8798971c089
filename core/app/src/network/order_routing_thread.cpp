#include "gridmm/network/order_routing_thread.hpp"

#include <iostream>
#include <utility>

namespace gridmm {

// -----------------------------------------------------------------------------
// Constructor: create the gateway on the (not yet running) loop's bus
// -----------------------------------------------------------------------------
OrderRoutingThread::OrderRoutingThread(IExchangeAdapter& adapter,
                                       const ITimeProvider& time_provider,
                                       std::string symbol, RetryPolicy retry,
                                       std::int64_t call_deadline_ms,
                                       ExecutionGateway::Sleeper sleeper)
    : loop_("order_routing:" + symbol) {
  gateway_ = std::make_unique<ExecutionGateway>(
      loop_.eventBus(), adapter, time_provider, std::move(symbol), retry,
      call_deadline_ms, std::move(sleeper));
}

// -----------------------------------------------------------------------------
// Destructor: RAII stop
// -----------------------------------------------------------------------------
OrderRoutingThread::~OrderRoutingThread() {
  stop();
  gateway_.reset();
}

// -----------------------------------------------------------------------------
// start(): start loop thread
// -----------------------------------------------------------------------------
void OrderRoutingThread::start() {
  if (running_) {
    return;
  }

  loop_.start();
  running_ = true;

  std::cout << "[OrderRoutingThread] started.\n";
}

// -----------------------------------------------------------------------------
// stop(): stop loop
// -----------------------------------------------------------------------------
void OrderRoutingThread::stop() {
  if (!running_) {
    return;
  }

  loop_.stop();
  running_ = false;

  std::cout << "[OrderRoutingThread] stopped.\n";
}

// -----------------------------------------------------------------------------
// push(): enqueue event for this thread
// -----------------------------------------------------------------------------
void OrderRoutingThread::push(Event event) {
  loop_.push(std::move(event));
}

// -----------------------------------------------------------------------------
// eventBus(): access the internal bus for cross-thread bridge subscriptions
// -----------------------------------------------------------------------------
EventBus& OrderRoutingThread::eventBus() {
  return loop_.eventBus();
}

}  // namespace gridmm
