#pragma once

#include "gridmm/concurrent/thread_safe_queue.hpp"
#include "gridmm/eventbus/event_bus.hpp"
#include "gridmm/events/event.hpp"

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>

namespace gridmm {

// -----------------------------------------------------------------------------
// EventLoopThread — one thread, one queue, one bus
// -----------------------------------------------------------------------------
//
// @brief  Owns a worker thread that drains a ThreadSafeQueue<Event> and
//         publishes each event on its own EventBus.
//
// @details
// This is the account's reconcile loop. The ExecutionGateway, the adapter
// event sink and the periodic timer all push() into it from their own
// threads; the OrderLedger and ReconciliationEngine subscribe to its bus and
// therefore only ever run on this thread. That single-consumer property is
// what lets the ledger be mutated without a lock.
//
// When the queue is empty the thread waits on a condition variable with a
// short timeout so stop() is noticed promptly.
//
// Lifecycle:
//   Subscribe on eventBus() before start(). stop() is idempotent and is
//   called by the destructor.
// -----------------------------------------------------------------------------
class EventLoopThread {
 public:
  explicit EventLoopThread(std::string name = "event_loop");

  ~EventLoopThread();

  EventLoopThread(const EventLoopThread&) = delete;
  EventLoopThread& operator=(const EventLoopThread&) = delete;
  EventLoopThread(EventLoopThread&&) = delete;
  EventLoopThread& operator=(EventLoopThread&&) = delete;

  void start();

  void stop();

  void push(Event event) { queue_.push(std::move(event)); }

  EventBus& eventBus() { return bus_; }

  const EventBus& eventBus() const { return bus_; }

  bool isRunning() const { return running_.load(); }

 private:
  void run();

  std::string name_;
  ThreadSafeQueue<Event> queue_;
  EventBus bus_;
  std::atomic<bool> running_{false};
  std::mutex stop_mutex_;
  std::condition_variable stop_cv_;
  std::thread thread_;
};

}  // namespace gridmm
