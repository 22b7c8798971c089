#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>

namespace gridmm {

// -----------------------------------------------------------------------------
// ThreadSafeQueue<T> — unbounded MPMC FIFO guarded by a mutex
// -----------------------------------------------------------------------------
//
// @brief  The hand-off point between threads. Every thread boundary in the
//         agent (adapter callback → reconcile loop, reconcile loop → routing
//         thread, any thread → profit recorder) is one of these.
//
// @details
// Producers call push(); consumers call pop() (blocking), try_pop()
// (non-blocking) or pop_for() (blocking with timeout). FIFO order is
// preserved per queue, which is what keeps venue events for one account in
// arrival order.
//
// Thread model:
//   All member functions are safe to call concurrently from any thread.
//
// Ownership:
//   Owned by value by the thread wrapper that drains it (EventLoopThread,
//   OrderRoutingThread, ProfitRecorder). Non-copyable, non-movable because
//   std::mutex is neither.
// -----------------------------------------------------------------------------
template <typename T>
class ThreadSafeQueue {
 public:
  ThreadSafeQueue() = default;

  ThreadSafeQueue(const ThreadSafeQueue&) = delete;
  ThreadSafeQueue& operator=(const ThreadSafeQueue&) = delete;

  ThreadSafeQueue(ThreadSafeQueue&&) = delete;
  ThreadSafeQueue& operator=(ThreadSafeQueue&&) = delete;

  void push(T value) {
    {
      std::lock_guard lock(mutex_);
      queue_.push_back(std::move(value));
    }
    condition_.notify_one();
  }

  // Blocks until an element is available.
  T pop() {
    std::unique_lock lock(mutex_);
    condition_.wait(lock, [this] { return !queue_.empty(); });

    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  std::optional<T> try_pop() {
    std::lock_guard lock(mutex_);
    if (queue_.empty()) {
      return std::nullopt;
    }
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  // -------------------------------------------------------------------------
  // pop_for(timeout)
  // -------------------------------------------------------------------------
  // @brief  Waits up to `timeout` for an element.
  //
  // @return The front element, or std::nullopt if the queue stayed empty.
  //
  // @details
  // Used by worker threads that must also notice a stop flag: they loop on
  // pop_for() with a short timeout instead of blocking forever in pop().
  // -------------------------------------------------------------------------
  template <typename Rep, typename Period>
  std::optional<T> pop_for(std::chrono::duration<Rep, Period> timeout) {
    std::unique_lock lock(mutex_);
    if (!condition_.wait_for(lock, timeout,
                             [this] { return !queue_.empty(); })) {
      return std::nullopt;
    }
    T value = std::move(queue_.front());
    queue_.pop_front();
    return value;
  }

  bool empty() const {
    std::lock_guard lock(mutex_);
    return queue_.empty();
  }

  std::size_t size() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
  }

 private:
  mutable std::mutex mutex_;
  std::condition_variable condition_;
  std::deque<T> queue_;
};

}  // namespace gridmm
