#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace gridmm {

// -----------------------------------------------------------------------------
// PeriodicTimer — runs a callback every `period` on its own thread
// -----------------------------------------------------------------------------
//
// @brief  Drives clock ticks and snapshot requests for one account.
//
// @details
// The first call happens one period after start(). stop() wakes the thread
// immediately through the condition variable instead of waiting out the
// current period. The callback should only push into a queue; anything slow
// delays the next tick.
//
// Thread model:
//   start()/stop() from the owning thread; callback on the timer thread.
// -----------------------------------------------------------------------------
class PeriodicTimer {
 public:
  using Callback = std::function<void()>;

  PeriodicTimer(std::string name, std::chrono::milliseconds period,
                Callback callback);

  ~PeriodicTimer();

  PeriodicTimer(const PeriodicTimer&) = delete;
  PeriodicTimer& operator=(const PeriodicTimer&) = delete;
  PeriodicTimer(PeriodicTimer&&) = delete;
  PeriodicTimer& operator=(PeriodicTimer&&) = delete;

  void start();
  void stop();

  bool isRunning() const { return running_.load(); }

 private:
  void run();

  std::string name_;
  std::chrono::milliseconds period_;
  Callback callback_;

  std::atomic<bool> running_{false};
  std::mutex mutex_;
  std::condition_variable cv_;
  std::thread thread_;
};

}  // namespace gridmm
