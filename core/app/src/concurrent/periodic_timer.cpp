#include "gridmm/concurrent/periodic_timer.hpp"

#include <exception>
#include <iostream>
#include <utility>

namespace gridmm {

PeriodicTimer::PeriodicTimer(std::string name,
                             std::chrono::milliseconds period,
                             Callback callback)
    : name_(std::move(name)), period_(period), callback_(std::move(callback)) {}

PeriodicTimer::~PeriodicTimer() { stop(); }

void PeriodicTimer::start() {
  if (thread_.joinable()) {
    return;
  }
  running_.store(true);
  thread_ = std::thread([this] { run(); });
}

void PeriodicTimer::stop() {
  if (!thread_.joinable()) {
    return;
  }
  {
    std::lock_guard lock(mutex_);
    running_.store(false);
  }
  cv_.notify_all();
  thread_.join();
}

void PeriodicTimer::run() {
  auto next = std::chrono::steady_clock::now() + period_;

  while (running_.load()) {
    {
      std::unique_lock lock(mutex_);
      if (cv_.wait_until(lock, next, [this] { return !running_.load(); })) {
        break;
      }
    }

    try {
      callback_();
    } catch (const std::exception& e) {
      std::cerr << "[" << name_ << "] ERROR: timer callback threw: "
                << e.what() << "\n";
    }

    next += period_;
    // Skip ticks missed while the callback or the machine was stalled.
    const auto now = std::chrono::steady_clock::now();
    if (next < now) {
      next = now + period_;
    }
  }
}

}  // namespace gridmm
