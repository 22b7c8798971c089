#include "gridmm/concurrent/event_loop_thread.hpp"

#include <chrono>
#include <exception>
#include <iostream>

namespace gridmm {

namespace {

constexpr auto kIdleWaitTimeout = std::chrono::milliseconds(10);

}  // namespace

EventLoopThread::EventLoopThread(std::string name) : name_(std::move(name)) {}

EventLoopThread::~EventLoopThread() { stop(); }

void EventLoopThread::start() {
  if (thread_.joinable()) {
    return;
  }
  running_.store(true);
  thread_ = std::thread([this] { run(); });
}

void EventLoopThread::stop() {
  if (!thread_.joinable()) {
    return;
  }
  running_.store(false);
  stop_cv_.notify_all();
  thread_.join();
}

// -----------------------------------------------------------------------------
// run(): drain the queue; sleep briefly when idle
// -----------------------------------------------------------------------------
// A handler that throws must not kill the loop: the event is logged and
// dropped, and the next one is processed. Local invariants were checked by
// the handler before it threw, so no half-applied state survives.
// -----------------------------------------------------------------------------
void EventLoopThread::run() {
  while (running_.load()) {
    std::optional<Event> event = queue_.try_pop();

    if (event) {
      try {
        bus_.publish(*event);
      } catch (const std::exception& e) {
        std::cerr << "[" << name_ << "] ERROR: handler threw: " << e.what()
                  << "\n";
      }
      continue;
    }

    std::unique_lock lock(stop_mutex_);
    stop_cv_.wait_for(lock, kIdleWaitTimeout,
                      [this] { return !running_.load(); });
  }
}

}  // namespace gridmm
