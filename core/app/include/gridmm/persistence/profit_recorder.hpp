#pragma once

#include "gridmm/concurrent/thread_safe_queue.hpp"
#include "gridmm/config/grid_config.hpp"
#include "gridmm/domain/monitor_account.hpp"
#include "gridmm/domain/profit_log_entry.hpp"
#include "gridmm/events/event_types.hpp"
#include "gridmm/persistence/i_account_store.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <thread>

namespace gridmm {

// -----------------------------------------------------------------------------
// ProfitRecorder — asynchronous writer in front of IAccountStore
// -----------------------------------------------------------------------------
//
// @brief  Queues ProfitLogEntry appends and MonitorAccount upserts and
//         writes them on a worker thread, so persistence latency or outages
//         never reach the trading path.
//
// @details
// recordProfit()/recordAccount() push onto a ThreadSafeQueue and return
// immediately. The worker writes jobs in FIFO order. A write that throws
// PersistenceError is retried with the RetryPolicy's exponential backoff;
// once max_attempts is spent the job is dropped, logged, and a
// HeartbeatEvent with status "PersistenceFailure" is handed to the health
// callback. Trading continues either way.
//
// stop() lets the worker drain what is already queued before it exits.
//
// Thread model:
//   Enqueue from any thread. The health callback runs on the worker and
//   must be thread-safe (GridAgent forwards it to the IPC telemetry queue).
//
// Ownership:
//   Owned by GridAgent and shared by reference with every AccountContext.
//   Holds a reference to the store, which must outlive it.
// -----------------------------------------------------------------------------
class ProfitRecorder {
 public:
  using HealthCallback = std::function<void(const HeartbeatEvent&)>;
  using Sleeper = std::function<void(std::chrono::milliseconds)>;

  ProfitRecorder(IAccountStore& store, RetryPolicy retry,
                 HealthCallback on_health = nullptr,
                 Sleeper sleeper = nullptr);

  ~ProfitRecorder();

  ProfitRecorder(const ProfitRecorder&) = delete;
  ProfitRecorder& operator=(const ProfitRecorder&) = delete;
  ProfitRecorder(ProfitRecorder&&) = delete;
  ProfitRecorder& operator=(ProfitRecorder&&) = delete;

  void start();

  // Drains the queue, then joins the worker. Idempotent.
  void stop();

  void recordProfit(const std::string& userid,
                    const domain::ProfitLogEntry& entry);

  void recordAccount(const domain::MonitorAccount& account);

  std::size_t pending() const { return queue_.size(); }
  std::uint64_t writtenCount() const { return written_.load(); }
  std::uint64_t droppedCount() const { return dropped_.load(); }

 private:
  static constexpr auto kPollTimeout = std::chrono::milliseconds(50);

  struct Job {
    enum class Kind { Profit, Account } kind{Kind::Profit};
    std::string userid;
    domain::ProfitLogEntry entry;
    domain::MonitorAccount account;
  };

  void run();

  // Writes one job with retries. Returns false when the budget ran out.
  bool write(const Job& job);

  IAccountStore& store_;
  const RetryPolicy retry_;
  HealthCallback on_health_;
  Sleeper sleeper_;

  ThreadSafeQueue<Job> queue_;
  std::thread thread_;
  std::atomic<bool> running_{false};
  std::atomic<std::uint64_t> written_{0};
  std::atomic<std::uint64_t> dropped_{0};
  std::uint64_t health_sequence_{0};
};

}  // namespace gridmm
