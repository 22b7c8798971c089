#include "gridmm/persistence/profit_recorder.hpp"
#include "gridmm/domain/errors.hpp"

#include <iostream>
#include <utility>

namespace gridmm {

ProfitRecorder::ProfitRecorder(IAccountStore& store, RetryPolicy retry,
                               HealthCallback on_health, Sleeper sleeper)
    : store_(store),
      retry_(retry),
      on_health_(std::move(on_health)),
      sleeper_(std::move(sleeper)) {
  if (!sleeper_) {
    sleeper_ = [](std::chrono::milliseconds d) {
      std::this_thread::sleep_for(d);
    };
  }
}

ProfitRecorder::~ProfitRecorder() { stop(); }

void ProfitRecorder::start() {
  if (thread_.joinable()) {
    return;
  }
  running_.store(true);
  thread_ = std::thread([this] { run(); });
  std::cout << "[ProfitRecorder] started.\n";
}

void ProfitRecorder::stop() {
  if (!thread_.joinable()) {
    return;
  }
  running_.store(false);
  thread_.join();
  std::cout << "[ProfitRecorder] stopped. written=" << written_.load()
            << " dropped=" << dropped_.load() << "\n";
}

void ProfitRecorder::recordProfit(const std::string& userid,
                                  const domain::ProfitLogEntry& entry) {
  Job job;
  job.kind = Job::Kind::Profit;
  job.userid = userid;
  job.entry = entry;
  queue_.push(std::move(job));
}

void ProfitRecorder::recordAccount(const domain::MonitorAccount& account) {
  Job job;
  job.kind = Job::Kind::Account;
  job.userid = account.userid;
  job.account = account;
  queue_.push(std::move(job));
}

// -----------------------------------------------------------------------------
// run(): pop with timeout so stop() is noticed; drain before exit
// -----------------------------------------------------------------------------
void ProfitRecorder::run() {
  while (running_.load()) {
    if (auto job = queue_.pop_for(kPollTimeout)) {
      write(*job);
    }
  }
  while (auto job = queue_.try_pop()) {
    write(*job);
  }
}

// -----------------------------------------------------------------------------
// write(): one job, bounded retry with backoff
// -----------------------------------------------------------------------------
bool ProfitRecorder::write(const Job& job) {
  const char* what =
      job.kind == Job::Kind::Profit ? "profit append" : "account upsert";
  std::string last_error;

  for (int attempt = 1; attempt <= retry_.max_attempts; ++attempt) {
    try {
      if (job.kind == Job::Kind::Profit) {
        store_.appendProfit(job.userid, job.entry);
      } else {
        store_.upsertAccount(job.account);
      }
      written_.fetch_add(1);
      return true;
    } catch (const PersistenceError& e) {
      last_error = e.what();
      std::cerr << "[ProfitRecorder] WARNING: " << what << " for "
                << job.userid << " failed (attempt " << attempt << "/"
                << retry_.max_attempts << "): " << last_error << "\n";
    }
    if (attempt < retry_.max_attempts) {
      sleeper_(std::chrono::milliseconds(retry_.backoffFor(attempt)));
    }
  }

  dropped_.fetch_add(1);
  std::cerr << "[ProfitRecorder] ERROR: giving up on " << what << " for "
            << job.userid << ".\n";

  if (on_health_) {
    HeartbeatEvent hb;
    hb.component_id = "ProfitRecorder:" + job.userid;
    hb.status = "PersistenceFailure";
    hb.detail = std::string(what) + ": " + last_error;
    hb.timestamp = std::chrono::system_clock::now();
    hb.sequence_id = ++health_sequence_;
    on_health_(hb);
  }
  return false;
}

}  // namespace gridmm
