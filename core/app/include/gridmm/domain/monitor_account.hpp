#pragma once

#include <cstdint>
#include <string>

namespace gridmm {
namespace domain {

// -----------------------------------------------------------------------------
// AccountStatus
// -----------------------------------------------------------------------------
// Persisted as a small integer in monitor_account.status. 0 is the column
// default, so Active must stay 0.
// -----------------------------------------------------------------------------
enum class AccountStatus : int {
  Active = 0,
  Paused = 1,
  Stopped = 2,
};

inline const char* toString(AccountStatus s) {
  switch (s) {
    case AccountStatus::Active:  return "Active";
    case AccountStatus::Paused:  return "Paused";
    case AccountStatus::Stopped: return "Stopped";
  }
  return "Unknown";
}

// -----------------------------------------------------------------------------
// MonitorAccount — identity and status of one running agent instance
// -----------------------------------------------------------------------------
// Upserted by userid on startup and on every status change. Timestamps are
// epoch milliseconds; created_at is preserved by the store on update.
// -----------------------------------------------------------------------------
struct MonitorAccount {
  std::string userid;
  std::string username;
  AccountStatus status{AccountStatus::Active};
  std::int64_t created_at_ms{0};
  std::int64_t updated_at_ms{0};
};

}  // namespace domain
}  // namespace gridmm
