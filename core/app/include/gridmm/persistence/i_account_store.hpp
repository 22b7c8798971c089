#pragma once

#include "gridmm/domain/monitor_account.hpp"
#include "gridmm/domain/profit_log_entry.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace gridmm {

// -----------------------------------------------------------------------------
// IAccountStore — narrow repository over the relational store
// -----------------------------------------------------------------------------
//
// @brief  Schema creation, MonitorAccount upsert-by-userid, append-only
//         profit log, and the few reads the agent and tests need.
//
// @details
// Every method throws PersistenceError on failure. Implementations must be
// safe to call from several threads; in practice only the ProfitRecorder
// worker and startup code touch the store.
//
// Ownership:
//   Owned by GridAgent via std::unique_ptr; shared by reference with the
//   ProfitRecorder.
// -----------------------------------------------------------------------------
class IAccountStore {
 public:
  virtual ~IAccountStore() = default;

  // Creates the tables if they do not exist. Idempotent.
  virtual void initSchema() = 0;

  // Insert, or update username/status/updated_at of the row with the same
  // userid. created_at of an existing row is preserved.
  virtual void upsertAccount(const domain::MonitorAccount& account) = 0;

  virtual void appendProfit(const std::string& userid,
                            const domain::ProfitLogEntry& entry) = 0;

  virtual std::optional<domain::MonitorAccount> findAccount(
      const std::string& userid) const = 0;

  virtual std::size_t accountCount() const = 0;

  virtual std::size_t profitCount() const = 0;

  // Oldest first.
  virtual std::vector<domain::ProfitLogEntry> profitsFor(
      const std::string& userid) const = 0;
};

}  // namespace gridmm
