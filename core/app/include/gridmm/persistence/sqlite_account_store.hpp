#pragma once

#include "gridmm/persistence/i_account_store.hpp"

#include <sqlite3.h>

#include <mutex>
#include <string>

namespace gridmm {

// -----------------------------------------------------------------------------
// SqliteAccountStore — IAccountStore on a single SQLite connection
// -----------------------------------------------------------------------------
//
// @brief  Owns one sqlite3 handle guarded by a mutex.
//
// @details
// Schema:
//   monitor_account(id INTEGER PRIMARY KEY, userid TEXT UNIQUE NOT NULL,
//                   username TEXT NOT NULL, status INTEGER DEFAULT 0,
//                   created_at INTEGER, updated_at INTEGER)
//   profit_log(id INTEGER PRIMARY KEY, userid TEXT NOT NULL,
//              price FLOAT NOT NULL, position FLOAT NOT NULL,
//              period_profit FLOAT NOT NULL, created_at INTEGER)
// Timestamps are epoch milliseconds.
//
// The upsert is a single INSERT ... ON CONFLICT(userid) DO UPDATE, so two
// agents starting with the same userid never create a second row.
//
// Pass ":memory:" as the path for a private in-memory database (tests).
// -----------------------------------------------------------------------------
class SqliteAccountStore final : public IAccountStore {
 public:
  // Opens (creating if needed) the database. Throws PersistenceError.
  explicit SqliteAccountStore(const std::string& path);

  ~SqliteAccountStore() override;

  SqliteAccountStore(const SqliteAccountStore&) = delete;
  SqliteAccountStore& operator=(const SqliteAccountStore&) = delete;
  SqliteAccountStore(SqliteAccountStore&&) = delete;
  SqliteAccountStore& operator=(SqliteAccountStore&&) = delete;

  void initSchema() override;

  void upsertAccount(const domain::MonitorAccount& account) override;

  void appendProfit(const std::string& userid,
                    const domain::ProfitLogEntry& entry) override;

  std::optional<domain::MonitorAccount> findAccount(
      const std::string& userid) const override;

  std::size_t accountCount() const override;

  std::size_t profitCount() const override;

  std::vector<domain::ProfitLogEntry> profitsFor(
      const std::string& userid) const override;

 private:
  // Runs SQL with no parameters and no result rows. Caller holds mutex_.
  void execute(const std::string& sql) const;

  // Single-integer query. Caller holds mutex_.
  std::int64_t scalar(const std::string& sql) const;

  // Throws PersistenceError carrying sqlite3_errmsg(). Caller holds mutex_.
  [[noreturn]] void fail(const std::string& what) const;

  sqlite3* db_{nullptr};
  mutable std::mutex mutex_;
};

}  // namespace gridmm
