#include "gridmm/persistence/sqlite_account_store.hpp"
#include "gridmm/domain/errors.hpp"

#include <iostream>
#include <memory>

namespace gridmm {

namespace {

// Finalizes the statement when it goes out of scope.
struct StatementDeleter {
  void operator()(sqlite3_stmt* stmt) const { sqlite3_finalize(stmt); }
};
using Statement = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

constexpr const char* kCreateMonitorAccount =
    "CREATE TABLE IF NOT EXISTS monitor_account ("
    " id INTEGER PRIMARY KEY,"
    " userid TEXT UNIQUE NOT NULL,"
    " username TEXT NOT NULL,"
    " status INTEGER DEFAULT 0,"
    " created_at INTEGER,"
    " updated_at INTEGER)";

constexpr const char* kCreateProfitLog =
    "CREATE TABLE IF NOT EXISTS profit_log ("
    " id INTEGER PRIMARY KEY,"
    " userid TEXT NOT NULL,"
    " price FLOAT NOT NULL,"
    " position FLOAT NOT NULL,"
    " period_profit FLOAT NOT NULL,"
    " created_at INTEGER)";

constexpr const char* kUpsertAccount =
    "INSERT INTO monitor_account (userid, username, status, created_at,"
    " updated_at) VALUES (?1, ?2, ?3, ?4, ?5)"
    " ON CONFLICT(userid) DO UPDATE SET"
    " username = excluded.username,"
    " status = excluded.status,"
    " updated_at = excluded.updated_at";

constexpr const char* kInsertProfit =
    "INSERT INTO profit_log (userid, price, position, period_profit,"
    " created_at) VALUES (?1, ?2, ?3, ?4, ?5)";

constexpr const char* kSelectAccount =
    "SELECT userid, username, status, created_at, updated_at"
    " FROM monitor_account WHERE userid = ?1";

constexpr const char* kSelectProfits =
    "SELECT price, position, period_profit, created_at"
    " FROM profit_log WHERE userid = ?1 ORDER BY id";

std::string columnText(sqlite3_stmt* stmt, int col) {
  const unsigned char* text = sqlite3_column_text(stmt, col);
  return text ? reinterpret_cast<const char*>(text) : std::string();
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor: open the connection
// -----------------------------------------------------------------------------
SqliteAccountStore::SqliteAccountStore(const std::string& path) {
  if (sqlite3_open(path.c_str(), &db_) != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
    sqlite3_close(db_);
    db_ = nullptr;
    throw PersistenceError("cannot open database '" + path + "': " + msg);
  }
  std::cout << "[SqliteAccountStore] opened " << path << "\n";
}

SqliteAccountStore::~SqliteAccountStore() {
  if (db_ != nullptr) {
    sqlite3_close(db_);
  }
}

void SqliteAccountStore::initSchema() {
  std::lock_guard lock(mutex_);
  execute(kCreateMonitorAccount);
  execute(kCreateProfitLog);
}

// -----------------------------------------------------------------------------
// upsertAccount(): INSERT ... ON CONFLICT(userid) DO UPDATE
// -----------------------------------------------------------------------------
void SqliteAccountStore::upsertAccount(const domain::MonitorAccount& account) {
  std::lock_guard lock(mutex_);

  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db_, kUpsertAccount, -1, &raw, nullptr) !=
      SQLITE_OK) {
    fail("prepare upsert");
  }
  Statement stmt(raw);

  sqlite3_bind_text(raw, 1, account.userid.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(raw, 2, account.username.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int(raw, 3, static_cast<int>(account.status));
  sqlite3_bind_int64(raw, 4, account.created_at_ms);
  sqlite3_bind_int64(raw, 5, account.updated_at_ms);

  if (sqlite3_step(raw) != SQLITE_DONE) {
    fail("upsert account " + account.userid);
  }
}

void SqliteAccountStore::appendProfit(const std::string& userid,
                                      const domain::ProfitLogEntry& entry) {
  std::lock_guard lock(mutex_);

  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db_, kInsertProfit, -1, &raw, nullptr) !=
      SQLITE_OK) {
    fail("prepare profit insert");
  }
  Statement stmt(raw);

  sqlite3_bind_text(raw, 1, userid.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_double(raw, 2, entry.price);
  sqlite3_bind_double(raw, 3, entry.position);
  sqlite3_bind_double(raw, 4, entry.period_profit);
  sqlite3_bind_int64(raw, 5, entry.created_at_ms);

  if (sqlite3_step(raw) != SQLITE_DONE) {
    fail("append profit for " + userid);
  }
}

std::optional<domain::MonitorAccount> SqliteAccountStore::findAccount(
    const std::string& userid) const {
  std::lock_guard lock(mutex_);

  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db_, kSelectAccount, -1, &raw, nullptr) !=
      SQLITE_OK) {
    fail("prepare account select");
  }
  Statement stmt(raw);
  sqlite3_bind_text(raw, 1, userid.c_str(), -1, SQLITE_TRANSIENT);

  const int rc = sqlite3_step(raw);
  if (rc == SQLITE_DONE) {
    return std::nullopt;
  }
  if (rc != SQLITE_ROW) {
    fail("select account " + userid);
  }

  domain::MonitorAccount account;
  account.userid = columnText(raw, 0);
  account.username = columnText(raw, 1);
  account.status =
      static_cast<domain::AccountStatus>(sqlite3_column_int(raw, 2));
  account.created_at_ms = sqlite3_column_int64(raw, 3);
  account.updated_at_ms = sqlite3_column_int64(raw, 4);
  return account;
}

std::size_t SqliteAccountStore::accountCount() const {
  std::lock_guard lock(mutex_);
  return static_cast<std::size_t>(
      scalar("SELECT COUNT(*) FROM monitor_account"));
}

std::size_t SqliteAccountStore::profitCount() const {
  std::lock_guard lock(mutex_);
  return static_cast<std::size_t>(scalar("SELECT COUNT(*) FROM profit_log"));
}

std::vector<domain::ProfitLogEntry> SqliteAccountStore::profitsFor(
    const std::string& userid) const {
  std::lock_guard lock(mutex_);

  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db_, kSelectProfits, -1, &raw, nullptr) !=
      SQLITE_OK) {
    fail("prepare profit select");
  }
  Statement stmt(raw);
  sqlite3_bind_text(raw, 1, userid.c_str(), -1, SQLITE_TRANSIENT);

  std::vector<domain::ProfitLogEntry> out;
  int rc;
  while ((rc = sqlite3_step(raw)) == SQLITE_ROW) {
    domain::ProfitLogEntry entry;
    entry.price = sqlite3_column_double(raw, 0);
    entry.position = sqlite3_column_double(raw, 1);
    entry.period_profit = sqlite3_column_double(raw, 2);
    entry.created_at_ms = sqlite3_column_int64(raw, 3);
    out.push_back(entry);
  }
  if (rc != SQLITE_DONE) {
    fail("select profits for " + userid);
  }
  return out;
}

void SqliteAccountStore::execute(const std::string& sql) const {
  char* err = nullptr;
  if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
    std::string msg = err ? err : "unknown error";
    sqlite3_free(err);
    throw PersistenceError(msg + " in: " + sql);
  }
}

std::int64_t SqliteAccountStore::scalar(const std::string& sql) const {
  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &raw, nullptr) != SQLITE_OK) {
    fail("prepare " + sql);
  }
  Statement stmt(raw);
  if (sqlite3_step(raw) != SQLITE_ROW) {
    fail("step " + sql);
  }
  return sqlite3_column_int64(raw, 0);
}

void SqliteAccountStore::fail(const std::string& what) const {
  throw PersistenceError(what + ": " + sqlite3_errmsg(db_));
}

}  // namespace gridmm
