// =============================================================================
// sqlite_account_store_test.cpp
// =============================================================================
// Unit tests for gridmm::SqliteAccountStore against an in-memory database.
//
// Validates:
//   - initSchema() is idempotent
//   - upsertAccount() keeps one row per userid and preserves created_at
//   - Profit entries are stored per account, oldest first
//   - Statements against a missing schema throw PersistenceError
// =============================================================================

#include "gridmm/domain/errors.hpp"
#include "gridmm/persistence/sqlite_account_store.hpp"

#include <gtest/gtest.h>

using gridmm::domain::AccountStatus;

class SqliteAccountStoreTest : public ::testing::Test {
 protected:
  gridmm::SqliteAccountStore store{":memory:"};

  void SetUp() override { store.initSchema(); }

  static gridmm::domain::MonitorAccount account(const std::string& userid,
                                                AccountStatus status,
                                                std::int64_t created,
                                                std::int64_t updated) {
    gridmm::domain::MonitorAccount a;
    a.userid = userid;
    a.username = userid + "-name";
    a.status = status;
    a.created_at_ms = created;
    a.updated_at_ms = updated;
    return a;
  }
};

// -----------------------------------------------------------------------------
// 1. Running initSchema() twice is harmless.
// -----------------------------------------------------------------------------
TEST_F(SqliteAccountStoreTest, InitSchemaIsIdempotent) {
  EXPECT_NO_THROW(store.initSchema());
  EXPECT_EQ(store.accountCount(), 0u);
  EXPECT_EQ(store.profitCount(), 0u);
}

// -----------------------------------------------------------------------------
// 2. A second upsert for the same userid updates in place: one row, new
//    status and updated_at, original created_at.
// Why: The agent upserts on every start and status change; duplicate rows
//      would make the account table grow without bound.
// -----------------------------------------------------------------------------
TEST_F(SqliteAccountStoreTest, UpsertKeepsOneRowAndCreatedAt) {
  store.upsertAccount(account("u1", AccountStatus::Active, 1000, 1000));
  store.upsertAccount(account("u1", AccountStatus::Paused, 9000, 9000));

  EXPECT_EQ(store.accountCount(), 1u);
  auto found = store.findAccount("u1");
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(found->username, "u1-name");
  EXPECT_EQ(found->status, AccountStatus::Paused);
  EXPECT_EQ(found->created_at_ms, 1000);
  EXPECT_EQ(found->updated_at_ms, 9000);
}

// -----------------------------------------------------------------------------
// 3. Unknown accounts are not found.
// -----------------------------------------------------------------------------
TEST_F(SqliteAccountStoreTest, UnknownAccountIsNullopt) {
  store.upsertAccount(account("u1", AccountStatus::Active, 1, 1));
  EXPECT_FALSE(store.findAccount("u2").has_value());
}

// -----------------------------------------------------------------------------
// 4. Profit entries are kept per account, in insertion order.
// -----------------------------------------------------------------------------
TEST_F(SqliteAccountStoreTest, ProfitsArePerAccountOldestFirst) {
  gridmm::domain::ProfitLogEntry first{100.0, 1.0, 0.5, 1000};
  gridmm::domain::ProfitLogEntry second{101.0, 0.0, -0.25, 2000};
  gridmm::domain::ProfitLogEntry other{50.0, -2.0, 3.0, 1500};

  store.appendProfit("u1", first);
  store.appendProfit("u2", other);
  store.appendProfit("u1", second);

  EXPECT_EQ(store.profitCount(), 3u);
  auto profits = store.profitsFor("u1");
  ASSERT_EQ(profits.size(), 2u);
  EXPECT_DOUBLE_EQ(profits[0].price, 100.0);
  EXPECT_DOUBLE_EQ(profits[0].period_profit, 0.5);
  EXPECT_EQ(profits[0].created_at_ms, 1000);
  EXPECT_DOUBLE_EQ(profits[1].position, 0.0);
  EXPECT_DOUBLE_EQ(profits[1].period_profit, -0.25);

  EXPECT_EQ(store.profitsFor("u2").size(), 1u);
  EXPECT_TRUE(store.profitsFor("nobody").empty());
}

// -----------------------------------------------------------------------------
// 5. Writing before the schema exists throws PersistenceError.
// -----------------------------------------------------------------------------
TEST(SqliteAccountStoreNoSchemaTest, WriteWithoutSchemaThrows) {
  gridmm::SqliteAccountStore store(":memory:");
  gridmm::domain::ProfitLogEntry entry{100.0, 1.0, 0.5, 1000};

  EXPECT_THROW(store.appendProfit("u1", entry), gridmm::PersistenceError);
  EXPECT_THROW(store.accountCount(), gridmm::PersistenceError);
}

// -----------------------------------------------------------------------------
// 6. An unopenable path throws PersistenceError at construction.
// -----------------------------------------------------------------------------
TEST(SqliteAccountStoreOpenTest, BadPathThrows) {
  EXPECT_THROW(gridmm::SqliteAccountStore("/nonexistent/dir/gridmm.db"),
               gridmm::PersistenceError);
}
