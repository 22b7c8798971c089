// =============================================================================
// config_loader_test.cpp
// =============================================================================
// Unit tests for gridmm::ConfigLoader and the validate() rules of the config
// structs.
//
// Validates:
//   - A minimal document fills every omitted field with its default
//   - Grid, retry and gateway sections override the defaults
//   - Malformed JSON and missing required keys become ConfigurationError
//   - Invalid grid parameters are rejected at load time
//   - Fix-order and auto-close cannot both be enabled
//   - Duplicate userids are rejected
//   - RetryPolicy::backoffFor() grows geometrically
// =============================================================================

#include "gridmm/config/config_loader.hpp"
#include "gridmm/domain/errors.hpp"

#include <gtest/gtest.h>

#include <string>

namespace {

const char* kMinimalConfig = R"({
  "accounts": [
    { "userid": "u1", "instrument": { "symbol": "BTC-USD" } }
  ]
})";

}  // namespace

class ConfigLoaderTest : public ::testing::Test {
 protected:
  static std::string accountWithGrid(const std::string& grid_json) {
    return std::string(R"({"accounts":[{"userid":"u1",)") +
           R"("instrument":{"symbol":"BTC-USD","tick_size":0.5,"lot_size":0.1},)" +
           R"("grid":)" + grid_json + "}]}";
  }
};

// -----------------------------------------------------------------------------
// 1. A minimal config loads and omitted fields take their defaults.
// -----------------------------------------------------------------------------
TEST_F(ConfigLoaderTest, MinimalConfigUsesDefaults) {
  gridmm::AppConfig config = gridmm::ConfigLoader::parse(kMinimalConfig);

  EXPECT_EQ(config.database_path, "gridmm.db");
  ASSERT_EQ(config.accounts.size(), 1u);

  const auto& account = config.accounts[0];
  EXPECT_EQ(account.userid, "u1");
  EXPECT_EQ(account.username, "u1");
  EXPECT_EQ(account.adapter, gridmm::AdapterKind::Paper);
  EXPECT_EQ(account.instrument.symbol, "BTC-USD");
  EXPECT_EQ(account.grid.level_count, 3);
  EXPECT_EQ(account.grid.distance_mode, gridmm::DistanceMode::Percentage);
  EXPECT_FALSE(account.grid.fix_order_enabled);
  EXPECT_FALSE(account.grid.auto_close_enabled);
  EXPECT_EQ(account.retry.max_attempts, 3);
}

// -----------------------------------------------------------------------------
// 2. Every section overrides its defaults.
// -----------------------------------------------------------------------------
TEST_F(ConfigLoaderTest, SectionsOverrideDefaults) {
  const char* text = R"({
    "database": "/tmp/agent.db",
    "market_data_endpoint": "tcp://127.0.0.1:7000",
    "ipc": { "command_endpoint": "", "telemetry_endpoint": "" },
    "persistence_retry": { "max_attempts": 5, "initial_backoff_ms": 10 },
    "accounts": [{
      "userid": "alice",
      "username": "Alice",
      "adapter": "zmq",
      "gateway": { "command_endpoint": "tcp://h:1", "event_endpoint": "tcp://h:2" },
      "instrument": { "symbol": "ETH-USD", "tick_size": 0.1, "lot_size": 0.01 },
      "grid": {
        "level_count": 5, "distance": 2.5, "distance_mode": "absolute",
        "order_size": 0.5, "max_position": 2.0, "auto_close_enabled": true,
        "ack_deadline_ms": 800, "profit_log_interval_ms": 60000
      },
      "retry": { "max_attempts": 4, "multiplier": 3.0 }
    }]
  })";

  gridmm::AppConfig config = gridmm::ConfigLoader::parse(text);

  EXPECT_EQ(config.database_path, "/tmp/agent.db");
  EXPECT_EQ(config.market_data_endpoint, "tcp://127.0.0.1:7000");
  EXPECT_TRUE(config.ipc_command_endpoint.empty());
  EXPECT_EQ(config.persistence_retry.max_attempts, 5);

  const auto& a = config.accounts.at(0);
  EXPECT_EQ(a.username, "Alice");
  EXPECT_EQ(a.adapter, gridmm::AdapterKind::Zmq);
  EXPECT_EQ(a.gateway_command_endpoint, "tcp://h:1");
  EXPECT_DOUBLE_EQ(a.instrument.tick_size, 0.1);
  EXPECT_EQ(a.grid.level_count, 5);
  EXPECT_EQ(a.grid.distance_mode, gridmm::DistanceMode::Absolute);
  EXPECT_DOUBLE_EQ(a.grid.distanceFraction(), 2.5);
  EXPECT_TRUE(a.grid.auto_close_enabled);
  EXPECT_EQ(a.grid.ack_deadline_ms, 800);
  EXPECT_EQ(a.grid.profit_log_interval_ms, 60000);
  EXPECT_EQ(a.retry.max_attempts, 4);
  EXPECT_DOUBLE_EQ(a.retry.multiplier, 3.0);
}

// -----------------------------------------------------------------------------
// 3. Malformed JSON is reported as a ConfigurationError, not a json exception.
// -----------------------------------------------------------------------------
TEST_F(ConfigLoaderTest, MalformedJsonThrowsConfigurationError) {
  EXPECT_THROW(gridmm::ConfigLoader::parse("{ not json"),
               gridmm::ConfigurationError);
}

// -----------------------------------------------------------------------------
// 4. Missing required keys (accounts, userid, instrument) are rejected.
// -----------------------------------------------------------------------------
TEST_F(ConfigLoaderTest, MissingRequiredKeysThrow) {
  EXPECT_THROW(gridmm::ConfigLoader::parse("{}"), gridmm::ConfigurationError);
  EXPECT_THROW(gridmm::ConfigLoader::parse(
                   R"({"accounts":[{"instrument":{"symbol":"X"}}]})"),
               gridmm::ConfigurationError);
  EXPECT_THROW(gridmm::ConfigLoader::parse(R"({"accounts":[{"userid":"u"}]})"),
               gridmm::ConfigurationError);
  EXPECT_THROW(gridmm::ConfigLoader::parse(R"({"accounts":[]})"),
               gridmm::ConfigurationError);
}

// -----------------------------------------------------------------------------
// 5. Invalid grid parameters are rejected at load time.
// Why: A grid with zero levels or zero spacing would either place nothing or
//      stack every order at the reference price.
// -----------------------------------------------------------------------------
TEST_F(ConfigLoaderTest, InvalidGridParametersThrow) {
  EXPECT_THROW(gridmm::ConfigLoader::parse(accountWithGrid(R"({"level_count":0})")),
               gridmm::ConfigurationError);
  EXPECT_THROW(gridmm::ConfigLoader::parse(accountWithGrid(R"({"distance":0})")),
               gridmm::ConfigurationError);
  EXPECT_THROW(gridmm::ConfigLoader::parse(accountWithGrid(R"({"order_size":-1})")),
               gridmm::ConfigurationError);
  EXPECT_THROW(gridmm::ConfigLoader::parse(accountWithGrid(R"({"max_position":0})")),
               gridmm::ConfigurationError);
  EXPECT_THROW(
      gridmm::ConfigLoader::parse(accountWithGrid(R"({"distance_mode":"log"})")),
      gridmm::ConfigurationError);
  // 40 levels at 3 % would push the lowest bid below zero.
  EXPECT_THROW(gridmm::ConfigLoader::parse(
                   accountWithGrid(R"({"level_count":40,"distance":3})")),
               gridmm::ConfigurationError);
  // 0.05 rounds down to zero lots at lot_size 0.1.
  EXPECT_THROW(gridmm::ConfigLoader::parse(accountWithGrid(R"({"order_size":0.05})")),
               gridmm::ConfigurationError);
}

// -----------------------------------------------------------------------------
// 6. Fix-order and auto-close are mutually exclusive.
// -----------------------------------------------------------------------------
TEST_F(ConfigLoaderTest, FixOrderAndAutoCloseAreExclusive) {
  EXPECT_THROW(gridmm::ConfigLoader::parse(accountWithGrid(
                   R"({"fix_order_enabled":true,"auto_close_enabled":true})")),
               gridmm::ConfigurationError);
  EXPECT_NO_THROW(gridmm::ConfigLoader::parse(
      accountWithGrid(R"({"fix_order_enabled":true})")));
}

// -----------------------------------------------------------------------------
// 7. Two accounts with the same userid are rejected.
// -----------------------------------------------------------------------------
TEST_F(ConfigLoaderTest, DuplicateUseridThrows) {
  const char* text = R"({"accounts":[
    {"userid":"u1","instrument":{"symbol":"BTC-USD"}},
    {"userid":"u1","instrument":{"symbol":"ETH-USD"}}
  ]})";
  EXPECT_THROW(gridmm::ConfigLoader::parse(text), gridmm::ConfigurationError);
}

// -----------------------------------------------------------------------------
// 8. Unknown adapter kinds are rejected.
// -----------------------------------------------------------------------------
TEST_F(ConfigLoaderTest, UnknownAdapterThrows) {
  const char* text = R"({"accounts":[
    {"userid":"u1","adapter":"rest","instrument":{"symbol":"BTC-USD"}}
  ]})";
  EXPECT_THROW(gridmm::ConfigLoader::parse(text), gridmm::ConfigurationError);
}

// -----------------------------------------------------------------------------
// 9. loadFile() on a missing path throws ConfigurationError.
// -----------------------------------------------------------------------------
TEST_F(ConfigLoaderTest, MissingFileThrows) {
  EXPECT_THROW(gridmm::ConfigLoader::loadFile("/nonexistent/gridmm.json"),
               gridmm::ConfigurationError);
}

// -----------------------------------------------------------------------------
// 10. Backoff doubles per attempt with the default multiplier.
// -----------------------------------------------------------------------------
TEST(RetryPolicyTest, BackoffGrowsGeometrically) {
  gridmm::RetryPolicy policy;
  policy.initial_backoff_ms = 100;
  policy.multiplier = 2.0;

  EXPECT_EQ(policy.backoffFor(1), 100);
  EXPECT_EQ(policy.backoffFor(2), 200);
  EXPECT_EQ(policy.backoffFor(3), 400);
}
