// =============================================================================
// account_context_test.cpp
// =============================================================================
// Integration tests for gridmm::AccountContext and gridmm::GridAgent wired to
// the in-process PaperExchangeAdapter. Real threads: reconcile loop, routing
// loop, timers and the profit recorder.
//
// Validates:
//   - start() hydrates position and open orders from the venue snapshot
//   - A startup snapshot failure is a StartupError
//   - A first price produces a resting grid at the venue
//   - A fill re-arms the opposite side at the venue and moves the position
//   - Pause cancels everything at the venue; resume restores the grid
//   - Account status is persisted through the recorder, Stopped on shutdown
//   - GridAgent IPC commands: PING, STATUS, PAUSE/RESUME, unknown
// =============================================================================

#include "gridmm/domain/errors.hpp"
#include "gridmm/engine/account_context.hpp"
#include "gridmm/engine/grid_agent.hpp"
#include "gridmm/exchange/paper_exchange_adapter.hpp"
#include "gridmm/persistence/sqlite_account_store.hpp"
#include "gridmm/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <chrono>
#include <cmath>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <variant>
#include <vector>

namespace {

// Polls `pred` every 10 ms until it holds or `timeout` elapses.
bool waitUntil(const std::function<bool()>& pred,
               std::chrono::milliseconds timeout = std::chrono::seconds(3)) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return pred();
}

gridmm::AccountConfig makeAccount(const std::string& userid) {
  gridmm::AccountConfig account;
  account.userid = userid;
  account.username = userid;
  account.adapter = gridmm::AdapterKind::Paper;
  account.instrument = gridmm::domain::InstrumentSpec{"BTC-USD", 0.01, 0.001};
  account.grid.level_count = 3;
  account.grid.distance = 1.0;
  account.grid.order_size = 1.0;
  account.grid.max_position = 3.0;
  account.retry.max_attempts = 2;
  account.retry.initial_backoff_ms = 1;
  return account;
}

// Adapter whose snapshot always fails, for the startup gate.
class UnreachableAdapter : public gridmm::IExchangeAdapter {
 public:
  void start(EventSink) override {}
  void stop() override {}
  gridmm::PlaceResult placeOrder(const gridmm::PlaceRequest&,
                                 std::int64_t) override {
    return {gridmm::domain::VenueError::TransportFailure, "", "down"};
  }
  gridmm::CancelResult cancelOrder(const std::string&, const std::string&,
                                   std::int64_t) override {
    return {gridmm::domain::VenueError::TransportFailure, "down"};
  }
  gridmm::QueryResult queryOrder(const std::string&, gridmm::domain::IntentId,
                                 const std::optional<std::string>&,
                                 std::int64_t) override {
    return {gridmm::domain::VenueError::TransportFailure, std::nullopt, "down"};
  }
  gridmm::SnapshotResult getAccountSnapshot(const std::string&,
                                            std::int64_t) override {
    gridmm::SnapshotResult result;
    result.error = gridmm::domain::VenueError::TransportFailure;
    result.message = "down";
    return result;
  }
};

}  // namespace

// =============================================================================
// Test fixture: one paper-traded account with an in-memory store.
// =============================================================================
class AccountContextTest : public ::testing::Test {
 protected:
  gridmm::IntentIdGenerator ids;
  gridmm::SimulationTimeProvider clock{1000};
  gridmm::SqliteAccountStore store{":memory:"};
  std::unique_ptr<gridmm::ProfitRecorder> recorder;
  gridmm::PaperExchangeAdapter* paper{nullptr};
  std::unique_ptr<gridmm::AccountContext> context;

  std::mutex telemetry_mutex;
  std::vector<gridmm::Event> telemetry;

  void SetUp() override {
    store.initSchema();
    gridmm::RetryPolicy retry;
    recorder = std::make_unique<gridmm::ProfitRecorder>(store, retry);
    recorder->start();
  }

  void TearDown() override {
    context.reset();
    recorder->stop();
  }

  void build(double initial_position = 0.0) {
    auto adapter = std::make_unique<gridmm::PaperExchangeAdapter>(
        clock, "BTC-USD", initial_position);
    paper = adapter.get();
    context = std::make_unique<gridmm::AccountContext>(
        makeAccount("u1"), ids, clock, std::move(adapter), recorder.get(),
        [this](gridmm::Event e) {
          std::lock_guard lock(telemetry_mutex);
          telemetry.push_back(std::move(e));
        },
        [](std::chrono::milliseconds) {});
  }

  void tick(double price) {
    gridmm::MarketDataEvent md;
    md.symbol = "BTC-USD";
    md.price = price;
    paper->onMarketData(md);
  }

  bool restingAskAt(double price) {
    auto snap = paper->getAccountSnapshot("BTC-USD", 1000);
    for (const auto& order : snap.open_orders) {
      if (order.side == gridmm::domain::Side::Ask &&
          std::abs(order.price - price) < 1e-9) {
        return true;
      }
    }
    return false;
  }

  template <typename T>
  std::size_t telemetryCount() {
    std::lock_guard lock(telemetry_mutex);
    std::size_t n = 0;
    for (const auto& e : telemetry) {
      if (std::holds_alternative<T>(e)) {
        ++n;
      }
    }
    return n;
  }
};

// -----------------------------------------------------------------------------
// 1. start() seeds the ledger from the venue: position and resting orders.
// -----------------------------------------------------------------------------
TEST_F(AccountContextTest, StartHydratesFromSnapshot) {
  build(1.5);
  gridmm::PlaceRequest external;
  external.intent_id = 999;
  external.symbol = "BTC-USD";
  external.side = gridmm::domain::Side::Ask;
  external.price = 110.0;
  external.quantity = 0.5;
  paper->placeOrder(external, 1000);

  context->start();

  gridmm::AccountStatusView view = context->status();
  EXPECT_TRUE(view.running);
  EXPECT_FALSE(view.paused);
  EXPECT_DOUBLE_EQ(view.ledger.position.net_quantity, 1.5);
  EXPECT_EQ(view.ledger.working_orders, 1u);

  context->stop();
  EXPECT_FALSE(context->isRunning());
}

// -----------------------------------------------------------------------------
// 2. A venue that cannot produce a snapshot blocks startup.
// Why: Trading without knowing the venue position could double the exposure.
// -----------------------------------------------------------------------------
TEST_F(AccountContextTest, SnapshotFailureIsStartupError) {
  gridmm::AccountContext unreachable(
      makeAccount("u2"), ids, clock, std::make_unique<UnreachableAdapter>(),
      nullptr, nullptr, [](std::chrono::milliseconds) {});

  EXPECT_THROW(unreachable.start(), gridmm::StartupError);
  EXPECT_FALSE(unreachable.isRunning());
}

// -----------------------------------------------------------------------------
// 3. The first price puts six resting orders on the venue.
// -----------------------------------------------------------------------------
TEST_F(AccountContextTest, FirstPricePlacesGridAtVenue) {
  build();
  context->start();
  tick(100.0);

  ASSERT_TRUE(waitUntil([this] { return paper->restingCount() == 6; }));
  EXPECT_TRUE(waitUntil(
      [this] { return context->status().ledger.working_orders == 6; }));
  EXPECT_GE(telemetryCount<gridmm::OrderUpdateEvent>(), 6u);
}

// -----------------------------------------------------------------------------
// 4. The price trades through the 99 bid: the fill reaches the ledger and an
//    ask is re-armed at 99 on the venue.
// -----------------------------------------------------------------------------
TEST_F(AccountContextTest, FillReArmsAtVenue) {
  build();
  context->start();
  tick(100.0);
  ASSERT_TRUE(waitUntil([this] { return paper->restingCount() == 6; }));

  tick(98.5);

  ASSERT_TRUE(waitUntil([this] {
    return std::abs(context->status().ledger.position.net_quantity - 1.0) <
           1e-9;
  }));
  EXPECT_TRUE(waitUntil([this] { return restingAskAt(99.0); }));
  EXPECT_DOUBLE_EQ(paper->netPosition(), 1.0);
  EXPECT_GE(telemetryCount<gridmm::PositionUpdateEvent>(), 1u);
}

// -----------------------------------------------------------------------------
// 5. Pause empties the venue; resume restores the grid.
// -----------------------------------------------------------------------------
TEST_F(AccountContextTest, PauseAndResume) {
  build();
  context->start();
  tick(100.0);
  ASSERT_TRUE(waitUntil([this] { return paper->restingCount() == 6; }));

  context->pause();
  EXPECT_TRUE(context->isPaused());
  ASSERT_TRUE(waitUntil([this] { return paper->restingCount() == 0; }));

  context->resume();
  EXPECT_FALSE(context->isPaused());
  EXPECT_TRUE(waitUntil([this] { return paper->restingCount() == 6; }));
}

// -----------------------------------------------------------------------------
// 6. The account row tracks Active → Paused → Stopped.
// -----------------------------------------------------------------------------
TEST_F(AccountContextTest, StatusIsPersisted) {
  build();
  context->start();
  ASSERT_TRUE(waitUntil([this] { return store.findAccount("u1").has_value(); }));
  EXPECT_EQ(store.findAccount("u1")->status,
            gridmm::domain::AccountStatus::Active);

  context->pause();
  ASSERT_TRUE(waitUntil([this] {
    auto a = store.findAccount("u1");
    return a && a->status == gridmm::domain::AccountStatus::Paused;
  }));

  context->stop();
  recorder->stop();
  EXPECT_EQ(store.findAccount("u1")->status,
            gridmm::domain::AccountStatus::Stopped);
  EXPECT_EQ(store.accountCount(), 1u);
}

// =============================================================================
// GridAgent
// =============================================================================
class GridAgentTest : public ::testing::Test {
 protected:
  std::unique_ptr<gridmm::GridAgent> agent;

  void SetUp() override {
    gridmm::AppConfig config;
    config.ipc_command_endpoint.clear();
    config.ipc_telemetry_endpoint.clear();
    config.market_data_endpoint.clear();
    config.accounts.push_back(makeAccount("alice"));
    config.accounts.push_back(makeAccount("bob"));

    agent = std::make_unique<gridmm::GridAgent>(
        config, std::make_unique<gridmm::SqliteAccountStore>(":memory:"));
    agent->start();
  }

  void TearDown() override { agent.reset(); }

  nlohmann::json command(const std::string& cmd) {
    return nlohmann::json::parse(agent->executeCommand(cmd));
  }
};

// -----------------------------------------------------------------------------
// 7. PING answers PONG.
// -----------------------------------------------------------------------------
TEST_F(GridAgentTest, Ping) {
  auto r = command("PING");
  EXPECT_EQ(r.at("status"), "ok");
  EXPECT_EQ(r.at("response"), "PONG");
}

// -----------------------------------------------------------------------------
// 8. STATUS lists every account with its ledger summary.
// -----------------------------------------------------------------------------
TEST_F(GridAgentTest, StatusListsAccounts) {
  auto r = command("STATUS");
  EXPECT_EQ(r.at("status"), "ok");
  ASSERT_EQ(r.at("accounts").size(), 2u);
  EXPECT_EQ(r.at("accounts")[0].at("userid"), "alice");
  EXPECT_EQ(r.at("accounts")[1].at("userid"), "bob");
  EXPECT_TRUE(r.at("accounts")[0].at("running").get<bool>());
  EXPECT_EQ(r.at("accounts")[0].at("working_orders").get<std::size_t>(), 0u);
}

// -----------------------------------------------------------------------------
// 9. PAUSE and RESUME address one account by userid.
// -----------------------------------------------------------------------------
TEST_F(GridAgentTest, PauseResumeByUserid) {
  auto paused = command("PAUSE bob");
  EXPECT_EQ(paused.at("status"), "ok");
  EXPECT_TRUE(agent->findAccount("bob")->isPaused());
  EXPECT_FALSE(agent->findAccount("alice")->isPaused());

  auto resumed = command("RESUME bob");
  EXPECT_EQ(resumed.at("status"), "ok");
  EXPECT_FALSE(agent->findAccount("bob")->isPaused());

  EXPECT_EQ(command("PAUSE carol").at("status"), "error");
}

// -----------------------------------------------------------------------------
// 10. Unknown commands are an error reply, not an exception.
// -----------------------------------------------------------------------------
TEST_F(GridAgentTest, UnknownCommand) {
  auto r = command("LAUNCH");
  EXPECT_EQ(r.at("status"), "error");
}

// -----------------------------------------------------------------------------
// 11. Market data pushed into the agent reaches every paper venue.
// -----------------------------------------------------------------------------
TEST_F(GridAgentTest, PushMarketDataDrivesAccounts) {
  gridmm::MarketDataEvent md;
  md.symbol = "BTC-USD";
  md.price = 100.0;
  agent->pushMarketData(md);

  EXPECT_TRUE(waitUntil([this] {
    return agent->findAccount("alice")->status().ledger.working_orders == 6 &&
           agent->findAccount("bob")->status().ledger.working_orders == 6;
  }));
}
