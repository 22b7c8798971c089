#pragma once

#include "gridmm/concurrent/intent_id_generator.hpp"
#include "gridmm/config/grid_config.hpp"
#include "gridmm/engine/account_context.hpp"
#include "gridmm/exchange/paper_exchange_adapter.hpp"
#include "gridmm/network/ipc_server.hpp"
#include "gridmm/network/market_data_thread.hpp"
#include "gridmm/persistence/i_account_store.hpp"
#include "gridmm/persistence/profit_recorder.hpp"
#include "gridmm/time/live_time_provider.hpp"

#include <memory>
#include <string>
#include <vector>

namespace gridmm {

// -----------------------------------------------------------------------------
// GridAgent — top-level orchestrator of the process
// -----------------------------------------------------------------------------
//
// @brief  Owns every AccountContext plus the shared pieces: intent ids, the
//         account store and its ProfitRecorder, the IPC server and the
//         market-data feed of the paper venues.
//
// @details
// Startup sequence (start()):
//   1. Create the store schema and start the ProfitRecorder.
//   2. Start the IpcServer so startup telemetry is not lost.
//   3. Start every AccountContext (snapshot gate; StartupError propagates
//      after the already-started accounts are stopped again).
//   4. Start the MarketDataThread LAST, when any account uses the paper
//      venue and an endpoint is configured.
//
// Shutdown sequence (stop()), reverse order:
//   1. MarketDataThread (no more ticks).
//   2. AccountContexts (their Stopped upserts reach the recorder).
//   3. ProfitRecorder (drains its queue).
//   4. IpcServer (publishes the last telemetry).
//
// Commands (IPC REP socket, executeCommand()):
//   PING                → {"status":"ok","response":"PONG"}
//   STATUS              → per-account position and order counts
//   PAUSE <userid>      → cancels every working order, stops placing
//   RESUME <userid>     → re-plans around the last reference price
//
// Thread model:
//   Constructed, started and stopped on the main thread. executeCommand()
//   runs on the IPC thread and touches only thread-safe account methods.
//
// Ownership:
//   Owns everything listed above. Contexts hold references to ids_, clock_
//   and recorder_, so those members are declared before contexts_.
// -----------------------------------------------------------------------------
class GridAgent {
 public:
  // Empty IPC endpoints in the config disable the IpcServer; an empty
  // market_data_endpoint disables the MarketDataThread.
  explicit GridAgent(AppConfig config,
                     std::unique_ptr<IAccountStore> store = nullptr);

  ~GridAgent();

  GridAgent(const GridAgent&) = delete;
  GridAgent& operator=(const GridAgent&) = delete;
  GridAgent(GridAgent&&) = delete;
  GridAgent& operator=(GridAgent&&) = delete;

  // Throws StartupError / PersistenceError.
  void start();

  void stop();

  std::string executeCommand(const std::string& cmd);

  // Feeds a reference price to every paper venue trading that symbol.
  void pushMarketData(const MarketDataEvent& event);

  AccountContext* findAccount(const std::string& userid);

  std::size_t accountCount() const { return contexts_.size(); }

  IAccountStore& store() { return *store_; }

 private:
  std::unique_ptr<IExchangeAdapter> makeAdapter(const AccountConfig& account);

  void publishTelemetry(Event event);

  AppConfig config_;

  IntentIdGenerator ids_;
  LiveTimeProvider clock_;

  std::unique_ptr<IAccountStore> store_;
  std::unique_ptr<ProfitRecorder> recorder_;
  std::unique_ptr<IpcServer> ipc_server_;

  // Non-owning; the adapters belong to their AccountContext.
  std::vector<PaperExchangeAdapter*> paper_venues_;

  std::vector<std::unique_ptr<AccountContext>> contexts_;
  std::unique_ptr<MarketDataThread> market_data_thread_;

  bool running_{false};
};

}  // namespace gridmm
