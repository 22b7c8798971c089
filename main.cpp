// -----------------------------------------------------------------------------
// gridmm — single executable entry point.
//
//   1) Load and validate the JSON config named on the command line
//      (default: gridmm.json). Invalid parameters are fatal.
//   2) Create the GridAgent and start it. Every account takes a venue
//      snapshot before trading; an unreachable venue is fatal.
//   3) Wait for SIGINT/SIGTERM on the main thread.
//   4) Shut down cleanly.
//
// Thread layout (per account):
//   reconcile thread   → OrderLedger + ReconciliationEngine
//   routing thread     → ExecutionGateway (adapter calls)
//   adapter thread     → venue event stream
//   timer threads      → clock ticks, snapshot requests
// Shared: ProfitRecorder worker, IpcServer, MarketDataThread (paper venue).
// -----------------------------------------------------------------------------

#include "gridmm/config/config_loader.hpp"
#include "gridmm/domain/errors.hpp"
#include "gridmm/engine/grid_agent.hpp"

#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>
#include <utility>

// -----------------------------------------------------------------------------
// Set by the signal handler, polled by main(). sig_atomic_t keeps the
// handler async-signal-safe.
// -----------------------------------------------------------------------------
static volatile std::sig_atomic_t g_stop_requested = 0;

static void signal_handler(int /*signum*/) { g_stop_requested = 1; }

int main(int argc, char* argv[]) {
  const std::string config_path = argc > 1 ? argv[1] : "gridmm.json";

  gridmm::AppConfig config;
  try {
    config = gridmm::ConfigLoader::loadFile(config_path);
  } catch (const gridmm::ConfigurationError& e) {
    std::cerr << "[main] " << e.what() << "\n";
    return 2;
  }

  std::signal(SIGINT, signal_handler);
  std::signal(SIGTERM, signal_handler);

  try {
    gridmm::GridAgent agent(std::move(config));
    agent.start();

    std::cout << "[main] " << agent.accountCount()
              << " account(s) running. Press Ctrl-C to shut down.\n";

    while (g_stop_requested == 0) {
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    std::cout << "\n[main] Shutdown requested. Stopping agent...\n";
    agent.stop();
  } catch (const gridmm::ConfigurationError& e) {
    std::cerr << "[main] " << e.what() << "\n";
    return 2;
  } catch (const gridmm::StartupError& e) {
    std::cerr << "[main] " << e.what() << "\n";
    return 3;
  } catch (const gridmm::PersistenceError& e) {
    std::cerr << "[main] " << e.what() << "\n";
    return 4;
  } catch (const zmq::error_t& e) {
    std::cerr << "[main] ZeroMQ error: " << e.what() << "\n";
    return 5;
  }

  return 0;
}
