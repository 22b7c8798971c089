#include "gridmm/engine/grid_agent.hpp"
#include "gridmm/domain/errors.hpp"
#include "gridmm/exchange/zmq_exchange_adapter.hpp"
#include "gridmm/persistence/sqlite_account_store.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <sstream>
#include <utility>

namespace gridmm {

// -----------------------------------------------------------------------------
// Constructor: build contexts (validates config); no threads yet
// -----------------------------------------------------------------------------
GridAgent::GridAgent(AppConfig config, std::unique_ptr<IAccountStore> store)
    : config_(std::move(config)), store_(std::move(store)) {
  config_.validate();

  if (!store_) {
    store_ = std::make_unique<SqliteAccountStore>(config_.database_path);
  }

  recorder_ = std::make_unique<ProfitRecorder>(
      *store_, config_.persistence_retry,
      [this](const HeartbeatEvent& hb) { publishTelemetry(hb); });

  if (!config_.ipc_command_endpoint.empty() &&
      !config_.ipc_telemetry_endpoint.empty()) {
    ipc_server_ = std::make_unique<IpcServer>(
        [this](const std::string& cmd) { return executeCommand(cmd); },
        config_.ipc_command_endpoint, config_.ipc_telemetry_endpoint);
  }

  for (const auto& account : config_.accounts) {
    contexts_.push_back(std::make_unique<AccountContext>(
        account, ids_, clock_, makeAdapter(account), recorder_.get(),
        [this](Event event) { publishTelemetry(std::move(event)); }));
  }
}

// -----------------------------------------------------------------------------
// Destructor: RAII stop
// -----------------------------------------------------------------------------
GridAgent::~GridAgent() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void GridAgent::start() {
  if (running_) {
    return;
  }

  // ---  1) Persistence ------------------------------------------------------
  store_->initSchema();
  recorder_->start();

  // ---  2) IPC --------------------------------------------------------------
  if (ipc_server_) {
    ipc_server_->start();
  }

  // ---  3) Accounts ---------------------------------------------------------
  for (auto& context : contexts_) {
    try {
      context->start();
    } catch (const StartupError&) {
      for (auto& started : contexts_) {
        started->stop();
      }
      recorder_->stop();
      if (ipc_server_) {
        ipc_server_->stop();
      }
      throw;
    }
  }

  // ---  4) Market data LAST (ticks begin flowing) ----------------------------
  if (!paper_venues_.empty() && !config_.market_data_endpoint.empty()) {
    market_data_thread_ = std::make_unique<MarketDataThread>(
        [this](Event event) {
          if (auto* md = std::get_if<MarketDataEvent>(&event)) {
            pushMarketData(*md);
          }
        },
        config_.market_data_endpoint);
    market_data_thread_->start();
  }

  running_ = true;

  std::cout << "[GridAgent] started " << contexts_.size()
            << " account(s)"
            << (market_data_thread_ ? " with paper market data" : "")
            << ".\n";
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void GridAgent::stop() {
  if (!running_) {
    return;
  }

  market_data_thread_.reset();

  for (auto& context : contexts_) {
    context->stop();
  }

  recorder_->stop();

  if (ipc_server_) {
    ipc_server_->stop();
  }

  running_ = false;

  std::cout << "[GridAgent] stopped. All threads joined.\n";
}

void GridAgent::pushMarketData(const MarketDataEvent& event) {
  for (auto* venue : paper_venues_) {
    venue->onMarketData(event);
  }
}

AccountContext* GridAgent::findAccount(const std::string& userid) {
  for (auto& context : contexts_) {
    if (context->userid() == userid) {
      return context.get();
    }
  }
  return nullptr;
}

// -----------------------------------------------------------------------------
// executeCommand(): handle IPC command requests
// -----------------------------------------------------------------------------
std::string GridAgent::executeCommand(const std::string& cmd) {
  nlohmann::json response;

  std::istringstream in(cmd);
  std::string verb;
  std::string userid;
  in >> verb >> userid;

  if (verb == "PING") {
    response["status"] = "ok";
    response["response"] = "PONG";
  } else if (verb == "STATUS") {
    response["status"] = "ok";

    nlohmann::json accounts_json = nlohmann::json::array();
    for (const auto& context : contexts_) {
      const AccountStatusView view = context->status();
      nlohmann::json a;
      a["userid"] = view.userid;
      a["symbol"] = view.symbol;
      a["running"] = view.running;
      a["paused"] = view.paused;
      a["net_quantity"] = view.ledger.position.net_quantity;
      a["average_price"] = view.ledger.position.average_price;
      a["realized_pnl"] = view.ledger.position.realized_pnl;
      a["working_orders"] = view.ledger.working_orders;
      a["finished_orders"] = view.ledger.finished_orders;
      accounts_json.push_back(std::move(a));
    }
    response["accounts"] = std::move(accounts_json);
  } else if (verb == "PAUSE" || verb == "RESUME") {
    AccountContext* context = findAccount(userid);
    if (context == nullptr) {
      response["status"] = "error";
      response["response"] = "Unknown account: " + userid;
    } else {
      if (verb == "PAUSE") {
        context->pause();
      } else {
        context->resume();
      }
      response["status"] = "ok";
      response["response"] =
          userid + (verb == "PAUSE" ? " paused" : " resumed");
    }
  } else {
    response["status"] = "error";
    response["response"] = "Unknown command: " + cmd;
  }

  return response.dump();
}

std::unique_ptr<IExchangeAdapter> GridAgent::makeAdapter(
    const AccountConfig& account) {
  if (account.adapter == AdapterKind::Paper) {
    auto paper = std::make_unique<PaperExchangeAdapter>(
        clock_, account.instrument.symbol);
    paper_venues_.push_back(paper.get());
    return paper;
  }
  return std::make_unique<ZmqExchangeAdapter>(
      account.instrument.symbol, account.gateway_command_endpoint,
      account.gateway_event_endpoint);
}

void GridAgent::publishTelemetry(Event event) {
  if (ipc_server_) {
    ipc_server_->pushTelemetry(std::move(event));
  }
}

}  // namespace gridmm
