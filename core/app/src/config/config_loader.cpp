#include "gridmm/config/config_loader.hpp"
#include "gridmm/domain/errors.hpp"

#include <fstream>
#include <sstream>

namespace gridmm {

// -----------------------------------------------------------------------------
// loadFile(): read the whole file and delegate to parse()
// -----------------------------------------------------------------------------
AppConfig ConfigLoader::loadFile(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigurationError("cannot open config file: " + path);
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  return parse(buffer.str());
}

// -----------------------------------------------------------------------------
// parse(): JSON text → AppConfig. Parse errors become ConfigurationError.
// -----------------------------------------------------------------------------
AppConfig ConfigLoader::parse(const std::string& text) {
  nlohmann::json root;
  try {
    root = nlohmann::json::parse(text);
  } catch (const nlohmann::json::parse_error& e) {
    throw ConfigurationError(std::string("malformed JSON: ") + e.what());
  }
  return fromJson(root);
}

AppConfig ConfigLoader::fromJson(const nlohmann::json& root) {
  AppConfig config;
  try {
    config.database_path = root.value("database", config.database_path);
    config.market_data_endpoint =
        root.value("market_data_endpoint", config.market_data_endpoint);

    if (root.contains("ipc")) {
      const auto& ipc = root.at("ipc");
      config.ipc_command_endpoint =
          ipc.value("command_endpoint", config.ipc_command_endpoint);
      config.ipc_telemetry_endpoint =
          ipc.value("telemetry_endpoint", config.ipc_telemetry_endpoint);
    }
    if (root.contains("persistence_retry")) {
      config.persistence_retry = retryFromJson(root.at("persistence_retry"));
    }

    for (const auto& account : root.at("accounts")) {
      config.accounts.push_back(accountFromJson(account));
    }
  } catch (const nlohmann::json::exception& e) {
    throw ConfigurationError(std::string("invalid config: ") + e.what());
  }

  config.validate();
  return config;
}

AccountConfig ConfigLoader::accountFromJson(const nlohmann::json& j) {
  AccountConfig account;
  account.userid = j.at("userid").get<std::string>();
  account.username = j.value("username", account.userid);

  std::string adapter = j.value("adapter", std::string("paper"));
  if (adapter == "zmq") {
    account.adapter = AdapterKind::Zmq;
  } else if (adapter == "paper") {
    account.adapter = AdapterKind::Paper;
  } else {
    throw ConfigurationError("account " + account.userid +
                             ": unknown adapter '" + adapter + "'");
  }

  if (j.contains("gateway")) {
    const auto& gw = j.at("gateway");
    account.gateway_command_endpoint =
        gw.value("command_endpoint", account.gateway_command_endpoint);
    account.gateway_event_endpoint =
        gw.value("event_endpoint", account.gateway_event_endpoint);
  }

  const auto& inst = j.at("instrument");
  account.instrument.symbol = inst.at("symbol").get<std::string>();
  account.instrument.tick_size =
      inst.value("tick_size", account.instrument.tick_size);
  account.instrument.lot_size =
      inst.value("lot_size", account.instrument.lot_size);

  if (j.contains("grid")) {
    account.grid = gridFromJson(j.at("grid"));
  }
  if (j.contains("retry")) {
    account.retry = retryFromJson(j.at("retry"));
  }
  return account;
}

GridConfig ConfigLoader::gridFromJson(const nlohmann::json& j) {
  GridConfig g;
  g.level_count = j.value("level_count", g.level_count);
  g.distance = j.value("distance", g.distance);

  std::string mode = j.value("distance_mode", std::string("percentage"));
  if (mode == "percentage") {
    g.distance_mode = DistanceMode::Percentage;
  } else if (mode == "absolute") {
    g.distance_mode = DistanceMode::Absolute;
  } else {
    throw ConfigurationError("grid.distance_mode must be 'absolute' or "
                             "'percentage' (got '" + mode + "')");
  }

  g.order_size = j.value("order_size", g.order_size);
  g.max_position = j.value("max_position", g.max_position);
  g.recenter_threshold = j.value("recenter_threshold", g.recenter_threshold);
  g.fix_order_enabled = j.value("fix_order_enabled", g.fix_order_enabled);
  g.auto_close_enabled = j.value("auto_close_enabled", g.auto_close_enabled);
  g.fix_order_offset = j.value("fix_order_offset", g.fix_order_offset);
  g.ack_deadline_ms = j.value("ack_deadline_ms", g.ack_deadline_ms);
  g.snapshot_poll_interval_ms =
      j.value("snapshot_poll_interval_ms", g.snapshot_poll_interval_ms);
  g.call_deadline_ms = j.value("call_deadline_ms", g.call_deadline_ms);
  g.position_tolerance = j.value("position_tolerance", g.position_tolerance);
  g.profit_log_interval_ms =
      j.value("profit_log_interval_ms", g.profit_log_interval_ms);
  return g;
}

RetryPolicy ConfigLoader::retryFromJson(const nlohmann::json& j) {
  RetryPolicy r;
  r.max_attempts = j.value("max_attempts", r.max_attempts);
  r.initial_backoff_ms = j.value("initial_backoff_ms", r.initial_backoff_ms);
  r.multiplier = j.value("multiplier", r.multiplier);
  return r;
}

}  // namespace gridmm
