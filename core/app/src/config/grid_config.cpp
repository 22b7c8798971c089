#include "gridmm/config/grid_config.hpp"
#include "gridmm/domain/errors.hpp"

#include <cmath>
#include <set>
#include <string>

namespace gridmm {

void GridConfig::validate() const {
  if (level_count < 1) {
    throw ConfigurationError("grid.level_count must be >= 1 (got " +
                             std::to_string(level_count) + ")");
  }
  if (!(distance > 0.0)) {
    throw ConfigurationError("grid.distance must be > 0");
  }
  if (distance_mode == DistanceMode::Percentage &&
      distanceFraction() * level_count >= 1.0) {
    throw ConfigurationError(
        "grid.level_count * grid.distance must stay below 100% so every bid "
        "level has a positive price");
  }
  if (!(order_size > 0.0)) {
    throw ConfigurationError("grid.order_size must be > 0");
  }
  if (!(max_position > 0.0)) {
    throw ConfigurationError("grid.max_position must be > 0");
  }
  if (recenter_threshold < 0.0) {
    throw ConfigurationError("grid.recenter_threshold must be >= 0");
  }
  if (fix_order_enabled && auto_close_enabled) {
    throw ConfigurationError(
        "grid.fix_order_enabled and grid.auto_close_enabled are mutually "
        "exclusive");
  }
  if (fix_order_offset < 0.0 || fix_order_offset >= 1.0) {
    throw ConfigurationError("grid.fix_order_offset must be in [0, 1)");
  }
  if (ack_deadline_ms <= 0 || call_deadline_ms <= 0 ||
      snapshot_poll_interval_ms <= 0) {
    throw ConfigurationError(
        "grid.ack_deadline_ms, grid.call_deadline_ms and "
        "grid.snapshot_poll_interval_ms must be > 0");
  }
  if (position_tolerance < 0.0) {
    throw ConfigurationError("grid.position_tolerance must be >= 0");
  }
  if (profit_log_interval_ms < 0) {
    throw ConfigurationError("grid.profit_log_interval_ms must be >= 0");
  }
}

std::int64_t RetryPolicy::backoffFor(int attempt) const {
  if (attempt <= 1) {
    return initial_backoff_ms;
  }
  double backoff = static_cast<double>(initial_backoff_ms) *
                   std::pow(multiplier, attempt - 1);
  return static_cast<std::int64_t>(backoff);
}

void RetryPolicy::validate() const {
  if (max_attempts < 1) {
    throw ConfigurationError("retry.max_attempts must be >= 1");
  }
  if (initial_backoff_ms < 0) {
    throw ConfigurationError("retry.initial_backoff_ms must be >= 0");
  }
  if (multiplier < 1.0) {
    throw ConfigurationError("retry.multiplier must be >= 1");
  }
}

void AccountConfig::validate() const {
  if (userid.empty()) {
    throw ConfigurationError("account userid must not be empty");
  }
  if (instrument.symbol.empty()) {
    throw ConfigurationError("account " + userid +
                             ": instrument.symbol must not be empty");
  }
  if (!(instrument.tick_size > 0.0) || !(instrument.lot_size > 0.0)) {
    throw ConfigurationError("account " + userid +
                             ": tick_size and lot_size must be > 0");
  }
  if (instrument.quantityDown(grid.order_size) <= 0.0) {
    throw ConfigurationError("account " + userid +
                             ": grid.order_size is below one lot");
  }
  if (adapter == AdapterKind::Zmq &&
      (gateway_command_endpoint.empty() || gateway_event_endpoint.empty())) {
    throw ConfigurationError("account " + userid +
                             ": zmq adapter needs both gateway endpoints");
  }
  grid.validate();
  retry.validate();
}

void AppConfig::validate() const {
  if (accounts.empty()) {
    throw ConfigurationError("at least one account must be configured");
  }
  if (database_path.empty()) {
    throw ConfigurationError("database path must not be empty");
  }
  persistence_retry.validate();

  std::set<std::string> seen;
  for (const auto& account : accounts) {
    account.validate();
    if (!seen.insert(account.userid).second) {
      throw ConfigurationError("duplicate account userid: " + account.userid);
    }
  }
}

}  // namespace gridmm
