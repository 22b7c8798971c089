#pragma once

#include "gridmm/domain/instrument.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace gridmm {

// -----------------------------------------------------------------------------
// DistanceMode
// -----------------------------------------------------------------------------
// Absolute: level i sits i * distance price units from the reference.
// Percentage: level i sits i * distance percent from the reference
//             (distance 1.0 means 1 %).
// -----------------------------------------------------------------------------
enum class DistanceMode {
  Absolute,
  Percentage,
};

// -----------------------------------------------------------------------------
// GridConfig — validated grid and risk parameters for one account
// -----------------------------------------------------------------------------
//
// @brief  Everything the GridPlanner, RiskGuard and ReconciliationEngine need
//         to know about one market.
//
// @details
// Built by ConfigLoader from JSON and validated once by validate(). After
// that it is copied into components at construction and never re-checked.
//
// fix_order_enabled and auto_close_enabled are mutually exclusive policies;
// validate() rejects a config with both set.
//
// profit_log_interval_ms == 0 writes one ProfitLogEntry per realized closing
// fill. A positive value aggregates realized profit and writes one entry per
// interval instead.
// -----------------------------------------------------------------------------
struct GridConfig {
  int level_count{3};
  double distance{1.0};
  DistanceMode distance_mode{DistanceMode::Percentage};
  double order_size{1.0};
  double max_position{3.0};

  /// Fractional move of the reference away from the anchor that triggers a
  /// re-plan (0.02 = 2 %). 0 disables re-centring.
  double recenter_threshold{0.02};

  bool fix_order_enabled{false};
  bool auto_close_enabled{false};

  /// Fix orders are priced this fraction beyond entry or reference,
  /// whichever favours the agent (0.0002 = 2 bps).
  double fix_order_offset{0.0002};

  std::int64_t ack_deadline_ms{5000};
  std::int64_t snapshot_poll_interval_ms{20000};
  std::int64_t call_deadline_ms{3000};

  /// Allowed |local - venue| position gap before a snapshot correction.
  double position_tolerance{0.0};

  std::int64_t profit_log_interval_ms{0};

  /// Fraction (percentage mode) or price units (absolute mode) per level.
  double distanceFraction() const {
    return distance_mode == DistanceMode::Percentage ? distance / 100.0
                                                     : distance;
  }

  void validate() const;
};

// -----------------------------------------------------------------------------
// RetryPolicy — bounded exponential backoff for venue calls and writes
// -----------------------------------------------------------------------------
struct RetryPolicy {
  int max_attempts{3};
  std::int64_t initial_backoff_ms{100};
  double multiplier{2.0};

  std::int64_t backoffFor(int attempt) const;
  void validate() const;
};

enum class AdapterKind {
  Zmq,
  Paper,
};

// -----------------------------------------------------------------------------
// AccountConfig — one monitored account/market
// -----------------------------------------------------------------------------
struct AccountConfig {
  std::string userid;
  std::string username;
  AdapterKind adapter{AdapterKind::Paper};
  std::string gateway_command_endpoint{"tcp://127.0.0.1:6000"};
  std::string gateway_event_endpoint{"tcp://127.0.0.1:6001"};
  domain::InstrumentSpec instrument;
  GridConfig grid;
  RetryPolicy retry;

  void validate() const;
};

// -----------------------------------------------------------------------------
// AppConfig — process-wide settings plus every account
// -----------------------------------------------------------------------------
struct AppConfig {
  std::string database_path{"gridmm.db"};
  std::string ipc_command_endpoint{"tcp://127.0.0.1:5556"};
  std::string ipc_telemetry_endpoint{"tcp://127.0.0.1:5557"};
  std::string market_data_endpoint{"tcp://127.0.0.1:5555"};
  RetryPolicy persistence_retry;
  std::vector<AccountConfig> accounts;

  void validate() const;
};

}  // namespace gridmm
