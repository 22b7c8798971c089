#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace gridmm {

// -----------------------------------------------------------------------------
// Timestamp
// -----------------------------------------------------------------------------
// Wall-clock time carried by every event. Converted to/from epoch
// milliseconds with time_utils.hpp.
// -----------------------------------------------------------------------------
using Timestamp = std::chrono::system_clock::time_point;

// -----------------------------------------------------------------------------
// MarketDataEvent
// -----------------------------------------------------------------------------
// Responsibility: One reference-price update for a market.
// Produced by the exchange adapter's stream (ticker messages) or by the
// MarketDataGateway feeding the paper venue. Consumed by the
// ReconciliationEngine to (re)plan the grid.
// -----------------------------------------------------------------------------
struct MarketDataEvent {
  std::string symbol;
  double price{0.0};
  double quantity{0.0};
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

// -----------------------------------------------------------------------------
// ClockTickEvent
// -----------------------------------------------------------------------------
// Emitted by the account's PeriodicTimer. Drives ack-deadline checks and
// interval profit aggregation. now_ms comes from the injected ITimeProvider
// so simulation tests can drive it deterministically.
// -----------------------------------------------------------------------------
struct ClockTickEvent {
  std::int64_t now_ms{0};
};

// -----------------------------------------------------------------------------
// SnapshotRequestEvent
// -----------------------------------------------------------------------------
// Asks the ExecutionGateway to fetch a full account snapshot. The request
// time travels with the result so the engine can ignore orders acknowledged
// after the snapshot was taken.
// -----------------------------------------------------------------------------
struct SnapshotRequestEvent {
  std::int64_t requested_at_ms{0};
};

// -----------------------------------------------------------------------------
// AccountCommandEvent
// -----------------------------------------------------------------------------
// Operator control from the IPC server: pause cancels every working order
// and stops placing new ones; resume re-plans around the last reference.
// -----------------------------------------------------------------------------
struct AccountCommandEvent {
  enum class Command { Pause, Resume } command{Command::Pause};
};

// -----------------------------------------------------------------------------
// HeartbeatEvent
// -----------------------------------------------------------------------------
// Health/status signal from a component. status is "ok", "degraded" or a
// failure code such as "PersistenceFailure"; detail is free text.
// -----------------------------------------------------------------------------
struct HeartbeatEvent {
  std::string component_id;
  std::string status;
  std::string detail;
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

}  // namespace gridmm
