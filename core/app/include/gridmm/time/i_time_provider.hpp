#pragma once

#include <cstdint>

namespace gridmm {

// -----------------------------------------------------------------------------
// ITimeProvider — abstract time source
// -----------------------------------------------------------------------------
//
// @brief  "Current time" behind an interface so the ledger, the ack-deadline
//         checks and the profit aggregation can be driven by a simulated
//         clock in tests.
//
// @details
// LiveTimeProvider reads the system clock; SimulationTimeProvider returns
// whatever the test (or the paper venue's tick feed) last set.
//
// Epoch milliseconds as int64_t: the ZeroMQ bridge and the JSON tick feed
// carry integer timestamps, and the persisted created_at columns are
// milliseconds too.
//
// Thread-safety contract:
//   Implementations must be safe for concurrent reads.
//
// Ownership:
//   Components hold a const reference; GridAgent (or the test) owns it.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  virtual std::int64_t now_ms() const = 0;
};

}  // namespace gridmm
