#pragma once

#include "gridmm/domain/order.hpp"

#include <atomic>
#include <cstdint>

namespace gridmm {

// -----------------------------------------------------------------------------
// IntentIdGenerator — monotonically increasing intent id source
// -----------------------------------------------------------------------------
//
// @brief  Hands out unique IntentIds for the lifetime of one agent run.
//
// @details
// Starts at 1; 0 is the "unset" sentinel. A single generator is owned by
// GridAgent and shared by every account's OrderLedger, so intent ids are
// unique across accounts as well. That matters because the intent id doubles
// as the venue client order id.
//
// memory_order_relaxed is enough: uniqueness is the only requirement.
//
// Thread model:
//   next_id() is safe to call concurrently from any thread.
//
// Ownership:
//   Value member of GridAgent (or of a test fixture). Outlives every ledger
//   that holds a reference to it.
// -----------------------------------------------------------------------------
class IntentIdGenerator {
 public:
  IntentIdGenerator() = default;

  IntentIdGenerator(const IntentIdGenerator&) = delete;
  IntentIdGenerator& operator=(const IntentIdGenerator&) = delete;
  IntentIdGenerator(IntentIdGenerator&&) = delete;
  IntentIdGenerator& operator=(IntentIdGenerator&&) = delete;

  domain::IntentId next_id() {
    return next_id_.fetch_add(1, std::memory_order_relaxed);
  }

 private:
  std::atomic<domain::IntentId> next_id_{1};
};

}  // namespace gridmm
