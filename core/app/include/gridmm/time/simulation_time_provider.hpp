#pragma once

#include "gridmm/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace gridmm {

// -----------------------------------------------------------------------------
// SimulationTimeProvider — externally driven clock
// -----------------------------------------------------------------------------
//
// @brief  now_ms() returns the last value passed to advance_time().
//
// @details
// Tests use it to step past ack deadlines and profit intervals without
// sleeping. Starts at 0. Monotonicity is the caller's responsibility.
//
// Thread model:
//   One writer, many readers; the std::atomic makes both lock-free.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  SimulationTimeProvider() = default;

  explicit SimulationTimeProvider(std::int64_t start_ms)
      : current_time_ms_(start_ms) {}

  std::int64_t now_ms() const override;

  void advance_time(std::int64_t new_time_ms);

  void advance_by(std::int64_t delta_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_{0};
};

}  // namespace gridmm
