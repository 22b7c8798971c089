#pragma once

#include "gridmm/events/event_types.hpp"

#include <chrono>
#include <cstdint>

namespace gridmm {

// -----------------------------------------------------------------------------
// Time conversion utilities
// -----------------------------------------------------------------------------
// Bridge between ITimeProvider's epoch milliseconds and the Timestamp
// (system_clock::time_point) carried by events.
// -----------------------------------------------------------------------------

inline Timestamp ms_to_timestamp(std::int64_t ms) {
  return Timestamp{std::chrono::milliseconds{ms}};
}

inline std::int64_t timestamp_to_ms(Timestamp tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

}  // namespace gridmm
