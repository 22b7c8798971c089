#include "gridmm/time/live_time_provider.hpp"

#include <chrono>

namespace gridmm {

std::int64_t LiveTimeProvider::now_ms() const {
  auto now = std::chrono::system_clock::now();
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             now.time_since_epoch())
      .count();
}

}  // namespace gridmm
