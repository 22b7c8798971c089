#pragma once

#include "gridmm/time/i_time_provider.hpp"

namespace gridmm {

// Wall-clock ITimeProvider backed by std::chrono::system_clock.
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;
};

}  // namespace gridmm
