#pragma once

#include <cstdint>

namespace gridmm {
namespace domain {

// -----------------------------------------------------------------------------
// ProfitLogEntry — immutable realized-PnL snapshot for one accounting period
// -----------------------------------------------------------------------------
// price is the reference price at emission, position the signed net
// position at emission, period_profit the profit realized since the previous
// entry. Append-only.
// -----------------------------------------------------------------------------
struct ProfitLogEntry {
  double price{0.0};
  double position{0.0};
  double period_profit{0.0};
  std::int64_t created_at_ms{0};
};

}  // namespace domain
}  // namespace gridmm
