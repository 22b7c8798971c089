#pragma once

#include "gridmm/domain/order.hpp"

namespace gridmm {
namespace domain {

// -----------------------------------------------------------------------------
// GridLevel — one planned rung of the ladder
// -----------------------------------------------------------------------------
// level_index is the signed offset from the reference price: bids are
// -1..-N, asks +1..+N. Price is tick-quantized away from the reference,
// quantity is lot-quantized down.
// -----------------------------------------------------------------------------
struct GridLevel {
  Side side{Side::Bid};
  double price{0.0};
  double quantity{0.0};
  int level_index{0};
};

}  // namespace domain
}  // namespace gridmm
