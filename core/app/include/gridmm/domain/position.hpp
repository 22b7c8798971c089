#pragma once

#include <string>

namespace gridmm {
namespace domain {

// -----------------------------------------------------------------------------
// Position — net inventory for one account/instrument
// -----------------------------------------------------------------------------
//
// @brief  Signed net quantity, weighted average entry price, and cumulative
//         realized PnL.
//
// @details
// Sign convention for net_quantity:
//   positive → long, negative → short, zero → flat.
//
// average_price is updated when the position grows in the same direction,
// left unchanged on a reducing fill, and reset to the fill price when the
// position flips through zero. realized_pnl accumulates
//   closed_qty * (fill_price - average_price) for longs
//   closed_qty * (average_price - fill_price) for shorts.
//
// Not stored on its own: the OrderLedger derives it from fills and clamps it
// to the venue snapshot when the two diverge.
// -----------------------------------------------------------------------------
struct Position {
  std::string symbol;
  double net_quantity{0.0};
  double average_price{0.0};
  double realized_pnl{0.0};
};

}  // namespace domain
}  // namespace gridmm
