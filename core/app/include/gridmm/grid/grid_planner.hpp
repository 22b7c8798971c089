#pragma once

#include "gridmm/config/grid_config.hpp"
#include "gridmm/domain/grid_level.hpp"
#include "gridmm/domain/instrument.hpp"

#include <vector>

namespace gridmm {

// -----------------------------------------------------------------------------
// GridPlanner — target ladder of limit orders around a reference price
// -----------------------------------------------------------------------------
//
// @brief  Computes the bid and ask GridLevels for a reference price.
//
// @details
// For i = 1..N with d = distanceFraction():
//   percentage mode: bid_i = ref * (1 - i*d),  ask_i = ref * (1 + i*d)
//   absolute mode:   bid_i = ref - i*d,        ask_i = ref + i*d
// Bids are quantized down to the tick and asks up, so a level never crosses
// the reference. Sizes are quantized down to the lot.
//
// Output order: bids from the nearest (-1) to the farthest (-N), then asks
// from +1 to +N. Prices are strictly monotonic per side and no two levels on
// one side share a tick, because plan() refuses references where the level
// spacing is below one tick.
//
// Pure: no state beyond the config, no side effects other than warning logs
// for dropped levels.
// -----------------------------------------------------------------------------
class GridPlanner {
 public:
  // Throws ConfigurationError if the grid config is invalid.
  GridPlanner(GridConfig config, domain::InstrumentSpec instrument);

  // -------------------------------------------------------------------------
  // plan(reference_price)
  // -------------------------------------------------------------------------
  // @throws ConfigurationError if reference_price <= 0 or if the spacing
  //         between adjacent levels is below one tick at this reference.
  //
  // Levels whose quantized size is zero, or whose bid price is not
  // positive (absolute mode), are dropped with a warning.
  // -------------------------------------------------------------------------
  std::vector<domain::GridLevel> plan(double reference_price) const;

  // True when price has moved away from anchor by more than the configured
  // re-centre threshold (fraction of the anchor). Always false when the
  // threshold is 0. A non-positive anchor means "no plan yet" and returns
  // true.
  bool needsRecenter(double anchor, double price) const;

  const GridConfig& config() const { return config_; }
  const domain::InstrumentSpec& instrument() const { return instrument_; }

 private:
  GridConfig config_;
  domain::InstrumentSpec instrument_;
};

}  // namespace gridmm
