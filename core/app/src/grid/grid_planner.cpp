#include "gridmm/grid/grid_planner.hpp"
#include "gridmm/domain/errors.hpp"

#include <cmath>
#include <iostream>
#include <string>
#include <utility>

namespace gridmm {

GridPlanner::GridPlanner(GridConfig config, domain::InstrumentSpec instrument)
    : config_(std::move(config)), instrument_(std::move(instrument)) {
  config_.validate();
  if (!(instrument_.tick_size > 0.0) || !(instrument_.lot_size > 0.0)) {
    throw ConfigurationError("instrument tick_size and lot_size must be > 0");
  }
}

std::vector<domain::GridLevel> GridPlanner::plan(double reference_price) const {
  if (!(reference_price > 0.0)) {
    throw ConfigurationError("reference price must be > 0 (got " +
                             std::to_string(reference_price) + ")");
  }

  const double d = config_.distanceFraction();
  const double spacing = config_.distance_mode == DistanceMode::Percentage
                             ? reference_price * d
                             : d;
  if (instrument_.ticksDown(spacing) < 1) {
    throw ConfigurationError(
        "grid spacing " + std::to_string(spacing) + " at reference " +
        std::to_string(reference_price) + " is below one tick (" +
        std::to_string(instrument_.tick_size) + ")");
  }

  const double size = instrument_.quantityDown(config_.order_size);
  if (size <= 0.0) {
    std::cerr << "[GridPlanner] WARNING: order_size " << config_.order_size
              << " quantizes to zero lots. No levels planned.\n";
    return {};
  }

  std::vector<domain::GridLevel> levels;
  levels.reserve(static_cast<std::size_t>(config_.level_count) * 2);

  for (int i = 1; i <= config_.level_count; ++i) {
    double raw = config_.distance_mode == DistanceMode::Percentage
                     ? reference_price * (1.0 - i * d)
                     : reference_price - i * d;
    double price = instrument_.priceDown(raw);
    if (price <= 0.0) {
      std::cerr << "[GridPlanner] WARNING: bid level " << -i
                << " would be priced at " << price << ". Dropped.\n";
      continue;
    }
    levels.push_back(domain::GridLevel{domain::Side::Bid, price, size, -i});
  }

  for (int i = 1; i <= config_.level_count; ++i) {
    double raw = config_.distance_mode == DistanceMode::Percentage
                     ? reference_price * (1.0 + i * d)
                     : reference_price + i * d;
    levels.push_back(domain::GridLevel{domain::Side::Ask,
                                       instrument_.priceUp(raw), size, i});
  }

  return levels;
}

bool GridPlanner::needsRecenter(double anchor, double price) const {
  if (!(anchor > 0.0)) {
    return true;
  }
  if (config_.recenter_threshold <= 0.0) {
    return false;
  }
  return std::abs(price - anchor) / anchor > config_.recenter_threshold;
}

}  // namespace gridmm
