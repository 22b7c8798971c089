#pragma once

#include <cmath>
#include <cstdint>
#include <string>

namespace gridmm {
namespace domain {

// -----------------------------------------------------------------------------
// InstrumentSpec — venue quantization rules for one market
// -----------------------------------------------------------------------------
//
// @brief  Tick size (price increment) and lot size (quantity increment) of
//         the traded market.
//
// @details
// All quantization goes through integer step counts so that two prices that
// land on the same tick compare equal regardless of floating-point noise.
// kQuantizeEpsilon absorbs representation error such as
// 100 * 0.99 = 98.99999999999999.
// -----------------------------------------------------------------------------
struct InstrumentSpec {
  std::string symbol;
  double tick_size{0.01};
  double lot_size{0.001};

  static constexpr double kQuantizeEpsilon = 1e-9;

  std::int64_t ticksDown(double price) const {
    return static_cast<std::int64_t>(
        std::floor(price / tick_size + kQuantizeEpsilon));
  }

  std::int64_t ticksUp(double price) const {
    return static_cast<std::int64_t>(
        std::ceil(price / tick_size - kQuantizeEpsilon));
  }

  std::int64_t ticksNearest(double price) const {
    return static_cast<std::int64_t>(std::llround(price / tick_size));
  }

  double priceDown(double price) const {
    return static_cast<double>(ticksDown(price)) * tick_size;
  }

  double priceUp(double price) const {
    return static_cast<double>(ticksUp(price)) * tick_size;
  }

  double priceNearest(double price) const {
    return static_cast<double>(ticksNearest(price)) * tick_size;
  }

  double quantityDown(double quantity) const {
    auto lots = static_cast<std::int64_t>(
        std::floor(quantity / lot_size + kQuantizeEpsilon));
    return static_cast<double>(lots) * lot_size;
  }
};

}  // namespace domain
}  // namespace gridmm
