#pragma once

#include "gridmm/domain/errors.hpp"
#include "gridmm/domain/instrument.hpp"
#include "gridmm/domain/order.hpp"

namespace gridmm {

// -----------------------------------------------------------------------------
// RiskDecision
// -----------------------------------------------------------------------------
// Result of RiskGuard::evaluate(). quantity and price are already quantized;
// on Clip, quantity is the reduced size. On Reject both are the quantized
// request and reason says why.
// -----------------------------------------------------------------------------
struct RiskDecision {
  enum class Verdict { Accept, Clip, Reject };

  Verdict verdict{Verdict::Reject};
  double quantity{0.0};
  double price{0.0};
  domain::RiskRejectReason reason{domain::RiskRejectReason::None};

  bool accepted() const { return verdict != Verdict::Reject; }
};

inline const char* toString(RiskDecision::Verdict v) {
  switch (v) {
    case RiskDecision::Verdict::Accept: return "Accept";
    case RiskDecision::Verdict::Clip:   return "Clip";
    case RiskDecision::Verdict::Reject: return "Reject";
  }
  return "Unknown";
}

// -----------------------------------------------------------------------------
// RiskGuard — clip-or-reject against the maximum net position
// -----------------------------------------------------------------------------
//
// @brief  Stateless check run before every order intent is recorded.
//
// @details
// The caller passes the position it wants checked; the guard keeps no copy.
// Headroom for a buy is max - position, for a sell max + position. A request
// larger than the headroom is clipped to it (quantized down to the lot); if
// nothing is left the intent is rejected with PositionLimitExceeded.
//
// Because headroom is always measured against the limit on the side the
// order moves toward, a sell that reduces a long already above the limit is
// allowed but never carries the position past -max.
//
// Thread model:
//   No locking. Called only on the account's reconcile thread, which is the
//   single writer of the position it is handed.
// -----------------------------------------------------------------------------
class RiskGuard {
 public:
  RiskGuard(double max_position, domain::InstrumentSpec instrument);

  RiskDecision evaluate(double position, domain::Side side, double quantity,
                        double price) const;

  double maxPosition() const { return max_position_; }

 private:
  double max_position_;
  domain::InstrumentSpec instrument_;
};

}  // namespace gridmm
