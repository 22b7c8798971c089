#include "gridmm/risk/risk_guard.hpp"

#include <utility>

namespace gridmm {

RiskGuard::RiskGuard(double max_position, domain::InstrumentSpec instrument)
    : max_position_(max_position), instrument_(std::move(instrument)) {}

RiskDecision RiskGuard::evaluate(double position, domain::Side side,
                                 double quantity, double price) const {
  RiskDecision decision;
  decision.price = instrument_.priceNearest(price);
  decision.quantity = instrument_.quantityDown(quantity);

  if (decision.price <= 0.0 || decision.quantity <= 0.0) {
    decision.verdict = RiskDecision::Verdict::Reject;
    decision.reason = domain::RiskRejectReason::InvalidOrderIntent;
    return decision;
  }

  const double headroom = side == domain::Side::Bid ? max_position_ - position
                                                    : max_position_ + position;

  // Within one lot-epsilon of the limit counts as "at the limit".
  const double epsilon =
      instrument_.lot_size * domain::InstrumentSpec::kQuantizeEpsilon;

  if (decision.quantity <= headroom + epsilon) {
    decision.verdict = RiskDecision::Verdict::Accept;
    return decision;
  }

  const double clipped =
      headroom > 0.0 ? instrument_.quantityDown(headroom) : 0.0;
  if (clipped <= 0.0) {
    decision.verdict = RiskDecision::Verdict::Reject;
    decision.reason = domain::RiskRejectReason::PositionLimitExceeded;
    return decision;
  }

  decision.verdict = RiskDecision::Verdict::Clip;
  decision.quantity = clipped;
  return decision;
}

}  // namespace gridmm
