// =============================================================================
// risk_guard_test.cpp
// =============================================================================
// Unit tests for gridmm::RiskGuard.
//
// Validates:
//   - Orders within the limit are accepted unchanged
//   - Orders that would breach the limit are clipped to the headroom
//   - Orders that end exactly at the limit are accepted
//   - Orders at the limit in the increasing direction are rejected
//   - Orders that reduce exposure are always allowed
//   - Non-positive quantity or price is an InvalidOrderIntent
// =============================================================================

#include "gridmm/risk/risk_guard.hpp"

#include <gtest/gtest.h>

using gridmm::RiskDecision;
using gridmm::domain::RiskRejectReason;
using gridmm::domain::Side;

class RiskGuardTest : public ::testing::Test {
 protected:
  gridmm::domain::InstrumentSpec instrument{"BTC-USD", 0.01, 0.001};
  gridmm::RiskGuard guard{3.0, instrument};
};

// -----------------------------------------------------------------------------
// 1. A buy that stays inside the limit passes unchanged.
// -----------------------------------------------------------------------------
TEST_F(RiskGuardTest, WithinLimitIsAccepted) {
  RiskDecision d = guard.evaluate(0.0, Side::Bid, 1.0, 99.0);

  EXPECT_EQ(d.verdict, RiskDecision::Verdict::Accept);
  EXPECT_TRUE(d.accepted());
  EXPECT_DOUBLE_EQ(d.quantity, 1.0);
  EXPECT_NEAR(d.price, 99.0, 1e-9);
  EXPECT_EQ(d.reason, RiskRejectReason::None);
}

// -----------------------------------------------------------------------------
// 2. Position 1, max 3, buy 5: clipped to 2.
// -----------------------------------------------------------------------------
TEST_F(RiskGuardTest, BreachingBuyIsClippedToHeadroom) {
  RiskDecision d = guard.evaluate(1.0, Side::Bid, 5.0, 99.0);

  EXPECT_EQ(d.verdict, RiskDecision::Verdict::Clip);
  EXPECT_TRUE(d.accepted());
  EXPECT_NEAR(d.quantity, 2.0, 1e-9);
}

// -----------------------------------------------------------------------------
// 3. A sell is measured against the short limit.
// -----------------------------------------------------------------------------
TEST_F(RiskGuardTest, BreachingSellIsClippedToHeadroom) {
  RiskDecision d = guard.evaluate(-2.5, Side::Ask, 1.0, 101.0);

  EXPECT_EQ(d.verdict, RiskDecision::Verdict::Clip);
  EXPECT_NEAR(d.quantity, 0.5, 1e-9);
}

// -----------------------------------------------------------------------------
// 4. An order that lands exactly on the limit is accepted.
// -----------------------------------------------------------------------------
TEST_F(RiskGuardTest, ExactLimitIsAccepted) {
  RiskDecision d = guard.evaluate(2.0, Side::Bid, 1.0, 99.0);

  EXPECT_EQ(d.verdict, RiskDecision::Verdict::Accept);
  EXPECT_NEAR(d.quantity, 1.0, 1e-9);
}

// -----------------------------------------------------------------------------
// 5. At the limit, any further increase is rejected.
// -----------------------------------------------------------------------------
TEST_F(RiskGuardTest, AtLimitIncreaseIsRejected) {
  RiskDecision d = guard.evaluate(3.0, Side::Bid, 1.0, 99.0);

  EXPECT_EQ(d.verdict, RiskDecision::Verdict::Reject);
  EXPECT_FALSE(d.accepted());
  EXPECT_EQ(d.reason, RiskRejectReason::PositionLimitExceeded);
}

// -----------------------------------------------------------------------------
// 6. Reducing exposure is always allowed, even when past the limit.
// Why: Fix and auto-close orders must be able to flatten a position that a
//      venue-side correction pushed beyond the limit.
// -----------------------------------------------------------------------------
TEST_F(RiskGuardTest, ReducingOrderIsAccepted) {
  RiskDecision d = guard.evaluate(3.5, Side::Ask, 1.0, 101.0);

  EXPECT_EQ(d.verdict, RiskDecision::Verdict::Accept);
  EXPECT_NEAR(d.quantity, 1.0, 1e-9);
}

// -----------------------------------------------------------------------------
// 7. Zero quantity, sub-lot quantity and non-positive price are invalid.
// -----------------------------------------------------------------------------
TEST_F(RiskGuardTest, InvalidIntentIsRejected) {
  RiskDecision zero_qty = guard.evaluate(0.0, Side::Bid, 0.0, 99.0);
  EXPECT_EQ(zero_qty.verdict, RiskDecision::Verdict::Reject);
  EXPECT_EQ(zero_qty.reason, RiskRejectReason::InvalidOrderIntent);

  RiskDecision sub_lot = guard.evaluate(0.0, Side::Bid, 0.0004, 99.0);
  EXPECT_EQ(sub_lot.reason, RiskRejectReason::InvalidOrderIntent);

  RiskDecision bad_price = guard.evaluate(0.0, Side::Ask, 1.0, 0.0);
  EXPECT_EQ(bad_price.reason, RiskRejectReason::InvalidOrderIntent);
}

// -----------------------------------------------------------------------------
// 8. Quantity is floored to the lot and price rounded to the tick.
// -----------------------------------------------------------------------------
TEST_F(RiskGuardTest, QuantizesPriceAndQuantity) {
  RiskDecision d = guard.evaluate(0.0, Side::Bid, 1.23456, 99.004);

  EXPECT_NEAR(d.quantity, 1.234, 1e-9);
  EXPECT_NEAR(d.price, 99.0, 1e-9);
}
