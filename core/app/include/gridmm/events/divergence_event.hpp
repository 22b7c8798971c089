#pragma once

#include "gridmm/domain/order.hpp"
#include "gridmm/events/event_types.hpp"

#include <string>

namespace gridmm {

// -----------------------------------------------------------------------------
// DivergenceEvent
// -----------------------------------------------------------------------------
//
// @brief  The local view disagreed with venue truth and was corrected.
//
// @details
// Always published and logged, never dropped silently. Kinds:
//   PositionMismatch  local net position differs from the snapshot by more
//                     than the tolerance; local_value/venue_value are the
//                     two positions.
//   MissingAtVenue    a locally working order is absent from the snapshot;
//                     a status query was issued for it.
//   UnknownAtVenue    the venue reports an open order the ledger did not
//                     know; it was adopted.
//   VanishedAfterAck  an acknowledged order came back NotFound from a
//                     status query and was finalized as Cancelled.
//   FilledMismatch    the snapshot reports more filled quantity than the
//                     ledger; the ledger was synced.
// -----------------------------------------------------------------------------
struct DivergenceEvent {
  enum class Kind {
    PositionMismatch,
    MissingAtVenue,
    UnknownAtVenue,
    VanishedAfterAck,
    FilledMismatch,
  };

  std::string userid;
  Kind kind{Kind::PositionMismatch};
  domain::IntentId intent_id{};
  std::string venue_order_id;
  double local_value{0.0};
  double venue_value{0.0};
  Timestamp timestamp{};
};

inline const char* toString(DivergenceEvent::Kind k) {
  switch (k) {
    case DivergenceEvent::Kind::PositionMismatch: return "PositionMismatch";
    case DivergenceEvent::Kind::MissingAtVenue:   return "MissingAtVenue";
    case DivergenceEvent::Kind::UnknownAtVenue:   return "UnknownAtVenue";
    case DivergenceEvent::Kind::VanishedAfterAck: return "VanishedAfterAck";
    case DivergenceEvent::Kind::FilledMismatch:   return "FilledMismatch";
  }
  return "Unknown";
}

}  // namespace gridmm
