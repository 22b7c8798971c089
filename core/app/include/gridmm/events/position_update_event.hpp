#pragma once

#include "gridmm/domain/position.hpp"
#include "gridmm/events/event_types.hpp"

#include <string>

namespace gridmm {

// -----------------------------------------------------------------------------
// PositionUpdateEvent
// -----------------------------------------------------------------------------
// Published after every fill or snapshot correction that changed the net
// position. Carries a full copy of the Position after the change.
// -----------------------------------------------------------------------------
struct PositionUpdateEvent {
  std::string userid;
  domain::Position position;
  Timestamp timestamp{};
  std::uint64_t sequence_id{0};
};

}  // namespace gridmm
