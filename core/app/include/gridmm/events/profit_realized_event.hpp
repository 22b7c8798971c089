#pragma once

#include "gridmm/domain/profit_log_entry.hpp"
#include "gridmm/events/event_types.hpp"

#include <string>

namespace gridmm {

// -----------------------------------------------------------------------------
// ProfitRealizedEvent
// -----------------------------------------------------------------------------
// Responsibility: A closed period of realized profit, ready to persist.
// By default one per closing fill; with profit_log_interval_ms > 0, one per
// interval that realized anything. The AccountContext forwards these to the
// ProfitRecorder; closed_quantity is informational and not persisted.
// -----------------------------------------------------------------------------
struct ProfitRealizedEvent {
  std::string userid;
  domain::ProfitLogEntry entry;
  double closed_quantity{0.0};
  Timestamp timestamp{};
};

}  // namespace gridmm
