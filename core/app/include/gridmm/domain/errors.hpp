#pragma once

#include <stdexcept>
#include <string>

namespace gridmm {

// -----------------------------------------------------------------------------
// ConfigurationError
// -----------------------------------------------------------------------------
// Invalid grid/risk parameters. Thrown while loading or validating config
// and by GridPlanner on an unusable reference price. Fatal at startup.
// -----------------------------------------------------------------------------
class ConfigurationError : public std::runtime_error {
 public:
  explicit ConfigurationError(const std::string& what)
      : std::runtime_error("ConfigurationError: " + what) {}
};

// -----------------------------------------------------------------------------
// StartupError
// -----------------------------------------------------------------------------
// The venue could not be reached during startup after the retry budget was
// exhausted. The only transport failure that is fatal to the process.
// -----------------------------------------------------------------------------
class StartupError : public std::runtime_error {
 public:
  explicit StartupError(const std::string& what)
      : std::runtime_error("StartupError: " + what) {}
};

// -----------------------------------------------------------------------------
// PersistenceError
// -----------------------------------------------------------------------------
// A store operation failed. Thrown by IAccountStore implementations and
// caught by the ProfitRecorder, which retries and then reports health.
// Never reaches the trading path.
// -----------------------------------------------------------------------------
class PersistenceError : public std::runtime_error {
 public:
  explicit PersistenceError(const std::string& what)
      : std::runtime_error("PersistenceError: " + what) {}
};

namespace domain {

// -----------------------------------------------------------------------------
// VenueError — outcome codes reported by (or about) the exchange adapter
// -----------------------------------------------------------------------------
// None means success. Rejected/AlreadyFilled/NotFound are venue-reported
// facts resolved through status queries; TransportFailure/RateLimited are
// retried by the ExecutionGateway; Timeout means the call deadline expired
// and the outcome at the venue is unknown.
// -----------------------------------------------------------------------------
enum class VenueError {
  None,
  Rejected,
  AlreadyFilled,
  NotFound,
  TransportFailure,
  RateLimited,
  Timeout,
};

inline bool isRetryable(VenueError e) {
  return e == VenueError::TransportFailure || e == VenueError::RateLimited;
}

inline const char* toString(VenueError e) {
  switch (e) {
    case VenueError::None:             return "None";
    case VenueError::Rejected:         return "Rejected";
    case VenueError::AlreadyFilled:    return "AlreadyFilled";
    case VenueError::NotFound:         return "NotFound";
    case VenueError::TransportFailure: return "TransportFailure";
    case VenueError::RateLimited:      return "RateLimited";
    case VenueError::Timeout:          return "Timeout";
  }
  return "Unknown";
}

inline VenueError venueErrorFromString(const std::string& s) {
  if (s.empty() || s == "None") return VenueError::None;
  if (s == "Rejected") return VenueError::Rejected;
  if (s == "AlreadyFilled") return VenueError::AlreadyFilled;
  if (s == "NotFound") return VenueError::NotFound;
  if (s == "RateLimited") return VenueError::RateLimited;
  if (s == "Timeout") return VenueError::Timeout;
  return VenueError::TransportFailure;
}

// -----------------------------------------------------------------------------
// RiskRejectReason
// -----------------------------------------------------------------------------
// Local, non-fatal reasons an intent is dropped for the current cycle.
// -----------------------------------------------------------------------------
enum class RiskRejectReason {
  None,
  InvalidOrderIntent,
  PositionLimitExceeded,
};

inline const char* toString(RiskRejectReason r) {
  switch (r) {
    case RiskRejectReason::None:                  return "None";
    case RiskRejectReason::InvalidOrderIntent:    return "InvalidOrderIntent";
    case RiskRejectReason::PositionLimitExceeded: return "PositionLimitExceeded";
  }
  return "Unknown";
}

}  // namespace domain
}  // namespace gridmm
