#pragma once

#include "cppi/domain/position.hpp"

#include <optional>
#include <string>
#include <variant>

namespace cppi {
namespace domain {

// -----------------------------------------------------------------------------
// ErrorCode — taxonomy of ledger failures
// -----------------------------------------------------------------------------
//
// Validation (caller mistakes, never retried):
//   InvalidStrategy, InvalidFloor, InvalidPrincipal, PositionNotFound,
//   RebalanceInFlight, NoRebalanceInFlight
//
// Execution (transient; the position keeps its prior allocation and the next
// tick is the retry):
//   SlippageExceeded, ExecutionTimeout, ExecutionRejected
//
// Data quality (decision skipped for the tick):
//   StaleValuation, InvalidValuation, MissingVolatilitySignal
//
// Invariant (programming-bug class; position halted for manual review):
//   InvariantViolation, PositionUnderReview
// -----------------------------------------------------------------------------
enum class ErrorCode {
  InvalidStrategy,
  InvalidFloor,
  InvalidPrincipal,
  PositionNotFound,
  RebalanceInFlight,
  NoRebalanceInFlight,
  SlippageExceeded,
  ExecutionTimeout,
  ExecutionRejected,
  StaleValuation,
  InvalidValuation,
  MissingVolatilitySignal,
  PositionUnderReview,
  InvariantViolation,
};

inline const char* errorCodeToString(ErrorCode c) {
  switch (c) {
    case ErrorCode::InvalidStrategy:         return "InvalidStrategy";
    case ErrorCode::InvalidFloor:            return "InvalidFloor";
    case ErrorCode::InvalidPrincipal:        return "InvalidPrincipal";
    case ErrorCode::PositionNotFound:        return "PositionNotFound";
    case ErrorCode::RebalanceInFlight:       return "RebalanceInFlight";
    case ErrorCode::NoRebalanceInFlight:     return "NoRebalanceInFlight";
    case ErrorCode::SlippageExceeded:        return "SlippageExceeded";
    case ErrorCode::ExecutionTimeout:        return "ExecutionTimeout";
    case ErrorCode::ExecutionRejected:       return "ExecutionRejected";
    case ErrorCode::StaleValuation:          return "StaleValuation";
    case ErrorCode::InvalidValuation:        return "InvalidValuation";
    case ErrorCode::MissingVolatilitySignal: return "MissingVolatilitySignal";
    case ErrorCode::PositionUnderReview:     return "PositionUnderReview";
    case ErrorCode::InvariantViolation:      return "InvariantViolation";
  }
  return "Unknown";
}

// -----------------------------------------------------------------------------
// LedgerError
// -----------------------------------------------------------------------------
// Carries enough context for a caller to retry or intervene: which position,
// why, and the last state the ledger considers good (absent for
// PositionNotFound and open() failures).
// -----------------------------------------------------------------------------
struct LedgerError {
  ErrorCode code{ErrorCode::PositionNotFound};
  PositionId position_id{0};
  std::string reason;
  std::optional<Position> last_known_good;
};

// -----------------------------------------------------------------------------
// Result<T>
// -----------------------------------------------------------------------------
// Either the value or a LedgerError. Inspect with std::get_if, as with the
// Event variant.
// -----------------------------------------------------------------------------
template <typename T>
using Result = std::variant<T, LedgerError>;

template <typename T>
bool isOk(const Result<T>& r) {
  return std::holds_alternative<T>(r);
}

}  // namespace domain
}  // namespace cppi
