#pragma once

#include "cppi/domain/strategy.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace cppi {
namespace domain {

using PositionId = std::uint64_t;

// -----------------------------------------------------------------------------
// PositionStatus
// -----------------------------------------------------------------------------
//   Active      — normal operation.
//   Frozen      — emergency stop by the owner. Drift/volatility/scheduled
//                 rebalances are suppressed; floor protection and manual
//                 requests still go through.
//   UnderReview — an invariant violation was detected. Auto-rebalancing is
//                 halted until an operator clears the review.
// -----------------------------------------------------------------------------
enum class PositionStatus { Active, Frozen, UnderReview };

inline const char* positionStatusToString(PositionStatus s) {
  switch (s) {
    case PositionStatus::Active:      return "Active";
    case PositionStatus::Frozen:      return "Frozen";
    case PositionStatus::UnderReview: return "UnderReview";
  }
  return "Unknown";
}

// -----------------------------------------------------------------------------
// Position — one CPPI commitment
// -----------------------------------------------------------------------------
//
// @brief  Value snapshot of a single CPPI position: principal, protected
//         floor, current mark, leg exposures and lifetime counters.
//
// @details
// Invariants (checked by PositionLedger on every mutation):
//   safe_exposure + risky_exposure == current_value   (relative epsilon)
//   guaranteed_floor never decreases
//   cushion == max(0, current_value - guaranteed_floor)
//
// max_drawdown is stored as a positive fraction (0.048 == 4.8% below the
// running peak).
//
// Thread model:
//   Value type. The authoritative copy lives inside PositionLedger and is
//   only mutated through its contract methods; everything else in the
//   engine works on copies (query results, PositionUpdateEvent).
// -----------------------------------------------------------------------------
struct Position {
  PositionId id{0};
  std::string owner;
  StrategyId strategy_id;
  std::uint32_t strategy_version{0};

  double principal{0.0};
  double guaranteed_floor{0.0};
  double current_value{0.0};
  double peak_value{0.0};

  double safe_exposure{0.0};
  double risky_exposure{0.0};
  double cushion{0.0};
  double max_drawdown{0.0};

  // Owner re-parameterisation (PositionLedger::updatePosition). The pinned
  // strategy version is kept; only its multiplier is replaced.
  std::optional<double> multiplier_override;

  std::uint64_t rebalance_count{0};
  bool auto_rebalance_enabled{true};
  PositionStatus status{PositionStatus::Active};

  std::optional<std::int64_t> maturity_ms;
  std::int64_t created_at_ms{0};
  std::int64_t last_rebalanced_at_ms{0};
  std::int64_t last_valuation_ms{0};

  bool rebalance_in_flight{false};
  std::uint64_t data_quality_incidents{0};
};

}  // namespace domain
}  // namespace cppi
