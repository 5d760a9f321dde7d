#pragma once

#include "cppi/domain/position.hpp"

#include <cstdint>
#include <string>

namespace cppi {
namespace domain {

// -----------------------------------------------------------------------------
// TriggerReason — why a rebalance fired
// -----------------------------------------------------------------------------
// Closed set. A floor breach is reported as Drift: it is the extreme case of
// the actual allocation drifting away from a target of zero risky exposure.
// -----------------------------------------------------------------------------
enum class TriggerReason { Drift, Volatility, Scheduled, Manual };

inline const char* triggerReasonToString(TriggerReason r) {
  switch (r) {
    case TriggerReason::Drift:      return "Drift";
    case TriggerReason::Volatility: return "Volatility";
    case TriggerReason::Scheduled:  return "Scheduled";
    case TriggerReason::Manual:     return "Manual";
  }
  return "Unknown";
}

using InstructionId = std::uint64_t;

// -----------------------------------------------------------------------------
// RebalanceInstruction — engine → executor
// -----------------------------------------------------------------------------
// Target leg amounts in money, not ratios. max_slippage_bps is copied from
// the strategy at issue time.
// -----------------------------------------------------------------------------
struct RebalanceInstruction {
  PositionId position_id{0};
  InstructionId instruction_id{0};
  TriggerReason trigger{TriggerReason::Drift};
  double target_safe{0.0};
  double target_risky{0.0};
  double max_slippage_bps{0.0};
  std::int64_t issued_at_ms{0};
};

// -----------------------------------------------------------------------------
// RebalanceResult — executor → engine
// -----------------------------------------------------------------------------
// achieved_safe / achieved_risky are the post-fill leg values, net of
// cost_paid. success == false means the executor rejected the instruction.
// -----------------------------------------------------------------------------
struct RebalanceResult {
  PositionId position_id{0};
  InstructionId instruction_id{0};
  double achieved_safe{0.0};
  double achieved_risky{0.0};
  double slippage_bps{0.0};
  double cost_paid{0.0};
  bool success{true};
  std::string failure_reason;
  std::int64_t timestamp_ms{0};
};

// -----------------------------------------------------------------------------
// RebalanceEvent — append-only audit record
// -----------------------------------------------------------------------------
// Allocations are fractions of total value (0.40 == 40%). Keyed by
// (position_id, sequence); sequence starts at 1 per position.
// -----------------------------------------------------------------------------
struct RebalanceEvent {
  PositionId position_id{0};
  std::uint64_t sequence{0};
  TriggerReason trigger{TriggerReason::Drift};
  double before_safe_allocation{0.0};
  double after_safe_allocation{0.0};
  double before_risky_allocation{0.0};
  double after_risky_allocation{0.0};
  std::int64_t timestamp_ms{0};
  double slippage_bps{0.0};
  double cost_paid{0.0};
};

enum class SettlementReason { Closed, Matured };

inline const char* settlementReasonToString(SettlementReason r) {
  switch (r) {
    case SettlementReason::Closed:  return "Closed";
    case SettlementReason::Matured: return "Matured";
  }
  return "Unknown";
}

// -----------------------------------------------------------------------------
// FinalSettlement — returned when a position leaves the active set
// -----------------------------------------------------------------------------
struct FinalSettlement {
  PositionId position_id{0};
  std::string owner;
  double principal{0.0};
  double final_value{0.0};
  double guaranteed_floor{0.0};
  double total_return{0.0};  // (final_value - principal) / principal
  double max_drawdown{0.0};
  std::uint64_t rebalance_count{0};
  std::int64_t closed_at_ms{0};
  SettlementReason reason{SettlementReason::Closed};
};

}  // namespace domain
}  // namespace cppi
