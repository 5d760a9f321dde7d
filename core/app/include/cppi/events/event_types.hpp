#pragma once

#include "cppi/domain/errors.hpp"
#include "cppi/domain/position.hpp"
#include "cppi/domain/rebalance.hpp"
#include "cppi/domain/volatility.hpp"
#include "cppi/health/health_scorer.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace cppi {

// -----------------------------------------------------------------------------
// ValuationTickEvent
// -----------------------------------------------------------------------------
// Responsibility: One mark-to-market reading for a position from the
// valuation feed, optionally carrying the volatility reading for the same
// instant.
// Routed to the worker that owns position_id; PositionLedger::revalue()
// consumes it.
// -----------------------------------------------------------------------------
struct ValuationTickEvent {
  domain::PositionId position_id{0};
  double value{0.0};
  std::int64_t timestamp_ms{0};
  std::optional<domain::VolatilitySignal> volatility;
};

// -----------------------------------------------------------------------------
// RebalanceRequestEvent
// -----------------------------------------------------------------------------
// Responsibility: An explicit rebalance request from the command surface
// (manual rebalance). Routed to the owning worker so it is serialized with
// that position's ticks.
// -----------------------------------------------------------------------------
struct RebalanceRequestEvent {
  domain::PositionId position_id{0};
  domain::TriggerReason reason{domain::TriggerReason::Manual};
};

// -----------------------------------------------------------------------------
// RebalanceInstructionEvent
// -----------------------------------------------------------------------------
// Responsibility: The engine's output to the execution boundary. Published on
// the worker bus, bridged to the execution loop.
// -----------------------------------------------------------------------------
struct RebalanceInstructionEvent {
  domain::RebalanceInstruction instruction;
};

// -----------------------------------------------------------------------------
// RebalanceResultEvent
// -----------------------------------------------------------------------------
// Responsibility: The executor's fill (or rejection) report. Published on the
// execution bus, bridged back to the worker that owns the position.
// -----------------------------------------------------------------------------
struct RebalanceResultEvent {
  domain::RebalanceResult result;
};

// -----------------------------------------------------------------------------
// RebalanceCancelRequestEvent
// -----------------------------------------------------------------------------
// Responsibility: The executor gave up on an instruction (venue timeout,
// shutdown). Clears the in-flight flag without recording history.
// -----------------------------------------------------------------------------
struct RebalanceCancelRequestEvent {
  domain::PositionId position_id{0};
  domain::InstructionId instruction_id{0};
  std::string reason;
};

// -----------------------------------------------------------------------------
// RebalanceCompletedEvent
// -----------------------------------------------------------------------------
// Responsibility: Telemetry copy of the RebalanceEvent just appended to the
// position's history.
// -----------------------------------------------------------------------------
struct RebalanceCompletedEvent {
  domain::RebalanceEvent record;
};

// -----------------------------------------------------------------------------
// RebalanceCancelledEvent
// -----------------------------------------------------------------------------
// Responsibility: An in-flight instruction ended without a fill: rejected by
// the executor, slippage over budget, cancelled, or timed out.
// -----------------------------------------------------------------------------
struct RebalanceCancelledEvent {
  domain::PositionId position_id{0};
  domain::InstructionId instruction_id{0};
  domain::ErrorCode code{domain::ErrorCode::ExecutionTimeout};
  std::string reason;
  std::int64_t timestamp_ms{0};
};

// -----------------------------------------------------------------------------
// PositionUpdateEvent
// -----------------------------------------------------------------------------
// Responsibility: Snapshot of a position after any state change (open, tick,
// fill, flag toggle). HealthMonitor and the IPC telemetry channel listen.
// -----------------------------------------------------------------------------
struct PositionUpdateEvent {
  domain::Position position;
  std::int64_t timestamp_ms{0};
};

// -----------------------------------------------------------------------------
// PositionClosedEvent
// -----------------------------------------------------------------------------
struct PositionClosedEvent {
  domain::FinalSettlement settlement;
};

// -----------------------------------------------------------------------------
// InvariantViolationEvent
// -----------------------------------------------------------------------------
// Responsibility: A ledger invariant broke for a position (floor decreased,
// legs do not sum to value). The position is already UnderReview when this is
// published. Never filtered.
// -----------------------------------------------------------------------------
struct InvariantViolationEvent {
  domain::PositionId position_id{0};
  std::string reason;
  domain::Position snapshot;
  std::int64_t timestamp_ms{0};
};

// -----------------------------------------------------------------------------
// DataQualityEvent
// -----------------------------------------------------------------------------
// Responsibility: Surfaces repeated stale valuations or missing volatility
// readings for a position once the configured threshold is reached.
// -----------------------------------------------------------------------------
struct DataQualityEvent {
  domain::PositionId position_id{0};
  domain::ErrorCode code{domain::ErrorCode::StaleValuation};
  std::uint64_t incidents{0};
  std::string reason;
  std::int64_t timestamp_ms{0};
};

// -----------------------------------------------------------------------------
// HealthAlertEvent
// -----------------------------------------------------------------------------
// Responsibility: Published by HealthMonitor when a position's band worsens
// or when it sits in AtRisk.
// -----------------------------------------------------------------------------
struct HealthAlertEvent {
  domain::PositionId position_id{0};
  HealthBand previous_band{HealthBand::Excellent};
  HealthReport report;
  std::int64_t timestamp_ms{0};
};

}  // namespace cppi
