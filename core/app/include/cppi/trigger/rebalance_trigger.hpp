#pragma once

#include "cppi/allocation/allocation_calculator.hpp"
#include "cppi/domain/position.hpp"
#include "cppi/domain/rebalance.hpp"
#include "cppi/domain/strategy.hpp"
#include "cppi/domain/volatility.hpp"

#include <cstdint>
#include <optional>

namespace cppi {

// -----------------------------------------------------------------------------
// RebalanceTrigger — decides whether a position must rebalance now, and why
// -----------------------------------------------------------------------------
//
// @brief  Pure decision function evaluated on every tick after the ledger has
//         updated the position's value and floor.
//
// @details
// Rules, first match wins:
//
//   1. Floor breach   value <= floor                           → Drift
//   2. Drift          |actual risky ratio - target ratio|
//                         > strategy.rebalance_threshold       → Drift
//   3. Volatility     regime High, or value > spike threshold  → Volatility
//   4. Scheduled      now - last_rebalanced_at >= interval     → Scheduled
//   5. Manual         manual_requested                         → Manual
//
// Rules 2–4 are suppressed when auto-rebalancing is off or the position is
// Frozen/UnderReview. Rules 1 and 5 are never suppressed: floor protection is
// not optional, and an explicit request is always honoured.
//
// Without a volatility signal the tick is treated as suspect: rules 2–4 are
// skipped and only rules 1 and 5 are evaluated. The ledger records the
// data-quality incident and passes std::nullopt for stale readings too.
//
// Thread model:
//   Immutable after construction; safe to share across worker threads.
// -----------------------------------------------------------------------------
class RebalanceTrigger {
 public:
  explicit RebalanceTrigger(double volatility_spike_threshold);

  std::optional<domain::TriggerReason> shouldRebalance(
      const domain::Position& position,
      const domain::Strategy& strategy,
      const std::optional<domain::VolatilitySignal>& volatility,
      std::int64_t now_ms,
      bool manual_requested = false) const;

  // Absolute difference between the actual and target risky ratios.
  static double drift(const domain::Position& position,
                      const Allocation& target);

  double volatilitySpikeThreshold() const { return spike_threshold_; }

 private:
  static bool isFloorBreached(const domain::Position& position);
  static bool automaticRulesEnabled(const domain::Position& position);
  bool isSpike(const domain::VolatilitySignal& signal) const;

  const double spike_threshold_;
};

}  // namespace cppi
