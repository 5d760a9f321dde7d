#include "cppi/trigger/rebalance_trigger.hpp"

#include <cmath>

namespace cppi {

RebalanceTrigger::RebalanceTrigger(double volatility_spike_threshold)
    : spike_threshold_(volatility_spike_threshold) {}

double RebalanceTrigger::drift(const domain::Position& position,
                               const Allocation& target) {
  const double actual = AllocationCalculator::riskyRatio(
      position.safe_exposure, position.risky_exposure);
  const double wanted =
      AllocationCalculator::riskyRatio(target.safe, target.risky);
  return std::abs(actual - wanted);
}

bool RebalanceTrigger::isFloorBreached(const domain::Position& position) {
  return position.current_value <= position.guaranteed_floor;
}

bool RebalanceTrigger::isSpike(const domain::VolatilitySignal& signal) const {
  return signal.regime == domain::VolatilityRegime::High ||
         signal.value > spike_threshold_;
}

bool RebalanceTrigger::automaticRulesEnabled(
    const domain::Position& position) {
  return position.auto_rebalance_enabled &&
         position.status == domain::PositionStatus::Active;
}

// -----------------------------------------------------------------------------
// shouldRebalance: evaluate the five rules in priority order
// -----------------------------------------------------------------------------
std::optional<domain::TriggerReason> RebalanceTrigger::shouldRebalance(
    const domain::Position& position,
    const domain::Strategy& strategy,
    const std::optional<domain::VolatilitySignal>& volatility,
    std::int64_t now_ms,
    bool manual_requested) const {
  using domain::TriggerReason;

  // --- 1. Floor breach: full flight to safety, never suppressed -------------
  // Already flat on the risky leg means there is nothing left to sell.
  if (isFloorBreached(position) && position.risky_exposure > 0.0) {
    return TriggerReason::Drift;
  }

  // Rules 2-4 need a trustworthy reading; without one the tick is suspect
  // and only floor protection and an explicit request are honoured.
  if (automaticRulesEnabled(position) && volatility.has_value()) {
    // --- 2. Drift ----------------------------------------------------------
    const Allocation target = AllocationCalculator::target(position, strategy);
    if (drift(position, target) > strategy.rebalance_threshold) {
      return TriggerReason::Drift;
    }

    // --- 3. Volatility spike: pre-emptive de-risking -----------------------
    if (isSpike(*volatility)) {
      return TriggerReason::Volatility;
    }

    // --- 4. Scheduled ------------------------------------------------------
    if (strategy.scheduled_interval_ms.has_value() &&
        now_ms - position.last_rebalanced_at_ms >=
            *strategy.scheduled_interval_ms) {
      return TriggerReason::Scheduled;
    }
  }

  // --- 5. Manual ------------------------------------------------------------
  if (manual_requested) {
    return TriggerReason::Manual;
  }

  return std::nullopt;
}

}  // namespace cppi
