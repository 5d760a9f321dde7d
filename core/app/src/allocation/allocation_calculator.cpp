#include "cppi/allocation/allocation_calculator.hpp"

#include <algorithm>

namespace cppi {

double AllocationCalculator::cushion(double current_value, double floor) {
  return std::max(0.0, current_value - floor);
}

Allocation AllocationCalculator::target(const domain::Position& position,
                                        const domain::Strategy& strategy) {
  const double value = position.current_value;
  const double cushion_value = cushion(value, position.guaranteed_floor);

  double desired_risky = strategy.multiplier * cushion_value;
  desired_risky = std::min(desired_risky, value);
  if (strategy.cap.has_value()) {
    desired_risky =
        std::min(desired_risky, position.principal * (*strategy.cap - 1.0));
  }

  Allocation allocation;
  allocation.risky = std::max(0.0, desired_risky);
  allocation.safe = value - allocation.risky;
  return allocation;
}

double AllocationCalculator::ratchetFloor(const domain::Position& position,
                                          const domain::Strategy& strategy) {
  if (!strategy.ratchet_enabled) {
    return position.guaranteed_floor;
  }

  double candidate = position.peak_value * strategy.floor_ratio;
  if (strategy.cap.has_value()) {
    candidate = std::min(
        candidate, *strategy.cap * position.principal * strategy.floor_ratio);
  }
  return std::max(position.guaranteed_floor, candidate);
}

double AllocationCalculator::riskyRatio(double safe, double risky) {
  const double total = safe + risky;
  if (total <= 0.0) {
    return 0.0;
  }
  return risky / total;
}

}  // namespace cppi
