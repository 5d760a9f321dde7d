#pragma once

#include "cppi/domain/position.hpp"
#include "cppi/domain/strategy.hpp"

namespace cppi {

// -----------------------------------------------------------------------------
// Allocation — target split of a position's current value
// -----------------------------------------------------------------------------
struct Allocation {
  double safe{0.0};
  double risky{0.0};
};

// -----------------------------------------------------------------------------
// AllocationCalculator — CPPI sizing and floor ratchet
// -----------------------------------------------------------------------------
//
// @brief  Stateless functions that size the risky leg from the cushion and
//         move the floor on new highs.
//
// @details
// target():
//   cushion = max(0, value - floor)
//   risky   = min(multiplier * cushion, value)
//   risky   = min(risky, principal * (cap - 1))       if the strategy caps
//   risky   = max(0, risky);  safe = value - risky
//
// A zero cushion gives zero risky exposure (floor lock). Identical inputs
// always produce identical outputs, which is what makes history replayable.
//
// ratchetFloor():
//   Only when strategy.ratchet_enabled:
//     candidate = peak_value * floor_ratio
//     candidate = min(candidate, cap * principal * floor_ratio)   if capped
//     floor     = max(floor, candidate)
//   The cap clamp keeps the floor from outrunning the capped upside; it
//   never lowers a floor that is already above it.
// -----------------------------------------------------------------------------
class AllocationCalculator {
 public:
  static double cushion(double current_value, double floor);

  static Allocation target(const domain::Position& position,
                           const domain::Strategy& strategy);

  static double ratchetFloor(const domain::Position& position,
                             const domain::Strategy& strategy);

  // risky / (safe + risky); 0 when the position is worth nothing.
  static double riskyRatio(double safe, double risky);
};

}  // namespace cppi
