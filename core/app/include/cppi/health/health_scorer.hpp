#pragma once

#include "cppi/domain/position.hpp"

namespace cppi {

// -----------------------------------------------------------------------------
// HealthBand — monitoring classification of a position
// -----------------------------------------------------------------------------
// Ordered from best to worst; operator< on the underlying value means
// "healthier than".
// -----------------------------------------------------------------------------
enum class HealthBand { Excellent = 0, Good = 1, Fair = 2, AtRisk = 3 };

const char* healthBandToString(HealthBand band);

struct HealthReport {
  double floor_distance{0.0};  // (value - floor) / floor
  double cushion_ratio{0.0};   // cushion / principal
  HealthBand band{HealthBand::AtRisk};
  int score{0};                // 0..100, fixed per band
};

// -----------------------------------------------------------------------------
// HealthScorer — read-only risk banding
// -----------------------------------------------------------------------------
//
// @brief  Maps a Position snapshot to a HealthReport.
//
// @details
// Bands (first match wins):
//   floor_distance > 0.30 and cushion_ratio > 0.20  → Excellent (95)
//   floor_distance > 0.15 and cushion_ratio > 0.10  → Good      (80)
//   floor_distance > 0.05                           → Fair      (65)
//   otherwise                                       → AtRisk    (40)
//
// A zero floor (custom floor of 0) gives an infinite floor distance.
//
// The scorer is deliberately outside the control path: neither the
// AllocationCalculator nor the RebalanceTrigger include this header.
// -----------------------------------------------------------------------------
class HealthScorer {
 public:
  static HealthReport score(const domain::Position& position);
};

}  // namespace cppi
