#include "cppi/health/health_scorer.hpp"

#include <limits>

namespace cppi {

namespace {

constexpr double kExcellentFloorDistance = 0.30;
constexpr double kExcellentCushionRatio = 0.20;
constexpr double kGoodFloorDistance = 0.15;
constexpr double kGoodCushionRatio = 0.10;
constexpr double kFairFloorDistance = 0.05;

}  // namespace

const char* healthBandToString(HealthBand band) {
  switch (band) {
    case HealthBand::Excellent: return "Excellent";
    case HealthBand::Good:      return "Good";
    case HealthBand::Fair:      return "Fair";
    case HealthBand::AtRisk:    return "At Risk";
  }
  return "Unknown";
}

HealthReport HealthScorer::score(const domain::Position& position) {
  HealthReport report;

  if (position.guaranteed_floor > 0.0) {
    report.floor_distance =
        (position.current_value - position.guaranteed_floor) /
        position.guaranteed_floor;
  } else {
    report.floor_distance = std::numeric_limits<double>::infinity();
  }

  report.cushion_ratio = position.principal > 0.0
                             ? position.cushion / position.principal
                             : 0.0;

  if (report.floor_distance > kExcellentFloorDistance &&
      report.cushion_ratio > kExcellentCushionRatio) {
    report.band = HealthBand::Excellent;
    report.score = 95;
  } else if (report.floor_distance > kGoodFloorDistance &&
             report.cushion_ratio > kGoodCushionRatio) {
    report.band = HealthBand::Good;
    report.score = 80;
  } else if (report.floor_distance > kFairFloorDistance) {
    report.band = HealthBand::Fair;
    report.score = 65;
  } else {
    report.band = HealthBand::AtRisk;
    report.score = 40;
  }

  return report;
}

}  // namespace cppi
