#pragma once

#include <cstdint>

namespace cppi {
namespace domain {

enum class VolatilityRegime { Low, Normal, High };

inline const char* volatilityRegimeToString(VolatilityRegime r) {
  switch (r) {
    case VolatilityRegime::Low:    return "Low";
    case VolatilityRegime::Normal: return "Normal";
    case VolatilityRegime::High:   return "High";
  }
  return "Unknown";
}

// -----------------------------------------------------------------------------
// VolatilitySignal — one reading of the risky leg's volatility
// -----------------------------------------------------------------------------
// value is annualised volatility as a fraction (0.185 == 18.5%). Feeds that
// only publish a discretised regime still trigger: a High regime counts as a
// spike regardless of value. timestamp_ms is checked against the freshness
// window like a valuation.
// -----------------------------------------------------------------------------
struct VolatilitySignal {
  double value{0.0};
  VolatilityRegime regime{VolatilityRegime::Normal};
  std::int64_t timestamp_ms{0};
};

}  // namespace domain
}  // namespace cppi
