#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace cppi {
namespace domain {

using StrategyId = std::string;

// -----------------------------------------------------------------------------
// Strategy — immutable CPPI template
// -----------------------------------------------------------------------------
//
// @brief  The parameters that turn a position's cushion into a risky
//         allocation: multiplier, floor ratio, optional upside cap and the
//         drift tolerance that decides when a rebalance is due.
//
// @details
// A Strategy is published once into the StrategyCatalog and never mutated
// afterwards. Publishing a template under an existing id creates a new
// version; positions pin the version they were opened with so that a later
// edit of the template cannot silently change the risk of open positions.
//
// Validity (enforced by validateStrategy()):
//   multiplier          >= 1
//   0 < floor_ratio     <= 1
//   rebalance_threshold >  0
//   cap                 >  1 when present (a multiple of principal)
//   max_slippage_bps    >  0
//   scheduled_interval  >  0 when present
//
// Thread model:
//   Shared across positions and threads as std::shared_ptr<const Strategy>.
//   No mutable state.
// -----------------------------------------------------------------------------
struct Strategy {
  StrategyId id;
  std::string name;
  std::uint32_t version{0};  // Assigned by StrategyCatalog::publish()

  double multiplier{3.0};
  double floor_ratio{0.9};
  std::optional<double> cap;  // Max total value as a multiple of principal
  double rebalance_threshold{0.05};

  /// Raise the floor to peak_value * floor_ratio on new highs.
  bool ratchet_enabled{false};

  /// Scheduled rebalance period. std::nullopt means "never".
  std::optional<std::int64_t> scheduled_interval_ms;

  /// Slippage budget attached to every instruction issued for this strategy.
  double max_slippage_bps{50.0};
};

// -----------------------------------------------------------------------------
// RiskLevel — coarse classification of a strategy by its multiplier
// -----------------------------------------------------------------------------
enum class RiskLevel { Conservative, Balanced, Aggressive };

inline RiskLevel riskLevel(double multiplier) {
  if (multiplier <= 3.0) {
    return RiskLevel::Conservative;
  }
  if (multiplier <= 4.5) {
    return RiskLevel::Balanced;
  }
  return RiskLevel::Aggressive;
}

inline const char* riskLevelToString(RiskLevel level) {
  switch (level) {
    case RiskLevel::Conservative: return "Conservative";
    case RiskLevel::Balanced:     return "Balanced";
    case RiskLevel::Aggressive:   return "Aggressive";
  }
  return "Unknown";
}

// -----------------------------------------------------------------------------
// validateStrategy(strategy)
// -----------------------------------------------------------------------------
// @brief  Checks the template invariants.
// @return std::nullopt when valid, otherwise a human-readable reason.
// -----------------------------------------------------------------------------
inline std::optional<std::string> validateStrategy(const Strategy& s) {
  if (s.id.empty()) {
    return std::string("strategy id must not be empty");
  }
  if (!(s.multiplier >= 1.0)) {
    return "multiplier must be >= 1 (got " + std::to_string(s.multiplier) +
           ")";
  }
  if (!(s.floor_ratio > 0.0 && s.floor_ratio <= 1.0)) {
    return "floor_ratio must be in (0, 1] (got " +
           std::to_string(s.floor_ratio) + ")";
  }
  if (!(s.rebalance_threshold > 0.0)) {
    return "rebalance_threshold must be > 0 (got " +
           std::to_string(s.rebalance_threshold) + ")";
  }
  if (s.cap.has_value() && !(*s.cap > 1.0)) {
    return "cap must be > 1 when present (got " + std::to_string(*s.cap) +
           ")";
  }
  if (!(s.max_slippage_bps > 0.0)) {
    return std::string("max_slippage_bps must be > 0");
  }
  if (s.scheduled_interval_ms.has_value() && *s.scheduled_interval_ms <= 0) {
    return std::string("scheduled_interval_ms must be > 0 when present");
  }
  return std::nullopt;
}

}  // namespace domain
}  // namespace cppi
