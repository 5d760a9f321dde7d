#pragma once

#include "cppi/domain/engine_config.hpp"
#include "cppi/domain/strategy.hpp"
#include "cppi/strategy/strategy_catalog.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace cppi {

// -----------------------------------------------------------------------------
// AppConfig — everything the executable reads at start-up
// -----------------------------------------------------------------------------
struct AppConfig {
  domain::EngineConfig engine;
  std::vector<domain::Strategy> strategies;

  /// Drive the engine clock from valuation timestamps (replay) instead of
  /// the wall clock.
  bool replay_clock{true};
};

// -----------------------------------------------------------------------------
// ConfigLoader — JSON configuration
// -----------------------------------------------------------------------------
//
// @brief  Reads AppConfig from a JSON document.
//
// @details
// Layout (every key optional; missing keys keep the EngineConfig defaults):
//   {
//     "clock": "replay" | "live",
//     "engine": {
//       "volatility_spike_threshold": 0.35,
//       "freshness_window_ms": 60000,
//       "execution_timeout_ms": 30000,
//       "keeper_interval_ms": 1000,
//       "sum_epsilon": 1e-6,
//       "data_quality_alert_threshold": 3,
//       "default_max_slippage_bps": 50,
//       "worker_count": 2,
//       "valuation_endpoint": "tcp://127.0.0.1:5555",
//       "ipc_cmd_endpoint":   "tcp://127.0.0.1:5556",
//       "ipc_pub_endpoint":   "tcp://127.0.0.1:5557"
//     },
//     "strategies": [
//       { "id": "cppi_balanced", "name": "Balanced CPPI", "multiplier": 4,
//         "floor_ratio": 0.85, "cap": 1.5, "rebalance_threshold": 0.03,
//         "ratchet_enabled": false, "scheduled_interval_ms": null,
//         "max_slippage_bps": 50 }
//     ]
//   }
//
// When "strategies" is absent the built-in catalog is used. Strategy
// invariants are not checked here; StrategyCatalog::publish() rejects and
// logs invalid templates.
// -----------------------------------------------------------------------------
class ConfigLoader {
 public:
  // Built-in configuration: EngineConfig defaults plus defaultStrategies().
  static AppConfig defaults();

  // Conservative (m=3, floor 0.90), balanced (m=4, floor 0.85, cap 1.5) and
  // aggressive (m=5.5, floor 0.80) templates.
  static std::vector<domain::Strategy> defaultStrategies();

  // -------------------------------------------------------------------------
  // parse(text, error)
  // -------------------------------------------------------------------------
  // @return The configuration, or std::nullopt for malformed JSON, wrong
  //         value types or an unknown clock name. The reason is written to
  //         *error when provided.
  // -------------------------------------------------------------------------
  static std::optional<AppConfig> parse(const std::string& text,
                                        std::string* error = nullptr);

  // Reads and parses path. Falls back to defaults() (logged to std::cerr)
  // when the file cannot be read or parsed.
  static AppConfig loadFile(const std::string& path);

  // Publishes every strategy; returns how many were accepted.
  static std::size_t publishAll(StrategyCatalog& catalog,
                                const std::vector<domain::Strategy>& strategies);
};

}  // namespace cppi
