#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace cppi {
namespace domain {

// -----------------------------------------------------------------------------
// EngineConfig — engine-wide thresholds and wiring
// -----------------------------------------------------------------------------
//
// @brief  Immutable collection of the parameters that govern the trigger
//         loop, data-quality gates and thread layout.
//
// @details
// Loaded from JSON by ConfigLoader (missing keys keep these defaults) and
// copied by value into the components that need it. Remains constant for the
// lifetime of the engine.
//
// Endpoints: an empty string disables the corresponding ZeroMQ socket. Unit
// tests use empty endpoints and push events into the engine directly.
// -----------------------------------------------------------------------------
struct EngineConfig {
  /// Volatility above this value fires a pre-emptive Volatility rebalance.
  double volatility_spike_threshold{0.35};

  /// Valuations (and volatility readings) older than
  /// now - freshness_window_ms are rejected.
  std::int64_t freshness_window_ms{60'000};

  /// Valuations stamped later than now + max_clock_skew_ms are rejected.
  std::int64_t max_clock_skew_ms{5'000};

  /// An in-flight instruction without a result after this long is treated
  /// as cancelled.
  std::int64_t execution_timeout_ms{30'000};

  /// How often the keeper sweeps timeouts and maturities (wall clock).
  std::int64_t keeper_interval_ms{1'000};

  /// Relative tolerance for safe + risky == current_value.
  double sum_epsilon{1e-6};

  /// Data-quality incidents per position before a DataQualityEvent is
  /// raised for monitoring.
  std::uint64_t data_quality_alert_threshold{3};

  /// Slippage budget for strategies that do not set max_slippage_bps.
  double default_max_slippage_bps{50.0};

  /// Number of per-position worker loops.
  std::size_t worker_count{2};

  std::string valuation_endpoint{"tcp://127.0.0.1:5555"};
  std::string ipc_cmd_endpoint{"tcp://127.0.0.1:5556"};
  std::string ipc_pub_endpoint{"tcp://127.0.0.1:5557"};
};

}  // namespace domain
}  // namespace cppi
