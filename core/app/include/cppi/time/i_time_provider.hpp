#pragma once

#include <cstdint>

namespace cppi {

// -----------------------------------------------------------------------------
// ITimeProvider — abstract engine clock
// -----------------------------------------------------------------------------
//
// @brief  Pure virtual interface that abstracts "current time" away from
//         std::chrono::system_clock.
//
// @details
// Every time-dependent decision in the engine goes through this interface:
// valuation freshness, scheduled rebalances, execution timeouts and maturity.
// In live mode it is the wall clock; in replay and in tests it is a
// SimulationTimeProvider driven by the valuation stream, which makes the
// trigger loop deterministic for identical input.
//
// Epoch milliseconds are used everywhere (feed ticks, events, history) so
// JSON and the engine share one representation.
//
// Thread-safety contract:
//   Implementations MUST be safe for concurrent reads from every worker.
//
// Ownership:
//   Components hold a const reference; the provider outlives them.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // -------------------------------------------------------------------------
  // now_ms()
  // -------------------------------------------------------------------------
  // @brief  Milliseconds since the Unix epoch. May be 0 for a simulation
  //         clock that has not been advanced yet.
  // -------------------------------------------------------------------------
  virtual std::int64_t now_ms() const = 0;
};

}  // namespace cppi
