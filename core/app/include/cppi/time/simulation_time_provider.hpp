#pragma once

#include "cppi/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace cppi {

// -----------------------------------------------------------------------------
// SimulationTimeProvider — externally-driven clock for replay and tests
// -----------------------------------------------------------------------------
//
// @brief  ITimeProvider whose "now" is whatever the valuation stream says it
//         is.
//
// @details
// The ValuationGateway advances the clock to each tick's timestamp before the
// tick is routed to a worker, so freshness checks, scheduled rebalances and
// execution timeouts observe replay time rather than wall time. Tests call
// advance_time() directly to step through scenarios.
//
// The clock is a single std::atomic<int64_t>: one writer (the feed thread or
// the test body), many readers (workers, keeper, executor).
//
// advance_time() does not enforce monotonicity; feeding ticks in order is
// the caller's responsibility, and tests rely on being able to set arbitrary
// times.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  SimulationTimeProvider() = default;
  explicit SimulationTimeProvider(std::int64_t start_ms)
      : current_time_ms_(start_ms) {}

  std::int64_t now_ms() const override;

  // -------------------------------------------------------------------------
  // advance_time(new_time_ms)
  // -------------------------------------------------------------------------
  // @brief  Sets the simulated clock. Visible to all threads after return.
  // -------------------------------------------------------------------------
  void advance_time(std::int64_t new_time_ms);

  // Convenience for tests: move the clock forward by delta_ms.
  void advance_by(std::int64_t delta_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_{0};
};

}  // namespace cppi
