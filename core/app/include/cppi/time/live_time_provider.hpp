#pragma once

#include "cppi/time/i_time_provider.hpp"

namespace cppi {

// -----------------------------------------------------------------------------
// LiveTimeProvider — wall-clock ITimeProvider
// -----------------------------------------------------------------------------
// Used when the engine runs against live valuation feeds. Stateless; safe
// from any thread.
// -----------------------------------------------------------------------------
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;
};

}  // namespace cppi
