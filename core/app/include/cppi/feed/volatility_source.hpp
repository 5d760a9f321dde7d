#pragma once

#include "cppi/domain/volatility.hpp"

#include <mutex>
#include <optional>

namespace cppi {

// -----------------------------------------------------------------------------
// IVolatilitySource — polled once per valuation tick
// -----------------------------------------------------------------------------
//
// @brief  Supplies the current volatility reading for the risky leg.
//
// @details
// The engine polls the source only for ticks that do not carry their own
// volatility field. std::nullopt means "no reading available"; the ledger
// counts that as a data-quality incident and skips the Volatility rule for
// the tick, nothing more.
//
// Thread-safety contract:
//   current() is called from the feed thread and from test threads.
// -----------------------------------------------------------------------------
class IVolatilitySource {
 public:
  virtual ~IVolatilitySource() = default;

  virtual std::optional<domain::VolatilitySignal> current() const = 0;
};

// -----------------------------------------------------------------------------
// SettableVolatilitySource — in-process source fed by the operator or a test
// -----------------------------------------------------------------------------
class SettableVolatilitySource final : public IVolatilitySource {
 public:
  std::optional<domain::VolatilitySignal> current() const override {
    std::lock_guard lock(mutex_);
    return signal_;
  }

  void set(const domain::VolatilitySignal& signal) {
    std::lock_guard lock(mutex_);
    signal_ = signal;
  }

  void clear() {
    std::lock_guard lock(mutex_);
    signal_.reset();
  }

 private:
  mutable std::mutex mutex_;
  std::optional<domain::VolatilitySignal> signal_;
};

}  // namespace cppi
