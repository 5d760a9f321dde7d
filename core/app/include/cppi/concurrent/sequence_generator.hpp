#pragma once

#include <atomic>
#include <cstdint>

namespace cppi {

// -----------------------------------------------------------------------------
// SequenceGenerator — thread-safe, monotonically increasing id source
// -----------------------------------------------------------------------------
//
// @brief  Hands out unique ids starting at 1 (0 is the "unset" sentinel in
//         every domain struct).
//
// @details
// PositionLedger owns two of these: one for position ids and one for
// rebalance instruction ids. open() may be called concurrently from the IPC
// thread and from tests, and instructions are issued from every worker loop,
// so the counter is atomic. Relaxed ordering is enough: uniqueness is the only
// requirement.
//
// Not a singleton; owned as a value member and never copied (a copy would
// produce duplicate ids).
// -----------------------------------------------------------------------------
class SequenceGenerator {
 public:
  SequenceGenerator() = default;

  SequenceGenerator(const SequenceGenerator&) = delete;
  SequenceGenerator& operator=(const SequenceGenerator&) = delete;
  SequenceGenerator(SequenceGenerator&&) = delete;
  SequenceGenerator& operator=(SequenceGenerator&&) = delete;

  std::uint64_t next_id() {
    return next_id_.fetch_add(1, std::memory_order_relaxed);
  }

  // Guarantees every later next_id() is greater than id. Used when ids
  // restored from a previous session must not be handed out again.
  void advance_past(std::uint64_t id) {
    std::uint64_t current = next_id_.load(std::memory_order_relaxed);
    while (current <= id &&
           !next_id_.compare_exchange_weak(current, id + 1,
                                           std::memory_order_relaxed)) {
    }
  }

 private:
  std::atomic<std::uint64_t> next_id_{1};
};

}  // namespace cppi
