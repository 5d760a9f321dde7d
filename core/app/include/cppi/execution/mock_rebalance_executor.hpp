#pragma once

#include "cppi/eventbus/event_bus.hpp"
#include "cppi/events/event_types.hpp"
#include "cppi/execution/i_rebalance_executor.hpp"
#include "cppi/time/i_time_provider.hpp"

#include <atomic>
#include <cstddef>
#include <mutex>
#include <string>

namespace cppi {

// -----------------------------------------------------------------------------
// FillProfile — how MockRebalanceExecutor answers an instruction
// -----------------------------------------------------------------------------
struct FillProfile {
  enum class Mode {
    Fill,    // report a fill at the target split
    Reject,  // report success == false
    Cancel,  // publish RebalanceCancelRequestEvent
    Ignore,  // never answer (exercises the execution timeout)
  };

  Mode mode{Mode::Fill};

  /// Reported slippage. Anything above the instruction's budget is rejected
  /// by the ledger.
  double slippage_bps{0.0};

  /// Trading cost as a fraction of the risky target, in basis points. Paid
  /// out of the safe leg (or the risky leg once the safe leg is empty).
  double fee_bps{0.0};
};

// -----------------------------------------------------------------------------
// MockRebalanceExecutor — deterministic executor for simulation and tests
// -----------------------------------------------------------------------------
//
// @brief  Subscribes to RebalanceInstructionEvent and immediately answers
//         according to the current FillProfile.
//
// @details
// Fill model:
//   cost           = target_risky * fee_bps / 10'000
//   achieved_safe  = target_safe  - cost   (floored at 0)
//   achieved_risky = target_risky - what the safe leg could not cover
//   slippage_bps   = profile.slippage_bps
//   timestamp      = time_provider.now_ms()
//
// so a fill never creates value and achieved_safe + achieved_risky equals
// the target total minus the fee.
//
// The profile may be changed from any thread (tests flip it between
// scenarios while the loop is running).
//
// Ownership:
//   Holds a reference to the execution loop's EventBus and a const
//   reference to the ITimeProvider. Owns neither.
// -----------------------------------------------------------------------------
class MockRebalanceExecutor final : public IRebalanceExecutor {
 public:
  MockRebalanceExecutor(EventBus& bus, const ITimeProvider& time_provider,
                        FillProfile profile = {});

  ~MockRebalanceExecutor() override;

  MockRebalanceExecutor(const MockRebalanceExecutor&) = delete;
  MockRebalanceExecutor& operator=(const MockRebalanceExecutor&) = delete;
  MockRebalanceExecutor(MockRebalanceExecutor&&) = delete;
  MockRebalanceExecutor& operator=(MockRebalanceExecutor&&) = delete;

  void setProfile(const FillProfile& profile);
  FillProfile profile() const;

  // Instructions seen so far, whatever the answer was.
  std::size_t received() const { return received_.load(); }

 private:
  void onInstruction(const RebalanceInstructionEvent& event);

  EventBus& bus_;
  const ITimeProvider& time_provider_;
  EventBus::SubscriptionId subscription_id_{0};

  mutable std::mutex profile_mutex_;
  FillProfile profile_;

  std::atomic<std::size_t> received_{0};
};

}  // namespace cppi
