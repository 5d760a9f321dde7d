#include "cppi/execution/mock_rebalance_executor.hpp"

#include <algorithm>
#include <iostream>

namespace cppi {

// -----------------------------------------------------------------------------
// Constructor: subscribe to RebalanceInstructionEvent
// -----------------------------------------------------------------------------
MockRebalanceExecutor::MockRebalanceExecutor(EventBus& bus,
                                             const ITimeProvider& time_provider,
                                             FillProfile profile)
    : bus_(bus), time_provider_(time_provider), profile_(profile) {
  subscription_id_ = bus_.subscribe<RebalanceInstructionEvent>(
      [this](const RebalanceInstructionEvent& e) { onInstruction(e); });
}

MockRebalanceExecutor::~MockRebalanceExecutor() {
  bus_.unsubscribe(subscription_id_);
}

void MockRebalanceExecutor::setProfile(const FillProfile& profile) {
  std::lock_guard lock(profile_mutex_);
  profile_ = profile;
}

FillProfile MockRebalanceExecutor::profile() const {
  std::lock_guard lock(profile_mutex_);
  return profile_;
}

// -----------------------------------------------------------------------------
// onInstruction: answer according to the profile
// -----------------------------------------------------------------------------
void MockRebalanceExecutor::onInstruction(
    const RebalanceInstructionEvent& event) {
  ++received_;

  const domain::RebalanceInstruction& instruction = event.instruction;
  const FillProfile profile = this->profile();
  const std::int64_t now = time_provider_.now_ms();

  switch (profile.mode) {
    case FillProfile::Mode::Ignore:
      return;

    case FillProfile::Mode::Cancel: {
      RebalanceCancelRequestEvent cancel;
      cancel.position_id = instruction.position_id;
      cancel.instruction_id = instruction.instruction_id;
      cancel.reason = "venue cancelled the order";
      bus_.publish(cancel);
      return;
    }

    case FillProfile::Mode::Reject: {
      domain::RebalanceResult result;
      result.position_id = instruction.position_id;
      result.instruction_id = instruction.instruction_id;
      result.success = false;
      result.failure_reason = "venue rejected the order";
      result.timestamp_ms = now;
      bus_.publish(RebalanceResultEvent{result});
      return;
    }

    case FillProfile::Mode::Fill:
      break;
  }

  const double cost =
      std::max(0.0, instruction.target_risky * profile.fee_bps / 10'000.0);
  const double from_safe = std::min(cost, instruction.target_safe);
  const double from_risky =
      std::min(cost - from_safe, instruction.target_risky);

  domain::RebalanceResult result;
  result.position_id = instruction.position_id;
  result.instruction_id = instruction.instruction_id;
  result.achieved_safe = instruction.target_safe - from_safe;
  result.achieved_risky = instruction.target_risky - from_risky;
  result.slippage_bps = profile.slippage_bps;
  result.cost_paid = from_safe + from_risky;
  result.success = true;
  result.timestamp_ms = now;

  std::cout << "[MockRebalanceExecutor] filled instruction "
            << instruction.instruction_id << " for position "
            << instruction.position_id << " (safe=" << result.achieved_safe
            << ", risky=" << result.achieved_risky << ")\n";

  bus_.publish(RebalanceResultEvent{result});
}

}  // namespace cppi
