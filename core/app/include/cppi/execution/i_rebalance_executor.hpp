#pragma once

namespace cppi {

// -----------------------------------------------------------------------------
// IRebalanceExecutor — the execution boundary
// -----------------------------------------------------------------------------
//
// @brief  Polymorphic base for anything that turns a RebalanceInstruction
//         into capital actually moving between the safe and risky legs.
//
// @details
// Like every other component on the execution loop, an executor is driven by
// the EventBus rather than by method calls: it subscribes to
// RebalanceInstructionEvent in its constructor and answers with either a
// RebalanceResultEvent (fill or rejection) or a RebalanceCancelRequestEvent.
// Staying silent is also legal; the keeper then expires the instruction
// after EngineConfig::execution_timeout_ms.
//
// AutopilotEngine holds a std::unique_ptr<IRebalanceExecutor>, so a venue
// adapter can replace MockRebalanceExecutor without touching the wiring.
//
// Thread model:
//   Implementations live on the execution loop thread.
// -----------------------------------------------------------------------------
class IRebalanceExecutor {
 public:
  virtual ~IRebalanceExecutor() = default;
};

}  // namespace cppi
