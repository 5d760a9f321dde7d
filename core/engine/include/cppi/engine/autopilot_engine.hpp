#pragma once

#include "cppi/concurrent/event_loop_thread.hpp"
#include "cppi/domain/engine_config.hpp"
#include "cppi/domain/errors.hpp"
#include "cppi/execution/i_rebalance_executor.hpp"
#include "cppi/feed/volatility_source.hpp"
#include "cppi/health/health_monitor.hpp"
#include "cppi/ledger/i_position_reconciler.hpp"
#include "cppi/ledger/position_ledger.hpp"
#include "cppi/network/ipc_server.hpp"
#include "cppi/network/keeper_thread.hpp"
#include "cppi/network/valuation_feed_thread.hpp"
#include "cppi/strategy/strategy_catalog.hpp"
#include "cppi/time/i_time_provider.hpp"
#include "cppi/time/simulation_time_provider.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace cppi {

// -----------------------------------------------------------------------------
// AutopilotEngine — top-level orchestrator
// -----------------------------------------------------------------------------
//
// @brief  Owns the strategy catalog, the ledger and every thread of the
//         autopilot, and wires them together.
//
// @details
// Thread layout:
//
//   worker-0 .. worker-N-1   → PositionLedger calls for the positions they own
//   execution thread         → IRebalanceExecutor callbacks
//   keeper thread            → expireInFlight + matureDue every interval
//   ipc thread               → REP commands, PUB telemetry
//   valuation feed thread    → ValuationGateway ZMQ recv loop
//
// Cross-thread bridges (wired in start()):
//   1. feed            →  worker[id % N]:  ValuationTickEvent (pushValuation)
//   2. worker          →  execution:       RebalanceInstructionEvent
//   3. execution       →  worker[id % N]:  RebalanceResultEvent,
//                                          RebalanceCancelRequestEvent
//   4. ledger          →  worker[id % N]:  PositionUpdateEvent and the other
//                                          ledger events (EventSink)
//   5. worker          →  ipc:             telemetry events
//
// Every event that concerns a position travels through the worker that owns
// it (workerFor(id)), including the ledger's own PositionUpdateEvents. That
// worker's thread is therefore the only one that feeds ticks, results and
// cancellations for the position into the ledger, in arrival order.
//
// The ledger additionally locks each position, so the commands executed on
// the IPC thread (open, close, manual rebalance, toggles) are safe to run
// directly.
//
// Startup (start):
//   1. Synchronization gate: hydrate positions from the reconciler.
//   2. Start the worker loops and the execution loop.
//   3. Subscribe the ledger handlers and the cross-thread bridges.
//   4. Create the executor and the health monitor.
//   5. Start the keeper and the IPC server.
//   6. Start the valuation feed LAST (ticks begin flowing).
//
// Shutdown (stop):
//   1. Stop the feed, the keeper and the IPC command thread.
//   2. Join the worker loops and the execution loop.
//   3. Unsubscribe, then destroy the executor, the health monitor and the
//      IPC server. Their callbacks are captured by bus subscriptions, so
//      they are only freed once no loop can dispatch to them.
//
// Components that need no thread (catalog, ledger) exist from construction,
// so strategies can be published and positions opened before start().
// -----------------------------------------------------------------------------
class AutopilotEngine {
 public:
  using ExecutorFactory = std::function<std::unique_ptr<IRebalanceExecutor>(
      EventBus& execution_bus, const ITimeProvider& clock)>;

  // -------------------------------------------------------------------------
  // Constructor
  // -------------------------------------------------------------------------
  // @param  clock         Engine clock. Must outlive the engine.
  // @param  config        Thresholds, thread count and endpoints. Empty
  //                       endpoints disable the feed and IPC sockets.
  // @param  replay_clock  When non-null the valuation feed advances it to
  //                       each tick's timestamp (usually the same object as
  //                       clock).
  // -------------------------------------------------------------------------
  AutopilotEngine(const ITimeProvider& clock, domain::EngineConfig config,
                  SimulationTimeProvider* replay_clock = nullptr);

  ~AutopilotEngine();

  AutopilotEngine(const AutopilotEngine&) = delete;
  AutopilotEngine& operator=(const AutopilotEngine&) = delete;
  AutopilotEngine(AutopilotEngine&&) = delete;
  AutopilotEngine& operator=(AutopilotEngine&&) = delete;

  // Replaces the default MockRebalanceExecutor. Call before start().
  void setExecutorFactory(ExecutorFactory factory);

  // Polled for ticks without their own volatility field. Not owned; may be
  // null. Call before start().
  void setVolatilitySource(const IVolatilitySource* source);

  void start(IPositionReconciler* reconciler = nullptr);
  void stop();

  // Routes a tick to the owning worker. Safe from any thread.
  void pushValuation(ValuationTickEvent tick);

  // -------------------------------------------------------------------------
  // requestManualRebalance(id)
  // -------------------------------------------------------------------------
  // @brief  Issues a Manual instruction now and sends it to the executor.
  // @return The instruction or the ledger's error (RebalanceInFlight, ...).
  // -------------------------------------------------------------------------
  domain::Result<domain::RebalanceInstruction> requestManualRebalance(
      domain::PositionId id);

  // One housekeeping pass: expire timed-out instructions, settle matured
  // positions. The keeper thread calls this periodically.
  void sweep();

  // -------------------------------------------------------------------------
  // executeCommand(cmd)
  // -------------------------------------------------------------------------
  // @brief  Handles one IPC request and returns the JSON response.
  //
  // @details
  // cmd is a JSON object {"cmd": NAME, ...arguments} or a bare NAME for
  // argument-less commands. Responses carry "status": "ok" | "error"; errors
  // from the ledger add "code" and "reason".
  //
  //   PING                                          → PONG
  //   OPEN      strategy_id, principal, [owner, custom_floor,
  //             auto_rebalance, maturity_ms]        → position
  //   CLOSE     position_id                         → settlement
  //   TOGGLE_AUTO position_id, [enabled]            → position (flips when
  //                                                   enabled is absent)
  //   UPDATE    position_id, [multiplier, floor,
  //             auto_rebalance]                     → position + instruction
  //                                                   (null unless re-targeted)
  //   REBALANCE position_id                         → instruction
  //   EMERGENCY_STOP [position_id]                  → positions frozen
  //   RESUME    position_id                         → position
  //   CLEAR_REVIEW position_id, safe, risky         → position
  //   POSITION  position_id                         → position + health
  //   POSITIONS [owner]                             → positions
  //   HISTORY   [position_id]                       → events (recent 20
  //                                                   across the pool when
  //                                                   no id is given)
  //   POOL                                          → pool statistics
  //   STRATEGIES                                    → latest templates
  //   HEALTH    position_id                         → health report
  //
  // Thread-safety: Safe from any thread (called on the IPC thread).
  // -------------------------------------------------------------------------
  std::string executeCommand(const std::string& cmd);

  PositionLedger& ledger() { return *ledger_; }
  StrategyCatalog& catalog() { return catalog_; }
  const HealthMonitor* healthMonitor() const { return health_monitor_.get(); }

  std::size_t workerCount() const { return workers_.size(); }
  std::size_t workerFor(domain::PositionId id) const;

  EventBus& workerEventBus(std::size_t index);
  EventBus& executionEventBus();

  // True when every loop is drained. Tests poll this after pushing events.
  bool idle() const;

 private:
  void onLedgerEvent(const Event& event);

  void subscribeWorker(EventLoopThread& worker);
  void onTick(EventBus& bus, const ValuationTickEvent& tick);
  void onRebalanceRequest(EventBus& bus, const RebalanceRequestEvent& request);
  void onResult(const RebalanceResultEvent& event);
  void onCancelRequest(const RebalanceCancelRequestEvent& event);

  void routeToWorker(domain::PositionId id, Event event);

  const ITimeProvider& clock_;
  const domain::EngineConfig config_;
  SimulationTimeProvider* replay_clock_;

  StrategyCatalog catalog_;
  std::unique_ptr<PositionLedger> ledger_;

  std::vector<std::unique_ptr<EventLoopThread>> workers_;
  EventLoopThread execution_loop_{"execution"};

  ExecutorFactory executor_factory_;
  const IVolatilitySource* volatility_source_{nullptr};

  std::unique_ptr<IRebalanceExecutor> executor_;
  std::unique_ptr<HealthMonitor> health_monitor_;
  std::unique_ptr<KeeperThread> keeper_;
  std::unique_ptr<IpcServer> ipc_server_;
  std::unique_ptr<ValuationFeedThread> feed_thread_;

  // (bus, subscription) pairs registered by start(), removed by stop().
  std::vector<std::pair<EventBus*, EventBus::SubscriptionId>> subscriptions_;

  bool running_{false};
};

}  // namespace cppi
