#pragma once

#include "cppi/concurrent/sequence_generator.hpp"
#include "cppi/domain/engine_config.hpp"
#include "cppi/domain/errors.hpp"
#include "cppi/domain/position.hpp"
#include "cppi/domain/rebalance.hpp"
#include "cppi/domain/volatility.hpp"
#include "cppi/events/event.hpp"
#include "cppi/strategy/strategy_catalog.hpp"
#include "cppi/time/i_time_provider.hpp"
#include "cppi/trigger/rebalance_trigger.hpp"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace cppi {

// -----------------------------------------------------------------------------
// OpenRequest — parameters of PositionLedger::open()
// -----------------------------------------------------------------------------
struct OpenRequest {
  std::string owner;
  domain::StrategyId strategy_id;
  double principal{0.0};
  std::optional<double> custom_floor;  // Defaults to principal * floor_ratio
  bool auto_rebalance{true};
  std::optional<std::int64_t> maturity_ms;
};

// -----------------------------------------------------------------------------
// PositionUpdate — owner re-parameterisation of an open position
// -----------------------------------------------------------------------------
// Absent fields are left unchanged.
// -----------------------------------------------------------------------------
struct PositionUpdate {
  std::optional<double> multiplier;        // >= 1
  std::optional<double> guaranteed_floor;  // may only be raised
  std::optional<bool> auto_rebalance;
};

// -----------------------------------------------------------------------------
// PoolStats — folds over the active positions
// -----------------------------------------------------------------------------
struct PoolStats {
  double total_aum{0.0};
  std::size_t total_positions{0};
  double average_multiplier{0.0};
  double average_floor_protection{0.0};  // mean(floor / principal)
  double success_rate{0.0};              // share of positions above floor
  std::uint64_t total_rebalances{0};
  // Pool-wide rebalances per day: each position's count over its age,
  // with ages under a day counted as one day.
  double avg_daily_rebalances{0.0};
  double total_safe{0.0};
  double total_risky{0.0};
  double risk_budget_utilization{0.0};   // sum(risky) / sum(m * cushion)
};

// -----------------------------------------------------------------------------
// PositionLedger — authoritative state of every CPPI position
// -----------------------------------------------------------------------------
//
// @brief  Owns all Positions, their in-flight rebalance instruction and their
//         append-only RebalanceEvent history. Every mutation goes through the
//         methods below; callers only ever receive copies.
//
// @details
// Tick processing (revalue):
//   1. Reject valuations older than the freshness window (StaleValuation) or
//      stamped more than max_clock_skew_ms ahead of the clock
//      (InvalidValuation), and ignore duplicates / out-of-order timestamps
//      (idempotent no-op).
//   2. Mark the legs to the new value. The safe leg is treated as stable, so
//      the change is attributed to the risky leg; once the risky leg is
//      exhausted the remainder hits the safe leg. This keeps
//      safe + risky == value exactly.
//   3. Update peak and max drawdown, apply the floor ratchet, recompute the
//      cushion, and check invariants.
//   4. Expire a timed-out in-flight instruction, then ask RebalanceTrigger
//      whether to act. A new instruction is only issued if none is in flight.
//
// revalue() never changes exposures toward the target; only a confirmed fill
// (applyRebalanceResult) does.
//
// At most one instruction per position is in flight. It ends with
// applyRebalanceResult (fill, rejection or slippage breach), cancelRebalance,
// or the execution timeout.
//
// Invariant violations (floor decreased, legs not summing to value, negative
// legs) put the position UnderReview, switch auto-rebalancing off, publish an
// InvariantViolationEvent and return ErrorCode::InvariantViolation. Nothing is
// corrected automatically; clearReview() is the operator's explicit fix.
//
// Events (PositionUpdateEvent, RebalanceCompletedEvent, ...) are handed to the
// EventSink after the position's lock is released.
//
// Thread model:
//   Each position has its own mutex, so calls for the same position are
//   serialized while different positions proceed in parallel. The index of
//   positions and the history log are guarded by shared_mutexes; history is
//   append-only and readable concurrently.
//
// Ownership:
//   Holds references to the StrategyCatalog and ITimeProvider; both must
//   outlive the ledger.
// -----------------------------------------------------------------------------
class PositionLedger {
 public:
  using EventSink = std::function<void(const Event&)>;

  PositionLedger(const StrategyCatalog& catalog,
                 const ITimeProvider& clock,
                 const domain::EngineConfig& config,
                 EventSink sink = nullptr);

  PositionLedger(const PositionLedger&) = delete;
  PositionLedger& operator=(const PositionLedger&) = delete;
  PositionLedger(PositionLedger&&) = delete;
  PositionLedger& operator=(PositionLedger&&) = delete;

  // Replaces the event sink. Only call before events start flowing.
  void setEventSink(EventSink sink);

  // -------------------------------------------------------------------------
  // open(request)
  // -------------------------------------------------------------------------
  // @brief  Creates a position with its initial CPPI allocation.
  //
  // @return The new PositionId, or:
  //           InvalidStrategy  — unknown strategy id
  //           InvalidPrincipal — principal <= 0
  //           InvalidFloor     — custom floor < 0 or > principal
  //
  // @details
  // The opening deposit is assumed to be allocated at the target split, so
  // the exposures start equal to AllocationCalculator::target(). The
  // position pins the current strategy version.
  // -------------------------------------------------------------------------
  domain::Result<domain::PositionId> open(const OpenRequest& request);

  domain::Result<domain::PositionId> open(
      const domain::StrategyId& strategy_id,
      double principal,
      std::optional<double> custom_floor = std::nullopt,
      bool auto_rebalance = true);

  // -------------------------------------------------------------------------
  // hydrate(position, history)
  // -------------------------------------------------------------------------
  // @brief  Restores a position from a previous session (start-up only).
  //
  // @details
  // The position keeps its id; the id generator is advanced past it. The
  // strategy version it references must exist. Invariants are checked: a
  // hydrated position that breaks them starts UnderReview. No in-flight
  // instruction survives a restart.
  // -------------------------------------------------------------------------
  domain::Result<domain::PositionId> hydrate(
      domain::Position position,
      std::vector<domain::RebalanceEvent> history = {});

  // -------------------------------------------------------------------------
  // revalue(id, value, timestamp_ms, volatility)
  // -------------------------------------------------------------------------
  // @brief  Applies one valuation tick and evaluates the trigger.
  //
  // @return An instruction for the executor when a rebalance fires,
  //         std::nullopt when nothing is to be done, or an error:
  //           PositionNotFound, StaleValuation, InvalidValuation,
  //           PositionUnderReview, InvariantViolation
  //
  // A missing volatility signal, or one older than the freshness window, is
  // counted as a data-quality incident but is not an error. The tick still
  // updates the position, but only floor protection is evaluated.
  // -------------------------------------------------------------------------
  domain::Result<std::optional<domain::RebalanceInstruction>> revalue(
      domain::PositionId id,
      double value,
      std::int64_t timestamp_ms,
      const std::optional<domain::VolatilitySignal>& volatility =
          std::nullopt);

  // -------------------------------------------------------------------------
  // requestRebalance(id, reason)
  // -------------------------------------------------------------------------
  // @brief  Issues an instruction toward the current target immediately.
  //
  // @return The instruction, or RebalanceInFlight if one is already
  //         outstanding, PositionUnderReview, PositionNotFound.
  // -------------------------------------------------------------------------
  domain::Result<domain::RebalanceInstruction> requestRebalance(
      domain::PositionId id,
      domain::TriggerReason reason = domain::TriggerReason::Manual);

  // -------------------------------------------------------------------------
  // applyRebalanceResult(id, result)
  // -------------------------------------------------------------------------
  // @brief  Records the executor's report for the in-flight instruction.
  //
  // @return The appended RebalanceEvent, or:
  //           NoRebalanceInFlight — nothing outstanding / wrong instruction
  //           ExecutionRejected   — executor reported failure
  //           SlippageExceeded    — slippage above the instruction's budget
  //           PositionNotFound
  //
  // Every outcome except NoRebalanceInFlight clears the in-flight flag.
  // On any failure the exposures are left exactly as they were.
  // -------------------------------------------------------------------------
  domain::Result<domain::RebalanceEvent> applyRebalanceResult(
      domain::PositionId id, const domain::RebalanceResult& result);

  // Executor-side cancellation. No history is recorded.
  domain::Result<domain::RebalanceInstruction> cancelRebalance(
      domain::PositionId id,
      domain::InstructionId instruction_id,
      const std::string& reason);

  // Cancels every instruction older than the execution timeout.
  std::vector<domain::RebalanceInstruction> expireInFlight(std::int64_t now_ms);

  // -------------------------------------------------------------------------
  // close(id)
  // -------------------------------------------------------------------------
  // @brief  Removes the position from the active set and settles it.
  //         History is retained for audit.
  // -------------------------------------------------------------------------
  domain::Result<domain::FinalSettlement> close(domain::PositionId id);

  // Closes every position whose maturity is at or before now_ms.
  std::vector<domain::FinalSettlement> matureDue(std::int64_t now_ms);

  // -------------------------------------------------------------------------
  // updatePosition(id, update)
  // -------------------------------------------------------------------------
  // @brief  Re-parameterises an open position and re-targets it.
  //
  // @return An instruction toward the new target when the floor is breached
  //         or, with auto-rebalancing on, the drift exceeds the threshold;
  //         std::nullopt otherwise. Errors:
  //           InvalidStrategy     — multiplier < 1 or not finite
  //           InvalidFloor        — floor below the current guaranteed floor
  //                                 or above the current value
  //           PositionUnderReview, PositionNotFound
  //
  // @details
  // The multiplier is stored as a per-position override on top of the pinned
  // strategy version; other positions on the same strategy are unaffected.
  // No volatility reading is needed: the update is an explicit owner action.
  // Nothing is applied if any field is invalid.
  // -------------------------------------------------------------------------
  domain::Result<std::optional<domain::RebalanceInstruction>> updatePosition(
      domain::PositionId id, const PositionUpdate& update);

  // --- Position commands ---------------------------------------------------
  domain::Result<domain::Position> setAutoRebalance(domain::PositionId id,
                                                    bool enabled);
  domain::Result<domain::Position> emergencyStop(domain::PositionId id);
  domain::Result<domain::Position> resume(domain::PositionId id);

  // Operator fix for an UnderReview position: supplies reconciled leg values
  // (value becomes their sum). Auto-rebalancing stays off until re-enabled.
  domain::Result<domain::Position> clearReview(domain::PositionId id,
                                               double reconciled_safe,
                                               double reconciled_risky);

  // --- Queries (copies; safe from any thread) ------------------------------
  std::optional<domain::Position> position(domain::PositionId id) const;
  std::vector<domain::Position> positionsForOwner(const std::string& owner) const;
  std::vector<domain::Position> snapshots() const;
  std::vector<domain::RebalanceEvent> history(domain::PositionId id) const;
  std::vector<domain::RebalanceEvent> recentRebalances(std::size_t count) const;
  PoolStats poolStats() const;
  std::size_t activeCount() const;

 private:
  static constexpr std::size_t kRecentHistoryCapacity = 1024;

  struct Entry {
    std::mutex mutex;
    domain::Position position;
    StrategyCatalog::StrategyPtr strategy;
    std::optional<domain::RebalanceInstruction> in_flight;
    bool closed{false};
  };
  using EntryPtr = std::shared_ptr<Entry>;

  // Events collected while a position lock is held, published after release.
  using PendingEvents = std::vector<Event>;

  EntryPtr findEntry(domain::PositionId id) const;

  // The pinned template, with the position's multiplier override applied.
  static StrategyCatalog::StrategyPtr withOverride(
      StrategyCatalog::StrategyPtr pinned,
      const std::optional<double>& multiplier);

  static domain::LedgerError makeError(
      domain::ErrorCode code, domain::PositionId id, std::string reason,
      std::optional<domain::Position> last_known_good = std::nullopt);

  static void markToValue(domain::Position& pos, double value);
  static void updateDrawdown(domain::Position& pos);

  std::optional<std::string> checkInvariants(
      const domain::Position& before, const domain::Position& after) const;

  void flagForReview(Entry& entry, const std::string& reason,
                     PendingEvents& events) const;

  void recordDataQuality(Entry& entry, domain::ErrorCode code,
                         const std::string& reason,
                         PendingEvents& events) const;

  domain::RebalanceInstruction issueInstruction(Entry& entry,
                                                domain::TriggerReason reason,
                                                std::int64_t now_ms);

  // Drops the in-flight instruction if it has outlived the timeout.
  bool expireIfTimedOut(Entry& entry, std::int64_t now_ms,
                        PendingEvents& events) const;

  domain::FinalSettlement settle(Entry& entry,
                                 domain::SettlementReason reason,
                                 std::int64_t now_ms);

  // Assigns the per-position sequence number and stores the record.
  domain::RebalanceEvent appendHistory(domain::RebalanceEvent event);

  void publish(const PendingEvents& events) const;

  const StrategyCatalog& catalog_;
  const ITimeProvider& clock_;
  const domain::EngineConfig config_;
  const RebalanceTrigger trigger_;
  EventSink sink_;

  SequenceGenerator position_ids_;
  SequenceGenerator instruction_ids_;

  mutable std::shared_mutex entries_mutex_;
  std::unordered_map<domain::PositionId, EntryPtr> entries_;

  mutable std::shared_mutex history_mutex_;
  std::unordered_map<domain::PositionId, std::vector<domain::RebalanceEvent>>
      history_;
  std::deque<domain::RebalanceEvent> recent_;
};

}  // namespace cppi
