#include "cppi/ledger/position_ledger.hpp"

#include "cppi/allocation/allocation_calculator.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <utility>

namespace cppi {

namespace {

using domain::ErrorCode;
using domain::LedgerError;
using domain::Position;
using domain::PositionId;
using domain::RebalanceEvent;
using domain::RebalanceInstruction;

// Safe share of value; 0 for an empty position.
double safeRatio(double safe, double risky) {
  return (safe + risky) > 0.0
             ? 1.0 - AllocationCalculator::riskyRatio(safe, risky)
             : 0.0;
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
PositionLedger::PositionLedger(const StrategyCatalog& catalog,
                               const ITimeProvider& clock,
                               const domain::EngineConfig& config,
                               EventSink sink)
    : catalog_(catalog),
      clock_(clock),
      config_(config),
      trigger_(config.volatility_spike_threshold),
      sink_(std::move(sink)) {}

void PositionLedger::setEventSink(EventSink sink) { sink_ = std::move(sink); }

// -----------------------------------------------------------------------------
// open: validate, size the initial allocation, register
// -----------------------------------------------------------------------------
domain::Result<PositionId> PositionLedger::open(const OpenRequest& request) {
  auto strategy = catalog_.find(request.strategy_id);
  if (!strategy) {
    std::cerr << "[PositionLedger] open rejected: unknown strategy '"
              << request.strategy_id << "'\n";
    return makeError(ErrorCode::InvalidStrategy, 0,
                     "unknown strategy '" + request.strategy_id + "'");
  }

  if (!(request.principal > 0.0) || !std::isfinite(request.principal)) {
    return makeError(ErrorCode::InvalidPrincipal, 0,
                     "principal must be a positive amount");
  }

  if (request.custom_floor.has_value() &&
      (!(*request.custom_floor >= 0.0) ||
       *request.custom_floor > request.principal)) {
    std::cerr << "[PositionLedger] open rejected: custom floor "
              << *request.custom_floor << " outside [0, "
              << request.principal << "]\n";
    return makeError(ErrorCode::InvalidFloor, 0,
                     "custom floor must be within [0, principal]");
  }

  const std::int64_t now = clock_.now_ms();

  auto entry = std::make_shared<Entry>();
  entry->strategy = strategy;

  Position& pos = entry->position;
  pos.id = position_ids_.next_id();
  pos.owner = request.owner;
  pos.strategy_id = strategy->id;
  pos.strategy_version = strategy->version;
  pos.principal = request.principal;
  pos.guaranteed_floor = request.custom_floor.value_or(
      request.principal * strategy->floor_ratio);
  pos.current_value = request.principal;
  pos.peak_value = request.principal;
  pos.cushion =
      AllocationCalculator::cushion(pos.current_value, pos.guaranteed_floor);
  pos.auto_rebalance_enabled = request.auto_rebalance;
  pos.maturity_ms = request.maturity_ms;
  pos.created_at_ms = now;
  pos.last_rebalanced_at_ms = now;
  pos.last_valuation_ms = now;

  const Allocation initial = AllocationCalculator::target(pos, *strategy);
  pos.safe_exposure = initial.safe;
  pos.risky_exposure = initial.risky;

  const Position snapshot = pos;
  {
    std::unique_lock lock(entries_mutex_);
    entries_.emplace(snapshot.id, std::move(entry));
  }

  std::cout << "[PositionLedger] opened position " << snapshot.id << " ("
            << strategy->id << " v" << strategy->version
            << ", principal=" << snapshot.principal
            << ", floor=" << snapshot.guaranteed_floor
            << ", risky=" << snapshot.risky_exposure << ")\n";

  publish({PositionUpdateEvent{snapshot, now}});
  return snapshot.id;
}

domain::Result<PositionId> PositionLedger::open(
    const domain::StrategyId& strategy_id, double principal,
    std::optional<double> custom_floor, bool auto_rebalance) {
  OpenRequest request;
  request.strategy_id = strategy_id;
  request.principal = principal;
  request.custom_floor = custom_floor;
  request.auto_rebalance = auto_rebalance;
  return open(request);
}

// -----------------------------------------------------------------------------
// hydrate: restore a position from a previous session
// -----------------------------------------------------------------------------
domain::Result<PositionId> PositionLedger::hydrate(
    Position position, std::vector<RebalanceEvent> history) {
  auto strategy = position.strategy_version == 0
                      ? catalog_.find(position.strategy_id)
                      : catalog_.find(position.strategy_id,
                                      position.strategy_version);
  if (!strategy) {
    return makeError(ErrorCode::InvalidStrategy, position.id,
                     "unknown strategy '" + position.strategy_id + "' v" +
                         std::to_string(position.strategy_version));
  }
  if (!(position.principal > 0.0)) {
    return makeError(ErrorCode::InvalidPrincipal, position.id,
                     "hydrated principal must be positive");
  }
  if (position.multiplier_override.has_value() &&
      !(*position.multiplier_override >= 1.0 &&
        std::isfinite(*position.multiplier_override))) {
    return makeError(ErrorCode::InvalidStrategy, position.id,
                     "hydrated multiplier override must be >= 1");
  }

  if (position.id == 0) {
    position.id = position_ids_.next_id();
  } else {
    position_ids_.advance_past(position.id);
  }
  position.strategy_version = strategy->version;
  position.rebalance_in_flight = false;

  auto entry = std::make_shared<Entry>();
  entry->strategy = withOverride(strategy, position.multiplier_override);
  entry->position = std::move(position);

  PendingEvents events;
  if (auto violation = checkInvariants(entry->position, entry->position)) {
    flagForReview(*entry, *violation, events);
  }
  events.push_back(PositionUpdateEvent{entry->position, clock_.now_ms()});

  const PositionId id = entry->position.id;
  {
    std::unique_lock lock(entries_mutex_);
    if (entries_.count(id) != 0) {
      return makeError(ErrorCode::InvariantViolation, id,
                       "position id already present in the ledger");
    }
    entries_.emplace(id, std::move(entry));
  }

  {
    std::unique_lock lock(history_mutex_);
    auto& log = history_[id];
    for (auto& record : history) {
      record.position_id = id;
      record.sequence = log.size() + 1;
      log.push_back(record);
      recent_.push_back(record);
    }
    while (recent_.size() > kRecentHistoryCapacity) {
      recent_.pop_front();
    }
  }

  publish(events);
  return id;
}

// -----------------------------------------------------------------------------
// revalue: one valuation tick
// -----------------------------------------------------------------------------
domain::Result<std::optional<RebalanceInstruction>> PositionLedger::revalue(
    PositionId id, double value, std::int64_t timestamp_ms,
    const std::optional<domain::VolatilitySignal>& volatility) {
  using Outcome = domain::Result<std::optional<RebalanceInstruction>>;

  EntryPtr entry = findEntry(id);
  if (!entry) {
    return makeError(ErrorCode::PositionNotFound, id, "no such position");
  }

  PendingEvents events;
  Outcome outcome = [&]() -> Outcome {
    std::lock_guard lock(entry->mutex);
    if (entry->closed) {
      return makeError(ErrorCode::PositionNotFound, id, "position closed");
    }

    Position& pos = entry->position;
    const std::int64_t now = clock_.now_ms();

    // --- Data-quality gates: never act on suspect input ---------------------
    if (!std::isfinite(value) || value < 0.0) {
      recordDataQuality(*entry, ErrorCode::InvalidValuation,
                        "non-finite or negative valuation", events);
      return makeError(ErrorCode::InvalidValuation, id,
                       "valuation " + std::to_string(value) + " rejected",
                       pos);
    }
    if (timestamp_ms < now - config_.freshness_window_ms) {
      recordDataQuality(*entry, ErrorCode::StaleValuation,
                        "valuation older than freshness window", events);
      std::cerr << "[PositionLedger] stale valuation for position " << id
                << " (age=" << (now - timestamp_ms)
                << "ms). Keeping last allocation.\n";
      return makeError(ErrorCode::StaleValuation, id,
                       "valuation is " + std::to_string(now - timestamp_ms) +
                           "ms old",
                       pos);
    }

    // A tick from the future would move last_valuation_ms past the clock and
    // turn every genuine tick after it into a duplicate.
    if (timestamp_ms > now + config_.max_clock_skew_ms) {
      recordDataQuality(*entry, ErrorCode::InvalidValuation,
                        "valuation timestamp ahead of the engine clock",
                        events);
      std::cerr << "[PositionLedger] future-dated valuation for position "
                << id << " (" << (timestamp_ms - now)
                << "ms ahead). Keeping last allocation.\n";
      return makeError(ErrorCode::InvalidValuation, id,
                       "valuation is " + std::to_string(timestamp_ms - now) +
                           "ms ahead of the clock",
                       pos);
    }

    // --- Duplicate or out-of-order tick: idempotent no-op -------------------
    if (timestamp_ms <= pos.last_valuation_ms) {
      return std::optional<RebalanceInstruction>{};
    }

    if (pos.status == domain::PositionStatus::UnderReview) {
      return makeError(ErrorCode::PositionUnderReview, id,
                       "position is under review; tick ignored", pos);
    }

    // --- Bookkeeping: mark, peak/drawdown, ratchet, cushion -----------------
    const Position before = pos;
    markToValue(pos, value);
    pos.last_valuation_ms = timestamp_ms;
    updateDrawdown(pos);
    pos.guaranteed_floor = AllocationCalculator::ratchetFloor(pos, *entry->strategy);
    pos.cushion =
        AllocationCalculator::cushion(pos.current_value, pos.guaranteed_floor);

    if (auto violation = checkInvariants(before, pos)) {
      flagForReview(*entry, *violation, events);
      return makeError(ErrorCode::InvariantViolation, id, *violation, before);
    }

    expireIfTimedOut(*entry, now, events);

    // A reading older than the freshness window counts as missing. Without
    // one the trigger only evaluates floor protection.
    std::optional<domain::VolatilitySignal> reading = volatility;
    if (!reading.has_value()) {
      recordDataQuality(*entry, ErrorCode::MissingVolatilitySignal,
                        "no volatility reading for tick", events);
    } else if (reading->timestamp_ms < now - config_.freshness_window_ms) {
      recordDataQuality(*entry, ErrorCode::MissingVolatilitySignal,
                        "volatility reading older than freshness window",
                        events);
      reading.reset();
    }

    // --- Decision ------------------------------------------------------------
    std::optional<RebalanceInstruction> instruction;
    if (!entry->in_flight) {
      if (auto reason = trigger_.shouldRebalance(pos, *entry->strategy,
                                                 reading, now)) {
        instruction = issueInstruction(*entry, *reason, now);
      }
    }

    events.push_back(PositionUpdateEvent{pos, now});
    return instruction;
  }();

  publish(events);
  return outcome;
}

// -----------------------------------------------------------------------------
// requestRebalance: explicit instruction toward the current target
// -----------------------------------------------------------------------------
domain::Result<RebalanceInstruction> PositionLedger::requestRebalance(
    PositionId id, domain::TriggerReason reason) {
  using Outcome = domain::Result<RebalanceInstruction>;

  EntryPtr entry = findEntry(id);
  if (!entry) {
    return makeError(ErrorCode::PositionNotFound, id, "no such position");
  }

  PendingEvents events;
  Outcome outcome = [&]() -> Outcome {
    std::lock_guard lock(entry->mutex);
    if (entry->closed) {
      return makeError(ErrorCode::PositionNotFound, id, "position closed");
    }

    Position& pos = entry->position;
    if (pos.status == domain::PositionStatus::UnderReview) {
      return makeError(ErrorCode::PositionUnderReview, id,
                       "position is under review", pos);
    }

    const std::int64_t now = clock_.now_ms();
    expireIfTimedOut(*entry, now, events);

    if (entry->in_flight) {
      return makeError(ErrorCode::RebalanceInFlight, id,
                       "instruction " +
                           std::to_string(entry->in_flight->instruction_id) +
                           " is still in flight",
                       pos);
    }

    RebalanceInstruction instruction = issueInstruction(*entry, reason, now);
    events.push_back(PositionUpdateEvent{pos, now});
    return instruction;
  }();

  publish(events);
  return outcome;
}

// -----------------------------------------------------------------------------
// applyRebalanceResult: the executor's report closes the transaction
// -----------------------------------------------------------------------------
domain::Result<RebalanceEvent> PositionLedger::applyRebalanceResult(
    PositionId id, const domain::RebalanceResult& result) {
  using Outcome = domain::Result<RebalanceEvent>;

  EntryPtr entry = findEntry(id);
  if (!entry) {
    return makeError(ErrorCode::PositionNotFound, id, "no such position");
  }

  PendingEvents events;
  Outcome outcome = [&]() -> Outcome {
    std::lock_guard lock(entry->mutex);
    if (entry->closed) {
      return makeError(ErrorCode::PositionNotFound, id, "position closed");
    }

    Position& pos = entry->position;
    if (!entry->in_flight ||
        entry->in_flight->instruction_id != result.instruction_id) {
      std::cerr << "[PositionLedger] WARNING: result for instruction "
                << result.instruction_id << " on position " << id
                << " does not match an in-flight instruction. Ignoring.\n";
      return makeError(ErrorCode::NoRebalanceInFlight, id,
                       "no in-flight instruction " +
                           std::to_string(result.instruction_id),
                       pos);
    }

    const RebalanceInstruction instruction = *entry->in_flight;
    entry->in_flight.reset();
    pos.rebalance_in_flight = false;

    const std::int64_t now =
        result.timestamp_ms > 0 ? result.timestamp_ms : clock_.now_ms();

    auto reject = [&](ErrorCode code, const std::string& reason) -> Outcome {
      std::cerr << "[PositionLedger] rebalance " << instruction.instruction_id
                << " for position " << id << " rejected ("
                << domain::errorCodeToString(code) << "): " << reason
                << ". Keeping prior allocation.\n";
      events.push_back(RebalanceCancelledEvent{
          id, instruction.instruction_id, code, reason, now});
      events.push_back(PositionUpdateEvent{pos, now});
      return makeError(code, id, reason, pos);
    };

    if (!result.success) {
      return reject(ErrorCode::ExecutionRejected,
                    result.failure_reason.empty() ? "executor reported failure"
                                                  : result.failure_reason);
    }
    if (result.slippage_bps > instruction.max_slippage_bps) {
      return reject(ErrorCode::SlippageExceeded,
                    "slippage " + std::to_string(result.slippage_bps) +
                        "bps exceeds budget of " +
                        std::to_string(instruction.max_slippage_bps) + "bps");
    }
    if (!std::isfinite(result.achieved_safe) ||
        !std::isfinite(result.achieved_risky) || result.achieved_safe < 0.0 ||
        result.achieved_risky < 0.0) {
      return reject(ErrorCode::ExecutionRejected, "fill reported invalid leg amounts");
    }

    const Position before = pos;

    pos.safe_exposure = result.achieved_safe;
    pos.risky_exposure = result.achieved_risky;
    pos.current_value = result.achieved_safe + result.achieved_risky;
    updateDrawdown(pos);
    pos.guaranteed_floor = AllocationCalculator::ratchetFloor(pos, *entry->strategy);
    pos.cushion =
        AllocationCalculator::cushion(pos.current_value, pos.guaranteed_floor);

    if (auto violation = checkInvariants(before, pos)) {
      flagForReview(*entry, *violation, events);
      return makeError(ErrorCode::InvariantViolation, id, *violation, before);
    }

    ++pos.rebalance_count;
    pos.last_rebalanced_at_ms = now;

    RebalanceEvent record;
    record.position_id = id;
    record.trigger = instruction.trigger;
    record.before_safe_allocation =
        safeRatio(before.safe_exposure, before.risky_exposure);
    record.before_risky_allocation = AllocationCalculator::riskyRatio(
        before.safe_exposure, before.risky_exposure);
    record.after_safe_allocation =
        safeRatio(pos.safe_exposure, pos.risky_exposure);
    record.after_risky_allocation =
        AllocationCalculator::riskyRatio(pos.safe_exposure, pos.risky_exposure);
    record.timestamp_ms = now;
    record.slippage_bps = result.slippage_bps;
    record.cost_paid = result.cost_paid;
    record = appendHistory(record);

    events.push_back(RebalanceCompletedEvent{record});
    events.push_back(PositionUpdateEvent{pos, now});
    return record;
  }();

  publish(events);
  return outcome;
}

// -----------------------------------------------------------------------------
// cancelRebalance: executor gave up; no history
// -----------------------------------------------------------------------------
domain::Result<RebalanceInstruction> PositionLedger::cancelRebalance(
    PositionId id, domain::InstructionId instruction_id,
    const std::string& reason) {
  using Outcome = domain::Result<RebalanceInstruction>;

  EntryPtr entry = findEntry(id);
  if (!entry) {
    return makeError(ErrorCode::PositionNotFound, id, "no such position");
  }

  PendingEvents events;
  Outcome outcome = [&]() -> Outcome {
    std::lock_guard lock(entry->mutex);
    if (entry->closed) {
      return makeError(ErrorCode::PositionNotFound, id, "position closed");
    }
    if (!entry->in_flight || entry->in_flight->instruction_id != instruction_id) {
      return makeError(ErrorCode::NoRebalanceInFlight, id,
                       "no in-flight instruction " +
                           std::to_string(instruction_id),
                       entry->position);
    }

    const RebalanceInstruction cancelled = *entry->in_flight;
    entry->in_flight.reset();
    entry->position.rebalance_in_flight = false;

    const std::int64_t now = clock_.now_ms();
    events.push_back(RebalanceCancelledEvent{
        id, instruction_id, ErrorCode::ExecutionTimeout, reason, now});
    events.push_back(PositionUpdateEvent{entry->position, now});
    return cancelled;
  }();

  publish(events);
  return outcome;
}

// -----------------------------------------------------------------------------
// expireInFlight: keeper sweep for instructions without a result
// -----------------------------------------------------------------------------
std::vector<RebalanceInstruction> PositionLedger::expireInFlight(
    std::int64_t now_ms) {
  std::vector<EntryPtr> entries;
  {
    std::shared_lock lock(entries_mutex_);
    entries.reserve(entries_.size());
    for (const auto& [id, entry] : entries_) {
      entries.push_back(entry);
    }
  }

  std::vector<RebalanceInstruction> expired;
  for (const auto& entry : entries) {
    PendingEvents events;
    {
      std::lock_guard lock(entry->mutex);
      if (entry->closed || !entry->in_flight) {
        continue;
      }
      const RebalanceInstruction candidate = *entry->in_flight;
      if (expireIfTimedOut(*entry, now_ms, events)) {
        expired.push_back(candidate);
        events.push_back(PositionUpdateEvent{entry->position, now_ms});
      }
    }
    publish(events);
  }
  return expired;
}

// -----------------------------------------------------------------------------
// close: settle and remove from the active set
// -----------------------------------------------------------------------------
domain::Result<domain::FinalSettlement> PositionLedger::close(PositionId id) {
  EntryPtr entry = findEntry(id);
  if (!entry) {
    return makeError(ErrorCode::PositionNotFound, id, "no such position");
  }

  domain::FinalSettlement settlement;
  {
    std::lock_guard lock(entry->mutex);
    if (entry->closed) {
      return makeError(ErrorCode::PositionNotFound, id, "position closed");
    }
    settlement =
        settle(*entry, domain::SettlementReason::Closed, clock_.now_ms());
  }

  {
    std::unique_lock lock(entries_mutex_);
    entries_.erase(id);
  }

  std::cout << "[PositionLedger] closed position " << id
            << " (final=" << settlement.final_value
            << ", return=" << settlement.total_return << ")\n";

  publish({PositionClosedEvent{settlement}});
  return settlement;
}

// -----------------------------------------------------------------------------
// matureDue: close every position whose maturity has passed
// -----------------------------------------------------------------------------
std::vector<domain::FinalSettlement> PositionLedger::matureDue(
    std::int64_t now_ms) {
  std::vector<EntryPtr> entries;
  {
    std::shared_lock lock(entries_mutex_);
    for (const auto& [id, entry] : entries_) {
      entries.push_back(entry);
    }
  }

  std::vector<domain::FinalSettlement> settled;
  for (const auto& entry : entries) {
    std::lock_guard lock(entry->mutex);
    const auto& maturity = entry->position.maturity_ms;
    if (entry->closed || !maturity.has_value() || *maturity > now_ms) {
      continue;
    }
    settled.push_back(
        settle(*entry, domain::SettlementReason::Matured, now_ms));
  }

  if (!settled.empty()) {
    std::unique_lock lock(entries_mutex_);
    for (const auto& s : settled) {
      entries_.erase(s.position_id);
    }
  }

  PendingEvents events;
  for (const auto& s : settled) {
    std::cout << "[PositionLedger] position " << s.position_id
              << " matured (final=" << s.final_value << ")\n";
    events.push_back(PositionClosedEvent{s});
  }
  publish(events);
  return settled;
}

// -----------------------------------------------------------------------------
// updatePosition: new multiplier / floor / auto flag, then re-target
// -----------------------------------------------------------------------------
domain::Result<std::optional<RebalanceInstruction>>
PositionLedger::updatePosition(PositionId id, const PositionUpdate& update) {
  using Outcome = domain::Result<std::optional<RebalanceInstruction>>;

  EntryPtr entry = findEntry(id);
  if (!entry) {
    return makeError(ErrorCode::PositionNotFound, id, "no such position");
  }

  PendingEvents events;
  Outcome outcome = [&]() -> Outcome {
    std::lock_guard lock(entry->mutex);
    if (entry->closed) {
      return makeError(ErrorCode::PositionNotFound, id, "position closed");
    }

    Position& pos = entry->position;
    if (pos.status == domain::PositionStatus::UnderReview) {
      return makeError(ErrorCode::PositionUnderReview, id,
                       "position is under review", pos);
    }

    // --- Validate everything before touching the position -------------------
    if (update.multiplier.has_value() &&
        !(*update.multiplier >= 1.0 && std::isfinite(*update.multiplier))) {
      return makeError(ErrorCode::InvalidStrategy, id,
                       "multiplier must be >= 1", pos);
    }
    if (update.guaranteed_floor.has_value()) {
      const double floor = *update.guaranteed_floor;
      if (!std::isfinite(floor) || floor < pos.guaranteed_floor) {
        return makeError(ErrorCode::InvalidFloor, id,
                         "the guaranteed floor can only be raised (current " +
                             std::to_string(pos.guaranteed_floor) + ")",
                         pos);
      }
      if (floor > pos.current_value) {
        return makeError(ErrorCode::InvalidFloor, id,
                         "floor above the current value cannot be guaranteed",
                         pos);
      }
    }

    const Position before = pos;
    if (update.multiplier.has_value()) {
      pos.multiplier_override = *update.multiplier;
      entry->strategy = withOverride(entry->strategy, pos.multiplier_override);
    }
    if (update.guaranteed_floor.has_value()) {
      pos.guaranteed_floor = *update.guaranteed_floor;
    }
    if (update.auto_rebalance.has_value()) {
      pos.auto_rebalance_enabled = *update.auto_rebalance;
    }
    pos.cushion =
        AllocationCalculator::cushion(pos.current_value, pos.guaranteed_floor);

    if (auto violation = checkInvariants(before, pos)) {
      flagForReview(*entry, *violation, events);
      return makeError(ErrorCode::InvariantViolation, id, *violation, before);
    }

    std::cout << "[PositionLedger] position " << id << " updated (m="
              << entry->strategy->multiplier
              << ", floor=" << pos.guaranteed_floor
              << ", auto=" << (pos.auto_rebalance_enabled ? "on" : "off")
              << ")\n";

    const std::int64_t now = clock_.now_ms();
    expireIfTimedOut(*entry, now, events);

    std::optional<RebalanceInstruction> instruction;
    if (!entry->in_flight) {
      const Allocation target =
          AllocationCalculator::target(pos, *entry->strategy);
      const bool breached = pos.current_value <= pos.guaranteed_floor &&
                            pos.risky_exposure > 0.0;
      const bool drifted =
          pos.auto_rebalance_enabled &&
          pos.status == domain::PositionStatus::Active &&
          RebalanceTrigger::drift(pos, target) >
              entry->strategy->rebalance_threshold;
      if (breached || drifted) {
        instruction =
            issueInstruction(*entry, domain::TriggerReason::Drift, now);
      }
    }

    events.push_back(PositionUpdateEvent{pos, now});
    return instruction;
  }();

  publish(events);
  return outcome;
}

// -----------------------------------------------------------------------------
// Position commands
// -----------------------------------------------------------------------------
domain::Result<Position> PositionLedger::setAutoRebalance(PositionId id,
                                                          bool enabled) {
  EntryPtr entry = findEntry(id);
  if (!entry) {
    return makeError(ErrorCode::PositionNotFound, id, "no such position");
  }

  Position snapshot;
  {
    std::lock_guard lock(entry->mutex);
    if (entry->closed) {
      return makeError(ErrorCode::PositionNotFound, id, "position closed");
    }
    Position& pos = entry->position;
    if (enabled && pos.status == domain::PositionStatus::UnderReview) {
      return makeError(ErrorCode::PositionUnderReview, id,
                       "clear the review before re-enabling auto-rebalance",
                       pos);
    }
    pos.auto_rebalance_enabled = enabled;
    snapshot = pos;
  }

  publish({PositionUpdateEvent{snapshot, clock_.now_ms()}});
  return snapshot;
}

domain::Result<Position> PositionLedger::emergencyStop(PositionId id) {
  EntryPtr entry = findEntry(id);
  if (!entry) {
    return makeError(ErrorCode::PositionNotFound, id, "no such position");
  }

  Position snapshot;
  {
    std::lock_guard lock(entry->mutex);
    if (entry->closed) {
      return makeError(ErrorCode::PositionNotFound, id, "position closed");
    }
    Position& pos = entry->position;
    if (pos.status == domain::PositionStatus::Active) {
      pos.status = domain::PositionStatus::Frozen;
      std::cerr << "[PositionLedger] EMERGENCY STOP on position " << id
                << ". Automatic rebalancing frozen; floor protection stays "
                   "active.\n";
    }
    snapshot = pos;
  }

  publish({PositionUpdateEvent{snapshot, clock_.now_ms()}});
  return snapshot;
}

domain::Result<Position> PositionLedger::resume(PositionId id) {
  EntryPtr entry = findEntry(id);
  if (!entry) {
    return makeError(ErrorCode::PositionNotFound, id, "no such position");
  }

  Position snapshot;
  {
    std::lock_guard lock(entry->mutex);
    if (entry->closed) {
      return makeError(ErrorCode::PositionNotFound, id, "position closed");
    }
    Position& pos = entry->position;
    if (pos.status == domain::PositionStatus::UnderReview) {
      return makeError(ErrorCode::PositionUnderReview, id,
                       "position is under review", pos);
    }
    pos.status = domain::PositionStatus::Active;
    snapshot = pos;
  }

  publish({PositionUpdateEvent{snapshot, clock_.now_ms()}});
  return snapshot;
}

domain::Result<Position> PositionLedger::clearReview(PositionId id,
                                                     double reconciled_safe,
                                                     double reconciled_risky) {
  EntryPtr entry = findEntry(id);
  if (!entry) {
    return makeError(ErrorCode::PositionNotFound, id, "no such position");
  }

  Position snapshot;
  {
    std::lock_guard lock(entry->mutex);
    if (entry->closed) {
      return makeError(ErrorCode::PositionNotFound, id, "position closed");
    }
    Position& pos = entry->position;
    if (pos.status != domain::PositionStatus::UnderReview) {
      return pos;
    }
    if (!(reconciled_safe >= 0.0) || !(reconciled_risky >= 0.0)) {
      return makeError(ErrorCode::InvalidValuation, id,
                       "reconciled legs must be non-negative", pos);
    }

    pos.safe_exposure = reconciled_safe;
    pos.risky_exposure = reconciled_risky;
    pos.current_value = reconciled_safe + reconciled_risky;
    pos.peak_value = std::max(pos.peak_value, pos.current_value);
    pos.cushion =
        AllocationCalculator::cushion(pos.current_value, pos.guaranteed_floor);
    pos.status = domain::PositionStatus::Active;
    pos.auto_rebalance_enabled = false;
    snapshot = pos;
  }

  std::cout << "[PositionLedger] review cleared for position " << id
            << " (value=" << snapshot.current_value
            << "). Auto-rebalance remains off.\n";

  publish({PositionUpdateEvent{snapshot, clock_.now_ms()}});
  return snapshot;
}

// -----------------------------------------------------------------------------
// Queries
// -----------------------------------------------------------------------------
std::optional<Position> PositionLedger::position(PositionId id) const {
  EntryPtr entry = findEntry(id);
  if (!entry) {
    return std::nullopt;
  }
  std::lock_guard lock(entry->mutex);
  if (entry->closed) {
    return std::nullopt;
  }
  return entry->position;
}

std::vector<Position> PositionLedger::snapshots() const {
  std::vector<EntryPtr> entries;
  {
    std::shared_lock lock(entries_mutex_);
    entries.reserve(entries_.size());
    for (const auto& [id, entry] : entries_) {
      entries.push_back(entry);
    }
  }

  std::vector<Position> result;
  result.reserve(entries.size());
  for (const auto& entry : entries) {
    std::lock_guard lock(entry->mutex);
    if (!entry->closed) {
      result.push_back(entry->position);
    }
  }
  std::sort(result.begin(), result.end(),
            [](const Position& a, const Position& b) { return a.id < b.id; });
  return result;
}

std::vector<Position> PositionLedger::positionsForOwner(
    const std::string& owner) const {
  std::vector<Position> all = snapshots();
  all.erase(std::remove_if(all.begin(), all.end(),
                           [&owner](const Position& p) {
                             return p.owner != owner;
                           }),
            all.end());
  return all;
}

std::vector<RebalanceEvent> PositionLedger::history(PositionId id) const {
  std::shared_lock lock(history_mutex_);
  auto it = history_.find(id);
  if (it == history_.end()) {
    return {};
  }
  return it->second;
}

std::vector<RebalanceEvent> PositionLedger::recentRebalances(
    std::size_t count) const {
  std::shared_lock lock(history_mutex_);
  const std::size_t n = std::min(count, recent_.size());
  return std::vector<RebalanceEvent>(
      recent_.rbegin(), recent_.rbegin() + static_cast<std::ptrdiff_t>(n));
}

PoolStats PositionLedger::poolStats() const {
  std::vector<EntryPtr> entries;
  {
    std::shared_lock lock(entries_mutex_);
    for (const auto& [id, entry] : entries_) {
      entries.push_back(entry);
    }
  }

  constexpr double kDayMs = 86'400'000.0;
  const std::int64_t now = clock_.now_ms();

  PoolStats stats;
  double multiplier_sum = 0.0;
  double floor_protection_sum = 0.0;
  double risk_budget = 0.0;
  std::size_t above_floor = 0;

  for (const auto& entry : entries) {
    std::lock_guard lock(entry->mutex);
    if (entry->closed) {
      continue;
    }
    const Position& pos = entry->position;
    ++stats.total_positions;
    stats.total_aum += pos.current_value;
    stats.total_safe += pos.safe_exposure;
    stats.total_risky += pos.risky_exposure;
    stats.total_rebalances += pos.rebalance_count;
    stats.avg_daily_rebalances +=
        static_cast<double>(pos.rebalance_count) /
        std::max(1.0, static_cast<double>(now - pos.created_at_ms) / kDayMs);
    multiplier_sum += entry->strategy->multiplier;
    floor_protection_sum += pos.guaranteed_floor / pos.principal;
    risk_budget += entry->strategy->multiplier * pos.cushion;
    if (pos.current_value > pos.guaranteed_floor) {
      ++above_floor;
    }
  }

  if (stats.total_positions > 0) {
    const auto n = static_cast<double>(stats.total_positions);
    stats.average_multiplier = multiplier_sum / n;
    stats.average_floor_protection = floor_protection_sum / n;
    stats.success_rate = static_cast<double>(above_floor) / n;
  }
  stats.risk_budget_utilization =
      risk_budget > 0.0 ? stats.total_risky / risk_budget : 0.0;
  return stats;
}

std::size_t PositionLedger::activeCount() const {
  std::shared_lock lock(entries_mutex_);
  return entries_.size();
}

// -----------------------------------------------------------------------------
// Private helpers
// -----------------------------------------------------------------------------
PositionLedger::EntryPtr PositionLedger::findEntry(PositionId id) const {
  std::shared_lock lock(entries_mutex_);
  auto it = entries_.find(id);
  return it != entries_.end() ? it->second : nullptr;
}

StrategyCatalog::StrategyPtr PositionLedger::withOverride(
    StrategyCatalog::StrategyPtr pinned,
    const std::optional<double>& multiplier) {
  if (!pinned || !multiplier.has_value()) {
    return pinned;
  }
  auto adjusted = std::make_shared<domain::Strategy>(*pinned);
  adjusted->multiplier = *multiplier;
  return adjusted;
}

LedgerError PositionLedger::makeError(ErrorCode code, PositionId id,
                                      std::string reason,
                                      std::optional<Position> last_known_good) {
  LedgerError error;
  error.code = code;
  error.position_id = id;
  error.reason = std::move(reason);
  error.last_known_good = std::move(last_known_good);
  return error;
}

// The safe leg is the stable one: the risky leg absorbs the move until it is
// exhausted, then the safe leg takes the rest.
void PositionLedger::markToValue(Position& pos, double value) {
  pos.risky_exposure += value - pos.current_value;
  if (pos.risky_exposure < 0.0) {
    pos.safe_exposure += pos.risky_exposure;
    pos.risky_exposure = 0.0;
  }
  pos.current_value = value;
}

void PositionLedger::updateDrawdown(Position& pos) {
  pos.peak_value = std::max(pos.peak_value, pos.current_value);
  if (pos.peak_value > 0.0) {
    pos.max_drawdown = std::max(pos.max_drawdown,
                                1.0 - pos.current_value / pos.peak_value);
  }
}

std::optional<std::string> PositionLedger::checkInvariants(
    const Position& before, const Position& after) const {
  if (after.guaranteed_floor < before.guaranteed_floor) {
    return "guaranteed floor decreased from " +
           std::to_string(before.guaranteed_floor) + " to " +
           std::to_string(after.guaranteed_floor);
  }

  const double tolerance =
      config_.sum_epsilon * std::max(1.0, std::abs(after.current_value));
  const double sum = after.safe_exposure + after.risky_exposure;
  if (!std::isfinite(sum) || std::abs(sum - after.current_value) > tolerance) {
    return "legs sum to " + std::to_string(sum) + " but value is " +
           std::to_string(after.current_value);
  }
  if (after.safe_exposure < -tolerance || after.risky_exposure < -tolerance) {
    return "negative leg exposure (safe=" +
           std::to_string(after.safe_exposure) +
           ", risky=" + std::to_string(after.risky_exposure) + ")";
  }
  return std::nullopt;
}

void PositionLedger::flagForReview(Entry& entry, const std::string& reason,
                                   PendingEvents& events) const {
  Position& pos = entry.position;
  pos.status = domain::PositionStatus::UnderReview;
  pos.auto_rebalance_enabled = false;
  pos.rebalance_in_flight = false;
  entry.in_flight.reset();

  std::cerr << "[PositionLedger] CRITICAL: invariant violation on position "
            << pos.id << ": " << reason
            << ". Auto-rebalancing halted, flagged for manual review.\n";

  const std::int64_t now = clock_.now_ms();
  events.push_back(InvariantViolationEvent{pos.id, reason, pos, now});
  events.push_back(PositionUpdateEvent{pos, now});
}

void PositionLedger::recordDataQuality(Entry& entry, ErrorCode code,
                                       const std::string& reason,
                                       PendingEvents& events) const {
  Position& pos = entry.position;
  ++pos.data_quality_incidents;

  const std::uint64_t threshold = config_.data_quality_alert_threshold;
  if (threshold == 0 || pos.data_quality_incidents % threshold != 0) {
    return;
  }

  std::cerr << "[PositionLedger] WARNING: position " << pos.id << " has "
            << pos.data_quality_incidents << " data-quality incidents (latest: "
            << domain::errorCodeToString(code) << ")\n";
  events.push_back(DataQualityEvent{pos.id, code, pos.data_quality_incidents,
                                    reason, clock_.now_ms()});
}

RebalanceInstruction PositionLedger::issueInstruction(
    Entry& entry, domain::TriggerReason reason, std::int64_t now_ms) {
  const Allocation target =
      AllocationCalculator::target(entry.position, *entry.strategy);

  RebalanceInstruction instruction;
  instruction.position_id = entry.position.id;
  instruction.instruction_id = instruction_ids_.next_id();
  instruction.trigger = reason;
  instruction.target_safe = target.safe;
  instruction.target_risky = target.risky;
  instruction.max_slippage_bps = entry.strategy->max_slippage_bps;
  instruction.issued_at_ms = now_ms;

  entry.in_flight = instruction;
  entry.position.rebalance_in_flight = true;
  return instruction;
}

bool PositionLedger::expireIfTimedOut(Entry& entry, std::int64_t now_ms,
                                      PendingEvents& events) const {
  if (!entry.in_flight ||
      now_ms - entry.in_flight->issued_at_ms < config_.execution_timeout_ms) {
    return false;
  }

  const RebalanceInstruction& expired = *entry.in_flight;
  std::cerr << "[PositionLedger] instruction " << expired.instruction_id
            << " for position " << expired.position_id << " timed out after "
            << (now_ms - expired.issued_at_ms) << "ms. Cancelled.\n";

  events.push_back(RebalanceCancelledEvent{
      expired.position_id, expired.instruction_id, ErrorCode::ExecutionTimeout,
      "no execution result within " +
          std::to_string(config_.execution_timeout_ms) + "ms",
      now_ms});

  entry.in_flight.reset();
  entry.position.rebalance_in_flight = false;
  return true;
}

domain::FinalSettlement PositionLedger::settle(Entry& entry,
                                               domain::SettlementReason reason,
                                               std::int64_t now_ms) {
  const Position& pos = entry.position;

  domain::FinalSettlement settlement;
  settlement.position_id = pos.id;
  settlement.owner = pos.owner;
  settlement.principal = pos.principal;
  settlement.final_value = pos.current_value;
  settlement.guaranteed_floor = pos.guaranteed_floor;
  settlement.total_return = (pos.current_value - pos.principal) / pos.principal;
  settlement.max_drawdown = pos.max_drawdown;
  settlement.rebalance_count = pos.rebalance_count;
  settlement.closed_at_ms = now_ms;
  settlement.reason = reason;

  entry.in_flight.reset();
  entry.closed = true;
  return settlement;
}

RebalanceEvent PositionLedger::appendHistory(RebalanceEvent event) {
  std::unique_lock lock(history_mutex_);
  auto& log = history_[event.position_id];
  event.sequence = log.size() + 1;
  log.push_back(event);

  recent_.push_back(event);
  if (recent_.size() > kRecentHistoryCapacity) {
    recent_.pop_front();
  }
  return event;
}

void PositionLedger::publish(const PendingEvents& events) const {
  if (!sink_) {
    return;
  }
  for (const auto& event : events) {
    sink_(event);
  }
}

}  // namespace cppi
