// =============================================================================
// position_ledger_test.cpp
// =============================================================================
// Unit tests for cppi::PositionLedger.
//
// Validates:
//   - open(): validation errors and the opening allocation
//   - revalue(): risky-leg marking, drift and floor-breach instructions,
//     ratchet, stale/invalid valuations, idempotent duplicate ticks
//   - At most one instruction in flight; fills, rejections, slippage
//     breaches, cancellations and timeouts
//   - close() / matureDue() settlements; history retained for audit
//   - hydrate(): id continuity, resequenced history, UnderReview on a broken
//     snapshot, clearReview()
//   - Future-dated ticks, freshness/skew boundaries, cap through revalue
//   - Missing, stale or High-regime volatility readings
//   - updatePosition(): multiplier override, floor raise, validation
//   - emergencyStop()/resume(), data-quality alerts, queries and pool stats
//
// Design note:
//   The ledger is driven synchronously with a SimulationTimeProvider; the
//   event sink appends to a vector so each test can assert on exactly what
//   was published. Reference position: principal 10,000, multiplier 3,
//   floor ratio 0.8 (floor 8,000, opening split 4,000 safe / 6,000 risky).
// =============================================================================

#include "cppi/ledger/position_ledger.hpp"
#include "cppi/time/simulation_time_provider.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

using cppi::domain::ErrorCode;
using cppi::domain::LedgerError;
using cppi::domain::PositionId;
using cppi::domain::PositionStatus;
using cppi::domain::RebalanceInstruction;
using cppi::domain::TriggerReason;

class PositionLedgerTest : public ::testing::Test {
 protected:
  static constexpr std::int64_t kStart = 1'000'000;

  cppi::SimulationTimeProvider sim_clock{kStart};
  cppi::StrategyCatalog catalog;
  cppi::domain::EngineConfig config;
  std::unique_ptr<cppi::PositionLedger> ledger;

  std::mutex events_mutex;
  std::vector<cppi::Event> events;

  void SetUp() override {
    config.freshness_window_ms = 60'000;
    config.execution_timeout_ms = 30'000;
    config.data_quality_alert_threshold = 3;

    catalog.publish(makeStrategy("ref", false));
    catalog.publish(makeStrategy("ratchet", true));

    ledger = std::make_unique<cppi::PositionLedger>(
        catalog, sim_clock, config, [this](const cppi::Event& e) {
          std::lock_guard lock(events_mutex);
          events.push_back(e);
        });
  }

  static cppi::domain::Strategy makeStrategy(const std::string& id,
                                             bool ratchet) {
    cppi::domain::Strategy s;
    s.id = id;
    s.multiplier = 3.0;
    s.floor_ratio = 0.8;
    s.rebalance_threshold = 0.05;
    s.ratchet_enabled = ratchet;
    s.max_slippage_bps = 50.0;
    return s;
  }

  static std::optional<cppi::domain::VolatilitySignal> calm(
      std::int64_t at_ms = 0) {
    return cppi::domain::VolatilitySignal{
        0.18, cppi::domain::VolatilityRegime::Normal, at_ms};
  }

  PositionId openRef(double principal = 10'000.0, bool auto_rebalance = true,
                     const std::string& strategy = "ref") {
    return std::get<PositionId>(
        ledger->open(strategy, principal, std::nullopt, auto_rebalance));
  }

  // Advances the clock one second and applies a tick stamped "now". The
  // volatility reading, if any, is stamped with the same time.
  cppi::domain::Result<std::optional<RebalanceInstruction>> tick(
      PositionId id, double value,
      std::optional<cppi::domain::VolatilitySignal> vol = calm()) {
    sim_clock.advance_by(1'000);
    if (vol) {
      vol->timestamp_ms = sim_clock.now_ms();
    }
    return ledger->revalue(id, value, sim_clock.now_ms(), vol);
  }

  // Tick that is expected to produce an instruction.
  RebalanceInstruction tickExpectingInstruction(PositionId id, double value) {
    auto result = tick(id, value);
    auto instruction =
        std::get<std::optional<RebalanceInstruction>>(result);
    EXPECT_TRUE(instruction.has_value());
    return instruction.value_or(RebalanceInstruction{});
  }

  cppi::domain::RebalanceResult fillOf(const RebalanceInstruction& i,
                                       double slippage_bps = 5.0) const {
    cppi::domain::RebalanceResult r;
    r.position_id = i.position_id;
    r.instruction_id = i.instruction_id;
    r.achieved_safe = i.target_safe;
    r.achieved_risky = i.target_risky;
    r.slippage_bps = slippage_bps;
    r.success = true;
    r.timestamp_ms = sim_clock.now_ms();
    return r;
  }

  template <typename T>
  static std::optional<ErrorCode> errorOf(const cppi::domain::Result<T>& r) {
    if (const auto* e = std::get_if<LedgerError>(&r)) {
      return e->code;
    }
    return std::nullopt;
  }

  template <typename T>
  std::vector<T> eventsOf() {
    std::lock_guard lock(events_mutex);
    std::vector<T> out;
    for (const auto& e : events) {
      if (const auto* typed = std::get_if<T>(&e)) {
        out.push_back(*typed);
      }
    }
    return out;
  }

  cppi::domain::Position snapshot(PositionId id) const {
    return ledger->position(id).value();
  }
};

// -----------------------------------------------------------------------------
// 1) Opening allocation.
// Why: the deposit is assumed to land at the target split immediately.
// -----------------------------------------------------------------------------
TEST_F(PositionLedgerTest, OpenSeedsTargetAllocation) {
  const PositionId id = openRef();

  auto p = snapshot(id);
  EXPECT_EQ(p.strategy_version, 1u);
  EXPECT_DOUBLE_EQ(p.guaranteed_floor, 8'000.0);
  EXPECT_DOUBLE_EQ(p.safe_exposure, 4'000.0);
  EXPECT_DOUBLE_EQ(p.risky_exposure, 6'000.0);
  EXPECT_DOUBLE_EQ(p.cushion, 2'000.0);
  EXPECT_EQ(p.status, PositionStatus::Active);
  EXPECT_EQ(p.created_at_ms, kStart);
  EXPECT_FALSE(p.rebalance_in_flight);

  EXPECT_EQ(eventsOf<cppi::PositionUpdateEvent>().size(), 1u);
}

TEST_F(PositionLedgerTest, OpenValidatesInputs) {
  EXPECT_EQ(errorOf(ledger->open("missing", 10'000.0)),
            ErrorCode::InvalidStrategy);
  EXPECT_EQ(errorOf(ledger->open("ref", 0.0)), ErrorCode::InvalidPrincipal);
  EXPECT_EQ(errorOf(ledger->open("ref", -5.0)), ErrorCode::InvalidPrincipal);
  EXPECT_EQ(errorOf(ledger->open(
                "ref", std::numeric_limits<double>::infinity())),
            ErrorCode::InvalidPrincipal);
  EXPECT_EQ(errorOf(ledger->open("ref", 10'000.0, 12'000.0)),
            ErrorCode::InvalidFloor);
  EXPECT_EQ(errorOf(ledger->open("ref", 10'000.0, -1.0)),
            ErrorCode::InvalidFloor);
  EXPECT_EQ(ledger->activeCount(), 0u);

  // A zero custom floor is allowed: everything is cushion.
  auto zero_floor = ledger->open("ref", 10'000.0, 0.0);
  ASSERT_TRUE(cppi::domain::isOk(zero_floor));
  auto p = snapshot(std::get<PositionId>(zero_floor));
  EXPECT_DOUBLE_EQ(p.risky_exposure, 10'000.0);
}

// -----------------------------------------------------------------------------
// 2) Value drops to 8,200.
// Why: the move lands on the risky leg (4,000 / 4,200), the cushion falls
// to 200, and the ledger asks for 600 risky / 7,600 safe. Exposures only
// move once the fill is applied.
// -----------------------------------------------------------------------------
TEST_F(PositionLedgerTest, DriftIssuesInstructionAndFillAppliesIt) {
  const PositionId id = openRef();

  RebalanceInstruction instruction = tickExpectingInstruction(id, 8'200.0);
  EXPECT_EQ(instruction.position_id, id);
  EXPECT_EQ(instruction.trigger, TriggerReason::Drift);
  EXPECT_DOUBLE_EQ(instruction.target_risky, 600.0);
  EXPECT_DOUBLE_EQ(instruction.target_safe, 7'600.0);
  EXPECT_DOUBLE_EQ(instruction.max_slippage_bps, 50.0);

  auto marked = snapshot(id);
  EXPECT_DOUBLE_EQ(marked.current_value, 8'200.0);
  EXPECT_DOUBLE_EQ(marked.safe_exposure, 4'000.0);
  EXPECT_DOUBLE_EQ(marked.risky_exposure, 4'200.0);
  EXPECT_DOUBLE_EQ(marked.cushion, 200.0);
  EXPECT_TRUE(marked.rebalance_in_flight);

  auto applied = ledger->applyRebalanceResult(id, fillOf(instruction));
  ASSERT_TRUE(cppi::domain::isOk(applied));
  const auto& record = std::get<cppi::domain::RebalanceEvent>(applied);
  EXPECT_EQ(record.sequence, 1u);
  EXPECT_EQ(record.trigger, TriggerReason::Drift);
  EXPECT_NEAR(record.before_risky_allocation, 4'200.0 / 8'200.0, 1e-12);
  EXPECT_NEAR(record.after_risky_allocation, 600.0 / 8'200.0, 1e-12);
  EXPECT_NEAR(record.before_safe_allocation + record.before_risky_allocation,
              1.0, 1e-12);

  auto filled = snapshot(id);
  EXPECT_DOUBLE_EQ(filled.safe_exposure, 7'600.0);
  EXPECT_DOUBLE_EQ(filled.risky_exposure, 600.0);
  EXPECT_EQ(filled.rebalance_count, 1u);
  EXPECT_EQ(filled.last_rebalanced_at_ms, sim_clock.now_ms());
  EXPECT_FALSE(filled.rebalance_in_flight);

  EXPECT_EQ(eventsOf<cppi::RebalanceCompletedEvent>().size(), 1u);
  EXPECT_EQ(ledger->history(id).size(), 1u);
}

// -----------------------------------------------------------------------------
// 3) Floor breach with auto-rebalancing off.
// Why: floor protection is never suppressed; the instruction moves
// everything to the safe leg.
// -----------------------------------------------------------------------------
TEST_F(PositionLedgerTest, FloorBreachFiresEvenWithAutoOff) {
  const PositionId id = openRef(10'000.0, false);

  RebalanceInstruction instruction = tickExpectingInstruction(id, 7'900.0);
  EXPECT_EQ(instruction.trigger, TriggerReason::Drift);
  EXPECT_DOUBLE_EQ(instruction.target_risky, 0.0);
  EXPECT_DOUBLE_EQ(instruction.target_safe, 7'900.0);
  EXPECT_DOUBLE_EQ(snapshot(id).cushion, 0.0);
}

TEST_F(PositionLedgerTest, DriftSuppressedWhenAutoOff) {
  const PositionId id = openRef(10'000.0, false);

  auto result = tick(id, 8'200.0);
  ASSERT_TRUE(cppi::domain::isOk(result));
  EXPECT_FALSE(std::get<std::optional<RebalanceInstruction>>(result));
}

// -----------------------------------------------------------------------------
// 4) Legs always sum to value.
// Why: a crash through the whole risky leg spills into the safe leg rather
// than leaving a negative exposure.
// -----------------------------------------------------------------------------
TEST_F(PositionLedgerTest, LegsSumToValueThroughLargeMoves) {
  const PositionId id = openRef(10'000.0, false);

  for (double value : {10'400.0, 9'100.0, 3'000.0, 3'500.0}) {
    auto result = tick(id, value);
    ASSERT_TRUE(cppi::domain::isOk(result)) << "value " << value;

    auto p = snapshot(id);
    EXPECT_NEAR(p.safe_exposure + p.risky_exposure, p.current_value, 1e-9);
    EXPECT_GE(p.safe_exposure, 0.0);
    EXPECT_GE(p.risky_exposure, 0.0);
  }

  // 3,000 wiped out the risky leg and spilled 1,000 into safe; 3,500 then
  // put 500 back on the risky leg.
  auto p = snapshot(id);
  EXPECT_DOUBLE_EQ(p.risky_exposure, 500.0);
  EXPECT_DOUBLE_EQ(p.safe_exposure, 3'000.0);
  EXPECT_NEAR(p.max_drawdown, 1.0 - 3'000.0 / 10'400.0, 1e-12);
}

TEST_F(PositionLedgerTest, NoBreachInstructionOnceFullySafe) {
  const PositionId id = openRef(10'000.0, false);

  // Risky leg wiped out: nothing left to sell.
  auto result = tick(id, 3'000.0);
  ASSERT_TRUE(cppi::domain::isOk(result));
  EXPECT_FALSE(std::get<std::optional<RebalanceInstruction>>(result));
}

// -----------------------------------------------------------------------------
// 5) Ratchet.
// Why: a new peak lifts the floor; a later drop never lowers it.
// -----------------------------------------------------------------------------
TEST_F(PositionLedgerTest, RatchetedFloorNeverDecreases) {
  const PositionId id = openRef(10'000.0, false, "ratchet");

  ASSERT_TRUE(cppi::domain::isOk(tick(id, 12'000.0)));
  EXPECT_DOUBLE_EQ(snapshot(id).guaranteed_floor, 9'600.0);

  ASSERT_TRUE(cppi::domain::isOk(tick(id, 11'000.0)));
  auto p = snapshot(id);
  EXPECT_DOUBLE_EQ(p.guaranteed_floor, 9'600.0);
  EXPECT_DOUBLE_EQ(p.peak_value, 12'000.0);
  EXPECT_DOUBLE_EQ(p.cushion, 1'400.0);
}

// -----------------------------------------------------------------------------
// 6) One instruction in flight.
// Why: a second trade before the first settles would double the move.
// -----------------------------------------------------------------------------
TEST_F(PositionLedgerTest, AtMostOneInstructionInFlight) {
  const PositionId id = openRef();
  tickExpectingInstruction(id, 8'200.0);

  EXPECT_EQ(errorOf(ledger->requestRebalance(id)),
            ErrorCode::RebalanceInFlight);

  auto next = tick(id, 8'100.0);
  ASSERT_TRUE(cppi::domain::isOk(next));
  EXPECT_FALSE(std::get<std::optional<RebalanceInstruction>>(next));
}

TEST_F(PositionLedgerTest, ManualRequestTargetsCurrentAllocation) {
  const PositionId id = openRef();

  auto result = ledger->requestRebalance(id);
  ASSERT_TRUE(cppi::domain::isOk(result));
  const auto& instruction = std::get<RebalanceInstruction>(result);
  EXPECT_EQ(instruction.trigger, TriggerReason::Manual);
  EXPECT_DOUBLE_EQ(instruction.target_risky, 6'000.0);
  EXPECT_TRUE(snapshot(id).rebalance_in_flight);

  EXPECT_EQ(errorOf(ledger->requestRebalance(999)),
            ErrorCode::PositionNotFound);
}

// -----------------------------------------------------------------------------
// 7) Duplicate and out-of-order ticks.
// Why: feeds redeliver; the second copy must change nothing.
// -----------------------------------------------------------------------------
TEST_F(PositionLedgerTest, DuplicateTicksAreIdempotent) {
  const PositionId id = openRef(10'000.0, false);

  ASSERT_TRUE(cppi::domain::isOk(tick(id, 9'500.0)));
  const std::int64_t ts = sim_clock.now_ms();
  const auto before = snapshot(id);

  auto again = ledger->revalue(id, 5'000.0, ts, calm(ts));
  ASSERT_TRUE(cppi::domain::isOk(again));
  EXPECT_FALSE(std::get<std::optional<RebalanceInstruction>>(again));

  auto older = ledger->revalue(id, 5'000.0, ts - 500, calm(ts - 500));
  ASSERT_TRUE(cppi::domain::isOk(older));

  auto after = snapshot(id);
  EXPECT_DOUBLE_EQ(after.current_value, before.current_value);
  EXPECT_DOUBLE_EQ(after.risky_exposure, before.risky_exposure);
  EXPECT_EQ(after.last_valuation_ms, ts);
}

TEST_F(PositionLedgerTest, StaleValuationKeepsPriorState) {
  const PositionId id = openRef();
  sim_clock.advance_time(kStart + 100'000);

  auto result = ledger->revalue(id, 8'200.0, kStart + 30'000,
                                calm(kStart + 30'000));
  EXPECT_EQ(errorOf(result), ErrorCode::StaleValuation);

  const auto& error = std::get<LedgerError>(result);
  ASSERT_TRUE(error.last_known_good.has_value());
  EXPECT_DOUBLE_EQ(error.last_known_good->current_value, 10'000.0);

  auto p = snapshot(id);
  EXPECT_DOUBLE_EQ(p.current_value, 10'000.0);
  EXPECT_FALSE(p.rebalance_in_flight);
  EXPECT_EQ(p.data_quality_incidents, 1u);
}

TEST_F(PositionLedgerTest, NonFiniteOrNegativeValuationRejected) {
  const PositionId id = openRef();

  EXPECT_EQ(errorOf(tick(id, std::numeric_limits<double>::quiet_NaN())),
            ErrorCode::InvalidValuation);
  EXPECT_EQ(errorOf(tick(id, -1.0)), ErrorCode::InvalidValuation);
  EXPECT_DOUBLE_EQ(snapshot(id).current_value, 10'000.0);
}

// -----------------------------------------------------------------------------
// 7b) Future-dated valuation.
// Why: accepting it would move last_valuation_ms past the clock and turn
// every genuine tick after it into a duplicate, silencing floor protection.
// -----------------------------------------------------------------------------
TEST_F(PositionLedgerTest, FutureDatedValuationIsRejected) {
  const PositionId id = openRef();
  const std::int64_t now = sim_clock.now_ms();

  auto future = ledger->revalue(id, 10'000.0, now + 86'400'000,
                                calm(now + 86'400'000));
  EXPECT_EQ(errorOf(future), ErrorCode::InvalidValuation);

  auto p = snapshot(id);
  EXPECT_EQ(p.last_valuation_ms, now);
  EXPECT_EQ(p.data_quality_incidents, 1u);

  auto breach = tick(id, 7'900.0);
  ASSERT_TRUE(cppi::domain::isOk(breach));
  const auto& instruction =
      std::get<std::optional<RebalanceInstruction>>(breach);
  ASSERT_TRUE(instruction.has_value());
  EXPECT_EQ(instruction->trigger, TriggerReason::Drift);
  EXPECT_DOUBLE_EQ(instruction->target_risky, 0.0);
}

TEST_F(PositionLedgerTest, FreshnessAndSkewBoundaries) {
  const PositionId id = openRef(10'000.0, false);
  sim_clock.advance_time(kStart + 100'000);
  const std::int64_t now = sim_clock.now_ms();
  const std::int64_t oldest = now - config.freshness_window_ms;

  EXPECT_EQ(errorOf(ledger->revalue(id, 9'900.0, oldest - 1, calm(oldest))),
            ErrorCode::StaleValuation);
  EXPECT_TRUE(cppi::domain::isOk(
      ledger->revalue(id, 9'900.0, oldest, calm(oldest))));
  EXPECT_EQ(snapshot(id).last_valuation_ms, oldest);

  const std::int64_t latest = now + config.max_clock_skew_ms;
  EXPECT_EQ(errorOf(ledger->revalue(id, 9'800.0, latest + 1, calm(now))),
            ErrorCode::InvalidValuation);
  EXPECT_TRUE(cppi::domain::isOk(
      ledger->revalue(id, 9'800.0, latest, calm(now))));
  EXPECT_EQ(snapshot(id).last_valuation_ms, latest);
  EXPECT_DOUBLE_EQ(snapshot(id).current_value, 9'800.0);
}

// -----------------------------------------------------------------------------
// 7c) Cap enforced through the tick path.
// Why: with cap 1.5 the risky leg may never exceed principal * 0.5, however
// large the cushion grows.
// -----------------------------------------------------------------------------
TEST_F(PositionLedgerTest, CapLimitsInstructionTarget) {
  auto capped = makeStrategy("capped", false);
  capped.cap = 1.5;
  ASSERT_TRUE(catalog.publish(capped).has_value());

  const PositionId id = openRef(10'000.0, true, "capped");
  auto opened = snapshot(id);
  EXPECT_DOUBLE_EQ(opened.risky_exposure, 5'000.0);
  EXPECT_DOUBLE_EQ(opened.safe_exposure, 5'000.0);

  // Marked to 12,000 the risky leg holds 7,000; uncapped m * cushion would
  // be 12,000.
  RebalanceInstruction instruction = tickExpectingInstruction(id, 12'000.0);
  EXPECT_EQ(instruction.trigger, TriggerReason::Drift);
  EXPECT_LE(instruction.target_risky, 10'000.0 * (1.5 - 1.0));
  EXPECT_DOUBLE_EQ(instruction.target_risky, 5'000.0);
  EXPECT_DOUBLE_EQ(instruction.target_safe, 7'000.0);
}

// -----------------------------------------------------------------------------
// 8) Missing volatility.
// Why: it is a data-quality incident, not an error; the third one in a row
// raises one DataQualityEvent.
// -----------------------------------------------------------------------------
TEST_F(PositionLedgerTest, MissingVolatilityRaisesDataQualityAtThreshold) {
  const PositionId id = openRef();

  for (int i = 0; i < 3; ++i) {
    auto result = tick(id, 10'000.0, std::nullopt);
    ASSERT_TRUE(cppi::domain::isOk(result));
    EXPECT_FALSE(std::get<std::optional<RebalanceInstruction>>(result));
  }

  auto alerts = eventsOf<cppi::DataQualityEvent>();
  ASSERT_EQ(alerts.size(), 1u);
  EXPECT_EQ(alerts[0].position_id, id);
  EXPECT_EQ(alerts[0].code, ErrorCode::MissingVolatilitySignal);
  EXPECT_EQ(alerts[0].incidents, 3u);
}

// -----------------------------------------------------------------------------
// 8b) No usable volatility reading.
// Why: the tick is suspect, so drift must not act on it; a floor breach
// still must.
// -----------------------------------------------------------------------------
TEST_F(PositionLedgerTest, MissingVolatilitySkipsDriftButNotFloorBreach) {
  const PositionId id = openRef();

  auto drifted = tick(id, 8'200.0, std::nullopt);
  ASSERT_TRUE(cppi::domain::isOk(drifted));
  EXPECT_FALSE(std::get<std::optional<RebalanceInstruction>>(drifted));
  EXPECT_FALSE(snapshot(id).rebalance_in_flight);

  auto breached = tick(id, 7'900.0, std::nullopt);
  ASSERT_TRUE(cppi::domain::isOk(breached));
  const auto& instruction =
      std::get<std::optional<RebalanceInstruction>>(breached);
  ASSERT_TRUE(instruction.has_value());
  EXPECT_DOUBLE_EQ(instruction->target_risky, 0.0);
  EXPECT_EQ(snapshot(id).data_quality_incidents, 2u);
}

TEST_F(PositionLedgerTest, StaleVolatilityReadingCountsAsMissing) {
  const PositionId id = openRef();
  sim_clock.advance_by(1'000);
  const std::int64_t now = sim_clock.now_ms();

  cppi::domain::VolatilitySignal old_spike{
      0.9, cppi::domain::VolatilityRegime::High,
      now - config.freshness_window_ms - 1};
  auto result = ledger->revalue(id, 8'200.0, now, old_spike);

  ASSERT_TRUE(cppi::domain::isOk(result));
  EXPECT_FALSE(std::get<std::optional<RebalanceInstruction>>(result));
  EXPECT_EQ(snapshot(id).data_quality_incidents, 1u);
}

TEST_F(PositionLedgerTest, HighRegimeReadingTriggersVolatility) {
  const PositionId id = openRef();

  cppi::domain::VolatilitySignal regime_only{
      0.0, cppi::domain::VolatilityRegime::High, 0};
  auto result = tick(id, 10'000.0, regime_only);

  ASSERT_TRUE(cppi::domain::isOk(result));
  const auto& instruction =
      std::get<std::optional<RebalanceInstruction>>(result);
  ASSERT_TRUE(instruction.has_value());
  EXPECT_EQ(instruction->trigger, TriggerReason::Volatility);
  EXPECT_EQ(snapshot(id).data_quality_incidents, 0u);
}

// -----------------------------------------------------------------------------
// 9) Execution failures keep the prior allocation.
// -----------------------------------------------------------------------------
TEST_F(PositionLedgerTest, SlippageBreachRejectsFill) {
  const PositionId id = openRef();
  RebalanceInstruction instruction = tickExpectingInstruction(id, 8'200.0);

  auto result = ledger->applyRebalanceResult(id, fillOf(instruction, 80.0));
  EXPECT_EQ(errorOf(result), ErrorCode::SlippageExceeded);

  auto p = snapshot(id);
  EXPECT_DOUBLE_EQ(p.safe_exposure, 4'000.0);
  EXPECT_DOUBLE_EQ(p.risky_exposure, 4'200.0);
  EXPECT_FALSE(p.rebalance_in_flight);
  EXPECT_EQ(p.rebalance_count, 0u);
  EXPECT_TRUE(ledger->history(id).empty());

  auto cancelled = eventsOf<cppi::RebalanceCancelledEvent>();
  ASSERT_EQ(cancelled.size(), 1u);
  EXPECT_EQ(cancelled[0].code, ErrorCode::SlippageExceeded);
  EXPECT_EQ(cancelled[0].instruction_id, instruction.instruction_id);
}

TEST_F(PositionLedgerTest, ExecutorRejectionKeepsAllocation) {
  const PositionId id = openRef();
  RebalanceInstruction instruction = tickExpectingInstruction(id, 8'200.0);

  auto rejected = fillOf(instruction);
  rejected.success = false;
  rejected.failure_reason = "venue closed";

  auto result = ledger->applyRebalanceResult(id, rejected);
  EXPECT_EQ(errorOf(result), ErrorCode::ExecutionRejected);
  EXPECT_DOUBLE_EQ(snapshot(id).risky_exposure, 4'200.0);

  // The next tick is the retry.
  auto retry = tick(id, 8'150.0);
  ASSERT_TRUE(cppi::domain::isOk(retry));
  EXPECT_TRUE(std::get<std::optional<RebalanceInstruction>>(retry).has_value());
}

TEST_F(PositionLedgerTest, ResultForUnknownInstructionIsIgnored) {
  const PositionId id = openRef();
  RebalanceInstruction instruction = tickExpectingInstruction(id, 8'200.0);

  auto stray = fillOf(instruction);
  stray.instruction_id += 100;
  EXPECT_EQ(errorOf(ledger->applyRebalanceResult(id, stray)),
            ErrorCode::NoRebalanceInFlight);
  EXPECT_TRUE(snapshot(id).rebalance_in_flight);
}

TEST_F(PositionLedgerTest, CancelClearsInFlightWithoutHistory) {
  const PositionId id = openRef();
  RebalanceInstruction instruction = tickExpectingInstruction(id, 8'200.0);

  auto cancelled =
      ledger->cancelRebalance(id, instruction.instruction_id, "venue timeout");
  ASSERT_TRUE(cppi::domain::isOk(cancelled));
  EXPECT_FALSE(snapshot(id).rebalance_in_flight);
  EXPECT_TRUE(ledger->history(id).empty());

  auto events_seen = eventsOf<cppi::RebalanceCancelledEvent>();
  ASSERT_EQ(events_seen.size(), 1u);
  EXPECT_EQ(events_seen[0].code, ErrorCode::ExecutionTimeout);
  EXPECT_EQ(events_seen[0].reason, "venue timeout");

  EXPECT_EQ(errorOf(ledger->cancelRebalance(id, instruction.instruction_id, "")),
            ErrorCode::NoRebalanceInFlight);
}

// -----------------------------------------------------------------------------
// 10) Execution timeout.
// Why: an executor that never answers must not block the position forever.
// -----------------------------------------------------------------------------
TEST_F(PositionLedgerTest, InFlightInstructionExpiresAfterTimeout) {
  const PositionId id = openRef();
  RebalanceInstruction instruction = tickExpectingInstruction(id, 8'200.0);

  EXPECT_TRUE(
      ledger->expireInFlight(instruction.issued_at_ms + 29'999).empty());
  EXPECT_TRUE(snapshot(id).rebalance_in_flight);

  auto expired = ledger->expireInFlight(instruction.issued_at_ms + 30'000);
  ASSERT_EQ(expired.size(), 1u);
  EXPECT_EQ(expired[0].instruction_id, instruction.instruction_id);
  EXPECT_FALSE(snapshot(id).rebalance_in_flight);

  auto cancelled = eventsOf<cppi::RebalanceCancelledEvent>();
  ASSERT_EQ(cancelled.size(), 1u);
  EXPECT_EQ(cancelled[0].code, ErrorCode::ExecutionTimeout);

  // A late fill for the expired instruction is refused.
  EXPECT_EQ(errorOf(ledger->applyRebalanceResult(id, fillOf(instruction))),
            ErrorCode::NoRebalanceInFlight);
  EXPECT_TRUE(cppi::domain::isOk(ledger->requestRebalance(id)));
}

// -----------------------------------------------------------------------------
// 11) Settlement.
// Why: close() reports the realised return and keeps the audit trail.
// -----------------------------------------------------------------------------
TEST_F(PositionLedgerTest, CloseSettlesAndRetainsHistory) {
  const PositionId id = openRef();
  RebalanceInstruction instruction = tickExpectingInstruction(id, 8'200.0);
  ASSERT_TRUE(cppi::domain::isOk(
      ledger->applyRebalanceResult(id, fillOf(instruction))));

  auto result = ledger->close(id);
  ASSERT_TRUE(cppi::domain::isOk(result));
  const auto& s = std::get<cppi::domain::FinalSettlement>(result);
  EXPECT_DOUBLE_EQ(s.final_value, 8'200.0);
  EXPECT_NEAR(s.total_return, -0.18, 1e-12);
  EXPECT_EQ(s.rebalance_count, 1u);
  EXPECT_EQ(s.reason, cppi::domain::SettlementReason::Closed);

  EXPECT_FALSE(ledger->position(id).has_value());
  EXPECT_EQ(ledger->activeCount(), 0u);
  EXPECT_EQ(ledger->history(id).size(), 1u);
  EXPECT_EQ(eventsOf<cppi::PositionClosedEvent>().size(), 1u);

  EXPECT_EQ(errorOf(ledger->close(id)), ErrorCode::PositionNotFound);
  EXPECT_EQ(errorOf(tick(id, 9'000.0)), ErrorCode::PositionNotFound);
}

TEST_F(PositionLedgerTest, MatureDueClosesExpiredPositions) {
  cppi::OpenRequest request;
  request.owner = "alice";
  request.strategy_id = "ref";
  request.principal = 10'000.0;
  request.maturity_ms = kStart + 5'000;
  const PositionId maturing = std::get<PositionId>(ledger->open(request));
  const PositionId open_ended = openRef();

  EXPECT_TRUE(ledger->matureDue(kStart + 4'999).empty());

  auto settled = ledger->matureDue(kStart + 5'000);
  ASSERT_EQ(settled.size(), 1u);
  EXPECT_EQ(settled[0].position_id, maturing);
  EXPECT_EQ(settled[0].owner, "alice");
  EXPECT_EQ(settled[0].reason, cppi::domain::SettlementReason::Matured);
  EXPECT_FALSE(ledger->position(maturing).has_value());
  EXPECT_TRUE(ledger->position(open_ended).has_value());
}

// -----------------------------------------------------------------------------
// 12) Frozen positions.
// Why: an emergency stop suppresses drift, but a floor breach still fires.
// -----------------------------------------------------------------------------
TEST_F(PositionLedgerTest, EmergencyStopKeepsFloorProtection) {
  const PositionId id = openRef();
  auto frozen = ledger->emergencyStop(id);
  ASSERT_TRUE(cppi::domain::isOk(frozen));
  EXPECT_EQ(std::get<cppi::domain::Position>(frozen).status,
            PositionStatus::Frozen);

  auto drifted = tick(id, 8'200.0);
  ASSERT_TRUE(cppi::domain::isOk(drifted));
  EXPECT_FALSE(std::get<std::optional<RebalanceInstruction>>(drifted));

  RebalanceInstruction breach = tickExpectingInstruction(id, 7'900.0);
  EXPECT_DOUBLE_EQ(breach.target_risky, 0.0);

  auto resumed = ledger->resume(id);
  ASSERT_TRUE(cppi::domain::isOk(resumed));
  EXPECT_EQ(std::get<cppi::domain::Position>(resumed).status,
            PositionStatus::Active);
}

TEST_F(PositionLedgerTest, ToggleAutoRebalance) {
  const PositionId id = openRef();
  auto off = ledger->setAutoRebalance(id, false);
  ASSERT_TRUE(cppi::domain::isOk(off));
  EXPECT_FALSE(std::get<cppi::domain::Position>(off).auto_rebalance_enabled);
  EXPECT_FALSE(snapshot(id).auto_rebalance_enabled);
  EXPECT_EQ(errorOf(ledger->setAutoRebalance(404, true)),
            ErrorCode::PositionNotFound);
}

// -----------------------------------------------------------------------------
// 12b) Adjusting a live position.
// Why: a new multiplier or a higher floor changes the target at once; the
// strategy template the position was opened on stays pinned for others.
// -----------------------------------------------------------------------------
TEST_F(PositionLedgerTest, UpdateMultiplierRetargetsOnlyThatPosition) {
  const PositionId id = openRef();
  const PositionId other = openRef();

  cppi::PositionUpdate update;
  update.multiplier = 4.0;
  auto result = ledger->updatePosition(id, update);

  ASSERT_TRUE(cppi::domain::isOk(result));
  const auto& instruction =
      std::get<std::optional<RebalanceInstruction>>(result);
  ASSERT_TRUE(instruction.has_value());
  EXPECT_EQ(instruction->trigger, TriggerReason::Drift);
  EXPECT_DOUBLE_EQ(instruction->target_risky, 8'000.0);
  EXPECT_DOUBLE_EQ(instruction->target_safe, 2'000.0);

  auto p = snapshot(id);
  ASSERT_TRUE(p.multiplier_override.has_value());
  EXPECT_DOUBLE_EQ(*p.multiplier_override, 4.0);
  EXPECT_EQ(p.strategy_version, 1u);
  EXPECT_TRUE(p.rebalance_in_flight);

  EXPECT_FALSE(snapshot(other).multiplier_override.has_value());
  auto untouched = tick(other, 10'000.0);
  ASSERT_TRUE(cppi::domain::isOk(untouched));
  EXPECT_FALSE(std::get<std::optional<RebalanceInstruction>>(untouched));
  EXPECT_DOUBLE_EQ(catalog.find("ref")->multiplier, 3.0);
}

TEST_F(PositionLedgerTest, RaisingFloorShrinksRiskyTarget) {
  const PositionId id = openRef();

  cppi::PositionUpdate update;
  update.guaranteed_floor = 9'000.0;
  auto result = ledger->updatePosition(id, update);

  ASSERT_TRUE(cppi::domain::isOk(result));
  const auto& instruction =
      std::get<std::optional<RebalanceInstruction>>(result);
  ASSERT_TRUE(instruction.has_value());
  EXPECT_DOUBLE_EQ(instruction->target_risky, 3'000.0);
  EXPECT_DOUBLE_EQ(instruction->target_safe, 7'000.0);

  auto p = snapshot(id);
  EXPECT_DOUBLE_EQ(p.guaranteed_floor, 9'000.0);
  EXPECT_DOUBLE_EQ(p.cushion, 1'000.0);
  EXPECT_DOUBLE_EQ(p.safe_exposure + p.risky_exposure, p.current_value);
}

TEST_F(PositionLedgerTest, UpdateWithoutRetargetingIssuesNothing) {
  const PositionId id = openRef();

  cppi::PositionUpdate update;
  update.auto_rebalance = false;
  auto result = ledger->updatePosition(id, update);

  ASSERT_TRUE(cppi::domain::isOk(result));
  EXPECT_FALSE(std::get<std::optional<RebalanceInstruction>>(result));
  EXPECT_FALSE(snapshot(id).auto_rebalance_enabled);
}

TEST_F(PositionLedgerTest, UpdateValidatesInputs) {
  const PositionId id = openRef();

  cppi::PositionUpdate low_multiplier;
  low_multiplier.multiplier = 0.5;
  EXPECT_EQ(errorOf(ledger->updatePosition(id, low_multiplier)),
            ErrorCode::InvalidStrategy);

  cppi::PositionUpdate lower_floor;
  lower_floor.guaranteed_floor = 7'000.0;
  EXPECT_EQ(errorOf(ledger->updatePosition(id, lower_floor)),
            ErrorCode::InvalidFloor);

  cppi::PositionUpdate above_value;
  above_value.guaranteed_floor = 10'500.0;
  EXPECT_EQ(errorOf(ledger->updatePosition(id, above_value)),
            ErrorCode::InvalidFloor);

  // A rejected update leaves nothing half-applied.
  cppi::PositionUpdate mixed;
  mixed.multiplier = 5.0;
  mixed.guaranteed_floor = 7'000.0;
  EXPECT_EQ(errorOf(ledger->updatePosition(id, mixed)),
            ErrorCode::InvalidFloor);

  auto p = snapshot(id);
  EXPECT_FALSE(p.multiplier_override.has_value());
  EXPECT_DOUBLE_EQ(p.guaranteed_floor, 8'000.0);
  EXPECT_FALSE(p.rebalance_in_flight);

  EXPECT_EQ(errorOf(ledger->updatePosition(999, low_multiplier)),
            ErrorCode::PositionNotFound);
}

// -----------------------------------------------------------------------------
// 13) Restart with a broken snapshot.
// Why: legs that do not sum to value are a bug upstream; the position must
// halt for review rather than trade on bad numbers.
// -----------------------------------------------------------------------------
TEST_F(PositionLedgerTest, HydratedInconsistentPositionGoesUnderReview) {
  cppi::domain::Position p;
  p.id = 50;
  p.strategy_id = "ref";
  p.principal = 10'000.0;
  p.guaranteed_floor = 8'000.0;
  p.current_value = 10'000.0;
  p.peak_value = 10'000.0;
  p.safe_exposure = 4'000.0;
  p.risky_exposure = 5'000.0;
  p.cushion = 2'000.0;

  auto restored = ledger->hydrate(p);
  ASSERT_TRUE(cppi::domain::isOk(restored));
  EXPECT_EQ(std::get<PositionId>(restored), 50u);

  auto review = snapshot(50);
  EXPECT_EQ(review.status, PositionStatus::UnderReview);
  EXPECT_FALSE(review.auto_rebalance_enabled);
  EXPECT_EQ(eventsOf<cppi::InvariantViolationEvent>().size(), 1u);

  EXPECT_EQ(errorOf(tick(50, 9'000.0)), ErrorCode::PositionUnderReview);
  EXPECT_EQ(errorOf(ledger->requestRebalance(50)),
            ErrorCode::PositionUnderReview);
  EXPECT_EQ(errorOf(ledger->setAutoRebalance(50, true)),
            ErrorCode::PositionUnderReview);
  EXPECT_EQ(errorOf(ledger->resume(50)), ErrorCode::PositionUnderReview);
  cppi::PositionUpdate update;
  update.guaranteed_floor = 9'000.0;
  EXPECT_EQ(errorOf(ledger->updatePosition(50, update)),
            ErrorCode::PositionUnderReview);

  auto cleared = ledger->clearReview(50, 4'000.0, 6'000.0);
  ASSERT_TRUE(cppi::domain::isOk(cleared));
  const auto& fixed = std::get<cppi::domain::Position>(cleared);
  EXPECT_EQ(fixed.status, PositionStatus::Active);
  EXPECT_FALSE(fixed.auto_rebalance_enabled);
  EXPECT_DOUBLE_EQ(fixed.current_value, 10'000.0);

  EXPECT_TRUE(cppi::domain::isOk(tick(50, 9'900.0)));

  // Ids continue after the hydrated one.
  EXPECT_EQ(openRef(), 51u);
}

TEST_F(PositionLedgerTest, HydrateResequencesHistoryAndRejectsDuplicates) {
  cppi::domain::Position p;
  p.id = 5;
  p.strategy_id = "ref";
  p.strategy_version = 1;
  p.principal = 10'000.0;
  p.guaranteed_floor = 8'000.0;
  p.current_value = 9'000.0;
  p.safe_exposure = 6'000.0;
  p.risky_exposure = 3'000.0;
  p.rebalance_in_flight = true;

  std::vector<cppi::domain::RebalanceEvent> history(2);
  history[0].sequence = 9;
  history[1].sequence = 10;

  ASSERT_TRUE(cppi::domain::isOk(ledger->hydrate(p, history)));
  EXPECT_FALSE(snapshot(5).rebalance_in_flight);
  EXPECT_EQ(snapshot(5).status, PositionStatus::Active);

  auto log = ledger->history(5);
  ASSERT_EQ(log.size(), 2u);
  EXPECT_EQ(log[0].sequence, 1u);
  EXPECT_EQ(log[1].sequence, 2u);
  EXPECT_EQ(log[1].position_id, 5u);

  EXPECT_EQ(errorOf(ledger->hydrate(p)), ErrorCode::InvariantViolation);

  p.id = 6;
  p.strategy_version = 7;
  EXPECT_EQ(errorOf(ledger->hydrate(p)), ErrorCode::InvalidStrategy);
}

// -----------------------------------------------------------------------------
// 14) Queries and pool aggregates.
// -----------------------------------------------------------------------------
TEST_F(PositionLedgerTest, PoolStatsAndRecentRebalances) {
  const PositionId first = openRef();
  const PositionId second = openRef();

  for (PositionId id : {first, second}) {
    RebalanceInstruction instruction = tickExpectingInstruction(id, 8'200.0);
    ASSERT_TRUE(cppi::domain::isOk(
        ledger->applyRebalanceResult(id, fillOf(instruction))));
  }

  auto recent = ledger->recentRebalances(10);
  ASSERT_EQ(recent.size(), 2u);
  EXPECT_EQ(recent[0].position_id, second);
  EXPECT_EQ(recent[1].position_id, first);
  EXPECT_EQ(ledger->recentRebalances(1).size(), 1u);

  auto stats = ledger->poolStats();
  EXPECT_EQ(stats.total_positions, 2u);
  EXPECT_DOUBLE_EQ(stats.total_aum, 16'400.0);
  EXPECT_EQ(stats.total_rebalances, 2u);
  EXPECT_DOUBLE_EQ(stats.average_multiplier, 3.0);
  EXPECT_DOUBLE_EQ(stats.average_floor_protection, 0.8);
  EXPECT_DOUBLE_EQ(stats.success_rate, 1.0);
  EXPECT_DOUBLE_EQ(stats.total_risky, 1'200.0);
  EXPECT_NEAR(stats.risk_budget_utilization, 1.0, 1e-12);
  // Both positions are younger than a day, so each counts as one day.
  EXPECT_DOUBLE_EQ(stats.avg_daily_rebalances, 2.0);
}

TEST_F(PositionLedgerTest, PositionsForOwnerAreSortedById) {
  cppi::OpenRequest request;
  request.strategy_id = "ref";
  request.principal = 1'000.0;

  request.owner = "alice";
  const auto a1 = std::get<PositionId>(ledger->open(request));
  request.owner = "bob";
  std::get<PositionId>(ledger->open(request));
  request.owner = "alice";
  const auto a2 = std::get<PositionId>(ledger->open(request));

  auto mine = ledger->positionsForOwner("alice");
  ASSERT_EQ(mine.size(), 2u);
  EXPECT_EQ(mine[0].id, a1);
  EXPECT_EQ(mine[1].id, a2);
  EXPECT_EQ(ledger->snapshots().size(), 3u);
  EXPECT_TRUE(ledger->positionsForOwner("carol").empty());
}

// -----------------------------------------------------------------------------
// 15) Concurrent revaluation of different positions.
// Why: per-position locks must keep each position consistent while workers
// run in parallel.
// -----------------------------------------------------------------------------
TEST_F(PositionLedgerTest, ParallelTicksOnDistinctPositions) {
  constexpr int kPositions = 4;
  constexpr int kTicks = 200;

  std::vector<PositionId> ids;
  for (int i = 0; i < kPositions; ++i) {
    ids.push_back(openRef(10'000.0, false));
  }

  std::vector<std::thread> workers;
  for (PositionId id : ids) {
    workers.emplace_back([this, id] {
      for (int t = 1; t <= kTicks; ++t) {
        const double value = 10'000.0 + 50.0 * std::sin(t * 0.1);
        (void)ledger->revalue(id, value, kStart + t, calm(kStart + t));
      }
    });
  }
  for (auto& w : workers) {
    w.join();
  }

  for (PositionId id : ids) {
    auto p = snapshot(id);
    EXPECT_EQ(p.last_valuation_ms, kStart + kTicks);
    EXPECT_NEAR(p.safe_exposure + p.risky_exposure, p.current_value, 1e-6);
    EXPECT_EQ(p.status, PositionStatus::Active);
  }
}
