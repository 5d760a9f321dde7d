// =============================================================================
// event_bus_test.cpp
// =============================================================================
// Unit tests for cppi::EventBus and cppi::EventLoopThread.
//
// Validates:
//   - Generic subscribers see every alternative of the Event variant
//   - Typed subscribers only see their own alternative
//   - unsubscribe() stops delivery; unknown ids are harmless
//   - A callback may publish again (the worker publishes instructions from
//     inside its tick handler)
//   - EventLoopThread dispatches pushed events on its own thread, in order
// =============================================================================

#include "cppi/concurrent/event_loop_thread.hpp"
#include "cppi/eventbus/event_bus.hpp"
#include "cppi/events/event.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <future>
#include <mutex>
#include <thread>
#include <vector>

class EventBusTest : public ::testing::Test {
 protected:
  cppi::EventBus bus;

  static cppi::ValuationTickEvent makeTick(cppi::domain::PositionId id,
                                           double value,
                                           std::int64_t ts = 1'000) {
    cppi::ValuationTickEvent e;
    e.position_id = id;
    e.value = value;
    e.timestamp_ms = ts;
    return e;
  }

  static cppi::RebalanceInstructionEvent makeInstruction(
      cppi::domain::PositionId id) {
    cppi::RebalanceInstructionEvent e;
    e.instruction.position_id = id;
    e.instruction.instruction_id = 1;
    e.instruction.target_safe = 4'000.0;
    e.instruction.target_risky = 6'000.0;
    return e;
  }
};

TEST_F(EventBusTest, GenericSubscriberSeesEveryAlternative) {
  int calls = 0;
  bus.subscribe([&calls](const cppi::Event&) { ++calls; });

  bus.publish(makeTick(1, 100.0));
  bus.publish(makeInstruction(1));
  bus.publish(cppi::RebalanceRequestEvent{1, cppi::domain::TriggerReason::Manual});

  EXPECT_EQ(calls, 3);
  EXPECT_EQ(bus.subscriberCount(), 1u);
}

TEST_F(EventBusTest, TypedSubscriberIgnoresOtherAlternatives) {
  int ticks = 0;
  bus.subscribe<cppi::ValuationTickEvent>(
      [&ticks](const cppi::ValuationTickEvent&) { ++ticks; });

  bus.publish(makeTick(1, 100.0));
  bus.publish(makeInstruction(1));

  EXPECT_EQ(ticks, 1);
}

TEST_F(EventBusTest, EverySubscriberReceivesTheEvent) {
  int a = 0;
  int b = 0;
  bus.subscribe<cppi::ValuationTickEvent>(
      [&a](const cppi::ValuationTickEvent&) { ++a; });
  bus.subscribe<cppi::ValuationTickEvent>(
      [&b](const cppi::ValuationTickEvent&) { ++b; });

  bus.publish(makeTick(2, 50.0));

  EXPECT_EQ(a, 1);
  EXPECT_EQ(b, 1);
}

TEST_F(EventBusTest, UnsubscribeStopsDelivery) {
  int calls = 0;
  auto id = bus.subscribe<cppi::ValuationTickEvent>(
      [&calls](const cppi::ValuationTickEvent&) { ++calls; });

  bus.publish(makeTick(1, 1.0));
  bus.unsubscribe(id);
  bus.publish(makeTick(1, 2.0));

  EXPECT_EQ(calls, 1);
  EXPECT_EQ(bus.subscriberCount(), 0u);
}

TEST_F(EventBusTest, UnsubscribeUnknownIdIsNoOp) {
  EXPECT_NO_FATAL_FAILURE(bus.unsubscribe(4242));
  EXPECT_NO_FATAL_FAILURE(bus.publish(makeTick(1, 1.0)));
}

// -----------------------------------------------------------------------------
// The worker's tick handler publishes a RebalanceInstructionEvent on the same
// bus; that must not deadlock.
// -----------------------------------------------------------------------------
TEST_F(EventBusTest, CallbackMayPublishAgain) {
  std::vector<cppi::domain::PositionId> instructed;

  bus.subscribe<cppi::RebalanceInstructionEvent>(
      [&instructed](const cppi::RebalanceInstructionEvent& e) {
        instructed.push_back(e.instruction.position_id);
      });
  bus.subscribe<cppi::ValuationTickEvent>(
      [this](const cppi::ValuationTickEvent& e) {
        bus.publish(makeInstruction(e.position_id));
      });

  bus.publish(makeTick(17, 8'200.0));

  ASSERT_EQ(instructed.size(), 1u);
  EXPECT_EQ(instructed[0], 17u);
}

TEST_F(EventBusTest, PayloadSurvivesDispatch) {
  cppi::ValuationTickEvent received;
  bus.subscribe<cppi::ValuationTickEvent>(
      [&received](const cppi::ValuationTickEvent& e) { received = e; });

  auto tick = makeTick(3, 9'876.5, 42);
  tick.volatility = cppi::domain::VolatilitySignal{
      0.4, cppi::domain::VolatilityRegime::High, 42};
  bus.publish(tick);

  EXPECT_EQ(received.position_id, 3u);
  EXPECT_DOUBLE_EQ(received.value, 9'876.5);
  EXPECT_EQ(received.timestamp_ms, 42);
  ASSERT_TRUE(received.volatility.has_value());
  EXPECT_EQ(received.volatility->regime, cppi::domain::VolatilityRegime::High);
}

// -----------------------------------------------------------------------------
// EventLoopThread: pushed events are published on the loop's thread, in order.
// -----------------------------------------------------------------------------
TEST(EventLoopThreadTest, DispatchesInPushOrderOnItsOwnThread) {
  cppi::EventLoopThread loop("test-loop");

  std::mutex mutex;
  std::vector<double> values;
  std::thread::id dispatch_thread;
  std::promise<void> done;

  loop.eventBus().subscribe<cppi::ValuationTickEvent>(
      [&](const cppi::ValuationTickEvent& e) {
        std::lock_guard lock(mutex);
        dispatch_thread = std::this_thread::get_id();
        values.push_back(e.value);
        if (values.size() == 3) {
          done.set_value();
        }
      });

  loop.start();
  for (double v : {1.0, 2.0, 3.0}) {
    cppi::ValuationTickEvent tick;
    tick.position_id = 1;
    tick.value = v;
    loop.push(tick);
  }

  ASSERT_EQ(done.get_future().wait_for(std::chrono::seconds(2)),
            std::future_status::ready);
  loop.stop();

  std::lock_guard lock(mutex);
  EXPECT_EQ(values, (std::vector<double>{1.0, 2.0, 3.0}));
  EXPECT_NE(dispatch_thread, std::this_thread::get_id());
  EXPECT_EQ(loop.processed(), 3u);
  EXPECT_EQ(loop.name(), "test-loop");
}

TEST(EventLoopThreadTest, StartAndStopAreIdempotent) {
  cppi::EventLoopThread loop;
  EXPECT_NO_FATAL_FAILURE(loop.stop());
  loop.start();
  EXPECT_NO_FATAL_FAILURE(loop.start());
  loop.stop();
  EXPECT_NO_FATAL_FAILURE(loop.stop());
  EXPECT_TRUE(loop.idle());
}
