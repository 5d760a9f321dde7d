#pragma once

#include "cppi/events/event.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

namespace cppi {

// -----------------------------------------------------------------------------
// EventBus — synchronous publish/subscribe over the Event variant
// -----------------------------------------------------------------------------
//
// @brief  Delivers each published Event to every subscriber on the
//         publishing thread.
//
// @details
// Each EventLoopThread owns one bus. Components (the ledger adapter on a
// worker, the executor on the execution loop, the HealthMonitor) subscribe in
// their constructor and unsubscribe in their destructor.
//
// Typed subscriptions wrap the callback in a std::get_if filter, so a
// subscriber only sees the alternative it asked for.
//
// Subscriber table:
//   Held as an immutable std::shared_ptr<const Table>. subscribe() and
//   unsubscribe() build a new table and swap it in; publish() only takes a
//   reference to the current one. Ticks are published far more often than
//   subscriptions change, so the hot path never copies callbacks.
//
// Re-entrancy:
//   Dispatch runs without the lock. A callback may publish again (the worker
//   publishes a RebalanceInstructionEvent from inside its ValuationTickEvent
//   handler) or subscribe/unsubscribe; changes apply from the next publish().
//
// Thread-safety: subscribe/unsubscribe/publish are safe from any thread.
// -----------------------------------------------------------------------------
class EventBus {
 public:
  using GenericCallback = std::function<void(const Event&)>;
  using SubscriptionId = std::size_t;

  EventBus();

  EventBus(const EventBus&) = delete;
  EventBus& operator=(const EventBus&) = delete;

  SubscriptionId subscribe(GenericCallback callback);

  // Receives only events holding EventType.
  template <typename EventType>
  SubscriptionId subscribe(std::function<void(const EventType&)> callback);

  // Unknown ids are ignored.
  void unsubscribe(SubscriptionId id);

  void publish(const Event& event);

  std::size_t subscriberCount() const;

 private:
  struct Subscriber {
    SubscriptionId id;
    GenericCallback callback;
  };
  using Table = std::vector<Subscriber>;

  std::shared_ptr<const Table> snapshot() const;

  mutable std::mutex mutex_;
  SubscriptionId next_id_{0};
  std::shared_ptr<const Table> table_;
};

template <typename EventType>
EventBus::SubscriptionId EventBus::subscribe(
    std::function<void(const EventType&)> callback) {
  return subscribe(
      GenericCallback([cb = std::move(callback)](const Event& event) {
        if (const auto* typed = std::get_if<EventType>(&event)) {
          cb(*typed);
        }
      }));
}

}  // namespace cppi
