#pragma once

#include "cppi/concurrent/thread_safe_queue.hpp"
#include "cppi/eventbus/event_bus.hpp"
#include "cppi/events/event.hpp"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <string>
#include <thread>

namespace cppi {

// -----------------------------------------------------------------------------
// EventLoopThread — one thread, one queue, one bus
// -----------------------------------------------------------------------------
//
// @brief  Drains its queue on a dedicated thread and publishes each event to
//         its own EventBus.
//
// @details
// The engine runs N of these as position workers (every event for a position
// lands on the same worker, which is what serializes a position's ticks and
// fills) and one as the execution loop.
//
// push() is safe from any thread. start()/stop() are idempotent; the
// destructor stops the thread.
//
// processed() counts dispatched events; tests use it together with idle() to
// wait for a loop to drain.
// -----------------------------------------------------------------------------
class EventLoopThread {
 public:
  explicit EventLoopThread(std::string name = "loop");
  ~EventLoopThread();

  EventLoopThread(const EventLoopThread&) = delete;
  EventLoopThread& operator=(const EventLoopThread&) = delete;
  EventLoopThread(EventLoopThread&&) = delete;
  EventLoopThread& operator=(EventLoopThread&&) = delete;

  void start();
  void stop();

  void push(Event event);

  EventBus& eventBus() { return bus_; }
  const EventBus& eventBus() const { return bus_; }

  const std::string& name() const { return name_; }

  std::size_t processed() const { return processed_.load(); }

  // True when nothing is queued and no event is being dispatched.
  bool idle() const;

 private:
  void run();

  std::string name_;
  ThreadSafeQueue<Event> queue_;
  EventBus bus_;

  std::atomic<bool> running_{false};
  std::atomic<bool> dispatching_{false};
  std::atomic<std::size_t> processed_{0};

  std::mutex wake_mutex_;
  std::condition_variable wake_cv_;

  std::thread thread_;
};

}  // namespace cppi
