#include "cppi/concurrent/event_loop_thread.hpp"

#include <chrono>
#include <utility>

namespace cppi {

namespace {

constexpr auto kIdleWaitTimeout = std::chrono::milliseconds(5);

}  // namespace

EventLoopThread::EventLoopThread(std::string name) : name_(std::move(name)) {}

EventLoopThread::~EventLoopThread() { stop(); }

void EventLoopThread::start() {
  if (thread_.joinable()) {
    return;
  }
  running_.store(true);
  thread_ = std::thread([this] { run(); });
}

void EventLoopThread::stop() {
  if (!thread_.joinable()) {
    return;
  }
  running_.store(false);
  wake_cv_.notify_all();
  thread_.join();
}

void EventLoopThread::push(Event event) {
  queue_.push(std::move(event));
  wake_cv_.notify_one();
}

bool EventLoopThread::idle() const {
  return queue_.empty() && !dispatching_.load();
}

// -----------------------------------------------------------------------------
// run(): drain the queue, sleep briefly when empty, exit on stop()
// -----------------------------------------------------------------------------
void EventLoopThread::run() {
  while (running_.load()) {
    dispatching_.store(true);
    std::optional<Event> event = queue_.try_pop();

    if (event) {
      bus_.publish(*event);
      processed_.fetch_add(1);
      dispatching_.store(false);
      continue;
    }
    dispatching_.store(false);

    std::unique_lock lock(wake_mutex_);
    wake_cv_.wait_for(lock, kIdleWaitTimeout, [this] {
      return !running_.load() || !queue_.empty();
    });
  }
}

}  // namespace cppi
