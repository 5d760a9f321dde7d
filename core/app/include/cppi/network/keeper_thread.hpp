#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>

namespace cppi {

// -----------------------------------------------------------------------------
// KeeperThread — periodic housekeeping
// -----------------------------------------------------------------------------
//
// @brief  Invokes a callback every interval on a dedicated thread.
//
// @details
// AutopilotEngine binds the callback to a sweep that expires in-flight
// instructions past the execution timeout and settles matured positions.
// The interval is wall-clock; the sweep itself reads the engine clock, so
// under a replay clock timeouts follow replay time.
//
// stop() wakes the thread immediately instead of waiting out the interval.
// -----------------------------------------------------------------------------
class KeeperThread {
 public:
  using Task = std::function<void()>;

  KeeperThread(Task task, std::chrono::milliseconds interval);
  ~KeeperThread();

  KeeperThread(const KeeperThread&) = delete;
  KeeperThread& operator=(const KeeperThread&) = delete;
  KeeperThread(KeeperThread&&) = delete;
  KeeperThread& operator=(KeeperThread&&) = delete;

  void start();
  void stop();

  std::uint64_t sweeps() const { return sweeps_.load(); }

 private:
  void run();

  Task task_;
  std::chrono::milliseconds interval_;

  std::mutex mutex_;
  std::condition_variable cv_;
  bool stop_requested_{false};

  std::atomic<std::uint64_t> sweeps_{0};
  std::thread thread_;
};

}  // namespace cppi
