#include "cppi/network/keeper_thread.hpp"

#include <iostream>
#include <utility>

namespace cppi {

KeeperThread::KeeperThread(Task task, std::chrono::milliseconds interval)
    : task_(std::move(task)), interval_(interval) {}

KeeperThread::~KeeperThread() { stop(); }

void KeeperThread::start() {
  if (thread_.joinable()) {
    return;
  }
  {
    std::lock_guard lock(mutex_);
    stop_requested_ = false;
  }
  thread_ = std::thread([this] { run(); });
}

void KeeperThread::stop() {
  {
    std::lock_guard lock(mutex_);
    stop_requested_ = true;
  }
  cv_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }
}

void KeeperThread::run() {
  std::cout << "[KeeperThread] sweeping every " << interval_.count()
            << "ms\n";

  std::unique_lock lock(mutex_);
  while (!stop_requested_) {
    if (cv_.wait_for(lock, interval_, [this] { return stop_requested_; })) {
      break;
    }
    lock.unlock();
    task_();
    ++sweeps_;
    lock.lock();
  }
}

}  // namespace cppi
