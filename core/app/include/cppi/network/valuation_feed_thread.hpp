#pragma once

#include "cppi/feed/valuation_gateway.hpp"

#include <memory>
#include <string>
#include <thread>

namespace cppi {

// -----------------------------------------------------------------------------
// ValuationFeedThread — dedicated I/O thread for the valuation feed
// -----------------------------------------------------------------------------
//
// @brief  Runs ValuationGateway::run() on its own std::thread so network I/O
//         never shares a thread with the position workers.
//
// @details
// The gateway (and its socket) is created in start() and destroyed in stop(),
// so the engine can wire this object up before any worker is running and a
// stopped feed holds no zmq resources.
//
// Ownership:
//   Owned by AutopilotEngine via std::unique_ptr. Owns the gateway.
// -----------------------------------------------------------------------------
class ValuationFeedThread {
 public:
  using EventSink = ValuationGateway::EventSink;

  ValuationFeedThread(SimulationTimeProvider* replay_clock,
                      EventSink event_sink,
                      std::string endpoint);

  ~ValuationFeedThread();

  ValuationFeedThread(const ValuationFeedThread&) = delete;
  ValuationFeedThread& operator=(const ValuationFeedThread&) = delete;
  ValuationFeedThread(ValuationFeedThread&&) = delete;
  ValuationFeedThread& operator=(ValuationFeedThread&&) = delete;

  // Idempotent.
  void start();

  // Idempotent; blocks until the recv loop has exited.
  void stop();

 private:
  void recvLoop();

  SimulationTimeProvider* replay_clock_;
  EventSink event_sink_;
  std::string endpoint_;

  std::unique_ptr<ValuationGateway> gateway_;
  std::thread thread_;
};

}  // namespace cppi
