#include "cppi/network/valuation_feed_thread.hpp"

#include <zmq.hpp>

#include <iostream>
#include <utility>

namespace cppi {

ValuationFeedThread::ValuationFeedThread(SimulationTimeProvider* replay_clock,
                                         EventSink event_sink,
                                         std::string endpoint)
    : replay_clock_(replay_clock),
      event_sink_(std::move(event_sink)),
      endpoint_(std::move(endpoint)) {}

ValuationFeedThread::~ValuationFeedThread() { stop(); }

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
//
// Connecting happens here, on the caller's thread, so a malformed endpoint
// surfaces as a zmq::error_t from AutopilotEngine::start() rather than from
// inside the recv thread.
// -----------------------------------------------------------------------------
void ValuationFeedThread::start() {
  if (thread_.joinable()) {
    return;
  }
  gateway_ =
      std::make_unique<ValuationGateway>(replay_clock_, event_sink_, endpoint_);
  thread_ = std::thread(&ValuationFeedThread::recvLoop, this);
}

void ValuationFeedThread::stop() {
  if (!gateway_) {
    return;
  }
  gateway_->stop();
  if (thread_.joinable()) {
    thread_.join();
  }
  gateway_.reset();
}

// A socket failure mid-run ends the feed; positions keep their last
// valuation and go stale, which the ledger already reports per tick.
void ValuationFeedThread::recvLoop() {
  std::cout << "[ValuationFeedThread] subscribed to " << endpoint_ << "\n";
  try {
    gateway_->run();
  } catch (const zmq::error_t& e) {
    std::cerr << "[ValuationFeedThread] feed aborted: " << e.what() << "\n";
    return;
  }
  std::cout << "[ValuationFeedThread] feed closed.\n";
}

}  // namespace cppi
