#pragma once

#include "cppi/events/event.hpp"
#include "cppi/time/simulation_time_provider.hpp"

#include <zmq.hpp>

#include <atomic>
#include <functional>
#include <optional>
#include <string>

namespace cppi {

// -----------------------------------------------------------------------------
// ValuationGateway — ZeroMQ bridge for valuation ticks
// -----------------------------------------------------------------------------
//
// @brief  Listens on a ZeroMQ SUB socket for JSON-encoded valuation ticks,
//         advances the replay clock when one is attached, and hands each tick
//         to the engine.
//
// @details
// Expected JSON format:
//   {
//     "position_id":  42,              // uint64
//     "value":        10250.0,         // mark-to-market value of the position
//     "timestamp_ms": 1700000000000,   // int64 epoch milliseconds
//     "volatility":   0.21,            // optional, annualised fraction
//     "regime":       "Normal"         // optional, Low | Normal | High
//   }
//
// On each message, IN ORDER:
//   1. replay_clock->advance_time(timestamp_ms), when a replay clock is
//      attached, so freshness and timeouts observe replay time.
//   2. event_sink_(ValuationTickEvent).
//
// Malformed messages are logged to std::cerr and skipped; they never stop
// the loop.
//
// Thread model:
//   run() blocks; call it from ValuationFeedThread. stop() is safe from any
//   thread and takes effect within kRecvTimeoutMs.
//
// Ownership:
//   Owns the zmq context and socket. The replay clock (may be null) is
//   owned by the caller.
// -----------------------------------------------------------------------------
class ValuationGateway {
 public:
  using EventSink = std::function<void(Event)>;

  ValuationGateway(SimulationTimeProvider* replay_clock, EventSink event_sink,
                   const std::string& endpoint);

  ~ValuationGateway() = default;

  ValuationGateway(const ValuationGateway&) = delete;
  ValuationGateway& operator=(const ValuationGateway&) = delete;
  ValuationGateway(ValuationGateway&&) = delete;
  ValuationGateway& operator=(ValuationGateway&&) = delete;

  void run();
  void stop();

  // -------------------------------------------------------------------------
  // decodeTick(payload)
  // -------------------------------------------------------------------------
  // @brief  Parses one feed message.
  //
  // @return The decoded tick, or std::nullopt (reason logged to std::cerr)
  //         for malformed JSON, missing keys, or an unknown regime.
  //
  // A "volatility" without "regime" defaults to Normal.
  // -------------------------------------------------------------------------
  static std::optional<ValuationTickEvent> decodeTick(
      const std::string& payload);

 private:
  static constexpr int kRecvTimeoutMs = 100;

  SimulationTimeProvider* replay_clock_;
  EventSink event_sink_;

  zmq::context_t context_{1};
  zmq::socket_t socket_{context_, zmq::socket_type::sub};

  // Starts true so a stop() issued before run() is not lost.
  std::atomic<bool> running_{true};
};

}  // namespace cppi
