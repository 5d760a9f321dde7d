#pragma once

#include "cppi/concurrent/thread_safe_queue.hpp"
#include "cppi/events/event.hpp"

#include <zmq.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace cppi {

// -----------------------------------------------------------------------------
// IpcServer — ZeroMQ command and telemetry gateway
// -----------------------------------------------------------------------------
//
// @brief  Runs one thread that answers JSON commands on a REP socket and
//         broadcasts JSON telemetry on a PUB socket.
//
// @details
// Two sockets share the thread:
//
//   1. REP (commands): each request string is handed to the CommandHandler
//      (bound to AutopilotEngine::executeCommand()) and the returned JSON is
//      sent back. ZMQ_RCVTIMEO keeps the loop from blocking so telemetry is
//      still drained while no client is talking.
//
//   2. PUB (telemetry): events are pushed from worker threads through a
//      ThreadSafeQueue, so JSON encoding and socket I/O stay off the
//      workers. Each message is an object with a "type" field:
//        position_update, rebalance_instruction, rebalance_completed,
//        rebalance_cancelled, position_closed, health_alert,
//        invariant_violation, data_quality
//
// Thread model:
//   start()/stop() from the owning thread; pushTelemetry() from any thread.
//
// Ownership:
//   Owned by AutopilotEngine via std::unique_ptr. Owns the ZMQ context,
//   both sockets, the queue and the thread.
// -----------------------------------------------------------------------------
class IpcServer {
 public:
  using CommandHandler = std::function<std::string(const std::string&)>;

  IpcServer(CommandHandler command_handler, std::string cmd_endpoint,
            std::string pub_endpoint);

  ~IpcServer();

  IpcServer(const IpcServer&) = delete;
  IpcServer& operator=(const IpcServer&) = delete;
  IpcServer(IpcServer&&) = delete;
  IpcServer& operator=(IpcServer&&) = delete;

  // Binds both sockets and spawns the thread. Idempotent.
  void start();

  // Joins the thread after a final telemetry drain. Idempotent.
  void stop();

  void pushTelemetry(Event event);

  // -------------------------------------------------------------------------
  // formatTelemetry(event)
  // -------------------------------------------------------------------------
  // @return The JSON message for a telemetry event type, std::nullopt for
  //         events that are never broadcast (ticks, results, requests).
  // -------------------------------------------------------------------------
  static std::optional<std::string> formatTelemetry(const Event& event);

 private:
  static constexpr int kPollTimeoutMs = 50;

  void run();
  void processTelemetry();
  void processCommands();

  CommandHandler command_handler_;
  std::string cmd_endpoint_;
  std::string pub_endpoint_;

  std::unique_ptr<zmq::context_t> context_;
  std::unique_ptr<zmq::socket_t> cmd_socket_;
  std::unique_ptr<zmq::socket_t> pub_socket_;

  ThreadSafeQueue<Event> telemetry_queue_;
  std::thread thread_;
  std::atomic<bool> running_{false};
};

}  // namespace cppi
