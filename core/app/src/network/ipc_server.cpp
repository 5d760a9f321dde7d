#include "cppi/network/ipc_server.hpp"

#include "cppi/network/json_format.hpp"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <iostream>
#include <type_traits>
#include <utility>

namespace cppi {

IpcServer::IpcServer(CommandHandler command_handler, std::string cmd_endpoint,
                     std::string pub_endpoint)
    : command_handler_(std::move(command_handler)),
      cmd_endpoint_(std::move(cmd_endpoint)),
      pub_endpoint_(std::move(pub_endpoint)) {}

IpcServer::~IpcServer() { stop(); }

// -----------------------------------------------------------------------------
// start(): create sockets and spawn worker thread
// -----------------------------------------------------------------------------
void IpcServer::start() {
  if (running_.load()) {
    return;
  }

  context_ = std::make_unique<zmq::context_t>(1);
  cmd_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::rep);
  pub_socket_ =
      std::make_unique<zmq::socket_t>(*context_, zmq::socket_type::pub);

  cmd_socket_->set(zmq::sockopt::rcvtimeo, kPollTimeoutMs);
  cmd_socket_->bind(cmd_endpoint_);
  pub_socket_->bind(pub_endpoint_);

  running_.store(true);
  thread_ = std::thread([this] { run(); });

  std::cout << "[IpcServer] started. CMD=" << cmd_endpoint_
            << " PUB=" << pub_endpoint_ << "\n";
}

// -----------------------------------------------------------------------------
// stop(): signal and join
// -----------------------------------------------------------------------------
void IpcServer::stop() {
  if (!running_.exchange(false)) {
    if (thread_.joinable()) {
      thread_.join();
    }
    return;
  }

  if (thread_.joinable()) {
    thread_.join();
  }

  cmd_socket_.reset();
  pub_socket_.reset();
  context_.reset();

  std::cout << "[IpcServer] stopped.\n";
}

void IpcServer::pushTelemetry(Event event) {
  telemetry_queue_.push(std::move(event));
}

void IpcServer::run() {
  while (running_.load()) {
    processTelemetry();
    processCommands();
  }
  processTelemetry();
}

void IpcServer::processTelemetry() {
  while (auto maybe_event = telemetry_queue_.try_pop()) {
    auto json_str = formatTelemetry(*maybe_event);
    if (json_str.has_value()) {
      zmq::message_t msg(json_str->data(), json_str->size());
      // A PUB socket without subscribers drops the message; that is fine.
      (void)pub_socket_->send(msg, zmq::send_flags::dontwait);
    }
  }
}

// -----------------------------------------------------------------------------
// processCommands(): poll REP socket and dispatch
// -----------------------------------------------------------------------------
void IpcServer::processCommands() {
  zmq::message_t request;
  zmq::recv_result_t result;

  try {
    result = cmd_socket_->recv(request, zmq::recv_flags::none);
  } catch (const zmq::error_t& e) {
    if (e.num() == EINTR) {
      return;
    }
    throw;
  }

  if (!result.has_value()) {
    return;
  }

  std::string cmd(static_cast<const char*>(request.data()), request.size());
  std::string response = command_handler_(cmd);

  zmq::message_t reply(response.data(), response.size());
  cmd_socket_->send(reply, zmq::send_flags::none);
}

// -----------------------------------------------------------------------------
// formatTelemetry(): one JSON object per telemetry event
// -----------------------------------------------------------------------------
std::optional<std::string> IpcServer::formatTelemetry(const Event& event) {
  return std::visit(
      [](const auto& e) -> std::optional<std::string> {
        using T = std::decay_t<decltype(e)>;
        nlohmann::json j;

        if constexpr (std::is_same_v<T, PositionUpdateEvent>) {
          j["type"] = "position_update";
          j["timestamp_ms"] = e.timestamp_ms;
          j["position"] = toJson(e.position);
        } else if constexpr (std::is_same_v<T, RebalanceInstructionEvent>) {
          j["type"] = "rebalance_instruction";
          j["instruction"] = toJson(e.instruction);
        } else if constexpr (std::is_same_v<T, RebalanceCompletedEvent>) {
          j["type"] = "rebalance_completed";
          j["record"] = toJson(e.record);
        } else if constexpr (std::is_same_v<T, RebalanceCancelledEvent>) {
          j["type"] = "rebalance_cancelled";
          j["position_id"] = e.position_id;
          j["instruction_id"] = e.instruction_id;
          j["code"] = domain::errorCodeToString(e.code);
          j["reason"] = e.reason;
          j["timestamp_ms"] = e.timestamp_ms;
        } else if constexpr (std::is_same_v<T, PositionClosedEvent>) {
          j["type"] = "position_closed";
          j["settlement"] = toJson(e.settlement);
        } else if constexpr (std::is_same_v<T, HealthAlertEvent>) {
          j["type"] = "health_alert";
          j["position_id"] = e.position_id;
          j["previous_band"] = healthBandToString(e.previous_band);
          j["report"] = toJson(e.report);
          j["timestamp_ms"] = e.timestamp_ms;
        } else if constexpr (std::is_same_v<T, InvariantViolationEvent>) {
          j["type"] = "invariant_violation";
          j["position_id"] = e.position_id;
          j["reason"] = e.reason;
          j["snapshot"] = toJson(e.snapshot);
          j["timestamp_ms"] = e.timestamp_ms;
        } else if constexpr (std::is_same_v<T, DataQualityEvent>) {
          j["type"] = "data_quality";
          j["position_id"] = e.position_id;
          j["code"] = domain::errorCodeToString(e.code);
          j["incidents"] = e.incidents;
          j["reason"] = e.reason;
          j["timestamp_ms"] = e.timestamp_ms;
        } else {
          return std::nullopt;
        }
        return j.dump();
      },
      event);
}

}  // namespace cppi
