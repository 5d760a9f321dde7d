#include "cppi/engine/autopilot_engine.hpp"

#include "cppi/execution/mock_rebalance_executor.hpp"
#include "cppi/network/json_format.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <chrono>
#include <iostream>
#include <utility>

namespace cppi {

namespace {

using domain::LedgerError;
using domain::PositionId;

// --- Position id carried by each event alternative ---------------------------
PositionId idOf(const ValuationTickEvent& e) { return e.position_id; }
PositionId idOf(const RebalanceRequestEvent& e) { return e.position_id; }
PositionId idOf(const RebalanceInstructionEvent& e) {
  return e.instruction.position_id;
}
PositionId idOf(const RebalanceResultEvent& e) { return e.result.position_id; }
PositionId idOf(const RebalanceCancelRequestEvent& e) { return e.position_id; }
PositionId idOf(const RebalanceCompletedEvent& e) {
  return e.record.position_id;
}
PositionId idOf(const RebalanceCancelledEvent& e) { return e.position_id; }
PositionId idOf(const PositionUpdateEvent& e) { return e.position.id; }
PositionId idOf(const PositionClosedEvent& e) {
  return e.settlement.position_id;
}
PositionId idOf(const InvariantViolationEvent& e) { return e.position_id; }
PositionId idOf(const DataQualityEvent& e) { return e.position_id; }
PositionId idOf(const HealthAlertEvent& e) { return e.position_id; }

PositionId positionOf(const Event& event) {
  return std::visit([](const auto& e) { return idOf(e); }, event);
}

// Events that only move work between threads are not broadcast.
bool isTelemetry(const Event& event) {
  return !std::holds_alternative<ValuationTickEvent>(event) &&
         !std::holds_alternative<RebalanceRequestEvent>(event) &&
         !std::holds_alternative<RebalanceResultEvent>(event) &&
         !std::holds_alternative<RebalanceCancelRequestEvent>(event);
}

// --- Command responses -------------------------------------------------------
nlohmann::json ok() {
  nlohmann::json j;
  j["status"] = "ok";
  return j;
}

nlohmann::json errorResponse(const std::string& reason) {
  nlohmann::json j;
  j["status"] = "error";
  j["response"] = reason;
  return j;
}

nlohmann::json errorResponse(const LedgerError& error) {
  nlohmann::json j = errorResponse(error.reason);
  j["code"] = domain::errorCodeToString(error.code);
  j["reason"] = error.reason;
  j["position_id"] = error.position_id;
  return j;
}

template <typename T>
nlohmann::json fromResult(const domain::Result<T>& result, const char* key) {
  if (const auto* error = std::get_if<LedgerError>(&result)) {
    return errorResponse(*error);
  }
  nlohmann::json j = ok();
  j[key] = toJson(std::get<T>(result));
  return j;
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor
// -----------------------------------------------------------------------------
AutopilotEngine::AutopilotEngine(const ITimeProvider& clock,
                                 domain::EngineConfig config,
                                 SimulationTimeProvider* replay_clock)
    : clock_(clock), config_(std::move(config)), replay_clock_(replay_clock) {
  const std::size_t worker_count = std::max<std::size_t>(1, config_.worker_count);
  workers_.reserve(worker_count);
  for (std::size_t i = 0; i < worker_count; ++i) {
    workers_.push_back(
        std::make_unique<EventLoopThread>("worker-" + std::to_string(i)));
  }

  ledger_ = std::make_unique<PositionLedger>(
      catalog_, clock_, config_,
      [this](const Event& event) { onLedgerEvent(event); });

  executor_factory_ = [](EventBus& bus, const ITimeProvider& time_provider)
      -> std::unique_ptr<IRebalanceExecutor> {
    return std::make_unique<MockRebalanceExecutor>(bus, time_provider);
  };
}

AutopilotEngine::~AutopilotEngine() { stop(); }

void AutopilotEngine::setExecutorFactory(ExecutorFactory factory) {
  executor_factory_ = std::move(factory);
}

void AutopilotEngine::setVolatilitySource(const IVolatilitySource* source) {
  volatility_source_ = source;
}

// -----------------------------------------------------------------------------
// start()
// -----------------------------------------------------------------------------
void AutopilotEngine::start(IPositionReconciler* reconciler) {
  if (running_) {
    return;
  }

  // ---  1) Synchronization gate (optional) ----------------------------------
  if (reconciler != nullptr) {
    std::size_t restored = 0;
    for (auto& entry : reconciler->reconcilePositions()) {
      auto result =
          ledger_->hydrate(std::move(entry.position), std::move(entry.history));
      if (const auto* error = std::get_if<LedgerError>(&result)) {
        std::cerr << "[AutopilotEngine] could not hydrate position "
                  << error->position_id << ": " << error->reason << "\n";
        continue;
      }
      ++restored;
    }
    std::cout << "[AutopilotEngine] Reconciliation complete: " << restored
              << " position(s) hydrated.\n";
  }

  // ---  2) Start the event loops ---------------------------------------------
  for (auto& worker : workers_) {
    worker->start();
  }
  execution_loop_.start();

  // The IPC server object must exist before the telemetry bridges are wired;
  // its sockets are opened in step 5.
  if (!config_.ipc_cmd_endpoint.empty() && !config_.ipc_pub_endpoint.empty()) {
    ipc_server_ = std::make_unique<IpcServer>(
        [this](const std::string& cmd) { return executeCommand(cmd); },
        config_.ipc_cmd_endpoint, config_.ipc_pub_endpoint);
  }

  // ---  3) Ledger handlers and cross-thread bridges --------------------------
  for (auto& worker : workers_) {
    subscribeWorker(*worker);
  }

  EventBus& exec_bus = execution_loop_.eventBus();
  subscriptions_.emplace_back(
      &exec_bus, exec_bus.subscribe<RebalanceResultEvent>(
                     [this](const RebalanceResultEvent& e) {
                       routeToWorker(e.result.position_id, e);
                     }));
  subscriptions_.emplace_back(
      &exec_bus, exec_bus.subscribe<RebalanceCancelRequestEvent>(
                     [this](const RebalanceCancelRequestEvent& e) {
                       routeToWorker(e.position_id, e);
                     }));

  // ---  4) Executor and health monitor --------------------------------------
  executor_ = executor_factory_(exec_bus, clock_);

  health_monitor_ = std::make_unique<HealthMonitor>(
      [this](const HealthAlertEvent& alert) {
        routeToWorker(alert.position_id, alert);
      });
  for (auto& worker : workers_) {
    health_monitor_->attach(worker->eventBus());
  }

  // ---  5) Keeper and IPC server ---------------------------------------------
  if (config_.keeper_interval_ms > 0) {
    keeper_ = std::make_unique<KeeperThread>(
        [this] { sweep(); },
        std::chrono::milliseconds(config_.keeper_interval_ms));
    keeper_->start();
  }

  if (ipc_server_) {
    ipc_server_->start();
  }

  // ---  6) Valuation feed LAST -----------------------------------------------
  if (!config_.valuation_endpoint.empty()) {
    feed_thread_ = std::make_unique<ValuationFeedThread>(
        replay_clock_,
        [this](Event event) {
          if (auto* tick = std::get_if<ValuationTickEvent>(&event)) {
            pushValuation(std::move(*tick));
          }
        },
        config_.valuation_endpoint);
    feed_thread_->start();
  }

  running_ = true;

  std::cout << "[AutopilotEngine] started. Threads: " << workers_.size()
            << " worker(s), execution" << (keeper_ ? ", keeper" : "")
            << (ipc_server_ ? ", ipc" : "")
            << (feed_thread_ ? ", valuation_feed" : "") << ".\n";
}

// -----------------------------------------------------------------------------
// stop()
// -----------------------------------------------------------------------------
void AutopilotEngine::stop() {
  if (!running_) {
    return;
  }

  // ---  1) Stop inflow: feed, housekeeping, then the command socket --------
  // The IPC server object stays alive until step 3: worker telemetry
  // bridges still reference it while the loops drain.
  feed_thread_.reset();
  keeper_.reset();
  if (ipc_server_) {
    ipc_server_->stop();
  }

  // ---  2) Join the event loops ----------------------------------------------
  // No handler can run after this point, so nothing below races a dispatch.
  for (auto& worker : workers_) {
    worker->stop();
  }
  execution_loop_.stop();

  // ---  3) Detach handlers and destroy the bus-bound components -------------
  for (auto& [bus, id] : subscriptions_) {
    bus->unsubscribe(id);
  }
  subscriptions_.clear();

  health_monitor_.reset();
  executor_.reset();
  ipc_server_.reset();

  running_ = false;

  std::cout << "[AutopilotEngine] stopped. All threads joined.\n";
}

// -----------------------------------------------------------------------------
// Routing
// -----------------------------------------------------------------------------
std::size_t AutopilotEngine::workerFor(PositionId id) const {
  return static_cast<std::size_t>(id % workers_.size());
}

void AutopilotEngine::routeToWorker(PositionId id, Event event) {
  workers_[workerFor(id)]->push(std::move(event));
}

void AutopilotEngine::onLedgerEvent(const Event& event) {
  routeToWorker(positionOf(event), event);
}

void AutopilotEngine::pushValuation(ValuationTickEvent tick) {
  if (!tick.volatility.has_value() && volatility_source_ != nullptr) {
    tick.volatility = volatility_source_->current();
  }
  const PositionId id = tick.position_id;
  routeToWorker(id, std::move(tick));
}

domain::Result<domain::RebalanceInstruction>
AutopilotEngine::requestManualRebalance(PositionId id) {
  auto result = ledger_->requestRebalance(id, domain::TriggerReason::Manual);
  if (const auto* instruction =
          std::get_if<domain::RebalanceInstruction>(&result)) {
    routeToWorker(id, RebalanceInstructionEvent{*instruction});
  }
  return result;
}

void AutopilotEngine::sweep() {
  const std::int64_t now = clock_.now_ms();
  ledger_->expireInFlight(now);
  ledger_->matureDue(now);
}

// -----------------------------------------------------------------------------
// Worker wiring
// -----------------------------------------------------------------------------
void AutopilotEngine::subscribeWorker(EventLoopThread& worker) {
  EventBus& bus = worker.eventBus();
  auto track = [this, &bus](EventBus::SubscriptionId id) {
    subscriptions_.emplace_back(&bus, id);
  };

  track(bus.subscribe<ValuationTickEvent>(
      [this, &bus](const ValuationTickEvent& e) { onTick(bus, e); }));
  track(bus.subscribe<RebalanceRequestEvent>(
      [this, &bus](const RebalanceRequestEvent& e) {
        onRebalanceRequest(bus, e);
      }));
  track(bus.subscribe<RebalanceResultEvent>(
      [this](const RebalanceResultEvent& e) { onResult(e); }));
  track(bus.subscribe<RebalanceCancelRequestEvent>(
      [this](const RebalanceCancelRequestEvent& e) { onCancelRequest(e); }));

  // Bridge: worker → execution loop
  track(bus.subscribe<RebalanceInstructionEvent>(
      [this](const RebalanceInstructionEvent& e) { execution_loop_.push(e); }));

  // Bridge: worker → IPC telemetry
  if (ipc_server_) {
    track(bus.subscribe([this](const Event& e) {
      if (isTelemetry(e)) {
        ipc_server_->pushTelemetry(e);
      }
    }));
  }
}

void AutopilotEngine::onTick(EventBus& bus, const ValuationTickEvent& tick) {
  auto outcome = ledger_->revalue(tick.position_id, tick.value,
                                  tick.timestamp_ms, tick.volatility);

  if (const auto* error = std::get_if<LedgerError>(&outcome)) {
    switch (error->code) {
      case domain::ErrorCode::PositionNotFound:
      case domain::ErrorCode::InvalidValuation:
        std::cerr << "[AutopilotEngine] tick for position "
                  << tick.position_id << " dropped ("
                  << domain::errorCodeToString(error->code)
                  << "): " << error->reason << "\n";
        break;
      default:
        // Logged by the ledger, or expected while under review.
        break;
    }
    return;
  }

  const auto& instruction =
      std::get<std::optional<domain::RebalanceInstruction>>(outcome);
  if (!instruction.has_value()) {
    return;
  }

  std::cout << "[AutopilotEngine] position " << instruction->position_id
            << ": " << domain::triggerReasonToString(instruction->trigger)
            << " rebalance -> safe=" << instruction->target_safe
            << " risky=" << instruction->target_risky << "\n";

  bus.publish(RebalanceInstructionEvent{*instruction});
}

void AutopilotEngine::onRebalanceRequest(EventBus& bus,
                                         const RebalanceRequestEvent& request) {
  auto outcome = ledger_->requestRebalance(request.position_id, request.reason);
  if (const auto* error = std::get_if<LedgerError>(&outcome)) {
    std::cerr << "[AutopilotEngine] rebalance request for position "
              << request.position_id << " refused ("
              << domain::errorCodeToString(error->code)
              << "): " << error->reason << "\n";
    return;
  }
  bus.publish(
      RebalanceInstructionEvent{std::get<domain::RebalanceInstruction>(outcome)});
}

void AutopilotEngine::onResult(const RebalanceResultEvent& event) {
  auto outcome =
      ledger_->applyRebalanceResult(event.result.position_id, event.result);
  if (const auto* record = std::get_if<domain::RebalanceEvent>(&outcome)) {
    std::cout << "[AutopilotEngine] position " << record->position_id
              << " rebalanced (#" << record->sequence
              << ", risky=" << record->after_risky_allocation * 100.0
              << "%)\n";
  }
}

void AutopilotEngine::onCancelRequest(const RebalanceCancelRequestEvent& event) {
  auto outcome = ledger_->cancelRebalance(event.position_id,
                                          event.instruction_id, event.reason);
  if (const auto* error = std::get_if<LedgerError>(&outcome)) {
    std::cerr << "[AutopilotEngine] cancellation of instruction "
              << event.instruction_id << " ignored: " << error->reason
              << "\n";
  }
}

// -----------------------------------------------------------------------------
// executeCommand(): IPC request → JSON response
// -----------------------------------------------------------------------------
std::string AutopilotEngine::executeCommand(const std::string& cmd) {
  nlohmann::json request;

  const auto first = cmd.find_first_not_of(" \t\r\n");
  if (first != std::string::npos && cmd[first] == '{') {
    try {
      request = nlohmann::json::parse(cmd);
    } catch (const nlohmann::json::exception& e) {
      return errorResponse(std::string("Malformed command: ") + e.what()).dump();
    }
  } else {
    request["cmd"] = cmd;
  }

  const std::string name = request.value("cmd", std::string());
  nlohmann::json response;

  try {
    if (name == "PING") {
      response = ok();
      response["response"] = "PONG";

    } else if (name == "OPEN") {
      OpenRequest open;
      open.owner = request.value("owner", std::string());
      open.strategy_id = request.at("strategy_id").get<std::string>();
      open.principal = request.at("principal").get<double>();
      if (request.contains("custom_floor") && !request["custom_floor"].is_null()) {
        open.custom_floor = request["custom_floor"].get<double>();
      }
      open.auto_rebalance = request.value("auto_rebalance", true);
      if (request.contains("maturity_ms") && !request["maturity_ms"].is_null()) {
        open.maturity_ms = request["maturity_ms"].get<std::int64_t>();
      }

      auto result = ledger_->open(open);
      if (const auto* error = std::get_if<LedgerError>(&result)) {
        response = errorResponse(*error);
      } else {
        const PositionId id = std::get<PositionId>(result);
        response = ok();
        response["position_id"] = id;
        if (auto snapshot = ledger_->position(id)) {
          response["position"] = toJson(*snapshot);
        }
      }

    } else if (name == "CLOSE") {
      response = fromResult(
          ledger_->close(request.at("position_id").get<PositionId>()),
          "settlement");

    } else if (name == "TOGGLE_AUTO") {
      const auto id = request.at("position_id").get<PositionId>();
      auto current = ledger_->position(id);
      if (!current) {
        response = errorResponse("No such position: " + std::to_string(id));
      } else {
        const bool enabled =
            request.value("enabled", !current->auto_rebalance_enabled);
        response = fromResult(ledger_->setAutoRebalance(id, enabled), "position");
      }

    } else if (name == "UPDATE") {
      const auto id = request.at("position_id").get<PositionId>();
      PositionUpdate update;
      if (request.contains("multiplier") && !request["multiplier"].is_null()) {
        update.multiplier = request["multiplier"].get<double>();
      }
      if (request.contains("floor") && !request["floor"].is_null()) {
        update.guaranteed_floor = request["floor"].get<double>();
      }
      if (request.contains("auto_rebalance") &&
          !request["auto_rebalance"].is_null()) {
        update.auto_rebalance = request["auto_rebalance"].get<bool>();
      }

      auto result = ledger_->updatePosition(id, update);
      if (const auto* error = std::get_if<LedgerError>(&result)) {
        response = errorResponse(*error);
      } else {
        const auto& instruction =
            std::get<std::optional<domain::RebalanceInstruction>>(result);
        response = ok();
        if (instruction) {
          routeToWorker(id, RebalanceInstructionEvent{*instruction});
          response["instruction"] = toJson(*instruction);
        } else {
          response["instruction"] = nullptr;
        }
        if (auto snapshot = ledger_->position(id)) {
          response["position"] = toJson(*snapshot);
        }
      }

    } else if (name == "REBALANCE") {
      response = fromResult(
          requestManualRebalance(request.at("position_id").get<PositionId>()),
          "instruction");

    } else if (name == "EMERGENCY_STOP") {
      std::vector<PositionId> targets;
      if (request.contains("position_id")) {
        targets.push_back(request["position_id"].get<PositionId>());
      } else {
        for (const auto& p : ledger_->snapshots()) {
          targets.push_back(p.id);
        }
      }

      std::cerr << "[AutopilotEngine] EMERGENCY STOP requested for "
                << targets.size() << " position(s)\n";

      nlohmann::json frozen = nlohmann::json::array();
      nlohmann::json failed = nlohmann::json::array();
      for (PositionId id : targets) {
        auto result = ledger_->emergencyStop(id);
        if (const auto* error = std::get_if<LedgerError>(&result)) {
          failed.push_back(toJson(*error));
        } else {
          frozen.push_back(id);
        }
      }
      response = failed.empty() || !frozen.empty()
                     ? ok()
                     : errorResponse("No position could be frozen");
      response["frozen"] = std::move(frozen);
      response["failed"] = std::move(failed);

    } else if (name == "RESUME") {
      response = fromResult(
          ledger_->resume(request.at("position_id").get<PositionId>()),
          "position");

    } else if (name == "CLEAR_REVIEW") {
      response = fromResult(
          ledger_->clearReview(request.at("position_id").get<PositionId>(),
                               request.at("safe").get<double>(),
                               request.at("risky").get<double>()),
          "position");

    } else if (name == "POSITION" || name == "HEALTH") {
      const auto id = request.at("position_id").get<PositionId>();
      auto snapshot = ledger_->position(id);
      if (!snapshot) {
        response = errorResponse("No such position: " + std::to_string(id));
      } else {
        std::optional<HealthReport> report;
        if (health_monitor_) {
          report = health_monitor_->report(id);
        }
        if (!report) {
          report = HealthScorer::score(*snapshot);
        }
        response = ok();
        response["health"] = toJson(*report);
        if (name == "POSITION") {
          response["position"] = toJson(*snapshot);
        }
      }

    } else if (name == "POSITIONS") {
      const auto positions =
          request.contains("owner")
              ? ledger_->positionsForOwner(request["owner"].get<std::string>())
              : ledger_->snapshots();
      nlohmann::json list = nlohmann::json::array();
      for (const auto& p : positions) {
        list.push_back(toJson(p));
      }
      response = ok();
      response["positions"] = std::move(list);

    } else if (name == "HISTORY") {
      const auto events =
          request.contains("position_id")
              ? ledger_->history(request["position_id"].get<PositionId>())
              : ledger_->recentRebalances(
                    request.value("limit", std::size_t{20}));
      nlohmann::json list = nlohmann::json::array();
      for (const auto& e : events) {
        list.push_back(toJson(e));
      }
      response = ok();
      response["events"] = std::move(list);

    } else if (name == "POOL") {
      response = ok();
      response["pool"] = toJson(ledger_->poolStats());

    } else if (name == "STRATEGIES") {
      nlohmann::json list = nlohmann::json::array();
      for (const auto& s : catalog_.list()) {
        list.push_back(toJson(*s));
      }
      response = ok();
      response["strategies"] = std::move(list);

    } else {
      response = errorResponse("Unknown command: " + name);
    }
  } catch (const nlohmann::json::exception& e) {
    response = errorResponse("Bad arguments for " + name + ": " + e.what());
  }

  return response.dump();
}

// -----------------------------------------------------------------------------
// Accessors
// -----------------------------------------------------------------------------
EventBus& AutopilotEngine::workerEventBus(std::size_t index) {
  return workers_.at(index)->eventBus();
}

EventBus& AutopilotEngine::executionEventBus() {
  return execution_loop_.eventBus();
}

bool AutopilotEngine::idle() const {
  for (const auto& worker : workers_) {
    if (!worker->idle()) {
      return false;
    }
  }
  return execution_loop_.idle();
}

}  // namespace cppi
