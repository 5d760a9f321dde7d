#include "cppi/feed/valuation_gateway.hpp"

#include <nlohmann/json.hpp>

#include <iostream>
#include <utility>

namespace cppi {

namespace {

std::optional<domain::VolatilityRegime> parseRegime(const std::string& s) {
  if (s == "Low") {
    return domain::VolatilityRegime::Low;
  }
  if (s == "Normal") {
    return domain::VolatilityRegime::Normal;
  }
  if (s == "High") {
    return domain::VolatilityRegime::High;
  }
  return std::nullopt;
}

}  // namespace

// -----------------------------------------------------------------------------
// Constructor: SUB socket with receive timeout
// -----------------------------------------------------------------------------
ValuationGateway::ValuationGateway(SimulationTimeProvider* replay_clock,
                                   EventSink event_sink,
                                   const std::string& endpoint)
    : replay_clock_(replay_clock), event_sink_(std::move(event_sink)) {
  socket_.set(zmq::sockopt::subscribe, "");

  // Without a receive timeout recv() never returns on a quiet feed and
  // stop() is never observed.
  socket_.set(zmq::sockopt::rcvtimeo, kRecvTimeoutMs);

  socket_.connect(endpoint);
}

// -----------------------------------------------------------------------------
// run(): blocking recv loop
// -----------------------------------------------------------------------------
void ValuationGateway::run() {
  while (running_.load()) {
    zmq::message_t msg;
    auto result = socket_.recv(msg, zmq::recv_flags::none);
    if (!result.has_value()) {
      continue;
    }

    auto tick = decodeTick(msg.to_string());
    if (!tick.has_value()) {
      continue;
    }

    if (replay_clock_ != nullptr) {
      replay_clock_->advance_time(tick->timestamp_ms);
    }

    event_sink_(std::move(*tick));
  }
}

void ValuationGateway::stop() { running_.store(false); }

// -----------------------------------------------------------------------------
// decodeTick(): JSON payload -> ValuationTickEvent
// -----------------------------------------------------------------------------
std::optional<ValuationTickEvent> ValuationGateway::decodeTick(
    const std::string& payload) {
  try {
    auto json = nlohmann::json::parse(payload);

    ValuationTickEvent tick;
    tick.position_id = json.at("position_id").get<domain::PositionId>();
    tick.value = json.at("value").get<double>();
    tick.timestamp_ms = json.at("timestamp_ms").get<std::int64_t>();

    if (json.contains("volatility") && !json["volatility"].is_null()) {
      domain::VolatilitySignal signal;
      signal.value = json["volatility"].get<double>();
      signal.timestamp_ms = tick.timestamp_ms;

      const std::string regime = json.value("regime", std::string("Normal"));
      auto parsed = parseRegime(regime);
      if (!parsed.has_value()) {
        std::cerr << "[ValuationGateway] unknown regime '" << regime
                  << "'. Payload skipped: " << payload << "\n";
        return std::nullopt;
      }
      signal.regime = *parsed;
      tick.volatility = signal;
    }

    return tick;
  } catch (const nlohmann::json::exception& e) {
    std::cerr << "[ValuationGateway] JSON parse error: " << e.what()
              << ". Payload: " << payload << "\n";
  }
  return std::nullopt;
}

}  // namespace cppi
