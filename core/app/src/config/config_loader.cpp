#include "cppi/config/config_loader.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <iostream>
#include <sstream>

namespace cppi {

namespace {

template <typename T>
void readIfPresent(const nlohmann::json& j, const char* key, T& out) {
  if (j.contains(key) && !j[key].is_null()) {
    out = j[key].get<T>();
  }
}

domain::Strategy parseStrategy(const nlohmann::json& j,
                               double default_slippage_bps) {
  domain::Strategy s;
  s.id = j.at("id").get<std::string>();
  s.name = j.value("name", s.id);
  s.max_slippage_bps = default_slippage_bps;

  readIfPresent(j, "multiplier", s.multiplier);
  readIfPresent(j, "floor_ratio", s.floor_ratio);
  readIfPresent(j, "rebalance_threshold", s.rebalance_threshold);
  readIfPresent(j, "ratchet_enabled", s.ratchet_enabled);
  readIfPresent(j, "max_slippage_bps", s.max_slippage_bps);

  if (j.contains("cap") && !j["cap"].is_null()) {
    s.cap = j["cap"].get<double>();
  }
  if (j.contains("scheduled_interval_ms") &&
      !j["scheduled_interval_ms"].is_null()) {
    s.scheduled_interval_ms = j["scheduled_interval_ms"].get<std::int64_t>();
  }
  return s;
}

}  // namespace

AppConfig ConfigLoader::defaults() {
  AppConfig config;
  config.strategies = defaultStrategies();
  return config;
}

std::vector<domain::Strategy> ConfigLoader::defaultStrategies() {
  domain::Strategy conservative;
  conservative.id = "cppi_conservative";
  conservative.name = "Conservative CPPI";
  conservative.multiplier = 3.0;
  conservative.floor_ratio = 0.90;
  conservative.rebalance_threshold = 0.05;

  domain::Strategy balanced;
  balanced.id = "cppi_balanced";
  balanced.name = "Balanced CPPI";
  balanced.multiplier = 4.0;
  balanced.floor_ratio = 0.85;
  balanced.cap = 1.5;
  balanced.rebalance_threshold = 0.03;

  domain::Strategy aggressive;
  aggressive.id = "cppi_aggressive";
  aggressive.name = "Aggressive CPPI";
  aggressive.multiplier = 5.5;
  aggressive.floor_ratio = 0.80;
  aggressive.rebalance_threshold = 0.02;

  return {conservative, balanced, aggressive};
}

// -----------------------------------------------------------------------------
// parse(): JSON text -> AppConfig
// -----------------------------------------------------------------------------
std::optional<AppConfig> ConfigLoader::parse(const std::string& text,
                                             std::string* error) {
  auto fail = [error](const std::string& reason) -> std::optional<AppConfig> {
    if (error != nullptr) {
      *error = reason;
    }
    return std::nullopt;
  };

  try {
    auto root = nlohmann::json::parse(text);
    if (!root.is_object()) {
      return fail("configuration root must be an object");
    }

    AppConfig config;

    if (root.contains("clock")) {
      const auto clock = root["clock"].get<std::string>();
      if (clock == "replay") {
        config.replay_clock = true;
      } else if (clock == "live") {
        config.replay_clock = false;
      } else {
        return fail("unknown clock '" + clock + "'");
      }
    }

    if (root.contains("engine")) {
      const auto& e = root["engine"];
      domain::EngineConfig& c = config.engine;
      readIfPresent(e, "volatility_spike_threshold", c.volatility_spike_threshold);
      readIfPresent(e, "freshness_window_ms", c.freshness_window_ms);
      readIfPresent(e, "max_clock_skew_ms", c.max_clock_skew_ms);
      readIfPresent(e, "execution_timeout_ms", c.execution_timeout_ms);
      readIfPresent(e, "keeper_interval_ms", c.keeper_interval_ms);
      readIfPresent(e, "sum_epsilon", c.sum_epsilon);
      readIfPresent(e, "data_quality_alert_threshold",
                    c.data_quality_alert_threshold);
      readIfPresent(e, "default_max_slippage_bps", c.default_max_slippage_bps);
      readIfPresent(e, "worker_count", c.worker_count);
      readIfPresent(e, "valuation_endpoint", c.valuation_endpoint);
      readIfPresent(e, "ipc_cmd_endpoint", c.ipc_cmd_endpoint);
      readIfPresent(e, "ipc_pub_endpoint", c.ipc_pub_endpoint);

      if (c.worker_count == 0) {
        return fail("engine.worker_count must be at least 1");
      }
      if (c.max_clock_skew_ms < 0) {
        return fail("engine.max_clock_skew_ms must not be negative");
      }
    }

    if (root.contains("strategies")) {
      for (const auto& s : root["strategies"]) {
        config.strategies.push_back(
            parseStrategy(s, config.engine.default_max_slippage_bps));
      }
    } else {
      config.strategies = defaultStrategies();
    }

    return config;
  } catch (const nlohmann::json::exception& e) {
    return fail(e.what());
  }
}

AppConfig ConfigLoader::loadFile(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    std::cerr << "[ConfigLoader] cannot open '" << path
              << "'. Using built-in defaults.\n";
    return defaults();
  }

  std::stringstream buffer;
  buffer << in.rdbuf();

  std::string error;
  auto config = parse(buffer.str(), &error);
  if (!config.has_value()) {
    std::cerr << "[ConfigLoader] invalid configuration in '" << path
              << "': " << error << ". Using built-in defaults.\n";
    return defaults();
  }

  std::cout << "[ConfigLoader] loaded '" << path << "' ("
            << config->strategies.size() << " strategies)\n";
  return *config;
}

std::size_t ConfigLoader::publishAll(
    StrategyCatalog& catalog, const std::vector<domain::Strategy>& strategies) {
  std::size_t accepted = 0;
  for (const auto& s : strategies) {
    if (catalog.publish(s).has_value()) {
      ++accepted;
    }
  }
  return accepted;
}

}  // namespace cppi
