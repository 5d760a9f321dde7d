#include "cppi/network/json_format.hpp"

#include <cmath>

namespace cppi {

nlohmann::json toJson(const domain::Position& p) {
  nlohmann::json j;
  j["id"] = p.id;
  j["owner"] = p.owner;
  j["strategy_id"] = p.strategy_id;
  j["strategy_version"] = p.strategy_version;
  j["principal"] = p.principal;
  j["guaranteed_floor"] = p.guaranteed_floor;
  j["current_value"] = p.current_value;
  j["peak_value"] = p.peak_value;
  j["safe_exposure"] = p.safe_exposure;
  j["risky_exposure"] = p.risky_exposure;
  j["cushion"] = p.cushion;
  j["max_drawdown"] = p.max_drawdown;
  j["multiplier_override"] = p.multiplier_override
                                 ? nlohmann::json(*p.multiplier_override)
                                 : nlohmann::json(nullptr);
  j["rebalance_count"] = p.rebalance_count;
  j["auto_rebalance_enabled"] = p.auto_rebalance_enabled;
  j["status"] = domain::positionStatusToString(p.status);
  j["maturity_ms"] =
      p.maturity_ms ? nlohmann::json(*p.maturity_ms) : nlohmann::json(nullptr);
  j["created_at_ms"] = p.created_at_ms;
  j["last_rebalanced_at_ms"] = p.last_rebalanced_at_ms;
  j["last_valuation_ms"] = p.last_valuation_ms;
  j["rebalance_in_flight"] = p.rebalance_in_flight;
  j["data_quality_incidents"] = p.data_quality_incidents;
  return j;
}

nlohmann::json toJson(const domain::RebalanceEvent& e) {
  nlohmann::json j;
  j["position_id"] = e.position_id;
  j["sequence"] = e.sequence;
  j["trigger"] = domain::triggerReasonToString(e.trigger);
  j["before_safe_allocation"] = e.before_safe_allocation;
  j["after_safe_allocation"] = e.after_safe_allocation;
  j["before_risky_allocation"] = e.before_risky_allocation;
  j["after_risky_allocation"] = e.after_risky_allocation;
  j["timestamp_ms"] = e.timestamp_ms;
  j["slippage_bps"] = e.slippage_bps;
  j["cost_paid"] = e.cost_paid;
  return j;
}

nlohmann::json toJson(const domain::RebalanceInstruction& i) {
  nlohmann::json j;
  j["position_id"] = i.position_id;
  j["instruction_id"] = i.instruction_id;
  j["trigger"] = domain::triggerReasonToString(i.trigger);
  j["target_safe"] = i.target_safe;
  j["target_risky"] = i.target_risky;
  j["max_slippage_bps"] = i.max_slippage_bps;
  j["issued_at_ms"] = i.issued_at_ms;
  return j;
}

nlohmann::json toJson(const domain::FinalSettlement& s) {
  nlohmann::json j;
  j["position_id"] = s.position_id;
  j["owner"] = s.owner;
  j["principal"] = s.principal;
  j["final_value"] = s.final_value;
  j["guaranteed_floor"] = s.guaranteed_floor;
  j["total_return"] = s.total_return;
  j["max_drawdown"] = s.max_drawdown;
  j["rebalance_count"] = s.rebalance_count;
  j["closed_at_ms"] = s.closed_at_ms;
  j["reason"] = domain::settlementReasonToString(s.reason);
  return j;
}

nlohmann::json toJson(const domain::Strategy& s) {
  nlohmann::json j;
  j["id"] = s.id;
  j["name"] = s.name;
  j["version"] = s.version;
  j["multiplier"] = s.multiplier;
  j["floor_ratio"] = s.floor_ratio;
  j["cap"] = s.cap ? nlohmann::json(*s.cap) : nlohmann::json(nullptr);
  j["rebalance_threshold"] = s.rebalance_threshold;
  j["ratchet_enabled"] = s.ratchet_enabled;
  j["scheduled_interval_ms"] = s.scheduled_interval_ms
                                   ? nlohmann::json(*s.scheduled_interval_ms)
                                   : nlohmann::json(nullptr);
  j["max_slippage_bps"] = s.max_slippage_bps;
  j["risk_level"] = domain::riskLevelToString(domain::riskLevel(s.multiplier));
  return j;
}

nlohmann::json toJson(const domain::LedgerError& e) {
  nlohmann::json j;
  j["code"] = domain::errorCodeToString(e.code);
  j["position_id"] = e.position_id;
  j["reason"] = e.reason;
  if (e.last_known_good) {
    j["last_known_good"] = toJson(*e.last_known_good);
  }
  return j;
}

nlohmann::json toJson(const HealthReport& r) {
  nlohmann::json j;
  // JSON has no infinity; a zero floor is reported as null.
  j["floor_distance"] = std::isfinite(r.floor_distance)
                            ? nlohmann::json(r.floor_distance)
                            : nlohmann::json(nullptr);
  j["cushion_ratio"] = r.cushion_ratio;
  j["band"] = healthBandToString(r.band);
  j["score"] = r.score;
  return j;
}

nlohmann::json toJson(const PoolStats& s) {
  nlohmann::json j;
  j["total_aum"] = s.total_aum;
  j["total_positions"] = s.total_positions;
  j["average_multiplier"] = s.average_multiplier;
  j["average_floor_protection"] = s.average_floor_protection;
  j["success_rate"] = s.success_rate;
  j["total_rebalances"] = s.total_rebalances;
  j["avg_daily_rebalances"] = s.avg_daily_rebalances;
  j["total_safe"] = s.total_safe;
  j["total_risky"] = s.total_risky;
  j["risk_budget_utilization"] = s.risk_budget_utilization;
  return j;
}

}  // namespace cppi
