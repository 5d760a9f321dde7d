#pragma once

#include "cppi/domain/errors.hpp"
#include "cppi/domain/position.hpp"
#include "cppi/domain/rebalance.hpp"
#include "cppi/domain/strategy.hpp"
#include "cppi/health/health_scorer.hpp"
#include "cppi/ledger/position_ledger.hpp"

#include <nlohmann/json.hpp>

namespace cppi {

// -----------------------------------------------------------------------------
// JSON projections of the domain types
// -----------------------------------------------------------------------------
// Shared by the IPC command responses and the telemetry channel so that a
// position looks the same on both sockets. Enums are written as their
// *ToString() names, optionals as null.
// -----------------------------------------------------------------------------
nlohmann::json toJson(const domain::Position& p);
nlohmann::json toJson(const domain::RebalanceEvent& e);
nlohmann::json toJson(const domain::RebalanceInstruction& i);
nlohmann::json toJson(const domain::FinalSettlement& s);
nlohmann::json toJson(const domain::Strategy& s);
nlohmann::json toJson(const domain::LedgerError& e);
nlohmann::json toJson(const HealthReport& r);
nlohmann::json toJson(const PoolStats& s);

}  // namespace cppi
