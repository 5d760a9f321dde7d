#pragma once

#include "cppi/domain/position.hpp"
#include "cppi/domain/rebalance.hpp"

#include <vector>

namespace cppi {

// -----------------------------------------------------------------------------
// ReconciledPosition — one position restored from outside the engine
// -----------------------------------------------------------------------------
struct ReconciledPosition {
  domain::Position position;
  std::vector<domain::RebalanceEvent> history;
};

// -----------------------------------------------------------------------------
// IPositionReconciler — start-up synchronization gate
// -----------------------------------------------------------------------------
//
// @brief  Supplies the positions (and their rebalance history) that existed
//         before this process started, so the engine does not begin from an
//         empty ledger.
//
// @details
// AutopilotEngine::start() calls reconcilePositions() once, before any
// worker runs or any tick arrives, and hands every entry to
// PositionLedger::hydrate(). A position whose invariants do not hold is
// hydrated UnderReview rather than rejected.
//
// Implementations typically read the persisted position table and event
// log. The call happens on the thread that calls start().
// -----------------------------------------------------------------------------
class IPositionReconciler {
 public:
  virtual ~IPositionReconciler() = default;

  virtual std::vector<ReconciledPosition> reconcilePositions() = 0;
};

}  // namespace cppi
