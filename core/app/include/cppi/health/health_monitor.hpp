#pragma once

#include "cppi/eventbus/event_bus.hpp"
#include "cppi/events/event_types.hpp"
#include "cppi/health/health_scorer.hpp"

#include <functional>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

namespace cppi {

// -----------------------------------------------------------------------------
// HealthMonitor — watches position snapshots and raises health alerts
// -----------------------------------------------------------------------------
//
// @brief  Scores every PositionUpdateEvent with HealthScorer, remembers the
//         latest report per position, and emits a HealthAlertEvent when a
//         position's band worsens or while it sits in AtRisk.
//
// @details
// The monitor subscribes to one EventBus per position worker (attach()) and
// forgets a position on PositionClosedEvent. It never writes to the ledger;
// alerts leave through the AlertSink (the engine forwards them to the IPC
// telemetry channel).
//
// The first snapshot of a position sets its baseline band. Repeated AtRisk
// updates each produce an alert; a position recovering to a better band
// produces none.
//
// Thread model:
//   Callbacks arrive concurrently from several worker threads. The report
//   map is guarded by a mutex; the sink is invoked outside it.
// -----------------------------------------------------------------------------
class HealthMonitor {
 public:
  using AlertSink = std::function<void(const HealthAlertEvent&)>;

  explicit HealthMonitor(AlertSink sink);
  ~HealthMonitor();

  HealthMonitor(const HealthMonitor&) = delete;
  HealthMonitor& operator=(const HealthMonitor&) = delete;
  HealthMonitor(HealthMonitor&&) = delete;
  HealthMonitor& operator=(HealthMonitor&&) = delete;

  // Subscribes to PositionUpdateEvent and PositionClosedEvent on bus. The
  // bus must outlive the monitor.
  void attach(EventBus& bus);

  std::optional<HealthReport> report(domain::PositionId id) const;

  std::size_t alertCount() const;

 private:
  void onPositionUpdate(const PositionUpdateEvent& event);
  void onPositionClosed(const PositionClosedEvent& event);

  AlertSink sink_;

  struct Subscription {
    EventBus* bus;
    EventBus::SubscriptionId update_id;
    EventBus::SubscriptionId closed_id;
  };
  std::vector<Subscription> subscriptions_;

  mutable std::mutex mutex_;
  std::unordered_map<domain::PositionId, HealthReport> reports_;
  std::size_t alerts_{0};
};

}  // namespace cppi
