#include "cppi/health/health_monitor.hpp"

#include <iostream>
#include <utility>

namespace cppi {

HealthMonitor::HealthMonitor(AlertSink sink) : sink_(std::move(sink)) {}

HealthMonitor::~HealthMonitor() {
  for (const auto& sub : subscriptions_) {
    sub.bus->unsubscribe(sub.update_id);
    sub.bus->unsubscribe(sub.closed_id);
  }
}

void HealthMonitor::attach(EventBus& bus) {
  Subscription sub;
  sub.bus = &bus;
  sub.update_id = bus.subscribe<PositionUpdateEvent>(
      [this](const PositionUpdateEvent& e) { onPositionUpdate(e); });
  sub.closed_id = bus.subscribe<PositionClosedEvent>(
      [this](const PositionClosedEvent& e) { onPositionClosed(e); });
  subscriptions_.push_back(sub);
}

std::optional<HealthReport> HealthMonitor::report(domain::PositionId id) const {
  std::lock_guard lock(mutex_);
  auto it = reports_.find(id);
  if (it == reports_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::size_t HealthMonitor::alertCount() const {
  std::lock_guard lock(mutex_);
  return alerts_;
}

// -----------------------------------------------------------------------------
// onPositionUpdate: re-score and compare with the previous band
// -----------------------------------------------------------------------------
void HealthMonitor::onPositionUpdate(const PositionUpdateEvent& event) {
  const HealthReport current = HealthScorer::score(event.position);

  std::optional<HealthAlertEvent> alert;
  {
    std::lock_guard lock(mutex_);
    auto [it, inserted] = reports_.try_emplace(event.position.id, current);
    const HealthBand previous = inserted ? current.band : it->second.band;
    it->second = current;

    // A higher enum value is a worse band.
    if (current.band > previous || current.band == HealthBand::AtRisk) {
      alert = HealthAlertEvent{event.position.id, previous, current,
                               event.timestamp_ms};
      ++alerts_;
    }
  }

  if (!alert) {
    return;
  }

  std::cerr << "[HealthMonitor] position " << alert->position_id << " is "
            << healthBandToString(current.band) << " (was "
            << healthBandToString(alert->previous_band)
            << ", floor distance=" << current.floor_distance << ")\n";

  if (sink_) {
    sink_(*alert);
  }
}

void HealthMonitor::onPositionClosed(const PositionClosedEvent& event) {
  std::lock_guard lock(mutex_);
  reports_.erase(event.settlement.position_id);
}

}  // namespace cppi
