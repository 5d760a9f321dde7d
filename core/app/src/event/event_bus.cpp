#include "cppi/eventbus/event_bus.hpp"

#include <algorithm>
#include <utility>

namespace cppi {

EventBus::EventBus() : table_(std::make_shared<const Table>()) {}

std::shared_ptr<const EventBus::Table> EventBus::snapshot() const {
  std::lock_guard lock(mutex_);
  return table_;
}

// -----------------------------------------------------------------------------
// subscribe / unsubscribe: copy the table, edit, swap
// -----------------------------------------------------------------------------
EventBus::SubscriptionId EventBus::subscribe(GenericCallback callback) {
  std::lock_guard lock(mutex_);
  const SubscriptionId id = next_id_++;

  auto next = std::make_shared<Table>(*table_);
  next->push_back(Subscriber{id, std::move(callback)});
  table_ = std::move(next);
  return id;
}

void EventBus::unsubscribe(SubscriptionId id) {
  std::lock_guard lock(mutex_);
  auto it = std::find_if(table_->begin(), table_->end(),
                         [id](const Subscriber& s) { return s.id == id; });
  if (it == table_->end()) {
    return;
  }

  auto next = std::make_shared<Table>();
  next->reserve(table_->size() - 1);
  for (const auto& s : *table_) {
    if (s.id != id) {
      next->push_back(s);
    }
  }
  table_ = std::move(next);
}

void EventBus::publish(const Event& event) {
  const auto table = snapshot();
  for (const auto& subscriber : *table) {
    subscriber.callback(event);
  }
}

std::size_t EventBus::subscriberCount() const { return snapshot()->size(); }

}  // namespace cppi
