#include "cppi/strategy/strategy_catalog.hpp"

#include <algorithm>
#include <iostream>
#include <mutex>

namespace cppi {

std::optional<StrategyCatalog::StrategyPtr> StrategyCatalog::publish(
    domain::Strategy strategy, std::string* error) {
  if (auto reason = domain::validateStrategy(strategy)) {
    std::cerr << "[StrategyCatalog] rejected strategy '" << strategy.id
              << "': " << *reason << "\n";
    if (error != nullptr) {
      *error = *reason;
    }
    return std::nullopt;
  }

  std::unique_lock lock(mutex_);
  auto& chain = versions_[strategy.id];
  strategy.version = static_cast<std::uint32_t>(chain.size() + 1);

  auto published = std::make_shared<const domain::Strategy>(std::move(strategy));
  chain.push_back(published);
  return published;
}

StrategyCatalog::StrategyPtr StrategyCatalog::find(
    const domain::StrategyId& id) const {
  std::shared_lock lock(mutex_);
  auto it = versions_.find(id);
  if (it == versions_.end() || it->second.empty()) {
    return nullptr;
  }
  return it->second.back();
}

StrategyCatalog::StrategyPtr StrategyCatalog::find(
    const domain::StrategyId& id, std::uint32_t version) const {
  std::shared_lock lock(mutex_);
  auto it = versions_.find(id);
  if (it == versions_.end() || version == 0 || version > it->second.size()) {
    return nullptr;
  }
  return it->second[version - 1];
}

std::vector<StrategyCatalog::StrategyPtr> StrategyCatalog::list() const {
  std::vector<StrategyPtr> result;
  {
    std::shared_lock lock(mutex_);
    result.reserve(versions_.size());
    for (const auto& [id, chain] : versions_) {
      if (!chain.empty()) {
        result.push_back(chain.back());
      }
    }
  }
  std::sort(result.begin(), result.end(),
            [](const StrategyPtr& a, const StrategyPtr& b) {
              return a->id < b->id;
            });
  return result;
}

std::size_t StrategyCatalog::size() const {
  std::shared_lock lock(mutex_);
  return versions_.size();
}

}  // namespace cppi
