#pragma once

#include "cppi/domain/strategy.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace cppi {

// -----------------------------------------------------------------------------
// StrategyCatalog — versioned, read-only strategy templates
// -----------------------------------------------------------------------------
//
// @brief  Holds every published Strategy. Lookups hand out
//         std::shared_ptr<const Strategy>, so a template is immutable once it
//         leaves the catalog and can be shared by any number of positions and
//         threads without copying.
//
// @details
// publish() validates the template and stores it as the next version under
// its id (the version field of the argument is ignored and assigned here).
// find(id) returns the latest version; find(id, version) returns the exact
// version a position was opened with. Old versions are never removed, so a
// position's pinned template stays resolvable for its whole life.
//
// Thread model:
//   Writes (publish) normally happen once at start-up from the config
//   loader. Reads happen on every tick from every worker. A shared_mutex
//   protects the index; the Strategy objects themselves need no locking.
// -----------------------------------------------------------------------------
class StrategyCatalog {
 public:
  using StrategyPtr = std::shared_ptr<const domain::Strategy>;

  StrategyCatalog() = default;

  StrategyCatalog(const StrategyCatalog&) = delete;
  StrategyCatalog& operator=(const StrategyCatalog&) = delete;

  // -------------------------------------------------------------------------
  // publish(strategy)
  // -------------------------------------------------------------------------
  // @brief  Validates and stores a new version of a strategy.
  //
  // @return The published template (with its assigned version), or
  //         std::nullopt if validation failed. The reason is logged to
  //         std::cerr and written to *error when provided.
  // -------------------------------------------------------------------------
  std::optional<StrategyPtr> publish(domain::Strategy strategy,
                                     std::string* error = nullptr);

  StrategyPtr find(const domain::StrategyId& id) const;
  StrategyPtr find(const domain::StrategyId& id, std::uint32_t version) const;

  // Latest version of every strategy, ordered by id.
  std::vector<StrategyPtr> list() const;

  std::size_t size() const;

 private:
  mutable std::shared_mutex mutex_;
  std::unordered_map<domain::StrategyId, std::vector<StrategyPtr>> versions_;
};

}  // namespace cppi
