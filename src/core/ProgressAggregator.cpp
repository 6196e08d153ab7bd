/* @file ProgressAggregator.cpp
 * @brief progress snapshot derivation
 *
 * © 2026 Stocktake Engine — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <map>
#include <set>
#include <stdexcept>

// Stocktake headers
#include "core/ProgressAggregator.hpp"

using namespace stocktake::core;

ProgressAggregator::ProgressAggregator(std::size_t recentLimit) : recentLimit_(recentLimit) {
  if (recentLimit_ == 0)
    throw std::invalid_argument("[ProgressAggregator] recent count limit must be positive");
}

double ProgressAggregator::percentOf(std::size_t counted, std::size_t total) {
  if (total == 0)
    return 0.0;
  return static_cast<double>(counted) * 100.0 / static_cast<double>(total);
}

ProgressSnapshot ProgressAggregator::snapshot(const Session& session,
                                              const std::vector<AssignedItem>& items,
                                              const LedgerView& ledger,
                                              std::size_t activeLocks) const {
  ProgressSnapshot out;
  out.sessionId = session.id;
  out.sessionCode = session.code;
  out.state = session.state;
  out.totalItems = items.size();
  out.activeLocks = activeLocks;

  // counter -> items it is responsible for
  std::map<CounterId, std::set<ItemId>> assigned;
  for (const auto& c : session.allowedCounters)
    assigned[c];
  for (const auto& [shelf, counter] : session.shelfAssignments)
    assigned[counter];

  for (const auto& item : items) {
    const bool counted = ledger.latest.count(item.itemId) != 0;
    if (counted)
      ++out.totalCounted;

    auto shelf = session.shelfAssignments.find(item.shelf);
    if (!item.shelf.empty() && shelf != session.shelfAssignments.end())
      assigned[shelf->second].insert(item.itemId);
  }

  for (const auto& [item, entry] : ledger.latest)
    assigned[entry.counter].insert(item);

  out.missingItems = out.totalItems - out.totalCounted;
  out.percentComplete = percentOf(out.totalCounted, out.totalItems);

  out.counters.reserve(assigned.size());
  for (const auto& [counter, itemSet] : assigned) {
    CounterProgress cp;
    cp.counter = counter;
    cp.itemsAssigned = itemSet.size();
    for (const auto& item : itemSet) {
      if (ledger.latest.count(item) != 0)
        ++cp.itemsCounted;
    }
    cp.percent = percentOf(cp.itemsCounted, cp.itemsAssigned);
    out.counters.push_back(std::move(cp));
  }

  out.recentCounts.assign(ledger.recent.begin(),
                          ledger.recent.begin() +
                              static_cast<std::ptrdiff_t>(std::min(recentLimit_, ledger.recent.size())));
  return out;
}
