#pragma once
/** @file  ProgressAggregator.hpp
 *  @brief Derives Progress Snapshots; pure read path, never mutates.
 *
 *  © 2026 Stocktake Engine — MIT-licensed.
 */

// STL headers
#include <cstddef>
#include <vector>

// Stocktake headers
#include "core/CountLedger.hpp"
#include "core/Types.hpp"

namespace stocktake {
  namespace core {

    /**
 * @class ProgressAggregator
 * @brief Per-session and per-counter completeness from one LedgerView.
 *
 *  * A counter's assigned items: items on shelves mapped to it, plus items
 *    whose latest entry is theirs.
 *  * Breakdown lists allowed counters, shelf-map counters and every counter
 *    owning a latest entry, sorted by id.
 */
    class ProgressAggregator {
    public:
      explicit ProgressAggregator(std::size_t recentLimit = 20);

      std::size_t recentLimit() const { return recentLimit_; }

      ProgressSnapshot snapshot(const Session& session, const std::vector<AssignedItem>& items,
                                const LedgerView& ledger, std::size_t activeLocks) const;

      /// counted / total * 100, or 0 when total is 0.
      static double percentOf(std::size_t counted, std::size_t total);

    private:
      std::size_t recentLimit_;
    };

  } // namespace core
} // namespace stocktake
