#pragma once
/** @file  CountLedger.hpp
 *  @brief Append-only record of submitted counts; source of truth for variance and totals.
 *
 *  © 2026 Stocktake Engine — MIT-licensed.
 */

// STL headers
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

// Stocktake headers
#include "core/Clock.hpp"
#include "core/LockManager.hpp"
#include "core/SessionStore.hpp"
#include "core/Types.hpp"

namespace stocktake {
  namespace core {

    /// Point-in-time copy of one session's ledger, taken under a single lock.
    struct LedgerView {
      std::map<ItemId, CountEntry> latest; ///< newest entry per item
      std::vector<CountEntry> recent;      ///< newest first, bounded
      std::size_t totalEntries{ 0 };
    };

    /**
 * @class CountLedger
 * @brief Lock-checked, persisted appends; nothing is ever rewritten.
 *
 *  * `record()` runs inside LockManager::consume(): ownership check, store
 *    append, in-memory append and lock release form one critical section per item.
 *  * A failed store append leaves both the ledger and the lock untouched.
 */
    class CountLedger {
    public:
      CountLedger(LockManager& locks, SessionStore& store, std::shared_ptr<const Clock> clock);
      ~CountLedger() = default;

      /// Registers the session's baselines, optionally replaying persisted history.
      void track(const SessionId& session, const std::vector<AssignedItem>& items,
                 std::vector<CountEntry> history = {});
      void forget(const SessionId& session);

      /// An empty \p shelfLocation records the item's assigned shelf.
      CountEntry record(const SessionId& session, const ItemId& item, const CounterId& counter,
                        Quantity quantity, const std::string& shelfLocation = {},
                        const std::string& notes = {});

      LedgerView view(const SessionId& session, std::size_t recentLimit) const;
      std::vector<CountEntry> history(const SessionId& session) const;

    private:
      struct Book {
        std::unordered_map<ItemId, Quantity> baselines; ///< immutable after track()
        std::unordered_map<ItemId, std::string> shelves; ///< immutable after track()
        mutable std::mutex mtx;
        std::vector<CountEntry> entries;
        std::unordered_map<ItemId, std::size_t> latest; ///< item -> index into entries
        std::uint64_t nextSequence{ 1 };
      };

      std::shared_ptr<Book> bookFor(const SessionId& session) const;

      LockManager& locks_;
      SessionStore& store_;
      std::shared_ptr<const Clock> clock_;

      mutable std::shared_mutex booksMtx_;
      std::unordered_map<SessionId, std::shared_ptr<Book>> books_;
    };

  } // namespace core
} // namespace stocktake
