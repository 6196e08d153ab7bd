#pragma once
/** @file  SessionStore.hpp
 *  @brief Repository interface for durable session state (sessions, items, counts, verdicts).
 *
 *  © 2026 Stocktake Engine — MIT-licensed.
 */

// STL headers
#include <map>
#include <mutex>
#include <optional>
#include <vector>

// Stocktake headers
#include "core/Types.hpp"

namespace stocktake {
  namespace core {

    /// One atomic write: the session row plus whatever changed with it.
    struct SessionWrite {
      Session session;
      std::optional<std::vector<AssignedItem>> items; ///< replaces the item set when present
      std::vector<Adjustment> adjustments;            ///< inserted when non-empty
    };

    /**
 * @class SessionStore
 * @brief Everything that must survive a restart. Locks are never persisted.
 *
 *  * Implementations throw `StockTakeError(Storage)` on failure and must leave
 *    no partial write behind.
 *  * Count entries are append-only; there is no update or delete.
 */
    class SessionStore {
    public:
      virtual ~SessionStore() = default;

      virtual void write(const SessionWrite& w) = 0;
      virtual void appendCount(const CountEntry& entry) = 0;
      virtual void appendVerification(const ShelfVerification& verdict) = 0;

      virtual std::vector<Session> loadSessions() const = 0;
      virtual std::vector<AssignedItem> loadItems(const SessionId& session) const = 0;
      virtual std::vector<CountEntry> loadCounts(const SessionId& session) const = 0;
      virtual std::vector<Adjustment> loadAdjustments(const SessionId& session) const = 0;
      /// Oldest first.
      virtual std::vector<ShelfVerification> loadVerifications(const SessionId& session) const = 0;
    };

    /**
 * @class InMemorySessionStore
 * @brief Volatile store for tests and `database_path: ""` runs.
 */
    class InMemorySessionStore : public SessionStore {
    public:
      void write(const SessionWrite& w) override;
      void appendCount(const CountEntry& entry) override;
      void appendVerification(const ShelfVerification& verdict) override;

      std::vector<Session> loadSessions() const override;
      std::vector<AssignedItem> loadItems(const SessionId& session) const override;
      std::vector<CountEntry> loadCounts(const SessionId& session) const override;
      std::vector<Adjustment> loadAdjustments(const SessionId& session) const override;
      std::vector<ShelfVerification> loadVerifications(const SessionId& session) const override;

    private:
      mutable std::mutex mtx_;
      std::map<SessionId, Session> sessions_;
      std::map<SessionId, std::vector<AssignedItem>> items_;
      std::map<SessionId, std::vector<CountEntry>> counts_;
      std::map<SessionId, std::vector<Adjustment>> adjustments_;
      std::map<SessionId, std::vector<ShelfVerification>> verifications_;
    };

  } // namespace core
} // namespace stocktake
