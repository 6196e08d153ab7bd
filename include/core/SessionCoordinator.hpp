#pragma once

/** @file  SessionCoordinator.hpp
 *  @brief Public API for stocktake::core::SessionCoordinator.
 *
 *  © 2026 Stocktake Engine — MIT-licensed.
 */

// STL headers
#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <set>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

// Stocktake headers
#include "core/AccessPolicy.hpp"
#include "core/AuditLogger.hpp"
#include "core/Clock.hpp"
#include "core/CountLedger.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/ItemCatalog.hpp"
#include "core/LockManager.hpp"
#include "core/ProgressAggregator.hpp"
#include "core/SessionStore.hpp"
#include "core/Types.hpp"

namespace stocktake {
  namespace core {

    struct CoordinatorOptions {
      std::chrono::seconds lockTtl{ 300 };
      std::size_t recentCountLimit{ 20 };
    };

    /// Collaborators injected into the coordinator; only `audit` may be null.
    struct CoordinatorDeps {
      std::shared_ptr<SessionStore> store;
      std::shared_ptr<ItemCatalog> catalog;
      std::shared_ptr<AccessPolicy> policy;
      std::shared_ptr<ErrorMonitor> errorMonitor;
      std::shared_ptr<const Clock> clock;
      std::shared_ptr<AuditLogger> audit;
    };

    /**
 * @class SessionCoordinator
 * @brief Façade over the state machine, lock manager, ledger and aggregator.
 *
 *  * Each session has a lifecycle `shared_mutex`: transitions take it
 *    exclusively, lock/count/progress paths take it shared. A pause therefore
 *    waits for in-flight acquisitions, and later ones see PAUSED.
 *  * Within the shared section, items contend only on their own LockManager slot.
 *  * The registry lock is never held across a store write; session creation
 *    reserves its branch and code first, then persists.
 *  * Every failure is a `StockTakeError` with the failing component's kind;
 *    store faults are also reported to the ErrorMonitor.
 */
    class SessionCoordinator {

    public:
      SessionCoordinator(CoordinatorDeps deps, CoordinatorOptions options = {});
      ~SessionCoordinator() = default;

      SessionCoordinator(const SessionCoordinator&) = delete;
      SessionCoordinator& operator=(const SessionCoordinator&) = delete;

      /// Reload persisted sessions, items and counts. Locks start empty. Returns session count.
      std::size_t recover();

      // ---- lifecycle ----------------------------------------------------------
      Session createSession(const CreateSessionRequest& request);
      Session startSession(const SessionId& id, const std::string& actor);
      Session pauseSession(const SessionId& id, const std::string& actor);
      Session resumeSession(const SessionId& id, const std::string& actor);
      Session completeSession(const SessionId& id, const std::string& actor, bool force = false);
      Session cancelSession(const SessionId& id, const std::string& actor);

      /// Adds \p counter to an ACTIVE multi-user session found by its code.
      Session joinSession(const std::string& code, const CounterId& counter);

      // ---- counting -----------------------------------------------------------
      Lock acquireLock(const SessionId& id, const ItemId& item, const CounterId& counter);
      void releaseLock(const SessionId& id, const ItemId& item, const CounterId& counter);
      CountEntry submitCount(const SessionId& id, const ItemId& item, const CounterId& counter,
                             Quantity quantity, const std::string& shelfLocation = {},
                             const std::string& notes = {});

      // ---- shelf verification ---------------------------------------------------
      ShelfVerification approveShelf(const SessionId& id, const std::string& shelf,
                                     const std::string& actor);
      ShelfVerification rejectShelf(const SessionId& id, const std::string& shelf,
                                    const std::string& actor, const std::string& reason);

      // ---- queries ------------------------------------------------------------
      ProgressSnapshot getProgress(const SessionId& id) const;
      Session getSession(const SessionId& id) const;
      Session getSessionByCode(const std::string& code) const;
      std::vector<Session> listSessions(const std::string& branch) const; ///< newest first; "" = all
      std::vector<AssignedItem> listItems(const SessionId& id) const;
      std::vector<Lock> listLocks(const SessionId& id) const;
      std::vector<CountEntry> listCounts(const SessionId& id) const;
      std::vector<CountEntry> listCounterCounts(const SessionId& id,
                                                const CounterId& counter) const; ///< newest first
      std::vector<ShelfSummary> listShelves(const SessionId& id) const;
      std::vector<CountEntry> listShelfCounts(const SessionId& id, const std::string& shelf) const;
      std::vector<Adjustment> varianceReport(const SessionId& id) const;

    private:
      struct SessionEntry {
        SessionEntry(std::string c, std::string b) : code(std::move(c)), branch(std::move(b)) {}

        const std::string code;   ///< readable without `mtx`
        const std::string branch; ///< readable without `mtx`
        std::atomic<bool> open{ true };

        mutable std::shared_mutex mtx; ///< lifecycle section
        Session session;
        std::vector<AssignedItem> items;
        std::vector<Adjustment> adjustments;

        mutable std::mutex verdictMtx;
        std::vector<ShelfVerification> verifications; ///< guarded by verdictMtx, oldest first
      };

      std::shared_ptr<SessionEntry> find(const SessionId& id) const;
      std::shared_ptr<SessionEntry> findByCode(const std::string& code) const;
      ShelfVerification verifyShelf(const SessionId& id, const std::string& shelf,
                                    const std::string& actor, VerificationStatus status,
                                    const std::string& reason);
      void requireManager(const Session& session, const std::string& actor) const;
      void validate(const CreateSessionRequest& request) const;
      void persist(const SessionWrite& write);
      void audit(const char* event, const Session& session, const std::string& actor,
                 const ItemId& item = {}, const std::string& detail = {});

      template <typename Fn> auto reportingStorage(Fn&& fn) -> decltype(fn());

      CoordinatorDeps deps_;
      LockManager locks_;
      CountLedger ledger_;
      ProgressAggregator aggregator_;

      mutable std::shared_mutex registryMtx_;
      std::unordered_map<SessionId, std::shared_ptr<SessionEntry>> sessions_;
      std::set<std::string> pendingBranches_; ///< creations between reservation and persist
      std::set<std::string> pendingCodes_;
    };

  } // namespace core
} // namespace stocktake
