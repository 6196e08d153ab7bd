#pragma once
/** @file  SqliteSessionStore.hpp
 *  @brief Durable SessionStore on a single SQLite database file.
 *
 *  © 2026 Stocktake Engine — MIT-licensed.
 */

#include <mutex>
#include <string>
#include <vector>

#include "core/SessionStore.hpp"

struct sqlite3;

namespace stocktake {
  namespace storage {

    /**
 * @class SqliteSessionStore
 * @brief Tables `sessions`, `assigned_items`, `count_entries`, `adjustments`,
 *        `shelf_verifications`.
 *
 *  * One connection guarded by a mutex; every multi-row write runs in a transaction.
 *  * Lists and maps on the session row are stored as JSON text.
 *  * Any SQLite failure surfaces as `StockTakeError(Storage)`.
 *  * Non-copyable (owns the connection).
 */
    class SqliteSessionStore : public core::SessionStore {
    public:
      /// Opens or creates \p path (":memory:" works) and applies the schema.
      explicit SqliteSessionStore(const std::string& path);
      ~SqliteSessionStore() override;

      void write(const core::SessionWrite& w) override;
      void appendCount(const core::CountEntry& entry) override;
      void appendVerification(const core::ShelfVerification& verdict) override;

      std::vector<core::Session> loadSessions() const override;
      std::vector<core::AssignedItem> loadItems(const core::SessionId& session) const override;
      std::vector<core::CountEntry> loadCounts(const core::SessionId& session) const override;
      std::vector<core::Adjustment> loadAdjustments(const core::SessionId& session) const override;
      std::vector<core::ShelfVerification>
      loadVerifications(const core::SessionId& session) const override;

      SqliteSessionStore(const SqliteSessionStore&) = delete;
      SqliteSessionStore& operator=(const SqliteSessionStore&) = delete;

    private:
      void exec(const char* sql) const;

      std::string path_;
      sqlite3* db_{ nullptr };
      mutable std::mutex mtx_;
    };

  } // namespace storage
} // namespace stocktake
