/* @file SqliteSessionStore.cpp
 * @brief SQLite persistence for sessions, assigned items, counts, adjustments and shelf verdicts
 *
 * © 2026 Stocktake Engine — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

// 3rd-party headers
#include <nlohmann/json.hpp>
#include <sqlite3.h>

// Stocktake headers
#include "core/Errors.hpp"
#include "storage/SqliteSessionStore.hpp"

using namespace stocktake::storage;
using stocktake::core::AssignedItem;
using stocktake::core::Adjustment;
using stocktake::core::CountEntry;
using stocktake::core::ErrorKind;
using stocktake::core::Session;
using stocktake::core::SessionId;
using stocktake::core::SessionState;
using stocktake::core::ShelfVerification;
using stocktake::core::StockTakeError;

namespace {

  constexpr const char* kSchema = R"sql(
    CREATE TABLE IF NOT EXISTS sessions (
      id                TEXT PRIMARY KEY,
      code              TEXT NOT NULL UNIQUE,
      branch            TEXT NOT NULL,
      created_by        TEXT NOT NULL,
      is_multi_user     INTEGER NOT NULL,
      allowed_counters  TEXT NOT NULL,
      shelf_assignments TEXT NOT NULL,
      notes             TEXT NOT NULL,
      state             TEXT NOT NULL,
      created_at        INTEGER NOT NULL,
      updated_at        INTEGER NOT NULL,
      started_at        INTEGER,
      paused_at         INTEGER,
      completed_at      INTEGER,
      cancelled_at      INTEGER,
      completed_by      TEXT NOT NULL,
      forced            INTEGER NOT NULL
    );
    CREATE TABLE IF NOT EXISTS assigned_items (
      session_id TEXT NOT NULL REFERENCES sessions(id),
      item_id    TEXT NOT NULL,
      shelf      TEXT NOT NULL,
      baseline   INTEGER NOT NULL,
      PRIMARY KEY (session_id, item_id)
    );
    CREATE TABLE IF NOT EXISTS count_entries (
      session_id       TEXT NOT NULL REFERENCES sessions(id),
      sequence         INTEGER NOT NULL,
      item_id          TEXT NOT NULL,
      counter          TEXT NOT NULL,
      counted_quantity INTEGER NOT NULL,
      baseline         INTEGER NOT NULL,
      variance         INTEGER NOT NULL,
      shelf_location   TEXT NOT NULL,
      notes            TEXT NOT NULL,
      counted_at       INTEGER NOT NULL,
      PRIMARY KEY (session_id, sequence)
    );
    CREATE TABLE IF NOT EXISTS adjustments (
      session_id TEXT NOT NULL REFERENCES sessions(id),
      item_id    TEXT NOT NULL,
      baseline   INTEGER NOT NULL,
      counted    INTEGER NOT NULL,
      adjustment INTEGER NOT NULL,
      zeroed_out INTEGER NOT NULL,
      PRIMARY KEY (session_id, item_id)
    );
    CREATE TABLE IF NOT EXISTS shelf_verifications (
      session_id       TEXT NOT NULL REFERENCES sessions(id),
      shelf            TEXT NOT NULL,
      status           TEXT NOT NULL,
      verified_by      TEXT NOT NULL,
      verified_at      INTEGER NOT NULL,
      reason           TEXT NOT NULL,
      through_sequence INTEGER NOT NULL,
      counts_covered   INTEGER NOT NULL
    );
    CREATE INDEX IF NOT EXISTS sessions_by_branch ON sessions(branch);
    CREATE INDEX IF NOT EXISTS verifications_by_session ON shelf_verifications(session_id);
  )sql";

  [[noreturn]] void fail(sqlite3* db, const std::string& what) {
    throw StockTakeError(ErrorKind::Storage,
                         "[SqliteSessionStore] " + what + ": " + sqlite3_errmsg(db));
  }

  /// RAII prepared statement.
  class Statement {
  public:
    Statement(sqlite3* db, const char* sql) : db_(db) {
      if (sqlite3_prepare_v2(db_, sql, -1, &stmt_, nullptr) != SQLITE_OK)
        fail(db_, "prepare");
    }
    ~Statement() { sqlite3_finalize(stmt_); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    Statement& bind(int idx, const std::string& v) {
      check(sqlite3_bind_text(stmt_, idx, v.c_str(), static_cast<int>(v.size()), SQLITE_TRANSIENT));
      return *this;
    }
    Statement& bind(int idx, std::int64_t v) {
      check(sqlite3_bind_int64(stmt_, idx, v));
      return *this;
    }
    Statement& bind(int idx, const std::optional<stocktake::core::TimePoint>& t) {
      check(t ? sqlite3_bind_int64(stmt_, idx, stocktake::core::toMillis(*t))
              : sqlite3_bind_null(stmt_, idx));
      return *this;
    }

    /// @returns true while a row is available.
    bool step() {
      const int rc = sqlite3_step(stmt_);
      if (rc == SQLITE_ROW)
        return true;
      if (rc == SQLITE_DONE)
        return false;
      fail(db_, "step");
    }

    void run() {
      if (step())
        fail(db_, "unexpected row");
    }

    std::string text(int col) const {
      const auto* p = sqlite3_column_text(stmt_, col);
      return p ? reinterpret_cast<const char*>(p) : std::string{};
    }
    std::int64_t integer(int col) const { return sqlite3_column_int64(stmt_, col); }
    std::optional<stocktake::core::TimePoint> time(int col) const {
      if (sqlite3_column_type(stmt_, col) == SQLITE_NULL)
        return std::nullopt;
      return stocktake::core::fromMillis(integer(col));
    }

  private:
    void check(int rc) {
      if (rc != SQLITE_OK)
        fail(db_, "bind");
    }

    sqlite3* db_;
    sqlite3_stmt* stmt_{ nullptr };
  };

  /// BEGIN IMMEDIATE on construction, ROLLBACK unless commit() ran.
  class Transaction {
  public:
    explicit Transaction(sqlite3* db) : db_(db) {
      if (sqlite3_exec(db_, "BEGIN IMMEDIATE", nullptr, nullptr, nullptr) != SQLITE_OK)
        fail(db_, "begin");
    }
    ~Transaction() {
      if (!committed_)
        sqlite3_exec(db_, "ROLLBACK", nullptr, nullptr, nullptr);
    }
    void commit() {
      if (sqlite3_exec(db_, "COMMIT", nullptr, nullptr, nullptr) != SQLITE_OK)
        fail(db_, "commit");
      committed_ = true;
    }

  private:
    sqlite3* db_;
    bool committed_{ false };
  };

  Session readSession(const Statement& st) {
    Session s;
    s.id = st.text(0);
    s.code = st.text(1);
    s.branch = st.text(2);
    s.createdBy = st.text(3);
    s.isMultiUser = st.integer(4) != 0;
    s.allowedCounters = nlohmann::json::parse(st.text(5)).get<std::vector<std::string>>();
    s.shelfAssignments =
        nlohmann::json::parse(st.text(6)).get<std::map<std::string, std::string>>();
    s.notes = st.text(7);
    auto state = stocktake::core::sessionStateFromString(st.text(8));
    if (!state)
      throw StockTakeError(ErrorKind::Storage,
                           "[SqliteSessionStore] session " + s.id + " has unknown state " +
                               st.text(8));
    s.state = *state;
    s.createdAt = stocktake::core::fromMillis(st.integer(9));
    s.updatedAt = stocktake::core::fromMillis(st.integer(10));
    s.startedAt = st.time(11);
    s.pausedAt = st.time(12);
    s.completedAt = st.time(13);
    s.cancelledAt = st.time(14);
    s.completedBy = st.text(15);
    s.forced = st.integer(16) != 0;
    return s;
  }

} // namespace

SqliteSessionStore::SqliteSessionStore(const std::string& path) : path_(path) {
  const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
  if (sqlite3_open_v2(path_.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
    std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
    sqlite3_close(db_);
    db_ = nullptr;
    throw StockTakeError(ErrorKind::Storage,
                         "[SqliteSessionStore] cannot open " + path_ + ": " + msg);
  }
  sqlite3_busy_timeout(db_, 5000);
  exec("PRAGMA journal_mode=WAL;");
  exec("PRAGMA foreign_keys=ON;");
  exec(kSchema);
}

SqliteSessionStore::~SqliteSessionStore() { sqlite3_close(db_); }

void SqliteSessionStore::exec(const char* sql) const {
  char* err = nullptr;
  if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
    std::string msg = err ? err : "unknown error";
    sqlite3_free(err);
    throw StockTakeError(ErrorKind::Storage, "[SqliteSessionStore] " + msg);
  }
}

void SqliteSessionStore::write(const core::SessionWrite& w) {
  std::lock_guard<std::mutex> lock(mtx_);
  Transaction tx(db_);

  const Session& s = w.session;
  Statement upsert(db_, R"sql(
    INSERT INTO sessions (id, code, branch, created_by, is_multi_user, allowed_counters,
                          shelf_assignments, notes, state, created_at, updated_at, started_at,
                          paused_at, completed_at, cancelled_at, completed_by, forced)
    VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10, ?11, ?12, ?13, ?14, ?15, ?16, ?17)
    ON CONFLICT(id) DO UPDATE SET
      allowed_counters = excluded.allowed_counters,
      state = excluded.state, updated_at = excluded.updated_at,
      started_at = excluded.started_at, paused_at = excluded.paused_at,
      completed_at = excluded.completed_at, cancelled_at = excluded.cancelled_at,
      completed_by = excluded.completed_by, forced = excluded.forced
  )sql");
  upsert.bind(1, s.id)
      .bind(2, s.code)
      .bind(3, s.branch)
      .bind(4, s.createdBy)
      .bind(5, std::int64_t{ s.isMultiUser ? 1 : 0 })
      .bind(6, nlohmann::json(s.allowedCounters).dump())
      .bind(7, nlohmann::json(s.shelfAssignments).dump())
      .bind(8, s.notes)
      .bind(9, std::string(core::toString(s.state)))
      .bind(10, core::toMillis(s.createdAt))
      .bind(11, core::toMillis(s.updatedAt))
      .bind(12, s.startedAt)
      .bind(13, s.pausedAt)
      .bind(14, s.completedAt)
      .bind(15, s.cancelledAt)
      .bind(16, s.completedBy)
      .bind(17, std::int64_t{ s.forced ? 1 : 0 });
  upsert.run();

  if (w.items) {
    Statement clear(db_, "DELETE FROM assigned_items WHERE session_id = ?1");
    clear.bind(1, s.id).run();
    for (const auto& it : *w.items) {
      Statement ins(db_, "INSERT INTO assigned_items (session_id, item_id, shelf, baseline) "
                         "VALUES (?1, ?2, ?3, ?4)");
      ins.bind(1, s.id).bind(2, it.itemId).bind(3, it.shelf).bind(4, it.baseline).run();
    }
  }

  for (const auto& a : w.adjustments) {
    Statement ins(db_, "INSERT INTO adjustments (session_id, item_id, baseline, counted, "
                       "adjustment, zeroed_out) VALUES (?1, ?2, ?3, ?4, ?5, ?6)");
    ins.bind(1, s.id)
        .bind(2, a.itemId)
        .bind(3, a.baseline)
        .bind(4, a.counted)
        .bind(5, a.adjustment)
        .bind(6, std::int64_t{ a.zeroedOut ? 1 : 0 })
        .run();
  }

  tx.commit();
}

void SqliteSessionStore::appendCount(const CountEntry& e) {
  std::lock_guard<std::mutex> lock(mtx_);
  Statement ins(db_, R"sql(
    INSERT INTO count_entries (session_id, sequence, item_id, counter, counted_quantity,
                               baseline, variance, shelf_location, notes, counted_at)
    VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10)
  )sql");
  ins.bind(1, e.sessionId)
      .bind(2, static_cast<std::int64_t>(e.sequence))
      .bind(3, e.itemId)
      .bind(4, e.counter)
      .bind(5, e.countedQuantity)
      .bind(6, e.baseline)
      .bind(7, e.variance)
      .bind(8, e.shelfLocation)
      .bind(9, e.notes)
      .bind(10, core::toMillis(e.countedAt))
      .run();
}

void SqliteSessionStore::appendVerification(const ShelfVerification& v) {
  std::lock_guard<std::mutex> lock(mtx_);
  Statement ins(db_, R"sql(
    INSERT INTO shelf_verifications (session_id, shelf, status, verified_by, verified_at,
                                     reason, through_sequence, counts_covered)
    VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8)
  )sql");
  ins.bind(1, v.sessionId)
      .bind(2, v.shelf)
      .bind(3, std::string(core::toString(v.status)))
      .bind(4, v.verifiedBy)
      .bind(5, core::toMillis(v.verifiedAt))
      .bind(6, v.reason)
      .bind(7, static_cast<std::int64_t>(v.throughSequence))
      .bind(8, static_cast<std::int64_t>(v.countsCovered))
      .run();
}

std::vector<Session> SqliteSessionStore::loadSessions() const {
  std::lock_guard<std::mutex> lock(mtx_);
  Statement q(db_, "SELECT id, code, branch, created_by, is_multi_user, allowed_counters, "
                   "shelf_assignments, notes, state, created_at, updated_at, started_at, "
                   "paused_at, completed_at, cancelled_at, completed_by, forced "
                   "FROM sessions ORDER BY created_at");
  std::vector<Session> out;
  while (q.step()) {
    try {
      out.push_back(readSession(q));
    } catch (const nlohmann::json::exception& e) {
      throw StockTakeError(ErrorKind::Storage,
                           std::string("[SqliteSessionStore] corrupt session row: ") + e.what());
    }
  }
  return out;
}

std::vector<AssignedItem> SqliteSessionStore::loadItems(const SessionId& session) const {
  std::lock_guard<std::mutex> lock(mtx_);
  Statement q(db_, "SELECT item_id, shelf, baseline FROM assigned_items "
                   "WHERE session_id = ?1 ORDER BY item_id");
  q.bind(1, session);
  std::vector<AssignedItem> out;
  while (q.step())
    out.push_back(AssignedItem{ session, q.text(0), q.text(1), q.integer(2) });
  return out;
}

std::vector<CountEntry> SqliteSessionStore::loadCounts(const SessionId& session) const {
  std::lock_guard<std::mutex> lock(mtx_);
  Statement q(db_, "SELECT sequence, item_id, counter, counted_quantity, baseline, variance, "
                   "shelf_location, notes, counted_at FROM count_entries "
                   "WHERE session_id = ?1 ORDER BY sequence");
  q.bind(1, session);
  std::vector<CountEntry> out;
  while (q.step()) {
    CountEntry e;
    e.sessionId = session;
    e.sequence = static_cast<std::uint64_t>(q.integer(0));
    e.itemId = q.text(1);
    e.counter = q.text(2);
    e.countedQuantity = q.integer(3);
    e.baseline = q.integer(4);
    e.variance = q.integer(5);
    e.shelfLocation = q.text(6);
    e.notes = q.text(7);
    e.countedAt = core::fromMillis(q.integer(8));
    out.push_back(std::move(e));
  }
  return out;
}

std::vector<Adjustment> SqliteSessionStore::loadAdjustments(const SessionId& session) const {
  std::lock_guard<std::mutex> lock(mtx_);
  Statement q(db_, "SELECT item_id, baseline, counted, adjustment, zeroed_out FROM adjustments "
                   "WHERE session_id = ?1 ORDER BY item_id");
  q.bind(1, session);
  std::vector<Adjustment> out;
  while (q.step())
    out.push_back(Adjustment{ session, q.text(0), q.integer(1), q.integer(2), q.integer(3),
                              q.integer(4) != 0 });
  return out;
}

std::vector<ShelfVerification>
SqliteSessionStore::loadVerifications(const SessionId& session) const {
  std::lock_guard<std::mutex> lock(mtx_);
  Statement q(db_, "SELECT shelf, status, verified_by, verified_at, reason, through_sequence, "
                   "counts_covered FROM shelf_verifications WHERE session_id = ?1 ORDER BY rowid");
  q.bind(1, session);
  std::vector<ShelfVerification> out;
  while (q.step()) {
    auto status = core::verificationStatusFromString(q.text(1));
    if (!status)
      throw StockTakeError(ErrorKind::Storage, "[SqliteSessionStore] shelf " + q.text(0) +
                                                   " has unknown verification status " +
                                                   q.text(1));
    ShelfVerification v;
    v.sessionId = session;
    v.shelf = q.text(0);
    v.status = *status;
    v.verifiedBy = q.text(2);
    v.verifiedAt = core::fromMillis(q.integer(3));
    v.reason = q.text(4);
    v.throughSequence = static_cast<std::uint64_t>(q.integer(5));
    v.countsCovered = static_cast<std::size_t>(q.integer(6));
    out.push_back(std::move(v));
  }
  return out;
}
