// Stocktake-Prod headers
#include "core/Errors.hpp"
#include "storage/SqliteSessionStore.hpp"

// STL headers
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

// GTest headers
#include <gtest/gtest.h>

namespace stocktake::test {

  using core::ErrorKind;
  using core::StockTakeError;
  using storage::SqliteSessionStore;

  namespace {

    core::Session sampleSession() {
      core::Session s;
      s.id = "6f1c2a9e-0b7d-4c1e-9a55-3f2b8d7e4a10";
      s.code = "ST-MAR25A";
      s.branch = "BR-001";
      s.createdBy = "mgr";
      s.isMultiUser = true;
      s.allowedCounters = { "A", "B" };
      s.shelfAssignments = { { "A1", "A" }, { "B2", "B" } };
      s.notes = "quarter end, \"cold room\" included";
      s.state = core::SessionState::Draft;
      s.createdAt = core::fromMillis(1'740'787'200'000);
      s.updatedAt = s.createdAt;
      return s;
    }

    core::CountEntry sampleEntry(const core::Session& s, std::uint64_t seq) {
      core::CountEntry e;
      e.sessionId = s.id;
      e.sequence = seq;
      e.itemId = "item1";
      e.counter = "A";
      e.countedQuantity = 8;
      e.baseline = 10;
      e.variance = -2;
      e.shelfLocation = "A1";
      e.countedAt = core::fromMillis(1'740'787'260'000);
      return e;
    }

  } // namespace

  TEST(sqlite_store, session_row_survives_round_trip) {
    SqliteSessionStore store(":memory:");
    auto s = sampleSession();
    std::vector<core::AssignedItem> items{ { s.id, "item1", "A1", 10 }, { s.id, "item2", "B2", 0 } };
    store.write(core::SessionWrite{ s, items, {} });

    s.state = core::SessionState::Active;
    s.startedAt = core::fromMillis(1'740'787'230'000);
    store.write(core::SessionWrite{ s, std::nullopt, {} });

    const auto loaded = store.loadSessions();
    ASSERT_EQ(loaded.size(), 1u);
    EXPECT_EQ(loaded[0].state, core::SessionState::Active);
    EXPECT_EQ(loaded[0].startedAt, s.startedAt);
    EXPECT_FALSE(loaded[0].pausedAt);
    EXPECT_EQ(loaded[0].allowedCounters, s.allowedCounters);
    EXPECT_EQ(loaded[0].shelfAssignments, s.shelfAssignments);
    EXPECT_EQ(loaded[0].notes, s.notes);

    // items untouched by a write without an item set
    EXPECT_EQ(store.loadItems(s.id).size(), 2u);
  }

  TEST(sqlite_store, counts_come_back_in_sequence_order) {
    SqliteSessionStore store(":memory:");
    const auto s = sampleSession();
    store.write(core::SessionWrite{ s, std::nullopt, {} });
    store.appendCount(sampleEntry(s, 2));
    store.appendCount(sampleEntry(s, 1));

    const auto counts = store.loadCounts(s.id);
    ASSERT_EQ(counts.size(), 2u);
    EXPECT_EQ(counts[0].sequence, 1u);
    EXPECT_EQ(counts[0].variance, -2);
    EXPECT_EQ(counts[0].countedAt, core::fromMillis(1'740'787'260'000));
  }

  TEST(sqlite_store, duplicate_sequence_is_a_storage_error) {
    SqliteSessionStore store(":memory:");
    const auto s = sampleSession();
    store.write(core::SessionWrite{ s, std::nullopt, {} });
    store.appendCount(sampleEntry(s, 1));

    try {
      store.appendCount(sampleEntry(s, 1));
      FAIL() << "duplicate append accepted";
    } catch (const StockTakeError& e) {
      EXPECT_EQ(e.kind(), ErrorKind::Storage);
    }
    EXPECT_EQ(store.loadCounts(s.id).size(), 1u);
  }

  TEST(sqlite_store, count_for_unknown_session_is_refused) {
    SqliteSessionStore store(":memory:");
    EXPECT_THROW(store.appendCount(sampleEntry(sampleSession(), 1)), StockTakeError);
  }

  TEST(sqlite_store, failed_write_leaves_nothing_behind) {
    SqliteSessionStore store(":memory:");
    auto s = sampleSession();
    store.write(core::SessionWrite{ s, std::nullopt, {} });

    s.state = core::SessionState::Completed;
    std::vector<core::Adjustment> dup{ { s.id, "item1", 10, 8, -2, false },
                                       { s.id, "item1", 10, 8, -2, false } };
    EXPECT_THROW(store.write(core::SessionWrite{ s, std::nullopt, dup }), StockTakeError);

    EXPECT_EQ(store.loadSessions()[0].state, core::SessionState::Draft);
    EXPECT_TRUE(store.loadAdjustments(s.id).empty());
  }

  TEST(sqlite_store, data_persists_across_reopen) {
    const auto path = std::filesystem::temp_directory_path() / "stocktake_storage_test.db";
    std::filesystem::remove(path);

    const auto s = sampleSession();
    {
      SqliteSessionStore store(path.string());
      store.write(core::SessionWrite{ s, std::vector<core::AssignedItem>{ { s.id, "item1", "A1", 10 } },
                                      { { s.id, "item1", 10, 8, -2, false } } });
      store.appendCount(sampleEntry(s, 1));
    }

    {
      SqliteSessionStore reopened(path.string());
      EXPECT_EQ(reopened.loadSessions().size(), 1u);
      EXPECT_EQ(reopened.loadItems(s.id).front().baseline, 10);
      EXPECT_EQ(reopened.loadCounts(s.id).size(), 1u);
      EXPECT_EQ(reopened.loadAdjustments(s.id).front().adjustment, -2);
    }

    std::filesystem::remove(path);
    std::filesystem::remove(path.string() + "-wal");
    std::filesystem::remove(path.string() + "-shm");
  }

  TEST(sqlite_store, joined_counter_is_written_back) {
    SqliteSessionStore store(":memory:");
    auto s = sampleSession();
    store.write(core::SessionWrite{ s, std::nullopt, {} });

    s.allowedCounters.push_back("C");
    store.write(core::SessionWrite{ s, std::nullopt, {} });
    EXPECT_EQ(store.loadSessions()[0].allowedCounters,
              (std::vector<core::CounterId>{ "A", "B", "C" }));
  }

  TEST(sqlite_store, shelf_verdicts_keep_append_order) {
    SqliteSessionStore store(":memory:");
    const auto s = sampleSession();
    store.write(core::SessionWrite{ s, std::nullopt, {} });

    core::ShelfVerification v;
    v.sessionId = s.id;
    v.shelf = "A1";
    v.status = core::VerificationStatus::Rejected;
    v.verifiedBy = "mgr";
    v.verifiedAt = core::fromMillis(1'740'787'300'000);
    v.reason = "recount the top row";
    v.throughSequence = 4;
    v.countsCovered = 3;
    store.appendVerification(v);
    v.status = core::VerificationStatus::Approved;
    v.reason.clear();
    v.throughSequence = 6;
    store.appendVerification(v);

    const auto loaded = store.loadVerifications(s.id);
    ASSERT_EQ(loaded.size(), 2u);
    EXPECT_EQ(loaded[0].status, core::VerificationStatus::Rejected);
    EXPECT_EQ(loaded[0].reason, "recount the top row");
    EXPECT_EQ(loaded[0].verifiedAt, core::fromMillis(1'740'787'300'000));
    EXPECT_EQ(loaded[1].status, core::VerificationStatus::Approved);
    EXPECT_EQ(loaded[1].throughSequence, 6u);
    EXPECT_EQ(loaded[1].countsCovered, 3u);

    v.sessionId = "no-such-session";
    EXPECT_THROW(store.appendVerification(v), StockTakeError);
  }

  TEST(sqlite_store, unopenable_path_is_a_storage_error) {
    EXPECT_THROW(SqliteSessionStore("/nonexistent-dir/for/sure/stocktake.db"), StockTakeError);
  }

} // namespace stocktake::test
