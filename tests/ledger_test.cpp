// Stocktake-Prod headers
#include "core/CountLedger.hpp"
#include "core/Errors.hpp"
#include "core/LockManager.hpp"

// Stocktake-Fake headers
#include "fakes/FlakySessionStore.hpp"
#include "fakes/ManualClock.hpp"

// STL headers
#include <memory>

// GTest headers
#include <gtest/gtest.h>

namespace stocktake::test {

  using core::CountLedger;
  using core::ErrorKind;
  using core::LockManager;
  using core::StockTakeError;

  class CountLedgerTest : public ::testing::Test {
  protected:
    void SetUp() override {
      clock = std::make_shared<ManualClock>();
      locks = std::make_unique<LockManager>(clock, std::chrono::seconds{ 300 });
      ledger = std::make_unique<CountLedger>(*locks, store, clock);

      session.id = "s-1";
      session.code = "ST-MAR25A";
      session.state = core::SessionState::Active;
      store.write(core::SessionWrite{ session, std::nullopt, {} });

      items = { { "s-1", "X", "A1", 10 }, { "s-1", "Y", "A1", 5 }, { "s-1", "Z", "B2", 0 } };
      locks->track(session.id, { "X", "Y", "Z" });
      ledger->track(session.id, items);
    }

    ErrorKind recordFails(const core::ItemId& item, const core::CounterId& counter,
                          core::Quantity qty) {
      try {
        ledger->record(session.id, item, counter, qty);
      } catch (const StockTakeError& e) {
        return e.kind();
      }
      ADD_FAILURE() << "record of " << item << " succeeded";
      return ErrorKind::Storage;
    }

    std::shared_ptr<ManualClock> clock;
    FlakySessionStore store;
    std::unique_ptr<LockManager> locks;
    std::unique_ptr<CountLedger> ledger;
    core::Session session;
    std::vector<core::AssignedItem> items;
  };

  TEST_F(CountLedgerTest, record_without_lock_is_refused) {
    EXPECT_EQ(recordFails("X", "A", 8), ErrorKind::LockNotHeld);
    EXPECT_EQ(ledger->view(session.id, 10).totalEntries, 0u);
  }

  TEST_F(CountLedgerTest, record_by_non_holder_is_refused) {
    locks->acquire(session, "X", "A");
    EXPECT_EQ(recordFails("X", "B", 8), ErrorKind::LockNotHeld);
    EXPECT_EQ(locks->activeCount(session.id), 1u);
  }

  TEST_F(CountLedgerTest, record_fixes_variance_and_consumes_lock) {
    locks->acquire(session, "X", "A");
    const auto e = ledger->record(session.id, "X", "A", 8, "A1-top", "two damaged");

    EXPECT_EQ(e.baseline, 10);
    EXPECT_EQ(e.countedQuantity, 8);
    EXPECT_EQ(e.variance, -2);
    EXPECT_EQ(e.sequence, 1u);
    EXPECT_EQ(e.shelfLocation, "A1-top");
    EXPECT_EQ(e.countedAt, clock->now());
    EXPECT_EQ(locks->activeCount(session.id), 0u);
    EXPECT_EQ(store.loadCounts(session.id).size(), 1u);

    // lock was consumed: a second submission needs a new acquire
    EXPECT_EQ(recordFails("X", "A", 9), ErrorKind::LockNotHeld);
  }

  TEST_F(CountLedgerTest, record_without_shelf_uses_assigned_shelf) {
    locks->acquire(session, "Z", "A");
    EXPECT_EQ(ledger->record(session.id, "Z", "A", 1).shelfLocation, "B2");
  }

  TEST_F(CountLedgerTest, expired_lock_cannot_submit) {
    locks->acquire(session, "X", "A");
    clock->advance(std::chrono::seconds{ 300 });
    EXPECT_EQ(recordFails("X", "A", 8), ErrorKind::LockNotHeld);
  }

  TEST_F(CountLedgerTest, negative_quantity_is_invalid) {
    locks->acquire(session, "X", "A");
    EXPECT_EQ(recordFails("X", "A", -1), ErrorKind::ValidationError);
    EXPECT_EQ(locks->activeCount(session.id), 1u);
  }

  TEST_F(CountLedgerTest, unknown_item_is_not_assigned) {
    EXPECT_EQ(recordFails("W", "A", 1), ErrorKind::ItemNotAssigned);
  }

  TEST_F(CountLedgerTest, store_failure_keeps_lock_and_ledger) {
    locks->acquire(session, "X", "A");
    store.fail_appends = true;

    EXPECT_EQ(recordFails("X", "A", 8), ErrorKind::Storage);
    EXPECT_EQ(ledger->view(session.id, 10).totalEntries, 0u);
    EXPECT_EQ(locks->activeCount(session.id), 1u);

    store.fail_appends = false;
    EXPECT_NO_THROW(ledger->record(session.id, "X", "A", 8));
  }

  TEST_F(CountLedgerTest, recount_appends_and_latest_wins) {
    locks->acquire(session, "X", "A");
    ledger->record(session.id, "X", "A", 8);
    clock->advance(std::chrono::seconds{ 5 });
    locks->acquire(session, "X", "B");
    ledger->record(session.id, "X", "B", 11);

    const auto view = ledger->view(session.id, 10);
    EXPECT_EQ(view.totalEntries, 2u);
    ASSERT_EQ(view.latest.size(), 1u);
    EXPECT_EQ(view.latest.at("X").countedQuantity, 11);
    EXPECT_EQ(view.latest.at("X").counter, "B");
    ASSERT_EQ(view.recent.size(), 2u);
    EXPECT_EQ(view.recent.front().countedQuantity, 11);

    const auto all = ledger->history(session.id);
    ASSERT_EQ(all.size(), 2u);
    EXPECT_LT(all[0].sequence, all[1].sequence);
  }

  TEST_F(CountLedgerTest, replayed_history_continues_sequence) {
    core::CountEntry old;
    old.sessionId = session.id;
    old.sequence = 41;
    old.itemId = "Y";
    old.counter = "A";
    old.countedQuantity = 5;
    old.baseline = 5;
    ledger->track(session.id, items, { old });

    locks->acquire(session, "Z", "A");
    EXPECT_EQ(ledger->record(session.id, "Z", "A", 0).sequence, 42u);
    EXPECT_EQ(ledger->view(session.id, 1).recent.size(), 1u);
  }

} // namespace stocktake::test
