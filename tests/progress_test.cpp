// Stocktake-Prod headers
#include "core/CountLedger.hpp"
#include "core/ProgressAggregator.hpp"

// STL headers
#include <cstdint>
#include <stdexcept>

// GTest headers
#include <gtest/gtest.h>

namespace stocktake::test {

  using core::CountEntry;
  using core::LedgerView;
  using core::ProgressAggregator;

  namespace {

    CountEntry entry(std::uint64_t seq, const core::ItemId& item, const core::CounterId& counter,
                     core::Quantity qty, core::Quantity baseline) {
      CountEntry e;
      e.sessionId = "s-1";
      e.sequence = seq;
      e.itemId = item;
      e.counter = counter;
      e.countedQuantity = qty;
      e.baseline = baseline;
      e.variance = qty - baseline;
      return e;
    }

    const core::CounterProgress& counterRow(const core::ProgressSnapshot& p,
                                            const core::CounterId& id) {
      for (const auto& c : p.counters) {
        if (c.counter == id)
          return c;
      }
      throw std::out_of_range("no progress row for " + id);
    }

  } // namespace

  class ProgressAggregatorTest : public ::testing::Test {
  protected:
    void SetUp() override {
      session.id = "s-1";
      session.code = "ST-MAR25A";
      session.state = core::SessionState::Active;
      session.allowedCounters = { "A", "B", "C" };
      items = { { "s-1", "item1", "", 10 }, { "s-1", "item2", "", 5 }, { "s-1", "item3", "", 0 } };
    }

    core::Session session;
    std::vector<core::AssignedItem> items;
    ProgressAggregator aggregator{ 20 };
  };

  TEST(progress_aggregator, zero_recent_limit_is_rejected) {
    EXPECT_THROW(ProgressAggregator(0), std::invalid_argument);
  }

  TEST(progress_aggregator, percent_guards_zero_denominator) {
    EXPECT_DOUBLE_EQ(ProgressAggregator::percentOf(0, 0), 0.0);
    EXPECT_DOUBLE_EQ(ProgressAggregator::percentOf(1, 4), 25.0);
  }

  TEST_F(ProgressAggregatorTest, two_of_three_counted_by_two_counters) {
    LedgerView view;
    view.latest["item1"] = entry(1, "item1", "A", 8, 10);
    view.latest["item2"] = entry(2, "item2", "B", 5, 5);
    view.recent = { view.latest["item2"], view.latest["item1"] };
    view.totalEntries = 2;

    const auto p = aggregator.snapshot(session, items, view, 1);

    EXPECT_EQ(p.totalItems, 3u);
    EXPECT_EQ(p.totalCounted, 2u);
    EXPECT_EQ(p.missingItems, 1u);
    EXPECT_NEAR(p.percentComplete, 66.67, 0.01);
    EXPECT_EQ(p.activeLocks, 1u);
    EXPECT_EQ(view.latest.at("item1").variance, -2);

    EXPECT_EQ(counterRow(p, "A").itemsAssigned, 1u);
    EXPECT_EQ(counterRow(p, "A").itemsCounted, 1u);
    EXPECT_DOUBLE_EQ(counterRow(p, "A").percent, 100.0);
    EXPECT_DOUBLE_EQ(counterRow(p, "B").percent, 100.0);
    EXPECT_EQ(counterRow(p, "C").itemsAssigned, 0u);
    EXPECT_DOUBLE_EQ(counterRow(p, "C").percent, 0.0);

    ASSERT_EQ(p.recentCounts.size(), 2u);
    EXPECT_EQ(p.recentCounts.front().itemId, "item2");
  }

  TEST_F(ProgressAggregatorTest, recount_does_not_move_percent) {
    LedgerView view;
    view.latest["item1"] = entry(1, "item1", "A", 8, 10);
    const auto before = aggregator.snapshot(session, items, view, 0);

    view.latest["item1"] = entry(2, "item1", "A", 9, 10);
    const auto after = aggregator.snapshot(session, items, view, 0);

    EXPECT_DOUBLE_EQ(before.percentComplete, after.percentComplete);
    EXPECT_EQ(after.totalCounted, 1u);
  }

  TEST_F(ProgressAggregatorTest, shelf_assignment_drives_counter_scope) {
    items[0].shelf = "A1";
    items[1].shelf = "A1";
    items[2].shelf = "B2";
    session.shelfAssignments = { { "A1", "A" }, { "B2", "C" } };

    LedgerView view;
    view.latest["item1"] = entry(1, "item1", "A", 10, 10);
    const auto p = aggregator.snapshot(session, items, view, 0);

    EXPECT_EQ(counterRow(p, "A").itemsAssigned, 2u);
    EXPECT_DOUBLE_EQ(counterRow(p, "A").percent, 50.0);
    EXPECT_EQ(counterRow(p, "C").itemsAssigned, 1u);
    EXPECT_EQ(counterRow(p, "C").itemsCounted, 0u);
  }

  TEST_F(ProgressAggregatorTest, empty_session_reports_zero) {
    const auto p = aggregator.snapshot(session, {}, LedgerView{}, 0);
    EXPECT_EQ(p.totalItems, 0u);
    EXPECT_DOUBLE_EQ(p.percentComplete, 0.0);
  }

  TEST_F(ProgressAggregatorTest, recent_window_is_bounded) {
    ProgressAggregator small{ 2 };
    LedgerView view;
    for (std::uint64_t i = 5; i > 0; --i)
      view.recent.push_back(entry(i, "item1", "A", 1, 10));

    const auto p = small.snapshot(session, items, view, 0);
    ASSERT_EQ(p.recentCounts.size(), 2u);
    EXPECT_EQ(p.recentCounts[0].sequence, 5u);
  }

} // namespace stocktake::test
