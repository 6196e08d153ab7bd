// Stocktake-Prod headers
#include "core/Errors.hpp"
#include "core/SessionStateMachine.hpp"
#include "core/Types.hpp"

// STL headers
#include <functional>
#include <vector>

// GTest headers
#include <gtest/gtest.h>

namespace stocktake::test {

  using core::ErrorKind;
  using core::Session;
  using core::SessionState;
  using core::SessionStateMachine;
  using core::StockTakeError;

  namespace {

    Session sessionIn(SessionState state) {
      Session s;
      s.id = "s-1";
      s.code = "ST-MAR25A";
      s.state = state;
      return s;
    }

    ErrorKind kindOf(const std::function<void()>& fn) {
      try {
        fn();
      } catch (const StockTakeError& e) {
        return e.kind();
      }
      ADD_FAILURE() << "expected StockTakeError";
      return ErrorKind::Storage;
    }

  } // namespace

  TEST(state_machine, legal_edges) {
    EXPECT_TRUE(SessionStateMachine::isLegal(SessionState::Draft, SessionState::Active));
    EXPECT_TRUE(SessionStateMachine::isLegal(SessionState::Active, SessionState::Paused));
    EXPECT_TRUE(SessionStateMachine::isLegal(SessionState::Paused, SessionState::Active));
    EXPECT_TRUE(SessionStateMachine::isLegal(SessionState::Active, SessionState::Completed));
    EXPECT_TRUE(SessionStateMachine::isLegal(SessionState::Paused, SessionState::Completed));
    EXPECT_TRUE(SessionStateMachine::isLegal(SessionState::Draft, SessionState::Cancelled));
    EXPECT_TRUE(SessionStateMachine::isLegal(SessionState::Active, SessionState::Cancelled));
    EXPECT_TRUE(SessionStateMachine::isLegal(SessionState::Paused, SessionState::Cancelled));
  }

  TEST(state_machine, terminal_states_have_no_way_out) {
    for (auto from : { SessionState::Completed, SessionState::Cancelled }) {
      for (auto to : { SessionState::Draft, SessionState::Active, SessionState::Paused,
                       SessionState::Completed, SessionState::Cancelled }) {
        EXPECT_FALSE(SessionStateMachine::isLegal(from, to))
            << core::toString(from) << " -> " << core::toString(to);
      }
    }
    EXPECT_FALSE(SessionStateMachine::isLegal(SessionState::Draft, SessionState::Completed));
    EXPECT_FALSE(SessionStateMachine::isLegal(SessionState::Draft, SessionState::Paused));
  }

  TEST(state_machine, transition_stamps_timestamps) {
    auto s = sessionIn(SessionState::Draft);
    const auto t0 = core::fromMillis(1000);
    const auto t1 = core::fromMillis(2000);
    const auto t2 = core::fromMillis(3000);

    SessionStateMachine::transition(s, SessionState::Active, t0);
    EXPECT_EQ(s.state, SessionState::Active);
    ASSERT_TRUE(s.startedAt);
    EXPECT_EQ(*s.startedAt, t0);

    SessionStateMachine::transition(s, SessionState::Paused, t1);
    ASSERT_TRUE(s.pausedAt);
    EXPECT_EQ(*s.pausedAt, t1);

    // resuming keeps the first start time
    SessionStateMachine::transition(s, SessionState::Active, t2);
    EXPECT_EQ(*s.startedAt, t0);
    EXPECT_EQ(s.updatedAt, t2);
  }

  TEST(state_machine, illegal_transition_leaves_session_untouched) {
    auto s = sessionIn(SessionState::Completed);
    const auto before = s.updatedAt;

    EXPECT_EQ(kindOf([&] { SessionStateMachine::transition(s, SessionState::Active, {}); }),
              ErrorKind::InvalidTransition);
    EXPECT_EQ(s.state, SessionState::Completed);
    EXPECT_EQ(s.updatedAt, before);
  }

  TEST(state_machine, require_active) {
    EXPECT_NO_THROW(SessionStateMachine::requireActive(sessionIn(SessionState::Active)));
    for (auto st : { SessionState::Draft, SessionState::Paused, SessionState::Completed,
                     SessionState::Cancelled }) {
      EXPECT_EQ(kindOf([&] { SessionStateMachine::requireActive(sessionIn(st)); }),
                ErrorKind::SessionNotActive);
    }
  }

  TEST(types, state_names_round_trip_and_reject_garbage) {
    EXPECT_EQ(core::sessionStateFromString("PAUSED"), SessionState::Paused);
    EXPECT_FALSE(core::sessionStateFromString("paused"));
    EXPECT_TRUE(core::isOpen(SessionState::Draft));
    EXPECT_FALSE(core::isOpen(SessionState::Cancelled));
  }

  TEST(types, verification_names_round_trip) {
    EXPECT_EQ(core::verificationStatusFromString("REJECTED"), core::VerificationStatus::Rejected);
    EXPECT_STREQ(core::toString(core::VerificationStatus::Pending), "PENDING");
    EXPECT_FALSE(core::verificationStatusFromString("approved"));
  }

  TEST(types, millis_conversion_is_exact) {
    EXPECT_EQ(core::toMillis(core::fromMillis(1'740'787'200'123)), 1'740'787'200'123);
  }

  TEST(types, allowed_counters_empty_means_everyone) {
    Session s;
    EXPECT_TRUE(s.allowsCounter("anyone"));
    s.allowedCounters = { "A", "B" };
    EXPECT_TRUE(s.allowsCounter("B"));
    EXPECT_FALSE(s.allowsCounter("C"));
  }

  TEST(errors, incomplete_items_carry_missing_ids) {
    StockTakeError e(ErrorKind::IncompleteItems, "2 uncounted", { "X", "Y" });
    EXPECT_EQ(e.kind(), ErrorKind::IncompleteItems);
    EXPECT_EQ(e.missingItems(), (std::vector<core::ItemId>{ "X", "Y" }));
    EXPECT_STREQ(core::toString(e.kind()), "IncompleteItems");
  }

} // namespace stocktake::test
