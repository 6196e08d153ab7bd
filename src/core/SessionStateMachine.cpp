/* @file SessionStateMachine.cpp
 * @brief lifecycle transition table and timestamp stamping
 *
 * © 2026 Stocktake Engine — MIT-licensed.
 */

// STL headers
#include <array>
#include <string>
#include <utility>

// Stocktake headers
#include "core/Errors.hpp"
#include "core/SessionStateMachine.hpp"

using namespace stocktake::core;

namespace {

  using Edge = std::pair<SessionState, SessionState>;

  constexpr std::array<Edge, 8> kEdges{ {
      { SessionState::Draft, SessionState::Active },
      { SessionState::Active, SessionState::Paused },
      { SessionState::Paused, SessionState::Active },
      { SessionState::Active, SessionState::Completed },
      { SessionState::Paused, SessionState::Completed },
      { SessionState::Draft, SessionState::Cancelled },
      { SessionState::Active, SessionState::Cancelled },
      { SessionState::Paused, SessionState::Cancelled },
  } };

} // namespace

bool SessionStateMachine::isLegal(SessionState from, SessionState to) {
  for (const auto& [src, dst] : kEdges) {
    if (src == from && dst == to)
      return true;
  }
  return false;
}

void SessionStateMachine::transition(Session& session, SessionState next, TimePoint now) {
  if (!isLegal(session.state, next)) {
    throw StockTakeError(ErrorKind::InvalidTransition,
                         std::string("[SessionStateMachine] session ") + session.code + ": " +
                             toString(session.state) + " -> " + toString(next) +
                             " is not allowed");
  }

  switch (next) {
  case SessionState::Active:
    if (!session.startedAt)
      session.startedAt = now;
    break;
  case SessionState::Paused:
    session.pausedAt = now;
    break;
  case SessionState::Completed:
    session.completedAt = now;
    break;
  case SessionState::Cancelled:
    session.cancelledAt = now;
    break;
  default:
    break;
  }
  session.state = next;
  session.updatedAt = now;
}

void SessionStateMachine::requireActive(const Session& session) {
  if (session.state != SessionState::Active) {
    throw StockTakeError(ErrorKind::SessionNotActive, std::string("[SessionStateMachine] session ") +
                                                          session.code + " is " +
                                                          toString(session.state));
  }
}
