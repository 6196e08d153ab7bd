#pragma once
/** @file  SessionStateMachine.hpp
 *  @brief Session lifecycle table: DRAFT -> ACTIVE <-> PAUSED -> COMPLETED / CANCELLED.
 *
 *  © 2026 Stocktake Engine — MIT-licensed.
 */

#include "core/Types.hpp"

namespace stocktake {
  namespace core {

    /**
 * @class SessionStateMachine
 * @brief Stateless gatekeeper for lifecycle transitions.
 *
 *  * COMPLETED and CANCELLED are terminal.
 *  * Side effects on locks and the ledger are the coordinator's job; this
 *    class only validates and stamps the Session value.
 */
    class SessionStateMachine {
    public:
      /// True when \p from -> \p to appears in the transition table.
      static bool isLegal(SessionState from, SessionState to);

      /// Moves \p session to \p next and stamps the matching timestamp.
      /// Throws `StockTakeError(InvalidTransition)` and leaves \p session untouched otherwise.
      static void transition(Session& session, SessionState next, TimePoint now);

      /// Throws `StockTakeError(SessionNotActive)` unless the session accepts locks and counts.
      static void requireActive(const Session& session);
    };

  } // namespace core
} // namespace stocktake
