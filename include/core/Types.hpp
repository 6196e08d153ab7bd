#pragma once
/** @file  Types.hpp
 *  @brief Value types shared by every stock-take component.
 *
 *  © 2026 Stocktake Engine — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace stocktake {
  namespace core {

    using SessionId = std::string;
    using ItemId = std::string;
    using CounterId = std::string;
    using Quantity = std::int64_t;
    using TimePoint = std::chrono::system_clock::time_point;

    enum class SessionState : std::uint8_t { Draft, Active, Paused, Completed, Cancelled, Count };
    static_assert(static_cast<std::uint8_t>(SessionState::Count) == 5,
                  "SessionState count changed please update the transition table");

    inline const char* toString(SessionState s) {
      switch (s) {
      case SessionState::Draft:
        return "DRAFT";
      case SessionState::Active:
        return "ACTIVE";
      case SessionState::Paused:
        return "PAUSED";
      case SessionState::Completed:
        return "COMPLETED";
      case SessionState::Cancelled:
        return "CANCELLED";
      default:
        return "UNKNOWN";
      }
    }

    inline std::optional<SessionState> sessionStateFromString(const std::string& s) {
      for (auto st : { SessionState::Draft, SessionState::Active, SessionState::Paused,
                       SessionState::Completed, SessionState::Cancelled }) {
        if (s == toString(st))
          return st;
      }
      return std::nullopt;
    }

    inline bool isTerminal(SessionState s) {
      return s == SessionState::Completed || s == SessionState::Cancelled;
    }

    /// DRAFT, ACTIVE and PAUSED sessions still occupy their branch.
    inline bool isOpen(SessionState s) { return !isTerminal(s); }

    //---time helpers (persistence and wire use epoch milliseconds)-----------
    inline std::int64_t toMillis(TimePoint t) {
      return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
    }

    inline TimePoint fromMillis(std::int64_t ms) {
      return TimePoint{ std::chrono::duration_cast<TimePoint::duration>(
          std::chrono::milliseconds{ ms }) };
    }

    /**
 * @struct Session
 * @brief One physical stock-take exercise scoped to a branch.
 */
    struct Session {
      SessionId id;
      std::string code; ///< e.g. ST-MAR25A
      std::string branch;
      std::string createdBy;
      bool isMultiUser{ true };
      std::vector<CounterId> allowedCounters;            ///< empty = unrestricted
      std::map<std::string, CounterId> shelfAssignments; ///< shelf -> counter
      std::string notes;
      SessionState state{ SessionState::Draft };

      TimePoint createdAt{};
      TimePoint updatedAt{};
      std::optional<TimePoint> startedAt;
      std::optional<TimePoint> pausedAt;
      std::optional<TimePoint> completedAt;
      std::optional<TimePoint> cancelledAt;

      std::string completedBy;
      bool forced{ false }; ///< completed with uncounted items

      bool allowsCounter(const CounterId& counter) const {
        return allowedCounters.empty() ||
               std::find(allowedCounters.begin(), allowedCounters.end(), counter) !=
                   allowedCounters.end();
      }
    };

    /// Item as supplied by the catalog or the session creator.
    struct CatalogItem {
      ItemId itemId;
      std::string shelf;
      Quantity quantity{ 0 };
    };

    /// (session, item) in scope for counting with its frozen baseline.
    struct AssignedItem {
      SessionId sessionId;
      ItemId itemId;
      std::string shelf;
      Quantity baseline{ 0 };
    };

    struct Lock {
      SessionId sessionId;
      ItemId itemId;
      CounterId counter;
      TimePoint acquiredAt{};
      TimePoint expiresAt{};

      bool expiredAt(TimePoint now) const { return now >= expiresAt; }
    };

    struct CountEntry {
      SessionId sessionId;
      std::uint64_t sequence{ 0 }; ///< per-session submission order
      ItemId itemId;
      CounterId counter;
      Quantity countedQuantity{ 0 };
      Quantity baseline{ 0 };
      Quantity variance{ 0 }; ///< countedQuantity - baseline, fixed at write time
      std::string shelfLocation;
      std::string notes;
      TimePoint countedAt{};
    };

    /// Inventory correction produced when a session completes.
    struct Adjustment {
      SessionId sessionId;
      ItemId itemId;
      Quantity baseline{ 0 };
      Quantity counted{ 0 };
      Quantity adjustment{ 0 };
      bool zeroedOut{ false }; ///< item had no count and the session was force-completed
    };

    /// Manager verdict on the counts of one shelf.
    enum class VerificationStatus : std::uint8_t { Pending, Approved, Rejected };

    inline const char* toString(VerificationStatus v) {
      switch (v) {
      case VerificationStatus::Approved:
        return "APPROVED";
      case VerificationStatus::Rejected:
        return "REJECTED";
      default:
        return "PENDING";
      }
    }

    inline std::optional<VerificationStatus> verificationStatusFromString(const std::string& s) {
      for (auto v : { VerificationStatus::Pending, VerificationStatus::Approved,
                      VerificationStatus::Rejected }) {
        if (s == toString(v))
          return v;
      }
      return std::nullopt;
    }

    /**
 * @struct ShelfVerification
 * @brief Append-only verdict on a shelf; count entries themselves are never rewritten.
 *
 * Covers every entry of the shelf up to `throughSequence`. A later count on the
 * same shelf puts it back to PENDING.
 */
    struct ShelfVerification {
      SessionId sessionId;
      std::string shelf;
      VerificationStatus status{ VerificationStatus::Pending };
      std::string verifiedBy;
      TimePoint verifiedAt{};
      std::string reason; ///< rejection reason, may be empty
      std::uint64_t throughSequence{ 0 };
      std::size_t countsCovered{ 0 };
    };

    /// One row of the shelf listing.
    struct ShelfSummary {
      std::string shelf;
      std::size_t itemCount{ 0 }; ///< distinct items with at least one count
      std::size_t entryCount{ 0 };
      std::vector<CounterId> counters; ///< sorted
      VerificationStatus status{ VerificationStatus::Pending };
      std::optional<ShelfVerification> lastVerification;
    };

    struct CounterProgress {
      CounterId counter;
      std::size_t itemsAssigned{ 0 };
      std::size_t itemsCounted{ 0 };
      double percent{ 0.0 };
    };

    struct ProgressSnapshot {
      SessionId sessionId;
      std::string sessionCode;
      SessionState state{ SessionState::Draft };
      std::size_t totalItems{ 0 };
      std::size_t totalCounted{ 0 };
      std::size_t missingItems{ 0 };
      double percentComplete{ 0.0 };
      std::size_t activeLocks{ 0 };
      std::vector<CounterProgress> counters;
      std::vector<CountEntry> recentCounts; ///< newest first
    };

    struct CreateSessionRequest {
      std::string branch;
      std::string createdBy;
      bool isMultiUser{ true };
      std::vector<CounterId> allowedCounters;
      std::map<std::string, CounterId> shelfAssignments;
      std::string notes;
      std::vector<CatalogItem> items; ///< empty = snapshot the catalog on start
    };

  } // namespace core
} // namespace stocktake
