#pragma once
/** @file  LockManager.hpp
 *  @brief Short-lived exclusive claims on (session, item) pairs.
 *
 *  © 2026 Stocktake Engine — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <vector>

// Stocktake headers
#include "core/Clock.hpp"
#include "core/Errors.hpp"
#include "core/Types.hpp"

namespace stocktake {
  namespace core {

    /**
 * @class LockManager
 * @brief One slot (mutex + optional Lock) per assigned item, so disjoint items never contend.
 *
 *  * Slot tables are built by `track()` and are immutable afterwards; only slot
 *    contents change, each under its own mutex.
 *  * Expiry is lazy: an expired Lock is ignored and overwritten on the next acquire.
 *  * `consume()` is the Count Ledger's entry point: ownership check, write and
 *    release happen inside one slot critical section.
 */
    class LockManager {
    public:
      static constexpr std::chrono::seconds kMaxTtl{ 24 * 60 * 60 };

      /// Throws `std::invalid_argument` unless 0 < \p ttl <= kMaxTtl.
      LockManager(std::shared_ptr<const Clock> clock, std::chrono::seconds ttl);
      ~LockManager() = default;

      //---session tables---------------------------------------------------
      void track(const SessionId& session, const std::vector<ItemId>& items);
      void forget(const SessionId& session);
      bool tracks(const SessionId& session) const;

      //---public API-------------------------------------------------------
      /// Grants or refreshes the claim. Throws CounterNotAllowed, ItemNotAssigned or LockHeld.
      Lock acquire(const Session& session, const ItemId& item, const CounterId& counter);

      /// Throws LockNotHeld unless \p counter holds an unexpired claim on \p item.
      void release(const SessionId& session, const ItemId& item, const CounterId& counter);

      /// Drops every claim of \p session; returns how many were still live.
      std::size_t releaseAll(const SessionId& session);

      /**
       * @brief Runs \p fn under the item's slot mutex iff \p counter holds the lock.
       *
       * The lock is consumed only when \p fn returns normally; if it throws the
       * claim stays in place and the exception propagates.
       */
      template <typename Fn>
      auto consume(const SessionId& session, const ItemId& item, const CounterId& counter, Fn&& fn)
          -> decltype(fn(std::declval<const Lock&>()));

      std::vector<Lock> activeLocks(const SessionId& session) const;
      std::size_t activeCount(const SessionId& session) const;

      std::chrono::seconds ttl() const { return ttl_; }

    private:
      struct Slot {
        std::mutex mtx;
        std::optional<Lock> lock;
      };
      using Table = std::unordered_map<ItemId, std::unique_ptr<Slot>>;

      /// Keeps the owning table alive while the caller works on a slot.
      struct SlotRef {
        std::shared_ptr<Table> table;
        Slot* slot{ nullptr };
      };

      std::shared_ptr<Table> tableFor(const SessionId& session) const;
      SlotRef slotFor(const SessionId& session, const ItemId& item) const;

      std::shared_ptr<const Clock> clock_;
      std::chrono::seconds ttl_;

      mutable std::shared_mutex tablesMtx_;
      std::unordered_map<SessionId, std::shared_ptr<Table>> tables_;
    };

    template <typename Fn>
    auto LockManager::consume(const SessionId& session, const ItemId& item,
                              const CounterId& counter, Fn&& fn)
        -> decltype(fn(std::declval<const Lock&>())) {
      SlotRef ref = slotFor(session, item);
      std::lock_guard<std::mutex> guard(ref.slot->mtx);

      const auto& held = ref.slot->lock;
      if (!held || held->counter != counter || held->expiredAt(clock_->now())) {
        throw StockTakeError(ErrorKind::LockNotHeld, "[LockManager] " + counter +
                                                         " does not hold the lock on item " +
                                                         item);
      }

      if constexpr (std::is_void_v<decltype(fn(*held))>) {
        fn(*held);
        ref.slot->lock.reset();
      } else {
        auto result = fn(*held);
        ref.slot->lock.reset();
        return result;
      }
    }

  } // namespace core
} // namespace stocktake
