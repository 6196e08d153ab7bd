/* @file LockManager.cpp
 * @brief per-item TTL claims with lazy expiry
 *
 * © 2026 Stocktake Engine — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <stdexcept>

// Stocktake headers
#include "core/LockManager.hpp"

using namespace stocktake::core;

LockManager::LockManager(std::shared_ptr<const Clock> clock, std::chrono::seconds ttl)
    : clock_(std::move(clock)), ttl_(ttl) {
  if (!clock_)
    throw std::invalid_argument("[LockManager] clock is nullptr");
  if (ttl_.count() <= 0)
    throw std::invalid_argument("[LockManager] lock ttl must be positive");
  if (ttl_ > kMaxTtl)
    throw std::invalid_argument("[LockManager] lock ttl must not exceed one day");
}

void LockManager::track(const SessionId& session, const std::vector<ItemId>& items) {
  auto table = std::make_shared<Table>();
  table->reserve(items.size());
  for (const auto& item : items)
    table->emplace(item, std::make_unique<Slot>());

  std::unique_lock<std::shared_mutex> guard(tablesMtx_);
  tables_[session] = std::move(table);
}

void LockManager::forget(const SessionId& session) {
  std::unique_lock<std::shared_mutex> guard(tablesMtx_);
  tables_.erase(session);
}

bool LockManager::tracks(const SessionId& session) const {
  std::shared_lock<std::shared_mutex> guard(tablesMtx_);
  return tables_.count(session) != 0;
}

std::shared_ptr<LockManager::Table> LockManager::tableFor(const SessionId& session) const {
  std::shared_lock<std::shared_mutex> guard(tablesMtx_);
  auto it = tables_.find(session);
  if (it == tables_.end())
    throw StockTakeError(ErrorKind::SessionNotActive,
                         "[LockManager] session " + session + " has no lock table");
  return it->second;
}

LockManager::SlotRef LockManager::slotFor(const SessionId& session, const ItemId& item) const {
  SlotRef ref;
  ref.table = tableFor(session);
  auto it = ref.table->find(item);
  if (it == ref.table->end())
    throw StockTakeError(ErrorKind::ItemNotAssigned,
                         "[LockManager] item " + item + " is not assigned to session " + session);
  ref.slot = it->second.get();
  return ref;
}

Lock LockManager::acquire(const Session& session, const ItemId& item, const CounterId& counter) {
  if (!session.allowsCounter(counter)) {
    throw StockTakeError(ErrorKind::CounterNotAllowed, "[LockManager] counter " + counter +
                                                           " is not allowed in session " +
                                                           session.code);
  }

  SlotRef ref = slotFor(session.id, item);
  std::lock_guard<std::mutex> guard(ref.slot->mtx);

  const auto now = clock_->now();
  auto& held = ref.slot->lock;
  if (held && !held->expiredAt(now) && held->counter != counter) {
    throw StockTakeError(ErrorKind::LockHeld,
                         "[LockManager] item " + item + " is being counted by " + held->counter);
  }

  // fresh claim, refresh by the same holder, or silent reclaim of an expired one
  held = Lock{ session.id, item, counter, now, now + ttl_ };
  return *held;
}

void LockManager::release(const SessionId& session, const ItemId& item, const CounterId& counter) {
  SlotRef ref = slotFor(session, item);
  std::lock_guard<std::mutex> guard(ref.slot->mtx);

  auto& held = ref.slot->lock;
  if (!held || held->counter != counter || held->expiredAt(clock_->now())) {
    throw StockTakeError(ErrorKind::LockNotHeld,
                         "[LockManager] " + counter + " does not hold the lock on item " + item);
  }
  held.reset();
}

std::size_t LockManager::releaseAll(const SessionId& session) {
  std::shared_ptr<Table> table;
  {
    std::shared_lock<std::shared_mutex> guard(tablesMtx_);
    auto it = tables_.find(session);
    if (it == tables_.end())
      return 0;
    table = it->second;
  }

  const auto now = clock_->now();
  std::size_t live = 0;
  for (auto& [item, slot] : *table) {
    std::lock_guard<std::mutex> guard(slot->mtx);
    if (slot->lock && !slot->lock->expiredAt(now))
      ++live;
    slot->lock.reset();
  }
  return live;
}

std::vector<Lock> LockManager::activeLocks(const SessionId& session) const {
  std::shared_ptr<Table> table;
  {
    std::shared_lock<std::shared_mutex> guard(tablesMtx_);
    auto it = tables_.find(session);
    if (it == tables_.end())
      return {};
    table = it->second;
  }

  const auto now = clock_->now();
  std::vector<Lock> out;
  for (auto& [item, slot] : *table) {
    std::lock_guard<std::mutex> guard(slot->mtx);
    if (slot->lock && !slot->lock->expiredAt(now))
      out.push_back(*slot->lock);
  }
  std::sort(out.begin(), out.end(),
            [](const Lock& a, const Lock& b) { return a.acquiredAt < b.acquiredAt; });
  return out;
}

std::size_t LockManager::activeCount(const SessionId& session) const {
  return activeLocks(session).size();
}
