/* @file InMemorySessionStore.cpp
 * @brief map-backed SessionStore
 *
 * © 2026 Stocktake Engine — MIT-licensed.
 */

#include "core/Errors.hpp"
#include "core/SessionStore.hpp"

using namespace stocktake::core;

void InMemorySessionStore::write(const SessionWrite& w) {
  std::lock_guard<std::mutex> lock(mtx_);
  sessions_[w.session.id] = w.session;
  if (w.items)
    items_[w.session.id] = *w.items;
  if (!w.adjustments.empty()) {
    auto& dst = adjustments_[w.session.id];
    dst.insert(dst.end(), w.adjustments.begin(), w.adjustments.end());
  }
}

void InMemorySessionStore::appendCount(const CountEntry& entry) {
  std::lock_guard<std::mutex> lock(mtx_);
  if (sessions_.count(entry.sessionId) == 0)
    throw StockTakeError(ErrorKind::Storage,
                         "[InMemorySessionStore] unknown session " + entry.sessionId);
  counts_[entry.sessionId].push_back(entry);
}

void InMemorySessionStore::appendVerification(const ShelfVerification& verdict) {
  std::lock_guard<std::mutex> lock(mtx_);
  if (sessions_.count(verdict.sessionId) == 0)
    throw StockTakeError(ErrorKind::Storage,
                         "[InMemorySessionStore] unknown session " + verdict.sessionId);
  verifications_[verdict.sessionId].push_back(verdict);
}

std::vector<Session> InMemorySessionStore::loadSessions() const {
  std::lock_guard<std::mutex> lock(mtx_);
  std::vector<Session> out;
  out.reserve(sessions_.size());
  for (const auto& [id, s] : sessions_)
    out.push_back(s);
  return out;
}

std::vector<AssignedItem> InMemorySessionStore::loadItems(const SessionId& session) const {
  std::lock_guard<std::mutex> lock(mtx_);
  auto it = items_.find(session);
  return it == items_.end() ? std::vector<AssignedItem>{} : it->second;
}

std::vector<CountEntry> InMemorySessionStore::loadCounts(const SessionId& session) const {
  std::lock_guard<std::mutex> lock(mtx_);
  auto it = counts_.find(session);
  return it == counts_.end() ? std::vector<CountEntry>{} : it->second;
}

std::vector<Adjustment> InMemorySessionStore::loadAdjustments(const SessionId& session) const {
  std::lock_guard<std::mutex> lock(mtx_);
  auto it = adjustments_.find(session);
  return it == adjustments_.end() ? std::vector<Adjustment>{} : it->second;
}

std::vector<ShelfVerification>
InMemorySessionStore::loadVerifications(const SessionId& session) const {
  std::lock_guard<std::mutex> lock(mtx_);
  auto it = verifications_.find(session);
  return it == verifications_.end() ? std::vector<ShelfVerification>{} : it->second;
}
