/* @file CountLedger.cpp
 * @brief append-only, lock-checked count history per session
 *
 * © 2026 Stocktake Engine — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <stdexcept>

// Stocktake headers
#include "core/CountLedger.hpp"
#include "core/Errors.hpp"

using namespace stocktake::core;

namespace {

  bool newerFirst(const CountEntry& a, const CountEntry& b) { return a.sequence > b.sequence; }

} // namespace

CountLedger::CountLedger(LockManager& locks, SessionStore& store,
                         std::shared_ptr<const Clock> clock)
    : locks_(locks), store_(store), clock_(std::move(clock)) {
  if (!clock_)
    throw std::invalid_argument("[CountLedger] clock is nullptr");
}

void CountLedger::track(const SessionId& session, const std::vector<AssignedItem>& items,
                        std::vector<CountEntry> history) {
  auto book = std::make_shared<Book>();
  for (const auto& it : items) {
    book->baselines.emplace(it.itemId, it.baseline);
    book->shelves.emplace(it.itemId, it.shelf);
  }

  std::sort(history.begin(), history.end(),
            [](const CountEntry& a, const CountEntry& b) { return a.sequence < b.sequence; });
  for (auto& e : history) {
    book->latest[e.itemId] = book->entries.size();
    book->nextSequence = std::max(book->nextSequence, e.sequence + 1);
    book->entries.push_back(std::move(e));
  }

  std::unique_lock<std::shared_mutex> guard(booksMtx_);
  books_[session] = std::move(book);
}

void CountLedger::forget(const SessionId& session) {
  std::unique_lock<std::shared_mutex> guard(booksMtx_);
  books_.erase(session);
}

std::shared_ptr<CountLedger::Book> CountLedger::bookFor(const SessionId& session) const {
  std::shared_lock<std::shared_mutex> guard(booksMtx_);
  auto it = books_.find(session);
  if (it == books_.end())
    throw StockTakeError(ErrorKind::NotFound, "[CountLedger] no ledger for session " + session);
  return it->second;
}

CountEntry CountLedger::record(const SessionId& session, const ItemId& item,
                               const CounterId& counter, Quantity quantity,
                               const std::string& shelfLocation, const std::string& notes) {
  auto book = bookFor(session);

  auto base = book->baselines.find(item);
  if (base == book->baselines.end())
    throw StockTakeError(ErrorKind::ItemNotAssigned,
                         "[CountLedger] item " + item + " is not assigned to session " + session);
  if (quantity < 0)
    throw StockTakeError(ErrorKind::ValidationError,
                         "[CountLedger] counted quantity must not be negative");

  const Quantity baseline = base->second;
  std::string shelf = shelfLocation;
  if (shelf.empty()) {
    auto assigned = book->shelves.find(item);
    if (assigned != book->shelves.end())
      shelf = assigned->second;
  }

  return locks_.consume(session, item, counter, [&](const Lock&) {
    CountEntry entry;
    entry.sessionId = session;
    entry.itemId = item;
    entry.counter = counter;
    entry.countedQuantity = quantity;
    entry.baseline = baseline;
    entry.variance = quantity - baseline;
    entry.shelfLocation = shelf;
    entry.notes = notes;
    {
      std::lock_guard<std::mutex> guard(book->mtx);
      entry.sequence = book->nextSequence++;
      entry.countedAt = clock_->now();
    }

    store_.appendCount(entry); // throws -> lock kept, nothing appended

    std::lock_guard<std::mutex> guard(book->mtx);
    book->latest[item] = book->entries.size();
    book->entries.push_back(entry);
    return entry;
  });
}

LedgerView CountLedger::view(const SessionId& session, std::size_t recentLimit) const {
  auto book = bookFor(session);

  LedgerView out;
  std::vector<CountEntry> all;
  {
    std::lock_guard<std::mutex> guard(book->mtx);
    for (const auto& [item, idx] : book->latest)
      out.latest.emplace(item, book->entries[idx]);
    all = book->entries;
  }
  out.totalEntries = all.size();

  const auto k = std::min(recentLimit, all.size());
  std::partial_sort(all.begin(), all.begin() + static_cast<std::ptrdiff_t>(k), all.end(),
                    newerFirst);
  all.resize(k);
  out.recent = std::move(all);
  return out;
}

std::vector<CountEntry> CountLedger::history(const SessionId& session) const {
  auto book = bookFor(session);

  std::vector<CountEntry> out;
  {
    std::lock_guard<std::mutex> guard(book->mtx);
    out = book->entries;
  }
  std::sort(out.begin(), out.end(),
            [](const CountEntry& a, const CountEntry& b) { return a.sequence < b.sequence; });
  return out;
}
