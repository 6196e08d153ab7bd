/* @file SessionCoordinator.cpp
 * @brief session façade: lifecycle gating, lock/count routing, progress snapshots
 *
 * © 2026 Stocktake Engine — MIT-licensed.
 */

// STL headers
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <map>
#include <mutex>
#include <optional>
#include <random>
#include <set>
#include <stdexcept>
#include <unordered_set>

// Stocktake headers
#include "core/Errors.hpp"
#include "core/SessionCoordinator.hpp"
#include "core/SessionStateMachine.hpp"

using namespace stocktake::core;

namespace {

  CoordinatorDeps checkedDeps(CoordinatorDeps deps) {
    if (!deps.store)
      throw std::invalid_argument("[SessionCoordinator] session store is nullptr");
    if (!deps.catalog)
      throw std::invalid_argument("[SessionCoordinator] item catalog is nullptr");
    if (!deps.policy)
      throw std::invalid_argument("[SessionCoordinator] access policy is nullptr");
    if (!deps.errorMonitor)
      throw std::invalid_argument("[SessionCoordinator] error monitor is nullptr");
    if (!deps.clock)
      throw std::invalid_argument("[SessionCoordinator] clock is nullptr");
    return deps;
  }

  StockTakeError validationError(const std::string& what) {
    return StockTakeError(ErrorKind::ValidationError, "[SessionCoordinator] " + what);
  }

  /// Random RFC 4122 version-4 identifier.
  std::string newSessionId() {
    thread_local std::mt19937_64 rng{ std::random_device{}() };
    std::uniform_int_distribution<std::uint64_t> dist;
    const std::uint64_t hi = dist(rng);
    const std::uint64_t lo = dist(rng);

    char buf[37];
    std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx",
                  static_cast<unsigned>(hi >> 32), static_cast<unsigned>((hi >> 16) & 0xffff),
                  static_cast<unsigned>((hi & 0x0fff) | 0x4000),
                  static_cast<unsigned>(((lo >> 48) & 0x3fff) | 0x8000),
                  static_cast<unsigned long long>(lo & 0xffffffffffffULL));
    return buf;
  }

  /// ST-<MON><YY><suffix>; suffix A..Z, then Z1, Z2, ...
  std::string sessionCode(TimePoint createdAt, const std::set<std::string>& used) {
    static constexpr const char* kMonths[] = { "JAN", "FEB", "MAR", "APR", "MAY", "JUN",
                                               "JUL", "AUG", "SEP", "OCT", "NOV", "DEC" };
    const std::time_t t = std::chrono::system_clock::to_time_t(createdAt);
    std::tm tm{};
    gmtime_r(&t, &tm);

    char prefix[16];
    std::snprintf(prefix, sizeof(prefix), "ST-%s%02d", kMonths[tm.tm_mon], tm.tm_year % 100);

    for (int n = 0;; ++n) {
      std::string code = prefix;
      code += n < 26 ? std::string(1, static_cast<char>('A' + n)) : "Z" + std::to_string(n - 25);
      if (used.count(code) == 0)
        return code;
    }
  }

  std::string upperCase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
  }

  std::string trimmed(const std::string& s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos)
      return {};
    return s.substr(first, s.find_last_not_of(" \t\r\n") - first + 1);
  }

  std::vector<ItemId> itemIds(const std::vector<AssignedItem>& items) {
    std::vector<ItemId> ids;
    ids.reserve(items.size());
    for (const auto& it : items)
      ids.push_back(it.itemId);
    return ids;
  }

} // namespace

template <typename Fn> auto SessionCoordinator::reportingStorage(Fn&& fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const StockTakeError& e) {
    if (e.kind() == ErrorKind::Storage)
      deps_.errorMonitor->notifyFailure(e.what());
    throw;
  }
}

SessionCoordinator::SessionCoordinator(CoordinatorDeps deps, CoordinatorOptions options)
    : deps_(checkedDeps(std::move(deps))), locks_(deps_.clock, options.lockTtl),
      ledger_(locks_, *deps_.store, deps_.clock), aggregator_(options.recentCountLimit) {}

std::size_t SessionCoordinator::recover() {
  const auto stored = reportingStorage([&] { return deps_.store->loadSessions(); });

  std::unique_lock<std::shared_mutex> guard(registryMtx_);
  for (const auto& s : stored) {
    auto entry = std::make_shared<SessionEntry>(s.code, s.branch);
    entry->open = isOpen(s.state);
    entry->session = s;
    reportingStorage([&] {
      entry->items = deps_.store->loadItems(s.id);
      entry->adjustments = deps_.store->loadAdjustments(s.id);
      entry->verifications = deps_.store->loadVerifications(s.id);
      ledger_.track(s.id, entry->items, deps_.store->loadCounts(s.id));
    });
    if (s.state == SessionState::Active || s.state == SessionState::Paused)
      locks_.track(s.id, itemIds(entry->items));
    sessions_[s.id] = std::move(entry);
  }
  return sessions_.size();
}

//---lifecycle-------------------------------------------------------------

void SessionCoordinator::validate(const CreateSessionRequest& request) const {
  if (request.branch.empty())
    throw validationError("branch is required");
  if (request.createdBy.empty())
    throw validationError("creator is required");

  std::unordered_set<CounterId> allowed;
  for (const auto& c : request.allowedCounters) {
    if (c.empty())
      throw validationError("allowed counter ids must not be empty");
    if (!allowed.insert(c).second)
      throw validationError("counter " + c + " is listed twice");
  }
  if (!request.isMultiUser && allowed.size() > 1)
    throw validationError("a single-user session allows at most one counter");
  if (!request.isMultiUser && allowed.empty())
    allowed.insert(request.createdBy);

  for (const auto& [shelf, counter] : request.shelfAssignments) {
    if (shelf.empty() || counter.empty())
      throw validationError("shelf assignments need a shelf and a counter");
    if (!allowed.empty() && allowed.count(counter) == 0)
      throw validationError("shelf " + shelf + " is assigned to " + counter +
                            " who is not an allowed counter");
  }

  std::unordered_set<ItemId> items;
  for (const auto& it : request.items) {
    if (it.itemId.empty())
      throw validationError("item ids must not be empty");
    if (!items.insert(it.itemId).second)
      throw validationError("item " + it.itemId + " is listed twice");
  }
}

Session SessionCoordinator::createSession(const CreateSessionRequest& request) {
  validate(request);

  const auto now = deps_.clock->now();
  Session s;
  s.branch = request.branch;
  s.createdBy = request.createdBy;
  s.isMultiUser = request.isMultiUser;
  s.allowedCounters = request.allowedCounters;
  s.shelfAssignments = request.shelfAssignments;
  s.notes = request.notes;
  s.state = SessionState::Draft;
  s.createdAt = now;
  s.updatedAt = now;
  if (!s.isMultiUser && s.allowedCounters.empty())
    s.allowedCounters.push_back(s.createdBy);

  // reserve branch and code, then persist outside the registry lock
  std::unique_lock<std::shared_mutex> guard(registryMtx_);
  if (pendingBranches_.count(s.branch) != 0)
    throw validationError("branch " + s.branch + " already has a session being created");
  std::set<std::string> usedCodes = pendingCodes_;
  for (const auto& [id, other] : sessions_) {
    usedCodes.insert(other->code);
    if (other->branch == s.branch && other->open)
      throw validationError("branch " + s.branch + " already has an open session: " +
                            other->code);
  }

  do {
    s.id = newSessionId();
  } while (sessions_.count(s.id) != 0);
  s.code = sessionCode(now, usedCodes);
  pendingBranches_.insert(s.branch);
  pendingCodes_.insert(s.code);
  guard.unlock();

  std::optional<std::vector<AssignedItem>> items;
  if (!request.items.empty()) {
    items.emplace();
    for (const auto& ci : request.items)
      items->push_back(AssignedItem{ s.id, ci.itemId, ci.shelf, ci.quantity });
  }

  try {
    persist(SessionWrite{ s, items, {} });
  } catch (...) {
    guard.lock();
    pendingBranches_.erase(s.branch);
    pendingCodes_.erase(s.code);
    throw;
  }

  auto entry = std::make_shared<SessionEntry>(s.code, s.branch);
  entry->session = s;
  if (items)
    entry->items = std::move(*items);
  ledger_.track(s.id, entry->items);

  guard.lock();
  pendingBranches_.erase(s.branch);
  pendingCodes_.erase(s.code);
  sessions_.emplace(s.id, entry);
  guard.unlock();

  audit("session_created", s, s.createdBy, {},
        std::to_string(entry->items.size()) + " items");
  return s;
}

Session SessionCoordinator::startSession(const SessionId& id, const std::string& actor) {
  auto entry = find(id);

  // the catalog is an external call; query it before entering the lifecycle section
  std::vector<CatalogItem> catalogItems;
  {
    std::shared_lock<std::shared_mutex> lk(entry->mtx);
    const bool needCatalog =
        entry->session.state == SessionState::Draft && entry->items.empty();
    const std::string branch = entry->session.branch;
    lk.unlock();
    if (needCatalog)
      catalogItems = deps_.catalog->itemsForBranch(branch);
  }

  std::unique_lock<std::shared_mutex> guard(entry->mtx);
  requireManager(entry->session, actor);
  if (entry->session.state == SessionState::Paused)
    throw StockTakeError(ErrorKind::InvalidTransition,
                         "[SessionCoordinator] session " + entry->session.code +
                             " is PAUSED; resume it instead of starting it");

  Session next = entry->session;
  SessionStateMachine::transition(next, SessionState::Active, deps_.clock->now());

  std::optional<std::vector<AssignedItem>> frozen;
  if (entry->items.empty()) {
    frozen.emplace();
    std::unordered_set<ItemId> seen;
    for (const auto& ci : catalogItems) {
      if (ci.itemId.empty() || !seen.insert(ci.itemId).second)
        continue; // one Assigned Item per (session, item): first catalog row wins
      frozen->push_back(AssignedItem{ id, ci.itemId, ci.shelf, ci.quantity });
    }
  }

  persist(SessionWrite{ next, frozen, {} });

  entry->session = next;
  if (frozen) {
    entry->items = std::move(*frozen);
    ledger_.track(id, entry->items);
  }
  locks_.track(id, itemIds(entry->items));
  guard.unlock();

  audit("session_started", next, actor, {}, std::to_string(entry->items.size()) + " items");
  return next;
}

Session SessionCoordinator::pauseSession(const SessionId& id, const std::string& actor) {
  auto entry = find(id);
  std::unique_lock<std::shared_mutex> guard(entry->mtx);
  requireManager(entry->session, actor);

  Session next = entry->session;
  SessionStateMachine::transition(next, SessionState::Paused, deps_.clock->now());
  persist(SessionWrite{ next, std::nullopt, {} });

  entry->session = next;
  const auto released = locks_.releaseAll(id);
  guard.unlock();

  audit("session_paused", next, actor, {}, "released " + std::to_string(released) + " locks");
  return next;
}

Session SessionCoordinator::resumeSession(const SessionId& id, const std::string& actor) {
  auto entry = find(id);
  std::unique_lock<std::shared_mutex> guard(entry->mtx);
  requireManager(entry->session, actor);
  if (entry->session.state != SessionState::Paused)
    throw StockTakeError(ErrorKind::InvalidTransition,
                         std::string("[SessionCoordinator] only a PAUSED session can resume, ") +
                             entry->session.code + " is " + toString(entry->session.state));

  Session next = entry->session;
  SessionStateMachine::transition(next, SessionState::Active, deps_.clock->now());
  persist(SessionWrite{ next, std::nullopt, {} });
  entry->session = next;
  guard.unlock();

  audit("session_resumed", next, actor);
  return next;
}

Session SessionCoordinator::completeSession(const SessionId& id, const std::string& actor,
                                            bool force) {
  auto entry = find(id);
  std::unique_lock<std::shared_mutex> guard(entry->mtx);
  requireManager(entry->session, actor);

  Session next = entry->session;
  SessionStateMachine::transition(next, SessionState::Completed, deps_.clock->now());

  const auto view = ledger_.view(id, 0);
  std::vector<ItemId> missing;
  std::vector<Adjustment> adjustments;
  adjustments.reserve(entry->items.size());
  for (const auto& item : entry->items) {
    auto latest = view.latest.find(item.itemId);
    if (latest == view.latest.end()) {
      missing.push_back(item.itemId);
      // forced completion: uncounted stock is written off, the ledger stays untouched
      adjustments.push_back(Adjustment{ id, item.itemId, item.baseline, 0, -item.baseline, true });
    } else {
      adjustments.push_back(Adjustment{ id, item.itemId, item.baseline,
                                        latest->second.countedQuantity, latest->second.variance,
                                        false });
    }
  }

  if (!missing.empty() && !force) {
    throw StockTakeError(ErrorKind::IncompleteItems,
                         "[SessionCoordinator] session " + next.code + " has " +
                             std::to_string(missing.size()) + " uncounted items",
                         std::move(missing));
  }

  next.completedBy = actor;
  next.forced = !missing.empty();
  persist(SessionWrite{ next, std::nullopt, adjustments });

  entry->session = next;
  entry->open = false;
  entry->adjustments = std::move(adjustments);
  locks_.releaseAll(id);
  locks_.forget(id);
  guard.unlock();

  audit("session_completed", next, actor, {},
        next.forced ? std::to_string(missing.size()) + " items zeroed" : "all items counted");
  return next;
}

Session SessionCoordinator::cancelSession(const SessionId& id, const std::string& actor) {
  auto entry = find(id);
  std::unique_lock<std::shared_mutex> guard(entry->mtx);
  requireManager(entry->session, actor);

  Session next = entry->session;
  SessionStateMachine::transition(next, SessionState::Cancelled, deps_.clock->now());
  persist(SessionWrite{ next, std::nullopt, {} });

  entry->session = next;
  entry->open = false;
  locks_.releaseAll(id);
  locks_.forget(id);
  guard.unlock();

  audit("session_cancelled", next, actor);
  return next;
}

Session SessionCoordinator::joinSession(const std::string& code, const CounterId& counter) {
  if (counter.empty())
    throw validationError("counter is required");

  auto entry = findByCode(code);
  std::unique_lock<std::shared_mutex> guard(entry->mtx);
  if (!entry->session.isMultiUser)
    throw StockTakeError(ErrorKind::CounterNotAllowed,
                         "[SessionCoordinator] session " + entry->code +
                             " does not allow additional counters");
  SessionStateMachine::requireActive(entry->session);
  if (entry->session.allowsCounter(counter))
    return entry->session;

  Session next = entry->session;
  next.allowedCounters.push_back(counter);
  next.updatedAt = deps_.clock->now();
  persist(SessionWrite{ next, std::nullopt, {} });
  entry->session = next;
  guard.unlock();

  audit("counter_joined", next, counter);
  return next;
}

//---counting--------------------------------------------------------------

Lock SessionCoordinator::acquireLock(const SessionId& id, const ItemId& item,
                                     const CounterId& counter) {
  auto entry = find(id);
  std::shared_lock<std::shared_mutex> guard(entry->mtx);
  SessionStateMachine::requireActive(entry->session);

  Lock lock = locks_.acquire(entry->session, item, counter);
  audit("lock_acquired", entry->session, counter, item);
  return lock;
}

void SessionCoordinator::releaseLock(const SessionId& id, const ItemId& item,
                                     const CounterId& counter) {
  auto entry = find(id);
  std::shared_lock<std::shared_mutex> guard(entry->mtx);
  SessionStateMachine::requireActive(entry->session);

  locks_.release(id, item, counter);
  audit("lock_released", entry->session, counter, item);
}

CountEntry SessionCoordinator::submitCount(const SessionId& id, const ItemId& item,
                                           const CounterId& counter, Quantity quantity,
                                           const std::string& shelfLocation,
                                           const std::string& notes) {
  auto entry = find(id);
  std::shared_lock<std::shared_mutex> guard(entry->mtx);
  SessionStateMachine::requireActive(entry->session);

  CountEntry recorded = reportingStorage(
      [&] { return ledger_.record(id, item, counter, quantity, shelfLocation, notes); });

  audit("count_recorded", entry->session, counter, item,
        "qty=" + std::to_string(recorded.countedQuantity) +
            " variance=" + std::to_string(recorded.variance));
  return recorded;
}

//---shelf verification----------------------------------------------------

ShelfVerification SessionCoordinator::approveShelf(const SessionId& id, const std::string& shelf,
                                                   const std::string& actor) {
  return verifyShelf(id, shelf, actor, VerificationStatus::Approved, {});
}

ShelfVerification SessionCoordinator::rejectShelf(const SessionId& id, const std::string& shelf,
                                                  const std::string& actor,
                                                  const std::string& reason) {
  return verifyShelf(id, shelf, actor, VerificationStatus::Rejected, trimmed(reason));
}

ShelfVerification SessionCoordinator::verifyShelf(const SessionId& id, const std::string& shelf,
                                                  const std::string& actor,
                                                  VerificationStatus status,
                                                  const std::string& reason) {
  if (shelf.empty())
    throw validationError("shelf is required");

  auto entry = find(id);
  std::shared_lock<std::shared_mutex> guard(entry->mtx);
  requireManager(entry->session, actor);
  SessionStateMachine::requireActive(entry->session);

  ShelfVerification verdict;
  verdict.sessionId = id;
  verdict.shelf = shelf;
  verdict.status = status;
  verdict.verifiedBy = actor;
  verdict.reason = reason;
  {
    std::lock_guard<std::mutex> lk(entry->verdictMtx);
    for (const auto& e : ledger_.history(id)) {
      if (e.shelfLocation != shelf)
        continue;
      ++verdict.countsCovered;
      verdict.throughSequence = std::max(verdict.throughSequence, e.sequence);
    }
    if (verdict.countsCovered == 0)
      throw StockTakeError(ErrorKind::NotFound, "[SessionCoordinator] no counts on shelf " +
                                                    shelf + " in session " + entry->code);
    verdict.verifiedAt = deps_.clock->now();

    reportingStorage([&] { deps_.store->appendVerification(verdict); });
    entry->verifications.push_back(verdict);
  }

  audit(status == VerificationStatus::Approved ? "shelf_approved" : "shelf_rejected",
        entry->session, actor, {},
        "shelf=" + shelf + " through=" + std::to_string(verdict.throughSequence) +
            (reason.empty() ? std::string{} : " reason=" + reason));
  return verdict;
}

//---queries---------------------------------------------------------------

ProgressSnapshot SessionCoordinator::getProgress(const SessionId& id) const {
  auto entry = find(id);
  std::shared_lock<std::shared_mutex> guard(entry->mtx);

  const auto view = ledger_.view(id, aggregator_.recentLimit());
  return aggregator_.snapshot(entry->session, entry->items, view, locks_.activeCount(id));
}

Session SessionCoordinator::getSession(const SessionId& id) const {
  auto entry = find(id);
  std::shared_lock<std::shared_mutex> guard(entry->mtx);
  return entry->session;
}

Session SessionCoordinator::getSessionByCode(const std::string& code) const {
  auto entry = findByCode(code);
  std::shared_lock<std::shared_mutex> guard(entry->mtx);
  return entry->session;
}

std::vector<Session> SessionCoordinator::listSessions(const std::string& branch) const {
  std::vector<std::shared_ptr<SessionEntry>> matching;
  {
    std::shared_lock<std::shared_mutex> guard(registryMtx_);
    for (const auto& [id, entry] : sessions_) {
      if (branch.empty() || entry->branch == branch)
        matching.push_back(entry);
    }
  }

  std::vector<Session> out;
  out.reserve(matching.size());
  for (const auto& entry : matching) {
    std::shared_lock<std::shared_mutex> lk(entry->mtx);
    out.push_back(entry->session);
  }
  std::sort(out.begin(), out.end(), [](const Session& a, const Session& b) {
    return a.createdAt != b.createdAt ? a.createdAt > b.createdAt : a.code > b.code;
  });
  return out;
}

std::vector<AssignedItem> SessionCoordinator::listItems(const SessionId& id) const {
  auto entry = find(id);
  std::shared_lock<std::shared_mutex> guard(entry->mtx);
  return entry->items;
}

std::vector<Lock> SessionCoordinator::listLocks(const SessionId& id) const {
  auto entry = find(id);
  std::shared_lock<std::shared_mutex> guard(entry->mtx);
  return locks_.activeLocks(id);
}

std::vector<CountEntry> SessionCoordinator::listCounts(const SessionId& id) const {
  auto entry = find(id);
  std::shared_lock<std::shared_mutex> guard(entry->mtx);
  return ledger_.history(id);
}

std::vector<CountEntry> SessionCoordinator::listCounterCounts(const SessionId& id,
                                                             const CounterId& counter) const {
  auto entry = find(id);
  std::shared_lock<std::shared_mutex> guard(entry->mtx);
  const auto history = ledger_.history(id);
  guard.unlock();

  std::vector<CountEntry> out;
  for (auto it = history.rbegin(); it != history.rend(); ++it) {
    if (it->counter == counter)
      out.push_back(*it);
  }
  return out;
}

std::vector<CountEntry> SessionCoordinator::listShelfCounts(const SessionId& id,
                                                           const std::string& shelf) const {
  auto entry = find(id);
  std::shared_lock<std::shared_mutex> guard(entry->mtx);
  auto history = ledger_.history(id);
  guard.unlock();

  history.erase(std::remove_if(history.begin(), history.end(),
                               [&](const CountEntry& e) { return e.shelfLocation != shelf; }),
                history.end());
  return history;
}

std::vector<ShelfSummary> SessionCoordinator::listShelves(const SessionId& id) const {
  auto entry = find(id);
  std::shared_lock<std::shared_mutex> guard(entry->mtx);
  const auto history = ledger_.history(id);
  std::vector<ShelfVerification> verdicts;
  {
    std::lock_guard<std::mutex> lk(entry->verdictMtx);
    verdicts = entry->verifications;
  }
  guard.unlock();

  struct Tally {
    std::set<ItemId> items;
    std::set<CounterId> counters;
    std::size_t entries{ 0 };
    std::uint64_t lastSequence{ 0 };
    const ShelfVerification* verdict{ nullptr };
  };
  std::map<std::string, Tally> shelves;
  for (const auto& e : history) {
    if (e.shelfLocation.empty())
      continue;
    auto& t = shelves[e.shelfLocation];
    t.items.insert(e.itemId);
    t.counters.insert(e.counter);
    ++t.entries;
    t.lastSequence = std::max(t.lastSequence, e.sequence);
  }
  for (const auto& v : verdicts) {
    auto it = shelves.find(v.shelf);
    if (it != shelves.end())
      it->second.verdict = &v; // oldest first: the last one wins
  }

  std::vector<ShelfSummary> out;
  out.reserve(shelves.size());
  for (const auto& [shelf, t] : shelves) {
    ShelfSummary row;
    row.shelf = shelf;
    row.itemCount = t.items.size();
    row.entryCount = t.entries;
    row.counters.assign(t.counters.begin(), t.counters.end());
    if (t.verdict) {
      row.lastVerification = *t.verdict;
      // a count newer than the verdict reopens the shelf
      if (t.verdict->throughSequence >= t.lastSequence)
        row.status = t.verdict->status;
    }
    out.push_back(std::move(row));
  }
  return out;
}

std::vector<Adjustment> SessionCoordinator::varianceReport(const SessionId& id) const {
  auto entry = find(id);
  std::shared_lock<std::shared_mutex> guard(entry->mtx);
  if (entry->session.state != SessionState::Completed)
    throw StockTakeError(ErrorKind::NotFound, "[SessionCoordinator] session " +
                                                  entry->session.code + " is not completed");

  auto rows = entry->adjustments;
  std::sort(rows.begin(), rows.end(), [](const Adjustment& a, const Adjustment& b) {
    return a.zeroedOut != b.zeroedOut ? !a.zeroedOut : a.itemId < b.itemId;
  });
  return rows;
}

//---helpers---------------------------------------------------------------

std::shared_ptr<SessionCoordinator::SessionEntry>
SessionCoordinator::find(const SessionId& id) const {
  std::shared_lock<std::shared_mutex> guard(registryMtx_);
  auto it = sessions_.find(id);
  if (it == sessions_.end())
    throw StockTakeError(ErrorKind::NotFound, "[SessionCoordinator] no session " + id);
  return it->second;
}

std::shared_ptr<SessionCoordinator::SessionEntry>
SessionCoordinator::findByCode(const std::string& code) const {
  const std::string wanted = upperCase(trimmed(code));
  std::shared_lock<std::shared_mutex> guard(registryMtx_);
  for (const auto& [id, entry] : sessions_) {
    if (entry->code == wanted)
      return entry;
  }
  throw StockTakeError(ErrorKind::NotFound, "[SessionCoordinator] no session with code " + code);
}

void SessionCoordinator::requireManager(const Session& session, const std::string& actor) const {
  if (actor.empty())
    throw validationError("actor is required");
  if (!deps_.policy->mayManage(actor, session.branch))
    throw StockTakeError(ErrorKind::PermissionDenied, "[SessionCoordinator] " + actor +
                                                          " may not manage branch " +
                                                          session.branch);
}

void SessionCoordinator::persist(const SessionWrite& write) {
  reportingStorage([&] { deps_.store->write(write); });
}

void SessionCoordinator::audit(const char* event, const Session& session,
                               const std::string& actor, const ItemId& item,
                               const std::string& detail) {
  if (!deps_.audit)
    return;
  deps_.audit->log(AuditEvent{ deps_.clock->now(), event, session.id, item, actor, detail });
}
