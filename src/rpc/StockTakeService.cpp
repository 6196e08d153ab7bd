/* @file StockTakeService.cpp
 * @brief wire <-> coordinator translation and error-kind to status mapping
 *
 * © 2026 Stocktake Engine — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

// Stocktake headers
#include "rpc/StockTakeService.hpp"

using namespace stocktake::rpc;
using grpc::ServerContext;
using grpc::Status;
using grpc::StatusCode;

namespace core = stocktake::core;
namespace v1 = stocktake::v1;

namespace {

  std::int64_t optMillis(const std::optional<core::TimePoint>& t) {
    return t ? core::toMillis(*t) : 0;
  }

  v1::SessionState toProto(core::SessionState s) {
    switch (s) {
    case core::SessionState::Draft:
      return v1::DRAFT;
    case core::SessionState::Active:
      return v1::ACTIVE;
    case core::SessionState::Paused:
      return v1::PAUSED;
    case core::SessionState::Completed:
      return v1::COMPLETED;
    case core::SessionState::Cancelled:
      return v1::CANCELLED;
    default:
      return v1::SESSION_STATE_UNSPECIFIED;
    }
  }

  void toProto(const core::Session& s, v1::Session* out) {
    out->set_id(s.id);
    out->set_code(s.code);
    out->set_branch(s.branch);
    out->set_created_by(s.createdBy);
    out->set_is_multi_user(s.isMultiUser);
    for (const auto& c : s.allowedCounters)
      out->add_allowed_counters(c);
    for (const auto& [shelf, counter] : s.shelfAssignments)
      (*out->mutable_shelf_assignments())[shelf] = counter;
    out->set_notes(s.notes);
    out->set_state(toProto(s.state));
    out->set_created_at_ms(core::toMillis(s.createdAt));
    out->set_updated_at_ms(core::toMillis(s.updatedAt));
    out->set_started_at_ms(optMillis(s.startedAt));
    out->set_paused_at_ms(optMillis(s.pausedAt));
    out->set_completed_at_ms(optMillis(s.completedAt));
    out->set_cancelled_at_ms(optMillis(s.cancelledAt));
    out->set_completed_by(s.completedBy);
    out->set_forced(s.forced);
  }

  void toProto(const core::Lock& l, v1::Lock* out) {
    out->set_session_id(l.sessionId);
    out->set_item_id(l.itemId);
    out->set_counter(l.counter);
    out->set_acquired_at_ms(core::toMillis(l.acquiredAt));
    out->set_expires_at_ms(core::toMillis(l.expiresAt));
  }

  void toProto(const core::CountEntry& e, v1::CountEntry* out) {
    out->set_session_id(e.sessionId);
    out->set_sequence(e.sequence);
    out->set_item_id(e.itemId);
    out->set_counter(e.counter);
    out->set_counted_quantity(e.countedQuantity);
    out->set_baseline(e.baseline);
    out->set_variance(e.variance);
    out->set_shelf_location(e.shelfLocation);
    out->set_notes(e.notes);
    out->set_counted_at_ms(core::toMillis(e.countedAt));
  }

  v1::VerificationStatus toProto(core::VerificationStatus v) {
    switch (v) {
    case core::VerificationStatus::Approved:
      return v1::APPROVED;
    case core::VerificationStatus::Rejected:
      return v1::REJECTED;
    default:
      return v1::PENDING;
    }
  }

  void toProto(const core::ShelfVerification& v, v1::ShelfVerification* out) {
    out->set_session_id(v.sessionId);
    out->set_shelf(v.shelf);
    out->set_status(toProto(v.status));
    out->set_verified_by(v.verifiedBy);
    out->set_verified_at_ms(core::toMillis(v.verifiedAt));
    out->set_reason(v.reason);
    out->set_through_sequence(v.throughSequence);
    out->set_counts_covered(static_cast<std::uint32_t>(v.countsCovered));
  }

  void toProto(const core::ShelfSummary& s, v1::ShelfSummary* out) {
    out->set_shelf(s.shelf);
    out->set_item_count(static_cast<std::uint32_t>(s.itemCount));
    out->set_entry_count(static_cast<std::uint32_t>(s.entryCount));
    for (const auto& c : s.counters)
      out->add_counters(c);
    out->set_status(toProto(s.status));
    if (s.lastVerification)
      toProto(*s.lastVerification, out->mutable_last_verification());
  }

  void toProto(const core::ProgressSnapshot& p, v1::ProgressSnapshot* out) {
    out->set_session_id(p.sessionId);
    out->set_session_code(p.sessionCode);
    out->set_state(toProto(p.state));
    out->set_total_items(static_cast<std::uint32_t>(p.totalItems));
    out->set_total_counted(static_cast<std::uint32_t>(p.totalCounted));
    out->set_missing_items(static_cast<std::uint32_t>(p.missingItems));
    out->set_percent_complete(p.percentComplete);
    out->set_active_locks(static_cast<std::uint32_t>(p.activeLocks));
    for (const auto& c : p.counters) {
      auto* cp = out->add_counters();
      cp->set_counter(c.counter);
      cp->set_items_assigned(static_cast<std::uint32_t>(c.itemsAssigned));
      cp->set_items_counted(static_cast<std::uint32_t>(c.itemsCounted));
      cp->set_percent(c.percent);
    }
    for (const auto& e : p.recentCounts)
      toProto(e, out->add_recent_counts());
  }

  core::CreateSessionRequest fromProto(const v1::CreateSessionRequest& in) {
    core::CreateSessionRequest req;
    req.branch = in.branch();
    req.createdBy = in.created_by();
    req.isMultiUser = in.is_multi_user();
    req.allowedCounters.assign(in.allowed_counters().begin(), in.allowed_counters().end());
    for (const auto& kv : in.shelf_assignments())
      req.shelfAssignments[kv.first] = kv.second;
    req.notes = in.notes();
    for (const auto& seed : in.items())
      req.items.push_back(core::CatalogItem{ seed.item_id(), seed.shelf(), seed.quantity() });
    return req;
  }

} // namespace

StockTakeServiceImpl::StockTakeServiceImpl(std::shared_ptr<core::SessionCoordinator> coordinator)
    : coordinator_(std::move(coordinator)) {
  if (!coordinator_)
    throw std::invalid_argument("[StockTakeService] coordinator is nullptr");
}

StatusCode StockTakeServiceImpl::statusFor(core::ErrorKind kind) {
  switch (kind) {
  case core::ErrorKind::ValidationError:
    return StatusCode::INVALID_ARGUMENT;
  case core::ErrorKind::NotFound:
  case core::ErrorKind::ItemNotAssigned:
    return StatusCode::NOT_FOUND;
  case core::ErrorKind::InvalidTransition:
  case core::ErrorKind::SessionNotActive:
  case core::ErrorKind::IncompleteItems:
    return StatusCode::FAILED_PRECONDITION;
  case core::ErrorKind::LockHeld:
  case core::ErrorKind::LockNotHeld:
    return StatusCode::ABORTED;
  case core::ErrorKind::CounterNotAllowed:
  case core::ErrorKind::PermissionDenied:
    return StatusCode::PERMISSION_DENIED;
  case core::ErrorKind::Storage:
    return StatusCode::UNAVAILABLE;
  default:
    return StatusCode::UNKNOWN;
  }
}

template <typename Fn> Status StockTakeServiceImpl::guarded(const char* rpc, Fn&& fn) {
  try {
    fn();
    return Status::OK;
  } catch (const core::StockTakeError& e) {
    std::string msg = std::string(core::toString(e.kind())) + ": " + e.what();
    if (!e.missingItems().empty()) {
      msg += " [";
      for (std::size_t i = 0; i < e.missingItems().size(); ++i)
        msg += (i ? "," : "") + e.missingItems()[i];
      msg += "]";
    }
    return Status(statusFor(e.kind()), msg);
  } catch (const std::exception& e) {
    std::cerr << "[StockTakeService] " << rpc << " failed: " << e.what() << '\n';
    return Status(StatusCode::INTERNAL, std::string("Internal: ") + e.what());
  }
}

//---lifecycle-------------------------------------------------------------

Status StockTakeServiceImpl::CreateSession(ServerContext*, const v1::CreateSessionRequest* req,
                                           v1::Session* reply) {
  return guarded("CreateSession",
                 [&] { toProto(coordinator_->createSession(fromProto(*req)), reply); });
}

Status StockTakeServiceImpl::StartSession(ServerContext*, const v1::TransitionRequest* req,
                                          v1::Session* reply) {
  return guarded("StartSession", [&] {
    toProto(coordinator_->startSession(req->session_id(), req->actor()), reply);
  });
}

Status StockTakeServiceImpl::PauseSession(ServerContext*, const v1::TransitionRequest* req,
                                          v1::Session* reply) {
  return guarded("PauseSession", [&] {
    toProto(coordinator_->pauseSession(req->session_id(), req->actor()), reply);
  });
}

Status StockTakeServiceImpl::ResumeSession(ServerContext*, const v1::TransitionRequest* req,
                                           v1::Session* reply) {
  return guarded("ResumeSession", [&] {
    toProto(coordinator_->resumeSession(req->session_id(), req->actor()), reply);
  });
}

Status StockTakeServiceImpl::CompleteSession(ServerContext*,
                                             const v1::CompleteSessionRequest* req,
                                             v1::Session* reply) {
  return guarded("CompleteSession", [&] {
    toProto(coordinator_->completeSession(req->session_id(), req->actor(), req->force()), reply);
  });
}

Status StockTakeServiceImpl::CancelSession(ServerContext*, const v1::TransitionRequest* req,
                                           v1::Session* reply) {
  return guarded("CancelSession", [&] {
    toProto(coordinator_->cancelSession(req->session_id(), req->actor()), reply);
  });
}

//---counting--------------------------------------------------------------

Status StockTakeServiceImpl::AcquireLock(ServerContext*, const v1::LockRequest* req,
                                         v1::Lock* reply) {
  return guarded("AcquireLock", [&] {
    toProto(coordinator_->acquireLock(req->session_id(), req->item_id(), req->counter()), reply);
  });
}

Status StockTakeServiceImpl::ReleaseLock(ServerContext*, const v1::LockRequest* req,
                                         v1::ReleaseLockReply*) {
  return guarded("ReleaseLock", [&] {
    coordinator_->releaseLock(req->session_id(), req->item_id(), req->counter());
  });
}

Status StockTakeServiceImpl::SubmitCount(ServerContext*, const v1::SubmitCountRequest* req,
                                         v1::CountEntry* reply) {
  return guarded("SubmitCount", [&] {
    toProto(coordinator_->submitCount(req->session_id(), req->item_id(), req->counter(),
                                      req->quantity(), req->shelf_location(), req->notes()),
            reply);
  });
}

//---queries---------------------------------------------------------------

Status StockTakeServiceImpl::GetProgress(ServerContext*, const v1::SessionRef* req,
                                         v1::ProgressSnapshot* reply) {
  return guarded("GetProgress",
                 [&] { toProto(coordinator_->getProgress(req->session_id()), reply); });
}

Status StockTakeServiceImpl::GetSession(ServerContext*, const v1::SessionRef* req,
                                        v1::Session* reply) {
  return guarded("GetSession", [&] { toProto(coordinator_->getSession(req->session_id()), reply); });
}

Status StockTakeServiceImpl::GetSessionByCode(ServerContext*, const v1::SessionCodeRef* req,
                                              v1::Session* reply) {
  return guarded("GetSessionByCode",
                 [&] { toProto(coordinator_->getSessionByCode(req->code()), reply); });
}

Status StockTakeServiceImpl::ListSessions(ServerContext*, const v1::ListSessionsRequest* req,
                                          v1::ListSessionsReply* reply) {
  return guarded("ListSessions", [&] {
    for (const auto& s : coordinator_->listSessions(req->branch()))
      toProto(s, reply->add_sessions());
  });
}

Status StockTakeServiceImpl::ListLocks(ServerContext*, const v1::SessionRef* req,
                                       v1::ListLocksReply* reply) {
  return guarded("ListLocks", [&] {
    for (const auto& l : coordinator_->listLocks(req->session_id()))
      toProto(l, reply->add_locks());
  });
}

Status StockTakeServiceImpl::ListCounts(ServerContext*, const v1::SessionRef* req,
                                        v1::ListCountsReply* reply) {
  return guarded("ListCounts", [&] {
    for (const auto& e : coordinator_->listCounts(req->session_id()))
      toProto(e, reply->add_entries());
  });
}

Status StockTakeServiceImpl::GetVarianceReport(ServerContext*, const v1::SessionRef* req,
                                               v1::VarianceReport* reply) {
  return guarded("GetVarianceReport", [&] {
    const auto rows = coordinator_->varianceReport(req->session_id());
    const auto session = coordinator_->getSession(req->session_id());
    reply->set_session_id(session.id);
    reply->set_completed_at_ms(optMillis(session.completedAt));
    for (const auto& a : rows) {
      auto* row = reply->add_rows();
      row->set_item_id(a.itemId);
      row->set_baseline(a.baseline);
      row->set_counted(a.counted);
      row->set_adjustment(a.adjustment);
      row->set_zeroed_out(a.zeroedOut);
    }
  });
}

//---counter join and shelf verification-----------------------------------

Status StockTakeServiceImpl::JoinSession(ServerContext*, const v1::JoinSessionRequest* req,
                                         v1::Session* reply) {
  return guarded("JoinSession",
                 [&] { toProto(coordinator_->joinSession(req->code(), req->counter()), reply); });
}

Status StockTakeServiceImpl::ApproveShelf(ServerContext*, const v1::ShelfVerdictRequest* req,
                                          v1::ShelfVerification* reply) {
  return guarded("ApproveShelf", [&] {
    toProto(coordinator_->approveShelf(req->session_id(), req->shelf(), req->actor()), reply);
  });
}

Status StockTakeServiceImpl::RejectShelf(ServerContext*, const v1::ShelfVerdictRequest* req,
                                         v1::ShelfVerification* reply) {
  return guarded("RejectShelf", [&] {
    toProto(coordinator_->rejectShelf(req->session_id(), req->shelf(), req->actor(),
                                      req->reason()),
            reply);
  });
}

Status StockTakeServiceImpl::ListShelves(ServerContext*, const v1::SessionRef* req,
                                         v1::ListShelvesReply* reply) {
  return guarded("ListShelves", [&] {
    for (const auto& s : coordinator_->listShelves(req->session_id()))
      toProto(s, reply->add_shelves());
  });
}

Status StockTakeServiceImpl::ListShelfCounts(ServerContext*, const v1::ShelfRef* req,
                                             v1::ListCountsReply* reply) {
  return guarded("ListShelfCounts", [&] {
    for (const auto& e : coordinator_->listShelfCounts(req->session_id(), req->shelf()))
      toProto(e, reply->add_entries());
  });
}

Status StockTakeServiceImpl::ListCounterCounts(ServerContext*, const v1::CounterRef* req,
                                               v1::ListCountsReply* reply) {
  return guarded("ListCounterCounts", [&] {
    for (const auto& e : coordinator_->listCounterCounts(req->session_id(), req->counter()))
      toProto(e, reply->add_entries());
  });
}
