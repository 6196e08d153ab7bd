#pragma once
/** @file  StockTakeService.hpp
 *  @brief gRPC adapter that proxies each RPC into the SessionCoordinator.
 *
 *  © 2026 Stocktake Engine — MIT-licensed.
 */

#include <memory>

#include <grpcpp/grpcpp.h>

#include "core/Errors.hpp"
#include "core/SessionCoordinator.hpp"
#include "stocktake.grpc.pb.h"

namespace stocktake {
  namespace rpc {

    /**
 * @class StockTakeServiceImpl
 * @brief Translates wire messages to coordinator calls and StockTakeError to grpc::Status.
 *
 *  * Holds no state of its own; all concurrency control lives in the coordinator.
 *  * Status message is "<ErrorKind>: <detail>" so polling clients can tell
 *    "try again" (ABORTED) from "not allowed".
 */
    class StockTakeServiceImpl final : public v1::StockTakeService::Service {
    public:
      explicit StockTakeServiceImpl(std::shared_ptr<core::SessionCoordinator> coordinator);

      grpc::Status CreateSession(grpc::ServerContext*, const v1::CreateSessionRequest* req,
                                 v1::Session* reply) override;
      grpc::Status StartSession(grpc::ServerContext*, const v1::TransitionRequest* req,
                                v1::Session* reply) override;
      grpc::Status PauseSession(grpc::ServerContext*, const v1::TransitionRequest* req,
                                v1::Session* reply) override;
      grpc::Status ResumeSession(grpc::ServerContext*, const v1::TransitionRequest* req,
                                 v1::Session* reply) override;
      grpc::Status CompleteSession(grpc::ServerContext*, const v1::CompleteSessionRequest* req,
                                   v1::Session* reply) override;
      grpc::Status CancelSession(grpc::ServerContext*, const v1::TransitionRequest* req,
                                 v1::Session* reply) override;

      grpc::Status AcquireLock(grpc::ServerContext*, const v1::LockRequest* req,
                               v1::Lock* reply) override;
      grpc::Status ReleaseLock(grpc::ServerContext*, const v1::LockRequest* req,
                               v1::ReleaseLockReply* reply) override;
      grpc::Status SubmitCount(grpc::ServerContext*, const v1::SubmitCountRequest* req,
                               v1::CountEntry* reply) override;

      grpc::Status GetProgress(grpc::ServerContext*, const v1::SessionRef* req,
                               v1::ProgressSnapshot* reply) override;
      grpc::Status GetSession(grpc::ServerContext*, const v1::SessionRef* req,
                              v1::Session* reply) override;
      grpc::Status GetSessionByCode(grpc::ServerContext*, const v1::SessionCodeRef* req,
                                    v1::Session* reply) override;
      grpc::Status ListSessions(grpc::ServerContext*, const v1::ListSessionsRequest* req,
                                v1::ListSessionsReply* reply) override;
      grpc::Status ListLocks(grpc::ServerContext*, const v1::SessionRef* req,
                             v1::ListLocksReply* reply) override;
      grpc::Status ListCounts(grpc::ServerContext*, const v1::SessionRef* req,
                              v1::ListCountsReply* reply) override;
      grpc::Status GetVarianceReport(grpc::ServerContext*, const v1::SessionRef* req,
                                     v1::VarianceReport* reply) override;

      grpc::Status JoinSession(grpc::ServerContext*, const v1::JoinSessionRequest* req,
                               v1::Session* reply) override;
      grpc::Status ApproveShelf(grpc::ServerContext*, const v1::ShelfVerdictRequest* req,
                                v1::ShelfVerification* reply) override;
      grpc::Status RejectShelf(grpc::ServerContext*, const v1::ShelfVerdictRequest* req,
                               v1::ShelfVerification* reply) override;
      grpc::Status ListShelves(grpc::ServerContext*, const v1::SessionRef* req,
                               v1::ListShelvesReply* reply) override;
      grpc::Status ListShelfCounts(grpc::ServerContext*, const v1::ShelfRef* req,
                                   v1::ListCountsReply* reply) override;
      grpc::Status ListCounterCounts(grpc::ServerContext*, const v1::CounterRef* req,
                                     v1::ListCountsReply* reply) override;

      static grpc::StatusCode statusFor(core::ErrorKind kind);

    private:
      template <typename Fn> grpc::Status guarded(const char* rpc, Fn&& fn);

      std::shared_ptr<core::SessionCoordinator> coordinator_;
    };

  } // namespace rpc
} // namespace stocktake
