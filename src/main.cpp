/* @file main.cpp
 * @brief stocktaked: wires the coordinator to its store, catalog and gRPC endpoint
 *
 * © 2026 Stocktake Engine — MIT-licensed.
 */

// STL headers
#include <csignal>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>

// POSIX
#include <pthread.h>

// third-party
#include <grpcpp/grpcpp.h>
#include <nlohmann/json.hpp>

// Stocktake headers
#include "core/AccessPolicy.hpp"
#include "core/AuditLogger.hpp"
#include "core/Clock.hpp"
#include "core/ConfigLoader.hpp"
#include "core/EngineConfig.hpp"
#include "core/ErrorMonitor.hpp"
#include "core/ItemCatalog.hpp"
#include "core/SessionCoordinator.hpp"
#include "core/SessionStore.hpp"
#include "rpc/StockTakeService.hpp"
#include "storage/SqliteSessionStore.hpp"

using namespace stocktake;

namespace {

  std::shared_ptr<core::SessionStore> makeStore(const core::EngineConfig& cfg) {
    if (cfg.databasePath.empty()) {
      std::cout << "[stocktaked] database_path empty, sessions are not durable\n";
      return std::make_shared<core::InMemorySessionStore>();
    }
    return std::make_shared<storage::SqliteSessionStore>(cfg.databasePath);
  }

  std::shared_ptr<core::ItemCatalog> makeCatalog(const core::EngineConfig& cfg) {
    if (cfg.catalogPath.empty())
      return std::make_shared<core::StaticItemCatalog>();
    return core::StaticItemCatalog::fromJson(core::ConfigLoader(cfg.catalogPath).load());
  }

  std::shared_ptr<core::AccessPolicy> makePolicy(const core::EngineConfig& cfg) {
    if (cfg.managers)
      return std::make_shared<core::BranchManagerPolicy>(*cfg.managers);
    return std::make_shared<core::AllowAllPolicy>();
  }

  // Serves until SIGINT/SIGTERM. Signals are blocked in every thread and
  // collected by a dedicated sigwait thread that shuts the server down.
  int runServer(const core::EngineConfig& cfg) {
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);

    auto errorMonitor = std::make_shared<core::ErrorMonitor>();
    errorMonitor->registerEscalation(
        [](const std::string& msg) { std::cerr << "[stocktaked] FAULT: " << msg << '\n'; });

    std::shared_ptr<core::AuditLogger> audit;
    if (!cfg.auditLogPath.empty()) {
      audit = std::make_shared<core::AuditLogger>(errorMonitor);
      if (!audit->start(cfg.auditLogPath)) {
        std::cerr << "[stocktaked] cannot open audit log " << cfg.auditLogPath << '\n';
        return 1;
      }
    }

    core::CoordinatorDeps deps{ makeStore(cfg),   makeCatalog(cfg),
                                makePolicy(cfg),  errorMonitor,
                                std::make_shared<core::SystemClock>(), audit };
    auto coordinator = std::make_shared<core::SessionCoordinator>(
        std::move(deps), core::CoordinatorOptions{ cfg.lockTtl, cfg.recentCountLimit });

    const auto recovered = coordinator->recover();
    std::cout << "[stocktaked] recovered " << recovered << " session(s)\n";

    rpc::StockTakeServiceImpl service(coordinator);
    grpc::ServerBuilder builder;
    builder.AddListeningPort(cfg.listenAddress, grpc::InsecureServerCredentials());
    builder.RegisterService(&service);

    std::unique_ptr<grpc::Server> server(builder.BuildAndStart());
    if (!server) {
      std::cerr << "[stocktaked] failed to listen on " << cfg.listenAddress << '\n';
      return 1;
    }
    std::cout << "[stocktaked] listening on " << cfg.listenAddress << std::endl;

    std::thread waiter([&server, &signals] {
      int sig = 0;
      sigwait(&signals, &sig);
      std::cout << "[stocktaked] signal " << sig << ", shutting down\n";
      server->Shutdown();
    });

    server->Wait();
    waiter.join();

    if (audit)
      audit->stop();
    return 0;
  }

} // namespace

int main(int argc, char** argv) {
  if (argc != 2) {
    std::cerr << "Usage: ./stocktaked <config.json>\n";
    return 1;
  }

  try {
    const auto cfg = core::EngineConfig::fromJson(core::ConfigLoader(argv[1]).load());
    return runServer(cfg);
  } catch (const std::exception& e) {
    std::cerr << "[stocktaked] " << e.what() << '\n';
    return 1;
  }
}
