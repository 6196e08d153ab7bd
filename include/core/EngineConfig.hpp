#pragma once
/** @file  EngineConfig.hpp
 *  @brief Typed view of the daemon's JSON configuration.
 *
 *  © 2026 Stocktake Engine — MIT-licensed.
 */

#include <chrono>
#include <cstddef>
#include <map>
#include <optional>
#include <set>
#include <string>

#include <nlohmann/json_fwd.hpp>

namespace stocktake::core {

  struct EngineConfig {
    std::string listenAddress{ "0.0.0.0:50051" };
    std::chrono::seconds lockTtl{ 300 };
    std::size_t recentCountLimit{ 20 };
    std::string databasePath{ "stocktake.db" };       ///< empty = in-memory store
    std::string auditLogPath{ "stocktake_audit.csv" }; ///< empty = no audit log
    std::string catalogPath;                           ///< empty = empty catalog

    /// branch -> actors allowed to run lifecycle transitions; absent = allow everyone
    std::optional<std::map<std::string, std::set<std::string>>> managers;

    /// Validates \p j against the schema; throws `std::runtime_error` naming the bad key.
    static EngineConfig fromJson(const nlohmann::json& j);
  };

} // namespace stocktake::core
