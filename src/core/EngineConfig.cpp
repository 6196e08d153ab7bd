/* @file EngineConfig.cpp
 * @brief schema validation for the daemon config
 *
 * © 2026 Stocktake Engine — MIT-licensed.
 */

// STL headers
#include <cstdint>
#include <stdexcept>
#include <string>

// 3rd-party headers
#include <nlohmann/json.hpp>

// Stocktake headers
#include "core/EngineConfig.hpp"
#include "core/LockManager.hpp"

using namespace stocktake::core;

namespace {

  std::string readString(const nlohmann::json& j, const char* key, const std::string& fallback) {
    if (!j.contains(key))
      return fallback;
    if (!j.at(key).is_string())
      throw std::runtime_error(std::string("[EngineConfig] '") + key + "' must be a string");
    return j.at(key).get<std::string>();
  }

  std::int64_t readPositive(const nlohmann::json& j, const char* key, std::int64_t fallback,
                            std::int64_t max) {
    if (!j.contains(key))
      return fallback;
    const auto& v = j.at(key);
    if (!v.is_number_integer() || (v.is_number_unsigned() && v.get<std::uint64_t>() >
                                                                 static_cast<std::uint64_t>(max)))
      throw std::runtime_error(std::string("[EngineConfig] '") + key +
                               "' must be a positive integer up to " + std::to_string(max));
    const auto n = v.get<std::int64_t>();
    if (n <= 0 || n > max)
      throw std::runtime_error(std::string("[EngineConfig] '") + key +
                               "' must be a positive integer up to " + std::to_string(max));
    return n;
  }

  constexpr std::int64_t kMaxRecentCounts = 1000;

} // namespace

EngineConfig EngineConfig::fromJson(const nlohmann::json& j) {
  if (!j.is_object())
    throw std::runtime_error("[EngineConfig] top level must be an object");

  EngineConfig cfg;
  cfg.listenAddress = readString(j, "listen_address", cfg.listenAddress);
  cfg.lockTtl = std::chrono::seconds{ readPositive(j, "lock_ttl_seconds", cfg.lockTtl.count(),
                                                   LockManager::kMaxTtl.count()) };
  cfg.recentCountLimit = static_cast<std::size_t>(
      readPositive(j, "recent_count_limit", static_cast<std::int64_t>(cfg.recentCountLimit),
                   kMaxRecentCounts));
  cfg.databasePath = readString(j, "database_path", cfg.databasePath);
  cfg.auditLogPath = readString(j, "audit_log_path", cfg.auditLogPath);
  cfg.catalogPath = readString(j, "catalog_path", cfg.catalogPath);

  if (cfg.listenAddress.empty())
    throw std::runtime_error("[EngineConfig] 'listen_address' must not be empty");

  if (j.contains("managers")) {
    const auto& m = j.at("managers");
    if (!m.is_object())
      throw std::runtime_error("[EngineConfig] 'managers' must map branch -> [actor]");
    std::map<std::string, std::set<std::string>> managers;
    for (auto it = m.begin(); it != m.end(); ++it) {
      if (!it.value().is_array())
        throw std::runtime_error("[EngineConfig] managers of branch '" + it.key() +
                                 "' must be an array");
      auto& actors = managers[it.key()];
      for (const auto& a : it.value()) {
        if (!a.is_string() || a.get<std::string>().empty())
          throw std::runtime_error("[EngineConfig] managers of branch '" + it.key() +
                                   "' must be non-empty strings");
        actors.insert(a.get<std::string>());
      }
    }
    cfg.managers = std::move(managers);
  }
  return cfg;
}
