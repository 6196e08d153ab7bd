#pragma once
/** @file  ErrorMonitor.hpp
 *  @brief Central fault aggregator & escalation helper.
 *
 *  © 2026 Stocktake Engine — MIT-licensed.
 */

#include <cstddef>
#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace stocktake::core {

  /**
 * @class ErrorMonitor
 * @brief Components call `notifyFailure()` on infrastructure faults (store
 *        writes, audit file); the registered escalation runs once per unique message.
 *
 * * Thread-safe (mutex-protected vector).
 * * Request-level errors (LockHeld, InvalidTransition, ...) never come here.
 */
  class ErrorMonitor {
  public:
    ErrorMonitor() = default;
    virtual ~ErrorMonitor() = default;

    /// Register a lambda that escalates a fault (the daemon logs it).
    void registerEscalation(std::function<void(const std::string&)> cb);

    /// Called by components on fault; forwards new messages to the escalation callback.
    virtual void notifyFailure(const std::string& message);

    /// Total notifications, duplicates included.
    std::size_t failureCount() const;

  private:
    void forwardIfNew(const std::string& message);

    std::function<void(const std::string&)> escalation_{};
    std::vector<std::string> seen_; ///< de-dupe list
    std::size_t failures_{ 0 };
    mutable std::mutex mtx_;
  };

} // namespace stocktake::core
