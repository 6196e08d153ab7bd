/* @file ErrorMonitor.cpp
 * @brief de-duplicating fault escalation
 *
 * © 2026 Stocktake Engine — MIT-licensed.
 */

#include <algorithm>

#include "core/ErrorMonitor.hpp"

namespace stocktake {
  namespace core {

    void ErrorMonitor::registerEscalation(std::function<void(const std::string&)> cb) {
      std::lock_guard<std::mutex> lock(mtx_);
      escalation_ = std::move(cb);
    }

    void ErrorMonitor::notifyFailure(const std::string& message) { forwardIfNew(message); }

    std::size_t ErrorMonitor::failureCount() const {
      std::lock_guard<std::mutex> lock(mtx_);
      return failures_;
    }

    void ErrorMonitor::forwardIfNew(const std::string& message) {
      std::function<void(const std::string&)> cb;
      {
        std::lock_guard<std::mutex> lock(mtx_);
        ++failures_;
        if (std::find(seen_.begin(), seen_.end(), message) != seen_.end())
          return;
        seen_.push_back(message);
        cb = escalation_;
      }
      // escalate outside the lock so the callback may call back into us
      if (cb)
        cb(message);
    }

  } // namespace core
} // namespace stocktake
