#pragma once
/** @file  ManualClock.hpp
 *  @brief Clock whose time only moves when the test says so.
 *
 *  © 2026 Stocktake Engine — MIT-licensed.
 */

#include <chrono>
#include <mutex>

#include "core/Clock.hpp"

namespace stocktake {
  namespace test {

    class ManualClock : public stocktake::core::Clock {
    public:
      explicit ManualClock(core::TimePoint start = core::fromMillis(1'740'787'200'000)) // 2025-03-01
          : now_(start) {}

      core::TimePoint now() const override {
        std::lock_guard<std::mutex> lock(mtx_);
        return now_;
      }

      void advance(std::chrono::milliseconds d) {
        std::lock_guard<std::mutex> lock(mtx_);
        now_ += d;
      }

      void set(core::TimePoint t) {
        std::lock_guard<std::mutex> lock(mtx_);
        now_ = t;
      }

    private:
      mutable std::mutex mtx_;
      core::TimePoint now_;
    };

  } // namespace test
} // namespace stocktake
