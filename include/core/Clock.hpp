#pragma once
/** @file  Clock.hpp
 *  @brief Injectable wall clock so lock TTLs can be driven from tests.
 *
 *  © 2026 Stocktake Engine — MIT-licensed.
 */

#include <chrono>

#include "core/Types.hpp"

namespace stocktake {
  namespace core {

    class Clock {
    public:
      virtual ~Clock() = default;
      virtual TimePoint now() const = 0;
    };

    class SystemClock : public Clock {
    public:
      TimePoint now() const override { return std::chrono::system_clock::now(); }
    };

  } // namespace core
} // namespace stocktake
