#pragma once
/** @file  FlakySessionStore.hpp
 *  @brief InMemorySessionStore derivative whose writes can be made to fail on demand.
 *
 *  © 2026 Stocktake Engine — MIT-licensed.
 */

#include <atomic>
#include <chrono>
#include <cstddef>
#include <thread>

#include "core/Errors.hpp"
#include "core/SessionStore.hpp"

namespace stocktake {
  namespace test {

    class FlakySessionStore : public stocktake::core::InMemorySessionStore {
    public:
      std::atomic<bool> fail_writes{ false };
      std::atomic<bool> fail_appends{ false };
      std::atomic<std::size_t> append_calls{ 0 };
      std::atomic<std::size_t> write_calls{ 0 };
      std::atomic<int> write_delay_ms{ 0 };

      void write(const core::SessionWrite& w) override {
        ++write_calls;
        if (const int delay = write_delay_ms.load(); delay > 0)
          std::this_thread::sleep_for(std::chrono::milliseconds{ delay });
        if (fail_writes)
          throw core::StockTakeError(core::ErrorKind::Storage, "[FlakySessionStore] disk full");
        InMemorySessionStore::write(w);
      }

      void appendCount(const core::CountEntry& entry) override {
        ++append_calls;
        if (fail_appends)
          throw core::StockTakeError(core::ErrorKind::Storage, "[FlakySessionStore] disk full");
        InMemorySessionStore::appendCount(entry);
      }

      void appendVerification(const core::ShelfVerification& verdict) override {
        if (fail_appends)
          throw core::StockTakeError(core::ErrorKind::Storage, "[FlakySessionStore] disk full");
        InMemorySessionStore::appendVerification(verdict);
      }
    };

  } // namespace test
} // namespace stocktake
