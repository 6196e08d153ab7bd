#pragma once
/** @file  AuditLogger.hpp
 *  @brief Asynchronous CSV audit trail (runs its own worker thread).
 *
 *  © 2026 Stocktake Engine — MIT-licensed.
 */

#include <atomic>
#include <cstddef>
#include <memory>
#include <string>
#include <thread>

#include "core/Types.hpp"
#include "io/FileLogger.hpp"

namespace stocktake {
  namespace core {

    class ErrorMonitor;
    template <typename T> class RingBuffer; // forward decl to avoid heavy include

    /// One audit row: `timestamp,event,session,item,actor,detail`.
    struct AuditEvent {
      TimePoint at{};
      std::string event; ///< session_created, session_started, lock_acquired, count_recorded, ...
      SessionId session;
      ItemId item;
      std::string actor;
      std::string detail;

      std::string toCsv() const;
    };

    class AuditLogger {

    public:
      explicit AuditLogger(std::shared_ptr<ErrorMonitor> errorMonitor = nullptr,
                           std::size_t capacity = 4096);
      ~AuditLogger(); ///< stop()

      // --- public API ---
      bool start(const std::string& path); ///< open file + launch worker thread
      void log(AuditEvent event);          ///< enqueue event (non-blocking, drops when full)
      void stop();                         ///< drain + flush + join worker thread

      bool running() const { return running_.load(); }
      std::size_t dropped() const { return dropped_.load(); }

      AuditLogger(const AuditLogger&) = delete;
      AuditLogger& operator=(const AuditLogger&) = delete;

    private:
      void drain();

      std::shared_ptr<ErrorMonitor> errorMonitor_;
      std::size_t capacity_;
      std::string path_;
      io::FileLogger file_;
      std::unique_ptr<RingBuffer<AuditEvent>> buffer_;
      std::thread worker_;
      std::atomic<bool> running_{ false };
      std::atomic<std::size_t> dropped_{ 0 };
    };

  } // namespace core
} // namespace stocktake
