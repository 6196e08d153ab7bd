#pragma once
/** @file  FileLogger.hpp
 *  @brief Buffered append-only CSV writer for the host FS.
 *
 *  © 2026 Stocktake Engine — MIT-licensed.
 */

#include <cstddef>
#include <cstdio>
#include <string>
#include <vector>

namespace stocktake {
  namespace io {

    /**
 * @class FileLogger
 * @brief RAII wrapper that opens a file for append, buffers writes, and flushes on demand.
 *
 *  * Buffers up to 4 kB before an implicit `std::fwrite`.
 *  * Not thread-safe; AuditLogger drives it from its single worker.
 */
    class FileLogger {
    public:
      FileLogger() = default;
      ~FileLogger(); ///< flush + fclose

      //---public API------------------------------------------------------
      /** @returns false if path cannot be opened writable. */
      bool open(const std::string& path);

      /** Queues one CSV line (caller includes trailing '\n'); false if an implicit flush failed. */
      bool write(const std::string& csv);

      /** Force-flush buffer to disk; returns true on success. */
      bool flush();

      void close();

      bool isOpen() const { return fp_ != nullptr; }

      /** @returns true if the open file had no content when opened. */
      bool wasEmpty() const { return wasEmpty_; }

      //---non-copyable, move-enabled---------------------------------------
      FileLogger(const FileLogger&) = delete;
      FileLogger& operator=(const FileLogger&) = delete;
      FileLogger(FileLogger&& other) noexcept;
      FileLogger& operator=(FileLogger&& other) noexcept;

    private:
      static constexpr std::size_t kChunk = 4096;

      FILE* fp_{ nullptr };
      bool wasEmpty_{ false };
      std::vector<char> buffer_;
    };

  } // namespace io
} // namespace stocktake
