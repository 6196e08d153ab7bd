#pragma once
/** @file  RingBuffer.hpp
 *  @brief Bounded multi-producer / single-consumer queue for the audit worker.
 *
 *  © 2026 Stocktake Engine — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <utility>
#include <vector>

namespace stocktake {
  namespace core {

    /**
 * @class RingBuffer
 * @brief Fixed-capacity circular queue; producers never block.
 *
 *  * `tryPush()` returns false when full or closed (caller counts the drop).
 *  * `pop()` waits up to a timeout; after `close()` it keeps returning items
 *    until empty so the consumer can drain.
 */
    template <typename T> class RingBuffer {
    public:
      explicit RingBuffer(std::size_t capacity) : slots_(capacity) {
        if (capacity == 0)
          throw std::invalid_argument("[RingBuffer] capacity must be positive");
      }

      bool tryPush(T value) {
        {
          std::lock_guard<std::mutex> lock(mtx_);
          if (closed_ || size_ == slots_.size())
            return false;
          slots_[(head_ + size_) % slots_.size()] = std::move(value);
          ++size_;
        }
        cv_.notify_one();
        return true;
      }

      std::optional<T> pop(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mtx_);
        cv_.wait_for(lock, timeout, [this] { return size_ > 0 || closed_; });
        if (size_ == 0)
          return std::nullopt;
        T value = std::move(slots_[head_]);
        head_ = (head_ + 1) % slots_.size();
        --size_;
        return value;
      }

      void close() {
        {
          std::lock_guard<std::mutex> lock(mtx_);
          closed_ = true;
        }
        cv_.notify_all();
      }

      bool drained() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return closed_ && size_ == 0;
      }

      std::size_t size() const {
        std::lock_guard<std::mutex> lock(mtx_);
        return size_;
      }

    private:
      std::vector<T> slots_;
      std::size_t head_{ 0 };
      std::size_t size_{ 0 };
      bool closed_{ false };
      mutable std::mutex mtx_;
      std::condition_variable cv_;
    };

  } // namespace core
} // namespace stocktake
