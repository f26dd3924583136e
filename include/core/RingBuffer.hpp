#pragma once
/** @file  RingBuffer.hpp
 *  @brief Bounded MPSC queue used to hand log events to the logger thread.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

// STL headers
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace chime {
  namespace core {

    /**
 * @class RingBuffer
 * @brief Fixed-capacity FIFO; `push()` never blocks and overwrites the oldest
 *        entry once full.
 *
 *  * Producers: any thread.  Consumer: one worker calling `popFor()`.
 *  * `close()` wakes the consumer so it can drain and exit.
 */
    template <typename T> class RingBuffer {
    public:
      explicit RingBuffer(std::size_t capacity) : capacity_(capacity) {}

      /// @returns false if an old entry had to be dropped to make room.
      bool push(T item) {
        bool dropped = false;
        {
          std::lock_guard lock(mtx_);
          if (items_.size() >= capacity_) {
            items_.pop_front();
            ++dropped_;
            dropped = true;
          }
          items_.push_back(std::move(item));
        }
        cv_.notify_one();
        return !dropped;
      }

      /// Waits up to \p timeout for an item; std::nullopt on timeout or when closed and empty.
      std::optional<T> popFor(std::chrono::milliseconds timeout) {
        std::unique_lock lock(mtx_);
        cv_.wait_for(lock, timeout, [this] { return !items_.empty() || closed_; });
        if (items_.empty())
          return std::nullopt;
        T item = std::move(items_.front());
        items_.pop_front();
        return item;
      }

      void close() {
        {
          std::lock_guard lock(mtx_);
          closed_ = true;
        }
        cv_.notify_all();
      }

      bool closed() const {
        std::lock_guard lock(mtx_);
        return closed_;
      }

      bool empty() const {
        std::lock_guard lock(mtx_);
        return items_.empty();
      }

      std::size_t dropped() const {
        std::lock_guard lock(mtx_);
        return dropped_;
      }

    private:
      const std::size_t capacity_;
      std::deque<T> items_;
      std::size_t dropped_{ 0 };
      bool closed_{ false };
      mutable std::mutex mtx_;
      std::condition_variable cv_;
    };

  } // namespace core
} // namespace chime
