#pragma once
/** @file  RingBuffer.hpp
 *  @brief Bounded many-producer / single-consumer queue used by the async logger.
 *
 *  © 2025 Milo Medical — MIT-licensed.
 */

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace carpark::core {

  /**
   * @class RingBuffer
   * @brief Fixed-capacity FIFO; a push into a full buffer evicts the oldest entry.
   *
   *  * push() never blocks the producer.
   *  * After close(), pop() drains what is left, then returns std::nullopt.
   */
  template <typename T> class RingBuffer {
  public:
    enum class PushResult { Stored, Overwrote, Closed };

    explicit RingBuffer(std::size_t capacity) : capacity_{ capacity ? capacity : 1 } {}

    PushResult push(T item) {
      std::lock_guard<std::mutex> lock(mtx_);
      if (closed_)
        return PushResult::Closed;
      PushResult result = PushResult::Stored;
      if (items_.size() == capacity_) {
        items_.pop_front();
        result = PushResult::Overwrote;
      }
      items_.push_back(std::move(item));
      cv_.notify_one();
      return result;
    }

    /// Blocks until an item is available or the buffer is closed and empty.
    std::optional<T> pop() {
      std::unique_lock<std::mutex> lock(mtx_);
      cv_.wait(lock, [this] { return !items_.empty() || closed_; });
      return takeLocked();
    }

    /// As pop(), but gives up after \p timeout.
    std::optional<T> popFor(std::chrono::milliseconds timeout) {
      std::unique_lock<std::mutex> lock(mtx_);
      cv_.wait_for(lock, timeout, [this] { return !items_.empty() || closed_; });
      return takeLocked();
    }

    void close() {
      std::lock_guard<std::mutex> lock(mtx_);
      closed_ = true;
      cv_.notify_all();
    }

    /// Re-arm a closed buffer; pending items are discarded.
    void reopen() {
      std::lock_guard<std::mutex> lock(mtx_);
      items_.clear();
      closed_ = false;
    }

    std::size_t size() const {
      std::lock_guard<std::mutex> lock(mtx_);
      return items_.size();
    }

    std::size_t capacity() const { return capacity_; }

  private:
    std::optional<T> takeLocked() {
      if (items_.empty())
        return std::nullopt;
      T item = std::move(items_.front());
      items_.pop_front();
      return item;
    }

    const std::size_t capacity_;
    std::deque<T> items_;
    bool closed_{ false };
    mutable std::mutex mtx_;
    std::condition_variable cv_;
  };

} // namespace carpark::core
