#ifndef PFRELAY_RUNTIME_BOUNDED_QUEUE_HPP
#define PFRELAY_RUNTIME_BOUNDED_QUEUE_HPP
/**
 * @file BoundedQueue.hpp
 * @brief Fixed-capacity FIFO between one producer and one consumer thread.
 * @note Thread-safe.
 *
 * Overflow policy is drop-newest: tryPush never blocks and rejects the incoming
 * item when the queue is full. The producer is a netlink receive loop, and
 * blocking it would only move the overflow into the kernel socket buffer.
 */

#include "src/runtime/inc/CancelScope.hpp"

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace pfrelay {

namespace runtime {

template <typename T> class BoundedQueue {
public:
  explicit BoundedQueue(std::size_t capacity) : capacity_(capacity) {}

  BoundedQueue(const BoundedQueue&) = delete;
  BoundedQueue& operator=(const BoundedQueue&) = delete;

  /**
   * @brief Append an item unless the queue is full.
   * @return false if the item was dropped.
   */
  [[nodiscard]] bool tryPush(T value) {
    {
      std::lock_guard<std::mutex> lock(mtx_);
      if (items_.size() >= capacity_) {
        ++dropped_;
        return false;
      }
      items_.push_back(std::move(value));
    }
    cv_.notify_one();
    return true;
  }

  /**
   * @brief Block until an item is available or the scope is cancelled.
   * @return The oldest item, or std::nullopt on cancellation. Cancellation
   *         wins over pending items.
   */
  [[nodiscard]] std::optional<T> pop(const CancelScope& scope) {
    std::unique_lock<std::mutex> lock(mtx_);
    cv_.wait(lock, scope.token(), [this] { return !items_.empty(); });
    if (scope.isCancelled() || items_.empty()) {
      return std::nullopt;
    }
    T value = std::move(items_.front());
    items_.pop_front();
    return value;
  }

  /// @brief Total items rejected since construction.
  [[nodiscard]] std::uint64_t dropped() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return dropped_;
  }

private:
  const std::size_t capacity_;
  mutable std::mutex mtx_;
  std::condition_variable_any cv_;
  std::deque<T> items_;
  std::uint64_t dropped_{0};
};

} // namespace runtime

} // namespace pfrelay

#endif // PFRELAY_RUNTIME_BOUNDED_QUEUE_HPP
