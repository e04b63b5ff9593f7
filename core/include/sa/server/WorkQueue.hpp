#pragma once
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <queue>
#include <utility>

namespace sa {

// Bounded blocking FIFO shared by the accept thread and the workers.
// push() refuses items when full or closed and leaves a refused item with
// the caller, so the producer can reject the work itself; pop() blocks until
// an item arrives or the queue is closed.
template <typename T>
class WorkQueue {
public:
  explicit WorkQueue(std::size_t maxCapacity = 256)
      : maxCap_(maxCapacity) {}

  bool push(T&& item) {
    {
      std::lock_guard<std::mutex> lock(mtx_);
      if (closed_ || queue_.size() >= maxCap_) return false;
      queue_.push(std::move(item));
    }
    cv_.notify_one();
    return true;
  }

  // Returns false once the queue is closed and drained.
  bool pop(T& out) {
    std::unique_lock<std::mutex> lock(mtx_);
    cv_.wait(lock, [this] { return closed_ || !queue_.empty(); });
    if (queue_.empty()) return false;
    out = std::move(queue_.front());
    queue_.pop();
    return true;
  }

  bool tryPop(T& out) {
    std::lock_guard<std::mutex> lock(mtx_);
    if (queue_.empty()) return false;
    out = std::move(queue_.front());
    queue_.pop();
    return true;
  }

  void close() {
    {
      std::lock_guard<std::mutex> lock(mtx_);
      closed_ = true;
    }
    cv_.notify_all();
  }

  // Accepts items again after close().
  void reopen() {
    std::lock_guard<std::mutex> lock(mtx_);
    closed_ = false;
  }

  std::size_t size() const {
    std::lock_guard<std::mutex> lock(mtx_);
    return queue_.size();
  }

private:
  mutable std::mutex mtx_;
  std::condition_variable cv_;
  std::queue<T> queue_;
  std::size_t maxCap_;
  bool closed_{false};
};

} // namespace sa
