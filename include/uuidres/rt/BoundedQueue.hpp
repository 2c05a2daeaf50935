#pragma once
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <stdexcept>

namespace uuidres::rt {

// Multi-producer bounded FIFO with blocking backpressure.
// push() waits for room instead of dropping; pop() waits for an item.
// After close() producers are refused and consumers drain what is left.
template <typename T>
class BoundedQueue {
public:
  explicit BoundedQueue(size_t capacity)
  : cap_(capacity) {
    if (capacity == 0)
      throw std::invalid_argument("BoundedQueue: capacity must be > 0");
  }

  BoundedQueue(const BoundedQueue&)            = delete;
  BoundedQueue& operator=(const BoundedQueue&) = delete;

  // Blocks while full. Returns false (item untouched) if the queue is closed.
  bool push(T&& v) {
    std::unique_lock<std::mutex> lk(mx_);
    notFull_.wait(lk, [this]{ return closed_ || q_.size() < cap_; });
    if (closed_) return false;
    q_.push_back(std::move(v));
    lk.unlock();
    notEmpty_.notify_one();
    return true;
  }

  // Non-blocking variant; false if full or closed.
  bool try_push(T&& v) {
    {
      std::lock_guard<std::mutex> lk(mx_);
      if (closed_ || q_.size() >= cap_) return false;
      q_.push_back(std::move(v));
    }
    notEmpty_.notify_one();
    return true;
  }

  // Blocks while empty and open. Empty optional once closed and drained.
  std::optional<T> pop() {
    std::unique_lock<std::mutex> lk(mx_);
    notEmpty_.wait(lk, [this]{ return closed_ || !q_.empty(); });
    if (q_.empty()) return std::nullopt;
    std::optional<T> out(std::move(q_.front()));
    q_.pop_front();
    lk.unlock();
    notFull_.notify_one();
    return out;
  }

  // Idempotent.
  void close() {
    {
      std::lock_guard<std::mutex> lk(mx_);
      closed_ = true;
    }
    notFull_.notify_all();
    notEmpty_.notify_all();
  }

  size_t size() const { std::lock_guard<std::mutex> lk(mx_); return q_.size(); }

private:
  const size_t            cap_;
  mutable std::mutex      mx_;
  std::condition_variable notFull_;
  std::condition_variable notEmpty_;
  std::deque<T>           q_;
  bool                    closed_{false};
};

} // namespace uuidres::rt
