// File: include/uuidres/rt/ThreadPool.hpp
#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace uuidres::rt {

// Fixed-size worker pool for blocking work (storage transactions).
class ThreadPool {
public:
  explicit ThreadPool(unsigned nThreads = std::thread::hardware_concurrency());
  ~ThreadPool();

  ThreadPool(const ThreadPool&)            = delete;
  ThreadPool& operator=(const ThreadPool&) = delete;
  ThreadPool(ThreadPool&&)                 = delete;
  ThreadPool& operator=(ThreadPool&&)      = delete;

  // Enqueue work. Dropped silently once shutdown has begun.
  void post(std::function<void()> fn);

  // Enqueue work and observe its result. If the pool is already stopping the
  // task is destroyed unrun and the future reports broken_promise.
  template <typename Fn>
  auto submit(Fn&& fn) -> std::future<std::invoke_result_t<std::decay_t<Fn>>> {
    using R = std::invoke_result_t<std::decay_t<Fn>>;
    auto task = std::make_shared<std::packaged_task<R()>>(std::forward<Fn>(fn));
    auto fut = task->get_future();
    post([task] { (*task)(); });
    return fut;
  }

  // Best-effort drain: waits until queue is empty (does not guarantee workers are idle
  // if tasks enqueue more tasks).
  void drain();

  // Runs what is queued, then joins the workers. Idempotent.
  void shutdown();

  unsigned size() const { return static_cast<unsigned>(threads_.size()); }

private:
  void workerLoop();

private:
  std::vector<std::thread>           threads_;
  std::mutex                        mx_;
  std::condition_variable           cv_;
  std::condition_variable           idle_;
  std::queue<std::function<void()>> q_;
  std::atomic<bool>                 stopping_{false};
};

} // namespace uuidres::rt
