#pragma once

#include <atomic>
#include <exception>
#include <functional>

namespace lp {

// Cooperative cancellation flag shared read-only with probe tasks.
// cancel() is async-signal-safe (lock-free atomic store).
class Cancellation {
public:
  void cancel() { flag_.store(true, std::memory_order_relaxed); }
  bool is_cancelled() const { return flag_.load(std::memory_order_relaxed); }
  const std::atomic<bool>& flag() const { return flag_; }
private:
  std::atomic<bool> flag_{false};
};

// Fixed-size worker pool. Tasks that throw are recorded (first one wins)
// and do not take the worker down.
class ThreadPool {
public:
  explicit ThreadPool(int threads);
  ~ThreadPool();

  ThreadPool(const ThreadPool&) = delete;
  ThreadPool& operator=(const ThreadPool&) = delete;

  // Returns false once the pool is shutting down.
  bool submit(std::function<void()> task);

  // Wait until the queue is empty and all tasks complete
  void wait_idle();

  // Returns first captured exception (if any); nullptr if none
  std::exception_ptr first_exception() const;

private:
  struct Impl;
  Impl* impl_;
};

} // namespace lp
