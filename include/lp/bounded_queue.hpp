#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

namespace lp {

// Blocking FIFO with a fixed capacity. Any number of producers, intended
// for a single consumer. close() releases every blocked caller.
template <typename T>
class BoundedQueue {
public:
  explicit BoundedQueue(std::size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity)
  {}

  BoundedQueue(const BoundedQueue&) = delete;
  BoundedQueue& operator=(const BoundedQueue&) = delete;

  // Blocks while full. Returns false if the queue was closed.
  bool push(T value)
  {
    {
      std::unique_lock<std::mutex> lk(mtx_);
      cv_not_full_.wait(lk, [&]{ return closed_ || q_.size() < capacity_; });
      if (closed_) return false;
      q_.push_back(std::move(value));
    }
    cv_not_empty_.notify_one();
    return true;
  }

  // Blocks while empty. nullopt only when closed and drained.
  std::optional<T> pop()
  {
    std::optional<T> out;
    {
      std::unique_lock<std::mutex> lk(mtx_);
      cv_not_empty_.wait(lk, [&]{ return closed_ || !q_.empty(); });
      if (q_.empty()) return std::nullopt;
      out.emplace(std::move(q_.front()));
      q_.pop_front();
    }
    cv_not_full_.notify_one();
    return out;
  }

  std::optional<T> try_pop()
  {
    std::optional<T> out;
    {
      std::lock_guard<std::mutex> lk(mtx_);
      if (q_.empty()) return std::nullopt;
      out.emplace(std::move(q_.front()));
      q_.pop_front();
    }
    cv_not_full_.notify_one();
    return out;
  }

  void close()
  {
    {
      std::lock_guard<std::mutex> lk(mtx_);
      closed_ = true;
    }
    cv_not_empty_.notify_all();
    cv_not_full_.notify_all();
  }

  bool closed() const
  {
    std::lock_guard<std::mutex> lk(mtx_);
    return closed_;
  }

  std::size_t size() const
  {
    std::lock_guard<std::mutex> lk(mtx_);
    return q_.size();
  }

  std::size_t capacity() const { return capacity_; }

private:
  const std::size_t capacity_;
  mutable std::mutex mtx_;
  std::condition_variable cv_not_empty_;
  std::condition_variable cv_not_full_;
  std::deque<T> q_;
  bool closed_ = false;
};

} // namespace lp
