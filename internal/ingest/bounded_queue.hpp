#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <utility>

#include "run_context.hpp"

namespace liveviewer::ingest {

/*
  Bounded blocking FIFO between the collector and one reconciler.

  - Push blocks while full.
  - Close() is the end-of-stream sentinel: buffered items still drain.
  - Abandon() is called by a consumer that stopped early: buffered items
    are discarded and every later Push returns false without blocking.
  - Waits observe the run context in short slices so cancellation and
    deadlines are noticed even when nobody notifies.
*/
template <typename T>
class BoundedQueue {
 public:
  struct Stats {
    std::size_t              pushed     = 0;
    std::size_t              popped     = 0;
    std::size_t              high_water = 0;
    std::chrono::nanoseconds producer_blocked{0};
  };

  explicit BoundedQueue(std::size_t capacity, const RunContext* ctx = nullptr)
      : capacity_(capacity == 0 ? 1 : capacity), ctx_(ctx) {
  }

  BoundedQueue(const BoundedQueue&)            = delete;
  BoundedQueue& operator=(const BoundedQueue&) = delete;

  // false: queue closed, abandoned, or the run was cancelled.
  bool Push(T item) {
    std::unique_lock lock(mutex_);

    if (items_.size() >= capacity_ && Open()) {
      const auto started = std::chrono::steady_clock::now();
      while (items_.size() >= capacity_ && Open() && !CancelRequested()) {
        not_full_.wait_for(lock, kWaitSlice);
      }
      stats_.producer_blocked += std::chrono::steady_clock::now() - started;
    }

    if (!Open() || CancelRequested()) return false;

    items_.push_back(std::move(item));
    ++stats_.pushed;
    if (items_.size() > stats_.high_water) stats_.high_water = items_.size();

    lock.unlock();
    not_empty_.notify_one();
    return true;
  }

  // nullopt: closed and drained, abandoned, or the run was cancelled.
  std::optional<T> Pop() {
    std::unique_lock lock(mutex_);

    while (items_.empty() && !closed_ && !abandoned_ && !CancelRequested()) {
      not_empty_.wait_for(lock, kWaitSlice);
    }

    if (items_.empty() || abandoned_ || CancelRequested()) return std::nullopt;

    T item = std::move(items_.front());
    items_.pop_front();
    ++stats_.popped;

    lock.unlock();
    not_full_.notify_one();
    return item;
  }

  void Close() {
    {
      std::lock_guard lock(mutex_);
      closed_ = true;
    }
    not_empty_.notify_all();
    not_full_.notify_all();
  }

  void Abandon() {
    {
      std::lock_guard lock(mutex_);
      abandoned_ = true;
      items_.clear();
    }
    not_empty_.notify_all();
    not_full_.notify_all();
  }

  bool Closed() const {
    std::lock_guard lock(mutex_);
    return closed_;
  }

  bool Abandoned() const {
    std::lock_guard lock(mutex_);
    return abandoned_;
  }

  std::size_t Size() const {
    std::lock_guard lock(mutex_);
    return items_.size();
  }

  Stats GetStats() const {
    std::lock_guard lock(mutex_);
    return stats_;
  }

 private:
  static constexpr std::chrono::milliseconds kWaitSlice{50};

  bool Open() const {
    return !closed_ && !abandoned_;
  }

  bool CancelRequested() const {
    return ctx_ && ctx_->Cancelled();
  }

  const std::size_t       capacity_;
  const RunContext*       ctx_;
  mutable std::mutex      mutex_;
  std::condition_variable not_full_;
  std::condition_variable not_empty_;
  std::deque<T>           items_;
  bool                    closed_    = false;
  bool                    abandoned_ = false;
  Stats                   stats_;
};

} // namespace liveviewer::ingest
