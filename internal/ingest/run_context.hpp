#pragma once

#include <atomic>
#include <chrono>
#include <optional>

namespace liveviewer::ingest {

/*
  Cancellation scope of one ingestion run.

  Shared by the collector, both reconcilers and their queues. Cancel()
  may be called from any thread; the deadline is fixed at construction.
*/
class RunContext {
 public:
  using Clock = std::chrono::steady_clock;

  RunContext() = default;

  explicit RunContext(std::chrono::milliseconds timeout) : deadline_(Clock::now() + timeout) {
  }

  void Cancel() {
    cancelled_.store(true, std::memory_order_release);
  }

  bool Expired() const {
    return deadline_ && Clock::now() >= *deadline_;
  }

  // True once cancelled or past the deadline.
  bool Cancelled() const {
    return cancelled_.load(std::memory_order_acquire) || Expired();
  }

 private:
  std::atomic<bool>                cancelled_{false};
  std::optional<Clock::time_point> deadline_;
};

} // namespace liveviewer::ingest
