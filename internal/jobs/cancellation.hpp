#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace jobhub::jobs {

/*
  Cooperative cancellation flag shared between the executor and one
  running work function. Cancel() is sticky.
*/
class CancellationToken {
 public:
  bool IsCancelled() const noexcept {
    return cancelled_.load(std::memory_order_acquire);
  }

  // Returns true once cancelled, false when the timeout elapsed first.
  bool WaitFor(std::chrono::milliseconds timeout) const;

  void Cancel();

 private:
  std::atomic<bool>               cancelled_{false};
  mutable std::mutex              mutex_;
  mutable std::condition_variable cv_;
};

} // namespace jobhub::jobs
