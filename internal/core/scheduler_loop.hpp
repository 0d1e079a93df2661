#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

#include "internal/util/time.hpp"

namespace jobhub::core {

/*
  Periodically invokes the tick callback with the current time.

  The first tick fires immediately after Start(). Stop() wakes the loop and
  joins it; a tick in progress finishes first.
*/
class SchedulerLoop {
 public:
  using TickFn = std::function<void(util::TimePoint)>;

  SchedulerLoop(std::chrono::milliseconds tick_interval, TickFn on_tick);
  ~SchedulerLoop();

  SchedulerLoop(const SchedulerLoop&)            = delete;
  SchedulerLoop& operator=(const SchedulerLoop&) = delete;

  // Returns false when already running.
  bool Start();
  void Stop();

  // Wakes the loop for an early tick, used when a job's next run moves closer.
  void Poke();

 private:
  void Loop();

  const std::chrono::milliseconds tick_interval_;
  TickFn                          on_tick_;

  std::thread             thread_;
  std::atomic<bool>       running_{false};
  std::mutex              mutex_;
  std::condition_variable cv_;
  bool                    poked_ = false;
};

} // namespace jobhub::core
