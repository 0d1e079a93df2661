#include "scheduler_loop.hpp"

#include "internal/observability/logging.hpp"

namespace jobhub::core {

SchedulerLoop::SchedulerLoop(std::chrono::milliseconds tick_interval, TickFn on_tick)
    : tick_interval_(tick_interval.count() > 0 ? tick_interval : std::chrono::milliseconds(1000)), on_tick_(std::move(on_tick)) {
}

SchedulerLoop::~SchedulerLoop() {
  Stop();
}

bool SchedulerLoop::Start() {
  if (running_.exchange(true)) {
    return false;
  }
  thread_ = std::thread(&SchedulerLoop::Loop, this);
  return true;
}

void SchedulerLoop::Stop() {
  {
    std::lock_guard lock(mutex_);
    if (!running_.exchange(false)) {
      return;
    }
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

void SchedulerLoop::Poke() {
  {
    std::lock_guard lock(mutex_);
    poked_ = true;
  }
  cv_.notify_all();
}

void SchedulerLoop::Loop() {
  JOBHUB_LOG_DEBUG("scheduler loop started", {observability::IntField("tick_ms", tick_interval_.count())});

  while (running_) {
    try {
      on_tick_(util::Now());
    } catch (const std::exception& e) {
      JOBHUB_LOG_ERROR("scheduler tick failed", {observability::StringField("error", e.what())});
    }

    std::unique_lock lock(mutex_);
    cv_.wait_for(lock, tick_interval_, [&] { return !running_ || poked_; });
    poked_ = false;
  }

  JOBHUB_LOG_DEBUG("scheduler loop stopped");
}

} // namespace jobhub::core
