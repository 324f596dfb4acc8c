#include "core/scheduler.hpp"

#include <spdlog/spdlog.h>

#include <exception>

namespace conductor {

namespace {

// Background continuations must never take the event loop down
void run_guarded(const Scheduler::Task& task) {
  try {
    task();
  } catch (const std::exception& e) {
    spdlog::error("[Scheduler] Unhandled exception in task: {}", e.what());
  }
}

}  // namespace

AsioScheduler::AsioScheduler(asio::io_context& io_ctx) : io_ctx_(io_ctx) {}

AsioScheduler::~AsioScheduler() {
  std::lock_guard lock(mutex_);
  for (auto& [id, timer] : timers_) {
    timer->cancel();
  }
  timers_.clear();
}

void AsioScheduler::post(Task task) {
  asio::post(io_ctx_, [task = std::move(task)]() {
    run_guarded(task);
  });
}

Scheduler::TimerId AsioScheduler::schedule(std::chrono::milliseconds delay, Task task) {
  auto timer = std::make_shared<asio::steady_timer>(io_ctx_, delay);

  TimerId id;
  {
    std::lock_guard lock(mutex_);
    id = next_id_++;
    timers_[id] = timer;
  }

  timer->async_wait([this, id, timer, task = std::move(task)](const asio::error_code& ec) {
    if (ec == asio::error::operation_aborted) return;

    {
      std::lock_guard lock(mutex_);
      // cancel() raced with expiry: the timer entry is gone, so skip the task
      if (timers_.erase(id) == 0) return;
    }
    run_guarded(task);
  });

  return id;
}

bool AsioScheduler::cancel(TimerId id) {
  std::shared_ptr<asio::steady_timer> timer;
  {
    std::lock_guard lock(mutex_);
    auto it = timers_.find(id);
    if (it == timers_.end()) return false;
    timer = it->second;
    timers_.erase(it);
  }
  timer->cancel();
  return true;
}

Scheduler::Clock::time_point AsioScheduler::now() const {
  return Clock::now();
}

size_t AsioScheduler::active_timers() const {
  std::lock_guard lock(mutex_);
  return timers_.size();
}

}  // namespace conductor
