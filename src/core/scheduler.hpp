#pragma once

#include <asio.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>

namespace conductor {

// Single logical event stream: posted tasks and timers all run on one thread
class Scheduler {
 public:
  using Task = std::function<void()>;
  using TimerId = uint64_t;
  using Clock = std::chrono::steady_clock;

  virtual ~Scheduler() = default;

  // Run a task on the event stream as soon as possible
  virtual void post(Task task) = 0;

  // Run a task after a delay; returns an id usable with cancel()
  virtual TimerId schedule(std::chrono::milliseconds delay, Task task) = 0;

  // Returns false if the timer already fired or was never scheduled
  virtual bool cancel(TimerId id) = 0;

  virtual Clock::time_point now() const = 0;
};

// Scheduler backed by an asio::io_context (run by the owner on one thread)
class AsioScheduler : public Scheduler {
 public:
  explicit AsioScheduler(asio::io_context& io_ctx);
  ~AsioScheduler() override;

  void post(Task task) override;
  TimerId schedule(std::chrono::milliseconds delay, Task task) override;
  bool cancel(TimerId id) override;
  Clock::time_point now() const override;

  size_t active_timers() const;

 private:
  asio::io_context& io_ctx_;

  mutable std::mutex mutex_;
  TimerId next_id_ = 1;
  std::map<TimerId, std::shared_ptr<asio::steady_timer>> timers_;
};

}  // namespace conductor
