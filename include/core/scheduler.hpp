#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <utility>

// Timer source injected into every component that waits. Production code runs
// on AsioScheduler; tests step a ManualScheduler.
class IScheduler {
public:
  using Task = std::function<void()>;
  using TimerId = std::uint64_t;

  static constexpr TimerId kNoTimer = 0;

  virtual ~IScheduler() = default;

  virtual TimerId schedule_after(std::chrono::milliseconds delay,
                                 Task task) = 0;
  virtual void cancel(TimerId id) noexcept = 0;

  // Wall-clock milliseconds; used for envelope and server timestamps.
  [[nodiscard]] virtual std::int64_t now_ms() const = 0;
};

// One-shot timer that cancels itself on destruction.
class ScopedTimer {
public:
  explicit ScopedTimer(IScheduler &sched) : sched_(sched) {}
  ~ScopedTimer() { cancel(); }

  ScopedTimer(const ScopedTimer &) = delete;
  ScopedTimer &operator=(const ScopedTimer &) = delete;

  void arm(std::chrono::milliseconds delay, IScheduler::Task task) {
    cancel();
    id_ = sched_.schedule_after(delay, [this, task = std::move(task)] {
      id_ = IScheduler::kNoTimer;
      task();
    });
  }

  void cancel() noexcept {
    if (id_ != IScheduler::kNoTimer) {
      sched_.cancel(std::exchange(id_, IScheduler::kNoTimer));
    }
  }

  [[nodiscard]] bool armed() const noexcept {
    return id_ != IScheduler::kNoTimer;
  }

private:
  IScheduler &sched_;
  IScheduler::TimerId id_ = IScheduler::kNoTimer;
};

// Fixed-period repeating timer. The next period is armed before the callback
// runs, so the callback may stop() it.
class PeriodicTimer {
public:
  explicit PeriodicTimer(IScheduler &sched) : timer_(sched) {}

  void start(std::chrono::milliseconds period, IScheduler::Task task) {
    period_ = period;
    task_ = std::move(task);
    running_ = true;
    arm();
  }

  void stop() noexcept {
    running_ = false;
    timer_.cancel();
  }

  [[nodiscard]] bool running() const noexcept { return running_; }

private:
  void arm() {
    timer_.arm(period_, [this] {
      if (!running_) {
        return;
      }
      arm();
      task_();
    });
  }

  ScopedTimer timer_;
  std::chrono::milliseconds period_{0};
  IScheduler::Task task_;
  bool running_ = false;
};
