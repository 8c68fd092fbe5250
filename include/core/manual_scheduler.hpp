#pragma once
#include <chrono>
#include <cstdint>
#include <map>
#include <utility>

#include "core/scheduler.hpp"

// Deterministic scheduler: time only moves through advance(). Tasks due at
// the same instant run in scheduling order.
class ManualScheduler : public IScheduler {
public:
  explicit ManualScheduler(std::int64_t start_ms = 1'000'000)
      : now_(start_ms) {}

  TimerId schedule_after(std::chrono::milliseconds delay, Task task) override {
    const auto id = next_id_++;
    const auto due = now_ + (delay.count() < 0 ? 0 : delay.count());
    queue_.emplace(Key{due, id}, std::move(task));
    return id;
  }

  void cancel(TimerId id) noexcept override {
    for (auto it = queue_.begin(); it != queue_.end(); ++it) {
      if (it->first.id == id) {
        queue_.erase(it);
        return;
      }
    }
  }

  [[nodiscard]] std::int64_t now_ms() const override { return now_; }

  // Runs every task due within the next `delta`, advancing the clock to each
  // task's due time first.
  void advance(std::chrono::milliseconds delta) {
    const auto target = now_ + delta.count();
    while (!queue_.empty() && queue_.begin()->first.due <= target) {
      auto it = queue_.begin();
      now_ = it->first.due;
      auto task = std::move(it->second);
      queue_.erase(it);
      task();
    }
    now_ = target;
  }

  void run_ready() { advance(std::chrono::milliseconds(0)); }

  [[nodiscard]] std::size_t pending() const noexcept { return queue_.size(); }

private:
  struct Key {
    std::int64_t due;
    TimerId id;
    bool operator<(const Key &o) const noexcept {
      return due != o.due ? due < o.due : id < o.id;
    }
  };

  std::int64_t now_;
  TimerId next_id_ = 1;
  std::map<Key, Task> queue_;
};
