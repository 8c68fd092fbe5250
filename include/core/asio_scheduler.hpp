#pragma once
#include <chrono>
#include <cstdint>
#include <memory>
#include <unordered_map>

#include <utility>
#include <boost/asio.hpp>

#include "core/scheduler.hpp"

// IScheduler over steady_timers on one executor. Not thread-safe; call from
// the executor's thread only.
class AsioScheduler : public IScheduler {
public:
  explicit AsioScheduler(boost::asio::any_io_executor exec) : exec_(exec) {}
  ~AsioScheduler() override;

  AsioScheduler(const AsioScheduler &) = delete;
  AsioScheduler &operator=(const AsioScheduler &) = delete;

  TimerId schedule_after(std::chrono::milliseconds delay, Task task) override;
  void cancel(TimerId id) noexcept override;
  [[nodiscard]] std::int64_t now_ms() const override;

private:
  using TimerMap =
      std::unordered_map<TimerId, std::shared_ptr<boost::asio::steady_timer>>;

  boost::asio::any_io_executor exec_;
  TimerId next_id_ = 1;
  // Shared with pending handlers so a completion that was already queued when
  // its timer got cancelled (or the scheduler destroyed) is recognised.
  std::shared_ptr<TimerMap> timers_ = std::make_shared<TimerMap>();
};
