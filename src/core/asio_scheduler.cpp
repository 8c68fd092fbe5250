#include "core/asio_scheduler.hpp"

#include "core/log.hpp"

AsioScheduler::~AsioScheduler() {
  for (auto &[id, timer] : *timers_) {
    timer->cancel();
  }
  timers_->clear();
}

IScheduler::TimerId
AsioScheduler::schedule_after(std::chrono::milliseconds delay, Task task) {
  const auto id = next_id_++;
  auto timer = std::make_shared<boost::asio::steady_timer>(exec_, delay);
  timers_->emplace(id, timer);

  std::weak_ptr<TimerMap> weak = timers_;
  timer->async_wait([weak, id, task = std::move(task)](
                        const boost::system::error_code &ec) {
    auto timers = weak.lock();
    if (!timers || timers->erase(id) == 0) {
      return;
    }
    if (ec) {
      if (ec != boost::asio::error::operation_aborted) {
        DUEL_LOGLN("timer error: " << ec.message());
      }
      return;
    }
    task();
  });
  return id;
}

void AsioScheduler::cancel(TimerId id) noexcept {
  auto it = timers_->find(id);
  if (it == timers_->end()) {
    return;
  }
  it->second->cancel();
  timers_->erase(it);
}

std::int64_t AsioScheduler::now_ms() const {
  using namespace std::chrono;
  return duration_cast<milliseconds>(system_clock::now().time_since_epoch())
      .count();
}
