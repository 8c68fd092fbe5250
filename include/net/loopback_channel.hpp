#pragma once
#include <memory>
#include <string>
#include <utility>

#include "core/scheduler.hpp"
#include "net/channel.hpp"

// In-process channel pair. Envelopes go through the JSON codec and arrive on
// the peer from the scheduler, never re-entrantly from send().
class LoopbackChannel : public ChannelBase,
                        public std::enable_shared_from_this<LoopbackChannel> {
public:
  using Pair =
      std::pair<std::shared_ptr<LoopbackChannel>, std::shared_ptr<LoopbackChannel>>;

  LoopbackChannel(Slot local, IScheduler &sched) : local_(local), sched_(sched) {}

  // first.local == Slot::First, second.local == Slot::Second.
  static Pair make_pair(IScheduler &sched, bool open = true);

  void send(const WireMessage &msg) override;
  [[nodiscard]] bool is_ready() const override;
  void dispose() override;

  // Opening flushes anything sent while closed.
  void set_open(bool open);

  // Hands raw text to the peer as if it came off a wire.
  void inject_raw(const std::string &text);

  [[nodiscard]] Slot local_slot() const noexcept { return local_; }

private:
  void transmit(const WireMessage &msg);
  void receive(const std::string &text);

  Slot local_;
  IScheduler &sched_;
  std::weak_ptr<LoopbackChannel> peer_;
  SendBuffer pending_;
  bool open_ = false;
  bool disposed_ = false;
};
