#pragma once
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>

#include "core/listeners.hpp"
#include "core/scheduler.hpp"
#include "net/channel.hpp"
#include "sim/engine.hpp"

struct HostOptions {
  EngineOptions engine;
  std::size_t input_capacity = 4;
  // Tick from the scheduler at engine.tick_interval_ms once running.
  bool auto_tick = true;
};

// Simulation authority. Owns the only Engine of a session; the local player is
// Slot::First, the remote one Slot::Second.
class AuthorityHost {
public:
  using StateListener = std::function<void(const SimulationState &)>;

  explicit AuthorityHost(IScheduler &sched, HostOptions opts = {});
  ~AuthorityHost();

  AuthorityHost(const AuthorityHost &) = delete;
  AuthorityHost &operator=(const AuthorityHost &) = delete;

  void attach(std::shared_ptr<IChannel> channel);
  void detach();

  void mark_ready();
  void queue_local_intent(Direction dir);

  // One simulation step: applies at most one remote input, then broadcasts.
  SimulationState tick();

  [[nodiscard]] SimulationState state() const { return engine_.snapshot(); }
  [[nodiscard]] std::uint64_t tick_sequence() const noexcept {
    return sequence_;
  }
  [[nodiscard]] std::size_t pending_inputs() const noexcept {
    return inputs_.size();
  }
  [[nodiscard]] std::uint64_t dropped_inputs() const noexcept {
    return dropped_;
  }

  Subscription on_state(StateListener listener);
  Subscription on_error(ErrorHandler listener);

  void dispose();

private:
  void handle(const Envelope &env);
  void maybe_start();
  void broadcast();
  void send(const WireMessage &msg);
  void fail(const DuelError &err);

  IScheduler &sched_;
  HostOptions opts_;
  Engine engine_;
  std::shared_ptr<IChannel> channel_;
  Subscription envelope_sub_;
  Subscription error_sub_;
  std::deque<Direction> inputs_;
  PeriodicTimer ticker_;
  ListenerSet<const SimulationState &> state_listeners_;
  ListenerSet<const DuelError &> error_listeners_;
  std::uint64_t sequence_ = 0;
  std::uint64_t dropped_ = 0;
  bool disposed_ = false;
};
