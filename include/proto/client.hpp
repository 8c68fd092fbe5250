#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>

#include "core/listeners.hpp"
#include "core/scheduler.hpp"
#include "net/channel.hpp"

struct ClientOptions {
  std::chrono::milliseconds ping_interval{2000};
  double latency_smoothing = 0.2;
};

// Mirror of the Host's state. Sends intents, never simulates.
class AuthorityClient {
public:
  using StateListener = std::function<void(const SimulationState &)>;

  explicit AuthorityClient(IScheduler &sched, ClientOptions opts = {});
  ~AuthorityClient();

  AuthorityClient(const AuthorityClient &) = delete;
  AuthorityClient &operator=(const AuthorityClient &) = delete;

  // Attaching again after a previous channel asks the Host for a resync.
  void attach(std::shared_ptr<IChannel> channel);
  void detach();

  void mark_ready();
  void send_input(Direction dir);

  [[nodiscard]] const std::optional<SimulationState> &state() const noexcept {
    return state_;
  }
  [[nodiscard]] std::uint64_t last_tick_sequence() const noexcept {
    return last_sequence_;
  }
  // Smoothed one-way latency estimate in milliseconds.
  [[nodiscard]] std::optional<double> latency_ms() const noexcept {
    return latency_;
  }

  Subscription on_state(StateListener listener);
  Subscription on_error(ErrorHandler listener);

  void dispose();

private:
  void handle(const Envelope &env);
  void apply(const StateMsg &msg);
  void record_pong(const PongMsg &pong);
  void ping();
  void send(const WireMessage &msg);
  void fail(const DuelError &err);

  IScheduler &sched_;
  ClientOptions opts_;
  std::shared_ptr<IChannel> channel_;
  Subscription envelope_sub_;
  Subscription error_sub_;
  PeriodicTimer pinger_;
  ListenerSet<const SimulationState &> state_listeners_;
  ListenerSet<const DuelError &> error_listeners_;
  std::optional<SimulationState> state_;
  std::optional<double> latency_;
  std::uint64_t last_sequence_ = 0;
  std::uint64_t local_sequence_ = 0;
  bool ready_requested_ = false;
  bool ready_sent_ = false;
  bool attached_before_ = false;
  bool disposed_ = false;
};
