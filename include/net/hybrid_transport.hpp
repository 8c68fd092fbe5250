#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "core/scheduler.hpp"
#include "net/channel.hpp"
#include "net/direct_channel.hpp"
#include "net/relay_channel.hpp"

enum class ConnectionState : std::uint8_t {
  Disconnected,
  Connecting,
  Signaling,
  DirectConnecting,
  DirectConnected,
  RelayConnecting,
  RelayConnected,
  Failed,
};

const char *to_string(ConnectionState s) noexcept;

using DirectChannelFactory =
    std::function<std::shared_ptr<DirectChannel>(ISignaling &signaling)>;

struct HybridOptions {
  std::chrono::milliseconds negotiation_timeout{5000};
  bool enable_direct = true;
};

// The channel the authority layer talks to. Starts on the relay, tries to
// upgrade to a direct channel once both peers are present, and falls back to
// the relay when negotiation times out or the direct path dies. Relayed game
// traffic is ignored once both ends report the direct path open.
class HybridTransport : public ChannelBase {
public:
  using StateListener = std::function<void(ConnectionState)>;

  HybridTransport(IScheduler &sched, std::shared_ptr<RelayChannel> relay,
                  DirectChannelFactory direct_factory, HybridOptions opts = {});
  ~HybridTransport() override;

  HybridTransport(const HybridTransport &) = delete;
  HybridTransport &operator=(const HybridTransport &) = delete;

  void connect();

  void send(const WireMessage &msg) override;
  [[nodiscard]] bool is_ready() const override;
  void dispose() override;

  Subscription on_state_change(StateListener listener);

  [[nodiscard]] ConnectionState state() const noexcept { return state_; }
  [[nodiscard]] bool direct_active() const;
  [[nodiscard]] RelayChannel &relay() noexcept { return *relay_; }

private:
  void on_relay_event(RelayEvent ev);
  void on_signal(const nlohmann::json &frame);
  void start_direct();
  void on_direct_open();
  void fall_back(const std::string &reason);
  void retire_direct();
  void flush();
  void set_state(ConnectionState s);

  IScheduler &sched_;
  std::shared_ptr<RelayChannel> relay_;
  DirectChannelFactory direct_factory_;
  HybridOptions opts_;
  std::shared_ptr<DirectChannel> direct_;
  std::vector<Subscription> relay_subs_;
  std::vector<Subscription> direct_subs_;
  ScopedTimer negotiation_timer_;
  SendBuffer pending_;
  ListenerSet<ConnectionState> state_listeners_;
  ConnectionState state_ = ConnectionState::Disconnected;
  bool peer_direct_ready_ = false;
  bool disposed_ = false;
};
