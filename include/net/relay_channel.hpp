#pragma once
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "core/scheduler.hpp"
#include "net/channel.hpp"
#include "net/relay_socket.hpp"
#include "net/signaling.hpp"
#include "proto/relay_messages.hpp"

struct RelayOptions {
  std::string host = "127.0.0.1";
  std::string port = "8787";
  std::string room;
  Slot slot = Slot::First;
  std::chrono::milliseconds reconnect_base{1000};
  std::chrono::milliseconds reconnect_cap{16000};
  int max_reconnect_attempts = 5;
  std::chrono::milliseconds keepalive{30000};
};

enum class RelayEvent : std::uint8_t {
  Connecting,
  Open,
  PeersPresent,
  PeerLeft,
  Disconnected,
  Failed,
};

const char *to_string(RelayEvent ev) noexcept;

// Channel through the room coordinator's WebSocket. Ready once the socket is
// open and the room reported both peers present. Also carries the signaling
// frames used to negotiate the direct channel.
//
// Create with std::make_shared; socket callbacks hold a weak reference.
class RelayChannel : public ChannelBase,
                     public ISignaling,
                     public std::enable_shared_from_this<RelayChannel> {
public:
  using EventListener = std::function<void(RelayEvent)>;

  RelayChannel(IScheduler &sched, RelaySocketFactory factory,
               RelayOptions opts);
  ~RelayChannel() override;

  RelayChannel(const RelayChannel &) = delete;
  RelayChannel &operator=(const RelayChannel &) = delete;

  void connect();

  void send(const WireMessage &msg) override;
  [[nodiscard]] bool is_ready() const override;
  void dispose() override;

  // Signaling frames are queued until the socket is open.
  void send_signal(const nlohmann::json &frame) override;
  Subscription subscribe_signals(SignalListener listener) override;
  Subscription subscribe_events(EventListener listener);

  [[nodiscard]] bool socket_open() const;
  [[nodiscard]] bool peers_present() const noexcept { return peers_present_; }
  [[nodiscard]] int reconnect_attempts() const noexcept { return attempts_; }
  [[nodiscard]] const std::optional<RelayAssistConfig> &
  relay_assist() const noexcept {
    return relay_assist_;
  }
  [[nodiscard]] static RelayTarget target_for(const RelayOptions &opts);

private:
  void on_open(std::uint64_t gen);
  void on_text(std::uint64_t gen, const std::string &text);
  void on_close(std::uint64_t gen, std::uint16_t code,
                const std::string &reason);
  void schedule_reconnect();
  void flush_signals();
  void flush_game();
  void write(const nlohmann::json &frame);
  void emit(RelayEvent ev);

  IScheduler &sched_;
  RelaySocketFactory factory_;
  RelayOptions opts_;
  std::shared_ptr<IRelaySocket> socket_;
  std::uint64_t generation_ = 0;
  SendBuffer pending_;
  std::deque<nlohmann::json> pending_signals_;
  ScopedTimer reconnect_timer_;
  PeriodicTimer keepalive_;
  ListenerSet<const nlohmann::json &> signal_listeners_;
  ListenerSet<RelayEvent> event_listeners_;
  std::optional<RelayAssistConfig> relay_assist_;
  int attempts_ = 0;
  bool peers_present_ = false;
  bool disposed_ = false;
};
