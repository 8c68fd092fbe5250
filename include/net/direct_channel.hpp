#pragma once
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/scheduler.hpp"
#include "net/channel.hpp"
#include "net/datagram_socket.hpp"
#include "net/reliable_stream.hpp"
#include "net/signaling.hpp"

struct DirectOptions {
  std::chrono::milliseconds probe_interval{250};
  std::chrono::milliseconds keepalive{1000};
  std::chrono::milliseconds liveness_timeout{5000};
  std::chrono::milliseconds rto{200};
  // Session token used by the offering side; generated when empty.
  std::string token;
};

enum class DirectState : std::uint8_t { Idle, Negotiating, Open, Closed };

const char *to_string(DirectState s) noexcept;

// Point-to-point UDP channel negotiated over an ISignaling side channel.
//
// Slot::First offers a session token, Slot::Second answers it; both trickle
// their UDP candidates. Each side probes every remote candidate until one
// answers, then keeps the path alive and runs envelopes through a
// ReliableStream so delivery stays ordered.
//
// Datagrams are JSON objects keyed by "k" (probe, probe-ack, data{s,d},
// ack{a}, ka, bye), each carrying the session token "t". The "d" field of a
// data datagram holds the encoded envelope text.
class DirectChannel : public ChannelBase {
public:
  using OpenListener = std::function<void()>;
  using CloseListener = std::function<void(const std::string &reason)>;

  DirectChannel(IScheduler &sched, ISignaling &signaling,
                std::shared_ptr<IDatagramSocket> socket, Slot local,
                DirectOptions opts = {});
  ~DirectChannel() override;

  DirectChannel(const DirectChannel &) = delete;
  DirectChannel &operator=(const DirectChannel &) = delete;

  // Binds the socket and starts negotiation. A bind failure is reported to the
  // error listeners and closes the channel.
  void start();

  void send(const WireMessage &msg) override;
  [[nodiscard]] bool is_ready() const override {
    return state_ == DirectState::Open;
  }
  void dispose() override;

  Subscription on_open(OpenListener listener);
  Subscription on_closed(CloseListener listener);

  [[nodiscard]] DirectState state() const noexcept { return state_; }
  [[nodiscard]] const std::optional<UdpEndpoint> &remote() const noexcept {
    return remote_;
  }
  [[nodiscard]] const std::string &token() const noexcept { return token_; }
  [[nodiscard]] const ReliableStream &stream() const noexcept {
    return stream_;
  }

private:
  void on_signal(const nlohmann::json &frame);
  void on_datagram(const UdpEndpoint &from, std::span<const std::byte> data);
  void add_candidate(const UdpEndpoint &ep);
  void begin_probing();
  void probe();
  void open(const UdpEndpoint &remote);
  void maintain();
  void transmit(const ReliableStream::Segment &seg);
  void send_datagram(const UdpEndpoint &to, nlohmann::json body);
  void close(const std::string &reason);
  static std::string make_token();

  IScheduler &sched_;
  ISignaling &signaling_;
  std::shared_ptr<IDatagramSocket> socket_;
  Slot local_;
  DirectOptions opts_;
  DirectState state_ = DirectState::Idle;
  std::string token_;
  std::vector<UdpEndpoint> local_candidates_;
  std::vector<UdpEndpoint> remote_candidates_;
  std::optional<UdpEndpoint> remote_;
  ReliableStream stream_;
  SendBuffer pending_;
  Subscription signal_sub_;
  PeriodicTimer prober_;
  PeriodicTimer keepalive_;
  PeriodicTimer retransmit_;
  ListenerSet<> open_listeners_;
  ListenerSet<const std::string &> close_listeners_;
  std::int64_t last_heard_ms_ = 0;
  bool disposed_ = false;
};
