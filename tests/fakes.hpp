#pragma once
#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <span>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/errors.hpp"
#include "core/scheduler.hpp"
#include "net/datagram_socket.hpp"
#include "net/relay_socket.hpp"
#include "net/signaling.hpp"
#include "proto/relay_messages.hpp"
#include "room/room.hpp"

// Relay socket driven by the test or by a FakeRelayHub.
class FakeRelaySocket : public IRelaySocket {
public:
  void open(const RelayTarget &t, Handlers h) override {
    target = t;
    handlers = std::move(h);
    opened = true;
  }

  void send_text(std::string text) override {
    sent.push_back(nlohmann::json::parse(text));
    if (on_send) {
      on_send(sent.back());
    }
  }

  void close(std::uint16_t code, const std::string &) override {
    close_code = code;
    open_ = false;
  }

  [[nodiscard]] bool is_open() const override { return open_; }

  void accept() {
    open_ = true;
    handlers.on_open();
  }

  void receive(const nlohmann::json &frame) { handlers.on_text(frame.dump()); }
  void receive_raw(const std::string &text) { handlers.on_text(text); }

  void drop(std::uint16_t code, const std::string &reason = "") {
    open_ = false;
    handlers.on_close(code, reason);
  }

  [[nodiscard]] std::vector<nlohmann::json>
  sent_of(const std::string &type) const {
    std::vector<nlohmann::json> out;
    for (const auto &f : sent) {
      if (frame_type(f) == type) {
        out.push_back(f);
      }
    }
    return out;
  }

  RelayTarget target;
  Handlers handlers;
  std::vector<nlohmann::json> sent;
  std::function<void(const nlohmann::json &)> on_send;
  std::uint16_t close_code = 0;
  bool opened = false;

private:
  bool open_ = false;
};

// Stands in for a room: pairs one socket per slot and forwards game and
// signaling frames to the other slot on the scheduler.
class FakeRelayHub {
public:
  explicit FakeRelayHub(IScheduler &sched) : sched_(sched) {}

  RelaySocketFactory factory(Slot slot) {
    return [this, slot] {
      auto s = std::make_shared<FakeRelaySocket>();
      s->on_send = [this, slot](const nlohmann::json &frame) {
        route(slot, frame);
      };
      sockets_[slot_index(slot)].push_back(s);
      return s;
    };
  }

  // Opens the latest socket of both slots and announces both peers.
  void connect_both() {
    for (const auto slot : kSlots) {
      latest(slot)->accept();
    }
    for (const auto slot : kSlots) {
      latest(slot)->receive(make_peers_present(default_relay_assist()));
    }
  }

  std::shared_ptr<FakeRelaySocket> latest(Slot slot) {
    return sockets_[slot_index(slot)].back();
  }

  [[nodiscard]] std::size_t forwarded_games() const noexcept { return games_; }

private:
  void route(Slot from, const nlohmann::json &frame) {
    const auto type = frame_type(frame);
    if (type != "game" && !is_signal_type(type)) {
      return;
    }
    if (sockets_[slot_index(other_slot(from))].empty()) {
      return;
    }
    if (type == "game") {
      ++games_;
    }
    auto target = latest(other_slot(from));
    std::weak_ptr<FakeRelaySocket> weak = target;
    const auto text = frame.dump();
    sched_.schedule_after(std::chrono::milliseconds(0), [weak, text] {
      auto s = weak.lock();
      if (s && s->is_open()) {
        s->receive_raw(text);
      }
    });
  }

  IScheduler &sched_;
  std::vector<std::shared_ptr<FakeRelaySocket>> sockets_[2];
  std::size_t games_ = 0;
};

// In-memory UDP. Datagrams arrive on the scheduler after `latency`; `drop`
// decides per datagram whether it is lost.
class FakeDatagramNetwork {
public:
  using DropRule = std::function<bool(const UdpEndpoint &from,
                                      const UdpEndpoint &to,
                                      const std::string &text)>;

  explicit FakeDatagramNetwork(IScheduler &sched) : sched_(sched) {}

  class Socket : public IDatagramSocket {
  public:
    Socket(FakeDatagramNetwork &net, UdpEndpoint self, bool fail_bind)
        : net_(net), self_(std::move(self)), fail_bind_(fail_bind) {}

    std::vector<UdpEndpoint> open(ReceiveHandler handler) override {
      if (fail_bind_) {
        throw ConnectionError("bind failed");
      }
      handler_ = std::move(handler);
      net_.bound_[self_.port] = this;
      return {self_, UdpEndpoint{"203.0.113.9", self_.port}};
    }

    void send_to(const UdpEndpoint &dst,
                 std::span<const std::byte> data) noexcept override {
      net_.send(self_, dst,
                std::string(reinterpret_cast<const char *>(data.data()),
                            data.size()));
    }

    void close() noexcept override {
      auto it = net_.bound_.find(self_.port);
      if (it != net_.bound_.end() && it->second == this) {
        net_.bound_.erase(it);
      }
      handler_ = nullptr;
    }

    ~Socket() override { close(); }

    [[nodiscard]] const UdpEndpoint &endpoint() const noexcept { return self_; }

  private:
    friend class FakeDatagramNetwork;

    FakeDatagramNetwork &net_;
    UdpEndpoint self_;
    bool fail_bind_;
    ReceiveHandler handler_;
  };

  std::shared_ptr<Socket> make_socket(bool fail_bind = false) {
    return std::make_shared<Socket>(
        *this, UdpEndpoint{"127.0.0.1", next_port_++}, fail_bind);
  }

  DropRule drop;
  std::chrono::milliseconds latency{5};
  std::size_t delivered = 0;
  std::size_t dropped = 0;

private:
  void send(const UdpEndpoint &from, const UdpEndpoint &to, std::string text) {
    // Only loopback candidates are reachable.
    if (to.address != "127.0.0.1" || (drop && drop(from, to, text))) {
      ++dropped;
      return;
    }
    sched_.schedule_after(latency, [this, from, to, text] {
      auto it = bound_.find(to.port);
      if (it == bound_.end() || !it->second->handler_) {
        ++dropped;
        return;
      }
      ++delivered;
      auto handler = it->second->handler_;
      handler(from, std::as_bytes(std::span<const char>(text.data(),
                                                        text.size())));
    });
  }

  IScheduler &sched_;
  std::uint16_t next_port_ = 40000;
  std::map<std::uint16_t, Socket *> bound_;
};

// Signaling side channel between two peers. Frames arrive on the scheduler.
class FakeSignaling : public ISignaling {
public:
  explicit FakeSignaling(IScheduler &sched) : sched_(sched) {}

  static void link(FakeSignaling &a, FakeSignaling &b) {
    a.peer_ = &b;
    b.peer_ = &a;
  }

  void send_signal(const nlohmann::json &frame) override {
    sent.push_back(frame);
    if (!peer_ || !connected) {
      return;
    }
    auto *peer = peer_;
    sched_.schedule_after(std::chrono::milliseconds(0),
                          [peer, frame] { peer->inject(frame); });
  }

  Subscription subscribe_signals(SignalListener listener) override {
    return listeners_.add(std::move(listener));
  }

  void inject(const nlohmann::json &frame) { listeners_.emit(frame); }

  std::vector<nlohmann::json> sent;
  bool connected = true;

private:
  IScheduler &sched_;
  FakeSignaling *peer_ = nullptr;
  ListenerSet<const nlohmann::json &> listeners_;
};

// Room host with a hand-cranked clock and a recorded alarm.
class FakeRoomHost : public IRoomHost {
public:
  [[nodiscard]] std::int64_t now_ms() const override { return now; }
  void set_alarm(std::int64_t at_ms) override { alarm = at_ms; }

  std::int64_t now = 1'700'000'000'000;
  std::int64_t alarm = 0;
};

// Peer handle that records what the room sends it.
class FakePeer : public IPeerHandle {
public:
  void send_text(const std::string &text) override {
    frames.push_back(nlohmann::json::parse(text));
  }
  void close(std::uint16_t code, const std::string &reason) override {
    close_code = code;
    close_reason = reason;
  }

  [[nodiscard]] std::vector<nlohmann::json>
  frames_of(const std::string &type) const {
    std::vector<nlohmann::json> out;
    for (const auto &f : frames) {
      if (frame_type(f) == type) {
        out.push_back(f);
      }
    }
    return out;
  }

  std::vector<nlohmann::json> frames;
  std::uint16_t close_code = 0;
  std::string close_reason;
};
