#include "net/direct_channel.hpp"

#include <algorithm>
#include <cstdio>
#include <random>
#include <utility>

#include "core/log.hpp"
#include "proto/relay_messages.hpp"

using nlohmann::json;

const char *to_string(DirectState s) noexcept {
  switch (s) {
  case DirectState::Idle:
    return "idle";
  case DirectState::Negotiating:
    return "negotiating";
  case DirectState::Open:
    return "open";
  case DirectState::Closed:
    return "closed";
  }
  return "unknown";
}

DirectChannel::DirectChannel(IScheduler &sched, ISignaling &signaling,
                             std::shared_ptr<IDatagramSocket> socket,
                             Slot local, DirectOptions opts)
    : sched_(sched), signaling_(signaling), socket_(std::move(socket)),
      local_(local), opts_(std::move(opts)), stream_(opts_.rto),
      prober_(sched), keepalive_(sched), retransmit_(sched) {}

DirectChannel::~DirectChannel() { dispose(); }

std::string DirectChannel::make_token() {
  std::random_device rd;
  std::mt19937_64 gen((static_cast<std::uint64_t>(rd()) << 32) ^ rd());
  char buf[17];
  std::snprintf(buf, sizeof(buf), "%016llx",
                static_cast<unsigned long long>(gen()));
  return buf;
}

void DirectChannel::start() {
  if (state_ != DirectState::Idle || disposed_) {
    return;
  }
  state_ = DirectState::Negotiating;
  signal_sub_ = signaling_.subscribe_signals(
      [this](const json &frame) { on_signal(frame); });

  try {
    local_candidates_ = socket_->open(
        [this](const UdpEndpoint &from, std::span<const std::byte> data) {
          on_datagram(from, data);
        });
  } catch (const ConnectionError &e) {
    report(e);
    close(e.what());
    return;
  }

  if (local_ == Slot::First) {
    token_ = opts_.token.empty() ? make_token() : opts_.token;
    signaling_.send_signal(make_signal("offer", json{{"token", token_}}));
    for (const auto &c : local_candidates_) {
      signaling_.send_signal(make_signal(
          "ice-candidate", json{{"address", c.address}, {"port", c.port}}));
    }
    begin_probing();
  }
}

void DirectChannel::on_signal(const json &frame) {
  if (state_ != DirectState::Negotiating) {
    return;
  }
  const auto type = frame_type(frame);
  try {
    if (type == "offer" && local_ == Slot::Second) {
      if (!token_.empty()) {
        return;
      }
      token_ = frame.at("token").get<std::string>();
      signaling_.send_signal(make_signal("answer", json{{"token", token_}}));
      for (const auto &c : local_candidates_) {
        signaling_.send_signal(make_signal(
            "ice-candidate", json{{"address", c.address}, {"port", c.port}}));
      }
      begin_probing();
    } else if (type == "answer" && local_ == Slot::First) {
      if (frame.at("token").get<std::string>() != token_) {
        report(ProtocolError("answer carries a foreign session token"));
      }
    } else if (type == "ice-candidate") {
      add_candidate({frame.at("address").get<std::string>(),
                     frame.at("port").get<std::uint16_t>()});
    }
  } catch (const json::exception &e) {
    report(ProtocolError(std::string("bad ") + type + " signal: " + e.what()));
  }
}

void DirectChannel::add_candidate(const UdpEndpoint &ep) {
  if (std::find(remote_candidates_.begin(), remote_candidates_.end(), ep) !=
      remote_candidates_.end()) {
    return;
  }
  remote_candidates_.push_back(ep);
  if (prober_.running()) {
    send_datagram(ep, json{{"k", "probe"}});
  }
}

void DirectChannel::begin_probing() {
  prober_.start(opts_.probe_interval, [this] { probe(); });
  probe();
}

void DirectChannel::probe() {
  for (const auto &c : remote_candidates_) {
    send_datagram(c, json{{"k", "probe"}});
  }
}

void DirectChannel::on_datagram(const UdpEndpoint &from,
                                std::span<const std::byte> data) {
  if (state_ == DirectState::Closed || token_.empty()) {
    return;
  }

  json msg;
  try {
    msg = json::parse(reinterpret_cast<const char *>(data.data()),
                      reinterpret_cast<const char *>(data.data()) + data.size());
  } catch (const json::exception &) {
    DUEL_LOGLN("direct: dropping non-json datagram from " << from.address
                                                          << ":" << from.port);
    return;
  }
  if (!msg.is_object() || msg.value("t", std::string()) != token_) {
    return;
  }

  const auto kind = msg.value("k", std::string());
  if (kind == "probe") {
    send_datagram(from, json{{"k", "probe-ack"}});
    return;
  }
  if (kind == "probe-ack") {
    if (state_ == DirectState::Negotiating) {
      open(from);
    }
    return;
  }

  // Anything else only counts from the selected path. Data or a keepalive
  // arriving first means the peer already picked us.
  if (state_ == DirectState::Negotiating && (kind == "data" || kind == "ka")) {
    open(from);
  }
  if (state_ != DirectState::Open || !remote_ || from != *remote_) {
    return;
  }
  last_heard_ms_ = sched_.now_ms();

  try {
    if (kind == "data") {
      const auto seq = msg.at("s").get<std::uint64_t>();
      auto ready = stream_.on_segment(seq, msg.at("d").get<std::string>());
      send_datagram(from, json{{"k", "ack"}, {"a", stream_.cumulative_ack()}});
      for (const auto &text : ready) {
        Envelope env;
        try {
          env = decode_envelope(parse_json(text));
        } catch (const ProtocolError &e) {
          report(e);
          continue;
        }
        deliver(env);
        if (state_ != DirectState::Open) {
          return;
        }
      }
    } else if (kind == "ack") {
      stream_.on_ack(msg.at("a").get<std::uint64_t>());
    } else if (kind == "bye") {
      close("peer closed the direct channel");
    }
  } catch (const json::exception &e) {
    report(ProtocolError(std::string("bad datagram: ") + e.what()));
  }
}

void DirectChannel::open(const UdpEndpoint &remote) {
  remote_ = remote;
  state_ = DirectState::Open;
  prober_.stop();
  last_heard_ms_ = sched_.now_ms();
  DUEL_LOGLN("direct: open to " << remote.address << ":" << remote.port);

  keepalive_.start(opts_.keepalive, [this] { maintain(); });
  retransmit_.start(opts_.rto, [this] {
    for (const auto &seg : stream_.due_retransmits(sched_.now_ms())) {
      transmit(seg);
    }
  });

  open_listeners_.emit();
  for (const auto &msg : pending_.drain()) {
    if (state_ != DirectState::Open) {
      break;
    }
    send(msg);
  }
}

void DirectChannel::maintain() {
  if (sched_.now_ms() - last_heard_ms_ >= opts_.liveness_timeout.count()) {
    close("direct path went silent");
    return;
  }
  send_datagram(*remote_, json{{"k", "ka"}});
}

void DirectChannel::send(const WireMessage &msg) {
  if (disposed_ || state_ == DirectState::Closed) {
    return;
  }
  if (state_ != DirectState::Open) {
    pending_.push(msg);
    return;
  }
  const Envelope env{local_, msg, sched_.now_ms()};
  transmit(stream_.push(encode_envelope(env).dump(), sched_.now_ms()));
}

void DirectChannel::transmit(const ReliableStream::Segment &seg) {
  send_datagram(*remote_, json{{"k", "data"}, {"s", seg.seq}, {"d", seg.data}});
}

void DirectChannel::send_datagram(const UdpEndpoint &to, json body) {
  body["t"] = token_;
  const auto text = body.dump();
  socket_->send_to(to, std::as_bytes(std::span<const char>(text.data(),
                                                           text.size())));
}

Subscription DirectChannel::on_open(OpenListener listener) {
  return open_listeners_.add(std::move(listener));
}

Subscription DirectChannel::on_closed(CloseListener listener) {
  return close_listeners_.add(std::move(listener));
}

void DirectChannel::close(const std::string &reason) {
  if (state_ == DirectState::Closed) {
    return;
  }
  state_ = DirectState::Closed;
  prober_.stop();
  keepalive_.stop();
  retransmit_.stop();
  signal_sub_.reset();
  pending_.clear();
  socket_->close();
  DUEL_LOGLN("direct: closed: " << reason);
  close_listeners_.emit(reason);
}

void DirectChannel::dispose() {
  if (disposed_) {
    return;
  }
  disposed_ = true;
  if (state_ == DirectState::Open && remote_) {
    send_datagram(*remote_, json{{"k", "bye"}});
  }
  close_listeners_.clear();
  open_listeners_.clear();
  clear_listeners();
  close("disposed");
}
