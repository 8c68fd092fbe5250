#include "net/relay_channel.hpp"

#include <algorithm>
#include <utility>

#include "core/log.hpp"

const char *to_string(RelayEvent ev) noexcept {
  switch (ev) {
  case RelayEvent::Connecting:
    return "connecting";
  case RelayEvent::Open:
    return "open";
  case RelayEvent::PeersPresent:
    return "peers-present";
  case RelayEvent::PeerLeft:
    return "peer-left";
  case RelayEvent::Disconnected:
    return "disconnected";
  case RelayEvent::Failed:
    return "failed";
  }
  return "unknown";
}

RelayChannel::RelayChannel(IScheduler &sched, RelaySocketFactory factory,
                           RelayOptions opts)
    : sched_(sched), factory_(std::move(factory)), opts_(std::move(opts)),
      reconnect_timer_(sched), keepalive_(sched) {}

RelayChannel::~RelayChannel() { dispose(); }

RelayTarget RelayChannel::target_for(const RelayOptions &opts) {
  return {opts.host, opts.port,
          "/ws?room=" + opts.room + "&slot=" + std::string(to_string(opts.slot))};
}

void RelayChannel::connect() {
  if (disposed_ || socket_) {
    return;
  }
  emit(RelayEvent::Connecting);

  const auto gen = ++generation_;
  socket_ = factory_();
  std::weak_ptr<RelayChannel> weak = weak_from_this();

  IRelaySocket::Handlers handlers;
  handlers.on_open = [weak, gen] {
    if (auto self = weak.lock()) {
      self->on_open(gen);
    }
  };
  handlers.on_text = [weak, gen](const std::string &text) {
    if (auto self = weak.lock()) {
      self->on_text(gen, text);
    }
  };
  handlers.on_close = [weak, gen](std::uint16_t code,
                                  const std::string &reason) {
    if (auto self = weak.lock()) {
      self->on_close(gen, code, reason);
    }
  };
  // Keep a local reference: a socket may fail inside open().
  auto socket = socket_;
  socket->open(target_for(opts_), std::move(handlers));
}

bool RelayChannel::socket_open() const {
  return socket_ && socket_->is_open();
}

bool RelayChannel::is_ready() const {
  return !disposed_ && socket_open() && peers_present_;
}

void RelayChannel::send(const WireMessage &msg) {
  if (disposed_) {
    return;
  }
  if (!is_ready()) {
    pending_.push(msg);
    return;
  }
  write(make_game(Envelope{opts_.slot, msg, sched_.now_ms()}));
}

void RelayChannel::send_signal(const nlohmann::json &frame) {
  if (disposed_) {
    return;
  }
  if (!socket_open()) {
    pending_signals_.push_back(frame);
    return;
  }
  write(frame);
}

Subscription RelayChannel::subscribe_signals(SignalListener listener) {
  return signal_listeners_.add(std::move(listener));
}

Subscription RelayChannel::subscribe_events(EventListener listener) {
  return event_listeners_.add(std::move(listener));
}

void RelayChannel::dispose() {
  if (disposed_) {
    return;
  }
  disposed_ = true;
  reconnect_timer_.cancel();
  keepalive_.stop();
  peers_present_ = false;
  if (auto socket = std::exchange(socket_, nullptr)) {
    socket->close(kCloseNormal, "disposed");
  }
  pending_.clear();
  pending_signals_.clear();
  clear_listeners();
  signal_listeners_.clear();
  event_listeners_.clear();
}

void RelayChannel::on_open(std::uint64_t gen) {
  if (gen != generation_ || disposed_) {
    return;
  }
  attempts_ = 0;
  DUEL_LOGLN("relay: connected to room " << opts_.room << " as "
                                         << to_string(opts_.slot));
  keepalive_.start(opts_.keepalive, [this] {
    if (socket_open()) {
      write(make_ping());
    }
  });
  emit(RelayEvent::Open);
  flush_signals();
}

void RelayChannel::on_text(std::uint64_t gen, const std::string &text) {
  if (gen != generation_ || disposed_) {
    return;
  }

  nlohmann::json frame;
  try {
    frame = parse_json(text);
  } catch (const ProtocolError &e) {
    report(e);
    return;
  }

  const auto type = frame_type(frame);
  if (type == "game") {
    if (!frame.contains("payload")) {
      report(ProtocolError("game frame without payload"));
      return;
    }
    Envelope env;
    try {
      env = decode_envelope(frame["payload"]);
    } catch (const ProtocolError &e) {
      report(e);
      return;
    }
    deliver(env);
  } else if (type == "peers-present") {
    if (frame.contains("relayAssist")) {
      try {
        relay_assist_ = frame["relayAssist"].get<RelayAssistConfig>();
      } catch (const nlohmann::json::exception &e) {
        report(ProtocolError(std::string("bad relayAssist: ") + e.what()));
      }
    }
    peers_present_ = true;
    emit(RelayEvent::PeersPresent);
    flush_game();
  } else if (type == "joined") {
    DUEL_LOGLN("relay: joined as " << frame.value("slot", std::string("?")));
  } else if (type == "leave") {
    peers_present_ = false;
    emit(RelayEvent::PeerLeft);
  } else if (type == "error") {
    report(ProtocolError("room error " + frame.value("code", std::string()) +
                         ": " + frame.value("message", std::string())));
  } else if (type == "pong") {
    // keepalive answer
  } else if (is_signal_type(type)) {
    signal_listeners_.emit(frame);
  } else {
    report(ProtocolError("unknown relay frame '" + type + "'"));
  }
}

void RelayChannel::on_close(std::uint64_t gen, std::uint16_t code,
                            const std::string &reason) {
  if (gen != generation_ || disposed_) {
    return;
  }
  socket_.reset();
  peers_present_ = false;
  keepalive_.stop();
  DUEL_LOGLN("relay: closed (" << code << ") " << reason);

  switch (code) {
  case kCloseNormal:
    emit(RelayEvent::Disconnected);
    return;
  case kCloseSlotConflict:
    report(SlotConflictError("slot " + std::string(to_string(opts_.slot)) +
                             " is taken in room " + opts_.room));
    emit(RelayEvent::Failed);
    return;
  case kCloseBadRequest:
    report(ConnectionError("room rejected the connection: " + reason));
    emit(RelayEvent::Failed);
    return;
  default:
    report(ConnectionError("relay closed with code " + std::to_string(code) +
                           ": " + reason));
    emit(RelayEvent::Disconnected);
    schedule_reconnect();
  }
}

void RelayChannel::schedule_reconnect() {
  if (disposed_) {
    return;
  }
  if (attempts_ >= opts_.max_reconnect_attempts) {
    report(ReconnectionExhaustedError(
        "relay gave up after " + std::to_string(attempts_) + " attempts"));
    emit(RelayEvent::Failed);
    return;
  }
  auto delay = opts_.reconnect_base;
  for (int i = 0; i < attempts_ && delay < opts_.reconnect_cap; ++i) {
    delay *= 2;
  }
  delay = std::min(delay, opts_.reconnect_cap);
  ++attempts_;
  DUEL_LOGLN("relay: reconnect #" << attempts_ << " in " << delay.count()
                                  << "ms");
  reconnect_timer_.arm(delay, [this] { connect(); });
}

void RelayChannel::flush_signals() {
  while (!pending_signals_.empty() && socket_open()) {
    auto frame = std::move(pending_signals_.front());
    pending_signals_.pop_front();
    write(frame);
  }
}

void RelayChannel::flush_game() {
  if (!is_ready()) {
    return;
  }
  for (const auto &msg : pending_.drain()) {
    write(make_game(Envelope{opts_.slot, msg, sched_.now_ms()}));
  }
}

void RelayChannel::write(const nlohmann::json &frame) {
  if (socket_) {
    socket_->send_text(frame.dump());
  }
}

void RelayChannel::emit(RelayEvent ev) { event_listeners_.emit(ev); }
