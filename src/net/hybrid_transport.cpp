#include "net/hybrid_transport.hpp"

#include <utility>

#include "core/log.hpp"
#include "proto/relay_messages.hpp"

const char *to_string(ConnectionState s) noexcept {
  switch (s) {
  case ConnectionState::Disconnected:
    return "disconnected";
  case ConnectionState::Connecting:
    return "connecting";
  case ConnectionState::Signaling:
    return "signaling";
  case ConnectionState::DirectConnecting:
    return "direct-connecting";
  case ConnectionState::DirectConnected:
    return "direct-connected";
  case ConnectionState::RelayConnecting:
    return "relay-connecting";
  case ConnectionState::RelayConnected:
    return "relay-connected";
  case ConnectionState::Failed:
    return "failed";
  }
  return "unknown";
}

HybridTransport::HybridTransport(IScheduler &sched,
                                 std::shared_ptr<RelayChannel> relay,
                                 DirectChannelFactory direct_factory,
                                 HybridOptions opts)
    : sched_(sched), relay_(std::move(relay)),
      direct_factory_(std::move(direct_factory)), opts_(opts),
      negotiation_timer_(sched) {
  relay_subs_.push_back(relay_->subscribe([this](const Envelope &env) {
    // Until the peer reports its direct side open it may still use the relay.
    if (!direct_active() || !peer_direct_ready_) {
      deliver(env);
    }
  }));
  relay_subs_.push_back(relay_->subscribe_errors(
      [this](const DuelError &err) { report(err); }));
  relay_subs_.push_back(
      relay_->subscribe_events([this](RelayEvent ev) { on_relay_event(ev); }));
  relay_subs_.push_back(relay_->subscribe_signals(
      [this](const nlohmann::json &frame) { on_signal(frame); }));
}

HybridTransport::~HybridTransport() { dispose(); }

void HybridTransport::connect() {
  if (disposed_) {
    return;
  }
  set_state(ConnectionState::Connecting);
  relay_->connect();
}

bool HybridTransport::direct_active() const {
  return direct_ && direct_->is_ready();
}

bool HybridTransport::is_ready() const {
  return !disposed_ && (direct_active() || relay_->is_ready());
}

void HybridTransport::send(const WireMessage &msg) {
  if (disposed_) {
    return;
  }
  if (direct_active()) {
    direct_->send(msg);
  } else if (relay_->is_ready()) {
    relay_->send(msg);
  } else {
    pending_.push(msg);
  }
}

Subscription HybridTransport::on_state_change(StateListener listener) {
  return state_listeners_.add(std::move(listener));
}

void HybridTransport::dispose() {
  if (disposed_) {
    return;
  }
  disposed_ = true;
  negotiation_timer_.cancel();
  direct_subs_.clear();
  if (direct_) {
    direct_->dispose();
    direct_.reset();
  }
  relay_subs_.clear();
  relay_->dispose();
  pending_.clear();
  set_state(ConnectionState::Disconnected);
  state_listeners_.clear();
  clear_listeners();
}

void HybridTransport::on_relay_event(RelayEvent ev) {
  switch (ev) {
  case RelayEvent::Connecting:
    if (!direct_active() && state_ != ConnectionState::Connecting) {
      set_state(ConnectionState::RelayConnecting);
    }
    break;
  case RelayEvent::Open:
    if (!direct_) {
      set_state(ConnectionState::Signaling);
    }
    break;
  case RelayEvent::PeersPresent:
    if (!direct_) {
      if (opts_.enable_direct && direct_factory_) {
        start_direct();
      } else {
        set_state(ConnectionState::RelayConnected);
      }
    }
    // The relay is usable from here on, direct or not.
    flush();
    break;
  case RelayEvent::PeerLeft:
    if (!direct_) {
      set_state(ConnectionState::Signaling);
    }
    break;
  case RelayEvent::Disconnected:
    if (!direct_active()) {
      set_state(ConnectionState::RelayConnecting);
    }
    break;
  case RelayEvent::Failed:
    negotiation_timer_.cancel();
    set_state(ConnectionState::Failed);
    break;
  }
}

void HybridTransport::on_signal(const nlohmann::json &frame) {
  const auto type = frame_type(frame);
  if (type == "direct-failed" && direct_) {
    fall_back("peer gave up on the direct path");
  } else if (type == "direct-ready" && direct_) {
    DUEL_LOGLN("hybrid: peer reports direct path ready");
    peer_direct_ready_ = true;
  }
}

void HybridTransport::start_direct() {
  direct_ = direct_factory_(*relay_);
  if (!direct_) {
    set_state(ConnectionState::RelayConnected);
    return;
  }
  set_state(ConnectionState::DirectConnecting);

  direct_subs_.push_back(direct_->subscribe(
      [this](const Envelope &env) { deliver(env); }));
  direct_subs_.push_back(direct_->subscribe_errors(
      [this](const DuelError &err) { report(err); }));
  direct_subs_.push_back(direct_->on_open([this] { on_direct_open(); }));
  direct_subs_.push_back(direct_->on_closed(
      [this](const std::string &reason) { fall_back(reason); }));

  negotiation_timer_.arm(opts_.negotiation_timeout, [this] {
    report(NegotiationTimeoutError("direct negotiation timed out after " +
                                   std::to_string(opts_.negotiation_timeout.count()) +
                                   "ms"));
    fall_back("negotiation timeout");
  });

  auto direct = direct_;
  direct->start();
}

void HybridTransport::on_direct_open() {
  negotiation_timer_.cancel();
  relay_->send_signal(make_signal("direct-ready"));
  set_state(ConnectionState::DirectConnected);
  flush();
}

void HybridTransport::fall_back(const std::string &reason) {
  if (!direct_ || disposed_) {
    return;
  }
  DUEL_LOGLN("hybrid: using relay (" << reason << ")");
  negotiation_timer_.cancel();
  retire_direct();
  relay_->send_signal(make_signal("direct-failed"));
  if (relay_->is_ready()) {
    set_state(ConnectionState::RelayConnected);
    flush();
  } else if (state_ != ConnectionState::Failed) {
    set_state(ConnectionState::RelayConnecting);
  }
}

void HybridTransport::retire_direct() {
  direct_subs_.clear();
  peer_direct_ready_ = false;
  auto retired = std::exchange(direct_, nullptr);
  retired->dispose();
  // We may be running inside one of its callbacks; free it afterwards.
  sched_.schedule_after(std::chrono::milliseconds(0), [retired] {});
}

void HybridTransport::flush() {
  for (const auto &msg : pending_.drain()) {
    send(msg);
  }
}

void HybridTransport::set_state(ConnectionState s) {
  if (s == state_) {
    return;
  }
  DUEL_LOGLN("hybrid: " << to_string(state_) << " -> " << to_string(s));
  state_ = s;
  state_listeners_.emit(s);
}
