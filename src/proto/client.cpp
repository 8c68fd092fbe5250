#include "proto/client.hpp"

#include <string>
#include <utility>
#include <variant>

#include "core/log.hpp"

AuthorityClient::AuthorityClient(IScheduler &sched, ClientOptions opts)
    : sched_(sched), opts_(opts), pinger_(sched) {}

AuthorityClient::~AuthorityClient() { dispose(); }

void AuthorityClient::attach(std::shared_ptr<IChannel> channel) {
  if (disposed_) {
    return;
  }
  detach();
  channel_ = std::move(channel);
  if (!channel_) {
    return;
  }
  envelope_sub_ =
      channel_->subscribe([this](const Envelope &env) { handle(env); });
  error_sub_ = channel_->subscribe_errors(
      [this](const DuelError &err) { error_listeners_.emit(err); });

  if (ready_requested_ && !ready_sent_) {
    ready_sent_ = true;
    send(ReadyMsg{});
  }
  if (attached_before_) {
    send(SyncRequestMsg{});
  }
  attached_before_ = true;

  if (opts_.ping_interval.count() > 0) {
    pinger_.start(opts_.ping_interval, [this] { ping(); });
  }
}

void AuthorityClient::detach() {
  pinger_.stop();
  envelope_sub_.reset();
  error_sub_.reset();
  channel_.reset();
}

void AuthorityClient::mark_ready() {
  if (disposed_ || ready_requested_) {
    return;
  }
  ready_requested_ = true;
  if (channel_) {
    ready_sent_ = true;
    send(ReadyMsg{});
  }
}

void AuthorityClient::send_input(Direction dir) {
  send(InputMsg{dir, ++local_sequence_});
}

Subscription AuthorityClient::on_state(StateListener listener) {
  return state_listeners_.add(std::move(listener));
}

Subscription AuthorityClient::on_error(ErrorHandler listener) {
  return error_listeners_.add(std::move(listener));
}

void AuthorityClient::dispose() {
  if (disposed_) {
    return;
  }
  disposed_ = true;
  detach();
  state_listeners_.clear();
  error_listeners_.clear();
}

void AuthorityClient::handle(const Envelope &env) {
  if (env.from != Slot::First) {
    fail(ProtocolError("envelope from unexpected slot " +
                       std::string(to_string(env.from))));
    return;
  }

  if (const auto *state = std::get_if<StateMsg>(&env.payload)) {
    apply(*state);
  } else if (const auto *pong = std::get_if<PongMsg>(&env.payload)) {
    record_pong(*pong);
  } else if (const auto *ping = std::get_if<PingMsg>(&env.payload)) {
    send(PongMsg{ping->timestamp_ms, sched_.now_ms()});
  } else {
    fail(ProtocolError("client got unexpected '" +
                       std::string(message_type(env.payload)) + "'"));
  }
}

void AuthorityClient::apply(const StateMsg &msg) {
  // Stale or duplicate states leave the mirror untouched.
  if (state_ && msg.tick_sequence <= last_sequence_) {
    return;
  }
  last_sequence_ = msg.tick_sequence;
  state_ = msg.snapshot;
  state_listeners_.emit(*state_);
}

void AuthorityClient::record_pong(const PongMsg &pong) {
  const auto rtt = sched_.now_ms() - pong.timestamp_ms;
  if (rtt < 0) {
    return;
  }
  const double one_way = static_cast<double>(rtt) / 2.0;
  if (!latency_) {
    latency_ = one_way;
  } else {
    latency_ = *latency_ + opts_.latency_smoothing * (one_way - *latency_);
  }
}

void AuthorityClient::ping() {
  if (channel_ && channel_->is_ready()) {
    send(PingMsg{sched_.now_ms()});
  }
}

void AuthorityClient::send(const WireMessage &msg) {
  if (channel_) {
    channel_->send(msg);
  }
}

void AuthorityClient::fail(const DuelError &err) {
  DUEL_LOGLN("client: " << err.what());
  error_listeners_.emit(err);
}
