#include "proto/host.hpp"

#include <chrono>
#include <string>
#include <utility>
#include <variant>

#include "core/log.hpp"

AuthorityHost::AuthorityHost(IScheduler &sched, HostOptions opts)
    : sched_(sched), opts_(std::move(opts)), engine_(opts_.engine),
      ticker_(sched) {
  if (opts_.input_capacity == 0) {
    opts_.input_capacity = 1;
  }
}

AuthorityHost::~AuthorityHost() { dispose(); }

void AuthorityHost::attach(std::shared_ptr<IChannel> channel) {
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
}

void AuthorityHost::detach() {
  envelope_sub_.reset();
  error_sub_.reset();
  channel_.reset();
}

void AuthorityHost::mark_ready() {
  if (disposed_) {
    return;
  }
  engine_.ready(Slot::First);
  maybe_start();
}

void AuthorityHost::queue_local_intent(Direction dir) {
  engine_.queue_intent(Slot::First, dir);
}

SimulationState AuthorityHost::tick() {
  if (!inputs_.empty()) {
    engine_.queue_intent(Slot::Second, inputs_.front());
    inputs_.pop_front();
  }
  auto state = engine_.tick();
  broadcast();
  state_listeners_.emit(state);
  if (state.status == SimStatus::Finished) {
    ticker_.stop();
  }
  return state;
}

Subscription AuthorityHost::on_state(StateListener listener) {
  return state_listeners_.add(std::move(listener));
}

Subscription AuthorityHost::on_error(ErrorHandler listener) {
  return error_listeners_.add(std::move(listener));
}

void AuthorityHost::dispose() {
  if (disposed_) {
    return;
  }
  disposed_ = true;
  ticker_.stop();
  detach();
  inputs_.clear();
  state_listeners_.clear();
  error_listeners_.clear();
}

void AuthorityHost::handle(const Envelope &env) {
  if (env.from != Slot::Second) {
    fail(ProtocolError("envelope from unexpected slot " +
                       std::string(to_string(env.from))));
    return;
  }

  if (std::holds_alternative<ReadyMsg>(env.payload)) {
    engine_.ready(Slot::Second);
    maybe_start();
  } else if (const auto *input = std::get_if<InputMsg>(&env.payload)) {
    inputs_.push_back(input->direction);
    if (inputs_.size() > opts_.input_capacity) {
      inputs_.pop_front();
      ++dropped_;
    }
  } else if (std::holds_alternative<SyncRequestMsg>(env.payload)) {
    broadcast();
  } else if (const auto *ping = std::get_if<PingMsg>(&env.payload)) {
    send(PongMsg{ping->timestamp_ms, sched_.now_ms()});
  } else {
    fail(ProtocolError("host got unexpected '" +
                       std::string(message_type(env.payload)) + "'"));
  }
}

void AuthorityHost::maybe_start() {
  if (engine_.status() != SimStatus::Ready) {
    return;
  }
  engine_.start();
  DUEL_LOGLN("host: both peers ready, starting");
  broadcast();
  state_listeners_.emit(engine_.snapshot());
  if (opts_.auto_tick) {
    ticker_.start(std::chrono::milliseconds(opts_.engine.tick_interval_ms),
                  [this] { tick(); });
  }
}

void AuthorityHost::broadcast() {
  ++sequence_;
  if (!channel_ || !channel_->is_ready()) {
    return;
  }
  send(StateMsg{engine_.snapshot(), sequence_, sched_.now_ms()});
}

void AuthorityHost::send(const WireMessage &msg) {
  if (channel_) {
    channel_->send(msg);
  }
}

void AuthorityHost::fail(const DuelError &err) {
  DUEL_LOGLN("host: " << err.what());
  error_listeners_.emit(err);
}
