#include "net/loopback_channel.hpp"

#include <chrono>

LoopbackChannel::Pair LoopbackChannel::make_pair(IScheduler &sched, bool open) {
  auto a = std::make_shared<LoopbackChannel>(Slot::First, sched);
  auto b = std::make_shared<LoopbackChannel>(Slot::Second, sched);
  a->peer_ = b;
  b->peer_ = a;
  a->open_ = open;
  b->open_ = open;
  return {a, b};
}

bool LoopbackChannel::is_ready() const {
  return open_ && !disposed_ && !peer_.expired();
}

void LoopbackChannel::send(const WireMessage &msg) {
  if (disposed_) {
    return;
  }
  if (!is_ready()) {
    pending_.push(msg);
    return;
  }
  transmit(msg);
}

void LoopbackChannel::set_open(bool open) {
  if (disposed_) {
    return;
  }
  open_ = open;
  if (!is_ready()) {
    return;
  }
  for (const auto &msg : pending_.drain()) {
    transmit(msg);
  }
}

void LoopbackChannel::dispose() {
  if (disposed_) {
    return;
  }
  disposed_ = true;
  open_ = false;
  pending_.clear();
  clear_listeners();
}

void LoopbackChannel::inject_raw(const std::string &text) {
  std::weak_ptr<LoopbackChannel> weak = peer_;
  sched_.schedule_after(std::chrono::milliseconds(0), [weak, text] {
    if (auto peer = weak.lock()) {
      peer->receive(text);
    }
  });
}

void LoopbackChannel::transmit(const WireMessage &msg) {
  const Envelope env{local_, msg, sched_.now_ms()};
  inject_raw(encode_envelope(env).dump());
}

void LoopbackChannel::receive(const std::string &text) {
  if (disposed_) {
    return;
  }
  Envelope env;
  try {
    env = decode_envelope(parse_json(text));
  } catch (const ProtocolError &e) {
    report(e);
    return;
  }
  deliver(env);
}
