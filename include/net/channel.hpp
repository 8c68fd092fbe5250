#pragma once
#include <cstddef>
#include <deque>
#include <functional>
#include <iterator>
#include <utility>
#include <vector>

#include "core/errors.hpp"
#include "core/listeners.hpp"
#include "proto/wire.hpp"

using EnvelopeListener = std::function<void(const Envelope &)>;

// A bidirectional envelope pipe between the two peers.
class IChannel {
public:
  virtual ~IChannel() = default;

  // Before the channel is ready, messages are queued and flushed once, in
  // order, when it opens.
  virtual void send(const WireMessage &msg) = 0;
  virtual Subscription subscribe(EnvelopeListener listener) = 0;
  virtual Subscription subscribe_errors(ErrorHandler listener) = 0;
  [[nodiscard]] virtual bool is_ready() const = 0;
  // Idempotent.
  virtual void dispose() = 0;
};

// FIFO of messages waiting for a channel to open. drain() hands each message
// out exactly once.
class SendBuffer {
public:
  void push(WireMessage msg) { queue_.push_back(std::move(msg)); }

  std::vector<WireMessage> drain() {
    std::vector<WireMessage> out(std::make_move_iterator(queue_.begin()),
                                 std::make_move_iterator(queue_.end()));
    queue_.clear();
    return out;
  }

  void clear() noexcept { queue_.clear(); }
  [[nodiscard]] bool empty() const noexcept { return queue_.empty(); }
  [[nodiscard]] std::size_t size() const noexcept { return queue_.size(); }

private:
  std::deque<WireMessage> queue_;
};

// Listener bookkeeping shared by the concrete channels.
class ChannelBase : public IChannel {
public:
  Subscription subscribe(EnvelopeListener listener) override {
    return envelopes_.add(std::move(listener));
  }

  Subscription subscribe_errors(ErrorHandler listener) override {
    return errors_.add(std::move(listener));
  }

protected:
  void deliver(const Envelope &env) const { envelopes_.emit(env); }
  void report(const DuelError &err) const { errors_.emit(err); }

  void clear_listeners() {
    envelopes_.clear();
    errors_.clear();
  }

private:
  ListenerSet<const Envelope &> envelopes_;
  ListenerSet<const DuelError &> errors_;
};
