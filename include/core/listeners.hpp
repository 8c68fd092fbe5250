#pragma once
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <utility>
#include <vector>

// Handle returned by subscribe(). Unsubscribes when reset or destroyed; safe to
// outlive the publisher.
class Subscription {
public:
  Subscription() = default;
  explicit Subscription(std::function<void()> cancel)
      : cancel_(std::move(cancel)) {}
  ~Subscription() { reset(); }

  Subscription(const Subscription &) = delete;
  Subscription &operator=(const Subscription &) = delete;

  Subscription(Subscription &&other) noexcept
      : cancel_(std::exchange(other.cancel_, nullptr)) {}
  Subscription &operator=(Subscription &&other) noexcept {
    if (this != &other) {
      reset();
      cancel_ = std::exchange(other.cancel_, nullptr);
    }
    return *this;
  }

  void reset() {
    if (cancel_) {
      auto cancel = std::exchange(cancel_, nullptr);
      cancel();
    }
  }

  [[nodiscard]] bool active() const noexcept {
    return static_cast<bool>(cancel_);
  }

private:
  std::function<void()> cancel_;
};

template <typename... Args> class ListenerSet {
public:
  using Listener = std::function<void(Args...)>;

  Subscription add(Listener listener) {
    const auto id = state_->next_id++;
    state_->listeners.emplace(id, std::move(listener));
    std::weak_ptr<State> weak = state_;
    return Subscription([weak, id] {
      if (auto state = weak.lock()) {
        state->listeners.erase(id);
      }
    });
  }

  // Listeners removed while dispatching are skipped; listeners added while
  // dispatching first see the next emit.
  void emit(Args... args) const {
    auto state = state_;
    std::vector<std::uint64_t> ids;
    ids.reserve(state->listeners.size());
    for (const auto &entry : state->listeners) {
      ids.push_back(entry.first);
    }
    for (const auto id : ids) {
      auto it = state->listeners.find(id);
      if (it == state->listeners.end()) {
        continue;
      }
      auto fn = it->second;
      fn(args...);
    }
  }

  void clear() { state_->listeners.clear(); }

  [[nodiscard]] std::size_t size() const noexcept {
    return state_->listeners.size();
  }

  [[nodiscard]] bool empty() const noexcept {
    return state_->listeners.empty();
  }

private:
  struct State {
    std::uint64_t next_id = 1;
    std::map<std::uint64_t, Listener> listeners;
  };

  std::shared_ptr<State> state_ = std::make_shared<State>();
};
