#pragma once
#include <functional>

#include <nlohmann/json.hpp>

#include "core/listeners.hpp"

// Side channel carrying negotiation frames (offer, answer, ice-candidate,
// direct-ready, direct-failed) to the other peer.
class ISignaling {
public:
  using SignalListener = std::function<void(const nlohmann::json &)>;

  virtual ~ISignaling() = default;

  virtual void send_signal(const nlohmann::json &frame) = 0;
  virtual Subscription subscribe_signals(SignalListener listener) = 0;
};
