#include "proto/relay_messages.hpp"

#include <array>

using nlohmann::json;

RelayAssistConfig default_relay_assist() {
  return {{"stun:stun.l.google.com:19302", "stun:stun1.l.google.com:19302"}};
}

void to_json(json &j, const RelayAssistConfig &c) {
  j = json{{"iceServers", json::array({json{{"urls", c.urls}}})}};
}

void from_json(const json &j, RelayAssistConfig &c) {
  c.urls.clear();
  for (const auto &server : j.at("iceServers")) {
    const auto &urls = server.at("urls");
    if (urls.is_string()) {
      c.urls.push_back(urls.get<std::string>());
      continue;
    }
    for (const auto &u : urls) {
      c.urls.push_back(u.get<std::string>());
    }
  }
}

bool is_signal_type(std::string_view type) noexcept {
  static constexpr std::array<std::string_view, 5> kSignals{
      "offer", "answer", "ice-candidate", "direct-ready", "direct-failed"};
  for (const auto s : kSignals) {
    if (s == type) {
      return true;
    }
  }
  return false;
}

json make_joined(Slot slot) {
  return json{{"type", "joined"}, {"slot", std::string(to_string(slot))}};
}

json make_peers_present(const RelayAssistConfig &assist) {
  return json{{"type", "peers-present"}, {"relayAssist", assist}};
}

json make_leave(Slot slot) {
  return json{{"type", "leave"}, {"slot", std::string(to_string(slot))}};
}

json make_error(std::string_view code, std::string_view message) {
  return json{{"type", "error"},
              {"code", std::string(code)},
              {"message", std::string(message)}};
}

json make_ping() { return json{{"type", "ping"}}; }

json make_pong() { return json{{"type", "pong"}}; }

json make_game(const Envelope &env) {
  return json{{"type", "game"}, {"payload", encode_envelope(env)}};
}

json make_signal(std::string_view type, json body) {
  if (!body.is_object()) {
    body = json::object();
  }
  body["type"] = std::string(type);
  return body;
}

std::string frame_type(const json &frame) {
  if (!frame.is_object()) {
    return {};
  }
  auto it = frame.find("type");
  if (it == frame.end() || !it->is_string()) {
    return {};
  }
  return it->get<std::string>();
}
