#include "proto/wire.hpp"

#include <string>

#include "core/errors.hpp"

using nlohmann::json;

template <class... Ts> struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

template <typename T> static std::string text_of(T value) {
  return std::string(to_string(value));
}

static Slot slot_field(const json &j, const char *key) {
  const auto slot = parse_slot(j.at(key).get<std::string>());
  if (!slot) {
    throw ProtocolError(std::string("bad slot in '") + key + "'");
  }
  return *slot;
}

static Direction direction_field(const json &j, const char *key) {
  const auto dir = parse_direction(j.at(key).get<std::string>());
  if (!dir) {
    throw ProtocolError(std::string("bad direction in '") + key + "'");
  }
  return *dir;
}

std::string_view message_type(const WireMessage &msg) noexcept {
  return std::visit(overloaded{
                        [](const ReadyMsg &) { return "ready"; },
                        [](const InputMsg &) { return "input"; },
                        [](const StateMsg &) { return "state"; },
                        [](const SyncRequestMsg &) { return "sync-request"; },
                        [](const PingMsg &) { return "ping"; },
                        [](const PongMsg &) { return "pong"; },
                    },
                    msg);
}

void to_json(json &j, const Cell &c) { j = json{{"x", c.x}, {"y", c.y}}; }

void from_json(const json &j, Cell &c) {
  c.x = j.at("x").get<std::int32_t>();
  c.y = j.at("y").get<std::int32_t>();
}

void to_json(json &j, const ActorState &a) {
  j = json{
      {"slot", text_of(a.slot)},
      {"heading", text_of(a.heading)},
      {"pendingHeading", a.pending_heading
                             ? json(text_of(*a.pending_heading))
                             : json(nullptr)},
      {"body", a.body},
      {"score", a.score},
      {"alive", a.alive},
      {"ready", a.ready},
      {"respawnCooldown", a.respawn_cooldown},
  };
}

void from_json(const json &j, ActorState &a) {
  a.slot = slot_field(j, "slot");
  a.heading = direction_field(j, "heading");
  const auto &pending = j.at("pendingHeading");
  if (pending.is_null()) {
    a.pending_heading.reset();
  } else {
    a.pending_heading = direction_field(j, "pendingHeading");
  }
  a.body = j.at("body").get<std::vector<Cell>>();
  if (a.body.empty()) {
    throw ProtocolError("actor body is empty");
  }
  a.score = j.at("score").get<std::uint32_t>();
  a.alive = j.at("alive").get<bool>();
  a.ready = j.at("ready").get<bool>();
  a.respawn_cooldown = j.at("respawnCooldown").get<std::uint32_t>();
}

void to_json(json &j, const SimulationState &s) {
  j = json{
      {"status", text_of(s.status)},
      {"dimensions", {{"width", s.width}, {"height", s.height}}},
      {"fruit", s.fruit},
      {"targetScore", s.target_score},
      {"actors",
       {{"first", s.actor(Slot::First)}, {"second", s.actor(Slot::Second)}}},
      {"winner", s.winner ? json(text_of(*s.winner)) : json(nullptr)},
      {"tickIntervalMs", s.tick_interval_ms},
  };
}

void from_json(const json &j, SimulationState &s) {
  const auto status = parse_status(j.at("status").get<std::string>());
  if (!status) {
    throw ProtocolError("bad status");
  }
  s.status = *status;
  s.width = j.at("dimensions").at("width").get<std::int32_t>();
  s.height = j.at("dimensions").at("height").get<std::int32_t>();
  s.fruit = j.at("fruit").get<Cell>();
  s.target_score = j.at("targetScore").get<std::uint32_t>();
  s.actor(Slot::First) = j.at("actors").at("first").get<ActorState>();
  s.actor(Slot::Second) = j.at("actors").at("second").get<ActorState>();
  if (j.at("winner").is_null()) {
    s.winner.reset();
  } else {
    s.winner = slot_field(j, "winner");
  }
  s.tick_interval_ms = j.at("tickIntervalMs").get<std::uint32_t>();
}

json encode_message(const WireMessage &msg) {
  json j = std::visit(
      overloaded{
          [](const ReadyMsg &) { return json::object(); },
          [](const InputMsg &m) {
            return json{{"direction", text_of(m.direction)},
                        {"localSequence", m.local_sequence}};
          },
          [](const StateMsg &m) {
            return json{{"snapshot", m.snapshot},
                        {"tickSequence", m.tick_sequence},
                        {"serverTime", m.server_time_ms}};
          },
          [](const SyncRequestMsg &) { return json::object(); },
          [](const PingMsg &m) { return json{{"timestamp", m.timestamp_ms}}; },
          [](const PongMsg &m) {
            return json{{"timestamp", m.timestamp_ms},
                        {"serverTime", m.server_time_ms}};
          },
      },
      msg);
  j["type"] = std::string(message_type(msg));
  return j;
}

WireMessage decode_message(const json &j) {
  try {
    const auto type = j.at("type").get<std::string>();
    if (type == "ready") {
      return ReadyMsg{};
    }
    if (type == "input") {
      return InputMsg{direction_field(j, "direction"),
                      j.value("localSequence", std::uint64_t{0})};
    }
    if (type == "state") {
      return StateMsg{j.at("snapshot").get<SimulationState>(),
                      j.at("tickSequence").get<std::uint64_t>(),
                      j.at("serverTime").get<std::int64_t>()};
    }
    if (type == "sync-request") {
      return SyncRequestMsg{};
    }
    if (type == "ping") {
      return PingMsg{j.at("timestamp").get<std::int64_t>()};
    }
    if (type == "pong") {
      return PongMsg{j.at("timestamp").get<std::int64_t>(),
                     j.value("serverTime", std::int64_t{0})};
    }
    throw ProtocolError("unknown message type '" + type + "'");
  } catch (const json::exception &e) {
    throw ProtocolError(std::string("malformed message: ") + e.what());
  }
}

json encode_envelope(const Envelope &env) {
  return json{{"v", kMessageVersion},
              {"envelope",
               {{"from", text_of(env.from)},
                {"payload", encode_message(env.payload)},
                {"createdAt", env.created_at_ms}}}};
}

Envelope decode_envelope(const json &j) {
  try {
    const auto v = j.at("v").get<int>();
    if (v != kMessageVersion) {
      throw ProtocolError("unsupported message version " + std::to_string(v));
    }
    const auto &body = j.at("envelope");
    return Envelope{slot_field(body, "from"), decode_message(body.at("payload")),
                    body.at("createdAt").get<std::int64_t>()};
  } catch (const json::exception &e) {
    throw ProtocolError(std::string("malformed envelope: ") + e.what());
  }
}

json parse_json(std::string_view text) {
  try {
    return json::parse(text.begin(), text.end());
  } catch (const json::exception &e) {
    throw ProtocolError(std::string("invalid json: ") + e.what());
  }
}
