#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

#include <nlohmann/json.hpp>

#include "sim/types.hpp"

// Game payloads exchanged between the Host and Client authority layers.

inline constexpr int kMessageVersion = 1;

struct ReadyMsg {
  bool operator==(const ReadyMsg &) const = default;
};

struct InputMsg {
  Direction direction = Direction::Right;
  std::uint64_t local_sequence = 0; // diagnostics only, never used to order
  bool operator==(const InputMsg &) const = default;
};

struct StateMsg {
  SimulationState snapshot;
  std::uint64_t tick_sequence = 0;
  std::int64_t server_time_ms = 0;
  bool operator==(const StateMsg &) const = default;
};

struct SyncRequestMsg {
  bool operator==(const SyncRequestMsg &) const = default;
};

struct PingMsg {
  std::int64_t timestamp_ms = 0;
  bool operator==(const PingMsg &) const = default;
};

struct PongMsg {
  std::int64_t timestamp_ms = 0; // echoed from the ping
  std::int64_t server_time_ms = 0;
  bool operator==(const PongMsg &) const = default;
};

using WireMessage = std::variant<ReadyMsg, InputMsg, StateMsg, SyncRequestMsg,
                                 PingMsg, PongMsg>;

// Unit of transport. Built once by the sending channel and never mutated;
// listeners only ever see it by const reference.
struct Envelope {
  Slot from = Slot::First;
  WireMessage payload;
  std::int64_t created_at_ms = 0;
};

std::string_view message_type(const WireMessage &msg) noexcept;

void to_json(nlohmann::json &j, const Cell &c);
void from_json(const nlohmann::json &j, Cell &c);
void to_json(nlohmann::json &j, const ActorState &a);
void from_json(const nlohmann::json &j, ActorState &a);
void to_json(nlohmann::json &j, const SimulationState &s);
void from_json(const nlohmann::json &j, SimulationState &s);

// The decode functions throw ProtocolError on malformed input.
nlohmann::json encode_message(const WireMessage &msg);
WireMessage decode_message(const nlohmann::json &j);

// {"v":1,"envelope":{"from":..,"payload":..,"createdAt":..}}
nlohmann::json encode_envelope(const Envelope &env);
Envelope decode_envelope(const nlohmann::json &j);

// Parses text as JSON, throwing ProtocolError instead of a json exception.
nlohmann::json parse_json(std::string_view text);
