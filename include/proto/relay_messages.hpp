#pragma once
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "proto/wire.hpp"

// Text frames exchanged between a peer and the room coordinator.
//
//   peer -> room : game, ping, offer, answer, ice-candidate, direct-ready,
//                  direct-failed
//   room -> peer : joined, peers-present, leave, error, pong, game and the
//                  forwarded signaling types

inline constexpr std::uint16_t kCloseNormal = 1000;
inline constexpr std::uint16_t kCloseAbnormal = 1006;
inline constexpr std::uint16_t kCloseBadRequest = 4000;
inline constexpr std::uint16_t kCloseSlotConflict = 4009;

// Servers offered to peers for reaching each other directly.
struct RelayAssistConfig {
  std::vector<std::string> urls;
};

RelayAssistConfig default_relay_assist();

void to_json(nlohmann::json &j, const RelayAssistConfig &c);
void from_json(const nlohmann::json &j, RelayAssistConfig &c);

// offer, answer, ice-candidate, direct-ready and direct-failed.
bool is_signal_type(std::string_view type) noexcept;

nlohmann::json make_joined(Slot slot);
nlohmann::json make_peers_present(const RelayAssistConfig &assist);
nlohmann::json make_leave(Slot slot);
nlohmann::json make_error(std::string_view code, std::string_view message);
nlohmann::json make_ping();
nlohmann::json make_pong();
nlohmann::json make_game(const Envelope &env);
nlohmann::json make_signal(std::string_view type, nlohmann::json body = {});

// Type field of a frame, or "" if absent.
std::string frame_type(const nlohmann::json &frame);
