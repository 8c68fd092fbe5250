#pragma once
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "sim/types.hpp"

// Settings resolve in three layers: built-in defaults, then DUEL_* environment
// variables, then --flag value pairs on the command line. Bad values throw
// std::invalid_argument naming the offending key.

using EnvLookup = std::function<std::optional<std::string>(const char *name)>;

// Reads the process environment.
std::optional<std::string> process_env(const char *name);

struct CoordinatorConfig {
  std::string bind = "0.0.0.0";
  std::uint16_t port = 8787;
  std::uint16_t threads = 1;
  // Empty keeps room records in memory only.
  std::string state_dir;
  std::vector<std::string> relay_assist;
  std::uint32_t empty_ttl_ms = 60'000;
  std::uint32_t inactivity_timeout_ms = 30 * 60'000;
  bool help = false;
};

struct PeerConfig {
  std::string host = "127.0.0.1";
  std::string port = "8787";
  std::string room = "lobby";
  Slot slot = Slot::First;
  bool direct = true;
  std::uint16_t udp_port = 0;
  std::string advertise_host;
  std::uint32_t negotiation_timeout_ms = 5000;
  // Engine settings; only the Host (slot first) uses them.
  std::int32_t width = 40;
  std::int32_t height = 30;
  std::uint32_t target_score = 10;
  std::uint32_t tick_ms = 120;
  std::string seed = "duel-snake";
  bool help = false;
};

CoordinatorConfig load_coordinator_config(int argc, const char *const *argv,
                                          const EnvLookup &env = process_env);
PeerConfig load_peer_config(int argc, const char *const *argv,
                            const EnvLookup &env = process_env);

std::string coordinator_usage();
std::string peer_usage();
