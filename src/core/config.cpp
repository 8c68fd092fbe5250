#include "core/config.hpp"

#include <cctype>
#include <cstdlib>
#include <limits>
#include <map>
#include <sstream>
#include <stdexcept>

namespace {

using Setter = std::function<void(const std::string &)>;

template <typename T>
T parse_unsigned(const std::string &key, const std::string &text,
                 T min = std::numeric_limits<T>::min(),
                 T max = std::numeric_limits<T>::max()) {
  std::size_t used = 0;
  unsigned long long v = 0;
  try {
    v = std::stoull(text, &used);
  } catch (const std::exception &) {
    throw std::invalid_argument(key + ": expected a number, got '" + text + "'");
  }
  if (used != text.size() || text.empty() || text[0] == '-' ||
      v < static_cast<unsigned long long>(min) ||
      v > static_cast<unsigned long long>(max)) {
    throw std::invalid_argument(key + ": '" + text + "' is out of range");
  }
  return static_cast<T>(v);
}

bool parse_bool(const std::string &key, const std::string &text) {
  if (text == "1" || text == "true" || text == "yes" || text == "on") {
    return true;
  }
  if (text == "0" || text == "false" || text == "no" || text == "off") {
    return false;
  }
  throw std::invalid_argument(key + ": expected a boolean, got '" + text + "'");
}

std::vector<std::string> split_list(const std::string &text) {
  std::vector<std::string> out;
  std::stringstream ss(text);
  std::string item;
  while (std::getline(ss, item, ',')) {
    if (!item.empty()) {
      out.push_back(item);
    }
  }
  return out;
}

// "state-dir" -> "DUEL_STATE_DIR"
std::string env_name(const std::string &key) {
  std::string out = "DUEL_";
  for (const char c : key) {
    out += c == '-' ? '_' : static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  }
  return out;
}

bool apply(const std::map<std::string, Setter> &setters, int argc,
           const char *const *argv, const EnvLookup &env) {
  for (const auto &[key, set] : setters) {
    if (auto value = env(env_name(key).c_str())) {
      set(*value);
    }
  }

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--help" || arg == "-h") {
      return true;
    }
    if (arg.rfind("--", 0) != 0) {
      throw std::invalid_argument("unexpected argument '" + arg + "'");
    }
    const auto key = arg.substr(2);
    auto it = setters.find(key);
    if (it == setters.end()) {
      throw std::invalid_argument("unknown option '" + arg + "'");
    }
    if (i + 1 >= argc) {
      throw std::invalid_argument("option '" + arg + "' needs a value");
    }
    it->second(argv[++i]);
  }
  return false;
}

} // namespace

std::optional<std::string> process_env(const char *name) {
  if (const char *v = std::getenv(name)) {
    return std::string(v);
  }
  return std::nullopt;
}

CoordinatorConfig load_coordinator_config(int argc, const char *const *argv,
                                          const EnvLookup &env) {
  CoordinatorConfig cfg;
  const std::map<std::string, Setter> setters{
      {"bind", [&](const std::string &v) { cfg.bind = v; }},
      {"port",
       [&](const std::string &v) {
         cfg.port = parse_unsigned<std::uint16_t>("port", v, 1);
       }},
      {"threads",
       [&](const std::string &v) {
         cfg.threads = parse_unsigned<std::uint16_t>("threads", v, 1, 256);
       }},
      {"state-dir", [&](const std::string &v) { cfg.state_dir = v; }},
      {"relay-assist",
       [&](const std::string &v) { cfg.relay_assist = split_list(v); }},
      {"empty-ttl-ms",
       [&](const std::string &v) {
         cfg.empty_ttl_ms = parse_unsigned<std::uint32_t>("empty-ttl-ms", v, 1);
       }},
      {"inactivity-timeout-ms",
       [&](const std::string &v) {
         cfg.inactivity_timeout_ms =
             parse_unsigned<std::uint32_t>("inactivity-timeout-ms", v, 1);
       }},
  };
  cfg.help = apply(setters, argc, argv, env);
  return cfg;
}

PeerConfig load_peer_config(int argc, const char *const *argv,
                            const EnvLookup &env) {
  PeerConfig cfg;
  const std::map<std::string, Setter> setters{
      {"host", [&](const std::string &v) { cfg.host = v; }},
      {"port",
       [&](const std::string &v) {
         cfg.port = std::to_string(parse_unsigned<std::uint16_t>("port", v, 1));
       }},
      {"room", [&](const std::string &v) { cfg.room = v; }},
      {"slot",
       [&](const std::string &v) {
         const auto slot = parse_slot(v);
         if (!slot) {
           throw std::invalid_argument("slot: expected first or second, got '" +
                                       v + "'");
         }
         cfg.slot = *slot;
       }},
      {"direct", [&](const std::string &v) { cfg.direct = parse_bool("direct", v); }},
      {"udp-port",
       [&](const std::string &v) {
         cfg.udp_port = parse_unsigned<std::uint16_t>("udp-port", v);
       }},
      {"advertise-host", [&](const std::string &v) { cfg.advertise_host = v; }},
      {"negotiation-timeout-ms",
       [&](const std::string &v) {
         cfg.negotiation_timeout_ms =
             parse_unsigned<std::uint32_t>("negotiation-timeout-ms", v, 1);
       }},
      {"width",
       [&](const std::string &v) {
         cfg.width = parse_unsigned<std::int32_t>("width", v, 8, 1000);
       }},
      {"height",
       [&](const std::string &v) {
         cfg.height = parse_unsigned<std::int32_t>("height", v, 6, 1000);
       }},
      {"target-score",
       [&](const std::string &v) {
         cfg.target_score = parse_unsigned<std::uint32_t>("target-score", v, 1);
       }},
      {"tick-ms",
       [&](const std::string &v) {
         cfg.tick_ms = parse_unsigned<std::uint32_t>("tick-ms", v, 10, 10'000);
       }},
      {"seed", [&](const std::string &v) { cfg.seed = v; }},
  };
  cfg.help = apply(setters, argc, argv, env);
  return cfg;
}

std::string coordinator_usage() {
  return "usage: duel-coordinator [--bind ADDR] [--port N] [--threads N]\n"
         "                        [--state-dir DIR] [--relay-assist URL,...]\n"
         "                        [--empty-ttl-ms N] [--inactivity-timeout-ms N]\n"
         "Every option can also be set as DUEL_<OPTION> in the environment,\n"
         "e.g. DUEL_STATE_DIR=/var/lib/duel.\n";
}

std::string peer_usage() {
  return "usage: duel-peer [--host H] [--port N] [--room ID] [--slot first|second]\n"
         "                 [--direct true|false] [--udp-port N]\n"
         "                 [--advertise-host ADDR] [--negotiation-timeout-ms N]\n"
         "                 [--width N] [--height N] [--target-score N]\n"
         "                 [--tick-ms N] [--seed TEXT]\n"
         "Keys w/a/s/d steer, r marks ready, q quits.\n";
}
