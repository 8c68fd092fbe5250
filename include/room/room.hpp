#pragma once
#include <array>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "proto/relay_messages.hpp"
#include "room/storage.hpp"
#include "sim/types.hpp"

// One connected peer as seen by its room. Owned by the server session.
class IPeerHandle {
public:
  virtual ~IPeerHandle() = default;

  virtual void send_text(const std::string &text) = 0;
  virtual void close(std::uint16_t code, const std::string &reason) = 0;
};

// What a room needs from whoever runs it: a clock and a single wake-up call.
// Setting an alarm replaces the previous one.
class IRoomHost {
public:
  virtual ~IRoomHost() = default;

  [[nodiscard]] virtual std::int64_t now_ms() const = 0;
  virtual void set_alarm(std::int64_t at_ms) = 0;
};

enum class RoomPhase : std::uint8_t {
  Empty,
  OneOccupant,
  Signaling,
  Established,
  RelayOnly,
  Draining,
};

const char *to_string(RoomPhase p) noexcept;

struct RoomOptions {
  std::chrono::milliseconds empty_ttl{60'000};
  std::chrono::milliseconds inactivity_timeout{30 * 60'000};
  RelayAssistConfig relay_assist = default_relay_assist();
};

// Durable part of a room; written on every mutation.
struct RoomRecord {
  std::string id;
  std::array<bool, 2> occupied{};
  std::array<bool, 2> direct_ready{};
  bool direct_established = false;
  bool relay_only = false;
  std::int64_t created_at_ms = 0;
  std::int64_t last_activity_ms = 0;
};

void to_json(nlohmann::json &j, const RoomRecord &r);
void from_json(const nlohmann::json &j, RoomRecord &r);

// Pairs exactly two peers. Not thread-safe: the host runs every call for one
// room on the same serialized context.
class Room {
public:
  static constexpr const char *kKeyPrefix = "room:";

  Room(std::string id, IRoomHost &host, IDurableStorage &storage,
       RoomOptions opts = {});

  Room(const Room &) = delete;
  Room &operator=(const Room &) = delete;

  // Throws SlotConflictError if the slot already has a live occupant.
  void join(Slot slot, std::shared_ptr<IPeerHandle> handle);
  // Both ignored unless `handle` is the slot's current occupant.
  void on_message(Slot slot, const IPeerHandle *handle, const std::string &text);
  void leave(Slot slot, const IPeerHandle *handle);
  void on_alarm();

  // Reattaches live handles after a restart; persisted slots without one are
  // vacated.
  void resume(const std::array<std::shared_ptr<IPeerHandle>, 2> &live);

  [[nodiscard]] RoomPhase phase() const noexcept;
  [[nodiscard]] bool occupied(Slot slot) const noexcept {
    return peers_[slot_index(slot)] != nullptr;
  }
  [[nodiscard]] bool empty() const noexcept {
    return !occupied(Slot::First) && !occupied(Slot::Second);
  }
  [[nodiscard]] bool direct_established() const noexcept {
    return record_.direct_established;
  }
  // True once an empty room outlived its idle window; the host drops it.
  [[nodiscard]] bool expired() const noexcept { return expired_; }
  [[nodiscard]] const RoomRecord &record() const noexcept { return record_; }
  [[nodiscard]] std::uint64_t suppressed_game_frames() const noexcept {
    return suppressed_;
  }
  [[nodiscard]] nlohmann::json info() const;

private:
  void send(Slot slot, const nlohmann::json &frame);
  void forward(Slot from, const std::string &text);
  void vacate(Slot slot);
  void reset_direct();
  void touch();
  void persist();
  void schedule_alarm();
  [[nodiscard]] std::string key() const { return kKeyPrefix + record_.id; }

  IRoomHost &host_;
  IDurableStorage &storage_;
  RoomOptions opts_;
  RoomRecord record_;
  std::array<std::shared_ptr<IPeerHandle>, 2> peers_{};
  std::uint64_t suppressed_ = 0;
  std::int64_t persisted_activity_ms_ = 0;
  bool draining_ = false;
  bool expired_ = false;
};
