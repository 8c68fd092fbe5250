#include "room/room.hpp"

#include <utility>

#include "core/errors.hpp"
#include "core/log.hpp"

using nlohmann::json;

// Activity-only updates hit storage at most this often.
static constexpr std::int64_t kActivityPersistIntervalMs = 1000;

const char *to_string(RoomPhase p) noexcept {
  switch (p) {
  case RoomPhase::Empty:
    return "empty";
  case RoomPhase::OneOccupant:
    return "one-occupant";
  case RoomPhase::Signaling:
    return "signaling";
  case RoomPhase::Established:
    return "established";
  case RoomPhase::RelayOnly:
    return "relay-only";
  case RoomPhase::Draining:
    return "draining";
  }
  return "unknown";
}

void to_json(json &j, const RoomRecord &r) {
  j = json{{"id", r.id},
           {"occupied", r.occupied},
           {"directReady", r.direct_ready},
           {"directEstablished", r.direct_established},
           {"relayOnly", r.relay_only},
           {"createdAt", r.created_at_ms},
           {"lastActivity", r.last_activity_ms}};
}

void from_json(const json &j, RoomRecord &r) {
  r.id = j.at("id").get<std::string>();
  r.occupied = j.at("occupied").get<std::array<bool, 2>>();
  r.direct_ready = j.value("directReady", std::array<bool, 2>{});
  r.direct_established = j.value("directEstablished", false);
  r.relay_only = j.value("relayOnly", false);
  r.created_at_ms = j.at("createdAt").get<std::int64_t>();
  r.last_activity_ms = j.at("lastActivity").get<std::int64_t>();
}

Room::Room(std::string id, IRoomHost &host, IDurableStorage &storage,
           RoomOptions opts)
    : host_(host), storage_(storage), opts_(std::move(opts)) {
  record_.id = std::move(id);
  if (auto saved = storage_.get(key())) {
    try {
      auto loaded = json::parse(*saved).get<RoomRecord>();
      if (loaded.id == record_.id) {
        record_ = std::move(loaded);
        return;
      }
    } catch (const json::exception &e) {
      DUEL_LOGLN("room " << record_.id << ": discarding bad record: "
                         << e.what());
    }
  }
  record_.created_at_ms = host_.now_ms();
  record_.last_activity_ms = record_.created_at_ms;
}

RoomPhase Room::phase() const noexcept {
  if (expired_ || draining_) {
    return RoomPhase::Draining;
  }
  const int present = int(occupied(Slot::First)) + int(occupied(Slot::Second));
  if (present == 0) {
    return RoomPhase::Empty;
  }
  if (present == 1) {
    return RoomPhase::OneOccupant;
  }
  if (record_.direct_established) {
    return RoomPhase::Established;
  }
  return record_.relay_only ? RoomPhase::RelayOnly : RoomPhase::Signaling;
}

void Room::join(Slot slot, std::shared_ptr<IPeerHandle> handle) {
  auto &peer = peers_[slot_index(slot)];
  if (peer) {
    throw SlotConflictError("slot " + std::string(to_string(slot)) +
                            " is already taken in room " + record_.id);
  }
  peer = std::move(handle);
  record_.occupied[slot_index(slot)] = true;
  draining_ = false;
  expired_ = false;
  reset_direct();
  touch();

  DUEL_LOGLN("room " << record_.id << ": " << to_string(slot) << " joined");
  send(slot, make_joined(slot));
  if (occupied(Slot::First) && occupied(Slot::Second)) {
    const auto present = make_peers_present(opts_.relay_assist);
    send(Slot::First, present);
    send(Slot::Second, present);
  }
  persist();
  schedule_alarm();
}

void Room::on_message(Slot slot, const IPeerHandle *handle,
                      const std::string &text) {
  const auto &peer = peers_[slot_index(slot)];
  if (!peer || peer.get() != handle) {
    return;
  }
  touch();

  json frame;
  try {
    frame = parse_json(text);
  } catch (const ProtocolError &) {
    send(slot, make_error("PARSE_ERROR", "Failed to parse message"));
    return;
  }

  const auto type = frame_type(frame);
  bool changed = false;

  if (type == "ping") {
    send(slot, make_pong());
  } else if (type == "game") {
    if (record_.direct_established) {
      ++suppressed_;
    } else {
      forward(slot, text);
    }
  } else if (is_signal_type(type)) {
    forward(slot, text);
    if (type == "direct-ready") {
      record_.direct_ready[slot_index(slot)] = true;
      if (record_.direct_ready[0] && record_.direct_ready[1]) {
        record_.direct_established = true;
        record_.relay_only = false;
        DUEL_LOGLN("room " << record_.id << ": direct channel established");
      }
      changed = true;
    } else if (type == "direct-failed") {
      reset_direct();
      record_.relay_only = true;
      changed = true;
    }
  } else if (type == "join") {
    // Older peers announce themselves; the URL already did.
  } else {
    send(slot, make_error("UNKNOWN_TYPE", "Unknown message type '" + type + "'"));
  }

  if (changed ||
      record_.last_activity_ms - persisted_activity_ms_ >= kActivityPersistIntervalMs) {
    persist();
  }
}

void Room::leave(Slot slot, const IPeerHandle *handle) {
  const auto &peer = peers_[slot_index(slot)];
  if (!peer || peer.get() != handle) {
    return;
  }
  vacate(slot);
  reset_direct();
  touch();

  DUEL_LOGLN("room " << record_.id << ": " << to_string(slot) << " left");
  send(other_slot(slot), make_leave(slot));
  persist();
  schedule_alarm();
}

void Room::on_alarm() {
  if (expired_) {
    return;
  }
  const auto idle = host_.now_ms() - record_.last_activity_ms;

  if (empty()) {
    if (idle >= opts_.empty_ttl.count()) {
      expired_ = true;
      DUEL_LOGLN("room " << record_.id << ": expired");
      storage_.remove(key());
      return;
    }
  } else if (idle >= opts_.inactivity_timeout.count()) {
    DUEL_LOGLN("room " << record_.id << ": inactive, closing occupants");
    draining_ = true;
    for (const auto slot : kSlots) {
      if (auto peer = peers_[slot_index(slot)]) {
        vacate(slot);
        peer->close(kCloseNormal, "Room timeout");
      }
    }
    reset_direct();
    touch();
    persist();
  }
  schedule_alarm();
}

void Room::resume(const std::array<std::shared_ptr<IPeerHandle>, 2> &live) {
  for (const auto slot : kSlots) {
    const auto i = slot_index(slot);
    if (live[i]) {
      peers_[i] = live[i];
      record_.occupied[i] = true;
    } else {
      vacate(slot);
    }
  }
  if (!(occupied(Slot::First) && occupied(Slot::Second))) {
    reset_direct();
  }
  persist();
  schedule_alarm();
}

json Room::info() const {
  return json{{"id", record_.id},
              {"first", occupied(Slot::First)},
              {"second", occupied(Slot::Second)},
              {"directEstablished", record_.direct_established},
              {"phase", to_string(phase())},
              {"createdAt", record_.created_at_ms},
              {"lastActivity", record_.last_activity_ms}};
}

void Room::send(Slot slot, const json &frame) {
  if (const auto &peer = peers_[slot_index(slot)]) {
    peer->send_text(frame.dump());
  }
}

void Room::forward(Slot from, const std::string &text) {
  if (const auto &peer = peers_[slot_index(other_slot(from))]) {
    peer->send_text(text);
  }
}

void Room::vacate(Slot slot) {
  peers_[slot_index(slot)].reset();
  record_.occupied[slot_index(slot)] = false;
}

void Room::reset_direct() {
  record_.direct_ready = {false, false};
  record_.direct_established = false;
  record_.relay_only = false;
}

void Room::touch() { record_.last_activity_ms = host_.now_ms(); }

void Room::persist() {
  storage_.put(key(), json(record_).dump());
  persisted_activity_ms_ = record_.last_activity_ms;
}

void Room::schedule_alarm() {
  if (expired_) {
    return;
  }
  const auto window = empty() ? opts_.empty_ttl : opts_.inactivity_timeout;
  host_.set_alarm(record_.last_activity_ms + window.count());
}
