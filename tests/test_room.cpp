#include <catch2/catch_test_macros.hpp>

#include "core/errors.hpp"
#include "fakes.hpp"
#include "room/room.hpp"

using nlohmann::json;

namespace {

struct RoomFixture {
  FakeRoomHost host;
  MemoryStorage storage;
  Room room{"r1", host, storage};
  std::shared_ptr<FakePeer> first = std::make_shared<FakePeer>();
  std::shared_ptr<FakePeer> second = std::make_shared<FakePeer>();

  void join_both() {
    room.join(Slot::First, first);
    room.join(Slot::Second, second);
  }

  void say(Slot slot, const json &frame) {
    room.on_message(slot, peer(slot).get(), frame.dump());
  }

  [[nodiscard]] std::shared_ptr<FakePeer> peer(Slot slot) const {
    return slot == Slot::First ? first : second;
  }

  [[nodiscard]] RoomRecord saved() {
    return json::parse(*storage.get("room:r1")).get<RoomRecord>();
  }
};

} // namespace

TEST_CASE("room pairs two peers") {
  RoomFixture f;
  REQUIRE(f.room.phase() == RoomPhase::Empty);

  f.room.join(Slot::First, f.first);
  REQUIRE(f.room.phase() == RoomPhase::OneOccupant);
  REQUIRE(f.first->frames ==
          std::vector<json>{json{{"type", "joined"}, {"slot", "first"}}});
  REQUIRE(f.saved().occupied == std::array<bool, 2>{true, false});

  f.room.join(Slot::Second, f.second);
  REQUIRE(f.room.phase() == RoomPhase::Signaling);
  REQUIRE(f.first->frames_of("peers-present").size() == 1);
  REQUIRE(f.second->frames_of("peers-present").size() == 1);
  const auto assist = f.second->frames_of("peers-present")[0]
                          .at("relayAssist")
                          .get<RelayAssistConfig>();
  REQUIRE(assist.urls == default_relay_assist().urls);
}

TEST_CASE("a taken slot is refused") {
  RoomFixture f;
  f.room.join(Slot::First, f.first);
  auto intruder = std::make_shared<FakePeer>();

  REQUIRE_THROWS_AS(f.room.join(Slot::First, intruder), SlotConflictError);
  REQUIRE(intruder->frames.empty());

  // The first occupant is untouched.
  f.say(Slot::First, make_ping());
  REQUIRE(f.first->frames_of("pong").size() == 1);
}

TEST_CASE("a refused connection cannot speak for the occupant") {
  RoomFixture f;
  f.join_both();
  auto intruder = std::make_shared<FakePeer>();
  REQUIRE_THROWS_AS(f.room.join(Slot::First, intruder), SlotConflictError);

  const auto game = make_game({Slot::First, ReadyMsg{}, 1});
  f.room.on_message(Slot::First, intruder.get(), game.dump());
  f.room.on_message(Slot::First, intruder.get(),
                    make_signal("direct-ready").dump());
  f.room.on_message(Slot::First, intruder.get(), make_ping().dump());

  REQUIRE(f.second->frames_of("game").empty());
  REQUIRE(f.second->frames_of("direct-ready").empty());
  REQUIRE_FALSE(f.saved().direct_ready[0]);
  REQUIRE(intruder->frames.empty());
  REQUIRE(f.first->frames_of("pong").empty());

  // The real occupant still gets through.
  f.say(Slot::First, game);
  REQUIRE(f.second->frames_of("game") == std::vector<json>{game});
}

TEST_CASE("room forwards game and signaling frames to the other slot") {
  RoomFixture f;
  f.join_both();

  const auto game = make_game({Slot::First, ReadyMsg{}, 1});
  f.say(Slot::First, game);
  REQUIRE(f.second->frames_of("game") == std::vector<json>{game});
  REQUIRE(f.first->frames_of("game").empty());

  const auto offer = make_signal("offer", {{"token", "abc"}});
  f.say(Slot::First, offer);
  REQUIRE(f.second->frames_of("offer") == std::vector<json>{offer});
}

TEST_CASE("room tracks the direct path") {
  RoomFixture f;
  f.join_both();

  f.say(Slot::First, make_signal("direct-ready"));
  REQUIRE(f.room.phase() == RoomPhase::Signaling);
  f.say(Slot::Second, make_signal("direct-ready"));
  REQUIRE(f.room.phase() == RoomPhase::Established);
  REQUIRE(f.saved().direct_established);

  SECTION("game frames are dropped once peers talk directly") {
    f.say(Slot::First, make_game({Slot::First, PingMsg{1}, 1}));
    REQUIRE(f.second->frames_of("game").empty());
    REQUIRE(f.room.suppressed_game_frames() == 1);
  }

  SECTION("direct-failed switches to relay only") {
    f.say(Slot::Second, make_signal("direct-failed"));
    REQUIRE(f.room.phase() == RoomPhase::RelayOnly);
    REQUIRE_FALSE(f.room.direct_established());
    REQUIRE(f.first->frames_of("direct-failed").size() == 1);

    f.say(Slot::First, make_game({Slot::First, PingMsg{1}, 1}));
    REQUIRE(f.second->frames_of("game").size() == 1);
  }

  SECTION("a leave resets the direct flags") {
    f.room.leave(Slot::Second, f.second.get());
    REQUIRE(f.room.phase() == RoomPhase::OneOccupant);
    REQUIRE(f.first->frames_of("leave") ==
            std::vector<json>{json{{"type", "leave"}, {"slot", "second"}}});
    REQUIRE_FALSE(f.saved().direct_established);
    REQUIRE(f.saved().occupied == std::array<bool, 2>{true, false});
  }
}

TEST_CASE("room answers control frames") {
  RoomFixture f;
  f.join_both();

  SECTION("ping") {
    f.say(Slot::Second, make_ping());
    REQUIRE(f.second->frames_of("pong").size() == 1);
    REQUIRE(f.first->frames_of("pong").empty());
  }
  SECTION("unparseable text") {
    f.room.on_message(Slot::First, f.first.get(), "{oops");
    const auto errors = f.first->frames_of("error");
    REQUIRE(errors.size() == 1);
    REQUIRE(errors[0].at("code") == "PARSE_ERROR");
  }
  SECTION("unknown type") {
    f.say(Slot::First, json{{"type", "dance"}});
    const auto errors = f.first->frames_of("error");
    REQUIRE(errors.size() == 1);
    REQUIRE(errors[0].at("code") == "UNKNOWN_TYPE");
    REQUIRE(f.second->frames.size() == 2); // joined, peers-present
  }
  SECTION("join announcements are ignored") {
    f.say(Slot::First, json{{"type", "join"}});
    REQUIRE(f.first->frames_of("error").empty());
    REQUIRE(f.second->frames.size() == 2);
  }
}

TEST_CASE("a stale handle cannot evict the current occupant") {
  RoomFixture f;
  f.room.join(Slot::First, f.first);
  f.room.leave(Slot::First, f.first.get());

  auto again = std::make_shared<FakePeer>();
  f.room.join(Slot::First, again);
  f.room.leave(Slot::First, f.first.get());
  REQUIRE(f.room.occupied(Slot::First));
}

TEST_CASE("an empty room expires after its ttl") {
  RoomFixture f;
  f.room.join(Slot::First, f.first);
  f.room.leave(Slot::First, f.first.get());
  REQUIRE(f.host.alarm == f.host.now + 60'000);

  f.host.now += 59'999;
  f.room.on_alarm();
  REQUIRE_FALSE(f.room.expired());

  f.host.now += 1;
  f.room.on_alarm();
  REQUIRE(f.room.expired());
  REQUIRE_FALSE(f.storage.get("room:r1").has_value());
}

TEST_CASE("an idle room closes its occupants") {
  RoomFixture f;
  f.join_both();
  REQUIRE(f.host.alarm == f.host.now + 30 * 60'000);

  f.host.now += 30 * 60'000;
  f.room.on_alarm();

  REQUIRE(f.first->close_code == kCloseNormal);
  REQUIRE(f.first->close_reason == "Room timeout");
  REQUIRE(f.second->close_code == kCloseNormal);
  REQUIRE(f.room.phase() == RoomPhase::Draining);
  REQUIRE(f.room.empty());
  REQUIRE(f.host.alarm == f.host.now + 60'000);

  SECTION("a new join revives it") {
    auto back = std::make_shared<FakePeer>();
    f.room.join(Slot::Second, back);
    REQUIRE(f.room.phase() == RoomPhase::OneOccupant);
  }
}

TEST_CASE("activity alone is persisted at most once a second") {
  RoomFixture f;
  f.join_both();
  const auto joined_at = f.host.now;

  f.host.now += 500;
  f.say(Slot::First, make_ping());
  REQUIRE(f.saved().last_activity_ms == joined_at);

  f.host.now += 500;
  f.say(Slot::First, make_ping());
  REQUIRE(f.saved().last_activity_ms == joined_at + 1000);
}

TEST_CASE("a room reloads its record and vacates dead slots") {
  FakeRoomHost host;
  MemoryStorage storage;
  auto peer = std::make_shared<FakePeer>();
  std::int64_t created = 0;
  {
    Room room("r2", host, storage);
    room.join(Slot::First, peer);
    created = room.record().created_at_ms;
  }

  host.now += 5000;
  Room revived("r2", host, storage);
  REQUIRE(revived.record().created_at_ms == created);
  REQUIRE(revived.record().occupied == std::array<bool, 2>{true, false});

  revived.resume({});
  REQUIRE(revived.empty());
  REQUIRE(revived.record().occupied == std::array<bool, 2>{false, false});
  REQUIRE(host.alarm == revived.record().last_activity_ms + 60'000);

  SECTION("a live handle is reattached") {
    revived.resume({peer, nullptr});
    REQUIRE(revived.occupied(Slot::First));
  }
}

TEST_CASE("room info") {
  RoomFixture f;
  f.room.join(Slot::Second, f.second);
  const auto info = f.room.info();
  REQUIRE(info.at("id") == "r1");
  REQUIRE(info.at("first") == false);
  REQUIRE(info.at("second") == true);
  REQUIRE(info.at("directEstablished") == false);
  REQUIRE(info.at("phase") == "one-occupant");
  REQUIRE(info.at("createdAt") == f.host.now);
}
