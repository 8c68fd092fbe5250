#include <catch2/catch_test_macros.hpp>

#include "core/errors.hpp"
#include "proto/relay_messages.hpp"
#include "proto/wire.hpp"
#include "sim/engine.hpp"

using nlohmann::json;

TEST_CASE("state envelope survives the codec") {
  EngineOptions opts;
  opts.width = 12;
  opts.height = 9;
  opts.seed = "wire";
  Engine engine(opts);
  engine.ready(Slot::First);
  engine.ready(Slot::Second);
  engine.start();
  engine.queue_intent(Slot::First, Direction::Down);
  engine.tick();

  const Envelope env{Slot::First, StateMsg{engine.snapshot(), 7, 123456}, 99};
  const auto text = encode_envelope(env).dump();
  const auto back = decode_envelope(parse_json(text));

  REQUIRE(back.from == Slot::First);
  REQUIRE(back.created_at_ms == 99);
  REQUIRE(std::holds_alternative<StateMsg>(back.payload));
  REQUIRE(std::get<StateMsg>(back.payload) == std::get<StateMsg>(env.payload));
}

TEST_CASE("envelope layout") {
  const Envelope env{Slot::Second, InputMsg{Direction::Up, 3}, 42};
  const auto j = encode_envelope(env);

  REQUIRE(j.at("v") == 1);
  const auto &body = j.at("envelope");
  REQUIRE(body.at("from") == "second");
  REQUIRE(body.at("createdAt") == 42);
  REQUIRE(body.at("payload").at("type") == "input");
  REQUIRE(body.at("payload").at("direction") == "up");
  REQUIRE(body.at("payload").at("localSequence") == 3);
}

TEST_CASE("snapshot layout") {
  Engine engine;
  const json j = engine.snapshot();
  REQUIRE(j.at("status") == "idle");
  REQUIRE(j.at("dimensions").at("width") == 40);
  REQUIRE(j.at("dimensions").at("height") == 30);
  REQUIRE(j.at("winner").is_null());
  REQUIRE(j.at("actors").at("first").at("heading") == "right");
  REQUIRE(j.at("actors").at("second").at("heading") == "left");
  REQUIRE(j.at("actors").at("first").at("pendingHeading").is_null());
  REQUIRE(j.at("tickIntervalMs") == 120);
}

TEST_CASE("message type names") {
  REQUIRE(message_type(ReadyMsg{}) == "ready");
  REQUIRE(message_type(InputMsg{}) == "input");
  REQUIRE(message_type(StateMsg{}) == "state");
  REQUIRE(message_type(SyncRequestMsg{}) == "sync-request");
  REQUIRE(message_type(PingMsg{}) == "ping");
  REQUIRE(message_type(PongMsg{}) == "pong");
}

TEST_CASE("bad input is a ProtocolError") {
  SECTION("not json") {
    REQUIRE_THROWS_AS(parse_json("{nope"), ProtocolError);
  }
  SECTION("wrong version") {
    auto j = encode_envelope({Slot::First, ReadyMsg{}, 1});
    j["v"] = 2;
    REQUIRE_THROWS_AS(decode_envelope(j), ProtocolError);
  }
  SECTION("missing envelope") {
    REQUIRE_THROWS_AS(decode_envelope(json{{"v", 1}}), ProtocolError);
  }
  SECTION("unknown payload type") {
    REQUIRE_THROWS_AS(decode_message(json{{"type", "teleport"}}),
                      ProtocolError);
  }
  SECTION("bad direction") {
    REQUIRE_THROWS_AS(
        decode_message(json{{"type", "input"}, {"direction", "sideways"}}),
        ProtocolError);
  }
  SECTION("empty actor body") {
    Engine engine;
    json j = engine.snapshot();
    j["actors"]["first"]["body"] = json::array();
    REQUIRE_THROWS_AS(j.get<SimulationState>(), ProtocolError);
  }
}

TEST_CASE("relay frames") {
  REQUIRE(make_joined(Slot::Second) ==
          json{{"type", "joined"}, {"slot", "second"}});
  REQUIRE(frame_type(make_ping()) == "ping");
  REQUIRE(frame_type(json::array()).empty());
  REQUIRE(frame_type(json{{"type", 5}}).empty());

  const auto offer = make_signal("offer", {{"token", "abc"}});
  REQUIRE(offer.at("type") == "offer");
  REQUIRE(offer.at("token") == "abc");
  REQUIRE(is_signal_type("ice-candidate"));
  REQUIRE_FALSE(is_signal_type("game"));

  const auto game = make_game({Slot::First, PingMsg{5}, 6});
  REQUIRE(decode_envelope(game.at("payload")).from == Slot::First);
}

TEST_CASE("relay assist config accepts string or list urls") {
  const auto present = make_peers_present(default_relay_assist());
  const auto cfg = present.at("relayAssist").get<RelayAssistConfig>();
  REQUIRE(cfg.urls == default_relay_assist().urls);

  json single;
  single["iceServers"] =
      json::array({json{{"urls", "stun:example.org:3478"}}});
  REQUIRE(single.get<RelayAssistConfig>().urls ==
          std::vector<std::string>{"stun:example.org:3478"});
}
