#include <catch2/catch_test_macros.hpp>

#include <string>

#include "fakes.hpp"
#include "server/coordinator_server.hpp"

namespace http = boost::beast::http;
using nlohmann::json;

namespace {

struct RoutesFixture {
  HttpResponse get(const std::string &target) const {
    HttpRequest req{http::verb::get, target, 11};
    return routes.handle(req);
  }

  boost::asio::io_context io;
  MemoryStorage storage;
  RoomRegistry registry{io.get_executor(), storage};
  HttpRoutes routes{registry, RelayAssistConfig{{"stun:relay.test:3478"}}};
};

std::string header(const HttpResponse &res, http::field f) {
  return std::string(res[f]);
}

} // namespace

TEST_CASE("health reports the live room count") {
  RoutesFixture f;
  auto res = f.get("/health");
  REQUIRE(res.result() == http::status::ok);
  REQUIRE(header(res, http::field::content_type) == "application/json");
  REQUIRE(json::parse(res.body()) ==
          json{{"status", "ok"}, {"version", "2.0"}, {"rooms", 0}});

  f.registry.acquire("abc");
  res = f.get("/health");
  REQUIRE(json::parse(res.body()).at("rooms") == 1);
}

TEST_CASE("relay assist config is served under both names") {
  RoutesFixture f;
  for (const auto *path : {"/relay-config", "/ice-servers"}) {
    const auto res = f.get(path);
    REQUIRE(res.result() == http::status::ok);
    const auto assist = json::parse(res.body()).get<RelayAssistConfig>();
    REQUIRE(assist.urls == std::vector<std::string>{"stun:relay.test:3478"});
  }
}

TEST_CASE("room info is served for live rooms only") {
  RoutesFixture f;

  auto res = f.get("/api/room/abc");
  REQUIRE(res.result() == http::status::not_found);
  REQUIRE(json::parse(res.body()) == json{{"error", "room not found"}});
  REQUIRE(f.get("/api/room/bad%20id").result() == http::status::not_found);

  auto peer = std::make_shared<FakePeer>();
  f.registry.acquire("abc")->post(
      [peer](Room &room) { room.join(Slot::Second, peer); });
  f.io.poll();

  res = f.get("/api/room/abc?x=1");
  REQUIRE(res.result() == http::status::ok);
  const auto info = json::parse(res.body());
  REQUIRE(info.at("id") == "abc");
  REQUIRE(info.at("first") == false);
  REQUIRE(info.at("second") == true);
  REQUIRE(info.at("phase") == "one-occupant");
}

TEST_CASE("every response carries cors headers") {
  RoutesFixture f;

  HttpRequest pre{http::verb::options, "/api/room/abc", 11};
  const auto res = f.routes.handle(pre);
  REQUIRE(res.result() == http::status::no_content);
  REQUIRE(res.body().empty());

  for (const auto &r : {res, f.get("/health"), f.get("/nowhere")}) {
    REQUIRE(header(r, http::field::access_control_allow_origin) == "*");
    REQUIRE(header(r, http::field::access_control_allow_methods) ==
            "GET, OPTIONS");
    REQUIRE(header(r, http::field::server) == "duel-coordinator");
  }
}

TEST_CASE("unknown paths list the endpoints") {
  RoutesFixture f;
  const auto res = f.get("/nowhere");
  REQUIRE(res.result() == http::status::not_found);
  REQUIRE(header(res, http::field::content_type) == "text/plain");
  REQUIRE(res.body().find("/ws?room=") != std::string::npos);

  HttpRequest post{http::verb::post, "/health", 11};
  REQUIRE(f.routes.handle(post).result() == http::status::not_found);
}

TEST_CASE("websocket targets name a room and a slot") {
  SECTION("slot") {
    const auto t = parse_ws_target("/ws?room=r1&slot=second");
    REQUIRE(t.is_ws);
    REQUIRE(t.room == "r1");
    REQUIRE(t.slot == Slot::Second);
  }
  SECTION("legacy role names") {
    REQUIRE(parse_ws_target("/ws/?room=r1&role=host").slot == Slot::First);
    REQUIRE(parse_ws_target("/ws?role=guest&room=r1").slot == Slot::Second);
    // slot wins over role
    REQUIRE(parse_ws_target("/ws?slot=first&role=guest").slot == Slot::First);
  }
  SECTION("missing or invalid parameters") {
    const auto t = parse_ws_target("/ws?room=../x&slot=third&junk");
    REQUIRE(t.is_ws);
    REQUIRE(t.room.empty());
    REQUIRE_FALSE(t.slot.has_value());

    REQUIRE_FALSE(parse_ws_target("/ws").slot.has_value());
    REQUIRE_FALSE(parse_ws_target("/health?room=r1").is_ws);
    REQUIRE_FALSE(parse_ws_target("/wss?room=r1").is_ws);
  }
}
