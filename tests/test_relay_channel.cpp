#include <catch2/catch_test_macros.hpp>

#include <vector>

#include "core/manual_scheduler.hpp"
#include "fakes.hpp"
#include "net/relay_channel.hpp"

using namespace std::chrono_literals;
using nlohmann::json;

namespace {

struct RelayFixture {
  RelayFixture() {
    RelayOptions opts;
    opts.host = "relay.test";
    opts.port = "9999";
    opts.room = "r1";
    opts.slot = Slot::Second;
    channel = std::make_shared<RelayChannel>(
        sched,
        [this] {
          auto s = std::make_shared<FakeRelaySocket>();
          sockets.push_back(s);
          return s;
        },
        opts);
    subs.push_back(channel->subscribe(
        [this](const Envelope &env) { envelopes.push_back(env); }));
    subs.push_back(channel->subscribe_errors(
        [this](const DuelError &err) { errors.push_back(err.kind()); }));
    subs.push_back(
        channel->subscribe_events([this](RelayEvent ev) { events.push_back(ev); }));
  }

  FakeRelaySocket &socket() { return *sockets.back(); }

  void open_with_peer() {
    channel->connect();
    socket().accept();
    socket().receive(make_peers_present(default_relay_assist()));
  }

  ManualScheduler sched;
  std::vector<std::shared_ptr<FakeRelaySocket>> sockets;
  std::shared_ptr<RelayChannel> channel;
  std::vector<Envelope> envelopes;
  std::vector<ErrorKind> errors;
  std::vector<RelayEvent> events;
  std::vector<Subscription> subs;
};

} // namespace

TEST_CASE("relay connects to the room endpoint for its slot") {
  RelayFixture f;
  f.channel->connect();

  REQUIRE(f.sockets.size() == 1);
  REQUIRE(f.socket().target.host == "relay.test");
  REQUIRE(f.socket().target.port == "9999");
  REQUIRE(f.socket().target.path == "/ws?room=r1&slot=second");
  REQUIRE(f.events == std::vector<RelayEvent>{RelayEvent::Connecting});
}

TEST_CASE("relay is ready only with the socket open and both peers present") {
  RelayFixture f;
  f.channel->connect();

  f.channel->send(ReadyMsg{});
  f.channel->send_signal(make_signal("offer", {{"token", "t"}}));
  REQUIRE(f.socket().sent.empty());

  f.socket().accept();
  REQUIRE_FALSE(f.channel->is_ready());
  REQUIRE(f.socket().sent_of("offer").size() == 1);
  REQUIRE(f.socket().sent_of("game").empty());

  f.socket().receive(make_peers_present(default_relay_assist()));
  REQUIRE(f.channel->is_ready());
  REQUIRE(f.channel->relay_assist().has_value());
  REQUIRE(f.channel->relay_assist()->urls == default_relay_assist().urls);

  const auto games = f.socket().sent_of("game");
  REQUIRE(games.size() == 1);
  const auto env = decode_envelope(games[0].at("payload"));
  REQUIRE(env.from == Slot::Second);
  REQUIRE(std::holds_alternative<ReadyMsg>(env.payload));

  REQUIRE(f.events == std::vector<RelayEvent>{RelayEvent::Connecting,
                                              RelayEvent::Open,
                                              RelayEvent::PeersPresent});

  SECTION("a leaving peer makes it unready again") {
    f.socket().receive(make_leave(Slot::First));
    REQUIRE_FALSE(f.channel->is_ready());
    REQUIRE(f.events.back() == RelayEvent::PeerLeft);

    f.channel->send(PingMsg{1});
    REQUIRE(f.socket().sent_of("game").size() == 1);
  }
}

TEST_CASE("relay delivers game frames and reports bad ones") {
  RelayFixture f;
  f.open_with_peer();

  f.socket().receive(make_game({Slot::First, PingMsg{42}, 7}));
  REQUIRE(f.envelopes.size() == 1);
  REQUIRE(f.envelopes[0].from == Slot::First);
  REQUIRE(std::get<PingMsg>(f.envelopes[0].payload).timestamp_ms == 42);
  REQUIRE(f.errors.empty());

  SECTION("not json") {
    f.socket().receive_raw("{{{");
    REQUIRE(f.errors == std::vector<ErrorKind>{ErrorKind::Protocol});
  }
  SECTION("game without payload") {
    f.socket().receive(json{{"type", "game"}});
    REQUIRE(f.errors == std::vector<ErrorKind>{ErrorKind::Protocol});
  }
  SECTION("unknown frame type") {
    f.socket().receive(json{{"type", "weather"}});
    REQUIRE(f.errors == std::vector<ErrorKind>{ErrorKind::Protocol});
  }
  SECTION("room error frame") {
    f.socket().receive(make_error("PARSE_ERROR", "bad"));
    REQUIRE(f.errors == std::vector<ErrorKind>{ErrorKind::Protocol});
  }
  REQUIRE(f.envelopes.size() == 1);
}

TEST_CASE("relay hands signaling frames to signal listeners") {
  RelayFixture f;
  f.open_with_peer();

  std::vector<json> signals;
  auto sub = f.channel->subscribe_signals(
      [&](const json &frame) { signals.push_back(frame); });

  f.socket().receive(make_signal("answer", {{"token", "x"}}));
  f.socket().receive(make_pong());
  REQUIRE(signals.size() == 1);
  REQUIRE(signals[0].at("token") == "x");
}

TEST_CASE("relay pings the room on the keepalive interval") {
  RelayFixture f;
  f.open_with_peer();

  f.sched.advance(29'999ms);
  REQUIRE(f.socket().sent_of("ping").empty());
  f.sched.advance(1ms);
  REQUIRE(f.socket().sent_of("ping").size() == 1);
}

TEST_CASE("abnormal close reconnects with exponential backoff") {
  RelayFixture f;
  f.open_with_peer();

  f.socket().drop(kCloseAbnormal, "gone");
  REQUIRE_FALSE(f.channel->is_ready());
  REQUIRE(f.errors == std::vector<ErrorKind>{ErrorKind::Connection});
  REQUIRE(f.events.back() == RelayEvent::Disconnected);

  const std::chrono::milliseconds delays[] = {1000ms, 2000ms, 4000ms, 8000ms,
                                              16000ms};
  for (std::size_t i = 0; i < 5; ++i) {
    const auto count = f.sockets.size();
    f.sched.advance(delays[i] - 1ms);
    REQUIRE(f.sockets.size() == count);
    f.sched.advance(1ms);
    REQUIRE(f.sockets.size() == count + 1);
    REQUIRE(f.channel->reconnect_attempts() == static_cast<int>(i + 1));
    if (i < 4) {
      f.socket().drop(kCloseAbnormal);
    }
  }

  SECTION("a successful reconnect resets the backoff") {
    f.socket().accept();
    REQUIRE(f.channel->reconnect_attempts() == 0);
    REQUIRE(f.events.back() == RelayEvent::Open);
  }

  SECTION("running out of attempts is fatal") {
    f.socket().drop(kCloseAbnormal);
    REQUIRE(f.errors.back() == ErrorKind::ReconnectionExhausted);
    REQUIRE(f.events.back() == RelayEvent::Failed);
    f.sched.advance(60'000ms);
    REQUIRE(f.sockets.size() == 6);
  }
}

TEST_CASE("stale sockets are ignored after a reconnect") {
  RelayFixture f;
  f.open_with_peer();
  auto old = f.sockets.back();

  old->drop(kCloseAbnormal);
  f.sched.advance(1000ms);
  REQUIRE(f.sockets.size() == 2);

  old->receive(make_peers_present(default_relay_assist()));
  REQUIRE_FALSE(f.channel->peers_present());
}

TEST_CASE("close codes that end the session") {
  RelayFixture f;
  f.open_with_peer();

  SECTION("slot conflict") {
    f.socket().drop(kCloseSlotConflict, "taken");
    REQUIRE(f.errors == std::vector<ErrorKind>{ErrorKind::SlotConflict});
    REQUIRE(f.events.back() == RelayEvent::Failed);
  }
  SECTION("bad request") {
    f.socket().drop(kCloseBadRequest, "missing slot");
    REQUIRE(f.errors == std::vector<ErrorKind>{ErrorKind::Connection});
    REQUIRE(f.events.back() == RelayEvent::Failed);
  }
  SECTION("normal close") {
    f.socket().drop(kCloseNormal);
    REQUIRE(f.errors.empty());
    REQUIRE(f.events.back() == RelayEvent::Disconnected);
  }

  f.sched.advance(60'000ms);
  REQUIRE(f.sockets.size() == 1);
}

TEST_CASE("dispose closes the socket normally and goes quiet") {
  RelayFixture f;
  f.open_with_peer();
  auto socket = f.sockets.back();

  f.channel->dispose();
  REQUIRE(socket->close_code == kCloseNormal);
  REQUIRE_FALSE(f.channel->is_ready());

  socket->receive(make_game({Slot::First, ReadyMsg{}, 0}));
  REQUIRE(f.envelopes.empty());
}
