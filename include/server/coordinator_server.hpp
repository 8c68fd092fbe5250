#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "core/config.hpp"
#include "proto/relay_messages.hpp"
#include "room/room_registry.hpp"
#include "room/storage.hpp"

using HttpRequest =
    boost::beast::http::request<boost::beast::http::string_body>;
using HttpResponse =
    boost::beast::http::response<boost::beast::http::string_body>;

// Answers the plain HTTP endpoints. Separate from the socket code so it can be
// exercised without a network.
class HttpRoutes {
public:
  HttpRoutes(const RoomRegistry &registry, RelayAssistConfig assist)
      : registry_(registry), assist_(std::move(assist)) {}

  HttpResponse handle(const HttpRequest &req) const;

private:
  const RoomRegistry &registry_;
  RelayAssistConfig assist_;
};

// Parsed "/ws?room=..&slot=.." target. Empty optional fields mean the
// parameter was missing or invalid.
struct WsTarget {
  bool is_ws = false;
  std::string room;
  std::optional<Slot> slot;
};

WsTarget parse_ws_target(std::string_view target);

// HTTP + WebSocket front end that hosts the room actors.
class CoordinatorServer {
public:
  explicit CoordinatorServer(CoordinatorConfig cfg);
  ~CoordinatorServer();

  CoordinatorServer(CoordinatorServer &&) = delete;
  CoordinatorServer &operator=(CoordinatorServer &&) = delete;

  CoordinatorServer(const CoordinatorServer &) = delete;
  CoordinatorServer &operator=(const CoordinatorServer &) = delete;

  // Blocks until SIGINT/SIGTERM or stop().
  void start();
  void stop();

  [[nodiscard]] std::uint16_t port() const;

private:
  void do_accept();

  CoordinatorConfig cfg_;
  boost::asio::io_context io_;
  std::unique_ptr<IDurableStorage> storage_;
  RoomRegistry registry_;
  HttpRoutes routes_;
  boost::asio::ip::tcp::acceptor acceptor_;
  boost::asio::signal_set signals_;
};
