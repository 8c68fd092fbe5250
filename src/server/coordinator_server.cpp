#include "server/coordinator_server.hpp"

#include <csignal>
#include <deque>
#include <iostream>
#include <thread>
#include <vector>

#include <utility>
#include <boost/beast/websocket.hpp>

#include "core/errors.hpp"
#include "core/log.hpp"

namespace beast = boost::beast;
namespace http = boost::beast::http;
namespace websocket = boost::beast::websocket;
using boost::asio::ip::tcp;

static constexpr const char *kServerName = "duel-coordinator";
static constexpr const char *kVersion = "2.0";

WsTarget parse_ws_target(std::string_view target) {
  WsTarget out;
  const auto qpos = target.find('?');
  const auto path = target.substr(0, qpos);
  out.is_ws = path == "/ws" || path == "/ws/";
  if (qpos == std::string_view::npos) {
    return out;
  }

  auto query = target.substr(qpos + 1);
  while (!query.empty()) {
    const auto amp = query.find('&');
    const auto pair = query.substr(0, amp);
    query = amp == std::string_view::npos ? std::string_view{}
                                          : query.substr(amp + 1);
    const auto eq = pair.find('=');
    if (eq == std::string_view::npos) {
      continue;
    }
    const auto key = pair.substr(0, eq);
    const auto value = pair.substr(eq + 1);
    if (key == "room" && RoomRegistry::valid_id(value)) {
      out.room = std::string(value);
    } else if (key == "slot") {
      out.slot = parse_slot(value);
    } else if (key == "role" && !out.slot) {
      // host/guest naming used by older peers
      if (value == "host") {
        out.slot = Slot::First;
      } else if (value == "guest") {
        out.slot = Slot::Second;
      }
    }
  }
  return out;
}

HttpResponse HttpRoutes::handle(const HttpRequest &req) const {
  auto reply = [&req](http::status status, std::string body,
                      const char *content_type) {
    HttpResponse res{status, req.version()};
    res.set(http::field::server, kServerName);
    res.set(http::field::access_control_allow_origin, "*");
    res.set(http::field::access_control_allow_methods, "GET, OPTIONS");
    res.set(http::field::access_control_allow_headers, "Content-Type");
    if (content_type) {
      res.set(http::field::content_type, content_type);
    }
    res.keep_alive(req.keep_alive());
    res.body() = std::move(body);
    res.prepare_payload();
    return res;
  };
  auto reply_json = [&reply](http::status status, const nlohmann::json &body) {
    return reply(status, body.dump(), "application/json");
  };

  if (req.method() == http::verb::options) {
    return reply(http::status::no_content, {}, nullptr);
  }

  const std::string_view target(req.target().data(), req.target().size());
  const auto path = target.substr(0, target.find('?'));

  if (req.method() == http::verb::get) {
    if (path == "/health") {
      return reply_json(http::status::ok,
                        {{"status", "ok"},
                         {"version", kVersion},
                         {"rooms", registry_.size()}});
    }
    if (path == "/relay-config" || path == "/ice-servers") {
      return reply_json(http::status::ok, assist_);
    }
    constexpr std::string_view kRoomPrefix = "/api/room/";
    if (path.substr(0, kRoomPrefix.size()) == kRoomPrefix) {
      const auto id = path.substr(kRoomPrefix.size());
      if (RoomRegistry::valid_id(id)) {
        if (auto actor = registry_.find(std::string(id))) {
          return reply_json(http::status::ok, actor->info());
        }
      }
      return reply_json(http::status::not_found, {{"error", "room not found"}});
    }
  }

  return reply(http::status::not_found,
               "Not found. Endpoints: /ws?room=<id>&slot=first|second, "
               "/health, /relay-config, /api/room/<id>\n",
               "text/plain");
}

namespace {

// One WebSocket peer. Lives as long as its socket; the room holds it as an
// IPeerHandle while it occupies a slot.
class WsPeerSession : public IPeerHandle,
                      public std::enable_shared_from_this<WsPeerSession> {
public:
  WsPeerSession(tcp::socket &&socket, RoomRegistry &registry)
      : ws_(std::move(socket)), registry_(registry) {}

  void run(HttpRequest req) {
    req_ = std::move(req);
    target_ = parse_ws_target(
        std::string_view(req_.target().data(), req_.target().size()));
    ws_.set_option(
        websocket::stream_base::timeout::suggested(beast::role_type::server));
    ws_.set_option(websocket::stream_base::decorator(
        [](websocket::response_type &res) {
          res.set(http::field::server, kServerName);
        }));
    ws_.async_accept(req_, [self = shared_from_this()](
                               const boost::system::error_code &ec) {
      self->on_accept(ec);
    });
  }

  void send_text(const std::string &text) override {
    boost::asio::post(ws_.get_executor(),
                      [self = shared_from_this(), text] { self->queue(text); });
  }

  void close(std::uint16_t code, const std::string &reason) override {
    boost::asio::post(ws_.get_executor(),
                      [self = shared_from_this(), code, reason] {
                        self->do_close(code, reason);
                      });
  }

private:
  void on_accept(const boost::system::error_code &ec) {
    if (ec) {
      DUEL_LOGLN("ws accept error: " << ec.message());
      return;
    }
    if (!target_.slot || target_.room.empty()) {
      do_close(kCloseBadRequest, "missing or invalid room/slot");
      do_read();
      return;
    }

    slot_ = *target_.slot;
    actor_ = registry_.acquire(target_.room);
    actor_->post([self = shared_from_this(), slot = slot_](Room &room) {
      try {
        room.join(slot, self);
      } catch (const SlotConflictError &e) {
        DUEL_LOGLN("ws: " << e.what());
        self->close(kCloseSlotConflict, "slot already taken");
      }
    });
    do_read();
  }

  void do_read() {
    ws_.async_read(buf_, [self = shared_from_this()](
                             const boost::system::error_code &ec, std::size_t) {
      self->on_read(ec);
    });
  }

  void on_read(const boost::system::error_code &ec) {
    if (ec) {
      if (ec != websocket::error::closed &&
          ec != boost::asio::error::operation_aborted) {
        DUEL_LOGLN("ws read: " << ec.message());
      }
      leave();
      return;
    }
    auto text = beast::buffers_to_string(buf_.data());
    buf_.consume(buf_.size());
    if (actor_) {
      actor_->post([self = shared_from_this(), slot = slot_,
                    text = std::move(text)](Room &room) {
        room.on_message(slot, self.get(), text);
      });
    }
    do_read();
  }

  void leave() {
    if (!actor_ || left_) {
      return;
    }
    left_ = true;
    actor_->post([self = shared_from_this(), slot = slot_](Room &room) {
      room.leave(slot, self.get());
    });
  }

  void queue(std::string text) {
    if (closing_) {
      return;
    }
    outbox_.push_back(std::move(text));
    if (outbox_.size() == 1) {
      do_write();
    }
  }

  void do_write() {
    ws_.text(true);
    ws_.async_write(boost::asio::buffer(outbox_.front()),
                    [self = shared_from_this()](
                        const boost::system::error_code &ec, std::size_t) {
                      if (ec) {
                        if (ec != boost::asio::error::operation_aborted) {
                          DUEL_LOGLN("ws write: " << ec.message());
                        }
                        self->outbox_.clear();
                        return;
                      }
                      self->outbox_.pop_front();
                      if (!self->outbox_.empty()) {
                        self->do_write();
                      }
                    });
  }

  void do_close(std::uint16_t code, const std::string &reason) {
    if (closing_) {
      return;
    }
    closing_ = true;
    ws_.async_close(
        websocket::close_reason(static_cast<websocket::close_code>(code),
                                reason),
        [self = shared_from_this()](const boost::system::error_code &ec) {
          if (ec && ec != boost::asio::error::operation_aborted) {
            DUEL_LOGLN("ws close: " << ec.message());
          }
        });
  }

  websocket::stream<beast::tcp_stream> ws_;
  RoomRegistry &registry_;
  HttpRequest req_;
  WsTarget target_;
  Slot slot_ = Slot::First;
  beast::flat_buffer buf_;
  std::deque<std::string> outbox_;
  std::shared_ptr<RoomActor> actor_;
  bool closing_ = false;
  bool left_ = false;
};

// Plain HTTP connection; hands itself over to a WsPeerSession on upgrade.
class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
  HttpSession(tcp::socket &&socket, RoomRegistry &registry,
              const HttpRoutes &routes)
      : stream_(std::move(socket)), registry_(registry), routes_(routes) {}

  void run() {
    boost::asio::dispatch(stream_.get_executor(),
                          [self = shared_from_this()] { self->do_read(); });
  }

private:
  void do_read() {
    req_ = {};
    stream_.expires_after(std::chrono::seconds(30));
    http::async_read(stream_, buffer_, req_,
                     [self = shared_from_this()](
                         const boost::system::error_code &ec, std::size_t) {
                       self->on_read(ec);
                     });
  }

  void on_read(const boost::system::error_code &ec) {
    if (ec == http::error::end_of_stream) {
      boost::system::error_code ignored;
      stream_.socket().shutdown(tcp::socket::shutdown_send, ignored);
      return;
    }
    if (ec) {
      if (ec != boost::asio::error::operation_aborted &&
          ec != beast::error::timeout) {
        DUEL_LOGLN("http read: " << ec.message());
      }
      return;
    }

    if (websocket::is_upgrade(req_)) {
      stream_.expires_never();
      std::make_shared<WsPeerSession>(stream_.release_socket(), registry_)
          ->run(std::move(req_));
      return;
    }

    auto res = std::make_shared<HttpResponse>(routes_.handle(req_));
    http::async_write(stream_, *res,
                      [self = shared_from_this(), res](
                          const boost::system::error_code &ec, std::size_t) {
                        self->on_write(res->need_eof(), ec);
                      });
  }

  void on_write(bool close, const boost::system::error_code &ec) {
    if (ec) {
      DUEL_LOGLN("http write: " << ec.message());
      return;
    }
    if (close) {
      boost::system::error_code ignored;
      stream_.socket().shutdown(tcp::socket::shutdown_send, ignored);
      return;
    }
    do_read();
  }

  beast::tcp_stream stream_;
  beast::flat_buffer buffer_;
  HttpRequest req_;
  RoomRegistry &registry_;
  const HttpRoutes &routes_;
};

std::unique_ptr<IDurableStorage> make_storage(const CoordinatorConfig &cfg) {
  if (cfg.state_dir.empty()) {
    return std::make_unique<MemoryStorage>();
  }
  return std::make_unique<FileStorage>(cfg.state_dir);
}

RoomOptions room_options(const CoordinatorConfig &cfg) {
  RoomOptions opts;
  opts.empty_ttl = std::chrono::milliseconds(cfg.empty_ttl_ms);
  opts.inactivity_timeout = std::chrono::milliseconds(cfg.inactivity_timeout_ms);
  if (!cfg.relay_assist.empty()) {
    opts.relay_assist.urls = cfg.relay_assist;
  }
  return opts;
}

} // namespace

CoordinatorServer::CoordinatorServer(CoordinatorConfig cfg)
    : cfg_(std::move(cfg)), io_(cfg_.threads), storage_(make_storage(cfg_)),
      registry_(io_.get_executor(), *storage_, room_options(cfg_)),
      routes_(registry_, room_options(cfg_).relay_assist), acceptor_(io_),
      signals_(io_, SIGINT, SIGTERM) {
  tcp::endpoint ep(boost::asio::ip::make_address(cfg_.bind), cfg_.port);
  acceptor_.open(ep.protocol());
  acceptor_.set_option(boost::asio::socket_base::reuse_address(true));
  acceptor_.bind(ep);
  acceptor_.listen(boost::asio::socket_base::max_listen_connections);
}

CoordinatorServer::~CoordinatorServer() = default;

std::uint16_t CoordinatorServer::port() const {
  return acceptor_.local_endpoint().port();
}

void CoordinatorServer::start() {
  registry_.restore();
  do_accept();
  signals_.async_wait([this](const boost::system::error_code &, int) {
    DUEL_LOGLN("shutting down");
    stop();
  });

  std::cout << "Listening on " << cfg_.bind << ":" << port() << " with "
            << cfg_.threads << " thread(s) (Ctrl+C to stop)\n";

  std::vector<std::thread> workers;
  workers.reserve(cfg_.threads - 1);
  for (int i = 1; i < cfg_.threads; ++i) {
    workers.emplace_back([this] { io_.run(); });
  }
  io_.run();
  for (auto &t : workers) {
    t.join();
  }
}

void CoordinatorServer::stop() { io_.stop(); }

void CoordinatorServer::do_accept() {
  acceptor_.async_accept(
      boost::asio::make_strand(io_),
      [this](const boost::system::error_code &ec, tcp::socket socket) {
        if (ec) {
          if (ec == boost::asio::error::operation_aborted) {
            return;
          }
          DUEL_LOGLN("accept: " << ec.message());
        } else {
          std::make_shared<HttpSession>(std::move(socket), registry_, routes_)
              ->run();
        }
        do_accept();
      });
}
