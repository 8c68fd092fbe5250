#include "net/beast_relay_socket.hpp"

#include <chrono>
#include <utility>

#include "core/log.hpp"
#include "proto/relay_messages.hpp"

namespace beast = boost::beast;
namespace websocket = boost::beast::websocket;
using boost::asio::ip::tcp;

BeastRelaySocket::BeastRelaySocket(boost::asio::any_io_executor exec)
    : resolver_(exec), ws_(exec) {}

RelaySocketFactory BeastRelaySocket::factory(boost::asio::any_io_executor exec) {
  return [exec]() -> std::shared_ptr<IRelaySocket> {
    return std::make_shared<BeastRelaySocket>(exec);
  };
}

void BeastRelaySocket::open(const RelayTarget &target, Handlers handlers) {
  target_ = target;
  handlers_ = std::move(handlers);
  resolver_.async_resolve(
      target_.host, target_.port,
      [self = shared_from_this()](const boost::system::error_code &ec,
                                  tcp::resolver::results_type results) {
        self->on_resolve(ec, std::move(results));
      });
}

void BeastRelaySocket::on_resolve(const boost::system::error_code &ec,
                                  tcp::resolver::results_type results) {
  if (ec) {
    finish(kCloseAbnormal, "resolve: " + ec.message());
    return;
  }
  beast::get_lowest_layer(ws_).expires_after(std::chrono::seconds(10));
  beast::get_lowest_layer(ws_).async_connect(
      results, [self = shared_from_this()](const boost::system::error_code &ec,
                                           const tcp::endpoint &) {
        self->on_connect(ec);
      });
}

void BeastRelaySocket::on_connect(const boost::system::error_code &ec) {
  if (ec) {
    finish(kCloseAbnormal, "connect: " + ec.message());
    return;
  }
  beast::get_lowest_layer(ws_).expires_never();
  ws_.set_option(
      websocket::stream_base::timeout::suggested(beast::role_type::client));
  ws_.async_handshake(target_.host + ":" + target_.port, target_.path,
                      [self = shared_from_this()](
                          const boost::system::error_code &ec) {
                        self->on_handshake(ec);
                      });
}

void BeastRelaySocket::on_handshake(const boost::system::error_code &ec) {
  if (ec) {
    finish(kCloseAbnormal, "handshake: " + ec.message());
    return;
  }
  if (finished_) {
    return;
  }
  open_ = true;
  ws_.text(true);
  if (handlers_.on_open) {
    handlers_.on_open();
  }
  start_read();
  if (!outbox_.empty()) {
    start_write();
  }
}

void BeastRelaySocket::start_read() {
  ws_.async_read(buf_, [self = shared_from_this()](
                           const boost::system::error_code &ec, std::size_t) {
    if (ec) {
      if (ec == websocket::error::closed) {
        const auto &why = self->ws_.reason();
        self->finish(why.code,
                     std::string(why.reason.data(), why.reason.size()));
      } else {
        self->finish(kCloseAbnormal, ec.message());
      }
      return;
    }
    auto text = beast::buffers_to_string(self->buf_.data());
    self->buf_.consume(self->buf_.size());
    if (self->handlers_.on_text) {
      self->handlers_.on_text(text);
    }
    if (!self->finished_) {
      self->start_read();
    }
  });
}

void BeastRelaySocket::send_text(std::string text) {
  if (finished_ || closing_) {
    return;
  }
  outbox_.push_back(std::move(text));
  if (open_ && outbox_.size() == 1) {
    start_write();
  }
}

void BeastRelaySocket::start_write() {
  ws_.async_write(boost::asio::buffer(outbox_.front()),
                  [self = shared_from_this()](
                      const boost::system::error_code &ec, std::size_t) {
                    if (ec) {
                      if (ec != boost::asio::error::operation_aborted) {
                        DUEL_LOGLN("relay write error: " << ec.message());
                      }
                      self->outbox_.clear();
                      return;
                    }
                    self->outbox_.pop_front();
                    if (!self->outbox_.empty() && !self->finished_) {
                      self->start_write();
                    }
                  });
}

void BeastRelaySocket::close(std::uint16_t code, const std::string &reason) {
  if (finished_ || closing_) {
    return;
  }
  closing_ = true;
  if (!open_) {
    resolver_.cancel();
    beast::get_lowest_layer(ws_).cancel();
    finish(code, reason);
    return;
  }
  // Close reasons are limited to 123 bytes.
  websocket::close_reason why(static_cast<websocket::close_code>(code),
                              reason.substr(0, 123));
  ws_.async_close(why, [self = shared_from_this(), code,
                        reason](const boost::system::error_code &ec) {
    if (ec && ec != boost::asio::error::operation_aborted) {
      DUEL_LOGLN("relay close error: " << ec.message());
    }
    self->finish(code, reason);
  });
}

void BeastRelaySocket::finish(std::uint16_t code, const std::string &reason) {
  if (finished_) {
    return;
  }
  finished_ = true;
  open_ = false;
  auto on_close = std::move(handlers_.on_close);
  handlers_ = {};
  if (on_close) {
    on_close(code, reason);
  }
}
