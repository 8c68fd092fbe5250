#pragma once
#include <deque>
#include <memory>
#include <string>

#include <utility>
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include "net/relay_socket.hpp"

// IRelaySocket over a Boost.Beast WebSocket client stream. Must be owned by a
// shared_ptr; all callbacks run on the executor passed in.
class BeastRelaySocket : public IRelaySocket,
                         public std::enable_shared_from_this<BeastRelaySocket> {
public:
  explicit BeastRelaySocket(boost::asio::any_io_executor exec);
  ~BeastRelaySocket() override = default;

  static RelaySocketFactory factory(boost::asio::any_io_executor exec);

  void open(const RelayTarget &target, Handlers handlers) override;
  void send_text(std::string text) override;
  void close(std::uint16_t code, const std::string &reason) override;
  [[nodiscard]] bool is_open() const override { return open_; }

private:
  void on_resolve(const boost::system::error_code &ec,
                  boost::asio::ip::tcp::resolver::results_type results);
  void on_connect(const boost::system::error_code &ec);
  void on_handshake(const boost::system::error_code &ec);
  void start_read();
  void start_write();
  void finish(std::uint16_t code, const std::string &reason);

  boost::asio::ip::tcp::resolver resolver_;
  boost::beast::websocket::stream<boost::beast::tcp_stream> ws_;
  boost::beast::flat_buffer buf_;
  std::deque<std::string> outbox_;
  RelayTarget target_;
  Handlers handlers_;
  bool open_ = false;
  bool closing_ = false;
  bool finished_ = false;
};
