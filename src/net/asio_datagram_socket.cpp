#include "net/asio_datagram_socket.hpp"

#include <algorithm>
#include <cstring>
#include <utility>
#include <vector>

#include "core/errors.hpp"
#include "core/log.hpp"

using boost::asio::ip::udp;

AsioDatagramSocket::AsioDatagramSocket(boost::asio::any_io_executor exec,
                                       std::uint16_t port,
                                       std::string advertise_host)
    : exec_(exec), socket_(exec), remote_(), port_(port),
      advertise_host_(std::move(advertise_host)) {}

DatagramSocketFactory
AsioDatagramSocket::factory(boost::asio::any_io_executor exec,
                            std::uint16_t port, std::string advertise_host) {
  return [exec, port, advertise_host]() -> std::shared_ptr<IDatagramSocket> {
    return std::make_shared<AsioDatagramSocket>(exec, port, advertise_host);
  };
}

std::vector<UdpEndpoint> AsioDatagramSocket::open(ReceiveHandler handler) {
  handler_ = std::move(handler);

  boost::system::error_code ec;
  udp::endpoint ep(udp::v4(), port_);
  socket_.open(ep.protocol(), ec);
  if (!ec) {
    socket_.set_option(boost::asio::socket_base::reuse_address(true), ec);
  }
  if (!ec) {
    socket_.bind(ep, ec);
  }
  if (ec) {
    throw ConnectionError("udp bind on port " + std::to_string(port_) + ": " +
                          ec.message());
  }

  const auto bound = socket_.local_endpoint(ec);
  if (ec) {
    throw ConnectionError("udp local_endpoint: " + ec.message());
  }
  DUEL_LOGLN("direct: udp socket bound on port " << bound.port());
  start_receive();
  return local_candidates(bound.port());
}

std::vector<UdpEndpoint> AsioDatagramSocket::local_candidates(std::uint16_t port) {
  std::vector<UdpEndpoint> out;
  if (!advertise_host_.empty()) {
    out.push_back({advertise_host_, port});
    return out;
  }

  boost::system::error_code ec;
  udp::resolver resolver(exec_);
  const auto results =
      resolver.resolve(udp::v4(), boost::asio::ip::host_name(ec), "", ec);
  if (!ec) {
    for (const auto &entry : results) {
      const auto addr = entry.endpoint().address();
      if (addr.is_loopback() || addr.is_unspecified()) {
        continue;
      }
      UdpEndpoint cand{addr.to_string(), port};
      if (std::find(out.begin(), out.end(), cand) == out.end()) {
        out.push_back(std::move(cand));
      }
    }
  }
  out.push_back({"127.0.0.1", port});
  return out;
}

void AsioDatagramSocket::start_receive() {
  socket_.async_receive_from(
      boost::asio::buffer(buf_), remote_,
      [self = shared_from_this()](const boost::system::error_code &ec,
                                  std::size_t bytes) {
        if (ec == boost::asio::error::operation_aborted ||
            !self->socket_.is_open()) {
          return;
        }
        if (!ec && bytes > 0) {
          const UdpEndpoint from{self->remote_.address().to_string(),
                                 self->remote_.port()};
          std::span<const std::byte> span(self->buf_.data(), bytes);
          // The handler may close the socket.
          if (auto handler = self->handler_) {
            handler(from, span);
          }
        } else if (ec) {
          DUEL_LOGLN("udp recv error: " << ec.message());
        }
        if (self->socket_.is_open()) {
          self->start_receive();
        }
      });
}

void AsioDatagramSocket::send_to(const UdpEndpoint &dst,
                                 std::span<const std::byte> data) noexcept {
  if (data.empty() || dst.port == 0 || !socket_.is_open())
    return;

  boost::system::error_code ec;
  const auto addr = boost::asio::ip::make_address(dst.address, ec);
  if (ec || addr.is_unspecified())
    return;

  auto payload = std::make_shared<std::vector<std::byte>>(data.size());
  std::memcpy(payload->data(), data.data(), data.size());

  socket_.async_send_to(
      boost::asio::buffer(*payload), udp::endpoint(addr, dst.port),
      [payload](const boost::system::error_code &ec, std::size_t) {
        if (ec && ec != boost::asio::error::operation_aborted) {
          DUEL_LOGLN("udp send error: " << ec.message());
        }
      });
}

void AsioDatagramSocket::close() noexcept {
  handler_ = nullptr;
  boost::system::error_code ec;
  socket_.close(ec);
}
