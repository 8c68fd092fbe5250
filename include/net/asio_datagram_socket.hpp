#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

#include <utility>
#include <boost/asio.hpp>

#include "net/datagram_socket.hpp"

class AsioDatagramSocket
    : public IDatagramSocket,
      public std::enable_shared_from_this<AsioDatagramSocket> {
public:
  // port 0 binds an ephemeral port. A non-empty advertise_host replaces the
  // addresses discovered from the local host name.
  AsioDatagramSocket(boost::asio::any_io_executor exec, std::uint16_t port,
                     std::string advertise_host);
  ~AsioDatagramSocket() override = default;

  static DatagramSocketFactory factory(boost::asio::any_io_executor exec,
                                       std::uint16_t port,
                                       std::string advertise_host);

  std::vector<UdpEndpoint> open(ReceiveHandler handler) override;
  void send_to(const UdpEndpoint &dst,
               std::span<const std::byte> data) noexcept override;
  void close() noexcept override;

private:
  void start_receive();
  std::vector<UdpEndpoint> local_candidates(std::uint16_t port);

  boost::asio::any_io_executor exec_;
  boost::asio::ip::udp::socket socket_;
  boost::asio::ip::udp::endpoint remote_;
  std::array<std::byte, 2048> buf_{};
  std::uint16_t port_;
  std::string advertise_host_;
  ReceiveHandler handler_;
};
