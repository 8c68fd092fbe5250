#pragma once
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <span>
#include <string>
#include <vector>

struct UdpEndpoint {
  std::string address;
  std::uint16_t port = 0;

  bool operator==(const UdpEndpoint &) const = default;
};

// Unconnected UDP socket used by DirectChannel.
class IDatagramSocket {
public:
  using ReceiveHandler =
      std::function<void(const UdpEndpoint &from, std::span<const std::byte>)>;

  virtual ~IDatagramSocket() = default;

  // Binds, starts receiving and returns the local endpoints worth advertising
  // to the other peer. Throws ConnectionError if the socket cannot be bound.
  virtual std::vector<UdpEndpoint> open(ReceiveHandler handler) = 0;
  virtual void send_to(const UdpEndpoint &dst,
                       std::span<const std::byte> data) noexcept = 0;
  virtual void close() noexcept = 0;
};

using DatagramSocketFactory = std::function<std::shared_ptr<IDatagramSocket>()>;
