#pragma once
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

struct RelayTarget {
  std::string host;
  std::string port;
  std::string path; // e.g. "/ws?room=abc&slot=first"
};

// Text-frame WebSocket as seen by RelayChannel. Every opened socket ends with
// exactly one on_close, including when the connection never came up.
class IRelaySocket {
public:
  struct Handlers {
    std::function<void()> on_open;
    std::function<void(const std::string &)> on_text;
    std::function<void(std::uint16_t code, const std::string &reason)> on_close;
  };

  virtual ~IRelaySocket() = default;

  virtual void open(const RelayTarget &target, Handlers handlers) = 0;
  virtual void send_text(std::string text) = 0;
  virtual void close(std::uint16_t code, const std::string &reason) = 0;
  [[nodiscard]] virtual bool is_open() const = 0;
};

using RelaySocketFactory = std::function<std::shared_ptr<IRelaySocket>()>;
