#pragma once
#include <cstdint>
#include <functional>
#include <stdexcept>
#include <string>

enum class ErrorKind : std::uint8_t {
  Connection,
  Protocol,
  SlotConflict,
  NegotiationTimeout,
  ReconnectionExhausted,
};

const char *to_string(ErrorKind kind) noexcept;

class DuelError : public std::runtime_error {
public:
  DuelError(ErrorKind kind, const std::string &what)
      : std::runtime_error(what), kind_(kind) {}

  [[nodiscard]] ErrorKind kind() const noexcept { return kind_; }

  // Errors after which the session cannot continue.
  [[nodiscard]] bool fatal() const noexcept {
    return kind_ == ErrorKind::ReconnectionExhausted ||
           kind_ == ErrorKind::SlotConflict;
  }

private:
  ErrorKind kind_;
};

// Socket or channel failure; triggers fallback or reconnection.
class ConnectionError : public DuelError {
public:
  explicit ConnectionError(const std::string &what)
      : DuelError(ErrorKind::Connection, what) {}
};

// Malformed or version-mismatched payload; the message is dropped.
class ProtocolError : public DuelError {
public:
  explicit ProtocolError(const std::string &what)
      : DuelError(ErrorKind::Protocol, what) {}
};

class SlotConflictError : public DuelError {
public:
  explicit SlotConflictError(const std::string &what)
      : DuelError(ErrorKind::SlotConflict, what) {}
};

class NegotiationTimeoutError : public DuelError {
public:
  explicit NegotiationTimeoutError(const std::string &what)
      : DuelError(ErrorKind::NegotiationTimeout, what) {}
};

class ReconnectionExhaustedError : public DuelError {
public:
  explicit ReconnectionExhaustedError(const std::string &what)
      : DuelError(ErrorKind::ReconnectionExhausted, what) {}
};

using ErrorHandler = std::function<void(const DuelError &)>;
