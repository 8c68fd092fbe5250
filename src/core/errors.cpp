#include "core/errors.hpp"

const char *to_string(ErrorKind kind) noexcept {
  switch (kind) {
  case ErrorKind::Connection:
    return "connection";
  case ErrorKind::Protocol:
    return "protocol";
  case ErrorKind::SlotConflict:
    return "slot-conflict";
  case ErrorKind::NegotiationTimeout:
    return "negotiation-timeout";
  case ErrorKind::ReconnectionExhausted:
    return "reconnection-exhausted";
  }
  return "unknown";
}
