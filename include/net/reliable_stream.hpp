#pragma once
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <vector>

// Ordered, reliable delivery on top of datagrams. Pure bookkeeping: the owner
// moves bytes and supplies the clock.
//
// Outgoing messages get consecutive sequence numbers starting at 1 and stay
// in flight until a cumulative ack covers them. Incoming messages are held in
// a reorder buffer and released strictly in sequence order, once each.
class ReliableStream {
public:
  struct Segment {
    std::uint64_t seq = 0;
    std::string data;
  };

  explicit ReliableStream(std::chrono::milliseconds rto = std::chrono::milliseconds(200),
                          std::size_t window = 256)
      : rto_(rto), window_(window) {}

  Segment push(std::string data, std::int64_t now_ms);
  void on_ack(std::uint64_t ack);

  // Returns the payloads that became deliverable, in order. Duplicates and
  // segments beyond the receive window yield nothing.
  std::vector<std::string> on_segment(std::uint64_t seq, std::string data);

  // Segments unacknowledged for at least one RTO. Their timers restart.
  std::vector<Segment> due_retransmits(std::int64_t now_ms);

  [[nodiscard]] std::uint64_t cumulative_ack() const noexcept {
    return delivered_;
  }
  [[nodiscard]] std::size_t in_flight() const noexcept {
    return unacked_.size();
  }
  [[nodiscard]] std::size_t buffered() const noexcept {
    return reorder_.size();
  }
  [[nodiscard]] std::uint64_t retransmissions() const noexcept {
    return retransmissions_;
  }

private:
  struct InFlight {
    std::string data;
    std::int64_t sent_at_ms = 0;
  };

  std::chrono::milliseconds rto_;
  std::size_t window_;
  std::uint64_t next_seq_ = 1;
  std::uint64_t delivered_ = 0;
  std::uint64_t retransmissions_ = 0;
  std::map<std::uint64_t, InFlight> unacked_;
  std::map<std::uint64_t, std::string> reorder_;
};
