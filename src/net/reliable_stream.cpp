#include "net/reliable_stream.hpp"

#include <utility>

ReliableStream::Segment ReliableStream::push(std::string data,
                                             std::int64_t now_ms) {
  const auto seq = next_seq_++;
  unacked_.emplace(seq, InFlight{data, now_ms});
  return {seq, std::move(data)};
}

void ReliableStream::on_ack(std::uint64_t ack) {
  unacked_.erase(unacked_.begin(), unacked_.upper_bound(ack));
}

std::vector<std::string> ReliableStream::on_segment(std::uint64_t seq,
                                                    std::string data) {
  std::vector<std::string> out;
  if (seq <= delivered_ || seq > delivered_ + window_) {
    return out;
  }
  reorder_.emplace(seq, std::move(data));

  auto it = reorder_.begin();
  while (it != reorder_.end() && it->first == delivered_ + 1) {
    out.push_back(std::move(it->second));
    ++delivered_;
    it = reorder_.erase(it);
  }
  return out;
}

std::vector<ReliableStream::Segment>
ReliableStream::due_retransmits(std::int64_t now_ms) {
  std::vector<Segment> out;
  for (auto &[seq, entry] : unacked_) {
    if (now_ms - entry.sent_at_ms >= rto_.count()) {
      entry.sent_at_ms = now_ms;
      out.push_back({seq, entry.data});
      ++retransmissions_;
    }
  }
  return out;
}
