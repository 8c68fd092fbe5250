#include "room/room_registry.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <utility>
#include <vector>

#include "core/log.hpp"

RoomActor::RoomActor(RoomRegistry &registry, std::string id,
                     boost::asio::any_io_executor exec,
                     IDurableStorage &storage, const RoomOptions &opts)
    : registry_(registry), id_(std::move(id)),
      strand_(boost::asio::make_strand(exec)), alarm_(strand_),
      room_(id_, *this, storage, opts), info_(room_.info()) {}

void RoomActor::post(std::function<void(Room &)> fn) {
  boost::asio::post(strand_, [self = shared_from_this(), fn = std::move(fn)] {
    self->run(fn);
  });
}

void RoomActor::run(const std::function<void(Room &)> &fn) {
  if (room_.expired()) {
    // Raced with expiry; the registry hands out a fresh actor for this id.
    registry_.acquire(id_)->post(fn);
    return;
  }
  try {
    fn(room_);
  } catch (const std::exception &e) {
    DUEL_LOGLN("room " << id_ << ": event failed: " << e.what());
  }
  {
    std::lock_guard lock(info_mu_);
    info_ = room_.info();
  }
  if (room_.expired()) {
    alarm_.cancel();
    registry_.remove(id_, this);
  }
}

std::int64_t RoomActor::now_ms() const {
  using namespace std::chrono;
  return duration_cast<milliseconds>(system_clock::now().time_since_epoch())
      .count();
}

void RoomActor::set_alarm(std::int64_t at_ms) {
  const auto delay = std::chrono::milliseconds(std::max<std::int64_t>(
      at_ms - now_ms(), 0));
  alarm_.expires_after(delay);
  std::weak_ptr<RoomActor> weak = weak_from_this();
  alarm_.async_wait([weak](const boost::system::error_code &ec) {
    if (ec) {
      return;
    }
    if (auto self = weak.lock()) {
      self->run([](Room &room) { room.on_alarm(); });
    }
  });
}

nlohmann::json RoomActor::info() const {
  std::lock_guard lock(info_mu_);
  return info_;
}

RoomRegistry::RoomRegistry(boost::asio::any_io_executor exec,
                           IDurableStorage &storage, RoomOptions opts)
    : exec_(exec), storage_(storage), opts_(std::move(opts)) {}

bool RoomRegistry::valid_id(std::string_view id) noexcept {
  if (id.empty() || id.size() > 64) {
    return false;
  }
  for (const char c : id) {
    const bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                    (c >= '0' && c <= '9') || c == '-' || c == '_';
    if (!ok) {
      return false;
    }
  }
  return true;
}

std::shared_ptr<RoomActor> RoomRegistry::acquire(const std::string &id) {
  std::lock_guard lock(mu_);
  auto &slot = rooms_[id];
  if (!slot) {
    slot = std::make_shared<RoomActor>(*this, id, exec_, storage_, opts_);
    DUEL_LOGLN("registry: created room " << id << " (" << rooms_.size()
                                         << " live)");
  }
  return slot;
}

std::shared_ptr<RoomActor> RoomRegistry::find(const std::string &id) const {
  std::lock_guard lock(mu_);
  auto it = rooms_.find(id);
  return it == rooms_.end() ? nullptr : it->second;
}

std::size_t RoomRegistry::size() const {
  std::lock_guard lock(mu_);
  return rooms_.size();
}

std::size_t RoomRegistry::restore() {
  const std::string prefix = Room::kKeyPrefix;
  std::vector<std::string> ids;
  for (const auto &key : storage_.keys(prefix)) {
    auto id = key.substr(prefix.size());
    if (valid_id(id)) {
      ids.push_back(std::move(id));
    }
  }
  for (const auto &id : ids) {
    acquire(id)->post([](Room &room) { room.resume({}); });
  }
  if (!ids.empty()) {
    DUEL_LOGLN("registry: restored " << ids.size() << " rooms");
  }
  return ids.size();
}

void RoomRegistry::remove(const std::string &id, const RoomActor *actor) {
  std::lock_guard lock(mu_);
  auto it = rooms_.find(id);
  if (it != rooms_.end() && it->second.get() == actor) {
    rooms_.erase(it);
    DUEL_LOGLN("registry: dropped room " << id);
  }
}
