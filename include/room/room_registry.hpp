#pragma once
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

#include <utility>
#include <boost/asio.hpp>
#include <nlohmann/json.hpp>

#include "room/room.hpp"

class RoomRegistry;

// Runs one Room on its own strand and supplies its alarm.
class RoomActor : public IRoomHost,
                  public std::enable_shared_from_this<RoomActor> {
public:
  RoomActor(RoomRegistry &registry, std::string id,
            boost::asio::any_io_executor exec, IDurableStorage &storage,
            const RoomOptions &opts);

  RoomActor(const RoomActor &) = delete;
  RoomActor &operator=(const RoomActor &) = delete;

  // Queues fn(room) on the room's strand. Events for one room never overlap.
  void post(std::function<void(Room &)> fn);

  [[nodiscard]] std::int64_t now_ms() const override;
  void set_alarm(std::int64_t at_ms) override;

  [[nodiscard]] const std::string &id() const noexcept { return id_; }
  // Snapshot of Room::info() as of the last processed event.
  [[nodiscard]] nlohmann::json info() const;

private:
  void run(const std::function<void(Room &)> &fn);

  RoomRegistry &registry_;
  std::string id_;
  boost::asio::strand<boost::asio::any_io_executor> strand_;
  boost::asio::steady_timer alarm_;
  Room room_;
  mutable std::mutex info_mu_;
  nlohmann::json info_;
};

// Lazily creates room actors by id and drops them once their room expires.
class RoomRegistry {
public:
  RoomRegistry(boost::asio::any_io_executor exec, IDurableStorage &storage,
               RoomOptions opts = {});

  RoomRegistry(const RoomRegistry &) = delete;
  RoomRegistry &operator=(const RoomRegistry &) = delete;

  std::shared_ptr<RoomActor> acquire(const std::string &id);
  std::shared_ptr<RoomActor> find(const std::string &id) const;
  [[nodiscard]] std::size_t size() const;

  // Brings back persisted rooms after a restart. No connection survives a
  // restart, so every persisted occupant is vacated.
  std::size_t restore();

  // Called by an actor whose room expired.
  void remove(const std::string &id, const RoomActor *actor);

  static bool valid_id(std::string_view id) noexcept;

private:
  boost::asio::any_io_executor exec_;
  IDurableStorage &storage_;
  RoomOptions opts_;
  mutable std::mutex mu_;
  std::unordered_map<std::string, std::shared_ptr<RoomActor>> rooms_;
};
