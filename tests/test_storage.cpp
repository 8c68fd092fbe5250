#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

#include "room/room_registry.hpp"
#include "room/storage.hpp"

namespace fs = std::filesystem;

namespace {

// Fresh directory under the system temp dir, removed afterwards.
struct TempDir {
  TempDir() {
    const auto stamp =
        std::chrono::steady_clock::now().time_since_epoch().count();
    path = fs::temp_directory_path() /
           ("duelnet-test-" + std::to_string(stamp));
  }
  ~TempDir() {
    std::error_code ec;
    fs::remove_all(path, ec);
  }

  fs::path path;
};

} // namespace

TEST_CASE("memory storage lists keys by prefix") {
  MemoryStorage s;
  s.put("room:a", "1");
  s.put("room:b", "2");
  s.put("other", "3");

  REQUIRE(s.keys("room:") == std::vector<std::string>{"room:a", "room:b"});
  REQUIRE(s.get("room:b") == "2");
  REQUIRE_FALSE(s.get("room:c").has_value());

  s.remove("room:a");
  REQUIRE(s.keys("room:") == std::vector<std::string>{"room:b"});
  REQUIRE(s.keys("").size() == 2);
}

TEST_CASE("file storage survives a restart") {
  TempDir dir;
  {
    FileStorage s(dir.path);
    s.put("room:a", R"({"x":1})");
    s.put("room:b", "two");
    s.remove("room:b");
    REQUIRE(fs::exists(s.file()));
  }

  FileStorage reopened(dir.path);
  REQUIRE(reopened.get("room:a") == R"({"x":1})");
  REQUIRE_FALSE(reopened.get("room:b").has_value());
  REQUIRE(reopened.keys("room:") == std::vector<std::string>{"room:a"});

  // No temp file is left behind.
  auto tmp = reopened.file();
  tmp += ".tmp";
  REQUIRE_FALSE(fs::exists(tmp));
}

TEST_CASE("file storage starts empty from an unreadable file") {
  TempDir dir;
  fs::create_directories(dir.path);
  {
    std::ofstream out(dir.path / "rooms.json");
    out << "not json at all";
  }

  FileStorage s(dir.path);
  REQUIRE(s.keys("").empty());

  s.put("room:z", "v");
  FileStorage reopened(dir.path);
  REQUIRE(reopened.get("room:z") == "v");
}

TEST_CASE("room ids are short url-safe tokens") {
  REQUIRE(RoomRegistry::valid_id("lobby"));
  REQUIRE(RoomRegistry::valid_id("Room_42-b"));
  REQUIRE(RoomRegistry::valid_id(std::string(64, 'a')));

  REQUIRE_FALSE(RoomRegistry::valid_id(""));
  REQUIRE_FALSE(RoomRegistry::valid_id(std::string(65, 'a')));
  REQUIRE_FALSE(RoomRegistry::valid_id("a/b"));
  REQUIRE_FALSE(RoomRegistry::valid_id("has space"));
  REQUIRE_FALSE(RoomRegistry::valid_id("../etc"));
}

TEST_CASE("registry restores persisted rooms with their slots vacated") {
  MemoryStorage storage;
  // Far in the future, so the restored room is not yet idle.
  storage.put("room:fresh",
              R"({"id":"fresh","occupied":[true,true],"directEstablished":true,)"
              R"("createdAt":1,"lastActivity":4102444800000})");
  storage.put("room:stale", R"({"id":"stale","occupied":[true,false],)"
                            R"("createdAt":1,"lastActivity":2})");
  storage.put("room:bad id", "{}");

  boost::asio::io_context io;
  RoomRegistry registry(io.get_executor(), storage);
  REQUIRE(registry.restore() == 2);
  io.run_for(std::chrono::milliseconds(50));

  auto actor = registry.find("fresh");
  REQUIRE(actor);
  const auto info = actor->info();
  REQUIRE(info.at("first") == false);
  REQUIRE(info.at("second") == false);
  REQUIRE(info.at("directEstablished") == false);

  const auto saved = nlohmann::json::parse(*storage.get("room:fresh"));
  REQUIRE(saved.at("occupied") == nlohmann::json::array({false, false}));
  REQUIRE(saved.at("createdAt") == 1);

  // An empty room past its idle window expires as soon as it is restored.
  REQUIRE_FALSE(registry.find("stale"));
  REQUIRE_FALSE(storage.get("room:stale").has_value());
  REQUIRE(registry.size() == 1);
}
