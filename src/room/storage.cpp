#include "room/storage.hpp"

#include <fstream>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "core/log.hpp"

static std::vector<std::string>
keys_with_prefix(const std::map<std::string, std::string> &data,
                 const std::string &prefix) {
  std::vector<std::string> out;
  for (auto it = data.lower_bound(prefix);
       it != data.end() && it->first.compare(0, prefix.size(), prefix) == 0;
       ++it) {
    out.push_back(it->first);
  }
  return out;
}

std::optional<std::string> MemoryStorage::get(const std::string &key) {
  std::lock_guard lock(mu_);
  auto it = data_.find(key);
  if (it == data_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void MemoryStorage::put(const std::string &key, const std::string &value) {
  std::lock_guard lock(mu_);
  data_[key] = value;
}

void MemoryStorage::remove(const std::string &key) {
  std::lock_guard lock(mu_);
  data_.erase(key);
}

std::vector<std::string> MemoryStorage::keys(const std::string &prefix) {
  std::lock_guard lock(mu_);
  return keys_with_prefix(data_, prefix);
}

FileStorage::FileStorage(std::filesystem::path dir)
    : file_(dir / "rooms.json") {
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    throw std::runtime_error("cannot create state dir " + dir.string() + ": " +
                             ec.message());
  }
  load();
}

void FileStorage::load() {
  std::ifstream in(file_);
  if (!in) {
    return;
  }
  try {
    const auto doc = nlohmann::json::parse(in);
    data_ = doc.get<std::map<std::string, std::string>>();
  } catch (const nlohmann::json::exception &e) {
    DUEL_LOGLN("storage: ignoring unreadable " << file_ << ": " << e.what());
    data_.clear();
  }
}

void FileStorage::flush() {
  auto tmp = file_;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::trunc);
    if (!out) {
      throw std::runtime_error("cannot write " + tmp.string());
    }
    out << nlohmann::json(data_).dump();
    if (!out) {
      throw std::runtime_error("short write to " + tmp.string());
    }
  }
  std::error_code ec;
  std::filesystem::rename(tmp, file_, ec);
  if (ec) {
    throw std::runtime_error("cannot replace " + file_.string() + ": " +
                             ec.message());
  }
}

std::optional<std::string> FileStorage::get(const std::string &key) {
  std::lock_guard lock(mu_);
  auto it = data_.find(key);
  if (it == data_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void FileStorage::put(const std::string &key, const std::string &value) {
  std::lock_guard lock(mu_);
  data_[key] = value;
  flush();
}

void FileStorage::remove(const std::string &key) {
  std::lock_guard lock(mu_);
  if (data_.erase(key) > 0) {
    flush();
  }
}

std::vector<std::string> FileStorage::keys(const std::string &prefix) {
  std::lock_guard lock(mu_);
  return keys_with_prefix(data_, prefix);
}
