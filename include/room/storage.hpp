#pragma once
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// Durable key/value store handed to each room. Implementations are safe to
// share between room actors.
class IDurableStorage {
public:
  virtual ~IDurableStorage() = default;

  virtual std::optional<std::string> get(const std::string &key) = 0;
  virtual void put(const std::string &key, const std::string &value) = 0;
  virtual void remove(const std::string &key) = 0;
  virtual std::vector<std::string> keys(const std::string &prefix) = 0;
};

class MemoryStorage : public IDurableStorage {
public:
  std::optional<std::string> get(const std::string &key) override;
  void put(const std::string &key, const std::string &value) override;
  void remove(const std::string &key) override;
  std::vector<std::string> keys(const std::string &prefix) override;

private:
  std::mutex mu_;
  std::map<std::string, std::string> data_;
};

// Keeps every entry in one JSON document under `dir`, rewritten atomically
// (write to a temp file, then rename) on each change. Throws
// std::runtime_error when the directory or file cannot be written.
class FileStorage : public IDurableStorage {
public:
  explicit FileStorage(std::filesystem::path dir);

  std::optional<std::string> get(const std::string &key) override;
  void put(const std::string &key, const std::string &value) override;
  void remove(const std::string &key) override;
  std::vector<std::string> keys(const std::string &prefix) override;

  [[nodiscard]] const std::filesystem::path &file() const noexcept {
    return file_;
  }

private:
  void load();
  void flush();

  std::filesystem::path file_;
  std::mutex mu_;
  std::map<std::string, std::string> data_;
};
