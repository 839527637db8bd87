#pragma once

#include <nlohmann/json.hpp>

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace llmbridge {

// Persistent state supplied by the embedding application.
class IKeyValueStore {
 public:
  virtual ~IKeyValueStore() = default;
  virtual std::optional<nlohmann::json> Get(const std::string& key) = 0;
  virtual void Put(const std::string& key, const nlohmann::json& value) = 0;
  virtual void Erase(const std::string& key) = 0;
};

class MemoryKeyValueStore : public IKeyValueStore {
 public:
  std::optional<nlohmann::json> Get(const std::string& key) override;
  void Put(const std::string& key, const nlohmann::json& value) override;
  void Erase(const std::string& key) override;

 private:
  std::mutex mu_;
  std::unordered_map<std::string, nlohmann::json> map_;
};

// Single JSON document on disk, rewritten through a temp file and rename on
// every change.
class FileKeyValueStore : public IKeyValueStore {
 public:
  explicit FileKeyValueStore(std::string path);

  std::optional<nlohmann::json> Get(const std::string& key) override;
  void Put(const std::string& key, const nlohmann::json& value) override;
  void Erase(const std::string& key) override;

 private:
  void LoadAll();
  void PersistAll();

  std::string path_;
  std::mutex mu_;
  std::unordered_map<std::string, nlohmann::json> map_;
};

}  // namespace llmbridge
