#include "key_value_store.hpp"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <utility>

namespace llmbridge {

std::optional<nlohmann::json> MemoryKeyValueStore::Get(const std::string& key) {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = map_.find(key);
  if (it == map_.end()) return std::nullopt;
  return it->second;
}

void MemoryKeyValueStore::Put(const std::string& key, const nlohmann::json& value) {
  std::lock_guard<std::mutex> lock(mu_);
  map_[key] = value;
}

void MemoryKeyValueStore::Erase(const std::string& key) {
  std::lock_guard<std::mutex> lock(mu_);
  map_.erase(key);
}

FileKeyValueStore::FileKeyValueStore(std::string path) : path_(std::move(path)) {
  LoadAll();
}

std::optional<nlohmann::json> FileKeyValueStore::Get(const std::string& key) {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = map_.find(key);
  if (it == map_.end()) return std::nullopt;
  return it->second;
}

void FileKeyValueStore::Put(const std::string& key, const nlohmann::json& value) {
  std::lock_guard<std::mutex> lock(mu_);
  map_[key] = value;
  PersistAll();
}

void FileKeyValueStore::Erase(const std::string& key) {
  std::lock_guard<std::mutex> lock(mu_);
  if (map_.erase(key) == 0) return;
  PersistAll();
}

void FileKeyValueStore::LoadAll() {
  std::filesystem::path p(path_);
  std::error_code ec;
  if (!std::filesystem::exists(p, ec)) return;
  std::ifstream in(p, std::ios::binary);
  if (!in) return;
  std::string body((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  auto j = nlohmann::json::parse(body, nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    std::cout << "[store] ignoring unreadable state file path=" << path_ << "\n";
    return;
  }
  for (auto it = j.begin(); it != j.end(); ++it) {
    map_.emplace(it.key(), it.value());
  }
}

void FileKeyValueStore::PersistAll() {
  nlohmann::json out = nlohmann::json::object();
  for (const auto& kv : map_) out[kv.first] = kv.second;

  std::filesystem::path path(path_);
  std::error_code ec;
  auto dir = path.parent_path();
  if (!dir.empty()) std::filesystem::create_directories(dir, ec);
  auto tmp = path;
  tmp += ".tmp";
  {
    std::ofstream f(tmp, std::ios::binary | std::ios::trunc);
    if (!f) {
      std::cout << "[store] failed to write path=" << tmp.string() << "\n";
      return;
    }
    f << out.dump();
  }
  std::filesystem::rename(tmp, path, ec);
  if (ec) {
    std::cout << "[store] failed to replace path=" << path_ << " error=" << ec.message() << "\n";
    std::filesystem::remove(tmp, ec);
  }
}

}  // namespace llmbridge
