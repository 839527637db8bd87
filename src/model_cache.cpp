#include "model_cache.hpp"

#include <iostream>
#include <string>
#include <utility>

namespace llmbridge {
namespace {

static nlohmann::json ToJson(const ModelCache::ModelList& list) {
  nlohmann::json arr = nlohmann::json::array();
  for (const auto& m : list) arr.push_back({{"id", m.id}});
  return arr;
}

}  // namespace

ModelCache::ModelCache(std::shared_ptr<IKeyValueStore> store) : store_(std::move(store)) {}

std::shared_ptr<const ModelCache::ModelList> ModelCache::Memory() const {
  std::lock_guard<std::mutex> lock(mu_);
  return memory_;
}

void ModelCache::SetMemory(std::shared_ptr<const ModelList> list) {
  std::lock_guard<std::mutex> lock(mu_);
  memory_ = std::move(list);
}

std::optional<ModelCache::ModelList> ModelCache::LoadPersisted() {
  if (!store_) return std::nullopt;
  auto j = store_->Get(kModelsCacheKey);
  if (!j || !j->is_array()) return std::nullopt;
  ModelList out;
  for (const auto& it : *j) {
    if (!it.is_object() || !it.contains("id") || !it["id"].is_string()) continue;
    ModelDescriptor m;
    m.id = it["id"].get<std::string>();
    if (!m.id.empty()) out.push_back(std::move(m));
  }
  return out;
}

std::optional<ModelCache::ModelList> ModelCache::PromotePersisted() {
  std::lock_guard<std::mutex> persist_lock(persist_mu_);
  auto persisted = LoadPersisted();
  if (!persisted || persisted->empty()) return std::nullopt;
  SetMemory(std::make_shared<const ModelList>(*persisted));
  return persisted;
}

uint64_t ModelCache::generation() const {
  std::lock_guard<std::mutex> lock(mu_);
  return generation_;
}

std::optional<ModelCache::ModelList> ModelCache::Get(bool force_refresh, const Fetcher& fetch, ClientError* err) {
  return Get(force_refresh, fetch, err, generation());
}

std::optional<ModelCache::ModelList> ModelCache::Get(bool force_refresh,
                                                     const Fetcher& fetch,
                                                     ClientError* err,
                                                     uint64_t generation) {
  if (!force_refresh) {
    if (auto mem = Memory(); mem && !mem->empty()) return *mem;
    if (auto persisted = PromotePersisted()) {
      std::cout << "[models] using persisted cache count=" << persisted->size() << "\n";
      return persisted;
    }
  }

  ClientError fetch_err;
  std::optional<ModelList> fresh;
  if (fetch) {
    fresh = fetch(&fetch_err);
  } else {
    SetError(&fetch_err, ErrorKind::kConfig, "no model source configured");
  }

  if (fresh) {
    auto list = std::make_shared<const ModelList>(*fresh);
    std::lock_guard<std::mutex> persist_lock(persist_mu_);
    {
      std::lock_guard<std::mutex> lock(mu_);
      // Invalidated mid-fetch: the list belongs to the old endpoint.
      if (generation != generation_) {
        std::cout << "[models] dropped list fetched before invalidation count=" << fresh->size() << "\n";
        return fresh;
      }
      memory_ = list;
    }
    if (store_) store_->Put(kModelsCacheKey, ToJson(*fresh));
    std::cout << "[models] refreshed count=" << fresh->size() << "\n";
    return fresh;
  }

  if (auto persisted = PromotePersisted()) {
    std::cout << "[models] warning: using stale persisted models after fetch error: " << fetch_err.message << "\n";
    return persisted;
  }
  if (auto mem = Memory(); mem && !mem->empty()) {
    std::cout << "[models] warning: using stale in-memory models after fetch error: " << fetch_err.message << "\n";
    return *mem;
  }
  if (err) *err = fetch_err;
  return std::nullopt;
}

void ModelCache::Invalidate() {
  std::lock_guard<std::mutex> persist_lock(persist_mu_);
  {
    std::lock_guard<std::mutex> lock(mu_);
    memory_.reset();
    generation_++;
  }
  if (store_) store_->Erase(kModelsCacheKey);
  std::cout << "[models] cache invalidated\n";
}

ModelCacheState ModelCache::state() {
  if (auto mem = Memory(); mem && !mem->empty()) return ModelCacheState::kMemory;
  if (auto persisted = LoadPersisted(); persisted && !persisted->empty()) return ModelCacheState::kPersistedOnly;
  return ModelCacheState::kEmpty;
}

}  // namespace llmbridge
