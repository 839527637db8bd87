#pragma once

#include "key_value_store.hpp"
#include "types.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace llmbridge {

inline constexpr const char* kModelsCacheKey = "lollms_models_cache";

enum class ModelCacheState {
  kEmpty,
  kMemory,
  kPersistedOnly,
};

// Last good model list, held in memory and mirrored to an optional persistent
// store. The list is replaced as a whole; readers never see a partial update.
class ModelCache {
 public:
  using ModelList = std::vector<ModelDescriptor>;
  using Fetcher = std::function<std::optional<ModelList>(ClientError* err)>;

  explicit ModelCache(std::shared_ptr<IKeyValueStore> store);

  // Memory copy, then persisted copy, then `fetch`. A failed fetch falls back
  // to the persisted copy, however old; without one the fetch error is returned.
  std::optional<ModelList> Get(bool force_refresh, const Fetcher& fetch, ClientError* err);
  // As above, but a fetched list is cached only if no Invalidate happened
  // since `generation` was read. Callers that capture endpoint state before
  // calling Get pass the generation read together with that state.
  std::optional<ModelList> Get(bool force_refresh, const Fetcher& fetch, ClientError* err, uint64_t generation);

  // Drops both copies. Waits for an in-progress store write to finish first.
  void Invalidate();
  uint64_t generation() const;
  ModelCacheState state();

 private:
  std::shared_ptr<const ModelList> Memory() const;
  void SetMemory(std::shared_ptr<const ModelList> list);
  std::optional<ModelList> LoadPersisted();
  // Non-empty persisted copy, also installed as the memory copy.
  std::optional<ModelList> PromotePersisted();

  // Held across the generation check and the store write, and across
  // Invalidate's Erase, so an old list cannot be written back after an Erase.
  // Taken before mu_.
  std::mutex persist_mu_;
  mutable std::mutex mu_;
  std::shared_ptr<const ModelList> memory_;
  uint64_t generation_ = 0;
  std::shared_ptr<IKeyValueStore> store_;
};

}  // namespace llmbridge
