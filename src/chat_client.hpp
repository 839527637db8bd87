#pragma once

#include "adapters/backend_adapter.hpp"
#include "config.hpp"
#include "key_value_store.hpp"
#include "model_cache.hpp"
#include "request_controller.hpp"
#include "transport/transport.hpp"
#include "types.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace llmbridge {

// Single entry point for chat, model listing, tokenization, context size, text
// extraction and image generation against any supported backend dialect.
//
// Operations that can fail return std::nullopt and describe the failure in
// `err`. Tokenize and GetContextSize never fail; they fall back to local
// estimates flagged with is_estimation.
class ChatClient {
 public:
  using DeltaCallback = std::function<void(const std::string& delta)>;

  static constexpr int64_t kDefaultContextSize = 4096;
  static constexpr const char* kExtractTextDisabled =
      "Text extraction is disabled: enable extended endpoints to use it.";

  // Without a transport, an httplib-backed one is created. Without a store the
  // model list is cached in memory only.
  explicit ChatClient(BackendConfig config,
                      std::shared_ptr<IKeyValueStore> store = nullptr,
                      std::shared_ptr<ITransport> transport = nullptr);

  // Swaps in a new configuration for subsequent calls. The cached model list
  // is dropped when the base URL or backend kind changes.
  void UpdateConfig(BackendConfig config);
  BackendConfig config() const;
  std::string ModelName() const;

  ConnectionReport TestConnection();

  std::optional<std::vector<ModelDescriptor>> GetModels(bool force_refresh, ClientError* err);

  TokenizeResult Tokenize(const std::string& text, const std::optional<std::string>& model = std::nullopt);
  ContextSizeResult GetContextSize(const std::optional<std::string>& model = std::nullopt);

  std::optional<std::string> ExtractText(const std::string& file_base64, const std::string& filename, ClientError* err);

  std::optional<ImageGenerationResponse> GenerateImages(const ImageGenerationRequest& req,
                                                        const CancellationToken* cancel,
                                                        ClientError* err);
  // Base64 payload of the first generated image.
  std::optional<std::string> GenerateImage(const std::string& prompt, const CancellationToken* cancel, ClientError* err);

  // Streams when `on_delta` is set; every delta is passed to it as it arrives.
  // Returns the full text only after the backend signalled completion.
  std::optional<std::string> SendChat(const std::vector<ChatMessage>& messages,
                                      const DeltaCallback& on_delta,
                                      const CancellationToken* cancel,
                                      const std::optional<std::string>& model_override,
                                      ClientError* err);

  // ceil(code points / 4).
  static int64_t EstimateTokenCount(const std::string& text);

 private:
  struct Snapshot {
    BackendConfig config;
    std::shared_ptr<const IBackendAdapter> adapter;
    std::optional<HttpEndpoint> endpoint;
    std::string endpoint_error;
  };

  static std::shared_ptr<const Snapshot> MakeSnapshot(BackendConfig config);
  std::shared_ptr<const Snapshot> Current() const;
  // Snapshot plus the model cache generation it was current at.
  std::pair<std::shared_ptr<const Snapshot>, uint64_t> CurrentWithGeneration() const;

  std::optional<HttpResponse> Send(const Snapshot& s,
                                   HttpRequest req,
                                   const ChunkHandler& on_chunk,
                                   RequestController* controller,
                                   ClientError* err);
  std::optional<std::vector<ModelDescriptor>> FetchModels(const Snapshot& s, ClientError* err);
  std::string ResolveModel(const Snapshot& s, const std::optional<std::string>& model) const;

  mutable std::mutex mu_;
  std::shared_ptr<const Snapshot> snapshot_;
  std::shared_ptr<ITransport> transport_;
  ModelCache cache_;
};

}  // namespace llmbridge
