#pragma once

#include "adapters/backend_adapter.hpp"

namespace llmbridge {

// OpenAI-compatible dialect: /v1/models, /v1/chat/completions and SSE framing.
class OpenAiAdapter : public IBackendAdapter {
 public:
  BackendKind Kind() const override;

  HttpRequest ListModelsRequest() const override;
  std::optional<std::vector<ModelDescriptor>> DecodeModels(const std::string& body, std::string* err) const override;

  HttpRequest ChatRequest(const std::string& model,
                          const std::vector<ChatMessage>& messages,
                          bool stream) const override;
  std::optional<std::string> DecodeChat(const std::string& body, std::string* err) const override;

  // Accepts `data: <json>`, `data: [DONE]` and bare JSON objects. Comment and
  // non-data SSE fields are ignored.
  StreamEvent DecodeStreamLine(const std::string& line) const override;
};

}  // namespace llmbridge
