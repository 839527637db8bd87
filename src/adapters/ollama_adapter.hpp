#pragma once

#include "adapters/backend_adapter.hpp"

namespace llmbridge {

// Native Ollama dialect: /api/tags, /api/chat and newline-delimited JSON.
class OllamaAdapter : public IBackendAdapter {
 public:
  BackendKind Kind() const override;

  HttpRequest ListModelsRequest() const override;
  std::optional<std::vector<ModelDescriptor>> DecodeModels(const std::string& body, std::string* err) const override;

  HttpRequest ChatRequest(const std::string& model,
                          const std::vector<ChatMessage>& messages,
                          bool stream) const override;
  std::optional<std::string> DecodeChat(const std::string& body, std::string* err) const override;
  StreamEvent DecodeStreamLine(const std::string& line) const override;
};

}  // namespace llmbridge
