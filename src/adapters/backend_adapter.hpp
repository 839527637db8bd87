#pragma once

#include "config.hpp"
#include "transport/transport.hpp"
#include "types.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace llmbridge {

// What one complete line of a streamed chat body means.
struct StreamEvent {
  std::string delta;
  bool done = false;
  bool malformed = false;
  std::optional<std::string> error;
};

// One wire dialect. Adapters fill method, path and body; the client adds the
// base URL and headers.
class IBackendAdapter {
 public:
  virtual ~IBackendAdapter() = default;

  virtual BackendKind Kind() const = 0;

  virtual HttpRequest ListModelsRequest() const = 0;
  virtual std::optional<std::vector<ModelDescriptor>> DecodeModels(const std::string& body, std::string* err) const = 0;

  // `messages` must already be filtered by PromptMessages().
  virtual HttpRequest ChatRequest(const std::string& model,
                                  const std::vector<ChatMessage>& messages,
                                  bool stream) const = 0;
  virtual std::optional<std::string> DecodeChat(const std::string& body, std::string* err) const = 0;
  virtual StreamEvent DecodeStreamLine(const std::string& line) const = 0;
};

std::unique_ptr<IBackendAdapter> MakeBackendAdapter(BackendKind kind);

// Drops skip_in_prompt messages, keeping the rest in order.
std::vector<ChatMessage> PromptMessages(const std::vector<ChatMessage>& messages);

// Extended endpoints and image generation share one shape across dialects.
HttpRequest TokenizeRequest(const std::string& text, const std::string& model);
HttpRequest ContextSizeRequest(const std::string& model);
HttpRequest ExtractTextRequest(const std::string& file_base64, const std::string& filename);
HttpRequest ImageGenerationHttpRequest(const ImageGenerationRequest& req);

std::optional<TokenizeResult> DecodeTokenize(const std::string& body, std::string* err);
std::optional<ContextSizeResult> DecodeContextSize(const std::string& body, std::string* err);
std::optional<std::string> DecodeExtractText(const std::string& body, std::string* err);
std::optional<ImageGenerationResponse> DecodeImageGeneration(const std::string& body, std::string* err);

// Most specific message in an error body: error.message, then error, then the
// raw body.
std::string ExtractErrorDetail(const std::string& body);

}  // namespace llmbridge
