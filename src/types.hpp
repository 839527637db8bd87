#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace llmbridge {

struct ContentPart {
  enum class Type {
    kText,
    kImageUrl,
  };
  Type type = Type::kText;
  std::string text;
  std::string image_url;

  static ContentPart Text(std::string t) {
    ContentPart p;
    p.type = Type::kText;
    p.text = std::move(t);
    return p;
  }

  static ContentPart ImageUrl(std::string url) {
    ContentPart p;
    p.type = Type::kImageUrl;
    p.image_url = std::move(url);
    return p;
  }
};

// One turn of caller-side history. Only role and content (or parts) go on the
// wire; id, start_time, model and skip_in_prompt are bookkeeping.
struct ChatMessage {
  std::string role;
  std::string content;
  std::vector<ContentPart> parts;

  std::optional<std::string> id;
  std::optional<int64_t> start_time;
  std::optional<std::string> model;
  bool skip_in_prompt = false;
};

struct ModelDescriptor {
  std::string id;

  bool operator==(const ModelDescriptor& other) const { return id == other.id; }
  bool operator!=(const ModelDescriptor& other) const { return !(*this == other); }
};

struct TokenizeResult {
  int64_t token_count = 0;
  std::vector<int64_t> token_ids;
  bool is_estimation = false;
};

struct ContextSizeResult {
  int64_t context_size = 0;
  bool is_estimation = false;
};

struct ImageGenerationRequest {
  std::string prompt;
  int n = 1;
  std::string response_format = "b64_json";
  std::optional<std::string> model;
  std::optional<std::string> size;
  std::optional<std::string> quality;
  std::optional<std::string> style;
};

struct ImageObject {
  std::optional<std::string> b64_json;
  std::optional<std::string> url;
  std::optional<std::string> revised_prompt;
};

struct ImageGenerationResponse {
  int64_t created = 0;
  std::vector<ImageObject> data;
};

struct ConnectionReport {
  bool success = false;
  std::string message;
  std::string details;
};

enum class ErrorKind {
  kConfig,
  kNetwork,
  kHttp,
  kUserAborted,
  kTimeout,
  kProtocol,
};

inline const char* ErrorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kConfig:
      return "config";
    case ErrorKind::kNetwork:
      return "network";
    case ErrorKind::kHttp:
      return "http";
    case ErrorKind::kUserAborted:
      return "aborted";
    case ErrorKind::kTimeout:
      return "timeout";
    case ErrorKind::kProtocol:
      return "protocol";
  }
  return "unknown";
}

struct ClientError {
  ErrorKind kind = ErrorKind::kNetwork;
  int status = 0;
  std::string message;
};

inline void SetError(ClientError* err, ErrorKind kind, std::string message, int status = 0) {
  if (!err) return;
  err->kind = kind;
  err->status = status;
  err->message = std::move(message);
}

}  // namespace llmbridge
