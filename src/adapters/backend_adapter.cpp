#include "adapters/backend_adapter.hpp"

#include "adapters/lollms_adapter.hpp"
#include "adapters/ollama_adapter.hpp"
#include "adapters/openai_adapter.hpp"

#include <nlohmann/json.hpp>

#include <cctype>
#include <string>
#include <utility>

namespace llmbridge {
namespace {

static HttpRequest JsonPost(std::string path, const nlohmann::json& body) {
  HttpRequest req;
  req.method = "POST";
  req.path = std::move(path);
  req.body = body.dump();
  return req;
}

static std::string Trim(const std::string& s) {
  size_t start = 0;
  while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) start++;
  size_t end = s.size();
  while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) end--;
  return s.substr(start, end - start);
}

}  // namespace

std::unique_ptr<IBackendAdapter> MakeBackendAdapter(BackendKind kind) {
  switch (kind) {
    case BackendKind::kOpenAi:
      return std::make_unique<OpenAiAdapter>();
    case BackendKind::kOllama:
      return std::make_unique<OllamaAdapter>();
    case BackendKind::kLollms:
      return std::make_unique<LollmsAdapter>();
  }
  return std::make_unique<OpenAiAdapter>();
}

std::vector<ChatMessage> PromptMessages(const std::vector<ChatMessage>& messages) {
  std::vector<ChatMessage> out;
  out.reserve(messages.size());
  for (const auto& m : messages) {
    if (m.skip_in_prompt) continue;
    out.push_back(m);
  }
  return out;
}

HttpRequest TokenizeRequest(const std::string& text, const std::string& model) {
  nlohmann::json j;
  j["text"] = text;
  if (!model.empty()) j["model"] = model;
  return JsonPost("/lollms/v1/tokenize", j);
}

HttpRequest ContextSizeRequest(const std::string& model) {
  nlohmann::json j = nlohmann::json::object();
  if (!model.empty()) j["model"] = model;
  return JsonPost("/lollms/v1/context_size", j);
}

HttpRequest ExtractTextRequest(const std::string& file_base64, const std::string& filename) {
  nlohmann::json j;
  j["file"] = file_base64;
  j["filename"] = filename;
  return JsonPost("/v1/extract_text", j);
}

HttpRequest ImageGenerationHttpRequest(const ImageGenerationRequest& req) {
  nlohmann::json j;
  j["prompt"] = req.prompt;
  j["n"] = req.n;
  j["response_format"] = req.response_format;
  if (req.model.has_value()) j["model"] = *req.model;
  if (req.size.has_value()) j["size"] = *req.size;
  if (req.quality.has_value()) j["quality"] = *req.quality;
  if (req.style.has_value()) j["style"] = *req.style;
  return JsonPost("/v1/images/generations", j);
}

std::optional<TokenizeResult> DecodeTokenize(const std::string& body, std::string* err) {
  auto j = nlohmann::json::parse(body, nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    if (err) *err = "invalid json from /lollms/v1/tokenize";
    return std::nullopt;
  }
  TokenizeResult out;
  bool have_count = false;
  if (j.contains("tokens") && j["tokens"].is_array()) {
    for (const auto& t : j["tokens"]) {
      if (t.is_number_integer()) out.token_ids.push_back(t.get<int64_t>());
    }
    out.token_count = static_cast<int64_t>(out.token_ids.size());
    have_count = true;
  }
  if (j.contains("count") && j["count"].is_number_integer()) {
    out.token_count = j["count"].get<int64_t>();
    have_count = true;
  }
  if (!have_count || out.token_count < 0) {
    if (err) *err = "missing token count in /lollms/v1/tokenize response";
    return std::nullopt;
  }
  out.is_estimation = false;
  return out;
}

std::optional<ContextSizeResult> DecodeContextSize(const std::string& body, std::string* err) {
  auto j = nlohmann::json::parse(body, nullptr, false);
  if (j.is_discarded() || !j.is_object() || !j.contains("context_size") || !j["context_size"].is_number_integer()) {
    if (err) *err = "invalid json from /lollms/v1/context_size";
    return std::nullopt;
  }
  ContextSizeResult out;
  out.context_size = j["context_size"].get<int64_t>();
  if (out.context_size <= 0) {
    if (err) *err = "non-positive context_size from /lollms/v1/context_size";
    return std::nullopt;
  }
  out.is_estimation = false;
  return out;
}

std::optional<std::string> DecodeExtractText(const std::string& body, std::string* err) {
  auto j = nlohmann::json::parse(body, nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    if (err) *err = "invalid json from /v1/extract_text";
    return std::nullopt;
  }
  if (j.contains("text") && j["text"].is_string()) return j["text"].get<std::string>();
  return std::string();
}

std::optional<ImageGenerationResponse> DecodeImageGeneration(const std::string& body, std::string* err) {
  auto j = nlohmann::json::parse(body, nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    if (err) *err = "invalid json from /v1/images/generations";
    return std::nullopt;
  }
  ImageGenerationResponse out;
  if (j.contains("created") && j["created"].is_number_integer()) out.created = j["created"].get<int64_t>();
  if (!j.contains("data") || !j["data"].is_array()) return out;
  for (const auto& it : j["data"]) {
    if (!it.is_object()) continue;
    ImageObject img;
    if (it.contains("b64_json") && it["b64_json"].is_string()) img.b64_json = it["b64_json"].get<std::string>();
    if (it.contains("url") && it["url"].is_string()) img.url = it["url"].get<std::string>();
    if (it.contains("revised_prompt") && it["revised_prompt"].is_string()) {
      img.revised_prompt = it["revised_prompt"].get<std::string>();
    }
    out.data.push_back(std::move(img));
  }
  return out;
}

std::string ExtractErrorDetail(const std::string& body) {
  auto j = nlohmann::json::parse(body, nullptr, false);
  if (!j.is_discarded() && j.is_object() && j.contains("error") && !j["error"].is_null()) {
    const auto& e = j["error"];
    if (e.is_object() && e.contains("message") && e["message"].is_string()) {
      auto msg = e["message"].get<std::string>();
      if (!msg.empty()) return msg;
    }
    if (e.is_string()) {
      auto msg = e.get<std::string>();
      if (!msg.empty()) return msg;
    } else {
      return e.dump();
    }
  }
  return Trim(body);
}

}  // namespace llmbridge
