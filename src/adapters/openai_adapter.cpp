#include "adapters/openai_adapter.hpp"

#include <nlohmann/json.hpp>

#include <cctype>
#include <string>
#include <utility>

namespace llmbridge {
namespace {

static bool StartsWith(const std::string& s, const std::string& prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

static std::string Trim(const std::string& s) {
  size_t start = 0;
  while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) start++;
  size_t end = s.size();
  while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) end--;
  return s.substr(start, end - start);
}

static std::string NonEmptyString(const nlohmann::json& obj, const char* key) {
  if (!obj.is_object() || !obj.contains(key) || !obj[key].is_string()) return {};
  return obj[key].get<std::string>();
}

// choices[0].delta.content, then content, then message.content.
static std::string ExtractDeltaText(const nlohmann::json& j) {
  if (j.contains("choices") && j["choices"].is_array() && !j["choices"].empty()) {
    const auto& c0 = j["choices"][0];
    if (c0.is_object() && c0.contains("delta")) {
      auto text = NonEmptyString(c0["delta"], "content");
      if (!text.empty()) return text;
    }
  }
  auto text = NonEmptyString(j, "content");
  if (!text.empty()) return text;
  if (j.contains("message")) return NonEmptyString(j["message"], "content");
  return {};
}

static std::optional<std::string> StreamErrorMessage(const nlohmann::json& j) {
  if (!j.contains("error") || j["error"].is_null()) return std::nullopt;
  const auto& e = j["error"];
  if (e.is_object() && e.contains("message") && e["message"].is_string()) return e["message"].get<std::string>();
  if (e.is_string()) return e.get<std::string>();
  return e.dump();
}

static nlohmann::json MessageJson(const ChatMessage& m) {
  nlohmann::json jm;
  jm["role"] = m.role;
  if (m.parts.empty()) {
    jm["content"] = m.content;
    return jm;
  }
  nlohmann::json parts = nlohmann::json::array();
  for (const auto& p : m.parts) {
    if (p.type == ContentPart::Type::kText) {
      parts.push_back({{"type", "text"}, {"text", p.text}});
    } else {
      parts.push_back({{"type", "image_url"}, {"image_url", {{"url", p.image_url}}}});
    }
  }
  jm["content"] = std::move(parts);
  return jm;
}

}  // namespace

BackendKind OpenAiAdapter::Kind() const {
  return BackendKind::kOpenAi;
}

HttpRequest OpenAiAdapter::ListModelsRequest() const {
  HttpRequest req;
  req.method = "GET";
  req.path = "/v1/models";
  return req;
}

std::optional<std::vector<ModelDescriptor>> OpenAiAdapter::DecodeModels(const std::string& body, std::string* err) const {
  auto j = nlohmann::json::parse(body, nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    if (err) *err = "invalid json from /v1/models";
    return std::nullopt;
  }
  std::vector<ModelDescriptor> out;
  if (!j.contains("data") || !j["data"].is_array()) return out;
  for (const auto& it : j["data"]) {
    if (!it.is_object()) continue;
    ModelDescriptor m;
    if (it.contains("id") && it["id"].is_string()) m.id = it["id"].get<std::string>();
    if (!m.id.empty()) out.push_back(std::move(m));
  }
  return out;
}

HttpRequest OpenAiAdapter::ChatRequest(const std::string& model,
                                       const std::vector<ChatMessage>& messages,
                                       bool stream) const {
  nlohmann::json j;
  if (!model.empty()) j["model"] = model;
  j["stream"] = stream;
  j["messages"] = nlohmann::json::array();
  for (const auto& m : messages) {
    j["messages"].push_back(MessageJson(m));
  }
  HttpRequest req;
  req.method = "POST";
  req.path = "/v1/chat/completions";
  req.body = j.dump();
  return req;
}

std::optional<std::string> OpenAiAdapter::DecodeChat(const std::string& body, std::string* err) const {
  auto jr = nlohmann::json::parse(body, nullptr, false);
  if (jr.is_discarded() || !jr.is_object()) {
    if (err) *err = "invalid json from /v1/chat/completions";
    return std::nullopt;
  }
  if (!jr.contains("choices") || !jr["choices"].is_array() || jr["choices"].empty() || !jr["choices"][0].is_object()) {
    return std::string();
  }
  const auto& c0 = jr["choices"][0];
  if (!c0.contains("message") || !c0["message"].is_object()) return std::string();
  return NonEmptyString(c0["message"], "content");
}

StreamEvent OpenAiAdapter::DecodeStreamLine(const std::string& raw) const {
  StreamEvent ev;
  const std::string line = Trim(raw);
  if (line.empty() || line[0] == ':') return ev;

  std::string payload;
  if (StartsWith(line, "data:")) {
    payload = Trim(line.substr(5));
    if (payload == "[DONE]") {
      ev.done = true;
      return ev;
    }
    if (payload.empty()) return ev;
  } else if (StartsWith(line, "event:") || StartsWith(line, "id:") || StartsWith(line, "retry:")) {
    return ev;
  } else {
    payload = line;
  }

  auto j = nlohmann::json::parse(payload, nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    ev.malformed = true;
    return ev;
  }
  ev.delta = ExtractDeltaText(j);
  if (ev.delta.empty()) ev.error = StreamErrorMessage(j);
  return ev;
}

}  // namespace llmbridge
