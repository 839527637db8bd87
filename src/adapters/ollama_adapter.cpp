#include "adapters/ollama_adapter.hpp"

#include <nlohmann/json.hpp>

#include <cctype>
#include <iostream>
#include <string>
#include <utility>

namespace llmbridge {
namespace {

static std::string Trim(const std::string& s) {
  size_t start = 0;
  while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) start++;
  size_t end = s.size();
  while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) end--;
  return s.substr(start, end - start);
}

// Ollama takes plain text plus a list of raw base64 images.
static nlohmann::json MessageJson(const ChatMessage& m) {
  nlohmann::json jm;
  jm["role"] = m.role;
  if (m.parts.empty()) {
    jm["content"] = m.content;
    return jm;
  }
  std::string text;
  nlohmann::json images = nlohmann::json::array();
  for (const auto& p : m.parts) {
    if (p.type == ContentPart::Type::kText) {
      if (!text.empty()) text += "\n";
      text += p.text;
      continue;
    }
    const std::string marker = ";base64,";
    auto pos = p.image_url.find(marker);
    if (p.image_url.rfind("data:", 0) == 0 && pos != std::string::npos) {
      images.push_back(p.image_url.substr(pos + marker.size()));
    } else {
      std::cout << "[ollama] dropping non-inline image part url=" << p.image_url << "\n";
    }
  }
  jm["content"] = text;
  if (!images.empty()) jm["images"] = std::move(images);
  return jm;
}

}  // namespace

BackendKind OllamaAdapter::Kind() const {
  return BackendKind::kOllama;
}

HttpRequest OllamaAdapter::ListModelsRequest() const {
  HttpRequest req;
  req.method = "GET";
  req.path = "/api/tags";
  return req;
}

std::optional<std::vector<ModelDescriptor>> OllamaAdapter::DecodeModels(const std::string& body, std::string* err) const {
  auto j = nlohmann::json::parse(body, nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    if (err) *err = "invalid json from /api/tags";
    return std::nullopt;
  }
  std::vector<ModelDescriptor> out;
  if (!j.contains("models") || !j["models"].is_array()) return out;
  for (const auto& m : j["models"]) {
    if (!m.is_object()) continue;
    ModelDescriptor info;
    if (m.contains("name") && m["name"].is_string()) info.id = m["name"].get<std::string>();
    if (info.id.empty() && m.contains("model") && m["model"].is_string()) info.id = m["model"].get<std::string>();
    if (!info.id.empty()) out.push_back(std::move(info));
  }
  return out;
}

HttpRequest OllamaAdapter::ChatRequest(const std::string& model,
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
  req.path = "/api/chat";
  req.body = j.dump();
  return req;
}

std::optional<std::string> OllamaAdapter::DecodeChat(const std::string& body, std::string* err) const {
  auto jr = nlohmann::json::parse(body, nullptr, false);
  if (jr.is_discarded() || !jr.is_object()) {
    if (err) *err = "invalid json from /api/chat";
    return std::nullopt;
  }
  if (jr.contains("message") && jr["message"].is_object() && jr["message"].contains("content") &&
      jr["message"]["content"].is_string()) {
    return jr["message"]["content"].get<std::string>();
  }
  return std::string();
}

StreamEvent OllamaAdapter::DecodeStreamLine(const std::string& raw) const {
  StreamEvent ev;
  const std::string line = Trim(raw);
  if (line.empty()) return ev;

  auto j = nlohmann::json::parse(line, nullptr, false);
  if (j.is_discarded() || !j.is_object()) {
    ev.malformed = true;
    return ev;
  }
  if (j.contains("message") && j["message"].is_object() && j["message"].contains("content") &&
      j["message"]["content"].is_string()) {
    ev.delta = j["message"]["content"].get<std::string>();
  }
  if (j.contains("done") && j["done"].is_boolean()) ev.done = j["done"].get<bool>();
  if (ev.delta.empty() && !ev.done && j.contains("error")) {
    ev.error = j["error"].is_string() ? j["error"].get<std::string>() : j["error"].dump();
  }
  return ev;
}

}  // namespace llmbridge
