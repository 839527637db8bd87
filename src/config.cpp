#include "config.hpp"

#include <cctype>
#include <cstdlib>
#include <string>

namespace llmbridge {
namespace {

static bool StartsWith(const std::string& s, const std::string& prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

static std::string GetEnvStr(const char* name) {
  const char* v = std::getenv(name);
  return v ? std::string(v) : std::string();
}

static std::string ToLower(std::string s) {
  for (auto& c : s) {
    if (c >= 'A' && c <= 'Z') c = static_cast<char>(c - 'A' + 'a');
  }
  return s;
}

static std::string Trim(std::string s) {
  size_t start = 0;
  while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) start++;
  size_t end = s.size();
  while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) end--;
  return s.substr(start, end - start);
}

static bool TryParseBool(const std::string& s, bool* out) {
  if (!out) return false;
  const std::string v = ToLower(s);
  if (v == "1" || v == "true" || v == "yes" || v == "y" || v == "on") {
    *out = true;
    return true;
  }
  if (v == "0" || v == "false" || v == "no" || v == "n" || v == "off") {
    *out = false;
    return true;
  }
  return false;
}

static bool IsDigits(const std::string& s) {
  if (s.empty()) return false;
  for (char c : s) {
    if (c < '0' || c > '9') return false;
  }
  return true;
}

}  // namespace

const char* BackendKindName(BackendKind kind) {
  switch (kind) {
    case BackendKind::kOpenAi:
      return "openai";
    case BackendKind::kOllama:
      return "ollama";
    case BackendKind::kLollms:
      return "lollms";
  }
  return "unknown";
}

std::optional<BackendKind> ParseBackendKind(const std::string& s) {
  const std::string v = ToLower(Trim(s));
  if (v == "openai") return BackendKind::kOpenAi;
  if (v == "ollama") return BackendKind::kOllama;
  if (v == "lollms" || v == "lollms-extended") return BackendKind::kLollms;
  return std::nullopt;
}

std::string HttpEndpoint::BaseUrl() const {
  std::string out = scheme + "://" + host;
  if (port > 0) out += ":" + std::to_string(port);
  return out;
}

std::optional<HttpEndpoint> ParseHttpEndpoint(const std::string& url, std::string* err) {
  HttpEndpoint ep;
  std::string s = Trim(url);
  const std::string lower = ToLower(s);
  if (StartsWith(lower, "http://")) {
    ep.scheme = "http";
    s = s.substr(7);
  } else if (StartsWith(lower, "https://")) {
    ep.scheme = "https";
    s = s.substr(8);
  } else {
    if (err) *err = "Invalid API URL: missing http:// or https:// scheme";
    return std::nullopt;
  }

  auto cut = s.find_first_of("/?#");
  if (cut != std::string::npos) s = s.substr(0, cut);

  auto at = s.rfind('@');
  if (at != std::string::npos) s = s.substr(at + 1);

  auto colon_pos = s.rfind(':');
  auto bracket_pos = s.rfind(']');
  if (colon_pos != std::string::npos && (bracket_pos == std::string::npos || colon_pos > bracket_pos)) {
    auto port = s.substr(colon_pos + 1);
    if (!IsDigits(port) || port.size() > 5 || std::atoi(port.c_str()) > 65535) {
      if (err) *err = "Invalid API URL: bad port '" + port + "'";
      return std::nullopt;
    }
    ep.port = std::atoi(port.c_str());
    ep.host = s.substr(0, colon_pos);
  } else {
    ep.host = s;
  }
  if (ep.host.empty()) {
    if (err) *err = "Invalid API URL: missing host";
    return std::nullopt;
  }
  ep.host = ToLower(ep.host);
  return ep;
}

std::string EndpointIdentity(const BackendConfig& cfg) {
  std::string base;
  if (auto ep = ParseHttpEndpoint(cfg.api_url, nullptr)) {
    base = ep->BaseUrl();
  } else {
    base = Trim(cfg.api_url);
  }
  return std::string(BackendKindName(cfg.backend)) + "|" + base;
}

std::string StripQuotes(std::string s) {
  if (!s.empty() && (s.front() == '"' || s.front() == '\'')) s.erase(s.begin());
  if (!s.empty() && (s.back() == '"' || s.back() == '\'')) s.pop_back();
  return s;
}

CliConfig LoadConfigFromEnv() {
  CliConfig cfg;
  auto& b = cfg.backend;

  if (auto url = GetEnvStr("LLMBRIDGE_API_URL"); !url.empty()) b.api_url = url;
  if (auto key = GetEnvStr("LLMBRIDGE_API_KEY"); !key.empty()) b.api_key = key;
  if (auto kind = GetEnvStr("LLMBRIDGE_BACKEND"); !kind.empty()) {
    if (auto parsed = ParseBackendKind(kind)) b.backend = *parsed;
  }
  if (auto model = GetEnvStr("LLMBRIDGE_MODEL"); !model.empty()) b.model_name = model;
  if (auto v = GetEnvStr("LLMBRIDGE_DISABLE_SSL_VERIFICATION"); !v.empty()) {
    bool flag = false;
    if (TryParseBool(v, &flag)) b.disable_ssl_verification = flag;
  }
  if (auto ca = GetEnvStr("LLMBRIDGE_SSL_CERT_PATH"); !ca.empty()) b.ssl_cert_path = ca;
  if (auto v = GetEnvStr("LLMBRIDGE_USE_EXTENDED_ENDPOINTS"); !v.empty()) {
    bool flag = false;
    if (TryParseBool(v, &flag)) b.use_extended_endpoints = flag;
  }
  if (auto v = GetEnvStr("LLMBRIDGE_REQUEST_TIMEOUT_MS"); !v.empty()) {
    char* end = nullptr;
    long long ms = std::strtoll(v.c_str(), &end, 10);
    if (end != v.c_str() && ms > 0) b.request_timeout_ms = ms;
  }

  if (auto p = GetEnvStr("LLMBRIDGE_CACHE_PATH"); !p.empty()) {
    cfg.cache_path = p;
  } else {
    auto home = GetEnvStr("HOME");
    cfg.cache_path = (home.empty() ? std::string(".") : home + "/.cache") + "/llmbridge/state.json";
  }
  return cfg;
}

}  // namespace llmbridge
