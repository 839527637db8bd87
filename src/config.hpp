#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace llmbridge {

enum class BackendKind {
  kOpenAi,
  kOllama,
  kLollms,
};

const char* BackendKindName(BackendKind kind);
std::optional<BackendKind> ParseBackendKind(const std::string& s);

struct BackendConfig {
  std::string api_url = "http://localhost:9600";
  std::string api_key;
  BackendKind backend = BackendKind::kLollms;
  std::string model_name;
  bool disable_ssl_verification = false;
  std::optional<std::string> ssl_cert_path;
  bool use_extended_endpoints = false;
  int64_t request_timeout_ms = 600000;
};

// Parsed form of BackendConfig::api_url. Only scheme, host and port take part
// in request URLs; any path in the configured URL is dropped.
struct HttpEndpoint {
  std::string scheme = "http";
  std::string host;
  int port = 0;

  std::string BaseUrl() const;
};

std::optional<HttpEndpoint> ParseHttpEndpoint(const std::string& url, std::string* err);

// Two configs address the same server when these strings match. The API key is
// not part of the identity.
std::string EndpointIdentity(const BackendConfig& cfg);

std::string StripQuotes(std::string s);

struct CliConfig {
  BackendConfig backend;
  std::string cache_path;
};

CliConfig LoadConfigFromEnv();

}  // namespace llmbridge
