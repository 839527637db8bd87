#include "chat_client.hpp"

#include "stream_decoder.hpp"
#include "transport/http_transport.hpp"

#include <chrono>
#include <iostream>
#include <utility>

namespace llmbridge {
namespace {

static std::string HttpErrorMessage(const std::string& prefix, const HttpResponse& r) {
  std::string msg = prefix + ": " + std::to_string(r.status);
  if (!r.reason.empty()) msg += " " + r.reason;
  auto detail = ExtractErrorDetail(r.body);
  if (!detail.empty()) msg += " - " + detail;
  return msg;
}

static void SetAbortError(const RequestController& controller, ClientError* err) {
  if (controller.reason() == AbortReason::kTimeout) {
    SetError(err, ErrorKind::kTimeout, controller.TimeoutMessage());
  } else {
    SetError(err, ErrorKind::kUserAborted, "Request was aborted");
  }
}

static void LogFailure(const char* tag, const ClientError& err) {
  std::cout << "[" << tag << "] failed kind=" << ErrorKindName(err.kind);
  if (err.status != 0) std::cout << " status=" << err.status;
  std::cout << " error=" << err.message << "\n";
}

}  // namespace

ChatClient::ChatClient(BackendConfig config,
                       std::shared_ptr<IKeyValueStore> store,
                       std::shared_ptr<ITransport> transport)
    : snapshot_(MakeSnapshot(std::move(config))),
      transport_(std::move(transport)),
      cache_(store ? std::move(store) : std::make_shared<MemoryKeyValueStore>()) {
  auto policy = BuildTransportPolicy(snapshot_->config);
  if (transport_) {
    transport_->Configure(policy);
  } else {
    transport_ = std::make_shared<HttpTransport>(std::move(policy));
  }
}

std::shared_ptr<const ChatClient::Snapshot> ChatClient::MakeSnapshot(BackendConfig config) {
  auto s = std::make_shared<Snapshot>();
  std::string err;
  s->endpoint = ParseHttpEndpoint(config.api_url, &err);
  if (!s->endpoint) {
    s->endpoint_error = err;
    std::cout << "[config] " << err << "\n";
  }
  s->adapter = MakeBackendAdapter(config.backend);
  s->config = std::move(config);
  return s;
}

std::shared_ptr<const ChatClient::Snapshot> ChatClient::Current() const {
  std::lock_guard<std::mutex> lock(mu_);
  return snapshot_;
}

std::pair<std::shared_ptr<const ChatClient::Snapshot>, uint64_t> ChatClient::CurrentWithGeneration() const {
  std::lock_guard<std::mutex> lock(mu_);
  return {snapshot_, cache_.generation()};
}

void ChatClient::UpdateConfig(BackendConfig config) {
  auto next = MakeSnapshot(std::move(config));
  {
    // The invalidation lands together with the swap, so no reader sees the new
    // snapshot with the old cache generation.
    std::lock_guard<std::mutex> lock(mu_);
    const bool endpoint_changed = EndpointIdentity(snapshot_->config) != EndpointIdentity(next->config);
    snapshot_ = next;
    if (endpoint_changed) cache_.Invalidate();
  }
  transport_->Configure(BuildTransportPolicy(next->config));
  std::cout << "[config] updated backend=" << BackendKindName(next->config.backend)
            << " url=" << next->config.api_url << " extended=" << (next->config.use_extended_endpoints ? "true" : "false")
            << "\n";
}

BackendConfig ChatClient::config() const {
  return Current()->config;
}

std::string ChatClient::ModelName() const {
  return Current()->config.model_name;
}

std::string ChatClient::ResolveModel(const Snapshot& s, const std::optional<std::string>& model) const {
  if (model.has_value() && !model->empty()) return *model;
  return s.config.model_name;
}

std::optional<HttpResponse> ChatClient::Send(const Snapshot& s,
                                             HttpRequest req,
                                             const ChunkHandler& on_chunk,
                                             RequestController* controller,
                                             ClientError* err) {
  if (!s.endpoint) {
    SetError(err, ErrorKind::kConfig, s.endpoint_error);
    return std::nullopt;
  }
  req.base_url = s.endpoint->BaseUrl();
  req.headers.emplace_back("Authorization", "Bearer " + s.config.api_key);
  if (req.method == "POST") req.headers.emplace_back("Content-Type", "application/json");

  std::string terr;
  auto res = transport_->Execute(req, on_chunk, controller, &terr);
  if (res) return res;

  if (controller && controller->aborted()) {
    SetAbortError(*controller, err);
  } else {
    SetError(err, ErrorKind::kNetwork, terr.empty() ? "failed to reach " + req.Url() : terr);
  }
  return std::nullopt;
}

std::optional<std::vector<ModelDescriptor>> ChatClient::FetchModels(const Snapshot& s, ClientError* err) {
  auto res = Send(s, s.adapter->ListModelsRequest(), nullptr, nullptr, err);
  if (!res) return std::nullopt;
  if (!res->ok()) {
    SetError(err, ErrorKind::kHttp, HttpErrorMessage("Failed to fetch models", *res), res->status);
    return std::nullopt;
  }
  std::string derr;
  auto models = s.adapter->DecodeModels(res->body, &derr);
  if (!models) {
    SetError(err, ErrorKind::kProtocol, "Failed to fetch models: " + derr);
    return std::nullopt;
  }
  return models;
}

std::optional<std::vector<ModelDescriptor>> ChatClient::GetModels(bool force_refresh, ClientError* err) {
  const auto current = CurrentWithGeneration();
  const auto s = current.first;
  auto models = cache_.Get(
      force_refresh, [this, s](ClientError* e) { return FetchModels(*s, e); }, err, current.second);
  if (!models && err) LogFailure("models", *err);
  return models;
}

ConnectionReport ChatClient::TestConnection() {
  const auto current = CurrentWithGeneration();
  const auto s = current.first;
  ConnectionReport report;
  report.details = "URL: " + (s->endpoint ? s->endpoint->BaseUrl() : s->config.api_url) +
                   "\nSSL Verification: " + (s->config.disable_ssl_verification ? "Disabled" : "Enabled");

  // Goes through the cache so a good answer refreshes it, but a stale fallback
  // must not pass for a live server.
  bool reached = false;
  ClientError fetch_err;
  ClientError err;
  auto models = cache_.Get(
      true,
      [&](ClientError* e) {
        auto out = FetchModels(*s, e);
        reached = out.has_value();
        if (!out && e) fetch_err = *e;
        return out;
      },
      &err, current.second);

  if (models && reached) {
    report.success = true;
    report.message = "Connection successful! Found " + std::to_string(models->size()) + " models.";
  } else {
    const ClientError& cause = reached ? err : fetch_err;
    report.success = false;
    report.message = "Connection failed: " + cause.message;
    report.details += std::string("\nError kind: ") + ErrorKindName(cause.kind);
    if (cause.status != 0) report.details += "\nStatus: " + std::to_string(cause.status);
    if (models) report.details += "\nCached models available: " + std::to_string(models->size()) + " (stale)";
  }
  std::cout << "[connection] success=" << (report.success ? "true" : "false") << " " << report.message << "\n";
  return report;
}

int64_t ChatClient::EstimateTokenCount(const std::string& text) {
  int64_t code_points = 0;
  for (unsigned char c : text) {
    if ((c & 0xC0) != 0x80) code_points++;
  }
  return (code_points + 3) / 4;
}

TokenizeResult ChatClient::Tokenize(const std::string& text, const std::optional<std::string>& model) {
  TokenizeResult estimate;
  estimate.token_count = EstimateTokenCount(text);
  estimate.is_estimation = true;

  auto s = Current();
  if (!s->config.use_extended_endpoints) return estimate;

  ClientError err;
  auto res = Send(*s, TokenizeRequest(text, ResolveModel(*s, model)), nullptr, nullptr, &err);
  if (!res) {
    std::cout << "[tokenize] falling back to estimate: " << err.message << "\n";
    return estimate;
  }
  if (!res->ok()) {
    std::cout << "[tokenize] falling back to estimate: " << HttpErrorMessage("status", *res) << "\n";
    return estimate;
  }
  std::string derr;
  auto out = DecodeTokenize(res->body, &derr);
  if (!out) {
    std::cout << "[tokenize] falling back to estimate: " << derr << "\n";
    return estimate;
  }
  return *out;
}

ContextSizeResult ChatClient::GetContextSize(const std::optional<std::string>& model) {
  ContextSizeResult fallback;
  fallback.context_size = kDefaultContextSize;
  fallback.is_estimation = true;

  auto s = Current();
  if (!s->config.use_extended_endpoints) return fallback;

  ClientError err;
  auto res = Send(*s, ContextSizeRequest(ResolveModel(*s, model)), nullptr, nullptr, &err);
  if (!res) {
    std::cout << "[context] falling back to default: " << err.message << "\n";
    return fallback;
  }
  if (!res->ok()) {
    std::cout << "[context] falling back to default: " << HttpErrorMessage("status", *res) << "\n";
    return fallback;
  }
  std::string derr;
  auto out = DecodeContextSize(res->body, &derr);
  if (!out) {
    std::cout << "[context] falling back to default: " << derr << "\n";
    return fallback;
  }
  return *out;
}

std::optional<std::string> ChatClient::ExtractText(const std::string& file_base64,
                                                   const std::string& filename,
                                                   ClientError* err) {
  auto s = Current();
  if (!s->config.use_extended_endpoints) return std::string(kExtractTextDisabled);

  auto res = Send(*s, ExtractTextRequest(file_base64, filename), nullptr, nullptr, err);
  if (!res) return std::nullopt;
  if (!res->ok()) {
    SetError(err, ErrorKind::kHttp, HttpErrorMessage("Failed to extract text", *res), res->status);
    return std::nullopt;
  }
  std::string derr;
  auto text = DecodeExtractText(res->body, &derr);
  if (!text) {
    SetError(err, ErrorKind::kProtocol, "Failed to extract text: " + derr);
    return std::nullopt;
  }
  return text;
}

std::optional<ImageGenerationResponse> ChatClient::GenerateImages(const ImageGenerationRequest& req,
                                                                  const CancellationToken* cancel,
                                                                  ClientError* err) {
  auto s = Current();
  RequestController controller(std::chrono::milliseconds(s->config.request_timeout_ms), cancel);
  std::cout << "[images] generating n=" << req.n << " format=" << req.response_format << "\n";

  auto res = Send(*s, ImageGenerationHttpRequest(req), nullptr, &controller, err);
  controller.Complete();
  if (!res) {
    if (err) LogFailure("images", *err);
    return std::nullopt;
  }
  if (!res->ok()) {
    SetError(err, ErrorKind::kHttp, HttpErrorMessage("Image API error", *res), res->status);
    return std::nullopt;
  }
  std::string derr;
  auto out = DecodeImageGeneration(res->body, &derr);
  if (!out) {
    SetError(err, ErrorKind::kProtocol, "Image API error: " + derr);
    return std::nullopt;
  }
  return out;
}

std::optional<std::string> ChatClient::GenerateImage(const std::string& prompt,
                                                     const CancellationToken* cancel,
                                                     ClientError* err) {
  ImageGenerationRequest req;
  req.prompt = prompt;
  auto out = GenerateImages(req, cancel, err);
  if (!out) return std::nullopt;
  if (out->data.empty() || !out->data.front().b64_json.has_value() || out->data.front().b64_json->empty()) {
    SetError(err, ErrorKind::kProtocol, "API response did not contain valid b64_json image data.");
    return std::nullopt;
  }
  return *out->data.front().b64_json;
}

std::optional<std::string> ChatClient::SendChat(const std::vector<ChatMessage>& messages,
                                                const DeltaCallback& on_delta,
                                                const CancellationToken* cancel,
                                                const std::optional<std::string>& model_override,
                                                ClientError* err) {
  auto s = Current();
  const bool stream = static_cast<bool>(on_delta);
  const auto prompt = PromptMessages(messages);
  const auto model = ResolveModel(*s, model_override);
  std::cout << "[chat] backend=" << BackendKindName(s->adapter->Kind()) << " model=" << model
            << " stream=" << (stream ? "true" : "false") << " messages=" << prompt.size() << "\n";

  ClientError local_err;
  ClientError* out_err = err ? err : &local_err;
  auto fail = [&](ErrorKind kind, std::string msg, int status) -> std::optional<std::string> {
    SetError(out_err, kind, std::move(msg), status);
    LogFailure("chat", *out_err);
    return std::nullopt;
  };

  RequestController controller(std::chrono::milliseconds(s->config.request_timeout_ms), cancel);
  StreamDecoder decoder(*s->adapter);
  ChunkHandler on_chunk;
  if (stream) {
    on_chunk = [&](std::string_view chunk) { return decoder.Ingest(chunk, on_delta); };
  }

  auto res = Send(*s, s->adapter->ChatRequest(model, prompt, stream), on_chunk, &controller, out_err);
  if (!res) {
    controller.Complete();
    LogFailure("chat", *out_err);
    return std::nullopt;
  }
  if (!res->ok()) {
    controller.Complete();
    return fail(ErrorKind::kHttp, HttpErrorMessage("API error", *res), res->status);
  }

  if (!stream) {
    controller.Complete();
    std::string derr;
    auto text = s->adapter->DecodeChat(res->body, &derr);
    if (!text) return fail(ErrorKind::kProtocol, "invalid chat response: " + derr, 0);
    std::cout << "[chat] completed chars=" << text->size() << "\n";
    return text;
  }

  if (decoder.done()) {
    controller.Complete();
    std::cout << "[chat] stream completed chars=" << decoder.text().size() << "\n";
    return decoder.text();
  }
  if (decoder.error().has_value()) {
    controller.Complete();
    return fail(ErrorKind::kProtocol, "stream error: " + *decoder.error(), 0);
  }
  if (controller.aborted()) {
    controller.Complete();
    SetAbortError(controller, out_err);
    LogFailure("chat", *out_err);
    return std::nullopt;
  }
  controller.Complete();

  if (decoder.Finish(on_delta)) {
    std::cout << "[chat] stream completed chars=" << decoder.text().size() << "\n";
    return decoder.text();
  }
  if (decoder.error().has_value()) {
    return fail(ErrorKind::kProtocol, "stream error: " + *decoder.error(), 0);
  }
  return fail(ErrorKind::kProtocol, "stream ended before completion signal", 0);
}

}  // namespace llmbridge
