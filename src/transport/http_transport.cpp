#include "transport/http_transport.hpp"

#include "request_controller.hpp"

#include <httplib.h>

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <utility>

namespace llmbridge {
namespace {

static std::unique_ptr<httplib::Client> MakeClient(const std::string& base_url, const TransportPolicy& p) {
  auto cli = std::make_unique<httplib::Client>(base_url);
  cli->set_connection_timeout(p.connect_timeout_seconds);
  cli->set_read_timeout(p.read_timeout_seconds);
  cli->set_write_timeout(p.write_timeout_seconds);
  cli->set_keep_alive(true);
  cli->enable_server_certificate_verification(p.verify_certificate);
  cli->enable_server_hostname_verification(p.verify_hostname);
  if (p.ca_cert_path.has_value()) cli->set_ca_cert_path(*p.ca_cert_path);
  return cli;
}

}  // namespace

TransportPolicy BuildTransportPolicy(const BackendConfig& cfg) {
  TransportPolicy p;
  p.verify_certificate = !cfg.disable_ssl_verification;
  p.verify_hostname = !cfg.disable_ssl_verification;
  if (cfg.disable_ssl_verification) {
    std::cout << "[tls] verification disabled: certificate and hostname errors are ignored\n";
  }

  if (cfg.request_timeout_ms > 0) {
    const int64_t secs = (cfg.request_timeout_ms + 999) / 1000;
    p.read_timeout_seconds = static_cast<int>(std::min<int64_t>(secs, 24 * 3600));
  }

  if (cfg.ssl_cert_path.has_value()) {
    auto path = StripQuotes(*cfg.ssl_cert_path);
    if (!path.empty()) {
      std::error_code ec;
      if (std::filesystem::is_regular_file(path, ec)) {
        p.ca_cert_path = path;
        std::cout << "[tls] custom ca loaded path=" << path << "\n";
      } else {
        std::cout << "[tls] warning: ca certificate file not found path=" << path << "\n";
      }
    }
  }
  return p;
}

HttpTransport::HttpTransport(TransportPolicy policy)
    : policy_(std::make_shared<const TransportPolicy>(std::move(policy))) {}

void HttpTransport::Configure(const TransportPolicy& policy) {
  auto next = std::make_shared<const TransportPolicy>(policy);
  std::lock_guard<std::mutex> lock(mu_);
  policy_ = std::move(next);
}

std::shared_ptr<const TransportPolicy> HttpTransport::Policy() const {
  std::lock_guard<std::mutex> lock(mu_);
  return policy_;
}

std::optional<HttpResponse> HttpTransport::Execute(const HttpRequest& req,
                                                   const ChunkHandler& on_chunk,
                                                   RequestController* controller,
                                                   std::string* err) {
  if (controller && controller->aborted()) {
    if (err) *err = "request aborted before send";
    return std::nullopt;
  }

  auto policy = Policy();
  auto cli = MakeClient(req.base_url, *policy);
  if (!cli->is_valid()) {
    if (err) *err = "invalid endpoint " + req.base_url;
    return std::nullopt;
  }

  httplib::Request hreq;
  hreq.method = req.method;
  hreq.path = req.path;
  for (const auto& kv : req.headers) hreq.headers.emplace(kv.first, kv.second);
  hreq.body = req.body;

  HttpResponse out;
  bool handler_stopped = false;
  hreq.response_handler = [&](const httplib::Response& r) {
    out.status = r.status;
    out.reason = r.reason;
    return !(controller && controller->aborted());
  };
  hreq.content_receiver = [&](const char* data, size_t len, uint64_t, uint64_t) {
    if (controller && controller->aborted()) return false;
    if (!on_chunk || !out.ok()) {
      out.body.append(data, len);
      return true;
    }
    if (!on_chunk(std::string_view(data, len))) {
      handler_stopped = true;
      return false;
    }
    return true;
  };

  if (controller) controller->SetAbortHook([c = cli.get()]() { c->stop(); });
  auto res = cli->send(hreq);
  if (controller) controller->ClearAbortHook();

  if (handler_stopped && out.status != 0) {
    if (out.reason.empty()) out.reason = httplib::status_message(out.status);
    std::cout << "[http] " << req.method << " " << req.Url() << " status=" << out.status << " stream=stopped\n";
    return out;
  }
  if (!res) {
    const auto e = res.error();
    std::string msg = httplib::to_string(e);
    if (e == httplib::Error::SSLServerVerification) {
      msg += " (certificate rejected; provide a CA certificate path or disable SSL verification)";
    }
    std::cout << "[http] " << req.method << " " << req.Url() << " error=" << msg << "\n";
    if (err) *err = msg;
    return std::nullopt;
  }
  out.status = res->status;
  if (!res->reason.empty()) out.reason = res->reason;
  if (out.reason.empty()) out.reason = httplib::status_message(out.status);
  std::cout << "[http] " << req.method << " " << req.Url() << " status=" << out.status << "\n";
  return out;
}

}  // namespace llmbridge
