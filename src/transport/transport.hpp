#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace llmbridge {

class RequestController;

using HeaderList = std::vector<std::pair<std::string, std::string>>;

struct HttpRequest {
  std::string method = "GET";
  std::string base_url;
  std::string path;
  HeaderList headers;
  std::string body;

  std::string Url() const { return base_url + path; }
};

struct HttpResponse {
  int status = 0;
  std::string reason;
  // Holds the full body, except for 2xx responses delivered through a chunk
  // handler; those bytes went to the handler only.
  std::string body;

  bool ok() const { return status >= 200 && status < 300; }
};

// TLS trust settings shared by every request of one client.
struct TransportPolicy {
  bool verify_certificate = true;
  bool verify_hostname = true;
  std::optional<std::string> ca_cert_path;
  int connect_timeout_seconds = 10;
  int read_timeout_seconds = 600;
  int write_timeout_seconds = 30;
};

// Returns false to stop reading the body.
using ChunkHandler = std::function<bool(std::string_view chunk)>;

class ITransport {
 public:
  virtual ~ITransport() = default;

  virtual void Configure(const TransportPolicy& policy) = 0;

  // Sends `req`. With a chunk handler, a 2xx body is handed over piece by piece
  // as it arrives; a handler returning false ends the exchange normally. Any
  // status counts as a response; nullopt means no response (connect, TLS or
  // read failure, or the controller aborted the exchange).
  virtual std::optional<HttpResponse> Execute(const HttpRequest& req,
                                              const ChunkHandler& on_chunk,
                                              RequestController* controller,
                                              std::string* err) = 0;
};

}  // namespace llmbridge
