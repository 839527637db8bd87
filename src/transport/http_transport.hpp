#pragma once

#include "config.hpp"
#include "transport/transport.hpp"

#include <memory>
#include <mutex>

namespace llmbridge {

// Derives the TLS trust policy from configuration. The CA path is
// quote-stripped; a path that does not exist is logged and ignored.
TransportPolicy BuildTransportPolicy(const BackendConfig& cfg);

class HttpTransport : public ITransport {
 public:
  explicit HttpTransport(TransportPolicy policy);

  void Configure(const TransportPolicy& policy) override;
  std::optional<HttpResponse> Execute(const HttpRequest& req,
                                      const ChunkHandler& on_chunk,
                                      RequestController* controller,
                                      std::string* err) override;

 private:
  std::shared_ptr<const TransportPolicy> Policy() const;

  mutable std::mutex mu_;
  std::shared_ptr<const TransportPolicy> policy_;
};

}  // namespace llmbridge
