#pragma once

#include "adapters/backend_adapter.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace llmbridge {

// Reassembles line-delimited stream events from chunks split at arbitrary
// byte offsets. One instance per call; not reusable after completion.
class StreamDecoder {
 public:
  using DeltaCallback = std::function<void(const std::string& delta)>;

  explicit StreamDecoder(const IBackendAdapter& adapter);

  // Appends `chunk` and processes every complete line. Returns false once the
  // stream has completed or failed; input after that point is ignored.
  bool Ingest(std::string_view chunk, const DeltaCallback& on_delta);

  // End of input: processes a trailing unterminated line. Returns done().
  bool Finish(const DeltaCallback& on_delta);

  bool done() const { return done_; }
  const std::optional<std::string>& error() const { return error_; }
  const std::string& text() const { return accumulated_; }
  size_t discarded_lines() const { return discarded_lines_; }

 private:
  bool finished() const { return done_ || error_.has_value(); }
  void ProcessLine(const std::string& line, const DeltaCallback& on_delta);

  const IBackendAdapter& adapter_;
  std::string line_buffer_;
  std::string accumulated_;
  bool done_ = false;
  std::optional<std::string> error_;
  size_t discarded_lines_ = 0;
};

}  // namespace llmbridge
