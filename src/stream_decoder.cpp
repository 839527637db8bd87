#include "stream_decoder.hpp"

#include <iostream>
#include <string>
#include <utility>

namespace llmbridge {
namespace {

static std::string TruncateForLog(const std::string& s, size_t max_chars) {
  if (s.size() <= max_chars) return s;
  return s.substr(0, max_chars) + "...(truncated)";
}

}  // namespace

StreamDecoder::StreamDecoder(const IBackendAdapter& adapter) : adapter_(adapter) {}

bool StreamDecoder::Ingest(std::string_view chunk, const DeltaCallback& on_delta) {
  if (finished()) return false;
  line_buffer_.append(chunk.data(), chunk.size());

  size_t start = 0;
  for (;;) {
    auto nl = line_buffer_.find('\n', start);
    if (nl == std::string::npos) break;
    ProcessLine(line_buffer_.substr(start, nl - start), on_delta);
    start = nl + 1;
    if (finished()) {
      line_buffer_.clear();
      return false;
    }
  }
  line_buffer_.erase(0, start);
  return true;
}

bool StreamDecoder::Finish(const DeltaCallback& on_delta) {
  if (!finished() && !line_buffer_.empty()) {
    std::string tail;
    tail.swap(line_buffer_);
    ProcessLine(tail, on_delta);
  }
  line_buffer_.clear();
  return done_;
}

void StreamDecoder::ProcessLine(const std::string& line, const DeltaCallback& on_delta) {
  StreamEvent ev = adapter_.DecodeStreamLine(line);
  if (ev.malformed) {
    discarded_lines_++;
    std::cout << "[stream] discarded unparseable line=" << TruncateForLog(line, 200) << "\n";
    return;
  }
  if (ev.error.has_value()) {
    error_ = std::move(ev.error);
    return;
  }
  if (!ev.delta.empty()) {
    accumulated_ += ev.delta;
    if (on_delta) on_delta(ev.delta);
  }
  if (ev.done) done_ = true;
}

}  // namespace llmbridge
