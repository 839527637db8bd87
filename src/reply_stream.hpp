#pragma once

#include <ostream>
#include <streambuf>

namespace llmbridge {

// Keeps a streamed reply apart from log lines. While alive, std::cout (where
// the library logs) writes to `log_buf` and reply() writes to what std::cout
// wrote to before. Restores std::cout on destruction.
class ReplyStream {
 public:
  explicit ReplyStream(std::streambuf* log_buf);
  ~ReplyStream();

  ReplyStream(const ReplyStream&) = delete;
  ReplyStream& operator=(const ReplyStream&) = delete;

  std::ostream& reply() { return reply_; }

 private:
  std::streambuf* saved_;
  std::ostream reply_;
};

}  // namespace llmbridge
