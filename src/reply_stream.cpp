#include "reply_stream.hpp"

#include <iostream>

namespace llmbridge {

ReplyStream::ReplyStream(std::streambuf* log_buf) : saved_(std::cout.rdbuf()), reply_(saved_) {
  std::cout.flush();
  std::cout.rdbuf(log_buf);
}

ReplyStream::~ReplyStream() {
  reply_.flush();
  std::cout.flush();
  std::cout.rdbuf(saved_);
}

}  // namespace llmbridge
