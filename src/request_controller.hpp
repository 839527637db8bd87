#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace llmbridge {

// Caller-owned cancellation signal. Copies share state, so the caller keeps one
// copy and hands another to the client.
class CancellationToken {
 public:
  CancellationToken();

  void Cancel();
  bool IsCancelled() const;

  // Runs `cb` once when Cancel() is called, or right away on this thread if the
  // token is already cancelled. Returns an id for Unsubscribe.
  uint64_t Subscribe(std::function<void()> cb);

  // After this returns the callback is not running and will not run.
  void Unsubscribe(uint64_t id);

 private:
  struct State {
    std::mutex mu;
    bool cancelled = false;
    uint64_t next_id = 1;
    std::map<uint64_t, std::function<void()>> callbacks;
  };
  std::shared_ptr<State> state_;
};

enum class AbortReason {
  kNone,
  kUserCancelled,
  kTimeout,
};

// Cancellation context for one in-flight request. The timeout timer and the
// caller's token race; whichever fires first aborts exactly once and the other
// becomes a no-op. Destruction stops the timer and drops the token subscription.
class RequestController {
 public:
  RequestController(std::chrono::milliseconds timeout, const CancellationToken* cancel);
  ~RequestController();

  RequestController(const RequestController&) = delete;
  RequestController& operator=(const RequestController&) = delete;

  // Returns false when an earlier abort already won.
  bool Abort(AbortReason reason);

  AbortReason reason() const;
  bool aborted() const { return reason() != AbortReason::kNone; }

  // The transport installs a hook that tears down its connection. If the
  // request is already aborted the hook runs immediately. ClearAbortHook waits
  // for a running hook to return.
  void SetAbortHook(std::function<void()> hook);
  void ClearAbortHook();

  // Marks the request finished and releases the timer. Idempotent.
  void Complete();

  // "Request timed out after N seconds." for the configured timeout.
  std::string TimeoutMessage() const;

 private:
  void RunTimer();
  void FireHook();

  const std::chrono::milliseconds timeout_;
  std::optional<CancellationToken> cancel_;
  uint64_t subscription_ = 0;

  mutable std::mutex mu_;
  std::condition_variable cv_;
  bool completed_ = false;
  AbortReason reason_ = AbortReason::kNone;

  std::mutex hook_mu_;
  std::function<void()> hook_;
  bool hook_fired_ = false;

  std::thread timer_;
};

}  // namespace llmbridge
