#include "request_controller.hpp"

#include <string>
#include <utility>

namespace llmbridge {

CancellationToken::CancellationToken() : state_(std::make_shared<State>()) {}

void CancellationToken::Cancel() {
  std::lock_guard<std::mutex> lock(state_->mu);
  if (state_->cancelled) return;
  state_->cancelled = true;
  // Held across the callbacks so Unsubscribe can wait for them to finish.
  for (auto& [_, cb] : state_->callbacks) {
    if (cb) cb();
  }
  state_->callbacks.clear();
}

bool CancellationToken::IsCancelled() const {
  std::lock_guard<std::mutex> lock(state_->mu);
  return state_->cancelled;
}

uint64_t CancellationToken::Subscribe(std::function<void()> cb) {
  {
    std::lock_guard<std::mutex> lock(state_->mu);
    if (!state_->cancelled) {
      const uint64_t id = state_->next_id++;
      state_->callbacks.emplace(id, std::move(cb));
      return id;
    }
  }
  if (cb) cb();
  return 0;
}

void CancellationToken::Unsubscribe(uint64_t id) {
  if (id == 0) return;
  std::lock_guard<std::mutex> lock(state_->mu);
  state_->callbacks.erase(id);
}

RequestController::RequestController(std::chrono::milliseconds timeout, const CancellationToken* cancel)
    : timeout_(timeout) {
  if (cancel) {
    cancel_ = *cancel;
    subscription_ = cancel_->Subscribe([this]() { Abort(AbortReason::kUserCancelled); });
  }
  if (timeout_.count() > 0) {
    timer_ = std::thread([this]() { RunTimer(); });
  }
}

RequestController::~RequestController() {
  Complete();
}

bool RequestController::Abort(AbortReason reason) {
  if (reason == AbortReason::kNone) return false;
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (completed_ || reason_ != AbortReason::kNone) return false;
    reason_ = reason;
  }
  cv_.notify_all();
  FireHook();
  return true;
}

AbortReason RequestController::reason() const {
  std::lock_guard<std::mutex> lock(mu_);
  return reason_;
}

void RequestController::SetAbortHook(std::function<void()> hook) {
  std::lock_guard<std::mutex> lock(hook_mu_);
  hook_ = std::move(hook);
  hook_fired_ = false;
  if (aborted() && hook_) {
    hook_fired_ = true;
    hook_();
  }
}

void RequestController::ClearAbortHook() {
  std::lock_guard<std::mutex> lock(hook_mu_);
  hook_ = nullptr;
}

void RequestController::FireHook() {
  std::lock_guard<std::mutex> lock(hook_mu_);
  if (!hook_ || hook_fired_) return;
  hook_fired_ = true;
  hook_();
}

void RequestController::Complete() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    completed_ = true;
  }
  cv_.notify_all();
  if (timer_.joinable()) timer_.join();
  if (cancel_ && subscription_ != 0) {
    cancel_->Unsubscribe(subscription_);
    subscription_ = 0;
  }
}

std::string RequestController::TimeoutMessage() const {
  // Exact decimal seconds: 1234567 ms reads 1234.567, 1500 ms reads 1.5.
  const auto ms = timeout_.count();
  std::string seconds = std::to_string(ms / 1000);
  if (const auto frac = ms % 1000; frac != 0) {
    std::string digits = std::to_string(frac);
    digits.insert(0, 3 - digits.size(), '0');
    digits.erase(digits.find_last_not_of('0') + 1);
    seconds += "." + digits;
  }
  return "Request timed out after " + seconds + " seconds.";
}

void RequestController::RunTimer() {
  std::unique_lock<std::mutex> lock(mu_);
  const bool finished =
      cv_.wait_for(lock, timeout_, [this]() { return completed_ || reason_ != AbortReason::kNone; });
  if (finished) return;
  lock.unlock();
  Abort(AbortReason::kTimeout);
}

}  // namespace llmbridge
