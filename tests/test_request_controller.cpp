#include <gtest/gtest.h>
#include "request_controller.hpp"

#include <atomic>
#include <chrono>
#include <thread>

using namespace llmbridge;
using namespace std::chrono_literals;

namespace {

bool WaitUntilAborted(const RequestController& c, std::chrono::milliseconds limit) {
    const auto deadline = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < deadline) {
        if (c.aborted()) return true;
        std::this_thread::sleep_for(2ms);
    }
    return c.aborted();
}

}  // namespace

class RequestControllerTest : public ::testing::Test {
protected:
    CancellationToken token;
};

TEST_F(RequestControllerTest, TimeoutAborts) {
    RequestController c(30ms, nullptr);
    ASSERT_TRUE(WaitUntilAborted(c, 2000ms));
    EXPECT_EQ(c.reason(), AbortReason::kTimeout);
}

TEST_F(RequestControllerTest, CompleteStopsTimer) {
    RequestController c(30ms, nullptr);
    c.Complete();
    std::this_thread::sleep_for(80ms);
    EXPECT_FALSE(c.aborted());
    EXPECT_FALSE(c.Abort(AbortReason::kUserCancelled));
}

TEST_F(RequestControllerTest, ZeroTimeoutNeverFires) {
    RequestController c(0ms, nullptr);
    std::this_thread::sleep_for(30ms);
    EXPECT_FALSE(c.aborted());
}

TEST_F(RequestControllerTest, CancelWinsOverLaterTimeout) {
    RequestController c(50ms, &token);
    token.Cancel();
    EXPECT_EQ(c.reason(), AbortReason::kUserCancelled);
    std::this_thread::sleep_for(100ms);
    EXPECT_EQ(c.reason(), AbortReason::kUserCancelled);
}

TEST_F(RequestControllerTest, TimeoutWinsOverLaterCancel) {
    RequestController c(20ms, &token);
    ASSERT_TRUE(WaitUntilAborted(c, 2000ms));
    token.Cancel();
    EXPECT_EQ(c.reason(), AbortReason::kTimeout);
}

TEST_F(RequestControllerTest, AlreadyCancelledTokenAbortsImmediately) {
    token.Cancel();
    RequestController c(10000ms, &token);
    EXPECT_TRUE(c.aborted());
    EXPECT_EQ(c.reason(), AbortReason::kUserCancelled);
}

TEST_F(RequestControllerTest, AbortHookRunsOnce) {
    RequestController c(10000ms, &token);
    std::atomic<int> calls{0};
    c.SetAbortHook([&]() { calls++; });
    token.Cancel();
    EXPECT_FALSE(c.Abort(AbortReason::kTimeout));
    EXPECT_EQ(calls.load(), 1);
    c.ClearAbortHook();
}

TEST_F(RequestControllerTest, HookInstalledAfterAbortRunsImmediately) {
    RequestController c(10000ms, nullptr);
    ASSERT_TRUE(c.Abort(AbortReason::kUserCancelled));
    bool ran = false;
    c.SetAbortHook([&]() { ran = true; });
    EXPECT_TRUE(ran);
}

TEST_F(RequestControllerTest, TokenOutlivesController) {
    {
        RequestController c(10000ms, &token);
    }
    token.Cancel();
    EXPECT_TRUE(token.IsCancelled());
}

TEST_F(RequestControllerTest, TokenCopiesShareState) {
    CancellationToken copy = token;
    copy.Cancel();
    EXPECT_TRUE(token.IsCancelled());
}

TEST_F(RequestControllerTest, TimeoutMessage) {
    RequestController whole(600000ms, nullptr);
    EXPECT_EQ(whole.TimeoutMessage(), "Request timed out after 600 seconds.");
    RequestController fractional(1500ms, nullptr);
    EXPECT_EQ(fractional.TimeoutMessage(), "Request timed out after 1.5 seconds.");
}

TEST_F(RequestControllerTest, TimeoutMessageKeepsEveryMillisecond) {
    RequestController large(1234567ms, nullptr);
    EXPECT_EQ(large.TimeoutMessage(), "Request timed out after 1234.567 seconds.");
    RequestController short_one(50ms, nullptr);
    EXPECT_EQ(short_one.TimeoutMessage(), "Request timed out after 0.05 seconds.");
    RequestController padded(2005ms, nullptr);
    EXPECT_EQ(padded.TimeoutMessage(), "Request timed out after 2.005 seconds.");
}
