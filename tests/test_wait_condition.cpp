// =============================================================================
// Unit tests for wait_for_condition (src/wait_condition.hpp)
// =============================================================================
#include <gtest/gtest.h>
#include <thread>
#include "wait_condition.hpp"

using namespace portal;
using namespace std::chrono_literals;

TEST(WaitConditionTest, ImmediatelyMet) {
    int calls = 0;
    auto r = wait_for_condition([&] { calls++; return true; });
    EXPECT_TRUE(r.is_ok());
    EXPECT_EQ(calls, 1);
}

TEST(WaitConditionTest, MetAfterPolls) {
    int calls = 0;
    WaitOptions opt;
    opt.interval = 5ms;
    opt.max_wait = 2000ms;
    auto r = wait_for_condition([&] { return ++calls >= 3; }, opt);
    EXPECT_TRUE(r.is_ok());
    EXPECT_EQ(calls, 3);
}

TEST(WaitConditionTest, TimesOut) {
    WaitOptions opt;
    opt.interval = 10ms;
    opt.max_wait = 50ms;
    const auto t0 = std::chrono::steady_clock::now();
    auto r = wait_for_condition([] { return false; }, opt);
    const auto elapsed = std::chrono::steady_clock::now() - t0;

    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().kind(), ErrorCode::Timeout);
    EXPECT_GE(elapsed, 50ms);
}

TEST(WaitConditionTest, ZeroWaitEvaluatesOnce) {
    int calls = 0;
    WaitOptions opt;
    opt.max_wait = 0ms;
    auto r = wait_for_condition([&] { calls++; return false; }, opt);
    EXPECT_TRUE(r.is_err());
    EXPECT_EQ(calls, 1);
}

TEST(WaitConditionTest, CancelledFromAnotherThread) {
    CancellationToken token;
    WaitOptions opt;
    opt.interval = 1000ms;
    opt.max_wait = 10000ms;

    std::thread canceller([&] {
        std::this_thread::sleep_for(30ms);
        token.cancel();
    });
    const auto t0 = std::chrono::steady_clock::now();
    auto r = wait_for_condition([] { return false; }, opt, &token);
    const auto elapsed = std::chrono::steady_clock::now() - t0;
    canceller.join();

    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().kind(), ErrorCode::Cancelled);
    EXPECT_LT(elapsed, 1000ms);
}

TEST(WaitConditionTest, PreCancelledSkipsPredicate) {
    CancellationToken token;
    token.cancel();
    int calls = 0;
    auto r = wait_for_condition([&] { calls++; return true; }, WaitOptions{}, &token);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(calls, 0);

    token.reset();
    EXPECT_FALSE(token.is_cancelled());
}
