// EN: Unit tests for CancellationToken - explicit cancel, deadlines and interruptible sleep
// FR: Tests unitaires pour CancellationToken - annulation explicite, échéances et sommeil interruptible

#include <gtest/gtest.h>

#include "core/cancellation.hpp"

#include <chrono>
#include <thread>

using namespace FGL;
using namespace std::chrono_literals;

TEST(CancellationTokenTest, FreshTokenIsNotCancelled) {
    CancellationToken token;
    EXPECT_FALSE(token.isCancelled());
    EXPECT_FALSE(token.deadlineExceeded());
    EXPECT_EQ(token.reason(), "");
}

TEST(CancellationTokenTest, FirstReasonWins) {
    CancellationToken token;
    CancellationToken copy = token;

    token.cancel("superseded by run #9");
    copy.cancel("cancelled by operator");

    EXPECT_TRUE(copy.isCancelled());
    EXPECT_EQ(copy.reason(), "superseded by run #9");
    EXPECT_FALSE(token.deadlineExceeded());
}

TEST(CancellationTokenTest, ChildFollowsParentCancellation) {
    CancellationToken parent;
    CancellationToken child = parent.withDeadline(10s);

    EXPECT_FALSE(child.isCancelled());
    parent.cancel("interrupted by signal");

    EXPECT_TRUE(child.isCancelled());
    EXPECT_FALSE(child.deadlineExceeded());
    EXPECT_EQ(child.reason(), "interrupted by signal");
}

TEST(CancellationTokenTest, ChildCancellationDoesNotReachParent) {
    CancellationToken parent;
    CancellationToken child = parent.withDeadline(10s);

    child.cancel("stage only");

    EXPECT_TRUE(child.isCancelled());
    EXPECT_FALSE(parent.isCancelled());
}

TEST(CancellationTokenTest, DeadlineFiresOnChildOnly) {
    CancellationToken parent;
    CancellationToken child = parent.withDeadline(30ms);

    std::this_thread::sleep_for(60ms);

    EXPECT_TRUE(child.isCancelled());
    EXPECT_TRUE(child.deadlineExceeded());
    EXPECT_EQ(child.reason(), "deadline exceeded");
    EXPECT_FALSE(parent.isCancelled());
}

TEST(CancellationTokenTest, RemainingFollowsNearestDeadline) {
    CancellationToken root;
    EXPECT_FALSE(root.remaining().has_value());

    CancellationToken run = root.withDeadline(10s);
    CancellationToken stage = run.withDeadline(200ms);
    ASSERT_TRUE(stage.remaining().has_value());
    EXPECT_LE(*stage.remaining(), 200ms);
    EXPECT_GT(*run.remaining(), 5s);

    CancellationToken expired = root.withDeadline(0ms);
    EXPECT_EQ(*expired.remaining(), 0ms);
}

TEST(CancellationTokenTest, SleepRunsToCompletionWhenUntouched) {
    CancellationToken token;
    auto start = std::chrono::steady_clock::now();

    EXPECT_TRUE(token.sleepFor(50ms));
    EXPECT_GE(std::chrono::steady_clock::now() - start, 50ms);
}

TEST(CancellationTokenTest, SleepIsInterruptedByCancel) {
    CancellationToken token;
    std::thread canceller([token]() mutable {
        std::this_thread::sleep_for(40ms);
        token.cancel("stop");
    });

    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(token.sleepFor(5s));
    EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);
    canceller.join();
}

TEST(CancellationTokenTest, SleepIsBoundedByDeadline) {
    CancellationToken token = CancellationToken().withDeadline(40ms);

    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(token.sleepFor(5s));
    EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);
    EXPECT_TRUE(token.deadlineExceeded());
}
