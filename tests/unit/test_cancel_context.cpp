#include <chrono>
#include <thread>
#include <gtest/gtest.h>
#include "runtime/cancel_context.hpp"

namespace {

using stepgate::core::errors::is_context_canceled;
using stepgate::core::errors::is_context_deadline_exceeded;
using stepgate::runtime::CancelContext;

TEST(CancelContextTest, BackgroundIsNeverDone) {
    auto ctx = CancelContext::background();
    EXPECT_FALSE(ctx->done());
    EXPECT_FALSE(ctx->err().has_value());
    EXPECT_FALSE(ctx->deadline().has_value());
}

TEST(CancelContextTest, CancelPropagatesToChildren) {
    auto parent = CancelContext::background();
    auto child = CancelContext::with_cancel(parent);
    auto grandchild = CancelContext::with_cancel(child);

    parent->cancel();

    ASSERT_TRUE(grandchild->done());
    ASSERT_TRUE(grandchild->err().has_value());
    EXPECT_TRUE(is_context_canceled(grandchild->err().value()));
}

TEST(CancelContextTest, CancelDoesNotReachParent) {
    auto parent = CancelContext::background();
    auto child = CancelContext::with_cancel(parent);

    child->cancel();

    EXPECT_TRUE(child->done());
    EXPECT_FALSE(parent->done());
}

TEST(CancelContextTest, ChildOfFinishedParentStartsDone) {
    auto parent = CancelContext::background();
    parent->cancel();

    auto child = CancelContext::with_cancel(parent);
    EXPECT_TRUE(child->done());
}

TEST(CancelContextTest, TimeoutReportsDeadlineExceeded) {
    auto ctx = CancelContext::with_timeout(CancelContext::background(),
                                           std::chrono::milliseconds(20));
    ASSERT_TRUE(ctx->deadline().has_value());

    EXPECT_TRUE(ctx->wait_for(std::chrono::milliseconds(2000)));
    ASSERT_TRUE(ctx->err().has_value());
    EXPECT_TRUE(is_context_deadline_exceeded(ctx->err().value()));
}

TEST(CancelContextTest, HugeTimeoutSaturatesDeadline) {
    auto ctx = CancelContext::with_timeout(CancelContext::background(),
                                           std::chrono::milliseconds::max());
    ASSERT_TRUE(ctx->deadline().has_value());
    EXPECT_TRUE(ctx->deadline().value() == CancelContext::Clock::time_point::max());
    EXPECT_FALSE(ctx->done());
    EXPECT_FALSE(ctx->wait_for(std::chrono::milliseconds(5)));
}

TEST(CancelContextTest, ChildKeepsEarlierParentDeadline) {
    auto parent = CancelContext::with_timeout(CancelContext::background(),
                                              std::chrono::milliseconds(50));
    auto child = CancelContext::with_timeout(parent, std::chrono::hours(1));

    ASSERT_TRUE(child->deadline().has_value());
    EXPECT_EQ(child->deadline().value(), parent->deadline().value());
}

TEST(CancelContextTest, FirstCauseWins) {
    auto ctx = CancelContext::with_timeout(CancelContext::background(),
                                           std::chrono::hours(1));
    ctx->cancel();
    ASSERT_TRUE(ctx->err().has_value());
    EXPECT_TRUE(is_context_canceled(ctx->err().value()));
}

TEST(CancelContextTest, WaitForWakesOnCancelFromAnotherThread) {
    auto ctx = CancelContext::with_cancel(CancelContext::background());
    std::thread canceller([ctx]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        ctx->cancel();
    });

    const auto start = std::chrono::steady_clock::now();
    EXPECT_TRUE(ctx->wait_for(std::chrono::seconds(10)));
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));
    canceller.join();
}

TEST(CancelContextTest, WaitForTimesOutWhileActive) {
    auto ctx = CancelContext::with_cancel(CancelContext::background());
    EXPECT_FALSE(ctx->wait_for(std::chrono::milliseconds(10)));
}

}  // namespace
