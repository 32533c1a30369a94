/**
 * @file admission_test.cpp
 * @brief 有界队列与限流测试
 */

#include <gtest/gtest.h>
#include <thread>
#include <chrono>
#include <string>

#include "pipeline/admission.h"

using namespace labyrinth;

TEST(BoundedQueueTest, FifoOrder) {
    BoundedQueue<int> q(4);
    ASSERT_TRUE(q.push(1).ok());
    ASSERT_TRUE(q.push(2).ok());
    ASSERT_TRUE(q.push(3).ok());
    EXPECT_EQ(q.size(), 3u);
    EXPECT_EQ(*q.pop(), 1);
    EXPECT_EQ(*q.pop(), 2);
    EXPECT_EQ(*q.pop(), 3);
    EXPECT_EQ(q.size(), 0u);
}

TEST(BoundedQueueTest, RejectsBeyondCapacity) {
    BoundedQueue<std::string> q(2);
    ASSERT_TRUE(q.push("a").ok());
    ASSERT_TRUE(q.push("b").ok());
    auto full = q.push("c");
    ASSERT_FALSE(full.ok());
    EXPECT_EQ(full.error().code(), ErrorCode::QUEUE_FULL);
    EXPECT_EQ(q.size(), 2u);

    ASSERT_TRUE(q.pop().has_value());
    EXPECT_TRUE(q.push("c").ok());
}

// 测试：close 唤醒阻塞的 pop，并交回未取走的元素
TEST(BoundedQueueTest, CloseWakesConsumers) {
    BoundedQueue<int> q(4);
    std::optional<int> got = 7;
    std::thread consumer([&q, &got]() { got = q.pop(); });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    auto rest = q.close();
    consumer.join();

    EXPECT_TRUE(rest.empty());
    EXPECT_FALSE(got.has_value());
    EXPECT_TRUE(q.closed());

    auto after = q.push(1);
    ASSERT_FALSE(after.ok());
    EXPECT_EQ(after.error().code(), ErrorCode::PIPELINE_STOPPED);
}

TEST(BoundedQueueTest, CloseReturnsPendingItems) {
    BoundedQueue<int> q(4);
    ASSERT_TRUE(q.push(1).ok());
    ASSERT_TRUE(q.push(2).ok());
    auto rest = q.close();
    ASSERT_EQ(rest.size(), 2u);
    EXPECT_EQ(rest.front(), 1);
    EXPECT_FALSE(q.pop().has_value());
}

TEST(BoundedQueueTest, BlockingPopReceivesLaterPush) {
    BoundedQueue<int> q(1);
    std::optional<int> got;
    std::thread consumer([&q, &got]() { got = q.pop(); });
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
    ASSERT_TRUE(q.push(99).ok());
    consumer.join();
    ASSERT_TRUE(got.has_value());
    EXPECT_EQ(*got, 99);
}

// 测试：pop_for 超时返回空但队列仍可用；关闭后同样返回空
TEST(BoundedQueueTest, TimedPopDistinguishesTimeoutFromClose) {
    BoundedQueue<int> q(2);
    auto t0 = std::chrono::steady_clock::now();
    EXPECT_FALSE(q.pop_for(std::chrono::milliseconds(20)).has_value());
    EXPECT_GE(std::chrono::steady_clock::now() - t0, std::chrono::milliseconds(15));
    EXPECT_FALSE(q.closed());

    ASSERT_TRUE(q.push(5).ok());
    auto got = q.pop_for(std::chrono::milliseconds(20));
    ASSERT_TRUE(got.has_value());
    EXPECT_EQ(*got, 5);

    q.close();
    EXPECT_FALSE(q.pop_for(std::chrono::seconds(5)).has_value());
    EXPECT_TRUE(q.closed());
}

//==============================================================================
// 限流
//==============================================================================

TEST(RateLimiterTest, AllowsUpToLimitPerWindow) {
    using namespace std::chrono;
    RateLimiter limiter(3, seconds(60));
    auto t0 = RateLimiter::SteadyClock::now();

    for (int i = 0; i < 3; i++) {
        ASSERT_TRUE(limiter.check("alice", t0));
        limiter.record("alice", t0 + seconds(i));
    }
    EXPECT_FALSE(limiter.check("alice", t0 + seconds(10)));
    EXPECT_EQ(limiter.recent("alice", t0 + seconds(10)), 3u);

    // 其他用户不受影响
    EXPECT_TRUE(limiter.check("bob", t0 + seconds(10)));
}

// 测试：窗口滑过最早的记录后恢复
TEST(RateLimiterTest, WindowSlides) {
    using namespace std::chrono;
    RateLimiter limiter(2, seconds(60));
    auto t0 = RateLimiter::SteadyClock::now();

    limiter.record("alice", t0);
    limiter.record("alice", t0 + seconds(30));
    EXPECT_FALSE(limiter.check("alice", t0 + seconds(59)));
    EXPECT_TRUE(limiter.check("alice", t0 + seconds(60)));
    EXPECT_EQ(limiter.recent("alice", t0 + seconds(60)), 1u);
    EXPECT_EQ(limiter.recent("alice", t0 + seconds(91)), 0u);
}

// 测试：只检查不记录，不占用额度
TEST(RateLimiterTest, CheckDoesNotConsume) {
    RateLimiter limiter(1, std::chrono::seconds(60));
    for (int i = 0; i < 5; i++) {
        EXPECT_TRUE(limiter.check("alice"));
    }
    EXPECT_EQ(limiter.recent("alice"), 0u);
}
