#include "uuidres/rt/BoundedQueue.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace uuidres::rt;

TEST(BoundedQueueTest, ZeroCapacityThrows) {
    EXPECT_THROW(BoundedQueue<int>(0), std::invalid_argument);
}

TEST(BoundedQueueTest, FifoOrder) {
    BoundedQueue<int> q(8);
    for (int i = 0; i < 5; ++i) EXPECT_TRUE(q.push(int(i)));
    for (int i = 0; i < 5; ++i) {
        auto v = q.pop();
        ASSERT_TRUE(v.has_value());
        EXPECT_EQ(*v, i);
    }
}

TEST(BoundedQueueTest, TryPushFailsWhenFull) {
    BoundedQueue<int> q(2);
    EXPECT_TRUE(q.try_push(1));
    EXPECT_TRUE(q.try_push(2));
    EXPECT_FALSE(q.try_push(3));
    EXPECT_EQ(q.size(), 2u);
}

TEST(BoundedQueueTest, PushBlocksUntilRoom) {
    BoundedQueue<int> q(1);
    ASSERT_TRUE(q.push(1));

    std::atomic<bool> pushed{false};
    std::thread producer([&]{
        q.push(2);
        pushed = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_FALSE(pushed.load());

    EXPECT_EQ(*q.pop(), 1);
    producer.join();
    EXPECT_TRUE(pushed.load());
    EXPECT_EQ(*q.pop(), 2);
}

TEST(BoundedQueueTest, CloseDrainsThenEnds) {
    BoundedQueue<int> q(4);
    q.push(1);
    q.push(2);
    q.close();
    EXPECT_FALSE(q.push(3));
    EXPECT_EQ(*q.pop(), 1);
    EXPECT_EQ(*q.pop(), 2);
    EXPECT_FALSE(q.pop().has_value());
}

TEST(BoundedQueueTest, CloseWakesBlockedConsumer) {
    BoundedQueue<int> q(4);
    std::thread consumer([&]{
        EXPECT_FALSE(q.pop().has_value());
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    q.close();
    consumer.join();
}

TEST(BoundedQueueTest, CloseWakesBlockedProducer) {
    BoundedQueue<int> q(1);
    q.push(1);
    std::atomic<bool> result{true};
    std::thread producer([&]{ result = q.push(2); });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    q.close();
    producer.join();
    EXPECT_FALSE(result.load());
}

TEST(BoundedQueueTest, MoveOnlyItems) {
    BoundedQueue<std::unique_ptr<int>> q(2);
    EXPECT_TRUE(q.push(std::make_unique<int>(42)));
    auto v = q.pop();
    ASSERT_TRUE(v.has_value());
    EXPECT_EQ(**v, 42);
}

TEST(BoundedQueueTest, ManyProducersOneConsumer) {
    BoundedQueue<int> q(4);
    const int producers = 4, each = 250;
    std::vector<std::thread> ths;
    for (int p = 0; p < producers; ++p) {
        ths.emplace_back([&q, each]{
            for (int i = 0; i < each; ++i) q.push(1);
        });
    }
    int sum = 0;
    for (int i = 0; i < producers * each; ++i) sum += *q.pop();
    for (auto& t : ths) t.join();
    EXPECT_EQ(sum, producers * each);
    EXPECT_EQ(q.size(), 0u);
}
