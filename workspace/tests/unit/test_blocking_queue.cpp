#include <gtest/gtest.h>
#include "utils/blocking_queue.h"
#include <thread>
#include <vector>
#include <chrono>
#include <atomic>
#include <string>

using namespace proctor::utils;
using namespace std::chrono_literals;

// ============================================================================
// Basic Operations Tests
// ============================================================================

TEST(BlockingQueueTest, PushAndPop) {
    BlockingQueue<int> queue;

    queue.push(42);
    EXPECT_EQ(queue.size(), 1u);

    auto item = queue.pop();
    ASSERT_TRUE(item.has_value());
    EXPECT_EQ(item.value(), 42);
    EXPECT_EQ(queue.size(), 0u);
}

TEST(BlockingQueueTest, FifoOrder) {
    BlockingQueue<int> queue;

    for (int i = 0; i < 10; ++i) {
        queue.push(i);
    }

    for (int i = 0; i < 10; ++i) {
        auto item = queue.pop();
        ASSERT_TRUE(item.has_value());
        EXPECT_EQ(item.value(), i);
    }
}

TEST(BlockingQueueTest, TryPushRespectsCapacity) {
    BlockingQueue<int> queue(2);

    int a = 1, b = 2, c = 3;
    EXPECT_TRUE(queue.tryPush(a));
    EXPECT_TRUE(queue.tryPush(b));
    EXPECT_FALSE(queue.tryPush(c));  // Queue full
    EXPECT_EQ(c, 3);                 // Rejected item left untouched
    EXPECT_EQ(queue.capacity(), 2u);
}

TEST(BlockingQueueTest, TryPushMovesAcceptedItem) {
    BlockingQueue<std::string> queue(1);

    std::string str = "hello";
    EXPECT_TRUE(queue.tryPush(str));
    EXPECT_TRUE(str.empty());

    auto item = queue.pop();
    ASSERT_TRUE(item.has_value());
    EXPECT_EQ(item.value(), "hello");
}

TEST(BlockingQueueTest, UnlimitedCapacity) {
    BlockingQueue<int> queue;

    for (int i = 0; i < 1000; ++i) {
        int value = i;
        ASSERT_TRUE(queue.tryPush(value));
    }
    EXPECT_EQ(queue.size(), 1000u);
}

// ============================================================================
// Close Tests
// ============================================================================

TEST(BlockingQueueTest, CloseDrainsThenReturnsNullopt) {
    BlockingQueue<int> queue;
    queue.push(1);
    queue.close();

    EXPECT_TRUE(queue.isClosed());

    auto first = queue.pop();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first.value(), 1);

    // Pop returns nullopt when closed and empty
    EXPECT_FALSE(queue.pop().has_value());
}

TEST(BlockingQueueTest, PushAfterClose) {
    BlockingQueue<int> queue;
    queue.close();

    EXPECT_THROW(queue.push(1), QueueClosedException);

    int value = 2;
    EXPECT_FALSE(queue.tryPush(value));
}

TEST(BlockingQueueTest, CloseWakesBlockedConsumer) {
    BlockingQueue<int> queue;
    std::atomic<bool> woke(false);

    std::thread consumer([&]() {
        auto item = queue.pop();
        EXPECT_FALSE(item.has_value());
        woke = true;
    });

    std::this_thread::sleep_for(50ms);
    queue.close();
    consumer.join();

    EXPECT_TRUE(woke);
}

// ============================================================================
// Concurrency Tests
// ============================================================================

TEST(BlockingQueueTest, ProducersAndConsumers) {
    BlockingQueue<int> queue(8);
    std::atomic<int> sum(0);
    std::atomic<int> consumed(0);

    std::vector<std::thread> consumers;
    for (int i = 0; i < 3; ++i) {
        consumers.emplace_back([&]() {
            while (auto item = queue.pop()) {
                sum += *item;
                ++consumed;
            }
        });
    }

    std::vector<std::thread> producers;
    for (int p = 0; p < 4; ++p) {
        producers.emplace_back([&queue]() {
            for (int i = 1; i <= 100; ++i) {
                queue.push(i);
            }
        });
    }

    for (auto& t : producers) {
        t.join();
    }
    queue.close();
    for (auto& t : consumers) {
        t.join();
    }

    EXPECT_EQ(consumed, 400);
    EXPECT_EQ(sum, 4 * 5050);
}
