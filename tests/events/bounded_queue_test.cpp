#include <gtest/gtest.h>
#include "relay/events/bounded_queue.hpp"
#include <atomic>
#include <chrono>
#include <thread>

using namespace relay::events;

TEST(BoundedQueue, PushAndPopInOrder) {
    BoundedQueue<int> queue(4);

    EXPECT_TRUE(queue.push(42));
    EXPECT_TRUE(queue.push(100));

    auto first = queue.pop();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first.value(), 42);

    auto second = queue.pop();
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second.value(), 100);
}

TEST(BoundedQueue, TryPushFailsWhenFull) {
    BoundedQueue<int> queue(2);

    EXPECT_TRUE(queue.try_push(1));
    EXPECT_TRUE(queue.try_push(2));
    EXPECT_FALSE(queue.try_push(3));
    EXPECT_EQ(queue.size(), 2u);
    EXPECT_EQ(queue.capacity(), 2u);

    queue.try_pop();
    EXPECT_TRUE(queue.try_push(3));
}

TEST(BoundedQueue, PushWaitsForRoom) {
    BoundedQueue<int> queue(1);
    ASSERT_TRUE(queue.push(1));

    std::atomic<bool> pushed{false};
    std::thread producer([&]() {
        queue.push(2);
        pushed = true;
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    EXPECT_FALSE(pushed.load());

    auto val = queue.pop();
    producer.join();

    ASSERT_TRUE(val.has_value());
    EXPECT_EQ(val.value(), 1);
    EXPECT_TRUE(pushed.load());
    EXPECT_EQ(queue.pop().value(), 2);
}

TEST(BoundedQueue, PopTimeout) {
    BoundedQueue<int> queue(4);

    auto start = std::chrono::steady_clock::now();
    auto val = queue.pop_for(std::chrono::milliseconds(100));
    auto end = std::chrono::steady_clock::now();

    EXPECT_FALSE(val.has_value());
    EXPECT_GE(std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count(), 90);
}

TEST(BoundedQueue, ShutdownWakesBlockedProducer) {
    BoundedQueue<int> queue(1);
    ASSERT_TRUE(queue.push(1));

    std::atomic<bool> result{true};
    std::thread producer([&]() { result = queue.push(2); });

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    queue.shutdown();
    producer.join();

    EXPECT_FALSE(result.load());
    EXPECT_TRUE(queue.is_shutdown());
    EXPECT_FALSE(queue.try_push(3));
}

TEST(BoundedQueue, ShutdownDrainsRemainingItems) {
    BoundedQueue<int> queue(4);
    queue.push(7);
    queue.shutdown();

    auto val = queue.pop();
    ASSERT_TRUE(val.has_value());
    EXPECT_EQ(val.value(), 7);
    EXPECT_FALSE(queue.pop().has_value());
}

TEST(BoundedQueue, ProducerConsumer) {
    BoundedQueue<int> queue(8);
    std::atomic<int> sum{0};

    std::thread producer([&queue]() {
        for (int i = 0; i < 100; ++i) {
            queue.push(i);
        }
        queue.shutdown();
    });

    std::thread consumer([&queue, &sum]() {
        while (auto val = queue.pop()) {
            sum += val.value();
        }
    });

    producer.join();
    consumer.join();

    EXPECT_EQ(sum, 4950);
}
