#include "core/bounded_queue.h"

#include <gtest/gtest.h>
#include <string>
#include <thread>
#include <vector>

using DictationEngine::BoundedQueue;

TEST(BoundedQueue, PopsInPushOrder) {
    BoundedQueue<int> queue(4);
    EXPECT_TRUE(queue.tryPush(1));
    EXPECT_TRUE(queue.tryPush(2));
    EXPECT_TRUE(queue.tryPush(3));

    int value = 0;
    ASSERT_TRUE(queue.pop(value));
    EXPECT_EQ(value, 1);
    ASSERT_TRUE(queue.pop(value));
    EXPECT_EQ(value, 2);
    ASSERT_TRUE(queue.pop(value));
    EXPECT_EQ(value, 3);
}

TEST(BoundedQueue, RejectsWhenFull) {
    BoundedQueue<int> queue(2);
    EXPECT_TRUE(queue.tryPush(1));
    EXPECT_TRUE(queue.tryPush(2));
    EXPECT_FALSE(queue.tryPush(3));
    EXPECT_EQ(queue.size(), 2u);
    EXPECT_EQ(queue.rejectedCount(), 1u);
}

TEST(BoundedQueue, ZeroCapacityBecomesOne) {
    BoundedQueue<int> queue(0);
    EXPECT_EQ(queue.capacity(), 1u);
    EXPECT_TRUE(queue.tryPush(1));
    EXPECT_FALSE(queue.tryPush(2));
}

TEST(BoundedQueue, CloseDrainsThenStops) {
    BoundedQueue<std::string> queue(4);
    queue.tryPush("a");
    queue.tryPush("b");
    queue.close();

    EXPECT_TRUE(queue.isClosed());
    EXPECT_FALSE(queue.tryPush("c"));

    std::string value;
    EXPECT_TRUE(queue.pop(value));
    EXPECT_EQ(value, "a");
    EXPECT_TRUE(queue.pop(value));
    EXPECT_EQ(value, "b");
    EXPECT_FALSE(queue.pop(value));
}

TEST(BoundedQueue, CloseWakesBlockedConsumer) {
    BoundedQueue<int> queue(4);
    bool popped = true;
    std::thread consumer([&] {
        int value = 0;
        popped = queue.pop(value);
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    queue.close();
    consumer.join();
    EXPECT_FALSE(popped);
}

TEST(BoundedQueue, ReopenAcceptsPushes) {
    BoundedQueue<int> queue(2);
    queue.close();
    EXPECT_FALSE(queue.tryPush(1));
    queue.reopen();
    EXPECT_TRUE(queue.tryPush(1));
}

TEST(BoundedQueue, ConsumerSeesEveryItemFromProducer) {
    BoundedQueue<int> queue(8);
    std::vector<int> received;
    std::thread consumer([&] {
        int value = 0;
        while (queue.pop(value)) {
            received.push_back(value);
        }
    });

    for (int i = 0; i < 100; ++i) {
        while (!queue.tryPush(i)) {
            std::this_thread::yield();
        }
    }
    queue.close();
    consumer.join();

    ASSERT_EQ(received.size(), 100u);
    for (int i = 0; i < 100; ++i) {
        EXPECT_EQ(received[static_cast<size_t>(i)], i);
    }
}
