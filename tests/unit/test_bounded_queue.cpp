// ============================================================================
// VIGIL - Bounded Queue Unit Tests
// ============================================================================

#include "vigil/core/bounded_queue.hpp"

#include <gtest/gtest.h>

#include <thread>

using namespace vigil;

class BoundedQueueTest : public ::testing::Test {
protected:
    static constexpr size_t CAPACITY = 4;
    BoundedQueue<int> queue{CAPACITY};
};

TEST_F(BoundedQueueTest, InitiallyEmpty) {
    EXPECT_TRUE(queue.empty());
    EXPECT_EQ(queue.capacity(), CAPACITY);
    EXPECT_FALSE(queue.try_pop().has_value());
}

TEST_F(BoundedQueueTest, FIFO) {
    for (int i = 0; i < 3; ++i) {
        EXPECT_EQ(queue.push(i), PushResult::Queued);
    }
    for (int i = 0; i < 3; ++i) {
        auto value = queue.try_pop();
        ASSERT_TRUE(value.has_value());
        EXPECT_EQ(*value, i);
    }
}

TEST_F(BoundedQueueTest, OverflowDropsOldestAndCounts) {
    for (int i = 0; i < 4; ++i) {
        EXPECT_EQ(queue.push(i), PushResult::Queued);
    }
    EXPECT_EQ(queue.push(4), PushResult::EvictedOldest);
    EXPECT_EQ(queue.push(5), PushResult::EvictedOldest);

    EXPECT_EQ(queue.size(), CAPACITY);
    EXPECT_EQ(queue.dropped(), 2u);

    // 0 and 1 were evicted; the newest survive
    EXPECT_EQ(*queue.try_pop(), 2);
    EXPECT_EQ(*queue.try_pop(), 3);
    EXPECT_EQ(*queue.try_pop(), 4);
    EXPECT_EQ(*queue.try_pop(), 5);
}

TEST_F(BoundedQueueTest, PopForTimesOut) {
    auto value = queue.pop_for(std::chrono::milliseconds(10));
    EXPECT_FALSE(value.has_value());
}

TEST_F(BoundedQueueTest, PopForWakesOnPush) {
    std::thread producer([this] {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        queue.push(42);
    });

    auto value = queue.pop_for(std::chrono::seconds(2));
    producer.join();
    ASSERT_TRUE(value.has_value());
    EXPECT_EQ(*value, 42);
}

TEST_F(BoundedQueueTest, CloseRejectsPushes) {
    queue.push(1);
    queue.close();
    EXPECT_EQ(queue.push(2), PushResult::Closed);
    EXPECT_EQ(queue.dropped(), 0u);
    EXPECT_EQ(*queue.pop_for(std::chrono::milliseconds(10)), 1);
    EXPECT_FALSE(queue.pop_for(std::chrono::milliseconds(10)).has_value());
}

TEST(BoundedQueueConstruction, ZeroCapacityThrows) {
    EXPECT_THROW(BoundedQueue<int>(0), std::invalid_argument);
}
