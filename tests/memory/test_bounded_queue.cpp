#include <gtest/gtest.h>
#include <emtls/memory/bounded_queue.h>
#include <string>

using namespace emtls::v13;
using namespace emtls::v13::memory;

class BoundedQueueTest : public ::testing::Test {};

TEST_F(BoundedQueueTest, StartsEmpty) {
    BoundedQueue<int, 4> queue;
    EXPECT_TRUE(queue.empty());
    EXPECT_FALSE(queue.full());
    EXPECT_EQ(queue.size(), 0u);
    EXPECT_EQ((BoundedQueue<int, 4>::capacity()), 4u);
    EXPECT_FALSE(queue.pop().has_value());
}

TEST_F(BoundedQueueTest, PreservesOrder) {
    BoundedQueue<std::string, 3> queue;
    ASSERT_TRUE(queue.push("one"));
    ASSERT_TRUE(queue.push("two"));
    ASSERT_TRUE(queue.push("three"));

    EXPECT_EQ(*queue.pop(), "one");
    EXPECT_EQ(*queue.pop(), "two");
    EXPECT_EQ(*queue.pop(), "three");
    EXPECT_FALSE(queue.pop().has_value());
}

TEST_F(BoundedQueueTest, OverflowIsAnError) {
    BoundedQueue<int, 2> queue;
    ASSERT_TRUE(queue.push(1));
    ASSERT_TRUE(queue.push(2));
    EXPECT_TRUE(queue.full());

    auto result = queue.push(3);
    EXPECT_EQ(result.error(), TLSError::RECORD_QUEUE_FULL);
    EXPECT_EQ(queue.size(), 2u);
    EXPECT_EQ(*queue.pop(), 1);
    EXPECT_EQ(*queue.pop(), 2);
}

TEST_F(BoundedQueueTest, WrapsAround) {
    BoundedQueue<int, 3> queue;
    for (int round = 0; round < 5; ++round) {
        ASSERT_TRUE(queue.push(round * 10));
        ASSERT_TRUE(queue.push(round * 10 + 1));
        EXPECT_EQ(*queue.pop(), round * 10);
        EXPECT_EQ(*queue.pop(), round * 10 + 1);
    }
    EXPECT_TRUE(queue.empty());
}

TEST_F(BoundedQueueTest, Clear) {
    BoundedQueue<int, 2> queue;
    ASSERT_TRUE(queue.push(1));
    queue.clear();
    EXPECT_TRUE(queue.empty());
    ASSERT_TRUE(queue.push(2));
    EXPECT_EQ(*queue.pop(), 2);
}
