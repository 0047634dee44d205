#include <gtest/gtest.h>
#include <memory>
#include <string>

import Core;

using namespace Core;

TEST(CoreRingQueue, FillsToCapacityThenRejects)
{
    RingQueue<int> queue(3);

    EXPECT_TRUE(queue.IsEmpty());
    EXPECT_EQ(queue.Capacity(), 3u);

    EXPECT_TRUE(queue.Enqueue(1).has_value());
    EXPECT_TRUE(queue.Enqueue(2).has_value());
    EXPECT_TRUE(queue.Enqueue(3).has_value());
    EXPECT_TRUE(queue.IsFull());

    auto overflow = queue.Enqueue(4);
    ASSERT_FALSE(overflow.has_value());
    EXPECT_EQ(overflow.error(), ErrorCode::QueueFull);
    EXPECT_EQ(queue.Size(), 3u);
}

TEST(CoreRingQueue, DequeuesInInsertionOrder)
{
    RingQueue<int> queue(3);
    ASSERT_TRUE(queue.Enqueue(1).has_value());
    ASSERT_TRUE(queue.Enqueue(2).has_value());
    ASSERT_TRUE(queue.Enqueue(3).has_value());

    EXPECT_EQ(*queue.Dequeue(), 1);
    EXPECT_EQ(*queue.Dequeue(), 2);
    EXPECT_EQ(*queue.Dequeue(), 3);

    auto empty = queue.Dequeue();
    ASSERT_FALSE(empty.has_value());
    EXPECT_EQ(empty.error(), ErrorCode::QueueEmpty);
}

TEST(CoreRingQueue, WrapsAroundTheBuffer)
{
    RingQueue<int> queue(2);
    for (int i = 0; i < 10; ++i)
    {
        ASSERT_TRUE(queue.Enqueue(i).has_value());
        auto value = queue.Dequeue();
        ASSERT_TRUE(value.has_value());
        EXPECT_EQ(*value, i);
    }
    EXPECT_TRUE(queue.IsEmpty());
}

TEST(CoreRingQueue, PeekDoesNotConsume)
{
    RingQueue<std::string> queue(4);
    EXPECT_EQ(queue.Peek().error(), ErrorCode::QueueEmpty);

    ASSERT_TRUE(queue.Enqueue("first").has_value());
    ASSERT_TRUE(queue.Enqueue("second").has_value());

    auto head = queue.Peek();
    ASSERT_TRUE(head.has_value());
    EXPECT_EQ(**head, "first");
    EXPECT_EQ(queue.Size(), 2u);
}

TEST(CoreRingQueue, HoldsMoveOnlyTypes)
{
    RingQueue<std::unique_ptr<int>> queue(2);
    ASSERT_TRUE(queue.Enqueue(std::make_unique<int>(42)).has_value());

    auto value = queue.Dequeue();
    ASSERT_TRUE(value.has_value());
    ASSERT_NE(*value, nullptr);
    EXPECT_EQ(**value, 42);
}
