#include <gtest/gtest.h>
#include <memory>
#include <string>

import Core;

namespace
{
    struct TestTag {};
    using Handle = Core::StrongHandle<TestTag>;
    using Pool = Core::ResourcePool<std::string, Handle>;
}

TEST(ResourcePool, RemoveDefersFreeUntilFramesInFlightPassed)
{
    Pool pool;
    pool.Initialize(2, 0);

    auto h0 = pool.Create("first");
    ASSERT_TRUE(h0.has_value());
    EXPECT_TRUE(h0->IsValid());
    EXPECT_EQ(**pool.Get(*h0), "first");

    // Removed at frame 10: hidden at once, freed after frame 12.
    EXPECT_TRUE(pool.Remove(*h0, 10));
    EXPECT_EQ(pool.TryGet(*h0), nullptr);
    EXPECT_EQ(pool.Size(), 0u);
    EXPECT_EQ(pool.GetPendingDeletionCount(), 1u);

    pool.ProcessDeletions(12);
    EXPECT_EQ(pool.GetPendingDeletionCount(), 1u);

    pool.ProcessDeletions(13);
    EXPECT_EQ(pool.GetPendingDeletionCount(), 0u);

    // The slot is recycled with a new generation.
    auto h1 = pool.Create("second");
    ASSERT_TRUE(h1.has_value());
    EXPECT_EQ(h1->Index, h0->Index);
    EXPECT_NE(h1->Generation, h0->Generation);

    auto stale = pool.Get(*h0);
    ASSERT_FALSE(stale.has_value());
    EXPECT_EQ(stale.error(), Core::ErrorCode::ResourceNotFound);
    EXPECT_EQ(**pool.Get(*h1), "second");
}

TEST(ResourcePool, RemoveTwiceIsRejected)
{
    Pool pool;
    pool.Initialize(0, 0);

    auto handle = pool.Create("x");
    ASSERT_TRUE(handle.has_value());
    EXPECT_TRUE(pool.Remove(*handle, 0));
    EXPECT_FALSE(pool.Remove(*handle, 0));
    EXPECT_FALSE(pool.Remove(Handle::Invalid(), 0));
}

TEST(ResourcePool, MaxCountExhausts)
{
    Pool pool;
    pool.Initialize(2, 2);

    ASSERT_TRUE(pool.Create("a").has_value());
    ASSERT_TRUE(pool.Create("b").has_value());

    auto third = pool.Create("c");
    ASSERT_FALSE(third.has_value());
    EXPECT_EQ(third.error(), Core::ErrorCode::ResourceExhausted);
}

TEST(ResourcePool, AddressesStayStableAcrossGrowth)
{
    Pool pool;
    pool.Initialize(2, 0);

    auto first = pool.Add(std::make_unique<std::string>("anchor"));
    ASSERT_TRUE(first.has_value());
    const std::string* before = pool.TryGet(*first);

    for (int i = 0; i < 256; ++i)
        ASSERT_TRUE(pool.Create(std::to_string(i)).has_value());

    EXPECT_EQ(pool.TryGet(*first), before);
    EXPECT_EQ(pool.Size(), 257u);
}

TEST(ResourcePool, ClearDropsPendingDeletions)
{
    Pool pool;
    pool.Initialize(2, 0);

    auto handle = pool.Create("x");
    ASSERT_TRUE(handle.has_value());
    ASSERT_TRUE(pool.Remove(*handle, 1));

    pool.Clear();
    EXPECT_EQ(pool.Size(), 0u);
    EXPECT_EQ(pool.GetPendingDeletionCount(), 0u);
}

TEST(StrongHandle, DefaultIsInvalid)
{
    Handle h;
    EXPECT_FALSE(h.IsValid());
    EXPECT_FALSE(static_cast<bool>(h));
    EXPECT_EQ(h, Handle::Invalid());

    Handle zero(0, 1);
    EXPECT_TRUE(zero.IsValid());
    EXPECT_NE(zero, Handle(0, 2));
}
