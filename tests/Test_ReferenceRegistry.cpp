#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>

import Core;
import Graphics;

using Graphics::ReferenceRegistry;

TEST(ReferenceRegistry, TwoAcquiresTwoReleasesUnloadOnce)
{
    ReferenceRegistry<int> registry;
    int loads = 0;
    int unloads = 0;
    auto load = [&]() -> Core::Expected<int> { ++loads; return 7; };
    auto unload = [&](const int& value) { EXPECT_EQ(value, 7); ++unloads; };

    auto first = registry.Acquire("crate", true, load);
    auto second = registry.Acquire("crate", true, load);
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(*first, *second);
    EXPECT_EQ(loads, 1);
    EXPECT_EQ(registry.GetReferenceCount("crate"), 2u);

    EXPECT_TRUE(registry.Release("crate", unload).has_value());
    EXPECT_EQ(unloads, 0);
    EXPECT_TRUE(registry.Release("crate", unload).has_value());
    EXPECT_EQ(unloads, 1);
    EXPECT_EQ(registry.GetReferenceCount("crate"), 0u);
    EXPECT_FALSE(registry.Contains("crate"));

    auto third = registry.Release("crate", unload);
    ASSERT_FALSE(third.has_value());
    EXPECT_EQ(third.error(), Core::ErrorCode::ResourceNotFound);
    EXPECT_EQ(unloads, 1);
}

TEST(ReferenceRegistry, NoAutoReleaseKeepsEntryAtZero)
{
    ReferenceRegistry<int> registry;
    int unloads = 0;
    auto unload = [&](const int&) { ++unloads; };

    ASSERT_TRUE(registry.Acquire("sticky", false, [] { return Core::Expected<int>(1); }).has_value());
    ASSERT_TRUE(registry.Release("sticky", unload).has_value());
    EXPECT_EQ(unloads, 0);
    EXPECT_TRUE(registry.Contains("sticky"));
    EXPECT_EQ(registry.Find("sticky"), 1);

    auto underflow = registry.Release("sticky", unload);
    ASSERT_FALSE(underflow.has_value());
    EXPECT_EQ(underflow.error(), Core::ErrorCode::InvalidState);

    registry.ReleaseAll(unload);
    EXPECT_EQ(unloads, 1);
    EXPECT_EQ(registry.Size(), 0u);
}

TEST(ReferenceRegistry, FailedLoadLeavesNoEntry)
{
    ReferenceRegistry<int> registry;
    auto result = registry.Acquire("broken", true, []() -> Core::Expected<int>
    {
        return std::unexpected(Core::ErrorCode::FileNotFound);
    });
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), Core::ErrorCode::FileNotFound);
    EXPECT_FALSE(registry.Contains("broken"));
    EXPECT_FALSE(registry.Find("broken").has_value());
}

TEST(ReferenceRegistry, ConcurrentAcquireLoadsOnce)
{
    ReferenceRegistry<int> registry;
    std::atomic<int> loads = 0;
    auto load = [&]() -> Core::Expected<int>
    {
        ++loads;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        return 99;
    };

    std::vector<std::thread> threads;
    std::atomic<int> hits = 0;
    for (int i = 0; i < 8; ++i)
    {
        threads.emplace_back([&]
        {
            if (auto value = registry.Acquire("shared", true, load); value && *value == 99)
                ++hits;
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(loads.load(), 1);
    EXPECT_EQ(hits.load(), 8);
    EXPECT_EQ(registry.GetReferenceCount("shared"), 8u);
}
