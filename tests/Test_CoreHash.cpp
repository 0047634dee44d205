#include <gtest/gtest.h>
#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>

import Core;

using namespace Core::Hash;

TEST(CoreHash, HashStringIsFnv1a)
{
    EXPECT_EQ(HashString(""), 2166136261u);
    EXPECT_EQ(HashString("a"), (2166136261u ^ static_cast<uint32_t>('a')) * 16777619u);
    EXPECT_NE(HashString("diffuse_texture"), HashString("Diffuse_texture"));

    static_assert(HashString("model") == HashString(std::string_view("model")));
}

TEST(CoreHash, StringIdKeysUniformLookups)
{
    std::unordered_map<StringID, uint16_t> lookup;
    lookup.emplace(StringID("projection"), 0);
    lookup.emplace(StringID("view"), 1);

    const std::string name = "view";
    auto it = lookup.find(StringID(std::string_view(name)));
    ASSERT_NE(it, lookup.end());
    EXPECT_EQ(it->second, 1u);
    EXPECT_EQ(lookup.find(StringID("model")), lookup.end());
    EXPECT_EQ(StringID("view"), StringID(HashString("view")));
}

TEST(CoreHash, StringHashProbesWithoutAllocating)
{
    std::unordered_map<std::string, int, StringHash, std::equal_to<>> map;
    map.emplace("Renderpass.Builtin.World", 1);

    constexpr std::string_view key = "Renderpass.Builtin.World";
    EXPECT_TRUE(map.contains(key));
    EXPECT_TRUE(map.contains("Renderpass.Builtin.World"));
    EXPECT_FALSE(map.contains(std::string_view("Renderpass.Builtin.UI")));
}

TEST(CoreHash, HandlesHashByIndexAndGeneration)
{
    struct SlotTag {};
    using Handle = Core::StrongHandle<SlotTag>;

    std::unordered_set<Handle> seen;
    seen.insert(Handle(3, 0));
    seen.insert(Handle(3, 1));
    seen.insert(Handle(3, 0));
    EXPECT_EQ(seen.size(), 2u);

    // Same slot, later generation: a different handle.
    EXPECT_NE(Handle(3, 0), Handle(3, 1));
    EXPECT_LT(Handle(2, 9), Handle(3, 0));
}
