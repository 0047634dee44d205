#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>

import Core;

using namespace Core::Assets;

namespace
{
    void WriteFile(const std::filesystem::path& path, const std::string& contents)
    {
        std::filesystem::create_directories(path.parent_path());
        std::ofstream out(path, std::ios::binary);
        out << contents;
    }

    class AssetIndexTest : public ::testing::Test
    {
    protected:
        void SetUp() override
        {
            m_Root = std::filesystem::temp_directory_path() /
                     ("prism_assets_" + std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
            std::filesystem::remove_all(m_Root);
            std::filesystem::create_directories(m_Root);
        }

        void TearDown() override
        {
            std::error_code ec;
            std::filesystem::remove_all(m_Root, ec);
        }

        std::filesystem::path m_Root;
    };
}

TEST(CoreAssets, ClassifiesExtensions)
{
    EXPECT_EQ(ClassifyExtension(".png"), AssetType::Image);
    EXPECT_EQ(ClassifyExtension(".TGA"), AssetType::Image);
    EXPECT_EQ(ClassifyExtension(".jpeg"), AssetType::Image);
    EXPECT_EQ(ClassifyExtension(".amt"), AssetType::Material);
    EXPECT_EQ(ClassifyExtension(".shadercfg"), AssetType::Shader);
    EXPECT_EQ(ClassifyExtension(".spv"), AssetType::Binary);
    EXPECT_EQ(ClassifyExtension(".obj"), AssetType::Mesh);
    EXPECT_EQ(ClassifyExtension(".fnt"), AssetType::BitmapFont);
    EXPECT_EQ(ClassifyExtension(".fontcfg"), AssetType::SystemFont);
    EXPECT_EQ(ClassifyExtension(".txt"), AssetType::Text);
    EXPECT_EQ(ClassifyExtension(".exe"), AssetType::Unknown);
    EXPECT_EQ(ClassifyExtension(""), AssetType::Unknown);
}

TEST_F(AssetIndexTest, RescanIndexesByStemAndType)
{
    WriteFile(m_Root / "textures" / "cobblestone.png", "png");
    WriteFile(m_Root / "materials" / "cobblestone.amt", "name=cobblestone");
    WriteFile(m_Root / "shaders" / "builtin.spv", "spv");
    WriteFile(m_Root / "readme.md", "ignored");

    AssetIndex index(m_Root);
    auto scanned = index.Rescan();
    ASSERT_TRUE(scanned.has_value());
    EXPECT_EQ(*scanned, 3u);
    EXPECT_EQ(index.Count(), 3u);

    auto image = index.Find("cobblestone", AssetType::Image);
    ASSERT_TRUE(image.has_value());
    EXPECT_EQ(image->Path.filename(), "cobblestone.png");

    auto material = index.Find("cobblestone", AssetType::Material);
    ASSERT_TRUE(material.has_value());
    EXPECT_EQ(material->Path.filename(), "cobblestone.amt");

    EXPECT_FALSE(index.Find("readme", AssetType::Text).has_value());
    EXPECT_FALSE(index.Find("missing", AssetType::Image).has_value());
}

TEST_F(AssetIndexTest, MissingRootIsInvalidPath)
{
    AssetIndex index(m_Root / "does_not_exist");
    auto scanned = index.Rescan();
    ASSERT_FALSE(scanned.has_value());
    EXPECT_EQ(scanned.error(), Core::ErrorCode::InvalidPath);
}

TEST_F(AssetIndexTest, RescanReportsAddedAndRemoved)
{
    WriteFile(m_Root / "a.txt", "a");

    AssetIndex index(m_Root);
    int added = 0;
    int removed = 0;
    index.SetChangeCallback([&](const AssetEntry&, ChangeKind kind)
    {
        if (kind == ChangeKind::Added) ++added;
        if (kind == ChangeKind::Removed) ++removed;
    });

    ASSERT_TRUE(index.Rescan().has_value());
    EXPECT_EQ(added, 1);

    std::filesystem::remove(m_Root / "a.txt");
    WriteFile(m_Root / "b.txt", "b");
    ASSERT_TRUE(index.Rescan().has_value());
    EXPECT_EQ(added, 2);
    EXPECT_EQ(removed, 1);
    EXPECT_FALSE(index.Find("a", AssetType::Text).has_value());
    EXPECT_TRUE(index.Find("b", AssetType::Text).has_value());
}

TEST_F(AssetIndexTest, WatcherPicksUpNewFiles)
{
    AssetIndex index(m_Root);
    ASSERT_TRUE(index.Rescan().has_value());
    EXPECT_EQ(index.Count(), 0u);

    std::atomic<int> added = 0;
    index.SetChangeCallback([&added](const AssetEntry& entry, ChangeKind kind)
    {
        if (kind == ChangeKind::Added && entry.Name == "late") ++added;
    });

    index.StartWatching(std::chrono::milliseconds(10));
    EXPECT_TRUE(index.IsWatching());

    WriteFile(m_Root / "materials" / "late.amt", "name=late");

    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (!index.Find("late", AssetType::Material) && std::chrono::steady_clock::now() < deadline)
        std::this_thread::sleep_for(std::chrono::milliseconds(5));

    index.StopWatching();
    EXPECT_FALSE(index.IsWatching());
    EXPECT_TRUE(index.Find("late", AssetType::Material).has_value());
    EXPECT_EQ(added.load(), 1);
}

TEST_F(AssetIndexTest, FilesystemReadsTextAndBinary)
{
    WriteFile(m_Root / "hello.txt", "hello prism");

    auto text = Core::Filesystem::ReadText(m_Root / "hello.txt");
    ASSERT_TRUE(text.has_value());
    EXPECT_EQ(*text, "hello prism");

    auto bytes = Core::Filesystem::ReadBinary(m_Root / "hello.txt");
    ASSERT_TRUE(bytes.has_value());
    EXPECT_EQ(bytes->size(), 11u);

    auto missing = Core::Filesystem::ReadText(m_Root / "nope.txt");
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error(), Core::ErrorCode::FileNotFound);
}
