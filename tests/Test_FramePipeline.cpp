#include <gtest/gtest.h>
#include <algorithm>
#include <string>
#include <vector>

import Core;
import ECS;
import Graphics;
import Runtime;

#include "TestEngineHarness.h"

using namespace Graphics;

namespace
{
    // Renders an empty world view every frame.
    Core::Result RenderEmptyWorld(TestEngine& engine, RenderPacket& frame)
    {
        static std::vector<Mesh> noMeshes;
        auto built = engine.GetViews().Get("world").and_then([&](RenderView* view)
        {
            return engine.GetViews().BuildPacket(*view, MeshPacketData{&noMeshes, &engine.GetTransforms()});
        });
        if (!built) return std::unexpected(built.error());
        frame.Views.push_back(std::move(*built));
        return Core::Ok();
    }

    class FramePipelineTest : public ::testing::Test
    {
    protected:
        void SetUp() override
        {
            ASSERT_TRUE(m_Harness.Engine->Initialize().has_value());
            m_Harness.Engine->Render = RenderEmptyWorld;
            m_Harness.Backend->Calls.clear();
        }

        [[nodiscard]] std::vector<std::string>& Calls() { return m_Harness.Backend->Calls; }

        EngineHarness m_Harness;
    };

    const std::string kWorldBegin = "PassBegin:" + std::string(BUILTIN_WORLD_PASS_NAME);
    const std::string kWorldEnd = "PassEnd:" + std::string(BUILTIN_WORLD_PASS_NAME);
}

TEST_F(FramePipelineTest, FrameIsBracketedByBeginAndEnd)
{
    ASSERT_TRUE(m_Harness.Engine->Tick().has_value());
    const std::vector<std::string> expected{"BeginFrame", kWorldBegin, kWorldEnd, "EndFrame"};
    EXPECT_EQ(Calls(), expected);
    EXPECT_EQ(m_Harness.Engine->GetRenderer().GetFrameNumber(), 1u);
    EXPECT_EQ(m_Harness.Backend->GetStats().FramesEnded, 1u);
}

TEST_F(FramePipelineTest, OutOfDateSwapchainSkipsTheFrame)
{
    m_Harness.Backend->FailBeginFrame = Core::ErrorCode::SwapchainOutOfDate;
    ASSERT_TRUE(m_Harness.Engine->Tick().has_value());

    const std::vector<std::string> expected{"BeginFrame"};
    EXPECT_EQ(Calls(), expected);

    // The next frame renders normally.
    m_Harness.Backend->FailBeginFrame.reset();
    Calls().clear();
    ASSERT_TRUE(m_Harness.Engine->Tick().has_value());
    EXPECT_EQ(m_Harness.Backend->Count("EndFrame"), 1u);
}

TEST_F(FramePipelineTest, OtherBeginFrameErrorsAreReturned)
{
    m_Harness.Backend->FailBeginFrame = Core::ErrorCode::FrameSubmitFailed;
    auto result = m_Harness.Engine->Tick();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), Core::ErrorCode::FrameSubmitFailed);
    EXPECT_EQ(m_Harness.Backend->Count(kWorldBegin), 0u);
    EXPECT_EQ(m_Harness.Engine->GetFrameCount(), 0u);
}

TEST_F(FramePipelineTest, EndFrameErrorsAreReturned)
{
    m_Harness.Backend->FailEndFrame = Core::ErrorCode::FrameSubmitFailed;
    auto result = m_Harness.Engine->Tick();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), Core::ErrorCode::FrameSubmitFailed);
    EXPECT_EQ(m_Harness.Backend->Count(kWorldEnd), 1u);
}

TEST_F(FramePipelineTest, ResizeWaitsForTheDebounceWindow)
{
    m_Harness.Engine->OnWindowResized(800, 600);
    EXPECT_TRUE(m_Harness.Engine->GetRenderer().IsResizing());

    // ResizeDebounceFrames is 3: two quiet frames, the third applies.
    ASSERT_TRUE(m_Harness.Engine->Tick().has_value());
    ASSERT_TRUE(m_Harness.Engine->Tick().has_value());
    EXPECT_TRUE(Calls().empty());

    ASSERT_TRUE(m_Harness.Engine->Tick().has_value());
    ASSERT_GE(Calls().size(), 2u);
    EXPECT_EQ(Calls()[0], "Resized:800x600");
    EXPECT_EQ(Calls()[1], "BeginFrame");
    EXPECT_FALSE(m_Harness.Engine->GetRenderer().IsResizing());

    RenderView* world = m_Harness.View("world");
    ASSERT_NE(world, nullptr);
    EXPECT_EQ(world->Width, 800u);
    EXPECT_EQ(world->Height, 600u);
}

TEST_F(FramePipelineTest, NewResizeRestartsTheDebounce)
{
    m_Harness.Engine->OnWindowResized(800, 600);
    ASSERT_TRUE(m_Harness.Engine->Tick().has_value());
    ASSERT_TRUE(m_Harness.Engine->Tick().has_value());

    m_Harness.Engine->OnWindowResized(1024, 768);
    ASSERT_TRUE(m_Harness.Engine->Tick().has_value());
    ASSERT_TRUE(m_Harness.Engine->Tick().has_value());
    EXPECT_EQ(m_Harness.Backend->Count("Resized:800x600"), 0u);
    EXPECT_TRUE(Calls().empty());

    ASSERT_TRUE(m_Harness.Engine->Tick().has_value());
    EXPECT_EQ(m_Harness.Backend->Count("Resized:1024x768"), 1u);
    EXPECT_EQ(m_Harness.Backend->Count("Resized:800x600"), 0u);
}

TEST_F(FramePipelineTest, ViewsRenderInSubmissionOrder)
{
    m_Harness.Engine->Render = [](TestEngine& engine, RenderPacket& frame) -> Core::Result
    {
        static std::vector<Mesh> noMeshes;
        auto ui = engine.GetViews().Get("ui").and_then([&](RenderView* view)
        {
            return engine.GetViews().BuildPacket(*view, UIPacketData{&noMeshes, nullptr, &engine.GetTransforms()});
        });
        if (!ui) return std::unexpected(ui.error());
        frame.Views.push_back(std::move(*ui));
        return RenderEmptyWorld(engine, frame);
    };
    ASSERT_TRUE(m_Harness.Engine->Tick().has_value());

    const auto uiBegin = std::find(Calls().begin(), Calls().end(), "PassBegin:" + std::string(BUILTIN_UI_PASS_NAME));
    const auto worldBegin = std::find(Calls().begin(), Calls().end(), kWorldBegin);
    ASSERT_NE(uiBegin, Calls().end());
    ASSERT_NE(worldBegin, Calls().end());
    EXPECT_LT(uiBegin, worldBegin);
}

TEST_F(FramePipelineTest, RenderPassNamesAreUnique)
{
    RenderPassConfig config;
    config.Name = std::string(BUILTIN_WORLD_PASS_NAME);
    auto duplicate = m_Harness.Engine->GetRenderer().CreateRenderPass(config);
    ASSERT_FALSE(duplicate.has_value());
    EXPECT_EQ(duplicate.error(), Core::ErrorCode::AlreadyExists);

    config.Name.clear();
    auto unnamed = m_Harness.Engine->GetRenderer().CreateRenderPass(config);
    ASSERT_FALSE(unnamed.has_value());
    EXPECT_EQ(unnamed.error(), Core::ErrorCode::InvalidArgument);

    auto missing = m_Harness.Engine->GetRenderer().GetRenderPass("Renderpass.Missing");
    EXPECT_FALSE(missing.has_value());
}
