#include <gtest/gtest.h>
#include <string>
#include <vector>

import Core;
import ECS;
import Graphics;
import Runtime;

#include "TestEngineHarness.h"

using Runtime::EngineStage;

TEST(Engine, InitializeWalksTheStages)
{
    EngineHarness harness;
    EXPECT_EQ(harness.Engine->GetStage(), EngineStage::Uninitialized);

    ASSERT_TRUE(harness.Engine->Initialize().has_value());
    EXPECT_EQ(harness.Engine->GetStage(), EngineStage::Initialized);
    EXPECT_EQ(harness.Engine->Starts, 1u);

    // Built-in shaders and the default resources are ready.
    EXPECT_NE(harness.Engine->GetShaders().Get(Graphics::BUILTIN_MATERIAL_SHADER_NAME), nullptr);
    EXPECT_NE(harness.Engine->GetShaders().Get(Graphics::BUILTIN_UI_SHADER_NAME), nullptr);
    EXPECT_NE(harness.Engine->GetTextures().GetDefault(), nullptr);
    EXPECT_TRUE(harness.Engine->GetTextures().IsInitialized());

    auto again = harness.Engine->Initialize();
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error(), Core::ErrorCode::InvalidState);
}

TEST(Engine, TickNeedsAnInitializedEngine)
{
    EngineHarness harness;
    auto result = harness.Engine->Tick();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), Core::ErrorCode::InvalidState);
    EXPECT_EQ(harness.Engine->Updates, 0u);

    auto run = harness.Engine->Run();
    ASSERT_FALSE(run.has_value());
    EXPECT_EQ(run.error(), Core::ErrorCode::InvalidState);
}

TEST(Engine, TickCallsUpdateThenRender)
{
    EngineHarness harness;
    ASSERT_TRUE(harness.Engine->Initialize().has_value());

    for (int i = 0; i < 3; ++i)
        ASSERT_TRUE(harness.Engine->Tick().has_value());

    EXPECT_EQ(harness.Engine->Updates, 3u);
    EXPECT_EQ(harness.Engine->Renders, 3u);
    EXPECT_EQ(harness.Engine->GetFrameCount(), 3u);
    EXPECT_EQ(harness.Backend->Count("BeginFrame"), 3u);
    EXPECT_EQ(harness.Backend->Count("EndFrame"), 3u);
}

TEST(Engine, RunStopsWhenAsked)
{
    EngineHarness harness;
    ASSERT_TRUE(harness.Engine->Initialize().has_value());
    harness.Engine->Render = [](TestEngine& engine, Graphics::RenderPacket&) -> Core::Result
    {
        if (engine.Renders == 5)
            engine.Stop();
        return Core::Ok();
    };

    ASSERT_TRUE(harness.Engine->Run().has_value());
    EXPECT_EQ(harness.Engine->Renders, 5u);
    EXPECT_EQ(harness.Engine->GetFrameCount(), 5u);
    EXPECT_EQ(harness.Engine->Shutdowns, 1u);
    EXPECT_EQ(harness.Engine->GetStage(), EngineStage::Uninitialized);
}

TEST(Engine, UpdateErrorStopsRunAndShutsDown)
{
    EngineHarness harness;
    ASSERT_TRUE(harness.Engine->Initialize().has_value());
    harness.Engine->FailUpdateAt = 3;

    auto result = harness.Engine->Run();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), Core::ErrorCode::InvalidState);

    // The failing frame renders nothing.
    EXPECT_EQ(harness.Engine->Updates, 3u);
    EXPECT_EQ(harness.Engine->Renders, 2u);
    EXPECT_EQ(harness.Engine->GetFrameCount(), 2u);
    EXPECT_EQ(harness.Engine->Shutdowns, 1u);
    EXPECT_EQ(harness.Engine->GetStage(), EngineStage::Uninitialized);
}

TEST(Engine, RenderErrorSkipsDrawing)
{
    EngineHarness harness;
    ASSERT_TRUE(harness.Engine->Initialize().has_value());
    harness.Engine->Render = [](TestEngine&, Graphics::RenderPacket&) -> Core::Result
    {
        return Core::Err(Core::ErrorCode::OutOfMemory);
    };
    harness.Backend->Calls.clear();

    auto result = harness.Engine->Tick();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), Core::ErrorCode::OutOfMemory);
    EXPECT_TRUE(harness.Backend->Calls.empty());
}

TEST(Engine, ShutdownIsIdempotent)
{
    EngineHarness harness;
    harness.Engine->Shutdown();
    EXPECT_EQ(harness.Engine->Shutdowns, 0u);

    ASSERT_TRUE(harness.Engine->Initialize().has_value());
    harness.Engine->Shutdown();
    harness.Engine->Shutdown();
    EXPECT_EQ(harness.Engine->Shutdowns, 1u);
    EXPECT_EQ(harness.Engine->GetStage(), EngineStage::Uninitialized);
}

TEST(Engine, StageNamesArePrintable)
{
    EXPECT_EQ(Runtime::EngineStageToString(EngineStage::Uninitialized), "Uninitialized");
    EXPECT_EQ(Runtime::EngineStageToString(EngineStage::Running), "Running");
    EXPECT_EQ(Runtime::EngineStageToString(EngineStage::ShuttingDown), "ShuttingDown");
}

TEST(Engine, CustomViewListReplacesDefaults)
{
    auto config = MakeTestEngineConfig();
    config.RenderViews.push_back({"only_world", "", config.Width, config.Height, Graphics::RenderViewKind::World,
                                  {std::string(Graphics::BUILTIN_WORLD_PASS_NAME)}});
    EngineHarness harness(config);
    ASSERT_TRUE(harness.Engine->Initialize().has_value());

    EXPECT_EQ(harness.Engine->GetViews().GetViewCount(), 1u);
    EXPECT_NE(harness.View("only_world"), nullptr);
    EXPECT_EQ(harness.View("world"), nullptr);
}

TEST(Engine, ShaderNamesAreUnique)
{
    EngineHarness harness;
    ASSERT_TRUE(harness.Engine->Initialize().has_value());

    const auto builtins = Graphics::GetBuiltinShaderConfigs();
    auto duplicate = harness.Engine->GetShaders().Create(builtins.front());
    ASSERT_FALSE(duplicate.has_value());
    EXPECT_EQ(duplicate.error(), Core::ErrorCode::AlreadyExists);
}

TEST(Engine, MaterialsAreSharedByName)
{
    EngineHarness harness;
    ASSERT_TRUE(harness.Engine->Initialize().has_value());
    auto& materials = harness.Engine->GetMaterials();

    Graphics::MaterialConfig config;
    config.Name = "shared";
    config.ShaderName = std::string(Graphics::BUILTIN_MATERIAL_SHADER_NAME);
    auto first = materials.AcquireFromConfig(config);
    auto second = materials.Acquire("shared");
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(*first, *second);
    EXPECT_EQ(materials.GetReferenceCount("shared"), 2u);

    // Unnamed maps fall back to the default textures.
    EXPECT_EQ((*first)->DiffuseMap.Texture, harness.Engine->GetTextures().GetDefaultDiffuse());

    ASSERT_TRUE(materials.Release("shared").has_value());
    ASSERT_TRUE(materials.Release("shared").has_value());
    EXPECT_EQ(materials.GetReferenceCount("shared"), 0u);

    // Releasing the default material is a no-op.
    EXPECT_TRUE(materials.Release(Graphics::DEFAULT_MATERIAL_NAME).has_value());
}
