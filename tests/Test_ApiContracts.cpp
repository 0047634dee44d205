#include <gtest/gtest.h>
#include <expected>
#include <type_traits>
#include <variant>

import Core;
import ECS;
import Graphics;
import Runtime;

// Ownership contracts: systems are owned by the engine and handed out by reference.
static_assert(!std::is_copy_constructible_v<Graphics::Renderer>);
static_assert(!std::is_copy_assignable_v<Graphics::Renderer>);
static_assert(!std::is_copy_constructible_v<Graphics::TextureSystem>);
static_assert(!std::is_copy_constructible_v<Graphics::MaterialSystem>);
static_assert(!std::is_copy_constructible_v<Graphics::GeometrySystem>);
static_assert(!std::is_copy_constructible_v<Graphics::CameraSystem>);
static_assert(!std::is_copy_constructible_v<Runtime::Engine>);

static_assert(std::is_abstract_v<Graphics::IRendererBackend>);
static_assert(std::is_abstract_v<Runtime::Engine>);
static_assert(std::is_base_of_v<Graphics::IRendererBackend, Graphics::HeadlessBackend>);
static_assert(std::has_virtual_destructor_v<Graphics::IRendererBackend>);

static_assert(std::is_same_v<Core::Result, std::expected<Core::Unit, Core::ErrorCode>>);

// Handles are small value types.
static_assert(std::is_trivially_copyable_v<Graphics::GeometryHandle>);
static_assert(std::is_trivially_copyable_v<ECS::TransformHandle>);

static_assert(std::variant_size_v<Graphics::VertexData> == 2);

// Generation counter skips the tombstone value.
static_assert(Graphics::NextGeneration(Graphics::INVALID_GENERATION) == 0);
static_assert(Graphics::NextGeneration(0) == 1);
static_assert(Graphics::NextGeneration(254) == 0);

TEST(ApiContracts, MeshGenerationMarksLiveness)
{
    Graphics::Mesh mesh;
    EXPECT_FALSE(mesh.IsLive());

    mesh.MarkLoaded();
    EXPECT_TRUE(mesh.IsLive());
    EXPECT_EQ(mesh.Generation, 0u);

    mesh.MarkUnloaded();
    EXPECT_FALSE(mesh.IsLive());
    mesh.MarkLoaded();
    EXPECT_EQ(mesh.Generation, 0u);

    mesh.Generation = 254;
    mesh.MarkLoaded();
    EXPECT_EQ(mesh.Generation, 0u);
    EXPECT_TRUE(mesh.IsLive());
}

TEST(ApiContracts, ErrorCodesHaveNames)
{
    EXPECT_EQ(Core::ErrorCodeToString(Core::ErrorCode::SwapchainOutOfDate), "SwapchainOutOfDate");
    EXPECT_EQ(Core::ErrorCodeToString(Core::ErrorCode::TypeMismatch), "TypeMismatch");
}
