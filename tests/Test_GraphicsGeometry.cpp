#include <gtest/gtest.h>
#include <cmath>
#include <cstdint>
#include <string>
#include <variant>
#include <vector>

#include <glm/glm.hpp>

import Core;
import ECS;
import Graphics;
import Runtime;

#include "TestEngineHarness.h"

using namespace Graphics;

// -----------------------------------------------------------------------------
// Generators
// -----------------------------------------------------------------------------

TEST(GeometryGenerators, PlaneHasFourVerticesAndSixIndicesPerSegment)
{
    const auto config = GeometrySystem::GeneratePlaneConfig(10.0f, 4.0f, 3, 2, 1.0f, 1.0f, "floor", "stone");
    EXPECT_EQ(config.Name, "floor");
    EXPECT_EQ(config.MaterialName, "stone");
    EXPECT_EQ(config.GetVertexCount(), 3u * 2u * 4u);
    EXPECT_EQ(config.Indices.size(), 3u * 2u * 6u);
    EXPECT_EQ(config.GetVertexStride(), sizeof(Vertex3D));

    EXPECT_FLOAT_EQ(config.Extents.Min.x, -5.0f);
    EXPECT_FLOAT_EQ(config.Extents.Max.x, 5.0f);
    EXPECT_FLOAT_EQ(config.Extents.Min.y, -2.0f);
    EXPECT_FLOAT_EQ(config.Extents.Max.y, 2.0f);
    EXPECT_FLOAT_EQ(config.Extents.Min.z, 0.0f);
    EXPECT_FLOAT_EQ(config.Extents.Max.z, 0.0f);

    const auto& vertices = std::get<std::vector<Vertex3D>>(config.Vertices);
    for (const auto& vertex : vertices)
    {
        EXPECT_FLOAT_EQ(vertex.Normal.z, 1.0f);
        EXPECT_FLOAT_EQ(vertex.Position.z, 0.0f);
        EXPECT_LE(std::abs(vertex.Position.x), 5.0f);
        EXPECT_LE(std::abs(vertex.Position.y), 2.0f);
    }
    for (uint32_t index : config.Indices)
        EXPECT_LT(index, vertices.size());
}

TEST(GeometryGenerators, PlaneReplacesZeroParametersAndEmptyNames)
{
    const auto config = GeometrySystem::GeneratePlaneConfig(0.0f, 0.0f, 0, 0, 0.0f, 0.0f, "", "");
    EXPECT_EQ(config.Name, DEFAULT_GEOMETRY_NAME);
    EXPECT_EQ(config.MaterialName, DEFAULT_MATERIAL_NAME);
    EXPECT_EQ(config.GetVertexCount(), 4u);
    EXPECT_EQ(config.Indices.size(), 6u);
    EXPECT_FLOAT_EQ(config.Extents.Max.x, 0.5f);
    EXPECT_FLOAT_EQ(config.Extents.Max.y, 0.5f);
}

TEST(GeometryGenerators, CubeHasSixFacesWithOutwardNormals)
{
    const auto config = GeometrySystem::GenerateCubeConfig(2.0f, 4.0f, 6.0f, 1.0f, 1.0f, "box", "");
    EXPECT_EQ(config.GetVertexCount(), 24u);
    EXPECT_EQ(config.Indices.size(), 36u);
    EXPECT_EQ(config.MaterialName, DEFAULT_MATERIAL_NAME);

    EXPECT_FLOAT_EQ(config.Extents.Min.x, -1.0f);
    EXPECT_FLOAT_EQ(config.Extents.Max.y, 2.0f);
    EXPECT_FLOAT_EQ(config.Extents.Max.z, 3.0f);

    const auto& vertices = std::get<std::vector<Vertex3D>>(config.Vertices);
    for (const auto& vertex : vertices)
    {
        // Each vertex lies on the face its normal points out of.
        const glm::vec3 half(1.0f, 2.0f, 3.0f);
        const float along = glm::dot(vertex.Position, vertex.Normal);
        const float extent = glm::dot(half, glm::abs(vertex.Normal));
        EXPECT_NEAR(along, extent, 1e-5f);
    }
}

TEST(GeometryGenerators, TangentsFollowTheUAxis)
{
    const auto config = GeometrySystem::GeneratePlaneConfig(2.0f, 2.0f, 1, 1, 1.0f, 1.0f, "t", "m");
    const auto& vertices = std::get<std::vector<Vertex3D>>(config.Vertices);
    for (const auto& vertex : vertices)
    {
        EXPECT_NEAR(glm::length(vertex.Tangent), 1.0f, 1e-5f);
        EXPECT_NEAR(std::abs(vertex.Tangent.x), 1.0f, 1e-5f);
    }
}

TEST(GeometryGenerators, DegenerateTrianglesKeepZeroTangent)
{
    std::vector<Vertex3D> vertices(3);
    vertices[1].Position = {1.0f, 0.0f, 0.0f};
    vertices[2].Position = {0.0f, 1.0f, 0.0f};
    // Identical UVs give no tangent frame.
    GenerateTangents(vertices, {0, 1, 2});
    for (const auto& vertex : vertices)
        EXPECT_FLOAT_EQ(glm::length(vertex.Tangent), 0.0f);

    // Out-of-range indices are skipped.
    GenerateTangents(vertices, {0, 1, 7});
}

// -----------------------------------------------------------------------------
// GeometrySystem
// -----------------------------------------------------------------------------

namespace
{
    class GeometrySystemTest : public ::testing::Test
    {
    protected:
        void SetUp() override
        {
            ASSERT_TRUE(m_Harness.Engine->Initialize().has_value());
        }

        GeometrySystem& Geometries() { return m_Harness.Engine->GetGeometries(); }

        EngineHarness m_Harness;
    };
}

TEST_F(GeometrySystemTest, DefaultsUseTheDefaultMaterial)
{
    Geometry* geometry = Geometries().GetDefault();
    ASSERT_NE(geometry, nullptr);
    EXPECT_EQ(geometry->Name, DEFAULT_GEOMETRY_NAME);
    EXPECT_EQ(geometry->Material, m_Harness.Engine->GetMaterials().GetDefault());
    EXPECT_NE(geometry->InternalId, INVALID_ID);

    Geometry* geometry2D = Geometries().GetDefault2D();
    ASSERT_NE(geometry2D, nullptr);
    EXPECT_EQ(geometry2D->Name, DEFAULT_GEOMETRY_2D_NAME);
}

TEST_F(GeometrySystemTest, AcquireByNameCountsReferences)
{
    auto config = GeometrySystem::GenerateCubeConfig(1.0f, 1.0f, 1.0f, 1.0f, 1.0f, "crate", "");
    auto first = Geometries().AcquireFromConfig(config, true);
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(Geometries().GetLoadedCount(), 1u);

    auto second = Geometries().Acquire("crate");
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(*first, *second);
    EXPECT_EQ(Geometries().GetReferenceCount("crate"), 2u);
    EXPECT_FLOAT_EQ((*first)->Extents.Max.x, 0.5f);

    ASSERT_TRUE(Geometries().Release("crate").has_value());
    EXPECT_EQ(Geometries().GetReferenceCount("crate"), 1u);
    ASSERT_TRUE(Geometries().Release("crate").has_value());

    auto gone = Geometries().Acquire("crate");
    ASSERT_FALSE(gone.has_value());
    EXPECT_EQ(gone.error(), Core::ErrorCode::ResourceNotFound);
}

TEST_F(GeometrySystemTest, ConfigsNeedAName)
{
    auto config = GeometrySystem::GeneratePlaneConfig(1.0f, 1.0f, 1, 1, 1.0f, 1.0f, "p", "");
    config.Name.clear();
    auto result = Geometries().AcquireFromConfig(config, true);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), Core::ErrorCode::InvalidArgument);
}

TEST_F(GeometrySystemTest, GeometryHoldsAReferenceOnItsMaterial)
{
    MaterialConfig material;
    material.Name = "painted";
    material.ShaderName = std::string(BUILTIN_MATERIAL_SHADER_NAME);
    auto acquired = m_Harness.Engine->GetMaterials().AcquireFromConfig(material);
    ASSERT_TRUE(acquired.has_value());
    EXPECT_EQ(m_Harness.Engine->GetMaterials().GetReferenceCount("painted"), 1u);

    auto geometry = Geometries().AcquireFromConfig(
        GeometrySystem::GeneratePlaneConfig(1.0f, 1.0f, 1, 1, 1.0f, 1.0f, "panel", "painted"), true);
    ASSERT_TRUE(geometry.has_value());
    EXPECT_EQ((*geometry)->Material, *acquired);
    EXPECT_EQ(m_Harness.Engine->GetMaterials().GetReferenceCount("painted"), 2u);

    ASSERT_TRUE(Geometries().Release("panel").has_value());
    EXPECT_EQ(m_Harness.Engine->GetMaterials().GetReferenceCount("painted"), 1u);
}
