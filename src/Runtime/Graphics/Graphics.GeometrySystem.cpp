module;
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>
#include <glm/glm.hpp>

module Graphics;

namespace Graphics
{
    void GenerateTangents(std::vector<Vertex3D>& vertices, const std::vector<uint32_t>& indices)
    {
        for (size_t i = 0; i + 2 < indices.size(); i += 3)
        {
            const uint32_t i0 = indices[i];
            const uint32_t i1 = indices[i + 1];
            const uint32_t i2 = indices[i + 2];
            if (i0 >= vertices.size() || i1 >= vertices.size() || i2 >= vertices.size()) continue;

            const glm::vec3 edge1 = vertices[i1].Position - vertices[i0].Position;
            const glm::vec3 edge2 = vertices[i2].Position - vertices[i0].Position;

            const float deltaU1 = vertices[i1].Texcoord.x - vertices[i0].Texcoord.x;
            const float deltaV1 = vertices[i1].Texcoord.y - vertices[i0].Texcoord.y;
            const float deltaU2 = vertices[i2].Texcoord.x - vertices[i0].Texcoord.x;
            const float deltaV2 = vertices[i2].Texcoord.y - vertices[i0].Texcoord.y;

            const float dividend = deltaU1 * deltaV2 - deltaU2 * deltaV1;
            if (std::abs(dividend) < 1e-8f) continue;

            const float fc = 1.0f / dividend;
            glm::vec3 tangent = glm::normalize(fc * (deltaV2 * edge1 - deltaV1 * edge2));

            // Mirrored UVs flip the tangent.
            const float handedness = (deltaV1 * deltaU2 - deltaV2 * deltaU1) < 0.0f ? -1.0f : 1.0f;
            tangent *= handedness;

            vertices[i0].Tangent = tangent;
            vertices[i1].Tangent = tangent;
            vertices[i2].Tangent = tangent;
        }
    }

    GeometrySystem::GeometrySystem(Renderer& renderer, MaterialSystem& materials)
        : m_Renderer(renderer), m_Materials(materials)
    {
    }

    GeometrySystem::~GeometrySystem()
    {
        Shutdown();
    }

    Core::Result GeometrySystem::Initialize(const GeometrySystemConfig& config)
    {
        if (config.MaxGeometryCount == 0)
        {
            Core::Log::Error("GeometrySystem: MaxGeometryCount must be > 0.");
            return Core::Err(Core::ErrorCode::InvalidArgument);
        }
        m_Config = config;
        m_Pool.Initialize(config.FramesInFlight, config.MaxGeometryCount);

        if (auto defaults = CreateDefaultGeometries(); !defaults)
            return defaults;

        m_Initialized = true;
        return Core::Ok();
    }

    void GeometrySystem::Shutdown()
    {
        if (!m_Initialized) return;

        m_Registry.ReleaseAll([this](const GeometryHandle& handle)
        {
            if (Geometry* geometry = m_Pool.TryGet(handle))
                DestroyGeometry(*geometry);
        });
        m_Pool.Clear();

        DestroyGeometry(m_DefaultGeometry);
        DestroyGeometry(m_Default2DGeometry);
        m_Initialized = false;
    }

    Core::Result GeometrySystem::CreateDefaultGeometries()
    {
        constexpr float f = 10.0f;

        std::vector<Vertex3D> vertices(4);
        vertices[0].Position = {-0.5f * f, -0.5f * f, 0.0f};
        vertices[0].Texcoord = {0.0f, 0.0f};
        vertices[1].Position = {0.5f * f, 0.5f * f, 0.0f};
        vertices[1].Texcoord = {1.0f, 1.0f};
        vertices[2].Position = {-0.5f * f, 0.5f * f, 0.0f};
        vertices[2].Texcoord = {0.0f, 1.0f};
        vertices[3].Position = {0.5f * f, -0.5f * f, 0.0f};
        vertices[3].Texcoord = {1.0f, 0.0f};

        GeometryConfig config;
        config.Name = std::string(DEFAULT_GEOMETRY_NAME);
        config.MaterialName = std::string(DEFAULT_MATERIAL_NAME);
        config.Indices = {0, 1, 2, 0, 3, 1};
        config.Extents = {{-0.5f * f, -0.5f * f, 0.0f}, {0.5f * f, 0.5f * f, 0.0f}};
        config.Vertices = std::move(vertices);

        if (auto created = CreateGeometry(config, m_DefaultGeometry); !created)
        {
            Core::Log::Error("GeometrySystem: failed to create the default geometry.");
            return created;
        }

        std::vector<Vertex2D> vertices2D(4);
        vertices2D[0] = {{-0.5f * f, -0.5f * f}, {0.0f, 0.0f}};
        vertices2D[1] = {{0.5f * f, 0.5f * f}, {1.0f, 1.0f}};
        vertices2D[2] = {{-0.5f * f, 0.5f * f}, {0.0f, 1.0f}};
        vertices2D[3] = {{0.5f * f, -0.5f * f}, {1.0f, 0.0f}};

        GeometryConfig config2D;
        config2D.Name = std::string(DEFAULT_GEOMETRY_2D_NAME);
        config2D.MaterialName = std::string(DEFAULT_MATERIAL_NAME);
        // Counter-clockwise for the UI's flipped Y.
        config2D.Indices = {2, 1, 0, 3, 0, 1};
        config2D.Extents = config.Extents;
        config2D.Vertices = std::move(vertices2D);

        if (auto created = CreateGeometry(config2D, m_Default2DGeometry); !created)
        {
            Core::Log::Error("GeometrySystem: failed to create the default 2D geometry.");
            return created;
        }
        return Core::Ok();
    }

    Core::Result GeometrySystem::CreateGeometry(const GeometryConfig& config, Geometry& geometry)
    {
        const auto bytes = std::visit([](const auto& vertices) { return std::as_bytes(std::span(vertices)); }, config.Vertices);

        geometry.Name = config.Name;
        if (auto created = m_Renderer.Backend().GeometryCreate(geometry, bytes, config.GetVertexStride(),
                                                               config.GetVertexCount(), config.Indices); !created)
        {
            Core::Log::Error("GeometrySystem: backend rejected geometry '{}'.", config.Name);
            return created;
        }

        geometry.Center = config.Center;
        geometry.Extents = config.Extents;

        if (config.MaterialName.empty())
        {
            geometry.Material = m_Materials.GetDefault();
        }
        else if (auto material = m_Materials.Acquire(config.MaterialName))
        {
            geometry.Material = *material;
        }
        else
        {
            Core::Log::Warn("GeometrySystem: material '{}' of '{}' failed to load, using default.", config.MaterialName, config.Name);
            geometry.Material = m_Materials.GetDefault();
        }
        return Core::Ok();
    }

    void GeometrySystem::DestroyGeometry(Geometry& geometry)
    {
        m_Renderer.Backend().GeometryDestroy(geometry);

        if (geometry.Material && geometry.Material != m_Materials.GetDefault())
        {
            if (auto released = m_Materials.Release(geometry.Material->Name); !released)
                Core::Log::Warn("GeometrySystem: could not release material '{}' of '{}'.", geometry.Material->Name, geometry.Name);
        }
        geometry.Material = nullptr;
    }

    Core::Expected<Geometry*> GeometrySystem::AcquireFromConfig(const GeometryConfig& config, bool autoRelease)
    {
        if (config.Name.empty())
        {
            Core::Log::Error("GeometrySystem: geometry configs need a name.");
            return std::unexpected(Core::ErrorCode::InvalidArgument);
        }

        auto handle = m_Registry.Acquire(config.Name, autoRelease, [&]() -> Core::Expected<GeometryHandle>
        {
            auto entry = m_Pool.Create();
            if (!entry)
            {
                Core::Log::Error("GeometrySystem: no free slot for '{}' (max {}).", config.Name, m_Config.MaxGeometryCount);
                return entry;
            }

            Geometry* geometry = m_Pool.TryGet(*entry);
            geometry->Id = entry->Index;
            if (auto created = CreateGeometry(config, *geometry); !created)
            {
                m_Pool.Remove(*entry, m_FrameNumber);
                return std::unexpected(created.error());
            }
            return *entry;
        });
        if (!handle) return std::unexpected(handle.error());
        return m_Pool.Get(*handle);
    }

    Core::Expected<Geometry*> GeometrySystem::Acquire(std::string_view name)
    {
        auto handle = m_Registry.Acquire(name, true, [&]() -> Core::Expected<GeometryHandle>
        {
            Core::Log::Error("GeometrySystem: no geometry named '{}'.", name);
            return std::unexpected(Core::ErrorCode::ResourceNotFound);
        });
        if (!handle) return std::unexpected(handle.error());
        return m_Pool.Get(*handle);
    }

    Core::Result GeometrySystem::Release(std::string_view name)
    {
        return m_Registry.Release(name, [this](const GeometryHandle& handle)
        {
            if (Geometry* geometry = m_Pool.TryGet(handle))
            {
                DestroyGeometry(*geometry);
                m_Pool.Remove(handle, m_FrameNumber);
            }
        });
    }

    void GeometrySystem::ProcessDeletions(uint64_t frameNumber)
    {
        m_FrameNumber = frameNumber;
        m_Pool.ProcessDeletions(frameNumber);
    }

    GeometryConfig GeometrySystem::GeneratePlaneConfig(float width, float height,
                                                       uint32_t xSegmentCount, uint32_t ySegmentCount,
                                                       float tileX, float tileY,
                                                       std::string_view name, std::string_view materialName)
    {
        if (width == 0.0f) { Core::Log::Warn("Plane width is 0, using 1."); width = 1.0f; }
        if (height == 0.0f) { Core::Log::Warn("Plane height is 0, using 1."); height = 1.0f; }
        if (xSegmentCount == 0) { Core::Log::Warn("Plane x segment count is 0, using 1."); xSegmentCount = 1; }
        if (ySegmentCount == 0) { Core::Log::Warn("Plane y segment count is 0, using 1."); ySegmentCount = 1; }
        if (tileX == 0.0f) { Core::Log::Warn("Plane tile_x is 0, using 1."); tileX = 1.0f; }
        if (tileY == 0.0f) { Core::Log::Warn("Plane tile_y is 0, using 1."); tileY = 1.0f; }

        const size_t segmentCount = static_cast<size_t>(xSegmentCount) * ySegmentCount;
        std::vector<Vertex3D> vertices(segmentCount * 4);
        std::vector<uint32_t> indices(segmentCount * 6);

        const float segmentWidth = width / static_cast<float>(xSegmentCount);
        const float segmentHeight = height / static_cast<float>(ySegmentCount);
        const float halfWidth = width * 0.5f;
        const float halfHeight = height * 0.5f;

        for (uint32_t y = 0; y < ySegmentCount; ++y)
        {
            for (uint32_t x = 0; x < xSegmentCount; ++x)
            {
                const float minX = static_cast<float>(x) * segmentWidth - halfWidth;
                const float minY = static_cast<float>(y) * segmentHeight - halfHeight;
                const float maxX = minX + segmentWidth;
                const float maxY = minY + segmentHeight;
                const float minU = (static_cast<float>(x) / static_cast<float>(xSegmentCount)) * tileX;
                const float minV = (static_cast<float>(y) / static_cast<float>(ySegmentCount)) * tileY;
                const float maxU = (static_cast<float>(x + 1) / static_cast<float>(xSegmentCount)) * tileX;
                const float maxV = (static_cast<float>(y + 1) / static_cast<float>(ySegmentCount)) * tileY;

                const uint32_t v = (y * xSegmentCount + x) * 4;
                vertices[v + 0].Position = {minX, minY, 0.0f};
                vertices[v + 0].Texcoord = {minU, minV};
                vertices[v + 1].Position = {maxX, maxY, 0.0f};
                vertices[v + 1].Texcoord = {maxU, maxV};
                vertices[v + 2].Position = {minX, maxY, 0.0f};
                vertices[v + 2].Texcoord = {minU, maxV};
                vertices[v + 3].Position = {maxX, minY, 0.0f};
                vertices[v + 3].Texcoord = {maxU, minV};
                for (uint32_t k = 0; k < 4; ++k)
                    vertices[v + k].Normal = {0.0f, 0.0f, 1.0f};

                const size_t i = static_cast<size_t>(y * xSegmentCount + x) * 6;
                indices[i + 0] = v + 0;
                indices[i + 1] = v + 1;
                indices[i + 2] = v + 2;
                indices[i + 3] = v + 0;
                indices[i + 4] = v + 3;
                indices[i + 5] = v + 1;
            }
        }

        GenerateTangents(vertices, indices);

        GeometryConfig config;
        config.Name = name.empty() ? std::string(DEFAULT_GEOMETRY_NAME) : std::string(name);
        config.MaterialName = materialName.empty() ? std::string(DEFAULT_MATERIAL_NAME) : std::string(materialName);
        config.Center = glm::vec3(0.0f);
        config.Extents = {{-halfWidth, -halfHeight, 0.0f}, {halfWidth, halfHeight, 0.0f}};
        config.Vertices = std::move(vertices);
        config.Indices = std::move(indices);
        return config;
    }

    GeometryConfig GeometrySystem::GenerateCubeConfig(float width, float height, float depth,
                                                      float tileX, float tileY,
                                                      std::string_view name, std::string_view materialName)
    {
        if (width == 0.0f) { Core::Log::Warn("Cube width is 0, using 1."); width = 1.0f; }
        if (height == 0.0f) { Core::Log::Warn("Cube height is 0, using 1."); height = 1.0f; }
        if (depth == 0.0f) { Core::Log::Warn("Cube depth is 0, using 1."); depth = 1.0f; }
        if (tileX == 0.0f) { Core::Log::Warn("Cube tile_x is 0, using 1."); tileX = 1.0f; }
        if (tileY == 0.0f) { Core::Log::Warn("Cube tile_y is 0, using 1."); tileY = 1.0f; }

        const float hw = width * 0.5f;
        const float hh = height * 0.5f;
        const float hd = depth * 0.5f;

        struct Face
        {
            glm::vec3 Normal;
            glm::vec3 Corners[4];
        };

        // Corner order per face: (minU,minV), (maxU,maxV), (minU,maxV), (maxU,minV).
        const Face faces[6] = {
            {{0.0f, 0.0f, 1.0f}, {{-hw, -hh, hd}, {hw, hh, hd}, {-hw, hh, hd}, {hw, -hh, hd}}},       // front
            {{0.0f, 0.0f, -1.0f}, {{hw, -hh, -hd}, {-hw, hh, -hd}, {hw, hh, -hd}, {-hw, -hh, -hd}}},  // back
            {{-1.0f, 0.0f, 0.0f}, {{-hw, -hh, -hd}, {-hw, hh, hd}, {-hw, hh, -hd}, {-hw, -hh, hd}}},  // left
            {{1.0f, 0.0f, 0.0f}, {{hw, -hh, hd}, {hw, hh, -hd}, {hw, hh, hd}, {hw, -hh, -hd}}},       // right
            {{0.0f, -1.0f, 0.0f}, {{hw, -hh, hd}, {-hw, -hh, -hd}, {hw, -hh, -hd}, {-hw, -hh, hd}}},  // bottom
            {{0.0f, 1.0f, 0.0f}, {{-hw, hh, hd}, {hw, hh, -hd}, {-hw, hh, -hd}, {hw, hh, hd}}},       // top
        };
        const glm::vec2 uvs[4] = {{0.0f, 0.0f}, {tileX, tileY}, {0.0f, tileY}, {tileX, 0.0f}};

        std::vector<Vertex3D> vertices(24);
        std::vector<uint32_t> indices(36);
        for (uint32_t f = 0; f < 6; ++f)
        {
            for (uint32_t k = 0; k < 4; ++k)
            {
                Vertex3D& vertex = vertices[f * 4 + k];
                vertex.Position = faces[f].Corners[k];
                vertex.Normal = faces[f].Normal;
                vertex.Texcoord = uvs[k];
            }

            const uint32_t v = f * 4;
            const uint32_t i = f * 6;
            indices[i + 0] = v + 0;
            indices[i + 1] = v + 1;
            indices[i + 2] = v + 2;
            indices[i + 3] = v + 0;
            indices[i + 4] = v + 3;
            indices[i + 5] = v + 1;
        }

        GenerateTangents(vertices, indices);

        GeometryConfig config;
        config.Name = name.empty() ? std::string(DEFAULT_GEOMETRY_NAME) : std::string(name);
        config.MaterialName = materialName.empty() ? std::string(DEFAULT_MATERIAL_NAME) : std::string(materialName);
        config.Center = glm::vec3(0.0f);
        config.Extents = {{-hw, -hh, -hd}, {hw, hh, hd}};
        config.Vertices = std::move(vertices);
        config.Indices = std::move(indices);
        return config;
    }
}
