module;
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>
#include <glm/glm.hpp>

export module Graphics:Geometry;
import :Texture;
import :Material;

export namespace Graphics
{
    inline constexpr std::string_view DEFAULT_GEOMETRY_NAME = "default";
    inline constexpr std::string_view DEFAULT_GEOMETRY_2D_NAME = "default_2d";

    struct Vertex3D
    {
        glm::vec3 Position{0.0f};
        glm::vec3 Normal{0.0f};
        glm::vec2 Texcoord{0.0f};
        glm::vec4 Colour{1.0f};
        glm::vec3 Tangent{0.0f};
    };

    struct Vertex2D
    {
        glm::vec2 Position{0.0f};
        glm::vec2 Texcoord{0.0f};
    };

    struct Extents3D
    {
        glm::vec3 Min{0.0f};
        glm::vec3 Max{0.0f};
    };

    using VertexData = std::variant<std::vector<Vertex3D>, std::vector<Vertex2D>>;

    struct GeometryConfig
    {
        VertexData Vertices;
        std::vector<uint32_t> Indices;
        glm::vec3 Center{0.0f};
        Extents3D Extents;
        std::string Name;
        std::string MaterialName;

        [[nodiscard]] uint32_t GetVertexCount() const
        {
            return static_cast<uint32_t>(std::visit([](const auto& v) { return v.size(); }, Vertices));
        }

        [[nodiscard]] uint32_t GetVertexStride() const
        {
            return std::holds_alternative<std::vector<Vertex3D>>(Vertices)
                ? static_cast<uint32_t>(sizeof(Vertex3D))
                : static_cast<uint32_t>(sizeof(Vertex2D));
        }
    };

    struct Geometry
    {
        uint32_t Id = INVALID_ID;
        // Backend-side geometry slot.
        uint32_t InternalId = INVALID_ID;
        uint32_t Generation = INVALID_ID;
        glm::vec3 Center{0.0f};
        Extents3D Extents;
        std::string Name;
        Graphics::Material* Material = nullptr;
    };

    // One draw: a geometry with its world matrix and the id of the object it belongs to.
    struct GeometryRenderData
    {
        glm::mat4 Model{1.0f};
        Graphics::Geometry* Geometry = nullptr;
        uint32_t UniqueId = INVALID_ID;
    };

    // Per-triangle tangents from positions and UVs, written to all three vertices.
    void GenerateTangents(std::vector<Vertex3D>& vertices, const std::vector<uint32_t>& indices);
}
