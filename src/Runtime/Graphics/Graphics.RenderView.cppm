module;
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>
#include <glm/glm.hpp>

export module Graphics:RenderView;
import ECS;
import :Texture;
import :Geometry;
import :Mesh;
import :RenderTarget;

export namespace Graphics
{
    enum class RenderViewKind : uint8_t
    {
        World,
        UI,
        Skybox,
        Pick,
    };

    [[nodiscard]] constexpr std::string_view RenderViewKindToString(RenderViewKind kind)
    {
        switch (kind)
        {
        case RenderViewKind::World:  return "World";
        case RenderViewKind::UI:     return "UI";
        case RenderViewKind::Skybox: return "Skybox";
        case RenderViewKind::Pick:   return "Pick";
        }
        return "Unknown";
    }

    enum class RenderMode : uint32_t
    {
        Default = 0,
        Lighting = 1,
        Normals = 2,
    };

    struct RenderViewConfig
    {
        std::string Name;
        // Overrides the built-in shader of the kind when set.
        std::string CustomShaderName;
        uint16_t Width = 0;
        uint16_t Height = 0;
        RenderViewKind Kind = RenderViewKind::World;
        // Pick views take two: world pick, then UI pick.
        std::vector<std::string> PassNames;
    };

    // --- Per-kind state ---

    struct WorldViewState
    {
        uint32_t ShaderId = INVALID_ID;
        float Fov = 0.0f;
        float NearClip = 0.0f;
        float FarClip = 0.0f;
        glm::mat4 Projection{1.0f};
        glm::vec4 AmbientColour{0.0f};
        RenderMode Mode = RenderMode::Default;
    };

    struct UIViewState
    {
        uint32_t ShaderId = INVALID_ID;
        uint16_t DiffuseMapLocation = INVALID_ID_U16;
        uint16_t DiffuseColourLocation = INVALID_ID_U16;
        uint16_t ModelLocation = INVALID_ID_U16;
        float NearClip = 0.0f;
        float FarClip = 0.0f;
        glm::mat4 Projection{1.0f};
        glm::mat4 View{1.0f};
    };

    struct SkyboxViewState
    {
        uint32_t ShaderId = INVALID_ID;
        float Fov = 0.0f;
        float NearClip = 0.0f;
        float FarClip = 0.0f;
        glm::mat4 Projection{1.0f};
        uint16_t ProjectionLocation = INVALID_ID_U16;
        uint16_t ViewLocation = INVALID_ID_U16;
        uint16_t CubeMapLocation = INVALID_ID_U16;
    };

    struct PickShaderInfo
    {
        uint32_t ShaderId = INVALID_ID;
        uint16_t IdColourLocation = INVALID_ID_U16;
        uint16_t ModelLocation = INVALID_ID_U16;
        uint16_t ProjectionLocation = INVALID_ID_U16;
        uint16_t ViewLocation = INVALID_ID_U16;
        glm::mat4 Projection{1.0f};
        glm::mat4 View{1.0f};
        float Fov = 0.0f;
        float NearClip = 0.0f;
        float FarClip = 0.0f;
    };

    struct PickViewState
    {
        PickShaderInfo WorldShaderInfo;
        PickShaderInfo UIShaderInfo;
        // Pick pass attachments; owned by the view.
        Texture ColourTarget;
        Texture DepthTarget;
        uint32_t InstanceCount = 0;
        std::vector<bool> InstanceUpdated;
        int16_t MouseX = 0;
        int16_t MouseY = 0;
        uint32_t HoveredObjectId = INVALID_ID;
    };

    using RenderViewState = std::variant<WorldViewState, UIViewState, SkyboxViewState, PickViewState>;

    struct RenderView
    {
        uint16_t Id = INVALID_ID_U16;
        std::string Name;
        uint16_t Width = 0;
        uint16_t Height = 0;
        RenderViewKind Kind = RenderViewKind::World;
        std::vector<RenderPass*> Passes;
        std::string CustomShaderName;
        RenderViewState State;
    };

    // --- Payloads handed to BuildPacket ---

    struct MeshPacketData
    {
        const std::vector<Mesh>* Meshes = nullptr;
        const ECS::TransformArena* Transforms = nullptr;
    };

    struct SkyboxPacketData
    {
        Graphics::Skybox* Skybox = nullptr;
    };

    struct UIPacketData
    {
        const std::vector<Mesh>* Meshes = nullptr;
        const std::vector<UIText>* Texts = nullptr;
        const ECS::TransformArena* Transforms = nullptr;
    };

    struct PickPacketData
    {
        const std::vector<Mesh>* WorldMeshes = nullptr;
        const std::vector<Mesh>* UIMeshes = nullptr;
        const std::vector<UIText>* Texts = nullptr;
        const ECS::TransformArena* Transforms = nullptr;
        // Filled by BuildPacket.
        uint32_t WorldGeometryCount = 0;
        uint32_t UIGeometryCount = 0;
        uint32_t RequiredInstanceCount = 0;
    };

    using RenderViewPayload = std::variant<MeshPacketData, SkyboxPacketData, UIPacketData, PickPacketData>;

    using RenderViewExtendedData = std::variant<std::monostate, SkyboxPacketData, UIPacketData, PickPacketData>;

    struct RenderViewPacket
    {
        RenderView* View = nullptr;
        glm::mat4 ViewMatrix{1.0f};
        glm::mat4 ProjectionMatrix{1.0f};
        glm::vec3 ViewPosition{0.0f};
        glm::vec4 AmbientColour{0.0f};
        std::vector<GeometryRenderData> Geometries;
        std::string CustomShaderName;
        RenderViewExtendedData ExtendedData;
    };

    // Views render in submission order.
    struct RenderPacket
    {
        double DeltaTime = 0.0;
        std::vector<RenderViewPacket> Views;
    };
}
