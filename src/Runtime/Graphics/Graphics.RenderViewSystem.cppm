module;
#include <array>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>
#include <glm/glm.hpp>

export module Graphics:RenderViewSystem;
import Core;
import :Texture;
import :RenderTarget;
import :RenderView;
import :Renderer;
import :ShaderSystem;
import :MaterialSystem;
import :BuiltinShaders;
import :Camera;

export namespace Graphics
{
    struct RenderViewSystemConfig
    {
        uint16_t MaxViewCount = 251;
    };

    // Encodes an object id as an RGB colour for the pick passes.
    [[nodiscard]] glm::vec3 PickIdToColour(uint32_t id);

    // INVALID_ID for the cleared (white) pick colour.
    [[nodiscard]] uint32_t PickColourToId(const std::array<uint8_t, 4>& pixel);

    // Registry of render views. Each view turns a scene payload into a packet
    // and submits that packet through the renderer, dispatching on its kind.
    class RenderViewSystem
    {
    public:
        using HoveredObjectCallback = std::function<void(uint32_t objectId)>;

        RenderViewSystem(Renderer& renderer, ShaderSystem& shaders, MaterialSystem& materials, CameraSystem& cameras);
        ~RenderViewSystem();

        RenderViewSystem(const RenderViewSystem&) = delete;
        RenderViewSystem& operator=(const RenderViewSystem&) = delete;

        [[nodiscard]] Core::Result Initialize(const RenderViewSystemConfig& config = {});
        void Shutdown();

        [[nodiscard]] Core::Result Create(const RenderViewConfig& config);
        [[nodiscard]] Core::Result Destroy(std::string_view name);

        [[nodiscard]] Core::Expected<RenderView*> Get(std::string_view name);

        // Views whose size is unchanged are left alone.
        void OnWindowResize(uint16_t width, uint16_t height);

        [[nodiscard]] Core::Expected<RenderViewPacket> BuildPacket(RenderView& view, const RenderViewPayload& payload);
        void OnDestroyPacket(RenderViewPacket& packet);
        [[nodiscard]] Core::Result OnRender(RenderViewPacket& packet, uint64_t frameNumber, uint8_t renderTargetIndex);

        void OnMouseMoved(int16_t x, int16_t y);
        void SetRenderMode(RenderMode mode);
        void SetHoveredObjectCallback(HoveredObjectCallback callback) { m_OnHoveredObjectChanged = std::move(callback); }

        [[nodiscard]] size_t GetViewCount() const { return m_Lookup.size(); }

    private:
        Core::Result CreateWorld(RenderView& view);
        Core::Result CreateUI(RenderView& view);
        Core::Result CreateSkybox(RenderView& view);
        Core::Result CreatePick(RenderView& view);

        Core::Result ResolveShader(const RenderView& view, std::string_view builtinName, uint32_t& shaderId);
        Core::Result ResolveUniform(uint32_t shaderId, std::string_view name, uint16_t& location);

        Core::Result RegenerateRenderTargets(RenderView& view);
        Core::Result RegenerateAttachmentTarget(RenderView& view, const RenderPass& pass, RenderTargetAttachment& attachment);
        void UpdateProjection(RenderView& view);
        // Pick instances and attachment textures; never touches pass targets.
        void ReleaseOwnedResources(RenderView& view);
        // Destroys targets of passes no other live view uses and rebuilds the shared ones for their remaining users.
        Core::Result ReleasePassTargets(RenderView& view);

        Core::Result BuildWorldPacket(RenderView& view, const MeshPacketData& data, RenderViewPacket& packet);
        Core::Result BuildUIPacket(RenderView& view, const UIPacketData& data, RenderViewPacket& packet);
        Core::Result BuildSkyboxPacket(RenderView& view, const SkyboxPacketData& data, RenderViewPacket& packet);
        Core::Result BuildPickPacket(RenderView& view, PickPacketData data, RenderViewPacket& packet);

        Core::Result RenderMaterials(RenderView& view, RenderViewPacket& packet, uint32_t shaderId, uint32_t renderMode,
                                     uint64_t frameNumber, uint8_t renderTargetIndex);
        Core::Result RenderSkybox(RenderView& view, RenderViewPacket& packet, uint64_t frameNumber, uint8_t renderTargetIndex);
        Core::Result RenderPick(RenderView& view, RenderViewPacket& packet, uint64_t frameNumber, uint8_t renderTargetIndex);

        Renderer& m_Renderer;
        ShaderSystem& m_Shaders;
        MaterialSystem& m_Materials;
        CameraSystem& m_Cameras;

        RenderViewSystemConfig m_Config;
        bool m_Initialized = false;

        std::vector<std::unique_ptr<RenderView>> m_Views;
        std::unordered_map<std::string, uint16_t, Core::Hash::StringHash, std::equal_to<>> m_Lookup;
        HoveredObjectCallback m_OnHoveredObjectChanged;
    };
}
