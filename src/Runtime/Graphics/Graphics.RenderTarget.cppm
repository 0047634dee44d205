module;
#include <cstdint>
#include <string>
#include <vector>
#include <glm/glm.hpp>

export module Graphics:RenderTarget;
import :Texture;

export namespace Graphics
{
    enum class RenderTargetAttachmentType : uint8_t
    {
        Colour = 0x1,
        Depth = 0x2,
        Stencil = 0x4,
    };

    // Default: the window's swapchain/depth images. View: textures owned by the view (pick buffers).
    enum class RenderTargetAttachmentSource : uint8_t
    {
        Default,
        View,
    };

    enum class RenderTargetAttachmentLoadOp : uint8_t
    {
        DontCare,
        Load,
    };

    enum class RenderTargetAttachmentStoreOp : uint8_t
    {
        DontCare,
        Store,
    };

    struct RenderTargetAttachmentConfig
    {
        RenderTargetAttachmentType Type = RenderTargetAttachmentType::Colour;
        RenderTargetAttachmentSource Source = RenderTargetAttachmentSource::Default;
        RenderTargetAttachmentLoadOp LoadOperation = RenderTargetAttachmentLoadOp::DontCare;
        RenderTargetAttachmentStoreOp StoreOperation = RenderTargetAttachmentStoreOp::Store;
        bool PresentAfter = false;
    };

    struct RenderTargetAttachment
    {
        RenderTargetAttachmentType Type = RenderTargetAttachmentType::Colour;
        RenderTargetAttachmentSource Source = RenderTargetAttachmentSource::Default;
        RenderTargetAttachmentLoadOp LoadOperation = RenderTargetAttachmentLoadOp::DontCare;
        RenderTargetAttachmentStoreOp StoreOperation = RenderTargetAttachmentStoreOp::Store;
        bool PresentAfter = false;
        Graphics::Texture* Texture = nullptr;
    };

    struct RenderTarget
    {
        std::vector<RenderTargetAttachment> Attachments;
        uint64_t InternalHandle = 0;
    };

    enum class RenderPassClearFlag : uint8_t
    {
        None = 0x0,
        ColourBuffer = 0x1,
        DepthBuffer = 0x2,
        StencilBuffer = 0x4,
    };

    [[nodiscard]] constexpr uint8_t ToFlags(RenderPassClearFlag flag) { return static_cast<uint8_t>(flag); }

    struct RenderPassConfig
    {
        std::string Name;
        float Depth = 1.0f;
        uint32_t Stencil = 0;
        // x, y, width, height
        glm::vec4 RenderArea{0.0f, 0.0f, 1280.0f, 720.0f};
        glm::vec4 ClearColour{0.0f, 0.0f, 0.2f, 1.0f};
        uint8_t ClearFlags = 0;
        // One target per swapchain image.
        uint8_t RenderTargetCount = 3;
        std::vector<RenderTargetAttachmentConfig> Attachments;
    };

    struct RenderPass
    {
        uint16_t Id = INVALID_ID_U16;
        std::string Name;
        glm::vec4 RenderArea{0.0f};
        glm::vec4 ClearColour{0.0f};
        uint8_t ClearFlags = 0;
        float Depth = 1.0f;
        uint32_t Stencil = 0;
        std::vector<RenderTarget> Targets;
        uint64_t InternalHandle = 0;
    };

    enum class RenderBufferType : uint8_t
    {
        Unknown,
        Vertex,
        Index,
        Uniform,
        Staging,
        Read,
        Storage,
    };

    struct RenderBuffer
    {
        RenderBufferType Type = RenderBufferType::Unknown;
        uint64_t TotalSize = 0;
        uint64_t InternalHandle = 0;
    };
}
