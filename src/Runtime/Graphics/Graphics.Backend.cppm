module;
#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

export module Graphics:Backend;
import Core;
import :Texture;
import :Geometry;
import :Shader;
import :ShaderConfig;
import :RenderTarget;

export namespace Graphics
{
    // The GPU side of the renderer. The frontend only talks to this interface;
    // a Vulkan implementation lives outside the engine core, HeadlessBackend inside it.
    class IRendererBackend
    {
    public:
        virtual ~IRendererBackend() = default;

        // --- Lifecycle ---
        [[nodiscard]] virtual Core::Result Initialize(std::string_view appName, uint32_t width, uint32_t height) = 0;
        virtual void Shutdown() = 0;
        virtual void Resized(uint32_t width, uint32_t height) = 0;

        // --- Frame ---
        // SwapchainOutOfDate from BeginFrame means "skip this frame", not failure.
        [[nodiscard]] virtual Core::Result BeginFrame(double deltaTime) = 0;
        [[nodiscard]] virtual Core::Result EndFrame(double deltaTime) = 0;

        // --- Textures ---
        [[nodiscard]] virtual Core::Result TextureCreate(std::span<const uint8_t> pixels, Texture& texture) = 0;
        [[nodiscard]] virtual Core::Result TextureCreateWriteable(Texture& texture) = 0;
        [[nodiscard]] virtual Core::Result TextureResize(Texture& texture, uint32_t width, uint32_t height) = 0;
        [[nodiscard]] virtual Core::Result TextureWriteData(Texture& texture, uint32_t offset, std::span<const uint8_t> pixels) = 0;
        [[nodiscard]] virtual Core::Expected<std::array<uint8_t, 4>> TextureReadPixel(const Texture& texture, uint32_t x, uint32_t y) = 0;
        virtual void TextureDestroy(Texture& texture) = 0;

        [[nodiscard]] virtual Core::Result TextureMapAcquireResources(TextureMap& map) = 0;
        virtual void TextureMapReleaseResources(TextureMap& map) = 0;

        // --- Geometry ---
        [[nodiscard]] virtual Core::Result GeometryCreate(Geometry& geometry, std::span<const std::byte> vertices,
                                                          uint32_t vertexStride, uint32_t vertexCount,
                                                          std::span<const uint32_t> indices) = 0;
        virtual void GeometryDestroy(Geometry& geometry) = 0;
        virtual void DrawGeometry(const GeometryRenderData& data) = 0;

        // --- Render passes ---
        [[nodiscard]] virtual Core::Result RenderPassCreate(const RenderPassConfig& config, RenderPass& pass) = 0;
        virtual void RenderPassDestroy(RenderPass& pass) = 0;
        [[nodiscard]] virtual Core::Result RenderPassBegin(RenderPass& pass, RenderTarget& target) = 0;
        [[nodiscard]] virtual Core::Result RenderPassEnd(RenderPass& pass) = 0;

        // --- Render targets ---
        [[nodiscard]] virtual Core::Result RenderTargetCreate(std::span<const RenderTargetAttachment> attachments,
                                                              RenderPass& pass, uint32_t width, uint32_t height,
                                                              RenderTarget& target) = 0;
        // freeInternalMemory=false keeps the attachment list for regeneration.
        virtual void RenderTargetDestroy(RenderTarget& target, bool freeInternalMemory) = 0;

        [[nodiscard]] virtual Texture* WindowAttachmentGet(uint8_t index) = 0;
        [[nodiscard]] virtual Texture* DepthAttachmentGet(uint8_t index) = 0;
        [[nodiscard]] virtual uint8_t WindowAttachmentIndexGet() const = 0;
        [[nodiscard]] virtual uint8_t WindowAttachmentCountGet() const = 0;

        // --- Shaders ---
        [[nodiscard]] virtual Core::Result ShaderCreate(Shader& shader, const ShaderConfig& config, const RenderPass& pass) = 0;
        [[nodiscard]] virtual Core::Result ShaderInitialize(Shader& shader) = 0;
        virtual void ShaderDestroy(Shader& shader) = 0;

        [[nodiscard]] virtual Core::Result ShaderUse(Shader& shader) = 0;
        [[nodiscard]] virtual Core::Result ShaderBindGlobals(Shader& shader) = 0;
        [[nodiscard]] virtual Core::Result ShaderBindInstance(Shader& shader, uint32_t instanceId) = 0;
        [[nodiscard]] virtual Core::Result ShaderApplyGlobals(Shader& shader) = 0;
        [[nodiscard]] virtual Core::Result ShaderApplyInstance(Shader& shader, bool needsUpdate) = 0;

        // Returns the new instance id.
        [[nodiscard]] virtual Core::Expected<uint32_t> ShaderAcquireInstanceResources(Shader& shader, std::span<TextureMap* const> maps) = 0;
        [[nodiscard]] virtual Core::Result ShaderReleaseInstanceResources(Shader& shader, uint32_t instanceId) = 0;
        [[nodiscard]] virtual Core::Result ShaderSetUniform(Shader& shader, const ShaderUniform& uniform, const UniformValue& value) = 0;

        // --- Render buffers ---
        [[nodiscard]] virtual Core::Result RenderBufferCreate(RenderBuffer& buffer) = 0;
        virtual void RenderBufferDestroy(RenderBuffer& buffer) = 0;
        [[nodiscard]] virtual Core::Result RenderBufferBind(RenderBuffer& buffer, uint64_t offset) = 0;
        [[nodiscard]] virtual Core::Result RenderBufferUnbind(RenderBuffer& buffer) = 0;
        [[nodiscard]] virtual Core::Result RenderBufferLoadRange(RenderBuffer& buffer, uint64_t offset, std::span<const std::byte> data) = 0;
        [[nodiscard]] virtual Core::Result RenderBufferCopyRange(RenderBuffer& source, uint64_t sourceOffset,
                                                                 RenderBuffer& dest, uint64_t destOffset, uint64_t size) = 0;
        [[nodiscard]] virtual Core::Expected<std::vector<std::byte>> RenderBufferRead(RenderBuffer& buffer, uint64_t offset, uint64_t size) = 0;
        [[nodiscard]] virtual Core::Result RenderBufferResize(RenderBuffer& buffer, uint64_t newSize) = 0;
        [[nodiscard]] virtual Core::Result RenderBufferFlush(RenderBuffer& buffer, uint64_t offset, uint64_t size) = 0;
        [[nodiscard]] virtual Core::Result RenderBufferDraw(RenderBuffer& buffer, uint64_t offset, uint32_t elementCount, bool bindOnly) = 0;

        [[nodiscard]] virtual bool IsMultithreaded() const = 0;
    };
}
