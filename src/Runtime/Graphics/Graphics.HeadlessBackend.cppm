module;
#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

export module Graphics:HeadlessBackend;
import Core;
import :Texture;
import :Geometry;
import :Shader;
import :ShaderConfig;
import :RenderTarget;
import :Backend;

export namespace Graphics
{
    struct HeadlessBackendConfig
    {
        uint8_t WindowAttachmentCount = 3;
        bool Multithreaded = false;
        uint32_t MaxShaderInstances = 1024;
    };

    // Counters for tests and the sandbox's frame log.
    struct HeadlessBackendStats
    {
        uint64_t FramesBegun = 0;
        uint64_t FramesEnded = 0;
        uint64_t RenderPassesBegun = 0;
        uint64_t DrawCalls = 0;
        uint64_t UniformWrites = 0;
        uint64_t ResizeCount = 0;
    };

    // CPU implementation of the backend contract. Textures keep real pixel storage,
    // geometry and render buffers keep their bytes, shaders keep their uniform
    // blocks and instance slots. Nothing is rasterized: draws are counted.
    //
    // All methods are virtual through IRendererBackend, so tests derive from this
    // class to record calls or inject failures.
    class HeadlessBackend : public IRendererBackend
    {
    public:
        explicit HeadlessBackend(const HeadlessBackendConfig& config = {});
        ~HeadlessBackend() override;

        HeadlessBackend(const HeadlessBackend&) = delete;
        HeadlessBackend& operator=(const HeadlessBackend&) = delete;

        Core::Result Initialize(std::string_view appName, uint32_t width, uint32_t height) override;
        void Shutdown() override;
        void Resized(uint32_t width, uint32_t height) override;

        Core::Result BeginFrame(double deltaTime) override;
        Core::Result EndFrame(double deltaTime) override;

        Core::Result TextureCreate(std::span<const uint8_t> pixels, Texture& texture) override;
        Core::Result TextureCreateWriteable(Texture& texture) override;
        Core::Result TextureResize(Texture& texture, uint32_t width, uint32_t height) override;
        Core::Result TextureWriteData(Texture& texture, uint32_t offset, std::span<const uint8_t> pixels) override;
        Core::Expected<std::array<uint8_t, 4>> TextureReadPixel(const Texture& texture, uint32_t x, uint32_t y) override;
        void TextureDestroy(Texture& texture) override;

        Core::Result TextureMapAcquireResources(TextureMap& map) override;
        void TextureMapReleaseResources(TextureMap& map) override;

        Core::Result GeometryCreate(Geometry& geometry, std::span<const std::byte> vertices,
                                    uint32_t vertexStride, uint32_t vertexCount,
                                    std::span<const uint32_t> indices) override;
        void GeometryDestroy(Geometry& geometry) override;
        void DrawGeometry(const GeometryRenderData& data) override;

        Core::Result RenderPassCreate(const RenderPassConfig& config, RenderPass& pass) override;
        void RenderPassDestroy(RenderPass& pass) override;
        Core::Result RenderPassBegin(RenderPass& pass, RenderTarget& target) override;
        Core::Result RenderPassEnd(RenderPass& pass) override;

        Core::Result RenderTargetCreate(std::span<const RenderTargetAttachment> attachments,
                                        RenderPass& pass, uint32_t width, uint32_t height,
                                        RenderTarget& target) override;
        void RenderTargetDestroy(RenderTarget& target, bool freeInternalMemory) override;

        Texture* WindowAttachmentGet(uint8_t index) override;
        Texture* DepthAttachmentGet(uint8_t index) override;
        uint8_t WindowAttachmentIndexGet() const override { return m_AttachmentIndex; }
        uint8_t WindowAttachmentCountGet() const override { return static_cast<uint8_t>(m_WindowAttachments.size()); }

        Core::Result ShaderCreate(Shader& shader, const ShaderConfig& config, const RenderPass& pass) override;
        Core::Result ShaderInitialize(Shader& shader) override;
        void ShaderDestroy(Shader& shader) override;

        Core::Result ShaderUse(Shader& shader) override;
        Core::Result ShaderBindGlobals(Shader& shader) override;
        Core::Result ShaderBindInstance(Shader& shader, uint32_t instanceId) override;
        Core::Result ShaderApplyGlobals(Shader& shader) override;
        Core::Result ShaderApplyInstance(Shader& shader, bool needsUpdate) override;

        Core::Expected<uint32_t> ShaderAcquireInstanceResources(Shader& shader, std::span<TextureMap* const> maps) override;
        Core::Result ShaderReleaseInstanceResources(Shader& shader, uint32_t instanceId) override;
        Core::Result ShaderSetUniform(Shader& shader, const ShaderUniform& uniform, const UniformValue& value) override;

        Core::Result RenderBufferCreate(RenderBuffer& buffer) override;
        void RenderBufferDestroy(RenderBuffer& buffer) override;
        Core::Result RenderBufferBind(RenderBuffer& buffer, uint64_t offset) override;
        Core::Result RenderBufferUnbind(RenderBuffer& buffer) override;
        Core::Result RenderBufferLoadRange(RenderBuffer& buffer, uint64_t offset, std::span<const std::byte> data) override;
        Core::Result RenderBufferCopyRange(RenderBuffer& source, uint64_t sourceOffset,
                                           RenderBuffer& dest, uint64_t destOffset, uint64_t size) override;
        Core::Expected<std::vector<std::byte>> RenderBufferRead(RenderBuffer& buffer, uint64_t offset, uint64_t size) override;
        Core::Result RenderBufferResize(RenderBuffer& buffer, uint64_t newSize) override;
        Core::Result RenderBufferFlush(RenderBuffer& buffer, uint64_t offset, uint64_t size) override;
        Core::Result RenderBufferDraw(RenderBuffer& buffer, uint64_t offset, uint32_t elementCount, bool bindOnly) override;

        bool IsMultithreaded() const override { return m_Config.Multithreaded; }

        // --- Inspection ---
        [[nodiscard]] const HeadlessBackendStats& GetStats() const { return m_Stats; }
        [[nodiscard]] bool IsInitialized() const { return m_Initialized; }
        [[nodiscard]] bool IsFrameActive() const { return m_FrameActive; }
        [[nodiscard]] uint32_t GetWidth() const { return m_Width; }
        [[nodiscard]] uint32_t GetHeight() const { return m_Height; }
        [[nodiscard]] size_t GetLiveTextureCount() const;
        [[nodiscard]] size_t GetLiveGeometryCount() const { return m_Geometries.size(); }
        [[nodiscard]] size_t GetLiveInstanceCount(const Shader& shader) const;

        // Global uniform block of a shader, as last written by ShaderSetUniform.
        [[nodiscard]] std::span<const std::byte> GetGlobalUniformBlock(const Shader& shader) const;

    private:
        struct TextureStorage
        {
            uint32_t Width = 0;
            uint32_t Height = 0;
            uint8_t ChannelCount = 4;
            uint32_t LayerCount = 1;
            std::vector<uint8_t> Pixels;
        };

        struct GeometryStorage
        {
            std::vector<std::byte> Vertices;
            uint32_t VertexStride = 0;
            uint32_t VertexCount = 0;
            std::vector<uint32_t> Indices;
        };

        struct ShaderInstance
        {
            bool InUse = false;
            std::vector<TextureMap*> Maps;
            std::vector<std::byte> UniformBlock;
        };

        struct ShaderStorage
        {
            std::string RenderPassName;
            uint32_t StageCount = 0;
            std::vector<std::byte> GlobalBlock;
            std::vector<std::byte> PushConstants;
            std::vector<ShaderInstance> Instances;
        };

        uint64_t CreateTextureStorage(uint32_t width, uint32_t height, uint8_t channels, uint32_t layers, uint8_t fill);
        TextureStorage* FindTexture(uint64_t handle);
        const TextureStorage* FindTexture(uint64_t handle) const;
        ShaderStorage* FindShader(const Shader& shader);
        std::vector<std::byte>* FindBuffer(const RenderBuffer& buffer);
        void CreateWindowAttachments();
        void DestroyWindowAttachments();

        HeadlessBackendConfig m_Config;
        HeadlessBackendStats m_Stats;

        bool m_Initialized = false;
        bool m_FrameActive = false;
        uint32_t m_Width = 0;
        uint32_t m_Height = 0;
        uint8_t m_AttachmentIndex = 0;

        std::vector<Texture> m_WindowAttachments;
        std::vector<Texture> m_DepthAttachments;

        // Texture uploads may come from a loader worker when Multithreaded is set.
        mutable std::mutex m_TextureMutex;
        std::unordered_map<uint64_t, TextureStorage> m_Textures;

        std::unordered_map<uint32_t, GeometryStorage> m_Geometries;
        std::unordered_map<uint64_t, ShaderStorage> m_Shaders;
        std::unordered_map<uint64_t, std::vector<std::byte>> m_Buffers;

        const RenderPass* m_ActivePass = nullptr;
        const Shader* m_BoundShader = nullptr;

        std::atomic<uint64_t> m_NextHandle{1};
        uint32_t m_NextGeometryId = 0;
        uint16_t m_NextPassId = 0;
    };
}
