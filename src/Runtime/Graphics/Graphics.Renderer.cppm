module;
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>

export module Graphics:Renderer;
import Core;
import :RenderTarget;
import :RenderView;
import :Backend;

export namespace Graphics
{
    class RenderViewSystem;

    struct RendererConfig
    {
        std::string ApplicationName = "Prism";
        uint32_t Width = 1280;
        uint32_t Height = 720;
        // Frames without a new resize event before the swapchain is rebuilt.
        uint32_t ResizeDebounceFrames = 30;
    };

    // Frontend over one backend. Owned by the engine and passed by reference.
    class Renderer
    {
    public:
        explicit Renderer(std::unique_ptr<IRendererBackend> backend);
        ~Renderer();

        Renderer(const Renderer&) = delete;
        Renderer& operator=(const Renderer&) = delete;

        [[nodiscard]] Core::Result Initialize(const RendererConfig& config);
        void Shutdown();

        // Starts (or restarts) the resize debounce.
        void OnResized(uint16_t width, uint16_t height);

        // BeginFrame, every view packet's OnRender, EndFrame.
        // A skipped frame (resize pending, out-of-date swapchain) is not an error.
        [[nodiscard]] Core::Result DrawFrame(RenderPacket& packet, RenderViewSystem& views);

        [[nodiscard]] Core::Expected<RenderPass*> CreateRenderPass(const RenderPassConfig& config);
        [[nodiscard]] Core::Expected<RenderPass*> GetRenderPass(std::string_view name) const;

        [[nodiscard]] IRendererBackend& Backend() { return *m_Backend; }
        [[nodiscard]] const IRendererBackend& Backend() const { return *m_Backend; }

        [[nodiscard]] uint64_t GetFrameNumber() const { return m_FrameNumber; }
        [[nodiscard]] bool IsMultithreaded() const { return m_Backend->IsMultithreaded(); }
        [[nodiscard]] bool IsResizing() const { return m_Resizing; }
        [[nodiscard]] uint32_t GetWidth() const { return m_Width; }
        [[nodiscard]] uint32_t GetHeight() const { return m_Height; }

    private:
        std::unique_ptr<IRendererBackend> m_Backend;
        RendererConfig m_Config;
        bool m_Initialized = false;

        uint64_t m_FrameNumber = 0;
        uint32_t m_Width = 0;
        uint32_t m_Height = 0;
        bool m_Resizing = false;
        uint32_t m_FramesSinceResize = 0;

        std::unordered_map<std::string, std::unique_ptr<RenderPass>, Core::Hash::StringHash, std::equal_to<>> m_RenderPasses;
    };
}
