module;
#include <cstdint>
#include <expected>
#include <memory>
#include <string_view>
#include <utility>

module Graphics;

namespace Graphics
{
    Renderer::Renderer(std::unique_ptr<IRendererBackend> backend)
        : m_Backend(std::move(backend))
    {
    }

    Renderer::~Renderer()
    {
        Shutdown();
    }

    Core::Result Renderer::Initialize(const RendererConfig& config)
    {
        if (!m_Backend)
        {
            Core::Log::Error("Renderer: no backend supplied.");
            return Core::Err(Core::ErrorCode::InvalidState);
        }

        m_Config = config;
        m_Width = config.Width;
        m_Height = config.Height;

        if (auto result = m_Backend->Initialize(config.ApplicationName, config.Width, config.Height); !result)
        {
            Core::Log::Error("Renderer: backend failed to initialize ({}).", Core::ErrorCodeToString(result.error()));
            return result;
        }

        m_Initialized = true;
        Core::Log::Info("Renderer initialized ({}x{}).", m_Width, m_Height);
        return Core::Ok();
    }

    void Renderer::Shutdown()
    {
        if (!m_Initialized) return;

        for (auto& [name, pass] : m_RenderPasses)
            m_Backend->RenderPassDestroy(*pass);
        m_RenderPasses.clear();

        m_Backend->Shutdown();
        m_Initialized = false;
    }

    void Renderer::OnResized(uint16_t width, uint16_t height)
    {
        m_Width = width;
        m_Height = height;
        m_Resizing = true;
        m_FramesSinceResize = 0;
    }

    Core::Result Renderer::DrawFrame(RenderPacket& packet, RenderViewSystem& views)
    {
        ++m_FrameNumber;

        if (m_Resizing)
        {
            if (++m_FramesSinceResize < m_Config.ResizeDebounceFrames)
                return Core::Ok();

            Core::Log::Debug("Renderer: applying resize to {}x{}.", m_Width, m_Height);
            m_Backend->Resized(m_Width, m_Height);
            views.OnWindowResize(static_cast<uint16_t>(m_Width), static_cast<uint16_t>(m_Height));
            m_Resizing = false;
            m_FramesSinceResize = 0;
        }

        if (auto begun = m_Backend->BeginFrame(packet.DeltaTime); !begun)
        {
            if (begun.error() == Core::ErrorCode::SwapchainOutOfDate)
            {
                Core::Log::Debug("Renderer: swapchain out of date, frame {} skipped.", m_FrameNumber);
                return Core::Ok();
            }
            Core::Log::Error("Renderer: BeginFrame failed ({}).", Core::ErrorCodeToString(begun.error()));
            return begun;
        }

        const uint8_t attachmentIndex = m_Backend->WindowAttachmentIndexGet();

        for (auto& viewPacket : packet.Views)
        {
            if (auto rendered = views.OnRender(viewPacket, m_FrameNumber, attachmentIndex); !rendered)
            {
                Core::Log::Error("Renderer: view '{}' failed to render ({}).",
                                 viewPacket.View ? viewPacket.View->Name : "<null>",
                                 Core::ErrorCodeToString(rendered.error()));
                return rendered;
            }
        }

        if (auto ended = m_Backend->EndFrame(packet.DeltaTime); !ended)
        {
            Core::Log::Error("Renderer: EndFrame failed ({}), likely unrecoverable.", Core::ErrorCodeToString(ended.error()));
            return ended;
        }
        return Core::Ok();
    }

    Core::Expected<RenderPass*> Renderer::CreateRenderPass(const RenderPassConfig& config)
    {
        if (config.Name.empty())
        {
            Core::Log::Error("Renderer: render pass needs a name.");
            return std::unexpected(Core::ErrorCode::InvalidArgument);
        }
        if (m_RenderPasses.contains(config.Name))
        {
            Core::Log::Error("Renderer: render pass '{}' already exists.", config.Name);
            return std::unexpected(Core::ErrorCode::AlreadyExists);
        }

        auto pass = std::make_unique<RenderPass>();
        pass->Name = config.Name;
        pass->RenderArea = config.RenderArea;
        pass->ClearColour = config.ClearColour;
        pass->ClearFlags = config.ClearFlags;
        pass->Depth = config.Depth;
        pass->Stencil = config.Stencil;

        if (auto created = m_Backend->RenderPassCreate(config, *pass); !created)
        {
            Core::Log::Error("Renderer: backend rejected render pass '{}'.", config.Name);
            return std::unexpected(created.error());
        }

        RenderPass* raw = pass.get();
        m_RenderPasses.emplace(config.Name, std::move(pass));
        return raw;
    }

    Core::Expected<RenderPass*> Renderer::GetRenderPass(std::string_view name) const
    {
        if (auto it = m_RenderPasses.find(name); it != m_RenderPasses.end())
            return it->second.get();

        Core::Log::Error("Renderer: no render pass named '{}'.", name);
        return std::unexpected(Core::ErrorCode::ResourceNotFound);
    }
}
