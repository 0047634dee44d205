module;
#include <chrono>
#include <cstdint>
#include <expected>
#include <memory>
#include <string>
#include <string_view>
#include <thread>
#include <utility>

module Runtime;

namespace Runtime
{
    std::string_view EngineStageToString(EngineStage stage)
    {
        switch (stage)
        {
        case EngineStage::Uninitialized: return "Uninitialized";
        case EngineStage::Booting:       return "Booting";
        case EngineStage::BootComplete:  return "BootComplete";
        case EngineStage::Initializing:  return "Initializing";
        case EngineStage::Initialized:   return "Initialized";
        case EngineStage::Running:       return "Running";
        case EngineStage::ShuttingDown:  return "ShuttingDown";
        }
        return "Unknown";
    }

    Engine::Engine(EngineConfig config, std::unique_ptr<Graphics::IRendererBackend> backend)
        : m_Config(std::move(config))
    {
        if (m_Config.AssetRoot.empty())
            m_Config.AssetRoot = Core::Filesystem::GetAssetRoot();

        Core::Tasks::JobSystemConfig jobConfig = m_Config.Systems.Jobs;
        if (backend)
            jobConfig.BackendIsMultithreaded = backend->IsMultithreaded();

        m_Jobs = std::make_unique<Core::Tasks::JobSystem>(jobConfig);
        m_AssetIndex = std::make_unique<Core::Assets::AssetIndex>(m_Config.AssetRoot);
        m_Loader = std::make_unique<Graphics::FileResourceLoader>(m_Config.AssetRoot, m_AssetIndex.get());
        m_Renderer = std::make_unique<Graphics::Renderer>(std::move(backend));
        m_Textures = std::make_unique<Graphics::TextureSystem>(m_Renderer->Backend(), *m_Loader, m_Jobs.get());
        m_Shaders = std::make_unique<Graphics::ShaderSystem>(*m_Renderer, *m_Textures);
        m_Materials = std::make_unique<Graphics::MaterialSystem>(*m_Renderer, *m_Shaders, *m_Textures, *m_Loader);
        m_Geometries = std::make_unique<Graphics::GeometrySystem>(*m_Renderer, *m_Materials);
        m_Cameras = std::make_unique<Graphics::CameraSystem>();
        m_Views = std::make_unique<Graphics::RenderViewSystem>(*m_Renderer, *m_Shaders, *m_Materials, *m_Cameras);
    }

    Engine::~Engine()
    {
        Shutdown();
    }

    Core::Result Engine::Initialize()
    {
        if (m_Stage != EngineStage::Uninitialized)
        {
            Core::Log::Error("Engine: Initialize() called in stage {}.", EngineStageToString(m_Stage));
            return Core::Err(Core::ErrorCode::InvalidState);
        }

        Core::Log::Info("Initializing Engine...");
        m_Stage = EngineStage::Booting;

        // A missing asset directory is not fatal; lookups fall back to path conventions.
        if (auto scanned = m_AssetIndex->Rescan())
            Core::Log::Info("Engine: indexed {} assets under '{}'.", *scanned, m_Config.AssetRoot.string());
        else
            Core::Log::Warn("Engine: asset index unavailable ({}).", Core::ErrorCodeToString(scanned.error()));
        if (m_Config.WatchAssets)
            m_AssetIndex->StartWatching();

        Graphics::RendererConfig rendererConfig;
        rendererConfig.ApplicationName = m_Config.AppName;
        rendererConfig.Width = m_Config.Width;
        rendererConfig.Height = m_Config.Height;
        rendererConfig.ResizeDebounceFrames = m_Config.ResizeDebounceFrames;
        if (auto booted = m_Renderer->Initialize(rendererConfig); !booted)
        {
            Core::Log::Error("FATAL: renderer failed to boot.");
            return booted;
        }
        m_Stage = EngineStage::BootComplete;

        m_Stage = EngineStage::Initializing;
        const SystemsConfig& systems = m_Config.Systems;

        auto initialized = m_Textures->Initialize(systems.Textures)
            .and_then([&](Core::Unit) { return CreateRenderPasses(); })
            .and_then([&](Core::Unit) { return m_Shaders->Initialize(systems.Shaders); })
            .and_then([&](Core::Unit) { return CreateBuiltinShaders(); })
            .and_then([&](Core::Unit) { return m_Cameras->Initialize(systems.Cameras); })
            .and_then([&](Core::Unit) { return m_Materials->Initialize(systems.Materials); })
            .and_then([&](Core::Unit) { return m_Geometries->Initialize(systems.Geometries); })
            .and_then([&](Core::Unit) { return m_Views->Initialize(systems.Views); })
            .and_then([&](Core::Unit) { return CreateRenderViews(); });
        if (!initialized)
        {
            Core::Log::Error("FATAL: engine systems failed to initialize ({}).", Core::ErrorCodeToString(initialized.error()));
            return initialized;
        }

        if (auto started = OnStart(); !started)
        {
            Core::Log::Error("Engine: application OnStart failed ({}).", Core::ErrorCodeToString(started.error()));
            return started;
        }

        m_Stage = EngineStage::Initialized;
        Core::Log::Info("Engine initialized.");
        return Core::Ok();
    }

    Core::Result Engine::CreateRenderPasses()
    {
        const auto passes = m_Config.RenderPasses.empty()
            ? Graphics::GetDefaultRenderPassConfigs(m_Config.Width, m_Config.Height,
                                                    m_Renderer->Backend().WindowAttachmentCountGet())
            : m_Config.RenderPasses;

        for (const auto& pass : passes)
        {
            if (auto created = m_Renderer->CreateRenderPass(pass); !created)
                return std::unexpected(created.error());
        }
        return Core::Ok();
    }

    Core::Result Engine::CreateBuiltinShaders()
    {
        for (const auto& config : Graphics::GetBuiltinShaderConfigs())
        {
            if (auto created = m_Shaders->Create(config); !created)
            {
                Core::Log::Error("Engine: built-in shader '{}' failed.", config.Name);
                return created;
            }
        }
        return Core::Ok();
    }

    Core::Result Engine::CreateRenderViews()
    {
        const auto views = m_Config.RenderViews.empty()
            ? Graphics::GetDefaultRenderViewConfigs(m_Config.Width, m_Config.Height)
            : m_Config.RenderViews;

        for (const auto& view : views)
        {
            if (auto created = m_Views->Create(view); !created)
                return created;
        }
        return Core::Ok();
    }

    Core::Result Engine::Run()
    {
        if (m_Stage != EngineStage::Initialized)
        {
            Core::Log::Error("Engine: Run() needs an initialized engine (stage {}).", EngineStageToString(m_Stage));
            return Core::Err(Core::ErrorCode::InvalidState);
        }

        m_Stage = EngineStage::Running;
        m_Running = true;

        Core::Result result = Core::Ok();
        while (m_Running)
        {
            if (result = Tick(); !result)
            {
                Core::Log::Error("Engine: frame {} failed ({}), stopping.", m_FrameCount, Core::ErrorCodeToString(result.error()));
                m_Running = false;
            }
        }

        Shutdown();
        return result;
    }

    Core::Result Engine::Tick()
    {
        if (m_Stage != EngineStage::Initialized && m_Stage != EngineStage::Running)
            return Core::Err(Core::ErrorCode::InvalidState);

        const double frameStart = Core::Clock::Now();
        if (!m_Clock.IsRunning())
        {
            m_Clock.Start();
            m_LastTime = 0.0;
        }
        m_Clock.Update();
        const double now = m_Clock.Elapsed();
        const double deltaTime = now - m_LastTime;
        m_LastTime = now;

        // Completion callbacks of finished loads run here, on the main thread.
        m_Jobs->Update();

        if (auto updated = OnUpdate(deltaTime); !updated)
            return updated;

        Graphics::RenderPacket packet;
        packet.DeltaTime = deltaTime;
        if (auto rendered = OnRender(packet, deltaTime); !rendered)
            return rendered;

        auto drawn = m_Renderer->DrawFrame(packet, *m_Views);
        for (auto& viewPacket : packet.Views)
            m_Views->OnDestroyPacket(viewPacket);
        if (!drawn)
            return drawn;

        const uint64_t frameNumber = m_Renderer->GetFrameNumber();
        m_Textures->ProcessDeletions(frameNumber);
        m_Materials->ProcessDeletions(frameNumber);
        m_Geometries->ProcessDeletions(frameNumber);
        ++m_FrameCount;

        if (m_Config.LimitFrameRate)
        {
            const double remaining = m_Config.TargetFrameSeconds - (Core::Clock::Now() - frameStart);
            if (remaining > 0.0)
                std::this_thread::sleep_for(std::chrono::duration<double>(remaining));
        }
        return Core::Ok();
    }

    void Engine::OnWindowResized(uint16_t width, uint16_t height)
    {
        m_Renderer->OnResized(width, height);
        OnResize(width, height);
    }

    void Engine::Shutdown()
    {
        if (m_Stage == EngineStage::Uninitialized) return;

        Core::Log::Info("Shutting down Engine...");
        m_Stage = EngineStage::ShuttingDown;
        m_Running = false;

        OnShutdown();

        // Loads in flight still reference the systems below.
        m_Jobs->WaitForIdle();
        m_Jobs->Update();
        m_AssetIndex->StopWatching();

        // Order matters!
        m_Views->Shutdown();
        m_Geometries->Shutdown();
        m_Materials->Shutdown();
        m_Cameras->Shutdown();
        m_Shaders->Shutdown();
        m_Textures->Shutdown();
        m_Renderer->Shutdown();
        m_Jobs->Shutdown();

        m_Clock.Stop();
        m_Stage = EngineStage::Uninitialized;
    }

    Core::Result Engine::CreateSkybox(Graphics::Skybox& skybox, std::string_view cubeName)
    {
        auto cube = m_Textures->AcquireCube(cubeName, true);
        if (!cube)
        {
            Core::Log::Error("Engine: skybox cube map '{}' failed to load.", cubeName);
            return std::unexpected(cube.error());
        }
        skybox.CubeMap.Texture = *cube;

        Graphics::IRendererBackend& backend = m_Renderer->Backend();
        if (auto mapped = backend.TextureMapAcquireResources(skybox.CubeMap); !mapped)
        {
            DestroySkybox(skybox, cubeName);
            return mapped;
        }

        auto config = Graphics::GeometrySystem::GenerateCubeConfig(10.0f, 10.0f, 10.0f, 1.0f, 1.0f,
                                                                   std::string(cubeName) + "_skybox", "");
        auto geometry = m_Geometries->AcquireFromConfig(config, true);
        if (!geometry)
        {
            DestroySkybox(skybox, cubeName);
            return std::unexpected(geometry.error());
        }
        skybox.Geometry = *geometry;

        Graphics::Shader* shader = m_Shaders->Get(Graphics::BUILTIN_SKYBOX_SHADER_NAME);
        if (!shader)
        {
            DestroySkybox(skybox, cubeName);
            return Core::Err(Core::ErrorCode::ResourceNotFound);
        }

        Graphics::TextureMap* maps[] = {&skybox.CubeMap};
        auto instance = backend.ShaderAcquireInstanceResources(*shader, maps);
        if (!instance)
        {
            DestroySkybox(skybox, cubeName);
            return std::unexpected(instance.error());
        }
        skybox.InstanceId = *instance;
        return Core::Ok();
    }

    void Engine::DestroySkybox(Graphics::Skybox& skybox, std::string_view cubeName)
    {
        Graphics::IRendererBackend& backend = m_Renderer->Backend();

        if (skybox.InstanceId != Graphics::INVALID_ID)
        {
            if (Graphics::Shader* shader = m_Shaders->Get(Graphics::BUILTIN_SKYBOX_SHADER_NAME))
            {
                if (auto released = backend.ShaderReleaseInstanceResources(*shader, skybox.InstanceId); !released)
                    Core::Log::Warn("Engine: skybox instance {} was not released.", skybox.InstanceId);
            }
            skybox.InstanceId = Graphics::INVALID_ID;
        }

        if (skybox.Geometry)
        {
            if (auto released = m_Geometries->Release(skybox.Geometry->Name); !released)
                Core::Log::Warn("Engine: skybox geometry '{}' was not released.", skybox.Geometry->Name);
            skybox.Geometry = nullptr;
        }

        if (skybox.CubeMap.Texture)
        {
            backend.TextureMapReleaseResources(skybox.CubeMap);
            if (auto released = m_Textures->Release(cubeName); !released)
                Core::Log::Warn("Engine: skybox cube map '{}' was not released.", cubeName);
            skybox.CubeMap.Texture = nullptr;
        }
    }
}
