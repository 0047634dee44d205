module;
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

export module Runtime:Engine;

import Core;
import ECS;
import Graphics;

export namespace Runtime
{
    enum class EngineStage : uint8_t
    {
        Uninitialized,
        Booting,
        BootComplete,
        Initializing,
        Initialized,
        Running,
        ShuttingDown,
    };

    [[nodiscard]] std::string_view EngineStageToString(EngineStage stage);

    struct SystemsConfig
    {
        Core::Tasks::JobSystemConfig Jobs;
        Graphics::TextureSystemConfig Textures;
        Graphics::ShaderSystemConfig Shaders;
        Graphics::MaterialSystemConfig Materials;
        Graphics::GeometrySystemConfig Geometries;
        Graphics::CameraSystemConfig Cameras;
        Graphics::RenderViewSystemConfig Views;
    };

    struct EngineConfig
    {
        std::string AppName = "Prism App";
        uint16_t Width = 1280;
        uint16_t Height = 720;
        double TargetFrameSeconds = 1.0 / 60.0;
        bool LimitFrameRate = true;
        uint32_t ResizeDebounceFrames = 30;

        // Empty: Core::Filesystem::GetAssetRoot().
        std::filesystem::path AssetRoot;
        bool WatchAssets = false;

        // Empty: the built-in passes and views.
        std::vector<Graphics::RenderPassConfig> RenderPasses;
        std::vector<Graphics::RenderViewConfig> RenderViews;

        SystemsConfig Systems;
    };

    class Engine
    {
    public:
        Engine(EngineConfig config, std::unique_ptr<Graphics::IRendererBackend> backend);
        virtual ~Engine();

        Engine(const Engine&) = delete;
        Engine& operator=(const Engine&) = delete;

        // Boots the renderer, then the resource systems, render passes, built-in
        // shaders and views, then calls OnStart().
        [[nodiscard]] Core::Result Initialize();

        // Ticks until Stop() or the first frame error, then shuts down.
        [[nodiscard]] Core::Result Run();

        // One frame: jobs, OnUpdate, OnRender, DrawFrame, packet teardown, deferred deletions.
        [[nodiscard]] Core::Result Tick();

        void Stop() { m_Running = false; }
        void Shutdown();

        void OnWindowResized(uint16_t width, uint16_t height);

        // Fills `skybox` in place; the backend keeps a pointer to its cube map.
        [[nodiscard]] Core::Result CreateSkybox(Graphics::Skybox& skybox, std::string_view cubeName);
        void DestroySkybox(Graphics::Skybox& skybox, std::string_view cubeName);

        [[nodiscard]] EngineStage GetStage() const { return m_Stage; }
        [[nodiscard]] uint64_t GetFrameCount() const { return m_FrameCount; }
        [[nodiscard]] const EngineConfig& GetConfig() const { return m_Config; }

        [[nodiscard]] Graphics::Renderer& GetRenderer() { return *m_Renderer; }
        [[nodiscard]] Graphics::TextureSystem& GetTextures() { return *m_Textures; }
        [[nodiscard]] Graphics::ShaderSystem& GetShaders() { return *m_Shaders; }
        [[nodiscard]] Graphics::MaterialSystem& GetMaterials() { return *m_Materials; }
        [[nodiscard]] Graphics::GeometrySystem& GetGeometries() { return *m_Geometries; }
        [[nodiscard]] Graphics::CameraSystem& GetCameras() { return *m_Cameras; }
        [[nodiscard]] Graphics::RenderViewSystem& GetViews() { return *m_Views; }
        [[nodiscard]] Graphics::FileResourceLoader& GetResourceLoader() { return *m_Loader; }
        [[nodiscard]] Core::Tasks::JobSystem& GetJobs() { return *m_Jobs; }
        [[nodiscard]] Core::Assets::AssetIndex& GetAssetIndex() { return *m_AssetIndex; }
        [[nodiscard]] ECS::TransformArena& GetTransforms() { return m_Transforms; }

    protected:
        // To be implemented by the client (Sandbox)
        [[nodiscard]] virtual Core::Result OnStart() = 0;
        [[nodiscard]] virtual Core::Result OnUpdate(double deltaTime) = 0;
        // Adds one packet per view to render this frame.
        [[nodiscard]] virtual Core::Result OnRender(Graphics::RenderPacket& packet, double deltaTime) = 0;
        virtual void OnResize(uint16_t /*width*/, uint16_t /*height*/) {}
        virtual void OnShutdown() {}

        ECS::TransformArena m_Transforms;

    private:
        Core::Result CreateRenderPasses();
        Core::Result CreateBuiltinShaders();
        Core::Result CreateRenderViews();

        EngineConfig m_Config;
        EngineStage m_Stage = EngineStage::Uninitialized;
        bool m_Running = false;
        uint64_t m_FrameCount = 0;

        Core::Clock m_Clock;
        double m_LastTime = 0.0;

        // Declaration order is construction order; Shutdown() tears down in reverse.
        std::unique_ptr<Core::Tasks::JobSystem> m_Jobs;
        std::unique_ptr<Core::Assets::AssetIndex> m_AssetIndex;
        std::unique_ptr<Graphics::FileResourceLoader> m_Loader;
        std::unique_ptr<Graphics::Renderer> m_Renderer;
        std::unique_ptr<Graphics::TextureSystem> m_Textures;
        std::unique_ptr<Graphics::ShaderSystem> m_Shaders;
        std::unique_ptr<Graphics::MaterialSystem> m_Materials;
        std::unique_ptr<Graphics::GeometrySystem> m_Geometries;
        std::unique_ptr<Graphics::CameraSystem> m_Cameras;
        std::unique_ptr<Graphics::RenderViewSystem> m_Views;
    };
}
