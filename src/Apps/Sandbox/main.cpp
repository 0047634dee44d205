#include <cstdint>
#include <cstdlib>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>
#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

import Core;
import ECS;
import Graphics;
import Runtime;

using namespace Core;
using namespace Runtime;

// --- The Application Class ---
class SandboxApp : public Engine
{
public:
    SandboxApp(uint64_t frameLimit)
        : Engine(MakeConfig(), std::make_unique<Graphics::HeadlessBackend>()), m_FrameLimit(frameLimit)
    {
    }

protected:
    Result OnStart() override
    {
        Log::Info("Sandbox Started!");

        Graphics::Camera* camera = GetCameras().GetDefault();
        camera->SetPosition({0.0f, 2.0f, 15.0f});

        auto cube = GetGeometries().AcquireFromConfig(
            Graphics::GeometrySystem::GenerateCubeConfig(2.0f, 2.0f, 2.0f, 1.0f, 1.0f, "sandbox_cube", ""), true);
        auto floor = GetGeometries().AcquireFromConfig(
            Graphics::GeometrySystem::GeneratePlaneConfig(20.0f, 20.0f, 4, 4, 4.0f, 4.0f, "sandbox_floor", ""), true);
        if (!cube || !floor)
        {
            Log::Error("Sandbox: scene geometry failed to load.");
            return Err(ErrorCode::AssetLoadFailed);
        }

        m_CubeTransform = m_Transforms.Create({0.0f, 1.0f, 0.0f});
        const auto floorTransform = m_Transforms.Create({0.0f, 0.0f, 0.0f},
                                                        glm::angleAxis(glm::radians(-90.0f), glm::vec3(1.0f, 0.0f, 0.0f)),
                                                        glm::vec3(1.0f));
        // The small cube orbits the big one.
        const auto moonTransform = m_Transforms.Create({4.0f, 0.0f, 0.0f});
        if (auto parented = m_Transforms.SetParent(moonTransform, m_CubeTransform); !parented)
            return parented;

        AddMesh(m_WorldMeshes, 1, {*cube}, m_CubeTransform);
        AddMesh(m_WorldMeshes, 2, {*floor}, floorTransform);
        AddMesh(m_WorldMeshes, 3, {*cube}, moonTransform);

        Graphics::MaterialConfig panelMaterial;
        panelMaterial.Name = "sandbox_ui_panel";
        panelMaterial.ShaderName = std::string(Graphics::BUILTIN_UI_SHADER_NAME);
        panelMaterial.DiffuseColour = {0.2f, 0.2f, 0.2f, 0.8f};
        if (auto material = GetMaterials().AcquireFromConfig(panelMaterial); !material)
            return std::unexpected(material.error());

        Graphics::GeometryConfig panel;
        panel.Name = "sandbox_ui_panel";
        panel.MaterialName = panelMaterial.Name;
        panel.Vertices = std::vector<Graphics::Vertex2D>{
            {{0.0f, 0.0f}, {0.0f, 0.0f}},
            {{256.0f, 64.0f}, {1.0f, 1.0f}},
            {{0.0f, 64.0f}, {0.0f, 1.0f}},
            {{256.0f, 0.0f}, {1.0f, 0.0f}},
        };
        panel.Indices = {2, 1, 0, 3, 0, 1};
        auto panelGeometry = GetGeometries().AcquireFromConfig(panel, true);
        if (!panelGeometry)
            return std::unexpected(panelGeometry.error());
        AddMesh(m_UIMeshes, 4, {*panelGeometry}, m_Transforms.Create({16.0f, 16.0f, 0.0f}));

        m_Texts.push_back({.UniqueId = 5, .Text = "Prism Sandbox", .Transform = m_Transforms.Create({24.0f, 24.0f, 0.0f})});

        // Optional: needs assets/textures/skybox_{r,l,u,d,f,b}.
        m_HasSkybox = static_cast<bool>(CreateSkybox(m_Skybox, "skybox"));
        if (!m_HasSkybox)
            Log::Warn("Sandbox: running without a skybox.");

        GetViews().SetHoveredObjectCallback([](uint32_t id)
        {
            if (id == Graphics::INVALID_ID) Log::Info("Hovering nothing.");
            else Log::Info("Hovering object {}.", id);
        });
        return Ok();
    }

    Result OnUpdate(double deltaTime) override
    {
        const auto dt = static_cast<float>(deltaTime);
        m_Transforms.Rotate(m_CubeTransform, glm::angleAxis(0.5f * dt, glm::vec3(0.0f, 1.0f, 0.0f)));

        Graphics::Camera* camera = GetCameras().GetDefault();
        camera->Yaw(0.05f * dt);

        if (m_FrameLimit != 0 && GetFrameCount() + 1 >= m_FrameLimit)
            Stop();
        return Ok();
    }

    Result OnRender(Graphics::RenderPacket& packet, double) override
    {
        Graphics::RenderViewSystem& views = GetViews();

        auto build = [&](std::string_view name, const Graphics::RenderViewPayload& payload) -> Result
        {
            auto view = views.Get(name);
            if (!view)
                return std::unexpected(view.error());
            auto built = views.BuildPacket(**view, payload);
            if (!built)
                return std::unexpected(built.error());
            packet.Views.push_back(std::move(*built));
            return Ok();
        };

        if (m_HasSkybox)
        {
            if (auto sky = build("skybox", Graphics::SkyboxPacketData{&m_Skybox}); !sky)
                return sky;
        }

        return build("world", Graphics::MeshPacketData{&m_WorldMeshes, &m_Transforms})
            .and_then([&](Unit) { return build("ui", Graphics::UIPacketData{&m_UIMeshes, &m_Texts, &m_Transforms}); })
            .and_then([&](Unit)
            {
                Graphics::PickPacketData pick;
                pick.WorldMeshes = &m_WorldMeshes;
                pick.UIMeshes = &m_UIMeshes;
                pick.Texts = &m_Texts;
                pick.Transforms = &m_Transforms;
                return build("pick", pick);
            });
    }

    void OnShutdown() override
    {
        if (m_HasSkybox)
            DestroySkybox(m_Skybox, "skybox");
        Log::Info("Sandbox rendered {} frames.", GetFrameCount());
    }

private:
    static EngineConfig MakeConfig()
    {
        EngineConfig config;
        config.AppName = "Sandbox";
        config.Width = 1280;
        config.Height = 720;
        return config;
    }

    static void AddMesh(std::vector<Graphics::Mesh>& meshes, uint32_t id, std::vector<Graphics::Geometry*> geometries,
                        ECS::TransformHandle transform)
    {
        Graphics::Mesh mesh;
        mesh.UniqueId = id;
        mesh.Geometries = std::move(geometries);
        mesh.Transform = transform;
        mesh.MarkLoaded();
        meshes.push_back(std::move(mesh));
    }

    uint64_t m_FrameLimit = 0;
    ECS::TransformHandle m_CubeTransform = ECS::NullTransform;

    std::vector<Graphics::Mesh> m_WorldMeshes;
    std::vector<Graphics::Mesh> m_UIMeshes;
    std::vector<Graphics::UIText> m_Texts;
    Graphics::Skybox m_Skybox;
    bool m_HasSkybox = false;
};

int main(int argc, char** argv)
{
    // Headless: stop after N frames (0 runs until killed).
    const uint64_t frames = argc > 1 ? std::strtoull(argv[1], nullptr, 10) : 600;

    SandboxApp app(frames);
    if (auto initialized = app.Initialize(); !initialized)
    {
        Log::Error("Sandbox failed to initialize: {}", ErrorCodeToString(initialized.error()));
        return 1;
    }
    if (auto ran = app.Run(); !ran)
    {
        Log::Error("Sandbox stopped on error: {}", ErrorCodeToString(ran.error()));
        return 1;
    }
    return 0;
}
