#pragma once

// =============================================================================
// Shared engine fixtures for the frame pipeline and render view suites.
//
// Usage: #include "TestEngineHarness.h" AFTER `import Core; import ECS;
// import Graphics; import Runtime;` in each test file. Everything is inline.
// =============================================================================

#include <array>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// Headless backend that logs the frame-level calls and can be told to fail them.
class RecordingBackend : public Graphics::HeadlessBackend
{
public:
    std::vector<std::string> Calls;
    std::optional<Core::ErrorCode> FailBeginFrame;
    std::optional<Core::ErrorCode> FailEndFrame;
    // Nothing is rasterized, so pick tests inject the pixel under the mouse.
    std::optional<std::array<uint8_t, 4>> PickedPixel;

    Core::Result BeginFrame(double deltaTime) override
    {
        Calls.emplace_back("BeginFrame");
        if (FailBeginFrame) return Core::Err(*FailBeginFrame);
        return HeadlessBackend::BeginFrame(deltaTime);
    }

    Core::Result EndFrame(double deltaTime) override
    {
        Calls.emplace_back("EndFrame");
        if (FailEndFrame)
        {
            // Close the frame anyway so the next BeginFrame is legal.
            if (auto ended = HeadlessBackend::EndFrame(deltaTime); !ended) return ended;
            return Core::Err(*FailEndFrame);
        }
        return HeadlessBackend::EndFrame(deltaTime);
    }

    Core::Result RenderPassBegin(Graphics::RenderPass& pass, Graphics::RenderTarget& target) override
    {
        Calls.push_back("PassBegin:" + pass.Name);
        return HeadlessBackend::RenderPassBegin(pass, target);
    }

    Core::Result RenderPassEnd(Graphics::RenderPass& pass) override
    {
        Calls.push_back("PassEnd:" + pass.Name);
        return HeadlessBackend::RenderPassEnd(pass);
    }

    void Resized(uint32_t width, uint32_t height) override
    {
        Calls.push_back("Resized:" + std::to_string(width) + "x" + std::to_string(height));
        HeadlessBackend::Resized(width, height);
    }

    void DrawGeometry(const Graphics::GeometryRenderData& data) override
    {
        Calls.push_back("Draw:" + std::to_string(data.UniqueId));
        HeadlessBackend::DrawGeometry(data);
    }

    Core::Expected<std::array<uint8_t, 4>> TextureReadPixel(const Graphics::Texture& texture, uint32_t x, uint32_t y) override
    {
        Calls.push_back("ReadPixel:" + std::to_string(x) + "," + std::to_string(y));
        if (PickedPixel) return *PickedPixel;
        return HeadlessBackend::TextureReadPixel(texture, x, y);
    }

    [[nodiscard]] size_t Count(const std::string& call) const
    {
        size_t n = 0;
        for (const auto& c : Calls)
            if (c == call) ++n;
        return n;
    }
};

// Engine whose hooks are plain callbacks so each test supplies its own scene.
class TestEngine : public Runtime::Engine
{
public:
    using RenderHook = std::function<Core::Result(TestEngine&, Graphics::RenderPacket&)>;

    TestEngine(Runtime::EngineConfig config, std::unique_ptr<RecordingBackend> backend)
        : Engine(std::move(config), std::move(backend))
    {
    }

    uint32_t Starts = 0;
    uint32_t Updates = 0;
    uint32_t Renders = 0;
    uint32_t Shutdowns = 0;
    std::optional<uint32_t> FailUpdateAt;
    RenderHook Render;

protected:
    Core::Result OnStart() override
    {
        ++Starts;
        return Core::Ok();
    }

    Core::Result OnUpdate(double) override
    {
        ++Updates;
        if (FailUpdateAt && Updates == *FailUpdateAt)
            return Core::Err(Core::ErrorCode::InvalidState);
        return Core::Ok();
    }

    Core::Result OnRender(Graphics::RenderPacket& packet, double) override
    {
        ++Renders;
        return Render ? Render(*this, packet) : Core::Ok();
    }

    void OnShutdown() override { ++Shutdowns; }
};

inline Runtime::EngineConfig MakeTestEngineConfig()
{
    Runtime::EngineConfig config;
    config.AppName = "PrismTests";
    config.Width = 1280;
    config.Height = 720;
    config.LimitFrameRate = false;
    config.ResizeDebounceFrames = 3;
    // No asset files are needed; a missing directory only disables the index.
    config.AssetRoot = std::filesystem::temp_directory_path() / "prism_tests_no_assets";
    config.Systems.Jobs.ThreadCount = 1;
    return config;
}

// Owns a TestEngine plus a raw view of its backend. Tests call Initialize().
struct EngineHarness
{
    RecordingBackend* Backend = nullptr;
    std::unique_ptr<TestEngine> Engine;

    explicit EngineHarness(Runtime::EngineConfig config = MakeTestEngineConfig())
    {
        auto backend = std::make_unique<RecordingBackend>();
        Backend = backend.get();
        Engine = std::make_unique<TestEngine>(std::move(config), std::move(backend));
    }

    [[nodiscard]] Graphics::RenderView* View(std::string_view name)
    {
        auto view = Engine->GetViews().Get(name);
        return view ? *view : nullptr;
    }
};

inline Graphics::Mesh MakeMesh(uint32_t id, std::vector<Graphics::Geometry*> geometries, ECS::TransformHandle transform)
{
    Graphics::Mesh mesh;
    mesh.UniqueId = id;
    mesh.Geometries = std::move(geometries);
    mesh.Transform = transform;
    mesh.MarkLoaded();
    return mesh;
}
