module;
#include <algorithm>
#include <array>
#include <cstdint>
#include <expected>
#include <iterator>
#include <memory>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>
#include <glm/glm.hpp>

module Graphics;

namespace Graphics
{
    namespace
    {
        constexpr float DEFAULT_FOV = 0.785398163f; // 45 degrees
        constexpr float DEFAULT_NEAR = 0.1f;
        constexpr float DEFAULT_FAR = 1000.0f;
        constexpr float UI_NEAR = -100.0f;
        constexpr float UI_FAR = 100.0f;
        constexpr float DEFAULT_WIDTH = 1280.0f;
        constexpr float DEFAULT_HEIGHT = 720.0f;
        constexpr uint32_t PICK_NOTHING = 0x00FFFFFF;

        glm::mat4 ModelOf(const ECS::TransformArena& transforms, ECS::TransformHandle handle)
        {
            if (handle == ECS::NullTransform || !transforms.IsValid(handle))
                return glm::mat4(1.0f);
            return transforms.GetWorld(handle);
        }

        void AppendMeshGeometries(const std::vector<Mesh>& meshes, const ECS::TransformArena& transforms,
                                  std::vector<GeometryRenderData>& out)
        {
            for (const Mesh& mesh : meshes)
            {
                if (!mesh.IsLive()) continue;
                const glm::mat4 model = ModelOf(transforms, mesh.Transform);
                for (Geometry* geometry : mesh.Geometries)
                {
                    if (geometry)
                        out.push_back({model, geometry, mesh.UniqueId});
                }
            }
        }

        void TrackHighestId(const std::vector<Mesh>& meshes, uint32_t& highest)
        {
            for (const Mesh& mesh : meshes)
            {
                if (mesh.IsLive() && mesh.UniqueId != INVALID_ID)
                    highest = std::max(highest, mesh.UniqueId);
            }
        }
    }

    glm::vec3 PickIdToColour(uint32_t id)
    {
        const uint32_t r = (id >> 16) & 0xFF;
        const uint32_t g = (id >> 8) & 0xFF;
        const uint32_t b = id & 0xFF;
        return glm::vec3(static_cast<float>(r), static_cast<float>(g), static_cast<float>(b)) / 255.0f;
    }

    uint32_t PickColourToId(const std::array<uint8_t, 4>& pixel)
    {
        const uint32_t id = (static_cast<uint32_t>(pixel[0]) << 16) | (static_cast<uint32_t>(pixel[1]) << 8) | pixel[2];
        return id == PICK_NOTHING ? INVALID_ID : id;
    }

    RenderViewSystem::RenderViewSystem(Renderer& renderer, ShaderSystem& shaders, MaterialSystem& materials, CameraSystem& cameras)
        : m_Renderer(renderer), m_Shaders(shaders), m_Materials(materials), m_Cameras(cameras)
    {
    }

    RenderViewSystem::~RenderViewSystem()
    {
        Shutdown();
    }

    Core::Result RenderViewSystem::Initialize(const RenderViewSystemConfig& config)
    {
        if (config.MaxViewCount == 0)
        {
            Core::Log::Error("RenderViewSystem: MaxViewCount must be > 0.");
            return Core::Err(Core::ErrorCode::InvalidArgument);
        }
        m_Config = config;
        m_Views.clear();
        m_Views.resize(config.MaxViewCount);
        m_Initialized = true;
        return Core::Ok();
    }

    void RenderViewSystem::Shutdown()
    {
        if (!m_Initialized) return;

        std::vector<std::unique_ptr<RenderView>> views = std::move(m_Views);
        m_Views.clear();
        m_Lookup.clear();
        for (auto& view : views)
        {
            if (!view) continue;
            if (auto released = ReleasePassTargets(*view); !released)
                Core::Log::Warn("RenderViewSystem: targets of view '{}' were not released cleanly.", view->Name);
            ReleaseOwnedResources(*view);
        }
        m_Initialized = false;
    }

    // --- Registry ---

    Core::Result RenderViewSystem::Create(const RenderViewConfig& config)
    {
        if (!m_Initialized)
            return Core::Err(Core::ErrorCode::InvalidState);
        if (config.Name.empty())
        {
            Core::Log::Error("RenderViewSystem: views need a name.");
            return Core::Err(Core::ErrorCode::InvalidArgument);
        }
        if (config.PassNames.empty())
        {
            Core::Log::Error("RenderViewSystem: view '{}' has no render passes.", config.Name);
            return Core::Err(Core::ErrorCode::InvalidArgument);
        }
        if (m_Lookup.contains(config.Name))
        {
            Core::Log::Error("RenderViewSystem: a view named '{}' already exists.", config.Name);
            return Core::Err(Core::ErrorCode::AlreadyExists);
        }

        auto slot = std::ranges::find_if(m_Views, [](const auto& view) { return view == nullptr; });
        if (slot == m_Views.end())
        {
            Core::Log::Error("RenderViewSystem: no free slot for '{}' (max {}).", config.Name, m_Config.MaxViewCount);
            return Core::Err(Core::ErrorCode::ResourceExhausted);
        }

        auto view = std::make_unique<RenderView>();
        view->Id = static_cast<uint16_t>(std::distance(m_Views.begin(), slot));
        view->Name = config.Name;
        view->Width = config.Width;
        view->Height = config.Height;
        view->Kind = config.Kind;
        view->CustomShaderName = config.CustomShaderName;

        for (const auto& passName : config.PassNames)
        {
            auto pass = m_Renderer.GetRenderPass(passName);
            if (!pass)
            {
                Core::Log::Error("RenderViewSystem: view '{}' names unknown render pass '{}'.", config.Name, passName);
                return std::unexpected(pass.error());
            }
            view->Passes.push_back(*pass);
        }

        Core::Result created = Core::Ok();
        switch (view->Kind)
        {
        case RenderViewKind::World:  created = CreateWorld(*view); break;
        case RenderViewKind::UI:     created = CreateUI(*view); break;
        case RenderViewKind::Skybox: created = CreateSkybox(*view); break;
        case RenderViewKind::Pick:   created = CreatePick(*view); break;
        }
        if (!created)
        {
            Core::Log::Error("RenderViewSystem: failed to create {} view '{}'.", RenderViewKindToString(view->Kind), config.Name);
            ReleaseOwnedResources(*view);
            return created;
        }

        if (view->Width != 0 && view->Height != 0)
            UpdateProjection(*view);

        if (auto regenerated = RegenerateRenderTargets(*view); !regenerated)
        {
            if (auto released = ReleasePassTargets(*view); !released)
                Core::Log::Warn("RenderViewSystem: could not restore shared targets after '{}' failed.", config.Name);
            ReleaseOwnedResources(*view);
            return regenerated;
        }

        m_Lookup.emplace(config.Name, view->Id);
        *slot = std::move(view);
        Core::Log::Info("RenderViewSystem: created {} view '{}'.", RenderViewKindToString((*slot)->Kind), config.Name);
        return Core::Ok();
    }

    Core::Result RenderViewSystem::Destroy(std::string_view name)
    {
        auto it = m_Lookup.find(name);
        if (it == m_Lookup.end())
        {
            Core::Log::Warn("RenderViewSystem: cannot destroy unknown view '{}'.", name);
            return Core::Err(Core::ErrorCode::ResourceNotFound);
        }

        std::unique_ptr<RenderView> view = std::move(m_Views[it->second]);
        m_Lookup.erase(it);

        auto released = ReleasePassTargets(*view);
        ReleaseOwnedResources(*view);
        return released;
    }

    Core::Expected<RenderView*> RenderViewSystem::Get(std::string_view name)
    {
        if (auto it = m_Lookup.find(name); it != m_Lookup.end())
            return m_Views[it->second].get();

        Core::Log::Error("RenderViewSystem: no view named '{}'.", name);
        return std::unexpected(Core::ErrorCode::ResourceNotFound);
    }

    Core::Result RenderViewSystem::ResolveShader(const RenderView& view, std::string_view builtinName, uint32_t& shaderId)
    {
        const std::string_view name = view.CustomShaderName.empty() ? builtinName : std::string_view(view.CustomShaderName);
        shaderId = m_Shaders.GetId(name);
        if (shaderId == INVALID_ID)
        {
            Core::Log::Error("RenderViewSystem: view '{}' needs shader '{}', which does not exist.", view.Name, name);
            return Core::Err(Core::ErrorCode::ResourceNotFound);
        }
        return Core::Ok();
    }

    Core::Result RenderViewSystem::ResolveUniform(uint32_t shaderId, std::string_view name, uint16_t& location)
    {
        Shader* shader = m_Shaders.GetById(shaderId);
        if (!shader)
            return Core::Err(Core::ErrorCode::ResourceNotFound);

        location = m_Shaders.GetUniformIndex(*shader, name);
        if (location == INVALID_ID_U16)
            return Core::Err(Core::ErrorCode::ResourceNotFound);
        return Core::Ok();
    }

    // --- Creation per kind ---

    Core::Result RenderViewSystem::CreateWorld(RenderView& view)
    {
        WorldViewState state;
        if (auto shader = ResolveShader(view, BUILTIN_MATERIAL_SHADER_NAME, state.ShaderId); !shader)
            return shader;

        state.Fov = DEFAULT_FOV;
        state.NearClip = DEFAULT_NEAR;
        state.FarClip = DEFAULT_FAR;
        state.Projection = MakePerspective(state.Fov, DEFAULT_WIDTH / DEFAULT_HEIGHT, state.NearClip, state.FarClip);
        state.AmbientColour = glm::vec4(0.25f, 0.25f, 0.25f, 1.0f);
        state.Mode = RenderMode::Default;
        view.State = state;
        return Core::Ok();
    }

    Core::Result RenderViewSystem::CreateUI(RenderView& view)
    {
        UIViewState state;
        if (auto shader = ResolveShader(view, BUILTIN_UI_SHADER_NAME, state.ShaderId); !shader)
            return shader;

        auto resolved = ResolveUniform(state.ShaderId, "diffuse_texture", state.DiffuseMapLocation)
            .and_then([&](Core::Unit) { return ResolveUniform(state.ShaderId, "diffuse_colour", state.DiffuseColourLocation); })
            .and_then([&](Core::Unit) { return ResolveUniform(state.ShaderId, "model", state.ModelLocation); });
        if (!resolved)
            return resolved;

        state.NearClip = UI_NEAR;
        state.FarClip = UI_FAR;
        state.Projection = MakeOrthographic(DEFAULT_WIDTH, DEFAULT_HEIGHT, state.NearClip, state.FarClip);
        state.View = glm::mat4(1.0f);
        view.State = state;
        return Core::Ok();
    }

    Core::Result RenderViewSystem::CreateSkybox(RenderView& view)
    {
        SkyboxViewState state;
        if (auto shader = ResolveShader(view, BUILTIN_SKYBOX_SHADER_NAME, state.ShaderId); !shader)
            return shader;

        auto resolved = ResolveUniform(state.ShaderId, "projection", state.ProjectionLocation)
            .and_then([&](Core::Unit) { return ResolveUniform(state.ShaderId, "view", state.ViewLocation); })
            .and_then([&](Core::Unit) { return ResolveUniform(state.ShaderId, "cube_texture", state.CubeMapLocation); });
        if (!resolved)
            return resolved;

        state.Fov = DEFAULT_FOV;
        state.NearClip = DEFAULT_NEAR;
        state.FarClip = DEFAULT_FAR;
        state.Projection = MakePerspective(state.Fov, DEFAULT_WIDTH / DEFAULT_HEIGHT, state.NearClip, state.FarClip);
        view.State = state;
        return Core::Ok();
    }

    Core::Result RenderViewSystem::CreatePick(RenderView& view)
    {
        if (view.Passes.size() != 2)
        {
            Core::Log::Error("RenderViewSystem: pick view '{}' needs a world pass and a UI pass.", view.Name);
            return Core::Err(Core::ErrorCode::InvalidArgument);
        }

        // The state lives in the view from here on; the attachment textures must not move.
        view.State = PickViewState{};
        auto& state = std::get<PickViewState>(view.State);

        auto resolveInfo = [this](PickShaderInfo& info, std::string_view shaderName) -> Core::Result
        {
            info.ShaderId = m_Shaders.GetId(shaderName);
            if (info.ShaderId == INVALID_ID)
            {
                Core::Log::Error("RenderViewSystem: pick shader '{}' does not exist.", shaderName);
                return Core::Err(Core::ErrorCode::ResourceNotFound);
            }
            return ResolveUniform(info.ShaderId, "id_colour", info.IdColourLocation)
                .and_then([&](Core::Unit) { return ResolveUniform(info.ShaderId, "model", info.ModelLocation); })
                .and_then([&](Core::Unit) { return ResolveUniform(info.ShaderId, "projection", info.ProjectionLocation); })
                .and_then([&](Core::Unit) { return ResolveUniform(info.ShaderId, "view", info.ViewLocation); });
        };

        if (auto world = resolveInfo(state.WorldShaderInfo, BUILTIN_WORLD_PICK_SHADER_NAME); !world)
            return world;
        if (auto ui = resolveInfo(state.UIShaderInfo, BUILTIN_UI_PICK_SHADER_NAME); !ui)
            return ui;

        state.WorldShaderInfo.Fov = DEFAULT_FOV;
        state.WorldShaderInfo.NearClip = DEFAULT_NEAR;
        state.WorldShaderInfo.FarClip = DEFAULT_FAR;
        state.WorldShaderInfo.Projection = MakePerspective(DEFAULT_FOV, DEFAULT_WIDTH / DEFAULT_HEIGHT, DEFAULT_NEAR, DEFAULT_FAR);

        state.UIShaderInfo.NearClip = UI_NEAR;
        state.UIShaderInfo.FarClip = UI_FAR;
        state.UIShaderInfo.Projection = MakeOrthographic(DEFAULT_WIDTH, DEFAULT_HEIGHT, UI_NEAR, UI_FAR);
        state.UIShaderInfo.View = glm::mat4(1.0f);

        state.ColourTarget.Name = "__pick_colour_" + view.Name;
        state.ColourTarget.ChannelCount = 4;
        state.ColourTarget.SetFlag(TextureFlag::IsWriteable, true);

        state.DepthTarget.Name = "__pick_depth_" + view.Name;
        state.DepthTarget.ChannelCount = 4;
        state.DepthTarget.SetFlag(TextureFlag::IsWriteable, true);
        state.DepthTarget.SetFlag(TextureFlag::Depth, true);
        return Core::Ok();
    }

    void RenderViewSystem::ReleaseOwnedResources(RenderView& view)
    {
        auto* pick = std::get_if<PickViewState>(&view.State);
        if (!pick) return;

        IRendererBackend& backend = m_Renderer.Backend();
        Shader* worldShader = m_Shaders.GetById(pick->WorldShaderInfo.ShaderId);
        Shader* uiShader = m_Shaders.GetById(pick->UIShaderInfo.ShaderId);
        for (uint32_t i = 0; i < pick->InstanceCount; ++i)
        {
            if (worldShader)
            {
                if (auto released = backend.ShaderReleaseInstanceResources(*worldShader, i); !released)
                    Core::Log::Warn("RenderViewSystem: could not release world pick instance {}.", i);
            }
            if (uiShader)
            {
                if (auto released = backend.ShaderReleaseInstanceResources(*uiShader, i); !released)
                    Core::Log::Warn("RenderViewSystem: could not release UI pick instance {}.", i);
            }
        }
        pick->InstanceCount = 0;
        pick->InstanceUpdated.clear();

        if (pick->ColourTarget.InternalHandle != 0) backend.TextureDestroy(pick->ColourTarget);
        if (pick->DepthTarget.InternalHandle != 0) backend.TextureDestroy(pick->DepthTarget);
    }

    Core::Result RenderViewSystem::ReleasePassTargets(RenderView& view)
    {
        IRendererBackend& backend = m_Renderer.Backend();
        std::vector<RenderView*> sharing;

        // Passes belong to the renderer and may back several views.
        for (RenderPass* pass : view.Passes)
        {
            bool shared = false;
            for (auto& other : m_Views)
            {
                if (!other || other.get() == &view || std::ranges::find(other->Passes, pass) == other->Passes.end())
                    continue;
                shared = true;
                if (std::ranges::find(sharing, other.get()) == sharing.end())
                    sharing.push_back(other.get());
            }
            if (shared) continue;

            for (auto& target : pass->Targets)
            {
                for (auto& attachment : target.Attachments)
                {
                    if (attachment.Source == RenderTargetAttachmentSource::View)
                        attachment.Texture = nullptr;
                }
                if (target.InternalHandle != 0)
                    backend.RenderTargetDestroy(target, false);
            }
        }

        // A shared pass may still reference this view's attachments.
        Core::Result result = Core::Ok();
        for (RenderView* other : sharing)
        {
            if (auto regenerated = RegenerateRenderTargets(*other); !regenerated)
            {
                Core::Log::Error("RenderViewSystem: view '{}' lost its render targets when '{}' went away.", other->Name, view.Name);
                result = regenerated;
            }
        }
        return result;
    }

    // --- Render targets ---

    Core::Result RenderViewSystem::RegenerateAttachmentTarget(RenderView& view, const RenderPass& pass,
                                                              RenderTargetAttachment& attachment)
    {
        auto* pick = std::get_if<PickViewState>(&view.State);
        if (!pick)
        {
            Core::Log::Error("RenderViewSystem: {} view '{}' owns no attachment textures.", RenderViewKindToString(view.Kind), view.Name);
            return Core::Err(Core::ErrorCode::InvalidState);
        }

        Texture& texture = attachment.Type == RenderTargetAttachmentType::Colour ? pick->ColourTarget : pick->DepthTarget;
        attachment.Texture = &texture;

        const auto width = static_cast<uint32_t>(pass.RenderArea.z);
        const auto height = static_cast<uint32_t>(pass.RenderArea.w);
        IRendererBackend& backend = m_Renderer.Backend();

        if (texture.InternalHandle == 0)
        {
            texture.Width = width;
            texture.Height = height;
            if (auto created = backend.TextureCreateWriteable(texture); !created)
            {
                Core::Log::Error("RenderViewSystem: could not create attachment '{}'.", texture.Name);
                return created;
            }
            texture.Generation = 0;
        }
        else if (texture.Width != width || texture.Height != height)
        {
            if (auto resized = backend.TextureResize(texture, width, height); !resized)
            {
                Core::Log::Error("RenderViewSystem: could not resize attachment '{}'.", texture.Name);
                return resized;
            }
            ++texture.Generation;
        }
        return Core::Ok();
    }

    Core::Result RenderViewSystem::RegenerateRenderTargets(RenderView& view)
    {
        IRendererBackend& backend = m_Renderer.Backend();

        for (RenderPass* pass : view.Passes)
        {
            for (size_t i = 0; i < pass->Targets.size(); ++i)
            {
                RenderTarget& target = pass->Targets[i];
                backend.RenderTargetDestroy(target, false);

                std::vector<RenderTargetAttachment> attachments = target.Attachments;
                for (auto& attachment : attachments)
                {
                    if (attachment.Source == RenderTargetAttachmentSource::Default)
                    {
                        const auto index = static_cast<uint8_t>(i);
                        attachment.Texture = attachment.Type == RenderTargetAttachmentType::Colour
                            ? backend.WindowAttachmentGet(index)
                            : backend.DepthAttachmentGet(index);
                        if (!attachment.Texture)
                            return Core::Err(Core::ErrorCode::InvalidState);
                    }
                    else if (auto regenerated = RegenerateAttachmentTarget(view, *pass, attachment); !regenerated)
                    {
                        return regenerated;
                    }
                }

                uint32_t width = static_cast<uint32_t>(pass->RenderArea.z);
                uint32_t height = static_cast<uint32_t>(pass->RenderArea.w);
                if (!attachments.empty())
                {
                    width = attachments.front().Texture->Width;
                    height = attachments.front().Texture->Height;
                }

                if (auto created = backend.RenderTargetCreate(attachments, *pass, width, height, target); !created)
                {
                    Core::Log::Error("RenderViewSystem: render target {} of pass '{}' failed for view '{}'.", i, pass->Name, view.Name);
                    return created;
                }
            }
        }
        return Core::Ok();
    }

    // --- Resize ---

    void RenderViewSystem::UpdateProjection(RenderView& view)
    {
        // Minimized: the previous projection stays.
        if (view.Width == 0 || view.Height == 0)
            return;

        const float width = static_cast<float>(view.Width);
        const float height = static_cast<float>(view.Height);
        const float aspect = width / height;

        std::visit([&](auto& state)
        {
            using T = std::decay_t<decltype(state)>;
            if constexpr (std::is_same_v<T, WorldViewState> || std::is_same_v<T, SkyboxViewState>)
            {
                state.Projection = MakePerspective(state.Fov, aspect, state.NearClip, state.FarClip);
            }
            else if constexpr (std::is_same_v<T, UIViewState>)
            {
                state.Projection = MakeOrthographic(width, height, state.NearClip, state.FarClip);
            }
            else if constexpr (std::is_same_v<T, PickViewState>)
            {
                PickShaderInfo& world = state.WorldShaderInfo;
                world.Projection = MakePerspective(world.Fov, aspect, world.NearClip, world.FarClip);
                PickShaderInfo& ui = state.UIShaderInfo;
                ui.Projection = MakeOrthographic(width, height, ui.NearClip, ui.FarClip);
            }
        }, view.State);
    }

    void RenderViewSystem::OnWindowResize(uint16_t width, uint16_t height)
    {
        for (auto& view : m_Views)
        {
            if (!view || (view->Width == width && view->Height == height))
                continue;

            view->Width = width;
            view->Height = height;
            // Minimized: keep the old projection and targets.
            if (width == 0 || height == 0)
                continue;

            UpdateProjection(*view);
            for (RenderPass* pass : view->Passes)
                pass->RenderArea = glm::vec4(0.0f, 0.0f, static_cast<float>(width), static_cast<float>(height));

            if (auto regenerated = RegenerateRenderTargets(*view); !regenerated)
                Core::Log::Error("RenderViewSystem: view '{}' could not rebuild its targets after resize.", view->Name);
        }
    }

    // --- Packets ---

    Core::Expected<RenderViewPacket> RenderViewSystem::BuildPacket(RenderView& view, const RenderViewPayload& payload)
    {
        RenderViewPacket packet;
        packet.View = &view;
        packet.CustomShaderName = view.CustomShaderName;

        Core::Result built = Core::Err(Core::ErrorCode::TypeMismatch);
        switch (view.Kind)
        {
        case RenderViewKind::World:
            if (const auto* data = std::get_if<MeshPacketData>(&payload))
                built = BuildWorldPacket(view, *data, packet);
            break;
        case RenderViewKind::UI:
            if (const auto* data = std::get_if<UIPacketData>(&payload))
                built = BuildUIPacket(view, *data, packet);
            break;
        case RenderViewKind::Skybox:
            if (const auto* data = std::get_if<SkyboxPacketData>(&payload))
                built = BuildSkyboxPacket(view, *data, packet);
            break;
        case RenderViewKind::Pick:
            if (const auto* data = std::get_if<PickPacketData>(&payload))
                built = BuildPickPacket(view, *data, packet);
            break;
        }

        if (!built)
        {
            Core::Log::Error("RenderViewSystem: cannot build a packet for {} view '{}' ({}).",
                             RenderViewKindToString(view.Kind), view.Name, Core::ErrorCodeToString(built.error()));
            return std::unexpected(built.error());
        }
        return packet;
    }

    Core::Result RenderViewSystem::BuildWorldPacket(RenderView& view, const MeshPacketData& data, RenderViewPacket& packet)
    {
        if (!data.Meshes || !data.Transforms)
            return Core::Err(Core::ErrorCode::InvalidArgument);

        const auto& state = std::get<WorldViewState>(view.State);
        Camera* camera = m_Cameras.GetDefault();
        packet.ProjectionMatrix = state.Projection;
        packet.ViewMatrix = camera->GetView();
        packet.ViewPosition = camera->GetPosition();
        packet.AmbientColour = state.AmbientColour;

        struct Deferred
        {
            GeometryRenderData Data;
            float Distance = 0.0f;
        };
        std::vector<Deferred> transparent;

        for (const Mesh& mesh : *data.Meshes)
        {
            if (!mesh.IsLive()) continue;

            const glm::mat4 model = ModelOf(*data.Transforms, mesh.Transform);
            for (Geometry* geometry : mesh.Geometries)
            {
                if (!geometry) continue;

                if (!geometry->Material || !geometry->Material->IsTransparent())
                {
                    packet.Geometries.push_back({model, geometry, mesh.UniqueId});
                    continue;
                }

                const glm::vec3 center = glm::vec3(model * glm::vec4(geometry->Center, 1.0f));
                transparent.push_back({{model, geometry, mesh.UniqueId}, glm::distance(center, packet.ViewPosition)});
            }
        }

        // Nearest first; equal distances keep submission order.
        std::ranges::stable_sort(transparent, {}, &Deferred::Distance);
        for (const auto& entry : transparent)
            packet.Geometries.push_back(entry.Data);
        return Core::Ok();
    }

    Core::Result RenderViewSystem::BuildUIPacket(RenderView& view, const UIPacketData& data, RenderViewPacket& packet)
    {
        if (!data.Meshes || !data.Transforms)
            return Core::Err(Core::ErrorCode::InvalidArgument);

        const auto& state = std::get<UIViewState>(view.State);
        packet.ProjectionMatrix = state.Projection;
        packet.ViewMatrix = state.View;

        AppendMeshGeometries(*data.Meshes, *data.Transforms, packet.Geometries);
        packet.ExtendedData = data;
        return Core::Ok();
    }

    Core::Result RenderViewSystem::BuildSkyboxPacket(RenderView& view, const SkyboxPacketData& data, RenderViewPacket& packet)
    {
        if (!data.Skybox)
            return Core::Err(Core::ErrorCode::InvalidArgument);

        const auto& state = std::get<SkyboxViewState>(view.State);
        Camera* camera = m_Cameras.GetDefault();
        packet.ProjectionMatrix = state.Projection;
        packet.ViewMatrix = camera->GetView();
        packet.ViewPosition = camera->GetPosition();
        packet.ExtendedData = data;
        return Core::Ok();
    }

    Core::Result RenderViewSystem::BuildPickPacket(RenderView& view, PickPacketData data, RenderViewPacket& packet)
    {
        if (!data.WorldMeshes || !data.UIMeshes || !data.Transforms)
            return Core::Err(Core::ErrorCode::InvalidArgument);

        auto& state = std::get<PickViewState>(view.State);
        Camera* camera = m_Cameras.GetDefault();
        state.WorldShaderInfo.View = camera->GetView();
        packet.ProjectionMatrix = state.WorldShaderInfo.Projection;
        packet.ViewMatrix = state.WorldShaderInfo.View;
        packet.ViewPosition = camera->GetPosition();

        AppendMeshGeometries(*data.WorldMeshes, *data.Transforms, packet.Geometries);
        data.WorldGeometryCount = static_cast<uint32_t>(packet.Geometries.size());
        AppendMeshGeometries(*data.UIMeshes, *data.Transforms, packet.Geometries);
        data.UIGeometryCount = static_cast<uint32_t>(packet.Geometries.size()) - data.WorldGeometryCount;

        uint32_t highest = 0;
        TrackHighestId(*data.WorldMeshes, highest);
        TrackHighestId(*data.UIMeshes, highest);
        if (data.Texts)
        {
            for (const UIText& text : *data.Texts)
            {
                if (text.UniqueId != INVALID_ID)
                    highest = std::max(highest, text.UniqueId);
            }
        }
        if (highest >= PICK_NOTHING)
        {
            Core::Log::Error("RenderViewSystem: object id {} does not fit the 24-bit pick encoding of '{}'.", highest, view.Name);
            return Core::Err(Core::ErrorCode::InvalidArgument);
        }
        data.RequiredInstanceCount = highest + 1;

        if (data.RequiredInstanceCount > state.InstanceCount)
        {
            Shader* worldShader = m_Shaders.GetById(state.WorldShaderInfo.ShaderId);
            Shader* uiShader = m_Shaders.GetById(state.UIShaderInfo.ShaderId);
            if (!worldShader || !uiShader)
                return Core::Err(Core::ErrorCode::ResourceNotFound);

            IRendererBackend& backend = m_Renderer.Backend();
            while (state.InstanceCount < data.RequiredInstanceCount)
            {
                // Instance ids double as object ids, so both shaders must hand out the next slot.
                auto worldInstance = backend.ShaderAcquireInstanceResources(*worldShader, {});
                if (!worldInstance)
                    return std::unexpected(worldInstance.error());
                auto uiInstance = backend.ShaderAcquireInstanceResources(*uiShader, {});
                if (!uiInstance)
                {
                    if (auto released = backend.ShaderReleaseInstanceResources(*worldShader, *worldInstance); !released)
                        Core::Log::Warn("RenderViewSystem: could not return world pick instance {}.", *worldInstance);
                    return std::unexpected(uiInstance.error());
                }
                if (*worldInstance != state.InstanceCount || *uiInstance != state.InstanceCount)
                {
                    Core::Log::Error("RenderViewSystem: pick instance {} came back as {}/{}.",
                                     state.InstanceCount, *worldInstance, *uiInstance);
                    if (auto released = backend.ShaderReleaseInstanceResources(*worldShader, *worldInstance); !released)
                        Core::Log::Warn("RenderViewSystem: could not return world pick instance {}.", *worldInstance);
                    if (auto released = backend.ShaderReleaseInstanceResources(*uiShader, *uiInstance); !released)
                        Core::Log::Warn("RenderViewSystem: could not return UI pick instance {}.", *uiInstance);
                    return Core::Err(Core::ErrorCode::InvalidState);
                }
                ++state.InstanceCount;
                state.InstanceUpdated.push_back(false);
            }
        }

        packet.ExtendedData = data;
        return Core::Ok();
    }

    void RenderViewSystem::OnDestroyPacket(RenderViewPacket& packet)
    {
        packet.Geometries.clear();
        packet.ExtendedData = std::monostate{};
    }

    // --- Rendering ---

    Core::Result RenderViewSystem::OnRender(RenderViewPacket& packet, uint64_t frameNumber, uint8_t renderTargetIndex)
    {
        RenderView* view = packet.View;
        if (!view)
        {
            Core::Log::Error("RenderViewSystem: packet without a view.");
            return Core::Err(Core::ErrorCode::InvalidArgument);
        }

        switch (view->Kind)
        {
        case RenderViewKind::World:
        {
            const auto& state = std::get<WorldViewState>(view->State);
            uint32_t shaderId = state.ShaderId;
            if (!packet.CustomShaderName.empty())
            {
                shaderId = m_Shaders.GetId(packet.CustomShaderName);
                if (shaderId == INVALID_ID)
                    return Core::Err(Core::ErrorCode::ResourceNotFound);
            }
            return RenderMaterials(*view, packet, shaderId, static_cast<uint32_t>(state.Mode), frameNumber, renderTargetIndex);
        }
        case RenderViewKind::UI:
            return RenderMaterials(*view, packet, std::get<UIViewState>(view->State).ShaderId, 0, frameNumber, renderTargetIndex);
        case RenderViewKind::Skybox:
            return RenderSkybox(*view, packet, frameNumber, renderTargetIndex);
        case RenderViewKind::Pick:
            return RenderPick(*view, packet, frameNumber, renderTargetIndex);
        }
        return Core::Err(Core::ErrorCode::InvalidState);
    }

    Core::Result RenderViewSystem::RenderMaterials(RenderView& view, RenderViewPacket& packet, uint32_t shaderId, uint32_t renderMode,
                                                   uint64_t frameNumber, uint8_t renderTargetIndex)
    {
        IRendererBackend& backend = m_Renderer.Backend();

        for (RenderPass* pass : view.Passes)
        {
            if (renderTargetIndex >= pass->Targets.size())
                return Core::Err(Core::ErrorCode::OutOfRange);

            if (auto begun = backend.RenderPassBegin(*pass, pass->Targets[renderTargetIndex]); !begun)
            {
                Core::Log::Error("RenderViewSystem: view '{}' could not begin pass '{}'.", view.Name, pass->Name);
                return begun;
            }

            auto drawn = m_Shaders.UseById(shaderId)
                .and_then([&](Core::Unit)
                {
                    return m_Materials.ApplyGlobal(shaderId, frameNumber, packet.ProjectionMatrix, packet.ViewMatrix,
                                                   packet.AmbientColour, packet.ViewPosition, renderMode);
                })
                .and_then([&](Core::Unit) -> Core::Result
                {
                    for (const GeometryRenderData& data : packet.Geometries)
                    {
                        Material* material = data.Geometry->Material ? data.Geometry->Material : m_Materials.GetDefault();

                        // Instance uniforms go up once per frame per material.
                        const bool needsUpdate = material->RenderFrameNumber != frameNumber;
                        if (auto applied = m_Materials.ApplyInstance(*material, needsUpdate); !applied)
                            return applied;
                        material->RenderFrameNumber = frameNumber;

                        if (auto local = m_Materials.ApplyLocal(*material, data.Model); !local)
                            return local;

                        backend.DrawGeometry(data);
                    }
                    return Core::Ok();
                });

            // The pass is closed even when a draw failed.
            auto ended = backend.RenderPassEnd(*pass);
            if (!drawn)
            {
                Core::Log::Error("RenderViewSystem: view '{}' failed in pass '{}'.", view.Name, pass->Name);
                return drawn;
            }
            if (!ended)
                return ended;
        }
        return Core::Ok();
    }

    Core::Result RenderViewSystem::RenderSkybox(RenderView& view, RenderViewPacket& packet, uint64_t frameNumber, uint8_t renderTargetIndex)
    {
        const auto* data = std::get_if<SkyboxPacketData>(&packet.ExtendedData);
        if (!data || !data->Skybox)
            return Core::Err(Core::ErrorCode::InvalidArgument);

        Skybox& skybox = *data->Skybox;
        const auto& state = std::get<SkyboxViewState>(view.State);
        IRendererBackend& backend = m_Renderer.Backend();

        // The sky never moves with the camera.
        glm::mat4 viewMatrix = packet.ViewMatrix;
        viewMatrix[3][0] = 0.0f;
        viewMatrix[3][1] = 0.0f;
        viewMatrix[3][2] = 0.0f;

        for (RenderPass* pass : view.Passes)
        {
            if (renderTargetIndex >= pass->Targets.size())
                return Core::Err(Core::ErrorCode::OutOfRange);

            if (auto begun = backend.RenderPassBegin(*pass, pass->Targets[renderTargetIndex]); !begun)
                return begun;

            auto drawn = m_Shaders.UseById(state.ShaderId)
                .and_then([&](Core::Unit) { return m_Shaders.SetUniformByIndex(state.ProjectionLocation, packet.ProjectionMatrix); })
                .and_then([&](Core::Unit) { return m_Shaders.SetUniformByIndex(state.ViewLocation, viewMatrix); })
                .and_then([&](Core::Unit) { return m_Shaders.ApplyGlobal(); })
                .and_then([&](Core::Unit) { return m_Shaders.BindInstance(skybox.InstanceId); })
                .and_then([&](Core::Unit) { return m_Shaders.SetUniformByIndex(state.CubeMapLocation, &skybox.CubeMap); })
                .and_then([&](Core::Unit)
                {
                    const bool needsUpdate = skybox.RenderFrameNumber != frameNumber;
                    skybox.RenderFrameNumber = frameNumber;
                    return m_Shaders.ApplyInstance(needsUpdate);
                })
                .and_then([&](Core::Unit) -> Core::Result
                {
                    if (skybox.Geometry)
                        backend.DrawGeometry({glm::mat4(1.0f), skybox.Geometry, INVALID_ID});
                    return Core::Ok();
                });

            auto ended = backend.RenderPassEnd(*pass);
            if (!drawn)
            {
                Core::Log::Error("RenderViewSystem: skybox view '{}' failed.", view.Name);
                return drawn;
            }
            if (!ended)
                return ended;
        }
        return Core::Ok();
    }

    Core::Result RenderViewSystem::RenderPick(RenderView& view, RenderViewPacket& packet, uint64_t, uint8_t renderTargetIndex)
    {
        const auto* data = std::get_if<PickPacketData>(&packet.ExtendedData);
        if (!data)
            return Core::Err(Core::ErrorCode::InvalidArgument);

        auto& state = std::get<PickViewState>(view.State);
        IRendererBackend& backend = m_Renderer.Backend();
        std::ranges::fill(state.InstanceUpdated, false);

        auto drawIds = [&](const PickShaderInfo& info, size_t first, size_t count) -> Core::Result
        {
            for (size_t i = first; i < first + count && i < packet.Geometries.size(); ++i)
            {
                const GeometryRenderData& geometry = packet.Geometries[i];
                const uint32_t id = geometry.UniqueId;
                if (id >= state.InstanceCount) continue;

                const bool needsUpdate = !state.InstanceUpdated[id];
                auto applied = m_Shaders.BindInstance(id)
                    .and_then([&](Core::Unit) { return m_Shaders.SetUniformByIndex(info.IdColourLocation, PickIdToColour(id)); })
                    .and_then([&](Core::Unit) { return m_Shaders.ApplyInstance(needsUpdate); })
                    .and_then([&](Core::Unit) { return m_Shaders.SetUniformByIndex(info.ModelLocation, geometry.Model); });
                if (!applied)
                    return applied;
                state.InstanceUpdated[id] = true;

                backend.DrawGeometry(geometry);
            }
            return Core::Ok();
        };

        auto renderPass = [&](RenderPass& pass, const PickShaderInfo& info, size_t first, size_t count, bool withTexts) -> Core::Result
        {
            if (renderTargetIndex >= pass.Targets.size())
                return Core::Err(Core::ErrorCode::OutOfRange);
            if (auto begun = backend.RenderPassBegin(pass, pass.Targets[renderTargetIndex]); !begun)
                return begun;

            auto drawn = m_Shaders.UseById(info.ShaderId)
                .and_then([&](Core::Unit) { return m_Shaders.SetUniformByIndex(info.ProjectionLocation, info.Projection); })
                .and_then([&](Core::Unit) { return m_Shaders.SetUniformByIndex(info.ViewLocation, info.View); })
                .and_then([&](Core::Unit) { return m_Shaders.ApplyGlobal(); })
                .and_then([&](Core::Unit) { return drawIds(info, first, count); })
                .and_then([&](Core::Unit) -> Core::Result
                {
                    if (!withTexts || !data->Texts) return Core::Ok();

                    // Text geometry comes from the font collaborator; the id colour is still bound per text.
                    for (const UIText& text : *data->Texts)
                    {
                        if (text.UniqueId >= state.InstanceCount) continue;
                        const bool needsUpdate = !state.InstanceUpdated[text.UniqueId];
                        auto applied = m_Shaders.BindInstance(text.UniqueId)
                            .and_then([&](Core::Unit) { return m_Shaders.SetUniformByIndex(info.IdColourLocation, PickIdToColour(text.UniqueId)); })
                            .and_then([&](Core::Unit) { return m_Shaders.ApplyInstance(needsUpdate); });
                        if (!applied)
                            return applied;
                        state.InstanceUpdated[text.UniqueId] = true;
                    }
                    return Core::Ok();
                });

            auto ended = backend.RenderPassEnd(pass);
            if (!drawn)
                return drawn;
            return ended;
        };

        if (auto world = renderPass(*view.Passes[0], state.WorldShaderInfo, 0, data->WorldGeometryCount, false); !world)
        {
            Core::Log::Error("RenderViewSystem: world pick pass of '{}' failed.", view.Name);
            return world;
        }
        if (auto ui = renderPass(*view.Passes[1], state.UIShaderInfo, data->WorldGeometryCount, data->UIGeometryCount, true); !ui)
        {
            Core::Log::Error("RenderViewSystem: UI pick pass of '{}' failed.", view.Name);
            return ui;
        }

        const Texture& target = state.ColourTarget;
        if (target.Width == 0 || target.Height == 0)
            return Core::Ok();

        const auto x = static_cast<uint32_t>(std::clamp<int32_t>(state.MouseX, 0, static_cast<int32_t>(target.Width) - 1));
        const auto y = static_cast<uint32_t>(std::clamp<int32_t>(state.MouseY, 0, static_cast<int32_t>(target.Height) - 1));

        auto pixel = backend.TextureReadPixel(target, x, y);
        if (!pixel)
        {
            Core::Log::Error("RenderViewSystem: pick read-back at ({}, {}) failed.", x, y);
            return std::unexpected(pixel.error());
        }

        const uint32_t hovered = PickColourToId(*pixel);
        if (hovered != state.HoveredObjectId)
        {
            state.HoveredObjectId = hovered;
            if (m_OnHoveredObjectChanged)
                m_OnHoveredObjectChanged(hovered);
        }
        return Core::Ok();
    }

    void RenderViewSystem::OnMouseMoved(int16_t x, int16_t y)
    {
        for (auto& view : m_Views)
        {
            if (!view) continue;
            if (auto* pick = std::get_if<PickViewState>(&view->State))
            {
                pick->MouseX = x;
                pick->MouseY = y;
            }
        }
    }

    void RenderViewSystem::SetRenderMode(RenderMode mode)
    {
        for (auto& view : m_Views)
        {
            if (!view) continue;
            if (auto* world = std::get_if<WorldViewState>(&view->State))
                world->Mode = mode;
        }
    }
}
