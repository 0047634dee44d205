module;
#include <algorithm>
#include <array>
#include <cstdint>
#include <expected>
#include <initializer_list>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <glm/glm.hpp>

module Graphics;

namespace Graphics
{
    MaterialSystem::MaterialSystem(Renderer& renderer, ShaderSystem& shaders, TextureSystem& textures, IResourceLoader& loader)
        : m_Renderer(renderer), m_Shaders(shaders), m_Textures(textures), m_Loader(loader)
    {
    }

    MaterialSystem::~MaterialSystem()
    {
        Shutdown();
    }

    Core::Result MaterialSystem::Initialize(const MaterialSystemConfig& config)
    {
        if (config.MaxMaterialCount == 0)
        {
            Core::Log::Error("MaterialSystem: MaxMaterialCount must be > 0.");
            return Core::Err(Core::ErrorCode::InvalidArgument);
        }
        m_Config = config;
        m_Pool.Initialize(config.FramesInFlight, config.MaxMaterialCount);

        Shader* materialShader = m_Shaders.Get(BUILTIN_MATERIAL_SHADER_NAME);
        if (!materialShader)
        {
            Core::Log::Error("MaterialSystem: built-in shader '{}' is missing.", BUILTIN_MATERIAL_SHADER_NAME);
            return Core::Err(Core::ErrorCode::ResourceNotFound);
        }
        m_MaterialShaderId = materialShader->Id;
        m_MaterialLocations = {
            .Projection = m_Shaders.GetUniformIndex(*materialShader, "projection"),
            .View = m_Shaders.GetUniformIndex(*materialShader, "view"),
            .AmbientColour = m_Shaders.GetUniformIndex(*materialShader, "ambient_colour"),
            .ViewPosition = m_Shaders.GetUniformIndex(*materialShader, "view_position"),
            .Mode = m_Shaders.GetUniformIndex(*materialShader, "mode"),
            .DiffuseColour = m_Shaders.GetUniformIndex(*materialShader, "diffuse_colour"),
            .DiffuseTexture = m_Shaders.GetUniformIndex(*materialShader, "diffuse_texture"),
            .SpecularTexture = m_Shaders.GetUniformIndex(*materialShader, "specular_texture"),
            .NormalTexture = m_Shaders.GetUniformIndex(*materialShader, "normal_texture"),
            .Shininess = m_Shaders.GetUniformIndex(*materialShader, "shininess"),
            .Model = m_Shaders.GetUniformIndex(*materialShader, "model"),
        };

        if (Shader* uiShader = m_Shaders.Get(BUILTIN_UI_SHADER_NAME))
        {
            m_UIShaderId = uiShader->Id;
            m_UILocations = {
                .Projection = m_Shaders.GetUniformIndex(*uiShader, "projection"),
                .View = m_Shaders.GetUniformIndex(*uiShader, "view"),
                .DiffuseColour = m_Shaders.GetUniformIndex(*uiShader, "diffuse_colour"),
                .DiffuseTexture = m_Shaders.GetUniformIndex(*uiShader, "diffuse_texture"),
                .Model = m_Shaders.GetUniformIndex(*uiShader, "model"),
            };
        }

        MaterialConfig defaults;
        defaults.Name = std::string(DEFAULT_MATERIAL_NAME);
        defaults.ShaderName = std::string(BUILTIN_MATERIAL_SHADER_NAME);
        m_DefaultMaterial = Material{};
        if (auto loaded = LoadMaterial(defaults, m_DefaultMaterial); !loaded)
        {
            Core::Log::Error("MaterialSystem: failed to create the default material.");
            return loaded;
        }

        m_Initialized = true;
        return Core::Ok();
    }

    void MaterialSystem::Shutdown()
    {
        if (!m_Initialized) return;

        m_Registry.ReleaseAll([this](const MaterialHandle& handle)
        {
            if (Material* material = m_Pool.TryGet(handle))
                DestroyMaterial(*material);
        });
        m_Pool.Clear();
        DestroyMaterial(m_DefaultMaterial);
        m_Initialized = false;
    }

    Texture* MaterialSystem::AcquireMapTexture(std::string_view textureName, std::string_view materialName, Texture* fallback)
    {
        if (textureName.empty()) return fallback;

        auto texture = m_Textures.Acquire(textureName, true);
        if (!texture)
        {
            Core::Log::Warn("MaterialSystem: texture '{}' of material '{}' failed to load, using default.", textureName, materialName);
            return fallback;
        }
        return *texture;
    }

    Core::Result MaterialSystem::LoadMaterial(const MaterialConfig& config, Material& material)
    {
        if (auto valid = ValidateMaterialConfig(config); !valid)
            return valid;

        material.Name = config.Name;
        material.DiffuseColour = config.DiffuseColour;
        material.Shininess = config.Shininess;

        material.DiffuseMap = TextureMap{.Use = TextureUse::Diffuse};
        material.SpecularMap = TextureMap{.Use = TextureUse::Specular};
        material.NormalMap = TextureMap{.Use = TextureUse::Normal};
        material.DiffuseMap.Texture = AcquireMapTexture(config.DiffuseMapName, config.Name, m_Textures.GetDefaultDiffuse());
        material.SpecularMap.Texture = AcquireMapTexture(config.SpecularMapName, config.Name, m_Textures.GetDefaultSpecular());
        material.NormalMap.Texture = AcquireMapTexture(config.NormalMapName, config.Name, m_Textures.GetDefaultNormal());

        IRendererBackend& backend = m_Renderer.Backend();
        for (TextureMap* map : {&material.DiffuseMap, &material.SpecularMap, &material.NormalMap})
        {
            if (auto acquired = backend.TextureMapAcquireResources(*map); !acquired)
            {
                Core::Log::Error("MaterialSystem: sampler creation failed for '{}'.", config.Name);
                DestroyMaterial(material);
                return acquired;
            }
        }

        Shader* shader = m_Shaders.Get(config.ShaderName);
        if (!shader)
        {
            Core::Log::Error("MaterialSystem: material '{}' uses unknown shader '{}'.", config.Name, config.ShaderName);
            DestroyMaterial(material);
            return Core::Err(Core::ErrorCode::ResourceNotFound);
        }
        material.ShaderId = shader->Id;

        // The material shader samples all three maps, the UI shader only the diffuse one.
        std::array<TextureMap*, 3> maps{&material.DiffuseMap, &material.SpecularMap, &material.NormalMap};
        const size_t mapCount = std::min<size_t>(shader->InstanceTextureCount, maps.size());
        auto instance = backend.ShaderAcquireInstanceResources(*shader, std::span<TextureMap* const>(maps.data(), mapCount));
        if (!instance)
        {
            Core::Log::Error("MaterialSystem: no shader instance for material '{}'.", config.Name);
            DestroyMaterial(material);
            return Core::Err(instance.error());
        }
        material.InternalId = *instance;
        material.Generation = material.Generation == INVALID_ID ? 0 : material.Generation + 1;
        material.RenderFrameNumber = INVALID_ID;
        return Core::Ok();
    }

    void MaterialSystem::DestroyMaterial(Material& material)
    {
        IRendererBackend& backend = m_Renderer.Backend();

        for (TextureMap* map : {&material.DiffuseMap, &material.SpecularMap, &material.NormalMap})
        {
            Texture* texture = map->Texture;
            const bool isDefault = texture == m_Textures.GetDefault() || texture == m_Textures.GetDefaultDiffuse()
                || texture == m_Textures.GetDefaultSpecular() || texture == m_Textures.GetDefaultNormal();
            if (texture && !isDefault)
            {
                if (auto released = m_Textures.Release(texture->Name); !released)
                    Core::Log::Warn("MaterialSystem: could not release texture '{}' of '{}'.", texture->Name, material.Name);
            }
            if (map->InternalHandle != 0)
                backend.TextureMapReleaseResources(*map);
            map->Texture = nullptr;
        }

        if (material.ShaderId != INVALID_ID && material.InternalId != INVALID_ID)
        {
            if (Shader* shader = m_Shaders.GetById(material.ShaderId))
            {
                if (auto released = backend.ShaderReleaseInstanceResources(*shader, material.InternalId); !released)
                    Core::Log::Warn("MaterialSystem: could not release shader instance of '{}'.", material.Name);
            }
        }

        material.InternalId = INVALID_ID;
        material.ShaderId = INVALID_ID;
        material.Generation = INVALID_ID;
    }

    Core::Expected<MaterialHandle> MaterialSystem::CreateEntry(const MaterialConfig& config)
    {
        auto handle = m_Pool.Create();
        if (!handle)
        {
            Core::Log::Error("MaterialSystem: no free slot for '{}' (max {}).", config.Name, m_Config.MaxMaterialCount);
            return handle;
        }

        Material* material = m_Pool.TryGet(*handle);
        material->Id = handle->Index;
        if (auto loaded = LoadMaterial(config, *material); !loaded)
        {
            m_Pool.Remove(*handle, m_FrameNumber);
            return std::unexpected(loaded.error());
        }
        return *handle;
    }

    Core::Expected<Material*> MaterialSystem::AcquireFromConfig(const MaterialConfig& config)
    {
        if (config.Name == DEFAULT_MATERIAL_NAME)
            return GetDefault();

        auto handle = m_Registry.Acquire(config.Name, config.AutoRelease, [&] { return CreateEntry(config); });
        if (!handle) return std::unexpected(handle.error());
        return m_Pool.Get(*handle);
    }

    Core::Expected<Material*> MaterialSystem::Acquire(std::string_view name)
    {
        if (name.empty())
            return std::unexpected(Core::ErrorCode::InvalidArgument);
        if (name == DEFAULT_MATERIAL_NAME)
            return GetDefault();

        // Loaded already: only the count changes.
        if (m_Registry.Contains(name))
        {
            // The load only runs if the entry was released in between.
            auto handle = m_Registry.Acquire(name, MaterialConfig{}.AutoRelease, [&]() -> Core::Expected<MaterialHandle>
            {
                auto resource = m_Loader.Load(name, ResourceType::Material);
                if (!resource) return std::unexpected(resource.error());
                auto* config = std::get_if<MaterialConfig>(&resource->Payload);
                if (!config) return std::unexpected(Core::ErrorCode::AssetTypeMismatch);
                return CreateEntry(*config);
            });
            if (!handle) return std::unexpected(handle.error());
            return m_Pool.Get(*handle);
        }

        auto resource = m_Loader.Load(name, ResourceType::Material);
        if (!resource)
        {
            Core::Log::Error("MaterialSystem: failed to load material '{}'.", name);
            return std::unexpected(resource.error());
        }

        auto* config = std::get_if<MaterialConfig>(&resource->Payload);
        if (!config)
        {
            m_Loader.Unload(*resource);
            return std::unexpected(Core::ErrorCode::AssetTypeMismatch);
        }

        MaterialConfig loaded = std::move(*config);
        m_Loader.Unload(*resource);
        // The registry is keyed by the requested name.
        loaded.Name = std::string(name);
        return AcquireFromConfig(loaded);
    }

    Core::Result MaterialSystem::Release(std::string_view name)
    {
        if (name == DEFAULT_MATERIAL_NAME)
        {
            Core::Log::Warn("MaterialSystem: ignoring release of the default material.");
            return Core::Ok();
        }

        return m_Registry.Release(name, [this](const MaterialHandle& handle)
        {
            if (Material* material = m_Pool.TryGet(handle))
            {
                DestroyMaterial(*material);
                m_Pool.Remove(handle, m_FrameNumber);
            }
        });
    }

    Core::Result MaterialSystem::ApplyGlobal(uint32_t shaderId, uint64_t frameNumber, const glm::mat4& projection,
                                             const glm::mat4& view, const glm::vec4& ambientColour,
                                             const glm::vec3& viewPosition, uint32_t renderMode)
    {
        Shader* shader = m_Shaders.GetById(shaderId);
        if (!shader)
            return Core::Err(Core::ErrorCode::ResourceNotFound);
        if (shader->RenderFrameNumber == frameNumber)
            return Core::Ok();

        auto set = [this](uint16_t location, const UniformValue& value) { return m_Shaders.SetUniformByIndex(location, value); };

        Core::Result result = Core::Ok();
        if (shaderId == m_MaterialShaderId)
        {
            result = set(m_MaterialLocations.Projection, projection)
                .and_then([&](Core::Unit) { return set(m_MaterialLocations.View, view); })
                .and_then([&](Core::Unit) { return set(m_MaterialLocations.AmbientColour, ambientColour); })
                .and_then([&](Core::Unit) { return set(m_MaterialLocations.ViewPosition, viewPosition); })
                .and_then([&](Core::Unit) { return set(m_MaterialLocations.Mode, renderMode); });
        }
        else if (shaderId == m_UIShaderId)
        {
            result = set(m_UILocations.Projection, projection)
                .and_then([&](Core::Unit) { return set(m_UILocations.View, view); });
        }
        else
        {
            Core::Log::Error("MaterialSystem: shader '{}' is not a material shader.", shader->Name);
            return Core::Err(Core::ErrorCode::InvalidArgument);
        }

        if (!result)
        {
            Core::Log::Error("MaterialSystem: failed to set globals of '{}'.", shader->Name);
            return result;
        }
        if (auto applied = m_Shaders.ApplyGlobal(); !applied)
            return applied;

        shader->RenderFrameNumber = frameNumber;
        return Core::Ok();
    }

    Core::Result MaterialSystem::ApplyInstance(Material& material, bool needsUpdate)
    {
        if (auto bound = m_Shaders.BindInstance(material.InternalId); !bound)
        {
            Core::Log::Error("MaterialSystem: cannot bind instance of material '{}'.", material.Name);
            return bound;
        }

        if (needsUpdate)
        {
            auto set = [this](uint16_t location, const UniformValue& value) { return m_Shaders.SetUniformByIndex(location, value); };

            Core::Result result = Core::Ok();
            if (material.ShaderId == m_MaterialShaderId)
            {
                result = set(m_MaterialLocations.DiffuseColour, material.DiffuseColour)
                    .and_then([&](Core::Unit) { return set(m_MaterialLocations.DiffuseTexture, &material.DiffuseMap); })
                    .and_then([&](Core::Unit) { return set(m_MaterialLocations.SpecularTexture, &material.SpecularMap); })
                    .and_then([&](Core::Unit) { return set(m_MaterialLocations.NormalTexture, &material.NormalMap); })
                    .and_then([&](Core::Unit) { return set(m_MaterialLocations.Shininess, material.Shininess); });
            }
            else if (material.ShaderId == m_UIShaderId)
            {
                result = set(m_UILocations.DiffuseColour, material.DiffuseColour)
                    .and_then([&](Core::Unit) { return set(m_UILocations.DiffuseTexture, &material.DiffuseMap); });
            }
            else
            {
                Core::Log::Error("MaterialSystem: material '{}' has an unknown shader id {}.", material.Name, material.ShaderId);
                return Core::Err(Core::ErrorCode::InvalidArgument);
            }

            if (!result)
            {
                Core::Log::Error("MaterialSystem: failed to set instance uniforms of '{}'.", material.Name);
                return result;
            }
        }

        return m_Shaders.ApplyInstance(needsUpdate);
    }

    Core::Result MaterialSystem::ApplyLocal(Material& material, const glm::mat4& model)
    {
        if (material.ShaderId == m_MaterialShaderId)
            return m_Shaders.SetUniformByIndex(m_MaterialLocations.Model, model);
        if (material.ShaderId == m_UIShaderId)
            return m_Shaders.SetUniformByIndex(m_UILocations.Model, model);

        Core::Log::Error("MaterialSystem: material '{}' has an unknown shader id {}.", material.Name, material.ShaderId);
        return Core::Err(Core::ErrorCode::InvalidArgument);
    }

    void MaterialSystem::ProcessDeletions(uint64_t frameNumber)
    {
        m_FrameNumber = frameNumber;
        m_Pool.ProcessDeletions(frameNumber);
    }
}
