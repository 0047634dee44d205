module;
#include <algorithm>
#include <cstdint>
#include <iterator>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

module Graphics;

namespace Graphics
{
    ShaderSystem::ShaderSystem(Renderer& renderer, TextureSystem& textures)
        : m_Renderer(renderer), m_Textures(textures)
    {
    }

    ShaderSystem::~ShaderSystem()
    {
        Shutdown();
    }

    Core::Result ShaderSystem::Initialize(const ShaderSystemConfig& config)
    {
        if (config.MaxShaderCount == 0)
        {
            Core::Log::Error("ShaderSystem: MaxShaderCount must be > 0.");
            return Core::Err(Core::ErrorCode::InvalidArgument);
        }

        m_Config = config;
        m_Shaders.clear();
        m_Shaders.resize(config.MaxShaderCount);
        m_CurrentShaderId = INVALID_ID;
        m_Initialized = true;
        return Core::Ok();
    }

    void ShaderSystem::Shutdown()
    {
        if (!m_Initialized) return;

        for (auto& shader : m_Shaders)
        {
            if (shader) DestroyShader(*shader);
            shader.reset();
        }
        m_Lookup.clear();
        m_CurrentShaderId = INVALID_ID;
        m_Initialized = false;
    }

    Core::Result ShaderSystem::Create(const ShaderConfig& config)
    {
        if (auto valid = ValidateShaderConfig(config); !valid)
            return valid;

        if (m_Lookup.contains(config.Name))
        {
            Core::Log::Error("ShaderSystem: shader '{}' already exists.", config.Name);
            return Core::Err(Core::ErrorCode::AlreadyExists);
        }

        auto slot = std::ranges::find_if(m_Shaders, [](const auto& s) { return s == nullptr; });
        if (slot == m_Shaders.end())
        {
            Core::Log::Error("ShaderSystem: out of shader slots (max {}).", m_Config.MaxShaderCount);
            return Core::Err(Core::ErrorCode::ResourceExhausted);
        }

        auto pass = m_Renderer.GetRenderPass(config.RenderPassName);
        if (!pass)
        {
            Core::Log::Error("ShaderSystem: shader '{}' needs unknown render pass '{}'.", config.Name, config.RenderPassName);
            return Core::Err(pass.error());
        }

        auto shader = std::make_unique<Shader>();
        shader->Id = static_cast<uint32_t>(std::distance(m_Shaders.begin(), slot));
        shader->Name = config.Name;
        shader->RenderPassName = config.RenderPassName;
        shader->UseInstances = config.UseInstances;
        shader->UseLocals = config.UseLocal;

        IRendererBackend& backend = m_Renderer.Backend();
        if (auto created = backend.ShaderCreate(*shader, config, **pass); !created)
        {
            Core::Log::Error("ShaderSystem: backend could not create '{}'.", config.Name);
            return Core::Err(Core::ErrorCode::ShaderCreationFailed);
        }
        shader->State = ShaderState::Uninitialized;

        auto fail = [&](Core::ErrorCode code)
        {
            DestroyShader(*shader);
            return Core::Err(code);
        };

        for (const auto& attribute : config.Attributes)
        {
            if (auto added = AddAttribute(*shader, attribute); !added)
                return fail(added.error());
        }

        for (const auto& uniform : config.Uniforms)
        {
            auto added = uniform.Type == ShaderUniformType::Sampler
                ? AddSampler(*shader, uniform)
                : AddUniform(*shader, uniform.Name, GetUniformSize(uniform), uniform.Type, uniform.Scope, 0, false);
            if (!added)
                return fail(added.error());
        }

        if (auto initialized = backend.ShaderInitialize(*shader); !initialized)
        {
            Core::Log::Error("ShaderSystem: backend could not initialize '{}'.", config.Name);
            return fail(Core::ErrorCode::ShaderCreationFailed);
        }
        shader->State = ShaderState::Initialized;

        m_Lookup.emplace(config.Name, shader->Id);
        Core::Log::Debug("ShaderSystem: created '{}' (id {}, {} uniforms).", config.Name, shader->Id, shader->Uniforms.size());
        *slot = std::move(shader);
        return Core::Ok();
    }

    Core::Result ShaderSystem::AddAttribute(Shader& shader, const ShaderAttributeConfig& config)
    {
        const uint32_t size = GetAttributeSize(config.Type);
        shader.Attributes.push_back({config.Name, config.Type, size});
        shader.AttributeStride = static_cast<uint16_t>(shader.AttributeStride + size);
        return Core::Ok();
    }

    Core::Result ShaderSystem::AddSampler(Shader& shader, const ShaderUniformConfig& config)
    {
        if (config.Scope == ShaderScope::Instance && !shader.UseInstances)
        {
            Core::Log::Error("ShaderSystem: '{}' declares instance sampler '{}' without using instances.", shader.Name, config.Name);
            return Core::Err(Core::ErrorCode::InvalidArgument);
        }
        if (config.Scope == ShaderScope::Local)
        {
            Core::Log::Error("ShaderSystem: sampler '{}' of '{}' cannot be local.", config.Name, shader.Name);
            return Core::Err(Core::ErrorCode::InvalidArgument);
        }

        uint16_t location = 0;
        if (config.Scope == ShaderScope::Global)
        {
            if (shader.GlobalTextureMaps.size() >= m_Config.MaxGlobalTextures)
            {
                Core::Log::Error("ShaderSystem: '{}' exceeds {} global textures.", shader.Name, m_Config.MaxGlobalTextures);
                return Core::Err(Core::ErrorCode::ResourceExhausted);
            }
            location = static_cast<uint16_t>(shader.GlobalTextureMaps.size());

            TextureMap map{.Texture = m_Textures.GetDefault()};
            if (auto acquired = m_Renderer.Backend().TextureMapAcquireResources(map); !acquired)
                return acquired;
            shader.GlobalTextureMaps.push_back(map);
        }
        else
        {
            if (shader.InstanceTextureCount >= m_Config.MaxInstanceTextures)
            {
                Core::Log::Error("ShaderSystem: '{}' exceeds {} instance textures.", shader.Name, m_Config.MaxInstanceTextures);
                return Core::Err(Core::ErrorCode::ResourceExhausted);
            }
            location = shader.InstanceTextureCount++;
        }

        return AddUniform(shader, config.Name, 0, ShaderUniformType::Sampler, config.Scope, location, true);
    }

    Core::Result ShaderSystem::AddUniform(Shader& shader, std::string_view name, uint32_t size, ShaderUniformType type,
                                          ShaderScope scope, uint16_t location, bool isSampler)
    {
        if (shader.State != ShaderState::Uninitialized)
        {
            Core::Log::Error("ShaderSystem: uniforms of '{}' can only be added during creation.", shader.Name);
            return Core::Err(Core::ErrorCode::InvalidState);
        }
        if (shader.Uniforms.size() >= m_Config.MaxUniformCount)
        {
            Core::Log::Error("ShaderSystem: '{}' exceeds {} uniforms.", shader.Name, m_Config.MaxUniformCount);
            return Core::Err(Core::ErrorCode::ResourceExhausted);
        }
        if (name.empty() || shader.FindUniform(name))
        {
            Core::Log::Error("ShaderSystem: '{}' has an empty or duplicate uniform name '{}'.", shader.Name, name);
            return Core::Err(Core::ErrorCode::InvalidArgument);
        }

        ShaderUniform uniform;
        uniform.Index = static_cast<uint16_t>(shader.Uniforms.size());
        uniform.Scope = scope;
        uniform.Type = type;
        uniform.Location = isSampler ? location : uniform.Index;

        if (scope != ShaderScope::Local)
        {
            uniform.SetIndex = static_cast<uint8_t>(scope);
            uniform.Offset = isSampler ? 0 : (scope == ShaderScope::Global ? shader.GlobalUboSize : shader.UboSize);
            uniform.Size = isSampler ? 0 : static_cast<uint16_t>(size);
        }
        else
        {
            if (!shader.UseLocals)
            {
                Core::Log::Error("ShaderSystem: '{}' declares local '{}' without using locals.", shader.Name, name);
                return Core::Err(Core::ErrorCode::InvalidArgument);
            }

            const MemoryRange range = GetAlignedRange(shader.PushConstantSize, size, 4);
            if (range.Offset + range.Size > shader.PushConstantStride)
            {
                Core::Log::Error("ShaderSystem: '{}' push constants exceed {} bytes.", shader.Name, shader.PushConstantStride);
                return Core::Err(Core::ErrorCode::OutOfRange);
            }

            uniform.SetIndex = INVALID_ID_U8;
            uniform.Offset = range.Offset;
            uniform.Size = static_cast<uint16_t>(range.Size);
            shader.PushConstantRanges.push_back(range);
            shader.PushConstantSize += range.Size;
        }

        shader.UniformLookup.emplace(Core::Hash::StringID(name), uniform.Index);
        shader.Uniforms.push_back(uniform);

        if (!isSampler)
        {
            if (scope == ShaderScope::Global) shader.GlobalUboSize += uniform.Size;
            else if (scope == ShaderScope::Instance) shader.UboSize += uniform.Size;
        }
        return Core::Ok();
    }

    void ShaderSystem::DestroyShader(Shader& shader)
    {
        IRendererBackend& backend = m_Renderer.Backend();
        backend.ShaderDestroy(shader);
        for (auto& map : shader.GlobalTextureMaps)
            backend.TextureMapReleaseResources(map);
        shader.GlobalTextureMaps.clear();
        shader.State = ShaderState::NotCreated;
    }

    Core::Result ShaderSystem::Destroy(std::string_view name)
    {
        auto it = m_Lookup.find(name);
        if (it == m_Lookup.end())
        {
            Core::Log::Warn("ShaderSystem: no shader named '{}' to destroy.", name);
            return Core::Err(Core::ErrorCode::ResourceNotFound);
        }

        const uint32_t id = it->second;
        DestroyShader(*m_Shaders[id]);
        m_Shaders[id].reset();
        m_Lookup.erase(it);
        if (m_CurrentShaderId == id) m_CurrentShaderId = INVALID_ID;
        return Core::Ok();
    }

    uint32_t ShaderSystem::GetId(std::string_view name) const
    {
        auto it = m_Lookup.find(name);
        return it == m_Lookup.end() ? INVALID_ID : it->second;
    }

    Shader* ShaderSystem::Get(std::string_view name)
    {
        return GetById(GetId(name));
    }

    Shader* ShaderSystem::GetById(uint32_t id)
    {
        if (id >= m_Shaders.size()) return nullptr;
        return m_Shaders[id].get();
    }

    Core::Result ShaderSystem::Use(std::string_view name)
    {
        const uint32_t id = GetId(name);
        if (id == INVALID_ID)
        {
            Core::Log::Error("ShaderSystem: no shader named '{}'.", name);
            return Core::Err(Core::ErrorCode::ResourceNotFound);
        }
        return UseById(id);
    }

    Core::Result ShaderSystem::UseById(uint32_t id)
    {
        if (m_CurrentShaderId == id) return Core::Ok();

        Shader* next = GetById(id);
        if (!next)
        {
            Core::Log::Error("ShaderSystem: no shader with id {}.", id);
            return Core::Err(Core::ErrorCode::ResourceNotFound);
        }

        m_CurrentShaderId = id;
        IRendererBackend& backend = m_Renderer.Backend();
        if (auto used = backend.ShaderUse(*next); !used)
        {
            Core::Log::Error("ShaderSystem: failed to use '{}'.", next->Name);
            return used;
        }
        if (auto bound = backend.ShaderBindGlobals(*next); !bound)
        {
            Core::Log::Error("ShaderSystem: failed to bind globals of '{}'.", next->Name);
            return bound;
        }
        next->BoundScope = ShaderScope::Global;
        return Core::Ok();
    }

    uint16_t ShaderSystem::GetUniformIndex(const Shader& shader, std::string_view name) const
    {
        if (auto index = shader.FindUniform(name))
            return *index;

        Core::Log::Error("ShaderSystem: '{}' has no uniform named '{}'.", shader.Name, name);
        return INVALID_ID_U16;
    }

    Core::Result ShaderSystem::SetUniform(std::string_view name, const UniformValue& value)
    {
        Shader* shader = GetCurrent();
        if (!shader)
        {
            Core::Log::Error("ShaderSystem: SetUniform('{}') without a current shader.", name);
            return Core::Err(Core::ErrorCode::InvalidState);
        }

        const uint16_t index = GetUniformIndex(*shader, name);
        if (index == INVALID_ID_U16)
            return Core::Err(Core::ErrorCode::ResourceNotFound);
        return SetUniformByIndex(index, value);
    }

    Core::Result ShaderSystem::SetUniformByIndex(uint16_t index, const UniformValue& value)
    {
        Shader* shader = GetCurrent();
        if (!shader)
            return Core::Err(Core::ErrorCode::InvalidState);
        if (index >= shader->Uniforms.size())
        {
            Core::Log::Error("ShaderSystem: uniform index {} out of range for '{}'.", index, shader->Name);
            return Core::Err(Core::ErrorCode::OutOfRange);
        }

        const ShaderUniform& uniform = shader->Uniforms[index];
        IRendererBackend& backend = m_Renderer.Backend();
        if (shader->BoundScope != uniform.Scope)
        {
            if (uniform.Scope == ShaderScope::Global)
            {
                if (auto bound = backend.ShaderBindGlobals(*shader); !bound) return bound;
            }
            else if (uniform.Scope == ShaderScope::Instance)
            {
                if (auto bound = backend.ShaderBindInstance(*shader, shader->BoundInstanceId); !bound) return bound;
            }
            shader->BoundScope = uniform.Scope;
        }

        return backend.ShaderSetUniform(*shader, uniform, value);
    }

    Core::Result ShaderSystem::ApplyGlobal()
    {
        Shader* shader = GetCurrent();
        if (!shader) return Core::Err(Core::ErrorCode::InvalidState);
        return m_Renderer.Backend().ShaderApplyGlobals(*shader);
    }

    Core::Result ShaderSystem::ApplyInstance(bool needsUpdate)
    {
        Shader* shader = GetCurrent();
        if (!shader) return Core::Err(Core::ErrorCode::InvalidState);
        return m_Renderer.Backend().ShaderApplyInstance(*shader, needsUpdate);
    }

    Core::Result ShaderSystem::BindInstance(uint32_t instanceId)
    {
        Shader* shader = GetCurrent();
        if (!shader) return Core::Err(Core::ErrorCode::InvalidState);

        shader->BoundInstanceId = instanceId;
        return m_Renderer.Backend().ShaderBindInstance(*shader, instanceId);
    }
}
