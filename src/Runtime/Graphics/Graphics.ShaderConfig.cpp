module;
#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

module Graphics;

namespace Graphics
{
    uint32_t GetAttributeSize(ShaderAttributeType type)
    {
        switch (type)
        {
        case ShaderAttributeType::Float32:   return 4;
        case ShaderAttributeType::Float32_2: return 8;
        case ShaderAttributeType::Float32_3: return 12;
        case ShaderAttributeType::Float32_4: return 16;
        case ShaderAttributeType::Matrix4:   return 64;
        case ShaderAttributeType::Int8:
        case ShaderAttributeType::Uint8:     return 1;
        case ShaderAttributeType::Int16:
        case ShaderAttributeType::Uint16:    return 2;
        case ShaderAttributeType::Int32:
        case ShaderAttributeType::Uint32:    return 4;
        }
        return 0;
    }

    uint32_t GetUniformSize(const ShaderUniformConfig& config)
    {
        switch (config.Type)
        {
        case ShaderUniformType::Float32:   return 4;
        case ShaderUniformType::Float32_2: return 8;
        case ShaderUniformType::Float32_3: return 12;
        case ShaderUniformType::Float32_4: return 16;
        case ShaderUniformType::Int8:
        case ShaderUniformType::Uint8:     return 1;
        case ShaderUniformType::Int16:
        case ShaderUniformType::Uint16:    return 2;
        case ShaderUniformType::Int32:
        case ShaderUniformType::Uint32:    return 4;
        case ShaderUniformType::Matrix4:   return 64;
        case ShaderUniformType::Sampler:   return 0;
        case ShaderUniformType::Custom:    return config.Size;
        }
        return 0;
    }

    Core::Result ValidateShaderConfig(const ShaderConfig& config)
    {
        if (config.Name.empty())
        {
            Core::Log::Error("Shader config: name is required.");
            return Core::Err(Core::ErrorCode::InvalidFormat);
        }
        if (config.RenderPassName.empty())
        {
            Core::Log::Error("Shader config '{}': renderpass is required.", config.Name);
            return Core::Err(Core::ErrorCode::InvalidFormat);
        }
        if (config.Stages.empty() || config.Stages.size() != config.StageFiles.size())
        {
            Core::Log::Error("Shader config '{}': {} stages but {} stage files.",
                             config.Name, config.Stages.size(), config.StageFiles.size());
            return Core::Err(Core::ErrorCode::InvalidFormat);
        }

        std::unordered_set<std::string_view> seen;
        for (const auto& attribute : config.Attributes)
        {
            if (!seen.insert(attribute.Name).second)
            {
                Core::Log::Error("Shader config '{}': duplicate attribute '{}'.", config.Name, attribute.Name);
                return Core::Err(Core::ErrorCode::InvalidFormat);
            }
        }

        seen.clear();
        for (const auto& uniform : config.Uniforms)
        {
            if (uniform.Name.empty())
            {
                Core::Log::Error("Shader config '{}': uniform without a name.", config.Name);
                return Core::Err(Core::ErrorCode::InvalidFormat);
            }
            if (!seen.insert(uniform.Name).second)
            {
                Core::Log::Error("Shader config '{}': duplicate uniform '{}'.", config.Name, uniform.Name);
                return Core::Err(Core::ErrorCode::InvalidFormat);
            }
        }
        return Core::Ok();
    }
}
