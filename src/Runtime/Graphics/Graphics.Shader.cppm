module;
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>
#include <glm/glm.hpp>

export module Graphics:Shader;
import Core;
import :Texture;
import :ShaderConfig;

export namespace Graphics
{
    enum class ShaderState : uint8_t
    {
        NotCreated,
        Uninitialized,
        Initialized,
    };

    struct MemoryRange
    {
        uint64_t Offset = 0;
        uint64_t Size = 0;
    };

    [[nodiscard]] constexpr uint64_t AlignUp(uint64_t value, uint64_t granularity)
    {
        return (value + granularity - 1) & ~(granularity - 1);
    }

    [[nodiscard]] constexpr MemoryRange GetAlignedRange(uint64_t offset, uint64_t size, uint64_t granularity)
    {
        return {AlignUp(offset, granularity), AlignUp(size, granularity)};
    }

    struct ShaderUniform
    {
        // Byte offset inside its scope's block. Unused for samplers.
        uint64_t Offset = 0;
        // Texture slot for samplers, otherwise equal to Index.
        uint16_t Location = 0;
        uint16_t Index = 0;
        uint16_t Size = 0;
        // Descriptor set: 0 global, 1 instance, INVALID for push constants.
        uint8_t SetIndex = 0;
        ShaderScope Scope = ShaderScope::Global;
        ShaderUniformType Type = ShaderUniformType::Float32;
    };

    struct ShaderAttribute
    {
        std::string Name;
        ShaderAttributeType Type = ShaderAttributeType::Float32;
        uint32_t Size = 0;
    };

    using UniformValue = std::variant<float, glm::vec2, glm::vec3, glm::vec4, int32_t, uint32_t, glm::mat4, TextureMap*>;

    struct Shader
    {
        uint32_t Id = INVALID_ID;
        std::string Name;
        std::string RenderPassName;
        bool UseInstances = false;
        bool UseLocals = false;

        uint64_t RequiredUboAlignment = 256;
        uint64_t GlobalUboSize = 0;
        uint64_t GlobalUboStride = 0;
        uint64_t GlobalUboOffset = 0;
        uint64_t UboSize = 0;
        uint64_t UboStride = 0;

        // Vulkan only guarantees 128 bytes of push constants.
        uint64_t PushConstantStride = 128;
        uint64_t PushConstantSize = 0;
        std::vector<MemoryRange> PushConstantRanges;

        std::vector<TextureMap> GlobalTextureMaps;
        uint8_t InstanceTextureCount = 0;

        ShaderScope BoundScope = ShaderScope::Global;
        uint32_t BoundInstanceId = INVALID_ID;

        std::unordered_map<Core::Hash::StringID, uint16_t> UniformLookup;
        std::vector<ShaderUniform> Uniforms;
        std::vector<ShaderAttribute> Attributes;
        uint16_t AttributeStride = 0;

        ShaderState State = ShaderState::NotCreated;
        // Globals are applied once per frame.
        uint64_t RenderFrameNumber = INVALID_ID;
        uint64_t InternalHandle = 0;

        [[nodiscard]] std::optional<uint16_t> FindUniform(std::string_view name) const
        {
            if (auto it = UniformLookup.find(Core::Hash::StringID(name)); it != UniformLookup.end())
                return it->second;
            return std::nullopt;
        }
    };
}
