module;
#include <cstdint>
#include <string>
#include <vector>

export module Graphics:ShaderConfig;
import Core;

export namespace Graphics
{
    enum class ShaderStage : uint8_t
    {
        Vertex = 0x1,
        Geometry = 0x2,
        Fragment = 0x4,
        Compute = 0x8,
    };

    enum class ShaderAttributeType : uint8_t
    {
        Float32,
        Float32_2,
        Float32_3,
        Float32_4,
        Matrix4,
        Int8,
        Uint8,
        Int16,
        Uint16,
        Int32,
        Uint32,
    };

    enum class ShaderUniformType : uint8_t
    {
        Float32,
        Float32_2,
        Float32_3,
        Float32_4,
        Int8,
        Uint8,
        Int16,
        Uint16,
        Int32,
        Uint32,
        Matrix4,
        Sampler,
        Custom = 255,
    };

    // How often a uniform changes: once per frame, per material instance, per draw.
    enum class ShaderScope : uint8_t
    {
        Global = 0,
        Instance = 1,
        Local = 2,
    };

    enum class FaceCullMode : uint8_t
    {
        None,
        Front,
        Back,
        FrontAndBack,
    };

    struct ShaderAttributeConfig
    {
        std::string Name;
        ShaderAttributeType Type = ShaderAttributeType::Float32;
    };

    struct ShaderUniformConfig
    {
        std::string Name;
        ShaderUniformType Type = ShaderUniformType::Float32;
        ShaderScope Scope = ShaderScope::Global;
        // Only read for ShaderUniformType::Custom.
        uint32_t Size = 0;
    };

    // Parsed form of a .shadercfg file. The file format is read by an external
    // loader; the built-in shaders are described in code.
    struct ShaderConfig
    {
        uint32_t Version = 1;
        std::string Name;
        std::string RenderPassName;
        FaceCullMode CullMode = FaceCullMode::Back;
        std::vector<ShaderStage> Stages;
        std::vector<std::string> StageFiles;
        bool UseInstances = false;
        bool UseLocal = false;
        bool DepthTest = true;
        bool DepthWrite = true;
        std::vector<ShaderAttributeConfig> Attributes;
        std::vector<ShaderUniformConfig> Uniforms;
    };

    [[nodiscard]] uint32_t GetAttributeSize(ShaderAttributeType type);

    // Size in bytes; 0 for samplers, config.Size for custom uniforms.
    [[nodiscard]] uint32_t GetUniformSize(const ShaderUniformConfig& config);

    // Rejects an empty name or renderpass, stage/stage-file count mismatch or no
    // stages at all, and duplicate attribute or uniform names. Logs the first problem.
    [[nodiscard]] Core::Result ValidateShaderConfig(const ShaderConfig& config);
}
