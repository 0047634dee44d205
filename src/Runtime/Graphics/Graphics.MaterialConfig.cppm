module;
#include <cstdint>
#include <string>
#include <string_view>
#include <glm/glm.hpp>

export module Graphics:MaterialConfig;
import Core;

export namespace Graphics
{
    // Parsed form of a .amt file.
    struct MaterialConfig
    {
        uint32_t Version = 1;
        std::string Name;
        std::string ShaderName;
        bool AutoRelease = true;
        glm::vec4 DiffuseColour{1.0f};
        float Shininess = 32.0f;
        std::string DiffuseMapName;
        std::string SpecularMapName;
        std::string NormalMapName;
    };

    // key=value lines, '#' comments. `defaultName` is used when the file has no name key.
    // Malformed values are InvalidFormat; unknown keys are logged and skipped.
    [[nodiscard]] Core::Expected<MaterialConfig> ParseMaterialConfig(std::string_view text, std::string_view defaultName = {});

    [[nodiscard]] Core::Result ValidateMaterialConfig(const MaterialConfig& config);
}
