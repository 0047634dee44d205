module;
#include <cstdint>
#include <string>
#include <string_view>
#include <glm/glm.hpp>

export module Graphics:Material;
import :Texture;

export namespace Graphics
{
    inline constexpr std::string_view DEFAULT_MATERIAL_NAME = "default";

    struct Material
    {
        uint32_t Id = INVALID_ID;
        uint32_t Generation = INVALID_ID;
        // Shader instance id returned by the backend.
        uint32_t InternalId = INVALID_ID;
        std::string Name;
        glm::vec4 DiffuseColour{1.0f};
        TextureMap DiffuseMap{.Use = TextureUse::Diffuse};
        TextureMap SpecularMap{.Use = TextureUse::Specular};
        TextureMap NormalMap{.Use = TextureUse::Normal};
        float Shininess = 32.0f;
        uint32_t ShaderId = INVALID_ID;
        // Frame the instance uniforms were last pushed; avoids re-uploading shared materials.
        uint64_t RenderFrameNumber = INVALID_ID;

        [[nodiscard]] bool IsTransparent() const
        {
            return DiffuseMap.Texture && DiffuseMap.Texture->HasFlag(TextureFlag::HasTransparency);
        }
    };
}
