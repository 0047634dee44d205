// src/Runtime/Graphics/Graphics.MaterialSystem.cppm
module;
#include <cstdint>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>
#include <glm/glm.hpp>

export module Graphics:MaterialSystem;

import Core;
import :Texture;
import :Material;
import :MaterialConfig;
import :Resources;
import :ReferenceRegistry;
import :Renderer;
import :TextureSystem;
import :ShaderSystem;

export namespace Graphics
{
    struct MaterialTag {};
    using MaterialHandle = Core::StrongHandle<MaterialTag>;

    inline constexpr std::string_view BUILTIN_MATERIAL_SHADER_NAME = "Shader.Builtin.Material";
    inline constexpr std::string_view BUILTIN_UI_SHADER_NAME = "Shader.Builtin.UI";

    struct MaterialSystemConfig
    {
        uint32_t MaxMaterialCount = 4096;
        uint32_t FramesInFlight = 2;
    };

    class MaterialSystem
    {
    public:
        MaterialSystem(Renderer& renderer, ShaderSystem& shaders, TextureSystem& textures, IResourceLoader& loader);
        ~MaterialSystem();

        MaterialSystem(const MaterialSystem&) = delete;
        MaterialSystem& operator=(const MaterialSystem&) = delete;

        // Needs the built-in material shader; the UI shader is optional.
        [[nodiscard]] Core::Result Initialize(const MaterialSystemConfig& config = {});
        void Shutdown();

        // Loads <name>.amt on first use.
        [[nodiscard]] Core::Expected<Material*> Acquire(std::string_view name);
        [[nodiscard]] Core::Expected<Material*> AcquireFromConfig(const MaterialConfig& config);
        [[nodiscard]] Core::Result Release(std::string_view name);

        [[nodiscard]] Material* GetDefault() { return &m_DefaultMaterial; }

        // Pushes per-frame uniforms once per frame per shader.
        [[nodiscard]] Core::Result ApplyGlobal(uint32_t shaderId, uint64_t frameNumber, const glm::mat4& projection,
                                               const glm::mat4& view, const glm::vec4& ambientColour,
                                               const glm::vec3& viewPosition, uint32_t renderMode);
        [[nodiscard]] Core::Result ApplyInstance(Material& material, bool needsUpdate);
        [[nodiscard]] Core::Result ApplyLocal(Material& material, const glm::mat4& model);

        void ProcessDeletions(uint64_t frameNumber);

        [[nodiscard]] uint64_t GetReferenceCount(std::string_view name) const { return m_Registry.GetReferenceCount(name); }
        [[nodiscard]] size_t GetLoadedCount() const { return m_Pool.Size(); }

    private:
        struct MaterialUniformLocations
        {
            uint16_t Projection = INVALID_ID_U16;
            uint16_t View = INVALID_ID_U16;
            uint16_t AmbientColour = INVALID_ID_U16;
            uint16_t ViewPosition = INVALID_ID_U16;
            uint16_t Mode = INVALID_ID_U16;
            uint16_t DiffuseColour = INVALID_ID_U16;
            uint16_t DiffuseTexture = INVALID_ID_U16;
            uint16_t SpecularTexture = INVALID_ID_U16;
            uint16_t NormalTexture = INVALID_ID_U16;
            uint16_t Shininess = INVALID_ID_U16;
            uint16_t Model = INVALID_ID_U16;
        };

        struct UIUniformLocations
        {
            uint16_t Projection = INVALID_ID_U16;
            uint16_t View = INVALID_ID_U16;
            uint16_t DiffuseColour = INVALID_ID_U16;
            uint16_t DiffuseTexture = INVALID_ID_U16;
            uint16_t Model = INVALID_ID_U16;
        };

        Core::Result LoadMaterial(const MaterialConfig& config, Material& material);
        void DestroyMaterial(Material& material);
        Core::Expected<MaterialHandle> CreateEntry(const MaterialConfig& config);
        Texture* AcquireMapTexture(std::string_view textureName, std::string_view materialName, Texture* fallback);

        Renderer& m_Renderer;
        ShaderSystem& m_Shaders;
        TextureSystem& m_Textures;
        IResourceLoader& m_Loader;

        MaterialSystemConfig m_Config;
        bool m_Initialized = false;
        uint64_t m_FrameNumber = 0;

        Material m_DefaultMaterial;
        Core::ResourcePool<Material, MaterialHandle> m_Pool;
        ReferenceRegistry<MaterialHandle> m_Registry;

        uint32_t m_MaterialShaderId = INVALID_ID;
        uint32_t m_UIShaderId = INVALID_ID;
        MaterialUniformLocations m_MaterialLocations;
        UIUniformLocations m_UILocations;
    };
}
