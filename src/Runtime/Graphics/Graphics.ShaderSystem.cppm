module;
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

export module Graphics:ShaderSystem;
import Core;
import :Texture;
import :Shader;
import :ShaderConfig;
import :Renderer;
import :TextureSystem;

export namespace Graphics
{
    struct ShaderSystemConfig
    {
        uint16_t MaxShaderCount = 1024;
        uint8_t MaxUniformCount = 128;
        uint8_t MaxGlobalTextures = 31;
        uint8_t MaxInstanceTextures = 31;
    };

    // Shaders by name and id, plus the "current shader" state every uniform call goes through.
    class ShaderSystem
    {
    public:
        ShaderSystem(Renderer& renderer, TextureSystem& textures);
        ~ShaderSystem();

        ShaderSystem(const ShaderSystem&) = delete;
        ShaderSystem& operator=(const ShaderSystem&) = delete;

        [[nodiscard]] Core::Result Initialize(const ShaderSystemConfig& config = {});
        void Shutdown();

        [[nodiscard]] Core::Result Create(const ShaderConfig& config);
        [[nodiscard]] Core::Result Destroy(std::string_view name);

        // INVALID_ID when no shader has that name.
        [[nodiscard]] uint32_t GetId(std::string_view name) const;
        [[nodiscard]] Shader* Get(std::string_view name);
        [[nodiscard]] Shader* GetById(uint32_t id);
        [[nodiscard]] Shader* GetCurrent() { return GetById(m_CurrentShaderId); }

        // Switching shaders also binds the new shader's globals.
        [[nodiscard]] Core::Result Use(std::string_view name);
        [[nodiscard]] Core::Result UseById(uint32_t id);

        // INVALID_ID_U16 when the shader has no such uniform.
        [[nodiscard]] uint16_t GetUniformIndex(const Shader& shader, std::string_view name) const;

        // Operate on the current shader.
        [[nodiscard]] Core::Result SetUniform(std::string_view name, const UniformValue& value);
        [[nodiscard]] Core::Result SetUniformByIndex(uint16_t index, const UniformValue& value);
        [[nodiscard]] Core::Result ApplyGlobal();
        [[nodiscard]] Core::Result ApplyInstance(bool needsUpdate);
        [[nodiscard]] Core::Result BindInstance(uint32_t instanceId);

        [[nodiscard]] size_t GetShaderCount() const { return m_Lookup.size(); }
        [[nodiscard]] const ShaderSystemConfig& GetConfig() const { return m_Config; }

    private:
        Core::Result AddAttribute(Shader& shader, const ShaderAttributeConfig& config);
        Core::Result AddSampler(Shader& shader, const ShaderUniformConfig& config);
        Core::Result AddUniform(Shader& shader, std::string_view name, uint32_t size, ShaderUniformType type,
                                ShaderScope scope, uint16_t location, bool isSampler);
        void DestroyShader(Shader& shader);

        Renderer& m_Renderer;
        TextureSystem& m_Textures;
        ShaderSystemConfig m_Config;
        bool m_Initialized = false;

        std::vector<std::unique_ptr<Shader>> m_Shaders;
        std::unordered_map<std::string, uint32_t, Core::Hash::StringHash, std::equal_to<>> m_Lookup;
        uint32_t m_CurrentShaderId = INVALID_ID;
    };
}
