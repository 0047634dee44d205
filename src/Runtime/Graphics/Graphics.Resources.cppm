module;
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

export module Graphics:Resources;
import Core;
import :ShaderConfig;
import :MaterialConfig;

export namespace Graphics
{
    enum class ResourceType : uint8_t
    {
        Text,
        Binary,
        Image,
        Material,
        Shader,
    };

    [[nodiscard]] std::string_view ResourceTypeToString(ResourceType type);

    struct ImageResourceData
    {
        uint32_t Width = 0;
        uint32_t Height = 0;
        uint8_t ChannelCount = 0;
        std::vector<uint8_t> Pixels;
    };

    using ResourcePayload = std::variant<std::string, std::vector<std::byte>, ImageResourceData, MaterialConfig, ShaderConfig>;

    struct Resource
    {
        std::string Name;
        std::filesystem::path FullPath;
        uint64_t DataSize = 0;
        ResourcePayload Payload;
    };

    class IResourceLoader
    {
    public:
        virtual ~IResourceLoader() = default;

        // Must be callable from loader worker threads.
        [[nodiscard]] virtual Core::Expected<Resource> Load(std::string_view name, ResourceType type) = 0;
        virtual void Unload(Resource& resource) = 0;
    };

    // Reads assets from disk. Names resolve through the asset index when one is
    // attached, otherwise by convention under the asset root:
    //   textures/<name>.{tga,png,jpg,bmp}, materials/<name>.amt, shaders/<name>.shadercfg
    // Images are decoded to RGBA.
    class FileResourceLoader final : public IResourceLoader
    {
    public:
        using ShaderConfigParser = std::function<Core::Expected<ShaderConfig>(std::string_view text)>;

        explicit FileResourceLoader(std::filesystem::path assetRoot, const Core::Assets::AssetIndex* index = nullptr);

        [[nodiscard]] Core::Expected<Resource> Load(std::string_view name, ResourceType type) override;
        void Unload(Resource& resource) override;

        // .shadercfg files are TOML; the parser is supplied by the application.
        void SetShaderConfigParser(ShaderConfigParser parser) { m_ShaderParser = std::move(parser); }

        [[nodiscard]] std::filesystem::path Resolve(std::string_view name, ResourceType type) const;

    private:
        std::filesystem::path m_Root;
        const Core::Assets::AssetIndex* m_Index = nullptr;
        ShaderConfigParser m_ShaderParser;
    };
}
