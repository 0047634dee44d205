module;
#define STB_IMAGE_IMPLEMENTATION
#include "stb_image.h"
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <variant>
#include <vector>

module Graphics;

namespace Graphics
{
    std::string_view ResourceTypeToString(ResourceType type)
    {
        switch (type)
        {
        case ResourceType::Text:     return "Text";
        case ResourceType::Binary:   return "Binary";
        case ResourceType::Image:    return "Image";
        case ResourceType::Material: return "Material";
        case ResourceType::Shader:   return "Shader";
        }
        return "Unknown";
    }

    namespace
    {
        std::optional<Core::Assets::AssetType> ToAssetType(ResourceType type)
        {
            switch (type)
            {
            case ResourceType::Text:     return Core::Assets::AssetType::Text;
            case ResourceType::Binary:   return Core::Assets::AssetType::Binary;
            case ResourceType::Image:    return Core::Assets::AssetType::Image;
            case ResourceType::Material: return Core::Assets::AssetType::Material;
            case ResourceType::Shader:   return Core::Assets::AssetType::Shader;
            }
            return std::nullopt;
        }

        Core::Expected<ImageResourceData> DecodeImage(const std::filesystem::path& path)
        {
            int width = 0, height = 0, channels = 0;
            stbi_uc* pixels = stbi_load(path.string().c_str(), &width, &height, &channels, STBI_rgb_alpha);
            if (!pixels)
            {
                Core::Log::Error("Resources: failed to decode '{}': {}", path.string(), stbi_failure_reason());
                return std::unexpected(Core::ErrorCode::AssetLoadFailed);
            }

            ImageResourceData image;
            image.Width = static_cast<uint32_t>(width);
            image.Height = static_cast<uint32_t>(height);
            image.ChannelCount = 4;
            const size_t size = static_cast<size_t>(width) * height * 4;
            image.Pixels.assign(pixels, pixels + size);
            stbi_image_free(pixels);
            return image;
        }
    }

    FileResourceLoader::FileResourceLoader(std::filesystem::path assetRoot, const Core::Assets::AssetIndex* index)
        : m_Root(std::move(assetRoot)), m_Index(index)
    {
    }

    std::filesystem::path FileResourceLoader::Resolve(std::string_view name, ResourceType type) const
    {
        if (m_Index)
        {
            if (auto assetType = ToAssetType(type))
            {
                if (auto entry = m_Index->Find(name, *assetType))
                    return entry->Path;
            }
        }

        std::error_code ec;
        switch (type)
        {
        case ResourceType::Image:
            for (std::string_view extension : {".tga", ".png", ".jpg", ".bmp"})
            {
                auto candidate = m_Root / "textures" / (std::string(name) + std::string(extension));
                if (std::filesystem::exists(candidate, ec)) return candidate;
            }
            return {};
        case ResourceType::Material:
            return m_Root / "materials" / (std::string(name) + ".amt");
        case ResourceType::Shader:
            return m_Root / "shaders" / (std::string(name) + ".shadercfg");
        case ResourceType::Text:
        case ResourceType::Binary:
            return m_Root / name;
        }
        return {};
    }

    Core::Expected<Resource> FileResourceLoader::Load(std::string_view name, ResourceType type)
    {
        if (name.empty())
            return std::unexpected(Core::ErrorCode::InvalidArgument);

        const auto path = Resolve(name, type);
        std::error_code ec;
        if (path.empty() || !std::filesystem::is_regular_file(path, ec))
        {
            Core::Log::Error("Resources: no {} resource named '{}'.", ResourceTypeToString(type), name);
            return std::unexpected(Core::ErrorCode::FileNotFound);
        }

        Resource resource;
        resource.Name = std::string(name);
        resource.FullPath = path;

        switch (type)
        {
        case ResourceType::Text:
        {
            auto text = Core::Filesystem::ReadText(path);
            if (!text) return std::unexpected(text.error());
            resource.DataSize = text->size();
            resource.Payload = std::move(*text);
            break;
        }
        case ResourceType::Binary:
        {
            auto bytes = Core::Filesystem::ReadBinary(path);
            if (!bytes) return std::unexpected(bytes.error());
            resource.DataSize = bytes->size();
            resource.Payload = std::move(*bytes);
            break;
        }
        case ResourceType::Image:
        {
            auto image = DecodeImage(path);
            if (!image) return std::unexpected(image.error());
            resource.DataSize = image->Pixels.size();
            resource.Payload = std::move(*image);
            break;
        }
        case ResourceType::Material:
        {
            auto text = Core::Filesystem::ReadText(path);
            if (!text) return std::unexpected(text.error());
            auto config = ParseMaterialConfig(*text, name);
            if (!config) return std::unexpected(config.error());
            resource.DataSize = sizeof(MaterialConfig);
            resource.Payload = std::move(*config);
            break;
        }
        case ResourceType::Shader:
        {
            if (!m_ShaderParser)
            {
                Core::Log::Error("Resources: no shader config parser registered for '{}'.", name);
                return std::unexpected(Core::ErrorCode::AssetTypeMismatch);
            }
            auto text = Core::Filesystem::ReadText(path);
            if (!text) return std::unexpected(text.error());
            auto config = m_ShaderParser(*text);
            if (!config) return std::unexpected(config.error());
            if (auto valid = ValidateShaderConfig(*config); !valid) return std::unexpected(valid.error());
            resource.DataSize = sizeof(ShaderConfig);
            resource.Payload = std::move(*config);
            break;
        }
        }
        return resource;
    }

    void FileResourceLoader::Unload(Resource& resource)
    {
        resource.Payload = std::string{};
        resource.DataSize = 0;
        resource.FullPath.clear();
    }
}
