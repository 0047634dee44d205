// src/Runtime/Graphics/Graphics.Texture.cppm
module;
#include <cstdint>
#include <limits>
#include <string>
#include <string_view>

export module Graphics:Texture;

export namespace Graphics
{
    inline constexpr uint32_t INVALID_ID = std::numeric_limits<uint32_t>::max();
    inline constexpr uint16_t INVALID_ID_U16 = std::numeric_limits<uint16_t>::max();
    inline constexpr uint8_t INVALID_ID_U8 = std::numeric_limits<uint8_t>::max();

    inline constexpr std::string_view DEFAULT_TEXTURE_NAME = "default";
    inline constexpr std::string_view DEFAULT_DIFFUSE_TEXTURE_NAME = "default_DIFF";
    inline constexpr std::string_view DEFAULT_SPECULAR_TEXTURE_NAME = "default_SPEC";
    inline constexpr std::string_view DEFAULT_NORMAL_TEXTURE_NAME = "default_NORM";

    enum class TextureType : uint8_t
    {
        Texture2D,
        Cube,
    };

    // Bit flags, combined in Texture::Flags.
    enum class TextureFlag : uint8_t
    {
        None = 0x0,
        HasTransparency = 0x1,
        IsWriteable = 0x2,
        IsWrapped = 0x4,
        Depth = 0x8,
    };

    [[nodiscard]] constexpr uint8_t ToFlags(TextureFlag flag) { return static_cast<uint8_t>(flag); }

    struct Texture
    {
        uint32_t Id = INVALID_ID;
        TextureType Type = TextureType::Texture2D;
        uint32_t Width = 0;
        uint32_t Height = 0;
        uint8_t ChannelCount = 0;
        uint8_t Flags = 0;
        // INVALID_ID until pixels have been uploaded; bumped on every reload.
        uint32_t Generation = INVALID_ID;
        std::string Name;
        // Backend-owned object, 0 when none exists.
        uint64_t InternalHandle = 0;

        [[nodiscard]] bool HasFlag(TextureFlag flag) const { return (Flags & ToFlags(flag)) != 0; }
        void SetFlag(TextureFlag flag, bool enabled)
        {
            if (enabled) Flags |= ToFlags(flag);
            else Flags &= static_cast<uint8_t>(~ToFlags(flag));
        }
    };

    enum class TextureUse : uint8_t
    {
        Unknown,
        Diffuse,
        Specular,
        Normal,
        Cubemap,
    };

    enum class TextureFilter : uint8_t
    {
        Nearest,
        Linear,
    };

    enum class TextureRepeat : uint8_t
    {
        Repeat,
        MirroredRepeat,
        ClampToEdge,
        ClampToBorder,
    };

    // A texture plus the sampler state it is read with.
    struct TextureMap
    {
        Graphics::Texture* Texture = nullptr;
        TextureUse Use = TextureUse::Unknown;
        TextureFilter FilterMinify = TextureFilter::Linear;
        TextureFilter FilterMagnify = TextureFilter::Linear;
        TextureRepeat RepeatU = TextureRepeat::Repeat;
        TextureRepeat RepeatV = TextureRepeat::Repeat;
        TextureRepeat RepeatW = TextureRepeat::Repeat;
        uint64_t InternalHandle = 0;
    };
}
