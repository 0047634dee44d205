module;
#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

export module Core:Hash;

export namespace Core::Hash
{
    inline constexpr uint32_t FNV_OFFSET_BASIS = 2166136261u;
    inline constexpr uint32_t FNV_PRIME = 16777619u;

    // 32-bit FNV-1a.
    [[nodiscard]] constexpr uint32_t HashString(std::string_view text)
    {
        uint32_t hash = FNV_OFFSET_BASIS;
        for (const char c : text)
            hash = (hash ^ static_cast<uint8_t>(c)) * FNV_PRIME;
        return hash;
    }

    // Hashed uniform or attribute name. Collisions are not resolved; shader
    // configs with two names hashing alike are a content error.
    struct StringID
    {
        uint32_t Value = 0;

        constexpr StringID() = default;
        constexpr explicit StringID(uint32_t value) : Value(value) {}
        constexpr StringID(std::string_view name) : Value(HashString(name)) {}
        constexpr StringID(const char* name) : Value(HashString(name)) {}

        auto operator<=>(const StringID&) const = default;
    };

    // Lets name-keyed maps be probed with a string_view or literal without building a std::string.
    struct StringHash
    {
        using is_transparent = void;

        size_t operator()(std::string_view text) const noexcept { return std::hash<std::string_view>{}(text); }
        size_t operator()(const std::string& text) const noexcept { return (*this)(std::string_view(text)); }
        size_t operator()(const char* text) const noexcept { return (*this)(std::string_view(text)); }
    };
}

template <>
struct std::hash<Core::Hash::StringID>
{
    std::size_t operator()(const Core::Hash::StringID& id) const noexcept { return id.Value; }
};
