module;
#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <limits>

export module Core:Handle;

export namespace Core
{
    // Index + generation into a ResourcePool, tagged so a texture handle never
    // converts to a material handle:
    //
    //   struct TextureTag {};
    //   using TextureHandle = Core::StrongHandle<TextureTag>;
    //
    // Once a slot is reused the old generation no longer matches and lookups
    // through the stale handle fail with ResourceNotFound.
    template <typename Tag>
    struct StrongHandle
    {
        static constexpr uint32_t INVALID_INDEX = std::numeric_limits<uint32_t>::max();

        uint32_t Index = INVALID_INDEX;
        uint32_t Generation = 0;

        constexpr StrongHandle() = default;
        constexpr StrongHandle(uint32_t index, uint32_t generation) : Index(index), Generation(generation) {}

        [[nodiscard]] static constexpr StrongHandle Invalid() noexcept { return {}; }
        [[nodiscard]] constexpr bool IsValid() const noexcept { return Index != INVALID_INDEX; }
        [[nodiscard]] constexpr explicit operator bool() const noexcept { return IsValid(); }

        auto operator<=>(const StrongHandle&) const = default;
    };
}

template <typename Tag>
struct std::hash<Core::StrongHandle<Tag>>
{
    std::size_t operator()(const Core::StrongHandle<Tag>& handle) const noexcept
    {
        // splitmix64 over the packed pair.
        uint64_t key = (static_cast<uint64_t>(handle.Generation) << 32) | handle.Index;
        key += 0x9e3779b97f4a7c15ull;
        key = (key ^ (key >> 30)) * 0xbf58476d1ce4e5b9ull;
        key = (key ^ (key >> 27)) * 0x94d049bb133111ebull;
        return static_cast<std::size_t>(key ^ (key >> 31));
    }
};
