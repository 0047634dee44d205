module;
#include <cstdint>
#include <string>
#include <vector>

export module Graphics:Mesh;
import ECS;
import :Texture;
import :Geometry;

export namespace Graphics
{
    // Tombstone: the slot exists but holds no loaded mesh.
    inline constexpr uint8_t INVALID_GENERATION = 255;

    [[nodiscard]] constexpr uint8_t NextGeneration(uint8_t generation)
    {
        if (generation == INVALID_GENERATION) return 0;
        const auto next = static_cast<uint8_t>(generation + 1);
        return next == INVALID_GENERATION ? 0 : next;
    }

    struct Mesh
    {
        uint32_t UniqueId = INVALID_ID;
        uint8_t Generation = INVALID_GENERATION;
        std::vector<Geometry*> Geometries;
        ECS::TransformHandle Transform = ECS::NullTransform;

        [[nodiscard]] bool IsLive() const { return Generation != INVALID_GENERATION; }

        // Slots are reused: every load bumps the generation so stale references can tell.
        void MarkLoaded() { Generation = NextGeneration(Generation); }
        void MarkUnloaded() { Generation = INVALID_GENERATION; }
    };

    // Text is laid out by the font collaborator; the view only tracks ids and transforms.
    struct UIText
    {
        uint32_t UniqueId = INVALID_ID;
        std::string Text;
        ECS::TransformHandle Transform = ECS::NullTransform;
        uint32_t InstanceId = INVALID_ID;
        uint64_t RenderFrameNumber = INVALID_ID;
    };

    struct Skybox
    {
        TextureMap CubeMap{.Use = TextureUse::Cubemap};
        Graphics::Geometry* Geometry = nullptr;
        uint32_t InstanceId = INVALID_ID;
        uint64_t RenderFrameNumber = INVALID_ID;
    };
}
