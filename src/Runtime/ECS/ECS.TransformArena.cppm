module;
#define GLM_ENABLE_EXPERIMENTAL
#include <cstddef>
#include <glm/glm.hpp>
#include <glm/gtx/quaternion.hpp>
#include <entt/entity/registry.hpp>

export module ECS:TransformArena;
import Core;
import :Components.Transform;
import :Components.Hierarchy;

export namespace ECS
{
    // Transforms are entities in the arena's registry. A handle stays valid until Destroy().
    using TransformHandle = entt::entity;
    inline constexpr TransformHandle NullTransform{entt::null};

    // Owns every transform of a scene. Parents are handles into the same arena,
    // so a cycle can be rejected at SetParent() instead of overflowing GetWorld().
    //
    // Accessors other than IsValid/SetParent expect a live handle.
    class TransformArena
    {
    public:
        TransformArena() = default;

        TransformArena(const TransformArena&) = delete;
        TransformArena& operator=(const TransformArena&) = delete;

        [[nodiscard]] TransformHandle Create();
        [[nodiscard]] TransformHandle Create(const glm::vec3& position);
        [[nodiscard]] TransformHandle Create(const glm::vec3& position, const glm::quat& rotation, const glm::vec3& scale);

        // Children of a destroyed transform become roots.
        void Destroy(TransformHandle handle);

        [[nodiscard]] bool IsValid(TransformHandle handle) const;
        [[nodiscard]] size_t Size() const;

        void SetPosition(TransformHandle handle, const glm::vec3& position);
        void SetRotation(TransformHandle handle, const glm::quat& rotation);
        void SetScale(TransformHandle handle, const glm::vec3& scale);

        void Translate(TransformHandle handle, const glm::vec3& offset);
        void Rotate(TransformHandle handle, const glm::quat& rotation);
        void Scale(TransformHandle handle, const glm::vec3& factor);

        [[nodiscard]] glm::vec3 GetPosition(TransformHandle handle) const;
        [[nodiscard]] glm::quat GetRotation(TransformHandle handle) const;
        [[nodiscard]] glm::vec3 GetScale(TransformHandle handle) const;

        [[nodiscard]] Core::Result SetParent(TransformHandle child, TransformHandle parent);
        void ClearParent(TransformHandle child);
        [[nodiscard]] TransformHandle GetParent(TransformHandle handle) const;

        // Rebuilds the local matrix only when dirty.
        [[nodiscard]] glm::mat4 GetLocal(TransformHandle handle) const;

        // parent.world * local, walked to the root on every call so it always
        // reflects the latest ancestor state.
        [[nodiscard]] glm::mat4 GetWorld(TransformHandle handle) const;

    private:
        Components::Transform::Component& Edit(TransformHandle handle);

        // The local cache is logically const state.
        mutable entt::registry m_Registry;
    };
}
