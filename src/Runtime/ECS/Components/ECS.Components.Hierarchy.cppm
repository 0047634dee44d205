module;
#include <cstdint>
#include <entt/entity/registry.hpp>

export module ECS:Components.Hierarchy;
import Core;

export namespace ECS::Components::Hierarchy
{
    // Intrusive child list. Parent links are non-owning.
    struct Component
    {
        entt::entity Parent = entt::null;
        entt::entity FirstChild = entt::null;
        entt::entity NextSibling = entt::null;
        entt::entity PrevSibling = entt::null;
        uint32_t ChildCount = 0;
    };

    // True if 'potentialDescendant' is 'entity' or lies below it.
    [[nodiscard]] bool IsDescendant(const entt::registry& registry, entt::entity entity, entt::entity potentialDescendant);

    // InvalidState for dead entities, InvalidArgument for self-parenting or a cycle.
    [[nodiscard]] Core::Result Attach(entt::registry& registry, entt::entity child, entt::entity newParent);
    void Detach(entt::registry& registry, entt::entity child);

    // Turns every child of 'parent' into a root.
    void DetachChildren(entt::registry& registry, entt::entity parent);
}
