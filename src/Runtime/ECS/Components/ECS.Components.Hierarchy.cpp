module;
#include <cstdint>
#include <entt/entity/registry.hpp>

module ECS;

namespace
{
    using ECS::Components::Hierarchy::Component;

    // Pushes `child` to the front of the parent's sibling list.
    void LinkFirst(entt::registry& registry, entt::entity parent, entt::entity child)
    {
        auto& node = registry.get<Component>(child);
        auto& parentNode = registry.get<Component>(parent);

        node.Parent = parent;
        node.PrevSibling = entt::null;
        node.NextSibling = parentNode.FirstChild;
        if (parentNode.FirstChild != entt::null)
            registry.get<Component>(parentNode.FirstChild).PrevSibling = child;

        parentNode.FirstChild = child;
        ++parentNode.ChildCount;
    }

    void Unlink(entt::registry& registry, entt::entity child)
    {
        auto& node = registry.get<Component>(child);
        auto& parentNode = registry.get<Component>(node.Parent);

        if (node.PrevSibling == entt::null)
            parentNode.FirstChild = node.NextSibling;
        else
            registry.get<Component>(node.PrevSibling).NextSibling = node.NextSibling;

        if (node.NextSibling != entt::null)
            registry.get<Component>(node.NextSibling).PrevSibling = node.PrevSibling;

        --parentNode.ChildCount;
        node.Parent = node.PrevSibling = node.NextSibling = entt::null;
    }
}

namespace ECS::Components::Hierarchy
{
    bool IsDescendant(const entt::registry& registry, entt::entity entity, entt::entity potentialDescendant)
    {
        for (entt::entity node = potentialDescendant; node != entt::null && registry.valid(node);)
        {
            if (node == entity) return true;
            const auto* link = registry.try_get<Component>(node);
            if (!link) return false;
            node = link->Parent;
        }
        return false;
    }

    Core::Result Attach(entt::registry& registry, entt::entity child, entt::entity newParent)
    {
        if (!registry.valid(child) || !registry.valid(newParent))
        {
            Core::Log::Warn("Hierarchy: cannot attach {} to {}, entity is not alive.",
                            static_cast<uint32_t>(child), static_cast<uint32_t>(newParent));
            return Core::Err(Core::ErrorCode::InvalidState);
        }

        if (IsDescendant(registry, child, newParent))
        {
            Core::Log::Warn("Hierarchy: attaching {} to {} would form a cycle.",
                            static_cast<uint32_t>(child), static_cast<uint32_t>(newParent));
            return Core::Err(Core::ErrorCode::InvalidArgument);
        }

        registry.get_or_emplace<Component>(newParent);
        const entt::entity oldParent = registry.get_or_emplace<Component>(child).Parent;
        if (oldParent == newParent) return Core::Ok();
        if (oldParent != entt::null) Unlink(registry, child);

        LinkFirst(registry, newParent, child);
        return Core::Ok();
    }

    void Detach(entt::registry& registry, entt::entity child)
    {
        if (!registry.valid(child)) return;
        if (const auto* node = registry.try_get<Component>(child); node && node->Parent != entt::null)
            Unlink(registry, child);
    }

    void DetachChildren(entt::registry& registry, entt::entity parent)
    {
        const auto* parentNode = registry.try_get<Component>(parent);
        if (!parentNode) return;

        while (parentNode->FirstChild != entt::null)
            Unlink(registry, parentNode->FirstChild);
    }
}
