module;
#define GLM_ENABLE_EXPERIMENTAL
#include <cstddef>
#include <glm/glm.hpp>
#include <glm/gtx/quaternion.hpp>
#include <entt/entity/registry.hpp>

module ECS;

namespace ECS
{
    using Components::Transform::Component;
    using Components::Transform::LocalMatrix;

    TransformHandle TransformArena::Create()
    {
        return Create(glm::vec3(0.0f), glm::quat(1.0f, 0.0f, 0.0f, 0.0f), glm::vec3(1.0f));
    }

    TransformHandle TransformArena::Create(const glm::vec3& position)
    {
        return Create(position, glm::quat(1.0f, 0.0f, 0.0f, 0.0f), glm::vec3(1.0f));
    }

    TransformHandle TransformArena::Create(const glm::vec3& position, const glm::quat& rotation, const glm::vec3& scale)
    {
        const entt::entity e = m_Registry.create();
        m_Registry.emplace<Component>(e, position, rotation, scale);
        m_Registry.emplace<LocalMatrix>(e);
        m_Registry.emplace<Components::Hierarchy::Component>(e);
        return e;
    }

    void TransformArena::Destroy(TransformHandle handle)
    {
        if (!m_Registry.valid(handle)) return;

        Components::Hierarchy::DetachChildren(m_Registry, handle);
        Components::Hierarchy::Detach(m_Registry, handle);
        m_Registry.destroy(handle);
    }

    bool TransformArena::IsValid(TransformHandle handle) const
    {
        return handle != NullTransform && m_Registry.valid(handle);
    }

    size_t TransformArena::Size() const
    {
        return m_Registry.view<Component>().size();
    }

    Component& TransformArena::Edit(TransformHandle handle)
    {
        m_Registry.get<LocalMatrix>(handle).Dirty = true;
        return m_Registry.get<Component>(handle);
    }

    void TransformArena::SetPosition(TransformHandle handle, const glm::vec3& position)
    {
        Edit(handle).Position = position;
    }

    void TransformArena::SetRotation(TransformHandle handle, const glm::quat& rotation)
    {
        Edit(handle).Rotation = rotation;
    }

    void TransformArena::SetScale(TransformHandle handle, const glm::vec3& scale)
    {
        Edit(handle).Scale = scale;
    }

    void TransformArena::Translate(TransformHandle handle, const glm::vec3& offset)
    {
        Edit(handle).Position += offset;
    }

    void TransformArena::Rotate(TransformHandle handle, const glm::quat& rotation)
    {
        auto& t = Edit(handle);
        t.Rotation = t.Rotation * rotation;
    }

    void TransformArena::Scale(TransformHandle handle, const glm::vec3& factor)
    {
        Edit(handle).Scale *= factor;
    }

    glm::vec3 TransformArena::GetPosition(TransformHandle handle) const
    {
        return m_Registry.get<Component>(handle).Position;
    }

    glm::quat TransformArena::GetRotation(TransformHandle handle) const
    {
        return m_Registry.get<Component>(handle).Rotation;
    }

    glm::vec3 TransformArena::GetScale(TransformHandle handle) const
    {
        return m_Registry.get<Component>(handle).Scale;
    }

    Core::Result TransformArena::SetParent(TransformHandle child, TransformHandle parent)
    {
        return Components::Hierarchy::Attach(m_Registry, child, parent);
    }

    void TransformArena::ClearParent(TransformHandle child)
    {
        Components::Hierarchy::Detach(m_Registry, child);
    }

    TransformHandle TransformArena::GetParent(TransformHandle handle) const
    {
        if (!IsValid(handle)) return NullTransform;
        return m_Registry.get<Components::Hierarchy::Component>(handle).Parent;
    }

    glm::mat4 TransformArena::GetLocal(TransformHandle handle) const
    {
        auto& cache = m_Registry.get<LocalMatrix>(handle);
        if (cache.Dirty)
        {
            cache.Matrix = Components::Transform::GetMatrix(m_Registry.get<Component>(handle));
            cache.Dirty = false;
        }
        return cache.Matrix;
    }

    glm::mat4 TransformArena::GetWorld(TransformHandle handle) const
    {
        glm::mat4 world = GetLocal(handle);
        for (TransformHandle p = GetParent(handle); p != NullTransform; p = GetParent(p))
        {
            world = GetLocal(p) * world;
        }
        return world;
    }
}
