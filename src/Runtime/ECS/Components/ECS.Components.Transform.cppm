module;
#define GLM_ENABLE_EXPERIMENTAL
#include <glm/glm.hpp>
#include <glm/gtc/matrix_transform.hpp>
#include <glm/gtx/quaternion.hpp>

export module ECS:Components.Transform;

export namespace ECS::Components::Transform
{
    // Local translation/rotation/scale relative to the parent.
    struct Component
    {
        glm::vec3 Position{0.0f};
        glm::quat Rotation{1.0f, 0.0f, 0.0f, 0.0f};
        glm::vec3 Scale{1.0f};
    };

    // Memoized local matrix. Any write to Component sets Dirty; the next
    // GetLocal() rebuilds Matrix and clears it.
    struct LocalMatrix
    {
        glm::mat4 Matrix{1.0f};
        bool Dirty = true;
    };

    // T * R * S, column-vector convention.
    [[nodiscard]] inline glm::mat4 GetMatrix(const Component& transform)
    {
        glm::mat4 mat = glm::translate(glm::mat4(1.0f), transform.Position);
        mat = mat * glm::mat4_cast(transform.Rotation);
        mat = glm::scale(mat, transform.Scale);
        return mat;
    }
}
