module;

#include <algorithm>
#include <expected>
#include <string_view>

#define GLM_ENABLE_EXPERIMENTAL
#include <glm/glm.hpp>
#include <glm/gtc/matrix_transform.hpp>
#include <glm/gtx/euler_angles.hpp>

module Graphics;

namespace Graphics
{
    glm::mat4 MakePerspective(float fovRadians, float aspectRatio, float nearClip, float farClip)
    {
        glm::mat4 projection = glm::perspective(fovRadians, aspectRatio, nearClip, farClip);
        projection[1][1] *= -1;
        return projection;
    }

    glm::mat4 MakeOrthographic(float width, float height, float nearClip, float farClip)
    {
        return glm::ortho(0.0f, width, height, 0.0f, nearClip, farClip);
    }

    void Camera::Reset()
    {
        m_Position = glm::vec3(0.0f);
        m_EulerRotation = glm::vec3(0.0f);
        m_View = glm::mat4(1.0f);
        m_IsDirty = false;
    }

    void Camera::SetPosition(const glm::vec3& position)
    {
        m_Position = position;
        m_IsDirty = true;
    }

    void Camera::SetRotation(const glm::vec3& rotation)
    {
        m_EulerRotation = rotation;
        m_IsDirty = true;
    }

    const glm::mat4& Camera::GetView()
    {
        if (m_IsDirty)
        {
            const glm::mat4 rotation = glm::eulerAngleXYZ(m_EulerRotation.x, m_EulerRotation.y, m_EulerRotation.z);
            const glm::mat4 translation = glm::translate(glm::mat4(1.0f), m_Position);
            m_View = glm::inverse(translation * rotation);
            m_IsDirty = false;
        }
        return m_View;
    }

    glm::vec3 Camera::GetForward()
    {
        // Rows of the view matrix are the camera axes in world space.
        const glm::mat4 world = glm::inverse(GetView());
        return -glm::normalize(glm::vec3(world[2]));
    }

    glm::vec3 Camera::GetRight()
    {
        const glm::mat4 world = glm::inverse(GetView());
        return glm::normalize(glm::vec3(world[0]));
    }

    void Camera::MoveForward(float amount)
    {
        m_Position += GetForward() * amount;
        m_IsDirty = true;
    }

    void Camera::MoveBackward(float amount)
    {
        m_Position += GetBackward() * amount;
        m_IsDirty = true;
    }

    void Camera::MoveLeft(float amount)
    {
        m_Position += GetLeft() * amount;
        m_IsDirty = true;
    }

    void Camera::MoveRight(float amount)
    {
        m_Position += GetRight() * amount;
        m_IsDirty = true;
    }

    void Camera::MoveUp(float amount)
    {
        m_Position += glm::vec3(0.0f, 1.0f, 0.0f) * amount;
        m_IsDirty = true;
    }

    void Camera::MoveDown(float amount)
    {
        m_Position -= glm::vec3(0.0f, 1.0f, 0.0f) * amount;
        m_IsDirty = true;
    }

    void Camera::Yaw(float amount)
    {
        m_EulerRotation.y += amount;
        m_IsDirty = true;
    }

    void Camera::Pitch(float amount)
    {
        m_EulerRotation.x = std::clamp(m_EulerRotation.x + amount, -CAMERA_PITCH_LIMIT, CAMERA_PITCH_LIMIT);
        m_IsDirty = true;
    }

    Core::Result CameraSystem::Initialize(const CameraSystemConfig& config)
    {
        if (config.MaxCameraCount == 0)
        {
            Core::Log::Error("CameraSystem: MaxCameraCount must be > 0.");
            return Core::Err(Core::ErrorCode::InvalidArgument);
        }
        m_Config = config;
        m_Pool.Initialize(0, config.MaxCameraCount);
        m_DefaultCamera.Reset();
        return Core::Ok();
    }

    void CameraSystem::Shutdown()
    {
        m_Registry.ReleaseAll({});
        m_Pool.Clear();
    }

    Core::Expected<Camera*> CameraSystem::Acquire(std::string_view name)
    {
        if (name == DEFAULT_CAMERA_NAME)
            return &m_DefaultCamera;

        auto handle = m_Registry.Acquire(name, true, [this, name]() -> Core::Expected<CameraHandle>
        {
            auto created = m_Pool.Create();
            if (!created)
            {
                Core::Log::Error("CameraSystem: no free slot for camera '{}' (max {}).", name, m_Config.MaxCameraCount);
                return created;
            }
            m_Pool.TryGet(*created)->Reset();
            return created;
        });
        if (!handle) return std::unexpected(handle.error());
        return m_Pool.Get(*handle);
    }

    Core::Result CameraSystem::Release(std::string_view name)
    {
        if (name == DEFAULT_CAMERA_NAME)
        {
            Core::Log::Warn("CameraSystem: the default camera cannot be released.");
            return Core::Ok();
        }

        return m_Registry.Release(name, [this](const CameraHandle& handle)
        {
            // No GPU state, the slot is freed right away.
            m_Pool.Remove(handle, 0);
            m_Pool.ProcessDeletions(1);
        });
    }
}
