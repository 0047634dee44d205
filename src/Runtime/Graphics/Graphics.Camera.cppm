// src/Runtime/Graphics/Graphics.Camera.cppm
module;

#include <cstdint>
#include <string_view>
#include <glm/glm.hpp>

export module Graphics:Camera;
import Core;
import :ReferenceRegistry;

export namespace Graphics
{
    inline constexpr std::string_view DEFAULT_CAMERA_NAME = "default";

    // Projection (Vulkan: Y flipped, Depth 0..1)
    [[nodiscard]] glm::mat4 MakePerspective(float fovRadians, float aspectRatio, float nearClip, float farClip);

    // Screen space with the origin top-left: x in [0,width], y in [height,0].
    [[nodiscard]] glm::mat4 MakeOrthographic(float width, float height, float nearClip, float farClip);

    // Free-fly camera with Euler rotation in radians (pitch, yaw, roll).
    class Camera
    {
    public:
        void Reset();

        [[nodiscard]] glm::vec3 GetPosition() const { return m_Position; }
        void SetPosition(const glm::vec3& position);

        [[nodiscard]] glm::vec3 GetRotation() const { return m_EulerRotation; }
        void SetRotation(const glm::vec3& rotation);

        // Recomputed lazily after any movement.
        [[nodiscard]] const glm::mat4& GetView();

        [[nodiscard]] glm::vec3 GetForward();
        [[nodiscard]] glm::vec3 GetBackward() { return -GetForward(); }
        [[nodiscard]] glm::vec3 GetRight();
        [[nodiscard]] glm::vec3 GetLeft() { return -GetRight(); }

        void MoveForward(float amount);
        void MoveBackward(float amount);
        void MoveLeft(float amount);
        void MoveRight(float amount);
        void MoveUp(float amount);
        void MoveDown(float amount);

        void Yaw(float amount);
        // Clamped just short of straight up/down to avoid gimbal lock.
        void Pitch(float amount);

    private:
        glm::vec3 m_Position{0.0f};
        glm::vec3 m_EulerRotation{0.0f};
        glm::mat4 m_View{1.0f};
        bool m_IsDirty = false;
    };

    inline constexpr float CAMERA_PITCH_LIMIT = 1.55334306f; // 89 degrees

    struct CameraTag {};
    using CameraHandle = Core::StrongHandle<CameraTag>;

    struct CameraSystemConfig
    {
        uint32_t MaxCameraCount = 61;
    };

    class CameraSystem
    {
    public:
        CameraSystem() = default;
        CameraSystem(const CameraSystem&) = delete;
        CameraSystem& operator=(const CameraSystem&) = delete;

        [[nodiscard]] Core::Result Initialize(const CameraSystemConfig& config = {});
        void Shutdown();

        // DEFAULT_CAMERA_NAME always yields the default camera without a reference.
        [[nodiscard]] Core::Expected<Camera*> Acquire(std::string_view name);
        [[nodiscard]] Core::Result Release(std::string_view name);

        [[nodiscard]] Camera* GetDefault() { return &m_DefaultCamera; }

        [[nodiscard]] uint64_t GetReferenceCount(std::string_view name) const { return m_Registry.GetReferenceCount(name); }
        [[nodiscard]] size_t GetCameraCount() const { return m_Pool.Size(); }

    private:
        CameraSystemConfig m_Config;
        Camera m_DefaultCamera;
        Core::ResourcePool<Camera, CameraHandle> m_Pool;
        ReferenceRegistry<CameraHandle> m_Registry;
    };
}
