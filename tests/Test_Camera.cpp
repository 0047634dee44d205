#include <gtest/gtest.h>
#include <cmath>

#include <glm/glm.hpp>
#include <glm/gtc/matrix_transform.hpp>

import Core;
import Graphics;

using namespace Graphics;

TEST(Camera, DefaultLooksDownNegativeZ)
{
    Camera camera;
    camera.Reset();
    const glm::vec3 forward = camera.GetForward();
    EXPECT_NEAR(forward.x, 0.0f, 1e-6f);
    EXPECT_NEAR(forward.y, 0.0f, 1e-6f);
    EXPECT_NEAR(forward.z, -1.0f, 1e-6f);

    const glm::vec3 right = camera.GetRight();
    EXPECT_NEAR(right.x, 1.0f, 1e-6f);
    EXPECT_NEAR(camera.GetLeft().x, -1.0f, 1e-6f);
    EXPECT_NEAR(camera.GetBackward().z, 1.0f, 1e-6f);
}

TEST(Camera, MovementUpdatesPositionAndView)
{
    Camera camera;
    camera.MoveForward(3.0f);
    camera.MoveUp(2.0f);
    camera.MoveRight(1.0f);

    const glm::vec3 position = camera.GetPosition();
    EXPECT_NEAR(position.x, 1.0f, 1e-5f);
    EXPECT_NEAR(position.y, 2.0f, 1e-5f);
    EXPECT_NEAR(position.z, -3.0f, 1e-5f);

    // The view matrix brings the camera position to the origin.
    const glm::vec4 eye = camera.GetView() * glm::vec4(position, 1.0f);
    EXPECT_NEAR(eye.x, 0.0f, 1e-5f);
    EXPECT_NEAR(eye.y, 0.0f, 1e-5f);
    EXPECT_NEAR(eye.z, 0.0f, 1e-5f);

    camera.MoveDown(2.0f);
    camera.MoveBackward(3.0f);
    camera.MoveLeft(1.0f);
    EXPECT_NEAR(glm::length(camera.GetPosition()), 0.0f, 1e-5f);
}

TEST(Camera, YawTurnsForwardAroundY)
{
    Camera camera;
    camera.Yaw(glm::radians(90.0f));
    const glm::vec3 forward = camera.GetForward();
    EXPECT_NEAR(forward.y, 0.0f, 1e-5f);
    EXPECT_NEAR(std::abs(forward.x), 1.0f, 1e-5f);
    EXPECT_NEAR(forward.z, 0.0f, 1e-5f);
}

TEST(Camera, PitchIsClampedShortOfVertical)
{
    Camera camera;
    camera.Pitch(10.0f);
    EXPECT_FLOAT_EQ(camera.GetRotation().x, CAMERA_PITCH_LIMIT);
    camera.Pitch(-20.0f);
    EXPECT_FLOAT_EQ(camera.GetRotation().x, -CAMERA_PITCH_LIMIT);

    camera.Reset();
    camera.Pitch(0.25f);
    EXPECT_FLOAT_EQ(camera.GetRotation().x, 0.25f);
}

TEST(Projection, PerspectiveFlipsY)
{
    const glm::mat4 reference = glm::perspective(0.785398163f, 16.0f / 9.0f, 0.1f, 1000.0f);
    const glm::mat4 projection = MakePerspective(0.785398163f, 16.0f / 9.0f, 0.1f, 1000.0f);
    EXPECT_FLOAT_EQ(projection[1][1], -reference[1][1]);
    EXPECT_FLOAT_EQ(projection[0][0], reference[0][0]);
    EXPECT_FLOAT_EQ(projection[2][2], reference[2][2]);
}

TEST(Projection, OrthographicHasTopLeftOrigin)
{
    const glm::mat4 projection = MakeOrthographic(1280.0f, 720.0f, -100.0f, 100.0f);
    const glm::vec4 topLeft = projection * glm::vec4(0.0f, 0.0f, 0.0f, 1.0f);
    const glm::vec4 bottomRight = projection * glm::vec4(1280.0f, 720.0f, 0.0f, 1.0f);
    EXPECT_NEAR(topLeft.x, -1.0f, 1e-5f);
    EXPECT_NEAR(topLeft.y, 1.0f, 1e-5f);
    EXPECT_NEAR(bottomRight.x, 1.0f, 1e-5f);
    EXPECT_NEAR(bottomRight.y, -1.0f, 1e-5f);
}

TEST(CameraSystem, DefaultNameNeedsNoReference)
{
    CameraSystem cameras;
    ASSERT_TRUE(cameras.Initialize().has_value());

    auto camera = cameras.Acquire(DEFAULT_CAMERA_NAME);
    ASSERT_TRUE(camera.has_value());
    EXPECT_EQ(*camera, cameras.GetDefault());
    EXPECT_EQ(cameras.GetCameraCount(), 0u);
    EXPECT_TRUE(cameras.Release(DEFAULT_CAMERA_NAME).has_value());
}

TEST(CameraSystem, NamedCamerasAreReferenceCounted)
{
    CameraSystem cameras;
    ASSERT_TRUE(cameras.Initialize({2}).has_value());

    auto first = cameras.Acquire("orbit");
    auto second = cameras.Acquire("orbit");
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(*first, *second);
    EXPECT_EQ(cameras.GetReferenceCount("orbit"), 2u);
    EXPECT_EQ(cameras.GetCameraCount(), 1u);

    ASSERT_TRUE(cameras.Release("orbit").has_value());
    ASSERT_TRUE(cameras.Release("orbit").has_value());
    EXPECT_EQ(cameras.GetCameraCount(), 0u);

    auto unknown = cameras.Release("orbit");
    ASSERT_FALSE(unknown.has_value());
    EXPECT_EQ(unknown.error(), Core::ErrorCode::ResourceNotFound);
}

TEST(CameraSystem, RunsOutOfSlots)
{
    CameraSystem cameras;
    ASSERT_TRUE(cameras.Initialize({1}).has_value());
    ASSERT_TRUE(cameras.Acquire("a").has_value());

    auto full = cameras.Acquire("b");
    ASSERT_FALSE(full.has_value());
    EXPECT_EQ(full.error(), Core::ErrorCode::ResourceExhausted);

    EXPECT_FALSE(cameras.Initialize({0}).has_value());
}
