#include <gtest/gtest.h>

#define GLM_ENABLE_EXPERIMENTAL
#include <glm/glm.hpp>
#include <glm/gtc/matrix_transform.hpp>
#include <glm/gtx/quaternion.hpp>

import Core;
import ECS;

namespace
{
    void ExpectMatNear(const glm::mat4& a, const glm::mat4& b, float eps = 1e-5f)
    {
        for (int c = 0; c < 4; ++c)
            for (int r = 0; r < 4; ++r)
                EXPECT_NEAR(a[c][r], b[c][r], eps) << "column " << c << " row " << r;
    }
}

TEST(TransformArena, LocalMatrixIsTranslateRotateScale)
{
    ECS::TransformArena arena;
    const glm::quat rotation = glm::angleAxis(glm::radians(90.0f), glm::vec3(0.0f, 1.0f, 0.0f));
    auto handle = arena.Create({1.0f, 2.0f, 3.0f}, rotation, glm::vec3(2.0f));

    glm::mat4 expected = glm::translate(glm::mat4(1.0f), glm::vec3(1.0f, 2.0f, 3.0f));
    expected = expected * glm::mat4_cast(rotation);
    expected = glm::scale(expected, glm::vec3(2.0f));

    ExpectMatNear(arena.GetLocal(handle), expected);
    ExpectMatNear(arena.GetWorld(handle), expected);
}

TEST(TransformArena, ChainComposesParentFirst)
{
    ECS::TransformArena arena;
    auto a = arena.Create({10.0f, 0.0f, 0.0f});
    auto b = arena.Create({0.0f, 5.0f, 0.0f}, glm::angleAxis(glm::radians(45.0f), glm::vec3(0.0f, 0.0f, 1.0f)), glm::vec3(1.0f));
    auto c = arena.Create({0.0f, 0.0f, 2.0f});

    ASSERT_TRUE(arena.SetParent(b, a).has_value());
    ASSERT_TRUE(arena.SetParent(c, b).has_value());
    EXPECT_EQ(arena.GetParent(c), b);
    EXPECT_EQ(arena.GetParent(b), a);

    ExpectMatNear(arena.GetWorld(c), arena.GetWorld(b) * arena.GetLocal(c));
    ExpectMatNear(arena.GetWorld(b), arena.GetLocal(a) * arena.GetLocal(b));

    const glm::mat4 bLocal = arena.GetLocal(b);
    const glm::mat4 cLocal = arena.GetLocal(c);

    // Moving the root reaches the grandchild without touching the middle or leaf locals.
    arena.Translate(a, {0.0f, 0.0f, -3.0f});
    ExpectMatNear(arena.GetLocal(b), bLocal);
    ExpectMatNear(arena.GetLocal(c), cLocal);

    const glm::vec3 cWorld = glm::vec3(arena.GetWorld(c)[3]);
    const glm::vec3 expected = glm::vec3(arena.GetLocal(a) * bLocal * cLocal * glm::vec4(0.0f, 0.0f, 0.0f, 1.0f));
    EXPECT_NEAR(cWorld.x, expected.x, 1e-5f);
    EXPECT_NEAR(cWorld.y, expected.y, 1e-5f);
    EXPECT_NEAR(cWorld.z, expected.z, 1e-5f);
    EXPECT_NEAR(arena.GetPosition(a).z, -3.0f, 1e-6f);
}

TEST(TransformArena, RejectsCycles)
{
    ECS::TransformArena arena;
    auto a = arena.Create();
    auto b = arena.Create();
    auto c = arena.Create();

    ASSERT_TRUE(arena.SetParent(b, a).has_value());
    ASSERT_TRUE(arena.SetParent(c, b).has_value());

    auto cycle = arena.SetParent(a, c);
    ASSERT_FALSE(cycle.has_value());
    EXPECT_EQ(cycle.error(), Core::ErrorCode::InvalidArgument);

    auto self = arena.SetParent(a, a);
    ASSERT_FALSE(self.has_value());

    // The rejected calls left the hierarchy untouched.
    EXPECT_EQ(arena.GetParent(a), ECS::NullTransform);
    EXPECT_EQ(arena.GetParent(c), b);
}

TEST(TransformArena, ClearParentAndDestroyMakeRoots)
{
    ECS::TransformArena arena;
    auto a = arena.Create({1.0f, 0.0f, 0.0f});
    auto b = arena.Create({0.0f, 1.0f, 0.0f});
    auto c = arena.Create({0.0f, 0.0f, 1.0f});
    ASSERT_TRUE(arena.SetParent(b, a).has_value());
    ASSERT_TRUE(arena.SetParent(c, a).has_value());

    arena.ClearParent(b);
    EXPECT_EQ(arena.GetParent(b), ECS::NullTransform);
    ExpectMatNear(arena.GetWorld(b), arena.GetLocal(b));

    arena.Destroy(a);
    EXPECT_FALSE(arena.IsValid(a));
    EXPECT_TRUE(arena.IsValid(c));
    EXPECT_EQ(arena.GetParent(c), ECS::NullTransform);
    EXPECT_EQ(arena.Size(), 2u);

    auto dead = arena.SetParent(c, a);
    ASSERT_FALSE(dead.has_value());
    EXPECT_EQ(dead.error(), Core::ErrorCode::InvalidState);
}

TEST(TransformArena, SettersMarkLocalDirty)
{
    ECS::TransformArena arena;
    auto handle = arena.Create();
    ExpectMatNear(arena.GetLocal(handle), glm::mat4(1.0f));

    arena.SetPosition(handle, {0.0f, 4.0f, 0.0f});
    arena.SetScale(handle, glm::vec3(3.0f));
    const glm::mat4 local = arena.GetLocal(handle);
    EXPECT_NEAR(local[3].y, 4.0f, 1e-6f);
    EXPECT_NEAR(local[0].x, 3.0f, 1e-6f);

    arena.Scale(handle, glm::vec3(2.0f));
    EXPECT_NEAR(arena.GetScale(handle).x, 6.0f, 1e-6f);
    EXPECT_NEAR(arena.GetLocal(handle)[0].x, 6.0f, 1e-6f);
}
