#include <gtest/gtest.h>
#include <cmath>

#include <entt/entity/registry.hpp>
#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

import Physics;
import ECS;
import Core;

using namespace ECS::Components;

namespace
{
    Physics::BodyDesc FloatingBox(const glm::vec3& position, const glm::quat& rotation)
    {
        Physics::BodyDesc desc;
        desc.Collider = Physics::BoxShape{glm::vec3(0.5f)};
        desc.Position = position;
        desc.Rotation = rotation;
        desc.Motion = Physics::MotionType::Kinematic;
        desc.GravityEnabled = false;
        return desc;
    }

    void ExpectRotationNear(const glm::quat& a, const glm::quat& b)
    {
        // q and -q are the same rotation.
        EXPECT_NEAR(std::abs(glm::dot(a, b)), 1.0f, 1e-5f);
    }
}

TEST(RigidBodySync, CopiesPoseReproduciblyAcrossTicks)
{
    Physics::PhysicsWorld world;
    ASSERT_TRUE(world.IsValid());

    const glm::vec3 position(1.0f, 2.0f, 3.0f);
    const glm::quat rotation = glm::normalize(glm::quat(glm::vec3(0.1f, 0.2f, 0.3f)));

    auto body = world.CreateBody(FloatingBox(position, rotation));
    ASSERT_TRUE(body.has_value());

    ECS::Scene scene;
    auto& registry = scene.GetRegistry();
    entt::entity entity = scene.CreateEntity("Body");
    registry.emplace<RigidBody::Component>(entity, *body);

    for (int tick = 0; tick < 4; ++tick)
    {
        ASSERT_TRUE(world.Step(1.0f / 90.0f).has_value());
        registry.remove<Transform::IsDirtyTag>(entity);

        EXPECT_EQ(ECS::Systems::RigidBodySync::OnUpdate(registry, world), 1u);

        const auto& transform = registry.get<Transform::Component>(entity);
        EXPECT_NEAR(transform.Position.x, 1.0f, 1e-5f);
        EXPECT_NEAR(transform.Position.y, 2.0f, 1e-5f);
        EXPECT_NEAR(transform.Position.z, 3.0f, 1e-5f);
        ExpectRotationNear(transform.Rotation, rotation);
        EXPECT_NEAR(glm::length(transform.Rotation), 1.0f, 1e-6f);
        EXPECT_TRUE(registry.all_of<Transform::IsDirtyTag>(entity));
    }
}

TEST(RigidBodySync, FailedPoseReadSkipsOnlyThatEntity)
{
    Physics::PhysicsWorld world;
    ASSERT_TRUE(world.IsValid());

    auto good = world.CreateBody(FloatingBox(glm::vec3(4.0f, 0.0f, 0.0f), glm::quat(1, 0, 0, 0)));
    ASSERT_TRUE(good.has_value());

    ECS::Scene scene;
    auto& registry = scene.GetRegistry();

    entt::entity tracked = scene.CreateEntity("Tracked");
    registry.emplace<RigidBody::Component>(tracked, *good);

    entt::entity orphan = scene.CreateEntity("Orphan");
    registry.emplace<RigidBody::Component>(orphan, Physics::BodyHandle{});
    registry.get<Transform::Component>(orphan).Position = glm::vec3(-7.0f);
    registry.remove<Transform::IsDirtyTag>(orphan);

    EXPECT_EQ(ECS::Systems::RigidBodySync::OnUpdate(registry, world), 1u);

    EXPECT_NEAR(registry.get<Transform::Component>(tracked).Position.x, 4.0f, 1e-5f);
    EXPECT_EQ(registry.get<Transform::Component>(orphan).Position, glm::vec3(-7.0f));
    EXPECT_FALSE(registry.all_of<Transform::IsDirtyTag>(orphan));
}

TEST(RigidBodySync, WorldMatrixFollowsBodyAfterTransformPass)
{
    Physics::PhysicsWorld world;
    ASSERT_TRUE(world.IsValid());

    auto body = world.CreateBody(FloatingBox(glm::vec3(1.0f, 2.0f, 3.0f), glm::quat(1, 0, 0, 0)));
    ASSERT_TRUE(body.has_value());

    ECS::Scene scene;
    auto& registry = scene.GetRegistry();
    entt::entity entity = scene.CreateEntity("Body");
    registry.emplace<RigidBody::Component>(entity, *body);

    ECS::Systems::RigidBodySync::OnUpdate(registry, world);
    ECS::Systems::Transform::OnUpdate(registry);

    const glm::mat4& matrix = registry.get<Transform::WorldMatrix>(entity).Matrix;
    EXPECT_NEAR(matrix[3][0], 1.0f, 1e-5f);
    EXPECT_NEAR(matrix[3][1], 2.0f, 1e-5f);
    EXPECT_NEAR(matrix[3][2], 3.0f, 1e-5f);
}

TEST(PhysicsWorld, UnknownBodyReportsBodyNotFound)
{
    Physics::PhysicsWorld world;
    ASSERT_TRUE(world.IsValid());

    auto pose = world.GetBodyPose(Physics::BodyHandle{});
    ASSERT_FALSE(pose.has_value());
    EXPECT_EQ(pose.error(), Core::ErrorCode::BodyNotFound);
}

TEST(PhysicsWorld, DynamicBodyFallsUnderGravity)
{
    Physics::PhysicsWorld world;
    ASSERT_TRUE(world.IsValid());

    Physics::BodyDesc desc;
    desc.Collider = Physics::SphereShape{0.25f};
    desc.Position = glm::vec3(0.0f, 10.0f, 0.0f);
    auto body = world.CreateBody(desc);
    ASSERT_TRUE(body.has_value());
    EXPECT_EQ(world.GetBodyCount(), 1u);

    for (int i = 0; i < 30; ++i)
        ASSERT_TRUE(world.Step(1.0f / 60.0f).has_value());

    auto pose = world.GetBodyPose(*body);
    ASSERT_TRUE(pose.has_value());
    EXPECT_LT(pose->Position.y, 10.0f);

    world.RemoveBody(*body);
    EXPECT_EQ(world.GetBodyCount(), 0u);
}
