#include <gtest/gtest.h>

#include <entt/entity/registry.hpp>
#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

import ECS;

using namespace ECS::Components;

TEST(RuntimeECS, CreateEntityCarriesNameAndDirtyTransform)
{
    ECS::Scene scene;
    entt::entity entity = scene.CreateEntity("Crate");
    auto& registry = scene.GetRegistry();

    EXPECT_EQ(registry.get<NameTag::Component>(entity).Name, "Crate");
    EXPECT_TRUE(registry.all_of<Transform::Component>(entity));
    EXPECT_TRUE(registry.all_of<Transform::WorldMatrix>(entity));
    EXPECT_TRUE(registry.all_of<Transform::IsDirtyTag>(entity));
    EXPECT_EQ(scene.Size(), 1u);
}

TEST(RuntimeECS, TransformSystemRebuildsDirtyWorldMatrices)
{
    ECS::Scene scene;
    entt::entity entity = scene.CreateEntity("Mover");
    auto& registry = scene.GetRegistry();

    auto& transform = registry.get<Transform::Component>(entity);
    transform.Position = glm::vec3(1.0f, 2.0f, 3.0f);
    transform.Scale = glm::vec3(2.0f);

    ECS::Systems::Transform::OnUpdate(registry);

    const glm::mat4& world = registry.get<Transform::WorldMatrix>(entity).Matrix;
    EXPECT_FLOAT_EQ(world[3][0], 1.0f);
    EXPECT_FLOAT_EQ(world[3][1], 2.0f);
    EXPECT_FLOAT_EQ(world[3][2], 3.0f);
    EXPECT_FLOAT_EQ(world[0][0], 2.0f);

    EXPECT_FALSE(registry.all_of<Transform::IsDirtyTag>(entity));
    EXPECT_TRUE(registry.all_of<Transform::WorldUpdatedTag>(entity));
}

TEST(RuntimeECS, CleanEntitiesAreLeftAlone)
{
    ECS::Scene scene;
    entt::entity entity = scene.CreateEntity("Static");
    auto& registry = scene.GetRegistry();
    ECS::Systems::Transform::OnUpdate(registry);

    // Changing the local transform without marking it dirty has no effect.
    registry.get<Transform::Component>(entity).Position = glm::vec3(9.0f);
    ECS::Systems::Transform::OnUpdate(registry);

    EXPECT_FLOAT_EQ(registry.get<Transform::WorldMatrix>(entity).Matrix[3][0], 0.0f);
    EXPECT_FALSE(registry.all_of<Transform::WorldUpdatedTag>(entity));
}
