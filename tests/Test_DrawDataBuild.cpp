#include <gtest/gtest.h>
#include <algorithm>
#include <cstdint>
#include <memory>
#include <utility>
#include <vector>

#include <entt/entity/registry.hpp>
#include <glm/glm.hpp>
#include <glm/gtc/matrix_transform.hpp>

import Graphics;
import ECS;
import Core;

namespace
{
    class DrawDataBuildTest : public ::testing::Test
    {
    protected:
        DrawDataBuildTest()
        {
            m_Config.MaxDrawData = 4;
            m_Config.MaxIndirectCommands = 4;
            m_Backend = std::make_unique<Graphics::HostArenaBackend>(m_Config);
            m_Arena = std::make_unique<Graphics::ResourceArena>(*m_Backend, m_Config);
        }

        Graphics::MeshHandle MakeMesh(uint32_t primitiveCount, uint32_t meshMaterial)
        {
            Graphics::MeshData mesh;
            mesh.Transform = glm::translate(glm::mat4(1.0f), glm::vec3(0.0f, 1.0f, 0.0f));
            mesh.MaterialId = meshMaterial;
            for (uint32_t i = 0; i < primitiveCount; ++i)
            {
                Graphics::Primitive primitive;
                primitive.IndexOffset = i * 6;
                primitive.IndexCount = 6;
                mesh.Primitives.push_back(primitive);
            }
            return m_Arena->AllocateMesh(std::move(mesh));
        }

        entt::entity Spawn(Graphics::MeshHandle mesh, const glm::vec3& position)
        {
            entt::entity entity = m_Scene.CreateEntity("Drawable");
            auto& registry = m_Scene.GetRegistry();
            registry.get<ECS::Components::Transform::Component>(entity).Position = position;
            registry.emplace<ECS::MeshRenderer::Component>(entity, mesh);
            return entity;
        }

        Graphics::ResourceArenaConfig m_Config;
        std::unique_ptr<Graphics::HostArenaBackend> m_Backend;
        std::unique_ptr<Graphics::ResourceArena> m_Arena;
        ECS::Scene m_Scene;
    };
}

TEST_F(DrawDataBuildTest, OneDrawPerPrimitiveWithWorldTransform)
{
    const Graphics::MeshHandle mesh = MakeMesh(2, 0);
    Spawn(mesh, glm::vec3(5.0f, 0.0f, 0.0f));

    auto& registry = m_Scene.GetRegistry();
    ECS::Systems::Transform::OnUpdate(registry);

    m_Arena->BeginFrame(0);
    auto pushed = Graphics::Systems::DrawDataBuild::OnUpdate(registry, *m_Arena);
    ASSERT_TRUE(pushed.has_value());
    EXPECT_EQ(*pushed, 2u);

    const auto drawData = m_Arena->GetDrawData();
    const auto commands = m_Arena->GetDrawCommands();
    ASSERT_EQ(drawData.size(), 2u);
    ASSERT_EQ(commands.size(), 2u);

    // Entity translation (5,0,0) composed with the mesh's (0,1,0).
    const glm::vec4 origin = drawData[0].Transform * glm::vec4(0, 0, 0, 1);
    EXPECT_FLOAT_EQ(origin.x, 5.0f);
    EXPECT_FLOAT_EQ(origin.y, 1.0f);
    EXPECT_EQ(commands[1].firstIndex, 6u);
    EXPECT_EQ(commands[1].firstInstance, 1u);
}

TEST_F(DrawDataBuildTest, MaterialResolutionOrder)
{
    auto& registry = m_Scene.GetRegistry();

    // Primitive-level material beats the override, which beats the mesh.
    Graphics::MeshData mesh;
    mesh.MaterialId = 1;
    Graphics::Primitive inherits;
    Graphics::Primitive explicitMaterial;
    explicitMaterial.MaterialId = 3;
    mesh.Primitives = {inherits, explicitMaterial};
    const Graphics::MeshHandle handle = m_Arena->AllocateMesh(mesh);

    entt::entity plain = Spawn(handle, glm::vec3(0.0f));
    entt::entity overridden = Spawn(handle, glm::vec3(0.0f));
    registry.get<ECS::MeshRenderer::Component>(overridden).MaterialOverride = 2;

    ECS::Systems::Transform::OnUpdate(registry);
    m_Arena->BeginFrame(0);
    ASSERT_TRUE(Graphics::Systems::DrawDataBuild::OnUpdate(registry, *m_Arena).has_value());

    std::vector<uint32_t> materials;
    for (const Graphics::DrawData& drawData : m_Arena->GetDrawData())
        materials.push_back(drawData.MaterialId);
    std::sort(materials.begin(), materials.end());

    (void)plain;
    EXPECT_EQ(materials, (std::vector<uint32_t>{1, 2, 3, 3}));
}

TEST_F(DrawDataBuildTest, BoundingSphereIsInWorldSpace)
{
    Graphics::MeshData meshData;
    meshData.Transform = glm::translate(glm::mat4(1.0f), glm::vec3(0.0f, 1.0f, 0.0f));
    Graphics::Primitive primitive;
    primitive.IndexCount = 6;
    primitive.BoundingSphere = glm::vec4(1.0f, 0.0f, 0.0f, 0.5f);
    meshData.Primitives.push_back(primitive);
    const Graphics::MeshHandle mesh = m_Arena->AllocateMesh(std::move(meshData));

    const entt::entity entity = Spawn(mesh, glm::vec3(5.0f, 0.0f, 0.0f));
    auto& registry = m_Scene.GetRegistry();
    registry.get<ECS::Components::Transform::Component>(entity).Scale = glm::vec3(1.0f, 3.0f, 2.0f);
    ECS::Systems::Transform::OnUpdate(registry);

    m_Arena->BeginFrame(0);
    ASSERT_TRUE(Graphics::Systems::DrawDataBuild::OnUpdate(registry, *m_Arena).has_value());

    const auto drawData = m_Arena->GetDrawData();
    ASSERT_EQ(drawData.size(), 1u);
    const glm::vec4 sphere = drawData[0].BoundingSphere;
    // Center (1,0,0) shifted by the mesh (0,1,0), scaled by (1,3,2), moved by (5,0,0).
    EXPECT_FLOAT_EQ(sphere.x, 6.0f);
    EXPECT_FLOAT_EQ(sphere.y, 3.0f);
    EXPECT_FLOAT_EQ(sphere.z, 0.0f);
    EXPECT_FLOAT_EQ(sphere.w, 1.5f);
}

TEST_F(DrawDataBuildTest, ReleasedMeshIsSkipped)
{
    const Graphics::MeshHandle mesh = MakeMesh(1, 0);
    Spawn(mesh, glm::vec3(0.0f));
    m_Arena->FreeMesh(mesh);

    auto& registry = m_Scene.GetRegistry();
    ECS::Systems::Transform::OnUpdate(registry);
    m_Arena->BeginFrame(0);

    auto pushed = Graphics::Systems::DrawDataBuild::OnUpdate(registry, *m_Arena);
    ASSERT_TRUE(pushed.has_value());
    EXPECT_EQ(*pushed, 0u);
}

TEST_F(DrawDataBuildTest, OverflowIsReportedAsArenaFull)
{
    const Graphics::MeshHandle mesh = MakeMesh(3, 0);
    Spawn(mesh, glm::vec3(0.0f));
    Spawn(mesh, glm::vec3(1.0f));

    auto& registry = m_Scene.GetRegistry();
    ECS::Systems::Transform::OnUpdate(registry);
    m_Arena->BeginFrame(0);

    auto pushed = Graphics::Systems::DrawDataBuild::OnUpdate(registry, *m_Arena);
    ASSERT_FALSE(pushed.has_value());
    EXPECT_EQ(pushed.error(), Core::ErrorCode::ArenaFull);
    EXPECT_EQ(m_Arena->GetDrawData().size(), m_Arena->GetDrawCommands().size());
}
