module;
#include <algorithm>
#include <cstdint>
#include <expected>

#include <entt/entity/registry.hpp>
#include <glm/glm.hpp>

module Graphics:Systems.DrawDataBuild.Impl;

import :Systems.DrawDataBuild;
import :ResourceArena;
import :GpuTypes;
import :Components;
import ECS;
import Core;

namespace Graphics::Systems::DrawDataBuild
{
    namespace
    {
        // Object-space sphere to world space. Non-uniform scale grows the radius
        // by the largest axis so the sphere stays conservative.
        glm::vec4 TransformSphere(const glm::mat4& transform, const glm::vec4& sphere)
        {
            const glm::vec3 center = glm::vec3(transform * glm::vec4(glm::vec3(sphere), 1.0f));
            const float scale = std::max({glm::length(glm::vec3(transform[0])),
                                          glm::length(glm::vec3(transform[1])),
                                          glm::length(glm::vec3(transform[2]))});
            return glm::vec4(center, sphere.w * scale);
        }
    }

    Core::Expected<uint32_t> OnUpdate(entt::registry& registry, ResourceArena& arena)
    {
        auto view = registry.view<ECS::Components::Transform::WorldMatrix, ECS::MeshRenderer::Component>();

        uint32_t pushed = 0;
        for (auto [entity, world, renderer] : view.each())
        {
            const MeshData* mesh = arena.GetMesh(renderer.Mesh);
            if (!mesh)
            {
                Core::Log::Warn("DrawDataBuild: entity {} references a released mesh (index {}, generation {})",
                                static_cast<uint32_t>(entity), renderer.Mesh.Index, renderer.Mesh.Generation);
                continue;
            }

            const glm::mat4 transform = world.Matrix * mesh->Transform;
            const glm::mat4 inverseTranspose = glm::transpose(glm::inverse(transform));
            const uint32_t meshMaterial = renderer.MaterialOverride != INHERIT_MATERIAL
                ? renderer.MaterialOverride
                : mesh->MaterialId;

            for (const Primitive& primitive : mesh->Primitives)
            {
                DrawData drawData{};
                drawData.Transform = transform;
                drawData.InverseTranspose = inverseTranspose;
                drawData.BoundingSphere = TransformSphere(transform, primitive.BoundingSphere);
                drawData.MaterialId = primitive.MaterialId != INHERIT_MATERIAL ? primitive.MaterialId : meshMaterial;
                drawData.SkinId = mesh->SkinId;

                auto index = arena.PushDraw(drawData, primitive);
                if (!index) return std::unexpected(index.error());
                ++pushed;
            }
        }

        return pushed;
    }
}
