module;
#include <cstdint>
#include <entt/entity/registry.hpp>
#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

module ECS:Systems.RigidBodySync.Impl;
import :Systems.RigidBodySync;
import :Components.Transform;
import :Components.RigidBody;
import Physics;
import Core;

namespace ECS::Systems::RigidBodySync
{
    uint32_t OnUpdate(entt::registry& registry, const Physics::PhysicsWorld& world)
    {
        auto view = registry.view<Components::RigidBody::Component, Components::Transform::Component>();

        uint32_t written = 0;
        for (auto [entity, body, transform] : view.each())
        {
            auto pose = world.GetBodyPose(body.Body);
            if (!pose)
            {
                Core::Log::Warn("RigidBodySync: entity {} body {} pose unavailable ({})",
                                static_cast<uint32_t>(entity), body.Body.Value,
                                Core::ErrorCodeToString(pose.error()));
                continue;
            }

            transform.Position = pose->Position;
            transform.Rotation = glm::normalize(pose->Rotation);
            registry.emplace_or_replace<Components::Transform::IsDirtyTag>(entity);
            ++written;
        }
        return written;
    }
}
