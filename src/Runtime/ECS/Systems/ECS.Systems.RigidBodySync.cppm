module;
#include <cstdint>
#include <entt/fwd.hpp>

export module ECS:Systems.RigidBodySync;

import Physics;

export namespace ECS::Systems::RigidBodySync
{
    // Copies each body's simulated position and re-normalized orientation into the
    // entity's Transform and marks it dirty. Runs once per tick, after the physics
    // step and before the transform system. A pose that cannot be read is logged
    // and that entity keeps its previous transform for this tick.
    // Returns the number of transforms written.
    uint32_t OnUpdate(entt::registry& registry, const Physics::PhysicsWorld& world);
}
