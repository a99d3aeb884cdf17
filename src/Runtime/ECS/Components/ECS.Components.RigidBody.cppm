export module ECS:Components.RigidBody;

import Physics;

export namespace ECS::Components::RigidBody
{
    // Links an entity to a body owned by the physics world. The simulation is
    // authoritative for the pose; RigidBodySync copies it into Transform.
    struct Component
    {
        Physics::BodyHandle Body;
    };
}
