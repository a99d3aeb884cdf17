module;
#include <entt/fwd.hpp>

export module ECS:Systems.Transform;

export namespace ECS::Systems::Transform
{
    // Recomputes WorldMatrix for every entity tagged IsDirtyTag, then swaps the
    // dirty tag for WorldUpdatedTag.
    void OnUpdate(entt::registry& registry);
}
