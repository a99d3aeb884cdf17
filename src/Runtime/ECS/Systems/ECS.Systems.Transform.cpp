module;
#include <vector>
#include <entt/entity/registry.hpp>
#include <glm/glm.hpp>

module ECS:Systems.Transform.Impl;
import :Systems.Transform;
import :Components.Transform;

namespace ECS::Systems::Transform
{
    void OnUpdate(entt::registry& registry)
    {
        using namespace Components::Transform;

        registry.clear<WorldUpdatedTag>();

        auto view = registry.view<Component, IsDirtyTag>();

        // Collect first: tag storage must not change while iterating it.
        std::vector<entt::entity> updated;
        updated.reserve(view.size_hint());

        for (auto [entity, transform] : view.each())
        {
            registry.get_or_emplace<WorldMatrix>(entity).Matrix = GetMatrix(transform);
            updated.push_back(entity);
        }

        for (entt::entity entity : updated)
        {
            registry.remove<IsDirtyTag>(entity);
            registry.emplace_or_replace<WorldUpdatedTag>(entity);
        }
    }
}
