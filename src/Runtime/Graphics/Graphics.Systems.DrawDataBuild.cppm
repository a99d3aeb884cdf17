module;
#include <cstdint>
#include <entt/fwd.hpp>

export module Graphics:Systems.DrawDataBuild;

import :ResourceArena;
import Core;

export namespace Graphics::Systems::DrawDataBuild
{
    // Emits one draw data record and one matching indirect command per primitive
    // of every entity with Transform::WorldMatrix and MeshRenderer::Component.
    // Contract:
    //  - Runs after ResourceArena::BeginFrame for the current frame.
    //  - Entities whose mesh handle no longer resolves are logged and skipped.
    //  - ArenaFull is returned as-is; the caller treats it as fatal.
    // Returns the number of draws pushed.
    [[nodiscard]] Core::Expected<uint32_t> OnUpdate(entt::registry& registry, ResourceArena& arena);
}
