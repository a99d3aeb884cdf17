module;
#include <cstdint>

export module Graphics:Components;

import :GpuTypes;

export namespace ECS::MeshRenderer
{
    struct Component
    {
        Graphics::MeshHandle Mesh;
        // Replaces the mesh-level material when not INHERIT_MATERIAL.
        uint32_t MaterialOverride = Graphics::INHERIT_MATERIAL;
    };
}
