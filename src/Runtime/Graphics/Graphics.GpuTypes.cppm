module;
#include <array>
#include <cstddef>
#include <cstdint>
#include <vector>

#include <glm/glm.hpp>

#include "RHI.Vulkan.hpp"

export module Graphics:GpuTypes;

import Core;

// -----------------------------------------------------------------------------
// Host mirrors of the shader-side structs. Every layout here is consumed
// bit-for-bit by the shading stage (std430 for storage buffers, std140 for the
// scene uniform); the static_asserts below pin the contract.
// -----------------------------------------------------------------------------
export namespace Graphics
{
    // Descriptor set 0 bindings. Reordering breaks shading silently.
    namespace Bindings
    {
        constexpr uint32_t DrawData = 0;
        constexpr uint32_t Materials = 1;
        constexpr uint32_t IndirectCommands = 2;
        constexpr uint32_t Skins = 3;
        constexpr uint32_t SceneData = 4;
        constexpr uint32_t Textures = 5;
    }

    constexpr uint32_t MAX_JOINTS = 64;
    constexpr uint32_t MAX_LIGHTS = 4;

    constexpr uint32_t NO_SKIN = 0xFFFFFFFFu;
    constexpr uint32_t NO_TEXTURE = 0xFFFFFFFFu;
    // Material slot 0 always holds the default material.
    constexpr uint32_t DEFAULT_MATERIAL = 0;
    // Primitive material id meaning "use the mesh-level material".
    constexpr uint32_t INHERIT_MATERIAL = 0xFFFFFFFFu;

    struct alignas(16) DrawData
    {
        glm::mat4 Transform{1.0f};
        glm::mat4 InverseTranspose{1.0f};
        // World space, xyz = center, w = radius
        glm::vec4 BoundingSphere{0.0f};
        uint32_t MaterialId = DEFAULT_MATERIAL;
        uint32_t SkinId = NO_SKIN;
    };

    static_assert(sizeof(DrawData) == 160);
    static_assert(alignof(DrawData) == 16);
    static_assert(offsetof(DrawData, BoundingSphere) == 128);
    static_assert(offsetof(DrawData, MaterialId) == 144);
    static_assert(offsetof(DrawData, SkinId) == 148);

    struct alignas(16) Material
    {
        glm::vec4 BaseColorFactor{1.0f};
        glm::vec4 EmissiveFactor{0.0f};
        uint32_t BaseColorTextureId = NO_TEXTURE;
        uint32_t MetallicRoughnessTextureId = NO_TEXTURE;
        uint32_t NormalTextureId = NO_TEXTURE;
        uint32_t EmissiveTextureId = NO_TEXTURE;
        float MetallicFactor = 0.0f;
        float RoughnessFactor = 1.0f;
        float AlphaCutoff = 0.5f;
        uint32_t Flags = 0;
    };

    static_assert(sizeof(Material) == 64);

    struct Vertex
    {
        glm::vec3 Position{0.0f};
        glm::vec3 Normal{0.0f, 0.0f, 1.0f};
        glm::vec4 Tangent{1.0f, 0.0f, 0.0f, 1.0f};
        glm::vec2 TextureCoords{0.0f};
        // Four joint indices and four unorm weights, one byte each.
        uint32_t Joints = 0;
        uint32_t Weights = 0;
    };

    static_assert(sizeof(Vertex) == 56);

    using DrawIndexedIndirectCommand = VkDrawIndexedIndirectCommand;
    static_assert(sizeof(DrawIndexedIndirectCommand) == 20);

    using SkinMatrices = std::array<glm::mat4, MAX_JOINTS>;
    static_assert(sizeof(SkinMatrices) == MAX_JOINTS * 64);

    enum class LightType : uint32_t
    {
        Directional = 0,
        Point = 1,
        Spot = 2,
        None = 0xFFFFFFFFu
    };

    struct alignas(16) Light
    {
        glm::vec3 Direction{0.0f};
        // -1 means infinite range.
        float Range = 0.0f;
        glm::vec3 Color{0.0f};
        float Intensity = 0.0f;
        glm::vec3 Position{0.0f};
        float InnerConeCos = 0.0f;
        float OuterConeCos = 0.0f;
        LightType Type = LightType::None;

        [[nodiscard]] static Light None();
        [[nodiscard]] static Light Directional(const glm::vec3& direction, float intensity, const glm::vec3& color);
        [[nodiscard]] static Light Point(const glm::vec3& position, float range, float intensity, const glm::vec3& color);
        [[nodiscard]] static Light Spot(const glm::vec3& direction, float range, float intensity, const glm::vec3& color,
                                        const glm::vec3& position, float innerConeAngle, float outerConeAngle);
    };

    static_assert(sizeof(Light) == 64);
    static_assert(offsetof(Light, Range) == 12);
    static_assert(offsetof(Light, Intensity) == 28);
    static_assert(offsetof(Light, InnerConeCos) == 44);
    static_assert(offsetof(Light, OuterConeCos) == 48);
    static_assert(offsetof(Light, Type) == 52);

    struct alignas(16) SceneData
    {
        std::array<glm::mat4, 2> ViewProjection{glm::mat4(1.0f), glm::mat4(1.0f)};
        std::array<glm::vec4, 2> CameraPosition{glm::vec4(0.0f), glm::vec4(0.0f)};
        // x = IBL intensity, y = debug view, zw unused
        glm::vec4 Params{1.0f, 0.0f, 0.0f, 0.0f};
        std::array<Light, MAX_LIGHTS> Lights{Light::None(), Light::None(), Light::None(), Light::None()};
    };

    static_assert(sizeof(SceneData) == 432);
    static_assert(offsetof(SceneData, Lights) == 176);

    // Range of a primitive inside the shared vertex/index buffers.
    struct Primitive
    {
        uint32_t IndexOffset = 0;
        uint32_t IndexCount = 0;
        int32_t VertexOffset = 0;
        uint32_t MaterialId = INHERIT_MATERIAL;
        glm::vec4 BoundingSphere{0.0f};
    };

    // Per-mesh metadata kept in the stable mesh arena. Transform is the mesh's
    // node-local transform; the entity's world matrix is applied on top.
    struct MeshData
    {
        glm::mat4 Transform{1.0f};
        glm::mat4 InverseTranspose{1.0f};
        glm::vec4 BoundingSphere{0.0f};
        uint32_t MaterialId = DEFAULT_MATERIAL;
        uint32_t SkinId = NO_SKIN;
        std::vector<Primitive> Primitives;
    };

    struct MeshTag {};
    using MeshHandle = Core::StrongHandle<MeshTag>;

    using TextureKey = uint64_t;
    using TextureIndex = uint32_t;

    // A device image ready to be sampled. The view is opaque to host-only backends.
    struct TextureBinding
    {
        TextureKey Key = 0;
        VkImageView View = VK_NULL_HANDLE;
        VkFormat Format = VK_FORMAT_R8G8B8A8_SRGB;
        bool IsCubeMap = false;
    };
}
