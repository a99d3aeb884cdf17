module;
#include <array>
#include <cstdint>
#include <numbers>
#include <optional>
#include <span>

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

export module Graphics:Light;

import :GpuTypes;

export namespace Graphics
{
    // Authored light in KHR_lights_punctual terms.
    struct PunctualLight
    {
        enum class Type : uint8_t { Directional, Point, Spot };

        Type Kind = Type::Point;
        glm::vec3 Color{1.0f};
        float Intensity = 1.0f;
        // Unset means infinite.
        std::optional<float> Range;
        float InnerConeAngle = 0.0f;
        float OuterConeAngle = std::numbers::pi_v<float> / 4.0f;
    };

    // Decomposed transform of the node carrying the light. Scale is ignored.
    struct NodePose
    {
        glm::vec3 Translation{0.0f};
        glm::quat Rotation{1.0f, 0.0f, 0.0f, 0.0f};
    };

    // The light points down the node's local -Z axis.
    [[nodiscard]] Light LightFromPunctual(const PunctualLight& authored, const NodePose& node);

    // First MAX_LIGHTS lights, remaining slots filled with Light::None().
    [[nodiscard]] std::array<Light, MAX_LIGHTS> PackLights(std::span<const Light> lights);
}
