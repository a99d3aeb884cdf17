module;
#include <algorithm>
#include <array>
#include <cmath>
#include <optional>
#include <span>

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

module Graphics:Light.Impl;
import :GpuTypes;
import :Light;

namespace Graphics
{
    Light Light::None()
    {
        return Light{};
    }

    Light Light::Directional(const glm::vec3& direction, float intensity, const glm::vec3& color)
    {
        Light light{};
        light.Direction = direction;
        light.Color = color;
        light.Intensity = intensity;
        light.Type = LightType::Directional;
        return light;
    }

    Light Light::Point(const glm::vec3& position, float range, float intensity, const glm::vec3& color)
    {
        Light light{};
        light.Position = position;
        light.Range = range;
        light.Color = color;
        light.Intensity = intensity;
        light.Type = LightType::Point;
        return light;
    }

    Light Light::Spot(const glm::vec3& direction, float range, float intensity, const glm::vec3& color,
                      const glm::vec3& position, float innerConeAngle, float outerConeAngle)
    {
        Light light{};
        light.Direction = direction;
        light.Range = range;
        light.Color = color;
        light.Intensity = intensity;
        light.Position = position;
        light.InnerConeCos = std::cos(innerConeAngle);
        light.OuterConeCos = std::cos(outerConeAngle);
        light.Type = LightType::Spot;
        return light;
    }

    Light LightFromPunctual(const PunctualLight& authored, const NodePose& node)
    {
        const float range = authored.Range.value_or(-1.0f);
        const glm::vec3 direction = node.Rotation * glm::vec3(0.0f, 0.0f, -1.0f);

        switch (authored.Kind)
        {
            case PunctualLight::Type::Directional:
                return Light::Directional(direction, authored.Intensity, authored.Color);
            case PunctualLight::Type::Point:
                return Light::Point(node.Translation, range, authored.Intensity, authored.Color);
            case PunctualLight::Type::Spot:
                return Light::Spot(direction, range, authored.Intensity, authored.Color, node.Translation,
                                   authored.InnerConeAngle, authored.OuterConeAngle);
        }
        return Light::None();
    }

    std::array<Light, MAX_LIGHTS> PackLights(std::span<const Light> lights)
    {
        std::array<Light, MAX_LIGHTS> packed{Light::None(), Light::None(), Light::None(), Light::None()};
        const size_t count = std::min<size_t>(lights.size(), MAX_LIGHTS);
        for (size_t i = 0; i < count; ++i)
        {
            packed[i] = lights[i];
        }
        return packed;
    }
}
