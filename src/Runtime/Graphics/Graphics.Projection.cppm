module;
#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

export module Graphics:Projection;

export namespace Graphics
{
    // Asymmetric field of view in radians, as reported per eye by the XR runtime.
    // Left and Down are normally negative.
    struct Fov
    {
        float AngleLeft = 0.0f;
        float AngleRight = 0.0f;
        float AngleUp = 0.0f;
        float AngleDown = 0.0f;
    };

    struct Pose
    {
        glm::vec3 Position{0.0f};
        glm::quat Orientation{1.0f, 0.0f, 0.0f, 0.0f};
    };

    // Right-handed, Vulkan clip space (Y down, depth 0..1).
    [[nodiscard]] glm::mat4 ProjectionFromFov(const Fov& fov, float nearZ, float farZ);

    [[nodiscard]] glm::mat4 ViewFromPose(const Pose& pose);
}
