module;
#include <cmath>

#include <glm/glm.hpp>
#include <glm/gtc/matrix_transform.hpp>
#include <glm/gtc/quaternion.hpp>

module Graphics:Projection.Impl;
import :Projection;

namespace Graphics
{
    glm::mat4 ProjectionFromFov(const Fov& fov, float nearZ, float farZ)
    {
        const float tanLeft = std::tan(fov.AngleLeft);
        const float tanRight = std::tan(fov.AngleRight);
        const float tanUp = std::tan(fov.AngleUp);
        const float tanDown = std::tan(fov.AngleDown);

        const float tanWidth = tanRight - tanLeft;
        // Vulkan clip space has Y pointing down.
        const float tanHeight = tanDown - tanUp;

        glm::mat4 m(0.0f);
        m[0][0] = 2.0f / tanWidth;
        m[1][1] = 2.0f / tanHeight;
        m[2][0] = (tanRight + tanLeft) / tanWidth;
        m[2][1] = (tanUp + tanDown) / tanHeight;
        m[2][2] = -farZ / (farZ - nearZ);
        m[2][3] = -1.0f;
        m[3][2] = -(farZ * nearZ) / (farZ - nearZ);
        return m;
    }

    glm::mat4 ViewFromPose(const Pose& pose)
    {
        const glm::mat4 world = glm::translate(glm::mat4(1.0f), pose.Position) * glm::mat4_cast(pose.Orientation);
        return glm::inverse(world);
    }
}
