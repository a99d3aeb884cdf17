#include <gtest/gtest.h>
#include <numbers>

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

import Graphics;

namespace
{
    glm::vec3 ToNdc(const glm::mat4& m, const glm::vec3& p)
    {
        const glm::vec4 clip = m * glm::vec4(p, 1.0f);
        return glm::vec3(clip) / clip.w;
    }

    constexpr float kQuarterPi = std::numbers::pi_v<float> / 4.0f;
}

TEST(GraphicsProjection, DepthMapsNearToZeroFarToOne)
{
    const Graphics::Fov fov{-kQuarterPi, kQuarterPi, kQuarterPi, -kQuarterPi};
    const glm::mat4 projection = Graphics::ProjectionFromFov(fov, 0.1f, 100.0f);

    EXPECT_NEAR(ToNdc(projection, glm::vec3(0, 0, -0.1f)).z, 0.0f, 1e-5f);
    EXPECT_NEAR(ToNdc(projection, glm::vec3(0, 0, -100.0f)).z, 1.0f, 1e-4f);
}

TEST(GraphicsProjection, UpIsNegativeYInVulkanClipSpace)
{
    const Graphics::Fov fov{-kQuarterPi, kQuarterPi, kQuarterPi, -kQuarterPi};
    const glm::mat4 projection = Graphics::ProjectionFromFov(fov, 0.1f, 100.0f);

    // On the upper and right frustum edges at distance 1.
    const glm::vec3 top = ToNdc(projection, glm::vec3(0.0f, 1.0f, -1.0f));
    const glm::vec3 right = ToNdc(projection, glm::vec3(1.0f, 0.0f, -1.0f));
    EXPECT_NEAR(top.y, -1.0f, 1e-5f);
    EXPECT_NEAR(right.x, 1.0f, 1e-5f);
}

TEST(GraphicsProjection, AsymmetricFovShiftsCenter)
{
    const Graphics::Fov fov{-0.872f, 0.785f, 0.82f, -0.82f};
    const glm::mat4 projection = Graphics::ProjectionFromFov(fov, 0.05f, 100.0f);

    // The wider left side pulls the view axis right of the NDC center.
    EXPECT_GT(ToNdc(projection, glm::vec3(0.0f, 0.0f, -1.0f)).x, 0.0f);
}

TEST(GraphicsProjection, ViewFromPoseInvertsPose)
{
    Graphics::Pose pose;
    pose.Position = glm::vec3(1.0f, 1.6f, 2.0f);
    pose.Orientation = glm::angleAxis(0.5f, glm::vec3(0, 1, 0));

    const glm::mat4 view = Graphics::ViewFromPose(pose);
    const glm::vec4 eye = view * glm::vec4(pose.Position, 1.0f);
    EXPECT_NEAR(glm::length(glm::vec3(eye)), 0.0f, 1e-5f);

    // A point in front of the eye lands on the view -Z axis.
    const glm::vec3 ahead = pose.Position + pose.Orientation * glm::vec3(0, 0, -3.0f);
    const glm::vec4 local = view * glm::vec4(ahead, 1.0f);
    EXPECT_NEAR(local.x, 0.0f, 1e-5f);
    EXPECT_NEAR(local.y, 0.0f, 1e-5f);
    EXPECT_NEAR(local.z, -3.0f, 1e-5f);
}
