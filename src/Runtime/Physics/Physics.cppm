module;
#include <cstddef>
#include <cstdint>
#include <memory>
#include <variant>

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

export module Physics;

import Core;

export namespace Physics
{
    struct WorldConfig
    {
        uint32_t MaxBodies = 1024;
        uint32_t MaxBodyPairs = 1024;
        uint32_t MaxContactConstraints = 1024;
        uint32_t WorkerThreads = 1;
        uint32_t CollisionSteps = 1;
        size_t TempAllocatorBytes = 10 * 1024 * 1024;
        glm::vec3 Gravity{0.0f, -9.81f, 0.0f};
    };

    enum class MotionType : uint8_t
    {
        Static,
        Kinematic,
        Dynamic
    };

    struct BoxShape
    {
        glm::vec3 HalfExtents{0.5f};
    };

    struct SphereShape
    {
        float Radius = 0.5f;
    };

    using Shape = std::variant<BoxShape, SphereShape>;

    struct BodyDesc
    {
        Shape Collider = BoxShape{};
        glm::vec3 Position{0.0f};
        glm::quat Rotation{1.0f, 0.0f, 0.0f, 0.0f};
        MotionType Motion = MotionType::Dynamic;
        bool GravityEnabled = true;
    };

    // Opaque body id (index + sequence number packed by the simulation).
    struct BodyHandle
    {
        static constexpr uint32_t INVALID = 0xFFFFFFFFu;
        uint32_t Value = INVALID;

        [[nodiscard]] bool IsValid() const { return Value != INVALID; }
        auto operator<=>(const BodyHandle&) const = default;
    };

    struct BodyPose
    {
        glm::vec3 Position{0.0f};
        glm::quat Rotation{1.0f, 0.0f, 0.0f, 0.0f};
    };

    // -------------------------------------------------------------------------
    // PhysicsWorld - narrow step/pose API over Jolt
    // -------------------------------------------------------------------------
    // Both sides use right-handed, Y-up, metre units; no axis conversion.
    // -------------------------------------------------------------------------
    class PhysicsWorld
    {
    public:
        explicit PhysicsWorld(const WorldConfig& config = {});
        ~PhysicsWorld();

        PhysicsWorld(const PhysicsWorld&) = delete;
        PhysicsWorld& operator=(const PhysicsWorld&) = delete;

        [[nodiscard]] bool IsValid() const { return m_Impl != nullptr; }

        [[nodiscard]] Core::Expected<BodyHandle> CreateBody(const BodyDesc& desc);
        void RemoveBody(BodyHandle body);

        [[nodiscard]] Core::Result Step(float dt);

        [[nodiscard]] Core::Expected<BodyPose> GetBodyPose(BodyHandle body) const;
        [[nodiscard]] Core::Result SetBodyPose(BodyHandle body, const BodyPose& pose);

        [[nodiscard]] uint32_t GetBodyCount() const;

    private:
        struct Impl;
        std::unique_ptr<Impl> m_Impl;
    };
}
