module;
#include <algorithm>
#include <cstdint>
#include <expected>
#include <memory>
#include <mutex>
#include <variant>

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

// Jolt.h must come first.
#include <Jolt/Jolt.h>
#include <Jolt/RegisterTypes.h>
#include <Jolt/Core/Factory.h>
#include <Jolt/Core/TempAllocator.h>
#include <Jolt/Core/JobSystemThreadPool.h>
#include <Jolt/Physics/PhysicsSettings.h>
#include <Jolt/Physics/PhysicsSystem.h>
#include <Jolt/Physics/Body/BodyCreationSettings.h>
#include <Jolt/Physics/Collision/Shape/BoxShape.h>
#include <Jolt/Physics/Collision/Shape/SphereShape.h>

module Physics;

import Core;

namespace Physics
{
    namespace
    {
        namespace Layers
        {
            constexpr JPH::ObjectLayer NON_MOVING = 0;
            constexpr JPH::ObjectLayer MOVING = 1;
            constexpr JPH::ObjectLayer NUM_LAYERS = 2;
        }

        namespace BroadPhaseLayers
        {
            constexpr JPH::BroadPhaseLayer NON_MOVING(0);
            constexpr JPH::BroadPhaseLayer MOVING(1);
            constexpr JPH::uint NUM_LAYERS(2);
        }

        class BroadPhaseLayerMapping final : public JPH::BroadPhaseLayerInterface
        {
        public:
            JPH::uint GetNumBroadPhaseLayers() const override { return BroadPhaseLayers::NUM_LAYERS; }

            JPH::BroadPhaseLayer GetBroadPhaseLayer(JPH::ObjectLayer layer) const override
            {
                return layer == Layers::NON_MOVING ? BroadPhaseLayers::NON_MOVING : BroadPhaseLayers::MOVING;
            }

#if defined(JPH_EXTERNAL_PROFILE) || defined(JPH_PROFILE_ENABLED)
            const char* GetBroadPhaseLayerName(JPH::BroadPhaseLayer layer) const override
            {
                return layer == BroadPhaseLayers::NON_MOVING ? "NON_MOVING" : "MOVING";
            }
#endif
        };

        class ObjectVsBroadPhaseFilter final : public JPH::ObjectVsBroadPhaseLayerFilter
        {
        public:
            bool ShouldCollide(JPH::ObjectLayer layer, JPH::BroadPhaseLayer broadPhase) const override
            {
                // Static bodies never test against other static bodies.
                if (layer == Layers::NON_MOVING) return broadPhase == BroadPhaseLayers::MOVING;
                return true;
            }
        };

        class ObjectPairFilter final : public JPH::ObjectLayerPairFilter
        {
        public:
            bool ShouldCollide(JPH::ObjectLayer a, JPH::ObjectLayer b) const override
            {
                return a == Layers::MOVING || b == Layers::MOVING;
            }
        };

        // Jolt's allocator hooks and type factory are process-wide.
        std::mutex s_RuntimeMutex;
        uint32_t s_RuntimeUsers = 0;

        void AcquireJoltRuntime()
        {
            std::lock_guard lock(s_RuntimeMutex);
            if (s_RuntimeUsers++ == 0)
            {
                JPH::RegisterDefaultAllocator();
                JPH::Factory::sInstance = new JPH::Factory();
                JPH::RegisterTypes();
            }
        }

        void ReleaseJoltRuntime()
        {
            std::lock_guard lock(s_RuntimeMutex);
            if (--s_RuntimeUsers == 0)
            {
                JPH::UnregisterTypes();
                delete JPH::Factory::sInstance;
                JPH::Factory::sInstance = nullptr;
            }
        }

        JPH::Vec3 ToJolt(const glm::vec3& v) { return JPH::Vec3(v.x, v.y, v.z); }
        JPH::Quat ToJolt(const glm::quat& q) { return JPH::Quat(q.x, q.y, q.z, q.w); }
        glm::vec3 ToGlm(const JPH::Vec3& v) { return {v.GetX(), v.GetY(), v.GetZ()}; }
        glm::quat ToGlm(const JPH::Quat& q) { return {q.GetW(), q.GetX(), q.GetY(), q.GetZ()}; }

        JPH::BodyID ToBodyId(BodyHandle handle) { return JPH::BodyID(handle.Value); }

        JPH::EMotionType ToJolt(MotionType motion)
        {
            switch (motion)
            {
                case MotionType::Static: return JPH::EMotionType::Static;
                case MotionType::Kinematic: return JPH::EMotionType::Kinematic;
                case MotionType::Dynamic: return JPH::EMotionType::Dynamic;
            }
            return JPH::EMotionType::Static;
        }
    }

    struct PhysicsWorld::Impl
    {
        explicit Impl(const WorldConfig& config)
            : TempAllocator(static_cast<JPH::uint>(config.TempAllocatorBytes)),
              JobSystem(JPH::cMaxPhysicsJobs, JPH::cMaxPhysicsBarriers, static_cast<int>(config.WorkerThreads)),
              CollisionSteps(static_cast<int>(std::max(config.CollisionSteps, 1u)))
        {
            System.Init(config.MaxBodies, 0, config.MaxBodyPairs, config.MaxContactConstraints,
                        BroadPhaseMapping, ObjectVsBroadPhase, ObjectPairs);
            System.SetGravity(ToJolt(config.Gravity));
        }

        BroadPhaseLayerMapping BroadPhaseMapping;
        ObjectVsBroadPhaseFilter ObjectVsBroadPhase;
        ObjectPairFilter ObjectPairs;
        JPH::TempAllocatorImpl TempAllocator;
        JPH::JobSystemThreadPool JobSystem;
        JPH::PhysicsSystem System;
        int CollisionSteps;
        uint32_t BodyCount = 0;
    };

    PhysicsWorld::PhysicsWorld(const WorldConfig& config)
    {
        AcquireJoltRuntime();
        m_Impl = std::make_unique<Impl>(config);
        Core::Log::Info("Physics world initialized (max bodies {}, {} worker threads).",
                        config.MaxBodies, config.WorkerThreads);
    }

    PhysicsWorld::~PhysicsWorld()
    {
        if (m_Impl)
        {
            JPH::BodyInterface& bodies = m_Impl->System.GetBodyInterface();
            JPH::BodyIDVector ids;
            m_Impl->System.GetBodies(ids);
            for (const JPH::BodyID& id : ids)
            {
                bodies.RemoveBody(id);
                bodies.DestroyBody(id);
            }
            m_Impl.reset();
        }
        ReleaseJoltRuntime();
    }

    Core::Expected<BodyHandle> PhysicsWorld::CreateBody(const BodyDesc& desc)
    {
        JPH::ShapeRefC shape;
        if (const auto* box = std::get_if<BoxShape>(&desc.Collider))
            shape = new JPH::BoxShape(ToJolt(box->HalfExtents));
        else if (const auto* sphere = std::get_if<SphereShape>(&desc.Collider))
            shape = new JPH::SphereShape(sphere->Radius);

        const JPH::ObjectLayer layer = desc.Motion == MotionType::Static ? Layers::NON_MOVING : Layers::MOVING;

        JPH::BodyCreationSettings settings(shape, JPH::RVec3(ToJolt(desc.Position)),
                                           ToJolt(glm::normalize(desc.Rotation)), ToJolt(desc.Motion), layer);
        settings.mGravityFactor = desc.GravityEnabled ? 1.0f : 0.0f;

        JPH::BodyInterface& bodies = m_Impl->System.GetBodyInterface();
        const JPH::EActivation activation = desc.Motion == MotionType::Static
            ? JPH::EActivation::DontActivate
            : JPH::EActivation::Activate;

        const JPH::BodyID id = bodies.CreateAndAddBody(settings, activation);
        if (id.IsInvalid())
        {
            Core::Log::Error("PhysicsWorld: body limit reached ({} bodies).", m_Impl->BodyCount);
            return std::unexpected(Core::ErrorCode::OutOfMemory);
        }

        ++m_Impl->BodyCount;
        return BodyHandle{id.GetIndexAndSequenceNumber()};
    }

    void PhysicsWorld::RemoveBody(BodyHandle body)
    {
        JPH::BodyInterface& bodies = m_Impl->System.GetBodyInterface();
        const JPH::BodyID id = ToBodyId(body);
        if (!body.IsValid() || !bodies.IsAdded(id)) return;

        bodies.RemoveBody(id);
        bodies.DestroyBody(id);
        --m_Impl->BodyCount;
    }

    Core::Result PhysicsWorld::Step(float dt)
    {
        if (dt <= 0.0f) return Core::Ok();

        const JPH::EPhysicsUpdateError error =
            m_Impl->System.Update(dt, m_Impl->CollisionSteps, &m_Impl->TempAllocator, &m_Impl->JobSystem);

        if (error != JPH::EPhysicsUpdateError::None)
        {
            Core::Log::Warn("PhysicsWorld::Step: update reported error flags {:#x}", static_cast<uint32_t>(error));
            return Core::Err(Core::ErrorCode::OutOfMemory);
        }
        return Core::Ok();
    }

    Core::Expected<BodyPose> PhysicsWorld::GetBodyPose(BodyHandle body) const
    {
        const JPH::BodyInterface& bodies = m_Impl->System.GetBodyInterface();
        const JPH::BodyID id = ToBodyId(body);
        if (!body.IsValid() || !bodies.IsAdded(id))
            return std::unexpected(Core::ErrorCode::BodyNotFound);

        JPH::RVec3 position;
        JPH::Quat rotation;
        bodies.GetPositionAndRotation(id, position, rotation);

        BodyPose pose;
        pose.Position = ToGlm(JPH::Vec3(position));
        pose.Rotation = ToGlm(rotation);
        return pose;
    }

    Core::Result PhysicsWorld::SetBodyPose(BodyHandle body, const BodyPose& pose)
    {
        JPH::BodyInterface& bodies = m_Impl->System.GetBodyInterface();
        const JPH::BodyID id = ToBodyId(body);
        if (!body.IsValid() || !bodies.IsAdded(id))
            return Core::Err(Core::ErrorCode::BodyNotFound);

        bodies.SetPositionAndRotation(id, JPH::RVec3(ToJolt(pose.Position)), ToJolt(glm::normalize(pose.Rotation)),
                                      JPH::EActivation::Activate);
        return Core::Ok();
    }

    uint32_t PhysicsWorld::GetBodyCount() const
    {
        return m_Impl->BodyCount;
    }
}
