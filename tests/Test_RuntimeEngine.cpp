#include <gtest/gtest.h>
#include <chrono>
#include <cstdint>
#include <memory>
#include <utility>
#include <deque>
#include <vector>

#include <entt/entity/registry.hpp>
#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

import Runtime;
import Graphics;
import Physics;
import ECS;
import XR;
import Core;

using namespace std::chrono_literals;

// ===========================================================================
// Headless engine runs
//
// SimulatedRuntime walks the session through Idle -> Ready -> ... -> Focused,
// then Stopping -> Idle -> Exiting once the requested number of frames has
// been presented. Host memory stands in for the GPU arena.
// ===========================================================================

namespace
{
    class ScriptedPlatform final : public XR::IPlatformEventSource
    {
    public:
        // Events returned by the n-th Poll() call.
        void QueueAt(uint32_t poll, XR::PlatformEvent event)
        {
            if (m_Script.size() <= poll) m_Script.resize(poll + 1);
            m_Script[poll].push_back(event);
        }

        std::vector<XR::PlatformEvent> Poll() override
        {
            std::vector<XR::PlatformEvent> events;
            if (m_Polls < m_Script.size()) events = m_Script[m_Polls];
            ++m_Polls;
            return events;
        }

    private:
        std::vector<std::vector<XR::PlatformEvent>> m_Script;
        uint32_t m_Polls = 0;
    };

    class TestEngine final : public Runtime::Engine
    {
    public:
        using Runtime::Engine::Engine;

        void OnStart() override { ++StartCount; }

        void OnUpdate(float) override
        {
            ++UpdateCount;
            GetHaptics().RequestFeedback(0.6f, XR::Handedness::Left);
        }

        int StartCount = 0;
        int UpdateCount = 0;
    };

    class EngineTest : public ::testing::Test
    {
    protected:
        EngineTest()
        {
            m_Config.AppName = "EngineTest";
            m_Config.IdleSleep = 1ms;
            m_Config.Arena.MaxVertices = 1024;
            m_Config.Arena.MaxIndices = 1024;
            m_Config.Arena.MaxDrawData = 16;
            m_Config.Arena.MaxIndirectCommands = 16;
            m_Config.Arena.MaxMaterials = 16;
            m_Config.Arena.MaxTextures = 16;
        }

        std::unique_ptr<TestEngine> MakeEngine()
        {
            m_Backend = std::make_unique<Graphics::HostArenaBackend>(m_Config.Arena);
            return std::make_unique<TestEngine>(
                m_Config, Runtime::EngineServices{m_Runtime, m_Platform, *m_Backend, m_Renderer, m_Quit});
        }

        static Graphics::MeshHandle AddCube(Runtime::Engine& engine)
        {
            Graphics::MeshData mesh;
            Graphics::Primitive primitive;
            primitive.IndexCount = 36;
            mesh.Primitives.push_back(primitive);
            return engine.GetArena().AllocateMesh(std::move(mesh));
        }

        Runtime::EngineConfig m_Config;
        XR::SimulatedRuntime m_Runtime;
        ScriptedPlatform m_Platform;
        std::unique_ptr<Graphics::HostArenaBackend> m_Backend;
        Graphics::HeadlessFrameRenderer m_Renderer;
        Core::QuitSignal m_Quit;
    };
}

TEST_F(EngineTest, RunsSessionLifecycleToExit)
{
    m_Runtime.RequestExitAfterFrames(5);
    auto engine = MakeEngine();
    ASSERT_TRUE(engine->IsValid());

    // The constructor already observed the first transition.
    ASSERT_TRUE(engine->GetLastTransition().has_value());
    EXPECT_EQ(engine->GetLastTransition()->Current, XR::SessionState::Idle);

    auto result = engine->Run(100);
    ASSERT_TRUE(result.has_value());

    EXPECT_EQ(engine->StartCount, 1);
    EXPECT_EQ(m_Runtime.GetBeginSessionCount(), 1u);
    EXPECT_EQ(m_Runtime.GetEndSessionCount(), 1u);
    EXPECT_EQ(m_Runtime.GetFramesEnded(), 5u);
    EXPECT_EQ(m_Renderer.GetSubmittedFrames(), 5u);
    EXPECT_EQ(engine->UpdateCount, 5);
    EXPECT_EQ(engine->GetSessionDriver().GetState(), XR::SessionState::Exiting);
    EXPECT_EQ(engine->GetLastTransition()->Action, XR::SessionAction::Shutdown);
}

TEST_F(EngineTest, RigidBodyPoseReachesDrawData)
{
    m_Runtime.RequestExitAfterFrames(3);
    auto engine = MakeEngine();
    ASSERT_TRUE(engine->IsValid());

    Physics::BodyDesc desc;
    desc.Position = glm::vec3(1.0f, 2.0f, 3.0f);
    desc.Motion = Physics::MotionType::Kinematic;
    desc.GravityEnabled = false;
    auto body = engine->GetPhysics().CreateBody(desc);
    ASSERT_TRUE(body.has_value());

    auto& scene = engine->GetScene();
    entt::entity entity = scene.CreateEntity("Crate");
    scene.GetRegistry().emplace<ECS::Components::RigidBody::Component>(entity, *body);
    scene.GetRegistry().emplace<ECS::MeshRenderer::Component>(entity, AddCube(*engine));

    ASSERT_TRUE(engine->Run(100).has_value());

    EXPECT_EQ(m_Renderer.GetLastDrawCount(), 1u);
    const auto drawData = engine->GetArena().GetDrawData();
    ASSERT_EQ(drawData.size(), 1u);
    EXPECT_NEAR(drawData[0].Transform[3][0], 1.0f, 1e-5f);
    EXPECT_NEAR(drawData[0].Transform[3][1], 2.0f, 1e-5f);
    EXPECT_NEAR(drawData[0].Transform[3][2], 3.0f, 1e-5f);
}

TEST_F(EngineTest, ArenaOverflowStopsTheLoop)
{
    m_Config.Arena.MaxDrawData = 1;
    m_Config.Arena.MaxIndirectCommands = 1;
    m_Runtime.RequestExitAfterFrames(10);
    auto engine = MakeEngine();
    ASSERT_TRUE(engine->IsValid());

    const Graphics::MeshHandle cube = AddCube(*engine);
    auto& scene = engine->GetScene();
    for (int i = 0; i < 2; ++i)
    {
        entt::entity entity = scene.CreateEntity("Crate");
        scene.GetRegistry().emplace<ECS::MeshRenderer::Component>(entity, cube);
    }

    auto result = engine->Run(100);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), Core::ErrorCode::ArenaFull);

    // The runtime frame was still closed before stopping.
    EXPECT_EQ(m_Runtime.GetFramesEnded(), 1u);
}

TEST_F(EngineTest, HapticsAppliedOncePerFrameThenReset)
{
    m_Runtime.RequestExitAfterFrames(2);
    auto engine = MakeEngine();
    ASSERT_TRUE(engine->Run(100).has_value());

    EXPECT_FLOAT_EQ(m_Runtime.GetLastHaptics(XR::Handedness::Left), 0.6f);
    EXPECT_FLOAT_EQ(m_Runtime.GetLastHaptics(XR::Handedness::Right), 0.0f);
    EXPECT_EQ(m_Runtime.GetHapticsApplyCount(), 4u);
    EXPECT_FLOAT_EQ(engine->GetHaptics().GetAmplitude(XR::Handedness::Left), 0.0f);
}

TEST_F(EngineTest, PlatformDestroyRaisesQuit)
{
    // Poll 0 happens in the constructor; destroy arrives on the third tick.
    m_Platform.QueueAt(3, XR::PlatformEvent::Destroy);
    auto engine = MakeEngine();

    ASSERT_TRUE(engine->Run(100).has_value());
    EXPECT_TRUE(m_Quit.IsRequested());
    EXPECT_EQ(m_Runtime.GetFramesEnded(), 2u);
}

TEST_F(EngineTest, PausedPlatformSkipsFrames)
{
    m_Platform.QueueAt(1, XR::PlatformEvent::Pause);
    m_Platform.QueueAt(4, XR::PlatformEvent::Resume);
    m_Platform.QueueAt(6, XR::PlatformEvent::Destroy);
    auto engine = MakeEngine();

    ASSERT_TRUE(engine->Run(100).has_value());
    EXPECT_TRUE(engine->IsResumed());
    // Ticks 4 and 5 render; tick 6 shuts down.
    EXPECT_EQ(m_Runtime.GetFramesEnded(), 2u);
}

TEST_F(EngineTest, HapticsRequestedWhilePausedAreDropped)
{
    m_Platform.QueueAt(1, XR::PlatformEvent::Pause);
    m_Platform.QueueAt(3, XR::PlatformEvent::Resume);
    auto engine = MakeEngine();
    ASSERT_TRUE(engine->IsValid());

    auto paused = engine->Tick();
    ASSERT_TRUE(paused.has_value());
    EXPECT_EQ(*paused, Runtime::TickStatus::Continue);
    EXPECT_FALSE(engine->IsResumed());

    engine->GetHaptics().RequestFeedback(0.9f, XR::Handedness::Right);
    ASSERT_TRUE(engine->Tick().has_value());
    EXPECT_FLOAT_EQ(engine->GetHaptics().GetAmplitude(XR::Handedness::Right), 0.0f);
    EXPECT_EQ(m_Runtime.GetHapticsApplyCount(), 0u);

    // First rendered tick after resume sends only what OnUpdate asked for.
    ASSERT_TRUE(engine->Tick().has_value());
    EXPECT_TRUE(engine->IsResumed());
    EXPECT_EQ(m_Runtime.GetFramesEnded(), 1u);
    EXPECT_EQ(m_Runtime.GetHapticsApplyCount(), 2u);
    EXPECT_FLOAT_EQ(m_Runtime.GetLastHaptics(XR::Handedness::Right), 0.0f);
    EXPECT_FLOAT_EQ(m_Runtime.GetLastHaptics(XR::Handedness::Left), 0.6f);
}

TEST_F(EngineTest, QuitBeforeRunReturnsImmediately)
{
    m_Quit.Request();
    auto engine = MakeEngine();
    ASSERT_TRUE(engine->IsValid());

    ASSERT_TRUE(engine->Run().has_value());
    EXPECT_EQ(engine->StartCount, 0);
    EXPECT_EQ(m_Runtime.GetFramesEnded(), 0u);
}

TEST_F(EngineTest, RuntimeTeardownIsReported)
{
    auto engine = MakeEngine();
    m_Runtime.FailNextPoll(Core::ErrorCode::RuntimeTeardown);

    auto result = engine->Run(100);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), Core::ErrorCode::RuntimeTeardown);
}

TEST_F(EngineTest, MismatchedFramesInFlightIsInvalid)
{
    m_Config.Arena.FramesInFlight = 3;
    auto engine = MakeEngine();
    EXPECT_FALSE(engine->IsValid());

    auto result = engine->Run();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), Core::ErrorCode::InvalidState);
}
