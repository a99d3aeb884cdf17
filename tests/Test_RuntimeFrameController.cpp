#include <gtest/gtest.h>
#include <array>
#include <cstring>
#include <memory>

#include <glm/glm.hpp>

import Runtime;
import Graphics;
import XR;
import Core;


namespace
{
    class FrameControllerTest : public ::testing::Test
    {
    protected:
        void SetUp() override
        {
            XR::SimulatedRuntimeConfig runtimeConfig;
            runtimeConfig.AutoAdvance = false;
            runtimeConfig.StartReady = false;
            m_Runtime = std::make_unique<XR::SimulatedRuntime>(runtimeConfig);
            ASSERT_TRUE(m_Runtime->BeginSession().has_value());

            m_Backend = std::make_unique<Graphics::HostArenaBackend>(m_ArenaConfig);
            m_Arena = std::make_unique<Graphics::ResourceArena>(*m_Backend, m_ArenaConfig);
        }

        std::unique_ptr<Runtime::FrameController> MakeController(uint64_t wrap = 1u << 20)
        {
            Runtime::FrameControllerConfig config;
            config.FrameIndexWrap = wrap;
            return std::make_unique<Runtime::FrameController>(*m_Runtime, m_Renderer, *m_Arena, config);
        }

        Graphics::ResourceArenaConfig m_ArenaConfig;
        std::unique_ptr<XR::SimulatedRuntime> m_Runtime;
        std::unique_ptr<Graphics::HostArenaBackend> m_Backend;
        std::unique_ptr<Graphics::ResourceArena> m_Arena;
        Graphics::HeadlessFrameRenderer m_Renderer;
    };
}

TEST_F(FrameControllerTest, RenderedFrameOpensArenaAndSubmits)
{
    auto controller = MakeController();
    controller->SetSessionStates(XR::SessionState::Visible, XR::SessionState::Focused);

    ASSERT_TRUE(controller->BeginFrame().has_value());
    EXPECT_EQ(controller->GetPhase(), Runtime::SubmissionPhase::Active);
    EXPECT_TRUE(m_Arena->IsAcceptingFrameWrites());

    const Runtime::FrameContext& context = controller->GetContext();
    EXPECT_EQ(context.FrameIndex, 0u);
    EXPECT_EQ(context.FrameSlot, 0u);
    EXPECT_TRUE(context.ShouldRender);
    EXPECT_GT(context.PredictedDisplayTime, 0);
    EXPECT_EQ(context.PreviousState, XR::SessionState::Visible);
    EXPECT_EQ(context.CurrentState, XR::SessionState::Focused);

    ASSERT_TRUE(m_Arena->PushDrawData(Graphics::DrawData{}).has_value());

    ASSERT_TRUE(controller->EndFrame().has_value());
    EXPECT_EQ(controller->GetPhase(), Runtime::SubmissionPhase::Idle);
    EXPECT_FALSE(m_Arena->IsAcceptingFrameWrites());
    EXPECT_EQ(m_Renderer.GetSubmittedFrames(), 1u);
    EXPECT_EQ(m_Runtime->GetFramesEnded(), 1u);
    EXPECT_EQ(m_Runtime->GetFramesWithLayers(), 1u);
    EXPECT_EQ(m_Runtime->GetSyncCount(), 1u);
}

TEST_F(FrameControllerTest, SkippedFrameStillCompletesHandshake)
{
    m_Runtime->QueueShouldRender(false);
    auto controller = MakeController();

    ASSERT_TRUE(controller->BeginFrame().has_value());
    EXPECT_EQ(controller->GetPhase(), Runtime::SubmissionPhase::Idle);
    EXPECT_FALSE(controller->GetContext().ShouldRender);
    EXPECT_FALSE(m_Arena->IsAcceptingFrameWrites());

    auto write = controller->WriteSceneData({});
    ASSERT_FALSE(write.has_value());
    EXPECT_EQ(write.error(), Core::ErrorCode::FrameOutOfOrder);

    ASSERT_TRUE(controller->EndFrame().has_value());
    EXPECT_EQ(m_Renderer.GetSubmittedFrames(), 0u);
    EXPECT_EQ(m_Runtime->GetFramesEnded(), 1u);
    EXPECT_EQ(m_Runtime->GetFramesWithLayers(), 0u);
}

TEST_F(FrameControllerTest, OutOfTurnCallsAreRejected)
{
    auto controller = MakeController();

    auto endFirst = controller->EndFrame();
    ASSERT_FALSE(endFirst.has_value());
    EXPECT_EQ(endFirst.error(), Core::ErrorCode::FrameOutOfOrder);

    ASSERT_TRUE(controller->BeginFrame().has_value());
    auto beginTwice = controller->BeginFrame();
    ASSERT_FALSE(beginTwice.has_value());
    EXPECT_EQ(beginTwice.error(), Core::ErrorCode::FrameOutOfOrder);

    ASSERT_TRUE(controller->EndFrame().has_value());
    auto endTwice = controller->EndFrame();
    ASSERT_FALSE(endTwice.has_value());
    EXPECT_EQ(endTwice.error(), Core::ErrorCode::FrameOutOfOrder);
}

TEST_F(FrameControllerTest, FrameSlotsRoundRobinAndIndexWraps)
{
    // 5 is rounded down to 4 so the slot sequence survives the wrap.
    auto controller = MakeController(5);
    EXPECT_EQ(controller->GetFrameIndexWrap(), 4u);

    const std::array<uint64_t, 6> expectedIndex{0, 1, 2, 3, 0, 1};
    for (uint64_t expected : expectedIndex)
    {
        ASSERT_TRUE(controller->BeginFrame().has_value());
        EXPECT_EQ(controller->GetContext().FrameIndex, expected);
        EXPECT_EQ(controller->GetContext().FrameSlot, expected % 2);
        EXPECT_EQ(m_Arena->GetFrameSlot(), expected % 2);
        ASSERT_TRUE(controller->EndFrame().has_value());
    }
}

TEST_F(FrameControllerTest, SceneDataUsesLocatedViews)
{
    XR::ViewSet views = XR::SimulatedRuntime::MakeStereoViews(0.064f, 1.6f);
    m_Runtime->SetViews(views);
    auto controller = MakeController();

    ASSERT_TRUE(controller->BeginFrame().has_value());
    std::array<Graphics::Light, 1> lights{Graphics::Light::Point(glm::vec3(0, 3, 0), 10.0f, 1.0f, glm::vec3(1.0f))};
    ASSERT_TRUE(controller->WriteSceneData(lights).has_value());

    const Graphics::SceneData expected = Runtime::FrameController::BuildSceneData(views, 0.05f, 100.0f, lights);
    EXPECT_FLOAT_EQ(expected.CameraPosition[0].x, -0.032f);
    EXPECT_FLOAT_EQ(expected.CameraPosition[1].x, 0.032f);
    EXPECT_FLOAT_EQ(expected.CameraPosition[0].y, 1.6f);
    EXPECT_EQ(expected.Lights[0].Type, Graphics::LightType::Point);
    EXPECT_EQ(expected.Lights[1].Type, Graphics::LightType::None);

    Graphics::SceneData stored{};
    const auto memory = m_Backend->Map(Graphics::ArenaBufferKind::SceneData, controller->GetContext().FrameSlot);
    std::memcpy(&stored, memory.data(), sizeof(stored));
    EXPECT_EQ(stored.ViewProjection[0], expected.ViewProjection[0]);
    EXPECT_EQ(stored.ViewProjection[1], expected.ViewProjection[1]);
    EXPECT_NE(stored.ViewProjection[0], stored.ViewProjection[1]);

    ASSERT_TRUE(controller->EndFrame().has_value());
}

TEST_F(FrameControllerTest, RuntimeFailureAbortsBeginFrame)
{
    ASSERT_TRUE(m_Runtime->EndSession().has_value());
    auto controller = MakeController();

    auto result = controller->BeginFrame();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error(), Core::ErrorCode::SessionNotRunning);
    EXPECT_FALSE(controller->IsFrameOpen());
}
