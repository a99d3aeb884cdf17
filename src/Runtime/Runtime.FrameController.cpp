module;
#include <cstdint>
#include <span>

#include <glm/glm.hpp>

module Runtime:FrameController.Impl;
import :FrameController;
import Core;
import Graphics;
import XR;

namespace Runtime
{
    FrameController::FrameController(XR::IXrRuntime& runtime, Graphics::IFrameRenderer& renderer,
                                     Graphics::ResourceArena& arena, const FrameControllerConfig& config)
        : m_Runtime(runtime), m_Renderer(renderer), m_Arena(arena), m_Config(config)
    {
        const uint64_t framesInFlight = m_Arena.GetFramesInFlight();
        if (framesInFlight != m_Config.FramesInFlight)
        {
            Core::Log::Warn("FrameController: configured {} frames in flight, arena has {}. Using the arena's.",
                            m_Config.FramesInFlight, framesInFlight);
            m_Config.FramesInFlight = static_cast<uint32_t>(framesInFlight);
        }

        m_FrameIndexWrap = (m_Config.FrameIndexWrap / framesInFlight) * framesInFlight;
        if (m_FrameIndexWrap == 0) m_FrameIndexWrap = framesInFlight;
    }

    void FrameController::SetSessionStates(XR::SessionState previous, XR::SessionState current)
    {
        m_PreviousState = previous;
        m_CurrentState = current;
    }

    Core::Result FrameController::BeginFrame()
    {
        Core::Profiling::ScopedTimer timer("FrameController::BeginFrame");

        if (m_FrameOpen) return Core::Err(Core::ErrorCode::FrameOutOfOrder);

        // Input sync failing only costs this frame's input.
        if (auto synced = m_Runtime.SyncActions(); !synced)
        {
            if (synced.error() == Core::ErrorCode::RuntimeTeardown) return synced;
            Core::Log::Warn("Syncing XR actions failed: {}", Core::ErrorCodeToString(synced.error()));
        }

        auto frameState = m_Runtime.WaitFrame();
        if (!frameState)
        {
            Core::Log::Error("Waiting for the XR frame failed: {}", Core::ErrorCodeToString(frameState.error()));
            return Core::Err(frameState.error());
        }

        if (auto begun = m_Runtime.BeginFrame(); !begun)
        {
            Core::Log::Error("Beginning the XR frame failed: {}", Core::ErrorCodeToString(begun.error()));
            return begun;
        }

        m_FrameOpen = true;
        m_Phase = SubmissionPhase::Idle;

        m_Context.FrameIndex = m_NextFrameIndex;
        m_Context.FrameSlot = static_cast<uint32_t>(m_NextFrameIndex % m_Config.FramesInFlight);
        m_Context.ShouldRender = frameState->ShouldRender;
        m_Context.PredictedDisplayTime = frameState->PredictedDisplayTime;
        m_Context.PreviousState = m_PreviousState;
        m_Context.CurrentState = m_CurrentState;
        m_NextFrameIndex = (m_NextFrameIndex + 1) % m_FrameIndexWrap;

        // Keep the last known views when tracking drops out for a frame.
        if (auto views = m_Runtime.LocateViews(frameState->PredictedDisplayTime))
            m_Context.Views = *views;
        else
            Core::Log::Warn("Locating XR views failed: {}", Core::ErrorCodeToString(views.error()));

        if (!m_Context.ShouldRender)
        {
            Core::Log::Debug("Frame {} will not be rendered", m_Context.FrameIndex);
            return Core::Ok();
        }

        if (auto gpu = m_Renderer.BeginGpuFrame(m_Context.FrameSlot); !gpu)
        {
            Core::Log::Error("Beginning GPU frame {} failed: {}", m_Context.FrameIndex,
                             Core::ErrorCodeToString(gpu.error()));
            return gpu;
        }

        m_Arena.BeginFrame(m_Context.FrameIndex);
        m_Phase = SubmissionPhase::Active;
        return Core::Ok();
    }

    Core::Result FrameController::EndFrame()
    {
        Core::Profiling::ScopedTimer timer("FrameController::EndFrame");

        if (!m_FrameOpen) return Core::Err(Core::ErrorCode::FrameOutOfOrder);

        Core::Result submitted = Core::Ok();
        const bool active = m_Phase == SubmissionPhase::Active;
        if (active)
        {
            m_Arena.EndFrame();
            submitted = m_Renderer.Submit(m_Context.FrameSlot, m_Arena);
            if (!submitted)
            {
                Core::Log::Error("Submitting frame {} failed: {}", m_Context.FrameIndex,
                                 Core::ErrorCodeToString(submitted.error()));
            }
        }

        m_Phase = SubmissionPhase::Idle;
        m_FrameOpen = false;

        Core::Result ended = m_Runtime.EndFrame(m_Context.PredictedDisplayTime, active && submitted.has_value());
        if (!ended)
        {
            Core::Log::Error("Ending the XR frame failed: {}", Core::ErrorCodeToString(ended.error()));
            return ended;
        }
        return submitted;
    }

    Core::Result FrameController::WriteSceneData(std::span<const Graphics::Light> lights)
    {
        if (m_Phase != SubmissionPhase::Active) return Core::Err(Core::ErrorCode::FrameOutOfOrder);
        return m_Arena.WriteSceneData(BuildSceneData(m_Context.Views, m_Config.NearZ, m_Config.FarZ, lights));
    }

    Graphics::SceneData FrameController::BuildSceneData(const XR::ViewSet& views, float nearZ, float farZ,
                                                        std::span<const Graphics::Light> lights)
    {
        Graphics::SceneData sceneData;
        for (uint32_t eye = 0; eye < XR::VIEW_COUNT; ++eye)
        {
            const XR::View& view = views[eye];
            sceneData.ViewProjection[eye] =
                Graphics::ProjectionFromFov(view.Fov, nearZ, farZ) * Graphics::ViewFromPose(view.Pose);
            sceneData.CameraPosition[eye] = glm::vec4(view.Pose.Position, 1.0f);
        }
        sceneData.Lights = Graphics::PackLights(lights);
        return sceneData;
    }
}
