module;
#include <cmath>
#include <cstdint>
#include <expected>
#include <optional>
#include <utility>

#include <glm/glm.hpp>
#include <glm/gtc/quaternion.hpp>

module XR:SimulatedRuntime.Impl;
import :SimulatedRuntime;
import :Types;
import Graphics;
import Core;

namespace XR
{
    SimulatedRuntime::SimulatedRuntime(const SimulatedRuntimeConfig& config)
        : m_Config(config),
          m_Views(MakeStereoViews(config.InterpupillaryDistance, config.EyeHeight))
    {
        if (m_Config.StartReady)
        {
            QueueState(SessionState::Idle);
            QueueState(SessionState::Ready);
        }
    }

    ViewSet SimulatedRuntime::MakeStereoViews(float interpupillaryDistance, float eyeHeight)
    {
        // Slightly asymmetric frusta, wider towards the temple, like a typical HMD.
        constexpr float inner = 0.785f;
        constexpr float outer = 0.872f;
        constexpr float vertical = 0.820f;

        ViewSet views{};
        const float half = interpupillaryDistance * 0.5f;

        views[0].Pose.Position = glm::vec3(-half, eyeHeight, 0.0f);
        views[0].Fov = Graphics::Fov{-outer, inner, vertical, -vertical};

        views[1].Pose.Position = glm::vec3(half, eyeHeight, 0.0f);
        views[1].Fov = Graphics::Fov{-inner, outer, vertical, -vertical};
        return views;
    }

    Core::Expected<std::optional<SessionEvent>> SimulatedRuntime::PollEvent()
    {
        if (m_PollFailure)
        {
            const Core::ErrorCode code = *m_PollFailure;
            m_PollFailure.reset();
            if (code == Core::ErrorCode::RuntimeTeardown) m_Lost = true;
            return std::unexpected(code);
        }
        if (m_Lost) return std::unexpected(Core::ErrorCode::RuntimeTeardown);

        if (m_Events.empty()) return std::optional<SessionEvent>{};

        SessionEvent event = m_Events.front();
        m_Events.pop_front();
        return std::optional<SessionEvent>{event};
    }

    Core::Result SimulatedRuntime::BeginSession()
    {
        if (m_Lost) return Core::Err(Core::ErrorCode::RuntimeTeardown);
        if (m_SessionRunning) return Core::Err(Core::ErrorCode::InvalidState);

        m_SessionRunning = true;
        ++m_BeginSessionCount;

        if (m_Config.AutoAdvance)
        {
            QueueState(SessionState::Synchronized);
            QueueState(SessionState::Visible);
            QueueState(SessionState::Focused);
        }
        return Core::Ok();
    }

    Core::Result SimulatedRuntime::EndSession()
    {
        if (m_Lost) return Core::Err(Core::ErrorCode::RuntimeTeardown);
        if (!m_SessionRunning) return Core::Err(Core::ErrorCode::SessionNotRunning);

        m_SessionRunning = false;
        m_FramePhase = FramePhase::None;
        ++m_EndSessionCount;

        if (m_Config.AutoAdvance)
        {
            QueueState(SessionState::Idle);
            QueueState(SessionState::Exiting);
        }
        return Core::Ok();
    }

    Core::Result SimulatedRuntime::SyncActions()
    {
        if (m_Lost) return Core::Err(Core::ErrorCode::RuntimeTeardown);
        if (!m_SessionRunning) return Core::Err(Core::ErrorCode::SessionNotRunning);
        ++m_SyncCount;
        return Core::Ok();
    }

    Core::Expected<FrameState> SimulatedRuntime::WaitFrame()
    {
        if (m_Lost) return std::unexpected(Core::ErrorCode::RuntimeTeardown);
        if (!m_SessionRunning) return std::unexpected(Core::ErrorCode::SessionNotRunning);
        if (m_FramePhase == FramePhase::Waited) return std::unexpected(Core::ErrorCode::FrameOutOfOrder);

        if (!m_ShouldRender.empty())
        {
            m_LastShouldRender = m_ShouldRender.front();
            m_ShouldRender.pop_front();
        }

        m_DisplayTime += m_Config.DisplayPeriod;
        m_FramePhase = FramePhase::Waited;

        FrameState state;
        state.PredictedDisplayTime = m_DisplayTime;
        state.PredictedDisplayPeriod = m_Config.DisplayPeriod;
        state.ShouldRender = m_LastShouldRender;
        return state;
    }

    Core::Result SimulatedRuntime::BeginFrame()
    {
        if (m_Lost) return Core::Err(Core::ErrorCode::RuntimeTeardown);
        if (m_FramePhase != FramePhase::Waited) return Core::Err(Core::ErrorCode::FrameOutOfOrder);
        m_FramePhase = FramePhase::Begun;
        return Core::Ok();
    }

    Core::Expected<ViewSet> SimulatedRuntime::LocateViews(Time displayTime)
    {
        (void)displayTime;
        if (m_Lost) return std::unexpected(Core::ErrorCode::RuntimeTeardown);
        if (!m_SessionRunning) return std::unexpected(Core::ErrorCode::SessionNotRunning);
        return m_Views;
    }

    Core::Result SimulatedRuntime::EndFrame(Time displayTime, bool layersSubmitted)
    {
        if (m_Lost) return Core::Err(Core::ErrorCode::RuntimeTeardown);
        if (m_FramePhase != FramePhase::Begun) return Core::Err(Core::ErrorCode::FrameOutOfOrder);
        if (displayTime != m_DisplayTime) return Core::Err(Core::ErrorCode::InvalidArgument);

        m_FramePhase = FramePhase::None;
        ++m_FramesEnded;
        if (layersSubmitted) ++m_FramesWithLayers;

        if (m_ExitCountdown)
        {
            if (*m_ExitCountdown > 0) --*m_ExitCountdown;
            if (*m_ExitCountdown == 0)
            {
                m_ExitCountdown.reset();
                QueueState(SessionState::Stopping);
            }
        }
        return Core::Ok();
    }

    Core::Result SimulatedRuntime::ApplyHaptics(Handedness side, float amplitude)
    {
        if (m_Lost) return Core::Err(Core::ErrorCode::RuntimeTeardown);
        if (!std::isfinite(amplitude) || amplitude < 0.0f || amplitude > 1.0f)
            return Core::Err(Core::ErrorCode::InvalidArgument);

        m_LastHaptics[static_cast<uint32_t>(side)] = amplitude;
        ++m_HapticsApplyCount;
        return Core::Ok();
    }

    void SimulatedRuntime::QueueEvent(const SessionEvent& event)
    {
        m_Events.push_back(event);
    }

    void SimulatedRuntime::QueueState(SessionState state)
    {
        SessionEvent event;
        event.Type = SessionEvent::Kind::StateChanged;
        event.State = state;
        m_Events.push_back(event);
    }

    void SimulatedRuntime::FailNextPoll(Core::ErrorCode code)
    {
        m_PollFailure = code;
    }

    void SimulatedRuntime::QueueShouldRender(bool shouldRender)
    {
        m_ShouldRender.push_back(shouldRender);
    }

    void SimulatedRuntime::RequestExitAfterFrames(uint32_t frames)
    {
        if (frames == 0)
        {
            QueueState(SessionState::Stopping);
            return;
        }
        m_ExitCountdown = frames;
    }
}
