module;
#include <array>
#include <cstdint>
#include <string_view>

export module XR:Types;

import Graphics;

export namespace XR
{
    enum class SessionState : uint8_t
    {
        Unknown,
        Idle,
        Ready,
        Synchronized,
        Visible,
        Focused,
        Stopping,
        LossPending,
        Exiting
    };

    constexpr std::string_view ToString(SessionState state)
    {
        switch (state)
        {
            case SessionState::Unknown:      return "Unknown";
            case SessionState::Idle:         return "Idle";
            case SessionState::Ready:        return "Ready";
            case SessionState::Synchronized: return "Synchronized";
            case SessionState::Visible:      return "Visible";
            case SessionState::Focused:      return "Focused";
            case SessionState::Stopping:     return "Stopping";
            case SessionState::LossPending:  return "LossPending";
            case SessionState::Exiting:      return "Exiting";
        }
        return "Unknown";
    }

    enum class SessionAction : uint8_t
    {
        None,
        YieldIdle,
        BeginSession,
        EndSession,
        Shutdown
    };

    constexpr std::string_view ToString(SessionAction action)
    {
        switch (action)
        {
            case SessionAction::None:         return "None";
            case SessionAction::YieldIdle:    return "YieldIdle";
            case SessionAction::BeginSession: return "BeginSession";
            case SessionAction::EndSession:   return "EndSession";
            case SessionAction::Shutdown:     return "Shutdown";
        }
        return "None";
    }

    struct SessionTransition
    {
        SessionState Previous = SessionState::Unknown;
        SessionState Current = SessionState::Unknown;
        SessionAction Action = SessionAction::None;
    };

    // One entry of the runtime's event queue.
    struct SessionEvent
    {
        enum class Kind : uint8_t
        {
            StateChanged,
            // Input bindings or interaction profile changed. Consumed without effect.
            InteractionProfileChanged,
            // The runtime dropped events because its queue overflowed.
            EventsLost
        };

        Kind Type = Kind::StateChanged;
        SessionState State = SessionState::Unknown;
        uint32_t LostCount = 0;
    };

    // Nanoseconds on the runtime's clock.
    using Time = int64_t;

    struct FrameState
    {
        Time PredictedDisplayTime = 0;
        Time PredictedDisplayPeriod = 0;
        bool ShouldRender = false;
    };

    struct View
    {
        Graphics::Pose Pose;
        Graphics::Fov Fov;
    };

    constexpr uint32_t VIEW_COUNT = 2;
    using ViewSet = std::array<View, VIEW_COUNT>;

    enum class Handedness : uint8_t
    {
        Left = 0,
        Right = 1
    };

    enum class PlatformEvent : uint8_t
    {
        Resume,
        Pause,
        Destroy
    };
}
