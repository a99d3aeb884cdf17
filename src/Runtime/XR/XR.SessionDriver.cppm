module;
#include <chrono>
#include <cstdint>

export module XR:SessionDriver;

import :Types;
import :Runtime;
import Core;

export namespace XR
{
    struct SessionDriverConfig
    {
        // Upper bound of one idle sleep. A quit request cuts it short.
        std::chrono::milliseconds IdleSleep{100};
    };

    // Transition table, first match wins:
    //   Stopping -> Idle       None
    //   *        -> Idle       YieldIdle
    //   Idle     -> Ready      BeginSession
    //   *        -> Exiting    Shutdown
    //   *        -> Stopping   EndSession
    //   otherwise              None
    [[nodiscard]] constexpr SessionAction ClassifyTransition(SessionState previous, SessionState current)
    {
        if (previous == SessionState::Stopping && current == SessionState::Idle) return SessionAction::None;
        if (current == SessionState::Idle) return SessionAction::YieldIdle;
        if (previous == SessionState::Idle && current == SessionState::Ready) return SessionAction::BeginSession;
        if (current == SessionState::Exiting) return SessionAction::Shutdown;
        if (current == SessionState::Stopping) return SessionAction::EndSession;
        return SessionAction::None;
    }

    // -------------------------------------------------------------------------
    // SessionDriver
    // -------------------------------------------------------------------------
    // Tracks the runtime's session state. Poll() consumes queued runtime events
    // up to and including the first state change, so consecutive changes are
    // observed one pair per call. The action mapped from (previous, current) is
    // carried out inside Poll():
    //   YieldIdle     bounded sleep on the quit signal,
    //   BeginSession  IXrRuntime::BeginSession,
    //   EndSession    IXrRuntime::EndSession,
    //   Shutdown      reported to the caller.
    // The quit signal is checked on every call regardless of the session state
    // and turns the result into Shutdown.
    // -------------------------------------------------------------------------
    class SessionDriver
    {
    public:
        SessionDriver(IXrRuntime& runtime, Core::QuitSignal& quit, const SessionDriverConfig& config = {});

        // Errors: RuntimeTeardown when the runtime is gone, otherwise the
        // runtime's own error code. Both are fatal to the caller.
        [[nodiscard]] Core::Expected<SessionTransition> Poll();

        [[nodiscard]] SessionState GetState() const { return m_State; }
        [[nodiscard]] bool IsSessionRunning() const { return m_SessionRunning; }
        [[nodiscard]] uint32_t GetLostEventCount() const { return m_LostEvents; }

    private:
        [[nodiscard]] Core::Result Execute(SessionAction action);

        IXrRuntime& m_Runtime;
        Core::QuitSignal& m_Quit;
        SessionDriverConfig m_Config;

        SessionState m_State = SessionState::Unknown;
        bool m_SessionRunning = false;
        uint32_t m_LostEvents = 0;
    };
}
