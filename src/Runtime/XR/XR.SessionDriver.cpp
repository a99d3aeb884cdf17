module;
#include <cstdint>
#include <expected>
#include <optional>

module XR:SessionDriver.Impl;
import :SessionDriver;
import :Types;
import :Runtime;
import Core;

namespace XR
{
    SessionDriver::SessionDriver(IXrRuntime& runtime, Core::QuitSignal& quit, const SessionDriverConfig& config)
        : m_Runtime(runtime), m_Quit(quit), m_Config(config)
    {
    }

    Core::Expected<SessionTransition> SessionDriver::Poll()
    {
        SessionTransition transition;
        transition.Previous = m_State;

        // Drain until the queue is empty or one state change has been applied.
        while (true)
        {
            auto polled = m_Runtime.PollEvent();
            if (!polled)
            {
                if (polled.error() == Core::ErrorCode::RuntimeTeardown)
                    Core::Log::Warn("XR runtime was torn down (last state {})", ToString(m_State));
                else
                    Core::Log::Error("Polling XR events failed: {}", Core::ErrorCodeToString(polled.error()));
                return std::unexpected(polled.error());
            }

            const std::optional<SessionEvent>& event = *polled;
            if (!event) break;

            if (event->Type == SessionEvent::Kind::EventsLost)
            {
                m_LostEvents += event->LostCount;
                Core::Log::Warn("XR runtime dropped {} events", event->LostCount);
                continue;
            }
            if (event->Type != SessionEvent::Kind::StateChanged) continue;

            m_State = event->State;
            Core::Log::Info("XR session state {} -> {}", ToString(transition.Previous), ToString(m_State));
            break;
        }

        transition.Current = m_State;
        transition.Action = ClassifyTransition(transition.Previous, transition.Current);

        if (auto result = Execute(transition.Action); !result)
            return std::unexpected(result.error());

        if (m_Quit.IsRequested())
        {
            if (transition.Action != SessionAction::Shutdown)
                Core::Log::Info("Quit requested, shutting down from state {}", ToString(m_State));
            transition.Action = SessionAction::Shutdown;
        }

        return transition;
    }

    Core::Result SessionDriver::Execute(SessionAction action)
    {
        switch (action)
        {
            case SessionAction::YieldIdle:
                m_Quit.WaitFor(m_Config.IdleSleep);
                return Core::Ok();

            case SessionAction::BeginSession:
                // A runtime that stays Ready without new events must not get a second begin.
                if (m_SessionRunning) return Core::Ok();
                if (auto result = m_Runtime.BeginSession(); !result)
                {
                    Core::Log::Error("Beginning the XR session failed: {}", Core::ErrorCodeToString(result.error()));
                    return result;
                }
                m_SessionRunning = true;
                return Core::Ok();

            case SessionAction::EndSession:
                if (!m_SessionRunning) return Core::Ok();
                if (auto result = m_Runtime.EndSession(); !result)
                {
                    Core::Log::Error("Ending the XR session failed: {}", Core::ErrorCodeToString(result.error()));
                    return result;
                }
                m_SessionRunning = false;
                return Core::Ok();

            case SessionAction::Shutdown:
                Core::Log::Info("XR session is exiting");
                return Core::Ok();

            case SessionAction::None:
                return Core::Ok();
        }
        return Core::Ok();
    }
}
