module;
#include <cstdint>
#include <optional>
#include <vector>

export module XR:Runtime;

import :Types;
import Core;

export namespace XR
{
    // -------------------------------------------------------------------------
    // IXrRuntime - the device runtime as seen by the engine
    // -------------------------------------------------------------------------
    // Mirrors the OpenXR session and frame calls the engine issues. Calls return
    // ErrorCode::RuntimeTeardown once the instance or session is lost; every
    // other failure is reported as RuntimeCallFailed (or a more specific code).
    // -------------------------------------------------------------------------
    class IXrRuntime
    {
    public:
        virtual ~IXrRuntime() = default;

        // Next queued event, std::nullopt once the queue is drained.
        [[nodiscard]] virtual Core::Expected<std::optional<SessionEvent>> PollEvent() = 0;

        [[nodiscard]] virtual Core::Result BeginSession() = 0;
        [[nodiscard]] virtual Core::Result EndSession() = 0;

        [[nodiscard]] virtual Core::Result SyncActions() = 0;
        // Blocks until the runtime hands out the next frame slot.
        [[nodiscard]] virtual Core::Expected<FrameState> WaitFrame() = 0;
        [[nodiscard]] virtual Core::Result BeginFrame() = 0;
        [[nodiscard]] virtual Core::Expected<ViewSet> LocateViews(Time displayTime) = 0;
        // layersSubmitted is false for frames the runtime told us not to render.
        [[nodiscard]] virtual Core::Result EndFrame(Time displayTime, bool layersSubmitted) = 0;

        [[nodiscard]] virtual Core::Result ApplyHaptics(Handedness side, float amplitude) = 0;
    };

    // OS lifecycle notifications (activity resume/pause/destroy on mobile).
    class IPlatformEventSource
    {
    public:
        virtual ~IPlatformEventSource() = default;

        [[nodiscard]] virtual std::vector<PlatformEvent> Poll() = 0;
    };

    // Desktop hosts have no lifecycle events; the interrupt handler covers quit.
    class NullPlatformEventSource final : public IPlatformEventSource
    {
    public:
        [[nodiscard]] std::vector<PlatformEvent> Poll() override { return {}; }
    };
}
