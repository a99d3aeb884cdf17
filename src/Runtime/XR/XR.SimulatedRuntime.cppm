module;
#include <array>
#include <cstdint>
#include <deque>
#include <optional>
#include <vector>

export module XR:SimulatedRuntime;

import :Types;
import :Runtime;
import Core;

export namespace XR
{
    struct SimulatedRuntimeConfig
    {
        // Answer BeginSession/EndSession and exit requests with the state
        // sequence a conformant runtime would queue.
        bool AutoAdvance = true;
        // Queue Idle then Ready at construction.
        bool StartReady = true;
        Time DisplayPeriod = 11'111'111; // 90 Hz
        float InterpupillaryDistance = 0.064f;
        float EyeHeight = 1.6f;
    };

    // -------------------------------------------------------------------------
    // SimulatedRuntime - scripted IXrRuntime for headless runs and tests
    // -------------------------------------------------------------------------
    // Events, render flags, views and failures are queued by the caller. The
    // frame protocol (WaitFrame -> BeginFrame -> EndFrame) is enforced the way a
    // real runtime enforces it.
    // -------------------------------------------------------------------------
    class SimulatedRuntime final : public IXrRuntime
    {
    public:
        explicit SimulatedRuntime(const SimulatedRuntimeConfig& config = {});

        // --- IXrRuntime -------------------------------------------------------
        [[nodiscard]] Core::Expected<std::optional<SessionEvent>> PollEvent() override;
        [[nodiscard]] Core::Result BeginSession() override;
        [[nodiscard]] Core::Result EndSession() override;
        [[nodiscard]] Core::Result SyncActions() override;
        [[nodiscard]] Core::Expected<FrameState> WaitFrame() override;
        [[nodiscard]] Core::Result BeginFrame() override;
        [[nodiscard]] Core::Expected<ViewSet> LocateViews(Time displayTime) override;
        [[nodiscard]] Core::Result EndFrame(Time displayTime, bool layersSubmitted) override;
        [[nodiscard]] Core::Result ApplyHaptics(Handedness side, float amplitude) override;

        // --- Scripting --------------------------------------------------------
        void QueueEvent(const SessionEvent& event);
        void QueueState(SessionState state);
        // Makes the next PollEvent fail with the given code instead of returning an event.
        void FailNextPoll(Core::ErrorCode code);
        // Render flag for upcoming WaitFrame calls; consumed front to back, the
        // last value sticks once the queue is empty.
        void QueueShouldRender(bool shouldRender);
        void SetViews(const ViewSet& views) { m_Views = views; }
        // Stopping is queued after this many completed frames.
        void RequestExitAfterFrames(uint32_t frames);

        // --- Introspection ----------------------------------------------------
        [[nodiscard]] bool IsSessionRunning() const { return m_SessionRunning; }
        [[nodiscard]] uint32_t GetBeginSessionCount() const { return m_BeginSessionCount; }
        [[nodiscard]] uint32_t GetEndSessionCount() const { return m_EndSessionCount; }
        [[nodiscard]] uint64_t GetFramesEnded() const { return m_FramesEnded; }
        [[nodiscard]] uint64_t GetFramesWithLayers() const { return m_FramesWithLayers; }
        [[nodiscard]] uint64_t GetSyncCount() const { return m_SyncCount; }
        [[nodiscard]] float GetLastHaptics(Handedness side) const { return m_LastHaptics[static_cast<uint32_t>(side)]; }
        [[nodiscard]] uint64_t GetHapticsApplyCount() const { return m_HapticsApplyCount; }
        [[nodiscard]] size_t GetPendingEventCount() const { return m_Events.size(); }

        [[nodiscard]] static ViewSet MakeStereoViews(float interpupillaryDistance, float eyeHeight);

    private:
        enum class FramePhase : uint8_t { None, Waited, Begun };

        SimulatedRuntimeConfig m_Config;
        std::deque<SessionEvent> m_Events;
        std::optional<Core::ErrorCode> m_PollFailure;
        std::deque<bool> m_ShouldRender;
        bool m_LastShouldRender = true;
        ViewSet m_Views{};

        bool m_SessionRunning = false;
        bool m_Lost = false;
        FramePhase m_FramePhase = FramePhase::None;
        Time m_DisplayTime = 0;
        std::optional<uint32_t> m_ExitCountdown;

        uint32_t m_BeginSessionCount = 0;
        uint32_t m_EndSessionCount = 0;
        uint64_t m_FramesEnded = 0;
        uint64_t m_FramesWithLayers = 0;
        uint64_t m_SyncCount = 0;
        std::array<float, 2> m_LastHaptics{0.0f, 0.0f};
        uint64_t m_HapticsApplyCount = 0;
    };
}
