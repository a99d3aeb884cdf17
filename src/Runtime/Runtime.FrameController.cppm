module;
#include <cstdint>
#include <span>

export module Runtime:FrameController;

import Core;
import Graphics;
import XR;

export namespace Runtime
{
    // Whether this frame's GPU work is being recorded. Decided once per frame
    // from the runtime's render flag.
    enum class SubmissionPhase : uint8_t
    {
        Idle,
        Active
    };

    struct FrameContext
    {
        uint64_t FrameIndex = 0;
        uint32_t FrameSlot = 0;
        bool ShouldRender = false;
        XR::Time PredictedDisplayTime = 0;
        XR::SessionState PreviousState = XR::SessionState::Unknown;
        XR::SessionState CurrentState = XR::SessionState::Unknown;
        XR::ViewSet Views{};
    };

    struct FrameControllerConfig
    {
        uint32_t FramesInFlight = 2;
        // Rounded down to a multiple of FramesInFlight so the slot sequence
        // stays round-robin across the wrap.
        uint64_t FrameIndexWrap = 1u << 20;
        float NearZ = 0.05f;
        float FarZ = 100.0f;
    };

    // -------------------------------------------------------------------------
    // FrameController
    // -------------------------------------------------------------------------
    // BeginFrame: sync actions -> wait frame -> begin frame -> locate views ->
    //             (ShouldRender) GPU fence wait + arena rewind for the slot.
    // EndFrame:   (Active) close arena + submit -> runtime end frame.
    // The runtime handshake always completes, rendered or not.
    // -------------------------------------------------------------------------
    class FrameController
    {
    public:
        FrameController(XR::IXrRuntime& runtime, Graphics::IFrameRenderer& renderer,
                        Graphics::ResourceArena& arena, const FrameControllerConfig& config = {});

        // Latest session pair from the driver, copied into the next FrameContext.
        void SetSessionStates(XR::SessionState previous, XR::SessionState current);

        // FrameOutOfOrder when a frame is already open. A GPU-side failure leaves
        // the frame open in the Idle phase so EndFrame can finish the handshake.
        [[nodiscard]] Core::Result BeginFrame();
        [[nodiscard]] Core::Result EndFrame();

        // Builds the scene uniform from the located views and writes it into the
        // current slot. FrameOutOfOrder unless the phase is Active.
        [[nodiscard]] Core::Result WriteSceneData(std::span<const Graphics::Light> lights);

        [[nodiscard]] static Graphics::SceneData BuildSceneData(const XR::ViewSet& views, float nearZ, float farZ,
                                                                std::span<const Graphics::Light> lights);

        [[nodiscard]] SubmissionPhase GetPhase() const { return m_Phase; }
        [[nodiscard]] bool IsFrameOpen() const { return m_FrameOpen; }
        [[nodiscard]] const FrameContext& GetContext() const { return m_Context; }
        [[nodiscard]] uint64_t GetFrameIndexWrap() const { return m_FrameIndexWrap; }

    private:
        XR::IXrRuntime& m_Runtime;
        Graphics::IFrameRenderer& m_Renderer;
        Graphics::ResourceArena& m_Arena;
        FrameControllerConfig m_Config;

        uint64_t m_FrameIndexWrap;
        uint64_t m_NextFrameIndex = 0;

        FrameContext m_Context;
        XR::SessionState m_PreviousState = XR::SessionState::Unknown;
        XR::SessionState m_CurrentState = XR::SessionState::Unknown;
        SubmissionPhase m_Phase = SubmissionPhase::Idle;
        bool m_FrameOpen = false;
    };
}
