module;
#include <array>
#include <cstdint>

export module XR:HapticContext;

import :Types;
import :Runtime;
import Core;

export namespace XR
{
    // Collects vibration requests from gameplay systems during a tick. Only the
    // strongest request per hand survives; the engine applies both hands once
    // per tick and then resets them.
    class HapticContext
    {
    public:
        // Amplitude is clamped to [0, 1].
        void RequestFeedback(float amplitude, Handedness side);

        [[nodiscard]] float GetAmplitude(Handedness side) const { return m_Amplitude[Index(side)]; }

        // Sends both amplitudes to the runtime. Errors are returned after
        // attempting both hands.
        [[nodiscard]] Core::Result Apply(IXrRuntime& runtime) const;

        void Reset() { m_Amplitude = {0.0f, 0.0f}; }

    private:
        static constexpr uint32_t Index(Handedness side) { return static_cast<uint32_t>(side); }

        std::array<float, 2> m_Amplitude{0.0f, 0.0f};
    };
}
