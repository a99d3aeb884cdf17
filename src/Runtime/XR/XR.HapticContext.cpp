module;
#include <algorithm>
#include <cmath>

module XR:HapticContext.Impl;
import :HapticContext;
import :Types;
import :Runtime;
import Core;

namespace XR
{
    void HapticContext::RequestFeedback(float amplitude, Handedness side)
    {
        if (std::isnan(amplitude)) return;
        const float clamped = std::clamp(amplitude, 0.0f, 1.0f);
        float& current = m_Amplitude[Index(side)];
        current = std::max(current, clamped);
    }

    Core::Result HapticContext::Apply(IXrRuntime& runtime) const
    {
        Core::Result left = runtime.ApplyHaptics(Handedness::Left, m_Amplitude[Index(Handedness::Left)]);
        Core::Result right = runtime.ApplyHaptics(Handedness::Right, m_Amplitude[Index(Handedness::Right)]);
        if (!left) return left;
        return right;
    }
}
