module;
#include <cstdint>
#include <vector>
#include "RHI.Vulkan.hpp"

export module RHI:FrameSync;

import :Device;
import Core;

export namespace RHI
{
    // One command buffer and one fence per frame slot. Recording into a slot
    // waits until the GPU has retired the work last submitted from it.
    class FrameSync
    {
    public:
        explicit FrameSync(VulkanDevice& device);
        ~FrameSync();

        FrameSync(const FrameSync&) = delete;
        FrameSync& operator=(const FrameSync&) = delete;

        [[nodiscard]] Core::Expected<VkCommandBuffer> BeginSlot(uint32_t frameSlot);
        [[nodiscard]] Core::Result SubmitSlot(uint32_t frameSlot);

        [[nodiscard]] bool IsRecording() const { return m_RecordingSlot != NO_SLOT; }
        [[nodiscard]] bool IsValid() const { return m_IsValid; }
        [[nodiscard]] uint32_t GetSlotCount() const { return static_cast<uint32_t>(m_InFlightFences.size()); }

    private:
        static constexpr uint32_t NO_SLOT = ~0u;

        VulkanDevice& m_Device;
        std::vector<VkCommandBuffer> m_CommandBuffers;
        std::vector<VkFence> m_InFlightFences;
        uint32_t m_RecordingSlot = NO_SLOT;
        bool m_IsValid = true;
    };
}
