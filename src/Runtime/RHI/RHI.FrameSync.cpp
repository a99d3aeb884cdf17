module;
#include <cstdint>
#include <expected>
#include <vector>
#include "RHI.Vulkan.hpp"

module RHI:FrameSync.Impl;
import :FrameSync;
import Core;

namespace RHI
{
    FrameSync::FrameSync(VulkanDevice& device)
        : m_Device(device)
    {
        const uint32_t slots = m_Device.GetFramesInFlight();
        m_CommandBuffers.resize(slots, VK_NULL_HANDLE);
        m_InFlightFences.resize(slots, VK_NULL_HANDLE);

        VkCommandBufferAllocateInfo allocInfo{};
        allocInfo.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_ALLOCATE_INFO;
        allocInfo.commandPool = m_Device.GetCommandPool();
        allocInfo.level = VK_COMMAND_BUFFER_LEVEL_PRIMARY;
        allocInfo.commandBufferCount = slots;

        if (vkAllocateCommandBuffers(m_Device.GetLogicalDevice(), &allocInfo, m_CommandBuffers.data()) != VK_SUCCESS)
        {
            Core::Log::Error("Failed to allocate frame command buffers!");
            m_IsValid = false;
            return;
        }

        // Signaled so the first wait on every slot returns immediately.
        VkFenceCreateInfo fenceInfo{};
        fenceInfo.sType = VK_STRUCTURE_TYPE_FENCE_CREATE_INFO;
        fenceInfo.flags = VK_FENCE_CREATE_SIGNALED_BIT;

        for (auto& fence : m_InFlightFences)
        {
            if (vkCreateFence(m_Device.GetLogicalDevice(), &fenceInfo, nullptr, &fence) != VK_SUCCESS)
            {
                Core::Log::Error("Failed to create frame fence!");
                fence = VK_NULL_HANDLE;
                m_IsValid = false;
            }
        }
    }

    FrameSync::~FrameSync()
    {
        VkDevice logicalDevice = m_Device.GetLogicalDevice();
        if (!logicalDevice) return;

        vkDeviceWaitIdle(logicalDevice);

        for (VkFence fence : m_InFlightFences)
        {
            if (fence) vkDestroyFence(logicalDevice, fence, nullptr);
        }

        if (m_IsValid)
        {
            vkFreeCommandBuffers(logicalDevice, m_Device.GetCommandPool(),
                                 static_cast<uint32_t>(m_CommandBuffers.size()), m_CommandBuffers.data());
        }
    }

    Core::Expected<VkCommandBuffer> FrameSync::BeginSlot(uint32_t frameSlot)
    {
        if (!m_IsValid) return std::unexpected(Core::ErrorCode::DeviceLost);
        if (frameSlot >= m_InFlightFences.size()) return std::unexpected(Core::ErrorCode::OutOfRange);
        if (IsRecording()) return std::unexpected(Core::ErrorCode::FrameOutOfOrder);

        VkDevice logicalDevice = m_Device.GetLogicalDevice();

        VkResult wait = vkWaitForFences(logicalDevice, 1, &m_InFlightFences[frameSlot], VK_TRUE, UINT64_MAX);
        if (wait == VK_ERROR_DEVICE_LOST)
        {
            Core::Log::Error("Device lost while waiting for frame slot {}.", frameSlot);
            return std::unexpected(Core::ErrorCode::DeviceLost);
        }

        // The slot's previous GPU work is retired; its deferred destructions are now safe.
        m_Device.FlushDeletionQueue(frameSlot);

        VK_TRY(vkResetFences(logicalDevice, 1, &m_InFlightFences[frameSlot]), Core::ErrorCode::DeviceLost);

        VkCommandBuffer cmd = m_CommandBuffers[frameSlot];
        VK_TRY(vkResetCommandBuffer(cmd, 0), Core::ErrorCode::DeviceLost);

        VkCommandBufferBeginInfo beginInfo{};
        beginInfo.sType = VK_STRUCTURE_TYPE_COMMAND_BUFFER_BEGIN_INFO;
        beginInfo.flags = VK_COMMAND_BUFFER_USAGE_ONE_TIME_SUBMIT_BIT;
        VK_TRY(vkBeginCommandBuffer(cmd, &beginInfo), Core::ErrorCode::DeviceLost);

        m_RecordingSlot = frameSlot;
        return cmd;
    }

    Core::Result FrameSync::SubmitSlot(uint32_t frameSlot)
    {
        if (m_RecordingSlot != frameSlot) return std::unexpected(Core::ErrorCode::FrameOutOfOrder);
        m_RecordingSlot = NO_SLOT;

        VkCommandBuffer cmd = m_CommandBuffers[frameSlot];
        VK_TRY(vkEndCommandBuffer(cmd), Core::ErrorCode::DeviceLost);

        VkSubmitInfo submitInfo{};
        submitInfo.sType = VK_STRUCTURE_TYPE_SUBMIT_INFO;
        submitInfo.commandBufferCount = 1;
        submitInfo.pCommandBuffers = &cmd;

        VkResult result = m_Device.SubmitToGraphicsQueue(submitInfo, m_InFlightFences[frameSlot]);
        if (result != VK_SUCCESS)
        {
            Core::Log::Error("Frame submit failed for slot {} (VkResult {}).", frameSlot, static_cast<int>(result));
            return std::unexpected(result == VK_ERROR_OUT_OF_DEVICE_MEMORY ? Core::ErrorCode::OutOfDeviceMemory
                                                                           : Core::ErrorCode::DeviceLost);
        }
        return Core::Ok();
    }
}
