module;
#include <cstddef>
#include <utility>
#include "RHI.Vulkan.hpp"

module RHI:Buffer.Impl;
import :Buffer;
import Core;

namespace RHI
{
    VulkanBuffer::VulkanBuffer(VulkanDevice& device, size_t size, VkBufferUsageFlags usage, VmaMemoryUsage memoryUsage)
        : m_Device(device), m_SizeBytes(size)
    {
        VkBufferCreateInfo bufferInfo{};
        bufferInfo.sType = VK_STRUCTURE_TYPE_BUFFER_CREATE_INFO;
        bufferInfo.size = size;
        bufferInfo.usage = usage;
        bufferInfo.sharingMode = VK_SHARING_MODE_EXCLUSIVE;

        VmaAllocationCreateInfo allocInfo{};
        allocInfo.usage = memoryUsage;
        if (memoryUsage == VMA_MEMORY_USAGE_AUTO_PREFER_HOST || memoryUsage == VMA_MEMORY_USAGE_CPU_TO_GPU)
        {
            allocInfo.flags = VMA_ALLOCATION_CREATE_HOST_ACCESS_SEQUENTIAL_WRITE_BIT | VMA_ALLOCATION_CREATE_MAPPED_BIT;
        }

        VmaAllocationInfo resultInfo{};
        if (vmaCreateBuffer(m_Device.GetAllocator(), &bufferInfo, &allocInfo, &m_Buffer, &m_Allocation, &resultInfo) != VK_SUCCESS)
        {
            Core::Log::Error("Failed to create buffer! size={}", size);
            m_Buffer = VK_NULL_HANDLE;
            m_SizeBytes = 0;
            return;
        }

        m_MappedData = resultInfo.pMappedData;
    }

    VulkanBuffer::VulkanBuffer(VulkanBuffer&& other) noexcept
        : m_Device(other.m_Device),
          m_Buffer(std::exchange(other.m_Buffer, VK_NULL_HANDLE)),
          m_Allocation(std::exchange(other.m_Allocation, VK_NULL_HANDLE)),
          m_MappedData(std::exchange(other.m_MappedData, nullptr)),
          m_SizeBytes(std::exchange(other.m_SizeBytes, 0))
    {
    }

    VulkanBuffer::~VulkanBuffer()
    {
        if (!m_Buffer) return;

        VkBuffer buffer = m_Buffer;
        VmaAllocation allocation = m_Allocation;
        VmaAllocator allocator = m_Device.GetAllocator();

        m_Device.SafeDestroy([allocator, buffer, allocation]()
        {
            vmaDestroyBuffer(allocator, buffer, allocation);
        });
    }

    void VulkanBuffer::Flush(size_t offset, size_t size)
    {
        if (!m_Allocation) return;
        VK_CHECK(vmaFlushAllocation(m_Device.GetAllocator(), m_Allocation, offset, size));
    }
}
