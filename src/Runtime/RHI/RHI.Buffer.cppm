module;
#include <cstddef>
#include <cstdint>
#include <cstring>
#include "RHI.Vulkan.hpp"

export module RHI:Buffer;

import :Device;
import Core;

export namespace RHI
{
    class VulkanBuffer
    {
    public:
        // usage: StorageBuffer, UniformBuffer, IndirectBuffer, ...
        // HostVisible buffers (AUTO_PREFER_HOST / CPU_TO_GPU) are persistently mapped at creation.
        VulkanBuffer(VulkanDevice& device, size_t size, VkBufferUsageFlags usage, VmaMemoryUsage memoryUsage);
        ~VulkanBuffer();

        VulkanBuffer(const VulkanBuffer&) = delete;
        VulkanBuffer& operator=(const VulkanBuffer&) = delete;

        VulkanBuffer(VulkanBuffer&& other) noexcept;
        VulkanBuffer& operator=(VulkanBuffer&& other) = delete;

        [[nodiscard]] VkBuffer GetHandle() const { return m_Buffer; }
        [[nodiscard]] bool IsValid() const { return m_Buffer != VK_NULL_HANDLE; }

        // Persistent pointer for host-visible buffers, nullptr for device-local memory.
        [[nodiscard]] void* GetMappedData() const { return m_MappedData; }

        [[nodiscard]] bool IsHostVisible() const { return m_MappedData != nullptr; }
        [[nodiscard]] size_t GetSizeBytes() const { return m_SizeBytes; }

        Core::Result Write(const void* data, size_t size, size_t offset = 0)
        {
            if (!data || size == 0) return Core::Ok();
            if (offset + size > m_SizeBytes)
            {
                Core::Log::Error("VulkanBuffer::Write(): out of bounds. size={} offset={} cap={}", size, offset, m_SizeBytes);
                return Core::Err(Core::ErrorCode::OutOfRange);
            }

            if (!m_MappedData)
            {
                Core::Log::Error("VulkanBuffer::Write(): buffer={} is not host-visible. size={} offset={}",
                                 (void*)m_Buffer, size, offset);
                return Core::Err(Core::ErrorCode::InvalidState);
            }

            std::memcpy(static_cast<uint8_t*>(m_MappedData) + offset, data, size);

            // Safe for coherent memory too (no-op in driver/VMA).
            Flush(offset, size);
            return Core::Ok();
        }

        void Flush(size_t offset, size_t size);

    private:
        VulkanDevice& m_Device;
        VkBuffer m_Buffer = VK_NULL_HANDLE;
        VmaAllocation m_Allocation = VK_NULL_HANDLE;

        void* m_MappedData = nullptr;
        size_t m_SizeBytes = 0;
    };
}
