module;
#include <vector>
#include <optional>
#include <mutex>
#include <functional>
#include "RHI.Vulkan.hpp"

export module RHI:Device;

import :Context;

export namespace RHI
{
    struct QueueFamilyIndices
    {
        std::optional<uint32_t> GraphicsFamily;

        [[nodiscard]] bool IsComplete() const { return GraphicsFamily.has_value(); }
    };

    struct DeviceConfig
    {
        uint32_t FramesInFlight = 2;
        // Upper bound for the bound texture array (binding 5).
        uint32_t MaxBoundTextures = 4096;
    };

    class VulkanDevice
    {
    public:
        VulkanDevice(VulkanContext& context, const DeviceConfig& config = {});
        ~VulkanDevice();

        // No copy
        VulkanDevice(const VulkanDevice&) = delete;
        VulkanDevice& operator=(const VulkanDevice&) = delete;

        [[nodiscard]] VkDevice GetLogicalDevice() const { return m_Device; }
        [[nodiscard]] VkPhysicalDevice GetPhysicalDevice() const { return m_PhysicalDevice; }
        [[nodiscard]] VkQueue GetGraphicsQueue() const { return m_GraphicsQueue; }
        [[nodiscard]] QueueFamilyIndices GetQueueIndices() const { return m_Indices; }
        [[nodiscard]] VkResult SubmitToGraphicsQueue(const VkSubmitInfo& submitInfo, VkFence fence);
        [[nodiscard]] VkCommandPool GetCommandPool() const { return m_CommandPool; }
        [[nodiscard]] VmaAllocator GetAllocator() const { return m_Allocator; }
        [[nodiscard]] bool IsValid() const { return m_IsValid; }
        [[nodiscard]] uint32_t GetFramesInFlight() const { return m_FramesInFlight; }
        [[nodiscard]] uint32_t GetMaxBoundTextures() const { return m_MaxBoundTextures; }

        // Runs the deletions queued while `frameSlot` was last in flight.
        void FlushDeletionQueue(uint32_t frameSlot);
        void SafeDestroy(std::function<void()>&& deleteFn);

    private:
        VkPhysicalDevice m_PhysicalDevice = VK_NULL_HANDLE;
        VkDevice m_Device = VK_NULL_HANDLE;

        VkQueue m_GraphicsQueue = VK_NULL_HANDLE;
        QueueFamilyIndices m_Indices;

        VmaAllocator m_Allocator = VK_NULL_HANDLE;
        VkCommandPool m_CommandPool = VK_NULL_HANDLE;

        std::mutex m_QueueMutex;

        bool m_IsValid = true;

        uint32_t m_FramesInFlight = 2;
        uint32_t m_MaxBoundTextures = 4096;
        std::vector<std::vector<std::function<void()>>> m_DeletionQueue;
        uint32_t m_CurrentFrameSlot = 0;
        std::mutex m_DeletionMutex;

        void PickPhysicalDevice(VkInstance instance);
        void CreateLogicalDevice(VulkanContext& context);
        void CreateCommandPool();

        bool IsDeviceSuitable(VkPhysicalDevice device);
        QueueFamilyIndices FindQueueFamilies(VkPhysicalDevice device);
    };
}
