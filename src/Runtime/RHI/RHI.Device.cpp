module;
#include <vector>
#include <mutex>
#include <functional>
#include <algorithm>

#include "RHI.Vulkan.hpp"

module RHI:Device.Impl;
import :Device;
import Core;

namespace RHI
{
    VulkanDevice::VulkanDevice(VulkanContext& context, const DeviceConfig& config)
        : m_FramesInFlight(std::max(config.FramesInFlight, 1u)),
          m_MaxBoundTextures(config.MaxBoundTextures)
    {
        m_DeletionQueue.resize(m_FramesInFlight);

        if (!context.IsValid())
        {
            m_IsValid = false;
            return;
        }

        PickPhysicalDevice(context.GetInstance());

        // Abort initialization if no physical device was selected
        if (m_PhysicalDevice == VK_NULL_HANDLE)
        {
            m_IsValid = false;
            return;
        }

        CreateLogicalDevice(context);

        if (m_Device == VK_NULL_HANDLE)
        {
            m_IsValid = false;
            return;
        }

        CreateCommandPool();
    }

    VulkanDevice::~VulkanDevice()
    {
        // 1. Wait for GPU to stop
        if (m_Device) vkDeviceWaitIdle(m_Device);

        // 2. Flush ALL Deletion Queues
        {
            std::lock_guard lock(m_DeletionMutex);
            for (auto& queue : m_DeletionQueue)
            {
                for (auto& fn : queue) fn();
                queue.clear();
            }
        }

        // 3. Destroy Main Resources
        if (m_CommandPool) vkDestroyCommandPool(m_Device, m_CommandPool, nullptr);
        if (m_Allocator) vmaDestroyAllocator(m_Allocator);

        // 4. Destroy Device
        if (m_Device) vkDestroyDevice(m_Device, nullptr);
    }

    VkResult VulkanDevice::SubmitToGraphicsQueue(const VkSubmitInfo& submitInfo, VkFence fence)
    {
        std::scoped_lock lock(m_QueueMutex);
        return vkQueueSubmit(m_GraphicsQueue, 1, &submitInfo, fence);
    }

    void VulkanDevice::FlushDeletionQueue(uint32_t frameSlot)
    {
        std::lock_guard lock(m_DeletionMutex);
        m_CurrentFrameSlot = frameSlot % m_FramesInFlight;
        auto& queue = m_DeletionQueue[m_CurrentFrameSlot];
        for (auto& fn : queue) fn();
        queue.clear();
    }

    void VulkanDevice::SafeDestroy(std::function<void()>&& deleteFn)
    {
        std::lock_guard lock(m_DeletionMutex);
        m_DeletionQueue[m_CurrentFrameSlot].push_back(std::move(deleteFn));
    }

    void VulkanDevice::PickPhysicalDevice(VkInstance instance)
    {
        uint32_t deviceCount = 0;
        vkEnumeratePhysicalDevices(instance, &deviceCount, nullptr);

        if (deviceCount == 0)
        {
            Core::Log::Error("Failed to find GPUs with Vulkan support!");
            m_IsValid = false;
            return;
        }

        std::vector<VkPhysicalDevice> devices(deviceCount);
        vkEnumeratePhysicalDevices(instance, &deviceCount, devices.data());

        for (const auto& device : devices)
        {
            if (IsDeviceSuitable(device))
            {
                m_PhysicalDevice = device;
                break;
            }
        }

        if (m_PhysicalDevice == VK_NULL_HANDLE)
        {
            Core::Log::Error("Failed to find a suitable GPU! Checked {} devices.", deviceCount);
            m_IsValid = false;
        }
        else
        {
            VkPhysicalDeviceProperties props;
            vkGetPhysicalDeviceProperties(m_PhysicalDevice, &props);
            Core::Log::Info("Selected GPU: {}", props.deviceName);

            const uint32_t limit = props.limits.maxPerStageDescriptorUpdateAfterBindSampledImages;
            if (limit < m_MaxBoundTextures)
            {
                Core::Log::Warn("Bound texture array capped to {} (requested {}).", limit, m_MaxBoundTextures);
                m_MaxBoundTextures = limit;
            }
        }
    }

    void VulkanDevice::CreateLogicalDevice(VulkanContext& context)
    {
        m_Indices = FindQueueFamilies(m_PhysicalDevice);

        float queuePriority = 1.0f;
        VkDeviceQueueCreateInfo queueCreateInfo{};
        queueCreateInfo.sType = VK_STRUCTURE_TYPE_DEVICE_QUEUE_CREATE_INFO;
        queueCreateInfo.queueFamilyIndex = m_Indices.GraphicsFamily.value();
        queueCreateInfo.queueCount = 1;
        queueCreateInfo.pQueuePriorities = &queuePriority;

        VkPhysicalDeviceVulkan13Features features13{};
        features13.sType = VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_VULKAN_1_3_FEATURES;
        features13.synchronization2 = VK_TRUE;

        // The bound texture array grows at runtime and is indexed per draw.
        VkPhysicalDeviceVulkan12Features features12{};
        features12.sType = VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_VULKAN_1_2_FEATURES;
        features12.pNext = &features13;
        features12.descriptorIndexing = VK_TRUE;
        features12.runtimeDescriptorArray = VK_TRUE;
        features12.descriptorBindingPartiallyBound = VK_TRUE;
        features12.descriptorBindingVariableDescriptorCount = VK_TRUE;
        features12.descriptorBindingSampledImageUpdateAfterBind = VK_TRUE;
        features12.shaderSampledImageArrayNonUniformIndexing = VK_TRUE;

        VkPhysicalDeviceFeatures2 features2{};
        features2.sType = VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_FEATURES_2;
        features2.pNext = &features12;
        features2.features.multiDrawIndirect = VK_TRUE;
        features2.features.samplerAnisotropy = VK_TRUE;

        VkDeviceCreateInfo createInfo{};
        createInfo.sType = VK_STRUCTURE_TYPE_DEVICE_CREATE_INFO;
        createInfo.pNext = &features2;
        createInfo.queueCreateInfoCount = 1;
        createInfo.pQueueCreateInfos = &queueCreateInfo;
        createInfo.enabledExtensionCount = 0;
        createInfo.enabledLayerCount = 0;

        if (vkCreateDevice(m_PhysicalDevice, &createInfo, nullptr, &m_Device) != VK_SUCCESS)
        {
            Core::Log::Error("Failed to create logical device!");
            m_Device = VK_NULL_HANDLE;
            m_IsValid = false;
            return;
        }

        volkLoadDevice(m_Device);

        VmaVulkanFunctions vulkanFunctions = {};
        vulkanFunctions.vkGetInstanceProcAddr = vkGetInstanceProcAddr;
        vulkanFunctions.vkGetDeviceProcAddr = vkGetDeviceProcAddr;

        VmaAllocatorCreateInfo allocatorInfo = {};
        allocatorInfo.vulkanApiVersion = VK_API_VERSION_1_3;
        allocatorInfo.physicalDevice = m_PhysicalDevice;
        allocatorInfo.device = m_Device;
        allocatorInfo.instance = context.GetInstance();
        allocatorInfo.pVulkanFunctions = &vulkanFunctions;

        if (vmaCreateAllocator(&allocatorInfo, &m_Allocator) != VK_SUCCESS)
        {
            Core::Log::Error("Failed to create VMA allocator!");
            m_IsValid = false;
            return;
        }

        vkGetDeviceQueue(m_Device, m_Indices.GraphicsFamily.value(), 0, &m_GraphicsQueue);
    }

    void VulkanDevice::CreateCommandPool()
    {
        VkCommandPoolCreateInfo poolInfo{};
        poolInfo.sType = VK_STRUCTURE_TYPE_COMMAND_POOL_CREATE_INFO;
        poolInfo.flags = VK_COMMAND_POOL_CREATE_RESET_COMMAND_BUFFER_BIT;
        poolInfo.queueFamilyIndex = m_Indices.GraphicsFamily.value();

        if (vkCreateCommandPool(m_Device, &poolInfo, nullptr, &m_CommandPool) != VK_SUCCESS)
        {
            Core::Log::Error("Failed to create command pool!");
            m_IsValid = false;
        }
    }

    bool VulkanDevice::IsDeviceSuitable(VkPhysicalDevice device)
    {
        VkPhysicalDeviceProperties props;
        vkGetPhysicalDeviceProperties(device, &props);

        if (props.apiVersion < VK_API_VERSION_1_3)
        {
            Core::Log::Warn("GPU '{}' rejected: Vulkan 1.3 not supported.", props.deviceName);
            return false;
        }

        QueueFamilyIndices indices = FindQueueFamilies(device);
        if (!indices.IsComplete())
        {
            Core::Log::Warn("GPU '{}' rejected: No Graphics Queue.", props.deviceName);
            return false;
        }

        VkPhysicalDeviceVulkan12Features features12{};
        features12.sType = VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_VULKAN_1_2_FEATURES;

        VkPhysicalDeviceFeatures2 features2{};
        features2.sType = VK_STRUCTURE_TYPE_PHYSICAL_DEVICE_FEATURES_2;
        features2.pNext = &features12;
        vkGetPhysicalDeviceFeatures2(device, &features2);

        if (!features2.features.multiDrawIndirect)
        {
            Core::Log::Warn("GPU '{}' rejected: multiDrawIndirect not supported.", props.deviceName);
            return false;
        }
        if (!features12.runtimeDescriptorArray || !features12.descriptorBindingPartiallyBound ||
            !features12.descriptorBindingVariableDescriptorCount ||
            !features12.descriptorBindingSampledImageUpdateAfterBind)
        {
            Core::Log::Warn("GPU '{}' rejected: Missing descriptor indexing features.", props.deviceName);
            return false;
        }

        return true;
    }

    QueueFamilyIndices VulkanDevice::FindQueueFamilies(VkPhysicalDevice device)
    {
        QueueFamilyIndices indices;
        uint32_t queueFamilyCount = 0;

        vkGetPhysicalDeviceQueueFamilyProperties(device, &queueFamilyCount, nullptr);

        std::vector<VkQueueFamilyProperties> queueFamilies(queueFamilyCount);
        vkGetPhysicalDeviceQueueFamilyProperties(device, &queueFamilyCount, queueFamilies.data());

        for (uint32_t i = 0; i < queueFamilyCount; ++i)
        {
            if (queueFamilies[i].queueFlags & VK_QUEUE_GRAPHICS_BIT)
            {
                indices.GraphicsFamily = i;
                break;
            }
        }
        return indices;
    }
}
