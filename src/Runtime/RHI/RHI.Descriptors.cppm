module;
#include <cstdint>
#include <span>
#include <vector>
#include "RHI.Vulkan.hpp"

export module RHI:Descriptors;

import :Device;

export namespace RHI
{
    struct DescriptorBinding
    {
        uint32_t Binding = 0;
        VkDescriptorType Type = VK_DESCRIPTOR_TYPE_STORAGE_BUFFER;
        uint32_t Count = 1;
        VkShaderStageFlags Stages = VK_SHADER_STAGE_VERTEX_BIT | VK_SHADER_STAGE_FRAGMENT_BIT;
        // Partially bound, update-after-bind, variable count. Only valid on the last binding.
        bool GrowableArray = false;
    };

    class DescriptorLayout
    {
    public:
        DescriptorLayout(VulkanDevice& device, std::span<const DescriptorBinding> bindings);
        ~DescriptorLayout();

        DescriptorLayout(const DescriptorLayout&) = delete;
        DescriptorLayout& operator=(const DescriptorLayout&) = delete;

        [[nodiscard]] VkDescriptorSetLayout GetHandle() const { return m_Layout; }
        [[nodiscard]] bool IsValid() const { return m_IsValid; }
        [[nodiscard]] bool HasGrowableArray() const { return m_HasGrowableArray; }

    private:
        VulkanDevice& m_Device;
        bool m_IsValid = true;
        bool m_HasGrowableArray = false;
        VkDescriptorSetLayout m_Layout = VK_NULL_HANDLE;
    };

    class DescriptorPool
    {
    public:
        DescriptorPool(VulkanDevice& device, std::span<const DescriptorBinding> bindings, uint32_t maxSets);
        ~DescriptorPool();

        DescriptorPool(const DescriptorPool&) = delete;
        DescriptorPool& operator=(const DescriptorPool&) = delete;

        // variableCount is the size of the growable array binding, ignored when the layout has none.
        [[nodiscard]] VkDescriptorSet Allocate(const DescriptorLayout& layout, uint32_t variableCount = 0);
        [[nodiscard]] bool IsValid() const { return m_IsValid; }

    private:
        VulkanDevice& m_Device;
        bool m_IsValid = true;
        VkDescriptorPool m_Pool = VK_NULL_HANDLE;
    };

    void WriteBufferDescriptor(VulkanDevice& device, VkDescriptorSet set, uint32_t binding,
                               VkDescriptorType type, VkBuffer buffer, VkDeviceSize range = VK_WHOLE_SIZE);

    void WriteImageDescriptor(VulkanDevice& device, VkDescriptorSet set, uint32_t binding, uint32_t arrayElement,
                              VkImageView view, VkSampler sampler);
}
