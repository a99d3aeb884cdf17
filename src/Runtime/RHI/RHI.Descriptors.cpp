module;
#include <cstdint>
#include <map>
#include <span>
#include <vector>
#include "RHI.Vulkan.hpp"

module RHI:Descriptors.Impl;
import :Descriptors;
import Core;

namespace RHI
{
    // --- Descriptor Layout ---
    DescriptorLayout::DescriptorLayout(VulkanDevice& device, std::span<const DescriptorBinding> bindings)
        : m_Device(device)
    {
        std::vector<VkDescriptorSetLayoutBinding> vkBindings;
        std::vector<VkDescriptorBindingFlags> flags;
        vkBindings.reserve(bindings.size());
        flags.reserve(bindings.size());

        for (size_t i = 0; i < bindings.size(); ++i)
        {
            const DescriptorBinding& b = bindings[i];
            if (b.GrowableArray && i + 1 != bindings.size())
            {
                Core::Log::Error("DescriptorLayout: growable array must be the last binding (binding {}).", b.Binding);
                m_IsValid = false;
                return;
            }

            VkDescriptorSetLayoutBinding vkBinding{};
            vkBinding.binding = b.Binding;
            vkBinding.descriptorType = b.Type;
            vkBinding.descriptorCount = b.Count;
            vkBinding.stageFlags = b.Stages;
            vkBindings.push_back(vkBinding);

            if (b.GrowableArray)
            {
                flags.push_back(VK_DESCRIPTOR_BINDING_PARTIALLY_BOUND_BIT |
                                VK_DESCRIPTOR_BINDING_UPDATE_AFTER_BIND_BIT |
                                VK_DESCRIPTOR_BINDING_VARIABLE_DESCRIPTOR_COUNT_BIT);
                m_HasGrowableArray = true;
            }
            else
            {
                flags.push_back(0);
            }
        }

        VkDescriptorSetLayoutBindingFlagsCreateInfo bindingFlags{};
        bindingFlags.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_SET_LAYOUT_BINDING_FLAGS_CREATE_INFO;
        bindingFlags.bindingCount = static_cast<uint32_t>(flags.size());
        bindingFlags.pBindingFlags = flags.data();

        VkDescriptorSetLayoutCreateInfo layoutInfo{};
        layoutInfo.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_SET_LAYOUT_CREATE_INFO;
        layoutInfo.pNext = &bindingFlags;
        layoutInfo.bindingCount = static_cast<uint32_t>(vkBindings.size());
        layoutInfo.pBindings = vkBindings.data();
        if (m_HasGrowableArray)
            layoutInfo.flags = VK_DESCRIPTOR_SET_LAYOUT_CREATE_UPDATE_AFTER_BIND_POOL_BIT;

        if (vkCreateDescriptorSetLayout(m_Device.GetLogicalDevice(), &layoutInfo, nullptr, &m_Layout) != VK_SUCCESS)
        {
            Core::Log::Error("Failed to create descriptor set layout!");
            m_Layout = VK_NULL_HANDLE;
            m_IsValid = false;
        }
    }

    DescriptorLayout::~DescriptorLayout()
    {
        if (m_Layout) vkDestroyDescriptorSetLayout(m_Device.GetLogicalDevice(), m_Layout, nullptr);
    }

    // --- Descriptor Pool ---
    DescriptorPool::DescriptorPool(VulkanDevice& device, std::span<const DescriptorBinding> bindings, uint32_t maxSets)
        : m_Device(device)
    {
        std::map<VkDescriptorType, uint32_t> counts;
        bool updateAfterBind = false;
        for (const DescriptorBinding& b : bindings)
        {
            counts[b.Type] += b.Count * maxSets;
            updateAfterBind |= b.GrowableArray;
        }

        std::vector<VkDescriptorPoolSize> poolSizes;
        poolSizes.reserve(counts.size());
        for (const auto& [type, count] : counts)
        {
            poolSizes.push_back({type, count});
        }

        VkDescriptorPoolCreateInfo poolInfo{};
        poolInfo.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_POOL_CREATE_INFO;
        poolInfo.flags = updateAfterBind ? VK_DESCRIPTOR_POOL_CREATE_UPDATE_AFTER_BIND_BIT : 0;
        poolInfo.poolSizeCount = static_cast<uint32_t>(poolSizes.size());
        poolInfo.pPoolSizes = poolSizes.data();
        poolInfo.maxSets = maxSets;

        if (vkCreateDescriptorPool(m_Device.GetLogicalDevice(), &poolInfo, nullptr, &m_Pool) != VK_SUCCESS)
        {
            Core::Log::Error("Failed to create descriptor pool!");
            m_Pool = VK_NULL_HANDLE;
            m_IsValid = false;
        }
    }

    DescriptorPool::~DescriptorPool()
    {
        if (m_Pool) vkDestroyDescriptorPool(m_Device.GetLogicalDevice(), m_Pool, nullptr);
    }

    VkDescriptorSet DescriptorPool::Allocate(const DescriptorLayout& layout, uint32_t variableCount)
    {
        VkDescriptorSetLayout handle = layout.GetHandle();

        VkDescriptorSetVariableDescriptorCountAllocateInfo variableInfo{};
        variableInfo.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_SET_VARIABLE_DESCRIPTOR_COUNT_ALLOCATE_INFO;
        variableInfo.descriptorSetCount = 1;
        variableInfo.pDescriptorCounts = &variableCount;

        VkDescriptorSetAllocateInfo allocInfo{};
        allocInfo.sType = VK_STRUCTURE_TYPE_DESCRIPTOR_SET_ALLOCATE_INFO;
        allocInfo.pNext = layout.HasGrowableArray() ? &variableInfo : nullptr;
        allocInfo.descriptorPool = m_Pool;
        allocInfo.descriptorSetCount = 1;
        allocInfo.pSetLayouts = &handle;

        VkDescriptorSet set = VK_NULL_HANDLE;
        if (vkAllocateDescriptorSets(m_Device.GetLogicalDevice(), &allocInfo, &set) != VK_SUCCESS)
        {
            Core::Log::Error("Failed to allocate descriptor set!");
            return VK_NULL_HANDLE;
        }
        return set;
    }

    void WriteBufferDescriptor(VulkanDevice& device, VkDescriptorSet set, uint32_t binding,
                               VkDescriptorType type, VkBuffer buffer, VkDeviceSize range)
    {
        VkDescriptorBufferInfo bufferInfo{};
        bufferInfo.buffer = buffer;
        bufferInfo.offset = 0;
        bufferInfo.range = range;

        VkWriteDescriptorSet write{};
        write.sType = VK_STRUCTURE_TYPE_WRITE_DESCRIPTOR_SET;
        write.dstSet = set;
        write.dstBinding = binding;
        write.dstArrayElement = 0;
        write.descriptorType = type;
        write.descriptorCount = 1;
        write.pBufferInfo = &bufferInfo;

        vkUpdateDescriptorSets(device.GetLogicalDevice(), 1, &write, 0, nullptr);
    }

    void WriteImageDescriptor(VulkanDevice& device, VkDescriptorSet set, uint32_t binding, uint32_t arrayElement,
                              VkImageView view, VkSampler sampler)
    {
        VkDescriptorImageInfo imageInfo{};
        imageInfo.imageLayout = VK_IMAGE_LAYOUT_SHADER_READ_ONLY_OPTIMAL;
        imageInfo.imageView = view;
        imageInfo.sampler = sampler;

        VkWriteDescriptorSet write{};
        write.sType = VK_STRUCTURE_TYPE_WRITE_DESCRIPTOR_SET;
        write.dstSet = set;
        write.dstBinding = binding;
        write.dstArrayElement = arrayElement;
        write.descriptorType = VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER;
        write.descriptorCount = 1;
        write.pImageInfo = &imageInfo;

        vkUpdateDescriptorSets(device.GetLogicalDevice(), 1, &write, 0, nullptr);
    }
}
