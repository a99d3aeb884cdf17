module;
#include "RHI.Vulkan.hpp"

module RHI:Sampler.Impl;
import :Sampler;
import Core;

namespace RHI
{
    SamplerCache::SamplerCache(VulkanDevice& device)
        : m_Device(device)
    {
        m_RepeatSampler = CreateSampler(VK_SAMPLER_ADDRESS_MODE_REPEAT);
        m_ClampSampler = CreateSampler(VK_SAMPLER_ADDRESS_MODE_CLAMP_TO_EDGE);
    }

    SamplerCache::~SamplerCache()
    {
        VkDevice logicalDevice = m_Device.GetLogicalDevice();
        if (m_RepeatSampler) vkDestroySampler(logicalDevice, m_RepeatSampler, nullptr);
        if (m_ClampSampler) vkDestroySampler(logicalDevice, m_ClampSampler, nullptr);
    }

    VkSampler SamplerCache::CreateSampler(VkSamplerAddressMode mode) const
    {
        VkPhysicalDeviceProperties properties{};
        vkGetPhysicalDeviceProperties(m_Device.GetPhysicalDevice(), &properties);

        VkSamplerCreateInfo samplerInfo{};
        samplerInfo.sType = VK_STRUCTURE_TYPE_SAMPLER_CREATE_INFO;
        samplerInfo.magFilter = VK_FILTER_LINEAR;
        samplerInfo.minFilter = VK_FILTER_LINEAR;
        samplerInfo.mipmapMode = VK_SAMPLER_MIPMAP_MODE_LINEAR;
        samplerInfo.addressModeU = mode;
        samplerInfo.addressModeV = mode;
        samplerInfo.addressModeW = mode;
        samplerInfo.anisotropyEnable = VK_TRUE;
        samplerInfo.maxAnisotropy = properties.limits.maxSamplerAnisotropy;
        samplerInfo.borderColor = VK_BORDER_COLOR_INT_OPAQUE_BLACK;
        samplerInfo.compareEnable = VK_FALSE;
        samplerInfo.minLod = 0.0f;
        samplerInfo.maxLod = VK_LOD_CLAMP_NONE;

        VkSampler sampler = VK_NULL_HANDLE;
        if (vkCreateSampler(m_Device.GetLogicalDevice(), &samplerInfo, nullptr, &sampler) != VK_SUCCESS)
        {
            Core::Log::Error("Failed to create texture sampler!");
            return VK_NULL_HANDLE;
        }
        return sampler;
    }
}
