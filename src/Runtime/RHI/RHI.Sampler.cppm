module;
#include <cstdint>
#include "RHI.Vulkan.hpp"

export module RHI:Sampler;

import :Device;

export namespace RHI
{
    enum class SamplerAddressing : uint8_t
    {
        Repeat,
        ClampToEdge
    };

    // Cube maps and two-channel float lookup tables (BRDF LUT) must not wrap.
    [[nodiscard]] constexpr SamplerAddressing SelectAddressing(bool isCubeMap, VkFormat format)
    {
        if (isCubeMap || format == VK_FORMAT_R16G16_SFLOAT)
            return SamplerAddressing::ClampToEdge;
        return SamplerAddressing::Repeat;
    }

    // Owns one sampler per addressing mode; shared by every bound texture.
    class SamplerCache
    {
    public:
        explicit SamplerCache(VulkanDevice& device);
        ~SamplerCache();

        SamplerCache(const SamplerCache&) = delete;
        SamplerCache& operator=(const SamplerCache&) = delete;

        [[nodiscard]] VkSampler Get(SamplerAddressing addressing) const
        {
            return addressing == SamplerAddressing::ClampToEdge ? m_ClampSampler : m_RepeatSampler;
        }

    private:
        VulkanDevice& m_Device;
        VkSampler m_RepeatSampler = VK_NULL_HANDLE;
        VkSampler m_ClampSampler = VK_NULL_HANDLE;

        VkSampler CreateSampler(VkSamplerAddressMode mode) const;
    };
}
