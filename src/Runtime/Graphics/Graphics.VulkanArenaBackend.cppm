module;
#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <vector>

#include "RHI.Vulkan.hpp"

export module Graphics:VulkanArenaBackend;

import :ArenaBackend;
import :GpuTypes;
import RHI;
import Core;

export namespace Graphics
{
    // Arena memory in persistently mapped VMA buffers, one descriptor set per
    // frame slot. Set layout follows Graphics::Bindings; binding 5 is a
    // partially bound, update-after-bind texture array.
    class VulkanArenaBackend final : public IArenaBackend
    {
    public:
        VulkanArenaBackend(RHI::VulkanDevice& device, const ResourceArenaConfig& config);
        ~VulkanArenaBackend() override;

        [[nodiscard]] bool IsValid() const { return m_IsValid; }

        [[nodiscard]] std::span<std::byte> Map(ArenaBufferKind kind, uint32_t frameSlot) override;
        void Flush(ArenaBufferKind kind, uint32_t frameSlot, size_t offset, size_t size) override;
        [[nodiscard]] Core::Result BindTexture(TextureIndex index, const TextureBinding& binding) override;

        [[nodiscard]] uint32_t GetFramesInFlight() const override { return m_FramesInFlight; }
        [[nodiscard]] uint32_t GetTextureCapacity() const override { return m_TextureCapacity; }

        [[nodiscard]] VkDescriptorSet GetDescriptorSet(uint32_t frameSlot) const { return m_Sets.empty() ? VK_NULL_HANDLE : m_Sets[frameSlot % m_Sets.size()]; }
        [[nodiscard]] VkDescriptorSetLayout GetDescriptorSetLayout() const;
        [[nodiscard]] VkBuffer GetBuffer(ArenaBufferKind kind, uint32_t frameSlot) const;

    private:
        RHI::VulkanDevice& m_Device;
        uint32_t m_FramesInFlight;
        uint32_t m_TextureCapacity;
        bool m_IsValid = true;

        std::array<std::vector<std::unique_ptr<RHI::VulkanBuffer>>, ARENA_BUFFER_KIND_COUNT> m_Buffers;

        std::unique_ptr<RHI::SamplerCache> m_Samplers;
        std::unique_ptr<RHI::DescriptorLayout> m_Layout;
        std::unique_ptr<RHI::DescriptorPool> m_Pool;
        std::vector<VkDescriptorSet> m_Sets;

        [[nodiscard]] RHI::VulkanBuffer* FindBuffer(ArenaBufferKind kind, uint32_t frameSlot) const;
        void CreateBuffers(const ResourceArenaConfig& config);
        void CreateDescriptors();
    };
}
