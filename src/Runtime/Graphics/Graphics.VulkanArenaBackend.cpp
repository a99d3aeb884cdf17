module;
#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <vector>

#include "RHI.Vulkan.hpp"

module Graphics:VulkanArenaBackend.Impl;
import :VulkanArenaBackend;
import :ArenaBackend;
import :GpuTypes;
import RHI;
import Core;

namespace Graphics
{
    namespace
    {
        VkBufferUsageFlags UsageFor(ArenaBufferKind kind)
        {
            switch (kind)
            {
                case ArenaBufferKind::Vertex:
                    return VK_BUFFER_USAGE_VERTEX_BUFFER_BIT | VK_BUFFER_USAGE_STORAGE_BUFFER_BIT;
                case ArenaBufferKind::Index:
                    return VK_BUFFER_USAGE_INDEX_BUFFER_BIT;
                case ArenaBufferKind::IndirectCommand:
                    return VK_BUFFER_USAGE_INDIRECT_BUFFER_BIT | VK_BUFFER_USAGE_STORAGE_BUFFER_BIT;
                case ArenaBufferKind::SceneData:
                    return VK_BUFFER_USAGE_UNIFORM_BUFFER_BIT;
                default:
                    return VK_BUFFER_USAGE_STORAGE_BUFFER_BIT;
            }
        }

        constexpr VkShaderStageFlags kAllGraphics = VK_SHADER_STAGE_VERTEX_BIT | VK_SHADER_STAGE_FRAGMENT_BIT;
    }

    VulkanArenaBackend::VulkanArenaBackend(RHI::VulkanDevice& device, const ResourceArenaConfig& config)
        : m_Device(device),
          m_FramesInFlight(std::max(config.FramesInFlight, 1u)),
          m_TextureCapacity(std::min(config.MaxTextures, device.GetMaxBoundTextures()))
    {
        if (!m_Device.IsValid())
        {
            m_IsValid = false;
            return;
        }

        if (m_FramesInFlight != m_Device.GetFramesInFlight())
        {
            Core::Log::Warn("VulkanArenaBackend: arena uses {} frames in flight, device deletion queue uses {}.",
                            m_FramesInFlight, m_Device.GetFramesInFlight());
        }

        CreateBuffers(config);
        if (!m_IsValid) return;

        m_Samplers = std::make_unique<RHI::SamplerCache>(m_Device);
        CreateDescriptors();
    }

    VulkanArenaBackend::~VulkanArenaBackend()
    {
        // Sets are returned together with the pool.
        m_Sets.clear();
        m_Pool.reset();
        m_Layout.reset();
        m_Samplers.reset();
    }

    void VulkanArenaBackend::CreateBuffers(const ResourceArenaConfig& config)
    {
        for (size_t k = 0; k < ARENA_BUFFER_KIND_COUNT; ++k)
        {
            const auto kind = static_cast<ArenaBufferKind>(k);
            // Zero-sized buffers are invalid in Vulkan.
            const size_t bytes = std::max<size_t>(BufferBytes(kind, config), 16);
            const uint32_t copies = IsPerFrame(kind) ? m_FramesInFlight : 1u;

            for (uint32_t slot = 0; slot < copies; ++slot)
            {
                auto buffer = std::make_unique<RHI::VulkanBuffer>(
                    m_Device, bytes, UsageFor(kind), VMA_MEMORY_USAGE_AUTO_PREFER_HOST);

                if (!buffer->IsValid() || !buffer->IsHostVisible())
                {
                    Core::Log::Error("VulkanArenaBackend: could not create host-visible buffer kind={} slot={} ({} bytes)",
                                     k, slot, bytes);
                    m_IsValid = false;
                    return;
                }
                m_Buffers[k].push_back(std::move(buffer));
            }
        }
    }

    void VulkanArenaBackend::CreateDescriptors()
    {
        const std::array<RHI::DescriptorBinding, 6> bindings{{
            {Bindings::DrawData, VK_DESCRIPTOR_TYPE_STORAGE_BUFFER, 1, kAllGraphics, false},
            {Bindings::Materials, VK_DESCRIPTOR_TYPE_STORAGE_BUFFER, 1, kAllGraphics, false},
            {Bindings::IndirectCommands, VK_DESCRIPTOR_TYPE_STORAGE_BUFFER, 1, kAllGraphics | VK_SHADER_STAGE_COMPUTE_BIT, false},
            {Bindings::Skins, VK_DESCRIPTOR_TYPE_STORAGE_BUFFER, 1, VK_SHADER_STAGE_VERTEX_BIT, false},
            {Bindings::SceneData, VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER, 1, kAllGraphics, false},
            {Bindings::Textures, VK_DESCRIPTOR_TYPE_COMBINED_IMAGE_SAMPLER, m_TextureCapacity, VK_SHADER_STAGE_FRAGMENT_BIT, true},
        }};

        m_Layout = std::make_unique<RHI::DescriptorLayout>(m_Device, bindings);
        m_Pool = std::make_unique<RHI::DescriptorPool>(m_Device, bindings, m_FramesInFlight);
        if (!m_Layout->IsValid() || !m_Pool->IsValid())
        {
            m_IsValid = false;
            return;
        }

        m_Sets.resize(m_FramesInFlight, VK_NULL_HANDLE);
        for (uint32_t slot = 0; slot < m_FramesInFlight; ++slot)
        {
            VkDescriptorSet set = m_Pool->Allocate(*m_Layout, m_TextureCapacity);
            if (set == VK_NULL_HANDLE)
            {
                m_IsValid = false;
                return;
            }
            m_Sets[slot] = set;

            auto handle = [&](ArenaBufferKind kind) { return FindBuffer(kind, slot)->GetHandle(); };

            RHI::WriteBufferDescriptor(m_Device, set, Bindings::DrawData, VK_DESCRIPTOR_TYPE_STORAGE_BUFFER,
                                       handle(ArenaBufferKind::DrawData));
            RHI::WriteBufferDescriptor(m_Device, set, Bindings::Materials, VK_DESCRIPTOR_TYPE_STORAGE_BUFFER,
                                       handle(ArenaBufferKind::Material));
            RHI::WriteBufferDescriptor(m_Device, set, Bindings::IndirectCommands, VK_DESCRIPTOR_TYPE_STORAGE_BUFFER,
                                       handle(ArenaBufferKind::IndirectCommand));
            RHI::WriteBufferDescriptor(m_Device, set, Bindings::Skins, VK_DESCRIPTOR_TYPE_STORAGE_BUFFER,
                                       handle(ArenaBufferKind::Skin));
            RHI::WriteBufferDescriptor(m_Device, set, Bindings::SceneData, VK_DESCRIPTOR_TYPE_UNIFORM_BUFFER,
                                       handle(ArenaBufferKind::SceneData), sizeof(SceneData));
        }
    }

    RHI::VulkanBuffer* VulkanArenaBackend::FindBuffer(ArenaBufferKind kind, uint32_t frameSlot) const
    {
        const auto k = static_cast<size_t>(kind);
        if (k >= ARENA_BUFFER_KIND_COUNT || m_Buffers[k].empty()) return nullptr;

        const auto& copies = m_Buffers[k];
        return copies[IsPerFrame(kind) ? frameSlot % copies.size() : 0].get();
    }

    std::span<std::byte> VulkanArenaBackend::Map(ArenaBufferKind kind, uint32_t frameSlot)
    {
        RHI::VulkanBuffer* buffer = FindBuffer(kind, frameSlot);
        if (!buffer) return {};
        return {static_cast<std::byte*>(buffer->GetMappedData()), buffer->GetSizeBytes()};
    }

    void VulkanArenaBackend::Flush(ArenaBufferKind kind, uint32_t frameSlot, size_t offset, size_t size)
    {
        if (RHI::VulkanBuffer* buffer = FindBuffer(kind, frameSlot))
            buffer->Flush(offset, size);
    }

    Core::Result VulkanArenaBackend::BindTexture(TextureIndex index, const TextureBinding& binding)
    {
        if (!m_IsValid) return Core::Err(Core::ErrorCode::InvalidState);
        if (index >= m_TextureCapacity) return Core::Err(Core::ErrorCode::ArenaFull);
        if (binding.View == VK_NULL_HANDLE) return Core::Err(Core::ErrorCode::InvalidArgument);

        const VkSampler sampler = m_Samplers->Get(RHI::SelectAddressing(binding.IsCubeMap, binding.Format));
        for (VkDescriptorSet set : m_Sets)
        {
            RHI::WriteImageDescriptor(m_Device, set, Bindings::Textures, index, binding.View, sampler);
        }
        return Core::Ok();
    }

    VkDescriptorSetLayout VulkanArenaBackend::GetDescriptorSetLayout() const
    {
        return m_Layout ? m_Layout->GetHandle() : VK_NULL_HANDLE;
    }

    VkBuffer VulkanArenaBackend::GetBuffer(ArenaBufferKind kind, uint32_t frameSlot) const
    {
        RHI::VulkanBuffer* buffer = FindBuffer(kind, frameSlot);
        return buffer ? buffer->GetHandle() : VK_NULL_HANDLE;
    }
}
