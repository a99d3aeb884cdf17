module;
#include <cstdint>
#include <memory>

#include "RHI.Vulkan.hpp"

module Graphics:FrameRenderer.Impl;
import :FrameRenderer;
import :ResourceArena;
import :ArenaBackend;
import RHI;
import Core;

namespace Graphics
{
    Core::Result HeadlessFrameRenderer::BeginGpuFrame(uint32_t frameSlot)
    {
        if (m_OpenSlot != NO_SLOT) return Core::Err(Core::ErrorCode::FrameOutOfOrder);
        m_OpenSlot = frameSlot;
        return Core::Ok();
    }

    Core::Result HeadlessFrameRenderer::Submit(uint32_t frameSlot, const ResourceArena& arena)
    {
        if (m_OpenSlot != frameSlot) return Core::Err(Core::ErrorCode::FrameOutOfOrder);
        m_OpenSlot = NO_SLOT;

        m_LastDrawCount = arena.GetDrawCount();
        m_LastFrameSlot = frameSlot;
        ++m_SubmittedFrames;
        return Core::Ok();
    }

    VulkanFrameRenderer::VulkanFrameRenderer(RHI::VulkanDevice& device, VulkanArenaBackend& backend)
        : m_Backend(backend),
          m_FrameSync(std::make_unique<RHI::FrameSync>(device))
    {
    }

    Core::Result VulkanFrameRenderer::BeginGpuFrame(uint32_t frameSlot)
    {
        auto cmd = m_FrameSync->BeginSlot(frameSlot);
        if (!cmd) return Core::Err(cmd.error());
        m_Cmd = *cmd;
        return Core::Ok();
    }

    Core::Result VulkanFrameRenderer::Submit(uint32_t frameSlot, const ResourceArena& arena)
    {
        if (m_Cmd == VK_NULL_HANDLE) return Core::Err(Core::ErrorCode::FrameOutOfOrder);

        // Host writes to the arena become visible to indirect fetch, vertex input and shaders.
        VkMemoryBarrier2 barrier{};
        barrier.sType = VK_STRUCTURE_TYPE_MEMORY_BARRIER_2;
        barrier.srcStageMask = VK_PIPELINE_STAGE_2_HOST_BIT;
        barrier.srcAccessMask = VK_ACCESS_2_HOST_WRITE_BIT;
        barrier.dstStageMask = VK_PIPELINE_STAGE_2_DRAW_INDIRECT_BIT |
                               VK_PIPELINE_STAGE_2_VERTEX_INPUT_BIT |
                               VK_PIPELINE_STAGE_2_VERTEX_SHADER_BIT |
                               VK_PIPELINE_STAGE_2_FRAGMENT_SHADER_BIT;
        barrier.dstAccessMask = VK_ACCESS_2_INDIRECT_COMMAND_READ_BIT |
                                VK_ACCESS_2_INDEX_READ_BIT |
                                VK_ACCESS_2_VERTEX_ATTRIBUTE_READ_BIT |
                                VK_ACCESS_2_SHADER_STORAGE_READ_BIT |
                                VK_ACCESS_2_UNIFORM_READ_BIT;

        VkDependencyInfo dependency{};
        dependency.sType = VK_STRUCTURE_TYPE_DEPENDENCY_INFO;
        dependency.memoryBarrierCount = 1;
        dependency.pMemoryBarriers = &barrier;
        vkCmdPipelineBarrier2(m_Cmd, &dependency);

        if (m_DrawPass && arena.GetDrawCount() > 0)
        {
            DrawContext context{};
            context.Cmd = m_Cmd;
            context.Set = m_Backend.GetDescriptorSet(frameSlot);
            context.VertexBuffer = m_Backend.GetBuffer(ArenaBufferKind::Vertex, frameSlot);
            context.IndexBuffer = m_Backend.GetBuffer(ArenaBufferKind::Index, frameSlot);
            context.IndirectBuffer = m_Backend.GetBuffer(ArenaBufferKind::IndirectCommand, frameSlot);
            context.DrawCount = arena.GetDrawCount();
            m_DrawPass(context);
        }

        m_Cmd = VK_NULL_HANDLE;
        return m_FrameSync->SubmitSlot(frameSlot);
    }
}
