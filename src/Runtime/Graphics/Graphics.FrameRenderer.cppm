module;
#include <cstdint>
#include <functional>
#include <memory>
#include <utility>

#include "RHI.Vulkan.hpp"

export module Graphics:FrameRenderer;

import :ResourceArena;
import :VulkanArenaBackend;
import RHI;
import Core;

export namespace Graphics
{
    // GPU side of a frame. BeginGpuFrame blocks until the slot's previous work
    // has retired; Submit hands the recorded frame to the queue.
    class IFrameRenderer
    {
    public:
        virtual ~IFrameRenderer() = default;

        [[nodiscard]] virtual Core::Result BeginGpuFrame(uint32_t frameSlot) = 0;
        [[nodiscard]] virtual Core::Result Submit(uint32_t frameSlot, const ResourceArena& arena) = 0;
    };

    // No device. Counts frames and remembers what the last submission drew.
    class HeadlessFrameRenderer final : public IFrameRenderer
    {
    public:
        [[nodiscard]] Core::Result BeginGpuFrame(uint32_t frameSlot) override;
        [[nodiscard]] Core::Result Submit(uint32_t frameSlot, const ResourceArena& arena) override;

        [[nodiscard]] uint64_t GetSubmittedFrames() const { return m_SubmittedFrames; }
        [[nodiscard]] uint32_t GetLastDrawCount() const { return m_LastDrawCount; }
        [[nodiscard]] uint32_t GetLastFrameSlot() const { return m_LastFrameSlot; }

    private:
        static constexpr uint32_t NO_SLOT = ~0u;

        uint32_t m_OpenSlot = NO_SLOT;
        uint64_t m_SubmittedFrames = 0;
        uint32_t m_LastDrawCount = 0;
        uint32_t m_LastFrameSlot = 0;
    };

    struct DrawContext
    {
        VkCommandBuffer Cmd = VK_NULL_HANDLE;
        VkDescriptorSet Set = VK_NULL_HANDLE;
        VkBuffer VertexBuffer = VK_NULL_HANDLE;
        VkBuffer IndexBuffer = VK_NULL_HANDLE;
        VkBuffer IndirectBuffer = VK_NULL_HANDLE;
        uint32_t DrawCount = 0;
    };

    // Records the arena's host-write barrier and, when a pass is attached,
    // the indirect draws into the slot's command buffer.
    class VulkanFrameRenderer final : public IFrameRenderer
    {
    public:
        using DrawPass = std::function<void(const DrawContext&)>;

        VulkanFrameRenderer(RHI::VulkanDevice& device, VulkanArenaBackend& backend);

        [[nodiscard]] Core::Result BeginGpuFrame(uint32_t frameSlot) override;
        [[nodiscard]] Core::Result Submit(uint32_t frameSlot, const ResourceArena& arena) override;

        void SetDrawPass(DrawPass pass) { m_DrawPass = std::move(pass); }
        [[nodiscard]] bool IsValid() const { return m_FrameSync->IsValid(); }

    private:
        VulkanArenaBackend& m_Backend;
        std::unique_ptr<RHI::FrameSync> m_FrameSync;
        VkCommandBuffer m_Cmd = VK_NULL_HANDLE;
        DrawPass m_DrawPass;
    };
}
