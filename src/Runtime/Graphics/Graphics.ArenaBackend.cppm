module;
#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include <glm/glm.hpp>

export module Graphics:ArenaBackend;

import :GpuTypes;
import Core;

export namespace Graphics
{
    struct ResourceArenaConfig
    {
        uint32_t FramesInFlight = 2;
        uint32_t MaxVertices = 1'000'000;
        uint32_t MaxIndices = 1'000'000;
        uint32_t MaxDrawData = 10'000;
        uint32_t MaxMaterials = 10'000;
        uint32_t MaxIndirectCommands = 10'000;
        uint32_t MaxSkins = 100;
        uint32_t MaxTextures = 4'096;
    };

    enum class ArenaBufferKind : uint8_t
    {
        Vertex,
        Index,
        Material,
        DrawData,
        IndirectCommand,
        Skin,
        SceneData,
        Count
    };

    constexpr size_t ARENA_BUFFER_KIND_COUNT = static_cast<size_t>(ArenaBufferKind::Count);

    // Load-time buffers are written once when assets are loaded and are shared by
    // every frame slot; everything else is rewritten per frame and gets one copy
    // per frame in flight.
    [[nodiscard]] constexpr bool IsPerFrame(ArenaBufferKind kind)
    {
        switch (kind)
        {
            case ArenaBufferKind::Vertex:
            case ArenaBufferKind::Index:
            case ArenaBufferKind::Material:
                return false;
            default:
                return true;
        }
    }

    [[nodiscard]] constexpr uint32_t ElementCapacity(ArenaBufferKind kind, const ResourceArenaConfig& config)
    {
        switch (kind)
        {
            case ArenaBufferKind::Vertex: return config.MaxVertices;
            case ArenaBufferKind::Index: return config.MaxIndices;
            case ArenaBufferKind::Material: return config.MaxMaterials;
            case ArenaBufferKind::DrawData: return config.MaxDrawData;
            case ArenaBufferKind::IndirectCommand: return config.MaxIndirectCommands;
            case ArenaBufferKind::Skin: return config.MaxSkins;
            case ArenaBufferKind::SceneData: return 1;
            case ArenaBufferKind::Count: break;
        }
        return 0;
    }

    [[nodiscard]] constexpr size_t ElementSize(ArenaBufferKind kind)
    {
        switch (kind)
        {
            case ArenaBufferKind::Vertex: return sizeof(Vertex);
            case ArenaBufferKind::Index: return sizeof(uint32_t);
            case ArenaBufferKind::Material: return sizeof(Material);
            case ArenaBufferKind::DrawData: return sizeof(DrawData);
            case ArenaBufferKind::IndirectCommand: return sizeof(DrawIndexedIndirectCommand);
            case ArenaBufferKind::Skin: return sizeof(SkinMatrices);
            case ArenaBufferKind::SceneData: return sizeof(SceneData);
            case ArenaBufferKind::Count: break;
        }
        return 0;
    }

    [[nodiscard]] constexpr size_t BufferBytes(ArenaBufferKind kind, const ResourceArenaConfig& config)
    {
        return ElementSize(kind) * ElementCapacity(kind, config);
    }

    // -------------------------------------------------------------------------
    // IArenaBackend - where the arena's bytes live
    // -------------------------------------------------------------------------
    // The arena only ever sees host-visible, persistently mapped memory. A
    // backend owns FramesInFlight copies of every per-frame buffer and a single
    // copy of every load-time buffer (frameSlot is ignored for those).
    // -------------------------------------------------------------------------
    class IArenaBackend
    {
    public:
        virtual ~IArenaBackend() = default;

        IArenaBackend(const IArenaBackend&) = delete;
        IArenaBackend& operator=(const IArenaBackend&) = delete;

        [[nodiscard]] virtual std::span<std::byte> Map(ArenaBufferKind kind, uint32_t frameSlot) = 0;

        // Makes host writes in [offset, offset + size) visible to the device.
        virtual void Flush(ArenaBufferKind kind, uint32_t frameSlot, size_t offset, size_t size) = 0;

        // Writes the descriptor for texture array element `index` in every frame slot.
        [[nodiscard]] virtual Core::Result BindTexture(TextureIndex index, const TextureBinding& binding) = 0;

        [[nodiscard]] virtual uint32_t GetFramesInFlight() const = 0;
        [[nodiscard]] virtual uint32_t GetTextureCapacity() const = 0;

    protected:
        IArenaBackend() = default;
    };

    // Plain host memory. Used headless and in tests; records texture bindings
    // instead of writing descriptors.
    class HostArenaBackend final : public IArenaBackend
    {
    public:
        explicit HostArenaBackend(const ResourceArenaConfig& config);

        [[nodiscard]] std::span<std::byte> Map(ArenaBufferKind kind, uint32_t frameSlot) override;
        void Flush(ArenaBufferKind kind, uint32_t frameSlot, size_t offset, size_t size) override;
        [[nodiscard]] Core::Result BindTexture(TextureIndex index, const TextureBinding& binding) override;

        [[nodiscard]] uint32_t GetFramesInFlight() const override { return m_FramesInFlight; }
        [[nodiscard]] uint32_t GetTextureCapacity() const override { return m_TextureCapacity; }

        [[nodiscard]] const std::vector<TextureBinding>& GetBoundTextures() const { return m_BoundTextures; }
        [[nodiscard]] uint64_t GetFlushCount() const { return m_FlushCount; }

    private:
        // vec4 storage keeps every region 16-byte aligned.
        using Storage = std::vector<glm::vec4>;

        uint32_t m_FramesInFlight;
        uint32_t m_TextureCapacity;
        std::array<std::vector<Storage>, ARENA_BUFFER_KIND_COUNT> m_Buffers;
        std::array<size_t, ARENA_BUFFER_KIND_COUNT> m_Sizes{};
        std::vector<TextureBinding> m_BoundTextures;
        uint64_t m_FlushCount = 0;
    };
}
