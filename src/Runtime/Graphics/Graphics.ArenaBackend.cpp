module;
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include <glm/glm.hpp>

module Graphics:ArenaBackend.Impl;
import :ArenaBackend;
import :GpuTypes;
import Core;

namespace Graphics
{
    HostArenaBackend::HostArenaBackend(const ResourceArenaConfig& config)
        : m_FramesInFlight(std::max(config.FramesInFlight, 1u)),
          m_TextureCapacity(config.MaxTextures)
    {
        for (size_t k = 0; k < ARENA_BUFFER_KIND_COUNT; ++k)
        {
            const auto kind = static_cast<ArenaBufferKind>(k);
            const size_t bytes = BufferBytes(kind, config);
            const uint32_t copies = IsPerFrame(kind) ? m_FramesInFlight : 1u;

            m_Sizes[k] = bytes;
            m_Buffers[k].resize(copies);
            for (Storage& storage : m_Buffers[k])
            {
                storage.resize((bytes + sizeof(glm::vec4) - 1) / sizeof(glm::vec4));
            }
        }
    }

    std::span<std::byte> HostArenaBackend::Map(ArenaBufferKind kind, uint32_t frameSlot)
    {
        const auto k = static_cast<size_t>(kind);
        if (k >= ARENA_BUFFER_KIND_COUNT) return {};

        std::vector<Storage>& copies = m_Buffers[k];
        Storage& storage = copies[IsPerFrame(kind) ? frameSlot % copies.size() : 0];
        return {reinterpret_cast<std::byte*>(storage.data()), m_Sizes[k]};
    }

    void HostArenaBackend::Flush(ArenaBufferKind, uint32_t, size_t, size_t size)
    {
        if (size > 0) ++m_FlushCount;
    }

    Core::Result HostArenaBackend::BindTexture(TextureIndex index, const TextureBinding& binding)
    {
        if (index >= m_TextureCapacity) return Core::Err(Core::ErrorCode::ArenaFull);

        if (index >= m_BoundTextures.size())
            m_BoundTextures.resize(index + 1);
        m_BoundTextures[index] = binding;
        return Core::Ok();
    }
}
