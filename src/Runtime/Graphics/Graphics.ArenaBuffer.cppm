module;
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <expected>
#include <span>
#include <type_traits>

export module Graphics:ArenaBuffer;

import :ArenaBackend;
import Core;

export namespace Graphics
{
    // Append-only typed view over one backend buffer. Within a frame elements are
    // only ever appended; Rewind() moves the cursor back to zero and selects the
    // copy that belongs to the new frame slot.
    // The capacity never exceeds what the backend actually mapped.
    template <typename T>
    class ArenaBuffer
    {
        static_assert(std::is_trivially_copyable_v<T>, "Arena elements are copied into GPU memory");

    public:
        ArenaBuffer(IArenaBackend& backend, ArenaBufferKind kind, uint32_t capacity)
            : m_Backend(backend), m_Kind(kind),
              m_Capacity(static_cast<uint32_t>(std::min<size_t>(capacity, backend.Map(kind, 0).size() / sizeof(T))))
        {
        }

        void Rewind(uint32_t frameSlot)
        {
            m_FrameSlot = frameSlot;
            m_Cursor = 0;
            m_FlushedUpTo = 0;
        }

        [[nodiscard]] Core::Expected<uint32_t> Push(const T& element)
        {
            return Append(std::span<const T>(&element, 1));
        }

        // Returns the index of the first appended element.
        [[nodiscard]] Core::Expected<uint32_t> Append(std::span<const T> elements)
        {
            if (elements.size() > m_Capacity - m_Cursor)
                return std::unexpected(Core::ErrorCode::ArenaFull);

            const uint32_t first = m_Cursor;
            if (!elements.empty())
            {
                std::span<std::byte> memory = m_Backend.Map(m_Kind, m_FrameSlot);
                std::memcpy(memory.data() + static_cast<size_t>(first) * sizeof(T), elements.data(), elements.size_bytes());
                m_Cursor += static_cast<uint32_t>(elements.size());
            }
            return first;
        }

        // Overwrites an element that was already appended (skins, scene data).
        [[nodiscard]] Core::Result Write(uint32_t index, const T& element)
        {
            if (index >= m_Capacity) return Core::Err(Core::ErrorCode::OutOfRange);

            std::span<std::byte> memory = m_Backend.Map(m_Kind, m_FrameSlot);
            std::memcpy(memory.data() + static_cast<size_t>(index) * sizeof(T), &element, sizeof(T));
            m_Backend.Flush(m_Kind, m_FrameSlot, static_cast<size_t>(index) * sizeof(T), sizeof(T));
            return Core::Ok();
        }

        // Makes everything appended since the last flush visible to the device.
        void Flush()
        {
            if (m_Cursor == m_FlushedUpTo) return;
            const size_t offset = static_cast<size_t>(m_FlushedUpTo) * sizeof(T);
            const size_t size = static_cast<size_t>(m_Cursor - m_FlushedUpTo) * sizeof(T);
            m_Backend.Flush(m_Kind, m_FrameSlot, offset, size);
            m_FlushedUpTo = m_Cursor;
        }

        [[nodiscard]] std::span<const T> View() const
        {
            std::span<std::byte> memory = m_Backend.Map(m_Kind, m_FrameSlot);
            return {reinterpret_cast<const T*>(memory.data()), m_Cursor};
        }

        [[nodiscard]] uint32_t Size() const { return m_Cursor; }
        [[nodiscard]] uint32_t Capacity() const { return m_Capacity; }
        [[nodiscard]] bool IsClamped(uint32_t requested) const { return m_Capacity < requested; }
        [[nodiscard]] uint32_t GetFrameSlot() const { return m_FrameSlot; }
        [[nodiscard]] ArenaBufferKind GetKind() const { return m_Kind; }

    private:
        IArenaBackend& m_Backend;
        ArenaBufferKind m_Kind;
        uint32_t m_Capacity;
        uint32_t m_FrameSlot = 0;
        uint32_t m_Cursor = 0;
        uint32_t m_FlushedUpTo = 0;
    };
}
