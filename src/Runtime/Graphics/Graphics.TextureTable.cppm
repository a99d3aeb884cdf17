module;
#include <cstdint>
#include <expected>
#include <unordered_map>

export module Graphics:TextureTable;

import :GpuTypes;
import Core;

export namespace Graphics
{
    // Logical texture -> texture array element. Indices are handed out in
    // allocation order starting at 0 and are never reclaimed for the lifetime of
    // the process; binding the same key twice returns the original index.
    class BoundTextureTable
    {
    public:
        explicit BoundTextureTable(uint32_t capacity) : m_Capacity(capacity) {}

        struct Reservation
        {
            TextureIndex Index = 0;
            bool IsNew = false;
        };

        [[nodiscard]] Core::Expected<Reservation> Reserve(TextureKey key)
        {
            if (auto it = m_Indices.find(key); it != m_Indices.end())
                return Reservation{it->second, false};

            if (m_Next >= m_Capacity)
                return std::unexpected(Core::ErrorCode::ArenaFull);

            const TextureIndex index = m_Next++;
            m_Indices.emplace(key, index);
            return Reservation{index, true};
        }

        // Undo the most recent reservation when the descriptor write failed.
        void Rollback(TextureKey key)
        {
            auto it = m_Indices.find(key);
            if (it == m_Indices.end() || it->second + 1 != m_Next) return;
            m_Indices.erase(it);
            --m_Next;
        }

        [[nodiscard]] const TextureIndex* Find(TextureKey key) const
        {
            auto it = m_Indices.find(key);
            return it != m_Indices.end() ? &it->second : nullptr;
        }

        [[nodiscard]] uint32_t Size() const { return m_Next; }
        [[nodiscard]] uint32_t Capacity() const { return m_Capacity; }

    private:
        uint32_t m_Capacity;
        TextureIndex m_Next = 0;
        std::unordered_map<TextureKey, TextureIndex> m_Indices;
    };
}
