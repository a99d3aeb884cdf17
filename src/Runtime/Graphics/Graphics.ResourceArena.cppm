module;
#include <cstdint>
#include <span>

#include <glm/glm.hpp>

export module Graphics:ResourceArena;

import :GpuTypes;
import :ArenaBackend;
import :ArenaBuffer;
import :TextureTable;
import Core;

export namespace Graphics
{
    // -------------------------------------------------------------------------
    // ResourceArena
    // -------------------------------------------------------------------------
    // Owns every GPU-visible buffer the frame reads:
    //  * load-time buffers (vertices, indices, materials) grow append-only for
    //    the lifetime of the arena and are shared by all frame slots,
    //  * per-frame buffers (draw data, indirect commands, skins, scene data)
    //    exist once per frame in flight. BeginFrame(frameIndex) selects copy
    //    frameIndex % FramesInFlight and rewinds its cursors. The caller must
    //    have waited on that slot's fence first.
    // Draw data index i is always consumed by indirect command i.
    // Capacities are fixed at construction; overflowing any of them returns
    // ErrorCode::ArenaFull.
    // -------------------------------------------------------------------------
    class ResourceArena
    {
    public:
        ResourceArena(IArenaBackend& backend, const ResourceArenaConfig& config);

        ResourceArena(const ResourceArena&) = delete;
        ResourceArena& operator=(const ResourceArena&) = delete;

        // --- Per-frame ---------------------------------------------------------
        void BeginFrame(uint64_t frameIndex);
        // Flushes this frame's writes and stops accepting per-frame writes.
        void EndFrame();

        [[nodiscard]] Core::Expected<uint32_t> PushDrawData(const DrawData& drawData);
        [[nodiscard]] Core::Expected<uint32_t> PushDrawCommand(const DrawIndexedIndirectCommand& command);
        // Pushes a draw data record and the indirect command that consumes it.
        [[nodiscard]] Core::Expected<uint32_t> PushDraw(const DrawData& drawData, const Primitive& primitive);

        [[nodiscard]] Core::Result WriteSceneData(const SceneData& sceneData);
        // Skin matrices live in per-frame memory and must be rewritten every frame.
        [[nodiscard]] Core::Result WriteSkin(uint32_t skinId, std::span<const glm::mat4> joints);

        // --- Load-time ---------------------------------------------------------
        [[nodiscard]] Core::Expected<uint32_t> AppendVertices(std::span<const Vertex> vertices);
        [[nodiscard]] Core::Expected<uint32_t> AppendIndices(std::span<const uint32_t> indices);
        [[nodiscard]] Core::Expected<uint32_t> PushMaterial(const Material& material);
        [[nodiscard]] Core::Expected<uint32_t> AllocateSkin();

        [[nodiscard]] MeshHandle AllocateMesh(MeshData mesh);
        [[nodiscard]] const MeshData* GetMesh(MeshHandle handle) const;
        // The slot is recycled once FramesInFlight frames have begun since the call.
        void FreeMesh(MeshHandle handle);

        [[nodiscard]] Core::Expected<TextureIndex> AllocateTexture(const TextureBinding& binding);

        // --- Introspection -----------------------------------------------------
        [[nodiscard]] std::span<const DrawData> GetDrawData() const { return m_DrawData.View(); }
        [[nodiscard]] std::span<const DrawIndexedIndirectCommand> GetDrawCommands() const { return m_IndirectCommands.View(); }
        [[nodiscard]] uint32_t GetDrawCount() const { return m_IndirectCommands.Size(); }
        [[nodiscard]] uint32_t GetVertexCount() const { return m_Vertices.Size(); }
        [[nodiscard]] uint32_t GetIndexCount() const { return m_Indices.Size(); }
        [[nodiscard]] uint32_t GetMaterialCount() const { return m_Materials.Size(); }
        [[nodiscard]] uint32_t GetSkinCount() const { return m_SkinCount; }
        [[nodiscard]] uint32_t GetLiveMeshCount() const { return static_cast<uint32_t>(m_Meshes.LiveCount()); }
        [[nodiscard]] const BoundTextureTable& GetTextureTable() const { return m_Textures; }

        [[nodiscard]] uint64_t GetFrameIndex() const { return m_FrameIndex; }
        [[nodiscard]] uint32_t GetFrameSlot() const { return m_FrameSlot; }
        [[nodiscard]] uint32_t GetFramesInFlight() const { return m_FramesInFlight; }
        [[nodiscard]] bool IsAcceptingFrameWrites() const { return m_FrameOpen; }

    private:
        IArenaBackend& m_Backend;
        uint32_t m_FramesInFlight;

        ArenaBuffer<Vertex> m_Vertices;
        ArenaBuffer<uint32_t> m_Indices;
        ArenaBuffer<Material> m_Materials;
        ArenaBuffer<DrawData> m_DrawData;
        ArenaBuffer<DrawIndexedIndirectCommand> m_IndirectCommands;
        ArenaBuffer<SkinMatrices> m_Skins;
        ArenaBuffer<SceneData> m_SceneData;

        uint32_t m_SkinCount = 0;

        Core::ResourcePool<MeshData, MeshHandle> m_Meshes;
        BoundTextureTable m_Textures;

        uint64_t m_FrameIndex = 0;
        // Monotonic count of BeginFrame calls; the frame index itself wraps.
        uint64_t m_FramesBegun = 0;
        uint32_t m_FrameSlot = 0;
        bool m_FrameOpen = false;
    };
}
