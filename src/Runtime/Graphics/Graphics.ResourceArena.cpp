module;
#include <algorithm>
#include <cstdint>
#include <expected>
#include <span>
#include <utility>

#include <glm/glm.hpp>

module Graphics:ResourceArena.Impl;
import :ResourceArena;
import :ArenaBuffer;
import :GpuTypes;
import :ArenaBackend;
import Core;

namespace Graphics
{
    namespace
    {
        void LogArenaFull(const char* buffer, uint32_t capacity)
        {
            Core::Log::Error("ResourceArena: {} buffer is full (capacity {}). Raise ResourceArenaConfig limits.",
                             buffer, capacity);
        }

        template <typename T>
        void WarnIfClamped(const char* buffer, const ArenaBuffer<T>& arenaBuffer, uint32_t requested)
        {
            if (arenaBuffer.IsClamped(requested))
                Core::Log::Warn("ResourceArena: {} capacity {} exceeds the backend buffer, clamped to {}.",
                                buffer, requested, arenaBuffer.Capacity());
        }
    }

    ResourceArena::ResourceArena(IArenaBackend& backend, const ResourceArenaConfig& config)
        : m_Backend(backend),
          m_FramesInFlight(backend.GetFramesInFlight()),
          m_Vertices(backend, ArenaBufferKind::Vertex, config.MaxVertices),
          m_Indices(backend, ArenaBufferKind::Index, config.MaxIndices),
          m_Materials(backend, ArenaBufferKind::Material, config.MaxMaterials),
          m_DrawData(backend, ArenaBufferKind::DrawData, config.MaxDrawData),
          m_IndirectCommands(backend, ArenaBufferKind::IndirectCommand, config.MaxIndirectCommands),
          m_Skins(backend, ArenaBufferKind::Skin, config.MaxSkins),
          m_SceneData(backend, ArenaBufferKind::SceneData, 1),
          m_Textures(std::min(config.MaxTextures, backend.GetTextureCapacity()))
    {
        m_Meshes.Initialize(m_FramesInFlight);

        WarnIfClamped("vertex", m_Vertices, config.MaxVertices);
        WarnIfClamped("index", m_Indices, config.MaxIndices);
        WarnIfClamped("material", m_Materials, config.MaxMaterials);
        WarnIfClamped("draw data", m_DrawData, config.MaxDrawData);
        WarnIfClamped("indirect command", m_IndirectCommands, config.MaxIndirectCommands);
        WarnIfClamped("skin", m_Skins, config.MaxSkins);

        // Slot 0 is the default material for primitives without one.
        if (m_Materials.Capacity() > 0)
        {
            (void)m_Materials.Push(Material{});
            m_Materials.Flush();
        }
    }

    void ResourceArena::BeginFrame(uint64_t frameIndex)
    {
        m_FrameIndex = frameIndex;
        m_FrameSlot = static_cast<uint32_t>(frameIndex % m_FramesInFlight);
        ++m_FramesBegun;

        m_DrawData.Rewind(m_FrameSlot);
        m_IndirectCommands.Rewind(m_FrameSlot);
        m_Skins.Rewind(m_FrameSlot);
        m_SceneData.Rewind(m_FrameSlot);

        m_Meshes.ProcessDeletions(m_FramesBegun);
        m_FrameOpen = true;
    }

    void ResourceArena::EndFrame()
    {
        if (!m_FrameOpen) return;

        m_DrawData.Flush();
        m_IndirectCommands.Flush();
        m_FrameOpen = false;
    }

    Core::Expected<uint32_t> ResourceArena::PushDrawData(const DrawData& drawData)
    {
        if (!m_FrameOpen) return std::unexpected(Core::ErrorCode::FrameOutOfOrder);

        auto index = m_DrawData.Push(drawData);
        if (!index) LogArenaFull("draw data", m_DrawData.Capacity());
        return index;
    }

    Core::Expected<uint32_t> ResourceArena::PushDrawCommand(const DrawIndexedIndirectCommand& command)
    {
        if (!m_FrameOpen) return std::unexpected(Core::ErrorCode::FrameOutOfOrder);

        auto index = m_IndirectCommands.Push(command);
        if (!index) LogArenaFull("indirect command", m_IndirectCommands.Capacity());
        return index;
    }

    Core::Expected<uint32_t> ResourceArena::PushDraw(const DrawData& drawData, const Primitive& primitive)
    {
        if (!m_FrameOpen) return std::unexpected(Core::ErrorCode::FrameOutOfOrder);

        // Check both buffers up front so a failure never leaves them out of step.
        if (m_DrawData.Size() >= m_DrawData.Capacity() ||
            m_IndirectCommands.Size() >= m_IndirectCommands.Capacity())
        {
            LogArenaFull(m_DrawData.Size() >= m_DrawData.Capacity() ? "draw data" : "indirect command",
                         std::min(m_DrawData.Capacity(), m_IndirectCommands.Capacity()));
            return std::unexpected(Core::ErrorCode::ArenaFull);
        }

        auto index = m_DrawData.Push(drawData);
        if (!index) return std::unexpected(index.error());

        DrawIndexedIndirectCommand command{};
        command.indexCount = primitive.IndexCount;
        command.instanceCount = 1;
        command.firstIndex = primitive.IndexOffset;
        command.vertexOffset = primitive.VertexOffset;
        command.firstInstance = *index;

        auto commandIndex = m_IndirectCommands.Push(command);
        if (!commandIndex) return std::unexpected(commandIndex.error());

        return *index;
    }

    Core::Result ResourceArena::WriteSceneData(const SceneData& sceneData)
    {
        if (!m_FrameOpen) return Core::Err(Core::ErrorCode::FrameOutOfOrder);
        return m_SceneData.Write(0, sceneData);
    }

    Core::Result ResourceArena::WriteSkin(uint32_t skinId, std::span<const glm::mat4> joints)
    {
        if (!m_FrameOpen) return Core::Err(Core::ErrorCode::FrameOutOfOrder);
        if (skinId >= m_SkinCount)
        {
            Core::Log::Warn("ResourceArena::WriteSkin: unknown skin id {}", skinId);
            return Core::Err(Core::ErrorCode::ResourceNotFound);
        }
        if (joints.size() > MAX_JOINTS)
        {
            Core::Log::Warn("ResourceArena::WriteSkin: {} joints exceed the limit of {}", joints.size(), MAX_JOINTS);
            return Core::Err(Core::ErrorCode::InvalidArgument);
        }

        SkinMatrices matrices;
        matrices.fill(glm::mat4(1.0f));
        std::copy(joints.begin(), joints.end(), matrices.begin());
        return m_Skins.Write(skinId, matrices);
    }

    Core::Expected<uint32_t> ResourceArena::AppendVertices(std::span<const Vertex> vertices)
    {
        auto first = m_Vertices.Append(vertices);
        if (!first)
        {
            LogArenaFull("vertex", m_Vertices.Capacity());
            return first;
        }
        m_Vertices.Flush();
        return first;
    }

    Core::Expected<uint32_t> ResourceArena::AppendIndices(std::span<const uint32_t> indices)
    {
        auto first = m_Indices.Append(indices);
        if (!first)
        {
            LogArenaFull("index", m_Indices.Capacity());
            return first;
        }
        m_Indices.Flush();
        return first;
    }

    Core::Expected<uint32_t> ResourceArena::PushMaterial(const Material& material)
    {
        auto index = m_Materials.Push(material);
        if (!index)
        {
            LogArenaFull("material", m_Materials.Capacity());
            return index;
        }
        m_Materials.Flush();
        return index;
    }

    Core::Expected<uint32_t> ResourceArena::AllocateSkin()
    {
        if (m_SkinCount >= m_Skins.Capacity())
        {
            LogArenaFull("skin", m_Skins.Capacity());
            return std::unexpected(Core::ErrorCode::ArenaFull);
        }
        return m_SkinCount++;
    }

    MeshHandle ResourceArena::AllocateMesh(MeshData mesh)
    {
        mesh.InverseTranspose = glm::transpose(glm::inverse(mesh.Transform));
        return m_Meshes.Add(std::move(mesh));
    }

    const MeshData* ResourceArena::GetMesh(MeshHandle handle) const
    {
        return m_Meshes.Get(handle);
    }

    void ResourceArena::FreeMesh(MeshHandle handle)
    {
        m_Meshes.Remove(handle, m_FramesBegun);
    }

    Core::Expected<TextureIndex> ResourceArena::AllocateTexture(const TextureBinding& binding)
    {
        auto reservation = m_Textures.Reserve(binding.Key);
        if (!reservation)
        {
            LogArenaFull("texture array", m_Textures.Capacity());
            return std::unexpected(reservation.error());
        }

        if (!reservation->IsNew) return reservation->Index;

        if (auto bound = m_Backend.BindTexture(reservation->Index, binding); !bound)
        {
            m_Textures.Rollback(binding.Key);
            Core::Log::Error("ResourceArena: failed to bind texture {} ({})",
                             reservation->Index, Core::ErrorCodeToString(bound.error()));
            return std::unexpected(bound.error());
        }

        return reservation->Index;
    }
}
