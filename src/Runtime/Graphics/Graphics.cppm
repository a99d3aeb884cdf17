export module Graphics;

export import :GpuTypes;
export import :Light;
export import :Projection;
export import :ArenaBackend;
export import :ArenaBuffer;
export import :TextureTable;
export import :ResourceArena;
export import :VulkanArenaBackend;
export import :FrameRenderer;
export import :Components;
export import :Systems.DrawDataBuild;
