export module RHI;

export import :Buffer;
export import :Context;
export import :Descriptors;
export import :Device;
export import :FrameSync;
export import :Sampler;
