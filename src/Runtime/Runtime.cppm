export module Runtime;

export import :FrameController;
export import :Engine;
