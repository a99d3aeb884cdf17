export module XR;

export import :Types;
export import :Runtime;
export import :SimulatedRuntime;
export import :SessionDriver;
export import :HapticContext;
