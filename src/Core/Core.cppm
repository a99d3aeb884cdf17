export module Core;

// Re-export all sub-systems so the user only needs 'import Core;'
export import :Error;
export import :Logging;
export import :Handle;
export import :ResourcePool;
export import :Profiling;
export import :QuitSignal;
