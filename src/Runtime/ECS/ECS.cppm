export module ECS;

export import :Components;
export import :Scene;
export import :Systems.Transform;
export import :Systems.RigidBodySync;
