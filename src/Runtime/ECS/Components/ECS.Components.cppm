export module ECS:Components;

export import :Components.NameTag;
export import :Components.RigidBody;
export import :Components.Transform;
