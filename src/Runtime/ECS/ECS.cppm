export module ECS;

export import :Components.Transform;
export import :Components.Hierarchy;
export import :TransformArena;
