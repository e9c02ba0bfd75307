export module ECS;

export import :Components;
export import :Events;
export import :Scene;
export import :Systems.LookAt;
export import :Systems.Transform;
